/**
 * @file progress_event.h
 * @brief modelrt - Progress Event (internal)
 */

#ifndef MRT_PROGRESS_EVENT_H
#define MRT_PROGRESS_EVENT_H

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "mrt/core/mrt_events.h"

namespace mrt {

struct ProgressEvent {
    mrt_progress_kind_t kind = MRT_PROGRESS_BYTES;
    std::string subject_id;
    uint64_t sequence = 0;

    int64_t bytes_downloaded = 0;
    int64_t bytes_total = -1;

    std::string text;

    std::vector<float> audio;
    int32_t sample_rate_hz = 0;
};

// C view of an event; pointers borrow from the source event
void to_c_event(const ProgressEvent& event, mrt_progress_event_t* out);

/**
 * @brief Fan-out of progress events to the binding's listener
 */
class EventDispatcher {
   public:
    void set_listener(mrt_progress_listener_fn listener, void* user_data);
    bool has_listener() const;
    void emit(const ProgressEvent& event) const;

   private:
    mutable std::mutex mutex_;
    mrt_progress_listener_fn listener_ = nullptr;
    void* user_data_ = nullptr;
};

}  // namespace mrt

#endif  // MRT_PROGRESS_EVENT_H
