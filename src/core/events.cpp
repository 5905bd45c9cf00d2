/**
 * @file events.cpp
 * @brief modelrt - Progress Event Dispatch
 *
 * Bindings register one listener per runtime instance and receive every
 * download, token and audio-chunk event.
 */

#include "core/progress_event.h"
#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"

namespace mrt {

void to_c_event(const ProgressEvent& event, mrt_progress_event_t* out) {
    *out = mrt_progress_event_t{};
    out->kind = event.kind;
    out->subject_id = event.subject_id.c_str();
    out->sequence = event.sequence;
    out->bytes_downloaded = event.bytes_downloaded;
    out->bytes_total = event.bytes_total;
    out->text = event.text.empty() ? nullptr : event.text.c_str();
    out->text_length = event.text.size();
    out->audio = event.audio.empty() ? nullptr : event.audio.data();
    out->audio_samples = event.audio.size();
    out->sample_rate_hz = event.sample_rate_hz;
}

void EventDispatcher::set_listener(mrt_progress_listener_fn listener, void* user_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
    user_data_ = user_data;
}

bool EventDispatcher::has_listener() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listener_ != nullptr;
}

void EventDispatcher::emit(const ProgressEvent& event) const {
    mrt_progress_listener_fn listener;
    void* user_data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
        user_data = user_data_;
    }
    if (listener == nullptr) {
        return;
    }
    mrt_progress_event_t c_event;
    to_c_event(event, &c_event);
    listener(&c_event, user_data);
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

mrt_result_t mrt_events_set_listener(mrt_progress_listener_fn listener, void* user_data) {
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    ctx->events().set_listener(listener, user_data);
    return MRT_SUCCESS;
}

mrt_bool_t mrt_events_has_listener(void) {
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_FALSE;
    }
    return ctx->events().has_listener() ? MRT_TRUE : MRT_FALSE;
}

const char* mrt_progress_kind_name(mrt_progress_kind_t kind) {
    switch (kind) {
        case MRT_PROGRESS_BYTES:
            return "bytes";
        case MRT_PROGRESS_TOKEN:
            return "token";
        case MRT_PROGRESS_AUDIO_CHUNK:
            return "audio_chunk";
        default:
            return "unknown";
    }
}

}  // extern "C"
