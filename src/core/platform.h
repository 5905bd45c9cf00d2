/**
 * @file platform.h
 * @brief modelrt - Platform Services
 *
 * Copy of the binding's platform adapter with OS fallbacks for every entry
 * the binding left out.
 */

#ifndef MRT_PLATFORM_H
#define MRT_PLATFORM_H

#include <string>

#include "mrt/core/mrt_platform_adapter.h"

namespace mrt {

class Platform {
   public:
    explicit Platform(const mrt_platform_adapter_t* adapter);

    // Monotonic milliseconds
    int64_t now_ms() const;

    mrt_result_t memory_info(mrt_memory_info_t* out_info) const;

    mrt_result_t free_storage(const std::string& path, uint64_t* out_bytes) const;

    const mrt_http_transport_t* http_transport() const;

    // nullptr when the binding supplied no adapter
    const mrt_platform_adapter_t* adapter() const { return has_adapter_ ? &adapter_ : nullptr; }

   private:
    bool has_adapter_ = false;
    mrt_platform_adapter_t adapter_{};
};

}  // namespace mrt

#endif  // MRT_PLATFORM_H
