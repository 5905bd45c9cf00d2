/**
 * @file backend_registry.h
 * @brief modelrt - Backend Registry (internal)
 */

#ifndef MRT_BACKEND_REGISTRY_INTERNAL_H
#define MRT_BACKEND_REGISTRY_INTERNAL_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mrt/infrastructure/registry/mrt_backend_registry.h"

namespace mrt {

struct BackendEntry {
    std::string name;
    mrt_backend_capabilities_t capabilities{};
    mrt_backend_ops_t ops{};
    void* user_data = nullptr;

    bool supports(mrt_model_format_t format) const {
        return (capabilities.format_mask & MRT_FORMAT_BIT(format)) != 0;
    }
};

// Compares the tag, the format set, the streaming flag and the active variant
bool capabilities_equal(const mrt_backend_capabilities_t& a, const mrt_backend_capabilities_t& b);

class BackendRegistry {
   public:
    using InUsePredicate = std::function<bool(const std::string& backend_name)>;

    mrt_result_t register_backend(const mrt_backend_info_t& info);

    // Fails with MRT_ERROR_INVALID_STATE while in_use(name) holds
    mrt_result_t unregister_backend(const std::string& name, const InUsePredicate& in_use);

    std::shared_ptr<const BackendEntry> find(const std::string& name) const;

    // First backend, in registration order, that handles format
    std::shared_ptr<const BackendEntry> find_for_format(mrt_model_format_t format) const;

    std::vector<std::string> names() const;

   private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const BackendEntry>> backends_;
};

}  // namespace mrt

#endif  // MRT_BACKEND_REGISTRY_INTERNAL_H
