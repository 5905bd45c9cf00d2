/**
 * @file model_registry.h
 * @brief modelrt - Model Descriptor Registry (internal)
 */

#ifndef MRT_MODEL_REGISTRY_INTERNAL_H
#define MRT_MODEL_REGISTRY_INTERNAL_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "infrastructure/model_management/model_types.h"

namespace mrt {

class ModelRegistry {
   public:
    // Identical re-registration is a no-op; a differing one conflicts
    mrt_result_t register_model(const ModelDescriptor& descriptor);

    // Validates every entry against the registry first, then registers them all
    mrt_result_t register_all(const std::vector<ModelDescriptor>& descriptors,
                              size_t* out_registered);

    bool get(const std::string& id, ModelDescriptor* out) const;

    std::vector<ModelDescriptor> list() const;

    size_t size() const;

   private:
    mrt_result_t check_locked(const ModelDescriptor& descriptor, bool* out_exists) const;

    mutable std::mutex mutex_;
    std::map<std::string, ModelDescriptor> models_;
};

// Parses a JSON model catalog; sets error details on failure
mrt_result_t parse_model_catalog(const std::string& json, std::vector<ModelDescriptor>* out);

}  // namespace mrt

#endif  // MRT_MODEL_REGISTRY_INTERNAL_H
