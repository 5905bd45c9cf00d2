/**
 * @file model_catalog.cpp
 * @brief modelrt - JSON Model Catalog Parsing
 */

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "infrastructure/model_management/model_registry.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

using Json = nlohmann::json;

constexpr int kCatalogVersion = 1;

mrt_result_t fail(const std::string& details) {
    mrt_error_set_details(details.c_str());
    MRT_LOG_ERROR("ModelCatalog", "%s", details.c_str());
    return MRT_ERROR_INVALID_ARGUMENT;
}

mrt_result_t parse_entry(const Json& entry, size_t index, ModelDescriptor* out) {
    std::string where = "models[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        return fail(where + " is not an object");
    }
    if (!entry.contains("id") || !entry["id"].is_string()) {
        return fail(where + ".id is missing");
    }
    out->id = entry["id"].get<std::string>();

    if (entry.contains("name") && entry["name"].is_string()) {
        out->name = entry["name"].get<std::string>();
    }

    if (!entry.contains("format") || !entry["format"].is_string()) {
        return fail(where + ".format is missing");
    }
    std::string format = entry["format"].get<std::string>();
    out->format = mrt_model_format_from_string(format.c_str());
    if (out->format == MRT_MODEL_FORMAT_UNKNOWN) {
        return fail(where + ".format '" + format + "' is not gguf, whisper or piper");
    }

    if (!entry.contains("url") || !entry["url"].is_string()) {
        return fail(where + ".url is missing");
    }
    out->url = entry["url"].get<std::string>();

    if (!entry.contains("download_size") || !entry["download_size"].is_number_integer()) {
        return fail(where + ".download_size is missing");
    }
    out->download_size = entry["download_size"].get<int64_t>();

    if (!entry.contains("memory_required") || !entry["memory_required"].is_number_integer()) {
        return fail(where + ".memory_required is missing");
    }
    out->memory_required = entry["memory_required"].get<int64_t>();

    if (!entry.contains("checksum") || !entry["checksum"].is_string()) {
        return fail(where + ".checksum is missing");
    }
    out->checksum = to_lower_hex(entry["checksum"].get<std::string>());

    out->checksum_algorithm = MRT_CHECKSUM_SHA256;
    if (entry.contains("checksum_algorithm")) {
        if (!entry["checksum_algorithm"].is_string() ||
            entry["checksum_algorithm"].get<std::string>() != "sha256") {
            mrt_error_set_details((where + ".checksum_algorithm must be sha256").c_str());
            return MRT_ERROR_CHECKSUM_UNSUPPORTED;
        }
    }
    return MRT_SUCCESS;
}

}  // namespace

mrt_result_t parse_model_catalog(const std::string& json, std::vector<ModelDescriptor>* out) {
    Json doc;
    try {
        doc = Json::parse(json);
    } catch (const std::exception& e) {
        return fail(std::string("Catalog is not valid JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        return fail("Catalog root must be an object");
    }
    if (doc.contains("version")) {
        if (!doc["version"].is_number_integer() || doc["version"].get<int>() != kCatalogVersion) {
            return fail("Unsupported catalog version");
        }
    }
    if (!doc.contains("models") || !doc["models"].is_array()) {
        return fail("Catalog has no 'models' array");
    }

    std::vector<ModelDescriptor> descriptors;
    const auto& models = doc["models"];
    descriptors.reserve(models.size());
    for (size_t i = 0; i < models.size(); ++i) {
        ModelDescriptor descriptor;
        mrt_result_t rc = parse_entry(models[i], i, &descriptor);
        if (rc != MRT_SUCCESS) {
            return rc;
        }
        descriptors.push_back(std::move(descriptor));
    }

    *out = std::move(descriptors);
    return MRT_SUCCESS;
}

}  // namespace mrt
