/**
 * @file model_store.cpp
 * @brief modelrt - Model Store Implementation
 */

#include "infrastructure/model_management/model_store.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"
#include "mrt/infrastructure/model_management/mrt_model_store.h"

namespace fs = std::filesystem;

namespace mrt {

namespace {

using Json = nlohmann::json;

constexpr const char* kManifestName = "manifest.json";
constexpr const char* kStagingSuffix = ".part";

mrt_artifact_state_t state_from_string(const std::string& name, bool* ok) {
    *ok = true;
    if (name == "unverified") return MRT_ARTIFACT_UNVERIFIED;
    if (name == "verified") return MRT_ARTIFACT_VERIFIED;
    if (name == "corrupt") return MRT_ARTIFACT_CORRUPT;
    *ok = false;
    return MRT_ARTIFACT_UNVERIFIED;
}

int64_t file_size_or(const std::string& path, int64_t fallback) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? fallback : static_cast<int64_t>(size);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        MRT_LOG_WARNING("ModelStore", "Failed to remove %s: %s", path.c_str(),
                        ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace

ModelStore::ModelStore(std::string directory, int64_t quota_bytes, const Platform& platform)
    : directory_(std::move(directory)), quota_bytes_(quota_bytes), platform_(platform) {}

std::string ModelStore::manifest_path() const {
    return (fs::path(directory_) / kManifestName).string();
}

std::string ModelStore::final_path(const ModelDescriptor& descriptor) const {
    return (fs::path(directory_) / (descriptor.id + artifact_extension(descriptor.format)))
        .string();
}

std::string ModelStore::staging_path(const std::string& id) const {
    return (fs::path(directory_) / (id + kStagingSuffix)).string();
}

// =============================================================================
// OPEN / MANIFEST
// =============================================================================

mrt_result_t ModelStore::open() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec || !fs::is_directory(directory_, ec)) {
        std::string details = "Cannot create models directory " + directory_;
        mrt_error_set_details(details.c_str());
        MRT_LOG_ERROR("ModelStore", "%s", details.c_str());
        return MRT_ERROR_FILE_IO;
    }
    fs::remove(manifest_path() + ".tmp", ec);

    mrt_result_t rc = load_manifest_locked();
    if (rc == MRT_ERROR_MANIFEST_CORRUPT) {
        std::string aside = manifest_path() + ".corrupt";
        fs::rename(manifest_path(), aside, ec);
        MRT_LOG_WARNING("ModelStore", "Manifest is corrupt, moved to %s and starting empty",
                        aside.c_str());
        artifacts_.clear();
    } else if (rc != MRT_SUCCESS) {
        return rc;
    }

    reconcile_locked();

    rc = save_manifest_locked();
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    MRT_LOG_INFO("ModelStore", "Opened %s with %zu artifacts", directory_.c_str(),
                 artifacts_.size());
    return MRT_SUCCESS;
}

mrt_result_t ModelStore::load_manifest_locked() {
    artifacts_.clear();

    std::ifstream in(manifest_path(), std::ios::binary);
    if (!in) {
        return MRT_SUCCESS;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        Json doc = Json::parse(buffer.str());
        if (!doc.is_object() || !doc.contains("version") || !doc["version"].is_number_integer() ||
            doc["version"].get<int>() != kManifestVersion || !doc.contains("artifacts") ||
            !doc["artifacts"].is_array()) {
            return MRT_ERROR_MANIFEST_CORRUPT;
        }
        for (const auto& item : doc["artifacts"]) {
            ModelArtifact artifact;
            artifact.id = item.at("id").get<std::string>();
            artifact.local_path = item.at("local_path").get<std::string>();
            artifact.downloaded_bytes = item.at("downloaded_bytes").get<int64_t>();
            artifact.size_on_disk = item.at("size_on_disk").get<int64_t>();
            bool ok = false;
            artifact.state = state_from_string(item.at("state").get<std::string>(), &ok);
            if (!ok || !is_valid_model_id(artifact.id)) {
                return MRT_ERROR_MANIFEST_CORRUPT;
            }
            artifacts_[artifact.id] = artifact;
        }
    } catch (const std::exception& e) {
        MRT_LOG_ERROR("ModelStore", "Manifest parse error: %s", e.what());
        return MRT_ERROR_MANIFEST_CORRUPT;
    }
    return MRT_SUCCESS;
}

mrt_result_t ModelStore::save_manifest_locked() const {
    Json doc;
    doc["version"] = kManifestVersion;
    doc["artifacts"] = Json::array();
    for (const auto& entry : artifacts_) {
        const auto& artifact = entry.second;
        doc["artifacts"].push_back({{"id", artifact.id},
                                    {"local_path", artifact.local_path},
                                    {"downloaded_bytes", artifact.downloaded_bytes},
                                    {"size_on_disk", artifact.size_on_disk},
                                    {"state", mrt_artifact_state_name(artifact.state)}});
    }

    std::string tmp = manifest_path() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            mrt_error_set_details("Cannot write manifest");
            return MRT_ERROR_FILE_IO;
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            mrt_error_set_details("Cannot write manifest");
            return MRT_ERROR_FILE_IO;
        }
    }

    std::error_code ec;
    fs::rename(tmp, manifest_path(), ec);
    if (ec) {
        mrt_error_set_details(ec.message().c_str());
        return MRT_ERROR_FILE_IO;
    }
    return MRT_SUCCESS;
}

void ModelStore::reconcile_locked() {
    for (auto it = artifacts_.begin(); it != artifacts_.end();) {
        auto& artifact = it->second;
        std::error_code ec;

        if (artifact.state == MRT_ARTIFACT_VERIFIED) {
            if (!fs::exists(artifact.local_path, ec)) {
                MRT_LOG_WARNING("ModelStore", "Verified artifact '%s' is missing, dropping it",
                                artifact.id.c_str());
                it = artifacts_.erase(it);
                continue;
            }
            if (file_size_or(artifact.local_path, -1) != artifact.size_on_disk) {
                MRT_LOG_WARNING("ModelStore", "Artifact '%s' changed on disk, marking corrupt",
                                artifact.id.c_str());
                artifact.state = MRT_ARTIFACT_CORRUPT;
            }
        } else if (artifact.state == MRT_ARTIFACT_UNVERIFIED) {
            std::string staging = staging_path(artifact.id);
            if (!fs::exists(staging, ec)) {
                it = artifacts_.erase(it);
                continue;
            }
            artifact.local_path = staging;
            artifact.downloaded_bytes = file_size_or(staging, 0);
            artifact.size_on_disk = artifact.downloaded_bytes;
        }
        ++it;
    }

    // Adopt staging files written before their first manifest checkpoint
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != kStagingSuffix) {
            continue;
        }
        std::string id = entry.path().stem().string();
        if (!is_valid_model_id(id) || artifacts_.count(id) != 0) {
            continue;
        }
        ModelArtifact artifact;
        artifact.id = id;
        artifact.local_path = entry.path().string();
        artifact.downloaded_bytes = file_size_or(artifact.local_path, 0);
        artifact.size_on_disk = artifact.downloaded_bytes;
        artifact.state = MRT_ARTIFACT_UNVERIFIED;
        artifacts_[id] = artifact;
        MRT_LOG_INFO("ModelStore", "Adopted partial download '%s' (%lld bytes)", id.c_str(),
                     static_cast<long long>(artifact.downloaded_bytes));
    }
}

// =============================================================================
// QUERIES
// =============================================================================

bool ModelStore::get(const std::string& id, ModelArtifact* out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = artifacts_.find(id);
    if (it == artifacts_.end()) {
        return false;
    }
    if (out != nullptr) {
        *out = it->second;
    }
    return true;
}

std::vector<ModelArtifact> ModelStore::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ModelArtifact> out;
    out.reserve(artifacts_.size());
    for (const auto& entry : artifacts_) {
        out.push_back(entry.second);
    }
    return out;
}

int64_t ModelStore::used_bytes_locked() const {
    int64_t total = 0;
    for (const auto& entry : artifacts_) {
        const auto& artifact = entry.second;
        total += artifact.state == MRT_ARTIFACT_UNVERIFIED ? artifact.downloaded_bytes
                                                           : artifact.size_on_disk;
    }
    return total;
}

int64_t ModelStore::used_bytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return used_bytes_locked();
}

mrt_result_t ModelStore::check_capacity(int64_t additional_bytes) const {
    if (additional_bytes <= 0) {
        return MRT_SUCCESS;
    }
    int64_t used = used_bytes();
    if (quota_bytes_ > 0 && used + additional_bytes > quota_bytes_) {
        std::string details = "Quota exceeded: " + std::to_string(used) + " used + " +
                              std::to_string(additional_bytes) + " needed > " +
                              std::to_string(quota_bytes_);
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_STORAGE_FULL;
    }

    uint64_t free_bytes = 0;
    if (platform_.free_storage(directory_, &free_bytes) == MRT_SUCCESS &&
        free_bytes < static_cast<uint64_t>(additional_bytes)) {
        std::string details = "Volume has " + std::to_string(free_bytes) + " bytes free, " +
                              std::to_string(additional_bytes) + " needed";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_STORAGE_FULL;
    }
    return MRT_SUCCESS;
}

// =============================================================================
// MUTATORS
// =============================================================================

mrt_result_t ModelStore::begin_partial(const ModelDescriptor& descriptor, ModelArtifact* out) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = artifacts_.find(descriptor.id);
    if (it != artifacts_.end() && it->second.state == MRT_ARTIFACT_CORRUPT) {
        MRT_LOG_WARNING("ModelStore", "Discarding corrupt artifact '%s'", descriptor.id.c_str());
        remove_file(it->second.local_path);
        artifacts_.erase(it);
        it = artifacts_.end();
    }

    std::string staging = staging_path(descriptor.id);
    ModelArtifact& artifact = artifacts_[descriptor.id];
    artifact.id = descriptor.id;
    artifact.local_path = staging;
    artifact.state = MRT_ARTIFACT_UNVERIFIED;
    artifact.downloaded_bytes = file_size_or(staging, 0);
    artifact.size_on_disk = artifact.downloaded_bytes;

    if (out != nullptr) {
        *out = artifact;
    }
    return save_manifest_locked();
}

mrt_result_t ModelStore::reset_partial(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::string staging = staging_path(id);
    {
        std::ofstream truncate(staging, std::ios::binary | std::ios::trunc);
        if (!truncate) {
            mrt_error_set_details("Cannot truncate staging file");
            return MRT_ERROR_FILE_IO;
        }
    }
    auto it = artifacts_.find(id);
    if (it != artifacts_.end()) {
        it->second.downloaded_bytes = 0;
        it->second.size_on_disk = 0;
    }
    return save_manifest_locked();
}

mrt_result_t ModelStore::record_progress(const std::string& id, int64_t downloaded_bytes,
                                         bool persist) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = artifacts_.find(id);
    if (it == artifacts_.end()) {
        return MRT_ERROR_NOT_FOUND;
    }
    it->second.downloaded_bytes = downloaded_bytes;
    it->second.size_on_disk = downloaded_bytes;
    return persist ? save_manifest_locked() : MRT_SUCCESS;
}

mrt_result_t ModelStore::mark_verified(const ModelDescriptor& descriptor, ModelArtifact* out) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = artifacts_.find(descriptor.id);
    if (it == artifacts_.end()) {
        return MRT_ERROR_NOT_FOUND;
    }

    std::string target = final_path(descriptor);
    std::error_code ec;
    fs::rename(staging_path(descriptor.id), target, ec);
    if (ec) {
        std::string details = "Cannot move artifact into place: " + ec.message();
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_FILE_IO;
    }

    auto& artifact = it->second;
    artifact.local_path = target;
    artifact.size_on_disk = file_size_or(target, artifact.downloaded_bytes);
    artifact.downloaded_bytes = artifact.size_on_disk;
    artifact.state = MRT_ARTIFACT_VERIFIED;
    if (out != nullptr) {
        *out = artifact;
    }
    return save_manifest_locked();
}

mrt_result_t ModelStore::discard(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = artifacts_.find(id);
    if (it == artifacts_.end()) {
        return MRT_ERROR_NOT_FOUND;
    }
    remove_file(it->second.local_path);
    std::string staging = staging_path(id);
    if (staging != it->second.local_path) {
        remove_file(staging);
    }
    artifacts_.erase(it);
    MRT_LOG_INFO("ModelStore", "Removed artifact '%s'", id.c_str());
    return save_manifest_locked();
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

mrt_result_t mrt_store_get(const char* model_id, mrt_model_artifact_t* out_artifact) {
    if (model_id == nullptr || out_artifact == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    mrt::ModelArtifact artifact;
    if (!ctx->store().get(model_id, &artifact)) {
        return MRT_ERROR_NOT_FOUND;
    }
    mrt::artifact_to_c(artifact, out_artifact);
    return MRT_SUCCESS;
}

mrt_result_t mrt_store_list(mrt_model_artifact_t** out_artifacts, size_t* out_count) {
    if (out_artifacts == nullptr || out_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto artifacts = ctx->store().list();
    *out_artifacts = nullptr;
    *out_count = 0;
    if (artifacts.empty()) {
        return MRT_SUCCESS;
    }
    auto* list = static_cast<mrt_model_artifact_t*>(
        mrt_alloc(sizeof(mrt_model_artifact_t) * artifacts.size()));
    if (list == nullptr) {
        return MRT_ERROR_OUT_OF_MEMORY;
    }
    for (size_t i = 0; i < artifacts.size(); ++i) {
        mrt::artifact_to_c(artifacts[i], &list[i]);
    }
    *out_artifacts = list;
    *out_count = artifacts.size();
    return MRT_SUCCESS;
}

mrt_result_t mrt_store_delete(const char* model_id) {
    if (model_id == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    if (ctx->admission().is_loaded(model_id) || ctx->downloads().is_active(model_id)) {
        mrt_error_set_details("Unload the model or cancel its download first");
        return MRT_ERROR_MODEL_IN_USE;
    }
    return ctx->store().discard(model_id);
}

mrt_result_t mrt_store_get_usage(int64_t* out_used_bytes, int64_t* out_quota_bytes) {
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    if (out_used_bytes != nullptr) {
        *out_used_bytes = ctx->store().used_bytes();
    }
    if (out_quota_bytes != nullptr) {
        *out_quota_bytes = ctx->store().quota_bytes();
    }
    return MRT_SUCCESS;
}

}  // extern "C"
