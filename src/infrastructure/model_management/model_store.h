/**
 * @file model_store.h
 * @brief modelrt - Model Store (internal)
 *
 * On-disk artifact records. Layout of the models directory:
 *
 *   manifest.json      versioned record of every artifact
 *   <id>.part          staging file of an unverified (partial) artifact
 *   <id><ext>          verified artifact, renamed from <id>.part
 *
 * Readers take a shared lock and see a consistent snapshot; mutators are
 * serialized and rewrite the manifest atomically (temp file + rename).
 */

#ifndef MRT_MODEL_STORE_INTERNAL_H
#define MRT_MODEL_STORE_INTERNAL_H

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/platform.h"
#include "infrastructure/model_management/model_types.h"

namespace mrt {

class ModelStore {
   public:
    static constexpr int kManifestVersion = 1;

    ModelStore(std::string directory, int64_t quota_bytes, const Platform& platform);

    ModelStore(const ModelStore&) = delete;
    ModelStore& operator=(const ModelStore&) = delete;

    /**
     * @brief Create the directory, load the manifest and reconcile it with disk
     *
     * A corrupt manifest is moved aside and the store starts empty, adopting
     * any staging files it finds.
     */
    mrt_result_t open();

    bool get(const std::string& id, ModelArtifact* out) const;
    std::vector<ModelArtifact> list() const;

    std::string final_path(const ModelDescriptor& descriptor) const;
    std::string staging_path(const std::string& id) const;

    /**
     * @brief Ensure an unverified record backed by the staging file
     *
     * downloaded_bytes is taken from the staging file's actual size. A
     * corrupt record is discarded first.
     */
    mrt_result_t begin_partial(const ModelDescriptor& descriptor, ModelArtifact* out);

    // Truncate the staging file and reset the record to zero bytes
    mrt_result_t reset_partial(const std::string& id);

    mrt_result_t record_progress(const std::string& id, int64_t downloaded_bytes, bool persist);

    // Rename staging -> final path and mark the record verified
    mrt_result_t mark_verified(const ModelDescriptor& descriptor, ModelArtifact* out);

    // Delete the artifact's files and record
    mrt_result_t discard(const std::string& id);

    /**
     * @brief Whether additional_bytes more fit the quota and the volume
     *
     * @return MRT_SUCCESS or MRT_ERROR_STORAGE_FULL
     */
    mrt_result_t check_capacity(int64_t additional_bytes) const;

    int64_t used_bytes() const;
    int64_t quota_bytes() const { return quota_bytes_; }
    const std::string& directory() const { return directory_; }

   private:
    std::string manifest_path() const;
    mrt_result_t load_manifest_locked();
    mrt_result_t save_manifest_locked() const;
    void reconcile_locked();
    int64_t used_bytes_locked() const;

    std::string directory_;
    int64_t quota_bytes_;
    const Platform& platform_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, ModelArtifact> artifacts_;
};

}  // namespace mrt

#endif  // MRT_MODEL_STORE_INTERNAL_H
