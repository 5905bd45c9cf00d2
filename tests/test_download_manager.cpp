/**
 * @file test_download_manager.cpp
 * @brief Tests for model downloads: sharing, resume, integrity and capacity
 */

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "mrt/core/mrt_events.h"
#include "mrt/infrastructure/download/mrt_download.h"
#include "mrt/infrastructure/model_management/mrt_model_store.h"
#include "test_support.h"

namespace fs = std::filesystem;

using mrt_test::kMB;
using mrt_test::make_payload;

namespace {

constexpr size_t kPayloadSize = 64 * 1024;

class DownloadTest : public mrt_test::RuntimeTest {
   protected:
    void SetUp() override {
        transport_.chunk_size = 4096;
        payload_ = make_payload(kPayloadSize, 42);
    }

    void register_llm(const std::string& id = "smollm2-360m") {
        ASSERT_EQ(register_model(id, MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB, payload_),
                  MRT_SUCCESS);
    }

    // Drains a handle, returning every event it delivered
    std::vector<mrt_progress_event_t> drain(mrt_download_handle_t handle) {
        std::vector<mrt_progress_event_t> events;
        for (;;) {
            mrt_progress_event_t event{};
            mrt_bool_t finished = MRT_FALSE;
            if (mrt_download_next(handle, 5000, &event, &finished) != MRT_SUCCESS || finished) {
                break;
            }
            event.subject_id = nullptr;
            events.push_back(event);
        }
        return events;
    }

    mrt_model_artifact_t stored(const std::string& id) {
        mrt_model_artifact_t artifact{};
        EXPECT_EQ(mrt_store_get(id.c_str(), &artifact), MRT_SUCCESS);
        return artifact;
    }

    std::string payload_;
};

void count_event(const mrt_progress_event_t* event, void* user_data) {
    if (event->kind == MRT_PROGRESS_BYTES) {
        static_cast<std::atomic<int>*>(user_data)->fetch_add(1);
    }
}

}  // namespace

// =============================================================================
// BASIC FETCH
// =============================================================================

TEST_F(DownloadTest, DownloadsAndVerifies) {
    init();
    register_llm();

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    auto events = drain(handle);

    mrt_model_artifact_t artifact{};
    ASSERT_EQ(mrt_download_result(handle, &artifact), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_get_state(handle), MRT_DOWNLOAD_STATE_COMPLETED);
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_VERIFIED);
    EXPECT_EQ(artifact.size_on_disk, static_cast<int64_t>(kPayloadSize));
    EXPECT_EQ(mrt_test::read_file(artifact.local_path), payload_);
    EXPECT_EQ(fs::path(artifact.local_path).extension(), ".gguf");
    mrt_model_artifact_free(&artifact);
    mrt_download_release(handle);

    ASSERT_FALSE(events.empty());
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].sequence, events[i - 1].sequence);
        EXPECT_GE(events[i].bytes_downloaded, events[i - 1].bytes_downloaded);
    }
    EXPECT_EQ(events.back().bytes_downloaded, static_cast<int64_t>(kPayloadSize));
    EXPECT_EQ(events.back().bytes_total, static_cast<int64_t>(kPayloadSize));
    EXPECT_EQ(transport_.gets.load(), 1);
}

TEST_F(DownloadTest, UnknownModel) {
    init();
    mrt_download_handle_t handle = nullptr;
    EXPECT_EQ(mrt_download_start("nobody", &handle), MRT_ERROR_MODEL_NOT_FOUND);
    EXPECT_EQ(handle, nullptr);
}

TEST_F(DownloadTest, VerifiedModelCompletesWithoutTransfer) {
    init();
    register_llm();
    mrt_model_artifact_t artifact{};
    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    mrt_model_artifact_free(&artifact);
    int gets = transport_.gets.load();

    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_VERIFIED);
    mrt_model_artifact_free(&artifact);
    EXPECT_EQ(transport_.gets.load(), gets);
}

TEST_F(DownloadTest, ResultWhileRunningIsInvalidState) {
    init();
    register_llm();
    transport_.close_gate();

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_get_state(handle), MRT_DOWNLOAD_STATE_RUNNING);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_ERROR_INVALID_STATE);
    EXPECT_EQ(mrt_download_wait(handle, 20), MRT_ERROR_TIMEOUT);

    transport_.open_gate();
    EXPECT_EQ(mrt_download_wait(handle, -1), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_SUCCESS);
    mrt_download_release(handle);
}

// =============================================================================
// SHARED TRANSFER
// =============================================================================

TEST_F(DownloadTest, ConcurrentFetchesShareOneTransfer) {
    init();
    register_llm();
    transport_.close_gate();

    mrt_download_handle_t first = nullptr;
    mrt_download_handle_t second = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &first), MRT_SUCCESS);
    ASSERT_EQ(mrt_download_start("smollm2-360m", &second), MRT_SUCCESS);

    transport_.open_gate();
    ASSERT_EQ(mrt_download_wait(first, -1), MRT_SUCCESS);
    ASSERT_EQ(mrt_download_wait(second, -1), MRT_SUCCESS);

    EXPECT_EQ(mrt_download_result(first, nullptr), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_result(second, nullptr), MRT_SUCCESS);
    EXPECT_EQ(transport_.gets.load(), 1);
    EXPECT_EQ(transport_.probes.load(), 1);

    mrt_download_release(first);
    mrt_download_release(second);
}

TEST_F(DownloadTest, ReleasedSubscriberDoesNotStopTransfer) {
    init();
    register_llm();
    transport_.close_gate();

    mrt_download_handle_t leaving = nullptr;
    mrt_download_handle_t staying = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &leaving), MRT_SUCCESS);
    ASSERT_EQ(mrt_download_start("smollm2-360m", &staying), MRT_SUCCESS);
    mrt_download_release(leaving);

    transport_.open_gate();
    ASSERT_EQ(mrt_download_wait(staying, -1), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_result(staying, nullptr), MRT_SUCCESS);
    mrt_download_release(staying);
}

TEST_F(DownloadTest, SlowConsumerLosesOnlyOldProgress) {
    mrt_config_t config = make_config();
    config.stream_buffer_chunks = 2;
    init(config);
    register_llm();

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    ASSERT_EQ(mrt_download_wait(handle, -1), MRT_SUCCESS);

    auto events = drain(handle);
    ASSERT_FALSE(events.empty());
    EXPECT_LE(events.size(), 2u);
    EXPECT_EQ(events.back().bytes_downloaded, static_cast<int64_t>(kPayloadSize));
    EXPECT_GT(events.front().sequence, 1u);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_SUCCESS);

    // After the final event the handle only reports finished
    mrt_progress_event_t event{};
    mrt_bool_t finished = MRT_FALSE;
    EXPECT_EQ(mrt_download_next(handle, 0, &event, &finished), MRT_SUCCESS);
    EXPECT_TRUE(finished);
    mrt_download_release(handle);
}

TEST_F(DownloadTest, ListenerSeesProgress) {
    init();
    register_llm();
    std::atomic<int> count{0};
    ASSERT_EQ(mrt_events_set_listener(&count_event, &count), MRT_SUCCESS);
    EXPECT_TRUE(mrt_events_has_listener());

    mrt_model_artifact_t artifact{};
    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    mrt_model_artifact_free(&artifact);
    EXPECT_GE(count.load(), static_cast<int>(kPayloadSize / transport_.chunk_size));

    ASSERT_EQ(mrt_events_set_listener(nullptr, nullptr), MRT_SUCCESS);
    EXPECT_FALSE(mrt_events_has_listener());
}

// =============================================================================
// RESUME
// =============================================================================

TEST_F(DownloadTest, ResumesAcrossRestart) {
    const int64_t half = static_cast<int64_t>(kPayloadSize / 2);
    const std::string url = url_for("smollm2-360m");

    init();
    register_llm();
    transport_.set_fail_after(url, half);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_NETWORK);
    artifact = stored("smollm2-360m");
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_UNVERIFIED);
    EXPECT_EQ(artifact.downloaded_bytes, half);
    mrt_model_artifact_free(&artifact);

    // New process: same directory, catalog registered again
    mrt_shutdown();
    init();
    register_llm();
    transport_.set_fail_after(url, -1);

    artifact = stored("smollm2-360m");
    EXPECT_EQ(artifact.downloaded_bytes, half);
    mrt_model_artifact_free(&artifact);

    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_VERIFIED);
    EXPECT_EQ(mrt_test::read_file(artifact.local_path), payload_);
    mrt_model_artifact_free(&artifact);

    auto offsets = transport_.requested_offsets(url);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[0], 0);
    EXPECT_EQ(offsets[1], half);
}

TEST_F(DownloadTest, RestartsWhenServerHasNoRanges) {
    const std::string url = url_for("smollm2-360m");
    init();
    register_llm();
    transport_.set_accepts_ranges(url, false);
    transport_.set_fail_after(url, 10000);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_NETWORK);

    transport_.set_fail_after(url, -1);
    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    EXPECT_EQ(mrt_test::read_file(artifact.local_path), payload_);
    mrt_model_artifact_free(&artifact);

    auto offsets = transport_.requested_offsets(url);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 0);
}

TEST_F(DownloadTest, RestartsWhenRangeIsIgnored) {
    const std::string url = url_for("smollm2-360m");
    init();
    register_llm();
    transport_.set_honours_ranges(url, false);
    transport_.set_fail_after(url, 10000);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_NETWORK);

    // The range request is answered with 200 and the whole body
    transport_.set_fail_after(url, -1);
    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    EXPECT_EQ(mrt_test::read_file(artifact.local_path), payload_);
    mrt_model_artifact_free(&artifact);

    auto offsets = transport_.requested_offsets(url);
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], 10000);
}

TEST_F(DownloadTest, CancelKeepsDownloadedBytes) {
    init();
    register_llm();
    transport_.chunk_size = 1024;
    transport_.chunk_delay_ms = 2;

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);

    // Wait for real bytes before cancelling
    for (;;) {
        mrt_progress_event_t event{};
        mrt_bool_t finished = MRT_FALSE;
        ASSERT_EQ(mrt_download_next(handle, 5000, &event, &finished), MRT_SUCCESS);
        ASSERT_FALSE(finished);
        if (event.bytes_downloaded > 0) {
            break;
        }
    }
    ASSERT_EQ(mrt_download_cancel(handle), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_get_state(handle), MRT_DOWNLOAD_STATE_CANCELLED);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_ERROR_CANCELLED);
    mrt_download_release(handle);

    mrt_model_artifact_t artifact = stored("smollm2-360m");
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_UNVERIFIED);
    int64_t kept = artifact.downloaded_bytes;
    EXPECT_GT(kept, 0);
    EXPECT_LT(kept, static_cast<int64_t>(kPayloadSize));
    mrt_model_artifact_free(&artifact);

    transport_.chunk_delay_ms = 0;
    ASSERT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_SUCCESS);
    mrt_model_artifact_free(&artifact);
    auto offsets = transport_.requested_offsets(url_for("smollm2-360m"));
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[1], kept);
}

TEST_F(DownloadTest, FailedCheckpointDoesNotStopTransfer) {
    mrt_config_t config = make_config();
    config.download_persist_interval_bytes = 4096;
    init(config);
    register_llm();
    transport_.set_fail_after(url_for("smollm2-360m"), 8192);
    transport_.close_gate();

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return transport_.waiting.load() == 1; }));

    // Every manifest rewrite fails from here on
    fs::create_directories(fs::path(models_dir_) / "manifest.json.tmp");
    transport_.open_gate();

    drain(handle);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_ERROR_NETWORK);
    mrt_download_release(handle);
    EXPECT_TRUE(platform_.logged("Cannot checkpoint 'smollm2-360m'"));

    mrt_model_artifact_t artifact = stored("smollm2-360m");
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_UNVERIFIED);
    EXPECT_EQ(artifact.downloaded_bytes, 8192);
    mrt_model_artifact_free(&artifact);
}

// =============================================================================
// FAILURES
// =============================================================================

TEST_F(DownloadTest, ChecksumMismatchDeletesArtifact) {
    init();
    // Registered checksum is for a different body
    ASSERT_EQ(register_model("smollm2-360m", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB,
                             make_payload(kPayloadSize, 1)),
              MRT_SUCCESS);
    transport_.serve(url_for("smollm2-360m"), payload_);

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    ASSERT_EQ(mrt_download_wait(handle, -1), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_result(handle, nullptr), MRT_ERROR_INTEGRITY);
    EXPECT_EQ(mrt_download_get_state(handle), MRT_DOWNLOAD_STATE_FAILED);
    const char* message = mrt_download_get_error_message(handle);
    ASSERT_NE(message, nullptr);
    EXPECT_NE(std::string(message).find("Checksum mismatch"), std::string::npos);
    mrt_download_release(handle);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_store_get("smollm2-360m", &artifact), MRT_ERROR_NOT_FOUND);
    EXPECT_FALSE(fs::exists(fs::path(models_dir_) / "smollm2-360m.part"));
    EXPECT_FALSE(fs::exists(fs::path(models_dir_) / "smollm2-360m.gguf"));
}

TEST_F(DownloadTest, StorageFullBeforeAnyTransfer) {
    init();
    register_llm();
    platform_.free_bytes = 1024;

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_STORAGE_FULL);
    EXPECT_EQ(transport_.gets.load(), 0);
}

TEST_F(DownloadTest, QuotaExceeded) {
    mrt_config_t config = make_config();
    config.storage_quota_bytes = kPayloadSize / 2;
    init(config);
    register_llm();

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_STORAGE_FULL);
    EXPECT_EQ(transport_.gets.load(), 0);

    int64_t used = -1;
    int64_t quota = 0;
    ASSERT_EQ(mrt_store_get_usage(&used, &quota), MRT_SUCCESS);
    EXPECT_EQ(used, 0);
    EXPECT_EQ(quota, static_cast<int64_t>(kPayloadSize / 2));
}

TEST_F(DownloadTest, HttpErrorIsNetworkFailure) {
    init();
    register_llm();
    transport_.set_status(url_for("smollm2-360m"), 503);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_download_model("smollm2-360m", &artifact), MRT_ERROR_NETWORK);
}

TEST_F(DownloadTest, DeleteWhileDownloadingIsRefused) {
    init();
    register_llm();
    transport_.close_gate();

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    EXPECT_EQ(mrt_store_delete("smollm2-360m"), MRT_ERROR_MODEL_IN_USE);

    transport_.open_gate();
    ASSERT_EQ(mrt_download_wait(handle, -1), MRT_SUCCESS);
    mrt_download_release(handle);

    EXPECT_EQ(mrt_store_delete("smollm2-360m"), MRT_SUCCESS);
    EXPECT_FALSE(fs::exists(fs::path(models_dir_) / "smollm2-360m.gguf"));
}

TEST_F(DownloadTest, ShutdownCancelsRunningTransfer) {
    init();
    register_llm();
    transport_.chunk_size = 512;
    transport_.chunk_delay_ms = 5;

    mrt_download_handle_t handle = nullptr;
    ASSERT_EQ(mrt_download_start("smollm2-360m", &handle), MRT_SUCCESS);
    mrt_shutdown();

    EXPECT_EQ(mrt_download_wait(handle, 0), MRT_SUCCESS);
    EXPECT_EQ(mrt_download_get_state(handle), MRT_DOWNLOAD_STATE_CANCELLED);
    mrt_download_release(handle);
}
