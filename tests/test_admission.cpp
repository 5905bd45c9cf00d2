/**
 * @file test_admission.cpp
 * @brief Tests for model loading under the memory ceiling
 */

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "fake_backend.h"
#include "mrt/features/session/mrt_session.h"
#include "mrt/infrastructure/memory/mrt_admission.h"
#include "mrt/infrastructure/model_management/mrt_model_store.h"
#include "test_support.h"

using mrt_test::FakeBackend;
using mrt_test::kMB;

namespace {

class AdmissionTest : public mrt_test::RuntimeTest {
   protected:
    void start(int64_t ceiling_bytes) {
        mrt_config_t config = make_config();
        config.memory_ceiling_bytes = ceiling_bytes;
        init(config);
        ASSERT_EQ(llama_.register_self(), MRT_SUCCESS);
    }

    void TearDown() override {
        llama_.open_gate();
        RuntimeTest::TearDown();
    }

    int64_t resident() {
        int64_t bytes = -1;
        EXPECT_EQ(mrt_memory_get_usage(&bytes, nullptr), MRT_SUCCESS);
        return bytes;
    }

    // Starts a generation on model_id that blocks in the backend until the gate opens
    mrt_session_handle_t hold(const char* model_id) {
        llama_.close_gate();
        mrt_session_handle_t session = nullptr;
        EXPECT_EQ(mrt_session_create(MRT_SESSION_GENERATION, model_id, &session), MRT_SUCCESS);
        EXPECT_EQ(mrt_session_start_generation(session, "hold on", nullptr), MRT_SUCCESS);
        EXPECT_TRUE(mrt_test::wait_until([this] { return llama_.waiting.load() == 1; }));
        return session;
    }

    FakeBackend llama_{"llamacpp", mrt_test::generation_caps(2048)};
};

}  // namespace

// =============================================================================
// LOAD
// =============================================================================

TEST_F(AdmissionTest, LoadsVerifiedModel) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);

    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);
    EXPECT_TRUE(mrt_model_is_loaded("llm"));
    EXPECT_EQ(resident(), 300 * kMB);
    EXPECT_EQ(llama_.creates.load(), 1);
    EXPECT_EQ(llama_.last_context_length.load(), 2048);

    mrt_model_artifact_t artifact{};
    ASSERT_EQ(mrt_store_get("llm", &artifact), MRT_SUCCESS);
    EXPECT_EQ(llama_.last_model_path(), std::string(artifact.local_path));
    mrt_model_artifact_free(&artifact);
}

TEST_F(AdmissionTest, LoadingTwiceIsIdempotent) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);

    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);
    EXPECT_EQ(llama_.creates.load(), 1);
    EXPECT_EQ(resident(), 300 * kMB);
}

TEST_F(AdmissionTest, UnknownModel) {
    start(1024 * kMB);
    EXPECT_EQ(mrt_model_load("nobody"), MRT_ERROR_MODEL_NOT_FOUND);
}

TEST_F(AdmissionTest, RequiresVerifiedArtifact) {
    start(1024 * kMB);
    ASSERT_EQ(register_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB,
                             mrt_test::make_payload(1024)),
              MRT_SUCCESS);
    EXPECT_EQ(mrt_model_load("llm"), MRT_ERROR_MODEL_NOT_FOUND);
    EXPECT_EQ(llama_.creates.load(), 0);
}

TEST_F(AdmissionTest, RequiresBackendForFormat) {
    start(1024 * kMB);
    install_model("voice", MRT_MODEL_FORMAT_PIPER_TTS, 50 * kMB);
    EXPECT_EQ(mrt_model_load("voice"), MRT_ERROR_BACKEND);
    EXPECT_FALSE(mrt_model_is_loaded("voice"));
}

TEST_F(AdmissionTest, BackendFailureIsReported) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    llama_.create_result = MRT_ERROR_BACKEND;
    llama_.create_message = "unsupported quantization";

    EXPECT_EQ(mrt_model_load("llm"), MRT_ERROR_BACKEND);
    ASSERT_NE(mrt_error_get_details(), nullptr);
    EXPECT_STREQ(mrt_error_get_details(), "unsupported quantization");
    EXPECT_FALSE(mrt_model_is_loaded("llm"));
    EXPECT_EQ(resident(), 0);
}

TEST_F(AdmissionTest, ModelLargerThanCeilingIsRejected) {
    start(256 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    EXPECT_EQ(mrt_model_load("llm"), MRT_ERROR_INSUFFICIENT_MEMORY);
    EXPECT_EQ(llama_.creates.load(), 0);
}

// =============================================================================
// EVICTION
// =============================================================================

TEST_F(AdmissionTest, EvictsLeastRecentlyUsed) {
    start(1000 * kMB);
    install_model("a", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("b", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("c", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);

    ASSERT_EQ(mrt_model_load("a"), MRT_SUCCESS);
    ASSERT_EQ(mrt_model_load("b"), MRT_SUCCESS);
    // Touch a so b becomes the oldest
    ASSERT_EQ(mrt_model_load("a"), MRT_SUCCESS);

    ASSERT_EQ(mrt_model_load("c"), MRT_SUCCESS);
    EXPECT_TRUE(mrt_model_is_loaded("a"));
    EXPECT_FALSE(mrt_model_is_loaded("b"));
    EXPECT_TRUE(mrt_model_is_loaded("c"));
    EXPECT_EQ(llama_.destroys.load(), 1);
    EXPECT_EQ(resident(), 800 * kMB);
}

TEST_F(AdmissionTest, InUseModelIsNeverEvicted) {
    start(600 * kMB);
    install_model("big", MRT_MODEL_FORMAT_GGUF_LLM, 500 * kMB);
    install_model("small", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);

    ASSERT_EQ(mrt_model_load("big"), MRT_SUCCESS);
    mrt_session_handle_t session = hold("big");

    EXPECT_EQ(mrt_model_load("small"), MRT_ERROR_INSUFFICIENT_MEMORY);
    EXPECT_TRUE(mrt_model_is_loaded("big"));
    EXPECT_EQ(resident(), 500 * kMB);

    llama_.open_gate();
    ASSERT_EQ(mrt_session_wait(session, -1), MRT_SUCCESS);
    mrt_session_destroy(session);

    ASSERT_EQ(mrt_model_load("small"), MRT_SUCCESS);
    EXPECT_FALSE(mrt_model_is_loaded("big"));
    EXPECT_EQ(resident(), 300 * kMB);
}

TEST_F(AdmissionTest, FailedPlanEvictsNothing) {
    start(1000 * kMB);
    install_model("idle", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("busy", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("huge", MRT_MODEL_FORMAT_GGUF_LLM, 700 * kMB);

    ASSERT_EQ(mrt_model_load("idle"), MRT_SUCCESS);
    ASSERT_EQ(mrt_model_load("busy"), MRT_SUCCESS);
    mrt_session_handle_t session = hold("busy");

    // Evicting "idle" alone would not make room, so nothing is evicted
    EXPECT_EQ(mrt_model_load("huge"), MRT_ERROR_INSUFFICIENT_MEMORY);
    EXPECT_TRUE(mrt_model_is_loaded("idle"));
    EXPECT_TRUE(mrt_model_is_loaded("busy"));
    EXPECT_EQ(llama_.destroys.load(), 0);

    llama_.open_gate();
    ASSERT_EQ(mrt_session_wait(session, -1), MRT_SUCCESS);
    mrt_session_destroy(session);
}

TEST_F(AdmissionTest, CeilingFromDeviceMemory) {
    platform_.total_memory = 4096ull * kMB;
    mrt_config_t config = make_config();
    config.memory_ceiling_bytes = 0;
    config.memory_ceiling_fraction = 0.25f;
    init(config);

    int64_t ceiling = 0;
    ASSERT_EQ(mrt_memory_get_usage(nullptr, &ceiling), MRT_SUCCESS);
    EXPECT_EQ(ceiling, 1024 * kMB);
}

// =============================================================================
// UNLOAD / LISTING
// =============================================================================

TEST_F(AdmissionTest, UnloadReleasesBackendHandle) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);

    ASSERT_EQ(mrt_model_unload("llm"), MRT_SUCCESS);
    EXPECT_FALSE(mrt_model_is_loaded("llm"));
    EXPECT_EQ(llama_.live_handles.load(), 0);
    EXPECT_EQ(resident(), 0);
    EXPECT_EQ(mrt_model_unload("llm"), MRT_ERROR_MODEL_NOT_LOADED);
}

TEST_F(AdmissionTest, UnloadInUseModelFails) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);
    mrt_session_handle_t session = hold("llm");

    EXPECT_EQ(mrt_model_unload("llm"), MRT_ERROR_MODEL_IN_USE);
    EXPECT_EQ(mrt_store_delete("llm"), MRT_ERROR_MODEL_IN_USE);

    llama_.open_gate();
    ASSERT_EQ(mrt_session_wait(session, -1), MRT_SUCCESS);
    mrt_session_destroy(session);
    EXPECT_EQ(mrt_model_unload("llm"), MRT_SUCCESS);
    EXPECT_EQ(mrt_store_delete("llm"), MRT_SUCCESS);
}

TEST_F(AdmissionTest, UnloadCancelsIdleSessions) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);

    mrt_session_handle_t session = nullptr;
    ASSERT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "llm", &session), MRT_SUCCESS);
    EXPECT_EQ(mrt_session_get_state(session), MRT_SESSION_STATE_IDLE);

    ASSERT_EQ(mrt_model_unload("llm"), MRT_SUCCESS);
    EXPECT_EQ(mrt_session_get_state(session), MRT_SESSION_STATE_CANCELLED);
    const char* message = nullptr;
    EXPECT_EQ(mrt_session_get_error(session, &message), MRT_ERROR_CANCELLED);
    EXPECT_STREQ(message, "Model 'llm' was unloaded");

    EXPECT_EQ(mrt_session_start_generation(session, "too late", nullptr),
              MRT_ERROR_INVALID_STATE);
    EXPECT_EQ(llama_.requests.load(), 0);
    mrt_session_destroy(session);
}

TEST_F(AdmissionTest, EvictionCancelsIdleSessions) {
    start(1000 * kMB);
    install_model("a", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("b", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    install_model("c", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
    ASSERT_EQ(mrt_model_load("a"), MRT_SUCCESS);
    ASSERT_EQ(mrt_model_load("b"), MRT_SUCCESS);

    mrt_session_handle_t on_a = nullptr;
    mrt_session_handle_t on_b = nullptr;
    ASSERT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "a", &on_a), MRT_SUCCESS);
    ASSERT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "b", &on_b), MRT_SUCCESS);

    ASSERT_EQ(mrt_model_load("c"), MRT_SUCCESS);
    EXPECT_FALSE(mrt_model_is_loaded("a"));
    EXPECT_EQ(mrt_session_get_state(on_a), MRT_SESSION_STATE_CANCELLED);
    EXPECT_EQ(mrt_session_get_state(on_b), MRT_SESSION_STATE_IDLE);

    // The survivor is still usable
    llama_.text_steps = {"ok"};
    ASSERT_EQ(mrt_session_start_generation(on_b, "still here?", nullptr), MRT_SUCCESS);
    EXPECT_EQ(mrt_session_wait(on_b, 5000), MRT_SUCCESS);
    mrt_session_destroy(on_a);
    mrt_session_destroy(on_b);
}

TEST_F(AdmissionTest, CancelRacingCompletionNeverTouchesFreedHandle) {
    start(1000 * kMB);
    install_model("a", MRT_MODEL_FORMAT_GGUF_LLM, 600 * kMB);
    install_model("b", MRT_MODEL_FORMAT_GGUF_LLM, 600 * kMB);
    llama_.text_steps = {"x", "y"};

    for (int round = 0; round < 50; ++round) {
        ASSERT_EQ(mrt_model_load("a"), MRT_SUCCESS);
        mrt_session_handle_t session = nullptr;
        ASSERT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "a", &session), MRT_SUCCESS);
        ASSERT_EQ(mrt_session_start_generation(session, "race", nullptr), MRT_SUCCESS);

        std::thread canceller([session] { mrt_session_cancel(session); });
        // b only fits once the session lets go of a, which is then evicted
        mrt_result_t rc = MRT_ERROR_INSUFFICIENT_MEMORY;
        while (rc == MRT_ERROR_INSUFFICIENT_MEMORY) {
            rc = mrt_model_load("b");
            if (rc == MRT_ERROR_INSUFFICIENT_MEMORY) {
                std::this_thread::yield();
            }
        }
        canceller.join();
        ASSERT_EQ(rc, MRT_SUCCESS);

        mrt_session_state_t state = mrt_session_get_state(session);
        EXPECT_TRUE(state == MRT_SESSION_STATE_COMPLETED ||
                    state == MRT_SESSION_STATE_CANCELLED)
            << mrt_session_state_name(state);
        mrt_session_destroy(session);
        ASSERT_EQ(mrt_model_unload("b"), MRT_SUCCESS);
    }

    EXPECT_EQ(llama_.dead_handle_cancels.load(), 0);
    EXPECT_EQ(llama_.live_handles.load(), 0);
}

TEST_F(AdmissionTest, ListsLoadedModels) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);
    mrt_session_handle_t session = hold("llm");

    mrt_loaded_model_info_t* models = nullptr;
    size_t count = 0;
    ASSERT_EQ(mrt_model_list_loaded(&models, &count), MRT_SUCCESS);
    ASSERT_EQ(count, 1u);
    EXPECT_STREQ(models[0].model_id, "llm");
    EXPECT_STREQ(models[0].backend_name, "llamacpp");
    EXPECT_EQ(models[0].resident_bytes, 300 * kMB);
    EXPECT_EQ(models[0].ref_count, 1);
    mrt_loaded_model_list_free(models, count);

    llama_.open_gate();
    ASSERT_EQ(mrt_session_wait(session, -1), MRT_SUCCESS);
    mrt_session_destroy(session);
}

TEST_F(AdmissionTest, ShutdownUnloadsEverything) {
    start(1024 * kMB);
    install_model("llm", MRT_MODEL_FORMAT_GGUF_LLM, 300 * kMB);
    ASSERT_EQ(mrt_model_load("llm"), MRT_SUCCESS);

    mrt_shutdown();
    EXPECT_EQ(llama_.live_handles.load(), 0);
    EXPECT_EQ(llama_.destroys.load(), 1);
}
