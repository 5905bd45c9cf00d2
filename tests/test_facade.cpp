/**
 * @file test_facade.cpp
 * @brief End-to-end tests through the public C API
 *
 * A host registers its backends, feeds a catalog at init, downloads models,
 * loads them and runs requests, then shuts down with work in flight.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <string>
#include <vector>

#include "fake_backend.h"
#include "mrt/features/session/mrt_session.h"
#include "mrt/features/voice_pipeline/mrt_voice_pipeline.h"
#include "mrt/infrastructure/memory/mrt_admission.h"
#include "mrt/infrastructure/model_management/mrt_model_store.h"
#include "test_support.h"

using mrt_test::FakeBackend;
using mrt_test::kMB;

namespace {

struct CatalogModel {
    std::string id;
    std::string format;
    int64_t memory_required;
    std::string payload;
};

class FacadeTest : public mrt_test::RuntimeTest {
   protected:
    void SetUp() override {
        models_ = {
            {"whisper-tiny-en", "whisper", 75 * kMB, mrt_test::make_payload(6000, 1)},
            {"smollm2-360m-q8", "gguf", 500 * kMB, mrt_test::make_payload(9000, 2)},
            {"piper-lessac-medium", "piper", 65 * kMB, mrt_test::make_payload(3000, 3)},
        };
        for (const auto& model : models_) {
            transport_.serve(url_for(model.id), model.payload);
        }
    }

    void TearDown() override {
        whisper_.open_gate();
        llama_.open_gate();
        piper_.open_gate();
        RuntimeTest::TearDown();
    }

    std::string catalog_json() const {
        std::string json = "{\"version\": 1, \"models\": [";
        for (size_t i = 0; i < models_.size(); ++i) {
            const auto& model = models_[i];
            if (i > 0) {
                json += ", ";
            }
            json += "{\"id\": \"" + model.id + "\", \"name\": \"" + model.id +
                    "\", \"format\": \"" + model.format + "\", \"url\": \"" + url_for(model.id) +
                    "\", \"download_size\": " + std::to_string(model.payload.size()) +
                    ", \"memory_required\": " + std::to_string(model.memory_required) +
                    ", \"checksum\": \"" + mrt_test::sha256_hex(model.payload) + "\"}";
        }
        return json + "]}";
    }

    // Init with the catalog, register backends, download and load everything
    void boot() {
        catalog_ = catalog_json();
        mrt_config_t config = make_config();
        config.catalog_json = catalog_.c_str();
        init(config);

        ASSERT_EQ(whisper_.register_self(), MRT_SUCCESS);
        ASSERT_EQ(llama_.register_self(), MRT_SUCCESS);
        ASSERT_EQ(piper_.register_self(), MRT_SUCCESS);

        for (const auto& model : models_) {
            mrt_model_artifact_t artifact{};
            ASSERT_EQ(mrt_download_model(model.id.c_str(), &artifact), MRT_SUCCESS);
            EXPECT_EQ(artifact.state, MRT_ARTIFACT_VERIFIED);
            mrt_model_artifact_free(&artifact);
            ASSERT_EQ(mrt_model_load(model.id.c_str()), MRT_SUCCESS);
        }
    }

    std::vector<CatalogModel> models_;
    std::string catalog_;

    FakeBackend whisper_{"whispercpp", mrt_test::transcription_caps(16000)};
    FakeBackend llama_{"llamacpp", mrt_test::generation_caps(4096)};
    FakeBackend piper_{"piper", mrt_test::synthesis_caps(22050)};
};

struct TokenCounter {
    std::atomic<int> tokens{0};
    std::atomic<int> bytes{0};
};

void count_progress(const mrt_progress_event_t* event, void* user_data) {
    auto* counter = static_cast<TokenCounter*>(user_data);
    if (event->kind == MRT_PROGRESS_TOKEN) {
        counter->tokens++;
    } else if (event->kind == MRT_PROGRESS_BYTES) {
        counter->bytes++;
    }
}

}  // namespace

// =============================================================================
// END TO END
// =============================================================================

TEST_F(FacadeTest, CatalogToVoiceTurn) {
    boot();

    mrt_model_artifact_t* artifacts = nullptr;
    size_t count = 0;
    ASSERT_EQ(mrt_store_list(&artifacts, &count), MRT_SUCCESS);
    ASSERT_EQ(count, 3u);
    int64_t expected_bytes = 0;
    for (size_t i = 0; i < count; ++i) {
        EXPECT_EQ(artifacts[i].state, MRT_ARTIFACT_VERIFIED);
        expected_bytes += artifacts[i].size_on_disk;
    }
    mrt_model_artifact_list_free(artifacts, count);

    int64_t used = 0;
    ASSERT_EQ(mrt_store_get_usage(&used, nullptr), MRT_SUCCESS);
    EXPECT_EQ(used, expected_bytes);
    EXPECT_EQ(used, 18000);

    int64_t resident = 0;
    ASSERT_EQ(mrt_memory_get_usage(&resident, nullptr), MRT_SUCCESS);
    EXPECT_EQ(resident, 640 * kMB);
    EXPECT_EQ(llama_.last_context_length.load(), 4096);

    whisper_.text_steps = {" Turn on the lights."};
    llama_.text_steps = {"Okay,", " lights on."};
    piper_.audio_steps = {std::vector<float>(512, 0.2f)};

    mrt_voice_pipeline_config_t config{};
    config.stt_model_id = "whisper-tiny-en";
    config.llm_model_id = "smollm2-360m-q8";
    config.tts_model_id = "piper-lessac-medium";
    mrt_voice_pipeline_handle_t pipeline = nullptr;
    ASSERT_EQ(mrt_voice_pipeline_create(&config, nullptr, nullptr, &pipeline), MRT_SUCCESS);

    std::vector<float> samples(32000, 0.0f);
    mrt_audio_buffer_t audio{samples.data(), samples.size(), 16000};
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline, &audio), MRT_SUCCESS);
    ASSERT_EQ(mrt_voice_pipeline_wait(pipeline, -1), MRT_SUCCESS);

    char* response = nullptr;
    ASSERT_EQ(mrt_voice_pipeline_get_response(pipeline, &response), MRT_SUCCESS);
    EXPECT_STREQ(response, "Okay, lights on.");
    mrt_free(response);
    mrt_voice_pipeline_destroy(pipeline);

    // The chat helper picks the loaded generation model
    llama_.text_steps = {"Sure."};
    char* text = nullptr;
    ASSERT_EQ(mrt_chat("Thanks!", &text), MRT_SUCCESS);
    EXPECT_STREQ(text, "Sure.");
    mrt_free(text);
}

TEST_F(FacadeTest, ArtifactsSurviveRestart) {
    boot();
    mrt_shutdown();

    catalog_ = catalog_json();
    mrt_config_t config = make_config();
    config.catalog_json = catalog_.c_str();
    init(config);
    ASSERT_EQ(llama_.register_self(), MRT_SUCCESS);

    int gets_before = transport_.gets.load();
    mrt_model_artifact_t artifact{};
    ASSERT_EQ(mrt_download_model("smollm2-360m-q8", &artifact), MRT_SUCCESS);
    EXPECT_EQ(artifact.state, MRT_ARTIFACT_VERIFIED);
    mrt_model_artifact_free(&artifact);
    EXPECT_EQ(transport_.gets.load(), gets_before);

    EXPECT_EQ(mrt_model_load("smollm2-360m-q8"), MRT_SUCCESS);
}

TEST_F(FacadeTest, ListenerSeesDownloadAndTokenProgress) {
    catalog_ = catalog_json();
    mrt_config_t config = make_config();
    config.catalog_json = catalog_.c_str();
    init(config);
    ASSERT_EQ(llama_.register_self(), MRT_SUCCESS);

    TokenCounter counter;
    ASSERT_EQ(mrt_events_set_listener(&count_progress, &counter), MRT_SUCCESS);
    EXPECT_TRUE(mrt_events_has_listener());

    ASSERT_EQ(mrt_download_model("smollm2-360m-q8", nullptr), MRT_SUCCESS);
    ASSERT_EQ(mrt_model_load("smollm2-360m-q8"), MRT_SUCCESS);
    llama_.text_steps = {"one", " two", " three"};
    char* text = nullptr;
    ASSERT_EQ(mrt_generate("smollm2-360m-q8", "count", nullptr, &text), MRT_SUCCESS);
    mrt_free(text);

    EXPECT_GT(counter.bytes.load(), 0);
    EXPECT_EQ(counter.tokens.load(), 3);

    ASSERT_EQ(mrt_events_set_listener(nullptr, nullptr), MRT_SUCCESS);
    EXPECT_FALSE(mrt_events_has_listener());
}

// =============================================================================
// STORE / ADMISSION INTERPLAY
// =============================================================================

TEST_F(FacadeTest, DeletingLoadedModelFails) {
    boot();
    EXPECT_EQ(mrt_store_delete("smollm2-360m-q8"), MRT_ERROR_MODEL_IN_USE);

    ASSERT_EQ(mrt_model_unload("smollm2-360m-q8"), MRT_SUCCESS);
    ASSERT_EQ(mrt_store_delete("smollm2-360m-q8"), MRT_SUCCESS);

    mrt_model_artifact_t artifact{};
    EXPECT_EQ(mrt_store_get("smollm2-360m-q8", &artifact), MRT_ERROR_NOT_FOUND);
    EXPECT_EQ(mrt_model_load("smollm2-360m-q8"), MRT_ERROR_MODEL_NOT_FOUND);
    EXPECT_EQ(mrt_store_delete("smollm2-360m-q8"), MRT_ERROR_NOT_FOUND);

    // The descriptor is still registered, so the model can be fetched again
    ASSERT_EQ(mrt_download_model("smollm2-360m-q8", nullptr), MRT_SUCCESS);
    EXPECT_EQ(mrt_model_load("smollm2-360m-q8"), MRT_SUCCESS);
}

// =============================================================================
// SHUTDOWN WITH WORK IN FLIGHT
// =============================================================================

TEST_F(FacadeTest, ShutdownCancelsRunningSession) {
    boot();
    llama_.close_gate();
    mrt_session_handle_t session = nullptr;
    ASSERT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "smollm2-360m-q8", &session),
              MRT_SUCCESS);
    ASSERT_EQ(mrt_session_start_generation(session, "tell me a story", nullptr), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return llama_.waiting.load() == 1; }));

    mrt_shutdown();
    EXPECT_FALSE(mrt_is_initialized());
    EXPECT_EQ(mrt_session_get_state(session), MRT_SESSION_STATE_CANCELLED);
    EXPECT_EQ(mrt_session_wait(session, 0), MRT_ERROR_CANCELLED);
    EXPECT_EQ(llama_.live_handles.load(), 0);
    mrt_session_destroy(session);

    // No new sessions without a runtime
    EXPECT_EQ(mrt_session_create(MRT_SESSION_GENERATION, "smollm2-360m-q8", &session),
              MRT_ERROR_NOT_INITIALIZED);
}

TEST_F(FacadeTest, ShutdownCancelsVoicePipeline) {
    boot();
    whisper_.text_steps = {" hello"};
    llama_.close_gate();

    mrt_voice_pipeline_config_t config{};
    config.stt_model_id = "whisper-tiny-en";
    config.llm_model_id = "smollm2-360m-q8";
    config.tts_model_id = "piper-lessac-medium";
    mrt_voice_pipeline_handle_t pipeline = nullptr;
    ASSERT_EQ(mrt_voice_pipeline_create(&config, nullptr, nullptr, &pipeline), MRT_SUCCESS);
    std::vector<float> samples(1600, 0.0f);
    mrt_audio_buffer_t audio{samples.data(), samples.size(), 16000};
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline, &audio), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return llama_.waiting.load() == 1; }));

    mrt_shutdown();
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline), MRT_VOICE_PIPELINE_CANCELLED);
    EXPECT_EQ(piper_.requests.load(), 0);
    mrt_voice_pipeline_destroy(pipeline);
}

// =============================================================================
// MEMORY HELPERS
// =============================================================================

TEST(MemoryHelpers, StrdupAndFree) {
    char* copy = mrt_strdup("modelrt");
    ASSERT_NE(copy, nullptr);
    EXPECT_STREQ(copy, "modelrt");
    mrt_free(copy);

    EXPECT_EQ(mrt_strdup(nullptr), nullptr);
    mrt_free(nullptr);

    void* block = mrt_alloc(64);
    ASSERT_NE(block, nullptr);
    std::memset(block, 0xab, 64);
    mrt_free(block);
}
