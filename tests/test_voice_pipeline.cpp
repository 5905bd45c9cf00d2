/**
 * @file test_voice_pipeline.cpp
 * @brief Tests for the STT -> LLM -> TTS voice pipeline
 */

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "fake_backend.h"
#include "mrt/features/voice_pipeline/mrt_voice_pipeline.h"
#include "mrt/infrastructure/memory/mrt_admission.h"
#include "test_support.h"

using mrt_test::FakeBackend;
using mrt_test::kMB;

namespace {

struct RecordedEvent {
    mrt_voice_pipeline_event_type_t type;
    mrt_voice_pipeline_state_t state;
    std::string text;
    size_t audio_samples;
    mrt_result_t error_code;
    std::string error_message;
};

class EventRecorder {
   public:
    static void callback(const mrt_voice_pipeline_event_t* event, void* user_data) {
        auto* self = static_cast<EventRecorder*>(user_data);
        RecordedEvent recorded{event->type,
                               event->state,
                               event->text != nullptr ? std::string(event->text, event->text_length)
                                                      : std::string(),
                               event->audio_samples,
                               event->error_code,
                               event->error_message != nullptr ? event->error_message : ""};
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->events_.push_back(std::move(recorded));
    }

    std::vector<RecordedEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<mrt_voice_pipeline_event_type_t> types() const {
        std::vector<mrt_voice_pipeline_event_type_t> result;
        for (const auto& event : events()) {
            result.push_back(event.type);
        }
        return result;
    }

    std::vector<mrt_voice_pipeline_state_t> states() const {
        std::vector<mrt_voice_pipeline_state_t> result;
        for (const auto& event : events()) {
            if (event.type == MRT_VOICE_EVENT_STATE_CHANGED) {
                result.push_back(event.state);
            }
        }
        return result;
    }

    // Terminal events are emitted after the state becomes visible to wait()
    bool wait_for_terminal_event() const {
        return mrt_test::wait_until([this] {
            for (const auto& event : events()) {
                if (event.type == MRT_VOICE_EVENT_COMPLETED ||
                    event.type == MRT_VOICE_EVENT_FAILED ||
                    event.type == MRT_VOICE_EVENT_CANCELLED) {
                    return true;
                }
            }
            return false;
        });
    }

   private:
    mutable std::mutex mutex_;
    std::vector<RecordedEvent> events_;
};

class VoicePipelineTest : public mrt_test::RuntimeTest {
   protected:
    void SetUp() override {
        init();
        ASSERT_EQ(whisper_.register_self(), MRT_SUCCESS);
        ASSERT_EQ(llama_.register_self(), MRT_SUCCESS);
        ASSERT_EQ(piper_.register_self(), MRT_SUCCESS);
        install_model("whisper-tiny", MRT_MODEL_FORMAT_WHISPER_STT, 100 * kMB);
        install_model("smollm2-360m", MRT_MODEL_FORMAT_GGUF_LLM, 400 * kMB);
        install_model("piper-amy", MRT_MODEL_FORMAT_PIPER_TTS, 60 * kMB);
        ASSERT_EQ(mrt_model_load("whisper-tiny"), MRT_SUCCESS);
        ASSERT_EQ(mrt_model_load("smollm2-360m"), MRT_SUCCESS);
        ASSERT_EQ(mrt_model_load("piper-amy"), MRT_SUCCESS);

        whisper_.text_steps = {" What time is it?"};
        llama_.text_steps = {"It is", " noon."};
        piper_.audio_steps = {std::vector<float>(200, 0.25f), std::vector<float>(100, -0.25f)};

        samples_.assign(16000, 0.01f);
        audio_ = mrt_audio_buffer_t{samples_.data(), samples_.size(), 16000};
    }

    void TearDown() override {
        whisper_.open_gate();
        llama_.open_gate();
        piper_.open_gate();
        if (pipeline_ != nullptr) {
            mrt_voice_pipeline_destroy(pipeline_);
            pipeline_ = nullptr;
        }
        RuntimeTest::TearDown();
    }

    mrt_voice_pipeline_config_t pipeline_config() const {
        mrt_voice_pipeline_config_t config{};
        config.stt_model_id = "whisper-tiny";
        config.llm_model_id = "smollm2-360m";
        config.tts_model_id = "piper-amy";
        config.system_prompt = "You are a helpful voice assistant.";
        config.temperature = 0.7f;
        return config;
    }

    void create(const mrt_voice_pipeline_config_t& config) {
        ASSERT_EQ(mrt_voice_pipeline_create(&config, &EventRecorder::callback, &recorder_,
                                            &pipeline_),
                  MRT_SUCCESS);
    }

    std::string transcription() {
        char* text = nullptr;
        EXPECT_EQ(mrt_voice_pipeline_get_transcription(pipeline_, &text), MRT_SUCCESS);
        std::string result = text != nullptr ? text : "";
        mrt_free(text);
        return result;
    }

    FakeBackend whisper_{"whispercpp", mrt_test::transcription_caps(16000)};
    FakeBackend llama_{"llamacpp", mrt_test::generation_caps(2048)};
    FakeBackend piper_{"piper", mrt_test::synthesis_caps(22050)};

    EventRecorder recorder_;
    mrt_voice_pipeline_handle_t pipeline_ = nullptr;
    std::vector<float> samples_;
    mrt_audio_buffer_t audio_{};
};

}  // namespace

// =============================================================================
// FULL RUN
// =============================================================================

TEST_F(VoicePipelineTest, RunsAllStagesInOrder) {
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);
    ASSERT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_SUCCESS);
    ASSERT_TRUE(recorder_.wait_for_terminal_event());

    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_COMPLETED);
    EXPECT_EQ(recorder_.types(),
              (std::vector<mrt_voice_pipeline_event_type_t>{
                  MRT_VOICE_EVENT_STATE_CHANGED, MRT_VOICE_EVENT_TRANSCRIPTION,
                  MRT_VOICE_EVENT_STATE_CHANGED, MRT_VOICE_EVENT_RESPONSE_DELTA,
                  MRT_VOICE_EVENT_RESPONSE_DELTA, MRT_VOICE_EVENT_RESPONSE,
                  MRT_VOICE_EVENT_STATE_CHANGED, MRT_VOICE_EVENT_AUDIO_CHUNK,
                  MRT_VOICE_EVENT_AUDIO_CHUNK, MRT_VOICE_EVENT_STATE_CHANGED,
                  MRT_VOICE_EVENT_COMPLETED}));
    EXPECT_EQ(recorder_.states(),
              (std::vector<mrt_voice_pipeline_state_t>{
                  MRT_VOICE_PIPELINE_TRANSCRIBING, MRT_VOICE_PIPELINE_GENERATING,
                  MRT_VOICE_PIPELINE_SYNTHESIZING, MRT_VOICE_PIPELINE_COMPLETED}));

    // Each stage consumes the previous stage's output
    EXPECT_EQ(whisper_.last_audio_samples(), 16000u);
    EXPECT_EQ(llama_.last_text(), " What time is it?");
    EXPECT_EQ(llama_.last_system_prompt(), "You are a helpful voice assistant.");
    EXPECT_EQ(piper_.last_text(), "It is noon.");

    EXPECT_EQ(transcription(), " What time is it?");
    char* response = nullptr;
    ASSERT_EQ(mrt_voice_pipeline_get_response(pipeline_, &response), MRT_SUCCESS);
    EXPECT_STREQ(response, "It is noon.");
    mrt_free(response);

    float* samples = nullptr;
    size_t count = 0;
    int32_t rate = 0;
    ASSERT_EQ(mrt_voice_pipeline_get_audio(pipeline_, &samples, &count, &rate), MRT_SUCCESS);
    EXPECT_EQ(count, 300u);
    EXPECT_EQ(rate, 22050);
    mrt_free(samples);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_IDLE);
}

TEST_F(VoicePipelineTest, StagesRunOneAtATime) {
    whisper_.close_gate();
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return whisper_.waiting.load() == 1; }));

    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_TRANSCRIBING);
    EXPECT_EQ(llama_.requests.load(), 0);
    EXPECT_EQ(piper_.requests.load(), 0);

    whisper_.open_gate();
    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_SUCCESS);
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST_F(VoicePipelineTest, CancelDuringTranscriptionStopsLaterStages) {
    whisper_.close_gate();
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return whisper_.waiting.load() == 1; }));

    ASSERT_EQ(mrt_voice_pipeline_cancel(pipeline_), MRT_SUCCESS);
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_CANCELLED);
    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, 0), MRT_ERROR_CANCELLED);
    ASSERT_TRUE(recorder_.wait_for_terminal_event());

    auto types = recorder_.types();
    EXPECT_EQ(types.back(), MRT_VOICE_EVENT_CANCELLED);
    EXPECT_EQ(llama_.requests.load(), 0);
    EXPECT_EQ(piper_.requests.load(), 0);

    // The STT model was released with the stage
    EXPECT_EQ(mrt_model_unload("whisper-tiny"), MRT_SUCCESS);
}

TEST_F(VoicePipelineTest, CancelDuringGeneration) {
    llama_.close_gate();
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);
    ASSERT_TRUE(mrt_test::wait_until([this] { return llama_.waiting.load() == 1; }));
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_GENERATING);

    ASSERT_EQ(mrt_voice_pipeline_cancel(pipeline_), MRT_SUCCESS);
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_CANCELLED);
    EXPECT_EQ(transcription(), " What time is it?");
    EXPECT_EQ(piper_.requests.load(), 0);
    EXPECT_EQ(mrt_model_unload("smollm2-360m"), MRT_SUCCESS);
}

// =============================================================================
// FAILURES
// =============================================================================

TEST_F(VoicePipelineTest, GenerationFailureKeepsTranscription) {
    llama_.fail_at_step = 0;
    llama_.fail_message = "KV cache exhausted";
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);

    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_ERROR_BACKEND);
    ASSERT_TRUE(recorder_.wait_for_terminal_event());
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_FAILED);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_GENERATING);
    EXPECT_EQ(transcription(), " What time is it?");
    EXPECT_EQ(piper_.requests.load(), 0);

    const char* message = nullptr;
    EXPECT_EQ(mrt_voice_pipeline_get_error(pipeline_, &message), MRT_ERROR_BACKEND);
    EXPECT_STREQ(message, "KV cache exhausted");

    RecordedEvent last = recorder_.events().back();
    EXPECT_EQ(last.type, MRT_VOICE_EVENT_FAILED);
    EXPECT_EQ(last.state, MRT_VOICE_PIPELINE_GENERATING);
    EXPECT_EQ(last.error_code, MRT_ERROR_BACKEND);
    EXPECT_EQ(last.error_message, "KV cache exhausted");
}

TEST_F(VoicePipelineTest, EmptyTranscriptionFailsRun) {
    whisper_.text_steps = {"   "};
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);

    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_ERROR_EMPTY_TRANSCRIPTION);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_TRANSCRIBING);
    EXPECT_EQ(llama_.requests.load(), 0);
}

TEST_F(VoicePipelineTest, StageTimeoutFailsRun) {
    whisper_.text_steps = std::vector<std::string>(200, " word");
    whisper_.step_delay_ms = 10;
    mrt_voice_pipeline_config_t config = pipeline_config();
    config.stage_timeout_ms = 50;
    create(config);
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);

    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_ERROR_TIMEOUT);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_TRANSCRIBING);
    EXPECT_EQ(llama_.requests.load(), 0);
}

TEST_F(VoicePipelineTest, SttModelNotLoaded) {
    ASSERT_EQ(mrt_model_unload("whisper-tiny"), MRT_SUCCESS);
    create(pipeline_config());

    EXPECT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_ERROR_MODEL_NOT_LOADED);
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_FAILED);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_TRANSCRIBING);
}

TEST_F(VoicePipelineTest, LlmModelNotLoaded) {
    ASSERT_EQ(mrt_model_unload("smollm2-360m"), MRT_SUCCESS);
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);

    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_ERROR_MODEL_NOT_LOADED);
    EXPECT_EQ(mrt_voice_pipeline_get_failed_stage(pipeline_), MRT_VOICE_PIPELINE_GENERATING);
    EXPECT_EQ(transcription(), " What time is it?");
}

TEST_F(VoicePipelineTest, BadAudioFailsTranscription) {
    create(pipeline_config());
    mrt_audio_buffer_t wrong{samples_.data(), samples_.size(), 44100};
    EXPECT_EQ(mrt_voice_pipeline_start(pipeline_, &wrong), MRT_ERROR_AUDIO_FORMAT);
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_FAILED);
    EXPECT_EQ(whisper_.requests.load(), 0);
}

// =============================================================================
// API CONTRACT
// =============================================================================

TEST_F(VoicePipelineTest, StartsOnlyOnce) {
    create(pipeline_config());
    ASSERT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_SUCCESS);
    EXPECT_EQ(mrt_voice_pipeline_start(pipeline_, &audio_), MRT_ERROR_INVALID_STATE);
    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, -1), MRT_SUCCESS);
}

TEST_F(VoicePipelineTest, RequiresAllModelIds) {
    mrt_voice_pipeline_config_t config = pipeline_config();
    config.tts_model_id = nullptr;
    mrt_voice_pipeline_handle_t handle = nullptr;
    EXPECT_EQ(mrt_voice_pipeline_create(&config, nullptr, nullptr, &handle),
              MRT_ERROR_INVALID_ARGUMENT);
}

TEST_F(VoicePipelineTest, WaitBeforeStartIsInvalid) {
    create(pipeline_config());
    EXPECT_EQ(mrt_voice_pipeline_wait(pipeline_, 0), MRT_ERROR_INVALID_STATE);
    EXPECT_EQ(mrt_voice_pipeline_get_state(pipeline_), MRT_VOICE_PIPELINE_IDLE);
}

TEST(VoicePipelineState, Names) {
    EXPECT_STREQ(mrt_voice_pipeline_state_name(MRT_VOICE_PIPELINE_TRANSCRIBING), "transcribing");
    EXPECT_STREQ(mrt_voice_pipeline_state_name(MRT_VOICE_PIPELINE_SYNTHESIZING), "synthesizing");
}
