/**
 * @file voice_pipeline.h
 * @brief modelrt - Voice Pipeline Coordinator (internal)
 *
 * A run chains three sessions (transcription -> generation -> synthesis).
 * Each stage starts from the completion callback of the previous one, so a
 * run never occupies a worker while waiting for its own stages.
 */

#ifndef MRT_VOICE_PIPELINE_INTERNAL_H
#define MRT_VOICE_PIPELINE_INTERNAL_H

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "features/session/session_manager.h"
#include "mrt/core/mrt_error.h"
#include "mrt/features/voice_pipeline/mrt_voice_pipeline.h"

namespace mrt {

struct VoicePipelineConfig {
    std::string stt_model_id;
    std::string llm_model_id;
    std::string tts_model_id;
    std::string system_prompt;
    int32_t max_tokens = 0;
    float temperature = 0.7f;
    int32_t stage_timeout_ms = 0;
};

class VoicePipeline : public std::enable_shared_from_this<VoicePipeline> {
   public:
    VoicePipeline(std::string id, SessionManager& sessions, VoicePipelineConfig config,
                  mrt_voice_pipeline_event_fn callback, void* user_data);

    VoicePipeline(const VoicePipeline&) = delete;
    VoicePipeline& operator=(const VoicePipeline&) = delete;

    const std::string& id() const { return id_; }

    mrt_result_t start(std::vector<float> audio, int32_t sample_rate_hz);

    // Returns once the active stage is released and the run is terminal
    mrt_result_t cancel();

    mrt_result_t wait(int32_t timeout_ms);

    mrt_voice_pipeline_state_t state() const;
    mrt_voice_pipeline_state_t failed_stage() const;
    std::string transcription() const;
    std::string response() const;
    std::vector<float> audio() const;
    int32_t sample_rate_hz() const;
    mrt_result_t error(std::string* out_message) const;

   private:
    mrt_result_t begin_stage(mrt_voice_pipeline_state_t stage, SessionRequest request);
    bool advance(mrt_voice_pipeline_state_t from, mrt_voice_pipeline_state_t to);
    void on_chunk(mrt_voice_pipeline_state_t stage, const ProgressEvent& event);
    void on_stage_complete(mrt_voice_pipeline_state_t stage,
                           const std::shared_ptr<Session>& session);

    void complete();
    void fail(mrt_voice_pipeline_state_t stage, mrt_result_t code, const std::string& message);
    void mark_cancelled();

    void emit_state(mrt_voice_pipeline_state_t state);
    void emit(const mrt_voice_pipeline_event_t& event);

    const std::string id_;
    SessionManager& sessions_;
    const VoicePipelineConfig config_;
    const mrt_voice_pipeline_event_fn callback_;
    void* const user_data_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    mrt_voice_pipeline_state_t state_ = MRT_VOICE_PIPELINE_IDLE;
    mrt_voice_pipeline_state_t failed_stage_ = MRT_VOICE_PIPELINE_IDLE;
    bool cancel_requested_ = false;
    std::shared_ptr<Session> active_;

    std::string transcription_;
    std::string response_;
    std::vector<float> audio_;
    int32_t sample_rate_hz_ = 0;
    mrt_result_t result_ = MRT_SUCCESS;
    std::string message_;
};

class VoicePipelineManager {
   public:
    explicit VoicePipelineManager(SessionManager& sessions) : sessions_(sessions) {}

    mrt_result_t create(VoicePipelineConfig config, mrt_voice_pipeline_event_fn callback,
                        void* user_data, std::shared_ptr<VoicePipeline>* out);

    // Cancels every live run and refuses new ones
    void cancel_all();

   private:
    SessionManager& sessions_;

    std::mutex mutex_;
    std::map<std::string, std::weak_ptr<VoicePipeline>> pipelines_;
    uint64_t next_id_ = 0;
    bool stopped_ = false;
};

}  // namespace mrt

#endif  // MRT_VOICE_PIPELINE_INTERNAL_H
