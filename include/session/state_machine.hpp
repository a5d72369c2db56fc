#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include "capabilities/question_generator.hpp"
#include "capabilities/report_summarizer.hpp"
#include "capabilities/synthesizer.hpp"
#include "capabilities/transcriber.hpp"
#include "capabilities/vision_analyzer.hpp"
#include "core/config.hpp"
#include "core/mailbox.hpp"
#include "model/messages.hpp"
#include "pipeline/frame_gate.hpp"
#include "pipeline/frame_similarity.hpp"
#include "pipeline/playback_coordinator.hpp"
#include "pipeline/question_engine.hpp"
#include "pipeline/session_events.hpp"
#include "pipeline/transcript_stream.hpp"
#include "session/outbound_sink.hpp"
#include "session/session.hpp"
#include "sinks/history_sink.hpp"

namespace interview_agent::session {

// Collaborators shared by every session; each must tolerate calls from
// several session threads at once.
struct SessionServices {
  capabilities::Transcriber& transcriber;
  capabilities::VisionAnalyzer& vision;
  capabilities::QuestionGenerator& generator;
  capabilities::ReportSummarizer& summarizer;
  capabilities::Synthesizer& synthesizer;
  sinks::HistorySink& history;
};

// Single-writer actor for one session. Client messages and component results
// are queued on one mailbox and applied one at a time on the actor thread,
// which is also the only thread that emits client-bound events.
class SessionStateMachine final : public pipeline::EventSink {
 public:
  using FatalHandler = std::function<void(const std::string& session_id)>;

  SessionStateMachine(std::string session_id, const core::InterviewConfig& config, SessionServices services,
                      std::unique_ptr<pipeline::FrameComparator> comparator, std::shared_ptr<OutboundSink> outbound);
  ~SessionStateMachine() override;

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  // Starts the actor thread, which performs the handshake transitions.
  void start();
  bool deliver(model::inbound_message message);
  bool post(pipeline::component_event event) override;
  // Drains queued work, then stops every component. Idempotent.
  void shutdown();

  // Called on the actor thread when the outbound channel fails.
  void set_fatal_handler(FatalHandler handler);

  [[nodiscard]] const std::string& id() const { return session_id_; }
  [[nodiscard]] model::session_state state() const { return state_snapshot_.load(); }
  // True while messages are queued or an evaluation, utterance or report is outstanding.
  [[nodiscard]] bool busy() const { return unprocessed_.load() > 0 || busy_snapshot_.load(); }

 private:
  using actor_message = std::variant<model::inbound_message, pipeline::component_event>;

  void run();
  void fire_expired_timer();
  void handle(actor_message& message);

  // Client messages.
  void apply(model::audio_message& message);
  void apply(model::video_message& message);
  void apply(const model::stop_message& message);
  void apply(const model::generate_report_message& message);
  void apply(const model::screen_share_lost_message& message);
  void apply(const model::screen_share_restored_message& message);

  // Component results.
  void apply(pipeline::transcript_received& event);
  void apply(const pipeline::transcription_failed& event);
  void apply(const pipeline::transcription_recovered& event);
  void apply(const pipeline::vision_analysis_started& event);
  void apply(pipeline::vision_analyzed& event);
  void apply(const pipeline::vision_analysis_failed& event);
  void apply(pipeline::evaluation_ready& event);
  void apply(pipeline::report_ready& event);
  void apply(pipeline::synthesis_chunk& event);
  void apply(const pipeline::synthesis_finished& event);
  void apply(const pipeline::synthesis_failed& event);

  void start_handshake();
  void barge_in();
  void restore_screen();
  void speak(const std::string& text);
  void speak_notice(const std::string& text);
  bool finalize_answer(model::transcript_segment segment);
  void do_stop(bool auto_ended, bool keep_playback = false);
  void submit_report();
  void settle_state();
  void set_state(model::session_state next);
  void emit(model::outbound_event event);
  void save_record();
  void refresh_busy();
  bool enqueue(actor_message message);

  std::string session_id_;
  core::InterviewConfig config_;
  SessionServices services_;
  std::shared_ptr<OutboundSink> outbound_;

  Session session_{};
  std::atomic<model::session_state> state_snapshot_{model::session_state::IDLE};
  std::atomic<bool> busy_snapshot_{false};
  std::atomic<std::size_t> unprocessed_{0};
  bool connection_lost_{false};

  std::mutex fatal_mutex_;
  FatalHandler fatal_handler_{};

  core::Mailbox<actor_message> mailbox_;

  pipeline::TranscriptStream transcript_stream_;
  pipeline::FrameGate frame_gate_;
  pipeline::QuestionEngine question_engine_;
  pipeline::PlaybackCoordinator playback_;

  std::once_flag shutdown_once_;
  std::thread actor_;
};

}  // namespace interview_agent::session
