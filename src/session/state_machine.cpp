#include "session/state_machine.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"
#include "model/errors.hpp"

namespace interview_agent::session {

using model::session_state;

SessionStateMachine::SessionStateMachine(std::string session_id, const core::InterviewConfig& config,
                                         SessionServices services,
                                         std::unique_ptr<pipeline::FrameComparator> comparator,
                                         std::shared_ptr<OutboundSink> outbound)
    : session_id_(std::move(session_id)),
      config_(config),
      services_(services),
      outbound_(std::move(outbound)),
      transcript_stream_(services_.transcriber, *this, config_.transcription),
      frame_gate_(services_.vision, std::move(comparator), *this, config_.vision),
      question_engine_(services_.generator, services_.summarizer, *this),
      playback_(services_.synthesizer, *this, config_.playback.chunk_bytes) {
  session_.id = session_id_;
}

SessionStateMachine::~SessionStateMachine() { shutdown(); }

void SessionStateMachine::start() {
  if (actor_.joinable()) {
    return;
  }
  actor_ = std::thread([this] { run(); });
}

bool SessionStateMachine::deliver(model::inbound_message message) { return enqueue(std::move(message)); }

bool SessionStateMachine::post(pipeline::component_event event) { return enqueue(std::move(event)); }

bool SessionStateMachine::enqueue(actor_message message) {
  unprocessed_ += 1;
  if (!mailbox_.push(std::move(message))) {
    unprocessed_ -= 1;
    return false;
  }
  return true;
}

void SessionStateMachine::shutdown() {
  std::call_once(shutdown_once_, [this] {
    mailbox_.close();
    if (actor_.joinable()) {
      actor_.join();
    }
    playback_.stop();
    question_engine_.stop();
    frame_gate_.stop();
    transcript_stream_.stop();
    std::cerr << "[session " << session_id_ << "] closed in state " << model::to_string(state_snapshot_.load())
              << '\n';
  });
}

void SessionStateMachine::set_fatal_handler(FatalHandler handler) {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  fatal_handler_ = std::move(handler);
}

void SessionStateMachine::run() {
  start_handshake();
  refresh_busy();

  while (true) {
    fire_expired_timer();

    actor_message message;
    core::pop_status status = core::pop_status::ITEM;
    if (session_.grace_timer.has_value()) {
      status = mailbox_.pop_until(session_.grace_timer->deadline, message);
    } else if (auto next = mailbox_.pop()) {
      message = std::move(*next);
    } else {
      status = core::pop_status::CLOSED;
    }

    if (status == core::pop_status::CLOSED) {
      break;
    }
    if (status == core::pop_status::TIMEOUT) {
      continue;
    }

    try {
      handle(message);
    } catch (const std::exception& ex) {
      std::cerr << "[session " << session_id_ << "] transition failed: " << ex.what() << '\n';
    }
    refresh_busy();
    unprocessed_ -= 1;
  }
  busy_snapshot_.store(false);
  unprocessed_.store(0);
}

void SessionStateMachine::fire_expired_timer() {
  if (!session_.grace_timer.has_value() || std::chrono::steady_clock::now() < session_.grace_timer->deadline) {
    return;
  }

  const std::uint64_t timer_id = session_.grace_timer->id;
  session_.grace_timer.reset();
  if (model::is_terminal(session_.state)) {
    return;
  }
  std::cerr << "[session " << session_id_ << "] screen share grace period " << timer_id << " expired\n";

  // The closing line plays out after the stop.
  speak_notice(config_.session.screen_timeout_prompt);
  do_stop(true, true);
}

void SessionStateMachine::handle(actor_message& message) {
  if (auto* inbound = std::get_if<model::inbound_message>(&message)) {
    std::visit([this](auto& item) { apply(item); }, *inbound);
    return;
  }
  std::visit([this](auto& item) { apply(item); }, std::get<pipeline::component_event>(message));
}

void SessionStateMachine::start_handshake() {
  session_.started_at = core::iso8601_now();
  set_state(session_state::CONNECTING);
  set_state(session_state::LISTENING);

  if (!config_.session.opening_question.empty()) {
    speak(config_.session.opening_question);
  }
}

void SessionStateMachine::apply(model::audio_message& message) {
  if (model::is_terminal(session_.state) || message.data == nullptr || message.data->empty()) {
    return;
  }

  if (session_.state == session_state::SPEAKING) {
    const double min_rms = config_.session.barge_in_min_rms;
    const bool voiced =
        min_rms <= 0.0 || message.format.encoding != "linear16" || model::linear16_rms(*message.data) >= min_rms;
    if (voiced) {
      barge_in();
    }
  }

  session_.in_flight.transcription = true;
  transcript_stream_.submit(model::audio_chunk{
      .samples = std::move(message.data),
      .format = message.format,
      .arrival_ns = message.arrival_ns,
  });
}

void SessionStateMachine::apply(model::video_message& message) {
  if (model::is_terminal(session_.state) || message.data == nullptr) {
    return;
  }

  if (session_.screen == model::screen_state::SCREEN_LOST) {
    if (!config_.session.video_restores_screen) {
      return;
    }
    restore_screen();
  }

  frame_gate_.submit(model::vision_frame{.image = std::move(message.data), .timestamp_ns = message.arrival_ns});
}

void SessionStateMachine::apply(const model::stop_message& /*message*/) {
  if (model::is_terminal(session_.state)) {
    return;
  }
  do_stop(false);
}

void SessionStateMachine::apply(const model::generate_report_message& /*message*/) {
  if (session_.state == session_state::COMPLETE || session_.report_requested) {
    std::cerr << "[session " << session_id_ << "] report already requested\n";
    return;
  }

  if (!model::is_terminal(session_.state)) {
    do_stop(false);
  }

  session_.report_requested = true;
  emit(model::status_event{.state = session_state::THINKING});
  if (session_.pending_evaluations == 0) {
    submit_report();
  }
}

void SessionStateMachine::apply(const model::screen_share_lost_message& /*message*/) {
  if (model::is_terminal(session_.state) || session_.screen == model::screen_state::SCREEN_LOST) {
    return;
  }

  session_.screen = model::screen_state::SCREEN_LOST;
  frame_gate_.pause();
  session_.grace_timer = GraceTimer{
      .id = session_.next_timer_id++,
      .deadline = std::chrono::steady_clock::now() + config_.session.screen_grace_period,
  };

  const double grace_s =
      std::chrono::duration_cast<std::chrono::duration<double>>(config_.session.screen_grace_period).count();
  std::cerr << "[session " << session_id_ << "] screen share lost; stopping in " << grace_s << "s\n";
  emit(model::screen_share_lost_event{.grace_period_s = grace_s});
  speak_notice(config_.session.screen_lost_prompt);
}

void SessionStateMachine::apply(const model::screen_share_restored_message& /*message*/) {
  if (model::is_terminal(session_.state) || session_.screen != model::screen_state::SCREEN_LOST) {
    return;
  }
  restore_screen();
}

void SessionStateMachine::restore_screen() {
  session_.screen = model::screen_state::SCREEN_OK;
  session_.grace_timer.reset();
  frame_gate_.resume();
  std::cerr << "[session " << session_id_ << "] screen share restored\n";
  emit(model::screen_share_restored_event{});
  speak_notice(config_.session.screen_restored_prompt);
}

void SessionStateMachine::apply(pipeline::transcript_received& event) {
  if (model::is_terminal(session_.state)) {
    return;
  }

  auto& segment = event.segment;
  if (segment.kind == model::segment_kind::INTERIM) {
    session_.interim = segment;
    emit(model::transcript_interim_event{.text = segment.text});
    return;
  }

  if (finalize_answer(std::move(segment)) && session_.state != session_state::SPEAKING) {
    set_state(session_state::THINKING);
  }
}

bool SessionStateMachine::finalize_answer(model::transcript_segment segment) {
  segment.kind = model::segment_kind::FINAL;
  session_.interim.reset();
  session_.in_flight.transcription = false;
  session_.transcript.push_back(segment);
  emit(model::transcript_final_event{.text = segment.text});

  const std::uint64_t sequence = session_.next_sequence++;
  if (!question_engine_.submit(pipeline::evaluation_job{
          .sequence = sequence,
          .transcript = session_.transcript,
          .vision = session_.vision,
      })) {
    std::cerr << "[session " << session_id_ << "] question engine unavailable; answer " << sequence
              << " not evaluated\n";
    return false;
  }

  session_.pending_evaluations += 1;
  session_.in_flight.generation = true;
  return true;
}

void SessionStateMachine::apply(const pipeline::transcription_failed& event) {
  if (model::is_terminal(session_.state)) {
    return;
  }
  emit(model::error_event{.message = event.message});
}

void SessionStateMachine::apply(const pipeline::transcription_recovered& event) {
  std::cerr << "[session " << session_id_ << "] transcription recovered after replaying " << event.replayed_bytes
            << " bytes\n";
}

void SessionStateMachine::apply(const pipeline::vision_analysis_started& /*event*/) {
  session_.in_flight.vision = true;
}

void SessionStateMachine::apply(pipeline::vision_analyzed& event) {
  session_.in_flight.vision = false;
  if (model::is_terminal(session_.state)) {
    return;
  }

  session_.vision = event.context;
  session_.vision_log.push_back(std::move(event.context));
  emit(model::screen_update_event{
      .context = session_.vision->description.substr(0, model::kScreenUpdatePreviewChars),
  });
}

void SessionStateMachine::apply(const pipeline::vision_analysis_failed& event) {
  session_.in_flight.vision = false;
  std::cerr << "[session " << session_id_ << "] vision analysis failed: " << event.message << '\n';
}

void SessionStateMachine::apply(pipeline::evaluation_ready& event) {
  if (session_.pending_evaluations > 0) {
    session_.pending_evaluations -= 1;
  }
  session_.in_flight.generation = session_.pending_evaluations > 0 || session_.report_running;

  if (!event.error.empty()) {
    emit(model::error_event{.message = "Question generation failed: " + event.error});
  }

  model::history_entry entry{
      .sequence = event.sequence,
      .transcript = event.answer,
      .result = event.result,
      .screen_context = session_.vision.has_value()
                            ? session_.vision->description.substr(0, model::kHistoryContextChars)
                            : std::string{},
      .timestamp = core::iso8601_now(),
  };
  if (!services_.history.record_evaluation(session_id_, entry)) {
    std::cerr << "[session " << session_id_ << "] history sink rejected evaluation " << entry.sequence << '\n';
  }
  session_.history.push_back(std::move(entry));
  emit(model::evaluation_event{.result = event.result});

  if (model::is_terminal(session_.state)) {
    if (session_.report_requested && !session_.report_running && session_.pending_evaluations == 0) {
      submit_report();
    }
    return;
  }

  if (!event.result.next_question.empty()) {
    speak(event.result.next_question);
  }
  settle_state();
}

void SessionStateMachine::apply(pipeline::report_ready& event) {
  session_.report_running = false;
  session_.in_flight.generation = session_.pending_evaluations > 0;
  if (session_.state == session_state::COMPLETE) {
    return;
  }

  if (!event.error.empty()) {
    emit(model::error_event{.message = "Report generation failed: " + event.error});
  }

  session_.summary = event.summary;
  set_state(session_state::COMPLETE);
  save_record();
  emit(model::interview_complete_event{
      .summary = std::move(event.summary),
      .history = session_.history,
      .session_id = session_id_,
  });
}

void SessionStateMachine::apply(pipeline::synthesis_chunk& event) {
  if (event.utterance_id != session_.active_utterance) {
    return;
  }
  if (!model::is_terminal(session_.state)) {
    set_state(session_state::SPEAKING);
  }
  emit(model::audio_chunk_event{.audio = std::move(event.audio)});
}

void SessionStateMachine::apply(const pipeline::synthesis_finished& event) {
  if (event.utterance_id != session_.active_utterance) {
    return;
  }
  session_.active_utterance = 0;
  emit(model::audio_end_event{});
  settle_state();
}

void SessionStateMachine::apply(const pipeline::synthesis_failed& event) {
  if (event.utterance_id != session_.active_utterance) {
    return;
  }
  session_.active_utterance = 0;
  emit(model::error_event{.message = "Speech playback failed: " + event.message});
  settle_state();
}

void SessionStateMachine::barge_in() {
  playback_.cancel();
  session_.active_utterance = 0;
  std::cerr << "[session " << session_id_ << "] barge-in; playback cancelled\n";
  emit(model::stop_audio_event{});
  set_state(session_state::LISTENING);
}

void SessionStateMachine::speak(const std::string& text) {
  if (session_.active_utterance != 0 || playback_.busy()) {
    std::cerr << "[session " << session_id_ << "] playback busy; not speaking \"" << text << "\"\n";
    return;
  }

  const std::uint64_t utterance_id = session_.next_utterance++;
  if (!playback_.speak(utterance_id, text)) {
    std::cerr << "[session " << session_id_ << "] playback rejected utterance " << utterance_id << '\n';
    return;
  }
  session_.active_utterance = utterance_id;
  session_.last_question = text;
  emit(model::ai_message_event{.text = text});
}

// A notice preempts whatever is being said.
void SessionStateMachine::speak_notice(const std::string& text) {
  if (text.empty()) {
    return;
  }
  if (session_.active_utterance != 0) {
    playback_.cancel();
    session_.active_utterance = 0;
    emit(model::stop_audio_event{});
  }
  speak(text);
}

void SessionStateMachine::do_stop(const bool auto_ended, const bool keep_playback) {
  if (model::is_terminal(session_.state)) {
    return;
  }

  session_.grace_timer.reset();
  const bool was_speaking = session_.state == session_state::SPEAKING;
  if (session_.active_utterance != 0 && !keep_playback) {
    playback_.cancel();
    session_.active_utterance = 0;
    if (was_speaking) {
      emit(model::stop_audio_event{});
    }
  }
  frame_gate_.pause();

  if (session_.interim.has_value() && !session_.interim->text.empty()) {
    std::cerr << "[session " << session_id_ << "] finalizing the unfinished answer before stopping\n";
    finalize_answer(*session_.interim);
  }

  session_.auto_ended = auto_ended;
  session_.ended_at = core::iso8601_now();
  session_.interim.reset();
  session_.in_flight.transcription = false;
  set_state(session_state::STOPPED);

  std::cerr << "[session " << session_id_ << "] interview stopped" << (auto_ended ? " (auto-ended)" : "")
            << " after " << session_.history.size() << " evaluation(s)\n";
  // Answers still being evaluated count; their results arrive after the stop.
  const std::size_t answered = session_.history.size() + session_.pending_evaluations;
  emit(model::interview_stopped_event{
      .session_id = session_id_,
      .total_questions = answered,
      .has_content = answered > 0,
      .auto_ended = auto_ended,
  });
  save_record();
}

void SessionStateMachine::submit_report() {
  session_.report_running = true;
  session_.in_flight.generation = true;
  if (!question_engine_.submit(pipeline::report_job{
          .history = session_.history,
          .vision_contexts = session_.vision_log,
      })) {
    session_.report_running = false;
    session_.report_requested = false;
    std::cerr << "[session " << session_id_ << "] question engine unavailable; report not generated\n";
  }
}

void SessionStateMachine::settle_state() {
  if (model::is_terminal(session_.state) || session_.active_utterance != 0) {
    return;
  }
  set_state(session_.pending_evaluations > 0 ? session_state::THINKING : session_state::LISTENING);
}

void SessionStateMachine::set_state(const session_state next) {
  if (session_.state == next) {
    return;
  }
  session_.state = next;
  state_snapshot_.store(next);
  emit(model::status_event{.state = next});
}

void SessionStateMachine::emit(model::outbound_event event) {
  if (connection_lost_) {
    return;
  }

  try {
    outbound_->emit(event);
  } catch (const model::ConnectionError& ex) {
    connection_lost_ = true;
    std::cerr << "[session " << session_id_ << "] connection lost: " << ex.what() << '\n';

    FatalHandler handler;
    {
      std::lock_guard<std::mutex> lock(fatal_mutex_);
      handler = fatal_handler_;
    }
    if (handler) {
      handler(session_id_);
    }
  }
}

void SessionStateMachine::refresh_busy() {
  const bool report_outstanding = session_.report_requested && session_.state != session_state::COMPLETE;
  busy_snapshot_.store(session_.pending_evaluations > 0 || session_.active_utterance != 0 || report_outstanding);
}

void SessionStateMachine::save_record() {
  if (!services_.history.save_interview(make_record(session_))) {
    std::cerr << "[session " << session_id_ << "] history sink rejected interview record\n";
  }
}

}  // namespace interview_agent::session
