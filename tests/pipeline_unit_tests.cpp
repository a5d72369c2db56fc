#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "capabilities/question_generator.hpp"
#include "capabilities/report_summarizer.hpp"
#include "capabilities/synthesizer.hpp"
#include "capabilities/transcriber.hpp"
#include "capabilities/vision_analyzer.hpp"
#include "core/config.hpp"
#include "model/errors.hpp"
#include "pipeline/frame_gate.hpp"
#include "pipeline/playback_coordinator.hpp"
#include "pipeline/question_engine.hpp"
#include "pipeline/session_events.hpp"
#include "pipeline/transcript_stream.hpp"

using interview_agent::core::TranscriptionConfig;
using interview_agent::core::VisionConfig;
using interview_agent::model::byte_buffer;
using interview_agent::model::evaluation;
using interview_agent::model::history_entry;
using interview_agent::model::transcript_segment;
using interview_agent::model::vision_context;
using interview_agent::pipeline::component_event;
using interview_agent::pipeline::FrameGate;
using interview_agent::pipeline::FrameGatePolicy;
using interview_agent::pipeline::PlaybackCoordinator;
using interview_agent::pipeline::QuestionEngine;
using interview_agent::pipeline::TranscriptStream;

namespace capabilities = interview_agent::capabilities;
namespace model = interview_agent::model;
namespace pipeline = interview_agent::pipeline;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

class RecordingEvents final : public pipeline::EventSink {
 public:
  bool post(component_event event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
    return true;
  }

  template <typename Event>
  std::vector<Event> all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> matches;
    for (const auto& event : events_) {
      if (const auto* match = std::get_if<Event>(&event)) {
        matches.push_back(*match);
      }
    }
    return matches;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<component_event> events_;
};

model::shared_bytes bytes_of(std::size_t size, std::uint8_t value) {
  return std::make_shared<const byte_buffer>(size, value);
}

// Frame gate fakes.

class ConstantComparator final : public pipeline::FrameComparator {
 public:
  explicit ConstantComparator(double value) : value_(value) {}
  std::optional<double> similarity(const model::shared_bytes&, const model::shared_bytes&) override { return value_; }

 private:
  double value_;
};

// Frames filled with 0xEE do not decode; every decodable frame counts as changed.
class CorruptAwareComparator final : public pipeline::FrameComparator {
 public:
  std::optional<double> similarity(const model::shared_bytes& reference,
                                   const model::shared_bytes& candidate) override {
    std::lock_guard<std::mutex> lock(mutex_);
    references_.push_back(reference);
    if (candidate->front() == 0xEE) {
      return std::nullopt;
    }
    return 0.0;
  }

  std::vector<model::shared_bytes> references() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return references_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<model::shared_bytes> references_;
};

class GatedAnalyzer final : public capabilities::VisionAnalyzer {
 public:
  std::string analyze(const model::vision_frame& frame) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_.push_back(frame.timestamp_ns);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    released_cv_.wait(lock, [this] { return released_; });
    return "frame " + std::to_string(frame.timestamp_ns);
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    released_cv_.notify_all();
  }

  std::vector<std::uint64_t> seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable released_cv_;
  bool released_{false};
  std::vector<std::uint64_t> seen_;
};

int test_frame_gate_policy_debounce() {
  constexpr const char* name = "frame_gate_policy_debounce";
  FrameGatePolicy policy(0.10, std::chrono::milliseconds(3000));

  if (policy.changed(0.95) || !policy.changed(0.85)) {
    return fail(name, "expected change threshold of 10%");
  }

  int triggers = 0;
  for (std::uint64_t second = 0; second <= 5; ++second) {
    const std::uint64_t timestamp_ns = second * 1'000'000'000ULL;
    if (policy.should_analyze(0.0, timestamp_ns)) {
      policy.record_trigger(timestamp_ns);
      triggers += 1;
    }
  }
  if (triggers != 2) {
    return fail(name, "expected triggers at 0s and 3s only");
  }
  if (policy.should_analyze(0.99, 10'000'000'000ULL)) {
    return fail(name, "unchanged frame must not trigger");
  }
  return 0;
}

int test_frame_gate_keeps_latest_frame() {
  constexpr const char* name = "frame_gate_keeps_latest_frame";
  GatedAnalyzer analyzer;
  RecordingEvents events;
  VisionConfig config{};
  config.min_interval = std::chrono::milliseconds(0);
  FrameGate gate(analyzer, std::make_unique<ConstantComparator>(0.0), events, config);

  gate.submit(model::vision_frame{.image = bytes_of(4, 1), .timestamp_ns = 1});
  if (!wait_until([&] { return analyzer.seen().size() == 1; })) {
    return fail(name, "expected first frame to be analyzed");
  }
  gate.submit(model::vision_frame{.image = bytes_of(4, 2), .timestamp_ns = 2});
  gate.submit(model::vision_frame{.image = bytes_of(4, 3), .timestamp_ns = 3});
  gate.submit(model::vision_frame{.image = bytes_of(4, 4), .timestamp_ns = 4});
  analyzer.release();

  if (!wait_until([&] { return events.all<pipeline::vision_analyzed>().size() == 2; })) {
    return fail(name, "expected two analyses");
  }
  const std::vector<std::uint64_t> expected{1, 4};
  if (analyzer.seen() != expected) {
    return fail(name, "expected only the newest pending frame to be analyzed");
  }
  if (gate.frames_superseded() != 2 || gate.analyses_triggered() != 2) {
    return fail(name, "unexpected gate counters");
  }
  const auto analyzed = events.all<pipeline::vision_analyzed>();
  if (analyzed[1].context.description != "frame 4" || analyzed[1].context.timestamp_ns != 4) {
    return fail(name, "expected description of the newest frame");
  }
  if (events.all<pipeline::vision_analysis_started>().size() != 2) {
    return fail(name, "expected a start notice per analysis");
  }
  gate.stop();
  return 0;
}

int test_frame_gate_skips_similar_and_paused_frames() {
  constexpr const char* name = "frame_gate_skips_similar_and_paused_frames";
  GatedAnalyzer analyzer;
  analyzer.release();
  RecordingEvents events;
  VisionConfig config{};
  config.min_interval = std::chrono::milliseconds(0);
  FrameGate gate(analyzer, std::make_unique<ConstantComparator>(0.98), events, config);

  gate.submit(model::vision_frame{.image = bytes_of(4, 1), .timestamp_ns = 1});
  if (!wait_until([&] { return events.all<pipeline::vision_analyzed>().size() == 1; })) {
    return fail(name, "first frame must always be analyzed");
  }
  gate.submit(model::vision_frame{.image = bytes_of(4, 2), .timestamp_ns = 2});
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  if (gate.analyses_triggered() != 1) {
    return fail(name, "similar frame must not be analyzed");
  }

  gate.pause();
  if (gate.submit(model::vision_frame{.image = bytes_of(4, 3), .timestamp_ns = 3}) || !gate.paused()) {
    return fail(name, "paused gate must reject frames");
  }
  gate.resume();
  if (!gate.submit(model::vision_frame{.image = bytes_of(4, 4), .timestamp_ns = 4})) {
    return fail(name, "resumed gate must accept frames");
  }
  gate.stop();
  return 0;
}

int test_frame_gate_ignores_undecodable_frames() {
  constexpr const char* name = "frame_gate_ignores_undecodable_frames";
  GatedAnalyzer analyzer;
  analyzer.release();
  RecordingEvents events;
  VisionConfig config{};
  config.min_interval = std::chrono::milliseconds(0);
  auto comparator = std::make_unique<CorruptAwareComparator>();
  const CorruptAwareComparator* recorder = comparator.get();
  FrameGate gate(analyzer, std::move(comparator), events, config);

  gate.submit(model::vision_frame{.image = bytes_of(4, 0xEE), .timestamp_ns = 1});
  if (!wait_until([&] { return gate.frames_undecodable() == 1; })) {
    return fail(name, "expected the corrupt first frame to be skipped");
  }
  const auto good = bytes_of(4, 2);
  gate.submit(model::vision_frame{.image = good, .timestamp_ns = 2});
  if (!wait_until([&] { return gate.analyses_triggered() == 1; })) {
    return fail(name, "expected the first decodable frame to be analyzed");
  }
  gate.submit(model::vision_frame{.image = bytes_of(4, 0xEE), .timestamp_ns = 3});
  if (!wait_until([&] { return gate.frames_undecodable() == 2; })) {
    return fail(name, "expected the corrupt frame to be skipped");
  }
  gate.submit(model::vision_frame{.image = bytes_of(4, 4), .timestamp_ns = 4});
  if (!wait_until([&] { return events.all<pipeline::vision_analyzed>().size() == 2; })) {
    return fail(name, "expected two analyses");
  }
  gate.stop();

  const std::vector<std::uint64_t> expected{2, 4};
  if (analyzer.seen() != expected) {
    return fail(name, "corrupt frames must never be analyzed");
  }
  const auto references = recorder->references();
  if (references.size() != 4 || references[0] != nullptr || references[1] != nullptr) {
    return fail(name, "a corrupt frame must not become the reference");
  }
  if (references[2] != good || references[3] != good) {
    return fail(name, "expected the last analyzed frame to stay the reference");
  }
  return 0;
}

// Question engine fakes.

class EchoGenerator final : public capabilities::QuestionGenerator {
 public:
  evaluation generate(const std::vector<transcript_segment>& transcript,
                      const std::optional<vision_context>& vision) override {
    if (transcript.back().text == "explode") {
      throw model::GenerationError("bad reply from model");
    }
    return evaluation{
        .score = 6.0,
        .next_question = "About " + transcript.back().text + "?",
        .conflict_detected = false,
        .feedback = vision.has_value() ? vision->description : std::string{},
        .topic = "general",
    };
  }
};

class CountingSummarizer final : public capabilities::ReportSummarizer {
 public:
  nlohmann::json summarize(const std::vector<history_entry>&, const std::vector<vision_context>&) override {
    calls += 1;
    return nlohmann::json::object();
  }

  std::atomic<int> calls{0};
};

history_entry scored(std::uint64_t sequence, double score) {
  history_entry entry{};
  entry.sequence = sequence;
  entry.result.score = score;
  return entry;
}

int test_question_engine_runs_jobs_in_order() {
  constexpr const char* name = "question_engine_runs_jobs_in_order";
  EchoGenerator generator;
  CountingSummarizer summarizer;
  RecordingEvents events;
  QuestionEngine engine(generator, summarizer, events);

  std::vector<transcript_segment> transcript;
  for (std::uint64_t sequence = 1; sequence <= 3; ++sequence) {
    const std::string text = sequence == 2 ? "explode" : "answer " + std::to_string(sequence);
    transcript.push_back(transcript_segment{.kind = model::segment_kind::FINAL, .text = text});
    engine.submit(pipeline::evaluation_job{
        .sequence = sequence,
        .transcript = transcript,
        .vision = vision_context{.description = "terminal open", .timestamp_ns = 1},
    });
  }
  engine.submit(pipeline::report_job{});

  if (!wait_until([&] { return events.size() == 4; })) {
    return fail(name, "expected three evaluations and one report");
  }

  const auto ready = events.all<pipeline::evaluation_ready>();
  if (ready.size() != 3 || ready[0].sequence != 1 || ready[1].sequence != 2 || ready[2].sequence != 3) {
    return fail(name, "evaluations out of order");
  }
  if (ready[0].answer != "answer 1" || ready[0].result.next_question != "About answer 1?" ||
      ready[0].result.feedback != "terminal open") {
    return fail(name, "expected generator result for first answer");
  }
  if (ready[1].error.empty() || ready[1].result.next_question != pipeline::kFallbackQuestion ||
      ready[1].result.topic != "Unknown") {
    return fail(name, "expected fallback evaluation for failed generation");
  }

  const auto reports = events.all<pipeline::report_ready>();
  if (reports.size() != 1 || reports[0].summary.value("overall_score", -1) != 0 ||
      reports[0].summary.value("summary", "") != "No content to evaluate.") {
    return fail(name, "expected empty-history report");
  }
  if (summarizer.calls.load() != 0) {
    return fail(name, "summarizer must not run for an empty history");
  }
  engine.stop();
  return 0;
}

int test_summary_helpers() {
  constexpr const char* name = "summary_helpers";
  const std::vector<history_entry> history{scored(1, 4.0), scored(2, 5.0)};

  const auto filled = pipeline::complete_summary(nlohmann::json::object(), history);
  if (filled.value("overall_score", 0) != 45 || filled.value("recommendation", "") != "NEEDS_IMPROVEMENT" ||
      filled.value("summary", "") != "The candidate answered 2 questions with an average score of 4.5/10.") {
    return fail(name, "expected summary derived from history");
  }

  const auto clamped = pipeline::complete_summary(nlohmann::json{{"overall_score", 123.6}}, {scored(1, 9.0)});
  if (clamped.value("overall_score", 0) != 100 || clamped.value("recommendation", "") != "PASS") {
    return fail(name, "expected overall score clamped to 100");
  }

  const auto kept = pipeline::complete_summary(nlohmann::json{{"recommendation", "HIRE"}}, {scored(1, 1.0)});
  if (kept.value("recommendation", "") != "HIRE" || kept.value("overall_score", -1) != 10) {
    return fail(name, "expected model recommendation to be kept");
  }

  if (pipeline::failed_summary("timeout").value("recommendation", "") != "NEEDS_REVIEW") {
    return fail(name, "expected failed summary recommendation");
  }

  const auto fallback = pipeline::fallback_evaluation(std::string(80, 'x'));
  if (fallback.feedback != "Evaluation error: " + std::string(50, 'x') || fallback.score != 5.0) {
    return fail(name, "expected fallback feedback truncated to 50 characters");
  }
  return 0;
}

// Playback fakes.

class ChunkedStream final : public capabilities::SynthesisStream {
 public:
  ChunkedStream(byte_buffer audio, bool hold_open) : audio_(std::move(audio)), hold_open_(hold_open) {}

  std::optional<byte_buffer> next_chunk() override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
      return std::nullopt;
    }
    if (!sent_) {
      sent_ = true;
      return audio_;
    }
    if (hold_open_) {
      cancelled_cv_.wait(lock, [this] { return cancelled_; });
    }
    return std::nullopt;
  }

  void cancel() noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    cancelled_cv_.notify_all();
  }

 private:
  byte_buffer audio_;
  bool hold_open_;
  bool sent_{false};
  std::mutex mutex_;
  std::condition_variable cancelled_cv_;
  bool cancelled_{false};
};

class ChunkedSynthesizer final : public capabilities::Synthesizer {
 public:
  explicit ChunkedSynthesizer(bool hold_open) : hold_open_(hold_open) {}

  std::unique_ptr<capabilities::SynthesisStream> synthesize(const std::string& text) override {
    if (text.empty()) {
      throw model::PlaybackError("nothing to say");
    }
    byte_buffer audio(10);
    for (std::size_t i = 0; i < audio.size(); ++i) {
      audio[i] = static_cast<std::uint8_t>(i);
    }
    return std::make_unique<ChunkedStream>(std::move(audio), hold_open_);
  }

 private:
  bool hold_open_;
};

int test_playback_reslices_audio() {
  constexpr const char* name = "playback_reslices_audio";
  ChunkedSynthesizer synthesizer(false);
  RecordingEvents events;
  PlaybackCoordinator playback(synthesizer, events, 4);

  if (!playback.speak(1, "Tell me about caching")) {
    return fail(name, "expected idle coordinator to accept utterance");
  }
  if (!wait_until([&] { return events.all<pipeline::synthesis_finished>().size() == 1; })) {
    return fail(name, "expected utterance to finish");
  }

  const auto chunks = events.all<pipeline::synthesis_chunk>();
  if (chunks.size() != 3 || chunks[0].audio->size() != 4 || chunks[1].audio->size() != 4 ||
      chunks[2].audio->size() != 2) {
    return fail(name, "expected 10 bytes sliced as 4+4+2");
  }
  if ((*chunks[2].audio)[1] != 9 || chunks[0].utterance_id != 1) {
    return fail(name, "expected slices to preserve byte order");
  }
  if (playback.busy()) {
    return fail(name, "coordinator must be idle after the utterance finished");
  }

  playback.speak(2, "");
  if (!wait_until([&] { return events.all<pipeline::synthesis_failed>().size() == 1; })) {
    return fail(name, "expected synthesis failure to be reported");
  }
  playback.stop();
  return 0;
}

int test_playback_cancel_stops_chunks() {
  constexpr const char* name = "playback_cancel_stops_chunks";
  ChunkedSynthesizer synthesizer(true);
  RecordingEvents events;
  PlaybackCoordinator playback(synthesizer, events, 64);

  playback.speak(1, "What is a mutex?");
  if (!wait_until([&] { return events.all<pipeline::synthesis_chunk>().size() == 1; })) {
    return fail(name, "expected first chunk");
  }
  if (playback.speak(2, "Second question") || !playback.busy()) {
    return fail(name, "live utterance must block a new one");
  }

  playback.cancel();
  if (playback.busy()) {
    return fail(name, "cancelled coordinator must not report busy");
  }
  if (!playback.speak(3, "Next question")) {
    return fail(name, "expected new utterance after cancel");
  }
  if (!wait_until([&] { return events.all<pipeline::synthesis_chunk>().size() == 2; })) {
    return fail(name, "expected chunk of the new utterance");
  }
  playback.stop();

  for (const auto& finished : events.all<pipeline::synthesis_finished>()) {
    if (finished.utterance_id == 1) {
      return fail(name, "cancelled utterance must not report completion");
    }
  }
  if (events.all<pipeline::synthesis_chunk>().back().utterance_id != 3) {
    return fail(name, "expected last chunk from the new utterance");
  }
  return 0;
}

// Transcript stream fakes.

class ScriptedTranscriberStream final : public capabilities::TranscriberStream {
 public:
  explicit ScriptedTranscriberStream(std::deque<transcript_segment> segments) : segments_(std::move(segments)) {}

  void send(const model::audio_chunk& chunk) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.insert(sent_.end(), chunk.samples->begin(), chunk.samples->end());
  }

  std::optional<transcript_segment> read() override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!segments_.empty()) {
      auto segment = std::move(segments_.front());
      segments_.pop_front();
      return segment;
    }
    closed_cv_.wait(lock, [this] { return closed_; });
    return std::nullopt;
  }

  void close() noexcept override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    closed_cv_.notify_all();
  }

  byte_buffer sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable closed_cv_;
  std::deque<transcript_segment> segments_;
  byte_buffer sent_;
  bool closed_{false};
};

class FlakyTranscriber final : public capabilities::Transcriber {
 public:
  explicit FlakyTranscriber(int failing_opens) : failing_opens_(failing_opens) {}

  std::unique_ptr<capabilities::TranscriberStream> open(const model::audio_format&) override {
    opens += 1;
    if (opens.load() <= failing_opens_) {
      throw model::TranscriptionError("connection refused");
    }
    auto stream = std::make_unique<ScriptedTranscriberStream>(std::deque<transcript_segment>{
        transcript_segment{.kind = model::segment_kind::INTERIM, .text = "  "},
        transcript_segment{.kind = model::segment_kind::FINAL, .text = "hello there"},
    });
    last_stream = stream.get();
    return stream;
  }

  std::atomic<int> opens{0};
  std::atomic<ScriptedTranscriberStream*> last_stream{nullptr};

 private:
  int failing_opens_;
};

model::audio_chunk audio(std::uint8_t value) {
  return model::audio_chunk{.samples = bytes_of(4, value), .format = {}, .arrival_ns = value};
}

int test_transcript_stream_buffers_and_replays() {
  constexpr const char* name = "transcript_stream_buffers_and_replays";
  FlakyTranscriber transcriber(2);
  RecordingEvents events;
  TranscriptionConfig config{};
  config.max_reconnect_attempts = 2;
  config.backoff_initial = std::chrono::milliseconds(1);
  config.retry_cooldown = std::chrono::milliseconds(300);
  config.max_buffered_bytes = 10;
  TranscriptStream stream(transcriber, events, config);

  if (stream.submit(model::audio_chunk{})) {
    return fail(name, "empty audio must be rejected");
  }

  stream.submit(audio(1));
  if (!wait_until([&] { return stream.degraded(); })) {
    return fail(name, "expected degraded mode after failed connects");
  }
  stream.submit(audio(2));
  if (!wait_until([&] { return stream.buffered_bytes() == 8; })) {
    return fail(name, "expected audio to be held during cooldown");
  }
  if (transcriber.opens.load() != 2) {
    return fail(name, "no connect attempt expected during cooldown");
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(350));
  stream.submit(audio(3));
  if (!wait_until([&] { return events.all<pipeline::transcription_recovered>().size() == 1; })) {
    return fail(name, "expected recovery after cooldown");
  }

  const auto failures = events.all<pipeline::transcription_failed>();
  if (failures.size() != 1) {
    return fail(name, "expected a single degradation notice");
  }
  if (events.all<pipeline::transcription_recovered>()[0].replayed_bytes != 8 || stream.dropped_bytes() != 4) {
    return fail(name, "expected oldest chunk dropped and the rest replayed");
  }

  const byte_buffer expected{2, 2, 2, 2, 3, 3, 3, 3};
  if (transcriber.last_stream.load()->sent() != expected || stream.buffered_bytes() != 0 || stream.degraded()) {
    return fail(name, "expected buffered audio replayed in order");
  }

  if (!wait_until([&] { return events.all<pipeline::transcript_received>().size() == 1; })) {
    return fail(name, "expected final segment to be posted");
  }
  const auto received = events.all<pipeline::transcript_received>();
  if (received[0].segment.text != "hello there" || received[0].segment.kind != model::segment_kind::FINAL) {
    return fail(name, "blank segments must be skipped");
  }
  stream.stop();
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_frame_gate_policy_debounce(); rc != 0) {
    return rc;
  }
  if (int rc = test_frame_gate_keeps_latest_frame(); rc != 0) {
    return rc;
  }
  if (int rc = test_frame_gate_skips_similar_and_paused_frames(); rc != 0) {
    return rc;
  }
  if (int rc = test_frame_gate_ignores_undecodable_frames(); rc != 0) {
    return rc;
  }
  if (int rc = test_question_engine_runs_jobs_in_order(); rc != 0) {
    return rc;
  }
  if (int rc = test_summary_helpers(); rc != 0) {
    return rc;
  }
  if (int rc = test_playback_reslices_audio(); rc != 0) {
    return rc;
  }
  if (int rc = test_playback_cancel_stops_chunks(); rc != 0) {
    return rc;
  }
  if (int rc = test_transcript_stream_buffers_and_replays(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] pipeline unit tests\n";
  return 0;
}
