#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "capabilities/question_generator.hpp"
#include "capabilities/report_summarizer.hpp"
#include "core/mailbox.hpp"
#include "model/interview.hpp"
#include "pipeline/session_events.hpp"

namespace interview_agent::pipeline {

struct evaluation_job {
  std::uint64_t sequence{0};
  std::vector<model::transcript_segment> transcript{};
  std::optional<model::vision_context> vision{};
};

struct report_job {
  std::vector<model::history_entry> history{};
  std::vector<model::vision_context> vision_contexts{};
};

using engine_job = std::variant<evaluation_job, report_job>;

inline constexpr const char* kFallbackQuestion = "Could you elaborate on that?";

// Evaluation used when the generator fails.
model::evaluation fallback_evaluation(const std::string& reason);

// Summary for an interview without any evaluated answer.
nlohmann::json empty_history_summary();
nlohmann::json failed_summary(const std::string& reason);

// Fills overall_score, summary and recommendation from history statistics
// when the summarizer left them out.
nlohmann::json complete_summary(nlohmann::json summary, const std::vector<model::history_entry>& history);

// Runs generation and report jobs one at a time in submission order.
class QuestionEngine {
 public:
  QuestionEngine(capabilities::QuestionGenerator& generator, capabilities::ReportSummarizer& summarizer,
                 EventSink& events);
  ~QuestionEngine();

  QuestionEngine(const QuestionEngine&) = delete;
  QuestionEngine& operator=(const QuestionEngine&) = delete;

  bool submit(engine_job job);
  void stop();

  [[nodiscard]] std::size_t queued() const { return jobs_.size(); }

 private:
  void run();
  void execute(evaluation_job& job);
  void execute(report_job& job);

  capabilities::QuestionGenerator& generator_;
  capabilities::ReportSummarizer& summarizer_;
  EventSink& events_;
  core::Mailbox<engine_job> jobs_;
  std::thread worker_;
};

}  // namespace interview_agent::pipeline
