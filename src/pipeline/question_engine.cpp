#include "pipeline/question_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace interview_agent::pipeline {
namespace {

double average_score(const std::vector<model::history_entry>& history) {
  if (history.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& entry : history) {
    total += entry.result.score;
  }
  return total / static_cast<double>(history.size());
}

const char* recommendation_for(const double average) {
  if (average >= 6.0) {
    return "PASS";
  }
  if (average >= 4.0) {
    return "NEEDS_IMPROVEMENT";
  }
  return "FAIL";
}

}  // namespace

model::evaluation fallback_evaluation(const std::string& reason) {
  return model::evaluation{
      .score = 5.0,
      .next_question = kFallbackQuestion,
      .conflict_detected = false,
      .feedback = "Evaluation error: " + reason.substr(0, 50),
      .topic = "Unknown",
  };
}

nlohmann::json empty_history_summary() {
  return nlohmann::json{{"overall_score", 0}, {"summary", "No content to evaluate."}};
}

nlohmann::json failed_summary(const std::string& reason) {
  return nlohmann::json{{"overall_score", 50},
                        {"summary", "Report generation error: " + reason},
                        {"recommendation", "NEEDS_REVIEW"}};
}

nlohmann::json complete_summary(nlohmann::json summary, const std::vector<model::history_entry>& history) {
  if (!summary.is_object()) {
    summary = nlohmann::json::object();
  }

  const double average = average_score(history);
  const auto score_it = summary.find("overall_score");
  if (score_it == summary.end() || !score_it->is_number()) {
    summary["overall_score"] = static_cast<int>(average * 10.0);
  } else {
    summary["overall_score"] = static_cast<int>(std::lround(std::clamp(score_it->get<double>(), 0.0, 100.0)));
  }

  const auto text_it = summary.find("summary");
  if (text_it == summary.end() || !text_it->is_string() || text_it->get<std::string>().empty()) {
    std::ostringstream text;
    text << "The candidate answered " << history.size() << " question" << (history.size() == 1 ? "" : "s")
         << " with an average score of " << std::fixed << std::setprecision(1) << average << "/10.";
    summary["summary"] = text.str();
  }

  const auto recommendation_it = summary.find("recommendation");
  if (recommendation_it == summary.end() || !recommendation_it->is_string()) {
    summary["recommendation"] = recommendation_for(average);
  }
  return summary;
}

QuestionEngine::QuestionEngine(capabilities::QuestionGenerator& generator,
                               capabilities::ReportSummarizer& summarizer, EventSink& events)
    : generator_(generator), summarizer_(summarizer), events_(events) {
  worker_ = std::thread([this] { run(); });
}

QuestionEngine::~QuestionEngine() { stop(); }

bool QuestionEngine::submit(engine_job job) { return jobs_.push(std::move(job)); }

void QuestionEngine::stop() {
  const std::size_t dropped = jobs_.clear();
  if (dropped > 0) {
    std::cerr << "[question-engine] discarding " << dropped << " queued job(s) on shutdown\n";
  }
  jobs_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void QuestionEngine::run() {
  while (auto job = jobs_.pop()) {
    std::visit([this](auto& pending) { execute(pending); }, *job);
  }
}

void QuestionEngine::execute(evaluation_job& job) {
  const std::string answer = job.transcript.empty() ? std::string{} : job.transcript.back().text;
  try {
    auto result = generator_.generate(job.transcript, job.vision);
    events_.post(evaluation_ready{.sequence = job.sequence, .answer = answer, .result = std::move(result)});
  } catch (const std::exception& ex) {
    std::cerr << "[question-engine] generation " << job.sequence << " failed: " << ex.what() << '\n';
    events_.post(evaluation_ready{
        .sequence = job.sequence,
        .answer = answer,
        .result = fallback_evaluation(ex.what()),
        .error = ex.what(),
    });
  }
}

void QuestionEngine::execute(report_job& job) {
  if (job.history.empty()) {
    events_.post(report_ready{.summary = empty_history_summary()});
    return;
  }

  try {
    auto summary = summarizer_.summarize(job.history, job.vision_contexts);
    events_.post(report_ready{.summary = complete_summary(std::move(summary), job.history)});
  } catch (const std::exception& ex) {
    std::cerr << "[question-engine] report failed: " << ex.what() << '\n';
    events_.post(report_ready{.summary = failed_summary(ex.what()), .error = ex.what()});
  }
}

}  // namespace interview_agent::pipeline
