#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capabilities/question_generator.hpp"
#include "capabilities/report_summarizer.hpp"
#include "capabilities/vision_analyzer.hpp"
#include "core/config.hpp"
#include "model/interview.hpp"

namespace interview_agent::capabilities {

// Blocking client for the Ollama REST API. Each call opens its own
// connection, so one instance may be shared between worker threads.
class OllamaClient {
 public:
  explicit OllamaClient(core::OllamaConfig config);

  // POST /api/generate; returns the "response" text. Throws std::runtime_error.
  std::string generate(const std::string& model, const std::string& prompt,
                       const std::vector<std::string>& images_base64 = {}, bool force_json = false) const;

  // POST /api/chat; returns message.content. Throws std::runtime_error.
  std::string chat(const std::string& model, const nlohmann::json& messages, bool force_json = false) const;

  [[nodiscard]] const core::OllamaConfig& config() const { return config_; }

 private:
  nlohmann::json post(const std::string& target, const nlohmann::json& body) const;

  core::OllamaConfig config_;
};

// First {...} block of a model reply, tolerating surrounding prose or code fences.
// Throws std::invalid_argument when no object can be parsed.
nlohmann::json extract_json_object(const std::string& content);

// Maps a generator reply onto an evaluation. "proceed" replies carry an empty
// next_question. Throws model::GenerationError.
model::evaluation parse_evaluation_response(const std::string& content);

std::unique_ptr<VisionAnalyzer> make_ollama_vision_analyzer(std::shared_ptr<const OllamaClient> client);
std::unique_ptr<QuestionGenerator> make_ollama_question_generator(std::shared_ptr<const OllamaClient> client);
std::unique_ptr<ReportSummarizer> make_ollama_report_summarizer(std::shared_ptr<const OllamaClient> client);

}  // namespace interview_agent::capabilities
