#include "capabilities/ollama.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/base64.hpp"
#include "model/errors.hpp"

namespace interview_agent::capabilities {
namespace {

constexpr const char* kVisionPrompt =
    "Describe what is shown on this shared screen for an interviewer: slide titles, diagrams, code and any "
    "visible text. Be concise.";

constexpr const char* kEvaluationPrompt =
    "You are a senior engineer interviewing a presenter about the project on their screen. Score the latest "
    "answer from 0 to 10, check whether what they say conflicts with what the screen shows, and decide whether "
    "to ask one short follow-up question (under 20 words) or let them proceed. Reply with JSON only: "
    "{\"score\":<0-10>,\"conflict_detected\":<true|false>,\"feedback\":\"<brief>\","
    "\"next_question\":\"<question, empty to proceed>\",\"response_type\":\"<question|proceed>\","
    "\"topic\":\"<current topic>\"}";

constexpr const char* kSummaryPrompt =
    "You write the final evaluation of a recorded technical interview. Reply with JSON only containing "
    "\"overall_score\" (0-100), \"category_scores\", \"strengths\", \"weaknesses\", \"summary\" (3-4 sentences) "
    "and \"recommendation\" (PASS, NEEDS_IMPROVEMENT or FAIL with a brief reason).";

constexpr std::size_t kRecentSegments = 4;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string string_field(const nlohmann::json& object, const char* key, const std::string& fallback = {}) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

class OllamaVisionAnalyzer final : public VisionAnalyzer {
 public:
  explicit OllamaVisionAnalyzer(std::shared_ptr<const OllamaClient> client) : client_(std::move(client)) {}

  std::string analyze(const model::vision_frame& frame) override {
    if (frame.image == nullptr || frame.image->empty()) {
      throw model::AnalysisError("frame has no image data");
    }

    std::string description;
    try {
      description = client_->generate(client_->config().vision_model, kVisionPrompt,
                                      {core::base64_encode(*frame.image)});
    } catch (const std::runtime_error& ex) {
      throw model::AnalysisError(ex.what());
    }

    description = trim(description);
    if (description.empty()) {
      throw model::AnalysisError("vision model returned an empty description");
    }
    return description;
  }

 private:
  std::shared_ptr<const OllamaClient> client_;
};

class OllamaQuestionGenerator final : public QuestionGenerator {
 public:
  explicit OllamaQuestionGenerator(std::shared_ptr<const OllamaClient> client) : client_(std::move(client)) {}

  model::evaluation generate(const std::vector<model::transcript_segment>& transcript,
                             const std::optional<model::vision_context>& vision) override {
    if (transcript.empty()) {
      throw model::GenerationError("no answer to evaluate");
    }

    std::ostringstream context;
    context << "## SCREEN CONTENT:\n"
            << (vision.has_value() ? vision->description : std::string("No screen content captured yet")) << "\n\n";
    context << "## PREVIOUS ANSWERS:\n";
    const std::size_t first = transcript.size() > kRecentSegments ? transcript.size() - kRecentSegments : 0;
    if (first + 1 == transcript.size()) {
      context << "None\n";
    }
    for (std::size_t i = first; i + 1 < transcript.size(); ++i) {
      context << "- " << transcript[i].text << '\n';
    }
    context << "\n## LATEST ANSWER:\n\"" << transcript.back().text << "\"\n";

    const nlohmann::json messages = nlohmann::json::array(
        {{{"role", "system"}, {"content", kEvaluationPrompt}}, {{"role", "user"}, {"content", context.str()}}});

    std::string reply;
    try {
      reply = client_->chat(client_->config().model, messages, true);
    } catch (const std::runtime_error& ex) {
      throw model::GenerationError(ex.what());
    }
    return parse_evaluation_response(reply);
  }

 private:
  std::shared_ptr<const OllamaClient> client_;
};

class OllamaReportSummarizer final : public ReportSummarizer {
 public:
  explicit OllamaReportSummarizer(std::shared_ptr<const OllamaClient> client) : client_(std::move(client)) {}

  nlohmann::json summarize(const std::vector<model::history_entry>& history,
                           const std::vector<model::vision_context>& vision_contexts) override {
    std::ostringstream transcript;
    transcript << "## INTERVIEW TRANSCRIPT:\n";
    for (const auto& entry : history) {
      transcript << "Q" << entry.sequence << " topic=" << entry.result.topic << " score=" << entry.result.score
                 << " conflict=" << (entry.result.conflict_detected ? "yes" : "no") << "\n  answer: "
                 << entry.transcript << "\n  feedback: " << entry.result.feedback << '\n';
    }
    transcript << "\n## SCREENS SHOWN:\n";
    for (const auto& context : vision_contexts) {
      transcript << "- " << context.description.substr(0, model::kHistoryContextChars) << '\n';
    }

    const nlohmann::json messages = nlohmann::json::array(
        {{{"role", "system"}, {"content", kSummaryPrompt}}, {{"role", "user"}, {"content", transcript.str()}}});

    try {
      return extract_json_object(client_->chat(client_->config().model, messages, true));
    } catch (const std::runtime_error& ex) {
      throw model::GenerationError(ex.what());
    } catch (const std::invalid_argument& ex) {
      throw model::GenerationError(ex.what());
    }
  }

 private:
  std::shared_ptr<const OllamaClient> client_;
};

}  // namespace

nlohmann::json extract_json_object(const std::string& content) {
  const auto open = content.find('{');
  const auto close = content.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    throw std::invalid_argument("no JSON object in reply");
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(content.substr(open, close - open + 1));
  } catch (const nlohmann::json::exception& ex) {
    throw std::invalid_argument(std::string("malformed JSON in reply: ") + ex.what());
  }
  if (!parsed.is_object()) {
    throw std::invalid_argument("reply JSON is not an object");
  }
  return parsed;
}

model::evaluation parse_evaluation_response(const std::string& content) {
  nlohmann::json reply;
  try {
    reply = extract_json_object(content);
  } catch (const std::invalid_argument& ex) {
    throw model::GenerationError(ex.what());
  }

  const std::string response_type = string_field(reply, "response_type");
  const auto score_it = reply.find("score");
  const bool has_score = score_it != reply.end() && score_it->is_number();

  model::evaluation result{};
  if (response_type == "proceed" && !has_score) {
    result.score = 7.0;
    result.feedback = "Good explanation";
    result.topic = string_field(reply, "topic", "continuing");
    return result;
  }
  if (!has_score) {
    throw model::GenerationError("evaluation reply has no numeric score");
  }

  result.score = std::clamp(score_it->get<double>(), 0.0, 10.0);
  result.next_question = string_field(reply, "next_question", string_field(reply, "next_response"));
  if (response_type == "proceed") {
    result.next_question.clear();
  }
  const auto conflict_it = reply.find("conflict_detected");
  result.conflict_detected = conflict_it != reply.end() && conflict_it->is_boolean() && conflict_it->get<bool>();
  result.feedback = string_field(reply, "feedback");
  result.topic = string_field(reply, "topic");
  return result;
}

std::unique_ptr<VisionAnalyzer> make_ollama_vision_analyzer(std::shared_ptr<const OllamaClient> client) {
  return std::make_unique<OllamaVisionAnalyzer>(std::move(client));
}

std::unique_ptr<QuestionGenerator> make_ollama_question_generator(std::shared_ptr<const OllamaClient> client) {
  return std::make_unique<OllamaQuestionGenerator>(std::move(client));
}

std::unique_ptr<ReportSummarizer> make_ollama_report_summarizer(std::shared_ptr<const OllamaClient> client) {
  return std::make_unique<OllamaReportSummarizer>(std::move(client));
}

}  // namespace interview_agent::capabilities
