#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "model/interview.hpp"

namespace interview_agent::capabilities {

class ReportSummarizer {
 public:
  // Throws model::GenerationError.
  virtual nlohmann::json summarize(const std::vector<model::history_entry>& history,
                                   const std::vector<model::vision_context>& vision_contexts) = 0;
  virtual ~ReportSummarizer() = default;
};

}  // namespace interview_agent::capabilities
