#pragma once

#include <optional>
#include <vector>

#include "model/interview.hpp"

namespace interview_agent::capabilities {

class QuestionGenerator {
 public:
  // transcript holds every final segment so far, the newest answer last.
  // Throws model::GenerationError.
  virtual model::evaluation generate(const std::vector<model::transcript_segment>& transcript,
                                     const std::optional<model::vision_context>& vision) = 0;
  virtual ~QuestionGenerator() = default;
};

}  // namespace interview_agent::capabilities
