#pragma once

#include <string>

#include "model/interview.hpp"

namespace interview_agent::capabilities {

class VisionAnalyzer {
 public:
  // Throws model::AnalysisError.
  virtual std::string analyze(const model::vision_frame& frame) = 0;
  virtual ~VisionAnalyzer() = default;
};

}  // namespace interview_agent::capabilities
