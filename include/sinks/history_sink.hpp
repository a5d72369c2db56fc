#pragma once

#include <memory>
#include <string>

#include "model/interview.hpp"

namespace interview_agent::sinks {

// Receives evaluations as they happen and interview records at stop/complete.
// Failures are reported by return value and never reach the client.
class HistorySink {
 public:
  virtual bool record_evaluation(const std::string& session_id, const model::history_entry& entry) = 0;
  virtual bool save_interview(const model::interview_record& record) = 0;
  virtual ~HistorySink() = default;
};

std::unique_ptr<HistorySink> make_none_history_sink();

}  // namespace interview_agent::sinks
