#include "sinks/history_sink.hpp"

namespace interview_agent::sinks {
namespace {

class NoneHistorySink final : public HistorySink {
 public:
  bool record_evaluation(const std::string& /*session_id*/, const model::history_entry& /*entry*/) override {
    return true;
  }
  bool save_interview(const model::interview_record& /*record*/) override { return true; }
};

}  // namespace

std::unique_ptr<HistorySink> make_none_history_sink() { return std::make_unique<NoneHistorySink>(); }

}  // namespace interview_agent::sinks
