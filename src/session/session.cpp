#include "session/session.hpp"

namespace interview_agent::session {

model::interview_record make_record(const Session& session) {
  return model::interview_record{
      .session_id = session.id,
      .started_at = session.started_at,
      .ended_at = session.ended_at,
      .auto_ended = session.auto_ended,
      .history = session.history,
      .screen_contexts_count = session.vision_log.size(),
      .summary = session.summary,
  };
}

}  // namespace interview_agent::session
