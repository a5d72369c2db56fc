#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "model/messages.hpp"

namespace interview_agent::gateway {

// Parses one client message. Throws std::invalid_argument on malformed JSON,
// an unknown type or an invalid payload.
model::inbound_message decode_inbound(std::string_view raw, std::uint64_t arrival_ns);

// {"type": ..., "data": {...} | null, "timestamp": <unix seconds>}
nlohmann::json outbound_to_json(const model::outbound_event& event, double timestamp_s);
std::string encode_outbound(const model::outbound_event& event, double timestamp_s);

}  // namespace interview_agent::gateway
