#include "gateway/codec.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "core/base64.hpp"

namespace interview_agent::gateway {
namespace {

model::shared_bytes decode_payload(const nlohmann::json& value, const char* field) {
  if (!value.is_string()) {
    throw std::invalid_argument(std::string(field) + " must be a base64 string");
  }

  std::string_view text = value.get_ref<const std::string&>();
  // Browsers may send data URLs for captured frames.
  if (text.rfind("data:", 0) == 0) {
    const auto comma = text.find(',');
    if (comma == std::string_view::npos) {
      throw std::invalid_argument(std::string(field) + " is a malformed data URL");
    }
    text.remove_prefix(comma + 1);
  }

  auto bytes = core::base64_decode(text);
  if (!bytes.has_value()) {
    throw std::invalid_argument(std::string(field) + " is not valid base64");
  }
  if (bytes->empty()) {
    throw std::invalid_argument(std::string(field) + " is empty");
  }
  return std::make_shared<const model::byte_buffer>(std::move(*bytes));
}

model::audio_format decode_format(const nlohmann::json& source) {
  model::audio_format format{};
  if (const auto it = source.find("encoding"); it != source.end()) {
    if (!it->is_string()) {
      throw std::invalid_argument("encoding must be a string");
    }
    format.encoding = it->get<std::string>();
  }
  if (const auto it = source.find("sampleRate"); it != source.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
      throw std::invalid_argument("sampleRate must be a positive integer");
    }
    format.sample_rate = static_cast<std::uint32_t>(it->get<std::int64_t>());
  }
  return format;
}

model::audio_message decode_audio(const nlohmann::json& message, const std::uint64_t arrival_ns) {
  const auto data_it = message.find("data");
  if (data_it == message.end()) {
    throw std::invalid_argument("audio requires data");
  }

  // Either {"type":"audio","data":{"data":..., "encoding":..., "sampleRate":...}}
  // or {"type":"audio","data":"<base64>","encoding":...,"sampleRate":...}.
  if (data_it->is_object()) {
    const auto inner_it = data_it->find("data");
    if (inner_it == data_it->end()) {
      throw std::invalid_argument("audio requires data.data");
    }
    return model::audio_message{
        .data = decode_payload(*inner_it, "data.data"),
        .format = decode_format(*data_it),
        .arrival_ns = arrival_ns,
    };
  }

  return model::audio_message{
      .data = decode_payload(*data_it, "data"),
      .format = decode_format(message),
      .arrival_ns = arrival_ns,
  };
}

model::video_message decode_video(const nlohmann::json& message, const std::uint64_t arrival_ns) {
  const auto data_it = message.find("data");
  if (data_it == message.end()) {
    throw std::invalid_argument("video requires data");
  }
  if (data_it->is_object()) {
    const auto inner_it = data_it->find("data");
    if (inner_it == data_it->end()) {
      throw std::invalid_argument("video requires data.data");
    }
    return model::video_message{.data = decode_payload(*inner_it, "data.data"), .arrival_ns = arrival_ns};
  }
  return model::video_message{.data = decode_payload(*data_it, "data"), .arrival_ns = arrival_ns};
}

struct OutboundPayload {
  nlohmann::json operator()(const model::status_event& event) const {
    return {{"state", model::to_string(event.state)}};
  }
  nlohmann::json operator()(const model::transcript_interim_event& event) const { return {{"text", event.text}}; }
  nlohmann::json operator()(const model::transcript_final_event& event) const { return {{"text", event.text}}; }
  nlohmann::json operator()(const model::evaluation_event& event) const { return event.result; }
  nlohmann::json operator()(const model::audio_chunk_event& event) const {
    return {{"audio", event.audio != nullptr ? core::base64_encode(*event.audio) : std::string{}}};
  }
  nlohmann::json operator()(const model::audio_end_event&) const { return nullptr; }
  nlohmann::json operator()(const model::stop_audio_event&) const { return nullptr; }
  nlohmann::json operator()(const model::screen_update_event& event) const { return {{"context", event.context}}; }
  nlohmann::json operator()(const model::screen_share_lost_event& event) const {
    return {{"grace_period_s", event.grace_period_s}};
  }
  nlohmann::json operator()(const model::screen_share_restored_event&) const { return nullptr; }
  nlohmann::json operator()(const model::interview_stopped_event& event) const {
    return {{"session_id", event.session_id},
            {"total_questions", event.total_questions},
            {"has_content", event.has_content},
            {"auto_ended", event.auto_ended}};
  }
  nlohmann::json operator()(const model::interview_complete_event& event) const {
    return {{"summary", event.summary}, {"history", event.history}, {"session_id", event.session_id}};
  }
  nlohmann::json operator()(const model::error_event& event) const { return {{"message", event.message}}; }
  nlohmann::json operator()(const model::ai_message_event& event) const { return {{"text", event.text}}; }
  nlohmann::json operator()(const model::keepalive_event&) const { return nullptr; }
};

}  // namespace

model::inbound_message decode_inbound(const std::string_view raw, const std::uint64_t arrival_ns) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("invalid JSON: ") + ex.what());
  }

  if (!message.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }
  const auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    throw std::invalid_argument("type must be a string");
  }

  const auto& type = type_it->get_ref<const std::string&>();
  if (type == "audio") {
    return decode_audio(message, arrival_ns);
  }
  if (type == "video") {
    return decode_video(message, arrival_ns);
  }
  if (type == "stop") {
    return model::stop_message{};
  }
  if (type == "generate_report") {
    return model::generate_report_message{};
  }
  if (type == "screen_share_lost") {
    return model::screen_share_lost_message{};
  }
  if (type == "screen_share_restored") {
    return model::screen_share_restored_message{};
  }

  throw std::invalid_argument("unknown message type: " + type);
}

nlohmann::json outbound_to_json(const model::outbound_event& event, const double timestamp_s) {
  return nlohmann::json{{"type", model::event_type(event)},
                        {"data", std::visit(OutboundPayload{}, event)},
                        {"timestamp", timestamp_s}};
}

std::string encode_outbound(const model::outbound_event& event, const double timestamp_s) {
  return outbound_to_json(event, timestamp_s).dump();
}

}  // namespace interview_agent::gateway
