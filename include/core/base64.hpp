#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace interview_agent::core {

std::string base64_encode(const std::uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<std::uint8_t>& bytes);

// Standard alphabet, padding optional. Returns nullopt on any invalid character.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

}  // namespace interview_agent::core
