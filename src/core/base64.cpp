#include "core/base64.hpp"

#include <array>

namespace interview_agent::core {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<std::int8_t, 256> make_decode_table() {
  std::array<std::int8_t, 256> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < 64; ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
  }
  return table;
}

constexpr auto kDecodeTable = make_decode_table();

}  // namespace

std::string base64_encode(const std::uint8_t* data, const std::size_t size) {
  std::string out;
  out.reserve(((size + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < size; i += 3) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16U) |
                                 (static_cast<std::uint32_t>(data[i + 1]) << 8U) | data[i + 2];
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 6U) & 0x3FU]);
    out.push_back(kAlphabet[triple & 0x3FU]);
  }

  const std::size_t remaining = size - i;
  if (remaining == 1) {
    const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16U;
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out.append("==");
  } else if (remaining == 2) {
    const std::uint32_t triple =
        (static_cast<std::uint32_t>(data[i]) << 16U) | (static_cast<std::uint32_t>(data[i + 1]) << 8U);
    out.push_back(kAlphabet[(triple >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(triple >> 6U) & 0x3FU]);
    out.push_back('=');
  }

  return out;
}

std::string base64_encode(const std::vector<std::uint8_t>& bytes) {
  return base64_encode(bytes.data(), bytes.size());
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
  while (!text.empty() && text.back() == '=') {
    text.remove_suffix(1);
  }
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out;
  out.reserve((text.size() * 3) / 4);

  std::uint32_t accumulator = 0;
  int bits = 0;
  for (const char c : text) {
    const std::int8_t value = kDecodeTable[static_cast<unsigned char>(c)];
    if (value < 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << 6U) | static_cast<std::uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((accumulator >> static_cast<unsigned>(bits)) & 0xFFU));
    }
  }

  return out;
}

}  // namespace interview_agent::core
