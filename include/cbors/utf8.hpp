#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace cbors::utf8 {

namespace detail {

// Decodes one code point starting at data[pos]. Returns the sequence length,
// or 0 when the sequence is malformed (overlong, surrogate, out of range,
// truncated).
inline std::size_t decode_one(std::span<const std::byte> data, std::size_t pos, char32_t& out) {
  const auto at = [&](std::size_t i) { return std::to_integer<std::uint8_t>(data[i]); };
  const std::uint8_t lead = at(pos);
  const std::size_t remaining = data.size() - pos;

  if (lead < 0x80U) {
    out = lead;
    return 1;
  }

  std::size_t length = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    length = 2;
    cp = lead & 0x1FU;
    min = 0x80;
  } else if ((lead & 0xF0U) == 0xE0U) {
    length = 3;
    cp = lead & 0x0FU;
    min = 0x800;
  } else if ((lead & 0xF8U) == 0xF0U) {
    length = 4;
    cp = lead & 0x07U;
    min = 0x10000;
  } else {
    return 0;
  }

  if (remaining < length) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const std::uint8_t cont = at(pos + i);
    if ((cont & 0xC0U) != 0x80U) {
      return 0;
    }
    cp = (cp << 6U) | (cont & 0x3FU);
  }

  if (cp < min || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
    return 0;
  }
  out = cp;
  return length;
}

}  // namespace detail

inline bool is_valid(std::span<const std::byte> data) {
  std::size_t pos = 0;
  char32_t cp = 0;
  while (pos < data.size()) {
    // ASCII fast path.
    if (std::to_integer<std::uint8_t>(data[pos]) < 0x80U) {
      ++pos;
      continue;
    }
    const std::size_t len = detail::decode_one(data, pos, cp);
    if (len == 0) {
      return false;
    }
    pos += len;
  }
  return true;
}

inline bool is_valid(std::string_view text) {
  return is_valid(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

// Returns the code point when `text` holds exactly one.
inline std::optional<char32_t> single_char(std::string_view text) {
  const auto data = std::as_bytes(std::span<const char>(text.data(), text.size()));
  if (data.empty()) {
    return std::nullopt;
  }
  char32_t cp = 0;
  const std::size_t len = detail::decode_one(data, 0, cp);
  if (len == 0 || len != data.size()) {
    return std::nullopt;
  }
  return cp;
}

// Empty result for surrogates and values above U+10FFFF.
inline std::string encode(char32_t cp) {
  std::string out;
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp >= 0xD800U && cp <= 0xDFFFU) {
    return out;
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp <= 0x10FFFFU) {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
  return out;
}

}  // namespace cbors::utf8
