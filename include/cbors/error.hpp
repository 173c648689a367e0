#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace cbors {

enum class io_error {
  open_failed,
  write_failed,
  read_failed,
  capacity_exceeded,
};

inline constexpr std::string_view io_error_message(io_error error) {
  switch (error) {
    case io_error::open_failed:
      return "open_failed";
    case io_error::write_failed:
      return "write_failed";
    case io_error::read_failed:
      return "read_failed";
    case io_error::capacity_exceeded:
      return "capacity_exceeded";
  }
  return "unknown";
}

enum class decode_errc {
  end_of_input,
  reserved_indicator,
  invalid_utf8,
  type_mismatch,
  length_overflow,
  malformed_indefinite,
  source_error,
  invalid_length,
  invalid_value,
  duplicate_key,
  depth_limit_exceeded,
  no_matching_variant,
  trailing_data,
};

inline constexpr std::string_view error_message(decode_errc error) {
  switch (error) {
    case decode_errc::end_of_input:
      return "end_of_input";
    case decode_errc::reserved_indicator:
      return "reserved_indicator";
    case decode_errc::invalid_utf8:
      return "invalid_utf8";
    case decode_errc::type_mismatch:
      return "type_mismatch";
    case decode_errc::length_overflow:
      return "length_overflow";
    case decode_errc::malformed_indefinite:
      return "malformed_indefinite";
    case decode_errc::source_error:
      return "source_error";
    case decode_errc::invalid_length:
      return "invalid_length";
    case decode_errc::invalid_value:
      return "invalid_value";
    case decode_errc::duplicate_key:
      return "duplicate_key";
    case decode_errc::depth_limit_exceeded:
      return "depth_limit_exceeded";
    case decode_errc::no_matching_variant:
      return "no_matching_variant";
    case decode_errc::trailing_data:
      return "trailing_data";
  }
  return "unknown";
}

enum class encode_errc {
  sink_error,
  unrepresentable_value,
};

inline constexpr std::string_view error_message(encode_errc error) {
  switch (error) {
    case encode_errc::sink_error:
      return "sink_error";
    case encode_errc::unrepresentable_value:
      return "unrepresentable_value";
  }
  return "unknown";
}

// `position` counts the input bytes consumed before the failure was detected.
// `context` always refers to static storage.
struct decode_error {
  decode_errc code = decode_errc::end_of_input;
  std::size_t position = 0;
  std::string_view context{};

  bool operator==(const decode_error& rhs) const {
    return code == rhs.code && position == rhs.position;
  }
};

struct encode_error {
  encode_errc code = encode_errc::sink_error;
  std::string_view context{};

  bool operator==(const encode_error& rhs) const { return code == rhs.code; }
};

template <typename T>
using decode_result = tl::expected<T, decode_error>;

template <typename T>
using encode_result = tl::expected<T, encode_error>;

inline std::string to_string(const decode_error& error) {
  std::string out(error_message(error.code));
  out += " at byte ";
  out += std::to_string(error.position);
  if (!error.context.empty()) {
    out += ": ";
    out += error.context;
  }
  return out;
}

inline std::string to_string(const encode_error& error) {
  std::string out(error_message(error.code));
  if (!error.context.empty()) {
    out += ": ";
    out += error.context;
  }
  return out;
}

}  // namespace cbors
