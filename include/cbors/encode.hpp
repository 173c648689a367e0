#pragma once

#include <array>
#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <tl/expected.hpp>

#include "cbors/error.hpp"
#include "cbors/io.hpp"
#include "cbors/types.hpp"

namespace cbors {

// Wire-level writer. Every argument is written in the smallest width that
// holds it; floats are written at the precision the caller asks for.
template <byte_sink Sink>
class encoder {
 public:
  explicit encoder(Sink& sink) : sink_(sink) {}

  Sink& sink() { return sink_; }

  encode_result<void> write_header(major_type major, std::uint64_t argument) {
    std::array<std::byte, 9> buf{};
    std::size_t len = 1;
    if (argument < k_info_one_byte) {
      buf[0] = static_cast<std::byte>(initial_byte(major, static_cast<std::uint8_t>(argument)));
    } else if (argument <= 0xFFU) {
      buf[0] = static_cast<std::byte>(initial_byte(major, k_info_one_byte));
      buf[1] = static_cast<std::byte>(argument);
      len = 2;
    } else if (argument <= 0xFFFFU) {
      buf[0] = static_cast<std::byte>(initial_byte(major, k_info_two_bytes));
      store_be<std::uint16_t>(buf.data() + 1, static_cast<std::uint16_t>(argument));
      len = 3;
    } else if (argument <= 0xFFFFFFFFULL) {
      buf[0] = static_cast<std::byte>(initial_byte(major, k_info_four_bytes));
      store_be<std::uint32_t>(buf.data() + 1, static_cast<std::uint32_t>(argument));
      len = 5;
    } else {
      buf[0] = static_cast<std::byte>(initial_byte(major, k_info_eight_bytes));
      store_be<std::uint64_t>(buf.data() + 1, argument);
      len = 9;
    }
    return write_raw(std::span<const std::byte>(buf.data(), len));
  }

  encode_result<void> write_uint(std::uint64_t value) {
    return write_header(major_type::unsigned_integer, value);
  }

  // Writes the integer -1 - n.
  encode_result<void> write_negative(std::uint64_t n) {
    return write_header(major_type::negative_integer, n);
  }

  encode_result<void> write_int(std::int64_t value) {
    if (value >= 0) {
      return write_uint(static_cast<std::uint64_t>(value));
    }
    return write_negative(static_cast<std::uint64_t>(-1 - value));
  }

  // Tag 2 (positive) or tag 3 (negative, value -1 - magnitude) over a
  // minimal big-endian byte string.
  encode_result<void> write_bignum(bool negative, u128 magnitude) {
    auto tag = write_tag(negative ? k_tag_negative_bignum : k_tag_positive_bignum);
    if (!tag) {
      return tag;
    }
    const auto payload = magnitude_to_be(magnitude);
    return write_bytes(payload);
  }

  encode_result<void> write_bytes(std::span<const std::byte> bytes) {
    auto head = write_header(major_type::byte_string, bytes.size());
    if (!head) {
      return head;
    }
    return write_raw(bytes);
  }

  encode_result<void> write_text(std::string_view text) {
    auto head = write_header(major_type::text_string, text.size());
    if (!head) {
      return head;
    }
    return write_raw(std::as_bytes(std::span<const char>(text.data(), text.size())));
  }

  encode_result<void> write_array_header(std::size_t count) { return write_header(major_type::array, count); }

  encode_result<void> write_map_header(std::size_t count) { return write_header(major_type::map, count); }

  // Opens an indefinite byte string, text string, array or map.
  encode_result<void> begin_indefinite(major_type major) {
    assert(major == major_type::byte_string || major == major_type::text_string || major == major_type::array ||
           major == major_type::map);
    return write_byte(initial_byte(major, k_info_indefinite));
  }

  encode_result<void> write_break() { return write_byte(k_break_byte); }

  encode_result<void> write_tag(std::uint64_t tag) { return write_header(major_type::tag, tag); }

  encode_result<void> write_bool(bool value) {
    return write_byte(initial_byte(major_type::simple, value ? k_simple_true : k_simple_false));
  }

  encode_result<void> write_null() { return write_byte(initial_byte(major_type::simple, k_simple_null)); }

  encode_result<void> write_undefined() { return write_byte(initial_byte(major_type::simple, k_simple_undefined)); }

  // Simple values 24..31 are not well-formed in the two-byte form.
  encode_result<void> write_simple(std::uint8_t value) {
    assert(value < 24U || value >= 32U);
    if (value < 24U) {
      return write_byte(initial_byte(major_type::simple, value));
    }
    const std::array<std::byte, 2> buf{static_cast<std::byte>(initial_byte(major_type::simple, k_info_one_byte)),
                                       static_cast<std::byte>(value)};
    return write_raw(buf);
  }

  encode_result<void> write_f16_bits(std::uint16_t bits) {
    std::array<std::byte, 3> buf{};
    buf[0] = static_cast<std::byte>(initial_byte(major_type::simple, k_info_two_bytes));
    store_be<std::uint16_t>(buf.data() + 1, bits);
    return write_raw(buf);
  }

  encode_result<void> write_f32(float value) {
    std::array<std::byte, 5> buf{};
    buf[0] = static_cast<std::byte>(initial_byte(major_type::simple, k_info_four_bytes));
    store_be<std::uint32_t>(buf.data() + 1, std::bit_cast<std::uint32_t>(value));
    return write_raw(buf);
  }

  encode_result<void> write_f64(double value) {
    std::array<std::byte, 9> buf{};
    buf[0] = static_cast<std::byte>(initial_byte(major_type::simple, k_info_eight_bytes));
    store_be<std::uint64_t>(buf.data() + 1, std::bit_cast<std::uint64_t>(value));
    return write_raw(buf);
  }

  encode_result<void> write_raw(std::span<const std::byte> bytes) {
    if (bytes.empty()) {
      return {};
    }
    auto written = sink_.write(bytes);
    if (!written) {
      return tl::make_unexpected(encode_error{encode_errc::sink_error, io_error_message(written.error())});
    }
    return {};
  }

 private:
  encode_result<void> write_byte(std::uint8_t value) {
    const std::byte b = static_cast<std::byte>(value);
    return write_raw(std::span<const std::byte>(&b, 1));
  }

  Sink& sink_;
};

}  // namespace cbors
