#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "cbors/error.hpp"
#include "cbors/io.hpp"
#include "cbors/options.hpp"
#include "cbors/types.hpp"
#include "cbors/utf8.hpp"

namespace cbors {

struct header {
  major_type major = major_type::unsigned_integer;
  std::uint8_t info = 0;
  // Integer value, length, tag number, simple value or raw float bits.
  std::uint64_t argument = 0;

  [[nodiscard]] bool indefinite() const { return info == k_info_indefinite; }
  [[nodiscard]] bool is_break() const { return major == major_type::simple && info == k_info_indefinite; }
};

// RFC 8949 Appendix D.
inline double half_to_double(std::uint16_t half) {
  const int exponent = (half >> 10U) & 0x1F;
  const int mantissa = half & 0x3FF;
  double value = 0.0;
  if (exponent == 0) {
    value = std::ldexp(mantissa, -24);
  } else if (exponent != 31) {
    value = std::ldexp(mantissa + 1024, exponent - 25);
  } else {
    value = mantissa == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
  }
  return (half & 0x8000U) != 0U ? -value : value;
}

namespace detail {

inline void append_bytes(std::vector<std::byte>& out, std::span<const std::byte> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void append_bytes(std::string& out, std::span<const std::byte> bytes) {
  out.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

inline cow_bytes make_borrowed(std::span<const std::byte> bytes, const cow_bytes* /*tag*/) {
  return cow_bytes::borrowed(bytes);
}

inline cow_text make_borrowed(std::span<const std::byte> bytes, const cow_text* /*tag*/) {
  return cow_text::borrowed(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

}  // namespace detail

// Wire-level reader: one header at a time, with payload helpers. Holds no
// state beyond the consumed-byte count.
template <byte_source Source>
class decoder {
 public:
  explicit decoder(Source& source, decode_options options = {}) : source_(source), options_(options) {}

  Source& source() { return source_; }

  [[nodiscard]] const decode_options& options() const { return options_; }

  [[nodiscard]] std::size_t position() const { return position_; }

  [[nodiscard]] decode_error error(decode_errc code, std::string_view context) const {
    return decode_error{code, position_, context};
  }

  decode_result<std::uint8_t> peek_initial_byte() {
    auto ref = fill(1);
    if (!ref) {
      return tl::make_unexpected(ref.error());
    }
    if (ref->empty()) {
      return tl::make_unexpected(error(decode_errc::end_of_input, "expected item header"));
    }
    return std::to_integer<std::uint8_t>(ref->bytes[0]);
  }

  decode_result<major_type> peek_major() {
    auto initial = peek_initial_byte();
    if (!initial) {
      return tl::make_unexpected(initial.error());
    }
    return static_cast<major_type>(*initial >> 5U);
  }

  // Reserved indicators and misplaced indefinite markers are reported before
  // the header byte is consumed.
  decode_result<header> read_header() {
    auto initial = peek_initial_byte();
    if (!initial) {
      return tl::make_unexpected(initial.error());
    }

    header h;
    h.major = static_cast<major_type>(*initial >> 5U);
    h.info = static_cast<std::uint8_t>(*initial & 0x1FU);

    if (h.info >= 28U && h.info <= 30U) {
      return tl::make_unexpected(error(decode_errc::reserved_indicator, "reserved additional information"));
    }
    if (h.info == k_info_indefinite &&
        (h.major == major_type::unsigned_integer || h.major == major_type::negative_integer ||
         h.major == major_type::tag)) {
      return tl::make_unexpected(error(decode_errc::malformed_indefinite, "indefinite marker on integer or tag"));
    }
    consume(1);

    if (h.info < k_info_one_byte) {
      h.argument = h.info;
    } else if (h.info <= k_info_eight_bytes) {
      const std::size_t width = std::size_t{1} << (h.info - k_info_one_byte);
      std::array<std::byte, 8> buf{};
      auto read = read_exact(std::span<std::byte>(buf.data(), width));
      if (!read) {
        return tl::make_unexpected(read.error());
      }
      switch (width) {
        case 1:
          h.argument = std::to_integer<std::uint8_t>(buf[0]);
          break;
        case 2:
          h.argument = load_be<std::uint16_t>(buf.data());
          break;
        case 4:
          h.argument = load_be<std::uint32_t>(buf.data());
          break;
        default:
          h.argument = load_be<std::uint64_t>(buf.data());
          break;
      }
    }
    return h;
  }

  decode_result<header> expect_header(major_type major, std::string_view context) {
    auto h = read_header();
    if (!h) {
      return h;
    }
    if (h->major != major) {
      return tl::make_unexpected(error(decode_errc::type_mismatch, context));
    }
    return h;
  }

  decode_result<void> read_exact(std::span<std::byte> out) {
    std::size_t done = 0;
    while (done < out.size()) {
      auto ref = fill(out.size() - done);
      if (!ref) {
        return tl::make_unexpected(ref.error());
      }
      if (ref->empty()) {
        return tl::make_unexpected(error(decode_errc::end_of_input, "truncated item"));
      }
      const std::size_t n = std::min(ref->size(), out.size() - done);
      std::memcpy(out.data() + done, ref->bytes.data(), n);
      consume(n);
      done += n;
    }
    return {};
  }

  decode_result<cow_bytes> read_bytes() {
    auto h = expect_header(major_type::byte_string, "expected byte string");
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    return read_bytes_body(*h);
  }

  decode_result<cow_text> read_text() {
    auto h = expect_header(major_type::text_string, "expected text string");
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    return read_text_body(*h);
  }

  decode_result<cow_bytes> read_bytes_body(const header& h) { return read_string_body<cow_bytes>(h); }

  decode_result<cow_text> read_text_body(const header& h) { return read_string_body<cow_text>(h); }

  decode_result<double> read_float() {
    auto h = read_header();
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    return read_float_body(*h);
  }

  decode_result<double> read_float_body(const header& h) {
    if (h.major != major_type::simple) {
      return tl::make_unexpected(error(decode_errc::type_mismatch, "expected float"));
    }
    switch (h.info) {
      case k_info_two_bytes:
        return half_to_double(static_cast<std::uint16_t>(h.argument));
      case k_info_four_bytes:
        return static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(h.argument)));
      case k_info_eight_bytes:
        return std::bit_cast<double>(h.argument);
      default:
        return tl::make_unexpected(error(decode_errc::type_mismatch, "expected float"));
    }
  }

  decode_result<bool> at_break() {
    auto initial = peek_initial_byte();
    if (!initial) {
      return tl::make_unexpected(initial.error());
    }
    return *initial == k_break_byte;
  }

  decode_result<void> read_break() {
    auto initial = peek_initial_byte();
    if (!initial) {
      return tl::make_unexpected(initial.error());
    }
    if (*initial != k_break_byte) {
      return tl::make_unexpected(error(decode_errc::malformed_indefinite, "expected break"));
    }
    consume(1);
    return {};
  }

  // Consumes one complete item without materializing it.
  decode_result<void> skip_item(std::size_t depth = 0) {
    if (depth > options_.max_depth) {
      return tl::make_unexpected(error(decode_errc::depth_limit_exceeded, "nesting too deep"));
    }
    auto h = read_header();
    if (!h) {
      return tl::make_unexpected(h.error());
    }

    switch (h->major) {
      case major_type::unsigned_integer:
      case major_type::negative_integer:
        return {};
      case major_type::byte_string:
      case major_type::text_string:
        if (!h->indefinite()) {
          return skip_bytes(h->argument);
        }
        for (;;) {
          auto done = at_break();
          if (!done) {
            return tl::make_unexpected(done.error());
          }
          if (*done) {
            consume(1);
            return {};
          }
          auto chunk = read_header();
          if (!chunk) {
            return tl::make_unexpected(chunk.error());
          }
          if (chunk->major != h->major || chunk->indefinite()) {
            return tl::make_unexpected(error(decode_errc::malformed_indefinite, "invalid chunk in indefinite string"));
          }
          auto skipped = skip_bytes(chunk->argument);
          if (!skipped) {
            return skipped;
          }
        }
      case major_type::array:
      case major_type::map: {
        const std::uint64_t per_entry = h->major == major_type::map ? 2U : 1U;
        if (!h->indefinite()) {
          for (std::uint64_t i = 0; i < h->argument; ++i) {
            for (std::uint64_t j = 0; j < per_entry; ++j) {
              auto skipped = skip_item(depth + 1);
              if (!skipped) {
                return skipped;
              }
            }
          }
          return {};
        }
        for (;;) {
          auto done = at_break();
          if (!done) {
            return tl::make_unexpected(done.error());
          }
          if (*done) {
            consume(1);
            return {};
          }
          for (std::uint64_t j = 0; j < per_entry; ++j) {
            auto skipped = skip_item(depth + 1);
            if (!skipped) {
              return skipped;
            }
          }
        }
      }
      case major_type::tag:
        return skip_item(depth + 1);
      case major_type::simple:
        if (h->is_break()) {
          return tl::make_unexpected(error(decode_errc::malformed_indefinite, "unexpected break"));
        }
        return {};
    }
    return {};
  }

  decode_result<void> skip_bytes(std::uint64_t count) {
    while (count > 0) {
      const std::size_t want = count > std::numeric_limits<std::size_t>::max()
                                   ? std::numeric_limits<std::size_t>::max()
                                   : static_cast<std::size_t>(count);
      auto ref = fill(want);
      if (!ref) {
        return tl::make_unexpected(ref.error());
      }
      if (ref->empty()) {
        return tl::make_unexpected(error(decode_errc::end_of_input, "truncated payload"));
      }
      const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(ref->size(), count));
      consume(n);
      count -= n;
    }
    return {};
  }

 private:
  tl::expected<reference, decode_error> fill(std::size_t want) {
    auto ref = source_.fill(want);
    if (!ref) {
      return tl::make_unexpected(error(decode_errc::source_error, io_error_message(ref.error())));
    }
    return *ref;
  }

  void consume(std::size_t n) {
    source_.advance(n);
    position_ += n;
  }

  template <typename Cow>
  decode_result<Cow> read_string_body(const header& h) {
    constexpr bool is_text = std::is_same_v<Cow, cow_text>;
    if (!h.indefinite()) {
      return read_definite<Cow>(h.argument);
    }

    typename Cow::owned_type out;
    for (;;) {
      auto done = at_break();
      if (!done) {
        return tl::make_unexpected(done.error());
      }
      if (*done) {
        consume(1);
        return Cow::owned(std::move(out));
      }
      auto chunk = read_header();
      if (!chunk) {
        return tl::make_unexpected(chunk.error());
      }
      if (chunk->major != h.major) {
        return tl::make_unexpected(
            error(decode_errc::malformed_indefinite, "chunk of a different major type in indefinite string"));
      }
      if (chunk->indefinite()) {
        return tl::make_unexpected(error(decode_errc::malformed_indefinite, "nested indefinite string chunk"));
      }
      // Every chunk of a text string is valid UTF-8 on its own.
      auto part = read_definite<Cow>(chunk->argument);
      if (!part) {
        return tl::make_unexpected(part.error());
      }
      const auto view = part->view();
      if constexpr (is_text) {
        out.append(view.data(), view.size());
      } else {
        out.insert(out.end(), view.begin(), view.end());
      }
    }
  }

  template <typename Cow>
  decode_result<Cow> read_definite(std::uint64_t length) {
    constexpr bool is_text = std::is_same_v<Cow, cow_text>;
    if (length > std::numeric_limits<std::size_t>::max()) {
      return tl::make_unexpected(error(decode_errc::length_overflow, "declared length exceeds address space"));
    }
    const auto len = static_cast<std::size_t>(length);
    if (len == 0) {
      return Cow::owned({});
    }

    auto ref = fill(len);
    if (!ref) {
      return tl::make_unexpected(ref.error());
    }
    if (ref->empty()) {
      return tl::make_unexpected(error(decode_errc::end_of_input, "truncated string"));
    }

    if (ref->is_input_scoped() && ref->size() >= len) {
      const auto view = ref->bytes.first(len);
      if constexpr (is_text) {
        if (!utf8::is_valid(view)) {
          return tl::make_unexpected(error(decode_errc::invalid_utf8, "text string is not valid UTF-8"));
        }
      }
      consume(len);
      return detail::make_borrowed(view, static_cast<const Cow*>(nullptr));
    }

    typename Cow::owned_type out;
    out.reserve(std::min(len, options_.max_prealloc));
    std::size_t remaining = len;
    for (;;) {
      const std::size_t n = std::min(ref->size(), remaining);
      detail::append_bytes(out, ref->bytes.first(n));
      consume(n);
      remaining -= n;
      if (remaining == 0) {
        break;
      }
      ref = fill(remaining);
      if (!ref) {
        return tl::make_unexpected(ref.error());
      }
      if (ref->empty()) {
        return tl::make_unexpected(error(decode_errc::end_of_input, "truncated string"));
      }
    }

    if constexpr (is_text) {
      if (!utf8::is_valid(out)) {
        return tl::make_unexpected(error(decode_errc::invalid_utf8, "text string is not valid UTF-8"));
      }
    }
    return Cow::owned(std::move(out));
  }

  Source& source_;
  decode_options options_;
  std::size_t position_ = 0;
};

}  // namespace cbors
