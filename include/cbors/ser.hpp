#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "cbors/encode.hpp"
#include "cbors/error.hpp"
#include "cbors/io.hpp"
#include "cbors/options.hpp"
#include "cbors/types.hpp"
#include "cbors/utf8.hpp"

namespace cbors {

// Drives codecs over an encoder. Wire forms:
//   unit            -> empty array
//   none / some(x)  -> null / x
//   unit variant    -> identifier
//   other variants  -> {identifier: payload}
//   unknown length  -> indefinite array or map closed by a break
template <byte_sink Sink>
class serializer {
 public:
  explicit serializer(Sink& sink, encode_options options = {}) : wire_(sink), options_(options) {}

  encoder<Sink>& wire() { return wire_; }

  [[nodiscard]] const encode_options& options() const { return options_; }

  template <typename T>
  encode_result<void> serialize(const T& v) {
    return codec<T>::serialize(*this, v);
  }

  encode_result<void> serialize_unit() { return wire_.write_array_header(0); }

  encode_result<void> serialize_bool(bool v) { return wire_.write_bool(v); }

  encode_result<void> serialize_i64(std::int64_t v) { return wire_.write_int(v); }

  encode_result<void> serialize_u64(std::uint64_t v) { return wire_.write_uint(v); }

  encode_result<void> serialize_i128(i128 v) {
    if (v >= 0) {
      return serialize_u128(static_cast<u128>(v));
    }
    const auto magnitude = static_cast<u128>(-1 - v);
    if (magnitude <= std::numeric_limits<std::uint64_t>::max()) {
      return wire_.write_negative(static_cast<std::uint64_t>(magnitude));
    }
    if (options_.bignums == bignum_policy::reject) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "integer exceeds 64 bits"});
    }
    return wire_.write_bignum(true, magnitude);
  }

  encode_result<void> serialize_u128(u128 v) {
    if (v <= std::numeric_limits<std::uint64_t>::max()) {
      return wire_.write_uint(static_cast<std::uint64_t>(v));
    }
    if (options_.bignums == bignum_policy::reject) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "integer exceeds 64 bits"});
    }
    return wire_.write_bignum(false, v);
  }

  encode_result<void> serialize_f32(float v) { return wire_.write_f32(v); }

  encode_result<void> serialize_f64(double v) { return wire_.write_f64(v); }

  encode_result<void> serialize_char(char32_t v) {
    const std::string text = utf8::encode(v);
    if (text.empty()) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "invalid code point"});
    }
    return wire_.write_text(text);
  }

  encode_result<void> serialize_str(std::string_view v) { return wire_.write_text(v); }

  encode_result<void> serialize_bytes(std::span<const std::byte> v) { return wire_.write_bytes(v); }

  encode_result<void> serialize_none() { return wire_.write_null(); }

  template <typename T>
  encode_result<void> serialize_some(const T& v) {
    return serialize(v);
  }

  encode_result<void> serialize_variant_id(std::uint32_t index, std::string_view name) {
    if (options_.variant_ids == variant_id_policy::index) {
      return wire_.write_uint(index);
    }
    return wire_.write_text(name);
  }

  encode_result<void> serialize_unit_variant(std::uint32_t index, std::string_view name) {
    return serialize_variant_id(index, name);
  }

  // Writes the one-entry map header and the identifier; the caller writes the payload.
  encode_result<void> begin_variant(std::uint32_t index, std::string_view name) {
    auto head = wire_.write_map_header(1);
    if (!head) {
      return head;
    }
    return serialize_variant_id(index, name);
  }

  template <typename T>
  encode_result<void> serialize_newtype_variant(std::uint32_t index, std::string_view name, const T& payload) {
    auto head = begin_variant(index, name);
    if (!head) {
      return head;
    }
    return serialize(payload);
  }

  // Array or map under construction. A compound opened without a length is
  // indefinite and end() writes the break.
  class compound {
   public:
    compound(serializer& parent, bool indefinite) : parent_(parent), indefinite_(indefinite) {}

    template <typename T>
    encode_result<void> element(const T& v) {
      return parent_.serialize(v);
    }

    template <typename K, typename V>
    encode_result<void> entry(const K& key, const V& v) {
      auto written = parent_.serialize(key);
      if (!written) {
        return written;
      }
      return parent_.serialize(v);
    }

    template <typename V>
    encode_result<void> field(std::string_view name, const V& v) {
      auto written = parent_.serialize_str(name);
      if (!written) {
        return written;
      }
      return parent_.serialize(v);
    }

    serializer& parent() { return parent_; }

    encode_result<void> end() {
      if (indefinite_) {
        return parent_.wire_.write_break();
      }
      return {};
    }

   private:
    serializer& parent_;
    bool indefinite_;
  };

  encode_result<compound> serialize_seq(std::optional<std::size_t> len) {
    auto head = len ? wire_.write_array_header(*len) : wire_.begin_indefinite(major_type::array);
    if (!head) {
      return tl::make_unexpected(head.error());
    }
    return compound(*this, !len.has_value());
  }

  encode_result<compound> serialize_map(std::optional<std::size_t> len) {
    auto head = len ? wire_.write_map_header(*len) : wire_.begin_indefinite(major_type::map);
    if (!head) {
      return tl::make_unexpected(head.error());
    }
    return compound(*this, !len.has_value());
  }

 private:
  encoder<Sink> wire_;
  encode_options options_;
};

}  // namespace cbors
