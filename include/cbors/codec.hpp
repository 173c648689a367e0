#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include "cbors/content.hpp"
#include "cbors/error.hpp"
#include "cbors/shape.hpp"
#include "cbors/types.hpp"
#include "cbors/value.hpp"

namespace cbors {

namespace detail {

template <typename T>
inline constexpr bool is_plain_integer_v =
    std::is_integral_v<T> && sizeof(T) <= sizeof(std::uint64_t) && !std::is_same_v<T, bool> &&
    !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> &&
    !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

// Reads one element per slot; a short sequence is invalid_length.
template <typename De, typename Seq, typename... Slots>
decode_result<void> read_elements(De& de, Seq& seq, Slots&... slots) {
  std::optional<decode_error> failure;
  auto read_one = [&](auto& slot) -> bool {
    using slot_type = std::decay_t<decltype(slot)>;
    auto item = seq.template next_element<slot_type>();
    if (!item) {
      failure = item.error();
      return false;
    }
    if (!item->has_value()) {
      failure = de.error(decode_errc::invalid_length, "too few elements");
      return false;
    }
    slot = std::move(**item);
    return true;
  };
  static_cast<void>((read_one(slots) && ...));
  if (failure) {
    return tl::make_unexpected(*failure);
  }
  return {};
}

template <typename Ser, typename... Items>
encode_result<void> write_elements(Ser& ser, const Items&... items) {
  auto seq = ser.serialize_seq(sizeof...(Items));
  if (!seq) {
    return tl::make_unexpected(seq.error());
  }
  std::optional<encode_error> failure;
  auto write_one = [&](const auto& item) -> bool {
    auto written = seq->element(item);
    if (!written) {
      failure = written.error();
      return false;
    }
    return true;
  };
  static_cast<void>((write_one(items) && ...));
  if (failure) {
    return tl::make_unexpected(*failure);
  }
  return seq->end();
}

template <typename T, typename De>
decode_result<T> narrow(De& de) {
  auto w = de.deserialize_integer();
  if (!w) {
    return tl::make_unexpected(w.error());
  }
  auto out = narrow_integer<T>(*w);
  if (!out) {
    return tl::make_unexpected(de.error(decode_errc::invalid_value, "integer out of range"));
  }
  return *out;
}

}  // namespace detail

template <>
struct codec<bool> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, bool v) {
    return ser.serialize_bool(v);
  }

  template <typename De>
  static decode_result<bool> deserialize(De& de) {
    return de.deserialize_bool();
  }
};

template <typename T>
struct codec<T, std::enable_if_t<detail::is_plain_integer_v<T>>> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, T v) {
    if constexpr (std::is_signed_v<T>) {
      return ser.serialize_i64(static_cast<std::int64_t>(v));
    } else {
      return ser.serialize_u64(static_cast<std::uint64_t>(v));
    }
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    return detail::narrow<T>(de);
  }
};

template <>
struct codec<i128> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, i128 v) {
    return ser.serialize_i128(v);
  }

  template <typename De>
  static decode_result<i128> deserialize(De& de) {
    return detail::narrow<i128>(de);
  }
};

template <>
struct codec<u128> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, u128 v) {
    return ser.serialize_u128(v);
  }

  template <typename De>
  static decode_result<u128> deserialize(De& de) {
    return detail::narrow<u128>(de);
  }
};

template <>
struct codec<float> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, float v) {
    return ser.serialize_f32(v);
  }

  template <typename De>
  static decode_result<float> deserialize(De& de) {
    auto f = de.deserialize_float();
    if (!f) {
      return tl::make_unexpected(f.error());
    }
    return static_cast<float>(*f);
  }
};

template <>
struct codec<double> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, double v) {
    return ser.serialize_f64(v);
  }

  template <typename De>
  static decode_result<double> deserialize(De& de) {
    return de.deserialize_float();
  }
};

template <>
struct codec<char32_t> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, char32_t v) {
    return ser.serialize_char(v);
  }

  template <typename De>
  static decode_result<char32_t> deserialize(De& de) {
    return de.deserialize_char();
  }
};

template <>
struct codec<std::string> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::string& v) {
    return ser.serialize_str(v);
  }

  template <typename De>
  static decode_result<std::string> deserialize(De& de) {
    auto text = de.deserialize_str();
    if (!text) {
      return tl::make_unexpected(text.error());
    }
    return std::move(*text).into_owned();
  }
};

// Borrows from the input; fails when the text had to be copied.
template <>
struct codec<std::string_view> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, std::string_view v) {
    return ser.serialize_str(v);
  }

  template <typename De>
  static decode_result<std::string_view> deserialize(De& de) {
    auto text = de.deserialize_str();
    if (!text) {
      return tl::make_unexpected(text.error());
    }
    if (text->empty()) {
      return std::string_view{};
    }
    if (!text->is_borrowed()) {
      return tl::make_unexpected(de.error(decode_errc::type_mismatch, "text cannot be borrowed from this input"));
    }
    return text->view();
  }
};

template <>
struct codec<cow_text> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const cow_text& v) {
    return ser.serialize_str(v.view());
  }

  template <typename De>
  static decode_result<cow_text> deserialize(De& de) {
    return de.deserialize_str();
  }
};

template <>
struct codec<std::vector<std::byte>> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::vector<std::byte>& v) {
    return ser.serialize_bytes(v);
  }

  template <typename De>
  static decode_result<std::vector<std::byte>> deserialize(De& de) {
    auto bytes = de.deserialize_bytes();
    if (!bytes) {
      return tl::make_unexpected(bytes.error());
    }
    return std::move(*bytes).into_owned();
  }
};

template <>
struct codec<std::span<const std::byte>> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, std::span<const std::byte> v) {
    return ser.serialize_bytes(v);
  }

  template <typename De>
  static decode_result<std::span<const std::byte>> deserialize(De& de) {
    auto bytes = de.deserialize_bytes();
    if (!bytes) {
      return tl::make_unexpected(bytes.error());
    }
    if (bytes->empty()) {
      return std::span<const std::byte>{};
    }
    if (!bytes->is_borrowed()) {
      return tl::make_unexpected(de.error(decode_errc::type_mismatch, "bytes cannot be borrowed from this input"));
    }
    return bytes->view();
  }
};

template <>
struct codec<cow_bytes> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const cow_bytes& v) {
    return ser.serialize_bytes(v.view());
  }

  template <typename De>
  static decode_result<cow_bytes> deserialize(De& de) {
    return de.deserialize_bytes();
  }
};

template <>
struct codec<std::monostate> {
  static constexpr shape kind = shape::unit;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::monostate& /*v*/) {
    return ser.serialize_unit();
  }

  template <typename De>
  static decode_result<std::monostate> deserialize(De& de) {
    auto unit = de.deserialize_unit();
    if (!unit) {
      return tl::make_unexpected(unit.error());
    }
    return std::monostate{};
  }
};

template <typename T>
struct codec<std::optional<T>> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::optional<T>& v) {
    if (!v) {
      return ser.serialize_none();
    }
    return ser.serialize_some(*v);
  }

  template <typename De>
  static decode_result<std::optional<T>> deserialize(De& de) {
    auto present = de.deserialize_option();
    if (!present) {
      return tl::make_unexpected(present.error());
    }
    if (!*present) {
      return std::optional<T>{};
    }
    auto inner = de.template deserialize<T>();
    if (!inner) {
      return tl::make_unexpected(inner.error());
    }
    return std::optional<T>(std::move(*inner));
  }
};

template <typename T>
struct codec<std::unique_ptr<T>> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::unique_ptr<T>& v) {
    if (!v) {
      return ser.serialize_none();
    }
    return ser.serialize(*v);
  }

  template <typename De>
  static decode_result<std::unique_ptr<T>> deserialize(De& de) {
    auto present = de.deserialize_option();
    if (!present) {
      return tl::make_unexpected(present.error());
    }
    if (!*present) {
      return std::unique_ptr<T>{};
    }
    auto inner = de.template deserialize<T>();
    if (!inner) {
      return tl::make_unexpected(inner.error());
    }
    return std::make_unique<T>(std::move(*inner));
  }
};

template <typename T>
struct codec<box<T>> {
  static constexpr shape kind = codec_shape_v<T>;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const box<T>& v) {
    return ser.serialize(*v);
  }

  template <typename De>
  static decode_result<box<T>> deserialize(De& de) {
    auto inner = de.template deserialize<T>();
    if (!inner) {
      return tl::make_unexpected(inner.error());
    }
    return box<T>(std::move(*inner));
  }
};

template <typename T, typename Alloc>
struct codec<std::vector<T, Alloc>> {
  static constexpr shape kind = shape::sequence;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::vector<T, Alloc>& v) {
    auto seq = ser.serialize_seq(v.size());
    if (!seq) {
      return tl::make_unexpected(seq.error());
    }
    for (const auto& item : v) {
      auto written = seq->element(static_cast<const T&>(item));
      if (!written) {
        return written;
      }
    }
    return seq->end();
  }

  template <typename De>
  static decode_result<std::vector<T, Alloc>> deserialize(De& de) {
    return de.deserialize_seq([](auto& seq) -> decode_result<std::vector<T, Alloc>> {
      std::vector<T, Alloc> out;
      if (auto hint = seq.size_hint(sizeof(T))) {
        out.reserve(*hint);
      }
      for (;;) {
        auto item = seq.template next_element<T>();
        if (!item) {
          return tl::make_unexpected(item.error());
        }
        if (!item->has_value()) {
          return out;
        }
        out.push_back(std::move(**item));
      }
    });
  }
};

template <typename T, std::size_t N>
struct codec<std::array<T, N>> {
  static constexpr shape kind = shape::tuple;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::array<T, N>& v) {
    return std::apply([&](const auto&... items) { return detail::write_elements(ser, items...); }, v);
  }

  template <typename De>
  static decode_result<std::array<T, N>> deserialize(De& de) {
    return de.deserialize_seq([&](auto& seq) -> decode_result<std::array<T, N>> {
      std::array<T, N> out{};
      auto read = std::apply([&](auto&... slots) { return detail::read_elements(de, seq, slots...); }, out);
      if (!read) {
        return tl::make_unexpected(read.error());
      }
      return out;
    });
  }
};

template <typename A, typename B>
struct codec<std::pair<A, B>> {
  static constexpr shape kind = shape::tuple;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::pair<A, B>& v) {
    return detail::write_elements(ser, v.first, v.second);
  }

  template <typename De>
  static decode_result<std::pair<A, B>> deserialize(De& de) {
    return de.deserialize_seq([&](auto& seq) -> decode_result<std::pair<A, B>> {
      std::pair<A, B> out{};
      auto read = detail::read_elements(de, seq, out.first, out.second);
      if (!read) {
        return tl::make_unexpected(read.error());
      }
      return out;
    });
  }
};

template <typename... Ts>
struct codec<std::tuple<Ts...>> {
  static constexpr shape kind = shape::tuple;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const std::tuple<Ts...>& v) {
    return std::apply([&](const auto&... items) { return detail::write_elements(ser, items...); }, v);
  }

  template <typename De>
  static decode_result<std::tuple<Ts...>> deserialize(De& de) {
    return de.deserialize_seq([&](auto& seq) -> decode_result<std::tuple<Ts...>> {
      std::tuple<Ts...> out{};
      auto read = std::apply([&](auto&... slots) { return detail::read_elements(de, seq, slots...); }, out);
      if (!read) {
        return tl::make_unexpected(read.error());
      }
      return out;
    });
  }
};

// Keys come out in the map's order. With duplicate_key_policy::allow the
// last occurrence of a key wins.
template <typename K, typename V, typename Compare, typename Alloc>
struct codec<std::map<K, V, Compare, Alloc>> {
  using map_type = std::map<K, V, Compare, Alloc>;

  static constexpr shape kind = shape::map;

  template <typename Compound>
  static encode_result<void> serialize_entries(Compound& out, const map_type& v) {
    for (const auto& [key, item] : v) {
      auto written = out.entry(key, item);
      if (!written) {
        return written;
      }
    }
    return {};
  }

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const map_type& v) {
    auto out = ser.serialize_map(v.size());
    if (!out) {
      return tl::make_unexpected(out.error());
    }
    auto written = serialize_entries(*out, v);
    if (!written) {
      return written;
    }
    return out->end();
  }

  template <typename De>
  static decode_result<map_type> deserialize(De& de) {
    const bool reject_duplicates = de.options().duplicate_keys == duplicate_key_policy::reject;
    return de.deserialize_map([&](auto& entries) -> decode_result<map_type> {
      map_type out;
      for (;;) {
        auto key = entries.template next_key<K>();
        if (!key) {
          return tl::make_unexpected(key.error());
        }
        if (!key->has_value()) {
          return out;
        }
        auto item = entries.template next_value<V>();
        if (!item) {
          return tl::make_unexpected(item.error());
        }
        if (reject_duplicates && out.find(**key) != out.end()) {
          return tl::make_unexpected(de.error(decode_errc::duplicate_key, "duplicate map key"));
        }
        out.insert_or_assign(std::move(**key), std::move(*item));
      }
    });
  }
};

template <>
struct codec<identifier> {
  template <typename De>
  static decode_result<identifier> deserialize(De& de) {
    return de.deserialize_identifier();
  }
};

template <>
struct codec<value> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const value& v) {
    return encode_value(ser.wire(), v);
  }

  template <typename De>
  static decode_result<value> deserialize(De& de) {
    return de.deserialize_value();
  }
};

template <>
struct codec<content> {
  template <typename De>
  static decode_result<content> deserialize(De& de) {
    return de.deserialize_content();
  }
};

}  // namespace cbors
