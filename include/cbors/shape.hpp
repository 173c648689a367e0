#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

#include "cbors/types.hpp"

namespace cbors {

// Shape a codec presents to the bridge. Only the enum adapters look at it:
// unit alternatives are written as a bare identifier.
enum class shape : std::uint8_t {
  unit,
  scalar,
  newtype,
  tuple,
  structure,
  sequence,
  map,
  enumeration,
};

template <typename T, typename = void>
struct codec_shape : std::integral_constant<shape, shape::scalar> {};

template <typename T>
struct codec_shape<T, std::void_t<decltype(codec<T>::kind)>> : std::integral_constant<shape, codec<T>::kind> {};

template <typename T>
inline constexpr shape codec_shape_v = codec_shape<T>::value;

// Any CBOR integer, including bignums up to 128 bits of magnitude.
// The value is `magnitude` or `-1 - magnitude`.
struct wide_int {
  bool negative = false;
  u128 magnitude = 0;

  bool operator==(const wide_int&) const = default;
};

template <typename T>
struct integer_limits {
  static constexpr T min() { return std::numeric_limits<T>::min(); }
  static constexpr T max() { return std::numeric_limits<T>::max(); }
};

template <>
struct integer_limits<i128> {
  static constexpr i128 min() { return k_i128_min; }
  static constexpr i128 max() { return k_i128_max; }
};

template <>
struct integer_limits<u128> {
  static constexpr u128 min() { return 0; }
  static constexpr u128 max() { return k_u128_max; }
};

template <typename T>
inline constexpr bool is_signed_integer_v = integer_limits<T>::min() < T{0};

template <typename T>
std::optional<T> narrow_integer(const wide_int& w) {
  if (!w.negative) {
    if (w.magnitude > static_cast<u128>(integer_limits<T>::max())) {
      return std::nullopt;
    }
    return static_cast<T>(w.magnitude);
  }
  if constexpr (!is_signed_integer_v<T>) {
    return std::nullopt;
  } else {
    if (w.magnitude > static_cast<u128>(integer_limits<T>::max())) {
      return std::nullopt;
    }
    return static_cast<T>(T{-1} - static_cast<T>(w.magnitude));
  }
}

// Magnitude of a bignum payload; nullopt if it does not fit 128 bits.
inline std::optional<u128> magnitude_from_be(std::span<const std::byte> bytes) {
  std::size_t start = 0;
  while (start < bytes.size() && bytes[start] == std::byte{0}) {
    ++start;
  }
  if (bytes.size() - start > sizeof(u128)) {
    return std::nullopt;
  }
  u128 out = 0;
  for (std::size_t i = start; i < bytes.size(); ++i) {
    out = (out << 8U) | std::to_integer<std::uint8_t>(bytes[i]);
  }
  return out;
}

// Enum variant or struct field key: an index or a name.
struct identifier {
  std::optional<std::uint64_t> index;
  cow_text name;

  [[nodiscard]] bool matches(std::size_t i, std::string_view n) const {
    if (index.has_value()) {
      return *index == i;
    }
    return name.view() == n;
  }
};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

}  // namespace cbors
