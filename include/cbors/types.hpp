#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cbors {

__extension__ using i128 = __int128;
__extension__ using u128 = unsigned __int128;

inline constexpr u128 k_u128_max = ~u128{0};
inline constexpr i128 k_i128_max = static_cast<i128>(k_u128_max >> 1U);
inline constexpr i128 k_i128_min = -k_i128_max - 1;

template <typename T>
struct always_false : std::false_type {};

template <typename T>
inline constexpr bool always_false_v = always_false<T>::value;

// Per-type adapter between a C++ type and the serialize/deserialize contracts.
// Specializations live in codec.hpp (standard types) and are produced by the
// helpers in derive.hpp for user types.
template <typename T, typename Enable = void>
struct codec;

enum class major_type : std::uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  simple = 7,
};

inline constexpr std::uint8_t k_info_one_byte = 24;
inline constexpr std::uint8_t k_info_two_bytes = 25;
inline constexpr std::uint8_t k_info_four_bytes = 26;
inline constexpr std::uint8_t k_info_eight_bytes = 27;
inline constexpr std::uint8_t k_info_indefinite = 31;

inline constexpr std::uint8_t k_simple_false = 20;
inline constexpr std::uint8_t k_simple_true = 21;
inline constexpr std::uint8_t k_simple_null = 22;
inline constexpr std::uint8_t k_simple_undefined = 23;

inline constexpr std::uint8_t k_break_byte = 0xFF;

inline constexpr std::uint64_t k_tag_positive_bignum = 2;
inline constexpr std::uint64_t k_tag_negative_bignum = 3;

constexpr std::uint8_t initial_byte(major_type major, std::uint8_t info) {
  return static_cast<std::uint8_t>((static_cast<std::uint8_t>(major) << 5U) | (info & 0x1FU));
}

namespace detail {

template <typename UInt>
constexpr UInt byteswap_unsigned(UInt value) {
  static_assert(std::is_unsigned_v<UInt>, "byteswap_unsigned expects unsigned type");
  if constexpr (sizeof(UInt) == 1) {
    return value;
  } else if constexpr (sizeof(UInt) == 2) {
    return static_cast<UInt>(((value & static_cast<UInt>(0x00ffU)) << 8U) |
                             ((value & static_cast<UInt>(0xff00U)) >> 8U));
  } else if constexpr (sizeof(UInt) == 4) {
    return static_cast<UInt>(((value & static_cast<UInt>(0x000000ffUL)) << 24U) |
                             ((value & static_cast<UInt>(0x0000ff00UL)) << 8U) |
                             ((value & static_cast<UInt>(0x00ff0000UL)) >> 8U) |
                             ((value & static_cast<UInt>(0xff000000UL)) >> 24U));
  } else if constexpr (sizeof(UInt) == 8) {
    return static_cast<UInt>(
        ((value & static_cast<UInt>(0x00000000000000ffULL)) << 56U) |
        ((value & static_cast<UInt>(0x000000000000ff00ULL)) << 40U) |
        ((value & static_cast<UInt>(0x0000000000ff0000ULL)) << 24U) |
        ((value & static_cast<UInt>(0x00000000ff000000ULL)) << 8U) |
        ((value & static_cast<UInt>(0x000000ff00000000ULL)) >> 8U) |
        ((value & static_cast<UInt>(0x0000ff0000000000ULL)) >> 24U) |
        ((value & static_cast<UInt>(0x00ff000000000000ULL)) >> 40U) |
        ((value & static_cast<UInt>(0xff00000000000000ULL)) >> 56U));
  } else {
    static_assert(always_false_v<UInt>, "Unsupported integer width for byteswap");
  }
}

template <typename UInt>
constexpr UInt host_to_be(UInt value) {
  static_assert(std::is_unsigned_v<UInt>, "host_to_be expects unsigned type");
  if constexpr (std::endian::native == std::endian::big) {
    return value;
  } else {
    return byteswap_unsigned(value);
  }
}

template <typename UInt>
constexpr UInt be_to_host(UInt value) {
  static_assert(std::is_unsigned_v<UInt>, "be_to_host expects unsigned type");
  if constexpr (std::endian::native == std::endian::big) {
    return value;
  } else {
    return byteswap_unsigned(value);
  }
}

}  // namespace detail

template <typename UInt>
UInt load_be(const std::byte* ptr) {
  static_assert(std::is_unsigned_v<UInt>, "load_be expects unsigned type");
  UInt value = 0;
  std::memcpy(&value, ptr, sizeof(UInt));
  return detail::be_to_host(value);
}

template <typename UInt>
void store_be(std::byte* ptr, UInt value) {
  static_assert(std::is_unsigned_v<UInt>, "store_be expects unsigned type");
  const UInt wire = detail::host_to_be(value);
  std::memcpy(ptr, &wire, sizeof(UInt));
}

// Owned copy of a 128-bit magnitude as minimal big-endian bytes (bignum payload).
inline std::vector<std::byte> magnitude_to_be(u128 magnitude) {
  std::vector<std::byte> out;
  while (magnitude != 0) {
    out.push_back(static_cast<std::byte>(static_cast<std::uint8_t>(magnitude & 0xFFU)));
    magnitude >>= 8U;
  }
  if (out.empty()) {
    out.push_back(std::byte{0});
  }
  std::reverse(out.begin(), out.end());
  return out;
}

// A string or byte view that is either borrowed from the decoder input or
// owned by this object. Which one is observable through is_borrowed().
template <typename View, typename Owned>
class cow {
 public:
  using view_type = View;
  using owned_type = Owned;

  cow() : storage_(std::in_place_index<1>) {}

  static cow borrowed(View view) {
    cow out;
    out.storage_.template emplace<0>(view);
    return out;
  }

  static cow owned(Owned data) {
    cow out;
    out.storage_.template emplace<1>(std::move(data));
    return out;
  }

  [[nodiscard]] bool is_borrowed() const { return storage_.index() == 0; }

  [[nodiscard]] View view() const {
    if (const View* v = std::get_if<0>(&storage_)) {
      return *v;
    }
    const Owned& data = std::get<1>(storage_);
    return View(data.data(), data.size());
  }

  [[nodiscard]] std::size_t size() const { return view().size(); }

  [[nodiscard]] bool empty() const { return size() == 0; }

  Owned into_owned() && {
    if (Owned* data = std::get_if<1>(&storage_)) {
      return std::move(*data);
    }
    const View v = std::get<0>(storage_);
    return Owned(v.begin(), v.end());
  }

  [[nodiscard]] Owned to_owned() const {
    const View v = view();
    return Owned(v.begin(), v.end());
  }

  bool operator==(const cow& rhs) const {
    const View a = view();
    const View b = rhs.view();
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
  }

 private:
  std::variant<View, Owned> storage_;
};

using cow_text = cow<std::string_view, std::string>;
using cow_bytes = cow<std::span<const std::byte>, std::vector<std::byte>>;

// Heap-allocated single value with deep copy; lets recursive trees hold a
// child of their own (still incomplete) type.
template <typename T>
class box {
 public:
  box() : ptr_(std::make_unique<T>()) {}
  box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  box(const box& other) : ptr_(std::make_unique<T>(*other)) {}
  box(box&& other) noexcept = default;

  box& operator=(const box& other) {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other);
    }
    return *this;
  }

  box& operator=(box&& other) noexcept = default;

  ~box() = default;

  T& operator*() { return *ptr_; }
  const T& operator*() const { return *ptr_; }
  T* operator->() { return ptr_.get(); }
  const T* operator->() const { return ptr_.get(); }

  bool operator==(const box& rhs) const { return *ptr_ == *rhs.ptr_; }

 private:
  std::unique_ptr<T> ptr_;
};

}  // namespace cbors
