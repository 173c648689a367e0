#include "tests/test_schema.h"

#include <cbors.hpp>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

std::vector<std::byte> bytes_of(std::initializer_list<std::uint8_t> values) {
  std::vector<std::byte> out;
  out.reserve(values.size());
  for (const std::uint8_t v : values) {
    out.push_back(static_cast<std::byte>(v));
  }
  return out;
}

std::size_t largest_allocation = 0;

template <typename T>
struct tracking_allocator {
  using value_type = T;

  tracking_allocator() = default;
  template <typename U>
  tracking_allocator(const tracking_allocator<U>&) noexcept {}

  T* allocate(std::size_t n) {
    largest_allocation = std::max(largest_allocation, n * sizeof(T));
    return std::allocator<T>{}.allocate(n);
  }

  void deallocate(T* p, std::size_t n) noexcept { std::allocator<T>{}.deallocate(p, n); }

  friend bool operator==(const tracking_allocator&, const tracking_allocator&) { return true; }
};

template <typename T>
std::vector<std::byte> encode(const T& value, cbors::encode_options options = {}) {
  auto bytes = cbors::to_vec(value, options);
  assert(bytes.has_value());
  return std::move(*bytes);
}

template <typename T>
void assert_roundtrip(const T& value) {
  const auto bytes = encode(value);
  const auto decoded = cbors::from_slice<T>(bytes);
  assert(decoded.has_value());
  assert(*decoded == value);
}

Enum unit_variant() { return Enum{UnitVariant{}}; }

Enum newtype_variant(std::int32_t v) { return Enum{v}; }

Enum tuple_variant(std::string s, bool b) { return Enum{std::make_tuple(std::move(s), b)}; }

Enum struct_variant(std::int32_t x, std::int32_t y) { return Enum{Point{x, y}}; }

}  // namespace

int main() {
  {
    const std::vector<std::optional<std::uint32_t>> value{0x99U, std::nullopt, 0x33U};
    assert(encode(value) == bytes_of({0x83, 0x18, 0x99, 0xF6, 0x18, 0x33}));
    assert_roundtrip(value);
  }

  {
    assert(encode(unit_variant()) == bytes_of({0x64, 'U', 'n', 'i', 't'}));
    assert(encode(newtype_variant(0x999)) ==
           bytes_of({0xA1, 0x67, 'N', 'e', 'w', 'T', 'y', 'p', 'e', 0x19, 0x09, 0x99}));
    assert(encode(tuple_variant("123", false)) ==
           bytes_of({0xA1, 0x65, 'T', 'u', 'p', 'l', 'e', 0x82, 0x63, '1', '2', '3', 0xF4}));
    assert(encode(struct_variant(0x99, -0x99)) ==
           bytes_of({0xA1, 0x66, 'S', 't', 'r', 'u', 'c', 't', 0xA2, 0x61, 'x', 0x18, 0x99, 0x61, 'y', 0x38, 0x98}));

    assert_roundtrip(unit_variant());
    assert_roundtrip(newtype_variant(0x999));
    assert_roundtrip(tuple_variant("123", false));
    assert_roundtrip(struct_variant(0x99, -0x99));
  }

  {
    cbors::encode_options by_index;
    by_index.variant_ids = cbors::variant_id_policy::index;
    const auto unit = encode(unit_variant(), by_index);
    assert(unit == bytes_of({0x00}));
    const auto newtype = encode(newtype_variant(5), by_index);
    assert(newtype == bytes_of({0xA1, 0x01, 0x05}));

    const auto unit_back = cbors::from_slice<Enum>(unit);
    assert(unit_back.has_value() && *unit_back == unit_variant());
    const auto newtype_back = cbors::from_slice<Enum>(newtype);
    assert(newtype_back.has_value() && *newtype_back == newtype_variant(5));
  }

  {
    const auto unknown = cbors::from_slice<Enum>(bytes_of({0x63, 'F', 'o', 'o'}));
    assert(!unknown.has_value());
    assert(unknown.error().code == cbors::decode_errc::invalid_value);

    const auto two_entries = cbors::from_slice<Enum>(bytes_of({0xA2, 0x00, 0x80, 0x01, 0x05}));
    assert(!two_entries.has_value());
    assert(two_entries.error().code == cbors::decode_errc::invalid_length);

    const auto missing_payload = cbors::from_slice<Enum>(bytes_of({0x65, 'T', 'u', 'p', 'l', 'e'}));
    assert(!missing_payload.has_value());
    assert(missing_payload.error().code == cbors::decode_errc::type_mismatch);

    // {"Unit": null} is accepted for a unit variant.
    const auto unit_in_map = cbors::from_slice<Enum>(bytes_of({0xA1, 0x64, 'U', 'n', 'i', 't', 0xF6}));
    assert(unit_in_map.has_value() && *unit_in_map == unit_variant());
  }

  {
    Test test;
    test.name = U'G';
    test.test.entries.emplace(TestObj{"obj"}, BoxSet{});
    test.test.entries.emplace(TestObj{"obj2"}, BoxSet{{TestObj{"obj3"}, TestObj{"obj4"}, TestObj{""}}});
    const std::string b = "bbbbbbbbbbb";
    test.bytes.assign(b.begin(), b.end());
    test.map.emplace("key0", unit_variant());
    test.map.emplace("key1", tuple_variant("value", true));
    test.map.emplace("key2", struct_variant(-1, 0x123));
    test.map.emplace("key3", newtype_variant(-999));
    test.untag = std::make_tuple(UntaggedEnum{std::string("a")}, UntaggedEnum{0});
    test.new_type = NewType<UntaggedEnum>{UntaggedEnum{std::string("???")}};
    test.some = std::monostate{};
    test.str_ref = "hello world";

    const auto bytes = encode(test);
    // Definite map of nine fields; "bytes" is a byte string, not an array.
    assert(bytes[0] == std::byte{0xA9});

    const auto decoded = cbors::from_slice<Test>(bytes);
    assert(decoded.has_value());
    assert(*decoded == test);
    // str_ref borrows from the input buffer.
    assert(decoded->str_ref.data() >= reinterpret_cast<const char*>(bytes.data()));
    assert(decoded->str_ref.data() < reinterpret_cast<const char*>(bytes.data() + bytes.size()));
  }

  {
    const std::optional<std::uint32_t> some = 10U;
    assert(encode(some) == bytes_of({0x0A}));
    assert_roundtrip(some);

    const std::optional<std::monostate> unit_some = std::monostate{};
    assert(encode(unit_some) == bytes_of({0x80}));
    assert_roundtrip(unit_some);
    assert_roundtrip(std::optional<std::monostate>{});
  }

  {
    const std::optional<std::vector<std::pair<cbors::u128, cbors::i128>>> value =
        std::vector<std::pair<cbors::u128, cbors::i128>>{{10, 99999}};
    assert(encode(value) == bytes_of({0x81, 0x82, 0x0A, 0x1A, 0x00, 0x01, 0x86, 0x9F}));
    assert_roundtrip(value);
  }

  {
    const auto u_max = encode(cbors::k_u128_max);
    assert(u_max.size() == 18);
    assert(u_max[0] == std::byte{0xC2});
    assert(u_max[1] == std::byte{0x50});
    assert_roundtrip(cbors::k_u128_max);

    const auto i_min = encode(cbors::k_i128_min);
    assert(i_min.size() == 18);
    assert(i_min[0] == std::byte{0xC3});
    assert(i_min[2] == std::byte{0x7F});
    assert_roundtrip(cbors::k_i128_min);

    // Still native when the magnitude fits the 64-bit argument.
    const cbors::i128 low = -static_cast<cbors::i128>(0xFFFFFFFFFFFFFFFFULL) - 1;
    assert(encode(low) == bytes_of({0x3B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
    assert_roundtrip(low);

    cbors::encode_options strict;
    strict.bignums = cbors::bignum_policy::reject;
    const auto rejected = cbors::to_vec(cbors::k_u128_max, strict);
    assert(!rejected.has_value());
    assert(rejected.error().code == cbors::encode_errc::unrepresentable_value);

    const auto narrowed = cbors::from_slice<std::uint64_t>(u_max);
    assert(!narrowed.has_value());
    assert(narrowed.error().code == cbors::decode_errc::invalid_value);

    const auto from_bignum = cbors::from_slice<std::uint16_t>(bytes_of({0xC2, 0x42, 0x01, 0x00}));
    assert(from_bignum.has_value() && *from_bignum == 256U);
  }

  {
    assert(!cbors::from_slice<std::int8_t>(bytes_of({0x18, 0x80})).has_value());
    assert(!cbors::from_slice<std::uint32_t>(bytes_of({0x20})).has_value());
    const auto min8 = cbors::from_slice<std::int8_t>(bytes_of({0x38, 0x7F}));
    assert(min8.has_value() && *min8 == -128);
    assert(!cbors::from_slice<std::int8_t>(bytes_of({0x38, 0x80})).has_value());
  }

  {
    const auto ch = encode(U'é');
    assert(ch == bytes_of({0x62, 0xC3, 0xA9}));
    const auto decoded = cbors::from_slice<char32_t>(ch);
    assert(decoded.has_value() && *decoded == U'é');

    const auto two_chars = cbors::from_slice<char32_t>(bytes_of({0x62, 'a', 'b'}));
    assert(!two_chars.has_value());
    assert(two_chars.error().code == cbors::decode_errc::invalid_value);

    assert(!cbors::to_vec(static_cast<char32_t>(0xD800)).has_value());
  }

  {
    const std::vector<std::int32_t> empty;
    assert(encode(empty) == bytes_of({0x80}));
    const std::tuple<std::string, bool, double> t{"x", true, 1.5};
    assert(encode(t) == bytes_of({0x83, 0x61, 'x', 0xF5, 0xFB, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    assert_roundtrip(t);
    const std::array<std::uint8_t, 3> a{1, 2, 3};
    assert(encode(a) == bytes_of({0x83, 0x01, 0x02, 0x03}));
    assert_roundtrip(a);

    const auto short_array = cbors::from_slice<std::array<std::uint8_t, 3>>(bytes_of({0x82, 0x01, 0x02}));
    assert(!short_array.has_value());
    assert(short_array.error().code == cbors::decode_errc::invalid_length);
    const auto long_array = cbors::from_slice<std::array<std::uint8_t, 3>>(bytes_of({0x84, 0x01, 0x02, 0x03, 0x04}));
    assert(!long_array.has_value());
    assert(long_array.error().code == cbors::decode_errc::invalid_length);
  }

  {
    // Definite and indefinite encodings decode to the same typed value.
    const auto definite = cbors::from_slice<std::vector<std::string>>(bytes_of({0x82, 0x61, 'a', 0x61, 'b'}));
    const auto indefinite =
        cbors::from_slice<std::vector<std::string>>(bytes_of({0x9F, 0x61, 'a', 0x7F, 0x61, 'b', 0xFF, 0xFF}));
    assert(definite.has_value() && indefinite.has_value());
    assert(*definite == *indefinite);

    const auto map_definite = cbors::from_slice<std::map<std::string, int>>(bytes_of({0xA1, 0x61, 'k', 0x01}));
    const auto map_indefinite =
        cbors::from_slice<std::map<std::string, int>>(bytes_of({0xBF, 0x61, 'k', 0x01, 0xFF}));
    assert(map_definite.has_value() && map_indefinite.has_value());
    assert(*map_definite == *map_indefinite);
  }

  {
    // A declared length reserves at most max_prealloc bytes up front.
    using Page = std::array<std::uint64_t, 512>;
    using Pages = std::vector<Page, tracking_allocator<Page>>;
    const auto huge = bytes_of({0x9B, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    const cbors::decode_options options{};
    largest_allocation = 0;
    const auto pages = cbors::from_slice<Pages>(huge, options);
    assert(!pages.has_value());
    assert(pages.error().code == cbors::decode_errc::end_of_input);
    assert(pages.error().position == huge.size());
    assert(largest_allocation <= options.max_prealloc);

    cbors::decode_options tight;
    tight.max_prealloc = sizeof(Page) / 2;
    largest_allocation = 0;
    const auto none_reserved = cbors::from_slice<Pages>(huge, tight);
    assert(!none_reserved.has_value());
    assert(largest_allocation == 0);

    const auto small = cbors::from_slice<std::vector<std::uint16_t, tracking_allocator<std::uint16_t>>>(
        bytes_of({0x83, 0x01, 0x02, 0x19, 0x01, 0x00}));
    assert(small.has_value() && small->size() == 3 && (*small)[2] == 256);
  }

  {
    const auto dup = bytes_of({0xA2, 0x61, 'k', 0x01, 0x61, 'k', 0x02});
    const auto last_wins = cbors::from_slice<std::map<std::string, int>>(dup);
    assert(last_wins.has_value());
    assert(last_wins->at("k") == 2);

    cbors::decode_options reject;
    reject.duplicate_keys = cbors::duplicate_key_policy::reject;
    const auto rejected = cbors::from_slice<std::map<std::string, int>>(dup, reject);
    assert(!rejected.has_value());
    assert(rejected.error().code == cbors::decode_errc::duplicate_key);
  }

  {
    const auto trailing = cbors::from_slice<std::uint8_t>(bytes_of({0x01, 0x02}));
    assert(!trailing.has_value());
    assert(trailing.error().code == cbors::decode_errc::trailing_data);
    assert(trailing.error().position == 1);

    cbors::decode_options lenient;
    lenient.allow_trailing = true;
    const auto first = cbors::from_slice<std::uint8_t>(bytes_of({0x01, 0x02}), lenient);
    assert(first.has_value() && *first == 1);
  }

  {
    // unit accepts an empty array (either form) and null.
    assert(cbors::from_slice<std::monostate>(bytes_of({0x80})).has_value());
    assert(cbors::from_slice<std::monostate>(bytes_of({0x9F, 0xFF})).has_value());
    assert(cbors::from_slice<std::monostate>(bytes_of({0xF6})).has_value());
    const auto not_unit = cbors::from_slice<std::monostate>(bytes_of({0x81, 0x01}));
    assert(!not_unit.has_value());
    assert(not_unit.error().code == cbors::decode_errc::invalid_length);
  }

  {
    cbors::decode_options shallow;
    shallow.max_depth = 2;
    const auto nested = bytes_of({0x81, 0x81, 0x81, 0x01});
    const auto too_deep = cbors::from_slice<std::vector<std::vector<std::vector<int>>>>(nested, shallow);
    assert(!too_deep.has_value());
    assert(too_deep.error().code == cbors::decode_errc::depth_limit_exceeded);
    assert(cbors::from_slice<std::vector<std::vector<std::vector<int>>>>(nested).has_value());
  }

  {
    std::unique_ptr<std::int32_t> empty;
    assert(encode(empty) == bytes_of({0xF6}));
    const auto some = std::make_unique<std::int32_t>(7);
    assert(encode(some) == bytes_of({0x07}));
    const auto back = cbors::from_slice<std::unique_ptr<std::int32_t>>(bytes_of({0x07}));
    assert(back.has_value() && *back != nullptr && **back == 7);
    const auto null_back = cbors::from_slice<std::unique_ptr<std::int32_t>>(bytes_of({0xF6}));
    assert(null_back.has_value() && *null_back == nullptr);
  }

  return 0;
}
