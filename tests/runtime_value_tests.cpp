#include "tests/test_schema.h"

#include <cbors.hpp>

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>
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

cbors::value decode(const std::vector<std::byte>& input, cbors::decode_options options = {}) {
  auto out = cbors::from_slice<cbors::value>(input, options);
  assert(out.has_value());
  return std::move(*out);
}

std::vector<std::byte> encode(const cbors::value& v) {
  auto out = cbors::to_vec(v);
  assert(out.has_value());
  return std::move(*out);
}

}  // namespace

int main() {
  {
    // {"a": 1, "b": [2, 3]}
    const auto input = bytes_of({0xA2, 0x61, 'a', 0x01, 0x61, 'b', 0x82, 0x02, 0x03});
    const cbors::value v = decode(input);
    assert(v.kind() == cbors::value_kind::map);
    assert(v.as_map()->size() == 2);
    const cbors::value* a = v.find("a");
    assert(a != nullptr && a->as_integer() == cbors::i128{1});
    const cbors::value* b = v.find("b");
    assert(b != nullptr && b->as_array() != nullptr && b->as_array()->size() == 2);
    assert(v.find("c") == nullptr);
    assert(encode(v) == input);
  }

  {
    // Indefinite items come back out definite.
    const cbors::value v = decode(bytes_of({0xBF, 0x61, 'a', 0x9F, 0x01, 0xFF, 0xFF}));
    assert(encode(v) == bytes_of({0xA1, 0x61, 'a', 0x81, 0x01}));

    const cbors::value chunks = decode(bytes_of({0x5F, 0x41, 0x01, 0x42, 0x02, 0x03, 0xFF}));
    assert(encode(chunks) == bytes_of({0x43, 0x01, 0x02, 0x03}));
  }

  {
    const cbors::value v = cbors::value::array({
        cbors::value::integer(-1),
        cbors::value::text("x"),
        cbors::value::bytes(bytes_of({0xAA})),
        cbors::value::boolean(true),
        cbors::value::null(),
        cbors::value::undefined(),
        cbors::value::floating(1.5),
        cbors::value::tag(1, cbors::value::integer(1363896240)),
    });
    const auto bytes = encode(v);
    assert(bytes == bytes_of({0x88, 0x20, 0x61, 'x', 0x41, 0xAA, 0xF5, 0xF6, 0xF7, 0xFB, 0x3F, 0xF8, 0x00, 0x00,
                              0x00, 0x00, 0x00, 0x00, 0xC1, 0x1A, 0x51, 0x4B, 0x67, 0xB0}));
    assert(decode(bytes) == v);
  }

  {
    // Half and single floats widen to double.
    const cbors::value half = decode(bytes_of({0xF9, 0x3E, 0x00}));
    assert(half.as_float() == 1.5);
    const cbors::value single = decode(bytes_of({0xFA, 0x7F, 0x80, 0x00, 0x00}));
    assert(single.as_float() == std::numeric_limits<double>::infinity());

    // NaN equals itself.
    const cbors::value nan = decode(bytes_of({0xF9, 0x7E, 0x00}));
    assert(std::isnan(*nan.as_float()));
    assert(nan == nan);
  }

  {
    // Bignums within the integer range decode as integers.
    const cbors::value big = decode(bytes_of({0xC2, 0x49, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    assert(big.kind() == cbors::value_kind::integer);
    assert(big.as_integer() == (cbors::i128{1} << 64U));

    const auto typed = cbors::from_value<cbors::u128>(big);
    assert(typed.has_value() && *typed == (cbors::u128{1} << 64U));

    for (const cbors::i128 n : {cbors::k_i128_min, cbors::i128{1} << 100U, cbors::k_i128_max, -(cbors::i128{1} << 64U)}) {
      const cbors::value wide = cbors::value::integer(n);
      const auto wide_bytes = encode(wide);
      assert(wide_bytes[0] == (n < 0 ? std::byte{0xC3} : std::byte{0xC2}));
      assert(decode(wide_bytes) == wide);
      const auto wide_back = cbors::from_slice<cbors::i128>(wide_bytes);
      assert(wide_back.has_value() && *wide_back == n);
    }

    // Magnitudes past the integer range stay tags.
    const cbors::value huge = decode(bytes_of({0xC2, 0x50, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                                               0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
    assert(huge.kind() == cbors::value_kind::tag);
    const auto* tagged = huge.get_if<cbors::tagged_value>();
    assert(tagged != nullptr && tagged->tag == 2);
    assert(tagged->inner->is<std::vector<std::byte>>());
    const auto huge_typed = cbors::from_value<cbors::u128>(huge);
    assert(huge_typed.has_value() && *huge_typed == cbors::k_u128_max);

    // Other tags over byte strings are left alone.
    const cbors::value other = decode(bytes_of({0xD8, 0x40, 0x41, 0x07}));
    assert(other.kind() == cbors::value_kind::tag);
  }

  {
    const auto dup = bytes_of({0xA2, 0x01, 0x02, 0x01, 0x03});
    const cbors::value kept = decode(dup);
    assert(kept.as_map()->size() == 2);

    cbors::decode_options reject;
    reject.duplicate_keys = cbors::duplicate_key_policy::reject;
    const auto rejected = cbors::from_slice<cbors::value>(dup, reject);
    assert(!rejected.has_value());
    assert(rejected.error().code == cbors::decode_errc::duplicate_key);
  }

  {
    Point p{3, -4};
    const auto as_value = cbors::to_value(p);
    assert(as_value.has_value());
    assert(as_value->find("x") != nullptr && as_value->find("x")->as_integer() == cbors::i128{3});
    assert(as_value->find("y")->as_integer() == cbors::i128{-4});

    const auto back = cbors::from_value<Point>(*as_value);
    assert(back.has_value() && *back == p);

    const auto wrong = cbors::from_value<Point>(cbors::value::text("p"));
    assert(!wrong.has_value());
    assert(wrong.error().code == cbors::decode_errc::type_mismatch);
  }

  {
    Enum e{std::make_tuple(std::string("v"), true)};
    const auto as_value = cbors::to_value(e);
    assert(as_value.has_value());
    const cbors::value* payload = as_value->find("Tuple");
    assert(payload != nullptr && payload->as_array() != nullptr);
    assert((*payload->as_array())[1].as_bool() == true);
    const auto back = cbors::from_value<Enum>(*as_value);
    assert(back.has_value() && *back == e);
  }

  {
    // A value nested in a typed structure is carried through verbatim.
    std::map<std::string, cbors::value> doc;
    doc.emplace("raw", cbors::value::array({cbors::value::null(), cbors::value::text("t")}));
    const auto bytes = cbors::to_vec(doc);
    assert(bytes.has_value());
    const auto back = cbors::from_slice<std::map<std::string, cbors::value>>(*bytes);
    assert(back.has_value() && *back == doc);
  }

  {
    cbors::value v;
    assert(v.is_null());
    assert(!v.as_integer().has_value());
    assert(!v.as_text().has_value());
    v = cbors::value::text("now text");
    assert(v.as_text() == std::string_view("now text"));
  }

  return 0;
}
