#include "tests/test_schema.h"

#include <cbors.hpp>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct Measurement {
  std::variant<std::uint8_t, double, std::vector<std::int32_t>, Point> value;

  bool operator==(const Measurement&) const = default;
};

namespace cbors {

template <>
struct codec<Measurement> : untagged_codec<Measurement, &Measurement::value> {};

}  // namespace cbors

namespace {

std::vector<std::byte> bytes_of(std::initializer_list<std::uint8_t> values) {
  std::vector<std::byte> out;
  out.reserve(values.size());
  for (const std::uint8_t v : values) {
    out.push_back(static_cast<std::byte>(v));
  }
  return out;
}

// Reads one byte per fill, so nothing decoded from it can be borrowed.
class slow_reader {
 public:
  explicit slow_reader(std::span<const std::byte> input) : input_(input) {}

  tl::expected<cbors::reference, cbors::io_error> fill(std::size_t /*want*/) {
    if (input_.empty()) {
      return cbors::reference{};
    }
    return cbors::reference{input_.first(1), cbors::reference_kind::input_scoped};
  }

  void advance(std::size_t n) { input_ = input_.subspan(n); }

 private:
  std::span<const std::byte> input_;
};

}  // namespace

int main() {
  {
    const UntaggedEnum bar{std::int32_t{5}};
    const UntaggedEnum foo{std::string("five")};
    const auto bar_bytes = cbors::to_vec(bar);
    const auto foo_bytes = cbors::to_vec(foo);
    assert(bar_bytes.has_value() && *bar_bytes == bytes_of({0x05}));
    assert(foo_bytes.has_value() && *foo_bytes == bytes_of({0x64, 'f', 'i', 'v', 'e'}));

    const auto bar_back = cbors::from_slice<UntaggedEnum>(*bar_bytes);
    assert(bar_back.has_value() && bar_back->value.index() == 0);
    const auto foo_back = cbors::from_slice<UntaggedEnum>(*foo_bytes);
    assert(foo_back.has_value() && foo_back->value.index() == 1);
    assert(std::get<std::string>(foo_back->value) == "five");
  }

  {
    const auto none = cbors::from_slice<UntaggedEnum>(bytes_of({0xF5}));
    assert(!none.has_value());
    assert(none.error().code == cbors::decode_errc::no_matching_variant);
    assert(none.error().position == 0);

    // Position of the untagged item itself, not of the replay.
    const auto nested = cbors::from_slice<std::vector<UntaggedEnum>>(bytes_of({0x82, 0x01, 0x80}));
    assert(!nested.has_value());
    assert(nested.error().code == cbors::decode_errc::no_matching_variant);
    assert(nested.error().position == 2);

    // An int32 out of range falls through to the next alternative, which fails too.
    const auto too_big = cbors::from_slice<UntaggedEnum>(bytes_of({0x1B, 0, 0, 0, 1, 0, 0, 0, 0}));
    assert(!too_big.has_value());
    assert(too_big.error().code == cbors::decode_errc::no_matching_variant);

    // Malformed input is reported as such before any alternative is tried.
    const auto malformed = cbors::from_slice<UntaggedEnum>(bytes_of({0x1C}));
    assert(!malformed.has_value());
    assert(malformed.error().code == cbors::decode_errc::reserved_indicator);
  }

  {
    // First alternative that accepts the item wins, in declared order.
    const auto small = cbors::from_slice<Measurement>(bytes_of({0x18, 0x64}));
    assert(small.has_value() && small->value.index() == 0);
    const auto big = cbors::from_slice<Measurement>(bytes_of({0x19, 0x01, 0x00}));
    assert(!big.has_value());
    const auto real = cbors::from_slice<Measurement>(bytes_of({0xF9, 0x3E, 0x00}));
    assert(real.has_value() && real->value.index() == 1 && std::get<double>(real->value) == 1.5);
    const auto list = cbors::from_slice<Measurement>(bytes_of({0x82, 0x01, 0x20}));
    assert(list.has_value() && list->value.index() == 2);
    assert(std::get<std::vector<std::int32_t>>(list->value) == (std::vector<std::int32_t>{1, -1}));
    const auto point = cbors::from_slice<Measurement>(bytes_of({0xA2, 0x61, 'x', 0x01, 0x61, 'y', 0x02}));
    assert(point.has_value() && point->value.index() == 3);
    assert(std::get<Point>(point->value) == (Point{1, 2}));

    const Measurement m{Point{-5, 6}};
    const auto bytes = cbors::to_vec(m);
    assert(bytes.has_value());
    const auto back = cbors::from_slice<Measurement>(*bytes);
    assert(back.has_value() && *back == m);
  }

  {
    const auto input = bytes_of({0x65, 'h', 'e', 'l', 'l', 'o'});

    const auto borrowed = cbors::from_slice<CowStr>(input);
    assert(borrowed.has_value());
    assert(borrowed->value.index() == 0);
    assert(borrowed->as_ref() == "hello");
    assert(borrowed->as_ref().data() == reinterpret_cast<const char*>(input.data() + 1));

    slow_reader reader(input);
    const auto owned = cbors::from_source<CowStr>(reader);
    assert(owned.has_value());
    assert(owned->value.index() == 1);
    assert(owned->as_ref() == "hello");

    slow_reader cow_reader(input);
    const auto cow = cbors::from_source<cbors::cow_text>(cow_reader);
    assert(cow.has_value());
    assert(!cow->is_borrowed());
    assert(cow->view() == "hello");

    const auto cow_borrowed = cbors::from_slice<cbors::cow_text>(input);
    assert(cow_borrowed.has_value() && cow_borrowed->is_borrowed());
  }

  {
    // Byte strings keep borrowing through the buffered path as well.
    const auto input = bytes_of({0x43, 0x01, 0x02, 0x03});
    cbors::slice_source source(input);
    cbors::deserializer<cbors::slice_source> de(source);
    auto buffered = de.deserialize_content();
    assert(buffered.has_value());
    cbors::content_deserializer replay(*buffered, de.options(), 0);
    const auto view = replay.deserialize<std::span<const std::byte>>();
    assert(view.has_value());
    assert(view->size() == 3);
    assert(view->data() == input.data() + 1);
  }

  return 0;
}
