#include <cbors.hpp>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Hands out one byte per fill through a scratch byte, so every view is call-scoped.
class one_byte_source {
 public:
  explicit one_byte_source(std::span<const std::byte> input) : input_(input) {}

  tl::expected<cbors::reference, cbors::io_error> fill(std::size_t /*want*/) {
    if (input_.empty()) {
      return cbors::reference{};
    }
    scratch_ = input_[0];
    return cbors::reference{std::span<const std::byte>(&scratch_, 1), cbors::reference_kind::call_scoped};
  }

  void advance(std::size_t n) { input_ = input_.subspan(n); }

 private:
  std::span<const std::byte> input_;
  std::byte scratch_{};
};

class failing_source {
 public:
  tl::expected<cbors::reference, cbors::io_error> fill(std::size_t /*want*/) {
    return tl::make_unexpected(cbors::io_error::read_failed);
  }

  void advance(std::size_t /*n*/) {}
};

class failing_sink {
 public:
  tl::expected<void, cbors::io_error> write(std::span<const std::byte> /*data*/) {
    return tl::make_unexpected(cbors::io_error::write_failed);
  }
};

static_assert(cbors::byte_source<one_byte_source>);
static_assert(cbors::byte_source<cbors::slice_source>);
static_assert(cbors::byte_source<cbors::stream_source<>>);
static_assert(cbors::byte_source<cbors::segmented_source<>>);
static_assert(cbors::byte_sink<cbors::vector_sink>);
static_assert(cbors::byte_sink<cbors::segmented_sink<>>);
static_assert(cbors::byte_sink<cbors::stream_sink>);
static_assert(cbors::byte_sink<cbors::bounded_sink>);

std::map<std::string, std::vector<std::string>> sample() {
  return {
      {"alpha", {"one", "two", std::string(40, 'x')}},
      {"beta", {}},
      {"gamma", {std::string(100, 'y')}},
  };
}

}  // namespace

int main() {
  const auto expected = sample();
  const auto encoded = cbors::to_vec(expected);
  assert(encoded.has_value());

  {
    one_byte_source source(*encoded);
    const auto decoded = cbors::from_source<std::map<std::string, std::vector<std::string>>>(source);
    assert(decoded.has_value());
    assert(*decoded == expected);
  }

  {
    const std::vector<std::byte> text{std::byte{0x62}, std::byte{'h'}, std::byte{'i'}};
    one_byte_source source(text);
    const auto borrowed = cbors::from_source<std::string_view>(source);
    assert(!borrowed.has_value());
    assert(borrowed.error().code == cbors::decode_errc::type_mismatch);

    assert(cbors::from_slice<std::string_view>(text).has_value());

    one_byte_source text_source(text);
    const auto cow = cbors::from_source<cbors::cow_text>(text_source);
    assert(cow.has_value());
    assert(!cow->is_borrowed());
    assert(cow->view() == "hi");
  }

  {
    std::stringstream stream;
    cbors::stream_sink sink(stream);
    assert(cbors::to_sink(sink, expected).has_value());
    const std::string written = stream.str();
    assert(written.size() == encoded->size());

    stream.seekg(0);
    cbors::stream_source<16> source(stream);
    const auto decoded = cbors::from_source<std::map<std::string, std::vector<std::string>>>(source);
    assert(decoded.has_value());
    assert(*decoded == expected);
  }

  {
    cbors::segmented_sink<8> sink;
    assert(cbors::to_sink(sink, expected).has_value());
    assert(sink.size() == encoded->size());
    assert(sink.bytes() == *encoded);

    // Strings that straddle a page boundary are copied; the rest borrow.
    cbors::segmented_source<8> source(sink.storage());
    const auto decoded = cbors::from_source<std::map<std::string, std::vector<std::string>>>(source);
    assert(decoded.has_value());
    assert(*decoded == expected);

    cbors::segmented_sink<8> small;
    const std::string fits = "abc";
    assert(cbors::to_sink(small, fits).has_value());
    cbors::segmented_source<8> small_source(small.storage());
    const auto view = cbors::from_source<cbors::cow_text>(small_source);
    assert(view.has_value());
    assert(view->is_borrowed());
    assert(view->view() == "abc");

    cbors::segmented_sink<4> straddle;
    const std::string across = "abcdef";
    assert(cbors::to_sink(straddle, across).has_value());
    cbors::segmented_source<4> straddle_source(straddle.storage());
    const auto copied = cbors::from_source<cbors::cow_text>(straddle_source);
    assert(copied.has_value());
    assert(!copied->is_borrowed());
    assert(copied->view() == "abcdef");

    sink.clear();
    assert(sink.size() == 0);
  }

  {
    cbors::slice_source source(*encoded);
    cbors::decoder<cbors::slice_source> dec(source);
    assert(dec.skip_item().has_value());
    assert(source.remaining().empty());
  }

  {
    failing_source source;
    const auto out = cbors::from_source<std::uint32_t>(source);
    assert(!out.has_value());
    assert(out.error().code == cbors::decode_errc::source_error);
    assert(out.error().context == "read_failed");

    failing_sink sink;
    const auto written = cbors::to_sink(sink, std::uint32_t{1});
    assert(!written.has_value());
    assert(written.error().code == cbors::encode_errc::sink_error);
    assert(written.error().context == "write_failed");
  }

  return 0;
}
