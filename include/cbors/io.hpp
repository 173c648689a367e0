#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <istream>
#include <ostream>
#include <span>
#include <utility>
#include <vector>

#include <sfl/segmented_vector.hpp>
#include <tl/expected.hpp>

#include "cbors/error.hpp"

namespace cbors {

enum class reference_kind : std::uint8_t {
  // Valid only until the next call on the source.
  call_scoped,
  // Valid for as long as the whole input is alive.
  input_scoped,
};

struct reference {
  std::span<const std::byte> bytes{};
  reference_kind kind = reference_kind::call_scoped;

  [[nodiscard]] bool empty() const { return bytes.empty(); }
  [[nodiscard]] std::size_t size() const { return bytes.size(); }
  [[nodiscard]] bool is_input_scoped() const { return kind == reference_kind::input_scoped; }
};

// fill(want) returns at least one byte, possibly fewer than `want`, or an
// empty reference at end of input. advance(n) commits n bytes of the last fill.
template <typename S>
concept byte_source = requires(S& source, std::size_t n) {
  { source.fill(n) } -> std::same_as<tl::expected<reference, io_error>>;
  source.advance(n);
};

// write() is all-or-nothing.
template <typename S>
concept byte_sink = requires(S& sink, std::span<const std::byte> bytes) {
  { sink.write(bytes) } -> std::same_as<tl::expected<void, io_error>>;
};

class slice_source {
 public:
  explicit slice_source(std::span<const std::byte> input) : input_(input) {}

  explicit slice_source(std::span<const std::uint8_t> input) : input_(std::as_bytes(input)) {}

  tl::expected<reference, io_error> fill(std::size_t /*want*/) {
    filled_ = input_.size();
    return reference{input_, reference_kind::input_scoped};
  }

  void advance(std::size_t n) {
    assert(n <= filled_ && "advance past the last fill");
    input_ = input_.subspan(n);
    filled_ -= n;
  }

  [[nodiscard]] std::span<const std::byte> remaining() const { return input_; }

 private:
  std::span<const std::byte> input_;
  std::size_t filled_ = 0;
};

// Reads through a fixed chunk buffer; views are invalidated by the next refill.
template <std::size_t T_ChunkBytes = 4096>
class stream_source {
  static_assert(T_ChunkBytes > 0, "chunk size must be greater than zero");

 public:
  explicit stream_source(std::istream& in) : in_(in), buffer_(T_ChunkBytes) {}

  tl::expected<reference, io_error> fill(std::size_t /*want*/) {
    if (begin_ == end_) {
      in_.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
      const auto got = in_.gcount();
      if (got <= 0) {
        if (in_.bad()) {
          return tl::make_unexpected(io_error::read_failed);
        }
        begin_ = end_ = 0;
        return reference{};
      }
      begin_ = 0;
      end_ = static_cast<std::size_t>(got);
    }
    return reference{std::span<const std::byte>(buffer_.data() + begin_, end_ - begin_),
                     reference_kind::call_scoped};
  }

  void advance(std::size_t n) {
    assert(n <= end_ - begin_ && "advance past the last fill");
    begin_ += n;
  }

 private:
  std::istream& in_;
  std::vector<std::byte> buffer_;
  std::size_t begin_ = 0;
  std::size_t end_ = 0;
};

template <std::size_t T_PageBytes>
using segmented_bytes = sfl::segmented_vector<std::uint8_t, T_PageBytes>;

// Reads from paged storage. Views stay valid while the storage lives, but a
// single fill never crosses a page boundary.
template <std::size_t T_PageBytes = 4096>
class segmented_source {
 public:
  explicit segmented_source(const segmented_bytes<T_PageBytes>& storage) : storage_(storage) {}

  tl::expected<reference, io_error> fill(std::size_t /*want*/) {
    if (offset_ >= storage_.size()) {
      filled_ = 0;
      return reference{std::span<const std::byte>{}, reference_kind::input_scoped};
    }
    const std::size_t page_end = std::min(storage_.size(), ((offset_ / T_PageBytes) + 1U) * T_PageBytes);
    filled_ = page_end - offset_;
    const auto* ptr = reinterpret_cast<const std::byte*>(&storage_[offset_]);
    return reference{std::span<const std::byte>(ptr, filled_), reference_kind::input_scoped};
  }

  void advance(std::size_t n) {
    assert(n <= filled_ && "advance past the last fill");
    offset_ += n;
    filled_ -= n;
  }

 private:
  const segmented_bytes<T_PageBytes>& storage_;
  std::size_t offset_ = 0;
  std::size_t filled_ = 0;
};

class vector_sink {
 public:
  vector_sink() = default;

  explicit vector_sink(std::vector<std::byte> initial) : bytes_(std::move(initial)) {}

  tl::expected<void, io_error> write(std::span<const std::byte> data) {
    bytes_.insert(bytes_.end(), data.begin(), data.end());
    return {};
  }

  [[nodiscard]] const std::vector<std::byte>& bytes() const { return bytes_; }

  std::vector<std::byte> take() { return std::move(bytes_); }

 private:
  std::vector<std::byte> bytes_;
};

// Appends into fixed-size pages so written bytes never move.
template <std::size_t T_PageBytes = 4096>
class segmented_sink {
  static_assert(T_PageBytes > 0, "page size must be greater than zero");

 public:
  using storage_type = segmented_bytes<T_PageBytes>;

  static constexpr std::size_t kPageBytes = T_PageBytes;

  tl::expected<void, io_error> write(std::span<const std::byte> data) {
    const std::size_t old_size = storage_.size();
    storage_.resize(old_size + data.size());
    std::size_t copied = 0;
    while (copied < data.size()) {
      const std::size_t offset = old_size + copied;
      const std::size_t chunk = std::min(T_PageBytes - (offset % T_PageBytes), data.size() - copied);
      std::memcpy(&storage_[offset], data.data() + copied, chunk);
      copied += chunk;
    }
    return {};
  }

  [[nodiscard]] std::size_t size() const { return storage_.size(); }

  [[nodiscard]] const storage_type& storage() const { return storage_; }

  [[nodiscard]] std::vector<std::byte> bytes() const {
    std::vector<std::byte> out(storage_.size());
    std::size_t offset = 0;
    while (offset < storage_.size()) {
      const std::size_t chunk = std::min(T_PageBytes, storage_.size() - offset);
      std::memcpy(out.data() + offset, &storage_[offset], chunk);
      offset += chunk;
    }
    return out;
  }

  void clear() { storage_.clear(); }

 private:
  storage_type storage_;
};

class stream_sink {
 public:
  explicit stream_sink(std::ostream& out) : out_(out) {}

  tl::expected<void, io_error> write(std::span<const std::byte> data) {
    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out_) {
      return tl::make_unexpected(io_error::write_failed);
    }
    return {};
  }

 private:
  std::ostream& out_;
};

// Writes into caller-provided storage; a write that does not fit is refused whole.
class bounded_sink {
 public:
  explicit bounded_sink(std::span<std::byte> storage) : storage_(storage) {}

  tl::expected<void, io_error> write(std::span<const std::byte> data) {
    if (data.size() > storage_.size() - used_) {
      return tl::make_unexpected(io_error::capacity_exceeded);
    }
    if (!data.empty()) {
      std::memcpy(storage_.data() + used_, data.data(), data.size());
    }
    used_ += data.size();
    return {};
  }

  [[nodiscard]] std::span<const std::byte> written() const { return storage_.first(used_); }

 private:
  std::span<std::byte> storage_;
  std::size_t used_ = 0;
};

}  // namespace cbors
