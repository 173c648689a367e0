#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

#include "cbors/content.hpp"
#include "cbors/decode.hpp"
#include "cbors/error.hpp"
#include "cbors/io.hpp"
#include "cbors/options.hpp"
#include "cbors/shape.hpp"
#include "cbors/types.hpp"
#include "cbors/utf8.hpp"
#include "cbors/value.hpp"

namespace cbors {

// Drives codecs over a decoder. Each deserialize_* call consumes exactly one
// item (deserialize_option consumes only a null/undefined); compound items
// are walked through the access objects handed to the visitor.
template <byte_source Source>
class deserializer {
 public:
  explicit deserializer(Source& source, decode_options options = {}) : wire_(source, options) {}

  decoder<Source>& wire() { return wire_; }

  [[nodiscard]] const decode_options& options() const { return wire_.options(); }

  [[nodiscard]] std::size_t position() const { return wire_.position(); }

  [[nodiscard]] decode_error error(decode_errc code, std::string_view context) const {
    return wire_.error(code, context);
  }

  template <typename T>
  decode_result<T> deserialize() {
    return codec<T>::deserialize(*this);
  }

  decode_result<bool> deserialize_bool() {
    auto h = wire_.expect_header(major_type::simple, "expected bool");
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    if (h->info == k_simple_true || h->info == k_simple_false) {
      return h->info == k_simple_true;
    }
    return tl::make_unexpected(error(decode_errc::type_mismatch, "expected bool"));
  }

  // Native integers and bignum tags up to 128 bits of magnitude.
  decode_result<wide_int> deserialize_integer() {
    auto h = wire_.read_header();
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    switch (h->major) {
      case major_type::unsigned_integer:
        return wide_int{false, h->argument};
      case major_type::negative_integer:
        return wide_int{true, h->argument};
      case major_type::tag:
        if (h->argument == k_tag_positive_bignum || h->argument == k_tag_negative_bignum) {
          auto payload = wire_.read_bytes();
          if (!payload) {
            return tl::make_unexpected(payload.error());
          }
          const auto magnitude = magnitude_from_be(payload->view());
          if (!magnitude) {
            return tl::make_unexpected(error(decode_errc::invalid_value, "bignum exceeds 128 bits"));
          }
          return wide_int{h->argument == k_tag_negative_bignum, *magnitude};
        }
        break;
      default:
        break;
    }
    return tl::make_unexpected(error(decode_errc::type_mismatch, "expected integer"));
  }

  decode_result<double> deserialize_float() { return wire_.read_float(); }

  decode_result<char32_t> deserialize_char() {
    auto text = wire_.read_text();
    if (!text) {
      return tl::make_unexpected(text.error());
    }
    if (auto cp = utf8::single_char(text->view())) {
      return *cp;
    }
    return tl::make_unexpected(error(decode_errc::invalid_value, "expected a single character"));
  }

  decode_result<cow_text> deserialize_str() { return wire_.read_text(); }

  decode_result<cow_bytes> deserialize_bytes() { return wire_.read_bytes(); }

  // Unit is written as an empty array; null and undefined are accepted too.
  decode_result<void> deserialize_unit() {
    auto h = wire_.read_header();
    if (!h) {
      return tl::make_unexpected(h.error());
    }
    if (h->major == major_type::simple && (h->info == k_simple_null || h->info == k_simple_undefined)) {
      return {};
    }
    if (h->major != major_type::array) {
      return tl::make_unexpected(error(decode_errc::type_mismatch, "expected unit"));
    }
    if (h->indefinite()) {
      return wire_.read_break();
    }
    if (h->argument != 0) {
      return tl::make_unexpected(error(decode_errc::invalid_length, "expected empty array for unit"));
    }
    return {};
  }

  // true if a value follows; a null or undefined is consumed and yields false.
  decode_result<bool> deserialize_option() {
    auto initial = wire_.peek_initial_byte();
    if (!initial) {
      return tl::make_unexpected(initial.error());
    }
    if (*initial == initial_byte(major_type::simple, k_simple_null) ||
        *initial == initial_byte(major_type::simple, k_simple_undefined)) {
      auto h = wire_.read_header();
      if (!h) {
        return tl::make_unexpected(h.error());
      }
      return false;
    }
    return true;
  }

  decode_result<identifier> deserialize_identifier() {
    auto major = wire_.peek_major();
    if (!major) {
      return tl::make_unexpected(major.error());
    }
    if (*major == major_type::unsigned_integer) {
      auto h = wire_.read_header();
      if (!h) {
        return tl::make_unexpected(h.error());
      }
      return identifier{h->argument, {}};
    }
    if (*major == major_type::text_string) {
      auto name = wire_.read_text();
      if (!name) {
        return tl::make_unexpected(name.error());
      }
      return identifier{std::nullopt, std::move(*name)};
    }
    return tl::make_unexpected(error(decode_errc::type_mismatch, "expected identifier"));
  }

  decode_result<void> ignore() { return wire_.skip_item(depth_); }

  decode_result<content> deserialize_content() { return decode_content(wire_, depth_); }

  decode_result<value> deserialize_value() { return decode_value(wire_, depth_); }

  class seq_access {
   public:
    seq_access(deserializer& parent, std::optional<std::uint64_t> remaining)
        : parent_(parent), remaining_(remaining) {}

    // Declared element count, capped so that the reservation stays within
    // max_prealloc bytes.
    [[nodiscard]] std::optional<std::size_t> size_hint(std::size_t element_size = 1) const {
      if (!remaining_) {
        return std::nullopt;
      }
      const std::size_t budget = parent_.options().max_prealloc / std::max<std::size_t>(element_size, 1);
      return static_cast<std::size_t>(std::min<std::uint64_t>(*remaining_, budget));
    }

    template <typename T>
    decode_result<std::optional<T>> next_element() {
      auto more = has_next();
      if (!more) {
        return tl::make_unexpected(more.error());
      }
      if (!*more) {
        return std::optional<T>{};
      }
      auto item = parent_.template deserialize<T>();
      if (!item) {
        return tl::make_unexpected(item.error());
      }
      if (remaining_) {
        --*remaining_;
      }
      return std::optional<T>(std::move(*item));
    }

    // Called once the visitor is done; leftover elements are an error.
    decode_result<void> finish() {
      if (remaining_) {
        if (*remaining_ != 0) {
          return tl::make_unexpected(parent_.error(decode_errc::invalid_length, "trailing sequence elements"));
        }
        return {};
      }
      if (!closed_) {
        auto more = has_next();
        if (!more) {
          return tl::make_unexpected(more.error());
        }
        if (*more) {
          return tl::make_unexpected(parent_.error(decode_errc::invalid_length, "trailing sequence elements"));
        }
      }
      return {};
    }

   private:
    decode_result<bool> has_next() {
      if (remaining_) {
        return *remaining_ > 0;
      }
      if (closed_) {
        return false;
      }
      auto done = parent_.wire_.at_break();
      if (!done) {
        return tl::make_unexpected(done.error());
      }
      if (*done) {
        auto closed = parent_.wire_.read_break();
        if (!closed) {
          return tl::make_unexpected(closed.error());
        }
        closed_ = true;
        return false;
      }
      return true;
    }

    deserializer& parent_;
    std::optional<std::uint64_t> remaining_;
    bool closed_ = false;
  };

  class map_access {
   public:
    map_access(deserializer& parent, std::optional<std::uint64_t> remaining)
        : parent_(parent), remaining_(remaining) {}

    // Declared element count, capped so that the reservation stays within
    // max_prealloc bytes.
    [[nodiscard]] std::optional<std::size_t> size_hint(std::size_t element_size = 1) const {
      if (!remaining_) {
        return std::nullopt;
      }
      const std::size_t budget = parent_.options().max_prealloc / std::max<std::size_t>(element_size, 1);
      return static_cast<std::size_t>(std::min<std::uint64_t>(*remaining_, budget));
    }

    template <typename K>
    decode_result<std::optional<K>> next_key() {
      auto more = has_next();
      if (!more) {
        return tl::make_unexpected(more.error());
      }
      if (!*more) {
        return std::optional<K>{};
      }
      auto key = parent_.template deserialize<K>();
      if (!key) {
        return tl::make_unexpected(key.error());
      }
      return std::optional<K>(std::move(*key));
    }

    template <typename V>
    decode_result<V> next_value() {
      if (remaining_) {
        --*remaining_;
      }
      return parent_.template deserialize<V>();
    }

    decode_result<void> skip_value() {
      if (remaining_) {
        --*remaining_;
      }
      return parent_.ignore();
    }

    decode_result<void> finish() {
      if (remaining_) {
        if (*remaining_ != 0) {
          return tl::make_unexpected(parent_.error(decode_errc::invalid_length, "unconsumed map entries"));
        }
        return {};
      }
      if (!closed_) {
        auto more = has_next();
        if (!more) {
          return tl::make_unexpected(more.error());
        }
        if (*more) {
          return tl::make_unexpected(parent_.error(decode_errc::invalid_length, "unconsumed map entries"));
        }
      }
      return {};
    }

   private:
    decode_result<bool> has_next() {
      if (remaining_) {
        return *remaining_ > 0;
      }
      if (closed_) {
        return false;
      }
      auto done = parent_.wire_.at_break();
      if (!done) {
        return tl::make_unexpected(done.error());
      }
      if (*done) {
        auto closed = parent_.wire_.read_break();
        if (!closed) {
          return tl::make_unexpected(closed.error());
        }
        closed_ = true;
        return false;
      }
      return true;
    }

    deserializer& parent_;
    std::optional<std::uint64_t> remaining_;
    bool closed_ = false;
  };

  template <typename F>
  auto deserialize_seq(F&& visit) -> std::invoke_result_t<F&, seq_access&> {
    using result_type = std::invoke_result_t<F&, seq_access&>;
    auto h = wire_.expect_header(major_type::array, "expected array");
    if (!h) {
      return result_type(tl::make_unexpected(h.error()));
    }
    auto guard = enter();
    if (!guard) {
      return result_type(tl::make_unexpected(guard.error()));
    }
    seq_access access(*this, h->indefinite() ? std::nullopt : std::optional<std::uint64_t>(h->argument));
    auto result = visit(access);
    leave();
    if (!result) {
      return result;
    }
    auto finished = access.finish();
    if (!finished) {
      return result_type(tl::make_unexpected(finished.error()));
    }
    return result;
  }

  template <typename F>
  auto deserialize_map(F&& visit) -> std::invoke_result_t<F&, map_access&> {
    using result_type = std::invoke_result_t<F&, map_access&>;
    auto h = wire_.expect_header(major_type::map, "expected map");
    if (!h) {
      return result_type(tl::make_unexpected(h.error()));
    }
    auto guard = enter();
    if (!guard) {
      return result_type(tl::make_unexpected(guard.error()));
    }
    map_access access(*this, h->indefinite() ? std::nullopt : std::optional<std::uint64_t>(h->argument));
    auto result = visit(access);
    leave();
    if (!result) {
      return result;
    }
    auto finished = access.finish();
    if (!finished) {
      return result_type(tl::make_unexpected(finished.error()));
    }
    return result;
  }

  // visit(identifier, deserializer* payload); payload is null for the
  // bare-identifier form, otherwise it is positioned at the variant payload
  // inside a one-entry map.
  template <typename F>
  auto deserialize_enum(F&& visit) -> std::invoke_result_t<F&, const identifier&, deserializer*> {
    using result_type = std::invoke_result_t<F&, const identifier&, deserializer*>;
    auto major = wire_.peek_major();
    if (!major) {
      return result_type(tl::make_unexpected(major.error()));
    }
    if (*major == major_type::text_string || *major == major_type::unsigned_integer) {
      auto id = deserialize_identifier();
      if (!id) {
        return result_type(tl::make_unexpected(id.error()));
      }
      return visit(*id, static_cast<deserializer*>(nullptr));
    }
    if (*major != major_type::map) {
      return result_type(tl::make_unexpected(error(decode_errc::type_mismatch, "expected enum")));
    }
    auto h = wire_.read_header();
    if (!h) {
      return result_type(tl::make_unexpected(h.error()));
    }
    if (!h->indefinite() && h->argument != 1) {
      return result_type(tl::make_unexpected(error(decode_errc::invalid_length, "enum map must have one entry")));
    }
    auto guard = enter();
    if (!guard) {
      return result_type(tl::make_unexpected(guard.error()));
    }
    auto id = deserialize_identifier();
    if (!id) {
      leave();
      return result_type(tl::make_unexpected(id.error()));
    }
    auto result = visit(*id, this);
    leave();
    if (result && h->indefinite()) {
      auto closed = wire_.read_break();
      if (!closed) {
        return result_type(tl::make_unexpected(error(decode_errc::invalid_length, "enum map must have one entry")));
      }
    }
    return result;
  }

 private:
  decode_result<void> enter() {
    if (depth_ >= wire_.options().max_depth) {
      return tl::make_unexpected(error(decode_errc::depth_limit_exceeded, "nesting too deep"));
    }
    ++depth_;
    return {};
  }

  void leave() { --depth_; }

  decoder<Source> wire_;
  std::size_t depth_ = 0;
};

}  // namespace cbors
