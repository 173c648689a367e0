#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include "cbors/decode.hpp"
#include "cbors/error.hpp"
#include "cbors/options.hpp"
#include "cbors/shape.hpp"
#include "cbors/types.hpp"
#include "cbors/utf8.hpp"
#include "cbors/value.hpp"

namespace cbors {

class content;

struct tagged_content {
  std::uint64_t tag = 0;
  box<content> inner;

  bool operator==(const tagged_content& rhs) const;
};

// Buffered item used when the target shape is only known after looking at
// the data (untagged enums, flatten). Strings stay borrowed when the source
// handed out input-scoped views.
class content {
 public:
  using array_type = std::vector<content>;
  using map_type = std::vector<std::pair<content, content>>;
  using storage_type = std::variant<wide_int,
                                    cow_bytes,
                                    cow_text,
                                    array_type,
                                    map_type,
                                    tagged_content,
                                    bool,
                                    null_t,
                                    undefined_t,
                                    double>;

  content() : storage_(null_t{}) {}

  template <typename Alt>
  explicit content(std::in_place_type_t<Alt> tag, Alt alt) : storage_(tag, std::move(alt)) {}

  template <typename T>
  [[nodiscard]] const T* get_if() const {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] const storage_type& storage() const { return storage_; }

  bool operator==(const content& rhs) const = default;

 private:
  storage_type storage_;
};

inline bool tagged_content::operator==(const tagged_content& rhs) const {
  return tag == rhs.tag && *inner == *rhs.inner;
}

template <byte_source Source>
decode_result<content> decode_content(decoder<Source>& dec, std::size_t depth = 0) {
  if (depth > dec.options().max_depth) {
    return tl::make_unexpected(dec.error(decode_errc::depth_limit_exceeded, "nesting too deep"));
  }
  auto h = dec.read_header();
  if (!h) {
    return tl::make_unexpected(h.error());
  }

  switch (h->major) {
    case major_type::unsigned_integer:
      return content(std::in_place_type<wide_int>, wide_int{false, h->argument});
    case major_type::negative_integer:
      return content(std::in_place_type<wide_int>, wide_int{true, h->argument});
    case major_type::byte_string: {
      auto body = dec.read_bytes_body(*h);
      if (!body) {
        return tl::make_unexpected(body.error());
      }
      return content(std::in_place_type<cow_bytes>, std::move(*body));
    }
    case major_type::text_string: {
      auto body = dec.read_text_body(*h);
      if (!body) {
        return tl::make_unexpected(body.error());
      }
      return content(std::in_place_type<cow_text>, std::move(*body));
    }
    case major_type::array: {
      content::array_type items;
      const bool indefinite = h->indefinite();
      for (std::uint64_t i = 0; indefinite || i < h->argument; ++i) {
        if (indefinite) {
          auto done = dec.at_break();
          if (!done) {
            return tl::make_unexpected(done.error());
          }
          if (*done) {
            auto closed = dec.read_break();
            if (!closed) {
              return tl::make_unexpected(closed.error());
            }
            break;
          }
        }
        auto item = decode_content(dec, depth + 1);
        if (!item) {
          return item;
        }
        items.push_back(std::move(*item));
      }
      return content(std::in_place_type<content::array_type>, std::move(items));
    }
    case major_type::map: {
      content::map_type entries;
      const bool indefinite = h->indefinite();
      for (std::uint64_t i = 0; indefinite || i < h->argument; ++i) {
        if (indefinite) {
          auto done = dec.at_break();
          if (!done) {
            return tl::make_unexpected(done.error());
          }
          if (*done) {
            auto closed = dec.read_break();
            if (!closed) {
              return tl::make_unexpected(closed.error());
            }
            break;
          }
        }
        auto key = decode_content(dec, depth + 1);
        if (!key) {
          return key;
        }
        auto item = decode_content(dec, depth + 1);
        if (!item) {
          return item;
        }
        entries.emplace_back(std::move(*key), std::move(*item));
      }
      return content(std::in_place_type<content::map_type>, std::move(entries));
    }
    case major_type::tag: {
      auto inner = decode_content(dec, depth + 1);
      if (!inner) {
        return inner;
      }
      return content(std::in_place_type<tagged_content>, tagged_content{h->argument, box<content>(std::move(*inner))});
    }
    case major_type::simple:
      switch (h->info) {
        case k_simple_false:
          return content(std::in_place_type<bool>, false);
        case k_simple_true:
          return content(std::in_place_type<bool>, true);
        case k_simple_null:
          return content();
        case k_simple_undefined:
          return content(std::in_place_type<undefined_t>, undefined_t{});
        case k_info_two_bytes:
        case k_info_four_bytes:
        case k_info_eight_bytes: {
          auto f = dec.read_float_body(*h);
          if (!f) {
            return tl::make_unexpected(f.error());
          }
          return content(std::in_place_type<double>, *f);
        }
        case k_info_indefinite:
          return tl::make_unexpected(dec.error(decode_errc::malformed_indefinite, "unexpected break"));
        default:
          return tl::make_unexpected(dec.error(decode_errc::type_mismatch, "unassigned simple value"));
      }
  }
  return tl::make_unexpected(dec.error(decode_errc::type_mismatch, "unknown major type"));
}

inline value to_value(const content& c) {
  return std::visit(
      [](const auto& alt) -> value {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, wide_int>) {
          // Native CBOR integers never exceed 64 bits of magnitude.
          const auto magnitude = static_cast<i128>(alt.magnitude);
          return value::integer(alt.negative ? -1 - magnitude : magnitude);
        } else if constexpr (std::is_same_v<Alt, cow_bytes>) {
          return value::bytes(alt.to_owned());
        } else if constexpr (std::is_same_v<Alt, cow_text>) {
          return value::text(alt.to_owned());
        } else if constexpr (std::is_same_v<Alt, content::array_type>) {
          value::array_type items;
          items.reserve(alt.size());
          for (const auto& item : alt) {
            items.push_back(to_value(item));
          }
          return value::array(std::move(items));
        } else if constexpr (std::is_same_v<Alt, content::map_type>) {
          value::map_type entries;
          entries.reserve(alt.size());
          for (const auto& [k, item] : alt) {
            entries.emplace_back(to_value(k), to_value(item));
          }
          return value::map(std::move(entries));
        } else if constexpr (std::is_same_v<Alt, tagged_content>) {
          return value::tag(alt.tag, to_value(*alt.inner));
        } else if constexpr (std::is_same_v<Alt, bool>) {
          return value::boolean(alt);
        } else if constexpr (std::is_same_v<Alt, null_t>) {
          return value::null();
        } else if constexpr (std::is_same_v<Alt, undefined_t>) {
          return value::undefined();
        } else {
          return value::floating(alt);
        }
      },
      c.storage());
}

inline content to_content(const value& v) {
  return std::visit(
      [](const auto& alt) -> content {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, i128>) {
          if (alt >= 0) {
            return content(std::in_place_type<wide_int>, wide_int{false, static_cast<u128>(alt)});
          }
          return content(std::in_place_type<wide_int>, wide_int{true, static_cast<u128>(-1 - alt)});
        } else if constexpr (std::is_same_v<Alt, std::vector<std::byte>>) {
          return content(std::in_place_type<cow_bytes>, cow_bytes::owned(alt));
        } else if constexpr (std::is_same_v<Alt, std::string>) {
          return content(std::in_place_type<cow_text>, cow_text::owned(alt));
        } else if constexpr (std::is_same_v<Alt, value::array_type>) {
          content::array_type items;
          items.reserve(alt.size());
          for (const auto& item : alt) {
            items.push_back(to_content(item));
          }
          return content(std::in_place_type<content::array_type>, std::move(items));
        } else if constexpr (std::is_same_v<Alt, value::map_type>) {
          content::map_type entries;
          entries.reserve(alt.size());
          for (const auto& [k, item] : alt) {
            entries.emplace_back(to_content(k), to_content(item));
          }
          return content(std::in_place_type<content::map_type>, std::move(entries));
        } else if constexpr (std::is_same_v<Alt, tagged_value>) {
          return content(std::in_place_type<tagged_content>, tagged_content{alt.tag, box<content>(to_content(*alt.inner))});
        } else if constexpr (std::is_same_v<Alt, bool>) {
          return content(std::in_place_type<bool>, alt);
        } else if constexpr (std::is_same_v<Alt, null_t>) {
          return content();
        } else if constexpr (std::is_same_v<Alt, undefined_t>) {
          return content(std::in_place_type<undefined_t>, undefined_t{});
        } else {
          return content(std::in_place_type<double>, alt);
        }
      },
      v.storage());
}

// Replays a buffered item through the deserialize contract. Cheap to
// construct; every attempt gets a fresh one over the same content.
class content_deserializer {
 public:
  content_deserializer(const content& item, const decode_options& options, std::size_t position, std::size_t depth = 0)
      : item_(item), options_(options), position_(position), depth_(depth) {}

  [[nodiscard]] const decode_options& options() const { return options_; }

  [[nodiscard]] std::size_t position() const { return position_; }

  [[nodiscard]] decode_error error(decode_errc code, std::string_view context) const {
    return decode_error{code, position_, context};
  }

  template <typename T>
  decode_result<T> deserialize() {
    return codec<T>::deserialize(*this);
  }

  decode_result<bool> deserialize_bool() {
    if (const auto* b = item_.get_if<bool>()) {
      return *b;
    }
    return mismatch("expected bool");
  }

  decode_result<wide_int> deserialize_integer() {
    if (const auto* w = item_.get_if<wide_int>()) {
      return *w;
    }
    if (const auto* t = item_.get_if<tagged_content>()) {
      if (t->tag == k_tag_positive_bignum || t->tag == k_tag_negative_bignum) {
        const auto* payload = t->inner->get_if<cow_bytes>();
        if (payload == nullptr) {
          return mismatch("expected bignum byte string");
        }
        const auto magnitude = magnitude_from_be(payload->view());
        if (!magnitude) {
          return tl::make_unexpected(error(decode_errc::invalid_value, "bignum exceeds 128 bits"));
        }
        return wide_int{t->tag == k_tag_negative_bignum, *magnitude};
      }
    }
    return mismatch("expected integer");
  }

  decode_result<double> deserialize_float() {
    if (const auto* f = item_.get_if<double>()) {
      return *f;
    }
    return mismatch("expected float");
  }

  decode_result<char32_t> deserialize_char() {
    if (const auto* t = item_.get_if<cow_text>()) {
      if (auto cp = utf8::single_char(t->view())) {
        return *cp;
      }
      return tl::make_unexpected(error(decode_errc::invalid_value, "expected a single character"));
    }
    return mismatch("expected char");
  }

  // Borrowed content stays borrowed; owned content is copied out because the
  // buffer does not outlive this attempt.
  decode_result<cow_text> deserialize_str() {
    if (const auto* t = item_.get_if<cow_text>()) {
      return t->is_borrowed() ? *t : cow_text::owned(t->to_owned());
    }
    return mismatch("expected text string");
  }

  decode_result<cow_bytes> deserialize_bytes() {
    if (const auto* b = item_.get_if<cow_bytes>()) {
      return b->is_borrowed() ? *b : cow_bytes::owned(b->to_owned());
    }
    return mismatch("expected byte string");
  }

  decode_result<void> deserialize_unit() {
    if (item_.get_if<null_t>() != nullptr || item_.get_if<undefined_t>() != nullptr) {
      return {};
    }
    if (const auto* items = item_.get_if<content::array_type>()) {
      if (items->empty()) {
        return {};
      }
      return tl::make_unexpected(error(decode_errc::invalid_length, "expected empty array for unit"));
    }
    return mismatch("expected unit");
  }

  decode_result<bool> deserialize_option() {
    return item_.get_if<null_t>() == nullptr && item_.get_if<undefined_t>() == nullptr;
  }

  decode_result<identifier> deserialize_identifier() {
    if (const auto* w = item_.get_if<wide_int>()) {
      if (w->negative || w->magnitude > std::numeric_limits<std::uint64_t>::max()) {
        return tl::make_unexpected(error(decode_errc::invalid_value, "negative identifier"));
      }
      return identifier{static_cast<std::uint64_t>(w->magnitude), {}};
    }
    auto name = deserialize_str();
    if (!name) {
      return mismatch("expected identifier");
    }
    return identifier{std::nullopt, std::move(*name)};
  }

  decode_result<void> ignore() { return {}; }

  decode_result<content> deserialize_content() { return item_; }

  decode_result<value> deserialize_value() { return to_value(item_); }

  class seq_access {
   public:
    seq_access(content_deserializer& parent, const content::array_type& items) : parent_(parent), items_(items) {}

    [[nodiscard]] std::optional<std::size_t> size_hint(std::size_t = 1) const { return items_.size() - next_; }

    template <typename T>
    decode_result<std::optional<T>> next_element() {
      if (next_ >= items_.size()) {
        return std::optional<T>{};
      }
      auto de = parent_.child(items_[next_++]);
      auto item = de.template deserialize<T>();
      if (!item) {
        return tl::make_unexpected(item.error());
      }
      return std::optional<T>(std::move(*item));
    }

    [[nodiscard]] bool finished() const { return next_ >= items_.size(); }

   private:
    content_deserializer& parent_;
    const content::array_type& items_;
    std::size_t next_ = 0;
  };

  class map_access {
   public:
    map_access(content_deserializer& parent, const content::map_type& entries) : parent_(parent), entries_(entries) {}

    [[nodiscard]] std::optional<std::size_t> size_hint(std::size_t = 1) const { return entries_.size() - next_; }

    template <typename K>
    decode_result<std::optional<K>> next_key() {
      if (next_ >= entries_.size()) {
        return std::optional<K>{};
      }
      auto de = parent_.child(entries_[next_].first);
      auto key = de.template deserialize<K>();
      if (!key) {
        return tl::make_unexpected(key.error());
      }
      return std::optional<K>(std::move(*key));
    }

    template <typename V>
    decode_result<V> next_value() {
      auto de = parent_.child(entries_[next_++].second);
      return de.template deserialize<V>();
    }

    decode_result<void> skip_value() {
      ++next_;
      return {};
    }

    [[nodiscard]] bool finished() const { return next_ >= entries_.size(); }

   private:
    content_deserializer& parent_;
    const content::map_type& entries_;
    std::size_t next_ = 0;
  };

  template <typename F>
  auto deserialize_seq(F&& visit) -> std::invoke_result_t<F&, seq_access&> {
    using result_type = std::invoke_result_t<F&, seq_access&>;
    const auto* items = item_.get_if<content::array_type>();
    if (items == nullptr) {
      return result_type(tl::make_unexpected(error(decode_errc::type_mismatch, "expected array")));
    }
    if (depth_ >= options_.max_depth) {
      return result_type(tl::make_unexpected(error(decode_errc::depth_limit_exceeded, "nesting too deep")));
    }
    seq_access access(*this, *items);
    auto result = visit(access);
    if (result && !access.finished()) {
      return result_type(tl::make_unexpected(error(decode_errc::invalid_length, "trailing sequence elements")));
    }
    return result;
  }

  template <typename F>
  auto deserialize_map(F&& visit) -> std::invoke_result_t<F&, map_access&> {
    using result_type = std::invoke_result_t<F&, map_access&>;
    const auto* entries = item_.get_if<content::map_type>();
    if (entries == nullptr) {
      return result_type(tl::make_unexpected(error(decode_errc::type_mismatch, "expected map")));
    }
    if (depth_ >= options_.max_depth) {
      return result_type(tl::make_unexpected(error(decode_errc::depth_limit_exceeded, "nesting too deep")));
    }
    map_access access(*this, *entries);
    auto result = visit(access);
    if (result && !access.finished()) {
      return result_type(tl::make_unexpected(error(decode_errc::invalid_length, "unconsumed map entries")));
    }
    return result;
  }

  // visit(identifier, content_deserializer* payload); payload is null for the
  // bare-identifier form of a unit variant.
  template <typename F>
  auto deserialize_enum(F&& visit) -> std::invoke_result_t<F&, const identifier&, content_deserializer*> {
    using result_type = std::invoke_result_t<F&, const identifier&, content_deserializer*>;
    if (item_.get_if<cow_text>() != nullptr || item_.get_if<wide_int>() != nullptr) {
      auto id = deserialize_identifier();
      if (!id) {
        return result_type(tl::make_unexpected(id.error()));
      }
      return visit(*id, static_cast<content_deserializer*>(nullptr));
    }
    const auto* entries = item_.get_if<content::map_type>();
    if (entries == nullptr) {
      return result_type(tl::make_unexpected(error(decode_errc::type_mismatch, "expected enum")));
    }
    if (entries->size() != 1) {
      return result_type(tl::make_unexpected(error(decode_errc::invalid_length, "enum map must have one entry")));
    }
    if (depth_ >= options_.max_depth) {
      return result_type(tl::make_unexpected(error(decode_errc::depth_limit_exceeded, "nesting too deep")));
    }
    auto key_de = child(entries->front().first);
    auto id = key_de.deserialize_identifier();
    if (!id) {
      return result_type(tl::make_unexpected(id.error()));
    }
    auto payload = child(entries->front().second);
    return visit(*id, &payload);
  }

 private:
  content_deserializer child(const content& item) const {
    return content_deserializer(item, options_, position_, depth_ + 1);
  }

  decode_error mismatch_error(std::string_view context) const { return error(decode_errc::type_mismatch, context); }

  tl::unexpected<decode_error> mismatch(std::string_view context) const {
    return tl::make_unexpected(mismatch_error(context));
  }

  const content& item_;
  const decode_options& options_;
  std::size_t position_;
  std::size_t depth_;
};

}  // namespace cbors
