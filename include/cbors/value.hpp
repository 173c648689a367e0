#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include "cbors/decode.hpp"
#include "cbors/encode.hpp"
#include "cbors/error.hpp"
#include "cbors/shape.hpp"
#include "cbors/types.hpp"

namespace cbors {

class value;

struct null_t {
  bool operator==(const null_t&) const = default;
};

struct undefined_t {
  bool operator==(const undefined_t&) const = default;
};

struct tagged_value {
  std::uint64_t tag = 0;
  box<value> inner;
};

enum class value_kind : std::uint8_t {
  integer,
  bytes,
  text,
  array,
  map,
  tag,
  boolean,
  null,
  undefined,
  floating,
};

// Owned generic CBOR item. Map entries keep their wire order, duplicates included.
class value {
 public:
  using array_type = std::vector<value>;
  using map_type = std::vector<std::pair<value, value>>;
  using storage_type = std::variant<i128,
                                    std::vector<std::byte>,
                                    std::string,
                                    array_type,
                                    map_type,
                                    tagged_value,
                                    bool,
                                    null_t,
                                    undefined_t,
                                    double>;

  value() : storage_(null_t{}) {}

  static value integer(i128 v) { return value(storage_type(std::in_place_type<i128>, v)); }

  static value bytes(std::vector<std::byte> v) {
    return value(storage_type(std::in_place_type<std::vector<std::byte>>, std::move(v)));
  }

  static value text(std::string v) { return value(storage_type(std::in_place_type<std::string>, std::move(v))); }

  static value array(array_type v) { return value(storage_type(std::in_place_type<array_type>, std::move(v))); }

  static value map(map_type v) { return value(storage_type(std::in_place_type<map_type>, std::move(v))); }

  static value tag(std::uint64_t tag, value inner) {
    return value(storage_type(std::in_place_type<tagged_value>, tagged_value{tag, box<value>(std::move(inner))}));
  }

  static value boolean(bool v) { return value(storage_type(std::in_place_type<bool>, v)); }

  static value null() { return value(storage_type(std::in_place_type<null_t>)); }

  static value undefined() { return value(storage_type(std::in_place_type<undefined_t>)); }

  static value floating(double v) { return value(storage_type(std::in_place_type<double>, v)); }

  [[nodiscard]] value_kind kind() const { return static_cast<value_kind>(storage_.index()); }

  template <typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(storage_);
  }

  template <typename T>
  [[nodiscard]] const T* get_if() const {
    return std::get_if<T>(&storage_);
  }

  template <typename T>
  [[nodiscard]] T* get_if() {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] const storage_type& storage() const { return storage_; }

  [[nodiscard]] bool is_null() const { return is<null_t>(); }

  [[nodiscard]] std::optional<i128> as_integer() const {
    if (const auto* v = get_if<i128>()) {
      return *v;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<bool> as_bool() const {
    if (const auto* v = get_if<bool>()) {
      return *v;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<double> as_float() const {
    if (const auto* v = get_if<double>()) {
      return *v;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<std::string_view> as_text() const {
    if (const auto* v = get_if<std::string>()) {
      return std::string_view(*v);
    }
    return std::nullopt;
  }

  [[nodiscard]] const array_type* as_array() const { return get_if<array_type>(); }

  [[nodiscard]] const map_type* as_map() const { return get_if<map_type>(); }

  // Looks up the first entry whose key is the given text.
  [[nodiscard]] const value* find(std::string_view key) const {
    const auto* entries = get_if<map_type>();
    if (entries == nullptr) {
      return nullptr;
    }
    for (const auto& [k, v] : *entries) {
      const auto* text_key = k.get_if<std::string>();
      if (text_key != nullptr && *text_key == key) {
        return &v;
      }
    }
    return nullptr;
  }

  // Floats compare by bit pattern so that every value equals itself.
  bool operator==(const value& rhs) const {
    if (storage_.index() != rhs.storage_.index()) {
      return false;
    }
    return std::visit(
        [&](const auto& lhs_alt) -> bool {
          using Alt = std::decay_t<decltype(lhs_alt)>;
          const Alt& rhs_alt = std::get<Alt>(rhs.storage_);
          if constexpr (std::is_same_v<Alt, double>) {
            return std::bit_cast<std::uint64_t>(lhs_alt) == std::bit_cast<std::uint64_t>(rhs_alt);
          } else if constexpr (std::is_same_v<Alt, tagged_value>) {
            return lhs_alt.tag == rhs_alt.tag && *lhs_alt.inner == *rhs_alt.inner;
          } else {
            return lhs_alt == rhs_alt;
          }
        },
        storage_);
  }

 private:
  explicit value(storage_type storage) : storage_(std::move(storage)) {}

  storage_type storage_;
};

// Re-emits a value with definite lengths. Floats are written as doubles;
// integers outside the 64-bit argument range become bignum tags, which
// decode_value folds back into integers.
template <byte_sink Sink>
encode_result<void> encode_value(encoder<Sink>& enc, const value& v) {
  return std::visit(
      [&](const auto& alt) -> encode_result<void> {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, i128>) {
          if (alt >= 0) {
            const auto magnitude = static_cast<u128>(alt);
            if (magnitude <= std::numeric_limits<std::uint64_t>::max()) {
              return enc.write_uint(static_cast<std::uint64_t>(magnitude));
            }
            return enc.write_bignum(false, magnitude);
          }
          const auto magnitude = static_cast<u128>(-1 - alt);
          if (magnitude <= std::numeric_limits<std::uint64_t>::max()) {
            return enc.write_negative(static_cast<std::uint64_t>(magnitude));
          }
          return enc.write_bignum(true, magnitude);
        } else if constexpr (std::is_same_v<Alt, std::vector<std::byte>>) {
          return enc.write_bytes(alt);
        } else if constexpr (std::is_same_v<Alt, std::string>) {
          return enc.write_text(alt);
        } else if constexpr (std::is_same_v<Alt, value::array_type>) {
          auto head = enc.write_array_header(alt.size());
          if (!head) {
            return head;
          }
          for (const auto& item : alt) {
            auto written = encode_value(enc, item);
            if (!written) {
              return written;
            }
          }
          return {};
        } else if constexpr (std::is_same_v<Alt, value::map_type>) {
          auto head = enc.write_map_header(alt.size());
          if (!head) {
            return head;
          }
          for (const auto& [k, item] : alt) {
            auto key_written = encode_value(enc, k);
            if (!key_written) {
              return key_written;
            }
            auto value_written = encode_value(enc, item);
            if (!value_written) {
              return value_written;
            }
          }
          return {};
        } else if constexpr (std::is_same_v<Alt, tagged_value>) {
          auto head = enc.write_tag(alt.tag);
          if (!head) {
            return head;
          }
          return encode_value(enc, *alt.inner);
        } else if constexpr (std::is_same_v<Alt, bool>) {
          return enc.write_bool(alt);
        } else if constexpr (std::is_same_v<Alt, null_t>) {
          return enc.write_null();
        } else if constexpr (std::is_same_v<Alt, undefined_t>) {
          return enc.write_undefined();
        } else {
          return enc.write_f64(alt);
        }
      },
      v.storage());
}

namespace detail {

template <typename Entries>
bool has_duplicate_key(const Entries& entries) {
  if (entries.empty()) {
    return false;
  }
  const auto& last = entries.back().first;
  return std::any_of(entries.begin(), entries.end() - 1, [&](const auto& entry) { return entry.first == last; });
}

}  // namespace detail

// Decodes any well-formed item.
template <byte_source Source>
decode_result<value> decode_value(decoder<Source>& dec, std::size_t depth = 0) {
  if (depth > dec.options().max_depth) {
    return tl::make_unexpected(dec.error(decode_errc::depth_limit_exceeded, "nesting too deep"));
  }
  auto h = dec.read_header();
  if (!h) {
    return tl::make_unexpected(h.error());
  }

  switch (h->major) {
    case major_type::unsigned_integer:
      return value::integer(static_cast<i128>(h->argument));
    case major_type::negative_integer:
      return value::integer(-1 - static_cast<i128>(h->argument));
    case major_type::byte_string: {
      auto body = dec.read_bytes_body(*h);
      if (!body) {
        return tl::make_unexpected(body.error());
      }
      return value::bytes(std::move(*body).into_owned());
    }
    case major_type::text_string: {
      auto body = dec.read_text_body(*h);
      if (!body) {
        return tl::make_unexpected(body.error());
      }
      return value::text(std::move(*body).into_owned());
    }
    case major_type::array: {
      value::array_type items;
      if (!h->indefinite()) {
        items.reserve(static_cast<std::size_t>(
            std::min<std::uint64_t>(h->argument, dec.options().max_prealloc / sizeof(value))));
        for (std::uint64_t i = 0; i < h->argument; ++i) {
          auto item = decode_value(dec, depth + 1);
          if (!item) {
            return item;
          }
          items.push_back(std::move(*item));
        }
        return value::array(std::move(items));
      }
      for (;;) {
        auto done = dec.at_break();
        if (!done) {
          return tl::make_unexpected(done.error());
        }
        if (*done) {
          auto closed = dec.read_break();
          if (!closed) {
            return tl::make_unexpected(closed.error());
          }
          return value::array(std::move(items));
        }
        auto item = decode_value(dec, depth + 1);
        if (!item) {
          return item;
        }
        items.push_back(std::move(*item));
      }
    }
    case major_type::map: {
      value::map_type entries;
      const bool reject_duplicates = dec.options().duplicate_keys == duplicate_key_policy::reject;
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
        auto key = decode_value(dec, depth + 1);
        if (!key) {
          return key;
        }
        auto item = decode_value(dec, depth + 1);
        if (!item) {
          return item;
        }
        entries.emplace_back(std::move(*key), std::move(*item));
        if (reject_duplicates && detail::has_duplicate_key(entries)) {
          return tl::make_unexpected(dec.error(decode_errc::duplicate_key, "duplicate map key"));
        }
      }
      return value::map(std::move(entries));
    }
    case major_type::tag: {
      auto inner = decode_value(dec, depth + 1);
      if (!inner) {
        return inner;
      }
      // Bignums within the integer range fold back into an integer.
      if (h->argument == k_tag_positive_bignum || h->argument == k_tag_negative_bignum) {
        if (const auto* payload = inner->get_if<std::vector<std::byte>>()) {
          const auto magnitude = magnitude_from_be(*payload);
          if (magnitude && *magnitude <= static_cast<u128>(k_i128_max)) {
            const auto v = static_cast<i128>(*magnitude);
            return value::integer(h->argument == k_tag_negative_bignum ? -1 - v : v);
          }
        }
      }
      return value::tag(h->argument, std::move(*inner));
    }
    case major_type::simple:
      switch (h->info) {
        case k_simple_false:
          return value::boolean(false);
        case k_simple_true:
          return value::boolean(true);
        case k_simple_null:
          return value::null();
        case k_simple_undefined:
          return value::undefined();
        case k_info_two_bytes:
        case k_info_four_bytes:
        case k_info_eight_bytes: {
          auto f = dec.read_float_body(*h);
          if (!f) {
            return tl::make_unexpected(f.error());
          }
          return value::floating(*f);
        }
        case k_info_indefinite:
          return tl::make_unexpected(dec.error(decode_errc::malformed_indefinite, "unexpected break"));
        default:
          return tl::make_unexpected(dec.error(decode_errc::type_mismatch, "unassigned simple value"));
      }
  }
  return tl::make_unexpected(dec.error(decode_errc::type_mismatch, "unknown major type"));
}

}  // namespace cbors
