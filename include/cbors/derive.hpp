#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "cbors/codec.hpp"
#include "cbors/content.hpp"
#include "cbors/error.hpp"
#include "cbors/shape.hpp"
#include "cbors/types.hpp"

// Adapters that turn a plain C++ type into a codec from a short declaration:
//
//   struct point { std::int32_t x; std::int32_t y; };
//
//   template <>
//   struct cbors::codec<point> : cbors::struct_codec<point> {
//     static constexpr auto fields = std::make_tuple(cbors::field("x", &point::x),
//                                                    cbors::field("y", &point::y));
//   };

namespace cbors {

enum class field_flags : std::uint8_t {
  none = 0,
  // Omitted from the encoded map.
  skip_serializing = 1U << 0U,
  // Never read; the member is reset to its type's default.
  skip_deserializing = 1U << 1U,
  // std::vector<std::uint8_t> written as a byte string instead of an array.
  bytes = 1U << 2U,
  // Member's entries are merged into the enclosing map.
  flatten = 1U << 3U,
};

constexpr field_flags operator|(field_flags lhs, field_flags rhs) {
  return static_cast<field_flags>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

template <typename Owner, typename Member>
struct field_def {
  using owner_type = Owner;
  using member_type = Member;

  std::string_view name;
  Member Owner::*member;
  field_flags flags = field_flags::none;

  [[nodiscard]] constexpr bool has(field_flags flag) const {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0U;
  }
};

template <typename Owner, typename Member>
constexpr field_def<Owner, Member> field(std::string_view name,
                                         Member Owner::*member,
                                         field_flags flags = field_flags::none) {
  return field_def<Owner, Member>{name, member, flags};
}

namespace detail {

struct byte_buffer {
  std::vector<std::uint8_t> data;
};

// Calls fn(index, field) for each field until fn returns false.
template <typename Fields, typename F>
bool for_each_field(const Fields& fields, F&& fn) {
  return std::apply(
      [&](const auto&... f) {
        std::size_t i = 0;
        return (fn(i++, f) && ...);
      },
      fields);
}

template <std::size_t N, typename F>
auto with_index(std::size_t i, F&& fn) -> decltype(fn(std::integral_constant<std::size_t, 0>{})) {
  using result_type = decltype(fn(std::integral_constant<std::size_t, 0>{}));
  std::optional<result_type> out;
  [&]<std::size_t... I>(std::index_sequence<I...>) {
    static_cast<void>(((i == I ? (out.emplace(fn(std::integral_constant<std::size_t, I>{})), true) : false) || ...));
  }(std::make_index_sequence<N>{});
  return std::move(*out);
}

inline content identifier_content(const identifier& id) {
  if (id.index) {
    return content(std::in_place_type<wide_int>, wide_int{false, *id.index});
  }
  return content(std::in_place_type<cow_text>, id.name);
}

}  // namespace detail

template <>
struct codec<detail::byte_buffer> {
  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const detail::byte_buffer& v) {
    return ser.serialize_bytes(std::as_bytes(std::span<const std::uint8_t>(v.data)));
  }

  template <typename De>
  static decode_result<detail::byte_buffer> deserialize(De& de) {
    auto bytes = de.deserialize_bytes();
    if (!bytes) {
      return tl::make_unexpected(bytes.error());
    }
    const auto view = bytes->view();
    detail::byte_buffer out;
    out.data.reserve(view.size());
    for (const std::byte b : view) {
      out.data.push_back(std::to_integer<std::uint8_t>(b));
    }
    return out;
  }
};

// Struct as a map keyed by field names. `codec<T>::fields` is a tuple of
// field() descriptors. Unknown keys are skipped, or handed to the flattened
// members when there are any; a struct with a flattened member is written as
// an indefinite map.
template <typename T>
struct struct_codec {
  static constexpr shape kind = shape::structure;

  static const auto& fields() { return codec<T>::fields; }

  static bool has_flatten() {
    bool found = false;
    detail::for_each_field(fields(), [&](std::size_t /*i*/, const auto& f) {
      found = found || f.has(field_flags::flatten);
      return true;
    });
    return found;
  }

  template <typename Compound>
  static encode_result<void> serialize_entries(Compound& out, const T& v) {
    encode_result<void> status;
    detail::for_each_field(fields(), [&](std::size_t /*i*/, const auto& f) {
      using member_type = typename std::decay_t<decltype(f)>::member_type;
      if (f.has(field_flags::skip_serializing)) {
        return true;
      }
      const member_type& member = v.*(f.member);
      if (f.has(field_flags::flatten)) {
        if constexpr (requires(Compound& o, const member_type& m) { codec<member_type>::serialize_entries(o, m); }) {
          status = codec<member_type>::serialize_entries(out, member);
        } else {
          status = tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "flattened field is not a map"});
        }
        return status.has_value();
      }
      if constexpr (std::is_same_v<member_type, std::vector<std::uint8_t>>) {
        if (f.has(field_flags::bytes)) {
          status = out.field(f.name, detail::byte_buffer{member});
          return status.has_value();
        }
      }
      status = out.field(f.name, member);
      return status.has_value();
    });
    return status;
  }

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& v) {
    std::optional<std::size_t> len;
    if (!has_flatten()) {
      std::size_t count = 0;
      detail::for_each_field(fields(), [&](std::size_t /*i*/, const auto& f) {
        count += f.has(field_flags::skip_serializing) ? 0U : 1U;
        return true;
      });
      len = count;
    }
    auto out = ser.serialize_map(len);
    if (!out) {
      return tl::make_unexpected(out.error());
    }
    auto written = serialize_entries(*out, v);
    if (!written) {
      return written;
    }
    return out->end();
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    constexpr std::size_t field_count = std::tuple_size_v<std::remove_cvref_t<decltype(codec<T>::fields)>>;
    const bool flatten = has_flatten();
    const bool reject_duplicates = de.options().duplicate_keys == duplicate_key_policy::reject;

    return de.deserialize_map([&](auto& entries) -> decode_result<T> {
      T out{};
      std::array<bool, field_count> seen{};
      content::map_type leftovers;

      for (;;) {
        auto key = entries.template next_key<identifier>();
        if (!key) {
          return tl::make_unexpected(key.error());
        }
        if (!key->has_value()) {
          break;
        }
        const identifier& id = **key;

        std::optional<decode_error> failure;
        bool matched = false;
        detail::for_each_field(fields(), [&](std::size_t i, const auto& f) {
          using member_type = typename std::decay_t<decltype(f)>::member_type;
          if (f.has(field_flags::flatten) || !id.matches(i, f.name)) {
            return true;
          }
          matched = true;
          if (f.has(field_flags::skip_deserializing)) {
            auto skipped = entries.skip_value();
            if (!skipped) {
              failure = skipped.error();
            }
            return false;
          }
          if (seen[i] && reject_duplicates) {
            failure = de.error(decode_errc::duplicate_key, "duplicate struct field");
            return false;
          }
          if constexpr (std::is_same_v<member_type, std::vector<std::uint8_t>>) {
            if (f.has(field_flags::bytes)) {
              auto item = entries.template next_value<detail::byte_buffer>();
              if (!item) {
                failure = item.error();
                return false;
              }
              out.*(f.member) = std::move(item->data);
              seen[i] = true;
              return false;
            }
          }
          auto item = entries.template next_value<member_type>();
          if (!item) {
            failure = item.error();
            return false;
          }
          out.*(f.member) = std::move(*item);
          seen[i] = true;
          return false;
        });
        if (failure) {
          return tl::make_unexpected(*failure);
        }
        if (matched) {
          continue;
        }

        if (flatten) {
          auto item = entries.template next_value<content>();
          if (!item) {
            return tl::make_unexpected(item.error());
          }
          leftovers.emplace_back(detail::identifier_content(id), std::move(*item));
        } else {
          auto skipped = entries.skip_value();
          if (!skipped) {
            return tl::make_unexpected(skipped.error());
          }
        }
      }

      std::optional<decode_error> failure;
      detail::for_each_field(fields(), [&](std::size_t i, const auto& f) {
        using member_type = typename std::decay_t<decltype(f)>::member_type;
        if (f.has(field_flags::skip_deserializing)) {
          out.*(f.member) = member_type{};
          return true;
        }
        if (f.has(field_flags::flatten)) {
          spdlog::debug("cbors: flattening {} entries into field '{}'", leftovers.size(), f.name);
          const content rest(std::in_place_type<content::map_type>, leftovers);
          content_deserializer rest_de(rest, de.options(), de.position());
          auto item = rest_de.template deserialize<member_type>();
          if (!item) {
            failure = item.error();
            return false;
          }
          out.*(f.member) = std::move(*item);
          return true;
        }
        if (!seen[i] && !is_optional_v<member_type>) {
          failure = de.error(decode_errc::invalid_value, "missing struct field");
          return false;
        }
        return true;
      });
      if (failure) {
        return tl::make_unexpected(*failure);
      }
      return out;
    });
  }
};

// Struct with unnamed fields, written as a definite array.
template <typename T, auto... Members>
struct tuple_struct_codec {
  static constexpr shape kind = shape::tuple;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& v) {
    return detail::write_elements(ser, (v.*Members)...);
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    return de.deserialize_seq([&](auto& seq) -> decode_result<T> {
      T out{};
      auto read = detail::read_elements(de, seq, (out.*Members)...);
      if (!read) {
        return tl::make_unexpected(read.error());
      }
      return out;
    });
  }
};

// Single-field wrapper, written as the wrapped value.
template <typename T, auto Member>
struct newtype_codec {
  static constexpr shape kind = shape::newtype;

  using inner_type = std::remove_cvref_t<decltype(std::declval<const T&>().*Member)>;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& v) {
    return ser.serialize(v.*Member);
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    auto inner = de.template deserialize<inner_type>();
    if (!inner) {
      return tl::make_unexpected(inner.error());
    }
    T out{};
    out.*Member = std::move(*inner);
    return out;
  }
};

template <typename T>
struct unit_struct_codec {
  static constexpr shape kind = shape::unit;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& /*v*/) {
    return ser.serialize_unit();
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    auto unit = de.deserialize_unit();
    if (!unit) {
      return tl::make_unexpected(unit.error());
    }
    return T{};
  }
};

// Externally tagged enum over a std::variant member. `codec<T>::variants`
// names the alternatives in order. Alternatives with a unit shape are written
// as the bare identifier; every other alternative as {identifier: payload}.
template <typename T, auto Member>
struct enum_codec {
  static constexpr shape kind = shape::enumeration;

  using variant_type = std::remove_cvref_t<decltype(std::declval<const T&>().*Member)>;

  static constexpr std::size_t alternative_count = std::variant_size_v<variant_type>;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& v) {
    static_assert(codec<T>::variants.size() == alternative_count, "one name per alternative");
    const variant_type& alternatives = v.*Member;
    const auto index = static_cast<std::uint32_t>(alternatives.index());
    if (alternatives.valueless_by_exception()) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "valueless variant"});
    }
    const std::string_view name = codec<T>::variants[index];
    return std::visit(
        [&](const auto& alt) -> encode_result<void> {
          using alt_type = std::decay_t<decltype(alt)>;
          if constexpr (codec_shape_v<alt_type> == shape::unit) {
            return ser.serialize_unit_variant(index, name);
          } else {
            return ser.serialize_newtype_variant(index, name, alt);
          }
        },
        alternatives);
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    return de.deserialize_enum([&](const identifier& id, auto* payload) -> decode_result<T> {
      std::size_t index = alternative_count;
      for (std::size_t i = 0; i < alternative_count; ++i) {
        if (id.matches(i, codec<T>::variants[i])) {
          index = i;
          break;
        }
      }
      if (index == alternative_count) {
        return tl::make_unexpected(de.error(decode_errc::invalid_value, "unknown enum variant"));
      }
      return detail::with_index<alternative_count>(index, [&](auto alt_index) -> decode_result<T> {
        using alt_type = std::variant_alternative_t<decltype(alt_index)::value, variant_type>;
        T out{};
        if (payload == nullptr) {
          if constexpr (codec_shape_v<alt_type> == shape::unit) {
            (out.*Member).template emplace<decltype(alt_index)::value>();
            return out;
          } else {
            return tl::make_unexpected(de.error(decode_errc::type_mismatch, "enum variant requires a payload"));
          }
        }
        auto alt = payload->template deserialize<alt_type>();
        if (!alt) {
          return tl::make_unexpected(alt.error());
        }
        (out.*Member).template emplace<decltype(alt_index)::value>(std::move(*alt));
        return out;
      });
    });
  }
};

// C++ enum whose enumerators are 0..N-1, written as unit variants.
template <typename E>
struct unit_enum_codec {
  static constexpr shape kind = shape::enumeration;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, E v) {
    const auto index = static_cast<std::size_t>(v);
    if (index >= codec<E>::variants.size()) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "enumerator without a name"});
    }
    return ser.serialize_unit_variant(static_cast<std::uint32_t>(index), codec<E>::variants[index]);
  }

  template <typename De>
  static decode_result<E> deserialize(De& de) {
    return de.deserialize_enum([&](const identifier& id, auto* payload) -> decode_result<E> {
      for (std::size_t i = 0; i < codec<E>::variants.size(); ++i) {
        if (!id.matches(i, codec<E>::variants[i])) {
          continue;
        }
        if (payload != nullptr) {
          auto unit = payload->deserialize_unit();
          if (!unit) {
            return tl::make_unexpected(unit.error());
          }
        }
        return static_cast<E>(i);
      }
      return tl::make_unexpected(de.error(decode_errc::invalid_value, "unknown enum variant"));
    });
  }
};

// Enum without a tag on the wire. Each alternative is written as itself; on
// decode the item is buffered and the alternatives are tried in order.
template <typename T, auto Member>
struct untagged_codec {
  using variant_type = std::remove_cvref_t<decltype(std::declval<const T&>().*Member)>;

  static constexpr std::size_t alternative_count = std::variant_size_v<variant_type>;

  template <typename Ser>
  static encode_result<void> serialize(Ser& ser, const T& v) {
    const variant_type& alternatives = v.*Member;
    if (alternatives.valueless_by_exception()) {
      return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "valueless variant"});
    }
    return std::visit([&](const auto& alt) { return ser.serialize(alt); }, alternatives);
  }

  template <typename De>
  static decode_result<T> deserialize(De& de) {
    const std::size_t position = de.position();
    auto buffered = de.deserialize_content();
    if (!buffered) {
      return tl::make_unexpected(buffered.error());
    }

    std::optional<T> out;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
      auto attempt = [&](auto alt_index) -> bool {
        using alt_type = std::variant_alternative_t<decltype(alt_index)::value, variant_type>;
        content_deserializer replay(*buffered, de.options(), position);
        auto alt = replay.template deserialize<alt_type>();
        if (!alt) {
          spdlog::debug("cbors: untagged alternative {} rejected: {}", decltype(alt_index)::value,
                        to_string(alt.error()));
          return false;
        }
        out.emplace();
        ((*out).*Member).template emplace<decltype(alt_index)::value>(std::move(*alt));
        return true;
      };
      static_cast<void>((attempt(std::integral_constant<std::size_t, I>{}) || ...));
    }(std::make_index_sequence<alternative_count>{});

    if (!out) {
      return tl::make_unexpected(decode_error{decode_errc::no_matching_variant, position, "no untagged alternative matched"});
    }
    return std::move(*out);
  }
};

}  // namespace cbors
