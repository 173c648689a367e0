#pragma once

#include <cstddef>
#include <cstdint>

namespace cbors {

// How enum variants are identified on the wire.
enum class variant_id_policy : std::uint8_t {
  name,
  index,
};

// What to do with 128-bit integers outside the 64-bit argument range.
enum class bignum_policy : std::uint8_t {
  tag,
  reject,
};

enum class duplicate_key_policy : std::uint8_t {
  allow,
  reject,
};

struct encode_options {
  variant_id_policy variant_ids = variant_id_policy::name;
  bignum_policy bignums = bignum_policy::tag;
};

struct decode_options {
  // Nesting limit for arrays, maps, tags and enum payloads.
  std::size_t max_depth = 256;
  // allow: maps keep every entry, structs and std::map keep the last one.
  duplicate_key_policy duplicate_keys = duplicate_key_policy::allow;
  bool allow_trailing = false;
  // Upper bound on allocation made from a declared length before the bytes
  // have actually arrived.
  std::size_t max_prealloc = 64U * 1024U;
};

}  // namespace cbors
