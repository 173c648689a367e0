#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

#include <bitsery/deserializer.h>
#include <bitsery/serializer.h>
#include <bitsery/traits/vector.h>

#include "cbors/api.hpp"
#include "cbors/value.hpp"

namespace cbors {

// Largest CBOR payload a single value may occupy inside a bitsery stream.
inline constexpr std::size_t k_bitsery_max_payload_bytes = 0x3FFFFFFFU;

namespace detail {

// Input archives expose the reader error state through their adapter.
template <typename S>
concept bitsery_input_archive = requires(S& archive, bitsery::ReaderError error) {
  archive.adapter().error();
  archive.adapter().error(error);
};

}  // namespace detail

}  // namespace cbors

namespace bitsery {

// Embeds a value as a length-prefixed CBOR payload. A payload that is not
// exactly one well-formed item fails the read with ReaderError::InvalidData.
template <typename S>
void serialize(S& s, cbors::value& v) {
  if constexpr (cbors::detail::bitsery_input_archive<S>) {
    std::vector<std::uint8_t> payload{};
    s.container1b(payload, cbors::k_bitsery_max_payload_bytes);
    if (s.adapter().error() != bitsery::ReaderError::NoError) {
      v = cbors::value{};
      return;
    }

    auto decoded = cbors::from_slice<cbors::value>(std::span<const std::uint8_t>(payload));
    if (!decoded) {
      v = cbors::value{};
      s.adapter().error(bitsery::ReaderError::InvalidData);
      return;
    }
    v = std::move(*decoded);
  } else {
    std::vector<std::uint8_t> payload{};
    cbors::vector_sink sink;
    cbors::encoder<cbors::vector_sink> enc(sink);
    // vector_sink never refuses a write.
    if (cbors::encode_value(enc, v)) {
      const auto& bytes = sink.bytes();
      payload.resize(bytes.size());
      std::memcpy(payload.data(), bytes.data(), bytes.size());
    }
    s.container1b(payload, cbors::k_bitsery_max_payload_bytes);
  }
}

}  // namespace bitsery
