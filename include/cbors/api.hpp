#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "cbors/codec.hpp"
#include "cbors/content.hpp"
#include "cbors/de.hpp"
#include "cbors/error.hpp"
#include "cbors/io.hpp"
#include "cbors/options.hpp"
#include "cbors/ser.hpp"
#include "cbors/value.hpp"

namespace cbors {

template <byte_sink Sink, typename T>
encode_result<void> to_sink(Sink& sink, const T& v, encode_options options = {}) {
  serializer<Sink> ser(sink, options);
  return ser.serialize(v);
}

template <typename T>
encode_result<std::vector<std::byte>> to_vec(const T& v, encode_options options = {}) {
  vector_sink sink;
  auto written = to_sink(sink, v, options);
  if (!written) {
    return tl::make_unexpected(written.error());
  }
  return sink.take();
}

// Decodes one item. Unless options.allow_trailing is set, bytes left after
// the item are an error.
template <typename T, byte_source Source>
decode_result<T> from_source(Source& source, decode_options options = {}) {
  deserializer<Source> de(source, options);
  auto out = de.template deserialize<T>();
  if (!out) {
    spdlog::debug("cbors: decode failed: {}", to_string(out.error()));
    return out;
  }
  if (options.allow_trailing) {
    return out;
  }
  auto next = de.wire().peek_initial_byte();
  if (next) {
    return tl::make_unexpected(de.error(decode_errc::trailing_data, "bytes after the top-level item"));
  }
  if (next.error().code != decode_errc::end_of_input) {
    return tl::make_unexpected(next.error());
  }
  return out;
}

// Borrowed results (std::string_view, cow_text, ...) point into `input`.
template <typename T>
decode_result<T> from_slice(std::span<const std::byte> input, decode_options options = {}) {
  slice_source source(input);
  return from_source<T>(source, options);
}

template <typename T>
decode_result<T> from_slice(std::span<const std::uint8_t> input, decode_options options = {}) {
  return from_slice<T>(std::as_bytes(input), options);
}

template <typename T>
encode_result<value> to_value(const T& v, encode_options options = {}) {
  auto bytes = to_vec(v, options);
  if (!bytes) {
    return tl::make_unexpected(bytes.error());
  }
  slice_source source(*bytes);
  decoder<slice_source> dec(source);
  auto out = decode_value(dec);
  if (!out) {
    spdlog::debug("cbors: re-decoding as value failed: {}", to_string(out.error()));
    return tl::make_unexpected(encode_error{encode_errc::unrepresentable_value, "not representable as a value"});
  }
  return std::move(*out);
}

template <typename T>
decode_result<T> from_value(const value& v, decode_options options = {}) {
  const content item = to_content(v);
  content_deserializer de(item, options, 0);
  return de.template deserialize<T>();
}

template <typename T>
encode_result<void> write_file(const std::filesystem::path& path, const T& v, encode_options options = {}) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    spdlog::debug("cbors: cannot open {} for writing", path.string());
    return tl::make_unexpected(encode_error{encode_errc::sink_error, io_error_message(io_error::open_failed)});
  }
  stream_sink sink(out);
  auto written = to_sink(sink, v, options);
  if (!written) {
    spdlog::debug("cbors: writing {} failed: {}", path.string(), to_string(written.error()));
    return written;
  }
  out.flush();
  if (!out) {
    return tl::make_unexpected(encode_error{encode_errc::sink_error, io_error_message(io_error::write_failed)});
  }
  return {};
}

// The file is read through a call-scoped stream, so T must own its data.
template <typename T>
decode_result<T> read_file(const std::filesystem::path& path, decode_options options = {}) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    spdlog::debug("cbors: cannot open {} for reading", path.string());
    return tl::make_unexpected(decode_error{decode_errc::source_error, 0, io_error_message(io_error::open_failed)});
  }
  stream_source<> source(in);
  return from_source<T>(source, options);
}

}  // namespace cbors
