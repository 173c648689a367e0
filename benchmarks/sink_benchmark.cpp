#include "examples/example.h"

#include <cbors.hpp>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using SegmentedSink = cbors::segmented_sink<4096>;
using SegmentedSource = cbors::segmented_source<4096>;

std::uint32_t next_lcg(std::uint32_t& state) {
  state = state * 1664525U + 1013904223U;
  return state;
}

std::vector<Reading> build_readings(std::size_t records) {
  std::vector<Reading> out;
  out.reserve(records);

  std::uint32_t rng = 0xC0FFEE42U;
  for (std::size_t i = 0; i < records; ++i) {
    const std::uint32_t r0 = next_lcg(rng);
    const std::uint32_t r1 = next_lcg(rng);

    Reading rec{};
    rec.sensor = r0 % 5000U;
    rec.value = static_cast<double>(static_cast<std::int32_t>(r1 % 100000U)) / 31.0;
    rec.unit = (r0 & 1U) != 0U ? Unit::Pascal : Unit::Celsius;
    if ((r1 & 7U) == 0U) {
      rec.note = "sensor " + std::to_string(rec.sensor);
    }
    out.push_back(std::move(rec));
  }
  return out;
}

std::size_t serialize_vector(const std::vector<Reading>& src, std::vector<std::byte>& out) {
  auto bytes = cbors::to_vec(src);
  assert(bytes.has_value());
  out = std::move(*bytes);
  return out.size();
}

std::size_t serialize_segmented(const std::vector<Reading>& src, SegmentedSink& out) {
  out.clear();
  const auto written = cbors::to_sink(out, src);
  assert(written.has_value());
  static_cast<void>(written);
  return out.size();
}

bool deserialize_slice(const std::vector<std::byte>& in, std::vector<Reading>& dst) {
  auto out = cbors::from_slice<std::vector<Reading>>(in);
  if (!out) {
    return false;
  }
  dst = std::move(*out);
  return true;
}

bool deserialize_segmented(const SegmentedSink& in, std::vector<Reading>& dst) {
  SegmentedSource source(in.storage());
  auto out = cbors::from_source<std::vector<Reading>>(source);
  if (!out) {
    return false;
  }
  dst = std::move(*out);
  return true;
}

std::uint64_t checksum(const std::vector<Reading>& records) {
  if (records.empty()) {
    return 0;
  }
  const Reading& first = records.front();
  const Reading& last = records.back();
  std::uint64_t sum = static_cast<std::uint64_t>(records.size());
  sum ^= static_cast<std::uint64_t>(first.sensor);
  sum ^= static_cast<std::uint64_t>(last.sensor) << 17U;
  sum ^= static_cast<std::uint64_t>(first.unit) << 33U;
  sum ^= static_cast<std::uint64_t>(last.unit) << 41U;
  return sum;
}

template <typename F>
double measure_seconds(std::size_t iterations, F&& fn) {
  const auto start = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  return std::chrono::duration<double>(end - start).count();
}

double throughput_mib_per_s(std::size_t bytes_per_iteration, std::size_t iterations, double seconds) {
  const double total_bytes = static_cast<double>(bytes_per_iteration) * static_cast<double>(iterations);
  const double total_mib = total_bytes / (1024.0 * 1024.0);
  return total_mib / seconds;
}

}  // namespace

int main(int argc, char** argv) {
  std::size_t records = 200000;
  std::size_t iterations = 20;
  if (argc >= 2) {
    records = static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10));
  }
  if (argc >= 3) {
    iterations = static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10));
  }
  if (records == 0 || iterations == 0) {
    std::cerr << "records and iterations must be > 0\n";
    return 1;
  }

  const std::vector<Reading> src = build_readings(records);
  assert(src.size() == records);

  std::vector<std::byte> flat_blob;
  SegmentedSink paged_blob;
  std::vector<Reading> flat_dst;
  std::vector<Reading> paged_dst;

  std::size_t flat_bytes = serialize_vector(src, flat_blob);
  std::size_t paged_bytes = serialize_segmented(src, paged_blob);
  assert(flat_bytes == paged_bytes);
  assert(paged_blob.bytes() == flat_blob);

  assert(deserialize_slice(flat_blob, flat_dst));
  assert(deserialize_segmented(paged_blob, paged_dst));
  assert(flat_dst == src);
  assert(paged_dst == src);

  std::uint64_t sink = 0;

  const double flat_ser_s = measure_seconds(iterations, [&] {
    flat_bytes = serialize_vector(src, flat_blob);
    sink ^= static_cast<std::uint64_t>(flat_bytes);
  });

  const double paged_ser_s = measure_seconds(iterations, [&] {
    paged_bytes = serialize_segmented(src, paged_blob);
    sink ^= static_cast<std::uint64_t>(paged_bytes);
  });

  const double flat_des_s = measure_seconds(iterations, [&] {
    const bool ok = deserialize_slice(flat_blob, flat_dst);
    assert(ok);
    static_cast<void>(ok);
    sink ^= checksum(flat_dst);
  });

  const double paged_des_s = measure_seconds(iterations, [&] {
    const bool ok = deserialize_segmented(paged_blob, paged_dst);
    assert(ok);
    static_cast<void>(ok);
    sink ^= checksum(paged_dst);
  });

  const double flat_ser_mib_s = throughput_mib_per_s(flat_bytes, iterations, flat_ser_s);
  const double paged_ser_mib_s = throughput_mib_per_s(paged_bytes, iterations, paged_ser_s);
  const double flat_des_mib_s = throughput_mib_per_s(flat_bytes, iterations, flat_des_s);
  const double paged_des_mib_s = throughput_mib_per_s(paged_bytes, iterations, paged_des_s);

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "records=" << records << " iterations=" << iterations << "\n";
  std::cout << "blob_bytes=" << flat_bytes << "\n";
  std::cout << "serialize_vector_mib_s=" << flat_ser_mib_s << "\n";
  std::cout << "serialize_segmented_mib_s=" << paged_ser_mib_s << "\n";
  std::cout << "deserialize_slice_mib_s=" << flat_des_mib_s << "\n";
  std::cout << "deserialize_segmented_mib_s=" << paged_des_mib_s << "\n";
  std::cout << "segmented_serialize_ratio_x=" << (paged_ser_mib_s / flat_ser_mib_s) << "\n";
  std::cout << "segmented_deserialize_ratio_x=" << (paged_des_mib_s / flat_des_mib_s) << "\n";
  std::cout << "checksum_sink=" << sink << "\n";

  return 0;
}
