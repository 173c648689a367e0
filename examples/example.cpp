#include "examples/example.h"

#include <cbors.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>

namespace {

std::string to_hex(std::span<const std::byte> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2U);
  char buf[3];
  for (const std::byte b : bytes) {
    std::snprintf(buf, sizeof(buf), "%02x", std::to_integer<unsigned>(b));
    out += buf;
  }
  return out;
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::debug);

  Batch batch;
  batch.site = "roof";
  batch.readings.push_back(Reading{7, 21.5, Unit::Celsius, std::nullopt});
  batch.readings.push_back(Reading{8, 101325.0, Unit::Pascal, std::string("sea level")});

  const auto bytes = cbors::to_vec(batch);
  if (!bytes) {
    spdlog::error("encode failed: {}", cbors::to_string(bytes.error()));
    return 1;
  }
  spdlog::info("encoded {} bytes: {}", bytes->size(), to_hex(*bytes));

  const auto decoded = cbors::from_slice<Batch>(*bytes);
  if (!decoded) {
    spdlog::error("decode failed: {}", cbors::to_string(decoded.error()));
    return 1;
  }
  spdlog::info("round trip {}", *decoded == batch ? "ok" : "MISMATCH");

  const auto generic = cbors::to_value(batch);
  if (generic) {
    if (const cbors::value* site = generic->find("site"); site != nullptr && site->as_text()) {
      spdlog::info("site from generic value: {}", *site->as_text());
    }
  }

  // Variant names or indices; the decoder accepts both.
  cbors::encode_options compact;
  compact.variant_ids = cbors::variant_id_policy::index;
  const auto small = cbors::to_vec(batch, compact);
  if (small) {
    spdlog::info("with variant indices: {} bytes", small->size());
  }

  const std::filesystem::path path = std::filesystem::temp_directory_path() / "cbors_example.cbor";
  if (auto written = cbors::write_file(path, batch); !written) {
    spdlog::error("write failed: {}", cbors::to_string(written.error()));
    return 1;
  }
  const auto from_disk = cbors::read_file<Batch>(path);
  std::filesystem::remove(path);
  if (!from_disk) {
    spdlog::error("read failed: {}", cbors::to_string(from_disk.error()));
    return 1;
  }
  spdlog::info("file round trip {}", *from_disk == batch ? "ok" : "MISMATCH");

  // Truncated input reports where decoding stopped.
  const auto truncated = cbors::from_slice<Batch>(std::span<const std::byte>(*bytes).first(bytes->size() - 3));
  if (!truncated) {
    spdlog::info("truncated input: {}", cbors::to_string(truncated.error()));
  }
  return 0;
}
