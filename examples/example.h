#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <cbors.hpp>

enum class Unit : std::uint8_t {
  Celsius = 0,
  Pascal = 1,
};

struct Reading {
  std::uint32_t sensor{};
  double value{};
  Unit unit{};
  std::optional<std::string> note;

  bool operator==(const Reading&) const = default;
};

struct Batch {
  std::string site;
  std::vector<Reading> readings;

  bool operator==(const Batch&) const = default;
};

namespace cbors {

template <>
struct codec<Unit> : unit_enum_codec<Unit> {
  static constexpr std::array<std::string_view, 2> variants{"Celsius", "Pascal"};
};

template <>
struct codec<Reading> : struct_codec<Reading> {
  static constexpr auto fields = std::make_tuple(field("sensor", &Reading::sensor),
                                                 field("value", &Reading::value),
                                                 field("unit", &Reading::unit),
                                                 field("note", &Reading::note));
};

template <>
struct codec<Batch> : struct_codec<Batch> {
  static constexpr auto fields = std::make_tuple(field("site", &Batch::site), field("readings", &Batch::readings));
};

}  // namespace cbors
