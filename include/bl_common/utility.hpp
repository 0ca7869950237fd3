#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <span>
#include <string>

#include <fmt/ranges.h>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

namespace bllink {

inline constexpr auto to_byte = [](auto t_in) { return static_cast<std::uint8_t>(t_in); };

/**
 * @brief Little endian serialization of a word, the byte order of every multi-byte field on the wire
 */
inline constexpr auto word_to_byte_array = [](std::uint32_t const t_v) {
  return std::array{to_byte(t_v & 0xFFU), to_byte((t_v >> 8U) & 0xFFU), to_byte((t_v >> 16U) & 0xFFU),
                    to_byte(t_v >> 24U)};
};

template <std::endian Endian>
inline constexpr std::uint32_t byte_array_to_word(std::span<std::uint8_t const, 4> const t_bytes) noexcept {
  auto const b0 = static_cast<std::uint32_t>(t_bytes[0]);
  auto const b1 = static_cast<std::uint32_t>(t_bytes[1]);
  auto const b2 = static_cast<std::uint32_t>(t_bytes[2]);
  auto const b3 = static_cast<std::uint32_t>(t_bytes[3]);

  if constexpr (Endian == std::endian::big) {
    return (b0 << 24U) | (b1 << 16U) | (b2 << 8U) | b3;
  } else {
    return (b3 << 24U) | (b2 << 16U) | (b1 << 8U) | b0;
  }
}

inline constexpr std::uint16_t byte_array_to_halfword(std::uint8_t const t_low, std::uint8_t const t_high) noexcept {
  return static_cast<std::uint16_t>((t_high << 8U) | t_low);
}

inline std::string to_hex_string(auto const& t_bytes) {
  using ranges::views::transform;
  return fmt::format("{:02x}", fmt::join(t_bytes | transform(to_byte), ""));
}

inline void print_byte_stream(auto t_begin, auto t_end) noexcept {
  using ranges::subrange;
  using ranges::views::transform;
  if (spdlog::get_level() > spdlog::level::debug) {
    return;
  }

  constexpr auto byte_per_line = 16;
  auto const byte_stream_size  = t_end - t_begin;
  auto const line_to_print = static_cast<std::size_t>((byte_stream_size + byte_per_line - 1) / byte_per_line);  // ceil
  spdlog::set_pattern("%v");

  for (std::size_t i = 0; i < line_to_print; ++i) {
    auto const curr_end = t_end - t_begin < byte_per_line ? t_end : t_begin + byte_per_line;
    spdlog::debug("{:04X}  {:02X}", i * byte_per_line,
                  fmt::join(subrange(t_begin, curr_end) | transform(to_byte), " "));
    t_begin = curr_end;
  }

  spdlog::debug("");
  spdlog::set_pattern("%+");
}

}  // namespace bllink
