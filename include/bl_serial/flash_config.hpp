#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

namespace bllink {

// Winbond W25Q128
inline constexpr std::array<std::uint8_t, 88> FLASH_CONFIG_EF4018 = {
  0x04, 0x41, 0x01, 0x00, 0x04, 0x01, 0x00, 0x00, 0x66, 0x99, 0xFF, 0x03, 0x9F, 0x00, 0xB7, 0xE9, 0x04, 0xEF,
  0x00, 0x01, 0xC7, 0x20, 0x52, 0xD8, 0x06, 0x02, 0x32, 0x00, 0x0B, 0x01, 0x0B, 0x01, 0x3B, 0x01, 0xBB, 0x00,
  0x6B, 0x01, 0xEB, 0x02, 0xEB, 0x02, 0x02, 0x50, 0x00, 0x01, 0x00, 0x01, 0x01, 0x00, 0x02, 0x01, 0x01, 0x01,
  0xAB, 0x01, 0x05, 0x35, 0x00, 0x00, 0x01, 0x31, 0x00, 0x00, 0x38, 0xFF, 0xA0, 0xFF, 0x77, 0x03, 0x02, 0x40,
  0x77, 0x03, 0x02, 0xF0, 0x2C, 0x01, 0xB0, 0x04, 0xB0, 0x04, 0x05, 0x00, 0xE8, 0x80, 0x03, 0x00,
};

/**
 * @brief Flash configuration table to send to the boot ROM for a JEDEC id as printed by FlashId::to_string(), empty
 *        if the flash is not supported
 */
inline std::span<std::uint8_t const> get_flash_config(std::string_view const t_flash_id) noexcept {
  constexpr std::array flash_config_table{
    std::pair{std::string_view{"EF4018"}, std::span<std::uint8_t const>{FLASH_CONFIG_EF4018}},
  };

  auto const id_matched = [=](auto const& t_entry) { return t_entry.first == t_flash_id; };
  if (auto const result = std::find_if(flash_config_table.begin(), flash_config_table.end(), id_matched);
      result != flash_config_table.end()) {
    return result->second;
  }

  return {};
}

}  // namespace bllink
