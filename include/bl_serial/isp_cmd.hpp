#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/ranges.h>
#include <range/v3/view/reverse.hpp>

#include "bl_common/error.hpp"
#include "bl_common/utility.hpp"

namespace bllink {

// Ref: https://github.com/pine64/blisp/blob/e45941c45e2418b2bb7e3dab49468a8f4d132439/include/blisp.h#L26
struct BootInfo {
  std::array<std::uint8_t, 4> boot_rom_version_{};
  std::array<std::uint8_t, 4> reserved1_{};
  std::uint32_t flash_info_from_boot_{};
  std::array<std::uint8_t, 6> chip_id_{};
  std::array<std::uint8_t, 6> reserved2_{};

  /**
   * @brief Pin group the flash is attached to, needed to configure the flash interface before erasing or writing
   */
  [[nodiscard]] constexpr std::uint32_t flash_pin() const noexcept {
    return (this->flash_info_from_boot_ >> 14U) & 0x1FU;
  }

  [[nodiscard]] std::string chip_id_str() const {
    return fmt::format("{:02X}", fmt::join(this->chip_id_ | ranges::views::reverse, ""));
  }
};

struct FlashId {
  std::array<std::uint8_t, 3> jedec_id_{};

  [[nodiscard]] std::string to_string() const { return fmt::format("{:02X}", fmt::join(this->jedec_id_, "")); }
};

}  // namespace bllink

namespace bllink::command {

template <typename T>
concept IspCommand = requires(T const& t_cmd, std::span<std::uint8_t const> t_response) {
  { T::NAME } -> std::convertible_to<std::string_view>;
  { T::COMMAND_BYTE } -> std::convertible_to<std::uint8_t>;
  { T::RESPONSE_PAYLOAD } -> std::convertible_to<bool>;
  { t_cmd.data_size() } -> std::convertible_to<std::size_t>;
  t_cmd();
  T::parse_response(t_response);
};

namespace detail {

inline void expect_empty_response(std::span<std::uint8_t const> const t_response) {
  if (not t_response.empty()) {
    throw ResponseLengthError(t_response.size());
  }
}

}  // namespace detail

// Ref: https://github.com/pine64/blisp/blob/e45941c45e2418b2bb7e3dab49468a8f4d132439/lib/blisp.c#L234
struct GET_BOOT_INFO {
  using Response = BootInfo;

  static constexpr std::string_view NAME     = "GET_BOOT_INFO";
  static constexpr std::uint8_t COMMAND_BYTE = 0x10;
  static constexpr bool RESPONSE_PAYLOAD     = true;
  static constexpr std::size_t RESPONSE_SIZE = 24;

  [[nodiscard]] constexpr std::size_t data_size() const noexcept { return 0; }

  constexpr auto operator()() const noexcept { return std::array<std::uint8_t, 0>{}; }

  static Response parse_response(std::span<std::uint8_t const> const t_response) {
    if (t_response.size() != RESPONSE_SIZE) {
      throw ResponseLengthError(t_response.size());
    }

    auto const copy_field = [&](std::size_t const t_offset, auto& t_field) {
      auto const field = t_response.subspan(t_offset, t_field.size());
      std::copy(field.begin(), field.end(), t_field.begin());
    };

    Response ret_val;
    copy_field(0, ret_val.boot_rom_version_);
    copy_field(4, ret_val.reserved1_);
    ret_val.flash_info_from_boot_ = byte_array_to_word<std::endian::little>(t_response.subspan<8, 4>());
    copy_field(12, ret_val.chip_id_);
    copy_field(18, ret_val.reserved2_);

    return ret_val;
  }
};

// Ref: https://github.com/pine64/blisp/blob/e45941c45e2418b2bb7e3dab49468a8f4d132439/lib/blisp.c#L355
struct ERASE_FLASH {
  std::uint32_t start_address_{};
  std::uint32_t end_address_{};

  using Response = void;

  static constexpr std::string_view NAME     = "ERASE_FLASH";
  static constexpr std::uint8_t COMMAND_BYTE = 0x30;
  static constexpr bool RESPONSE_PAYLOAD     = false;
  static constexpr std::size_t PACKET_SIZE   = 2 * sizeof(std::uint32_t);

  [[nodiscard]] constexpr std::size_t data_size() const noexcept { return PACKET_SIZE; }

  constexpr auto operator()() const noexcept {
    auto const start_arr = word_to_byte_array(this->start_address_);
    auto const end_arr   = word_to_byte_array(this->end_address_);

    std::array<std::uint8_t, PACKET_SIZE> ret_val{};
    auto iter = std::copy_n(start_arr.begin(), start_arr.size(), ret_val.begin());
    std::copy_n(end_arr.begin(), end_arr.size(), iter);

    return ret_val;
  }

  static void parse_response(std::span<std::uint8_t const> const t_response) {
    detail::expect_empty_response(t_response);
  }
};

// Ref: https://github.com/pine64/blisp/blob/e45941c45e2418b2bb7e3dab49468a8f4d132439/lib/blisp.c#L372
struct WRITE_FLASH {
  std::uint32_t start_address_{};
  std::span<std::uint8_t const> payload_;

  using Response = void;

  static constexpr std::string_view NAME     = "WRITE_FLASH";
  static constexpr std::uint8_t COMMAND_BYTE = 0x31;
  static constexpr bool RESPONSE_PAYLOAD     = false;

  [[nodiscard]] constexpr std::size_t data_size() const noexcept {
    return sizeof(this->start_address_) + this->payload_.size();
  }

  auto operator()() const {
    auto const start_arr = word_to_byte_array(this->start_address_);

    std::vector<std::uint8_t> ret_val(this->data_size());
    auto iter = std::copy_n(start_arr.begin(), start_arr.size(), ret_val.begin());
    std::copy(this->payload_.begin(), this->payload_.end(), iter);

    return ret_val;
  }

  static void parse_response(std::span<std::uint8_t const> const t_response) {
    detail::expect_empty_response(t_response);
  }
};

struct READ_FLASH_ID {
  using Response = FlashId;

  static constexpr std::string_view NAME     = "READ_FLASH_ID";
  static constexpr std::uint8_t COMMAND_BYTE = 0x36;
  static constexpr bool RESPONSE_PAYLOAD     = true;
  static constexpr std::size_t RESPONSE_SIZE = 4;

  [[nodiscard]] constexpr std::size_t data_size() const noexcept { return 0; }

  constexpr auto operator()() const noexcept { return std::array<std::uint8_t, 0>{}; }

  static Response parse_response(std::span<std::uint8_t const> const t_response) {
    if (t_response.size() != RESPONSE_SIZE) {
      throw ResponseLengthError(t_response.size());
    }

    Response ret_val;
    std::copy_n(t_response.begin(), ret_val.jedec_id_.size(), ret_val.jedec_id_.begin());  // last byte is unused
    return ret_val;
  }
};

/**
 * @brief Flash interface parameters, either the pin selection word or a complete flash configuration table
 */
struct FLASH_SET_PARA {
  std::vector<std::uint8_t> parameter_;

  using Response = void;

  static constexpr std::string_view NAME          = "FLASH_SET_PARA";
  static constexpr std::uint8_t COMMAND_BYTE      = 0x3B;
  static constexpr bool RESPONSE_PAYLOAD          = false;
  static constexpr std::uint32_t FLASH_PIN_SELECT = 0x0001'4100;

  static FLASH_SET_PARA from_flash_pin(std::uint32_t const t_flash_pin) {
    auto const pin_arr = word_to_byte_array(FLASH_PIN_SELECT | t_flash_pin);
    return FLASH_SET_PARA{std::vector<std::uint8_t>(pin_arr.begin(), pin_arr.end())};
  }

  [[nodiscard]] std::size_t data_size() const noexcept { return this->parameter_.size(); }

  auto const& operator()() const noexcept { return this->parameter_; }

  static void parse_response(std::span<std::uint8_t const> const t_response) {
    detail::expect_empty_response(t_response);
  }
};

static_assert(IspCommand<GET_BOOT_INFO>);
static_assert(IspCommand<ERASE_FLASH>);
static_assert(IspCommand<WRITE_FLASH>);
static_assert(IspCommand<READ_FLASH_ID>);
static_assert(IspCommand<FLASH_SET_PARA>);

}  // namespace bllink::command
