#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "bl_common/error.hpp"
#include "bl_common/utility.hpp"
#include "bl_serial/isp_cmd.hpp"

namespace bllink {

/**
 * @brief Framing used by the boot ROM on the UART interface.
 *
 *        request:  | command | checksum | length (LE16) | data ...         |
 *        success:  | 'O' 'K' | length (LE16) | data ...  (payload commands only)
 *        failure:  | 'F' 'L' | error code (LE16) |
 *
 *        The checksum is the low byte of the sum of both length bytes and every data byte.
 */
class IspProtocol {
 private:
  static constexpr std::size_t REQUEST_HEADER_SIZE = 4;
  static constexpr std::size_t STATUS_SIZE         = 2;
  static constexpr std::size_t LENGTH_SIZE         = 2;
  static constexpr std::size_t MAX_DATA_SIZE       = 0xFFFF;

  static constexpr std::array<std::uint8_t, STATUS_SIZE> OK_STATUS   = {'O', 'K'};
  static constexpr std::array<std::uint8_t, STATUS_SIZE> FAIL_STATUS = {'F', 'L'};

  static constexpr auto has_status = [](auto t_begin, auto const& t_status) {
    return std::equal(t_status.begin(), t_status.end(), t_begin,
                      [](auto const t_lhs, auto const t_rhs) { return t_lhs == to_byte(t_rhs); });
  };

  bool expect_payload_ = false;

 public:
  template <command::IspCommand Cmd>
  [[nodiscard]] static std::uint8_t check_sum(Cmd const& t_cmd) {
    auto const data_content = t_cmd();
    auto const size_of_data = std::size(data_content);
    auto const sum = std::accumulate(std::begin(data_content), std::end(data_content),
                                     static_cast<std::uint32_t>((size_of_data & 0xFFU) + (size_of_data >> 8U)));
    return to_byte(sum & 0xFFU);
  }

  template <command::IspCommand Cmd>
  std::vector<std::uint8_t> generate_packet(Cmd const& t_cmd) {
    auto const& data_content = t_cmd();
    auto const size_of_data  = std::size(data_content);
    if (size_of_data > MAX_DATA_SIZE) {
      throw std::length_error(fmt::format("{}: data size {} exceeds {}", Cmd::NAME, size_of_data, MAX_DATA_SIZE));
    }

    auto packet = std::vector<std::uint8_t>{
      Cmd::COMMAND_BYTE,
      check_sum(t_cmd),
      to_byte(size_of_data & 0xFFU),
      to_byte(size_of_data >> 8U),
    };
    packet.reserve(REQUEST_HEADER_SIZE + size_of_data);
    packet.insert(packet.end(), std::begin(data_content), std::end(data_content));

    this->expect_payload_ = Cmd::RESPONSE_PAYLOAD;
    return packet;
  }

  /**
   * @brief Checks the status bytes, strips the length field of payload responses, and hands the rest to the command's
   *        own parser. Bytes following a response that should carry no payload are passed through so that the parser
   *        rejects them.
   *
   * @throw IspStatusError if the boot ROM answered with a failure status
   * @throw ResponseLengthError if the payload is shorter than announced, or does not have the expected size
   * @return Cmd::Response
   */
  template <command::IspCommand Cmd>
  auto decode_packet(Cmd const& /* unused */, auto t_buffer, std::size_t t_byte_read) const {
    std::vector<std::uint8_t> vec;
    vec.reserve(t_byte_read);
    std::transform(t_buffer, std::next(t_buffer, static_cast<std::ptrdiff_t>(t_byte_read)), std::back_inserter(vec),
                   to_byte);

    spdlog::debug("Raw bytes (len = {}):\n", vec.size());
    print_byte_stream(vec.begin(), vec.end());

    if (vec.size() < STATUS_SIZE) {
      throw std::runtime_error(fmt::format("Response too short ({} byte)", vec.size()));
    }

    if (has_status(vec.begin(), FAIL_STATUS)) {
      if (vec.size() < STATUS_SIZE + LENGTH_SIZE) {
        throw std::runtime_error("Failure response without error code");
      }

      throw IspStatusError(byte_array_to_halfword(vec[STATUS_SIZE], vec[STATUS_SIZE + 1]));
    }

    if (not has_status(vec.begin(), OK_STATUS)) {
      throw std::runtime_error(fmt::format("Unexpected response status \"{:02X}\"",
                                           fmt::join(vec.begin(), vec.begin() + STATUS_SIZE, " ")));
    }

    auto payload = std::span<std::uint8_t const>{vec}.subspan(STATUS_SIZE);
    if constexpr (Cmd::RESPONSE_PAYLOAD) {
      if (payload.size() < LENGTH_SIZE) {
        throw ResponseLengthError(payload.size());
      }

      auto const data_size = byte_array_to_halfword(payload[0], payload[1]);
      payload              = payload.subspan(LENGTH_SIZE);
      if (payload.size() < data_size) {
        throw ResponseLengthError(payload.size());
      }

      payload = payload.first(data_size);
    }

    return Cmd::parse_response(payload);
  }

  /**
   * @brief This function checks whether the boot ROM sent a complete response. A failure status is always followed by
   *        a two byte error code, a success status is followed by a length and the payload only if the last command
   *        generated expects one:
   *
   *        4F 4B | 18 00 | XX XX ... XX |  XX XX
   *        ^^^^^   ^^^^^   ^^^^^^^^^^^^    ^^^^^
   *         OK    length   24 byte data    not part of the response
   *
   * @return pair of iterator past the response and whether the response is complete
   */
  auto complete_condition(auto const t_begin, auto const t_end) const {
    auto const read_size = static_cast<std::size_t>(t_end - t_begin);
    if (read_size < STATUS_SIZE) {
      return std::pair{t_end, false};
    }

    auto const is_ok   = has_status(t_begin, OK_STATUS);
    auto const is_fail = has_status(t_begin, FAIL_STATUS);

    std::size_t response_size = STATUS_SIZE;
    if (is_fail or (is_ok and this->expect_payload_)) {
      response_size += LENGTH_SIZE;
    }

    if (read_size < response_size) {
      return std::pair{t_end, false};
    }

    if (is_ok and this->expect_payload_) {
      response_size += byte_array_to_halfword(to_byte(t_begin[STATUS_SIZE]), to_byte(t_begin[STATUS_SIZE + 1]));
      if (read_size < response_size) {
        return std::pair{t_end, false};
      }
    }

    return std::pair{std::next(t_begin, static_cast<std::ptrdiff_t>(response_size)), true};
  }
};

}  // namespace bllink
