#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace bllink {

inline constexpr std::uint64_t HEAD_LENGTH         = 0x160;
inline constexpr std::uint32_t HEAD_MAGIC          = 0x4246'4E50;  // "BFNP"
inline constexpr std::uint32_t FLASH_MAGIC         = 0x4643'4647;  // "FCFG"
inline constexpr std::uint32_t CLOCK_MAGIC         = 0x5043'4647;  // "PCFG"
inline constexpr std::size_t SHA256_DIGEST_SIZE    = 32;
inline constexpr std::size_t HEADER_CRC_COVERAGE   = 0x15C;
inline constexpr std::size_t HASH_READ_BUFFER_SIZE = 4096;

using Sha256Digest = std::array<std::uint8_t, SHA256_DIGEST_SIZE>;

/**
 * @brief Byte offsets of the boot header fields. Magic numbers are stored big endian, every other word little endian.
 */
namespace layout {

inline constexpr std::uint64_t HEAD_MAGIC_OFFSET         = 0x000;
inline constexpr std::uint64_t FLASH_MAGIC_OFFSET        = 0x008;
inline constexpr std::uint64_t CLOCK_MAGIC_OFFSET        = 0x064;
inline constexpr std::uint64_t GROUP_IMAGE_OFFSET_OFFSET = 0x084;
inline constexpr std::uint64_t IMAGE_BODY_LENGTH_OFFSET  = 0x08C;
inline constexpr std::uint64_t SHA256_OFFSET             = 0x090;
inline constexpr std::uint64_t HEADER_CRC32_OFFSET       = 0x15C;

static_assert(SHA256_OFFSET + SHA256_DIGEST_SIZE <= HEADER_CRC_COVERAGE);
static_assert(HEADER_CRC32_OFFSET == HEADER_CRC_COVERAGE);
static_assert(HEADER_CRC32_OFFSET + sizeof(std::uint32_t) == HEAD_LENGTH);

}  // namespace layout

// 0xDEADBEEF as it appears in memory on the little endian target
inline constexpr std::array<std::uint8_t, 4> UNFILLED_HASH_WORD = {0xEF, 0xBE, 0xAD, 0xDE};

/**
 * @brief Placeholders written by image tools that have not computed the body hash yet. A stored hash equal to one of
 *        these is refilled instead of being reported as corrupted; anything else that mismatches is an error.
 */
inline constexpr auto UNFILLED_HASH_SENTINELS = []() {
  std::array<Sha256Digest, 2> ret_val{};

  // single word followed by zeros
  std::copy(UNFILLED_HASH_WORD.begin(), UNFILLED_HASH_WORD.end(), ret_val[0].begin());

  // word repeated over the whole digest
  for (std::size_t i = 0; i < SHA256_DIGEST_SIZE; i += UNFILLED_HASH_WORD.size()) {
    std::copy(UNFILLED_HASH_WORD.begin(), UNFILLED_HASH_WORD.end(), ret_val[1].begin() + i);
  }

  return ret_val;
}();

inline constexpr std::uint32_t ISP_DEFAULT_BAUD_RATE = 2'000'000;
inline constexpr std::size_t ISP_SYNC_LENGTH         = 300;
inline constexpr std::uint8_t ISP_SYNC_BYTE          = 0x55;

inline constexpr std::array<std::uint8_t, 22> ISP_USB_INIT = {'B', 'O', 'U', 'F', 'F', 'A', 'L', 'O', 'L', 'A', 'B',
                                                              '5', '5', '5', '5', 'R', 'E', 'S', 'E', 'T', 0x00, 0x01};
inline constexpr std::array<std::uint8_t, 12> ISP_HANDSHAKE = {0x50, 0x00, 0x08, 0x00, 0x38, 0xF0,
                                                               0x00, 0x20, 0x00, 0x00, 0x00, 0x18};

}  // namespace bllink
