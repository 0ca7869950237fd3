#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "bl_common/constants.hpp"
#include "bl_common/utility.hpp"

namespace bllink {

/**
 * @brief Base of every failure reported while checking or repairing an image. No partial result is ever returned
 *        alongside one of these.
 */
class ImageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class IoError : public ImageError {
 public:
  explicit IoError(std::string const& t_what) : ImageError(fmt::format("I/O error: {}", t_what)) {}
};

class WrongMagicError : public ImageError {
  std::uint32_t wrong_magic_;

 protected:
  WrongMagicError(std::string_view t_field, std::uint32_t const t_wrong_magic)
    : ImageError(fmt::format("incorrect {} {:#010x}", t_field, t_wrong_magic)), wrong_magic_{t_wrong_magic} {}

 public:
  [[nodiscard]] std::uint32_t wrong_magic() const noexcept { return this->wrong_magic_; }
};

class MagicNumberError : public WrongMagicError {
 public:
  explicit MagicNumberError(std::uint32_t const t_wrong_magic) : WrongMagicError("magic number", t_wrong_magic) {}
};

class FlashConfigMagicError : public WrongMagicError {
 public:
  explicit FlashConfigMagicError(std::uint32_t const t_wrong_magic)
    : WrongMagicError("flash config magic", t_wrong_magic) {}
};

class ClockConfigMagicError : public WrongMagicError {
 public:
  explicit ClockConfigMagicError(std::uint32_t const t_wrong_magic)
    : WrongMagicError("clock config magic", t_wrong_magic) {}
};

class HeadLengthError : public ImageError {
  std::uint64_t wrong_length_;

 public:
  explicit HeadLengthError(std::uint64_t const t_wrong_length)
    : ImageError(fmt::format("file is too short to include an image header, should include {} bytes but only {}",
                             HEAD_LENGTH, t_wrong_length)),
      wrong_length_{t_wrong_length} {}

  [[nodiscard]] std::uint64_t wrong_length() const noexcept { return this->wrong_length_; }
};

class ImageOffsetOverflowError : public ImageError {
  std::uint64_t file_length_;
  std::uint32_t wrong_image_offset_;
  std::uint32_t wrong_image_length_;

 public:
  ImageOffsetOverflowError(std::uint64_t const t_file_length, std::uint32_t const t_offset,
                           std::uint32_t const t_length)
    : ImageError(fmt::format("file length is only {}, but image offset is {} and image length is {}", t_file_length,
                             t_offset, t_length)),
      file_length_{t_file_length},
      wrong_image_offset_{t_offset},
      wrong_image_length_{t_length} {}

  [[nodiscard]] std::uint64_t file_length() const noexcept { return this->file_length_; }
  [[nodiscard]] std::uint32_t wrong_image_offset() const noexcept { return this->wrong_image_offset_; }
  [[nodiscard]] std::uint32_t wrong_image_length() const noexcept { return this->wrong_image_length_; }
};

class Sha256ChecksumError : public ImageError {
  Sha256Digest wrong_checksum_;

 public:
  explicit Sha256ChecksumError(Sha256Digest const& t_wrong_checksum)
    : ImageError(fmt::format("wrong sha256 verification: {}", to_hex_string(t_wrong_checksum))),
      wrong_checksum_{t_wrong_checksum} {}

  [[nodiscard]] Sha256Digest const& wrong_checksum() const noexcept { return this->wrong_checksum_; }
};

/**
 * @brief Base of the failures reported while encoding or decoding ISP commands
 */
class IspError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ResponseLengthError : public IspError {
  std::size_t wrong_length_;

 public:
  explicit ResponseLengthError(std::size_t const t_wrong_length)
    : IspError(fmt::format("Wrong response length: {}", t_wrong_length)), wrong_length_{t_wrong_length} {}

  [[nodiscard]] std::size_t wrong_length() const noexcept { return this->wrong_length_; }
};

class IspStatusError : public IspError {
  std::uint16_t code_;

 public:
  explicit IspStatusError(std::uint16_t const t_code)
    : IspError(fmt::format("Operation failed with error code \"{:04X}\"", t_code)), code_{t_code} {}

  [[nodiscard]] std::uint16_t code() const noexcept { return this->code_; }
};

}  // namespace bllink
