#include "bl_image/image_header.hpp"
#include "bl_common/utility.hpp"
#include "bl_image/digest.hpp"
#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <fmt/format.h>
#include <fstream>
#include <ios>
#include <range/v3/algorithm/find.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <system_error>

namespace {

template <std::size_t N>
std::array<std::uint8_t, N> read_at(std::istream& t_file, std::uint64_t const t_offset) {
  std::array<char, N> buffer{};
  if (not t_file.seekg(static_cast<std::streamoff>(t_offset)) or
      not t_file.read(buffer.data(), static_cast<std::streamsize>(N))) {
    throw bllink::IoError(fmt::format("failed to read {} bytes at offset {:#x}", N, t_offset));
  }

  return std::bit_cast<std::array<std::uint8_t, N>>(buffer);
}

template <std::endian Endian>
std::uint32_t read_word_at(std::istream& t_file, std::uint64_t const t_offset) {
  return bllink::byte_array_to_word<Endian>(read_at<sizeof(std::uint32_t)>(t_file, t_offset));
}

bllink::Sha256Digest hash_image_body(std::istream& t_file, std::uint64_t const t_offset, std::uint64_t t_length) {
  if (not t_file.seekg(static_cast<std::streamoff>(t_offset))) {
    throw bllink::IoError(fmt::format("failed to seek to image body at {:#x}", t_offset));
  }

  bllink::Sha256 hasher;
  std::array<char, bllink::HASH_READ_BUFFER_SIZE> buffer{};
  while (t_length != 0) {
    auto const chunk_size = std::min<std::uint64_t>(t_length, buffer.size());
    t_file.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
    auto const byte_read = static_cast<std::size_t>(t_file.gcount());
    if (byte_read == 0) {
      break;
    }

    auto const bytes = std::bit_cast<std::array<std::uint8_t, bllink::HASH_READ_BUFFER_SIZE>>(buffer);
    hasher.update(std::span{bytes}.first(byte_read));
    t_length -= byte_read;
  }

  if (t_file.bad()) {
    throw bllink::IoError("failed to read image body");
  }

  // a short body leaves eof set, the header is read afterwards
  t_file.clear();
  return hasher.finish();
}

}  // namespace

namespace bllink {

RepairPlan check(std::istream& t_file, std::uint64_t const t_file_length) {
  t_file.clear();

  if (auto const head_magic = read_word_at<std::endian::big>(t_file, layout::HEAD_MAGIC_OFFSET);
      head_magic != HEAD_MAGIC) {
    throw MagicNumberError(head_magic);
  }

  if (t_file_length < HEAD_LENGTH) {
    throw HeadLengthError(t_file_length);
  }

  if (auto const flash_magic = read_word_at<std::endian::big>(t_file, layout::FLASH_MAGIC_OFFSET);
      flash_magic != FLASH_MAGIC) {
    throw FlashConfigMagicError(flash_magic);
  }

  if (auto const clock_magic = read_word_at<std::endian::big>(t_file, layout::CLOCK_MAGIC_OFFSET);
      clock_magic != CLOCK_MAGIC) {
    throw ClockConfigMagicError(clock_magic);
  }

  auto const group_image_offset = read_word_at<std::endian::little>(t_file, layout::GROUP_IMAGE_OFFSET_OFFSET);
  auto const image_body_length  = read_word_at<std::endian::little>(t_file, layout::IMAGE_BODY_LENGTH_OFFSET);
  if (std::uint64_t{group_image_offset} + std::uint64_t{image_body_length} > t_file_length) {
    throw ImageOffsetOverflowError(t_file_length, group_image_offset, image_body_length);
  }

  auto const stored_hash     = read_at<SHA256_DIGEST_SIZE>(t_file, layout::SHA256_OFFSET);
  auto const calculated_hash = ::hash_image_body(t_file, group_image_offset, image_body_length);
  spdlog::debug("Image body at {:#x}, length {:#x}, sha256: {}", group_image_offset, image_body_length,
                to_hex_string(calculated_hash));

  RepairPlan plan;
  if (calculated_hash != stored_hash) {
    if (ranges::find(UNFILLED_HASH_SENTINELS, stored_hash) == UNFILLED_HASH_SENTINELS.end()) {
      throw Sha256ChecksumError(stored_hash);
    }

    plan.refill_hash_ = calculated_hash;
  }

  // the crc has to match the header as it will be once the hash is refilled
  auto header = read_at<HEADER_CRC_COVERAGE>(t_file, 0);
  if (plan.refill_hash_.has_value()) {
    auto const hash_start = header.begin() + static_cast<std::ptrdiff_t>(layout::SHA256_OFFSET);
    std::copy(plan.refill_hash_->begin(), plan.refill_hash_->end(), hash_start);
  }

  auto const calculated_header_crc = header_crc32(header);
  auto const stored_header_crc     = read_word_at<std::endian::little>(t_file, layout::HEADER_CRC32_OFFSET);
  spdlog::debug("Header crc32 stored: {:#010x}, calculated: {:#010x}", stored_header_crc, calculated_header_crc);

  if (stored_header_crc != calculated_header_crc or plan.refill_hash_.has_value()) {
    plan.refill_header_crc_ = calculated_header_crc;
  }

  return plan;
}

RepairPlan check(std::istream& t_file) {
  t_file.clear();
  if (not t_file.seekg(0, std::ios::end)) {
    throw IoError("failed to measure file length");
  }

  auto const file_length = static_cast<std::uint64_t>(t_file.tellg());
  return check(t_file, file_length);
}

void process(std::ostream& t_file, RepairPlan const& t_plan) {
  if (auto const& hash = t_plan.refill_hash_; hash.has_value()) {
    auto const byte_stream = std::bit_cast<std::array<char, SHA256_DIGEST_SIZE>>(*hash);
    t_file.seekp(static_cast<std::streamoff>(layout::SHA256_OFFSET));
    t_file.write(byte_stream.data(), byte_stream.size());
  }

  if (auto const& header_crc = t_plan.refill_header_crc_; header_crc.has_value()) {
    auto const byte_stream = std::bit_cast<std::array<char, sizeof(std::uint32_t)>>(word_to_byte_array(*header_crc));
    t_file.seekp(static_cast<std::streamoff>(layout::HEADER_CRC32_OFFSET));
    t_file.write(byte_stream.data(), byte_stream.size());
  }

  if (not t_file.flush()) {
    throw IoError("failed to write repaired header");
  }
}

RepairPlan patch_file(std::filesystem::path const& t_input, std::filesystem::path const& t_output) {
  auto const plan = [&]() {
    std::ifstream input_file{t_input, std::ios::in | std::ios::binary};
    if (not input_file.is_open()) {
      throw IoError(fmt::format("cannot open {}", t_input.string()));
    }

    return check(input_file);
  }();

  if (not(std::filesystem::exists(t_output) and std::filesystem::equivalent(t_input, t_output))) {
    std::error_code err;
    std::filesystem::copy_file(t_input, t_output, std::filesystem::copy_options::overwrite_existing, err);
    if (err) {
      throw IoError(fmt::format("cannot copy {} to {}: {}", t_input.string(), t_output.string(), err.message()));
    }
  }

  if (plan.empty()) {
    return plan;
  }

  std::fstream output_file{t_output, std::ios::in | std::ios::out | std::ios::binary};
  if (not output_file.is_open()) {
    throw IoError(fmt::format("cannot open {} for writing", t_output.string()));
  }

  spdlog::debug("Patching {}", t_output.string());
  process(output_file, plan);
  return plan;
}

}  // namespace bllink
