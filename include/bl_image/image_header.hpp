#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>

#include "bl_common/constants.hpp"
#include "bl_common/error.hpp"

namespace bllink {

/**
 * @brief Writes needed to make a boot header consistent, as computed by check(). An empty field means the
 *        corresponding bytes are already correct. Only valid against the exact file content it was computed from.
 */
struct RepairPlan {
  std::optional<Sha256Digest> refill_hash_;
  std::optional<std::uint32_t> refill_header_crc_;

  [[nodiscard]] constexpr bool empty() const noexcept {
    return not this->refill_hash_.has_value() and not this->refill_header_crc_.has_value();
  }

  constexpr bool operator==(RepairPlan const& /* unused */) const noexcept = default;
};

/**
 * @brief Verifies the boot header of an image without modifying it.
 *
 *        Magic numbers are checked first (head, then file length, then flash and clock config), then the body range
 *        declared by the header. The body hash may be one of the unfilled placeholders, in which case it is scheduled
 *        for refill. The header CRC is always computed over the header as it will be after the hash refill.
 *
 * @param t_file        Readable and seekable image content, the read position is left unspecified
 * @param t_file_length Total length of the image in bytes
 *
 * @throw ImageError subclass describing the first inconsistency found, IoError if the stream cannot be read
 * @return RepairPlan
 */
[[nodiscard]] RepairPlan check(std::istream& t_file, std::uint64_t t_file_length);

/**
 * @brief Same as check(std::istream&, std::uint64_t), the length is measured by seeking to the end of the stream
 */
[[nodiscard]] RepairPlan check(std::istream& t_file);

/**
 * @brief Applies a plan produced by check() on the same content. Nothing is re-validated.
 *
 * @throw IoError if seeking or writing fails
 */
void process(std::ostream& t_file, RepairPlan const& t_plan);

/**
 * @brief Checks t_input and, if the check succeeds, writes the repaired image to t_output. t_output may be t_input or
 *        any other path to the same file, in which case the file is repaired in place.
 *
 * @throw ImageError as check() does, nothing is written in that case. IoError if copying or writing fails
 * @return the RepairPlan that was applied
 */
RepairPlan patch_file(std::filesystem::path const& t_input, std::filesystem::path const& t_output);

}  // namespace bllink
