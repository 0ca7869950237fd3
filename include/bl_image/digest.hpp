#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include <boost/crc.hpp>
#include <fmt/format.h>
#include <mbedtls/sha256.h>

#include "bl_common/constants.hpp"

namespace bllink {

/**
 * @brief Incremental SHA-256 over the image body, owns the underlying mbedtls context
 */
class Sha256 {
  mbedtls_sha256_context context_{};

  static void check_result(int const t_ret, std::string_view t_step) {
    if (t_ret != 0) {
      throw std::runtime_error(fmt::format("mbedtls_sha256_{} failed with {}", t_step, t_ret));
    }
  }

 public:
  Sha256() {
    mbedtls_sha256_init(&this->context_);
    if (auto const ret = mbedtls_sha256_starts(&this->context_, 0); ret != 0) {
      mbedtls_sha256_free(&this->context_);
      this->check_result(ret, "starts");
    }
  }

  Sha256(Sha256 const&)            = delete;
  Sha256(Sha256&&)                 = delete;
  Sha256& operator=(Sha256 const&) = delete;
  Sha256& operator=(Sha256&&)      = delete;

  ~Sha256() { mbedtls_sha256_free(&this->context_); }

  void update(std::span<std::uint8_t const> const t_bytes) {
    this->check_result(mbedtls_sha256_update(&this->context_, t_bytes.data(), t_bytes.size()), "update");
  }

  [[nodiscard]] Sha256Digest finish() {
    Sha256Digest ret_val{};
    this->check_result(mbedtls_sha256_finish(&this->context_, ret_val.data()), "finish");
    return ret_val;
  }
};

// CRC-32/ISO-HDLC, same as zlib and Ethernet
[[nodiscard]] inline std::uint32_t header_crc32(std::span<std::uint8_t const> const t_bytes) noexcept {
  boost::crc_32_type crc;
  crc.process_bytes(t_bytes.data(), t_bytes.size());
  return crc.checksum();
}

}  // namespace bllink
