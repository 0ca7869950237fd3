#include "catch2/catch_test_macros.hpp"
#include "catch2/generators/catch_generators.hpp"
#include "bl_common/constants.hpp"
#include "bl_common/error.hpp"
#include "bl_image/image_header.hpp"
#include "image_fixture.hpp"
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

using bllink::test::make_unfilled_image;
using bllink::test::make_valid_image;
using bllink::test::to_stream;

namespace {

template <typename Error>
Error check_failure(std::vector<std::uint8_t> const& t_image) {
  auto stream = to_stream(t_image);
  try {
    [[maybe_unused]] auto const plan = bllink::check(stream, t_image.size());
  } catch (Error const& t_e) {
    return t_e;
  }

  FAIL("check should have failed");
  throw std::logic_error("unreachable");
}

}  // namespace

TEST_CASE("check accepts a consistent image", "[Check Image]") {
  auto const image = make_valid_image();
  REQUIRE(image.size() == 4256);

  auto stream     = to_stream(image);
  auto const plan = bllink::check(stream, image.size());
  CHECK(plan.empty());
  CHECK_FALSE(plan.refill_hash_.has_value());
  CHECK_FALSE(plan.refill_header_crc_.has_value());

  SECTION("length measured from the stream") {
    auto measured = to_stream(image);
    CHECK(bllink::check(measured) == plan);
  }

  SECTION("same plan on every call") {
    CHECK(bllink::check(stream, image.size()) == plan);
  }
}

TEST_CASE("check reports wrong magic numbers", "[Check Image]") {
  auto image = make_valid_image();

  SECTION("head magic") {
    bllink::test::put_bytes(image, 0x00, std::array<std::uint8_t, 4>{0x11, 0x22, 0x33, 0x44});
    CHECK(check_failure<bllink::MagicNumberError>(image).wrong_magic() == 0x11223344U);
  }

  SECTION("flash config magic") {
    bllink::test::put_bytes(image, 0x08, std::array<std::uint8_t, 4>{0x55, 0x66, 0x77, 0x88});
    CHECK(check_failure<bllink::FlashConfigMagicError>(image).wrong_magic() == 0x55667788U);
  }

  SECTION("clock config magic") {
    bllink::test::put_bytes(image, 0x64, std::array<std::uint8_t, 4>{0x22, 0x33, 0x10, 0x37});
    CHECK(check_failure<bllink::ClockConfigMagicError>(image).wrong_magic() == 0x22331037U);
  }

  SECTION("head magic is reported before the other magics") {
    bllink::test::put_bytes(image, 0x00, std::array<std::uint8_t, 4>{0x11, 0x22, 0x33, 0x44});
    bllink::test::put_bytes(image, 0x08, std::array<std::uint8_t, 4>{0x55, 0x66, 0x77, 0x88});
    CHECK(check_failure<bllink::MagicNumberError>(image).wrong_magic() == 0x11223344U);
  }
}

TEST_CASE("check reports a truncated image", "[Check Image]") {
  auto image = make_valid_image();

  SECTION("shorter than the header") {
    image.resize(0x123);
    CHECK(check_failure<bllink::HeadLengthError>(image).wrong_length() == 0x123U);
  }

  SECTION("too short to be checked at all") {
    image.resize(2);
    CHECK_NOTHROW(check_failure<bllink::IoError>(image));
  }

  SECTION("body range past the end of file") {
    image.resize(0x1037);
    auto const error = check_failure<bllink::ImageOffsetOverflowError>(image);
    CHECK(error.file_length() == 0x1037U);
    CHECK(error.wrong_image_offset() == 0x1000U);
    CHECK(error.wrong_image_length() == 0xA0U);
  }

  SECTION("body range overflowing 32 bits") {
    bllink::test::put_word_le(image, bllink::layout::GROUP_IMAGE_OFFSET_OFFSET, 0xFFFF'FF00U);
    bllink::test::put_word_le(image, bllink::layout::IMAGE_BODY_LENGTH_OFFSET, 0x200U);
    auto const error = check_failure<bllink::ImageOffsetOverflowError>(image);
    CHECK(error.wrong_image_offset() == 0xFFFF'FF00U);
    CHECK(error.wrong_image_length() == 0x200U);
  }
}

TEST_CASE("check reports a corrupted body hash", "[Check Image]") {
  auto image              = make_valid_image();
  auto const old_checksum = bllink::test::body_digest(image);

  auto wrong_checksum = old_checksum;
  wrong_checksum[0] ^= 0x01U;
  bllink::test::put_bytes(image, bllink::layout::SHA256_OFFSET, wrong_checksum);

  auto const error = check_failure<bllink::Sha256ChecksumError>(image);
  CHECK(error.wrong_checksum() == wrong_checksum);
  CHECK(error.wrong_checksum() != old_checksum);
}

TEST_CASE("check schedules refills for an image with a placeholder hash", "[Check Image]") {
  auto const expected = make_valid_image();
  auto const index    = GENERATE(std::size_t{0}, std::size_t{1});
  auto const image    = make_unfilled_image(index);

  auto stream     = to_stream(image);
  auto const plan = bllink::check(stream, image.size());
  REQUIRE(plan.refill_hash_.has_value());
  REQUIRE(plan.refill_header_crc_.has_value());
  CHECK(*plan.refill_hash_ == bllink::test::body_digest(expected));

  // computed over the header with the new hash in place, not over the placeholder
  CHECK(*plan.refill_header_crc_ == bllink::test::get_word_le(expected, bllink::layout::HEADER_CRC32_OFFSET));
}

TEST_CASE("check schedules a crc refill when the hash is valid but crc is stale", "[Check Image]") {
  auto const expected = make_valid_image();
  auto image          = expected;
  bllink::test::put_word_le(image, bllink::layout::HEADER_CRC32_OFFSET, 0x1234'5678U);

  auto stream     = to_stream(image);
  auto const plan = bllink::check(stream, image.size());
  CHECK_FALSE(plan.refill_hash_.has_value());
  REQUIRE(plan.refill_header_crc_.has_value());
  CHECK(*plan.refill_header_crc_ == bllink::test::get_word_le(expected, bllink::layout::HEADER_CRC32_OFFSET));
}

TEST_CASE("check hashes only the declared body", "[Check Image]") {
  auto image = make_valid_image();
  image.insert(image.end(), 64, 0x5A);

  auto stream = to_stream(image);
  CHECK(bllink::check(stream, image.size()).empty());
}
