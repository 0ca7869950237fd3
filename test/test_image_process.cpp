#include "catch2/catch_test_macros.hpp"
#include "bl_common/constants.hpp"
#include "bl_image/image_header.hpp"
#include "image_fixture.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

using bllink::test::from_stream;
using bllink::test::make_unfilled_image;
using bllink::test::make_valid_image;
using bllink::test::to_stream;

namespace {

/**
 * @brief Scratch directory removed with everything in it when the test case ends
 */
struct TempDir {
  std::filesystem::path path_;

  explicit TempDir(std::string const& t_name) : path_{std::filesystem::temp_directory_path() / t_name} {
    std::filesystem::remove_all(this->path_);
    std::filesystem::create_directories(this->path_);
  }

  TempDir(TempDir const&)            = delete;
  TempDir& operator=(TempDir const&) = delete;

  ~TempDir() {
    std::error_code err;
    std::filesystem::remove_all(this->path_, err);
  }
};

void write_file(std::filesystem::path const& t_file, std::vector<std::uint8_t> const& t_image) {
  std::ofstream file{t_file, std::ios::out | std::ios::binary | std::ios::trunc};
  file.write(std::string(t_image.begin(), t_image.end()).data(), static_cast<std::streamsize>(t_image.size()));
  REQUIRE(file.good());
}

std::vector<std::uint8_t> read_file(std::filesystem::path const& t_file) {
  std::ifstream file{t_file, std::ios::in | std::ios::binary};
  REQUIRE(file.is_open());
  std::string const content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
  return std::vector<std::uint8_t>(content.begin(), content.end());
}

}  // namespace

TEST_CASE("process writes the planned fields only", "[Process Image]") {
  auto const original = make_unfilled_image();
  auto stream         = to_stream(original);

  auto const plan = bllink::check(stream, original.size());
  REQUIRE(plan.refill_hash_.has_value());
  REQUIRE(plan.refill_header_crc_.has_value());

  bllink::process(stream, plan);
  auto const patched = from_stream(stream);
  REQUIRE(patched.size() == original.size());

  SECTION("hash and crc are written at their offsets") {
    auto const hash_begin = patched.begin() + static_cast<std::ptrdiff_t>(bllink::layout::SHA256_OFFSET);
    CHECK(std::equal(plan.refill_hash_->begin(), plan.refill_hash_->end(), hash_begin));
    CHECK(bllink::test::get_word_le(patched, bllink::layout::HEADER_CRC32_OFFSET) == *plan.refill_header_crc_);
  }

  SECTION("every other byte is unchanged") {
    auto const is_patched_field = [](std::size_t const t_offset) {
      auto const in_hash = t_offset >= bllink::layout::SHA256_OFFSET and
                           t_offset < bllink::layout::SHA256_OFFSET + bllink::SHA256_DIGEST_SIZE;
      auto const in_crc  = t_offset >= bllink::layout::HEADER_CRC32_OFFSET and t_offset < bllink::HEAD_LENGTH;
      return in_hash or in_crc;
    };

    for (std::size_t i = 0; i < original.size(); ++i) {
      if (not is_patched_field(i) and original[i] != patched[i]) {
        FAIL("byte " << i << " changed");
      }
    }
  }

  SECTION("result is the consistent image") {
    CHECK(patched == make_valid_image());
  }

  SECTION("nothing left to patch afterwards") {
    auto const replan = bllink::check(stream, patched.size());
    CHECK(replan.empty());
    CHECK(replan == bllink::RepairPlan{});
  }
}

TEST_CASE("process leaves the hash alone when only the crc is planned", "[Process Image]") {
  auto image = make_valid_image();
  bllink::test::put_word_le(image, bllink::layout::HEADER_CRC32_OFFSET, 0U);
  auto stream = to_stream(image);

  auto const plan = bllink::check(stream, image.size());
  REQUIRE_FALSE(plan.refill_hash_.has_value());
  REQUIRE(plan.refill_header_crc_.has_value());

  bllink::process(stream, plan);
  CHECK(from_stream(stream) == make_valid_image());
  CHECK(bllink::check(stream, image.size()).empty());
}

TEST_CASE("process with an empty plan does not modify the image", "[Process Image]") {
  auto const image = make_unfilled_image(1);
  auto stream      = to_stream(image);

  bllink::process(stream, bllink::RepairPlan{});
  CHECK(from_stream(stream) == image);
}

TEST_CASE("process reports a stream that cannot be written", "[Process Image]") {
  auto const image = make_unfilled_image();
  auto stream      = to_stream(image);
  auto const plan  = bllink::check(stream, image.size());
  REQUIRE_FALSE(plan.empty());

  SECTION("stream without buffer") {
    std::ostream no_buffer{nullptr};
    CHECK_THROWS_AS(bllink::process(no_buffer, plan), bllink::IoError);
  }

  SECTION("stream already failed") {
    auto failed = to_stream(image);
    failed.setstate(std::ios::badbit);
    CHECK_THROWS_AS(bllink::process(failed, plan), bllink::IoError);
  }

  SECTION("crc only") {
    std::ostream no_buffer{nullptr};
    CHECK_THROWS_AS(bllink::process(no_buffer, bllink::RepairPlan{std::nullopt, 0x1234'5678U}), bllink::IoError);
  }
}

TEST_CASE("patch file repairs the image on disk", "[Process Image]") {
  TempDir const dir{"bllink_test_patch_file"};
  auto const input = dir.path_ / "image.bin";
  write_file(input, make_unfilled_image());

  SECTION("in place") {
    auto const plan = bllink::patch_file(input, input);
    CHECK_FALSE(plan.empty());
    CHECK(read_file(input) == make_valid_image());
  }

  SECTION("in place through another path to the same file") {
    auto const same_file = dir.path_ / "." / "image.bin";
    REQUIRE(same_file != input);

    auto const plan = bllink::patch_file(input, same_file);
    CHECK(plan.refill_hash_.has_value());
    CHECK(read_file(input) == make_valid_image());
  }

  SECTION("to a separate output") {
    auto const output = dir.path_ / "patched.bin";
    auto const plan   = bllink::patch_file(input, output);
    CHECK(plan.refill_header_crc_.has_value());
    CHECK(read_file(output) == make_valid_image());
    CHECK(read_file(input) == make_unfilled_image());

    std::ifstream patched{output, std::ios::in | std::ios::binary};
    CHECK(bllink::check(patched).empty());
  }

  SECTION("consistent image is copied unchanged") {
    write_file(input, make_valid_image());
    auto const output = dir.path_ / "copy.bin";
    CHECK(bllink::patch_file(input, output).empty());
    CHECK(read_file(output) == make_valid_image());
  }

  SECTION("nothing is written when the check fails") {
    auto broken = make_unfilled_image();
    bllink::test::put_word_be(broken, bllink::layout::HEAD_MAGIC_OFFSET, 0x1122'3344);
    write_file(input, broken);

    auto const output = dir.path_ / "never.bin";
    CHECK_THROWS_AS(bllink::patch_file(input, output), bllink::MagicNumberError);
    CHECK_FALSE(std::filesystem::exists(output));
    CHECK(read_file(input) == broken);
  }

  SECTION("missing input") {
    CHECK_THROWS_AS(bllink::patch_file(dir.path_ / "missing.bin", dir.path_ / "out.bin"), bllink::IoError);
  }
}
