#include "bl_common/error.hpp"
#include "bl_common/utility.hpp"
#include "bl_image/image_header.hpp"
#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace bpo = boost::program_options;

namespace {

void print_plan(bllink::RepairPlan const& t_plan) {
  if (t_plan.empty()) {
    spdlog::info("Image header is consistent, nothing to patch");
    return;
  }

  if (t_plan.refill_hash_.has_value()) {
    spdlog::info("Refill sha256: {}", bllink::to_hex_string(*t_plan.refill_hash_));
  }

  if (t_plan.refill_header_crc_.has_value()) {
    spdlog::info("Refill header crc32: {:#010x}", *t_plan.refill_header_crc_);
  }
}

}  // namespace

void patch_image(std::filesystem::path const& t_input, std::filesystem::path const& t_output, bool const t_dry_run) {
  if (not std::filesystem::is_regular_file(t_input)) {
    throw std::invalid_argument(fmt::format("{} is not a regular file", t_input.string()));
  }

  if (t_dry_run) {
    std::ifstream input_file{t_input, std::ios::in | std::ios::binary};
    if (not input_file.is_open()) {
      throw bllink::IoError(fmt::format("cannot open {}", t_input.string()));
    }

    print_plan(bllink::check(input_file));
    return;
  }

  auto const plan = bllink::patch_file(t_input, t_output);
  print_plan(plan);
  spdlog::info("{} saved to {}", plan.empty() ? "Image" : "Patched image", t_output.string());
}

int main(int argc, const char** argv) {
  try {
    bpo::options_description patch_option("Parameter for patch");
    patch_option.add_options()                                                               //
      ("verbose", "Show debug message during execution")                                     //
      ("input", bpo::value<std::string>()->required(), "image file to patch")                //
      ("output", bpo::value<std::string>(), "output file name, input is overwritten if none")  //
      ("dry-run", "Only report what would be patched")                                       //
      ("help", "Show this help message and exit");

    bpo::positional_options_description pd;
    pd.add("input", 1).add("output", 1);

    bpo::variables_map vm;
    bpo::store(bpo::command_line_parser(argc, argv).options(patch_option).positional(pd).run(), vm);
    if (vm.count("help") != 0) {
      std::cout << patch_option << '\n';
      return EXIT_SUCCESS;
    }

    notify(vm);
    if (vm.count("verbose") != 0) {
      spdlog::set_level(spdlog::level::debug);
    }

    auto const input  = std::filesystem::path{vm["input"].as<std::string>()};
    auto const output = vm.count("output") != 0 ? std::filesystem::path{vm["output"].as<std::string>()} : input;
    patch_image(input, output, vm.count("dry-run") != 0);
  } catch (bllink::ImageError const& t_e) {
    spdlog::error("{}", t_e.what());
    return EXIT_FAILURE;
  } catch (std::exception const& t_e) {
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
