#include "bl_common/error.hpp"
#include "bl_image/image_header.hpp"
#include "bl_serial/flash_config.hpp"
#include "bl_serial/isp_cmd.hpp"
#include "bl_serial/isp_frame.hpp"
#include "bl_serial/serial_port.hpp"
#include <algorithm>
#include <boost/program_options.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <span>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

/**
 * @brief Reads the image and repairs its header in memory, the file itself is left untouched
 */
std::vector<std::uint8_t> load_image(std::filesystem::path const& t_file) {
  std::ifstream file(t_file, std::ios::binary | std::ios::in);
  if (not file.is_open()) {
    throw bllink::IoError(fmt::format("cannot open {}", t_file.string()));
  }

  std::stringstream image{std::ios::in | std::ios::out | std::ios::binary};
  image << file.rdbuf();

  auto const plan = bllink::check(image);
  if (not plan.empty()) {
    spdlog::warn("Image header of {} is not consistent, patching before flashing", t_file.string());
    bllink::process(image, plan);
  }

  auto const content = image.str();
  return {content.begin(), content.end()};
}

}  // namespace

void flash(std::filesystem::path const& t_file, std::string_view const t_port, std::uint32_t const t_baud) {
  constexpr std::size_t CHUNK_SIZE   = 4096;
  constexpr std::uint32_t FLASH_BASE = 0;

  auto const image_data = ::load_image(t_file);
  spdlog::info("Reading file: {}, file size: {}", t_file.string(), image_data.size());

  bllink::Serial<bllink::IspProtocol> loader{t_port, t_baud};
  spdlog::info("Connected to {} at {} bps, boot ROM handshake sent", t_port, t_baud);
  auto const boot_info = loader.transceive(bllink::command::GET_BOOT_INFO{}, 2);
  auto const flash_pin = boot_info.flash_pin();
  spdlog::info("chip id: {}, flash info: {:08X}, flash pin: {:02X}", boot_info.chip_id_str(),
               boot_info.flash_info_from_boot_, flash_pin);

  loader.transceive(bllink::command::FLASH_SET_PARA::from_flash_pin(flash_pin));

  auto const flash_id = loader.transceive(bllink::command::READ_FLASH_ID{}).to_string();
  spdlog::info("flash id: {}", flash_id);

  auto const flash_config = bllink::get_flash_config(flash_id);
  if (flash_config.empty()) {
    throw std::runtime_error(fmt::format("flash id {} not supported", flash_id));
  }
  auto const set_config =
    bllink::command::FLASH_SET_PARA{std::vector<std::uint8_t>(flash_config.begin(), flash_config.end())};
  loader.transceive(set_config);

  auto const image_size = static_cast<std::uint32_t>(image_data.size());
  spdlog::info("Erasing {} bytes in flash at offset {:#x}", image_size, FLASH_BASE);
  loader.transceive(bllink::command::ERASE_FLASH{FLASH_BASE, FLASH_BASE + image_size}, 0, 15000ms);

  auto const image = std::span<std::uint8_t const>{image_data};
  for (std::size_t offset = 0; offset < image.size();) {
    auto const chunk = image.subspan(offset, std::min(CHUNK_SIZE, image.size() - offset));
    loader.transceive(bllink::command::WRITE_FLASH{FLASH_BASE + static_cast<std::uint32_t>(offset), chunk}, 1, 2000ms);
    offset += chunk.size();
    spdlog::info("flashing: {}/{}", offset, image.size());
  }

  spdlog::info("flashing done.");
}

int main(int argc, const char** argv) {
  using namespace boost::program_options;
  options_description flash_options("Parameter for flash");
  flash_options.add_options()                                                   //
    ("port", value<std::string>(), "Serial port of the device in ISP mode")       //
    ("baud", value<std::uint32_t>()->default_value(bllink::ISP_DEFAULT_BAUD_RATE),  //
     "Baudrate of the communication");

  options_description visible_options("All options");
  visible_options.add(flash_options)
    .add_options()                               //
    ("help", "Show this help message and exit")  //
    ("verbose", "Show debug message during execution");

  options_description hidden_options("Hidden options");
  hidden_options.add_options()("image", value<std::string>(), "image file to flash");

  positional_options_description pd;
  pd.add("image", 1);

  options_description all("Allowed options");
  all.add(visible_options).add(hidden_options);

  try {
    variables_map vm;
    store(command_line_parser(argc, argv).options(all).positional(pd).run(), vm);
    notify(vm);

    if (vm.count("help") != 0) {
      std::cout << visible_options << '\n';
      return EXIT_SUCCESS;
    }

    if (vm.count("image") == 0) {
      std::cerr << "Must specify an image!\n";
      return EXIT_FAILURE;
    }

    if (vm.count("port") == 0) {
      std::cerr << "Must specify a port!\n";
      return EXIT_FAILURE;
    }

    if (vm.count("verbose") != 0) {
      spdlog::set_level(spdlog::level::debug);
    }

    flash(vm["image"].as<std::string>(), vm["port"].as<std::string>(), vm["baud"].as<std::uint32_t>());
  } catch (std::exception const& t_e) {
    spdlog::error("{}", t_e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
