#pragma once

#include <boost/asio.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/serial_port.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>
#include <termios.h>
#include <vector>

#include "bl_common/constants.hpp"
#include "bl_common/utility.hpp"

namespace bllink {

template <typename P>
struct MatchCondition;

template <typename PacketProtocol>
class Serial : PacketProtocol {
  void sleep_for(std::chrono::milliseconds const t_duration) {
    boost::asio::high_resolution_timer sleep_timer(this->port_.get_executor());
    sleep_timer.expires_after(t_duration);
    sleep_timer.wait();
  }

  /**
   * @brief Puts the boot ROM into ISP mode. USB attached chips need the init string first, the UART boot ROM detects
   *        the baud rate from the sync bytes, then answers the handshake.
   */
  void handshake() {
    using namespace std::chrono_literals;

    boost::asio::write(this->port_, boost::asio::buffer(ISP_USB_INIT));
    this->sleep_for(50ms);

    std::vector<std::uint8_t> const sync(ISP_SYNC_LENGTH, ISP_SYNC_BYTE);
    boost::asio::write(this->port_, boost::asio::buffer(sync));
    this->sleep_for(300ms);

    boost::asio::write(this->port_, boost::asio::buffer(ISP_HANDSHAKE));
    this->sleep_for(100ms);
    this->flush_io();
  }

  void flush_io() noexcept { tcflush(this->port_.lowest_layer().native_handle(), TCIOFLUSH); }

  using PacketProtocol::complete_condition;
  using PacketProtocol::decode_packet;
  using PacketProtocol::generate_packet;

  boost::asio::io_context context_{};
  boost::asio::serial_port port_;

  friend MatchCondition<PacketProtocol>;

 public:
  Serial(Serial const& t_ser)            = delete;
  Serial(Serial&& t_ser)                 = delete;
  Serial& operator=(Serial const& t_ser) = delete;
  Serial& operator=(Serial&& t_ser)      = delete;

  explicit Serial(std::string_view const t_port, std::uint32_t const t_baud = ISP_DEFAULT_BAUD_RATE)
    : port_{context_, std::string{t_port}} {
    spdlog::debug("Connection Success: {}, baudrate: {}", t_port, t_baud);

    using boost::asio::serial_port_base;
    this->port_.set_option(serial_port_base::baud_rate(t_baud));
    this->port_.set_option(serial_port_base::character_size());
    this->port_.set_option(serial_port_base::parity{serial_port_base::parity::none});
    this->port_.set_option(serial_port_base::stop_bits{serial_port_base::stop_bits::one});
    this->port_.set_option(serial_port_base::flow_control{serial_port_base::flow_control::none});
    spdlog::debug("Setting serial port options: {} bps, 8 bits, parity: none, flow_control: none", t_baud);

    this->handshake();
    spdlog::debug("Handshake sent to {}", t_port);
  }

  /**
   * @brief This function transmits a command to the boot ROM and recieves its response, the packet framing is defined
   *        by PacketProtocol
   *
   * @param t_data    Command to be sent, it will be passed to PacketProtocol::generate_packet to generate protocol
   *                  compliant packet
   * @param t_retry   Number of time to retry if no response arrived before timeout
   * @param t_timeout Maximum wait time for income data
   *
   * @return the response parsed by the command, through PacketProtocol::decode_packet
   */
  auto transceive(auto const& t_data, int t_retry = 0,
                  std::chrono::milliseconds t_timeout = std::chrono::milliseconds(1000)) {
    int const retried = t_retry;
    do {
      this->flush_io();  // drop anything the boot ROM sent before this request

      auto const packet       = this->generate_packet(t_data);
      auto const byte_written = boost::asio::write(this->port_, boost::asio::buffer(packet));
      spdlog::debug("Sending Packet: {} ({:#04x})", t_data.NAME, t_data.COMMAND_BYTE);
      spdlog::debug("Packet content: ({} byte)\n", byte_written);
      print_byte_stream(packet.begin(), packet.end());

      boost::asio::high_resolution_timer timeout_timer{this->context_, t_timeout};
      timeout_timer.async_wait([this](auto t_err) mutable {
        if (not t_err) {
          spdlog::debug("Serial port read timeout");
        }
        this->port_.cancel();
      });

      std::size_t byte_read = 0;
      auto read_done_cb     = [&](auto t_err, auto t_byte_read) mutable {
        if (not t_err) {
          byte_read = t_byte_read;  // if any error happened, discard all buffer, therefore only assign on success
          timeout_timer.cancel();
        }
      };
      boost::asio::streambuf input_buffer;  // local streambuf so that the content will be cleaned up automatically
      boost::asio::async_read_until(this->port_, input_buffer, MatchCondition<PacketProtocol>{this}, read_done_cb);

      this->context_.run();
      this->context_.restart();

      if (byte_read == 0) {
        continue;
      }

      try {
        return this->decode_packet(t_data, boost::asio::buffers_begin(input_buffer.data()), byte_read);
      } catch (std::exception const& t_e) {
        spdlog::debug("{}: {}", t_data.NAME, t_e.what());
        throw;
      }
    } while (t_retry-- > 0);

    throw std::runtime_error(fmt::format("{}: Read failed after retrying for {} times",  //
                                         t_data.NAME, retried));
  }
};

template <typename P>
struct MatchCondition {
  Serial<P>* port_;

  auto operator()(auto t_begin, auto t_end) { return this->port_->complete_condition(t_begin, t_end); }
};

}  // namespace bllink

template <typename P>
struct boost::asio::is_match_condition<bllink::MatchCondition<P>> : boost::true_type {};
