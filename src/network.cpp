#include "network.hpp"

#include <asio.hpp>

std::string detect_bind_address(Logger* logger) {
  try {
    asio::io_context io;
    asio::ip::udp::socket socket(io);
    // connecting a UDP socket only selects a route
    socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("10.255.255.255"), 1));
    auto address = socket.local_endpoint().address();
    if(!address.is_unspecified()) {
      return address.to_string();
    }
  } catch(const std::system_error& e) {
    log_warn(logger, "Unable to detect a LAN address ({}), binding to 127.0.0.1", e.what());
    return "127.0.0.1";
  }
  log_warn(logger, "Unable to detect a LAN address, binding to 127.0.0.1");
  return "127.0.0.1";
}
