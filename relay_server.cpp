#include "common/util.hpp"
#include "src/relay/relay_config.h"
#include "src/relay/relay_server.h"

#include <boost/asio.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::string err;
  const auto opts = relay::parse_relay_options(argc, argv, common::env_var("PORT"), &err);
  if (!opts) {
    std::cerr << err << "\n" << relay::relay_usage(argv[0]);
    return 2;
  }
  if (opts->show_help) {
    std::cout << relay::relay_usage(argv[0]);
    return 0;
  }

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address(opts->bind_ip, ec);
  if (ec) {
    std::cerr << "Invalid bind address: " << ec.message() << "\n";
    return 2;
  }

  try {
    boost::asio::io_context io;
    relay::RelayServer server(io, opts->router);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
      common::log("signal received, shutting down");
      server.stop();
      io.stop();
    });

    server.listen(boost::asio::ip::tcp::endpoint(addr, opts->port));
    io.run();
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
