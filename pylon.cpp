#include "common/util.hpp"
#include "src/pylon/agent_adapter.h"
#include "src/pylon/pylon_app.h"
#include "src/pylon/pylon_config.h"
#include "src/pylon/ws_transport.h"

#include <boost/asio.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
  std::string err;
  const auto opts = pylon::parse_pylon_options(argc, argv, pylon::PylonEnv::from_process(), &err);
  if (!opts) {
    std::cerr << err << "\n" << pylon::pylon_usage(argv[0]);
    return 2;
  }
  if (opts->show_help) {
    std::cout << pylon::pylon_usage(argv[0]);
    return 0;
  }

  try {
    boost::asio::io_context io;
    const pylon::WsUrl url = opts->relay;
    pylon::PylonApp app(
        io, *opts, [&io, url] { return std::make_shared<pylon::WsTransport>(io, url); },
        std::make_unique<pylon::EchoAgent>(io));

    if (!app.start(&err)) {
      std::cerr << err << "\n";
      return 1;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
      common::log("signal received, shutting down");
      app.stop();
      io.stop();
    });

    io.run();
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
