#pragma once

#include "common/json.hpp"
#include "src/blob/blob_handler.h"
#include "src/pylon/agent_adapter.h"
#include "src/pylon/local_server.h"
#include "src/pylon/packet_logger.h"
#include "src/pylon/pylon_config.h"
#include "src/pylon/relay_client.h"

#include <boost/asio.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace pylon {

// The Pylon process: one RelayClient, one LocalServer, the blob endpoint and
// the agent, all on one io_context. Messages from either side go through the
// same dispatcher; replies return to the side they came from.
class PylonApp : public RelayClient::Listener, public LocalServer::Listener, public AgentSink {
 public:
  PylonApp(boost::asio::io_context& io,
           PylonOptions opts,
           TransportFactory factory,
           std::unique_ptr<AgentAdapter> agent);
  ~PylonApp() override;

  PylonApp(const PylonApp&) = delete;
  PylonApp& operator=(const PylonApp&) = delete;

  bool start(std::string* out_error);
  void stop();

  void on_relay_message(const common::json& msg) override;
  void on_relay_status(bool connected) override;

  void on_local_connect(LocalServer::PeerId peer) override;
  void on_local_message(LocalServer::PeerId peer, const common::json& msg) override;
  void on_local_disconnect(LocalServer::PeerId peer) override;

  void on_agent_event(int64_t entity_id, const common::json& event) override;

  RelayClient& relay() { return *relay_; }
  LocalServer& local() { return local_; }
  blob::BlobHandler& blobs() { return blobs_; }
  const PylonOptions& options() const { return opts_; }
  // Uploads completed for an entity and not yet attached to a claude_send.
  std::size_t pending_file_count(int64_t entity_id) const;

 private:
  // Where a message came from. Relay origins carry the router's `from`.
  struct Origin {
    bool local = false;
    LocalServer::PeerId peer = 0;
    common::json from;

    std::string owner_key() const;
  };

  void dispatch(const Origin& origin, const common::json& msg);
  void reply(const Origin& origin, common::json msg);
  void send_relay(const common::json& msg);
  // Relay clients with broadcast:"clients" plus every local peer.
  void publish_to_clients(const common::json& msg);

  void handle_blob(const Origin& origin, const common::json& msg);
  void handle_claude_send(const Origin& origin, const common::json& payload);
  void handle_get_status(const Origin& origin);
  void forget_requester(const std::string& owner_key);

  PylonOptions opts_;
  std::unique_ptr<PacketLogger> packets_;
  LocalServer local_;
  std::shared_ptr<RelayClient> relay_;
  blob::BlobHandler blobs_;
  std::unique_ptr<AgentAdapter> agent_;
  // entity -> last requester, receives that entity's claude_event stream.
  std::map<int64_t, Origin> requesters_;
  std::map<int64_t, std::map<std::string, common::json>> pending_files_;
};

} // namespace pylon
