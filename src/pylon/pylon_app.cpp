#include "src/pylon/pylon_app.h"

#include "common/envelope.hpp"
#include "common/util.hpp"
#include "src/identity/device_id.h"

#include <utility>
#include <vector>

namespace pylon {

using common::json;

namespace {

RelayClient::Config relay_config_from(const PylonOptions& opts) {
  RelayClient::Config cfg;
  cfg.device_index = opts.device_index;
  cfg.name = opts.name;
  cfg.heartbeat_interval = opts.heartbeat_interval;
  cfg.heartbeat_timeout = opts.heartbeat_timeout;
  cfg.reconnect_interval = opts.reconnect_interval;
  return cfg;
}

std::string filename_of(const std::string& path) {
  const auto pos = path.find_last_of("/\\");
  const std::string name = pos == std::string::npos ? path : path.substr(pos + 1);
  return name.empty() ? "unknown" : name;
}

// Attachments go to the agent as a path list ahead of the message text.
std::string agent_prompt(const std::string& text, const json& attachments) {
  if (attachments.empty()) return text;
  std::string prompt = "[Read the attached files]";
  for (const auto& a : attachments) {
    prompt += "\n- " + common::string_field(a, "path").value_or("");
  }
  if (!text.empty()) prompt += "\n\n" + text;
  return prompt;
}

} // namespace

std::string PylonApp::Origin::owner_key() const {
  if (local) return "local:" + std::to_string(peer);
  if (from.is_object() && from.contains("deviceId")) return "relay:" + from["deviceId"].dump();
  return "relay:unknown";
}

PylonApp::PylonApp(boost::asio::io_context& io,
                   PylonOptions opts,
                   TransportFactory factory,
                   std::unique_ptr<AgentAdapter> agent)
    : opts_(std::move(opts)),
      packets_(opts_.packet_log_dir ? std::make_unique<PacketLogger>(PacketLogger::Config{*opts_.packet_log_dir})
                                    : nullptr),
      local_(io, opts_.local_port, packets_.get()),
      relay_(std::make_shared<RelayClient>(io, relay_config_from(opts_), std::move(factory))),
      blobs_(opts_.uploads_dir),
      agent_(std::move(agent)) {
  relay_->set_listener(this);
  local_.set_listener(this);
}

PylonApp::~PylonApp() {
  relay_->set_listener(nullptr);
  local_.set_listener(nullptr);
  relay_->disconnect();
  local_.stop();
}

bool PylonApp::start(std::string* out_error) {
  if (!local_.start(out_error)) return false;
  const auto global = identity::encode_pylon_id(opts_.env_id, opts_.device_index);
  common::log("pylon " + std::to_string(opts_.device_index) + " (deviceId " + std::to_string(global.value_or(0)) +
              ", " + identity::env_name_for(global.value_or(-1)) + ") -> " + opts_.relay_url);
  relay_->connect();
  return true;
}

void PylonApp::stop() {
  relay_->disconnect();
  local_.stop();
}

std::size_t PylonApp::pending_file_count(int64_t entity_id) const {
  const auto it = pending_files_.find(entity_id);
  return it == pending_files_.end() ? 0 : it->second.size();
}

void PylonApp::on_relay_message(const json& msg) {
  if (packets_) packets_->log_recv("relay", msg);
  Origin origin;
  if (msg.contains("from")) origin.from = msg["from"];
  dispatch(origin, msg);
}

void PylonApp::on_relay_status(bool connected) {
  local_.send_relay_status(connected);
}

void PylonApp::on_local_connect(LocalServer::PeerId) {}

void PylonApp::on_local_message(LocalServer::PeerId peer, const json& msg) {
  Origin origin;
  origin.local = true;
  origin.peer = peer;
  dispatch(origin, msg);
}

void PylonApp::on_local_disconnect(LocalServer::PeerId peer) {
  Origin origin;
  origin.local = true;
  origin.peer = peer;
  const auto key = origin.owner_key();
  blobs_.drop_owner(key);
  forget_requester(key);
}

void PylonApp::dispatch(const Origin& origin, const json& msg) {
  const auto type = common::message_type(msg).value_or("");
  const json& payload = common::payload_of(msg);

  if (blob::BlobHandler::is_blob_message(type)) {
    handle_blob(origin, msg);
    return;
  }
  if (type == "claude_send") {
    handle_claude_send(origin, payload);
    return;
  }
  if (type == "get_status") {
    handle_get_status(origin);
    return;
  }

  if (!origin.local) {
    if (type == "connected" || type == "auth_result") return;
    if (type == "device_status" || type == "device_list") {
      local_.broadcast(msg);
      return;
    }
    if (type == "client_disconnect") {
      Origin gone;
      gone.from = payload;
      const auto key = gone.owner_key();
      blobs_.drop_owner(key);
      forget_requester(key);
      return;
    }
    if (type == "error") {
      common::log_warn("error from relay: " + common::string_field(payload, "error").value_or("unknown"));
      return;
    }
    if (type == "route_error") {
      common::log_warn("relay could not reach " + (payload.contains("targets") ? payload["targets"].dump() : "[]"));
      return;
    }
  }

  common::log_warn("unhandled message type '" + type + "' from " + origin.owner_key());
}

void PylonApp::reply(const Origin& origin, json msg) {
  if (origin.local) {
    local_.send_to(origin.peer, msg);
    return;
  }
  const json& from = origin.from;
  if (!from.is_object() || !from.contains("deviceIndex") || !from.contains("role")) {
    common::log_warn("dropping reply without a sender: " + common::message_type(msg).value_or(""));
    return;
  }
  msg["to"] = json::array({json{{"deviceIndex", from["deviceIndex"]}, {"role", from["role"]}}});
  send_relay(msg);
}

void PylonApp::send_relay(const json& msg) {
  if (packets_) packets_->log_send("relay", msg);
  relay_->send(msg);
}

void PylonApp::publish_to_clients(const json& msg) {
  if (relay_->connected()) {
    json out = msg;
    out["broadcast"] = "clients";
    send_relay(out);
  }
  local_.broadcast(msg);
}

void PylonApp::handle_blob(const Origin& origin, const json& msg) {
  auto result = blobs_.handle(origin.owner_key(), msg);
  for (auto& r : result.replies) reply(origin, std::move(r));
  if (!result.saved) return;

  const auto& saved = *result.saved;
  common::log("blob " + saved.blob_id + " stored at " + saved.path.string() + " (" + std::to_string(saved.size) +
              " bytes)");

  const json& ctx = saved.context;
  if (!ctx.is_object() || common::string_field(ctx, "type").value_or("") != "image_upload") return;
  const auto entity = common::int_field(ctx, "entityId");
  if (!entity) return;

  const std::string path = saved.path.string();
  json info;
  info["fileId"] = saved.blob_id;
  info["path"] = path;
  info["filename"] = filename_of(path);
  info["mimeType"] = saved.mime;
  pending_files_[*entity][saved.blob_id] = info;

  json done = info;
  done["blobId"] = saved.blob_id;
  done["entityId"] = *entity;
  reply(origin, common::make_message("blob_upload_complete", std::move(done)));
}

void PylonApp::handle_claude_send(const Origin& origin, const json& payload) {
  const auto entity = common::int_field(payload, "entityId");
  const std::string text = common::string_field(payload, "message").value_or("");

  json attachments = json::array();
  const auto ids = payload.find("attachedFileIds");
  const auto paths = payload.find("attachments");
  if (ids != payload.end() && ids->is_array() && !ids->empty()) {
    const auto pending = entity ? pending_files_.find(*entity) : pending_files_.end();
    if (pending != pending_files_.end()) {
      for (const auto& id : *ids) {
        if (!id.is_string()) continue;
        const auto f = pending->second.find(id.get<std::string>());
        if (f == pending->second.end()) continue;
        attachments.push_back(f->second);
        pending->second.erase(f);
      }
    }
  } else if (paths != payload.end() && paths->is_array()) {
    for (const auto& p : *paths) {
      if (!p.is_string()) continue;
      attachments.push_back(json{{"path", p}, {"filename", filename_of(p.get<std::string>())}});
    }
  }

  if (!entity || (text.empty() && attachments.empty())) {
    common::log_warn("claude_send without entityId or content from " + origin.owner_key());
    return;
  }

  json event;
  event["type"] = "userMessage";
  event["content"] = text;
  event["timestamp"] = common::now_ms();
  if (!attachments.empty()) event["attachments"] = attachments;
  publish_to_clients(common::make_message("claude_event", json{{"entityId", *entity}, {"event", event}}));

  requesters_[*entity] = origin;
  if (!agent_) {
    common::log_error("no agent configured, dropping claude_send for entity " + std::to_string(*entity));
    return;
  }
  agent_->send(*entity, agent_prompt(text, attachments), *this);
}

void PylonApp::on_agent_event(int64_t entity_id, const json& event) {
  const auto msg = common::make_message("claude_event", json{{"entityId", entity_id}, {"event", event}});
  const auto it = requesters_.find(entity_id);
  if (it == requesters_.end()) {
    publish_to_clients(msg);
  } else {
    reply(it->second, msg);
    // Local peers watch every conversation.
    if (!it->second.local) local_.broadcast(msg);
  }

  if (common::string_field(event, "type").value_or("") == "state") {
    json status;
    status["entityId"] = entity_id;
    status["status"] = common::string_field(event, "state").value_or("idle");
    publish_to_clients(common::make_message("conversation_status", std::move(status)));
  }
}

void PylonApp::handle_get_status(const Origin& origin) {
  const auto global = identity::encode_pylon_id(opts_.env_id, opts_.device_index);
  json p;
  p["deviceIndex"] = opts_.device_index;
  p["deviceId"] = global.value_or(0);
  p["env"] = identity::env_name_for(global.value_or(-1));
  p["name"] = opts_.name;
  p["relayConnected"] = relay_->connected();
  p["authenticated"] = relay_->identity().has_value();
  if (relay_->identity()) p["deviceInfo"] = *relay_->identity();
  p["localClients"] = local_.client_count();
  p["activeTransfers"] = blobs_.receiver().active_count();
  reply(origin, common::make_message("status", std::move(p)));
}

void PylonApp::forget_requester(const std::string& owner_key) {
  for (auto it = requesters_.begin(); it != requesters_.end();) {
    if (it->second.owner_key() == owner_key) {
      it = requesters_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace pylon
