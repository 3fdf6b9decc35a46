#include "http_gateway.hpp"

#include "jsonrpc.hpp"
#include "request_router.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace toolmesh {
namespace {

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

}  // namespace

HttpGateway::HttpGateway(RequestRouter* router, HttpGatewayOptions options)
    : router_(router), options_(std::move(options)) {
  Register();
}

HttpGateway::~HttpGateway() {
  Stop();
}

void HttpGateway::Register() {
  server_.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) { HandlePost(req, res); });
  server_.Delete("/mcp", [this](const httplib::Request& req, httplib::Response& res) { HandleDelete(req, res); });

  server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    j["sessions"] = session_count();
    SendJson(&res, 200, j);
  });

  server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] handler exception error=" << message << "\n";
    SendJson(&res, 500, jsonrpc::MakeError(nullptr, {jsonrpc::kInternalError, message, nullptr}));
  });

  server_.set_keep_alive_timeout(5);
  server_.set_read_timeout(60);
  server_.set_write_timeout(60);
}

std::shared_ptr<HttpGateway::SessionSlot> HttpGateway::FindSession(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return nullptr;
  it->second->last_used = std::chrono::steady_clock::now();
  return it->second;
}

void HttpGateway::ReapIdleLocked(std::chrono::steady_clock::time_point now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now - it->second->last_used > options_.session_idle_timeout) {
      std::cout << "[http] session expired id=" << it->first << "\n";
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

std::shared_ptr<HttpGateway::SessionSlot> HttpGateway::CreateSession() {
  auto slot = std::make_shared<SessionSlot>(NewId("http_"), options_.max_frames_per_session);
  const auto now = std::chrono::steady_clock::now();
  slot->last_used = now;
  std::lock_guard<std::mutex> lock(mu_);
  ReapIdleLocked(now);
  if (options_.max_sessions > 0 && sessions_.size() >= options_.max_sessions) return nullptr;
  sessions_[slot->session.id()] = slot;
  return slot;
}

void HttpGateway::HandlePost(const httplib::Request& req, httplib::Response& res) {
  std::shared_ptr<SessionSlot> slot;
  const auto requested = req.get_header_value(kSessionHeader);
  if (!requested.empty()) {
    slot = FindSession(requested);
    if (!slot) {
      SendJson(&res, 404, jsonrpc::MakeError(nullptr, {jsonrpc::kInvalidRequest, "unknown session: " + requested, nullptr}));
      return;
    }
    res.set_header(kSessionHeader, slot->session.id());
  }

  // A body that never reaches the router does not open a session.
  if (req.body.size() > options_.max_frame_bytes) {
    std::cout << "[http] frame_too_large session=" << requested << " length=" << req.body.size() << "\n";
    SendJson(&res, 413, jsonrpc::MakeError(nullptr, jsonrpc::FrameTooLarge(req.body.size(), options_.max_frame_bytes)));
    return;
  }
  auto request = nlohmann::json::parse(req.body, nullptr, false);
  if (request.is_discarded()) {
    SendJson(&res, 400, jsonrpc::MakeError(nullptr, jsonrpc::ParseError("invalid json body")));
    return;
  }

  if (!slot) {
    slot = CreateSession();
    if (!slot) {
      std::cout << "[http] session limit reached max_sessions=" << options_.max_sessions << "\n";
      SendJson(&res,
               503,
               jsonrpc::MakeError(jsonrpc::GetId(request),
                                  {jsonrpc::kInternalError, "session_limit_reached",
                                   nlohmann::json{{"max_sessions", options_.max_sessions}}}));
      return;
    }
    std::cout << "[http] session opened id=" << slot->session.id() << " remote=" << req.remote_addr << "\n";
    res.set_header(kSessionHeader, slot->session.id());
  }

  std::optional<nlohmann::json> response;
  {
    std::lock_guard<std::mutex> lock(slot->mu);
    response = router_->Handle(&slot->session, request);
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    slot->last_used = std::chrono::steady_clock::now();
  }
  if (!response) {
    res.status = 202;
    return;
  }
  SendJson(&res, 200, *response);
}

void HttpGateway::HandleDelete(const httplib::Request& req, httplib::Response& res) {
  const auto id = req.get_header_value(kSessionHeader);
  std::size_t erased = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    erased = sessions_.erase(id);
  }
  if (erased == 0) {
    SendJson(&res, 404, {{"ok", false}, {"error", "unknown session"}});
    return;
  }
  std::cout << "[http] session closed id=" << id << "\n";
  SendJson(&res, 200, {{"ok", true}});
}

bool HttpGateway::Start(std::string* err) {
  if (running_.load()) return true;
  int port = options_.port;
  if (port == 0) {
    port = server_.bind_to_any_port(options_.host);
    if (port < 0) {
      if (err) *err = "failed to bind " + options_.host;
      return false;
    }
  } else if (!server_.bind_to_port(options_.host, port)) {
    if (err) *err = "failed to bind " + options_.host + ":" + std::to_string(port);
    return false;
  }
  bound_port_ = port;
  running_.store(true);
  thread_ = std::thread([this]() {
    const bool ok = server_.listen_after_bind();
    std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  });
  std::cout << "[http] listen host=" << options_.host << " port=" << bound_port_ << "\n";
  return true;
}

void HttpGateway::Stop() {
  if (!running_.exchange(false)) return;
  server_.stop();
  if (thread_.joinable()) thread_.join();
}

std::size_t HttpGateway::session_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

}  // namespace toolmesh
