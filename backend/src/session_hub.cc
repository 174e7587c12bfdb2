// ─── Mirrorgate — Shared session hub implementation ─────────────────────

#include "session_hub.h"
#include "utils.h"

#include "crow.h"

#include <exception>
#include <utility>

namespace {

std::string error_message(const std::string &message) {
  return "{\"type\":\"error\",\"message\":\"" + json_escape(message) + "\"}";
}

std::string raw_json(const crow::json::rvalue &value) {
  return crow::json::wvalue(value).dump();
}

std::string render_object(const std::map<std::string, std::string> &fields) {
  std::string out = "{";
  bool first = true;
  for (const auto &field : fields) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(field.first) + "\":" + field.second;
  }
  out += "}";
  return out;
}

// Shallow merge: each top-level key of `patch` replaces the stored value.
void merge_object(std::map<std::string, std::string> &target,
                  const crow::json::rvalue &patch) {
  for (const auto &item : patch) {
    target[item.key()] = raw_json(item);
  }
}

}  // namespace

SessionHub::SessionHub(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return epoch_millis(); };
}

void SessionHub::set_proxy_handler(ProxyHandler handler) {
  proxy_handler_ = std::move(handler);
}

SessionHub::MemberId SessionHub::add_member(Sender sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  MemberId id = next_member_++;
  members_[id] = Member{std::move(sender), {}};
  return id;
}

void SessionHub::remove_member(MemberId member) {
  Outbox outbox;
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = members_.find(member);
  if (it == members_.end()) return;
  leave_locked(member, it->second, outbox);
  members_.erase(it);
  // Also waits out any delivery still holding this member's sender.
  deliver(lock, outbox);
}

void SessionHub::handle_message(MemberId member, const std::string &text) {
  auto payload = crow::json::load(text);
  bool is_object = payload && payload.t() == crow::json::type::Object;
  // proxy_request does network I/O, so it is answered outside the lock.
  if (is_object && proxy_handler_ && payload.has("type") &&
      payload["type"].t() == crow::json::type::String &&
      std::string(payload["type"].s()) == "proxy_request" &&
      payload.has("url") && payload["url"].t() == crow::json::type::String &&
      !std::string(payload["url"].s()).empty()) {
    answer_proxy_request(member, payload["url"].s());
    return;
  }

  Outbox outbox;
  std::unique_lock<std::mutex> lock(mutex_);
  {
    auto member_it = members_.find(member);
    if (member_it == members_.end()) return;
    Member &record = member_it->second;

    auto reply_error = [&](const std::string &message) {
      outbox.emplace_back(record.sender, error_message(message));
    };

    if (!is_object || payload.t() != crow::json::type::Object) {
      reply_error("Invalid JSON");
    } else if (!payload.has("type") ||
               payload["type"].t() != crow::json::type::String) {
      reply_error("Missing message type");
    } else {
      std::string type = payload["type"].s();

      if (type == "ping") {
        outbox.emplace_back(record.sender,
                            "{\"type\":\"pong\",\"timestamp\":" +
                                std::to_string(clock_()) + "}");
      } else if (type == "init") {
        if (!payload.has("sessionId") ||
            payload["sessionId"].t() != crow::json::type::String ||
            std::string(payload["sessionId"].s()).empty()) {
          reply_error("init requires a sessionId");
        } else if (payload.has("settings") &&
                   payload["settings"].t() != crow::json::type::Object) {
          reply_error("settings must be an object");
        } else {
          std::string session_id = payload["sessionId"].s();
          if (record.session_id != session_id) {
            leave_locked(member, record, outbox);
          }
          auto inserted = sessions_.emplace(session_id, Session{});
          Session &session = inserted.first->second;
          if (inserted.second) {
            session.id = session_id;
            session.type = "default";
            CROW_LOG_DEBUG << "Session created: " << session_id;
          }
          if (payload.has("sessionType") &&
              payload["sessionType"].t() == crow::json::type::String) {
            session.type = payload["sessionType"].s();
          }
          if (payload.has("settings")) merge_object(session.settings, payload["settings"]);
          session.members.insert(member);
          session.updated_at = clock_();
          record.session_id = session_id;
          broadcast_locked(session, outbox);
        }
      } else if (type == "state_update") {
        auto session_it = sessions_.find(record.session_id);
        if (record.session_id.empty() || session_it == sessions_.end()) {
          reply_error("Not in a session");
        } else if (!payload.has("state") ||
                   payload["state"].t() != crow::json::type::Object) {
          reply_error("state_update requires a state object");
        } else {
          Session &session = session_it->second;
          merge_object(session.state, payload["state"]);
          session.updated_at = clock_();
          broadcast_locked(session, outbox);
        }
      } else if (type == "action") {
        auto session_it = sessions_.find(record.session_id);
        if (record.session_id.empty() || session_it == sessions_.end()) {
          reply_error("Not in a session");
        } else if (!payload.has("action") ||
                   payload["action"].t() != crow::json::type::String) {
          reply_error("action requires an action name");
        } else {
          std::string event = "{\"type\":\"event\",\"action\":\"" +
                              json_escape(payload["action"].s()) +
                              "\",\"payload\":" +
                              (payload.has("payload") ? raw_json(payload["payload"])
                                                      : std::string("null")) +
                              ",\"timestamp\":" + std::to_string(clock_()) + "}";
          for (MemberId other : session_it->second.members) {
            if (other == member) continue;
            auto other_it = members_.find(other);
            if (other_it != members_.end()) {
              outbox.emplace_back(other_it->second.sender, event);
            }
          }
        }
      } else if (type == "proxy_request") {
        reply_error(proxy_handler_ ? "proxy_request requires a url"
                                   : "proxy_request is not enabled");
      } else {
        reply_error("Unknown message type: " + type);
      }
    }
  }
  deliver(lock, outbox);
}

void SessionHub::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  members_.clear();
  sessions_.clear();
}

size_t SessionHub::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

size_t SessionHub::member_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.size();
}

std::optional<size_t> SessionHub::session_size(
    const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second.members.size();
}

// ── Internals ──

void SessionHub::answer_proxy_request(MemberId member, const std::string &url) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (members_.find(member) == members_.end()) return;
  }

  std::string error;
  std::optional<std::string> data;
  try {
    data = proxy_handler_(url, error);
  } catch (const std::exception &ex) {
    error = ex.what();
  }
  std::string reply =
      data ? "{\"type\":\"proxy_response\",\"data\":" + *data + "}"
           : error_message("Failed to proxy request: " + error);

  Outbox outbox;
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = members_.find(member);
  if (it == members_.end()) return;
  outbox.emplace_back(it->second.sender, std::move(reply));
  deliver(lock, outbox);
}

void SessionHub::leave_locked(MemberId member, Member &record,
                              Outbox &outbox) {
  if (record.session_id.empty()) return;
  auto it = sessions_.find(record.session_id);
  record.session_id.clear();
  if (it == sessions_.end()) return;

  Session &session = it->second;
  session.members.erase(member);
  if (session.members.empty()) {
    CROW_LOG_DEBUG << "Session closed: " << session.id;
    sessions_.erase(it);
    return;
  }
  session.updated_at = clock_();
  broadcast_locked(session, outbox);
}

void SessionHub::broadcast_locked(const Session &session,
                                  Outbox &outbox) const {
  std::string message = render_state(session);
  for (MemberId id : session.members) {
    auto it = members_.find(id);
    if (it != members_.end()) outbox.emplace_back(it->second.sender, message);
  }
}

std::string SessionHub::render_state(const Session &session) const {
  return "{\"type\":\"state\",\"session\":{\"id\":\"" + json_escape(session.id) +
         "\",\"type\":\"" + json_escape(session.type) +
         "\",\"state\":" + render_object(session.state) +
         ",\"memberCount\":" + std::to_string(session.members.size()) +
         ",\"timestamp\":" + std::to_string(session.updated_at) +
         ",\"settings\":" + render_object(session.settings) + "}}";
}

void SessionHub::deliver(std::unique_lock<std::mutex> &state_lock,
                         Outbox &outbox) {
  std::lock_guard<std::mutex> delivery(delivery_mutex_);
  state_lock.unlock();
  for (auto &message : outbox) {
    if (!message.first) continue;
    try {
      message.first(message.second);
    } catch (const std::exception &ex) {
      CROW_LOG_WARNING << "Session: send failed: " << ex.what();
    }
  }
}
