#pragma once
// ─── Mirrorgate — Shared session hub ────────────────────────────────────
// Server-held state that several WebSocket clients join by id. Messages are
// JSON objects with a "type" (init, state_update, action, ping,
// proxy_request); replies and
// broadcasts go out through each member's sender callback, never while the
// state lock is held. Once remove_member returns, that member's sender is
// never called again.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

class SessionHub {
public:
  using MemberId = uint64_t;
  using Sender = std::function<void(const std::string &text)>;
  using Clock = std::function<int64_t()>;  // epoch millis
  // Resolves a proxy_request: returns the JSON text of the reply's "data"
  // object, or std::nullopt with `error` set.
  using ProxyHandler = std::function<std::optional<std::string>(
      const std::string &url, std::string &error)>;

  explicit SessionHub(Clock clock = nullptr);

  // Enables proxy_request messages. Call before members are added; the
  // handler runs on the caller's thread without any hub lock held.
  void set_proxy_handler(ProxyHandler handler);

  MemberId add_member(Sender sender);

  // Leaves the member's session (deleting it when empty) and forgets the
  // member.
  void remove_member(MemberId member);

  void handle_message(MemberId member, const std::string &text);

  // Drops every member and session; used on shutdown.
  void clear();

  size_t session_count() const;
  size_t member_count() const;
  // Members of `session_id`; std::nullopt when no such session exists.
  std::optional<size_t> session_size(const std::string &session_id) const;

private:
  struct Session {
    std::string id;
    std::string type;
    std::map<std::string, std::string> state;     // key -> raw JSON
    std::map<std::string, std::string> settings;  // key -> raw JSON
    std::set<MemberId> members;
    int64_t updated_at = 0;
  };

  struct Member {
    Sender sender;
    std::string session_id;  // empty = not joined
  };

  using Outbox = std::vector<std::pair<Sender, std::string>>;

  void answer_proxy_request(MemberId member, const std::string &url);
  void leave_locked(MemberId member, Member &record, Outbox &outbox);
  void broadcast_locked(const Session &session, Outbox &outbox) const;
  std::string render_state(const Session &session) const;
  // Sends outside the state lock. Deliveries are serialized, and the
  // delivery lock is taken before the state lock is released.
  void deliver(std::unique_lock<std::mutex> &state_lock, Outbox &outbox);

  Clock clock_;
  ProxyHandler proxy_handler_;
  mutable std::mutex mutex_;
  std::mutex delivery_mutex_;
  MemberId next_member_ = 1;
  std::unordered_map<MemberId, Member> members_;
  std::unordered_map<std::string, Session> sessions_;
};
