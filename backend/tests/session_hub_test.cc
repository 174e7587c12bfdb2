#include "session_hub.h"

#include <gtest/gtest.h>

#include "crow.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Collects everything the hub sends to one member.
struct Inbox {
  std::vector<std::string> messages;
  SessionHub::Sender sender() {
    return [this](const std::string &text) { messages.push_back(text); };
  }
  crow::json::rvalue last() const { return crow::json::load(messages.back()); }
  void clear() { messages.clear(); }
};

class SessionHubTest : public ::testing::Test {
protected:
  SessionHub hub{[this] { return now; }};
  int64_t now = 1700000000000;
};

}  // namespace

TEST_F(SessionHubTest, AnswersPingWithPong) {
  Inbox inbox;
  auto id = hub.add_member(inbox.sender());
  hub.handle_message(id, R"({"type":"ping"})");
  ASSERT_EQ(inbox.messages.size(), 1u);
  auto reply = inbox.last();
  EXPECT_EQ(std::string(reply["type"].s()), "pong");
  EXPECT_EQ(reply["timestamp"].i(), now);
}

TEST_F(SessionHubTest, InitCreatesSessionAndBroadcastsState) {
  Inbox alice;
  auto a = hub.add_member(alice.sender());
  hub.handle_message(
      a, R"({"type":"init","sessionId":"room-1","sessionType":"video",)"
         R"("settings":{"volume":5}})");

  ASSERT_EQ(alice.messages.size(), 1u);
  auto state = alice.last();
  EXPECT_EQ(std::string(state["type"].s()), "state");
  EXPECT_EQ(std::string(state["session"]["id"].s()), "room-1");
  EXPECT_EQ(std::string(state["session"]["type"].s()), "video");
  EXPECT_EQ(state["session"]["memberCount"].i(), 1);
  EXPECT_EQ(state["session"]["settings"]["volume"].i(), 5);
  EXPECT_EQ(state["session"]["timestamp"].i(), now);
  EXPECT_EQ(hub.session_count(), 1u);
  EXPECT_EQ(hub.session_size("room-1").value_or(0), 1u);
}

TEST_F(SessionHubTest, SessionTypeDefaultsAndSecondMemberJoins) {
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  EXPECT_EQ(std::string(alice.last()["session"]["type"].s()), "default");

  alice.clear();
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  ASSERT_EQ(alice.messages.size(), 1u);
  ASSERT_EQ(bob.messages.size(), 1u);
  EXPECT_EQ(alice.last()["session"]["memberCount"].i(), 2);
  EXPECT_EQ(alice.messages[0], bob.messages[0]);
}

TEST_F(SessionHubTest, StateUpdateMergesShallowlyAndReachesEveryone) {
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");

  now += 1000;
  hub.handle_message(a, R"({"type":"state_update","state":{"time":12.5,"paused":false}})");
  hub.handle_message(b, R"({"type":"state_update","state":{"paused":true,"meta":{"q":1}}})");

  auto root = alice.last();
  const auto &state = root["session"];
  EXPECT_DOUBLE_EQ(state["state"]["time"].d(), 12.5);
  EXPECT_TRUE(state["state"]["paused"].b());
  EXPECT_EQ(state["state"]["meta"]["q"].i(), 1);
  EXPECT_EQ(state["timestamp"].i(), now);
  EXPECT_EQ(alice.messages.back(), bob.messages.back());
}

TEST_F(SessionHubTest, ActionGoesToOtherMembersOnly) {
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  alice.clear();
  bob.clear();

  hub.handle_message(a, R"({"type":"action","action":"seek","payload":{"to":30}})");
  EXPECT_TRUE(alice.messages.empty());
  ASSERT_EQ(bob.messages.size(), 1u);
  auto event = bob.last();
  EXPECT_EQ(std::string(event["type"].s()), "event");
  EXPECT_EQ(std::string(event["action"].s()), "seek");
  EXPECT_EQ(event["payload"]["to"].i(), 30);

  hub.handle_message(b, R"({"type":"action","action":"pause"})");
  EXPECT_TRUE(alice.last()["payload"].t() == crow::json::type::Null);
}

TEST_F(SessionHubTest, LeavingNotifiesRemainingAndDeletesEmptySession) {
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  alice.clear();
  bob.clear();

  hub.remove_member(b);
  EXPECT_TRUE(bob.messages.empty());
  ASSERT_EQ(alice.messages.size(), 1u);
  EXPECT_EQ(alice.last()["session"]["memberCount"].i(), 1);

  hub.remove_member(a);
  EXPECT_EQ(hub.session_count(), 0u);
  EXPECT_FALSE(hub.session_size("s").has_value());
  EXPECT_EQ(hub.member_count(), 0u);
}

TEST_F(SessionHubTest, ReInitMovesMemberBetweenSessions) {
  Inbox alice;
  auto a = hub.add_member(alice.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"one"})");
  hub.handle_message(a, R"({"type":"init","sessionId":"two"})");
  EXPECT_FALSE(hub.session_size("one").has_value());
  EXPECT_EQ(hub.session_size("two").value_or(0), 1u);
}

TEST_F(SessionHubTest, ReportsProtocolErrors) {
  Inbox alice;
  auto a = hub.add_member(alice.sender());
  auto error_for = [&](const std::string &text) {
    hub.handle_message(a, text);
    auto reply = alice.last();
    EXPECT_EQ(std::string(reply["type"].s()), "error") << text;
    return std::string(reply["message"].s());
  };

  EXPECT_EQ(error_for("not json"), "Invalid JSON");
  EXPECT_EQ(error_for("[1,2]"), "Invalid JSON");
  EXPECT_EQ(error_for(R"({"sessionId":"x"})"), "Missing message type");
  EXPECT_EQ(error_for(R"({"type":"init"})"), "init requires a sessionId");
  EXPECT_EQ(error_for(R"({"type":"init","sessionId":""})"),
            "init requires a sessionId");
  EXPECT_EQ(error_for(R"({"type":"init","sessionId":"s","settings":3})"),
            "settings must be an object");
  EXPECT_EQ(error_for(R"({"type":"state_update","state":{}})"), "Not in a session");
  EXPECT_EQ(error_for(R"({"type":"action","action":"x"})"), "Not in a session");
  EXPECT_EQ(error_for(R"({"type":"teleport"})"), "Unknown message type: teleport");

  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  EXPECT_EQ(error_for(R"({"type":"state_update","state":"nope"})"),
            "state_update requires a state object");
  EXPECT_EQ(error_for(R"({"type":"action"})"), "action requires an action name");
}

TEST_F(SessionHubTest, RemovedMemberReceivesNothingFurther) {
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  hub.remove_member(b);
  bob.clear();

  hub.handle_message(a, R"({"type":"state_update","state":{"x":1}})");
  hub.handle_message(b, R"({"type":"ping"})");  // unknown member: ignored
  EXPECT_TRUE(bob.messages.empty());
}

TEST_F(SessionHubTest, ThrowingSenderDoesNotStopDelivery) {
  Inbox bob;
  auto a = hub.add_member([](const std::string &) {
    throw std::runtime_error("socket gone");
  });
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  EXPECT_EQ(bob.messages.size(), 1u);
}

TEST_F(SessionHubTest, ProxyRequestIsAnsweredOnlyToTheCaller) {
  std::vector<std::string> fetched;
  hub.set_proxy_handler([&fetched](const std::string &url, std::string &error)
                            -> std::optional<std::string> {
    fetched.push_back(url);
    if (url == "https://down.example/") {
      error = "connection refused";
      return std::nullopt;
    }
    return std::string(R"({"status":200,"headers":{},"content":"hi"})");
  });
  Inbox alice, bob;
  auto a = hub.add_member(alice.sender());
  auto b = hub.add_member(bob.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.handle_message(b, R"({"type":"init","sessionId":"s"})");
  alice.clear();
  bob.clear();

  hub.handle_message(a, R"({"type":"proxy_request","url":"https://ex.com/"})");
  ASSERT_EQ(alice.messages.size(), 1u);
  EXPECT_TRUE(bob.messages.empty());
  auto reply = alice.last();
  EXPECT_EQ(std::string(reply["type"].s()), "proxy_response");
  EXPECT_EQ(reply["data"]["status"].i(), 200);
  EXPECT_EQ(std::string(reply["data"]["content"].s()), "hi");

  hub.handle_message(a, R"({"type":"proxy_request","url":"https://down.example/"})");
  EXPECT_EQ(std::string(alice.last()["type"].s()), "error");
  EXPECT_EQ(std::string(alice.last()["message"].s()),
            "Failed to proxy request: connection refused");

  hub.handle_message(a, R"({"type":"proxy_request"})");
  EXPECT_EQ(std::string(alice.last()["message"].s()),
            "proxy_request requires a url");
  EXPECT_EQ(fetched.size(), 2u);
}

TEST_F(SessionHubTest, ProxyRequestWithoutHandlerIsRejected) {
  Inbox alice;
  auto a = hub.add_member(alice.sender());
  hub.handle_message(a, R"({"type":"proxy_request","url":"https://ex.com/"})");
  EXPECT_EQ(std::string(alice.last()["message"].s()),
            "proxy_request is not enabled");
}

TEST_F(SessionHubTest, ClearDropsEverything) {
  Inbox alice;
  auto a = hub.add_member(alice.sender());
  hub.handle_message(a, R"({"type":"init","sessionId":"s"})");
  hub.clear();
  EXPECT_EQ(hub.session_count(), 0u);
  EXPECT_EQ(hub.member_count(), 0u);
}
