#include "config.h"
#include "tunnel.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace {

// Sets environment variables for one test and removes them afterwards.
class ScopedEnv {
public:
  void set(const char *name, const char *value) {
    setenv(name, value, 1);
    names_.push_back(name);
  }
  ~ScopedEnv() {
    for (const auto &name : names_) unsetenv(name.c_str());
  }

private:
  std::vector<std::string> names_;
};

}  // namespace

TEST(ConfigTest, ReadsOverridesFromEnvironment) {
  ScopedEnv env;
  env.set("PORT", "8081");
  env.set("DEBUG", "yes");
  env.set("MIRRORGATE_CACHE_MAX_ENTRIES", "50");
  env.set("MIRRORGATE_CACHE_TTL_MS", "2500");
  env.set("MIRRORGATE_CACHE_SIZING", "Estimated");
  env.set("MIRRORGATE_SCRIPT_STRATEGY", "identifiers");
  env.set("MIRRORGATE_SESSIONS", "off");
  env.set("MIRRORGATE_RATE_LIMIT", "0");
  env.set("MIRRORGATE_RATE_LIMIT_WINDOW_MS", "60000");

  ProxyConfig config = load_config_from_env();
  EXPECT_EQ(config.port, 8081);
  EXPECT_TRUE(config.debug);
  EXPECT_EQ(config.cache_max_entries, 50u);
  EXPECT_EQ(config.cache_ttl.count(), 2500);
  EXPECT_TRUE(config.cache_sizing == CacheSizing::Estimated);
  EXPECT_TRUE(config.script_strategy == ScriptStrategy::Identifiers);
  EXPECT_FALSE(config.enable_sessions);
  EXPECT_EQ(config.rate_limit_max_requests, 0);
  EXPECT_EQ(config.rate_limit_window.count(), 60000);
}

TEST(ConfigTest, PrefixedPortWinsOverPlainPort) {
  ScopedEnv env;
  env.set("PORT", "8081");
  env.set("MIRRORGATE_PORT", "9090");
  EXPECT_EQ(load_config_from_env().port, 9090);
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
  ScopedEnv env;
  env.set("MIRRORGATE_PORT", "70000");
  env.set("MIRRORGATE_RETRY_COUNT", "0");
  env.set("MIRRORGATE_MAX_REDIRECTS", "ten");
  env.set("MIRRORGATE_DEBUG", "maybe");
  env.set("MIRRORGATE_CACHE_SIZING", "huge");

  ProxyConfig defaults;
  ProxyConfig config = load_config_from_env();
  EXPECT_EQ(config.port, 10000);
  EXPECT_EQ(config.retry_count, defaults.retry_count);
  EXPECT_EQ(config.max_redirects, defaults.max_redirects);
  EXPECT_EQ(config.debug, defaults.debug);
  EXPECT_TRUE(config.cache_sizing == defaults.cache_sizing);
}

TEST(WebSocketTargetTest, MapsHttpSchemesToWebSocketSchemes) {
  EXPECT_EQ(websocket_target_for("http://chat.example.com/socket?x=1"),
            "ws://chat.example.com/socket?x=1");
  EXPECT_EQ(websocket_target_for("https://chat.example.com:8443/ws"),
            "wss://chat.example.com:8443/ws");
  EXPECT_EQ(websocket_target_for("HTTPS://Chat.example.com/"),
            "wss://Chat.example.com/");
  EXPECT_EQ(websocket_target_for("ftp://example.com/"), "");
  EXPECT_EQ(websocket_target_for("not a url"), "");
}
