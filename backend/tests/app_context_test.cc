#include "app_context.h"
#include "html_document.h"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

namespace {

const char kLandingPage[] = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta http-equiv="Content-Security-Policy" content="default-src 'self'">
  <title>Example Domain</title>
  <link rel="stylesheet" href="/static/site.css" integrity="sha384-xyz">
  <link rel="icon" href="favicon.ico">
  <script src="https://cdn.example.net/lib.js"></script>
  <style>body { background: url(/img/bg.png); }</style>
</head>
<body>
  <a href="/about">About</a>
  <a href="https://other.example.org/page#top">Elsewhere</a>
  <a href="#main">Skip</a>
  <a href="mailto:hi@example.com">Mail</a>
  <img src="logo.png" srcset="logo.png 1x, logo@2x.png 2x">
  <form action="/search" method="post"><input name="q"></form>
  <iframe src="//embed.example.com/widget"></iframe>
</body>
</html>
)HTML";

bool is_acceptable_reference(const std::string &value) {
  return value.rfind("/watch?url=", 0) == 0 || value.rfind("#", 0) == 0 ||
         value.rfind("mailto:", 0) == 0;
}

// Scripted upstream keyed by URL.
struct FakeSite {
  std::map<std::string, HttpProxyResponse> pages;
  int requests = 0;

  HttpSender sender() {
    return [this](const HttpRequestSpec &spec, ProxyError &error) {
      ++requests;
      auto it = pages.find(spec.url);
      if (it == pages.end()) {
        error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable,
                                 "no such host");
        return HttpProxyResponse{};
      }
      return it->second;
    };
  }
};

HttpProxyResponse page(const std::string &content_type, const std::string &body) {
  HttpProxyResponse response;
  response.status_code = 200;
  response.headers["content-type"] = content_type;
  response.body = body;
  return response;
}

}  // namespace

class AppContextTest : public ::testing::Test {
protected:
  AppContextTest()
      : ctx(ProxyConfig{}, site.sender(), [](std::chrono::milliseconds) {}) {}

  FakeSite site;
  AppContext ctx;
};

TEST_F(AppContextTest, EncodeForProxyUsesConfiguredPrefix) {
  std::string path = ctx.encode_for_proxy("https://example.com/");
  EXPECT_EQ(path, "/watch?url=" + ctx.codec.encode("https://example.com/"));
}

TEST_F(AppContextTest, RewritesEveryReferenceOnARealisticPage) {
  HttpProxyResponse landing = page("text/html; charset=utf-8", kLandingPage);
  landing.headers["etag"] = "\"abc\"";
  landing.headers["content-security-policy"] = "default-src 'self'";
  landing.set_cookie_headers.push_back("sid=1");
  site.pages["https://example.com"] = landing;

  ProxyError error;
  auto result =
      ctx.resolve_via_proxy(ctx.encode_for_proxy("https://example.com"), error);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_EQ(result->status_code, 200);
  EXPECT_EQ(result->content_type, "text/html; charset=utf-8");
  EXPECT_FALSE(result->cache_hit);
  EXPECT_EQ(result->headers.at("etag"), "\"abc\"");
  EXPECT_EQ(result->headers.count("content-security-policy"), 0u);
  EXPECT_EQ(result->headers.count("set-cookie"), 0u);

  auto document = parse_html_document(result->body);
  int checked = 0;
  for (HtmlNode *element : find_elements(*document, "")) {
    for (const char *name : {"href", "src", "action"}) {
      const HtmlAttribute *attr = element->attribute(name);
      if (!attr) continue;
      ++checked;
      EXPECT_TRUE(is_acceptable_reference(attr->value))
          << element->tag_name << " " << name << "=" << attr->value;
    }
    if (const HtmlAttribute *srcset = element->attribute("srcset")) {
      EXPECT_EQ(srcset->value.find("logo"), std::string::npos) << srcset->value;
    }
  }
  EXPECT_GE(checked, 10);

  EXPECT_NE(result->body.find(ctx.encode_for_proxy("https://example.com/about")),
            std::string::npos);
  EXPECT_NE(result->body.find(ctx.encode_for_proxy("https://other.example.org/page") +
                              "#top"),
            std::string::npos);
  EXPECT_NE(result->body.find(ctx.encode_for_proxy("https://embed.example.com/widget")),
            std::string::npos);
  EXPECT_EQ(result->body.find("Content-Security-Policy"), std::string::npos);
  EXPECT_EQ(result->body.find("integrity="), std::string::npos);
  EXPECT_NE(result->body.find("__mirrorgate"), std::string::npos);
}

TEST_F(AppContextTest, SecondFetchIsServedFromCache) {
  site.pages["https://example.com/"] = page("text/html", "<p>hi</p>");
  std::string path = ctx.encode_for_proxy("https://example.com/");

  ProxyError error;
  auto first = ctx.resolve_via_proxy(path, error);
  ASSERT_TRUE(first.has_value());
  auto second = ctx.resolve_via_proxy(path, error);
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(first->cache_hit);
  EXPECT_TRUE(second->cache_hit);
  EXPECT_EQ(first->body, second->body);
  EXPECT_EQ(site.requests, 1);
}

TEST_F(AppContextTest, RedirectTargetBecomesTheRewriteBase) {
  HttpProxyResponse moved;
  moved.status_code = 301;
  moved.headers["location"] = "https://www.example.com/home/";
  site.pages["https://example.com/"] = moved;
  site.pages["https://www.example.com/home/"] =
      page("text/html", "<img src=\"pic.png\">");

  ProxyError error;
  auto result =
      ctx.resolve_via_proxy(ctx.encode_for_proxy("https://example.com/"), error);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_NE(result->body.find(
                ctx.encode_for_proxy("https://www.example.com/home/pic.png")),
            std::string::npos);
}

TEST_F(AppContextTest, InvalidTokenFailsWithoutFetching) {
  ProxyError error;
  EXPECT_FALSE(ctx.resolve_via_proxy("/watch?url=!!!", error).has_value());
  EXPECT_EQ(error.kind, ProxyErrorKind::InvalidToken);
  EXPECT_EQ(site.requests, 0);
}

TEST_F(AppContextTest, UpstreamFailureIsCounted) {
  ProxyError error;
  EXPECT_FALSE(ctx.resolve_via_proxy(ctx.encode_for_proxy("https://nowhere.test/"),
                                     error)
                   .has_value());
  EXPECT_EQ(error.kind, ProxyErrorKind::UpstreamUnreachable);
  EXPECT_EQ(ctx.upstream_failures.load(), 1u);
}

TEST_F(AppContextTest, RewritesLocationOnUnfollowedResponses) {
  HttpProxyResponse created = page("application/json", "{}");
  created.status_code = 201;
  created.headers["location"] = "/items/7";
  site.pages["https://api.example.com/items"] = created;

  FetchRequest post;
  post.method = "POST";
  ProxyError error;
  auto result = ctx.resolve_target("https://api.example.com/items", post, error);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_EQ(result->status_code, 201);
  EXPECT_EQ(result->headers.at("Location"),
            ctx.encode_for_proxy("https://api.example.com/items/7"));
  EXPECT_EQ(result->body, "{}");
}

TEST_F(AppContextTest, UnknownEncodingPassesThroughUnrewritten) {
  HttpProxyResponse packed = page("text/html", "\x1f\x9d packed bytes");
  packed.headers["content-encoding"] = "compress";
  site.pages["https://example.com/old"] = packed;

  ProxyError error;
  auto result =
      ctx.resolve_via_proxy(ctx.encode_for_proxy("https://example.com/old"), error);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_EQ(result->body, "\x1f\x9d packed bytes");
  EXPECT_EQ(result->headers.at("Content-Encoding"), "compress");
  EXPECT_EQ(ctx.cache.stats().size, 0u);
}

TEST_F(AppContextTest, StylesheetsAreRewrittenToo) {
  site.pages["https://example.com/s.css"] =
      page("text/css", "a { background: url(img.png) }");
  ProxyError error;
  auto result =
      ctx.resolve_via_proxy(ctx.encode_for_proxy("https://example.com/s.css"), error);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->body, "a { background: url(" +
                              ctx.encode_for_proxy("https://example.com/img.png") +
                              ") }");
}

TEST_F(AppContextTest, SessionProxyRequestReturnsRewrittenContent) {
  HttpProxyResponse landing = page("text/html", "<a href=\"/about\">About</a>");
  landing.headers["etag"] = "\"v2\"";
  site.pages["https://example.com/"] = landing;

  std::vector<std::string> inbox;
  auto member = ctx.sessions.add_member(
      [&inbox](const std::string &text) { inbox.push_back(text); });
  ctx.sessions.handle_message(
      member, R"({"type":"proxy_request","url":"https://example.com/"})");

  ASSERT_EQ(inbox.size(), 1u);
  auto reply = crow::json::load(inbox[0]);
  ASSERT_TRUE(reply);
  EXPECT_EQ(std::string(reply["type"].s()), "proxy_response");
  const auto &data = reply["data"];
  EXPECT_EQ(data["status"].i(), 200);
  EXPECT_EQ(std::string(data["headers"]["content-type"].s()), "text/html");
  EXPECT_EQ(std::string(data["headers"]["etag"].s()), "\"v2\"");
  std::string content = data["content"].s();
  EXPECT_NE(content.find(ctx.encode_for_proxy("https://example.com/about")),
            std::string::npos);
}

TEST_F(AppContextTest, ShutdownIsIdempotent) {
  ctx.cache.start_sweeper(std::chrono::milliseconds(50));
  ctx.shutdown();
  ctx.shutdown();
  EXPECT_EQ(ctx.sessions.session_count(), 0u);
}
