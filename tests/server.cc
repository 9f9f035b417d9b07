#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "AnalyticsReporter.h"
#include "GeoLocator.h"
#include "RedirectResolver.h"
#include "Server.h"
#include "TimeUtils.h"
#include "test_support.hh"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Full HTTP round trips against a server on an ephemeral loopback port
class ServerTest : public ::testing::Test {
protected:
  ManualClock clock;
  CodeGenerator generator{6};
  LinkRegistry registry{generator, clock.source()};
  StaticGeoLocator geo;
  RedirectResolver resolver{registry, geo};
  AnalyticsReporter reporter{registry};
  UrlShortenerServer server{registry, resolver, reporter, "http://sho.rt/", 4};
  std::thread serverThread;
  std::unique_ptr<httplib::Client> client;

  void SetUp() override {
    int port = server.bindToAnyPort("127.0.0.1");
    ASSERT_GT(port, 0);
    serverThread = std::thread([this] { server.listenAfterBind(); });
    for (int i = 0; i < 200 && !server.isRunning(); i++) {
      std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(server.isRunning());
    client = std::make_unique<httplib::Client>("127.0.0.1", port);
  }

  void TearDown() override {
    server.stop();
    if (serverThread.joinable()) {
      serverThread.join();
    }
  }

  httplib::Result create(const json &body) {
    return client->Post("/shorturls", body.dump(), "application/json");
  }
};

} // namespace

TEST_F(ServerTest, CreateReturnsShortLinkAndExpiry) {
  auto res = create({{"url", "https://example.com/page"}, {"validity", 10}, {"shortcode", "abcd"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 201);

  json body = json::parse(res->body);
  EXPECT_EQ(body["shortLink"], "http://sho.rt/abcd");
  EXPECT_EQ(body["expiry"], toIso8601(clock.now() + 10min));
}

TEST_F(ServerTest, CreateWithoutCodeGeneratesOne) {
  auto res = create({{"url", "https://example.com"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 201);

  std::string link = json::parse(res->body)["shortLink"];
  std::string code = link.substr(std::string("http://sho.rt/").size());
  EXPECT_EQ(code.size(), 6u);
  EXPECT_EQ(registry.get(code).expires_at - registry.get(code).created_at, 30min);
}

TEST_F(ServerTest, ValidationFailuresAreBadRequests) {
  auto badUrl = create({{"url", "not-a-url"}});
  ASSERT_TRUE(badUrl);
  EXPECT_EQ(badUrl->status, 400);
  EXPECT_TRUE(json::parse(badUrl->body).contains("detail"));

  auto badCode = create({{"url", "https://a.com"}, {"shortcode", "a-b"}});
  ASSERT_TRUE(badCode);
  EXPECT_EQ(badCode->status, 400);

  auto badValidity = create({{"url", "https://a.com"}, {"validity", 0}});
  ASSERT_TRUE(badValidity);
  EXPECT_EQ(badValidity->status, 400);

  auto badJson = client->Post("/shorturls", "{oops", "application/json");
  ASSERT_TRUE(badJson);
  EXPECT_EQ(badJson->status, 400);

  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ServerTest, DuplicateCodeIsBadRequest) {
  ASSERT_EQ(create({{"url", "https://a.com"}, {"shortcode", "abcd"}})->status, 201);
  auto res = create({{"url", "https://b.com"}, {"shortcode", "abcd"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
}

// Codes that a fixed route would shadow are refused up front
TEST_F(ServerTest, ReservedRouteNamesAreRejected) {
  auto health = create({{"url", "https://a.com"}, {"shortcode", "health"}});
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 400);
  EXPECT_EQ(json::parse(health->body)["detail"], "Shortcode is reserved: health");

  auto shorturls = create({{"url", "https://a.com"}, {"shortcode", "shorturls"}});
  ASSERT_TRUE(shorturls);
  EXPECT_EQ(shorturls->status, 400);

  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(json::parse(client->Get("/health")->body)["status"], "healthy");
}

TEST_F(ServerTest, RedirectRecordsClickVisibleInStats) {
  ASSERT_EQ(create({{"url", "https://example.com/dest"}, {"shortcode", "go01"}})->status, 201);

  httplib::Headers headers = {{"Referer", "https://blog.example/post"}, {"User-Agent", "TestAgent/1.0"}};
  auto redirect = client->Get("/go01", headers);
  ASSERT_TRUE(redirect);
  EXPECT_EQ(redirect->status, 302);
  EXPECT_EQ(redirect->get_header_value("Location"), "https://example.com/dest");

  auto stats = client->Get("/shorturls/go01");
  ASSERT_TRUE(stats);
  EXPECT_EQ(stats->status, 200);

  json body = json::parse(stats->body);
  EXPECT_EQ(body["shortcode"], "go01");
  EXPECT_EQ(body["original_url"], "https://example.com/dest");
  EXPECT_EQ(body["total_clicks"], 1);
  EXPECT_EQ(body["is_expired"], false);
  ASSERT_EQ(body["clicks_data"].size(), 1u);
  EXPECT_EQ(body["clicks_data"][0]["source"], "https://blog.example/post");
  EXPECT_EQ(body["clicks_data"][0]["user_agent"], "TestAgent/1.0");
  EXPECT_EQ(body["clicks_data"][0]["ip"], "127.0.0.1");
  EXPECT_EQ(body["clicks_data"][0]["geographical_info"], "Localhost");
}

TEST_F(ServerTest, UnknownCodesAreNotFound) {
  auto redirect = client->Get("/nope1");
  ASSERT_TRUE(redirect);
  EXPECT_EQ(redirect->status, 404);
  EXPECT_EQ(json::parse(redirect->body)["detail"], "Short URL not found: nope1");

  auto stats = client->Get("/shorturls/nope1");
  ASSERT_TRUE(stats);
  EXPECT_EQ(stats->status, 404);
}

TEST_F(ServerTest, ExpiredLinkIsGoneButReportable) {
  ASSERT_EQ(create({{"url", "https://example.com"}, {"validity", 1}, {"shortcode", "old1"}})->status, 201);
  clock.advance(61s);

  auto redirect = client->Get("/old1");
  ASSERT_TRUE(redirect);
  EXPECT_EQ(redirect->status, 410);

  auto stats = client->Get("/shorturls/old1");
  ASSERT_TRUE(stats);
  EXPECT_EQ(stats->status, 200);
  json body = json::parse(stats->body);
  EXPECT_EQ(body["is_expired"], true);
  EXPECT_EQ(body["total_clicks"], 0);
}

TEST_F(ServerTest, HealthReportsLinkCount) {
  create({{"url", "https://a.com"}});
  create({{"url", "https://b.com"}});

  auto res = client->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["total_urls"], 2);
  EXPECT_EQ(body["timestamp"], toIso8601(clock.now()));
}

TEST_F(ServerTest, RootListsEndpoints) {
  auto res = client->Get("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json body = json::parse(res->body);
  EXPECT_EQ(body["endpoints"]["create_url"], "POST /shorturls");
}

TEST_F(ServerTest, EveryResponseCarriesCorsHeaders) {
  auto res = client->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

  auto preflight = client->Options("/shorturls");
  ASSERT_TRUE(preflight);
  EXPECT_EQ(preflight->status, 204);
  EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
}

TEST_F(ServerTest, NonAlphanumericPathIsNotFound) {
  auto res = client->Get("/ab-cd");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_TRUE(json::parse(res->body).contains("detail"));
}

// The flag is what a SIGINT/SIGTERM handler sets; the listen loop must then return
TEST(ServerShutdown, RunUntilReturnsOnceFlagIsSet) {
  ManualClock clock;
  CodeGenerator generator{6};
  LinkRegistry registry{generator, clock.source()};
  StaticGeoLocator geo;
  RedirectResolver resolver{registry, geo};
  AnalyticsReporter reporter{registry};
  UrlShortenerServer server{registry, resolver, reporter, "http://sho.rt/", 2};

  volatile std::sig_atomic_t stopFlag = 0;
  std::atomic<bool> returned{false};
  std::thread serverThread([&] {
    server.runUntil("127.0.0.1", 0, stopFlag);
    returned = true;
  });

  for (int i = 0; i < 200 && !server.isRunning(); i++) {
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_TRUE(server.isRunning());
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(returned.load());

  stopFlag = 1;
  for (int i = 0; i < 200 && !returned.load(); i++) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_TRUE(returned.load());
  if (!returned.load()) {
    server.stop();
  }
  serverThread.join();
  EXPECT_FALSE(server.isRunning());
}

TEST(ServerStatusMapping, ErrorCodesToHttp) {
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::InvalidUrl), 400);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::InvalidCode), 400);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::InvalidValidity), 400);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::CodeTaken), 400);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::NotFound), 404);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::Expired), 410);
  EXPECT_EQ(UrlShortenerServer::httpStatusFor(ErrorCode::Internal), 500);
}
