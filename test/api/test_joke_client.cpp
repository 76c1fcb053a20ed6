#include <gtest/gtest.h>

#include <algorithm>

#include <nlohmann/json.hpp>

#include "api/JokeClient.hpp"
#include "test_utils.hpp"

using namespace chuck;
using namespace chuck::test;
using nlohmann::json;

class JokeClientTest : public ::testing::Test {
protected:
    JokeClientTest() : client(transport, makeConfig()) {}

    static ClientConfig makeConfig() {
        ClientConfig cfg;
        cfg.baseUrl = "https://jokes.test";
        cfg.timeoutSeconds = 7;
        return cfg;
    }

    FakeTransport transport;
    JokeClient client;
};

// ---- random ----

TEST_F(JokeClientTest, RandomReturnsDecodedObjectUnchanged) {
    transport.respond(200, R"({"id":"1","value":"a joke","extra":{"k":[1,2]}})");

    auto res = client.fetchRandom();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value()["value"], "a joke");
    EXPECT_EQ(res.value()["extra"]["k"], json::array({1, 2}));

    ASSERT_EQ(transport.callCount(), 1u);
    EXPECT_EQ(transport.lastRequest().url, "https://jokes.test/jokes/random");
}

TEST_F(JokeClientTest, RandomSendsCategoryOnlyWhenGiven) {
    transport.respond(200, R"({"value":"a"})");
    transport.respond(200, R"({"value":"b"})");
    transport.respond(200, R"({"value":"c"})");

    ASSERT_TRUE(client.fetchRandom(std::string("dev")).has_value());
    EXPECT_EQ(transport.lastParam("category"), std::optional<std::string>("dev"));

    ASSERT_TRUE(client.fetchRandom().has_value());
    EXPECT_FALSE(transport.lastParam("category").has_value());
    EXPECT_TRUE(transport.lastRequest().query.empty());

    ASSERT_TRUE(client.fetchRandom(std::string("")).has_value());
    EXPECT_FALSE(transport.lastParam("category").has_value());
}

TEST_F(JokeClientTest, RandomMissingValueIsShapeError) {
    transport.respond(200, R"({"id":"1","text":"not here"})");
    auto res = client.fetchRandom();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::UnexpectedShape);
    EXPECT_NE(res.error().message.find("unexpected response shape"), std::string::npos);
}

TEST_F(JokeClientTest, RandomNonObjectIsShapeError) {
    transport.respond(200, R"(["value"])");
    auto res = client.fetchRandom();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::UnexpectedShape);
}

TEST_F(JokeClientTest, RandomInvalidJson) {
    transport.respond(200, "<html>oops</html>");
    auto res = client.fetchRandom();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidJson);
    EXPECT_NE(res.error().message.find("Invalid JSON"), std::string::npos);
}

TEST_F(JokeClientTest, EmptyBodyIsInvalidJson) {
    transport.respond(200, "");
    auto res = client.fetchRandom();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidJson);
}

TEST_F(JokeClientTest, TimeoutIsDistinctFromNetworkFailure) {
    transport.fail(ErrorCode::Timeout, "Timeout was reached");
    transport.fail(ErrorCode::Network, "Couldn't connect to server");

    auto timedOut = client.fetchRandom();
    ASSERT_FALSE(timedOut.has_value());
    EXPECT_EQ(timedOut.error().code, ErrorCode::Timeout);
    EXPECT_NE(timedOut.error().message.find("timed out"), std::string::npos);

    auto refused = client.fetchRandom();
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, ErrorCode::Network);
    EXPECT_NE(refused.error().message.find("Couldn't connect to server"), std::string::npos);
}

TEST_F(JokeClientTest, Non2xxIsHttpStatusError) {
    transport.respond(404, R"({"status":404,"error":"Not Found"})");
    auto res = client.fetchRandom(std::string("nope"));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HttpStatus);
    EXPECT_NE(res.error().message.find("404"), std::string::npos);
}

TEST_F(JokeClientTest, UsesConfiguredTimeoutUnlessOverridden) {
    transport.respond(200, R"({"value":"a"})");
    transport.respond(200, R"({"value":"b"})");
    transport.respond(200, R"({"value":"c"})");

    ASSERT_TRUE(client.fetchRandom().has_value());
    EXPECT_EQ(transport.lastRequest().timeoutSeconds, 7);

    ASSERT_TRUE(client.fetchRandom(std::nullopt, 2L).has_value());
    EXPECT_EQ(transport.lastRequest().timeoutSeconds, 2);

    ASSERT_TRUE(client.fetchRandom(std::nullopt, 0L).has_value());
    EXPECT_EQ(transport.lastRequest().timeoutSeconds, 7);
}

// ---- categories ----

TEST_F(JokeClientTest, CategoriesReturnedAsIs) {
    transport.respond(200, R"(["animal","career","dev"])");
    auto res = client.fetchCategories();
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value(), json::parse(R"(["animal","career","dev"])"));
    EXPECT_EQ(transport.lastRequest().url, "https://jokes.test/jokes/categories");
}

TEST_F(JokeClientTest, CategoriesAreNotShapeValidated) {
    transport.respond(200, R"({"unexpected":true})");
    auto res = client.fetchCategories();
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res.value().is_object());
}

TEST_F(JokeClientTest, CategoriesServerError) {
    transport.respond(503, "Service Unavailable");
    auto res = client.fetchCategories();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::HttpStatus);
}

// ---- search ----

TEST_F(JokeClientTest, SearchSendsQueryParameter) {
    transport.respond(200, R"({"total":0,"result":[]})");
    ASSERT_TRUE(client.search("kick & punch").has_value());
    EXPECT_EQ(transport.lastRequest().url, "https://jokes.test/jokes/search");
    EXPECT_EQ(transport.lastParam("query"), std::optional<std::string>("kick & punch"));
}

TEST_F(JokeClientTest, SearchTrimsToPrefixOfLimit) {
    const std::string body =
        R"({"total":5,"result":[{"value":"a"},{"value":"b"},{"value":"c"},{"value":"d"},{"value":"e"}]})";
    json server = json::parse(body);

    for (long long limit : {0LL, 1LL, 3LL, 5LL, 10LL}) {
        transport.respond(200, body);
        auto res = client.search("q", limit);
        ASSERT_TRUE(res.has_value());

        const json& result = res.value()["result"];
        size_t expected = std::min<size_t>(static_cast<size_t>(limit), 5);
        ASSERT_EQ(result.size(), expected) << "limit " << limit;
        for (size_t i = 0; i < result.size(); ++i) {
            EXPECT_EQ(result[i], server["result"][i]);
        }
        EXPECT_EQ(res.value()["total"], 5);
    }
}

TEST_F(JokeClientTest, SearchDefaultLimitIsTen) {
    json items = json::array();
    for (int i = 0; i < 15; ++i) items.push_back({{"value", std::to_string(i)}});
    transport.respond(200, json{{"total", 15}, {"result", items}}.dump());

    auto res = client.search("q");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value()["result"].size(), 10u);
}

TEST_F(JokeClientTest, SearchWithoutResultArrayPassesThrough) {
    transport.respond(200, R"({"total":0})");
    transport.respond(200, R"({"total":1,"result":"weird"})");
    transport.respond(200, R"([1,2,3])");

    auto noResult = client.search("q", 1);
    ASSERT_TRUE(noResult.has_value());
    EXPECT_EQ(noResult.value(), json::parse(R"({"total":0})"));

    auto weird = client.search("q", 1);
    ASSERT_TRUE(weird.has_value());
    EXPECT_EQ(weird.value()["result"], "weird");

    auto list = client.search("q", 1);
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list.value().size(), 3u);
}

TEST_F(JokeClientTest, NegativeLimitTrimsEverything) {
    json data = json::parse(R"({"result":[{"value":"a"}]})");
    JokeClient::trimResults(data, -4);
    EXPECT_TRUE(data["result"].empty());
}

TEST_F(JokeClientTest, SearchInvalidJson) {
    transport.respond(200, "{not json");
    auto res = client.search("q");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidJson);
}
