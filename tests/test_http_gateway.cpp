#include <gtest/gtest.h>

#include "http_gateway.hpp"
#include "request_router.hpp"
#include "tool_manager.hpp"
#include "tools/builtin_tools.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace toolmesh;

class HttpGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterSystemTools(&tools, "peer-http");
        HttpGatewayOptions options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.max_frame_bytes = 256;
        options.max_frames_per_session = 3;
        Configure(&options);
        gateway = std::make_unique<HttpGateway>(&router, options);
        std::string err;
        ASSERT_TRUE(gateway->Start(&err)) << err;
        client = std::make_unique<httplib::Client>("127.0.0.1", gateway->bound_port());
        client->set_connection_timeout(5);
        client->set_read_timeout(10);
    }

    void TearDown() override { gateway->Stop(); }

    virtual void Configure(HttpGatewayOptions*) {}

    httplib::Result Post(const nlohmann::json& body, const std::string& session_id = {}) {
        httplib::Headers headers;
        if (!session_id.empty()) headers.emplace(kSessionHeader, session_id);
        return client->Post("/mcp", headers, body.dump(), "application/json");
    }

    static nlohmann::json Request(int id, const std::string& method, nlohmann::json params = nlohmann::json::object()) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
    }

    HierarchicalToolManager tools;
    RequestRouter router{&tools, RouterOptions{"toolmesh", "test", "peer-http"}};
    std::unique_ptr<HttpGateway> gateway;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(HttpGatewayTest, SessionHeaderCarriesHandshake) {
    auto init = Post(Request(1, "initialize"));
    ASSERT_TRUE(init);
    EXPECT_EQ(init->status, 200);
    const auto session_id = init->get_header_value(kSessionHeader);
    ASSERT_FALSE(session_id.empty());
    auto body = nlohmann::json::parse(init->body);
    EXPECT_EQ(body["result"]["serverInfo"]["peer_id"], "peer-http");

    auto call = Post(Request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}}), session_id);
    ASSERT_TRUE(call);
    EXPECT_EQ(nlohmann::json::parse(call->body)["result"], (nlohmann::json{{"text", "hi"}}));

    // A request without the header starts a fresh, uninitialized session.
    auto fresh = Post(Request(3, "tools/list"));
    ASSERT_TRUE(fresh);
    EXPECT_EQ(nlohmann::json::parse(fresh->body)["error"]["code"], -32002);
    EXPECT_NE(fresh->get_header_value(kSessionHeader), session_id);
    EXPECT_EQ(gateway->session_count(), 2u);
}

TEST_F(HttpGatewayTest, FrameBudgetIsPerSession) {
    auto init = Post(Request(1, "initialize"));
    ASSERT_TRUE(init);
    const auto session_id = init->get_header_value(kSessionHeader);
    Post(Request(2, "tools/list"), session_id);
    Post(Request(3, "tools/list"), session_id);
    auto limited = Post(Request(4, "tools/list"), session_id);
    ASSERT_TRUE(limited);
    EXPECT_EQ(nlohmann::json::parse(limited->body)["error"]["code"], -32010);
}

TEST_F(HttpGatewayTest, UnknownSessionIsNotFound) {
    auto r = Post(Request(1, "tools/list"), "http_missing");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->status, 404);
}

TEST_F(HttpGatewayTest, OversizedBodyIsRejected) {
    auto r = Post(Request(1, "initialize", {{"padding", std::string(1024, 'x')}}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->status, 413);
    EXPECT_EQ(nlohmann::json::parse(r->body)["error"]["code"], -32003);
}

TEST_F(HttpGatewayTest, MalformedBodyIsParseError) {
    auto r = client->Post("/mcp", "{nope", "application/json");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->status, 400);
    EXPECT_EQ(nlohmann::json::parse(r->body)["error"]["code"], -32700);
}

TEST_F(HttpGatewayTest, RejectedBodiesDoNotOpenSessions) {
    auto big = Post(Request(1, "initialize", {{"padding", std::string(1024, 'x')}}));
    ASSERT_TRUE(big);
    EXPECT_EQ(big->status, 413);
    EXPECT_FALSE(big->has_header(kSessionHeader));

    auto bad = client->Post("/mcp", "{nope", "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
    EXPECT_FALSE(bad->has_header(kSessionHeader));

    EXPECT_EQ(gateway->session_count(), 0u);
}

class HttpGatewayIdleTest : public HttpGatewayTest {
protected:
    void Configure(HttpGatewayOptions* options) override {
        options->session_idle_timeout = std::chrono::milliseconds(50);
    }
};

TEST_F(HttpGatewayIdleTest, IdleSessionsAreReapedOnNextOpen) {
    auto first = Post(Request(1, "initialize"));
    ASSERT_TRUE(first);
    const auto stale_id = first->get_header_value(kSessionHeader);
    EXPECT_EQ(gateway->session_count(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    auto second = Post(Request(1, "initialize"));
    ASSERT_TRUE(second);
    EXPECT_EQ(second->status, 200);
    EXPECT_EQ(gateway->session_count(), 1u);

    auto stale = Post(Request(2, "tools/list"), stale_id);
    ASSERT_TRUE(stale);
    EXPECT_EQ(stale->status, 404);
}

class HttpGatewayCapTest : public HttpGatewayTest {
protected:
    void Configure(HttpGatewayOptions* options) override { options->max_sessions = 2; }
};

TEST_F(HttpGatewayCapTest, SessionCountIsBounded) {
    auto a = Post(Request(1, "initialize"));
    auto b = Post(Request(1, "initialize"));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(gateway->session_count(), 2u);

    auto refused = Post(Request(7, "initialize"));
    ASSERT_TRUE(refused);
    EXPECT_EQ(refused->status, 503);
    auto body = nlohmann::json::parse(refused->body);
    EXPECT_EQ(body["id"], 7);
    EXPECT_EQ(body["error"]["message"], "session_limit_reached");
    EXPECT_EQ(gateway->session_count(), 2u);

    httplib::Headers headers = {{kSessionHeader, a->get_header_value(kSessionHeader)}};
    auto del = client->Delete("/mcp", headers);
    ASSERT_TRUE(del);
    auto admitted = Post(Request(8, "initialize"));
    ASSERT_TRUE(admitted);
    EXPECT_EQ(admitted->status, 200);
}

TEST_F(HttpGatewayTest, DeleteEndsSession) {
    auto init = Post(Request(1, "initialize"));
    ASSERT_TRUE(init);
    const auto session_id = init->get_header_value(kSessionHeader);

    httplib::Headers headers = {{kSessionHeader, session_id}};
    auto del = client->Delete("/mcp", headers);
    ASSERT_TRUE(del);
    EXPECT_EQ(del->status, 200);
    EXPECT_EQ(gateway->session_count(), 0u);

    auto after = Post(Request(2, "tools/list"), session_id);
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 404);
}

TEST_F(HttpGatewayTest, Health) {
    auto r = client->Get("/health");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->status, 200);
    auto j = nlohmann::json::parse(r->body);
    EXPECT_EQ(j["ok"], true);
    EXPECT_EQ(j["sessions"], 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
