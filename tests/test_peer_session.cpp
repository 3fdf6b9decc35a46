#include <gtest/gtest.h>

#include "frame_codec.hpp"
#include "peer_client.hpp"
#include "request_router.hpp"
#include "session.hpp"
#include "tool_manager.hpp"
#include "tools/builtin_tools.hpp"
#include "transport/multiaddr.hpp"
#include "transport/peer_listener.hpp"
#include "transport/stream.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace toolmesh;

class PeerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterMetaTools(&tools, 4);
        RegisterSystemTools(&tools, "peer-under-test");
    }

    // Serves one side of a socket pair on a background thread and hands the
    // other side to the test.
    void StartSession(std::int64_t max_frames = 0, std::size_t max_frame_bytes = kDefaultMaxFrameBytes) {
        int fds[2] = {-1, -1};
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        server_stream = std::make_unique<FdStream>(fds[0], "local");
        client_stream = std::make_unique<FdStream>(fds[1], "local");
        session = std::make_unique<Session>("sess_test", max_frames);
        server = std::thread([this, max_frame_bytes]() {
            stats = ServeStream(server_stream.get(), &router, session.get(), max_frame_bytes);
            server_stream->Close();
        });
    }

    void TearDown() override {
        if (client_stream) client_stream->ShutdownWrite();
        if (server.joinable()) server.join();
    }

    HierarchicalToolManager tools;
    RequestRouter router{&tools, RouterOptions{"toolmesh", "test", "peer-under-test"}};
    std::unique_ptr<FdStream> server_stream;
    std::unique_ptr<FdStream> client_stream;
    std::unique_ptr<Session> session;
    std::thread server;
    ServeStats stats;
};

TEST_F(PeerSessionTest, HandshakeListAndCall) {
    StartSession();
    PeerClient client(client_stream.get());
    std::string err;

    auto info = client.Initialize(&err);
    ASSERT_TRUE(info.has_value()) << err;
    EXPECT_EQ((*info)["serverInfo"]["peer_id"], "peer-under-test");
    EXPECT_EQ((*info)["protocolVersion"], kProtocolId);

    auto listed = client.ListTools(&err);
    ASSERT_EQ(listed.size(), 7u) << err;
    EXPECT_EQ(listed[0].category, "meta");
    EXPECT_EQ(listed[5].category, "system");
    EXPECT_EQ(listed[5].name, "echo");

    auto echoed = client.CallTool("echo", {{"text", "hi"}}, &err);
    ASSERT_TRUE(echoed.has_value()) << err;
    EXPECT_EQ(*echoed, (nlohmann::json{{"text", "hi"}}));

    auto parallel = client.CallTool("meta/dispatch_parallel",
                                    {{"calls",
                                      {{{"category", "system"}, {"tool", "ping"}},
                                       {{"category", "system"}, {"tool", "echo"}, {"params", {{"n", 2}}}},
                                       {{"category", "ghost"}, {"tool", "echo"}}}},
                                     {"max_concurrent", 2}},
                                    &err);
    ASSERT_TRUE(parallel.has_value()) << err;
    ASSERT_EQ((*parallel)["results"].size(), 3u);
    EXPECT_EQ((*parallel)["results"][0]["ok"], true);
    EXPECT_EQ((*parallel)["results"][1]["n"], 2);
    EXPECT_EQ((*parallel)["results"][2]["status"], "error");

    client_stream->ShutdownWrite();
    server.join();
    EXPECT_EQ(stats.close_reason, "eof");
    EXPECT_EQ(stats.frames_read, 4);
}

TEST_F(PeerSessionTest, ErrorsArriveAsJsonRpcErrors) {
    StartSession();
    PeerClient client(client_stream.get());
    std::string err;

    EXPECT_FALSE(client.CallTool("echo", nlohmann::json::object(), &err).has_value());
    EXPECT_EQ(client.last_error_code(), -32002);
    EXPECT_EQ(err, "init_required");

    ASSERT_TRUE(client.Initialize(&err).has_value());
    EXPECT_FALSE(client.Rpc("prompts/list", nlohmann::json::object(), &err).has_value());
    EXPECT_EQ(client.last_error_code(), -32601);

    auto raw = client.Exchange({{"jsonrpc", "1.0"}, {"id", 99}, {"method", "tools/list"}}, &err);
    ASSERT_TRUE(raw.has_value()) << err;
    EXPECT_EQ((*raw)["id"], 99);
    EXPECT_EQ((*raw)["error"]["code"], -32600);
}

TEST_F(PeerSessionTest, RateLimitAppliesPerSession) {
    StartSession(2);
    PeerClient client(client_stream.get());
    std::string err;
    ASSERT_TRUE(client.Initialize(&err).has_value()) << err;
    ASSERT_TRUE(client.CallTool("ping", nlohmann::json::object(), &err).has_value()) << err;
    EXPECT_FALSE(client.CallTool("ping", nlohmann::json::object(), &err).has_value());
    EXPECT_EQ(client.last_error_code(), -32010);
}

TEST_F(PeerSessionTest, NotificationsAreSilent) {
    StartSession();
    PeerClient client(client_stream.get());
    std::string err;
    ASSERT_TRUE(client.Initialize(&err).has_value());
    ASSERT_TRUE(client.Notify("notifications/initialized", nlohmann::json::object(), &err)) << err;
    auto pong = client.CallTool("ping", nlohmann::json::object(), &err);
    ASSERT_TRUE(pong.has_value()) << err;
    EXPECT_EQ((*pong)["ok"], true);
}

TEST_F(PeerSessionTest, OversizedFrameClosesSession) {
    StartSession(0, 128);
    std::string err;
    ASSERT_TRUE(client_stream->WriteAll(EncodeFrameHeader(4096), &err)) << err;

    auto reply = ReadFrame(client_stream.get(), kDefaultMaxFrameBytes);
    ASSERT_EQ(reply.status, FrameStatus::kMessage);
    EXPECT_EQ(reply.message["error"]["code"], -32003);

    auto after = ReadFrame(client_stream.get(), kDefaultMaxFrameBytes);
    EXPECT_EQ(after.status, FrameStatus::kEndOfStream);
    server.join();
    EXPECT_EQ(stats.close_reason, "frame_too_large");
}

TEST_F(PeerSessionTest, ListenerServesIndependentSessions) {
    PeerListenerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.max_frames_per_session = 2;
    PeerListener listener(&router, options);
    std::string err;
    ASSERT_TRUE(listener.Start(&err)) << err;
    ASSERT_GT(listener.bound_port(), 0);

    Multiaddr addr{"127.0.0.1", listener.bound_port(), "peer-under-test"};
    auto first = DialMultiaddr(addr, &err);
    auto second = DialMultiaddr(addr, &err);
    ASSERT_NE(first, nullptr) << err;
    ASSERT_NE(second, nullptr) << err;

    PeerClient a(first.get());
    PeerClient b(second.get());
    ASSERT_TRUE(a.Initialize(&err).has_value()) << err;
    ASSERT_TRUE(a.CallTool("ping", nlohmann::json::object(), &err).has_value()) << err;
    EXPECT_FALSE(a.CallTool("ping", nlohmann::json::object(), &err).has_value());
    EXPECT_EQ(a.last_error_code(), -32010);

    ASSERT_TRUE(b.Initialize(&err).has_value()) << err;
    auto pong = b.CallTool("system/ping", nlohmann::json::object(), &err);
    ASSERT_TRUE(pong.has_value()) << err;
    EXPECT_EQ((*pong)["peer_id"], "peer-under-test");

    listener.Stop();
    EXPECT_EQ(listener.active_sessions(), 0u);
    EXPECT_FALSE(a.Rpc("tools/list", nlohmann::json::object(), &err).has_value());
}

// Lowers the soft descriptor limit for the lifetime of the object.
class ScopedFdLimit {
public:
    explicit ScopedFdLimit(rlim_t soft) {
        ok_ = getrlimit(RLIMIT_NOFILE, &saved_) == 0;
        if (!ok_) return;
        rlimit low = saved_;
        low.rlim_cur = soft;
        ok_ = setrlimit(RLIMIT_NOFILE, &low) == 0;
    }
    ~ScopedFdLimit() { Restore(); }
    void Restore() {
        if (ok_) setrlimit(RLIMIT_NOFILE, &saved_);
        ok_ = false;
    }
    bool ok() const { return ok_; }

private:
    rlimit saved_{};
    bool ok_ = false;
};

TEST_F(PeerSessionTest, ListenerKeepsAcceptingAfterDescriptorExhaustion) {
    PeerListenerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    PeerListener listener(&router, options);
    std::string err;
    ASSERT_TRUE(listener.Start(&err)) << err;
    Multiaddr addr{"127.0.0.1", listener.bound_port(), ""};

    std::unique_ptr<FdStream> waiting;
    {
        ScopedFdLimit limit(64);
        ASSERT_TRUE(limit.ok());
        std::vector<int> filler;
        for (;;) {
            int fd = ::open("/dev/null", O_RDONLY);
            if (fd < 0) break;
            filler.push_back(fd);
        }
        ASSERT_FALSE(filler.empty());

        // One free slot: the client takes it, so the listener's accept fails.
        ::close(filler.back());
        filler.pop_back();
        waiting = DialMultiaddr(addr, &err, std::chrono::milliseconds(5000));
        ASSERT_NE(waiting, nullptr) << err;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        for (int fd : filler) ::close(fd);
        limit.Restore();
    }

    PeerClient held(waiting.get());
    ASSERT_TRUE(held.Initialize(&err).has_value()) << err;

    auto fresh = DialMultiaddr(addr, &err, std::chrono::milliseconds(5000));
    ASSERT_NE(fresh, nullptr) << err;
    PeerClient client(fresh.get());
    auto info = client.Initialize(&err);
    ASSERT_TRUE(info.has_value()) << err;
    EXPECT_EQ((*info)["serverInfo"]["peer_id"], "peer-under-test");
    listener.Stop();
}

TEST(PeerClientTimeoutTest, SilentPeerFailsWithinTimeout) {
    // Accepts at the kernel level but never reads or answers.
    int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listen_fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(::bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listen_fd, 4), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

    std::string err;
    auto stream = DialMultiaddr({"127.0.0.1", ntohs(addr.sin_port), ""}, &err, std::chrono::milliseconds(200));
    ASSERT_NE(stream, nullptr) << err;

    PeerClient client(stream.get());
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.Initialize(&err).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_NE(err.find("timed out"), std::string::npos) << err;
    ::close(listen_fd);
}

TEST(PeerClientTimeoutTest, StreamTimeoutBoundsReads) {
    int fds[2] = {-1, -1};
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    FdStream near(fds[0], "local");
    FdStream far(fds[1], "local");
    std::string err;
    ASSERT_TRUE(near.SetIoTimeout(std::chrono::milliseconds(100), &err)) << err;

    std::string out;
    EXPECT_EQ(near.ReadExact(4, &out, &err), ReadStatus::kError);
    EXPECT_EQ(err, "recv: timed out");
}

TEST_F(PeerSessionTest, ConcurrentCallsShareOneClient) {
    StartSession();
    PeerClient client(client_stream.get());
    std::string err;
    ASSERT_TRUE(client.Initialize(&err).has_value()) << err;

    std::atomic<int> pongs{0};
    std::atomic<int> rejected{0};
    std::thread a([&]() {
        std::string e;
        for (int i = 0; i < 20; i++) {
            if (client.CallTool("ping", nlohmann::json::object(), &e)) pongs++;
        }
    });
    std::thread b([&]() {
        std::string e;
        for (int i = 0; i < 20; i++) {
            if (!client.Rpc("prompts/list", nlohmann::json::object(), &e) && e == "method_not_found") {
                rejected++;
            }
        }
    });
    a.join();
    b.join();
    EXPECT_EQ(pongs.load(), 20);
    EXPECT_EQ(rejected.load(), 20);
    const int code = client.last_error_code();
    EXPECT_TRUE(code == 0 || code == -32601) << code;
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
