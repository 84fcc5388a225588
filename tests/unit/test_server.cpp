#include <gtest/gtest.h>
#include "auth.hpp"
#include "client.hpp"
#include "discovery.hpp"
#include "net.hpp"
#include "server.hpp"
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// Real server on an ephemeral port, real ClientSessions against it
class ServerTest : public ::testing::Test {
protected:
    const std::string share = "/tmp/lanshare_server_test/share";
    const std::string sinks = "/tmp/lanshare_server_test/sinks";

    void SetUp() override {
        fs::remove_all("/tmp/lanshare_server_test");
        fs::create_directories(share);
        fs::create_directories(sinks);

        credentials.add_secret("faculty1", "secret1");
        credentials.add_secret("faculty2", "secret2");
        directory.add("faculty1", "127.0.0.1");

        cfg.identity = "faculty1";
        cfg.share_root = share;
        cfg.port = 0;
        cfg.num_workers = 4;
        cfg.idle_timeout_ms = 5000;
    }

    void TearDown() override {
        stop_server();
        fs::remove_all("/tmp/lanshare_server_test");
    }

    void create_file(const std::string& name, size_t size, char fill) {
        std::ofstream out(share + "/" + name, std::ios::binary);
        out << std::string(size, fill);
    }

    void start_server() {
        server = std::make_unique<Server>(cfg, credentials);
        server->start();
        accept_thread = std::thread([this]() { server->run(); });
    }

    void stop_server() {
        if (server) server->stop();
        if (accept_thread.joinable()) accept_thread.join();
        server.reset();
    }

    ClientConfig client_config(const std::string& sink_name,
                               const std::string& secret = "secret1") {
        ClientConfig c;
        c.identity = "faculty1";
        c.secret = secret;
        c.sink_dir = sinks + "/" + sink_name;
        c.port = server->port();
        c.idle_timeout_ms = 5000;
        return c;
    }

    // The active count drops when the worker finishes, slightly after the
    // client has seen TRANSFER_COMPLETE
    bool wait_for_active(uint64_t expected, int timeout_ms = 3000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (server->active_connections() == expected) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return server->active_connections() == expected;
    }

    static std::string read_all(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }

    auth::CredentialStore credentials;
    auth::IdentityDirectory directory;
    ServerConfig cfg;
    std::unique_ptr<Server> server;
    std::thread accept_thread;
};

// ============================================================
// Startup Tests
// ============================================================

TEST_F(ServerTest, MissingShareRootFailsFast) {
    cfg.share_root = "/tmp/lanshare_server_test/nope";
    Server s(cfg, credentials);
    EXPECT_THROW(s.start(), ConfigError);
    EXPECT_FALSE(s.is_running());
}

TEST_F(ServerTest, CreateShareRootOnRequest) {
    cfg.share_root = "/tmp/lanshare_server_test/created";
    cfg.create_share = true;
    start_server();
    EXPECT_TRUE(fs::is_directory(cfg.share_root));
    EXPECT_TRUE(server->is_running());
}

TEST_F(ServerTest, UnknownIdentityFailsFast) {
    cfg.identity = "faculty9";
    Server s(cfg, credentials);
    EXPECT_THROW(s.start(), ConfigError);
}

TEST_F(ServerTest, PortInUse) {
    int blocker = create_listen_socket(0);
    ASSERT_GE(blocker, 0);
    cfg.port = local_port(blocker);

    Server s(cfg, credentials);
    EXPECT_THROW(s.start(), std::system_error);
    close(blocker);
}

TEST_F(ServerTest, EphemeralPortAssigned) {
    start_server();
    EXPECT_NE(server->port(), 0);
    EXPECT_EQ(server->active_connections(), 0u);
}

// ============================================================
// End-to-end Tests
// ============================================================

TEST_F(ServerTest, DownloadsEverySharedFile) {
    create_file("notes.pdf", 2048, 'n');
    create_file("slides.pdf", 4096, 's');
    start_server();

    ClientSession session(client_config("sink1"), directory);
    SessionReport report = session.run();

    EXPECT_EQ(report.status, SessionStatus::SUCCESS) << report.error;
    EXPECT_EQ(report.summary(), "2/2");
    EXPECT_EQ(report.bytes_received, 6144u);
    EXPECT_EQ(read_all(sinks + "/sink1/notes.pdf"), read_all(share + "/notes.pdf"));
    EXPECT_EQ(read_all(sinks + "/sink1/slides.pdf"), read_all(share + "/slides.pdf"));

    EXPECT_TRUE(wait_for_active(0));
    EXPECT_EQ(server->stats().total_connections.load(), 1u);
    EXPECT_EQ(server->stats().files_sent.load(), 2u);
}

TEST_F(ServerTest, LargeFileSpansManyChunks) {
    std::string path = share + "/video.bin";
    {
        std::ofstream out(path, std::ios::binary);
        for (int i = 0; i < 300000; i++) out.put(static_cast<char>(i % 251));
    }
    start_server();

    ClientSession session(client_config("big"), directory);
    SessionReport report = session.run();

    ASSERT_EQ(report.status, SessionStatus::SUCCESS) << report.error;
    EXPECT_EQ(read_all(sinks + "/big/video.bin"), read_all(path));
}

TEST_F(ServerTest, WrongSecretGetsNothing) {
    create_file("notes.pdf", 2048, 'n');
    start_server();

    ClientSession session(client_config("denied", "wrong"), directory);
    SessionReport report = session.run();

    EXPECT_EQ(report.status, SessionStatus::AUTH_REJECTED);
    EXPECT_EQ(report.error_kind, ErrorKind::AUTHENTICATION_REJECTED);
    EXPECT_FALSE(fs::exists(sinks + "/denied/notes.pdf"));

    EXPECT_TRUE(wait_for_active(0));
    EXPECT_EQ(server->stats().auth_failures.load(), 1u);
}

TEST_F(ServerTest, EmptyShareReportsNoFiles) {
    start_server();

    ClientSession session(client_config("empty"), directory);
    SessionReport report = session.run();

    EXPECT_EQ(report.status, SessionStatus::NO_FILES);
    EXPECT_EQ(report.summary(), "0/0");
}

TEST_F(ServerTest, ConcurrentClients) {
    create_file("notes.pdf", 2048, 'n');
    create_file("slides.pdf", 4096, 's');
    cfg.num_workers = 3;
    start_server();

    constexpr int kClients = 6;
    std::vector<std::unique_ptr<ClientSession>> sessions;
    std::vector<std::future<SessionReport>> results;
    for (int i = 0; i < kClients; i++) {
        sessions.push_back(std::make_unique<ClientSession>(
            client_config("c" + std::to_string(i)), directory));
        results.push_back(sessions.back()->start());
    }

    for (int i = 0; i < kClients; i++) {
        SessionReport report = results[i].get();
        EXPECT_EQ(report.status, SessionStatus::SUCCESS) << report.error;
        EXPECT_EQ(report.summary(), "2/2");
    }

    EXPECT_TRUE(wait_for_active(0));
    EXPECT_EQ(server->stats().total_connections.load(), static_cast<uint64_t>(kClients));
}

TEST_F(ServerTest, FullPoolQueuesInsteadOfRefusing) {
    create_file("notes.pdf", 2048, 'n');
    cfg.num_workers = 1;
    start_server();

    // Occupy the only worker with a silent connection
    std::string error;
    int idle_fd = connect_to_host("127.0.0.1", server->port(), 2000, error);
    ASSERT_GE(idle_fd, 0) << error;
    Connection idle(idle_fd);
    ASSERT_TRUE(wait_for_active(1));

    ClientSession session(client_config("queued"), directory);
    auto pending = session.start();

    // Accepted and counted while waiting for the worker
    EXPECT_TRUE(wait_for_active(2));
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    idle.close();
    SessionReport report = pending.get();
    EXPECT_EQ(report.status, SessionStatus::SUCCESS) << report.error;
    EXPECT_TRUE(wait_for_active(0));
}

TEST_F(ServerTest, StopClosesQueuedConnections) {
    cfg.num_workers = 1;
    start_server();

    std::string error;
    int busy_fd = connect_to_host("127.0.0.1", server->port(), 2000, error);
    ASSERT_GE(busy_fd, 0) << error;
    Connection busy(busy_fd);
    ASSERT_TRUE(wait_for_active(1));

    int queued_fd = connect_to_host("127.0.0.1", server->port(), 2000, error);
    ASSERT_GE(queued_fd, 0) << error;
    Connection queued(queued_fd);
    ASSERT_TRUE(wait_for_active(2));

    server->stop();
    // Release the worker; the queued one must be closed unserved
    busy.close();

    std::string line;
    EXPECT_EQ(queued.read_line(line), IoResult::CLOSED);

    if (accept_thread.joinable()) accept_thread.join();
    EXPECT_EQ(server->active_connections(), 0u);
}

TEST_F(ServerTest, StopAfterRunReturnedIsHarmless) {
    start_server();
    uint16_t port = server->port();

    server->stop();
    accept_thread.join();

    // run() is over; the fd stays with the Server, no longer listening
    server->stop();
    std::string error;
    EXPECT_LT(connect_to_host("127.0.0.1", port, 500, error), 0);

    server.reset();
    cfg.port = port;
    Server again(cfg, credentials);
    EXPECT_NO_THROW(again.start());
}

TEST_F(ServerTest, StopRacingConnectsShutsDownCleanly) {
    for (int round = 0; round < 20; round++) {
        start_server();
        uint16_t port = server->port();

        std::thread clients([port]() {
            for (int i = 0; i < 5; i++) {
                std::string error;
                int fd = connect_to_host("127.0.0.1", port, 500, error);
                if (fd >= 0) close(fd);
            }
        });
        std::thread stopper([this]() { server->stop(); });

        stopper.join();
        clients.join();
        accept_thread.join();
        EXPECT_EQ(server->active_connections(), 0u) << "round " << round;
        server.reset();
    }
}

// ============================================================
// Discovery Tests
// ============================================================

TEST_F(ServerTest, AnswersDiscoveryProbe) {
    cfg.discovery = true;
    cfg.discovery_port = 0;
    start_server();
    ASSERT_NE(server->discovery_port(), 0);

    auto found = discover_servers(server->discovery_port(), 500, "127.0.0.1");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].identity, "faculty1");
    EXPECT_EQ(found[0].address, "127.0.0.1");
    EXPECT_EQ(found[0].port, server->port());
}

TEST(DiscoveryTest, NoResponderNoResults) {
    // Bind then free a UDP port so nothing answers there
    DiscoveryResponder probe_target("x", 1, 0);
    probe_target.start();
    uint16_t port = probe_target.udp_port();
    probe_target.stop();

    auto found = discover_servers(port, 200, "127.0.0.1");
    EXPECT_TRUE(found.empty());
}

TEST(DiscoveryTest, InvalidTarget) {
    EXPECT_TRUE(discover_servers(8888, 100, "not-an-address").empty());
}
