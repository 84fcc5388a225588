#include <getopt.h>
#include <signal.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <fmt/core.h>
#include "auth.hpp"
#include "client.hpp"
#include "discovery.hpp"
#include "share.hpp"
#include "utils.hpp"

constexpr const char* DEFAULT_HOSTS = "/etc/lanshare/hosts";
constexpr const char* DEFAULT_SINK = "/tmp/lanshare";

void print_usage(const char* prog) {
    fmt::print("Usage: {} [options] -u <identity>\n", prog);
    fmt::print("\nDownloads every file shared by the server of <identity>\n");
    fmt::print("\nOptions:\n");
    fmt::print("  -u, --identity <name>     Identity to log in as\n");
    fmt::print("  -s, --secret <secret>     Secret (default: $LANSHARE_SECRET)\n");
    fmt::print("  -o, --sink-dir <path>     Download directory (default: {})\n", DEFAULT_SINK);
    fmt::print("  -a, --address <host>      Connect here instead of looking up the identity\n");
    fmt::print("  -p, --port <n>            TCP port (default: {})\n", protocol::DEFAULT_PORT);
    fmt::print("  -H, --hosts <file>        Identity/hostname table (default: {})\n", DEFAULT_HOSTS);
    fmt::print("      --discover            List servers answering on the LAN and exit\n");
    fmt::print("      --purge               Delete downloaded files from the sink and exit\n");
    fmt::print("  -v, --verbose             Verbose output\n");
    fmt::print("  -h, --help                Show this help message\n");
}

enum LongOnly { OPT_DISCOVER = 1000, OPT_PURGE };

int main(int argc, char* argv[]) {
    ClientConfig cfg;
    cfg.sink_dir = DEFAULT_SINK;
    std::string hosts_path = DEFAULT_HOSTS;
    bool discover = false;
    bool purge = false;

    static struct option long_options[] = {
        {"identity", required_argument, nullptr, 'u'},
        {"secret",   required_argument, nullptr, 's'},
        {"sink-dir", required_argument, nullptr, 'o'},
        {"address",  required_argument, nullptr, 'a'},
        {"port",     required_argument, nullptr, 'p'},
        {"hosts",    required_argument, nullptr, 'H'},
        {"discover", no_argument,       nullptr, OPT_DISCOVER},
        {"purge",    no_argument,       nullptr, OPT_PURGE},
        {"verbose",  no_argument,       nullptr, 'v'},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr,    0,                 nullptr,  0 }
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "u:s:o:a:p:H:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'u':
                cfg.identity = auth::trim(optarg);
                break;
            case 's':
                cfg.secret = optarg;
                break;
            case 'o':
                cfg.sink_dir = optarg;
                break;
            case 'a':
                cfg.address = optarg;
                break;
            case 'p': {
                int port = std::atoi(optarg);
                if (port <= 0 || port > 65535) {
                    fmt::print(stderr, "Error: port must be 1-65535\n");
                    return 1;
                }
                cfg.port = static_cast<uint16_t>(port);
                break;
            }
            case 'H':
                hosts_path = optarg;
                break;
            case OPT_DISCOVER:
                discover = true;
                break;
            case OPT_PURGE:
                purge = true;
                break;
            case 'v':
                cfg.verbose = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (purge) {
        size_t removed = purge_sink(cfg.sink_dir);
        fmt::print("Cleanup complete, {} file(s) removed from {}\n", removed, cfg.sink_dir);
        return 0;
    }

    if (discover) {
        auto servers = discover_servers(protocol::DISCOVERY_PORT, 2000);
        if (servers.empty()) {
            fmt::print("No servers answered\n");
            return 1;
        }
        for (const auto& s : servers) {
            fmt::print("{:<16} {}:{}\n", s.identity, s.address, s.port);
        }
        return 0;
    }

    if (cfg.identity.empty()) {
        fmt::print(stderr, "Error: missing identity\n");
        print_usage(argv[0]);
        return 1;
    }
    if (cfg.secret.empty()) {
        const char* env = std::getenv("LANSHARE_SECRET");
        if (!env) {
            fmt::print(stderr, "Error: no secret given (use -s or LANSHARE_SECRET)\n");
            return 1;
        }
        cfg.secret = env;
    }

    auth::IdentityDirectory directory;
    if (cfg.address.empty()) {
        try {
            directory.load_file(hosts_path);
        } catch (const ConfigError& e) {
            fmt::print(stderr, "Error: {}\n", e.what());
            return 1;
        }
    }

    signal(SIGPIPE, SIG_IGN);

    ClientSession session(cfg, directory);
    session.on_progress([](const TransferProgress& p) {
        fmt::print("\r({}/{}) {:<32} {} / {}  ({}%)     ", p.file_index, p.file_count,
                   p.file_name, format_bytes(p.file_received), format_bytes(p.file_size),
                   p.overall_percent);
        if (p.file_received == p.file_size) fmt::print("\n");
        fflush(stdout);
    });

    auto start_time = std::chrono::steady_clock::now();
    SessionReport report = session.start().get();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    double seconds = duration.count() / 1000.0;

    switch (report.status) {
        case SessionStatus::SUCCESS:
            fmt::print("Done: {} file(s) downloaded, {} in {:.2f}s ({})\n", report.summary(),
                       format_bytes(report.bytes_received), seconds,
                       format_throughput(seconds > 0 ? report.bytes_received / seconds : 0));
            return 0;
        case SessionStatus::NO_FILES:
            fmt::print("No files available on server.\n");
            return 0;
        case SessionStatus::PARTIAL_FAILURE:
            fmt::print(stderr, "Partial: {} file(s) downloaded. {}\n", report.summary(), report.error);
            return 1;
        case SessionStatus::AUTH_REJECTED:
            fmt::print(stderr, "Login failed: {}\n", report.error);
            return 1;
        case SessionStatus::FAILED:
            fmt::print(stderr, "Error: {}\n", report.error);
            return 1;
    }
    return 1;
}
