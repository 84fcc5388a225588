#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <string>
#include <system_error>
#include <thread>

#include <fmt/core.h>
#include "auth.hpp"
#include "server.hpp"
#include "utils.hpp"

constexpr const char* DEFAULT_CREDENTIALS = "/etc/lanshare/credentials";
constexpr const char* DEFAULT_HOSTS = "/etc/lanshare/hosts";

// ============================================================
// Print Helpers
// ============================================================

void print_usage(const char* prog) {
    fmt::print("Usage: {} [options] -d <share-dir>\n", prog);
    fmt::print("\nShares the regular files of one directory with authenticated LAN clients\n");
    fmt::print("\nOptions:\n");
    fmt::print("  -u, --identity <name>     Identity this server represents (default: from hostname)\n");
    fmt::print("  -d, --share-dir <path>    Directory to share (required)\n");
    fmt::print("  -p, --port <n>            TCP port (default: {})\n", protocol::DEFAULT_PORT);
    fmt::print("  -j, --workers <n>         Max concurrent clients (default: 10)\n");
    fmt::print("  -t, --timeout <ms>        Per-connection idle timeout (default: {})\n",
               protocol::IDLE_TIMEOUT_MS);
    fmt::print("  -c, --credentials <file>  Credential table (default: {})\n", DEFAULT_CREDENTIALS);
    fmt::print("  -H, --hosts <file>        Identity/hostname table (default: {})\n", DEFAULT_HOSTS);
    fmt::print("      --create              Create the share directory if missing\n");
    fmt::print("      --discovery           Answer UDP discovery probes on port {}\n",
               protocol::DISCOVERY_PORT);
    fmt::print("  -v, --verbose             Verbose output\n");
    fmt::print("  -h, --help                Show this help message\n");
    fmt::print("\nExamples:\n");
    fmt::print("  {} -u faculty1 -d /srv/share\n", prog);
    fmt::print("  {} -d /srv/share -j 20 --discovery\n", prog);
}

enum LongOnly { OPT_CREATE = 1000, OPT_DISCOVERY };

int main(int argc, char* argv[]) {
    ServerConfig cfg;
    std::string credentials_path = DEFAULT_CREDENTIALS;
    std::string hosts_path;

    static struct option long_options[] = {
        {"identity",    required_argument, nullptr, 'u'},
        {"share-dir",   required_argument, nullptr, 'd'},
        {"port",        required_argument, nullptr, 'p'},
        {"workers",     required_argument, nullptr, 'j'},
        {"timeout",     required_argument, nullptr, 't'},
        {"credentials", required_argument, nullptr, 'c'},
        {"hosts",       required_argument, nullptr, 'H'},
        {"create",      no_argument,       nullptr, OPT_CREATE},
        {"discovery",   no_argument,       nullptr, OPT_DISCOVERY},
        {"verbose",     no_argument,       nullptr, 'v'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr,       0,                 nullptr,  0 }
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "u:d:p:j:t:c:H:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'u':
                cfg.identity = auth::trim(optarg);
                break;
            case 'd':
                cfg.share_root = optarg;
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
            case 'j':
                cfg.num_workers = std::atoi(optarg);
                if (cfg.num_workers <= 0) {
                    fmt::print(stderr, "Error: workers must be positive\n");
                    return 1;
                }
                break;
            case 't':
                cfg.idle_timeout_ms = std::atoi(optarg);
                if (cfg.idle_timeout_ms <= 0) {
                    fmt::print(stderr, "Error: timeout must be positive\n");
                    return 1;
                }
                break;
            case 'c':
                credentials_path = optarg;
                break;
            case 'H':
                hosts_path = optarg;
                break;
            case OPT_CREATE:
                cfg.create_share = true;
                break;
            case OPT_DISCOVERY:
                cfg.discovery = true;
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

    if (cfg.share_root.empty()) {
        fmt::print(stderr, "Error: missing share directory\n");
        print_usage(argv[0]);
        return 1;
    }

    // ========================================================
    // Lookup tables
    // ========================================================
    auth::CredentialStore credentials;
    auth::IdentityDirectory directory;
    try {
        credentials.load_file(credentials_path);

        // The hosts table is only needed to infer the identity
        if (!hosts_path.empty() || cfg.identity.empty()) {
            directory.load_file(hosts_path.empty() ? DEFAULT_HOSTS : hosts_path);
        }
    } catch (const ConfigError& e) {
        log_error("FATAL: {}", e.what());
        return 2;
    }

    if (cfg.identity.empty()) {
        char host[256] = {0};
        if (gethostname(host, sizeof(host) - 1) != 0) {
            log_error("FATAL: cannot read hostname and no --identity given");
            return 2;
        }
        auto match = directory.identity_for(host);
        if (!match) {
            log_error("Hostname '{}' not found in identity table; pass --identity", host);
            return 2;
        }
        cfg.identity = *match;
        log_info("Hostname '{}' matched, starting as '{}'", host, cfg.identity);
    }

    if (!credentials.exists(cfg.identity)) {
        log_error("ERROR: Unknown identity '{}'", cfg.identity);
        std::string known;
        for (const auto& id : credentials.all_identities()) {
            known += known.empty() ? id : ", " + id;
        }
        log_error("Registered identities: {}", known);
        return 2;
    }

    // ========================================================
    // Signals: one thread waits, the rest never see them
    // ========================================================
    signal(SIGPIPE, SIG_IGN);
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    Server server(cfg, credentials);
    try {
        server.start();
    } catch (const ConfigError& e) {
        log_error("FATAL: {}", e.what());
        return 2;
    } catch (const std::system_error& e) {
        log_error("FATAL: Failed to start server: {}", e.what());
        return 3;
    }

    std::thread signal_waiter([&server, stop_signals]() {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) == 0) {
            server.stop();
        }
    });

    // run() only returns after stop(), which only the waiter calls
    server.run();
    signal_waiter.join();
    return 0;
}
