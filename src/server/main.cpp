#include <getopt.h>
#include <pthread.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include "server.h"
#include "common/debug.h"

namespace {

struct CommandLine {
    std::optional<std::string> config_file;
    std::optional<std::string> address;
    std::optional<uint16_t> port;
    std::optional<std::string> mode;
    std::optional<std::string> credential;
    bool verbose{false};
};

void print_usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS]\n"
            "\n"
            "Zero-storage stream relay: a PUT is forwarded to the matching GET as it arrives.\n"
            "\n"
            "Options:\n"
            "  -c, --config FILE      JSON configuration file\n"
            "  -a, --address ADDR     IPv4 address to bind (default: 127.0.0.1)\n"
            "  -p, --port N           TCP port (default: 8080, 0 = any free port)\n"
            "  -m, --mode MODE        token (default) or open\n"
            "  -u, --user USER:PASS   Basic credential for token issuance (open mode: for streams)\n"
            "  -v, --verbose          Log every request\n"
            "  -h, --help             Show this help\n",
            argv0);
}

int parse_args(int argc, char** argv, CommandLine& cli) {
    static struct option long_opts[] = {{"config", required_argument, nullptr, 'c'},
                                        {"address", required_argument, nullptr, 'a'},
                                        {"port", required_argument, nullptr, 'p'},
                                        {"mode", required_argument, nullptr, 'm'},
                                        {"user", required_argument, nullptr, 'u'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "c:a:p:m:u:vh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            cli.config_file = optarg;
            break;
        case 'a':
            cli.address = optarg;
            break;
        case 'p': {
            char* end;
            long val = strtol(optarg, &end, 10);
            if (*end != '\0' || val < 0 || val > 65535) {
                fprintf(stderr, "relayd: invalid port: %s\n", optarg);
                return -1;
            }
            cli.port = static_cast<uint16_t>(val);
        } break;
        case 'm':
            cli.mode = optarg;
            break;
        case 'u':
            cli.credential = optarg;
            break;
        case 'v':
            cli.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }
    if (optind < argc) {
        fprintf(stderr, "relayd: unexpected argument: %s\n", argv[optind]);
        print_usage(argv[0]);
        return -1;
    }
    return 0;
}

// File first, then command line overrides.
ServerConfig build_config(const CommandLine& cli) {
    ServerConfig config = cli.config_file ? ServerConfig::fromFile(*cli.config_file) : ServerConfig{};
    if (cli.address) config.address = *cli.address;
    if (cli.port) config.port = *cli.port;
    if (cli.mode) config.auth_mode = parseAuthMode(*cli.mode);
    if (cli.credential) config.setCredential(*cli.credential);
    if (cli.verbose) config.verbose = true;
    return config;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cli;
    if (parse_args(argc, argv, cli) != 0) {
        return EXIT_FAILURE;
    }

    // every thread inherits the mask, the main thread collects the signal with sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    try {
        ServerConfig config = build_config(cli);
        set_log_verbose(config.verbose);

        Server server(std::move(config));
        server.start();
        fprintf(stderr, "relayd: listening on %s:%u (%s mode)\n",
                server.config().address.c_str(), server.port(), toString(server.config().auth_mode));

        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            RUNTIME_ERROR("sigwait failed");
        }
        fprintf(stderr, "relayd: received %s, shutting down\n", strsignal(sig));
        server.stop();
    } catch (const ConfigError& e) {
        RUNTIME_ERROR("%s", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        RUNTIME_ERROR("relayd failed: %s", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
