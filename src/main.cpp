#include "config.hpp"
#include "runtime.hpp"
#include "commands.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: pipeguard [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --command CMD    Run a single operator command and exit\n"
              << "  --no-janitor         Do not start the periodic cleanup thread\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status              Summary of cache, breakers, limiter, tasks\n"
              << "  /cache [clear]       Cache statistics, or clear the cache\n"
              << "  /breakers            Circuit breaker states\n"
              << "  /breaker-reset NAME  Force a breaker closed\n"
              << "  /limits              Rate limiter statistics\n"
              << "  /reset CLIENT        Reset a client's rate limit history\n"
              << "  /task ID             Show a task snapshot\n"
              << "  /sweep               Run one cleanup sweep now\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  PIPEGUARD_CACHE_MAX_SIZE  Cache capacity override\n"
              << "  PIPEGUARD_MAX_RETRIES     Retry count override\n"
              << "  PIPEGUARD_RATE_LIMIT      Requests per minute per client\n";
}

int main(int argc, char* argv[]) try {
    std::string command;
    bool janitor = true;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--command") == 0) && i + 1 < argc) {
            command = argv[++i];
        } else if (std::strcmp(argv[i], "--no-janitor") == 0) {
            janitor = false;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = pipeguard::Config::load();
    pipeguard::Runtime runtime(config);

    // Single command mode
    if (!command.empty()) {
        std::cout << pipeguard::handle_command(runtime, command) << '\n';
        return 0;
    }

    if (janitor) runtime.janitor().start();

    std::cout << "pipeguard operator console\n"
              << "Cache: " << config.cache.max_size << " entries"
              << " | Rate limit: " << config.rate_limit.requests_per_minute << "/min"
              << " | Retries: " << config.retry.max_retries << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "pipeguard> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line == "/help") {
            print_usage();
            continue;
        }

        std::cout << pipeguard::handle_command(runtime, line) << "\n";
    }

    runtime.janitor().stop();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
