#include "core/utils.hpp"
#include "config/pool_config_loader.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "pool/connection_pool.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string_view>
#include <thread>

using namespace sqlpool;

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int /*signal*/) {
    g_stop.store(true);
}

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [config.toml] [count]\n", argv0)
              << "  config.toml  Pool configuration (default: config/sqlpool.toml)\n"
              << "  count        Number of pings, one per second (default: 1)\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        if (argc > 3 || (argc > 1 && (std::string_view(argv[1]) == "-h" || std::string_view(argv[1]) == "--help"))) {
            print_usage(argv[0]);
            return argc > 3 ? 2 : 0;
        }

        std::string config_file = "config/sqlpool.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        int count = 1;
        if (argc > 2) {
            const std::string_view arg(argv[2]);
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), count);
            if (ec != std::errc() || ptr != arg.data() + arg.size() || count <= 0) {
                utils::log::error(std::format("Invalid ping count '{}'", arg));
                print_usage(argv[0]);
                return 2;
            }
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto config_result = PoolConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;

        if (auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        auto pool = ConnectionPool::create(cfg.pool, std::make_shared<MysqlConnectionFactory>());

        int attempts = 0;
        int failures = 0;
        std::chrono::microseconds best = std::chrono::microseconds::max();
        std::chrono::microseconds worst{0};
        std::chrono::microseconds total{0};

        for (int i = 0; i < count && !g_stop.load(); ++i) {
            if (i > 0) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            ++attempts;
            auto rtt = pool->ping();
            const auto size = pool->size();
            if (rtt.is_error()) {
                ++failures;
                std::cout << std::format("ping {}: {} failed: {} (total: {}, avail: {})\n",
                    i + 1, pool->name(), rtt.error().to_string(), size.total, size.available);
                continue;
            }

            const auto us = rtt.value();
            best = std::min(best, us);
            worst = std::max(worst, us);
            total += us;
            std::cout << std::format("ping {}: {} time={:.3f}ms (total: {}, avail: {})\n",
                i + 1, pool->name(), us.count() / 1000.0, size.total, size.available);
        }

        const int succeeded = attempts - failures;
        if (succeeded > 0) {
            std::cout << std::format("--- {} ---\n{} ok, {} failed, min/avg/max = {:.3f}/{:.3f}/{:.3f} ms\n",
                pool->name(), succeeded, failures,
                best.count() / 1000.0,
                total.count() / 1000.0 / succeeded,
                worst.count() / 1000.0);
        }

        pool->drain();
        return (failures == 0 && attempts > 0) ? 0 : 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
