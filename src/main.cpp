#include "config.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include "signals.hpp"
#include "connection.hpp"
#include "../core/tcpStream.hpp"
#include "../core/protocolNegotiator.hpp"

#include <memory>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace {

void print_usage() {
    fmt::print(stderr,
        "Usage: mythlink [--config file] <command>\n"
        "\n"
        "Commands:\n"
        "  recordings                   list recordings, newest first\n"
        "  upcoming                     list upcoming scheduled recordings\n"
        "  scheduled                    list recording schedules\n"
        "  tuners-free                  number of free tuners\n"
        "  load                         backend load average\n"
        "  uptime                       backend uptime\n"
        "  disk                         backend disk usage\n"
        "  fetch <url> <dest> [host]    copy a backend file to dest\n");
}

void print_programs(const std::vector<ml::Program>& programs) {
    for (const auto& p : programs) {
        fmt::print("{:%Y-%m-%d %H:%M}-{:%H:%M}  {:<5} {:<8} {}",
                   fmt::localtime(p.start_time()), fmt::localtime(p.end_time()),
                   p.channel_number(), p.callsign(), p.title());
        if (!p.subtitle().empty()) {
            fmt::print(" - {}", p.subtitle());
        }
        if (!p.category().empty()) {
            fmt::print(" [{}]", p.category());
        }
        fmt::print("\n");
    }
    fmt::print("{} programs\n", programs.size());
}

int run_command(ml::Connection& conn, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "recordings") {
        print_programs(conn.get_all_recordings());
    } else if (command == "upcoming") {
        print_programs(conn.get_upcoming_recordings());
    } else if (command == "scheduled") {
        print_programs(conn.get_scheduled_recordings());
    } else if (command == "tuners-free") {
        fmt::print("{}\n", conn.get_num_free_tuners());
    } else if (command == "load") {
        ml::LoadAverage load = conn.get_load();
        fmt::print("{} {} {}\n", load.one, load.five, load.fifteen);
    } else if (command == "uptime") {
        auto uptime = conn.get_uptime();
        if (uptime) {
            fmt::print("{}\n", *uptime);
        } else {
            fmt::print("unknown\n");
        }
    } else if (command == "disk") {
        ml::DiskUsage usage = conn.get_disk_usage();
        fmt::print("{}:{} total {} used {} free {}\n",
                   usage.hostname, usage.directory, usage.total, usage.used, usage.free);
    } else if (command == "fetch") {
        if (args.size() < 3) {
            print_usage();
            return 1;
        }
        std::string host = args.size() > 3 ? args[3] : std::string();
        if (!conn.transfer_file(args[1], args[2], host)) {
            LOG_WARN("Remote file {} is empty, nothing written", args[1]);
        }
    } else {
        print_usage();
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        // 1. Конфигурация
        auto config = std::make_shared<ml::Config>();
        if (!config_file.empty() && !config->load_from_file(config_file)) {
            LOG_CRITICAL("Cannot load config {}", config_file);
            return 1;
        }
        config->verify();

        // 2. Логгер
        ml::Logger::initialize(
            config->get_or<std::string>("logging.level", ml::Config::Defaults::LOG_LEVEL),
            config->get_or<std::string>("logging.file", ""));

        LOG_DEBUG("Backend: {}:{}", config->backend_host(), config->backend_port());

        // 3. Общий контекст соединений
        auto bus = std::make_shared<ml::EventBus>();
        config->attach_bus(bus.get());

        ml::ConnectionContext context{
            .config = config,
            .bus = bus,
            .connector = std::make_shared<ml::TcpConnector>(),
            .database = nullptr,
            .registry = ml::ProtocolRegistry::with_defaults(),
            .versions = std::make_shared<ml::VersionCache>()
        };

        // 4. Проверка связи с мастер-бэкендом
        ml::verify_connectivity(context);

        // 5. Команда
        int rc = 0;
        {
            ml::Connection conn(context);
            rc = run_command(conn, args);
        }

        config->attach_bus(nullptr);
        ml::Logger::shutdown();
        return rc;

    } catch (const ml::TransportError& e) {
        LOG_CRITICAL("Backend unreachable (error {}): {}", e.code().value(), e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
