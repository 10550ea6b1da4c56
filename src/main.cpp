#include "config/config_loader.hpp"
#include "core/security_control_plane.hpp"
#include "core/utils.hpp"
#include "security/derived_key_manager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace secplane;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running.store(false, std::memory_order_relaxed);
}

void print_usage() {
    std::cerr <<
        "Usage: secplane <command> [args] [--config <file>] [--org <organization>]\n"
        "\n"
        "Commands:\n"
        "  serve                              hydrate, run sweep and purge jobs until SIGINT/SIGTERM\n"
        "  block <address> [reason] [ttl-s]   add an address to the denylist\n"
        "  unblock <address>                  remove an address from the denylist\n"
        "  list-blocked                       print active denylist entries\n"
        "  purge-audit                        delete audit rows past retention\n"
        "  check-config                       validate the configuration file\n";
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string config_file = "config/secplane.toml";
    std::string organization_id;
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (arg == "--org" && i + 1 < argc) {
            args.organization_id = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

std::unique_ptr<SecurityControlPlane> build_control_plane(const SecPlaneConfig& cfg) {
    utils::log::info(std::format("[2/4] Storage backend: {}", cfg.storage.backend));
    auto store = SecurityControlPlane::make_store(cfg.storage);

    utils::log::info(std::format("[3/4] Field encryption: PBKDF2 ({} iterations), secret from ${}",
                                 cfg.encryption.iterations, cfg.encryption.master_secret_env));
    auto key_manager = std::make_shared<DerivedKeyManager>(
        DerivedKeyManager::secret_from_env(cfg.encryption.master_secret_env),
        DerivedKeyManager::Config{.salt = cfg.encryption.salt, .iterations = cfg.encryption.iterations});

    auto notifier = SecurityControlPlane::make_notifier(cfg.audit);
    utils::log::info(std::format("[4/4] Critical alerts: {}", notifier->name()));

    return std::make_unique<SecurityControlPlane>(cfg, std::move(store), std::move(key_manager),
                                                  std::move(notifier));
}

std::string format_expiry(const BlockedAddress& b) {
    return b.expires_at ? utils::format_timestamp(*b.expires_at) : "never";
}

// ============================================================================
// Commands
// ============================================================================

int cmd_serve(SecurityControlPlane& plane) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    plane.start();
    utils::log::info("Security control plane ready");

    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    utils::log::info("Shutting down...");
    plane.stop();

    const auto threat = plane.threat_stats();
    const auto audit = plane.audit_stats();
    utils::log::info(std::format(
        "Final stats: {} evaluated, {} blocked, {} fail-open, {} audit events, {} alert failures",
        threat.evaluated, threat.blocked, threat.fail_open, audit.recorded, audit.alert_failures));
    return 0;
}

int cmd_block(SecurityControlPlane& plane, const Caller& caller, const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 2;
    }
    const std::string reason = args.size() > 1 ? args[1] : "";
    std::optional<std::chrono::seconds> ttl;
    if (args.size() > 2) {
        const auto seconds = utils::try_parse_int<int64_t>(args[2]);
        if (!seconds || *seconds <= 0) {
            std::cerr << std::format("Invalid ttl '{}': expected positive seconds\n", args[2]);
            return 2;
        }
        ttl = std::chrono::seconds(*seconds);
    }

    auto blocked = plane.block_address(caller, args[0], reason, ttl);
    if (blocked.is_error()) {
        std::cerr << std::format("Block failed ({}): {}\n",
                                 error_category_to_string(blocked.error_category()),
                                 blocked.error_message());
        return 1;
    }
    std::cout << std::format("Blocked {} until {}\n", blocked.value().address,
                             format_expiry(blocked.value()));
    return 0;
}

int cmd_unblock(SecurityControlPlane& plane, const Caller& caller, const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 2;
    }
    auto removed = plane.unblock_address(caller, args[0]);
    if (removed.is_error()) {
        std::cerr << std::format("Unblock failed ({}): {}\n",
                                 error_category_to_string(removed.error_category()),
                                 removed.error_message());
        return 1;
    }
    std::cout << (removed.value() ? std::format("Unblocked {}\n", args[0])
                                  : std::format("{} was not blocked\n", args[0]));
    return 0;
}

int cmd_list_blocked(SecurityControlPlane& plane) {
    auto hydrated = plane.hydrate_denylist();
    if (hydrated.is_error()) {
        std::cerr << std::format("Listing failed: {}\n", hydrated.error_message());
        return 1;
    }

    const auto entries = plane.list_blocked();
    for (const auto& b : entries) {
        std::cout << std::format("{}\t{}\t{}\t{}\t{}\n", b.address, utils::format_timestamp(b.blocked_at),
                                 format_expiry(b), b.automatic ? "auto" : b.blocked_by.value_or("-"),
                                 b.reason);
    }
    std::cout << std::format("{} active entries\n", entries.size());
    return 0;
}

int cmd_purge_audit(SecurityControlPlane& plane) {
    auto purged = plane.purge_audit();
    if (purged.is_error()) {
        std::cerr << std::format("Purge failed: {}\n", purged.error_message());
        return 1;
    }
    std::cout << std::format("Purged {} audit rows\n", purged.value());
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 2;
    }

    try {
        utils::log::info(std::format("[1/4] Loading configuration from {}", args->config_file));
        auto config_result = ConfigLoader::load_from_file(args->config_file);

        if (args->command == "check-config") {
            if (!config_result.success) {
                std::cerr << config_result.error_message << "\n";
                return 1;
            }
            std::cout << "Configuration OK\n";
            return 0;
        }

        SecPlaneConfig cfg;
        if (config_result.success) {
            cfg = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("{} - using defaults", config_result.error_message));
        }
        utils::log::set_level(cfg.logging.level);

        auto plane = build_control_plane(cfg);

        Caller admin;
        admin.user_id = "cli";
        admin.organization_id = args->organization_id.empty()
            ? cfg.threat.system_organization_id : args->organization_id;
        admin.source_address = "127.0.0.1";

        if (args->command == "serve") return cmd_serve(*plane);
        if (args->command == "block") return cmd_block(*plane, admin, args->positional);
        if (args->command == "unblock") return cmd_unblock(*plane, admin, args->positional);
        if (args->command == "list-blocked") return cmd_list_blocked(*plane);
        if (args->command == "purge-audit") return cmd_purge_audit(*plane);

        std::cerr << std::format("Unknown command '{}'\n", args->command);
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
