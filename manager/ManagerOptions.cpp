// ManagerOptions.cpp - Spa manager options provider with auto-registration
#include "ManagerOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace {
    constexpr const char* kDefaultClientUuid = "a0b1c2d3-spaman-cli";

    std::mutex g_manager_opts_mtx;
    std::string g_client_uuid = kDefaultClientUuid;
    std::optional<std::string> g_spa_address;
    std::optional<std::string> g_spa_identifier;
    std::optional<std::string> g_spa_name;
    std::string g_log_level = "info";
    int g_pump_interval_ms = 0;
    int g_error_backoff_ms = 1000;
    double g_run_seconds = 0.0;
    std::atomic<bool> g_manager_registered{false};

    // Reads an optional string member of the "spaman" section; empty strings count as absent.
    std::optional<std::string> json_hint(const nlohmann::json& section, const char* key) {
        if (section.contains(key) && section[key].is_string()) {
            auto value = section[key].get<std::string>();
            if (!value.empty()) return value;
        }
        return std::nullopt;
    }
}

namespace manager_opts {

void register_options() {
    bool expected = false;
    if (!g_manager_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::lock_guard<std::mutex> lk(g_manager_opts_mtx);

        // Defaults, then values from the JSON config
        g_client_uuid = kDefaultClientUuid;
        g_spa_address.reset();
        g_spa_identifier.reset();
        g_spa_name.reset();
        g_log_level = "info";
        g_pump_interval_ms = 0;
        g_error_backoff_ms = 1000;
        g_run_seconds = 0.0;

        if (j.contains("spaman") && j["spaman"].is_object()) {
            const auto& sj = j["spaman"];
            if (sj.contains("client_uuid") && sj["client_uuid"].is_string()) g_client_uuid = sj["client_uuid"].get<std::string>();
            g_spa_address = json_hint(sj, "spa_address");
            g_spa_identifier = json_hint(sj, "spa_identifier");
            g_spa_name = json_hint(sj, "spa_name");
            if (sj.contains("log_level") && sj["log_level"].is_string()) g_log_level = sj["log_level"].get<std::string>();
            if (sj.contains("pump_interval_ms") && sj["pump_interval_ms"].is_number_integer()) g_pump_interval_ms = sj["pump_interval_ms"].get<int>();
            if (sj.contains("error_backoff_ms") && sj["error_backoff_ms"].is_number_integer()) g_error_backoff_ms = sj["error_backoff_ms"].get<int>();
            if (sj.contains("run_seconds") && sj["run_seconds"].is_number()) g_run_seconds = sj["run_seconds"].get<double>();
        }

        app.add_option("--client-uuid", g_client_uuid, "UUID identifying this client to the spa")
            ->group("Spa");
        app.add_option("--spa-address", g_spa_address, "IP address of the spa (useful across subnets)")
            ->group("Spa");
        app.add_option("--spa-identifier", g_spa_identifier, "Identifier of the spa to connect to automatically")
            ->group("Spa");
        app.add_option("--spa-name", g_spa_name, "Name of the spa, used in status messages")
            ->group("Spa");

        app.add_option("--log-level", g_log_level, "Log level: debug|info|warning|error|critical")
            ->check([](const std::string& value) {
                return parse_log_level(value) ? std::string() : std::string("unknown log level: " + value);
            })
            ->group("Manager");
        app.add_option("--pump-interval-ms", g_pump_interval_ms, "Pause between sequence pump iterations (0 = yield only)")
            ->check(CLI::NonNegativeNumber)
            ->group("Manager");
        app.add_option("--error-backoff-ms", g_error_backoff_ms, "Pause after a failed sequence pump step")
            ->check(CLI::NonNegativeNumber)
            ->group("Manager");
        app.add_option("--run-seconds", g_run_seconds, "Leave the manager scope after this many seconds (0 = until signalled)")
            ->check(CLI::NonNegativeNumber)
            ->group("Manager");
    });
}

std::string get_client_uuid() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return g_client_uuid;
}

std::optional<std::string> get_spa_address() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return g_spa_address;
}

std::optional<std::string> get_spa_identifier() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return g_spa_identifier;
}

std::optional<std::string> get_spa_name() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return g_spa_name;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    auto level = parse_log_level(g_log_level);
    if (!level) {
        throw std::invalid_argument("unknown log level: " + g_log_level);
    }
    return *level;
}

std::chrono::milliseconds get_pump_interval() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return std::chrono::milliseconds(g_pump_interval_ms);
}

std::chrono::milliseconds get_error_backoff() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    return std::chrono::milliseconds(g_error_backoff_ms);
}

std::optional<std::chrono::milliseconds> get_run_duration() {
    std::lock_guard<std::mutex> lk(g_manager_opts_mtx);
    if (g_run_seconds <= 0.0) return std::nullopt;
    return std::chrono::milliseconds(static_cast<long long>(g_run_seconds * 1000.0));
}

spaman::SpaManagerConfig make_manager_config() {
    spaman::SpaManagerConfig config;
    config.client_uuid = get_client_uuid();
    config.spa_address = get_spa_address();
    config.spa_identifier = get_spa_identifier();
    config.spa_name = get_spa_name();
    config.pump_interval = get_pump_interval();
    config.error_backoff = get_error_backoff();
    return config;
}

} // namespace manager_opts

// Static auto-registration object
namespace {
    struct ManagerOptsAutoReg {
        ManagerOptsAutoReg() { manager_opts::register_options(); }
    };
    [[maybe_unused]] static ManagerOptsAutoReg s_manager_auto_reg;
}
