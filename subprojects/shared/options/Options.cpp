#include "Options.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace shared_opts {

namespace {

constexpr const char* kAppDescription = "spaman - spa connection manager";
constexpr const char* kVersion = "spaman 0.1";

std::vector<Options::Provider>& registered_providers() {
    static std::vector<Options::Provider> providers;
    return providers;
}

std::optional<std::filesystem::path>& loaded_config_file() {
    static std::optional<std::filesystem::path> path;
    return path;
}

// Finds -c/--config ahead of the strict parse so the JSON can seed provider defaults.
bool probe_config_path(int argc, char** argv, std::string& config_file, std::string& err) {
    CLI::App probe{"config_probe"};
    probe.set_help_flag();
    probe.add_option("-c,--config", config_file);
    probe.allow_extras(true);
    try {
        probe.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        err = std::string("invalid --config argument: ") + e.what();
        return false;
    }
    return true;
}

bool read_config_json(const std::string& config_file, nlohmann::json& out, std::string& err) {
    std::ifstream ifs(config_file);
    if (!ifs) {
        err = "cannot open config file: " + config_file;
        return false;
    }
    try {
        ifs >> out;
    } catch (const nlohmann::json::parse_error& e) {
        err = "malformed config file " + config_file + ": " + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "config file " + config_file + " must contain a JSON object";
        return false;
    }
    return true;
}

} // namespace

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider provider) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    registered_providers().push_back(std::move(provider));
}

Options::ParseResult Options::load_and_parse(int argc, char** argv, std::string& err) {
    std::string config_file;
    if (!probe_config_path(argc, argv, config_file, err)) {
        return ParseResult::Error;
    }

    nlohmann::json config_json = nlohmann::json::object();
    loaded_config_file().reset();
    if (!config_file.empty()) {
        if (!read_config_json(config_file, config_json, err)) {
            return ParseResult::Error;
        }
        std::error_code ec;
        auto absolute = std::filesystem::absolute(config_file, ec);
        loaded_config_file() = ec ? std::filesystem::path(config_file) : absolute;
    }

    CLI::App app{kAppDescription};
    app.set_version_flag("-V,--version", std::string{kVersion});
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Provider values that do not fit the option types surface here, not in CLI11.
    try {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto& provider : registered_providers()) {
            if (provider) provider(app, config_json);
        }
    } catch (const nlohmann::json::exception& e) {
        err = std::string("invalid value in config file: ") + e.what();
        return ParseResult::Error;
    } catch (const std::invalid_argument& e) {
        err = std::string("invalid value in config file: ") + e.what();
        return ParseResult::Error;
    }

    app.allow_extras(false);
    try {
        app.parse(argc, argv);
        return ParseResult::Ok;
    } catch (const CLI::CallForHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForAllHelp&) {
        std::cout << app.help() << std::endl;
        return ParseResult::Help;
    } catch (const CLI::CallForVersion& v) {
        std::cout << v.what() << std::endl;
        return ParseResult::Version;
    } catch (const CLI::ParseError& e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file();
}

} // namespace shared_opts
