#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/**
 * \brief Process-wide option registry shared by the spaman modules.
 *
 * Each module registers a provider, usually from a static auto-registration object.
 * `load_and_parse()` reads the JSON file named by -c/--config, hands it to every provider so
 * it can reset its values, apply the JSON section it owns and declare its CLI flags, and
 * finally parses the command line strictly. Parsing again starts from defaults.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider provider);

    /**
     * \param err Receives a one-line reason when the result is Error.
     * \return Help/Version after printing the text to stdout; the caller should exit.
     */
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);

    /// Config file used by the last parse, if one was given.
    static std::optional<std::filesystem::path> get_config_file();

private:
    static std::mutex& providers_mutex();
};

} // namespace shared_opts
