#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {

/**
 * Process-wide option registry.
 *
 * Modules register a Provider at static-init time. load_and_parse() discovers
 * -c/--config, loads the JSON file, hands it to every provider (so JSON can seed
 * defaults before CLI11 options are added) and then runs a strict CLI parse.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    static ParseResult load_and_parse(int argc, const char* const* argv, std::string& err);
    // Directory of the loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_dir();
    // Full path to loaded config file (if any)
    static std::optional<std::filesystem::path> get_config_file();
    // Help text of the most recent parse, for usage errors
    static std::string last_help();

private:
    static std::mutex& providers_mutex();
};

}
