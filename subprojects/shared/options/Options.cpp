#include "Options.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <iostream>

namespace shared_opts {

namespace {

std::vector<Options::Provider>& providers() {
    static std::vector<Options::Provider> p;
    return p;
}

std::optional<std::filesystem::path>& loaded_config_file_storage() {
    static std::optional<std::filesystem::path> p;
    return p;
}

std::string& last_help_storage() {
    static std::string h;
    return h;
}

// Read and parse the JSON config. An unreadable or malformed file is an error;
// a missing -c option simply yields an empty object.
bool load_config(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream ifs(path);
    if (!ifs) {
        err = "cannot open config file '" + path + "'";
        return false;
    }
    try {
        ifs >> out;
    } catch (const nlohmann::json::parse_error& e) {
        err = "malformed config file '" + path + "': " + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "config file '" + path + "' must contain a JSON object";
        return false;
    }
    std::error_code fs_ec;
    auto abs = std::filesystem::absolute(path, fs_ec);
    if (!fs_ec) {
        loaded_config_file_storage() = abs;
    }
    return true;
}

} // namespace

std::mutex& Options::providers_mutex() {
    static std::mutex m;
    return m;
}

void Options::add_provider(Provider p) {
    std::lock_guard<std::mutex> lk(providers_mutex());
    providers().push_back(std::move(p));
}

Options::ParseResult Options::load_and_parse(int argc, const char* const* argv, std::string& err) {
    CLI::App app{"line-bridge: relay text lines to a line-oriented TCP peer"};
    app.set_version_flag("-V,--version", std::string{"line-bridge 0.1"});

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON config file to load")->group("General");

    // Scan for -c/--config first; the other options only exist once the
    // providers have seen the JSON.
    CLI::App config_prescan{"config_prescan"};
    config_prescan.add_option("-c,--config", config_file);
    config_prescan.allow_extras(true);
    config_prescan.set_help_flag();
    try {
        config_prescan.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        err = e.what();
        return ParseResult::Error;
    }

    loaded_config_file_storage().reset();
    nlohmann::json cfg_json = nlohmann::json::object();
    if (!config_file.empty() && !load_config(config_file, cfg_json, err)) {
        return ParseResult::Error;
    }

    {
        std::lock_guard<std::mutex> lk(providers_mutex());
        for (auto& provider : providers()) {
            if (provider) provider(app, cfg_json);
        }
    }

    last_help_storage() = app.help();
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
    } catch (const std::exception& e) {
        err = e.what();
        return ParseResult::Error;
    }
}

std::optional<std::filesystem::path> Options::get_config_dir() {
    auto& s = loaded_config_file_storage();
    if (s && s->has_parent_path()) return s->parent_path();
    return std::nullopt;
}

std::optional<std::filesystem::path> Options::get_config_file() {
    return loaded_config_file_storage();
}

std::string Options::last_help() {
    return last_help_storage();
}

}
