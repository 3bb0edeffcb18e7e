/**
 * @file Cli.cpp
 * @brief flatcfg-cli command dispatcher
 */

#include "flatcfg/Cli.hpp"
#include "flatcfg/Accessors.hpp"
#include "flatcfg/Env.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/ListDecoder.hpp"
#include "flatcfg/Loader.hpp"
#include "flatcfg/Log.hpp"

#include <boost/uuid/uuid_io.hpp>
#include <cxxopts.hpp>

#include <string>
#include <vector>

namespace flatcfg {

namespace {

const char* const COMMANDS_HELP =
    "Commands: get KEY [--type T] | list PREFIX | keys | dump | env\n"
    "Types: string, bool, int, long, port, uri, path, uuid\n";

std::string get_as(const Properties& props, const std::string& key, const std::string& type) {
    if (type == "string") return get_required_string(props, key);
    if (type == "bool") return get_required_bool(props, key) ? "true" : "false";
    if (type == "int") return std::to_string(get_required_int(props, key));
    if (type == "long") return std::to_string(get_required_long(props, key));
    if (type == "port") return std::to_string(get_required_port(props, key));
    if (type == "uri") return get_required_uri(props, key).str();
    if (type == "path") return get_required_path(props, key).string();
    if (type == "uuid") return boost::uuids::to_string(get_required_uuid(props, key));
    throw InvalidArgumentError("Unknown type: " + type);
}

} // anonymous namespace

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("flatcfg-cli", "Inspect flat key/value configuration");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to .properties/JSON/TOML config", cxxopts::value<std::string>())
            ("env-prefix", "Overlay PREFIX_* environment variables", cxxopts::value<std::string>())
            ("t,type", "Value type for `get`", cxxopts::value<std::string>()->default_value("string"))
            ("v,verbose", "Debug logging")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n" << COMMANDS_HELP;
            return 0;
        }

        if (result.count("verbose")) {
            logger()->set_level(spdlog::level::debug);
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](std::size_t want) {
            if (cmdv.size() < want) {
                throw InvalidArgumentError("insufficient arguments for command '" + cmd + "'");
            }
        };

        if (cmd == "env") {
            out << pretty_print_env_vars();
            return 0;
        }

        LoadOptions load_options;
        if (result.count("config")) {
            load_options.file_path = result["config"].as<std::string>();
        } else {
            load_options.candidates = candidate_config_files();
        }
        if (result.count("env-prefix")) {
            load_options.env_prefix = result["env-prefix"].as<std::string>();
        }

        Properties props = load(load_options);

        if (cmd == "get") {
            expect_args(2);
            out << get_as(props, cmdv[1], result["type"].as<std::string>()) << "\n";
            return 0;
        }

        if (cmd == "list") {
            expect_args(2);
            const std::string& prefix = cmdv[1];
            for (const auto& entry : decode_list(props, prefix)) {
                auto index = list_index_of(entry.full_key(), prefix);
                out << (index ? *index : 0) << "\t" << entry.short_key() << "\t"
                    << to_display_string(entry.value()) << "\n";
            }
            return 0;
        }

        if (cmd == "keys") {
            for (const auto& kv : props) {
                out << kv.first << "\n";
            }
            return 0;
        }

        if (cmd == "dump") {
            for (const auto& [key, value] : props) {
                out << key << " = " << to_display_string(value) << "\n";
            }
            return 0;
        }

        err << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace flatcfg
