#include "common/errors.hpp"
#include "common/logger.hpp"
#include "config/descriptor.hpp"
#include "factory/factory.hpp"
#include "factory/store_flags.hpp"
#include "marshal/marshaller.hpp"

#include <boost/program_options.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <format>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitError    = 1;
constexpr int kExitNotFound = 2;

constexpr const char* kUsage =
    "Usage: cfgstore-cli [options] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  list              List entries in the store\n"
    "  get KEY           Print the value of KEY as JSON\n"
    "  set KEY JSON      Store JSON under KEY\n"
    "  delete KEY        Remove KEY\n";

// Descriptor for KEY: a FormatKey when --format was given.
cfgstore::Descriptor descriptor_for(const std::string& name,
                                    const cfgstore::marshal::MarshallerPtr& format) {
    if (format) {
        return cfgstore::format_key(name, format);
    }
    return cfgstore::key(name);
}

void expect_args(const std::string& command, const std::vector<std::string>& args,
                 std::size_t count) {
    if (args.size() != count) {
        throw cfgstore::UsageError(
            std::format("'{}' takes {} argument(s), got {}", command, count, args.size()));
    }
}

int run(cfgstore::Store& store, const std::string& command,
        const std::vector<std::string>& args,
        const cfgstore::marshal::MarshallerPtr& format) {
    if (command == "list") {
        expect_args(command, args, 0);
        for (const auto& desc : store.list()) {
            fprintf(stdout, "%s\n", desc.to_string().c_str());
        }
        return kExitOk;
    }

    if (command == "get") {
        expect_args(command, args, 1);
        nlohmann::json value;
        auto found = store.unmarshal(descriptor_for(args[0], format), value);
        spdlog::debug("cfgstore-cli: read {}", found.to_string());
        fprintf(stdout, "%s\n", value.dump(2).c_str());
        return kExitOk;
    }

    if (command == "set") {
        expect_args(command, args, 2);
        nlohmann::json value;
        try {
            value = nlohmann::json::parse(args[1]);
        } catch (const nlohmann::json::exception& e) {
            throw cfgstore::UsageError(std::format("invalid JSON value: {}", e.what()));
        }
        store.marshal(descriptor_for(args[0], format), value);
        return kExitOk;
    }

    if (command == "delete") {
        expect_args(command, args, 1);
        store.del(descriptor_for(args[0], format));
        return kExitOk;
    }

    throw cfgstore::UsageError(std::format("unknown command '{}'", command));
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("cfgstore-cli options");
    desc.add_options()
        ("help,h",                                              "Show this help")
        ("app",    po::value<std::string>()->default_value("cfgstore"), "Application name")
        ("ns",     po::value<std::vector<std::string>>()->composing(),  "Namespace (repeatable)")
        ("format", po::value<std::string>()->default_value(""),
            "Pin entries to one format (toml, json, yaml, msgpack)")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level");
    cfgstore::add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(),                "Command")
        ("args",    po::value<std::vector<std::string>>(),   "Command arguments");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return kExitError;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(vm.count("help") ? stdout : stderr, "%s\n%s\n", kUsage, oss.str().c_str());
        return vm.count("help") ? kExitOk : kExitError;
    }

    cfgstore::init_default_logger(
        cfgstore::parse_log_level(vm["log-level"].as<std::string>()));

    const auto app     = vm["app"].as<std::string>();
    const auto command = vm["command"].as<std::string>();
    const auto namespaces = vm.count("ns")
        ? vm["ns"].as<std::vector<std::string>>() : std::vector<std::string>{};
    const auto args = vm.count("args")
        ? vm["args"].as<std::vector<std::string>>() : std::vector<std::string>{};

    try {
        cfgstore::marshal::MarshallerPtr format;
        if (const auto& name = vm["format"].as<std::string>(); !name.empty()) {
            format = cfgstore::marshal::by_name(name);
            if (!format) {
                throw cfgstore::UsageError(std::format(
                    "unknown format '{}' (known: {})", name, cfgstore::marshal::known_names()));
            }
        }

        auto flags  = cfgstore::flags_from_variables(vm);
        std::shared_ptr<spdlog::logger> trace_logger;
        if (flags.trace.enabled || flags.trace.log_responses) {
            trace_logger = cfgstore::make_component_logger("trace");
        }
        auto opener = cfgstore::make_opener(flags, trace_logger);
        auto store  = opener(app, namespaces);
        return run(*store, command, args, format);

    } catch (const cfgstore::NotFoundError& e) {
        fprintf(stderr, "not found: %s\n", e.what());
        return kExitNotFound;
    } catch (const std::exception& e) {
        spdlog::error("cfgstore-cli: {}", e.what());
        return kExitError;
    }
}
