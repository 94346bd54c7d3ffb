#include "base_cli.hpp"
#include "theme.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <platform/clock.hpp>
#include <iostream>
#include <fmt/format.h>

std::optional<std::string> CommandArgs::option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

Result<CommandArgs> CommandArgs::parse(const std::vector<std::string>& argv,
                                       const std::set<std::string>& valued) {
    CommandArgs args;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        if (a.size() > 1 && a[0] == '-') {
            if (valued.count(a)) {
                if (i + 1 >= argv.size()) {
                    return Result<CommandArgs>::Err("Missing value for " + a);
                }
                args.options[a] = argv[++i];
            } else {
                args.flags.insert(a);
            }
        } else {
            args.positional.push_back(a);
        }
    }
    return Result<CommandArgs>::Ok(std::move(args));
}

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error_ = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Config could not be loaded: " + config_error_);
        std::cout << theme::step("Fix " + get_global_config_path().string() + " or run 'docsync setup'.");
        return false;
    }
    return true;
}

bool BaseCLI::open_service() {
    if (!require_config()) {
        return false;
    }
    if (api) {
        return true;
    }

    auto key = resolve_api_key();
    if (key.is_err()) {
        std::cout << theme::fail(key.error);
        return false;
    }

    transport = std::make_unique<CurlTransport>();
    executor = std::make_unique<RequestExecutor>(*transport, SystemClock::instance(),
                                                 RetryPolicy::from_config(config->retry()),
                                                 &interrupted);
    api = std::make_unique<DocumentApi>(*executor, config->api(), key.value);
    docsync_log("service: " + config->api().base_url);
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& argv) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'docsync --help' for available commands.");
        return 1;
    }

    auto args = CommandArgs::parse(argv, {"--schema", "--workers"});
    if (args.is_err()) {
        std::cout << theme::fail(args.error);
        std::cout << theme::step("Usage: docsync " + it->second.usage);
        return 1;
    }

    try {
        return it->second.handler(*this, args.value);
    } catch (const std::exception& e) {
        docsync_error(fmt::format("{}: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Transfer", {"upload", "download"}},
        {"Service",  {"schemas", "datasets"}},
        {"Setup",    {"setup", "status"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<52}", "docsync " + it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n" << theme::color::DIM
              << "    docsync --version        Show version\n"
              << "    docsync --help           Show this help"
              << theme::color::RESET << "\n\n";
}
