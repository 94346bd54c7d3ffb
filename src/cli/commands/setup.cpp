#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <cstdlib>
#include <iostream>

static int do_setup(BaseCLI& cli, const CommandArgs&) {
    auto config_result = create_default_global_config();
    if (config_result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + config_result.error);
        return 1;
    }

    std::cout << theme::section("Setup");
    std::cout << theme::dim("    The API key is sent as " + std::string(API_KEY_HEADER) + " on every request.") << "\n";
    std::cout << theme::dim("    It is stored in " + CredentialManager::instance().path().string() + ".") << "\n\n";

    std::string key = platform::read_secret(theme::color::TEAL + "    API key: " + theme::color::RESET);
    trim(key);
    if (key.empty()) {
        std::cout << theme::fail("API key cannot be empty.");
        return 1;
    }

    auto stored = CredentialManager::instance().set(API_KEY_CREDENTIAL, key);
    if (stored.is_err()) {
        std::cout << "\n" << theme::fail("Failed to store API key: " + stored.error);
        return 1;
    }

    // Pick up a freshly written config for any later command in this process
    auto reloaded = Config::load();
    if (reloaded.is_ok()) cli.config = reloaded.value;

    std::cout << theme::divider();
    std::cout << theme::ok("Config file ready at " + get_global_config_path().string() + ".");
    std::cout << theme::ok("API key saved.");
    std::cout << theme::ok("Run 'docsync datasets' to check the connection.");
    std::cout << "\n";
    return 0;
}

static int do_status(BaseCLI& cli, const CommandArgs&) {
    std::cout << theme::section("Status");

    std::cout << theme::kv("config", global_config_exists()
                               ? get_global_config_path().string()
                               : theme::dim("(defaults, no config file)"));
    if (cli.config) {
        std::cout << theme::kv("service", cli.config->api().base_url);
        std::cout << theme::kv("workers", std::to_string(cli.config->transfer().workers));
    } else {
        std::cout << theme::kv("service", theme::red("config error"));
    }

    std::string key_source;
    if (std::getenv(API_KEY_ENV)) {
        key_source = std::string("$") + API_KEY_ENV;
    } else if (CredentialManager::instance().get(API_KEY_CREDENTIAL).is_ok()) {
        key_source = CredentialManager::instance().path().string();
    }
    std::cout << theme::kv("api key", key_source.empty() ? theme::red("not set") : theme::green(key_source));
    std::cout << theme::kv("log", log_path().string()) << "\n";
    return key_source.empty() ? 1 : 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("setup", do_setup, "setup", "Store the API key, write default config");
    cli.add_command("status", do_status, "status", "Show config, credential and log locations");
}
