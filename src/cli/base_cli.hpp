#pragma once

#include <string>
#include <map>
#include <set>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <atomic>
#include <core/config.hpp>
#include <http/curl_transport.hpp>
#include <http/request_executor.hpp>
#include <service/document_api.hpp>

// Parsed command line after the subcommand name
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;   // --schema <id>, --workers <n>
    std::set<std::string> flags;                  // -v / --verbose

    bool has_flag(const std::string& name) const { return flags.count(name) > 0; }
    std::optional<std::string> option(const std::string& name) const;

    // Options in `valued` consume the next argument
    static Result<CommandArgs> parse(const std::vector<std::string>& argv,
                                     const std::set<std::string>& valued);
};

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit code
    using CommandHandler = std::function<int(BaseCLI&, const CommandArgs&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    int execute_command(const std::string& command, const std::vector<std::string>& argv);
    void print_help() const;

    bool require_config();

    // Builds transport, executor and API client. False (with a message
    // printed) when no API key can be resolved.
    bool open_service();

    // Public state
    std::optional<Config> config;
    std::atomic<bool> interrupted{false};

    std::unique_ptr<CurlTransport> transport;
    std::unique_ptr<RequestExecutor> executor;
    std::unique_ptr<DocumentApi> api;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::string config_error_;
};
