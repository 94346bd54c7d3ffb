#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_transfer_commands(BaseCLI& cli);
void register_listing_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class DocsyncCLI : public BaseCLI {
public:
    DocsyncCLI();

    // Dispatch one subcommand; returns the process exit code
    int run(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
    void start_run_log(bool verbose);
};
