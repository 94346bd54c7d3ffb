#include "docsync_cli.hpp"
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <algorithm>
#include <fmt/format.h>

DocsyncCLI::DocsyncCLI() {
    register_all_commands();
}

void DocsyncCLI::register_all_commands() {
    register_transfer_commands(*this);
    register_listing_commands(*this);
    register_setup_commands(*this);
}

void DocsyncCLI::start_run_log(bool verbose) {
    Config cfg = config ? *config : Config::defaults();
    log_init(new_run_log_path(get_log_dir(cfg)), verbose || cfg.logging().verbose);
    set_log_thread_name("main");
}

int DocsyncCLI::run(const std::string& command, const std::vector<std::string>& args) {
    bool verbose = std::any_of(args.begin(), args.end(), [](const std::string& a) {
        return a == "-v" || a == "--verbose";
    });
    if (verbose && config) config->set_verbose(true);

    start_run_log(verbose);
    docsync_log(fmt::format("docsync {} ({} arg(s))", command, args.size()));

    platform::install_interrupt_flag(&interrupted);

    int code = execute_command(command, args);
    if (interrupted.load()) {
        docsync_warn("run interrupted");
    }
    docsync_log(fmt::format("docsync {} exited with {}", command, code));
    return code;
}
