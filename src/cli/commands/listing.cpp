#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static int do_schemas(BaseCLI& cli, const CommandArgs&) {
    if (!cli.open_service()) return 1;

    auto schemas = cli.api->list_schemas();
    if (schemas.is_err()) {
        std::cout << theme::fail("Could not list schemas: " + schemas.error);
        return 1;
    }

    std::cout << theme::section(fmt::format("Schemas ({})", schemas.value.size()));
    for (const auto& s : schemas.value) {
        std::cout << "    " << theme::blue(fmt::format("{:<36}", s.id))
                  << (s.name.empty() ? theme::dim("(unnamed)") : s.name) << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int do_datasets(BaseCLI& cli, const CommandArgs&) {
    if (!cli.open_service()) return 1;

    auto names = cli.api->list_dataset_names();
    if (names.is_err()) {
        std::cout << theme::fail("Could not list datasets: " + names.error);
        return 1;
    }

    std::cout << theme::section(fmt::format("Datasets ({})", names.value.size()));
    for (const auto& n : names.value) {
        std::cout << "    " << n << "\n";
    }
    std::cout << "\n";
    return 0;
}

void register_listing_commands(BaseCLI& cli) {
    cli.add_command("schemas", do_schemas, "schemas", "List standardization schemas");
    cli.add_command("datasets", do_datasets, "datasets", "List dataset names");
}
