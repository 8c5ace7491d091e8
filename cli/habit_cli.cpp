// FILE: cli/habit_cli.cpp
#include <getopt.h>

#include <iostream>
#include <string>

#include "cli/print_cli_help.hpp"
#include "cli/screen_controller.hpp"
#include "cli/terminal_input.hpp"
#include "cli_config.hpp"
#include "kernel/habit_store.hpp"
#include "kernel/interaction.hpp"

int main(int argc, char** argv) {
    // Fast path: if only asking for help, skip config and database setup.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    CliConfig config;
    std::string custom_config_path;
    std::string db_override;

    const char* const short_opts = "hc:d:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},
        {"config", required_argument, nullptr, 'c'},
        {"db", required_argument, nullptr, 'd'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'c': custom_config_path = optarg; break;
        case 'd': db_override = optarg; break;
        default: print_cli_help(); return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        print_cli_help();
        return 1;
    }

    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);
    if (!db_override.empty()) config.db_path = db_override;

    try {
        ht::HabitStore store(config.db_path);
        ht::InteractionService svc(store);
        ht::TerminalInput keys;
        ht::ScreenController controller(svc, config, keys, std::cin, std::cout);
        int code = controller.Run();
        std::cout << "Bye." << std::endl;
        return code;
    } catch (const ht::HabitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
