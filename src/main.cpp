#include <iostream>
#include <string>
#include "cli/davsync_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

int main(int argc, char** argv) {
    try {
        auto parsed = parse_command_args(argc, argv, 1);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            return 1;
        }
        CommandArgs args = parsed.value;

        fs::path config_path = Config::get_config_path();
        if (auto path = args.option("config")) {
            config_path = *path;
            args.options.erase("config");
        }
        DavsyncCLI cli(config_path);

        if (args.positional.empty()) {
            if (args.options.count("version")) {
                std::cout << theme::color::BROWN << theme::color::BOLD << "davsync"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << DAVSYNC_VERSION << theme::color::RESET << "\n";
                return 0;
            }
            cli.print_help();
            return args.options.count("help") ? 0 : 1;
        }

        std::string cmd = args.positional.front();
        args.positional.erase(args.positional.begin());
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
