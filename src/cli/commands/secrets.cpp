#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/credentials.hpp>

static int do_reveal(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.empty()) {
        std::cout << theme::fail("Usage: davsync reveal <obscured>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    auto result = reveal(args.positional[0], cli.config->key_hex());
    std::cout << result.text << "\n";
    if (!result.decrypted) {
        std::cerr << theme::dim("(not an obscured secret; printed unchanged)") << "\n";
    }
    return 0;
}

static int do_obscure(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.empty()) {
        std::cout << theme::fail("Usage: davsync obscure <plaintext>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    auto result = obscure(args.positional[0], cli.config->key_hex());
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << result.value << "\n";
    return 0;
}

static int do_init(BaseCLI& cli, const CommandArgs& args) {
    if (config_exists(cli.config_path())) {
        std::cout << theme::info("Config already exists at " + cli.config_path().string());
        return 0;
    }

    auto result = create_default_config(cli.config_path());
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Created " + cli.config_path().string());
    std::cout << theme::step("Edit 'remote' to name a section of your rclone config.");
    return 0;
}

void register_secret_commands(BaseCLI& cli) {
    cli.add_command("reveal", do_reveal, "<obscured>", "Decode an obscured rclone password");
    cli.add_command("obscure", do_obscure, "<plaintext>", "Obscure a password for rclone.conf");
    cli.add_command("init", do_init, "", "Write a default config file");
}
