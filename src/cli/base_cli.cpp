#include "base_cli.hpp"
#include "theme.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

Result<CommandArgs> parse_command_args(int argc, char** argv, int first) {
    CommandArgs args;
    for (int i = first; i < argc; i++) {
        std::string a = argv[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            std::string name = a.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                args.options[name.substr(0, eq)] = name.substr(eq + 1);
                continue;
            }
            if (name == "help" || name == "version") {
                args.options[name] = "";
                continue;
            }
            if (i + 1 >= argc) {
                return Result<CommandArgs>::Err("Missing value for --" + name);
            }
            args.options[name] = argv[++i];
        } else {
            args.positional.push_back(a);
        }
    }
    return Result<CommandArgs>::Ok(args);
}

BaseCLI::BaseCLI(fs::path config_path) : config_path_(std::move(config_path)) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

int BaseCLI::execute_command(const std::string& command, const CommandArgs& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'davsync --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        davsync_log(fmt::format("{} failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Usage");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << theme::color::BLUE
                  << fmt::format("    davsync {:<44}", name + " " + cmd.usage)
                  << theme::color::RESET
                  << theme::color::DIM << cmd.help << theme::color::RESET << "\n";
    }
    std::cout << "\n" << theme::color::DIM
              << "    --config PATH         Use another config file\n"
              << "    davsync --version     Show version\n"
              << "    davsync --help        Show this help"
              << theme::color::RESET << "\n\n";
}

bool BaseCLI::require_config() {
    if (config) return true;

    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;
    return true;
}

std::unique_ptr<WebDavClient> BaseCLI::make_client() {
    if (!require_config()) return nullptr;

    const Config& cfg = config.value();
    auto remote = load_remote(cfg.rclone_config(), cfg.remote_name(), cfg.key_hex());
    if (remote.is_err()) {
        std::cout << theme::fail(remote.error);
        std::cout << theme::step("Check 'rclone_config' and 'remote' in " + config_path_.string());
        return nullptr;
    }

    davsync_log(fmt::format("Using remote [{}] at {}", cfg.remote_name(), remote.value.url));
    return std::make_unique<WebDavClient>(remote.value, cfg.transfer());
}
