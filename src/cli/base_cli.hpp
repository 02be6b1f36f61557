#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/webdav_client.hpp>

namespace fs = std::filesystem;

// Positional arguments plus --name value options, in command-line order.
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;   // without the leading "--"

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
};

// Split argv[first..] into CommandArgs. --help and --version are flags; every
// other --option takes a value, either "--name value" or "--name=value".
Result<CommandArgs> parse_command_args(int argc, char** argv, int first);

class BaseCLI {
public:
    explicit BaseCLI(fs::path config_path = Config::get_config_path());
    virtual ~BaseCLI() = default;

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const CommandArgs&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    int execute_command(const std::string& command, const CommandArgs& args);
    void print_help() const;

    // Load config on first use. Prints the error and returns false on failure.
    bool require_config();

    // Resolve the configured remote and build a client for it.
    // Prints the error and returns nullptr on failure.
    std::unique_ptr<WebDavClient> make_client();

    const fs::path& config_path() const { return config_path_; }

    std::optional<Config> config;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };

    fs::path config_path_;
    std::vector<std::string> order_;
    std::map<std::string, Command> commands_;
};
