#include "davsync_cli.hpp"

DavsyncCLI::DavsyncCLI(fs::path config_path) : BaseCLI(std::move(config_path)) {
    register_transfer_commands(*this);
    register_secret_commands(*this);
}
