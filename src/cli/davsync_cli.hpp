#pragma once

#include "base_cli.hpp"

void register_transfer_commands(BaseCLI& cli);
void register_secret_commands(BaseCLI& cli);

class DavsyncCLI : public BaseCLI {
public:
    explicit DavsyncCLI(fs::path config_path = Config::get_config_path());
};
