#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load runtime settings from a YAML file. A missing file yields defaults.
    static Result<Config> load(const fs::path& path = get_config_path());

    // Parse runtime settings from YAML text.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& remote_name() const { return remote_name_; }
    const fs::path& rclone_config() const { return rclone_config_; }
    const std::string& key_hex() const { return key_hex_; }
    const TransferSettings& transfer() const { return transfer_; }
    const SyncSettings& sync() const { return sync_; }

    // Command-line overrides
    void set_remote_name(const std::string& name) { remote_name_ = name; }
    void set_concurrency(int n) { sync_.concurrency = n; }
    void set_compare(ComparePolicy p) { sync_.compare = p; }

    static fs::path get_config_path();

public:
    Config();

private:
    std::string remote_name_;
    fs::path rclone_config_;
    std::string key_hex_;
    TransferSettings transfer_;
    SyncSettings sync_;
};

// "size" / "size-only" -> Size, "size+etag" / "size+checksum" / "etag" -> SizeAndEtag
std::optional<ComparePolicy> parse_compare_policy(const std::string& name);
std::string compare_policy_name(ComparePolicy policy);

bool config_exists(const fs::path& path = Config::get_config_path());

// Write a commented default config if none exists yet.
Result<void> create_default_config(const fs::path& path = Config::get_config_path());
