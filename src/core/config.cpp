#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

std::optional<ComparePolicy> parse_compare_policy(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "size" || n == "size-only") return ComparePolicy::Size;
    if (n == "size+etag" || n == "size+checksum" || n == "etag") return ComparePolicy::SizeAndEtag;
    return std::nullopt;
}

std::string compare_policy_name(ComparePolicy policy) {
    return policy == ComparePolicy::Size ? "size" : "size+etag";
}

Config::Config()
    : remote_name_("myalist"),
      rclone_config_(platform::home_dir() / ".config" / "rclone" / "rclone.conf"),
      key_hex_(DEFAULT_OBSCURE_KEY_HEX) {
}

fs::path Config::get_config_path() {
    return platform::home_dir() / ".davsync" / "config.yaml";
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

static Result<int> read_non_negative(const YAML::Node& node, const char* key, int fallback) {
    if (!node || !node[key]) return Result<int>::Ok(fallback);
    int v = node[key].as<int>();
    if (v < 0) {
        return Result<int>::Err(fmt::format("{} must not be negative (got {})", key, v));
    }
    return Result<int>::Ok(v);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        config.remote_name_ = root["remote"].as<std::string>(config.remote_name_);
        if (root["rclone_config"]) {
            config.rclone_config_ = platform::expand_user(root["rclone_config"].as<std::string>());
        }

        if (root["crypto"] && root["crypto"]["key_hex"]) {
            std::string key = trimmed(root["crypto"]["key_hex"].as<std::string>());
            auto bytes = hex_decode(key);
            if (!bytes || (bytes->size() != 16 && bytes->size() != 24 && bytes->size() != 32)) {
                return Result<Config>::Err("crypto.key_hex must be 32, 48 or 64 hex characters");
            }
            config.key_hex_ = key;
        }

        const YAML::Node transfer = root["transfer"];
        auto timeout = read_non_negative(transfer, "timeout_ms", DEFAULT_TIMEOUT_MS);
        auto retries = read_non_negative(transfer, "max_retries", DEFAULT_MAX_RETRIES);
        auto delay = read_non_negative(transfer, "retry_delay_ms", DEFAULT_RETRY_DELAY_MS);
        for (const auto* r : {&timeout, &retries, &delay}) {
            if (r->is_err()) return Result<Config>::Err("transfer." + r->error);
        }
        config.transfer_.timeout_ms = timeout.value;
        config.transfer_.max_retries = retries.value;
        config.transfer_.retry_delay_ms = delay.value;

        const YAML::Node sync = root["sync"];
        if (sync && sync["compare"]) {
            std::string name = sync["compare"].as<std::string>();
            auto policy = parse_compare_policy(name);
            if (!policy) {
                return Result<Config>::Err(fmt::format(
                    "sync.compare: unknown policy '{}' (expected size or size+etag)", name));
            }
            config.sync_.compare = *policy;
        }
        auto concurrency = read_non_negative(sync, "concurrency", DEFAULT_CONCURRENCY);
        if (concurrency.is_err()) return Result<Config>::Err("sync." + concurrency.error);
        config.sync_.concurrency = concurrency.value;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Ok(Config());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const std::string default_config = fmt::format(R"(# davsync configuration

# Section name in the rclone config holding url / user / pass
remote: "myalist"
rclone_config: "~/.config/rclone/rclone.conf"

# Key used to reveal obscured passwords (rclone's default shown)
crypto:
  key_hex: "{}"

transfer:
  timeout_ms: {}
  max_retries: {}
  retry_delay_ms: {}

sync:
  compare: "size+etag"     # or "size"
  concurrency: {}
)", DEFAULT_OBSCURE_KEY_HEX, DEFAULT_TIMEOUT_MS, DEFAULT_MAX_RETRIES,
    DEFAULT_RETRY_DELAY_MS, DEFAULT_CONCURRENCY);

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
