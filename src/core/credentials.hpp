#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

// section name -> (key -> value)
using IniSection = std::map<std::string, std::string>;
using IniDocument = std::map<std::string, IniSection>;

// Parse an rclone-style sectioned key=value document.
Result<IniDocument> parse_ini(const std::string& text);

// Outcome of reveal(). decrypted=false means text is the input unchanged.
struct RevealResult {
    std::string text;
    bool decrypted = false;
};

// Decrypt an rclone "obscured" secret: urlsafe-base64(IV || AES-CTR(plain)).
// Never fails: on any decode or cipher error the input comes back unchanged.
RevealResult reveal(const std::string& obscured,
                    const std::string& key_hex = DEFAULT_OBSCURE_KEY_HEX);

// Inverse of reveal() with a random IV. Errors only on a bad key.
Result<std::string> obscure(const std::string& plaintext,
                            const std::string& key_hex = DEFAULT_OBSCURE_KEY_HEX);

// Look up remote_name in config_text and reveal its pass field.
// nullopt if the document does not parse or the section is missing.
std::optional<RemoteConfig> resolve_remote(const std::string& config_text,
                                           const std::string& remote_name,
                                           const std::string& key_hex = DEFAULT_OBSCURE_KEY_HEX);

// File-reading wrapper around resolve_remote(). Errors are fatal for callers.
Result<RemoteConfig> load_remote(const std::filesystem::path& config_path,
                                 const std::string& remote_name,
                                 const std::string& key_hex = DEFAULT_OBSCURE_KEY_HEX);
