#include "credentials.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <algorithm>

// ── INI parsing ────────────────────────────────────────────

static std::string strip_quotes(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

Result<IniDocument> parse_ini(const std::string& text) {
    IniDocument doc;
    std::istringstream in(text);
    std::string line;
    std::string section;
    bool in_section = false;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return Result<IniDocument>::Err(fmt::format("line {}: malformed section header", line_no));
            }
            section = trimmed(line.substr(1, line.size() - 2));
            doc[section];
            in_section = true;
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return Result<IniDocument>::Err(fmt::format("line {}: expected key = value", line_no));
        }
        if (!in_section) {
            return Result<IniDocument>::Err(fmt::format("line {}: key outside of any section", line_no));
        }

        std::string key = trimmed(line.substr(0, eq));
        if (key.empty()) {
            return Result<IniDocument>::Err(fmt::format("line {}: empty key", line_no));
        }
        doc[section][key] = strip_quotes(trimmed(line.substr(eq + 1)));
    }

    return Result<IniDocument>::Ok(std::move(doc));
}

// ── AES-CTR (64-bit counter) ───────────────────────────────

static const EVP_CIPHER* ecb_cipher_for(size_t key_len) {
    switch (key_len) {
        case 16: return EVP_aes_128_ecb();
        case 24: return EVP_aes_192_ecb();
        case 32: return EVP_aes_256_ecb();
        default: return nullptr;
    }
}

// CTR keystream where only the low 64 bits of the counter block advance and
// wrap, leaving the high 64 bits fixed. Encrypt and decrypt are the same call.
static std::optional<std::string> aes_ctr64(const std::string& key,
                                            const std::string& iv,
                                            const std::string& data) {
    const EVP_CIPHER* cipher = ecb_cipher_for(key.size());
    if (!cipher || iv.size() != static_cast<size_t>(OBSCURE_IV_SIZE)) return std::nullopt;

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
        EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) return std::nullopt;
    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr,
                           reinterpret_cast<const unsigned char*>(key.data()), nullptr) != 1) {
        return std::nullopt;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    unsigned char counter[16];
    std::copy(iv.begin(), iv.end(), counter);

    std::string out(data.size(), '\0');
    unsigned char keystream[32];
    for (size_t off = 0; off < data.size(); off += 16) {
        int produced = 0;
        if (EVP_EncryptUpdate(ctx.get(), keystream, &produced, counter, 16) != 1 || produced != 16) {
            return std::nullopt;
        }
        size_t n = std::min<size_t>(16, data.size() - off);
        for (size_t i = 0; i < n; ++i) {
            out[off + i] = static_cast<char>(static_cast<unsigned char>(data[off + i]) ^ keystream[i]);
        }
        for (int i = 15; i >= 8; --i) {
            if (++counter[i] != 0) break;
        }
    }
    return out;
}

// ── reveal / obscure ───────────────────────────────────────

RevealResult reveal(const std::string& obscured, const std::string& key_hex) {
    RevealResult fallback{obscured, false};
    if (obscured.empty()) return fallback;

    std::string std_alphabet = obscured;
    std::replace(std_alphabet.begin(), std_alphabet.end(), '-', '+');
    std::replace(std_alphabet.begin(), std_alphabet.end(), '_', '/');

    auto raw = base64_decode(std_alphabet);
    if (!raw || raw->size() < static_cast<size_t>(OBSCURE_IV_SIZE)) return fallback;

    auto key = hex_decode(key_hex);
    if (!key) return fallback;

    auto plain = aes_ctr64(*key, raw->substr(0, OBSCURE_IV_SIZE), raw->substr(OBSCURE_IV_SIZE));
    if (!plain || !is_valid_utf8(*plain)) return fallback;

    return {*plain, true};
}

Result<std::string> obscure(const std::string& plaintext, const std::string& key_hex) {
    auto key = hex_decode(key_hex);
    if (!key || !ecb_cipher_for(key->size())) {
        return Result<std::string>::Err("Obscure key must be 32, 48 or 64 hex characters");
    }

    unsigned char iv_bytes[OBSCURE_IV_SIZE];
    if (RAND_bytes(iv_bytes, OBSCURE_IV_SIZE) != 1) {
        return Result<std::string>::Err("Failed to generate IV");
    }
    std::string iv(reinterpret_cast<const char*>(iv_bytes), OBSCURE_IV_SIZE);

    auto cipher = aes_ctr64(*key, iv, plaintext);
    if (!cipher) {
        return Result<std::string>::Err("AES-CTR encryption failed");
    }

    std::string encoded = base64_encode(iv + *cipher);
    while (!encoded.empty() && encoded.back() == '=') encoded.pop_back();
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    return Result<std::string>::Ok(encoded);
}

// ── Remote resolution ──────────────────────────────────────

std::optional<RemoteConfig> resolve_remote(const std::string& config_text,
                                           const std::string& remote_name,
                                           const std::string& key_hex) {
    auto doc = parse_ini(config_text);
    if (doc.is_err()) {
        davsync_log("resolve_remote: " + doc.error);
        return std::nullopt;
    }

    auto it = doc.value.find(remote_name);
    if (it == doc.value.end()) return std::nullopt;

    const IniSection& section = it->second;
    auto get = [&](const char* key) -> std::string {
        auto kv = section.find(key);
        return kv == section.end() ? "" : kv->second;
    };

    RemoteConfig remote;
    remote.url = get("url");
    remote.user = get("user");
    if (section.count("type")) remote.type = get("type");

    auto revealed = reveal(get("pass"), key_hex);
    if (!revealed.decrypted && !revealed.text.empty()) {
        davsync_log(fmt::format("resolve_remote: [{}] pass not decryptable, using it as plaintext",
                                remote_name));
    }
    remote.pass = std::move(revealed.text);

    return remote;
}

Result<RemoteConfig> load_remote(const std::filesystem::path& config_path,
                                 const std::string& remote_name,
                                 const std::string& key_hex) {
    std::ifstream in(config_path);
    if (!in) {
        return Result<RemoteConfig>::Err("Cannot read remote config at " + config_path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto remote = resolve_remote(text, remote_name, key_hex);
    if (!remote) {
        return Result<RemoteConfig>::Err(fmt::format("Remote [{}] was not found in {}",
                                                     remote_name, config_path.string()));
    }
    return Result<RemoteConfig>::Ok(*remote);
}
