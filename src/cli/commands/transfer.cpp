#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <managers/sync_engine.hpp>

static bool need_args(const CommandArgs& args, size_t n, const std::string& usage) {
    if (args.positional.size() >= n) return true;
    std::cout << theme::fail("Missing arguments.");
    std::cout << theme::step("Usage: davsync " + usage);
    return false;
}

static int do_sync(BaseCLI& cli, const CommandArgs& args) {
    if (!need_args(args, 2, "sync <local_dir> <remote_dir>")) return 1;
    if (!cli.require_config()) return 1;

    Config& cfg = cli.config.value();
    if (auto remote = args.option("remote")) {
        cfg.set_remote_name(*remote);
    }
    if (auto n = args.option("concurrency")) {
        int value = safe_stoi(*n, -1);
        if (value < 1) {
            std::cout << theme::fail("--concurrency must be a positive integer");
            return 1;
        }
        cfg.set_concurrency(value);
    }
    if (auto name = args.option("compare")) {
        auto policy = parse_compare_policy(*name);
        if (!policy) {
            std::cout << theme::fail("Unknown compare policy: " + *name);
            std::cout << theme::step("Expected size or size+etag");
            return 1;
        }
        cfg.set_compare(*policy);
    }

    auto client = cli.make_client();
    if (!client) return 1;

    const std::string& local = args.positional[0];
    const std::string& remote = args.positional[1];
    std::cout << theme::section("Sync");
    std::cout << theme::step(fmt::format("{} -> {} ({} workers, compare {})",
                                         local, remote, cfg.sync().concurrency,
                                         compare_policy_name(cfg.sync().compare)));

    auto report = sync_directory(*client, local, remote, cfg.sync(),
        [](const std::string& line) {
            if (line.rfind("[ERR]", 0) == 0) {
                std::cout << theme::yellow("    " + line) << "\n";
            } else {
                std::cout << theme::log(line);
            }
        });

    std::cout << "\n";
    std::cout << theme::kv("Processed", std::to_string(report.processed));
    std::cout << theme::kv("Uploaded", std::to_string(report.uploaded));
    std::cout << theme::kv("Skipped", std::to_string(report.skipped));
    std::cout << theme::kv("Failed", std::to_string(report.failed));
    std::cout << theme::kv("Elapsed", fmt::format("{:.1f}s", report.elapsed_ms / 1000.0));
    std::cout << "\n";

    return report.failed > 0 ? 1 : 0;
}

static int do_upload(BaseCLI& cli, const CommandArgs& args) {
    if (!need_args(args, 2, "upload <local_file> <remote_path>")) return 1;

    fs::path local = args.positional[0];
    const std::string& remote = args.positional[1];
    if (!fs::is_regular_file(local)) {
        std::cout << theme::fail("Not a file: " + local.string());
        return 1;
    }

    auto client = cli.make_client();
    if (!client) return 1;

    client->ensure_parent_directory(remote);
    client->upload(local, remote);
    std::cout << theme::ok(fmt::format("Uploaded {} -> {}", local.string(), remote));
    return 0;
}

static int do_download(BaseCLI& cli, const CommandArgs& args) {
    if (!need_args(args, 2, "download <remote_path> <local_file>")) return 1;

    const std::string& remote = args.positional[0];
    fs::path local = args.positional[1];

    auto client = cli.make_client();
    if (!client) return 1;

    if (local.has_parent_path()) {
        fs::create_directories(local.parent_path());
    }
    client->download(remote, local);
    std::cout << theme::ok(fmt::format("Downloaded {} -> {}", remote, local.string()));
    return 0;
}

static int do_fetch(BaseCLI& cli, const CommandArgs& args) {
    if (!need_args(args, 2, "fetch <url> <remote_path>")) return 1;

    const std::string& url = args.positional[0];
    const std::string& remote = args.positional[1];

    auto client = cli.make_client();
    if (!client) return 1;

    client->ensure_parent_directory(remote);
    std::cout << theme::info("Streaming " + url);
    std::string written = client->upload_from_url(url, remote);
    std::cout << theme::ok("Stored as " + written);
    return 0;
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("sync", do_sync,
                    "<local_dir> <remote_dir> [--remote NAME] [--concurrency N] [--compare size|size+etag]",
                    "Upload new and changed files");
    cli.add_command("upload", do_upload, "<local_file> <remote_path>", "Upload one file");
    cli.add_command("download", do_download, "<remote_path> <local_file>", "Download one file");
    cli.add_command("fetch", do_fetch, "<url> <remote_path>", "Stream a URL straight to the remote");
}
