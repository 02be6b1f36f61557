#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct FileEntry {
    fs::path path;        // absolute or root-prefixed
    fs::path relative;    // relative to the walk root
    int64_t size = 0;
};

// Lazy walk over the regular files under root. Uses an explicit stack of
// pending directories, so depth is bounded only by memory. Symlinks and
// special files are skipped; unreadable subdirectories are logged and skipped.
class FileWalker {
public:
    // Throws LocalIOError if root is missing or not a directory.
    explicit FileWalker(const fs::path& root);

    std::optional<FileEntry> next();

    // Start over from root.
    void reset();

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    std::vector<fs::path> pending_;
    fs::directory_iterator current_;

    bool open_next_directory();
};

// One task per regular file under local_root, targeting
// remote_root/<relative path>. Order is walk order.
std::vector<SyncTask> plan_sync_tasks(const fs::path& local_root, const std::string& remote_root);
