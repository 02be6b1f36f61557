#include "task_planner.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <util/remote_path.hpp>
#include <fmt/format.h>

FileWalker::FileWalker(const fs::path& root) : root_(root) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw LocalIOError("Not a directory: " + root_.string());
    }
    reset();
}

void FileWalker::reset() {
    pending_.clear();
    pending_.push_back(root_);
    current_ = fs::directory_iterator();
}

bool FileWalker::open_next_directory() {
    while (!pending_.empty()) {
        fs::path dir = pending_.back();
        pending_.pop_back();

        std::error_code ec;
        current_ = fs::directory_iterator(dir, ec);
        if (ec) {
            davsync_log(fmt::format("Skipping unreadable directory {}: {}", dir.string(), ec.message()));
            continue;
        }
        return true;
    }
    return false;
}

std::optional<FileEntry> FileWalker::next() {
    while (true) {
        if (current_ == fs::directory_iterator()) {
            if (!open_next_directory()) return std::nullopt;
            continue;
        }

        fs::directory_entry entry = *current_;
        std::error_code ec;
        current_.increment(ec);
        if (ec) {
            davsync_log(fmt::format("Directory listing stopped at {}: {}", entry.path().string(), ec.message()));
            current_ = fs::directory_iterator();
        }

        auto status = entry.symlink_status(ec);
        if (ec || fs::is_symlink(status)) continue;

        if (fs::is_directory(status)) {
            pending_.push_back(entry.path());
            continue;
        }
        if (!fs::is_regular_file(status)) continue;

        auto size = entry.file_size(ec);
        if (ec) {
            davsync_log(fmt::format("Skipping {}: {}", entry.path().string(), ec.message()));
            continue;
        }

        FileEntry file;
        file.path = entry.path();
        file.relative = entry.path().lexically_relative(root_);
        file.size = static_cast<int64_t>(size);
        return file;
    }
}

std::vector<SyncTask> plan_sync_tasks(const fs::path& local_root, const std::string& remote_root) {
    FileWalker walker(local_root);
    std::vector<SyncTask> tasks;

    while (auto file = walker.next()) {
        SyncTask task;
        task.local_path = file->path.string();
        task.remote_path = RemotePath::join({remote_root, file->relative.generic_string()});
        task.size = file->size;
        tasks.push_back(std::move(task));
    }

    davsync_log(fmt::format("Planned {} tasks from {} -> {}", tasks.size(), local_root.string(), remote_root));
    return tasks;
}
