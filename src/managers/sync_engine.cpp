#include "sync_engine.hpp"
#include "task_planner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/remote_path.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <thread>

SyncEngine::SyncEngine(WebDavClient& client) : client_(client) {}

void SyncEngine::emit(const StatusCallback& cb, const std::string& line) {
    davsync_log(line);
    if (!cb) return;
    std::lock_guard<std::mutex> lock(status_mutex_);
    try {
        cb(line);
    } catch (const std::exception& e) {
        // Reporting must not change a task's outcome.
        davsync_log(fmt::format("Status callback threw: {}", e.what()));
    }
}

bool SyncEngine::is_up_to_date(const SyncTask& task,
                               const std::optional<RemoteMetadata>& meta,
                               ComparePolicy policy) {
    if (!meta || !meta->size || *meta->size != task.size) return false;
    if (policy == ComparePolicy::Size) return true;

    if (!meta->etag) return false;
    return StringUtils::iequals(compute_file_md5(task.local_path), *meta->etag);
}

SyncReport SyncEngine::run(const std::vector<SyncTask>& tasks,
                           int concurrency,
                           ComparePolicy policy,
                           StatusCallback cb) {
    auto start = std::chrono::steady_clock::now();

    std::mutex queue_mutex;
    std::deque<const SyncTask*> queue;
    for (const auto& t : tasks) queue.push_back(&t);

    std::atomic<int> processed{0};
    std::atomic<int> uploaded{0};
    std::atomic<int> skipped{0};
    std::atomic<int> failed{0};

    auto worker = [&]() {
        while (true) {
            const SyncTask* task = nullptr;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (queue.empty()) return;
                task = queue.front();
                queue.pop_front();
            }

            std::string name = fs::path(task->local_path).filename().string();
            std::string line;
            try {
                std::string parent = RemotePath::parent(task->remote_path);
                if (!parent.empty()) client_.create_directory(parent);

                auto meta = client_.probe_metadata(task->remote_path);
                if (is_up_to_date(*task, meta, policy)) {
                    skipped++;
                    line = fmt::format("[SKIP] {} (already synchronized)", name);
                } else {
                    client_.upload(task->local_path, task->remote_path);
                    uploaded++;
                    line = fmt::format("[UP]   {}", name);
                }
            } catch (const std::exception& e) {
                failed++;
                line = fmt::format("[ERR]  {}: {}", name, e.what());
            }
            processed++;
            emit(cb, line);
        }
    };

    size_t n_workers = static_cast<size_t>(std::max(1, concurrency));
    n_workers = std::min(n_workers, std::max<size_t>(1, tasks.size()));

    std::vector<std::thread> workers;
    workers.reserve(n_workers);
    for (size_t i = 0; i < n_workers; i++) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) w.join();

    SyncReport report;
    report.processed = processed.load();
    report.uploaded = uploaded.load();
    report.skipped = skipped.load();
    report.failed = failed.load();
    report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    davsync_log(fmt::format("Sync finished: {} processed, {} uploaded, {} skipped, {} failed in {} ms",
                            report.processed, report.uploaded, report.skipped,
                            report.failed, report.elapsed_ms));
    return report;
}

SyncReport sync_directory(WebDavClient& client,
                          const fs::path& local_root,
                          const std::string& remote_root,
                          const SyncSettings& settings,
                          StatusCallback cb) {
    auto tasks = plan_sync_tasks(local_root, remote_root);
    SyncEngine engine(client);
    return engine.run(tasks, settings.concurrency, settings.compare, std::move(cb));
}
