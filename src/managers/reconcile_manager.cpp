#include "reconcile_manager.hpp"
#include <core/log.hpp>
#include <resources/file_resource.hpp>
#include <resources/folder_resource.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>

const char* action_name(Action action) {
    switch (action) {
        case Action::Created:   return "created";
        case Action::Replaced:  return "replaced";
        case Action::Updated:   return "updated";
        case Action::Refreshed: return "refreshed";
        case Action::Gone:      return "gone";
        case Action::Deleted:   return "deleted";
        case Action::Failed:    return "failed";
    }
    return "unknown";
}

bool RunReport::ok() const {
    return failures() == 0;
}

int RunReport::failures() const {
    int n = 0;
    for (const auto& o : outcomes) {
        if (o.action == Action::Failed) n++;
    }
    return n;
}

static std::string file_key(const std::string& name) { return "file." + name; }
static std::string folder_key(const std::string& name) { return "folder." + name; }

// ── Worker plumbing ───────────────────────────────────────────

namespace {

// Collects outcomes and state changes from worker threads.
class Collector {
public:
    Collector(StoredState& state, StatusCallback cb) : state_(state), cb_(std::move(cb)) {}

    void record(ResourceOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cb_) {
            if (outcome.action == Action::Failed) {
                cb_(fmt::format("{}: {}", outcome.key, outcome.error.to_string()));
            } else {
                cb_(fmt::format("{}: {}", outcome.key, action_name(outcome.action)));
            }
        }
        report_.outcomes.push_back(std::move(outcome));
    }

    void put_file(const std::string& name, const FileObserved& obs) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.files[name] = obs;
    }
    void drop_file(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.files.erase(name);
    }
    void put_folder(const std::string& name, const FolderObserved& obs) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.folders[name] = obs;
    }
    void drop_folder(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.folders.erase(name);
    }

    RunReport take() { return std::move(report_); }

private:
    std::mutex mutex_;
    StoredState& state_;
    StatusCallback cb_;
    RunReport report_;
};

// Run `jobs` on at most `max_workers` threads, each pulling the next job
// until none are left. Returns once every job has finished.
void run_all(std::vector<std::function<void()>>& jobs, int max_workers) {
    std::atomic<size_t> next{0};
    auto drain = [&jobs, &next] {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            jobs[i]();
        }
    };

    size_t count = std::min(jobs.size(), static_cast<size_t>(std::max(1, max_workers)));
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (size_t i = 0; i < count; i++) {
        try {
            workers.emplace_back(drain);
        } catch (const std::system_error& e) {
            // Threads already started pick up the remaining jobs
            remotefs_log(fmt::format("worker start failed after {} threads: {}",
                                     workers.size(), e.what()));
            break;
        }
    }
    if (workers.empty()) drain();

    for (auto& t : workers) {
        t.join();
    }
}

ResourceOutcome failed(const std::string& key, const Error& error) {
    remotefs_log(fmt::format("{} failed: {}", key, error.to_string()));
    return {key, Action::Failed, error};
}

// Generic converge step shared by files and folders. `Res` is FileResource
// or FolderResource; `put`/`drop` write back into the collector.
template <typename Res, typename Desired, typename Observed, typename Put, typename Drop>
ResourceOutcome converge(Res& res, const std::string& key, const Desired& plan,
                         std::optional<Observed> prior, Put put, Drop drop) {
    if (prior) {
        auto read = res.read(*prior);
        if (read.is_err()) return failed(key, read.error);
        prior = read.value;
    }

    if (!prior) {
        auto created = res.create(plan);
        if (created.is_err()) {
            drop();
            return failed(key, created.error);
        }
        put(created.value);
        return {key, Action::Created, {}};
    }

    if (Res::requires_replace(plan, *prior)) {
        auto removed = res.destroy(*prior);
        if (removed.is_err()) return failed(key, removed.error);
        drop();

        auto created = res.create(plan);
        if (created.is_err()) return failed(key, created.error);
        put(created.value);
        return {key, Action::Replaced, {}};
    }

    auto updated = res.update(plan, *prior);
    if (updated.is_err()) return failed(key, updated.error);
    put(updated.value);
    return {key, Action::Updated, {}};
}

} // namespace

ReconcileManager::ReconcileManager(RemoteClient& client) : client_(client) {}

// ── Apply ─────────────────────────────────────────────────────

RunReport ReconcileManager::apply(const Config& config, StoredState& state, StatusCallback cb) {
    // Workers read from a snapshot and write into `state` via the collector
    const StoredState prior = state;
    Collector collector(state, cb);
    std::vector<std::function<void()>> jobs;
    std::set<std::string> declared_files, declared_folders;

    for (const auto& decl : config.resources()) {
        if (decl.type == ResourceType::File) {
            declared_files.insert(decl.name);
            std::optional<FileObserved> tracked;
            auto it = prior.files.find(decl.name);
            if (it != prior.files.end()) tracked = it->second;

            jobs.push_back([this, &collector, decl, tracked] {
                FileResource res(client_);
                collector.record(converge(
                    res, decl.key(), decl.file, tracked,
                    [&](const FileObserved& obs) { collector.put_file(decl.name, obs); },
                    [&] { collector.drop_file(decl.name); }));
            });
        } else {
            declared_folders.insert(decl.name);
            std::optional<FolderObserved> tracked;
            auto it = prior.folders.find(decl.name);
            if (it != prior.folders.end()) tracked = it->second;

            jobs.push_back([this, &collector, decl, tracked] {
                FolderResource res(client_);
                collector.record(converge(
                    res, decl.key(), decl.folder, tracked,
                    [&](const FolderObserved& obs) { collector.put_folder(decl.name, obs); },
                    [&] { collector.drop_folder(decl.name); }));
            });
        }
    }

    // Orphans: tracked but no longer declared
    for (const auto& [name, obs] : prior.files) {
        if (declared_files.count(name)) continue;
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FileResource res(client_);
            auto removed = res.destroy(obs);
            if (removed.is_err()) {
                collector.record(failed(file_key(name), removed.error));
                return;
            }
            collector.drop_file(name);
            collector.record({file_key(name), Action::Deleted, {}});
        });
    }
    for (const auto& [name, obs] : prior.folders) {
        if (declared_folders.count(name)) continue;
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FolderResource res(client_);
            auto removed = res.destroy(obs);
            if (removed.is_err()) {
                collector.record(failed(folder_key(name), removed.error));
                return;
            }
            collector.drop_folder(name);
            collector.record({folder_key(name), Action::Deleted, {}});
        });
    }

    remotefs_log(fmt::format("apply: {} job(s)", jobs.size()));
    run_all(jobs, client_.pool().capacity());
    return collector.take();
}

// ── Refresh ───────────────────────────────────────────────────

RunReport ReconcileManager::refresh(StoredState& state, StatusCallback cb) {
    const StoredState prior = state;
    Collector collector(state, cb);
    std::vector<std::function<void()>> jobs;

    for (const auto& [name, obs] : prior.files) {
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FileResource res(client_);
            auto read = res.read(obs);
            if (read.is_err()) {
                collector.record(failed(file_key(name), read.error));
            } else if (!read.value) {
                collector.drop_file(name);
                collector.record({file_key(name), Action::Gone, {}});
            } else {
                collector.put_file(name, *read.value);
                collector.record({file_key(name), Action::Refreshed, {}});
            }
        });
    }
    for (const auto& [name, obs] : prior.folders) {
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FolderResource res(client_);
            auto read = res.read(obs);
            if (read.is_err()) {
                collector.record(failed(folder_key(name), read.error));
            } else if (!read.value) {
                collector.drop_folder(name);
                collector.record({folder_key(name), Action::Gone, {}});
            } else {
                collector.put_folder(name, *read.value);
                collector.record({folder_key(name), Action::Refreshed, {}});
            }
        });
    }

    run_all(jobs, client_.pool().capacity());
    return collector.take();
}

// ── Destroy ───────────────────────────────────────────────────

RunReport ReconcileManager::destroy(StoredState& state, StatusCallback cb) {
    const StoredState prior = state;
    Collector collector(state, cb);
    std::vector<std::function<void()>> jobs;

    for (const auto& [name, obs] : prior.files) {
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FileResource res(client_);
            auto removed = res.destroy(obs);
            if (removed.is_err()) {
                collector.record(failed(file_key(name), removed.error));
                return;
            }
            collector.drop_file(name);
            collector.record({file_key(name), Action::Deleted, {}});
        });
    }
    for (const auto& [name, obs] : prior.folders) {
        jobs.push_back([this, &collector, name = name, obs = obs] {
            FolderResource res(client_);
            auto removed = res.destroy(obs);
            if (removed.is_err()) {
                collector.record(failed(folder_key(name), removed.error));
                return;
            }
            collector.drop_folder(name);
            collector.record({folder_key(name), Action::Deleted, {}});
        });
    }

    run_all(jobs, client_.pool().capacity());
    return collector.take();
}
