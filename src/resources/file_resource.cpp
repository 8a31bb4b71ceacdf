#include "file_resource.hpp"
#include "ownership.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

FileResource::FileResource(RemoteClient& client) : client_(client) {}

bool FileResource::requires_replace(const FileDesired& plan, const FileObserved& state) {
    return plan.path != state.path;
}

Result<FileObserved> FileResource::create(const FileDesired& plan) {
    const std::string& path = plan.path;
    bool ensure_dir = plan.ensure_dir.is_known() && plan.ensure_dir.value();
    const std::string content = plan.content.is_known() ? plan.content.value() : "";

    remotefs_log(fmt::format("file create: {}", path));

    auto written = client_.write_file(content, path, ensure_dir);
    if (written.is_err()) {
        return Result<FileObserved>::Err(written.error.wrap("Could not create file " + path));
    }

    auto owned = apply_initial_ownership(client_, path, plan.ownership);
    if (owned.is_err()) {
        return Result<FileObserved>::Err(owned.error.wrap("Could not create file " + path));
    }

    return refresh(path, ensure_dir);
}

Result<std::optional<FileObserved>> FileResource::read(const FileObserved& state) {
    using ReadResult = Result<std::optional<FileObserved>>;
    const std::string& path = state.id;

    auto file = client_.read_file(path);
    if (file.is_err()) {
        return ReadResult::Err(file.error.wrap("Could not read remote file " + path));
    }
    if (!file.value.exists) {
        remotefs_log(fmt::format("file read: {} is gone", path));
        return ReadResult::Ok(std::nullopt);
    }

    auto attrs = read_attributes(client_, path);
    if (attrs.is_err()) {
        return ReadResult::Err(attrs.error.wrap("Could not read remote file " + path));
    }

    FileObserved refreshed = state;
    refreshed.exists = true;
    refreshed.content = file.value.content;
    refreshed.attrs = attrs.value;
    return ReadResult::Ok(refreshed);
}

Result<FileObserved> FileResource::update(const FileDesired& plan, const FileObserved& state) {
    const std::string& path = state.id;

    remotefs_log(fmt::format("file update: {}", path));

    if (plan.content.differs_from(state.content)) {
        // The path is unchanged, so its directory already exists
        auto written = client_.write_file(plan.content.value(), path, false);
        if (written.is_err()) {
            return Result<FileObserved>::Err(
                written.error.wrap("Could not update content of " + path));
        }
    }

    auto owned = apply_ownership_changes(client_, path, plan.ownership, state.attrs);
    if (owned.is_err()) {
        return Result<FileObserved>::Err(owned.error.wrap("Could not update file " + path));
    }

    bool ensure_dir = plan.ensure_dir.is_known() ? plan.ensure_dir.value() : state.ensure_dir;
    return refresh(path, ensure_dir);
}

Result<void> FileResource::destroy(const FileObserved& state) {
    remotefs_log(fmt::format("file delete: {}", state.id));

    auto removed = client_.delete_file(state.id);
    if (removed.is_err()) {
        if (removed.error.kind == ErrorKind::NotFound) {
            remotefs_log(fmt::format("file delete: {} already absent", state.id));
            return Result<void>::Ok();
        }
        return Result<void>::Err(removed.error.wrap("Could not delete file " + state.id));
    }
    return Result<void>::Ok();
}

// Read back content and attributes after a mutation
Result<FileObserved> FileResource::refresh(const std::string& path, bool ensure_dir) {
    auto file = client_.read_file(path);
    if (file.is_err()) {
        return Result<FileObserved>::Err(file.error.wrap("Could not read back file " + path));
    }
    if (!file.value.exists) {
        Error err;
        err.kind = ErrorKind::NotFound;
        err.message = fmt::format("file {} vanished after being written", path);
        return Result<FileObserved>::Err(err);
    }

    auto attrs = read_attributes(client_, path);
    if (attrs.is_err()) {
        return Result<FileObserved>::Err(attrs.error.wrap("Could not read back file " + path));
    }

    FileObserved state;
    state.id = path;
    state.path = path;
    state.exists = true;
    state.content = file.value.content;
    state.ensure_dir = ensure_dir;
    state.attrs = attrs.value;
    state.last_updated = now_iso();
    return Result<FileObserved>::Ok(state);
}
