#include "folder_resource.hpp"
#include "ownership.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

FolderResource::FolderResource(RemoteClient& client) : client_(client) {}

bool FolderResource::requires_replace(const FolderDesired& plan, const FolderObserved& state) {
    return plan.path != state.path;
}

Result<FolderObserved> FolderResource::create(const FolderDesired& plan) {
    const std::string& path = plan.path;
    remotefs_log(fmt::format("folder create: {}", path));

    auto made = client_.create_dir(path);
    if (made.is_err()) {
        return Result<FolderObserved>::Err(made.error.wrap("Could not create folder " + path));
    }

    auto owned = apply_initial_ownership(client_, path, plan.ownership);
    if (owned.is_err()) {
        return Result<FolderObserved>::Err(owned.error.wrap("Could not create folder " + path));
    }

    return refresh(path);
}

Result<std::optional<FolderObserved>> FolderResource::read(const FolderObserved& state) {
    using ReadResult = Result<std::optional<FolderObserved>>;
    const std::string& path = state.id;

    auto exists = client_.dir_exists(path);
    if (exists.is_err()) {
        return ReadResult::Err(exists.error.wrap("Could not read remote folder " + path));
    }
    if (!exists.value) {
        remotefs_log(fmt::format("folder read: {} is gone", path));
        return ReadResult::Ok(std::nullopt);
    }

    auto attrs = read_attributes(client_, path);
    if (attrs.is_err()) {
        return ReadResult::Err(attrs.error.wrap("Could not read remote folder " + path));
    }

    FolderObserved refreshed = state;
    refreshed.exists = true;
    refreshed.attrs = attrs.value;
    return ReadResult::Ok(refreshed);
}

Result<FolderObserved> FolderResource::update(const FolderDesired& plan,
                                              const FolderObserved& state) {
    const std::string& path = state.id;
    remotefs_log(fmt::format("folder update: {}", path));

    auto owned = apply_ownership_changes(client_, path, plan.ownership, state.attrs);
    if (owned.is_err()) {
        return Result<FolderObserved>::Err(owned.error.wrap("Could not update folder " + path));
    }

    return refresh(path);
}

Result<void> FolderResource::destroy(const FolderObserved& state) {
    remotefs_log(fmt::format("folder delete: {}", state.id));

    auto removed = client_.delete_folder(state.id);
    if (removed.is_err()) {
        return Result<void>::Err(removed.error.wrap("Could not delete folder " + state.id));
    }
    return Result<void>::Ok();
}

Result<FolderObserved> FolderResource::refresh(const std::string& path) {
    auto attrs = read_attributes(client_, path);
    if (attrs.is_err()) {
        return Result<FolderObserved>::Err(attrs.error.wrap("Could not read back folder " + path));
    }

    FolderObserved state;
    state.id = path;
    state.path = path;
    state.exists = true;
    state.attrs = attrs.value;
    state.last_updated = now_iso();
    return Result<FolderObserved>::Ok(state);
}
