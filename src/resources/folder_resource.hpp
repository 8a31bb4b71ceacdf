#pragma once

#include <optional>
#include <core/types.hpp>
#include <remote/remote_client.hpp>
#include "attributes.hpp"

// Reconciles one remote directory: existence, owner, group and mode.
// Same transition contract as FileResource; destroy removes the whole tree.
class FolderResource {
public:
    explicit FolderResource(RemoteClient& client);

    Result<FolderObserved> create(const FolderDesired& plan);
    Result<std::optional<FolderObserved>> read(const FolderObserved& state);
    Result<FolderObserved> update(const FolderDesired& plan, const FolderObserved& state);
    Result<void> destroy(const FolderObserved& state);

    static bool requires_replace(const FolderDesired& plan, const FolderObserved& state);

private:
    RemoteClient& client_;

    Result<FolderObserved> refresh(const std::string& path);
};
