#pragma once

#include <optional>
#include <core/types.hpp>
#include <remote/remote_client.hpp>
#include "attributes.hpp"

// Reconciles one remote file: content, owner, group and mode.
//
// Every successful create/update re-reads the full attribute set from the
// host and returns it as the new state of record. A failure part way
// through leaves the host as the last successful command left it; the
// next pass is expected to converge.
class FileResource {
public:
    explicit FileResource(RemoteClient& client);

    // absent -> present
    Result<FileObserved> create(const FileDesired& plan);

    // nullopt when the file is gone and should no longer be tracked
    Result<std::optional<FileObserved>> read(const FileObserved& state);

    // present -> present, issuing commands only for fields that changed
    Result<FileObserved> update(const FileDesired& plan, const FileObserved& state);

    // present -> absent. An already missing file is not an error.
    Result<void> destroy(const FileObserved& state);

    // A path change can't be applied in place
    static bool requires_replace(const FileDesired& plan, const FileObserved& state);

private:
    RemoteClient& client_;

    Result<FileObserved> refresh(const std::string& path, bool ensure_dir);
};
