#pragma once

#include <map>
#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <resources/attributes.hpp>

namespace fs = std::filesystem;

// Last observed state of every managed resource, keyed by resource name.
struct StoredState {
    std::map<std::string, FileObserved> files;
    std::map<std::string, FolderObserved> folders;

    bool empty() const { return files.empty() && folders.empty(); }
};

class StateStore {
public:
    explicit StateStore(fs::path state_path);

    // A missing file loads as empty state. A malformed one is a Parse error:
    // starting fresh would orphan every tracked resource.
    Result<StoredState> load() const;
    Result<void> save(const StoredState& state) const;

    const fs::path& path() const { return state_path_; }

private:
    fs::path state_path_;
};
