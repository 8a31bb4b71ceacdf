#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include <core/constants.hpp>
#include <resources/attributes.hpp>
#include <ssh/session.hpp>
#include "types.hpp"

namespace fs = std::filesystem;

struct ConnectionConfig {
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string username;                          // default: local user
    std::optional<std::string> password;
    std::optional<std::string> password_env_var;
    std::optional<std::string> private_key;        // PEM text, wins over the path
    std::optional<std::string> private_key_path;
    bool sudo = false;
    int max_sessions = DEFAULT_MAX_SESSIONS;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
};

enum class ResourceType { File, Folder };

const char* resource_type_name(ResourceType type);

// One declared resource. Only the member matching `type` is meaningful.
struct ResourceDecl {
    ResourceType type = ResourceType::File;
    std::string name;
    FileDesired file;
    FolderDesired folder;

    const std::string& path() const {
        return type == ResourceType::File ? file.path : folder.path;
    }
    std::string key() const;                       // "<type>.<name>"
};

class Config {
public:
    // Load a manifest file. Relative state paths resolve against its directory.
    static Result<Config> load(const fs::path& manifest_path);

    // Parse manifest text; `base_dir` anchors a relative state path.
    static Result<Config> parse(const std::string& text,
                                const fs::path& base_dir = fs::current_path());

    const ConnectionConfig& connection() const { return connection_; }
    const std::vector<ResourceDecl>& resources() const { return resources_; }
    const fs::path& state_path() const { return state_path_; }

    // Resolve credentials into a transport target. Reads password_env_var
    // from the environment; an empty variable only produces a warning.
    SessionTarget session_target(StatusCallback warn = nullptr) const;

private:
    ConnectionConfig connection_;
    std::vector<ResourceDecl> resources_;
    fs::path state_path_;
};
