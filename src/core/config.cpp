#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>
#include <sstream>

namespace fs = std::filesystem;

const char* resource_type_name(ResourceType type) {
    return type == ResourceType::File ? "file" : "folder";
}

std::string ResourceDecl::key() const {
    return fmt::format("{}.{}", resource_type_name(type), name);
}

// ── Attribute parsing ─────────────────────────────────────────
// Missing key: Unknown (the host decides). Explicit null: Unset. Else Known.
template <typename T>
static Attr<T> parse_attr(const YAML::Node& entry, const char* key) {
    const YAML::Node node = entry[key];
    if (!node) return Attr<T>::unknown();
    if (node.IsNull()) return Attr<T>::unset();
    return Attr<T>::known(node.as<T>());
}

static OwnershipSpec parse_ownership(const YAML::Node& entry) {
    OwnershipSpec spec;
    spec.owner = parse_attr<int64_t>(entry, "owner");
    spec.owner_name = parse_attr<std::string>(entry, "owner_name");
    spec.group = parse_attr<int64_t>(entry, "group");
    spec.group_name = parse_attr<std::string>(entry, "group_name");
    spec.permissions = parse_attr<std::string>(entry, "permissions");
    return spec;
}

// "host:port" shorthand, as in `localhost:8022` or `[::1]:8022`. A bare
// IPv6 literal has several colons and is taken as the whole host. An
// explicit `port` key wins over the shorthand.
static void split_host_port(ConnectionConfig& conn, bool explicit_port) {
    std::string& host = conn.host;

    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated '[' in host");
        }
        std::string rest = host.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') throw std::invalid_argument("junk after ']' in host");
            if (!explicit_port) conn.port = std::stoi(rest.substr(1));
        }
        host = host.substr(1, close - 1);
        return;
    }

    auto colon = host.find(':');
    if (colon == std::string::npos || host.find(':', colon + 1) != std::string::npos) return;
    if (!explicit_port) conn.port = std::stoi(host.substr(colon + 1));
    host = host.substr(0, colon);
}

static ConnectionConfig parse_connection(const YAML::Node& node) {
    ConnectionConfig conn;
    conn.host = node["host"].as<std::string>("");
    conn.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    conn.username = node["username"].as<std::string>("");
    conn.sudo = node["sudo"].as<bool>(false);
    conn.max_sessions = node["max_sessions"].as<int>(DEFAULT_MAX_SESSIONS);
    conn.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);

    if (node["password"]) {
        conn.password = node["password"].as<std::string>();
    }
    if (node["password_env_var"]) {
        conn.password_env_var = node["password_env_var"].as<std::string>();
    }
    if (node["private_key"]) {
        conn.private_key = node["private_key"].as<std::string>();
    }
    if (node["private_key_path"]) {
        conn.private_key_path = node["private_key_path"].as<std::string>();
    }

    split_host_port(conn, node["port"].IsDefined());

    if (conn.username.empty()) {
        conn.username = platform::current_user();
    }
    return conn;
}

static Result<ResourceDecl> parse_resource(const YAML::Node& entry, size_t index) {
    ResourceDecl decl;
    std::string type = entry["type"].as<std::string>("");
    decl.name = entry["name"].as<std::string>("");

    if (type == "file") {
        decl.type = ResourceType::File;
    } else if (type == "folder") {
        decl.type = ResourceType::Folder;
    } else {
        return Result<ResourceDecl>::Err(fmt::format(
            "resources[{}]: type must be 'file' or 'folder', got '{}'", index, type));
    }

    if (decl.name.empty()) {
        return Result<ResourceDecl>::Err(fmt::format("resources[{}]: missing name", index));
    }

    std::string path = entry["path"].as<std::string>("");
    if (path.empty()) {
        return Result<ResourceDecl>::Err(fmt::format("{}: missing path", decl.key()));
    }

    if (decl.type == ResourceType::File) {
        if (!entry["content"] || entry["content"].IsNull()) {
            return Result<ResourceDecl>::Err(fmt::format("{}: missing content", decl.key()));
        }
        decl.file.path = path;
        decl.file.content = parse_attr<std::string>(entry, "content");
        decl.file.ensure_dir = parse_attr<bool>(entry, "ensure_dir");
        decl.file.ownership = parse_ownership(entry);
    } else {
        decl.folder.path = path;
        decl.folder.ownership = parse_ownership(entry);
    }

    return Result<ResourceDecl>::Ok(decl);
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::load(const fs::path& manifest_path) {
    std::ifstream in(manifest_path);
    if (!in) {
        return Result<Config>::Err("Cannot read manifest: " + manifest_path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    fs::path base = manifest_path.parent_path();
    if (base.empty()) base = fs::current_path();
    return parse(buf.str(), base);
}

Result<Config> Config::parse(const std::string& text, const fs::path& base_dir) {
    Config config;

    try {
        YAML::Node root = YAML::Load(text);

        if (!root["connection"] || !root["connection"].IsMap()) {
            return Result<Config>::Err("manifest: missing 'connection' block");
        }
        config.connection_ = parse_connection(root["connection"]);
        if (config.connection_.host.empty()) {
            return Result<Config>::Err("connection: missing host");
        }
        if (config.connection_.max_sessions < 1) {
            return Result<Config>::Err("connection: max_sessions must be at least 1");
        }

        fs::path state = root["state"].as<std::string>(DEFAULT_STATE_FILE);
        config.state_path_ = state.is_absolute() ? state : base_dir / state;

        std::set<std::string> seen;
        if (root["resources"] && root["resources"].IsSequence()) {
            size_t index = 0;
            for (const auto& entry : root["resources"]) {
                auto decl = parse_resource(entry, index++);
                if (decl.is_err()) return Result<Config>::Err(decl.error);
                if (!seen.insert(decl.value.key()).second) {
                    return Result<Config>::Err("duplicate resource: " + decl.value.key());
                }
                config.resources_.push_back(decl.value);
            }
        }
    } catch (const YAML::Exception& e) {
        Error err;
        err.kind = ErrorKind::Parse;
        err.message = "Failed to parse manifest: " + std::string(e.what());
        return Result<Config>::Err(err);
    } catch (const std::logic_error&) {
        // Malformed "host:port" or bracketed host
        return Result<Config>::Err("connection: invalid port in host");
    }

    return Result<Config>::Ok(config);
}

SessionTarget Config::session_target(StatusCallback warn) const {
    SessionTarget target;
    target.host = connection_.host;
    target.port = connection_.port;
    target.user = connection_.username;
    target.timeout = connection_.timeout;
    target.ssh_key_path = connection_.private_key_path;
    target.ssh_key_data = connection_.private_key;

    if (connection_.password) {
        target.password = *connection_.password;
    } else if (connection_.password_env_var) {
        const char* value = std::getenv(connection_.password_env_var->c_str());
        target.password = value ? value : "";
        if (target.password.empty() && warn) {
            warn("Empty password env var: " + *connection_.password_env_var);
        }
    }
    return target;
}
