#include "state_store.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

StateStore::StateStore(fs::path state_path) : state_path_(std::move(state_path)) {}

static ObservedAttributes load_attrs(const YAML::Node& n) {
    ObservedAttributes a;
    a.owner = n["owner"].as<int64_t>(0);
    a.group = n["group"].as<int64_t>(0);
    a.owner_name = n["owner_name"].as<std::string>("");
    a.group_name = n["group_name"].as<std::string>("");
    a.permissions = n["permissions"].as<std::string>("");
    return a;
}

static void emit_attrs(YAML::Emitter& out, const ObservedAttributes& a) {
    out << YAML::Key << "owner" << YAML::Value << a.owner;
    out << YAML::Key << "group" << YAML::Value << a.group;
    out << YAML::Key << "owner_name" << YAML::Value << a.owner_name;
    out << YAML::Key << "group_name" << YAML::Value << a.group_name;
    // Quoted so "0644" does not read back as an octal integer
    out << YAML::Key << "permissions" << YAML::Value << YAML::DoubleQuoted << a.permissions;
}

Result<StoredState> StateStore::load() const {
    StoredState state;

    if (!fs::exists(state_path_)) {
        return Result<StoredState>::Ok(state);
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());

        if (root["files"] && root["files"].IsMap()) {
            for (const auto& kv : root["files"]) {
                const YAML::Node& n = kv.second;
                FileObserved f;
                f.id = n["id"].as<std::string>("");
                f.path = n["path"].as<std::string>(f.id);
                f.exists = true;
                f.content = n["content"].as<std::string>("");
                f.ensure_dir = n["ensure_dir"].as<bool>(false);
                f.attrs = load_attrs(n);
                f.last_updated = n["last_updated"].as<std::string>("");
                state.files[kv.first.as<std::string>()] = f;
            }
        }

        if (root["folders"] && root["folders"].IsMap()) {
            for (const auto& kv : root["folders"]) {
                const YAML::Node& n = kv.second;
                FolderObserved d;
                d.id = n["id"].as<std::string>("");
                d.path = n["path"].as<std::string>(d.id);
                d.exists = true;
                d.attrs = load_attrs(n);
                d.last_updated = n["last_updated"].as<std::string>("");
                state.folders[kv.first.as<std::string>()] = d;
            }
        }
    } catch (const YAML::Exception& e) {
        Error err;
        err.kind = ErrorKind::Parse;
        err.message = "Corrupted state file " + state_path_.string() + ": " + e.what();
        return Result<StoredState>::Err(err);
    }

    return Result<StoredState>::Ok(state);
}

Result<void> StateStore::save(const StoredState& state) const {
    std::error_code ec;
    if (state_path_.has_parent_path()) {
        fs::create_directories(state_path_.parent_path(), ec);
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "files" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, f] : state.files) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << f.id;
        out << YAML::Key << "path" << YAML::Value << f.path;
        out << YAML::Key << "content" << YAML::Value << YAML::DoubleQuoted << f.content;
        out << YAML::Key << "ensure_dir" << YAML::Value << f.ensure_dir;
        emit_attrs(out, f.attrs);
        out << YAML::Key << "last_updated" << YAML::Value << f.last_updated;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "folders" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, d] : state.folders) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << d.id;
        out << YAML::Key << "path" << YAML::Value << d.path;
        emit_attrs(out, d.attrs);
        out << YAML::Key << "last_updated" << YAML::Value << d.last_updated;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream fout(state_path_.string());
    if (!fout) {
        return Result<void>::Err("Cannot write state file: " + state_path_.string());
    }
    fout << out.c_str() << "\n";
    if (!fout) {
        return Result<void>::Err("Failed writing state file: " + state_path_.string());
    }
    return Result<void>::Ok();
}
