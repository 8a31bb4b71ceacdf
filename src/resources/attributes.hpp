#pragma once

#include <string>
#include <cstdint>
#include <core/attr.hpp>

// Requested owner/group/mode. When both an id and a name are known, the
// numeric id wins.
struct OwnershipSpec {
    Attr<int64_t> owner;
    Attr<std::string> owner_name;
    Attr<int64_t> group;
    Attr<std::string> group_name;
    Attr<std::string> permissions;     // octal, e.g. "0644"
};

// Owner/group/mode as measured on the remote host.
struct ObservedAttributes {
    int64_t owner = 0;
    int64_t group = 0;
    std::string owner_name;
    std::string group_name;
    std::string permissions;
};

struct FileDesired {
    std::string path;                  // identity; a change means replacement
    Attr<std::string> content;
    Attr<bool> ensure_dir;
    OwnershipSpec ownership;
};

struct FolderDesired {
    std::string path;
    OwnershipSpec ownership;
};

struct FileObserved {
    std::string id;                    // always equal to path
    std::string path;
    bool exists = false;
    std::string content;
    bool ensure_dir = false;
    ObservedAttributes attrs;
    std::string last_updated;
};

struct FolderObserved {
    std::string id;
    std::string path;
    bool exists = false;
    ObservedAttributes attrs;
    std::string last_updated;
};
