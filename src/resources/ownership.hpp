#pragma once

#include <string>
#include <core/types.hpp>
#include <remote/remote_client.hpp>
#include "attributes.hpp"

// Apply owner, group and mode to a freshly created path. Owner and group
// each use their numeric id if known, else their name if known, else are
// left alone. Stops at the first failing command.
Result<void> apply_initial_ownership(RemoteClient& client, const std::string& path,
                                     const OwnershipSpec& plan);

// Apply only what differs from `prior`. For owner and group the id is
// compared first; the name is considered only when the id did not trigger
// a change.
Result<void> apply_ownership_changes(RemoteClient& client, const std::string& path,
                                     const OwnershipSpec& plan,
                                     const ObservedAttributes& prior);

// Read owner id, group id, owner name, group name and mode. Any failed
// lookup fails the whole read.
Result<ObservedAttributes> read_attributes(RemoteClient& client, const std::string& path);
