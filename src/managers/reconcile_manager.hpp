#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <remote/remote_client.hpp>
#include "state_store.hpp"

enum class Action { Created, Replaced, Updated, Refreshed, Gone, Deleted, Failed };

const char* action_name(Action action);

struct ResourceOutcome {
    std::string key;                // "<type>.<name>"
    Action action = Action::Failed;
    Error error;                    // set when action == Failed
};

struct RunReport {
    std::vector<ResourceOutcome> outcomes;

    bool ok() const;
    int failures() const;
};

// Drives the resource reconcilers against a manifest and the stored state.
// Resources run concurrently on up to pool-capacity worker threads; the
// client's channel pool bounds how many remote commands are in flight.
// Workers write outcomes into `state` under a mutex as each resource
// finishes, and every call returns only after all workers have joined.
class ReconcileManager {
public:
    explicit ReconcileManager(RemoteClient& client);

    // Converge every declared resource, then delete tracked ones that are
    // no longer declared.
    RunReport apply(const Config& config, StoredState& state, StatusCallback cb = nullptr);

    // Re-read every tracked resource. Vanished ones are dropped from state.
    RunReport refresh(StoredState& state, StatusCallback cb = nullptr);

    // Delete every tracked resource.
    RunReport destroy(StoredState& state, StatusCallback cb = nullptr);

private:
    RemoteClient& client_;
};
