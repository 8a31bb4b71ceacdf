#pragma once

#include <string>
#include <core/config.hpp>
#include <managers/reconcile_manager.hpp>
#include <managers/state_store.hpp>

// One-shot command driver: load the manifest and state, connect, run the
// reconciler, persist state. Each run_* returns the process exit code.
class RemotefsCLI {
public:
    int run_apply(const std::string& manifest);
    int run_refresh(const std::string& manifest);
    int run_destroy(const std::string& manifest);

private:
    enum class Mode { Apply, Refresh, Destroy };

    int run(Mode mode, const std::string& manifest);
    void print_report(const RunReport& report);
};
