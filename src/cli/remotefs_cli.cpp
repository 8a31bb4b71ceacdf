#include "remotefs_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>

int RemotefsCLI::run_apply(const std::string& manifest) {
    return run(Mode::Apply, manifest);
}

int RemotefsCLI::run_refresh(const std::string& manifest) {
    return run(Mode::Refresh, manifest);
}

int RemotefsCLI::run_destroy(const std::string& manifest) {
    return run(Mode::Destroy, manifest);
}

int RemotefsCLI::run(Mode mode, const std::string& manifest) {
    auto config = Config::load(manifest);
    if (config.is_err()) {
        std::cout << theme::fail(config.error.to_string());
        return 1;
    }

    StateStore store(config.value.state_path());
    auto loaded = store.load();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error.to_string());
        return 1;
    }
    StoredState state = loaded.value;

    if (mode != Mode::Apply && state.empty()) {
        std::cout << theme::info("No tracked resources in " + store.path().string());
        return 0;
    }

    const auto& conn = config.value.connection();
    auto status = [](const std::string& msg) { std::cout << theme::step(msg); };
    auto warn = [](const std::string& msg) { std::cout << theme::info(theme::yellow(msg)); };

    std::cout << theme::section(fmt::format("{}@{}:{}", conn.username, conn.host, conn.port));

    auto client = RemoteClient::connect(config.value.session_target(warn), conn.sudo,
                                        conn.max_sessions, status);
    if (client.is_err()) {
        std::cout << theme::fail(client.error.to_string());
        return 1;
    }

    ReconcileManager manager(*client.value);
    auto progress = [](const std::string& msg) { std::cout << theme::step(msg) << std::flush; };

    RunReport report;
    switch (mode) {
        case Mode::Apply:   report = manager.apply(config.value, state, progress); break;
        case Mode::Refresh: report = manager.refresh(state, progress); break;
        case Mode::Destroy: report = manager.destroy(state, progress); break;
    }

    client.value->close();

    // Successful resources are persisted even when others failed
    auto saved = store.save(state);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error.to_string());
        return 1;
    }

    print_report(report);
    return report.ok() ? 0 : 1;
}

void RemotefsCLI::print_report(const RunReport& report) {
    std::cout << theme::section("Summary");
    for (const auto& o : report.outcomes) {
        if (o.action == Action::Failed) {
            std::cout << theme::fail(fmt::format("{}\n{}", o.key, o.error.to_string()));
        } else {
            std::cout << theme::ok(fmt::format("{} {}", o.key, theme::dim(action_name(o.action))));
        }
    }
    if (report.outcomes.empty()) {
        std::cout << theme::info("Nothing to do");
    }
    remotefs_log(fmt::format("run finished: {} outcome(s), {} failure(s)",
                             report.outcomes.size(), report.failures()));
}
