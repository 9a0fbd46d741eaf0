/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/scenario/ScenarioRunner.hpp"
#include "common.hpp"
#include "json_util.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"Pooled lending ledger v1.0"};

    fs::path scenario;
    app.add_option("-f,--scenario-file", scenario, "Scenario config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path stateFile;
    app.add_option("-o,--state-file", stateFile, "Where to dump the final state as Json");

    fs::path eventLog;
    app.add_option("-l,--event-log", eventLog, "Where to write the CSV operation log");

    std::string logLevel{"info"};
    app.add_option("--log-level", logLevel, "Diagnostics verbosity")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "error", "critical", "off"}));

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    spdlog::set_level(spdlog::level::from_str(logLevel));

    auto runner = lendpool::scenario::ScenarioRunner::fromFile(scenario);
    if (!eventLog.empty()) {
        runner->attachOperationLogger(eventLog);
    }

    const auto outcomes = runner->run();
    for (const auto& outcome : outcomes) {
        fmt::print(" - {}\n", outcome);
    }

    if (!stateFile.empty()) {
        rapidjson::Document json;
        runner->jsonSerialize(json);
        std::ofstream ofs{stateFile};
        lendpool::json::dumpJson(json, ofs, {.indent = lendpool::json::IndentOptions{}});
        fmt::print(" - state written to '{}'\n", stateFile.c_str());
    }

    fmt::print(" - {} steps replayed, exiting\n", outcomes.size());

    return 0;
}

//-------------------------------------------------------------------------
