/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/suite/CreditSuite.hpp"
#include "creditsim/suite/ScenarioRunner.hpp"
#include "common.hpp"
#include "json_util.hpp"

#include <CLI/CLI.hpp>

#include <fstream>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"CreditSimulator v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Credit suite config file")
        ->check(CLI::ExistingFile)
        ->required();

    fs::path eventLog;
    app.add_option("-e,--event-log", eventLog, "File receiving the credit facade events");

    fs::path report;
    app.add_option("-o,--output", report, "File receiving the scenario report");

    bool debug{};
    app.add_flag("-d,--debug", debug, "Trace every state change to stdout");

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    auto suite = creditsim::suite::CreditSuite::fromConfig(config);
    if (debug) {
        suite->chain().setDebug(true);
    }
    if (!eventLog.empty()) {
        suite->attachEventLogger(eventLog);
    }

    creditsim::suite::ScenarioRunner runner{*suite};
    const auto result = runner.run();

    rapidjson::Document json;
    result.jsonSerialize(json);
    const creditsim::json::FormatOptions formatOptions{.indent = creditsim::json::IndentOptions{}};
    if (report.empty()) {
        fmt::print("{}\n", creditsim::json::json2str(json, formatOptions));
    } else {
        std::ofstream ofs{report};
        creditsim::json::dumpJson(json, ofs, formatOptions);
        fmt::print(" - report written to '{}'\n", report.c_str());
    }

    fmt::print(" - scenario finished after {} steps, exiting\n", result.stepsRun);

    return 0;
}

//-------------------------------------------------------------------------
