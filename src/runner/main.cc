#include <iostream>
#include <optional>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../common/configuration.h"
#include "../corpus/corpus_loader.h"
#include "result_writer.h"
#include "scenario_runner.h"

int main(int argc, char* argv[]) {
    // Initialize logging. stdout carries only envelopes.
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1;

    cxxopts::Options options("fork_oracle", "Deterministic epoch-fork conformance oracle");

    options.add_options()
        ("corpus", "Path to the scenario corpus", cxxopts::value<std::string>())
        ("scenario", "Run only this scenario_id", cxxopts::value<std::string>())
        ("stress", "Include scenarios tagged stress")
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("envelope_out", "Append every envelope to this JSONL file", cxxopts::value<std::string>())
        ("summary_out", "Write a run summary to this JSON file", cxxopts::value<std::string>())
        ("language", "Label for the envelope language field", cxxopts::value<std::string>())
        ("wall_time", "Add wall_time_ms to envelopes")
        ("j,workers", "Scenarios evaluated in parallel", cxxopts::value<int>())
        ("l,log_level", "Log level", cxxopts::value<int>())
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        std::cerr << options.help() << std::endl;
        return 1;
    }
    const cxxopts::ParseResult& arguments = *parsed;

    if (arguments.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    ForkOracle::Configuration& configuration = ForkOracle::Configuration::getInstance();
    if (arguments.count("config")) {
        const std::string config_path = arguments["config"].as<std::string>();
        if (!configuration.loadFromFile(config_path)) {
            LOG(ERROR) << "Failed to load configuration from " << config_path;
            for (const auto& err : configuration.getValidationErrors()) {
                LOG(ERROR) << "  " << err;
            }
            return 1;
        }
    }
    configuration.overrideFromCommandLine(arguments);
    if (!configuration.validate()) {
        for (const auto& err : configuration.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << err;
        }
        return 1;
    }

    const ForkOracle::OracleConfig& config = configuration.config();
    FLAGS_v = config.logging.level.get();

    const std::string corpus_path = configuration.getCorpusPath();
    nlohmann::json corpus;
    try {
        corpus = ForkOracle::LoadCorpusDocument(corpus_path);
    } catch (const ForkOracle::CorpusError& e) {
        LOG(ERROR) << "Failed to load corpus: " << e.what();
        return 1;
    }

    ForkOracle::RunOptions run_options;
    run_options.scenario_filter = configuration.getScenarioFilter();
    run_options.include_stress = config.corpus.include_stress.get();
    run_options.language = configuration.getLanguage();
    run_options.emit_wall_time = config.output.emit_wall_time.get();
    run_options.worker_threads = configuration.getWorkerThreads();

    ForkOracle::ScenarioRunner runner(run_options);
    ForkOracle::RunReport report = runner.Run(corpus);

    if (report.matched == 0) {
        LOG(ERROR) << "No scenarios matched"
                   << (run_options.scenario_filter.empty() ? "" : " " + run_options.scenario_filter);
        return 1;
    }

    ForkOracle::ResultWriter writer(config.output.envelope_path.get(),
                                    config.output.summary_path.get(),
                                    run_options.language);
    bool persisted = true;
    for (const auto& envelope : report.envelopes) {
        std::cout << ForkOracle::SerializeEnvelope(envelope) << "\n";
        persisted = writer.Record(envelope) && persisted;
    }
    std::cout.flush();
    persisted = writer.Finish() && persisted;

    LOG(INFO) << "Scenarios: " << report.matched << " passed: " << report.passed
              << " failed: " << report.failed << " structural faults: " << report.structural_faults
              << " skipped stress: " << report.skipped_stress;

    if (!persisted) {
        LOG(ERROR) << "Some results could not be persisted";
        return 1;
    }
    return report.ok() ? 0 : 1;
}
