#include "result_writer.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>
#include <glog/logging.h>

#include "../common/config.h"

namespace fs = std::filesystem;

namespace ForkOracle {

ResultWriter::ResultWriter(std::string envelope_path, std::string summary_path, std::string language)
    : envelope_path_(std::move(envelope_path)),
      summary_path_(std::move(summary_path)),
      language_(std::move(language)) {
    if (!envelope_path_.empty()) {
        LOG(INFO) << "Appending envelopes to " << envelope_path_;
    }
}

ResultWriter::~ResultWriter() {
    if (!finished_) {
        Finish();
    }
}

bool ResultWriter::EnsureParentDirectory(const std::string& path) const {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    try {
        fs::create_directories(parent);
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create result directory: " << e.what();
        return false;
    }
    return true;
}

bool ResultWriter::Record(const ResultEnvelope& envelope) {
    recorded_.push_back(envelope);
    if (envelope_path_.empty()) {
        return true;
    }
    if (!EnsureParentDirectory(envelope_path_)) {
        return false;
    }

    std::ofstream file(envelope_path_, std::ios::app);
    if (!file.is_open()) {
        LOG(ERROR) << "Could not open envelope file: " << envelope_path_ << " : " << strerror(errno);
        return false;
    }
    file << SerializeEnvelope(envelope) << "\n";
    if (!file) {
        LOG(ERROR) << "Failed to append envelope for " << envelope.scenario_id << " to " << envelope_path_;
        return false;
    }
    return true;
}

nlohmann::json ResultWriter::BuildSummary() const {
    nlohmann::json scenarios = nlohmann::json::array();
    for (const auto& env : recorded_) {
        scenarios.push_back(nlohmann::json{
            {"scenario_id", env.scenario_id},
            {"status", env.status},
            {"detection", env.detection},
            {"detection_ms", OptionalToJson(env.detection_ms)},
            {"reconciliation_ms", OptionalToJson(env.reconciliation_ms)},
            {"winning_epoch_id", OptionalToJson(env.winning_epoch_id)},
            {"winning_hash", OptionalToJson(env.winning_hash)},
            {"messages_dropped", env.messages_dropped},
            {"wall_time_ms", OptionalToJson(env.wall_time_ms)},
            {"notes", env.notes},
        });
    }

    const char* run_id = std::getenv(kRunIdEnv);
    return nlohmann::json{
        {"language", language_},
        {"run_id", run_id ? nlohmann::json(run_id) : nlohmann::json(nullptr)},
        {"scenarios", scenarios},
    };
}

bool ResultWriter::Finish() {
    finished_ = true;
    if (summary_path_.empty()) {
        return true;
    }
    if (!EnsureParentDirectory(summary_path_)) {
        return false;
    }

    std::ofstream file(summary_path_, std::ios::trunc);
    if (!file.is_open()) {
        LOG(ERROR) << "Could not open summary file: " << summary_path_ << " : " << strerror(errno);
        return false;
    }
    file << BuildSummary().dump(2) << "\n";
    if (!file) {
        LOG(ERROR) << "Failed to write summary to " << summary_path_;
        return false;
    }
    LOG(INFO) << "Wrote summary of " << recorded_.size() << " scenarios to " << summary_path_;
    return true;
}

} // namespace ForkOracle
