#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../evaluation/result_envelope.h"

namespace ForkOracle {

/**
 * Class for persisting scenario envelopes and the run summary
 */
class ResultWriter {
public:
    /**
     * Constructor
     * @param envelope_path JSONL file every envelope is appended to; empty disables it
     * @param summary_path Summary JSON file; empty disables it
     * @param language Label recorded in the summary
     */
    ResultWriter(std::string envelope_path, std::string summary_path, std::string language);

    /**
     * Destructor - writes the summary if Finish() was not called
     */
    ~ResultWriter();

    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    /**
     * Records one envelope and appends it to the JSONL file
     * @param envelope Envelope of a finished scenario
     * @return false if the JSONL append failed
     */
    bool Record(const ResultEnvelope& envelope);

    /**
     * Writes the summary file
     * @return false if the summary could not be written
     */
    bool Finish();

    /**
     * Builds the summary document for the recorded envelopes
     * @return {language, run_id, scenarios: [...]}
     */
    nlohmann::json BuildSummary() const;

private:
    bool EnsureParentDirectory(const std::string& path) const;

    std::string envelope_path_;
    std::string summary_path_;
    std::string language_;
    bool finished_ = false;
    std::vector<ResultEnvelope> recorded_;
};

} // namespace ForkOracle
