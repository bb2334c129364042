#pragma once

#include <string>
#include <vector>

#include "epoch_types.h"

namespace ForkOracle {

// Parse one fault directive. Unrecognized text comes back as FaultKind::None with the
// raw text kept. A delay that is not an integer is DelayValidation with delay_ms 0.
FaultDirective ParseFaultDirective(const std::string& raw);

std::vector<FaultDirective> ParseFaultDirectives(const std::vector<std::string>& raw);

// True when the record never reaches observers.
bool DropsRecord(const std::vector<FaultDirective>& faults);

// Value of the first delay_validation directive, 0 if none.
int64_t ValidationDelayMs(const std::vector<FaultDirective>& faults);

} // namespace ForkOracle
