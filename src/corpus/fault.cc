#include "fault.h"

#include <cstring>

#include <glog/logging.h>

#include "../common/config.h"

namespace ForkOracle {

namespace {

bool ParseStrictInt64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed, 10);
        if (consumed != text.size()) return false;
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

FaultDirective ParseFaultDirective(const std::string& raw) {
    FaultDirective directive;
    directive.raw = raw;

    if (raw == kFaultDropNextEare) {
        directive.kind = FaultKind::DropNextEare;
        return directive;
    }

    const size_t prefix_len = std::strlen(kFaultDelayValidationPrefix);
    if (raw.compare(0, prefix_len, kFaultDelayValidationPrefix) == 0) {
        // A malformed delay still claims the event's delay slot, with 0 ms.
        directive.kind = FaultKind::DelayValidation;
        int64_t delay = 0;
        if (ParseStrictInt64(raw.substr(prefix_len), delay)) {
            directive.delay_ms = delay;
        } else {
            LOG(WARNING) << "Fault directive has non-integer delay, using 0: " << raw;
        }
        return directive;
    }

    LOG(WARNING) << "Ignoring unknown fault directive: " << raw;
    return directive;
}

std::vector<FaultDirective> ParseFaultDirectives(const std::vector<std::string>& raw) {
    std::vector<FaultDirective> faults;
    faults.reserve(raw.size());
    for (const auto& r : raw) {
        faults.push_back(ParseFaultDirective(r));
    }
    return faults;
}

bool DropsRecord(const std::vector<FaultDirective>& faults) {
    for (const auto& f : faults) {
        if (f.kind == FaultKind::DropNextEare) return true;
    }
    return false;
}

int64_t ValidationDelayMs(const std::vector<FaultDirective>& faults) {
    for (const auto& f : faults) {
        if (f.kind == FaultKind::DelayValidation) return f.delay_ms;
    }
    return 0;
}

} // namespace ForkOracle
