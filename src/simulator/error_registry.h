#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace ForkOracle {

/**
 * Deduplicated set of protocol-detection error categories, kept in first-registration
 * order for reporting. Categories are never removed within a run.
 */
class ErrorRegistry {
public:
	// Returns true the first time a category is registered.
	bool Register(const std::string& category) {
		if (Contains(category)) return false;
		categories_.push_back(category);
		return true;
	}

	bool Contains(const std::string& category) const {
		return std::find(categories_.begin(), categories_.end(), category) != categories_.end();
	}

	const std::vector<std::string>& categories() const { return categories_; }
	bool empty() const { return categories_.empty(); }

private:
	std::vector<std::string> categories_;
};

} // namespace ForkOracle
