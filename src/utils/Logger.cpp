#include "utils/Logger.h"

namespace utils {

std::optional<Logger::Level> Logger::levelFromString(const std::string& name) {
	if (name == "error") {
		return ERROR;
	} else if (name == "warn") {
		return WARN;
	} else if (name == "info") {
		return INFO;
	} else if (name == "debug") {
		return DEBUG;
	}
	return std::nullopt;
}

} // namespace utils
