#include "edl/ReelName.h"
#include <algorithm>
#include <cctype>

namespace edl {

namespace {

std::string toUpper(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(),
		[](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return s;
}

bool isReelChar(unsigned char c) {
	return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace

std::string sanitizeReelName(const std::string& name, int maxLength) {
	std::string result;
	result.reserve(name.size());
	for (unsigned char c : name) {
		// One replacement per UTF-8 code point
		if ((c & 0xC0) == 0x80) {
			continue;
		}
		result += isReelChar(c) ? static_cast<char>(c) : '_';
	}

	if (maxLength > 0 && result.size() > static_cast<size_t>(maxLength)) {
		result.resize(maxLength);
	}

	if (result.empty()) {
		result = "AX";
	}
	return result;
}

bool isBlackReel(const std::string& reelName) {
	std::string upper = toUpper(reelName);
	return upper == "BLACK" || upper == "BL";
}

bool isBarsReel(const std::string& reelName) {
	return toUpper(reelName) == "BARS";
}

} // namespace edl
