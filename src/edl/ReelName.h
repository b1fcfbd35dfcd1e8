#pragma once

#include <string>

namespace edl {

// Maps every character outside [A-Za-z0-9_] to '_' and truncates to
// maxLength when it is positive. An empty result becomes "AX".
std::string sanitizeReelName(const std::string& name, int maxLength);

// BLACK/BL and BARS reels describe generated media rather than a source
bool isBlackReel(const std::string& reelName);
bool isBarsReel(const std::string& reelName);

} // namespace edl
