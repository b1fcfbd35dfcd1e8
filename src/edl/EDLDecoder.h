#pragma once

#include "edl/EDLTypes.h"
#include "edl/TimelineTypes.h"
#include <istream>
#include <string>

namespace edl {

// Reads CMX 3600 text into an OpenTimelineIO timeline
class EDLDecoder {
public:
	struct Config {
		double rate = 24.0;                   // Rate used to interpret every timecode
		bool ignoreTimecodeMismatch = false;  // Accepted, not consulted yet
	};

	EDLDecoder();
	explicit EDLDecoder(const Config& config);

	/**
	 * Decode a whole EDL.
	 * @throws ParseError on a missing timecode line or an unconvertible timecode
	 */
	TimelinePtr decode(std::istream& input);
	TimelinePtr decodeString(const std::string& text);
	TimelinePtr decodeFile(const std::string& filename);

	// Header values from the last decode
	const std::string& title() const { return title_; }
	const std::string& frameCountMode() const { return fcmMode_; }

	const Config& config() const { return config_; }

private:
	Config config_;
	std::string title_;
	std::string fcmMode_;
};

} // namespace edl
