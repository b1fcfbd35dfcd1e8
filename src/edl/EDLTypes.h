#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace edl {

// Decode-time structural violation, tied to a 1-based physical line
class ParseError : public std::runtime_error {
public:
	ParseError(int line, const std::string& message)
		: std::runtime_error("line " + std::to_string(line) + ": " + message)
		, line_(line)
		, message_(message) {}

	int line() const { return line_; }
	const std::string& message() const { return message_; }

private:
	int line_;
	std::string message_;
};

// Encode-time structural violation
class EncodeError : public std::runtime_error {
public:
	explicit EncodeError(const std::string& message)
		: std::runtime_error("encode error: " + message)
		, message_(message) {}

	const std::string& message() const { return message_; }

private:
	std::string message_;
};

// Timecode string could not be converted at the requested rate
class TimecodeError : public std::runtime_error {
public:
	explicit TimecodeError(const std::string& message)
		: std::runtime_error("Invalid timecode: " + message) {}
};

enum class EditType {
	Cut,            // C
	Dissolve,       // D
	Wipe,           // W###
	KeyBackground,  // KB
	Key             // K
};

enum class TrackType {
	Video,   // V
	Audio,   // A, AA
	Audio1,
	Audio2,
	Audio3,
	Audio4
};

inline bool isVideoTrack(TrackType type) {
	return type == TrackType::Video;
}

inline bool isAudioTrack(TrackType type) {
	return !isVideoTrack(type);
}

std::string toString(EditType type);
std::string toString(TrackType type);

// M2 motion effect
struct SpeedEffect {
	std::string name;       // Effect name/reel
	double speed = 0.0;     // Frames per second at the new rate
	std::string timecode;   // Source timecode the speed applies from
};

// Locator attached to an event
struct Marker {
	std::string timecode;
	std::string color;      // May be empty
	std::string comment;
};

// ASC CDL coefficients, neutral until a component is seen
struct ColorDecision {
	std::array<double, 3> slope = {1.0, 1.0, 1.0};
	std::array<double, 3> offset = {0.0, 0.0, 0.0};
	std::array<double, 3> power = {1.0, 1.0, 1.0};
	double saturation = 1.0;
};

struct Event {
	int eventNumber = 0;
	std::string reelName;
	TrackType trackType = TrackType::Video;
	std::string trackId;               // Identifier as written, e.g. "A2"
	EditType editType = EditType::Cut;

	std::string sourceIn;              // HH:MM:SS:FF
	std::string sourceOut;
	std::string recordIn;
	std::string recordOut;

	int transitionDuration = 0;        // Frames, dissolves and wipes only
	std::string wipeCode;              // e.g. "W001"
	std::string clipName;
	std::string filePath;              // From FROM CLIP / FROM FILE comments
	bool freezeFrame = false;
	std::optional<SpeedEffect> speedEffect;
	std::vector<Marker> markers;
	std::optional<ColorDecision> colorDecision;
	std::string comment;               // Remaining comment lines, newline joined

	int line = 0;                      // Physical line of the event header
};

enum class OutputStyle {
	Avid,
	Nucoda,
	Premiere
};

std::optional<OutputStyle> outputStyleFromString(const std::string& style);

constexpr int DefaultReelNameLength = 8;

} // namespace edl
