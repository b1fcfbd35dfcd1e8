#pragma once

#include "edl/EDLTypes.h"
#include <array>
#include <optional>
#include <string>

namespace edl {

// Physical line shapes, listed in classification priority
enum class LineKind {
	Blank,
	Title,           // TITLE: <string>
	FrameCountMode,  // FCM: DROP FRAME | NON-DROP FRAME
	EventHeader,     // 001  REEL  V  C  [duration]
	Speed,           // M2 <name> <speed> <timecode>
	Comment,         // * ...
	Other
};

struct EventHeader {
	int eventNumber = 0;
	std::string reelName;
	std::string trackId;             // As written: V, A, AA, A1..A4
	TrackType trackType = TrackType::Video;
	EditType editType = EditType::Cut;
	std::string wipeCode;            // Set for W### edits
	int transitionDuration = 0;      // 0 when the optional field is absent
};

struct TimecodeLine {
	std::string sourceIn;
	std::string sourceOut;
	std::string recordIn;
	std::string recordOut;
};

struct SopValues {
	std::array<double, 3> slope;
	std::array<double, 3> offset;
	std::array<double, 3> power;
};

/**
 * Regular expression grammar for single CMX 3600 lines. Every extractor takes
 * one physical line and returns nothing when the line does not have the
 * expected shape.
 */
class LineGrammar {
public:
	static std::string trim(const std::string& s);

	static LineKind classify(const std::string& line);

	// Value following "TITLE:" / "FCM:", trimmed
	static std::optional<std::string> matchTitle(const std::string& line);
	static std::optional<std::string> matchFrameCountMode(const std::string& line);

	static std::optional<EventHeader> matchEventHeader(const std::string& line);
	static std::optional<TimecodeLine> matchTimecodeLine(const std::string& line);

	// M2 lines with a non-numeric speed are rejected
	static std::optional<SpeedEffect> matchSpeedEffect(const std::string& line);

	// Comment extractors, applied to a trimmed line starting with '*'
	static std::optional<std::string> matchClipName(const std::string& comment);
	static std::optional<std::string> matchAvidFilePath(const std::string& comment);
	static std::optional<std::string> matchNucodaFilePath(const std::string& comment);
	static bool matchFreezeFrame(const std::string& comment);
	static std::optional<Marker> matchLocator(const std::string& comment);
	static std::optional<SopValues> matchAscSop(const std::string& comment);
	static std::optional<double> matchAscSat(const std::string& comment);

private:
	static std::optional<std::string> matchCommentKeyword(const std::string& comment, const std::string& keyword);
	static std::optional<double> parseNumber(const std::string& text);
};

} // namespace edl
