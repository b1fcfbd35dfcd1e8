#include "edl/EDLTypes.h"

namespace edl {

std::string toString(EditType type) {
	switch (type) {
		case EditType::Cut: return "C";
		case EditType::Dissolve: return "D";
		case EditType::Wipe: return "W";
		case EditType::KeyBackground: return "KB";
		case EditType::Key: return "K";
	}
	return "C";
}

std::string toString(TrackType type) {
	switch (type) {
		case TrackType::Video: return "V";
		case TrackType::Audio: return "A";
		case TrackType::Audio1: return "A1";
		case TrackType::Audio2: return "A2";
		case TrackType::Audio3: return "A3";
		case TrackType::Audio4: return "A4";
	}
	return "V";
}

std::optional<OutputStyle> outputStyleFromString(const std::string& style) {
	if (style == "avid") {
		return OutputStyle::Avid;
	} else if (style == "nucoda") {
		return OutputStyle::Nucoda;
	} else if (style == "premiere") {
		return OutputStyle::Premiere;
	}
	return std::nullopt;
}

} // namespace edl
