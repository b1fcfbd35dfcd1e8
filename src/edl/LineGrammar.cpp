#include "edl/LineGrammar.h"
#include <boost/regex.hpp>

namespace edl {

namespace {

// EVENT# REEL TRACK EDIT_TYPE [TRANSITION_DURATION]
const boost::regex eventHeaderPattern(
	R"(^\s*(\d+)\s+(\S+)\s+(V|AA|A[1-4]?)\s+(C|D|W\d{3}|KB|K)\s*(\d+)?)");

// SOURCE_IN SOURCE_OUT RECORD_IN RECORD_OUT
const boost::regex timecodeLinePattern(
	R"(^\s*(\d{2}:\d{2}:\d{2}[;:]\d{2})\s+(\d{2}:\d{2}:\d{2}[;:]\d{2})\s+(\d{2}:\d{2}:\d{2}[;:]\d{2})\s+(\d{2}:\d{2}:\d{2}[;:]\d{2}))");

// M2 NAME SPEED TIMECODE
const boost::regex speedEffectPattern(
	R"(^M2\s+(\S+)\s+(-?[0-9.]+)\s+(\d{2}:\d{2}:\d{2}[:;]\d{2}))");

// * LOC: TIMECODE COLOR, the comment is whatever follows the match
const boost::regex locatorPattern(
	R"(^\*\s*LOC:\s+(\d{2}:\d{2}:\d{2}[:;]\d{2})\s+(\w*)(?=\s|$))");

const std::string decimal = R"(([-+]?[\d.]+))";
const std::string triple = R"(\(\s*)" + decimal + R"([,\s]+)" + decimal + R"([,\s]+)" + decimal + R"(\s*\))";

const boost::regex ascSopPattern("ASC_SOP\\s*" + triple + "\\s*" + triple + "\\s*" + triple);

const boost::regex ascSatPattern(R"(ASC_SAT\s+([-+]?[\d.]+))");

bool startsWith(const std::string& s, const std::string& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
	return s.size() >= suffix.size() &&
		s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TrackType trackTypeFromId(const std::string& id) {
	if (id == "V") return TrackType::Video;
	if (id == "A1") return TrackType::Audio1;
	if (id == "A2") return TrackType::Audio2;
	if (id == "A3") return TrackType::Audio3;
	if (id == "A4") return TrackType::Audio4;
	return TrackType::Audio;
}

EditType editTypeFromToken(const std::string& token) {
	if (token == "C") return EditType::Cut;
	if (token == "D") return EditType::Dissolve;
	if (token == "KB") return EditType::KeyBackground;
	if (token == "K") return EditType::Key;
	return EditType::Wipe;
}

} // namespace

std::string LineGrammar::trim(const std::string& s) {
	static const char* whitespace = " \t\r\n\f\v";
	auto begin = s.find_first_not_of(whitespace);
	if (begin == std::string::npos) {
		return "";
	}
	auto end = s.find_last_not_of(whitespace);
	return s.substr(begin, end - begin + 1);
}

LineKind LineGrammar::classify(const std::string& line) {
	std::string trimmed = trim(line);
	if (trimmed.empty()) {
		return LineKind::Blank;
	}
	if (startsWith(trimmed, "TITLE:")) {
		return LineKind::Title;
	}
	if (startsWith(trimmed, "FCM:")) {
		return LineKind::FrameCountMode;
	}
	if (boost::regex_search(line, eventHeaderPattern)) {
		return LineKind::EventHeader;
	}
	if (startsWith(trimmed, "M2")) {
		return LineKind::Speed;
	}
	if (startsWith(trimmed, "*")) {
		return LineKind::Comment;
	}
	return LineKind::Other;
}

std::optional<std::string> LineGrammar::matchTitle(const std::string& line) {
	std::string trimmed = trim(line);
	if (!startsWith(trimmed, "TITLE:")) {
		return std::nullopt;
	}
	return trim(trimmed.substr(6));
}

std::optional<std::string> LineGrammar::matchFrameCountMode(const std::string& line) {
	std::string trimmed = trim(line);
	if (!startsWith(trimmed, "FCM:")) {
		return std::nullopt;
	}
	return trim(trimmed.substr(4));
}

std::optional<EventHeader> LineGrammar::matchEventHeader(const std::string& line) {
	boost::smatch m;
	if (!boost::regex_search(line, m, eventHeaderPattern)) {
		return std::nullopt;
	}

	EventHeader header;
	try {
		header.eventNumber = std::stoi(m[1].str());
		if (m[5].matched) {
			header.transitionDuration = std::stoi(m[5].str());
		}
	} catch (const std::out_of_range&) {
		return std::nullopt;
	}

	header.reelName = m[2].str();
	header.trackId = m[3].str();
	header.trackType = trackTypeFromId(header.trackId);

	std::string edit = m[4].str();
	header.editType = editTypeFromToken(edit);
	if (header.editType == EditType::Wipe) {
		header.wipeCode = edit;
	}
	return header;
}

std::optional<TimecodeLine> LineGrammar::matchTimecodeLine(const std::string& line) {
	boost::smatch m;
	if (!boost::regex_search(line, m, timecodeLinePattern)) {
		return std::nullopt;
	}
	return TimecodeLine{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
}

std::optional<SpeedEffect> LineGrammar::matchSpeedEffect(const std::string& line) {
	std::string trimmed = trim(line);
	boost::smatch m;
	if (!boost::regex_search(trimmed, m, speedEffectPattern)) {
		return std::nullopt;
	}

	auto speed = parseNumber(m[2].str());
	if (!speed) {
		return std::nullopt;
	}
	return SpeedEffect{m[1].str(), *speed, m[3].str()};
}

std::optional<std::string> LineGrammar::matchCommentKeyword(const std::string& comment, const std::string& keyword) {
	if (!startsWith(comment, "*")) {
		return std::nullopt;
	}
	// "*KEYWORD" and "* KEYWORD" are both written by editors
	std::string body = comment.substr(1);
	if (startsWith(body, " ")) {
		body = body.substr(1);
	}
	if (!startsWith(body, keyword)) {
		return std::nullopt;
	}
	return trim(body.substr(keyword.size()));
}

std::optional<std::string> LineGrammar::matchClipName(const std::string& comment) {
	return matchCommentKeyword(comment, "FROM CLIP NAME:");
}

std::optional<std::string> LineGrammar::matchAvidFilePath(const std::string& comment) {
	return matchCommentKeyword(comment, "FROM CLIP:");
}

std::optional<std::string> LineGrammar::matchNucodaFilePath(const std::string& comment) {
	return matchCommentKeyword(comment, "FROM FILE:");
}

bool LineGrammar::matchFreezeFrame(const std::string& comment) {
	return matchCommentKeyword(comment, "FREEZE FRAME").has_value() || endsWith(comment, " FF");
}

std::optional<Marker> LineGrammar::matchLocator(const std::string& comment) {
	boost::smatch m;
	if (!boost::regex_search(comment, m, locatorPattern)) {
		return std::nullopt;
	}
	return Marker{m[1].str(), m[2].str(), trim(m.suffix().str())};
}

std::optional<SopValues> LineGrammar::matchAscSop(const std::string& comment) {
	boost::smatch m;
	if (!boost::regex_search(comment, m, ascSopPattern)) {
		return std::nullopt;
	}

	SopValues values;
	for (int i = 0; i < 3; ++i) {
		auto slope = parseNumber(m[1 + i].str());
		auto offset = parseNumber(m[4 + i].str());
		auto power = parseNumber(m[7 + i].str());
		if (!slope || !offset || !power) {
			return std::nullopt;
		}
		values.slope[i] = *slope;
		values.offset[i] = *offset;
		values.power[i] = *power;
	}
	return values;
}

std::optional<double> LineGrammar::matchAscSat(const std::string& comment) {
	boost::smatch m;
	if (!boost::regex_search(comment, m, ascSatPattern)) {
		return std::nullopt;
	}
	return parseNumber(m[1].str());
}

std::optional<double> LineGrammar::parseNumber(const std::string& text) {
	try {
		size_t pos = 0;
		double value = std::stod(text, &pos);
		if (pos != text.size()) {
			return std::nullopt;
		}
		return value;
	} catch (const std::invalid_argument&) {
		return std::nullopt;
	} catch (const std::out_of_range&) {
		return std::nullopt;
	}
}

} // namespace edl
