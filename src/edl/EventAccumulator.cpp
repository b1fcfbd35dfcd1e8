#include "edl/EventAccumulator.h"
#include "edl/LineGrammar.h"
#include "utils/Logger.h"

namespace edl {

void EventAccumulator::accumulate(std::istream& input) {
	std::string line;
	while (readLine(input, line)) {
		switch (LineGrammar::classify(line)) {
			case LineKind::Blank:
				break;

			case LineKind::Title:
				title_ = LineGrammar::matchTitle(line).value_or("");
				break;

			case LineKind::FrameCountMode:
				// Captured only; timecodes are read the same way either way
				fcmMode_ = LineGrammar::matchFrameCountMode(line).value_or("");
				break;

			case LineKind::EventHeader:
				openEvent(line, input);
				break;

			case LineKind::Speed:
				if (auto* open = std::get_if<Accumulating>(&state_)) {
					applySpeedLine(open->event, line);
				}
				break;

			case LineKind::Comment:
				if (auto* open = std::get_if<Accumulating>(&state_)) {
					applyComment(open->event, LineGrammar::trim(line));
				}
				break;

			case LineKind::Other:
				break;
		}
	}

	flush();
}

bool EventAccumulator::readLine(std::istream& input, std::string& line) {
	if (!std::getline(input, line)) {
		return false;
	}
	++lineNumber_;
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	return true;
}

void EventAccumulator::openEvent(const std::string& headerLine, std::istream& input) {
	auto header = LineGrammar::matchEventHeader(headerLine);
	if (!header) {
		throw ParseError(lineNumber_, "malformed event header");
	}

	flush();

	Event event;
	event.eventNumber = header->eventNumber;
	event.reelName = header->reelName;
	event.trackId = header->trackId;
	event.trackType = header->trackType;
	event.editType = header->editType;
	event.wipeCode = header->wipeCode;
	event.transitionDuration = header->transitionDuration;
	event.line = lineNumber_;

	std::string tcLine;
	if (!readLine(input, tcLine)) {
		throw ParseError(lineNumber_ + 1, "expected timecode line after event, found end of input");
	}

	auto timecodes = LineGrammar::matchTimecodeLine(tcLine);
	if (!timecodes) {
		throw ParseError(lineNumber_, "expected timecode line after event");
	}

	event.sourceIn = timecodes->sourceIn;
	event.sourceOut = timecodes->sourceOut;
	event.recordIn = timecodes->recordIn;
	event.recordOut = timecodes->recordOut;

	state_ = Accumulating{std::move(event)};
}

void EventAccumulator::flush() {
	if (auto* open = std::get_if<Accumulating>(&state_)) {
		events_.push_back(std::move(open->event));
		state_ = Idle{};
	}
}

void EventAccumulator::applySpeedLine(Event& event, const std::string& line) {
	auto speed = LineGrammar::matchSpeedEffect(line);
	if (!speed) {
		utils::Logger::debug("Ignoring malformed M2 line {}: {}", lineNumber_, line);
		return;
	}
	event.speedEffect = *speed;
}

void EventAccumulator::applyComment(Event& event, const std::string& line) {
	if (auto name = LineGrammar::matchClipName(line)) {
		event.clipName = *name;
	} else if (auto avidPath = LineGrammar::matchAvidFilePath(line)) {
		event.filePath = *avidPath;
	} else if (auto nucodaPath = LineGrammar::matchNucodaFilePath(line)) {
		event.filePath = *nucodaPath;
	} else if (LineGrammar::matchFreezeFrame(line)) {
		event.freezeFrame = true;
	} else if (auto marker = LineGrammar::matchLocator(line)) {
		event.markers.push_back(*marker);
	} else if (auto sop = LineGrammar::matchAscSop(line)) {
		if (!event.colorDecision) {
			event.colorDecision = ColorDecision{};
		}
		event.colorDecision->slope = sop->slope;
		event.colorDecision->offset = sop->offset;
		event.colorDecision->power = sop->power;
	} else if (auto sat = LineGrammar::matchAscSat(line)) {
		if (!event.colorDecision) {
			event.colorDecision = ColorDecision{};
		}
		event.colorDecision->saturation = *sat;
	} else {
		if (!event.comment.empty()) {
			event.comment += "\n";
		}
		event.comment += line;
	}
}

} // namespace edl
