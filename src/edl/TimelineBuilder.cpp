#include "edl/TimelineBuilder.h"
#include "edl/ReelName.h"
#include "edl/Timecode.h"
#include "utils/Logger.h"
#include <algorithm>
#include <any>
#include <array>
#include <optional>
#include <stdexcept>

namespace edl {

namespace {

const std::string freezeFrameSuffix = " FF";

// Half a frame, absorbs rounding in record timecodes
constexpr double gapThreshold = 0.5;

void appendChild(otio::Composition* parent, otio::Composable* child) {
	otio::ErrorStatus status;
	parent->append_child(child, &status);
	if (otio::is_error(status)) {
		throw std::runtime_error("Failed to append to '" + parent->name() + "': " + status.full_description);
	}
}

otio::AnyVector toAnyVector(const std::array<double, 3>& values) {
	otio::AnyVector result;
	for (double value : values) {
		result.push_back(std::any(value));
	}
	return result;
}

} // namespace

TimelineBuilder::TimelineBuilder(double rate)
	: rate(rate) {
}

TimelinePtr TimelineBuilder::build(const std::vector<Event>& events, const std::string& title) const {
	TimelinePtr result(new otio::Timeline(title));

	// Group by identifier, ordered by first appearance
	std::vector<std::pair<std::string, std::vector<const Event*>>> groups;
	for (const auto& event : events) {
		auto it = std::find_if(groups.begin(), groups.end(),
			[&](const auto& group) { return group.first == event.trackId; });
		if (it == groups.end()) {
			groups.emplace_back(event.trackId, std::vector<const Event*>{&event});
		} else {
			it->second.push_back(&event);
		}
	}

	for (const auto& [trackId, trackEvents] : groups) {
		Retainer<otio::Track> track = buildTrack(trackId, trackEvents);
		appendChild(result->tracks(), track);
	}

	utils::Logger::debug("Built {} tracks from {} events", groups.size(), events.size());
	return result;
}

Retainer<otio::Track> TimelineBuilder::buildTrack(const std::string& trackId, const std::vector<const Event*>& events) const {
	std::string kind = otio::Track::Kind::video;
	if (!events.empty() && isAudioTrack(events.front()->trackType)) {
		kind = otio::Track::Kind::audio;
	}

	Retainer<otio::Track> track(new otio::Track(trackId, std::nullopt, kind));
	std::optional<otio::RationalTime> lastRecordOut;

	for (const Event* event : events) {
		EventTimes times = convertTimes(*event);

		if (lastRecordOut) {
			otio::RationalTime gap = times.recordIn - *lastRecordOut;
			if (gap.value() > gapThreshold) {
				Retainer<otio::Gap> filler(new otio::Gap(gap));
				appendChild(track, filler);
			}
		}

		otio::TimeRange sourceRange = otio::TimeRange::range_from_start_end_time(times.sourceIn, times.sourceOut);

		if (hasTransition(*event)) {
			Retainer<otio::Transition> transition = makeTransition(*event);
			appendChild(track, transition);
		}
		Retainer<otio::Clip> clip = makeClip(*event, sourceRange);
		appendChild(track, clip);

		lastRecordOut = times.recordOut;
	}

	return track;
}

TimelineBuilder::EventTimes TimelineBuilder::convertTimes(const Event& event) const {
	return {
		convertField(event, "source in", event.sourceIn),
		convertField(event, "source out", event.sourceOut),
		convertField(event, "record in", event.recordIn),
		convertField(event, "record out", event.recordOut)
	};
}

otio::RationalTime TimelineBuilder::convertField(const Event& event, const std::string& field, const std::string& value) const {
	try {
		return Timecode::fromTimecode(value, rate);
	} catch (const TimecodeError& e) {
		throw ParseError(event.line, "invalid " + field + " timecode '" + value + "': " + e.what());
	}
}

Retainer<otio::Clip> TimelineBuilder::makeClip(const Event& event, const otio::TimeRange& sourceRange) const {
	Retainer<otio::MediaReference> reference = makeMediaReference(event, sourceRange);
	Retainer<otio::Clip> clip(new otio::Clip(resolveClipName(event), reference, sourceRange));

	addEffects(event, clip);
	addMarkers(event, clip);
	addMetadata(event, clip->metadata());
	return clip;
}

Retainer<otio::MediaReference> TimelineBuilder::makeMediaReference(const Event& event, const otio::TimeRange& sourceRange) const {
	if (isBlackReel(event.reelName)) {
		return Retainer<otio::MediaReference>(new otio::GeneratorReference(
			GeneratorKind::Black, GeneratorKind::Black, sourceRange));
	}
	if (isBarsReel(event.reelName)) {
		return Retainer<otio::MediaReference>(new otio::GeneratorReference(
			GeneratorKind::SMPTEBars, GeneratorKind::SMPTEBars, sourceRange));
	}

	std::string target = event.filePath.empty() ? event.reelName : event.filePath;
	auto* reference = new otio::ExternalReference(target, sourceRange);
	reference->set_name(target);
	return Retainer<otio::MediaReference>(reference);
}

std::string TimelineBuilder::resolveClipName(const Event& event) const {
	std::string name = event.clipName.empty() ? event.reelName : event.clipName;

	if (event.freezeFrame && name.size() >= freezeFrameSuffix.size() &&
		name.compare(name.size() - freezeFrameSuffix.size(), freezeFrameSuffix.size(), freezeFrameSuffix) == 0) {
		name.resize(name.size() - freezeFrameSuffix.size());
	}
	return name;
}

void TimelineBuilder::addEffects(const Event& event, otio::Clip* clip) const {
	if (event.speedEffect) {
		// M2 speed is frames per second; the warp wants a multiplier
		clip->effects().push_back(new otio::LinearTimeWarp(
			event.speedEffect->name, "", event.speedEffect->speed / rate));
	}

	if (event.freezeFrame) {
		clip->effects().push_back(new otio::FreezeFrame());
	}
}

void TimelineBuilder::addMarkers(const Event& event, otio::Clip* clip) const {
	for (const auto& locator : event.markers) {
		otio::RationalTime position;
		try {
			position = Timecode::fromTimecode(locator.timecode, rate);
		} catch (const TimecodeError& e) {
			utils::Logger::debug("Dropping locator on event {}: {}", event.eventNumber, e.what());
			continue;
		}

		auto* marker = new otio::Marker(locator.comment,
			otio::TimeRange(position, otio::RationalTime(0.0, rate)), locator.color);
		marker->set_comment(locator.comment);
		if (!locator.color.empty()) {
			marker->metadata()["color"] = locator.color;
		}
		clip->markers().push_back(marker);
	}
}

void TimelineBuilder::addMetadata(const Event& event, otio::AnyDictionary& metadata) const {
	if (event.colorDecision) {
		const auto& decision = *event.colorDecision;
		otio::AnyDictionary cdl;
		cdl["slope"] = toAnyVector(decision.slope);
		cdl["offset"] = toAnyVector(decision.offset);
		cdl["power"] = toAnyVector(decision.power);
		cdl["saturation"] = decision.saturation;
		metadata["cdl"] = cdl;
	}
	if (!event.wipeCode.empty()) {
		metadata["wipe_code"] = event.wipeCode;
	}
	if (!event.comment.empty()) {
		metadata["comment"] = event.comment;
	}
}

bool TimelineBuilder::hasTransition(const Event& event) {
	return (event.editType == EditType::Dissolve || event.editType == EditType::Wipe) &&
		event.transitionDuration > 0;
}

Retainer<otio::Transition> TimelineBuilder::makeTransition(const Event& event) const {
	otio::RationalTime inOffset(0.0, rate);
	otio::RationalTime outOffset(static_cast<double>(event.transitionDuration), rate);

	if (event.editType == EditType::Wipe) {
		std::string name = event.wipeCode.empty() ? DefaultWipeName : event.wipeCode;
		return Retainer<otio::Transition>(new otio::Transition(
			name, otio::Transition::Type::Custom, inOffset, outOffset));
	}

	return Retainer<otio::Transition>(new otio::Transition(
		"", otio::Transition::Type::SMPTE_Dissolve, inOffset, outOffset));
}

} // namespace edl
