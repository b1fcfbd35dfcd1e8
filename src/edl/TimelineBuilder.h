#pragma once

#include "edl/EDLTypes.h"
#include "edl/TimelineTypes.h"
#include <string>
#include <vector>

namespace edl {

/**
 * Turns flushed events into OpenTimelineIO tracks.
 *
 * Events are grouped by track identifier; groups appear in the order of the
 * first event number seen for each. Within a group events keep input order.
 */
class TimelineBuilder {
public:
	explicit TimelineBuilder(double rate);

	/**
	 * @throws ParseError when a timecode cannot be converted at the rate
	 */
	TimelinePtr build(const std::vector<Event>& events, const std::string& title) const;

	Retainer<otio::Track> buildTrack(const std::string& trackId, const std::vector<const Event*>& events) const;

private:
	struct EventTimes {
		otio::RationalTime sourceIn;
		otio::RationalTime sourceOut;
		otio::RationalTime recordIn;
		otio::RationalTime recordOut;
	};

	EventTimes convertTimes(const Event& event) const;
	otio::RationalTime convertField(const Event& event, const std::string& field, const std::string& value) const;

	Retainer<otio::Clip> makeClip(const Event& event, const otio::TimeRange& sourceRange) const;
	Retainer<otio::MediaReference> makeMediaReference(const Event& event, const otio::TimeRange& sourceRange) const;
	std::string resolveClipName(const Event& event) const;
	void addEffects(const Event& event, otio::Clip* clip) const;
	void addMarkers(const Event& event, otio::Clip* clip) const;
	void addMetadata(const Event& event, otio::AnyDictionary& metadata) const;
	Retainer<otio::Transition> makeTransition(const Event& event) const;

	static bool hasTransition(const Event& event);

	double rate;
};

} // namespace edl
