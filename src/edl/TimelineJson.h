#pragma once

#include "edl/TimelineTypes.h"
#include <istream>
#include <stdexcept>
#include <string>

namespace edl {

class InvalidTimelineException : public std::runtime_error {
public:
	explicit InvalidTimelineException(const std::string& message)
		: std::runtime_error("Invalid timeline JSON: " + message) {}
};

// Reads and writes timelines through OpenTimelineIO's own JSON serializer
class TimelineJson {
public:
	/**
	 * @throws std::runtime_error if the file cannot be opened
	 * @throws InvalidTimelineException if it does not hold an OTIO timeline
	 */
	static TimelinePtr read(const std::string& filename);
	static TimelinePtr parse(const std::string& text);
	static TimelinePtr parse(std::istream& input);

	static void write(const otio::Timeline* timeline, const std::string& filename);
	static std::string toString(const otio::Timeline* timeline);

private:
	static TimelinePtr expectTimeline(otio::SerializableObject* object, const otio::ErrorStatus& status);
};

} // namespace edl
