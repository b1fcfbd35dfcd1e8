#include "edl/TimelineJson.h"
#include "utils/Logger.h"
#include <fstream>
#include <iterator>

namespace edl {

TimelinePtr TimelineJson::read(const std::string& filename) {
	std::ifstream file(filename);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open timeline file: " + filename);
	}
	return parse(file);
}

TimelinePtr TimelineJson::parse(std::istream& input) {
	std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
	if (input.bad()) {
		throw std::runtime_error("Failed to read timeline input");
	}
	return parse(text);
}

TimelinePtr TimelineJson::parse(const std::string& text) {
	otio::ErrorStatus status;
	otio::SerializableObject* object = otio::SerializableObject::from_json_string(text, &status);
	return expectTimeline(object, status);
}

void TimelineJson::write(const otio::Timeline* timeline, const std::string& filename) {
	std::string text = toString(timeline);

	std::ofstream file(filename, std::ios::binary);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open output file: " + filename);
	}
	file << text << "\n";
	if (!file) {
		throw std::runtime_error("Failed to write timeline file: " + filename);
	}
}

std::string TimelineJson::toString(const otio::Timeline* timeline) {
	if (timeline == nullptr) {
		throw std::invalid_argument("Cannot serialize a null timeline");
	}

	otio::ErrorStatus status;
	std::string text = timeline->to_json_string(&status);
	if (otio::is_error(status)) {
		throw std::runtime_error("Failed to serialize timeline '" + timeline->name() + "': " +
			status.full_description);
	}
	return text;
}

TimelinePtr TimelineJson::expectTimeline(otio::SerializableObject* object, const otio::ErrorStatus& status) {
	// Released on every path that does not hand it back
	Retainer<otio::SerializableObject> holder(object);

	if (otio::is_error(status) || object == nullptr) {
		throw InvalidTimelineException(status.full_description);
	}

	auto* timeline = dynamic_cast<otio::Timeline*>(object);
	if (timeline == nullptr) {
		throw InvalidTimelineException("root object is " + object->schema_name() + ", expected Timeline");
	}

	utils::Logger::debug("Read timeline '{}' with {} tracks", timeline->name(),
		timeline->tracks() ? timeline->tracks()->children().size() : 0);
	return TimelinePtr(timeline);
}

} // namespace edl
