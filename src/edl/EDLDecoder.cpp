#include "edl/EDLDecoder.h"
#include "edl/EventAccumulator.h"
#include "edl/TimelineBuilder.h"
#include "utils/Logger.h"
#include <fstream>
#include <sstream>

namespace edl {

EDLDecoder::EDLDecoder()
	: config_{} {
}

EDLDecoder::EDLDecoder(const Config& config)
	: config_(config) {
}

TimelinePtr EDLDecoder::decode(std::istream& input) {
	if (config_.rate <= 0.0) {
		throw std::invalid_argument("Decode rate must be positive: " + std::to_string(config_.rate));
	}

	EventAccumulator accumulator;
	accumulator.accumulate(input);
	if (input.bad()) {
		throw std::runtime_error("Failed to read EDL input");
	}

	title_ = accumulator.title();
	fcmMode_ = accumulator.frameCountMode();

	std::vector<Event> events = accumulator.takeEvents();

	TimelineBuilder builder(config_.rate);
	TimelinePtr result = builder.build(events, title_);

	utils::Logger::info("Decoded EDL '{}': {} events, {} tracks @ {} fps",
		title_, events.size(), result->tracks()->children().size(), config_.rate);
	return result;
}

TimelinePtr EDLDecoder::decodeString(const std::string& text) {
	std::istringstream input(text);
	return decode(input);
}

TimelinePtr EDLDecoder::decodeFile(const std::string& filename) {
	std::ifstream file(filename);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open EDL file: " + filename);
	}
	return decode(file);
}

} // namespace edl
