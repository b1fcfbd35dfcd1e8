#include "edl/EDLEncoder.h"
#include "edl/ReelName.h"
#include "edl/Timecode.h"
#include "utils/Logger.h"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace edl {

namespace {

const std::string defaultTitle = "Timeline";
const std::string defaultReelName = "AX";

// Reserved reels the decoder maps back to generators
const std::string blackReelName = "BL";
const std::string barsReelName = "BARS";

} // namespace

EDLEncoder::EDLEncoder()
	: config_{} {
}

EDLEncoder::EDLEncoder(const Config& config)
	: config_(config) {
}

void EDLEncoder::encode(const otio::Timeline* timeline, std::ostream& output) const {
	if (timeline == nullptr) {
		throw EncodeError("timeline is null");
	}
	encode(*timeline, output);
}

void EDLEncoder::encode(const otio::Timeline& timeline, std::ostream& output) const {
	if (config_.rate <= 0.0) {
		throw EncodeError("rate must be positive, got " + std::to_string(config_.rate));
	}

	std::vector<otio::Track*> videoTracks = timeline.video_tracks();
	if (videoTracks.size() > 1) {
		throw EncodeError("EDL format supports only one video track, timeline has " +
			std::to_string(videoTracks.size()));
	}
	std::vector<otio::Track*> audioTracks = timeline.audio_tracks();

	// Buffered so a failure part way leaves the output untouched
	std::ostringstream out;
	writeHeader(timeline, out);

	int eventNumber = 1;
	if (!videoTracks.empty()) {
		eventNumber = writeTrackEvents(*videoTracks.front(), toString(TrackType::Video), eventNumber, out);
	}
	for (size_t i = 0; i < audioTracks.size(); ++i) {
		eventNumber = writeTrackEvents(*audioTracks[i], audioTrackId(i), eventNumber, out);
	}

	utils::Logger::info("Encoded {} events from {} video and {} audio tracks",
		eventNumber - 1, videoTracks.size(), audioTracks.size());

	output << out.str();
	if (!output) {
		throw EncodeError("failed to write EDL output");
	}
}

std::string EDLEncoder::encodeToString(const otio::Timeline* timeline) const {
	std::ostringstream out;
	encode(timeline, out);
	return out.str();
}

void EDLEncoder::encodeFile(const otio::Timeline* timeline, const std::string& filename) const {
	std::string text = encodeToString(timeline);

	std::ofstream file(filename, std::ios::binary);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open output file: " + filename);
	}
	file << text;
	if (!file) {
		throw std::runtime_error("Failed to write EDL file: " + filename);
	}
}

void EDLEncoder::writeHeader(const otio::Timeline& timeline, std::ostream& out) const {
	const std::string& title = timeline.name().empty() ? defaultTitle : timeline.name();
	out << "TITLE: " << title << "\n";
	out << "FCM: NON-DROP FRAME\n\n";
}

int EDLEncoder::writeTrackEvents(const otio::Track& track, const std::string& trackId, int eventNumber, std::ostream& out) const {
	otio::RationalTime recordTime(0.0, config_.rate);
	const auto& children = track.children();

	for (size_t i = 0; i < children.size(); ++i) {
		if (const auto* gap = dynamic_cast<const otio::Gap*>(children[i].value)) {
			otio::ErrorStatus status;
			otio::RationalTime duration = gap->duration(&status);
			if (otio::is_error(status)) {
				throw EncodeError("gap in track '" + track.name() + "': " + status.full_description);
			}
			recordTime = recordTime + duration;
			continue;
		}

		const auto* clip = dynamic_cast<const otio::Clip*>(children[i].value);
		if (!clip) {
			continue;
		}

		otio::ErrorStatus status;
		otio::TimeRange range = clip->trimmed_range(&status);
		if (otio::is_error(status)) {
			throw EncodeError("clip '" + clip->name() + "' has no usable range: " + status.full_description);
		}

		otio::RationalTime duration = range.duration();
		otio::RationalTime sourceIn = range.start_time();
		otio::RationalTime sourceOut = sourceIn + duration;
		otio::RationalTime recordIn = recordTime;
		otio::RationalTime recordOut = recordTime + duration;

		Event event;
		event.eventNumber = eventNumber;
		event.reelName = reelNameFor(*clip);
		event.trackId = trackId;
		event.editType = EditType::Cut;
		event.sourceIn = formatTimecode(sourceIn);
		event.sourceOut = formatTimecode(sourceOut);
		event.recordIn = formatTimecode(recordIn);
		event.recordOut = formatTimecode(recordOut);
		event.clipName = clip->name();

		// A following transition belongs to this event and is not visited again
		if (i + 1 < children.size()) {
			if (const auto* transition = dynamic_cast<const otio::Transition*>(children[i + 1].value)) {
				if (transition->transition_type() == otio::Transition::Type::SMPTE_Dissolve) {
					event.editType = EditType::Dissolve;
					event.transitionDuration = static_cast<int>(std::lround(transition->out_offset().value_rescaled_to(config_.rate)));
				} else {
					utils::Logger::debug("Writing '{}' transition after event {} as a cut", transition->transition_type(), eventNumber);
				}
				++i;
			}
		}

		writeEvent(event, out);

		++eventNumber;
		recordTime = recordOut;
	}

	return eventNumber;
}

void EDLEncoder::writeEvent(const Event& event, std::ostream& out) const {
	std::ostringstream line;
	line << std::setw(3) << std::setfill('0') << event.eventNumber << "  "
		<< std::left << std::setfill(' ') << std::setw(8) << event.reelName << " "
		<< event.trackId << "    "
		<< std::setw(2) << toString(event.editType);

	if (event.editType == EditType::Dissolve && event.transitionDuration > 0) {
		line << "   " << std::right << std::setw(3) << std::setfill('0') << event.transitionDuration;
	}

	out << line.str() << "\n";
	out << "     " << event.sourceIn << " " << event.sourceOut << " "
		<< event.recordIn << " " << event.recordOut << "\n";

	if (!event.clipName.empty()) {
		out << "* FROM CLIP NAME: " << event.clipName << "\n";
	}

	out << "\n";
}

std::string EDLEncoder::reelNameFor(const otio::Clip& clip) const {
	const otio::MediaReference* reference = clip.media_reference();
	if (reference == nullptr) {
		return defaultReelName;
	}

	if (const auto* generator = dynamic_cast<const otio::GeneratorReference*>(reference)) {
		if (generator->generator_kind() == GeneratorKind::Black) {
			return blackReelName;
		}
		if (generator->generator_kind() == GeneratorKind::SMPTEBars) {
			return barsReelName;
		}
	}

	std::string reelName = reference->name();
	if (reelName.empty()) {
		if (const auto* external = dynamic_cast<const otio::ExternalReference*>(reference)) {
			reelName = external->target_url();
		}
	}
	return sanitizeReelName(reelName, config_.reelNameLength);
}

std::string EDLEncoder::formatTimecode(const otio::RationalTime& time) const {
	try {
		return Timecode::toTimecode(time.rescaled_to(config_.rate), config_.rate);
	} catch (const TimecodeError& e) {
		throw EncodeError(e.what());
	}
}

std::string EDLEncoder::audioTrackId(size_t index) {
	switch (index) {
		case 0: return toString(TrackType::Audio1);
		case 1: return toString(TrackType::Audio2);
		case 2: return toString(TrackType::Audio3);
		case 3: return toString(TrackType::Audio4);
		default: return toString(TrackType::Audio);
	}
}

} // namespace edl
