#pragma once

#include "edl/EDLTypes.h"
#include "edl/TimelineTypes.h"
#include <ostream>
#include <string>

namespace edl {

// Writes an OpenTimelineIO timeline as CMX 3600 text
class EDLEncoder {
public:
	struct Config {
		double rate = 24.0;                          // Rate of the written timecodes
		int reelNameLength = DefaultReelNameLength;  // <= 0 disables truncation
		OutputStyle style = OutputStyle::Avid;       // Accepted, output is identical for all styles
	};

	EDLEncoder();
	explicit EDLEncoder(const Config& config);

	/**
	 * Encode the timeline. Nothing is written to the stream on failure.
	 * @throws EncodeError for a null timeline, more than one video track,
	 *         a clip without a usable range, a negative time, or an unusable rate
	 */
	void encode(const otio::Timeline* timeline, std::ostream& output) const;
	void encode(const otio::Timeline& timeline, std::ostream& output) const;
	std::string encodeToString(const otio::Timeline* timeline) const;
	void encodeFile(const otio::Timeline* timeline, const std::string& filename) const;

	const Config& config() const { return config_; }

private:
	void writeHeader(const otio::Timeline& timeline, std::ostream& out) const;
	int writeTrackEvents(const otio::Track& track, const std::string& trackId, int eventNumber, std::ostream& out) const;
	void writeEvent(const Event& event, std::ostream& out) const;

	std::string reelNameFor(const otio::Clip& clip) const;
	std::string formatTimecode(const otio::RationalTime& time) const;

	static std::string audioTrackId(size_t index);

	Config config_;
};

} // namespace edl
