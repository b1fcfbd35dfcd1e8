#pragma once

#include "edl/TimelineTypes.h"
#include <string>

namespace edl {

/**
 * SMPTE timecode conversion backed by libavutil's AVTimecode.
 * Timecodes are "HH:MM:SS:FF", or "HH:MM:SS;FF" for drop-frame.
 */
class Timecode {
public:
	/**
	 * True for 29.97 and 59.94 (within 0.01), the rates that use drop-frame
	 */
	static bool isDropFrameRate(double rate);

	/**
	 * Convert a timecode string to a frame count at the given rate
	 * @throws TimecodeError if the string is malformed, a field is out of
	 *         range, or drop-frame is used with a rate that does not allow it
	 */
	static otio::RationalTime fromTimecode(const std::string& timecode, double rate);

	/**
	 * Render a time as timecode at the given rate. Every field has at least
	 * two digits. The ';' separator is only produced for drop-frame rates.
	 * @throws TimecodeError if the rate is not positive or the time is negative
	 */
	static std::string toTimecode(const otio::RationalTime& time, double rate);

	/**
	 * True if the frames separator of the string is ';'
	 */
	static bool isDropFrameTimecode(const std::string& timecode);
};

} // namespace edl
