#include "edl/Timecode.h"
#include "edl/EDLTypes.h"
#include <boost/regex.hpp>
#include <climits>
#include <cmath>
#include <cstdio>

extern "C" {
#include <libavutil/rational.h>
#include <libavutil/timecode.h>
}

namespace edl {

namespace {

const boost::regex timecodePattern(R"(^(\d+):(\d+):(\d+)([:;])(\d+)$)");

AVRational rateToRational(double rate) {
	// 29.97 -> 2997/100, 24 -> 24/1
	return av_d2q(rate, 1001000);
}

} // namespace

bool Timecode::isDropFrameRate(double rate) {
	return (rate > 29.96 && rate < 29.98) || (rate > 59.93 && rate < 59.95);
}

bool Timecode::isDropFrameTimecode(const std::string& timecode) {
	auto pos = timecode.find_last_of(":;");
	return pos != std::string::npos && timecode[pos] == ';';
}

otio::RationalTime Timecode::fromTimecode(const std::string& timecode, double rate) {
	if (rate <= 0.0) {
		throw TimecodeError("rate must be positive for '" + timecode + "'");
	}

	boost::smatch match;
	if (!boost::regex_match(timecode, match, timecodePattern)) {
		throw TimecodeError("'" + timecode + "' is not HH:MM:SS:FF");
	}

	bool dropFrame = match[4] == ";";
	if (dropFrame && !isDropFrameRate(rate)) {
		throw TimecodeError("'" + timecode + "' is drop-frame but rate " +
			std::to_string(rate) + " is not a drop-frame rate");
	}

	// hours, minutes, seconds, frames
	const int groups[4] = {1, 2, 3, 5};
	int fields[4] = {0, 0, 0, 0};
	try {
		for (int i = 0; i < 4; ++i) {
			fields[i] = std::stoi(match[groups[i]].str());
		}
	} catch (const std::out_of_range&) {
		throw TimecodeError("'" + timecode + "' has a field too large to represent");
	}

	int minutes = fields[1];
	int seconds = fields[2];
	int frames = fields[3];
	int nominalFps = static_cast<int>(std::lround(rate));
	if (minutes >= 60 || seconds >= 60 || frames >= nominalFps) {
		throw TimecodeError("'" + timecode + "' has a field out of range at " +
			std::to_string(rate) + " fps");
	}

	AVTimecode tc;
	int ret = av_timecode_init_from_string(&tc, rateToRational(rate), timecode.c_str(), nullptr);
	if (ret < 0) {
		throw TimecodeError("'" + timecode + "' rejected by libavutil (error " + std::to_string(ret) + ")");
	}

	return otio::RationalTime(static_cast<double>(tc.start), rate);
}

std::string Timecode::toTimecode(const otio::RationalTime& time, double rate) {
	if (rate <= 0.0) {
		throw TimecodeError("rate must be positive, got " + std::to_string(rate));
	}

	bool dropFrame = isDropFrameRate(rate);
	int flags = dropFrame ? AV_TIMECODE_FLAG_DROPFRAME : 0;

	AVTimecode tc;
	int ret = av_timecode_init(&tc, rateToRational(rate), flags, 0, nullptr);
	if (ret < 0) {
		throw TimecodeError("libavutil cannot build timecodes at rate " + std::to_string(rate));
	}

	double frames = std::round(time.value_rescaled_to(rate));
	if (frames < 0.0) {
		throw TimecodeError("negative time " + std::to_string(time.value()) + "@" +
			std::to_string(time.rate()) + " has no timecode");
	}
	if (frames > INT_MAX) {
		throw TimecodeError("time " + std::to_string(time.value()) + "@" +
			std::to_string(time.rate()) + " is out of range");
	}

	int frameNumber = static_cast<int>(frames);
	if (dropFrame) {
		frameNumber = av_timecode_adjust_ntsc_framenum2(frameNumber, tc.fps);
	}

	// av_timecode_make_string shortens the frames field below 10 fps
	int ff = frameNumber % tc.fps;
	int ss = frameNumber / tc.fps % 60;
	int mm = frameNumber / (tc.fps * 60) % 60;
	int hh = frameNumber / (tc.fps * 3600);

	char buf[AV_TIMECODE_STR_SIZE];
	std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d%c%02d", hh, mm, ss, dropFrame ? ';' : ':', ff);
	return std::string(buf);
}

} // namespace edl
