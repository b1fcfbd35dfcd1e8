#include <catch2/catch_all.hpp>
#include "edl/EventAccumulator.h"
#include <sstream>

using edl::EventAccumulator;

namespace {

EventAccumulator accumulate(const std::string& text) {
	std::istringstream input(text);
	EventAccumulator accumulator;
	accumulator.accumulate(input);
	return accumulator;
}

} // namespace

TEST_CASE("Header lines are captured", "[accumulator]") {
	auto acc = accumulate(
		"TITLE: Reel Test\n"
		"FCM: DROP FRAME\n");

	CHECK(acc.title() == "Reel Test");
	CHECK(acc.frameCountMode() == "DROP FRAME");
	CHECK(acc.events().empty());
	CHECK_FALSE(acc.isAccumulating());
}

TEST_CASE("Each event header opens a new event", "[accumulator]") {
	auto acc = accumulate(
		"TITLE: Two Events\n"
		"\n"
		"001  REEL001  V     C\n"
		"     01:00:00:00 01:00:05:00 00:00:00:00 00:00:05:00\n"
		"* FROM CLIP NAME: First\n"
		"\n"
		"002  REEL002  A2    D    010\n"
		"     02:00:00:00 02:00:01:00 00:00:05:00 00:00:06:00\n");

	const auto& events = acc.events();
	REQUIRE(events.size() == 2);

	CHECK(events[0].eventNumber == 1);
	CHECK(events[0].reelName == "REEL001");
	CHECK(events[0].clipName == "First");
	CHECK(events[0].sourceIn == "01:00:00:00");
	CHECK(events[0].recordOut == "00:00:05:00");
	CHECK(events[0].line == 3);

	CHECK(events[1].trackId == "A2");
	CHECK(events[1].trackType == edl::TrackType::Audio2);
	CHECK(events[1].editType == edl::EditType::Dissolve);
	CHECK(events[1].transitionDuration == 10);
	CHECK(events[1].clipName.empty());
	CHECK(events[1].line == 7);
}

TEST_CASE("Comments before any event are ignored", "[accumulator]") {
	auto acc = accumulate(
		"TITLE: Leading Comments\n"
		"* FROM CLIP NAME: Orphan\n"
		"M2   REEL   048.0   01:00:00:00\n"
		"001  REEL001  V     C\n"
		"     01:00:00:00 01:00:05:00 00:00:00:00 00:00:05:00\n");

	REQUIRE(acc.events().size() == 1);
	CHECK(acc.events()[0].clipName.empty());
	CHECK_FALSE(acc.events()[0].speedEffect.has_value());
}

TEST_CASE("Comment lines mutate the open event", "[accumulator][comments]") {
	auto acc = accumulate(
		"001  ZZ100_50 V     C\n"
		"     01:00:04:05 01:00:05:12 00:00:02:00 00:00:03:07\n"
		"* FROM CLIP NAME: SpeedRamp\n"
		"* FROM CLIP: S:\\media\\ZZ100_501.mov\n"
		"M2   ZZ100_50       047.6                01:00:04:05\n"
		"* ASC_SOP (1.2 1.0 0.9) (0.01 -0.02 0.0) (1.0 1.0 1.05)\n"
		"* LOC: 01:00:04:10 RED Check focus\n"
		"* FREEZE FRAME\n"
		"* Reviewed by editorial\n"
		"* Second note\n");

	REQUIRE(acc.events().size() == 1);
	const auto& event = acc.events()[0];

	CHECK(event.clipName == "SpeedRamp");
	CHECK(event.filePath == "S:\\media\\ZZ100_501.mov");

	REQUIRE(event.speedEffect);
	CHECK(event.speedEffect->speed == Catch::Approx(47.6));

	REQUIRE(event.colorDecision);
	CHECK(event.colorDecision->slope[0] == Catch::Approx(1.2));
	CHECK(event.colorDecision->saturation == Catch::Approx(1.0));

	REQUIRE(event.markers.size() == 1);
	CHECK(event.markers[0].color == "RED");

	CHECK(event.freezeFrame);
	CHECK(event.comment == "* Reviewed by editorial\n* Second note");
}

TEST_CASE("Long locator lines are accumulated", "[accumulator][comments]") {
	const std::string note(100000, 'x');
	auto acc = accumulate(
		"001  REEL001  V     C\n"
		"     01:00:00:00 01:00:10:00 00:00:00:00 00:00:10:00\n"
		"* LOC: 01:00:02:00 RED " + note + "\n"
		"* FROM CLIP NAME: After\n");

	REQUIRE(acc.events().size() == 1);
	const auto& event = acc.events()[0];
	REQUIRE(event.markers.size() == 1);
	CHECK(event.markers[0].comment.size() == note.size());
	CHECK(event.clipName == "After");
}

TEST_CASE("Saturation without SOP keeps neutral slope offset and power", "[accumulator][cdl]") {
	auto acc = accumulate(
		"001  REEL001  V     C\n"
		"     01:00:00:00 01:00:05:00 00:00:00:00 00:00:05:00\n"
		"* ASC_SAT 0.5\n");

	REQUIRE(acc.events().size() == 1);
	const auto& cdl = acc.events()[0].colorDecision;
	REQUIRE(cdl);
	CHECK(cdl->saturation == Catch::Approx(0.5));
	CHECK(cdl->slope[1] == Catch::Approx(1.0));
	CHECK(cdl->offset[1] == Catch::Approx(0.0));
	CHECK(cdl->power[1] == Catch::Approx(1.0));
}

TEST_CASE("Malformed M2 lines are skipped", "[accumulator][speed]") {
	auto acc = accumulate(
		"001  REEL001  V     C\n"
		"     01:00:00:00 01:00:05:00 00:00:00:00 00:00:05:00\n"
		"M2   REEL001   fast   01:00:00:00\n");

	REQUIRE(acc.events().size() == 1);
	CHECK_FALSE(acc.events()[0].speedEffect.has_value());
}

TEST_CASE("Carriage returns are stripped", "[accumulator]") {
	auto acc = accumulate(
		"TITLE: CRLF\r\n"
		"001  REEL001  V     C\r\n"
		"     01:00:00:00 01:00:05:00 00:00:00:00 00:00:05:00\r\n"
		"* FROM CLIP NAME: Windows\r\n");

	CHECK(acc.title() == "CRLF");
	REQUIRE(acc.events().size() == 1);
	CHECK(acc.events()[0].clipName == "Windows");
}

TEST_CASE("An event header must be followed by a timecode line", "[accumulator][errors]") {
	SECTION("another line follows") {
		std::istringstream input(
			"TITLE: Broken\n"
			"\n"
			"001  REEL001  V     C\n"
			"* FROM CLIP NAME: no timecodes\n");
		EventAccumulator acc;
		try {
			acc.accumulate(input);
			FAIL("expected ParseError");
		} catch (const edl::ParseError& e) {
			CHECK(e.line() == 4);
			CHECK_THAT(e.message(), Catch::Matchers::ContainsSubstring("timecode"));
		}
	}

	SECTION("input ends") {
		std::istringstream input(
			"001  REEL001  V     C\n");
		EventAccumulator acc;
		try {
			acc.accumulate(input);
			FAIL("expected ParseError");
		} catch (const edl::ParseError& e) {
			CHECK(e.line() == 2);
		}
	}
}
