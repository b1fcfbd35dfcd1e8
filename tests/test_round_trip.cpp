#include <catch2/catch_all.hpp>
#include "common/TimelineFixtures.h"
#include "edl/EDLDecoder.h"
#include "edl/EDLEncoder.h"

using test::childAt;
using test::childrenOf;
using test::tracksOf;
using namespace test::fixtures;

namespace {

edl::TimelinePtr reencode(const otio::Timeline* tl, double rate = 24.0) {
	edl::EDLEncoder::Config encoderConfig;
	encoderConfig.rate = rate;
	std::string text = edl::EDLEncoder(encoderConfig).encodeToString(tl);

	edl::EDLDecoder::Config decoderConfig;
	decoderConfig.rate = rate;
	return edl::EDLDecoder(decoderConfig).decodeString(text);
}

} // namespace

TEST_CASE("Single clip survives encode and decode", "[roundtrip]") {
	edl::TimelinePtr original(new otio::Timeline("Round Trip Test"));
	append(addTrack(original, "V", otio::Track::Kind::video), externalClip("TestClip", "TestClip", "TestClip", 0, 120));

	auto decoded = reencode(original);

	CHECK(decoded->name() == "Round Trip Test");
	auto videoTracks = decoded->video_tracks();
	REQUIRE(videoTracks.size() == 1);
	REQUIRE(videoTracks[0]->children().size() == 1);

	const auto* clip = childAt<otio::Clip>(videoTracks[0], 0);
	REQUIRE(clip != nullptr);
	CHECK(clip->name() == "TestClip");
	CHECK(test::trimmedRange(clip).start_time().value() == 0.0);
	CHECK(test::trimmedRange(clip).duration().value() == 120.0);
	const auto* reference = dynamic_cast<otio::ExternalReference*>(clip->media_reference());
	REQUIRE(reference != nullptr);
	CHECK(reference->target_url() == "TestClip");
}

TEST_CASE("Gaps survive encode and decode", "[roundtrip][gaps]") {
	edl::TimelinePtr original(new otio::Timeline("Gaps"));
	otio::Track* track = addTrack(original, "V", otio::Track::Kind::video);
	append(track, externalClip("One", "REEL1", "REEL1", 86400, 48));
	append(track, gap(36));
	append(track, externalClip("Two", "REEL2", "REEL2", 86400, 24));

	auto decoded = reencode(original);

	const otio::Track* after = tracksOf(decoded)[0];
	REQUIRE(after->children().size() == 3);
	CHECK(childAt<otio::Clip>(after, 0)->name() == "One");
	CHECK(test::duration(childAt<otio::Gap>(after, 1)).value() == 36.0);
	CHECK(childAt<otio::Clip>(after, 2)->name() == "Two");

	otio::ErrorStatus status;
	CHECK(after->duration(&status).value() == 108.0);
}

TEST_CASE("Audio tracks survive encode and decode", "[roundtrip][audio]") {
	edl::EDLDecoder decoder;
	auto original = decoder.decodeFile(test::sampleEdlPath("audio_tracks.edl"));
	auto decoded = reencode(original);

	auto beforeTracks = tracksOf(original);
	auto afterTracks = tracksOf(decoded);
	REQUIRE(afterTracks.size() == beforeTracks.size());
	for (size_t i = 0; i < beforeTracks.size(); ++i) {
		CHECK(afterTracks[i]->name() == beforeTracks[i]->name());
		CHECK(afterTracks[i]->kind() == beforeTracks[i]->kind());

		auto beforeClips = childrenOf<otio::Clip>(beforeTracks[i]);
		auto afterClips = childrenOf<otio::Clip>(afterTracks[i]);
		REQUIRE(afterClips.size() == beforeClips.size());
		for (size_t c = 0; c < beforeClips.size(); ++c) {
			CHECK(afterClips[c]->name() == beforeClips[c]->name());
			CHECK(test::trimmedRange(afterClips[c]) == test::trimmedRange(beforeClips[c]));
		}
	}
}

TEST_CASE("Generators survive encode and decode", "[roundtrip][generators]") {
	auto kind = GENERATE(edl::GeneratorKind::Black, edl::GeneratorKind::SMPTEBars);

	edl::TimelinePtr original(new otio::Timeline("Leader"));
	append(addTrack(original, "V", otio::Track::Kind::video), generatorClip("Leader", kind, 0, 48));

	auto decoded = reencode(original);

	const auto* clip = childAt<otio::Clip>(tracksOf(decoded)[0], 0);
	REQUIRE(clip != nullptr);
	const auto* generator = dynamic_cast<otio::GeneratorReference*>(clip->media_reference());
	REQUIRE(generator != nullptr);
	CHECK(generator->generator_kind() == kind);
	CHECK(test::duration(clip).value() == 48.0);
}

TEST_CASE("Dissolves are written on the event before the transition", "[roundtrip][transitions]") {
	edl::EDLDecoder decoder;
	auto original = decoder.decodeFile(test::sampleEdlPath("simple_cuts.edl"));

	std::string text = edl::EDLEncoder().encodeToString(original);
	CHECK_THAT(text, Catch::Matchers::ContainsSubstring("002  REEL002  V    D    024\n"));
	CHECK_THAT(text, Catch::Matchers::ContainsSubstring("003  REEL003  V    C \n"));

	auto decoded = decoder.decodeString(text);
	const otio::Track* track = tracksOf(decoded)[0];
	auto transitions = childrenOf<otio::Transition>(track);
	REQUIRE(transitions.size() == 1);
	CHECK(transitions[0]->out_offset().value() == 24.0);
	CHECK(childrenOf<otio::Clip>(track).size() == 3);
}

TEST_CASE("Drop-frame timelines survive encode and decode at 29.97", "[roundtrip][dropframe]") {
	edl::TimelinePtr original(new otio::Timeline("NTSC"));
	otio::Track* track = addTrack(original, "V", otio::Track::Kind::video);
	append(track, externalClip("Tape", "TAPE01", "TAPE01", 107892, 1800, 29.97));
	append(track, externalClip("Tape", "TAPE02", "TAPE02", 17982, 300, 29.97));

	auto decoded = reencode(original, 29.97);

	auto clips = childrenOf<otio::Clip>(tracksOf(decoded)[0]);
	REQUIRE(clips.size() == 2);
	CHECK(test::trimmedRange(clips[0]).start_time().value() == 107892.0);
	CHECK(test::trimmedRange(clips[0]).duration().value() == 1800.0);
	CHECK(test::trimmedRange(clips[1]).start_time().value() == 17982.0);
	CHECK(test::trimmedRange(clips[1]).duration().value() == 300.0);
}
