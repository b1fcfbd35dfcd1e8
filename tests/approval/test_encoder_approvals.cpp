#include <catch2/catch_all.hpp>
#include <ApprovalTests/ApprovalTests.hpp>
#include "../common/TimelineFixtures.h"
#include "edl/EDLDecoder.h"
#include "edl/EDLEncoder.h"

using namespace test::fixtures;

// Approved files sit next to this source, named after each test case

TEST_CASE("EncodesMixedTimeline", "[approval][encoder]") {
	edl::TimelinePtr tl(new otio::Timeline("Approval Timeline"));

	otio::Track* video = addTrack(tl, "V", otio::Track::Kind::video);
	append(video, externalClip("Opening Shot", "", "A001C003.mov", 86400, 48));
	append(video, gap(24));
	append(video, externalClip("Interview", "INTV_CAM_A", "INTV_CAM_A", 90000, 72));
	append(video, dissolve(12));
	append(video, generatorClip("Slate", edl::GeneratorKind::Black, 0, 24));

	otio::Track* roomTone = addTrack(tl, "Room Tone", otio::Track::Kind::audio);
	append(roomTone, externalClip("Room Tone", "ROOMTONE", "ROOMTONE", 0, 120));

	otio::Track* music = addTrack(tl, "Music", otio::Track::Kind::audio);
	append(music, gap(48));
	append(music, externalClip("Music Cue", "", "music/cue 01.wav", 240, 96));

	edl::EDLEncoder encoder;
	ApprovalTests::Approvals::verify(encoder.encodeToString(tl));
}

TEST_CASE("ConvertsComprehensiveEdl", "[approval][decoder][encoder]") {
	edl::EDLDecoder decoder;
	auto tl = decoder.decodeFile(test::sampleEdlPath("comprehensive.edl"));

	edl::EDLEncoder encoder;
	ApprovalTests::Approvals::verify(encoder.encodeToString(tl));
}
