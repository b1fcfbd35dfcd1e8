#pragma once

#include "edl/TimelineTypes.h"
#include <any>
#include <stdexcept>
#include <string>
#include <vector>

namespace test {

// Path of a file under sample_edls, honouring TEST_DATA_DIR
std::string sampleEdlPath(const std::string& name);

std::string readFile(const std::string& path);

// Tracks of the timeline's top-level stack, in composition order
std::vector<otio::Track*> tracksOf(const otio::Timeline* timeline);

// Every child of the given type, in track order
template<typename T>
std::vector<T*> childrenOf(const otio::Track* track) {
	std::vector<T*> result;
	for (const auto& child : track->children()) {
		if (auto* item = dynamic_cast<T*>(child.value)) {
			result.push_back(item);
		}
	}
	return result;
}

// Child at index cast to T, nullptr if it is something else
template<typename T>
T* childAt(const otio::Track* track, size_t index) {
	const auto& children = track->children();
	if (index >= children.size()) {
		return nullptr;
	}
	return dynamic_cast<T*>(children[index].value);
}

template<typename T>
T metadataValue(const otio::AnyDictionary& metadata, const std::string& key) {
	auto it = metadata.find(key);
	if (it == metadata.end()) {
		throw std::runtime_error("No metadata key: " + key);
	}
	return std::any_cast<T>(it->second);
}

bool hasMetadata(const otio::AnyDictionary& metadata, const std::string& key);

otio::TimeRange trimmedRange(const otio::Item* item);
otio::RationalTime duration(const otio::Item* item);

namespace fixtures {
	// Clip over an external reference, source range in frames
	edl::Retainer<otio::Clip> externalClip(const std::string& name, const std::string& referenceName,
		const std::string& targetUrl, double startFrame, double durationFrames, double rate = 24.0);

	// Clip over a generator ("black", "SMPTEBars")
	edl::Retainer<otio::Clip> generatorClip(const std::string& name, const std::string& generatorKind,
		double startFrame, double durationFrames, double rate = 24.0);

	edl::Retainer<otio::Gap> gap(double durationFrames, double rate = 24.0);

	edl::Retainer<otio::Transition> dissolve(double durationFrames, double rate = 24.0);

	// Appends a new track to the timeline's stack and returns it
	otio::Track* addTrack(otio::Timeline* timeline, const std::string& name, const std::string& kind);

	void append(otio::Track* track, otio::Composable* child);

	// One video track holding clipCount sequential one-second clips
	edl::TimelinePtr sequentialClips(const std::string& title, int clipCount, double rate = 24.0);
}

} // namespace test
