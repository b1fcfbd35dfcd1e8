#pragma once

#include <opentimelineio/clip.h>
#include <opentimelineio/errorStatus.h>
#include <opentimelineio/externalReference.h>
#include <opentimelineio/freezeFrame.h>
#include <opentimelineio/gap.h>
#include <opentimelineio/generatorReference.h>
#include <opentimelineio/linearTimeWarp.h>
#include <opentimelineio/marker.h>
#include <opentimelineio/missingReference.h>
#include <opentimelineio/stack.h>
#include <opentimelineio/timeline.h>
#include <opentimelineio/track.h>
#include <opentimelineio/transition.h>
#include <string>

namespace otio = opentimelineio::OPENTIMELINEIO_VERSION;

namespace edl {

// Reference-counted handle to an OpenTimelineIO object
template<typename T>
using Retainer = otio::SerializableObject::Retainer<T>;

using TimelinePtr = Retainer<otio::Timeline>;

// Generator kinds synthesized for reserved reel names
namespace GeneratorKind {
	inline const std::string Black = "black";
	inline const std::string SMPTEBars = "SMPTEBars";
}

// Name used for wipes that carry no wipe code
inline const std::string DefaultWipeName = "SMPTE_Wipe";

} // namespace edl
