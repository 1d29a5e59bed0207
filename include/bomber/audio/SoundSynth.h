#pragma once

#include <cstdint>
#include <vector>

namespace bomber::audio {

enum class SoundId : std::uint8_t {
    Drone,
    Drop,
    Explosion,
    Hit,
    Upgrade,
    Count
};

inline constexpr int kSynthSampleRate = 22050;
inline constexpr int kSynthChannels = 2;

const char* SoundName(SoundId id);
// Playback volume in [0, 1] applied on top of the synthesised amplitude.
float SoundVolume(SoundId id);
float SoundDuration(SoundId id);

// Interleaved signed 16-bit samples; every channel carries the same signal.
std::vector<std::int16_t> SynthesizeSound(SoundId id,
                                          std::uint32_t seed = 1,
                                          int sampleRate = kSynthSampleRate,
                                          int channels = kSynthChannels);

} // namespace bomber::audio
