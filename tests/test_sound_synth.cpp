#include <doctest/doctest.h>

#include "bomber/audio/SoundSynth.h"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <vector>

using bomber::audio::SoundId;
using bomber::audio::SynthesizeSound;

namespace {
constexpr SoundId kAllSounds[] = {SoundId::Drone, SoundId::Drop, SoundId::Explosion, SoundId::Hit, SoundId::Upgrade};
}

TEST_CASE("Every sound has a name, a duration and stereo samples")
{
    for (SoundId id : kAllSounds) {
        const std::string name = bomber::audio::SoundName(id);
        CAPTURE(name);
        CHECK_FALSE(name.empty());
        CHECK(bomber::audio::SoundVolume(id) > 0.0f);

        const auto samples = SynthesizeSound(id);
        const auto frames = static_cast<std::size_t>(
            static_cast<float>(bomber::audio::kSynthSampleRate) * bomber::audio::SoundDuration(id));
        CHECK(samples.size() == frames * bomber::audio::kSynthChannels);

        bool audible = false;
        bool channelsMatch = true;
        for (std::size_t i = 0; i + 1 < samples.size(); i += 2) {
            channelsMatch = channelsMatch && samples[i] == samples[i + 1];
            audible = audible || samples[i] != 0;
        }
        CHECK(channelsMatch);
        CHECK(audible);
    }
}

TEST_CASE("Drop envelope never exceeds its peak amplitude")
{
    const auto samples = SynthesizeSound(SoundId::Drop);
    int peak = 0;
    for (auto sample : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(sample)));
    }
    CHECK(peak > 0);
    CHECK(peak <= 8000);
}

TEST_CASE("Explosion noise is reproducible per seed")
{
    CHECK(SynthesizeSound(SoundId::Explosion, 3u) == SynthesizeSound(SoundId::Explosion, 3u));
    CHECK(SynthesizeSound(SoundId::Explosion, 3u) != SynthesizeSound(SoundId::Explosion, 4u));
    CHECK(std::string(bomber::audio::SoundName(SoundId::Explosion)) == "explosion");
}

namespace {
// Sign changes in the first channel, skipping exact zeros.
int ZeroCrossings(const std::vector<std::int16_t>& samples, int channels)
{
    int crossings = 0;
    int lastSign = 0;
    for (std::size_t i = 0; i < samples.size(); i += static_cast<std::size_t>(channels)) {
        const int sign = (samples[i] > 0) - (samples[i] < 0);
        if (sign == 0) {
            continue;
        }
        if (lastSign != 0 && sign != lastSign) {
            ++crossings;
        }
        lastSign = sign;
    }
    return crossings;
}
} // namespace

TEST_CASE("Sounds synthesized for a 48 kHz mono device keep their length and pitch")
{
    const auto reference = SynthesizeSound(SoundId::Drop, 1u, 22050, 2);
    const auto device = SynthesizeSound(SoundId::Drop, 1u, 48000, 1);

    const auto frames = static_cast<std::size_t>(48000.0f * bomber::audio::SoundDuration(SoundId::Drop));
    CHECK(device.size() == frames);

    // 400 Hz over 0.15 s crosses zero about 120 times at any sample rate.
    const int referenceCrossings = ZeroCrossings(reference, 2);
    const int deviceCrossings = ZeroCrossings(device, 1);
    CHECK(referenceCrossings >= 110);
    CHECK(referenceCrossings <= 125);
    CHECK(std::abs(deviceCrossings - referenceCrossings) <= 3);
}

TEST_CASE("Multi-channel devices get the same sample on every channel")
{
    const auto samples = SynthesizeSound(SoundId::Hit, 1u, 44100, 6);
    const auto frames = static_cast<std::size_t>(44100.0f * bomber::audio::SoundDuration(SoundId::Hit));
    REQUIRE(samples.size() == frames * 6);
    bool matched = true;
    for (std::size_t i = 0; i < samples.size(); i += 6) {
        for (std::size_t c = 1; c < 6; ++c) {
            matched = matched && samples[i + c] == samples[i];
        }
    }
    CHECK(matched);
    CHECK(SynthesizeSound(SoundId::Hit, 1u, 0, 2).empty());
}
