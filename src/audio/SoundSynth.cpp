#include "bomber/audio/SoundSynth.h"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <random>

namespace bomber::audio {

namespace {
constexpr float kTwoPi = 6.28318530718F;

std::int16_t toSample(float value) {
    return static_cast<std::int16_t>(std::clamp(value, -32767.0F, 32767.0F));
}

struct Format {
    int sampleRate{kSynthSampleRate};
    int channels{kSynthChannels};
};

template <typename Generator>
std::vector<std::int16_t> render(const Format& format, float duration, Generator&& generator) {
    if (format.sampleRate <= 0 || format.channels <= 0) {
        return {};
    }
    const int frames = static_cast<int>(static_cast<float>(format.sampleRate) * duration);
    std::vector<std::int16_t> samples;
    samples.reserve(static_cast<std::size_t>(frames) * static_cast<std::size_t>(format.channels));
    for (int i = 0; i < frames; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(format.sampleRate);
        const std::int16_t value = toSample(generator(t));
        samples.insert(samples.end(), static_cast<std::size_t>(format.channels), value);
    }
    return samples;
}
} // namespace

const char* SoundName(SoundId id) {
    switch (id) {
    case SoundId::Drone: return "drone";
    case SoundId::Drop: return "drop";
    case SoundId::Explosion: return "explosion";
    case SoundId::Hit: return "hit";
    case SoundId::Upgrade: return "upgrade";
    default: return "";
    }
}

float SoundVolume(SoundId id) {
    switch (id) {
    case SoundId::Drone: return 0.3F;
    case SoundId::Drop: return 0.4F;
    case SoundId::Explosion: return 0.6F;
    case SoundId::Hit: return 0.5F;
    case SoundId::Upgrade: return 0.5F;
    default: return 0.0F;
    }
}

float SoundDuration(SoundId id) {
    switch (id) {
    case SoundId::Drone: return 0.3F;
    case SoundId::Drop: return 0.15F;
    case SoundId::Explosion: return 0.4F;
    case SoundId::Hit: return 0.2F;
    case SoundId::Upgrade: return 0.5F;
    default: return 0.0F;
    }
}

std::vector<std::int16_t> SynthesizeSound(SoundId id, std::uint32_t seed, int sampleRate, int channels) {
    const float duration = SoundDuration(id);
    const Format format{sampleRate, channels};
    switch (id) {
    case SoundId::Explosion: {
        // Low rumble with a jittered pitch and a fast exponential decay.
        std::mt19937 rng{seed};
        std::uniform_real_distribution<float> unit(0.0F, 1.0F);
        return render(format, duration, [&](float t) {
            const float freq = 60.0F + unit(rng) * 40.0F;
            const float amp = std::exp(-t * 8.0F) * (0.3F + unit(rng) * 0.2F);
            return amp * 32767.0F * std::sin(kTwoPi * freq * t);
        });
    }
    case SoundId::Drop:
        return render(format, duration, [](float t) {
            return 8000.0F * std::exp(-t * 20.0F) * std::sin(kTwoPi * 400.0F * t);
        });
    case SoundId::Drone:
        return render(format, duration, [](float t) {
            const float freq = 200.0F + std::sin(t * 10.0F) * 30.0F;
            return 5000.0F * std::exp(-t * 3.0F) * std::sin(kTwoPi * freq * t);
        });
    case SoundId::Hit:
        return render(format, duration, [](float t) {
            return 12000.0F * std::exp(-t * 15.0F)
                * (std::sin(kTwoPi * 800.0F * t) * 0.7F + std::sin(kTwoPi * 1200.0F * t) * 0.3F);
        });
    case SoundId::Upgrade:
        return render(format, duration, [](float t) {
            const float freq = 300.0F + t * 400.0F;
            return 10000.0F * std::exp(-t * 2.0F) * std::sin(kTwoPi * freq * t);
        });
    default:
        return {};
    }
}

} // namespace bomber::audio
