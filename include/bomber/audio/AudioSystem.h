#pragma once

#include "bomber/audio/SoundSynth.h"

#include <memory>

namespace bomber::core {
struct AppConfig;
}

namespace bomber::audio {

class IAudioSystem {
public:
    virtual ~IAudioSystem() = default;
    virtual void initialize() = 0;
    virtual void play(SoundId id) = 0;
    virtual bool enabled() const = 0;
    virtual void shutdown() = 0;
};

std::unique_ptr<IAudioSystem> CreateSdlMixerAudio(const core::AppConfig& config);
std::unique_ptr<IAudioSystem> CreateSilentAudio();

} // namespace bomber::audio
