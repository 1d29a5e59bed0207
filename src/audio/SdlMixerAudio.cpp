#include "bomber/audio/AudioSystem.h"

#include "bomber/core/Application.h"

#include <SDL.h>
#include <SDL_mixer.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace bomber::audio {

namespace {

constexpr int kMixerChunkSize = 512;
constexpr int kMixerChannels = 16;

class SdlMixerAudio final : public IAudioSystem {
public:
    explicit SdlMixerAudio(std::string soundDir) : soundDir_{std::move(soundDir)} {}

    void initialize() override {
        if ((SDL_WasInit(SDL_INIT_AUDIO) & SDL_INIT_AUDIO) == 0) {
            if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
                SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Audio disabled, SDL audio init failed: %s", SDL_GetError());
                return;
            }
            ownsSubsystem_ = true;
        }
        if (Mix_OpenAudio(kSynthSampleRate, AUDIO_S16SYS, kSynthChannels, kMixerChunkSize) != 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Audio disabled, Mix_OpenAudio failed: %s", Mix_GetError());
            return;
        }
        // The device may open at another rate, channel count or sample format.
        if (Mix_QuerySpec(&deviceRate_, &deviceFormat_, &deviceChannels_) == 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Audio disabled, Mix_QuerySpec failed: %s", Mix_GetError());
            Mix_CloseAudio();
            return;
        }
        Mix_AllocateChannels(kMixerChannels);
        enabled_ = true;

        for (std::size_t i = 0; i < chunks_.size(); ++i) {
            const auto id = static_cast<SoundId>(i);
            chunks_[i] = loadOrSynthesize(id, buffers_[i]);
            if (chunks_[i]) {
                Mix_VolumeChunk(chunks_[i], static_cast<int>(SoundVolume(id) * MIX_MAX_VOLUME));
            }
        }
        SDL_Log("Audio ready (%d Hz, %d channels, format 0x%04x)", deviceRate_, deviceChannels_, deviceFormat_);
    }

    void play(SoundId id) override {
        if (!enabled_) {
            return;
        }
        const auto index = static_cast<std::size_t>(id);
        if (index >= chunks_.size() || !chunks_[index]) {
            return;
        }
        // -1 picks the first free channel; a full mixer just drops the sound.
        Mix_PlayChannel(-1, chunks_[index], 0);
    }

    bool enabled() const override { return enabled_; }

    void shutdown() override {
        if (enabled_) {
            Mix_HaltChannel(-1);
            for (auto& chunk : chunks_) {
                if (chunk) {
                    Mix_FreeChunk(chunk);
                    chunk = nullptr;
                }
            }
            Mix_CloseAudio();
            enabled_ = false;
        }
        for (auto& buffer : buffers_) {
            buffer.clear();
        }
        if (ownsSubsystem_) {
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            ownsSubsystem_ = false;
        }
    }

private:
    Mix_Chunk* loadOrSynthesize(SoundId id, std::vector<Uint8>& buffer) {
        const std::filesystem::path path = std::filesystem::path(soundDir_) / (std::string(SoundName(id)) + ".wav");
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            if (Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str())) {
                return chunk;
            }
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to load %s: %s", path.string().c_str(), Mix_GetError());
        }

        // Mix_QuickLoad_RAW does not copy, so the samples live in buffers_.
        if (!synthesizeForDevice(id, buffer)) {
            return nullptr;
        }
        Mix_Chunk* chunk = Mix_QuickLoad_RAW(buffer.data(), static_cast<Uint32>(buffer.size()));
        if (!chunk) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to create sound %s: %s", SoundName(id), Mix_GetError());
        }
        return chunk;
    }

    // Synthesizes at the device rate and channel count; only the sample format
    // may still need converting from signed 16-bit.
    bool synthesizeForDevice(SoundId id, std::vector<Uint8>& buffer) {
        const std::vector<std::int16_t> samples = SynthesizeSound(id, 1, deviceRate_, deviceChannels_);
        if (samples.empty()) {
            return false;
        }
        const std::size_t byteCount = samples.size() * sizeof(std::int16_t);
        if (deviceFormat_ == AUDIO_S16SYS) {
            buffer.resize(byteCount);
            std::memcpy(buffer.data(), samples.data(), byteCount);
            return true;
        }

        SDL_AudioCVT cvt{};
        const int built = SDL_BuildAudioCVT(&cvt,
                                            AUDIO_S16SYS,
                                            static_cast<Uint8>(deviceChannels_),
                                            deviceRate_,
                                            deviceFormat_,
                                            static_cast<Uint8>(deviceChannels_),
                                            deviceRate_);
        if (built < 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Cannot convert sound %s: %s", SoundName(id), SDL_GetError());
            return false;
        }
        cvt.len = static_cast<int>(byteCount);
        buffer.assign(byteCount * static_cast<std::size_t>(std::max(1, cvt.len_mult)), 0);
        std::memcpy(buffer.data(), samples.data(), byteCount);
        cvt.buf = buffer.data();
        if (SDL_ConvertAudio(&cvt) != 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Cannot convert sound %s: %s", SoundName(id), SDL_GetError());
            return false;
        }
        buffer.resize(static_cast<std::size_t>(cvt.len_cvt));
        return true;
    }

    std::string soundDir_{};
    int deviceRate_{kSynthSampleRate};
    Uint16 deviceFormat_{AUDIO_S16SYS};
    int deviceChannels_{kSynthChannels};
    bool enabled_{false};
    bool ownsSubsystem_{false};
    std::array<Mix_Chunk*, static_cast<std::size_t>(SoundId::Count)> chunks_{};
    std::array<std::vector<Uint8>, static_cast<std::size_t>(SoundId::Count)> buffers_{};
};

class SilentAudio final : public IAudioSystem {
public:
    void initialize() override {}
    void play(SoundId) override {}
    bool enabled() const override { return false; }
    void shutdown() override {}
};

} // namespace

std::unique_ptr<IAudioSystem> CreateSdlMixerAudio(const core::AppConfig& config) {
    return std::make_unique<SdlMixerAudio>(config.soundDir);
}

std::unique_ptr<IAudioSystem> CreateSilentAudio() {
    return std::make_unique<SilentAudio>();
}

} // namespace bomber::audio
