#pragma once

#include "bomber/core/Application.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bomber::core {

// Options accept both "--name value" and "--name=value".
struct CommandLineArgs {
    bool showHelp{false};   // --help / -h
    bool smoke{false};      // --smoke
    bool mute{false};       // --mute

    std::optional<float> seconds;        // --seconds <s>
    std::optional<int> frames;           // --frames <n>
    std::optional<std::uint32_t> seed;   // --seed <n>
    std::optional<int> width;            // --width <px>
    std::optional<int> height;           // --height <px>

    std::vector<std::string> unknown{};
    std::vector<std::string> errors{};

    bool ok() const { return unknown.empty() && errors.empty(); }
};

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv);
CommandLineArgs ParseCommandLineArgs(int argc, char** argv);
std::string BuildCommandLineHelpText();
void ApplyCommandLineArgs(const CommandLineArgs& args, AppConfig& config);

} // namespace bomber::core
