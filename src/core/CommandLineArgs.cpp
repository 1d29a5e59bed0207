#include "bomber/core/CommandLineArgs.h"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace bomber::core {

namespace {

constexpr int kMinWindowWidth = 480;
constexpr int kMinWindowHeight = 240;
constexpr int kSmokeWindowWidth = 640;
constexpr int kSmokeWindowHeight = 360;
constexpr int kSmokeSidebarWidth = 220;

bool takesValue(std::string_view name) {
    return name == "--seconds" || name == "--frames" || name == "--seed" || name == "--width" || name == "--height";
}

template <typename T>
bool parseInteger(std::string_view text, T& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool parseSeconds(std::string_view text, float& out) {
    if (text.empty()) {
        return false;
    }
    const std::string copy{text};
    char* end = nullptr;
    const float value = std::strtof(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
        return false;
    }
    out = value;
    return true;
}

void applyValue(std::string_view name, std::string_view value, CommandLineArgs& args) {
    const auto bad = [&]() { args.errors.push_back(std::string(name) + ": invalid value '" + std::string(value) + "'"); };
    if (name == "--seconds") {
        float seconds = 0.0F;
        if (!parseSeconds(value, seconds) || !(seconds > 0.0F)) {
            bad();
            return;
        }
        args.seconds = seconds;
    } else if (name == "--frames") {
        int frames = 0;
        if (!parseInteger(value, frames) || frames < 0) {
            bad();
            return;
        }
        args.frames = frames;
    } else if (name == "--seed") {
        std::uint32_t seed = 0;
        if (!parseInteger(value, seed)) {
            bad();
            return;
        }
        args.seed = seed;
    } else if (name == "--width" || name == "--height") {
        int side = 0;
        const int minimum = name == "--width" ? kMinWindowWidth : kMinWindowHeight;
        if (!parseInteger(value, side) || side < minimum) {
            bad();
            return;
        }
        if (name == "--width") {
            args.width = side;
        } else {
            args.height = side;
        }
    }
}

} // namespace

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv) {
    CommandLineArgs args{};
    // argv[0] is the program name.
    for (std::size_t i = 1; i < argv.size(); ++i) {
        std::string_view arg = argv[i];
        std::string_view inlineValue{};
        bool hasInlineValue = false;
        if (const auto eq = arg.find('='); eq != std::string_view::npos && arg.rfind("--", 0) == 0) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            hasInlineValue = true;
        }

        if (arg == "--help" || arg == "-h") {
            args.showHelp = true;
        } else if (arg == "--smoke") {
            args.smoke = true;
        } else if (arg == "--mute") {
            args.mute = true;
        } else if (takesValue(arg)) {
            if (hasInlineValue) {
                applyValue(arg, inlineValue, args);
            } else if (i + 1 < argv.size()) {
                applyValue(arg, argv[++i], args);
            } else {
                args.errors.push_back(std::string(arg) + ": missing value");
            }
        } else {
            args.unknown.emplace_back(argv[i]);
        }
    }
    return args;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv) {
    std::vector<std::string_view> view;
    view.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        view.emplace_back(argv[i]);
    }
    return ParseCommandLineArgs(view);
}

std::string BuildCommandLineHelpText() {
    std::ostringstream out;
    out << "BomberFPV - top-down FPV bomber\n"
        << "\n"
        << "Usage: bomberfpv [options]\n"
        << "  --smoke           run a short headless smoke test and exit\n"
        << "  --seconds <s>     smoke test duration in seconds (default 0.75)\n"
        << "  --frames <n>      smoke test frame cap, 0 = no cap\n"
        << "  --seed <n>        random seed, 0 = from the clock\n"
        << "  --mute            disable audio\n"
        << "  --width <px>      window width\n"
        << "  --height <px>     window height\n"
        << "  -h, --help        show this text\n";
    return out.str();
}

void ApplyCommandLineArgs(const CommandLineArgs& args, AppConfig& config) {
    config.smoke = args.smoke;
    if (args.smoke) {
        config.windowWidth = kSmokeWindowWidth;
        config.windowHeight = kSmokeWindowHeight;
        config.sidebarWidth = kSmokeSidebarWidth;
    }
    if (args.mute) {
        config.audioEnabled = false;
    }
    if (args.seconds) {
        config.smokeSeconds = *args.seconds;
    }
    if (args.frames) {
        config.smokeFrames = *args.frames;
    }
    if (args.seed) {
        config.seed = *args.seed;
    }
    if (args.width) {
        config.windowWidth = *args.width;
    }
    if (args.height) {
        config.windowHeight = *args.height;
    }
}

} // namespace bomber::core
