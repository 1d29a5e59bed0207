#include "bomber/core/Application.h"
#include "bomber/core/CommandLineArgs.h"

#include <SDL.h>

#include <exception>
#include <string>

int main(int argc, char* argv[]) {
    const bomber::core::CommandLineArgs args = bomber::core::ParseCommandLineArgs(argc, argv);
    if (args.showHelp) {
        SDL_Log("%s", bomber::core::BuildCommandLineHelpText().c_str());
        return 0;
    }
    if (!args.ok()) {
        for (const auto& option : args.unknown) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", option.c_str());
        }
        for (const auto& error : args.errors) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", error.c_str());
        }
        SDL_Log("%s", bomber::core::BuildCommandLineHelpText().c_str());
        return 2;
    }

    bomber::core::AppConfig config{};
    bomber::core::ApplyCommandLineArgs(args, config);

    try {
        bomber::core::Application app{config};
        return app.run();
    } catch (const std::exception& ex) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Fatal: %s", ex.what());
        SDL_Quit();
        return 1;
    }
}
