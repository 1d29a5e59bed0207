#pragma once

#include <cstdint>
#include <string>

namespace bomber::core {

struct AppConfig {
    std::string windowTitle{"BomberFPV"};
    int windowWidth{1100};
    int windowHeight{700};
    int sidebarWidth{320};
    int targetFps{120};
    std::string soundDir{"sounds"};
    bool audioEnabled{true};
    std::uint32_t seed{0};
    bool smoke{false};
    float smokeSeconds{0.75F};
    int smokeFrames{0};
};

class Application {
public:
    explicit Application(AppConfig config);
    ~Application();

    int run();

private:
    void init();
    void shutdown();

    AppConfig config_{};
    bool running_{false};
};

} // namespace bomber::core
