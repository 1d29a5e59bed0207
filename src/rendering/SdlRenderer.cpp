#include "bomber/rendering/Renderer.h"

#include "bomber/rendering/BitmapFont.h"

#include "bomber/core/Application.h"

#include <SDL.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bomber::rendering {

namespace {

constexpr float kTwoPi = 6.28318530718F;
constexpr int kTextScale = 2;
constexpr int kTitleScale = 3;

constexpr SDL_Color kWhite{240, 240, 240, 255};
constexpr SDL_Color kBlack{20, 20, 20, 255};
constexpr SDL_Color kGray{70, 70, 70, 255};
constexpr SDL_Color kDark{30, 30, 30, 255};
constexpr SDL_Color kSidebar{18, 18, 18, 255};
constexpr SDL_Color kYellow{235, 220, 90, 255};
constexpr SDL_Color kCyan{80, 210, 230, 255};
constexpr SDL_Color kGreen{70, 220, 120, 255};
constexpr SDL_Color kMuted{160, 160, 160, 255};

SDL_Color ToSdl(const entities::Rgb& rgb) {
    return SDL_Color{rgb.r, rgb.g, rgb.b, 255};
}

SDL_Color WithAlpha(SDL_Color color, float alpha) {
    color.a = static_cast<Uint8>(std::clamp(alpha * 255.0F, 0.0F, 255.0F));
    return color;
}

std::string FormatFixed(float value, int decimals) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

class SdlRenderer final : public IRenderer {
public:
    explicit SdlRenderer(core::AppConfig config) : config_{std::move(config)} {}

    void initialize() override {
        if ((SDL_WasInit(SDL_INIT_VIDEO) & SDL_INIT_VIDEO) == 0) {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
                throw std::runtime_error(std::string("Failed to init SDL: ") + SDL_GetError());
            }
        }

        window_ = SDL_CreateWindow(config_.windowTitle.c_str(),
                                   SDL_WINDOWPOS_CENTERED,
                                   SDL_WINDOWPOS_CENTERED,
                                   config_.windowWidth,
                                   config_.windowHeight,
                                   SDL_WINDOW_SHOWN);
        if (!window_) {
            throw std::runtime_error(std::string("Failed to create window: ") + SDL_GetError());
        }

        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer_) {
            // The dummy video driver used by the smoke run only has the software renderer.
            SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "Accelerated renderer unavailable (%s), using software", SDL_GetError());
            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
            throw std::runtime_error(std::string("Failed to create renderer: ") + SDL_GetError());
        }

        SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    }

    void render(const game::SimulationState& state, const HudState& hud) override {
        setColor(kBlack);
        SDL_RenderClear(renderer_);

        const world::Playfield& play = state.playfield;
        const SDL_Rect playRect{static_cast<int>(play.left),
                                static_cast<int>(play.top),
                                static_cast<int>(play.width()),
                                static_cast<int>(play.height())};
        setColor(kDark);
        SDL_RenderFillRect(renderer_, &playRect);

        drawTargets(state.targets);
        drawBombs(state.bombs);
        drawDrone(state.drone);
        drawFloatingNumbers(hud);
        if (hud.smokeRun) {
            drawText("SMOKE TEST...", playRect.x + 8, playRect.y + 8, kTextScale, kWhite);
        }

        drawSidebar(playRect, hud);
        drawMessageBanner(playRect, hud);
        if (hud.upgradeMenuOpen) {
            drawUpgradeOverlay(playRect, hud);
        }

        SDL_RenderPresent(renderer_);
    }

    void shutdown() override {
        if (renderer_) {
            SDL_DestroyRenderer(renderer_);
            renderer_ = nullptr;
        }
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }

private:
    void setColor(SDL_Color color) {
        SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    }

    void drawTargets(const std::vector<entities::Target>& targets) {
        for (const auto& target : targets) {
            const int cx = static_cast<int>(target.position.x);
            const int cy = static_cast<int>(target.position.y);
            const int r = static_cast<int>(target.radius);
            const SDL_Color color = ToSdl(target.color);
            fillCircle(cx, cy, r, color);
            if (target.kind == entities::TargetKind::Tent) {
                setColor(color);
                SDL_Rect body{cx - r, cy - r, r * 2, r * 2};
                SDL_RenderFillRect(renderer_, &body);
            } else if (target.kind == entities::TargetKind::Vehicle) {
                setColor(color);
                SDL_Rect hull{cx - r, cy - r / 2, r * 2, r};
                SDL_RenderFillRect(renderer_, &hull);
            }
        }
    }

    void drawBombs(const std::vector<entities::Bomb>& bombs) {
        for (const auto& bomb : bombs) {
            // Altitude ring shrinks as the bomb falls.
            const float k = bomb.fallTime > 0.0F ? std::clamp(bomb.tLeft / bomb.fallTime, 0.0F, 1.0F) : 0.0F;
            const int radius = static_cast<int>(6.0F + 18.0F * k);
            drawCircle(static_cast<int>(bomb.position.x), static_cast<int>(bomb.position.y), radius, 2, kWhite);
        }
    }

    void drawDrone(const entities::Drone& drone) {
        const int cx = static_cast<int>(drone.position().x);
        const int cy = static_cast<int>(drone.position().y);
        fillCircle(cx, cy, 9, kWhite);
        const int hx = static_cast<int>(drone.position().x + std::cos(drone.heading()) * 16.0F);
        const int hy = static_cast<int>(drone.position().y + std::sin(drone.heading()) * 16.0F);
        drawThickLine(cx, cy, hx, hy, 3, kWhite);
        drawCircle(cx, cy, static_cast<int>(drone.stats().bombRadius), 1, SDL_Color{255, 255, 255, 60});
    }

    void drawFloatingNumbers(const HudState& hud) {
        for (const auto& entry : hud.floatingNumbers) {
            if (entry.alpha <= 0.01F) {
                continue;
            }
            const std::string text = "+" + std::to_string(std::max(0, entry.amount));
            const int width = MeasureText(text, kTextScale);
            drawText(text,
                     static_cast<int>(std::round(entry.x)) - width / 2,
                     static_cast<int>(std::round(entry.y)) - kGlyphRows * kTextScale,
                     kTextScale,
                     WithAlpha(kGreen, entry.alpha));
        }
    }

    void drawSidebar(const SDL_Rect& playRect, const HudState& hud) {
        const int sidebarX = playRect.x + playRect.w;
        SDL_Rect sidebar{sidebarX, 0, config_.windowWidth - sidebarX, config_.windowHeight};
        setColor(kSidebar);
        SDL_RenderFillRect(renderer_, &sidebar);
        setColor(kGray);
        SDL_Rect divider{sidebarX, 0, 2, config_.windowHeight};
        SDL_RenderFillRect(renderer_, &divider);

        const int x0 = sidebarX + 16;
        int y = 16;
        drawText("BOMBERFPV", x0, y, kTitleScale, kWhite);
        y += 28;
        drawText("FRONTLINE EDITION", x0, y, kTextScale, kYellow);
        y += 30;

        drawText("SCORE: " + std::to_string(hud.score), x0, y, kTitleScale, kWhite);
        y += 34;

        const std::string reload = hud.reloadReady ? "READY" : FormatFixed(hud.reloadLeft, 2) + "S";
        drawText("DROP (SPACE): " + reload, x0, y, kTextScale, hud.reloadReady ? kGreen : kWhite);
        y += 26;
        drawText("SPEED: " + FormatFixed(hud.speed, 0), x0, y, kTextScale, kWhite);
        y += 22;
        drawText("RELOAD: " + FormatFixed(hud.reloadTime, 2) + "S", x0, y, kTextScale, kWhite);
        y += 22;
        drawText("RADIUS: " + FormatFixed(hud.bombRadius, 0), x0, y, kTextScale, kWhite);
        y += 22;
        drawText("FALL TIME: " + FormatFixed(hud.bombFallTime, 2) + "S", x0, y, kTextScale, kWhite);
        y += 30;

        drawText("SCORE TABLE:", x0, y, kTextScale, kWhite);
        y += 24;
        for (const auto& row : hud.scoreTable) {
            fillCircle(x0 + 6, y + 5, 6, ToSdl(row.color));
            drawText(row.name + " - " + std::to_string(row.points), x0 + 20, y, kTextScale, kWhite);
            y += 22;
        }

        y += 14;
        drawText("CONTROLS:", x0, y, kTextScale, kWhite);
        y += 24;
        drawText("WASD/ARROWS - FLY", x0, y, kTextScale, kWhite);
        y += 20;
        drawText("SPACE - DROP", x0, y, kTextScale, kWhite);
        y += 20;
        drawText("U - UPGRADES", x0, y, kTextScale, kWhite);
        y += 20;
        drawText("ESC - EXIT/CLOSE MENU", x0, y, kTextScale, kWhite);

        const int fps = std::max(0, static_cast<int>(std::round(hud.perfFps)));
        drawText("FPS " + std::to_string(fps), x0, config_.windowHeight - 24, kTextScale, kMuted);
    }

    void drawMessageBanner(const SDL_Rect& playRect, const HudState& hud) {
        if (hud.message.empty() || hud.messageAlpha <= 0.01F) {
            return;
        }
        const int width = MeasureText(hud.message, kTextScale);
        const int x = playRect.x + playRect.w / 2 - width / 2;
        const int y = playRect.y + 40 - (kGlyphRows * kTextScale) / 2;
        SDL_Rect bg{x - 10, y - 5, width + 20, kGlyphRows * kTextScale + 10};
        setColor(WithAlpha(SDL_Color{0, 0, 0, 255}, 0.7F * hud.messageAlpha));
        SDL_RenderFillRect(renderer_, &bg);
        drawText(hud.message, x, y, kTextScale, WithAlpha(kCyan, hud.messageAlpha));
    }

    void drawUpgradeOverlay(const SDL_Rect& playRect, const HudState& hud) {
        setColor(SDL_Color{0, 0, 0, 180});
        SDL_RenderFillRect(renderer_, &playRect);

        const int panelW = std::min(560, playRect.w - 20);
        const int panelH = 300;
        const int px = playRect.x + playRect.w / 2 - panelW / 2;
        const int py = playRect.y + playRect.h / 2 - panelH / 2;
        SDL_Rect panel{px, py, panelW, panelH};
        setColor(SDL_Color{15, 15, 15, 255});
        SDL_RenderFillRect(renderer_, &panel);
        setColor(kGray);
        SDL_RenderDrawRect(renderer_, &panel);

        int y = py + 18;
        drawText("UPGRADES (1/2/3). U/ESC - CLOSE.", px + 18, y, kTextScale, kWhite);
        y += 44;
        for (const auto& row : hud.upgradeRows) {
            const std::string line = "[" + row.key + "] " + row.label + "  (LV " + std::to_string(row.level)
                + ")  COST: " + std::to_string(row.cost);
            drawText(line, px + 20, y, kTextScale, row.affordable ? kWhite : kMuted);
            y += 34;
        }
        y += 10;
        drawText("NOTE: THE BOMB FALLS ABOUT " + FormatFixed(hud.bombFallTime, 2) + "S - DROP A BIT EARLY.",
                 px + 20,
                 y,
                 kTextScale,
                 SDL_Color{200, 200, 200, 255});
        y += 24;
        drawText("REMEMBER: EVERY BOMB HAS AN ADDRESS!", px + 20, y, kTextScale, SDL_Color{180, 180, 255, 255});
    }

    void fillCircle(int cx, int cy, int radius, SDL_Color color) {
        if (radius <= 0) {
            return;
        }
        setColor(color);
        for (int dy = -radius; dy <= radius; ++dy) {
            const int dx = static_cast<int>(std::sqrt(static_cast<float>(radius * radius - dy * dy)));
            SDL_RenderDrawLine(renderer_, cx - dx, cy + dy, cx + dx, cy + dy);
        }
    }

    void drawCircle(int cx, int cy, int radius, int thickness, SDL_Color color) {
        setColor(color);
        for (int t = 0; t < thickness; ++t) {
            const int r = radius - t;
            if (r <= 0) {
                break;
            }
            const int segments = std::max(16, r * 4);
            circlePoints_.resize(static_cast<std::size_t>(segments) + 1);
            for (int i = 0; i <= segments; ++i) {
                const float angle = kTwoPi * static_cast<float>(i) / static_cast<float>(segments);
                circlePoints_[static_cast<std::size_t>(i)] =
                    SDL_Point{cx + static_cast<int>(std::round(std::cos(angle) * static_cast<float>(r))),
                              cy + static_cast<int>(std::round(std::sin(angle) * static_cast<float>(r)))};
            }
            SDL_RenderDrawLines(renderer_, circlePoints_.data(), segments + 1);
        }
    }

    void drawThickLine(int x1, int y1, int x2, int y2, int thickness, SDL_Color color) {
        setColor(color);
        const float dx = static_cast<float>(x2 - x1);
        const float dy = static_cast<float>(y2 - y1);
        const float length = std::hypot(dx, dy);
        if (length <= 0.0F) {
            return;
        }
        const float nx = -dy / length;
        const float ny = dx / length;
        for (int i = 0; i < thickness; ++i) {
            const float offset = static_cast<float>(i) - static_cast<float>(thickness - 1) * 0.5F;
            const int ox = static_cast<int>(std::round(nx * offset));
            const int oy = static_cast<int>(std::round(ny * offset));
            SDL_RenderDrawLine(renderer_, x1 + ox, y1 + oy, x2 + ox, y2 + oy);
        }
    }

    void drawText(const std::string& text, int x, int y, int scale, SDL_Color color) {
        setColor(color);
        int cursorX = x;
        for (char c : text) {
            if (const Glyph* glyph = FindGlyph(c)) {
                drawGlyph(*glyph, cursorX, y, scale);
            }
            cursorX += GlyphAdvance(c) * scale;
        }
    }

    void drawGlyph(const Glyph& glyph, int x, int y, int scale) {
        for (int row = 0; row < kGlyphRows; ++row) {
            const char* bits = glyph.rows[static_cast<std::size_t>(row)];
            for (int col = 0; col < glyph.width; ++col) {
                if (bits[col] == '1') {
                    SDL_Rect rect{x + col * scale, y + row * scale, scale, scale};
                    SDL_RenderFillRect(renderer_, &rect);
                }
            }
        }
    }

    core::AppConfig config_{};
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    std::vector<SDL_Point> circlePoints_{};
};

} // namespace

std::unique_ptr<IRenderer> CreateSdlRenderer(const core::AppConfig& config) {
    return std::make_unique<SdlRenderer>(config);
}

} // namespace bomber::rendering
