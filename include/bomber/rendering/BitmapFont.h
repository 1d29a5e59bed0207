#pragma once

#include <array>
#include <string_view>

namespace bomber::rendering {

inline constexpr int kGlyphRows = 5;
// Horizontal advance, in font pixels, of characters without a glyph (space included).
inline constexpr int kBlankAdvance = 4;

// One character of the built-in 5-row pixel font. '1' marks a lit pixel.
struct Glyph {
    char symbol{' '};
    int width{3};
    std::array<const char*, kGlyphRows> rows{};
};

// Letters are matched case-insensitively. Returns nullptr for characters the
// font does not draw.
const Glyph* FindGlyph(char c);

int GlyphAdvance(char c);
int MeasureText(std::string_view text, int scale);

} // namespace bomber::rendering
