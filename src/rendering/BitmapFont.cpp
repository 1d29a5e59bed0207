#include "bomber/rendering/BitmapFont.h"

#include <cctype>

namespace bomber::rendering {

namespace {

constexpr std::array<Glyph, 48> kGlyphs{{
    {'A', 3, {"111", "101", "111", "101", "101"}},
    {'B', 3, {"110", "101", "110", "101", "110"}},
    {'C', 3, {"111", "100", "100", "100", "111"}},
    {'D', 3, {"110", "101", "101", "101", "110"}},
    {'E', 3, {"111", "100", "111", "100", "111"}},
    {'F', 3, {"111", "100", "110", "100", "100"}},
    {'G', 3, {"111", "100", "101", "101", "111"}},
    {'H', 3, {"101", "101", "111", "101", "101"}},
    {'I', 3, {"111", "010", "010", "010", "111"}},
    {'J', 5, {"00111", "00010", "00010", "10010", "01100"}},
    {'K', 5, {"10001", "10010", "11100", "10010", "10001"}},
    {'L', 3, {"100", "100", "100", "100", "111"}},
    {'M', 5, {"10001", "11011", "10101", "10001", "10001"}},
    {'N', 5, {"10001", "11001", "10101", "10011", "10001"}},
    {'O', 3, {"111", "101", "101", "101", "111"}},
    {'P', 3, {"111", "101", "111", "100", "100"}},
    {'Q', 5, {"01110", "10001", "10001", "10011", "01111"}},
    {'R', 3, {"110", "101", "110", "101", "101"}},
    {'S', 3, {"111", "100", "111", "001", "111"}},
    {'T', 3, {"111", "010", "010", "010", "010"}},
    {'U', 3, {"101", "101", "101", "101", "111"}},
    {'V', 5, {"10001", "10001", "01010", "01010", "00100"}},
    {'W', 5, {"10001", "10001", "10101", "10101", "01010"}},
    {'X', 5, {"10001", "01010", "00100", "01010", "10001"}},
    {'Y', 5, {"10001", "01010", "00100", "00100", "00100"}},
    {'Z', 5, {"11111", "00010", "00100", "01000", "11111"}},
    {'0', 3, {"111", "101", "101", "101", "111"}},
    {'1', 3, {"010", "110", "010", "010", "111"}},
    {'2', 3, {"111", "001", "111", "100", "111"}},
    {'3', 3, {"111", "001", "111", "001", "111"}},
    {'4', 3, {"101", "101", "111", "001", "001"}},
    {'5', 3, {"111", "100", "111", "001", "111"}},
    {'6', 3, {"111", "100", "111", "101", "111"}},
    {'7', 3, {"111", "001", "010", "010", "010"}},
    {'8', 3, {"111", "101", "111", "101", "111"}},
    {'9', 3, {"111", "101", "111", "001", "111"}},
    {'-', 3, {"000", "000", "111", "000", "000"}},
    {'.', 3, {"000", "000", "000", "000", "010"}},
    {':', 3, {"000", "010", "000", "010", "000"}},
    {'/', 3, {"001", "001", "010", "100", "100"}},
    {'!', 3, {"010", "010", "010", "000", "010"}},
    {',', 3, {"000", "000", "000", "010", "100"}},
    {'\'', 3, {"010", "010", "000", "000", "000"}},
    {'(', 3, {"010", "100", "100", "100", "010"}},
    {')', 3, {"010", "001", "001", "001", "010"}},
    {'[', 3, {"110", "100", "100", "100", "110"}},
    {']', 3, {"011", "001", "001", "001", "011"}},
    {'+', 3, {"000", "010", "111", "010", "000"}},
}};

} // namespace

const Glyph* FindGlyph(char c) {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (const auto& glyph : kGlyphs) {
        if (glyph.symbol == upper) {
            return &glyph;
        }
    }
    return nullptr;
}

int GlyphAdvance(char c) {
    const Glyph* glyph = FindGlyph(c);
    return glyph ? glyph->width + 1 : kBlankAdvance;
}

int MeasureText(std::string_view text, int scale) {
    int width = 0;
    for (char c : text) {
        width += GlyphAdvance(c);
    }
    return width * scale;
}

} // namespace bomber::rendering
