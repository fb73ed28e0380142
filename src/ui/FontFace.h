#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Image.hpp>

#include <string>

struct FT_LibraryRec_;
struct FT_FaceRec_;

namespace gridimg::ui {

// Ink box of a laid-out string in pixels, relative to the pen origin on the
// baseline; y grows downwards so `top` is negative for glyphs above the line.
struct TextBounds {
    float left{0.0f};
    float top{0.0f};
    float width{0.0f};
    float height{0.0f};
};

// A FreeType face that rasterises glyphs directly into an sf::Image.
// Not thread-safe: one face must only be used by one thread at a time.
class FontFace {
public:
    FontFace();
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    bool loadFromFile(const std::string& path);
    bool loaded() const noexcept { return face_ != nullptr; }

    TextBounds measure(const std::string& utf8, unsigned pixelSize);

    // Pen starts at (penX, baselineY); glyph coverage is blended over the existing pixels.
    void draw(sf::Image& target,
              const std::string& utf8,
              unsigned pixelSize,
              int penX,
              int baselineY,
              const sf::Color& color);

private:
    template <typename GlyphVisitor>
    int layout_(const std::string& utf8, unsigned pixelSize, GlyphVisitor&& visit);

    FT_LibraryRec_* library_{nullptr};
    FT_FaceRec_* face_{nullptr};
};

}  // namespace gridimg::ui
