#include "ui/FontFace.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <SFML/System/String.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

#include "logging/Log.h"
#include "ui/PixelCanvas.h"

namespace gridimg::ui {

FontFace::FontFace() {
    if (FT_Init_FreeType(&library_) != 0) {
        library_ = nullptr;
        LOG_ERROR(logging::LogCategory::FONT, "FreeType initialisation failed");
    }
}

FontFace::~FontFace() {
    if (face_ != nullptr) {
        FT_Done_Face(face_);
    }
    if (library_ != nullptr) {
        FT_Done_FreeType(library_);
    }
}

bool FontFace::loadFromFile(const std::string& path) {
    if (library_ == nullptr) {
        return false;
    }
    if (face_ != nullptr) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }

    FT_Face face = nullptr;
    if (const FT_Error err = FT_New_Face(library_, path.c_str(), 0, &face); err != 0) {
        LOG_DEBUG(logging::LogCategory::FONT, "FT_New_Face(%s) failed with %d", path.c_str(), err);
        return false;
    }
    if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) != 0) {
        LOG_DEBUG(logging::LogCategory::FONT, "%s has no Unicode charmap", path.c_str());
        FT_Done_Face(face);
        return false;
    }
    face_ = face;
    return true;
}

// Calls visit(glyphSlot, penX) for every rendered glyph and returns the final pen position.
template <typename GlyphVisitor>
int FontFace::layout_(const std::string& utf8, unsigned pixelSize, GlyphVisitor&& visit) {
    if (face_ == nullptr || FT_Set_Pixel_Sizes(face_, 0, pixelSize) != 0) {
        return 0;
    }

    const sf::String decoded = sf::String::fromUtf8(utf8.begin(), utf8.end());
    const bool kerning = FT_HAS_KERNING(face_);
    FT_UInt previous = 0;
    int pen = 0;
    for (const sf::Uint32 codepoint : decoded) {
        const FT_UInt index = FT_Get_Char_Index(face_, codepoint);
        if (kerning && previous != 0 && index != 0) {
            FT_Vector delta{};
            if (FT_Get_Kerning(face_, previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                pen += static_cast<int>(delta.x >> 6);
            }
        }
        previous = index;

        if (FT_Load_Glyph(face_, index, FT_LOAD_DEFAULT) != 0
            || FT_Render_Glyph(face_->glyph, FT_RENDER_MODE_NORMAL) != 0) {
            continue;
        }
        visit(face_->glyph, pen);
        pen += static_cast<int>(face_->glyph->advance.x >> 6);
    }
    return pen;
}

TextBounds FontFace::measure(const std::string& utf8, unsigned pixelSize) {
    int minX = std::numeric_limits<int>::max();
    int minY = std::numeric_limits<int>::max();
    int maxX = std::numeric_limits<int>::min();
    int maxY = std::numeric_limits<int>::min();

    const int advance = layout_(utf8, pixelSize, [&](FT_GlyphSlot slot, int pen) {
        const FT_Bitmap& bitmap = slot->bitmap;
        if (bitmap.width == 0 || bitmap.rows == 0) {
            return;
        }
        const int left = pen + slot->bitmap_left;
        const int top = -slot->bitmap_top;
        minX = std::min(minX, left);
        minY = std::min(minY, top);
        maxX = std::max(maxX, left + static_cast<int>(bitmap.width));
        maxY = std::max(maxY, top + static_cast<int>(bitmap.rows));
    });

    TextBounds bounds;
    if (minX > maxX) {
        bounds.width = static_cast<float>(advance);
        return bounds;
    }
    bounds.left = static_cast<float>(minX);
    bounds.top = static_cast<float>(minY);
    bounds.width = static_cast<float>(maxX - minX);
    bounds.height = static_cast<float>(maxY - minY);
    return bounds;
}

void FontFace::draw(sf::Image& target,
                    const std::string& utf8,
                    unsigned pixelSize,
                    int penX,
                    int baselineY,
                    const sf::Color& color) {
    layout_(utf8, pixelSize, [&](FT_GlyphSlot slot, int pen) {
        const FT_Bitmap& bitmap = slot->bitmap;
        const int originX = penX + pen + slot->bitmap_left;
        const int originY = baselineY - slot->bitmap_top;

        for (unsigned row = 0; row < bitmap.rows; ++row) {
            const unsigned char* line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
            for (unsigned col = 0; col < bitmap.width; ++col) {
                std::uint8_t coverage = 0;
                if (bitmap.pixel_mode == FT_PIXEL_MODE_GRAY) {
                    coverage = line[col];
                }
                else if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
                    coverage = (line[col >> 3] & (0x80 >> (col & 7))) != 0 ? 255 : 0;
                }
                pixels::blendPixel(target,
                                   originX + static_cast<int>(col),
                                   originY + static_cast<int>(row),
                                   color,
                                   coverage);
            }
        }
    });
}

}  // namespace gridimg::ui
