#pragma once

#include <SFML/Graphics/Image.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "domain/Types.h"

namespace gridimg::ui {

class OutputEncoder {
public:
    // Lossless PNG of the whole canvas.
    static domain::RenderedImage encodePng(const sf::Image& canvas);

    // Creates or truncates `path`; throws RenderError(OutputWriteFailure) on any I/O error.
    static void writeToFile(const domain::RenderedImage& image, const std::filesystem::path& path);

    // Standard alphabet with padding, no line breaks.
    static std::string toBase64(const domain::RenderedImage& image);
    static std::string base64Encode(const std::uint8_t* data, std::size_t len);
};

}  // namespace gridimg::ui
