#include "ui/OutputEncoder.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include "domain/Errors.h"
#include "logging/Log.h"

namespace gridimg::ui {

namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::OUTPUT;

std::string describeErrno(int err) {
    return err != 0 ? std::strerror(err) : "unknown I/O error";
}
}  // namespace

domain::RenderedImage OutputEncoder::encodePng(const sf::Image& canvas) {
    std::vector<sf::Uint8> encoded;
    if (!canvas.saveToMemory(encoded, "png") || encoded.empty()) {
        throw domain::RenderError(domain::ErrorKind::OutputWriteFailure, "PNG encoding failed");
    }

    domain::RenderedImage image;
    image.bytes.assign(encoded.begin(), encoded.end());
    image.width = canvas.getSize().x;
    image.height = canvas.getSize().y;
    LOG_DEBUG(kLogCategory, "Encoded PNG %ux%u (%zu bytes)", image.width, image.height, image.size());
    return image;
}

void OutputEncoder::writeToFile(const domain::RenderedImage& image, const std::filesystem::path& path) {
    if (path.empty()) {
        throw domain::RenderError(domain::ErrorKind::OutputWriteFailure, "Output path is empty");
    }

    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw domain::RenderError(domain::ErrorKind::OutputWriteFailure,
                                  "Cannot open " + path.string() + " for writing: " + describeErrno(errno));
    }

    out.write(reinterpret_cast<const char*>(image.bytes.data()), static_cast<std::streamsize>(image.bytes.size()));
    out.flush();
    if (!out) {
        throw domain::RenderError(domain::ErrorKind::OutputWriteFailure,
                                  "Failed writing " + path.string() + ": " + describeErrno(errno));
    }

    LOG_INFO(kLogCategory, "Wrote %zu bytes to %s", image.size(), path.string().c_str());
}

std::string OutputEncoder::toBase64(const domain::RenderedImage& image) {
    return base64Encode(image.bytes.data(), image.bytes.size());
}

std::string OutputEncoder::base64Encode(const std::uint8_t* data, std::size_t len) {
    static constexpr char chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((len + 2) / 3) * 4);

    for (std::size_t i = 0; i < len; i += 3) {
        const std::uint32_t octetA = data[i];
        const std::uint32_t octetB = (i + 1 < len) ? data[i + 1] : 0U;
        const std::uint32_t octetC = (i + 2 < len) ? data[i + 2] : 0U;

        const std::uint32_t triple = (octetA << 16) | (octetB << 8) | octetC;

        output.push_back(chars[(triple >> 18) & 0x3FU]);
        output.push_back(chars[(triple >> 12) & 0x3FU]);
        output.push_back(i + 1 < len ? chars[(triple >> 6) & 0x3FU] : '=');
        output.push_back(i + 2 < len ? chars[triple & 0x3FU] : '=');
    }

    return output;
}

}  // namespace gridimg::ui
