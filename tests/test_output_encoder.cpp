#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <SFML/Graphics/Image.hpp>

#include "domain/Errors.h"
#include "ui/OutputEncoder.h"

using gridimg::domain::ErrorKind;
using gridimg::domain::RenderError;
using gridimg::ui::OutputEncoder;

namespace {

std::vector<std::uint8_t> decodeBase64(const std::string& text) {
    static const std::string kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::vector<std::uint8_t> out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (const char ch : text) {
        if (ch == '=') {
            break;
        }
        const auto pos = kAlphabet.find(ch);
        if (pos == std::string::npos) {
            return {};
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(pos);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFU));
        }
    }
    return out;
}

std::string encode(const std::string& text) {
    return OutputEncoder::base64Encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace

int main() {
    if (encode("Man") != "TWFu" || encode("Ma") != "TWE=" || encode("M") != "TQ==" || !encode("").empty()) {
        std::cerr << "base64Encode does not match RFC 4648 vectors\n";
        return 1;
    }

    sf::Image canvas;
    canvas.create(1024, 250, sf::Color::White);
    for (unsigned x = 100; x < 200; ++x) {
        for (unsigned y = 104; y < 136; ++y) {
            canvas.setPixel(x, y, sf::Color(255, 59, 48));
        }
    }

    const auto image = OutputEncoder::encodePng(canvas);
    const std::uint8_t signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (image.size() < sizeof(signature) || !std::equal(std::begin(signature), std::end(signature), image.bytes.begin())) {
        std::cerr << "Encoded bytes are not a PNG\n";
        return 1;
    }
    if (image.width != 1024 || image.height != 250) {
        std::cerr << "Unexpected encoded size " << image.width << "x" << image.height << "\n";
        return 1;
    }

    // Lossless: decoding yields the same pixels.
    sf::Image decoded;
    if (!decoded.loadFromMemory(image.bytes.data(), image.bytes.size())
        || decoded.getPixel(150, 120) != sf::Color(255, 59, 48) || decoded.getPixel(10, 10) != sf::Color::White) {
        std::cerr << "PNG did not round-trip losslessly\n";
        return 1;
    }

    // File output and base64 output carry the same bytes.
    const auto path = std::filesystem::temp_directory_path() / "gridimg_test_output_encoder.png";
    OutputEncoder::writeToFile(image, path);
    std::ifstream in(path, std::ios::binary);
    const std::vector<std::uint8_t> fileBytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::filesystem::remove(path);

    if (fileBytes != image.bytes) {
        std::cerr << "File bytes differ from the encoded image\n";
        return 1;
    }
    if (decodeBase64(OutputEncoder::toBase64(image)) != fileBytes) {
        std::cerr << "Base64 payload does not decode to the file bytes\n";
        return 1;
    }

    try {
        OutputEncoder::writeToFile(image, "/nonexistent-gridimg-dir/out.png");
        std::cerr << "Expected a write failure for a missing directory\n";
        return 1;
    }
    catch (const RenderError& ex) {
        if (ex.kind() != ErrorKind::OutputWriteFailure) {
            std::cerr << "Unexpected error kind: " << ex.code() << "\n";
            return 1;
        }
    }

    std::cout << "test_output_encoder passed\n";
    return 0;
}
