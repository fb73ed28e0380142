#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include "config/Config.h"
#include "domain/InputValidator.h"
#include "domain/Types.h"
#include "ui/Renderer.h"

namespace gridimg::app {

// Validate -> render -> encode, with one clock reading per request.
class RenderService {
public:
    using NowProvider = std::function<domain::LocalDateTime()>;

    RenderService(const config::Config& config, ui::ResourceProvider& resources);
    RenderService(domain::InputValidator validator, ui::Renderer renderer, NowProvider now);

    domain::StateModel validate(const boost::json::value& input) const;

    domain::RenderedImage render(const domain::StateModel& model) const;
    domain::RenderedImage renderPng(const boost::json::value& input) const;

    void renderToFile(const boost::json::value& input, const std::filesystem::path& path) const;
    std::string renderToBase64(const boost::json::value& input) const;

private:
    domain::InputValidator validator_;
    ui::Renderer renderer_;
    NowProvider now_;
};

ui::RenderOptions renderOptionsFrom(const config::Config& config);

}  // namespace gridimg::app
