#include "app/RenderService.h"

#include "domain/Calendar.h"
#include "logging/Log.h"
#include "ui/OutputEncoder.h"
#include "ui/ResourceProvider.h"

namespace gridimg::app {

ui::RenderOptions renderOptionsFrom(const config::Config& config) {
    ui::RenderOptions options;
    options.hourLabels = config.hourLabels;
    return options;
}

RenderService::RenderService(const config::Config& config, ui::ResourceProvider& resources)
    : RenderService(domain::InputValidator(config.symbolPolicy),
                    ui::Renderer(resources, renderOptionsFrom(config)),
                    &domain::local_now) {}

RenderService::RenderService(domain::InputValidator validator, ui::Renderer renderer, NowProvider now)
    : validator_(std::move(validator)), renderer_(std::move(renderer)), now_(std::move(now)) {
    if (!now_) {
        now_ = &domain::local_now;
    }
}

domain::StateModel RenderService::validate(const boost::json::value& input) const {
    return validator_.validate(input);
}

domain::RenderedImage RenderService::render(const domain::StateModel& model) const {
    const domain::LocalDateTime now = now_();
    const sf::Image canvas = renderer_.render(model, now);
    return ui::OutputEncoder::encodePng(canvas);
}

domain::RenderedImage RenderService::renderPng(const boost::json::value& input) const {
    const domain::StateModel model = validate(input);
    LOG_INFO(logging::LogCategory::RENDER, "Rendering timeline for %s", domain::format_date(model.date).c_str());
    return render(model);
}

void RenderService::renderToFile(const boost::json::value& input, const std::filesystem::path& path) const {
    const auto image = renderPng(input);
    ui::OutputEncoder::writeToFile(image, path);
}

std::string RenderService::renderToBase64(const boost::json::value& input) const {
    const auto image = renderPng(input);
    return ui::OutputEncoder::toBase64(image);
}

}  // namespace gridimg::app
