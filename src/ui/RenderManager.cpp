#include "ui/RenderManager.h"

#include <algorithm>

#include "logging/Log.h"
#include "ui/PixelCanvas.h"

namespace gridimg::ui {

RenderManager::RenderManager() = default;

RenderManager::~RenderManager() = default;

void RenderManager::addRenderCommand(int z, std::function<void(sf::Image&)> func) {
    commands.emplace_back(z, std::move(func));
}

void RenderManager::render(sf::Image& target, const sf::Color& clearColor) {
    pixels::fill(target, clearColor);

    std::stable_sort(commands.begin(), commands.end(), [](const core::RenderCommand& a, const core::RenderCommand& b) {
        return a.zIndex < b.zIndex;
    });

    LOG_TRACE(logging::LogCategory::RENDER, "Replaying %zu render commands", commands.size());
    for (auto& cmd : commands) {
        cmd.drawFunc(target);
    }

    commands.clear();
}

bool RenderManager::hasCommands() const {
    return !commands.empty();
}

std::size_t RenderManager::commandCount() const {
    return commands.size();
}

}  // namespace gridimg::ui
