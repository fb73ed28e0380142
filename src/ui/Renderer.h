#pragma once

#include <SFML/Graphics/Image.hpp>

#include <string>

#include "domain/Types.h"
#include "ui/LayoutEngine.h"
#include "ui/ResourceProvider.h"
#include "ui/TimeMarkerCalculator.h"

namespace gridimg::ui {

struct RenderOptions {
    std::string title = "Electricity Grid Availability";
    bool hourLabels = true;
    bool legend = true;
};

// Composes one day's timeline into an in-memory 1024x250 image.
// Layer order is background, segments, marker, text; the same model and clock
// reading always yield the same pixels.
class Renderer {
public:
    explicit Renderer(ResourceProvider& resources, RenderOptions options = {});

    sf::Image render(const domain::StateModel& model, const domain::LocalDateTime& now) const;

private:
    ResourceProvider& resources_;
    RenderOptions options_;
    LayoutEngine layoutEngine_;
    TimeMarkerCalculator markerCalculator_;
};

}  // namespace gridimg::ui
