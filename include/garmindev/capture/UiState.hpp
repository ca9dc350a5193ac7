#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace GD::Capture {

inline constexpr std::string_view kSchemaVersion   = "1.0";
inline constexpr std::string_view kDefaultAppName  = "Garmin App";
inline constexpr std::string_view kDefaultDevice   = "fenix7";
inline constexpr std::string_view kCaptureSource   = "debug_logs";
inline constexpr int              kDefaultScreenSize = 260;

inline constexpr int kTextZIndex   = 10;
inline constexpr int kCircleZIndex = 5;
inline constexpr int kRectZIndex   = 8;

enum class ElementKind {
    Text,
    Circle,
    Rect,
};

[[nodiscard]] constexpr auto element_kind_name(ElementKind kind) -> std::string_view {
    switch (kind) {
    case ElementKind::Text:
        return "text";
    case ElementKind::Circle:
        return "circle";
    case ElementKind::Rect:
        return "rect";
    }
    return "unknown";
}

struct TextAttributes {
    std::string text_content;
    std::string font_family;
    int         font_size = 16;
    std::string font_weight{"normal"};
    std::string text_anchor{"middle"};
};

struct CircleAttributes {
    double radius = 0.0;
};

struct RectAttributes {
    int width  = 0;
    int height = 0;
};

using ElementShape = std::variant<TextAttributes, CircleAttributes, RectAttributes>;

struct Element {
    std::string  id;
    int          x = 0;
    int          y = 0;
    std::string  fill_color{"#000000"};
    int          z_index = 0;
    bool         visible = true;
    double       opacity = 1.0;
    ElementShape shape;

    [[nodiscard]] auto kind() const -> ElementKind {
        return static_cast<ElementKind>(shape.index());
    }
    [[nodiscard]] auto type_name() const -> std::string_view {
        return element_kind_name(kind());
    }
    [[nodiscard]] auto text() const -> TextAttributes const* {
        return std::get_if<TextAttributes>(&shape);
    }
    [[nodiscard]] auto circle() const -> CircleAttributes const* {
        return std::get_if<CircleAttributes>(&shape);
    }
    [[nodiscard]] auto rect() const -> RectAttributes const* {
        return std::get_if<RectAttributes>(&shape);
    }
};

struct Metadata {
    std::string app_name{kDefaultAppName};
    std::string device_model{kDefaultDevice};
    int         screen_width  = kDefaultScreenSize;
    int         screen_height = kDefaultScreenSize;
    std::string timestamp;
    std::string capture_source{kCaptureSource};
};

struct ScreenInfo {
    std::string background_color{"#000000"};
    double      scale_factor = 1.0;
    int         center_x     = kDefaultScreenSize / 2;
    int         center_y     = kDefaultScreenSize / 2;
};

/**
 * Canonical model of the UI reconstructed from one trace log.
 *
 * Elements are kept in discovery order: every text element, then every
 * circle, then every rect. `state` is reserved for projected STATE lines and
 * stays empty.
 */
struct UiStateDocument {
    std::string                        version{kSchemaVersion};
    Metadata                           metadata;
    ScreenInfo                         screen;
    std::vector<Element>               elements;
    std::map<std::string, std::string> state;
};

} // namespace GD::Capture
