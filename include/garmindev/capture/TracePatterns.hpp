#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GD::Capture {

struct ScreenMatch {
    int width    = 0;
    int height   = 0;
    int center_x = 0;
    int center_y = 0;
};

struct TextMatch {
    std::string name;
    std::string content;
    int         x = 0;
    int         y = 0;
    std::string font;
    std::string color;
};

struct CircleMatch {
    std::string name;
    std::string content;
    int         x    = 0;
    int         y    = 0;
    double      size = 0.0;
    std::string color;
};

struct RectMatch {
    std::string                name;
    std::optional<std::string> content;
    int                        x      = 0;
    int                        y      = 0;
    int                        width  = 0;
    int                        height = 0;
    std::string                color;
};

// LAYOUT: and STATE: lines. Recognized so they never leak into the other
// categories, but not projected into the document.
struct LabelMatch {
    std::string name;
    std::string content;
};

struct TraceMatches {
    std::optional<ScreenMatch> screen;
    std::vector<TextMatch>     texts;
    std::vector<CircleMatch>   circles;
    std::vector<RectMatch>     rects;
    std::vector<LabelMatch>    layouts;
    std::vector<LabelMatch>    states;
};

// Each matcher scans the whole text on its own; a line may satisfy more than
// one category and every category that matches reports it.
[[nodiscard]] auto MatchScreen(std::string_view log) -> std::optional<ScreenMatch>;
[[nodiscard]] auto MatchTexts(std::string_view log) -> std::vector<TextMatch>;
[[nodiscard]] auto MatchCircles(std::string_view log) -> std::vector<CircleMatch>;
[[nodiscard]] auto MatchRects(std::string_view log) -> std::vector<RectMatch>;
[[nodiscard]] auto MatchLayouts(std::string_view log) -> std::vector<LabelMatch>;
[[nodiscard]] auto MatchStates(std::string_view log) -> std::vector<LabelMatch>;

[[nodiscard]] auto MatchAll(std::string_view log) -> TraceMatches;

} // namespace GD::Capture
