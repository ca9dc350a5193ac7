#include <garmindev/capture/UiStateBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace GD::Capture {

namespace {

struct FontSizeEntry {
    std::string_view token;
    int              size;
};

constexpr std::array<FontSizeEntry, 4> kFontSizes{{
    {"LARGE", 24},
    {"MEDIUM", 18},
    {"SMALL", 14},
    {"XTINY", 10},
}};

constexpr int kDefaultFontSize = 16;

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

auto to_upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return out;
}

auto make_defaults(BuildOptions const& options) -> UiStateDocument {
    UiStateDocument document;
    if (options.device && !options.device->empty()) {
        document.metadata.device_model = *options.device;
    }
    document.metadata.timestamp =
        FormatCaptureTimestamp(options.capture_time.value_or(std::chrono::system_clock::now()));
    return document;
}

void apply_screen(ScreenMatch const& screen, UiStateDocument& document) {
    document.metadata.screen_width  = screen.width;
    document.metadata.screen_height = screen.height;
    document.screen.center_x        = screen.center_x;
    document.screen.center_y        = screen.center_y;
}

// Each pass takes the next free sequence number and returns the one after
// its last element, so ids run text -> circle -> rect without shared state.
auto append_texts(std::vector<TextMatch> const& texts,
                  std::size_t next_id,
                  std::vector<Element>& out) -> std::size_t {
    for (auto const& match : texts) {
        Element element;
        element.id         = MakeElementId(match.name, next_id++);
        element.x          = match.x;
        element.y          = match.y;
        element.fill_color = NormalizeColor(match.color);
        element.z_index    = kTextZIndex;
        element.shape      = TextAttributes{.text_content = match.content,
                                            .font_family  = to_lower(match.font),
                                            .font_size    = FontSizeForToken(match.font),
                                            .font_weight  = std::string(FontWeightForToken(match.font)),
                                            .text_anchor  = "middle"};
        out.push_back(std::move(element));
    }
    return next_id;
}

auto append_circles(std::vector<CircleMatch> const& circles,
                    std::size_t next_id,
                    std::vector<Element>& out) -> std::size_t {
    for (auto const& match : circles) {
        Element element;
        element.id         = MakeElementId(match.name, next_id++);
        element.x          = match.x;
        element.y          = match.y;
        element.fill_color = NormalizeColor(match.color);
        element.z_index    = kCircleZIndex;
        element.shape      = CircleAttributes{.radius = match.size};
        out.push_back(std::move(element));
    }
    return next_id;
}

auto append_rects(std::vector<RectMatch> const& rects,
                  std::size_t next_id,
                  std::vector<Element>& out) -> std::size_t {
    for (auto const& match : rects) {
        Element element;
        element.id         = MakeElementId(match.name, next_id++);
        element.x          = match.x;
        element.y          = match.y;
        element.fill_color = NormalizeColor(match.color);
        element.z_index    = kRectZIndex;
        element.shape      = RectAttributes{.width = match.width, .height = match.height};
        out.push_back(std::move(element));
    }
    return next_id;
}

} // namespace

auto NormalizeColor(std::string_view token) -> std::string {
    if (!token.starts_with("0x")) {
        return std::string(token);
    }
    auto        digits = token.substr(2);
    std::string color{"#"};
    if (digits.size() < 6) {
        color.append(6 - digits.size(), '0');
    }
    color.append(digits);
    return color;
}

auto FontSizeForToken(std::string_view font) -> int {
    auto const upper = to_upper(font);
    for (auto const& entry : kFontSizes) {
        if (entry.token == upper) {
            return entry.size;
        }
    }
    return kDefaultFontSize;
}

auto FontWeightForToken(std::string_view font) -> std::string_view {
    return font.find("LARGE") != std::string_view::npos ? "bold" : "normal";
}

auto MakeElementId(std::string_view name, std::size_t sequence) -> std::string {
    return to_lower(name) + "_" + std::to_string(sequence);
}

auto FormatCaptureTimestamp(std::chrono::system_clock::time_point when) -> std::string {
    auto const seconds = std::chrono::floor<std::chrono::seconds>(when);
    auto const micros  = std::chrono::duration_cast<std::chrono::microseconds>(when - seconds).count();
    auto const timeT   = std::chrono::system_clock::to_time_t(seconds);
    std::tm    utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << micros << 'Z';
    return oss.str();
}

auto BuildUiState(TraceMatches const& matches, BuildOptions const& options) -> UiStateDocument {
    auto document = make_defaults(options);

    if (matches.screen) {
        apply_screen(*matches.screen, document);
    }

    auto& elements = document.elements;
    elements.reserve(matches.texts.size() + matches.circles.size() + matches.rects.size());

    std::size_t next_id = 1;
    next_id = append_texts(matches.texts, next_id, elements);
    next_id = append_circles(matches.circles, next_id, elements);
    next_id = append_rects(matches.rects, next_id, elements);

    gd_log("Built document with " + std::to_string(elements.size()) + " elements for "
               + document.metadata.device_model,
           "UiStateBuilder");
    if (!matches.layouts.empty() || !matches.states.empty()) {
        gd_log("Ignoring " + std::to_string(matches.layouts.size()) + " layout and "
                   + std::to_string(matches.states.size()) + " state lines",
               "UiStateBuilder");
    }
    return document;
}

auto ParseTraceLog(std::string_view log, BuildOptions const& options) -> UiStateDocument {
    return BuildUiState(MatchAll(log), options);
}

} // namespace GD::Capture
