#include <garmindev/capture/TracePatterns.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace GD::Capture {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_word(char c) -> bool {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_hex(char c) -> bool {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto is_decimal(char c) -> bool {
    return is_digit(c) || c == '.';
}

// Forward-only reader over the log. Every grammar piece after the bracketed
// prefix is deterministic, so a failed read never needs to back up.
class Cursor {
public:
    Cursor(std::string_view text, std::size_t position)
        : text_(text), position_(position) {}

    auto position() const -> std::size_t { return position_; }

    auto literal(std::string_view token) -> bool {
        if (!text_.substr(position_).starts_with(token)) {
            return false;
        }
        position_ += token.size();
        return true;
    }

    template <typename Pred>
    auto run(Pred pred) -> std::optional<std::string_view> {
        auto end = position_;
        while (end < text_.size() && pred(text_[end])) {
            ++end;
        }
        if (end == position_) {
            return std::nullopt;
        }
        auto token = text_.substr(position_, end - position_);
        position_  = end;
        return token;
    }

    auto word() { return run(is_word); }
    auto digits() { return run(is_digit); }

    // Non-empty content up to the first ')', which is consumed. Newlines count
    // as content.
    auto until_close() -> std::optional<std::string_view> {
        auto close = text_.find(')', position_);
        if (close == std::string_view::npos || close == position_) {
            return std::nullopt;
        }
        auto content = text_.substr(position_, close - position_);
        position_    = close + 1;
        return content;
    }

    // "0x" followed by hex digits; lowercase x only.
    auto color() -> std::optional<std::string_view> {
        auto const start = position_;
        if (!literal("0x") || !run(is_hex)) {
            return std::nullopt;
        }
        return text_.substr(start, position_ - start);
    }

private:
    std::string_view text_;
    std::size_t      position_;
};

// Captures are plain digit runs; anything wider than int saturates.
auto to_int(std::string_view digits) -> int {
    std::int64_t value  = 0;
    auto         result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec == std::errc::result_out_of_range || value > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    if (result.ec != std::errc{}) {
        return 0;
    }
    return static_cast<int>(value);
}

auto to_decimal(std::string_view token) -> std::optional<double> {
    double      value  = 0.0;
    auto const* last   = token.data() + token.size();
    auto        result = std::from_chars(token.data(), last, value, std::chars_format::fixed);
    if (result.ptr != last) {
        return std::nullopt;
    }
    if (result.ec == std::errc::result_out_of_range) {
        // Well-formed but outside double: a non-zero integer part overflowed,
        // anything else underflowed.
        auto const integer_part = token.substr(0, token.find('.'));
        bool const overflowed   = integer_part.find_first_not_of('0') != std::string_view::npos;
        return overflowed ? std::numeric_limits<double>::infinity() : 0.0;
    }
    if (result.ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

auto read_position(Cursor& cursor) -> std::optional<std::pair<int, int>> {
    if (!cursor.literal(" Position(")) {
        return std::nullopt;
    }
    auto x = cursor.digits();
    if (!x || !cursor.literal(",")) {
        return std::nullopt;
    }
    auto y = cursor.digits();
    if (!y || !cursor.literal(")")) {
        return std::nullopt;
    }
    return std::pair{to_int(*x), to_int(*y)};
}

auto read_color(Cursor& cursor) -> std::optional<std::string_view> {
    if (!cursor.literal(" Color(")) {
        return std::nullopt;
    }
    auto color = cursor.color();
    if (!color || !cursor.literal(")")) {
        return std::nullopt;
    }
    return color;
}

// Walks the log for "[...]<keyword>" openings and hands each one to `tail`,
// positioned just past the keyword. The bracketed prefix never crosses a
// newline; it opens at the first '[' of its line (or after the previous
// match) and closes at the earliest ']' whose tail succeeds. When `tail`
// reports a match the walk resumes where the match ended. The walk is linear
// in the log apart from the tails' own reads.
template <typename Tail>
void scan_traces(std::string_view log,
                 std::string_view keyword,
                 Tail&&           tail,
                 std::size_t      limit = std::numeric_limits<std::size_t>::max()) {
    std::size_t found   = 0;
    bool        bracket = false;
    std::size_t i       = 0;
    while (i < log.size() && found < limit) {
        char const c = log[i];
        if (c == '\n') {
            bracket = false;
        } else if (c == '[') {
            bracket = true;
        } else if (c == ']' && bracket && log.substr(i).starts_with(keyword)) {
            Cursor cursor{log, i + keyword.size()};
            if (tail(cursor)) {
                ++found;
                bracket = false;
                i       = cursor.position();
                continue;
            }
        }
        ++i;
    }
}

constexpr std::string_view kRender = "] RENDER: ";
constexpr std::string_view kLayout = "] LAYOUT: ";
constexpr std::string_view kState  = "] STATE: ";

auto labels_after(std::string_view log, std::string_view keyword) -> std::vector<LabelMatch> {
    std::vector<LabelMatch> out;
    scan_traces(log, keyword, [&](Cursor& cursor) {
        auto name = cursor.word();
        if (!name || !cursor.literal("(")) {
            return false;
        }
        auto content = cursor.until_close();
        if (!content) {
            return false;
        }
        out.push_back(LabelMatch{.name = std::string{*name}, .content = std::string{*content}});
        return true;
    });
    return out;
}

} // namespace

auto MatchScreen(std::string_view log) -> std::optional<ScreenMatch> {
    std::optional<ScreenMatch> screen;
    scan_traces(
        log, kRender,
        [&](Cursor& cursor) {
            if (!cursor.literal("Screen(")) {
                return false;
            }
            auto width = cursor.digits();
            if (!width || !cursor.literal("x")) {
                return false;
            }
            auto height = cursor.digits();
            if (!height || !cursor.literal(") Center(")) {
                return false;
            }
            auto cx = cursor.digits();
            if (!cx || !cursor.literal(",")) {
                return false;
            }
            auto cy = cursor.digits();
            if (!cy || !cursor.literal(")")) {
                return false;
            }
            screen = ScreenMatch{.width    = to_int(*width),
                                 .height   = to_int(*height),
                                 .center_x = to_int(*cx),
                                 .center_y = to_int(*cy)};
            return true;
        },
        1);
    return screen;
}

auto MatchTexts(std::string_view log) -> std::vector<TextMatch> {
    std::vector<TextMatch> out;
    scan_traces(log, kRender, [&](Cursor& cursor) {
        auto name = cursor.word();
        if (!name || !cursor.literal("(")) {
            return false;
        }
        auto content = cursor.until_close();
        if (!content) {
            return false;
        }
        auto position = read_position(cursor);
        if (!position || !cursor.literal(" Font(")) {
            return false;
        }
        auto font = cursor.word();
        if (!font || !cursor.literal(")")) {
            return false;
        }
        auto color = read_color(cursor);
        if (!color) {
            return false;
        }
        out.push_back(TextMatch{.name    = std::string{*name},
                                .content = std::string{*content},
                                .x       = position->first,
                                .y       = position->second,
                                .font    = std::string{*font},
                                .color   = std::string{*color}});
        return true;
    });
    return out;
}

auto MatchCircles(std::string_view log) -> std::vector<CircleMatch> {
    std::vector<CircleMatch> out;
    scan_traces(log, kRender, [&](Cursor& cursor) {
        auto name = cursor.word();
        if (!name || !cursor.literal("(")) {
            return false;
        }
        auto content = cursor.until_close();
        if (!content) {
            return false;
        }
        auto position = read_position(cursor);
        if (!position || !cursor.literal(" Size(")) {
            return false;
        }
        auto token = cursor.run(is_decimal);
        if (!token || !cursor.literal(")")) {
            return false;
        }
        auto color = read_color(cursor);
        if (!color) {
            return false;
        }
        auto size = to_decimal(*token);
        if (!size) {
            gd_log("Dropping circle '" + std::string{*name} + "' with size token '" + std::string{*token} + "'",
                   "TracePatterns");
            return true;
        }
        out.push_back(CircleMatch{.name    = std::string{*name},
                                  .content = std::string{*content},
                                  .x       = position->first,
                                  .y       = position->second,
                                  .size    = *size,
                                  .color   = std::string{*color}});
        return true;
    });
    return out;
}

auto MatchRects(std::string_view log) -> std::vector<RectMatch> {
    std::vector<RectMatch> out;
    scan_traces(log, kRender, [&](Cursor& cursor) {
        auto name = cursor.word();
        if (!name) {
            return false;
        }
        std::optional<std::string_view> content;
        if (cursor.literal("(")) {
            content = cursor.until_close();
            if (!content) {
                return false;
            }
        }
        auto position = read_position(cursor);
        if (!position || !cursor.literal(" Size(")) {
            return false;
        }
        auto width = cursor.digits();
        if (!width || !cursor.literal("x")) {
            return false;
        }
        auto height = cursor.digits();
        if (!height || !cursor.literal(")")) {
            return false;
        }
        auto color = read_color(cursor);
        if (!color) {
            return false;
        }
        RectMatch rect{.name    = std::string{*name},
                       .content = std::nullopt,
                       .x       = position->first,
                       .y       = position->second,
                       .width   = to_int(*width),
                       .height  = to_int(*height),
                       .color   = std::string{*color}};
        if (content) {
            rect.content = std::string{*content};
        }
        out.push_back(std::move(rect));
        return true;
    });
    return out;
}

auto MatchLayouts(std::string_view log) -> std::vector<LabelMatch> {
    return labels_after(log, kLayout);
}

auto MatchStates(std::string_view log) -> std::vector<LabelMatch> {
    return labels_after(log, kState);
}

auto MatchAll(std::string_view log) -> TraceMatches {
    TraceMatches matches;
    matches.screen  = MatchScreen(log);
    matches.texts   = MatchTexts(log);
    matches.circles = MatchCircles(log);
    matches.rects   = MatchRects(log);
    matches.layouts = MatchLayouts(log);
    matches.states  = MatchStates(log);
    gd_log("Matched " + std::to_string(matches.texts.size()) + " text, "
               + std::to_string(matches.circles.size()) + " circle, "
               + std::to_string(matches.rects.size()) + " rect lines",
           "TracePatterns");
    return matches;
}

} // namespace GD::Capture
