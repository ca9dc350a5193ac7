#pragma once

#include <garmindev/capture/TracePatterns.hpp>
#include <garmindev/capture/UiState.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace GD::Capture {

struct BuildOptions {
    // Device identifier hint; the document falls back to kDefaultDevice.
    std::optional<std::string> device;
    // Capture instant written to metadata.timestamp; "now" when unset.
    std::optional<std::chrono::system_clock::time_point> capture_time;
};

// "0xFF00" -> "#00FF00". Tokens without the 0x prefix are returned unchanged.
[[nodiscard]] auto NormalizeColor(std::string_view token) -> std::string;

// LARGE 24, MEDIUM 18, SMALL 14, XTINY 10 (case-insensitive), anything else 16.
[[nodiscard]] auto FontSizeForToken(std::string_view font) -> int;
[[nodiscard]] auto FontWeightForToken(std::string_view font) -> std::string_view;

[[nodiscard]] auto MakeElementId(std::string_view name, std::size_t sequence) -> std::string;

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T09:30:00.000000Z.
[[nodiscard]] auto FormatCaptureTimestamp(std::chrono::system_clock::time_point when) -> std::string;

[[nodiscard]] auto BuildUiState(TraceMatches const& matches, BuildOptions const& options = {}) -> UiStateDocument;

[[nodiscard]] auto ParseTraceLog(std::string_view log, BuildOptions const& options = {}) -> UiStateDocument;

} // namespace GD::Capture
