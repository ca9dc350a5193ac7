#pragma once

#include <garmindev/capture/UiState.hpp>
#include <garmindev/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace GD::Capture {

enum class OutputFormat {
    Xml,
    Json,
};

[[nodiscard]] auto ParseOutputFormat(std::string_view text) -> Expected<OutputFormat>;
[[nodiscard]] auto OutputFormatName(OutputFormat format) -> std::string_view;

// Shortest round-trip decimal, keeping a ".0" on integral values (1.0, 2.5).
[[nodiscard]] auto FormatDecimal(double value) -> std::string;

/**
 * XML projection: metadata, screen, then the elements ordered by ascending
 * z-index (stable on discovery order). Text content is written verbatim.
 */
[[nodiscard]] auto SerializeXml(UiStateDocument const& document) -> std::string;

/**
 * Structured record projection, field for field, elements in document order.
 */
[[nodiscard]] auto ToJson(UiStateDocument const& document) -> nlohmann::ordered_json;
[[nodiscard]] auto SerializeJson(UiStateDocument const& document, int indent = 2) -> std::string;

[[nodiscard]] auto Serialize(UiStateDocument const& document, OutputFormat format) -> std::string;

} // namespace GD::Capture
