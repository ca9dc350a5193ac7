#include <garmindev/capture/UiStateSerialization.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <functional>
#include <locale>
#include <sstream>
#include <vector>

namespace GD::Capture {

namespace {

using Json = nlohmann::ordered_json;

auto sorted_by_z_index(std::vector<Element> const& elements) -> std::vector<std::reference_wrapper<Element const>> {
    std::vector<std::reference_wrapper<Element const>> ordered(elements.begin(), elements.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](Element const& lhs, Element const& rhs) {
        return lhs.z_index < rhs.z_index;
    });
    return ordered;
}

void append_element_xml(std::ostringstream& xml, Element const& element) {
    xml << "    <element id=\"" << element.id << "\" type=\"" << element.type_name() << "\">\n";
    xml << "      <position x=\"" << element.x << "\" y=\"" << element.y << "\"/>\n";

    switch (element.kind()) {
    case ElementKind::Text: {
        auto const& text = *element.text();
        xml << "      <text-content>" << text.text_content << "</text-content>\n";
        xml << "      <font-family>" << text.font_family << "</font-family>\n";
        xml << "      <font-size>" << text.font_size << "</font-size>\n";
        xml << "      <font-weight>" << text.font_weight << "</font-weight>\n";
        xml << "      <text-anchor>" << text.text_anchor << "</text-anchor>\n";
        break;
    }
    case ElementKind::Circle:
        xml << "      <radius>" << FormatDecimal(element.circle()->radius) << "</radius>\n";
        break;
    case ElementKind::Rect: {
        auto const& rect = *element.rect();
        xml << "      <dimensions width=\"" << rect.width << "\" height=\"" << rect.height << "\"/>\n";
        break;
    }
    }

    xml << "      <fill-color>" << element.fill_color << "</fill-color>\n";
    xml << "      <z-index>" << element.z_index << "</z-index>\n";
    xml << "      <visible>" << (element.visible ? "true" : "false") << "</visible>\n";
    xml << "      <opacity>" << FormatDecimal(element.opacity) << "</opacity>\n";
    xml << "    </element>\n";
}

auto element_to_json(Element const& element) -> Json {
    Json out{{"id", element.id}, {"type", element.type_name()}, {"x", element.x}, {"y", element.y}};
    switch (element.kind()) {
    case ElementKind::Text: {
        auto const& text      = *element.text();
        out["text_content"]   = text.text_content;
        out["font_family"]    = text.font_family;
        out["font_size"]      = text.font_size;
        out["font_weight"]    = text.font_weight;
        out["fill_color"]     = element.fill_color;
        out["text_anchor"]    = text.text_anchor;
        break;
    }
    case ElementKind::Circle:
        out["radius"]     = element.circle()->radius;
        out["fill_color"] = element.fill_color;
        break;
    case ElementKind::Rect:
        out["width"]      = element.rect()->width;
        out["height"]     = element.rect()->height;
        out["fill_color"] = element.fill_color;
        break;
    }
    out["z_index"] = element.z_index;
    out["visible"] = element.visible;
    out["opacity"] = element.opacity;
    return out;
}

} // namespace

auto ParseOutputFormat(std::string_view text) -> Expected<OutputFormat> {
    if (text == "xml") {
        return OutputFormat::Xml;
    }
    if (text == "json") {
        return OutputFormat::Json;
    }
    return std::unexpected(Error{Error::Code::InvalidArgument,
                                 "unsupported format '" + std::string(text) + "' (choose from xml, json)"});
}

auto OutputFormatName(OutputFormat format) -> std::string_view {
    switch (format) {
    case OutputFormat::Xml:
        return "xml";
    case OutputFormat::Json:
        return "json";
    }
    return "xml";
}

auto FormatDecimal(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    std::array<char, 64> buffer{};
    auto const magnitude = std::fabs(value);
    auto const format    = (magnitude == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16))
                               ? std::chars_format::fixed
                               : std::chars_format::scientific;
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, format);
    std::string text(buffer.data(), result.ptr);
    if (format == std::chars_format::fixed && text.find('.') == std::string::npos) {
        text.append(".0");
    }
    return text;
}

auto SerializeXml(UiStateDocument const& document) -> std::string {
    auto const& metadata = document.metadata;
    auto const& screen   = document.screen;

    std::ostringstream xml;
    xml.imbue(std::locale::classic());
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<garmin-ui-state version=\"" << document.version << "\">\n";
    xml << "  <metadata>\n";
    xml << "    <app-name>" << metadata.app_name << "</app-name>\n";
    xml << "    <device-model>" << metadata.device_model << "</device-model>\n";
    xml << "    <screen-width>" << metadata.screen_width << "</screen-width>\n";
    xml << "    <screen-height>" << metadata.screen_height << "</screen-height>\n";
    xml << "    <timestamp>" << metadata.timestamp << "</timestamp>\n";
    xml << "    <capture-source>" << metadata.capture_source << "</capture-source>\n";
    xml << "  </metadata>\n";
    xml << "  <screen>\n";
    xml << "    <background-color>" << screen.background_color << "</background-color>\n";
    xml << "    <scale-factor>" << FormatDecimal(screen.scale_factor) << "</scale-factor>\n";
    xml << "    <center-x>" << screen.center_x << "</center-x>\n";
    xml << "    <center-y>" << screen.center_y << "</center-y>\n";
    xml << "  </screen>\n";
    xml << "  <elements>\n";
    for (Element const& element : sorted_by_z_index(document.elements)) {
        append_element_xml(xml, element);
    }
    xml << "  </elements>\n";
    xml << "</garmin-ui-state>";
    return xml.str();
}

auto ToJson(UiStateDocument const& document) -> nlohmann::ordered_json {
    auto const& metadata = document.metadata;
    auto const& screen   = document.screen;

    Json elements = Json::array();
    for (auto const& element : document.elements) {
        elements.push_back(element_to_json(element));
    }

    Json state = Json::object();
    for (auto const& [key, value] : document.state) {
        state[key] = value;
    }

    return Json{{"version", document.version},
                {"metadata",
                 {{"app_name", metadata.app_name},
                  {"device_model", metadata.device_model},
                  {"screen_width", metadata.screen_width},
                  {"screen_height", metadata.screen_height},
                  {"timestamp", metadata.timestamp},
                  {"capture_source", metadata.capture_source}}},
                {"screen",
                 {{"background_color", screen.background_color},
                  {"scale_factor", screen.scale_factor},
                  {"center_x", screen.center_x},
                  {"center_y", screen.center_y}}},
                {"elements", std::move(elements)},
                {"state", std::move(state)}};
}

auto SerializeJson(UiStateDocument const& document, int indent) -> std::string {
    return ToJson(document).dump(indent, ' ', true, Json::error_handler_t::replace);
}

auto Serialize(UiStateDocument const& document, OutputFormat format) -> std::string {
    switch (format) {
    case OutputFormat::Xml:
        return SerializeXml(document);
    case OutputFormat::Json:
        return SerializeJson(document);
    }
    return SerializeXml(document);
}

} // namespace GD::Capture
