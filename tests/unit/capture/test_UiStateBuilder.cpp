#include <doctest/doctest.h>

#include <garmindev/capture/UiStateBuilder.hpp>

#include <chrono>
#include <string>
#include <utility>

using namespace GD::Capture;
using namespace std::chrono;

namespace {

auto fixed_options(std::optional<std::string> device = std::nullopt) -> BuildOptions {
    return BuildOptions{.device       = std::move(device),
                        .capture_time = sys_days{2024y / May / 1} + 9h + 30min + 123456us};
}

} // namespace

TEST_SUITE("capture.ui_state_builder") {

TEST_CASE("colors are normalized to #RRGGBB") {
    CHECK(NormalizeColor("0xFF0000") == "#FF0000");
    CHECK(NormalizeColor("0xA") == "#00000A");
    CHECK(NormalizeColor("0x00ff00") == "#00ff00");
    CHECK(NormalizeColor("0x1234567") == "#1234567");
    CHECK(NormalizeColor("#123456") == "#123456");
}

TEST_CASE("font tokens map to sizes and weights") {
    CHECK(FontSizeForToken("LARGE") == 24);
    CHECK(FontSizeForToken("medium") == 18);
    CHECK(FontSizeForToken("SMALL") == 14);
    CHECK(FontSizeForToken("XTINY") == 10);
    CHECK(FontSizeForToken("TINY") == 16);
    CHECK(FontWeightForToken("LARGE") == "bold");
    CHECK(FontWeightForToken("NUMBER_LARGE") == "bold");
    CHECK(FontWeightForToken("large") == "normal");
    CHECK(FontWeightForToken("TINY") == "normal");
}

TEST_CASE("element ids lowercase the name and append the sequence") {
    CHECK(MakeElementId("HourNumber", 1) == "hournumber_1");
    CHECK(MakeElementId("Label", 12) == "label_12");
}

TEST_CASE("capture timestamp is UTC with microseconds") {
    CHECK(FormatCaptureTimestamp(sys_days{2024y / May / 1} + 9h + 30min + 123456us) == "2024-05-01T09:30:00.123456Z");
    CHECK(FormatCaptureTimestamp(sys_days{1970y / January / 1}) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("log without recognized lines yields the default document") {
    auto document = ParseTraceLog("[0] INFO: nothing to see\n", fixed_options());
    CHECK(document.version == "1.0");
    CHECK(document.metadata.app_name == "Garmin App");
    CHECK(document.metadata.device_model == "fenix7");
    CHECK(document.metadata.screen_width == 260);
    CHECK(document.metadata.screen_height == 260);
    CHECK(document.metadata.capture_source == "debug_logs");
    CHECK(document.metadata.timestamp == "2024-05-01T09:30:00.123456Z");
    CHECK(document.screen.background_color == "#000000");
    CHECK(document.screen.scale_factor == doctest::Approx(1.0));
    CHECK(document.screen.center_x == 130);
    CHECK(document.screen.center_y == 130);
    CHECK(document.elements.empty());
    CHECK(document.state.empty());
}

TEST_CASE("device hint overrides the default model") {
    CHECK(ParseTraceLog("", fixed_options("venu2")).metadata.device_model == "venu2");
    CHECK(ParseTraceLog("", fixed_options("")).metadata.device_model == "fenix7");
}

TEST_CASE("screen line updates metadata and center") {
    auto document = ParseTraceLog("[0.1] RENDER: Screen(300x300) Center(150,150)", fixed_options());
    CHECK(document.metadata.screen_width == 300);
    CHECK(document.metadata.screen_height == 300);
    CHECK(document.screen.center_x == 150);
    CHECK(document.screen.center_y == 150);
}

TEST_CASE("elements are grouped text then circle then rect with one id sequence") {
    std::string const log = "[1] RENDER: Box(A) Position(5,6) Size(7x8) Color(0x00FF00)\n"
                            "[2] RENDER: Dot(1) Position(3,4) Size(2.0) Color(0xFF0000)\n"
                            "[3] RENDER: Label(Hi) Position(1,2) Font(SMALL) Color(0xFFFFFF)\n"
                            "[4] RENDER: Dot(2) Position(9,9) Size(1.5) Color(0xF)\n"
                            "[5] RENDER: Title(Go) Position(0,0) Font(LARGE) Color(0x0)\n";
    auto document = ParseTraceLog(log, fixed_options());
    REQUIRE(document.elements.size() == 5);
    CHECK(document.elements[0].id == "label_1");
    CHECK(document.elements[1].id == "title_2");
    CHECK(document.elements[2].id == "dot_3");
    CHECK(document.elements[3].id == "dot_4");
    CHECK(document.elements[4].id == "box_5");

    CHECK(document.elements[0].kind() == ElementKind::Text);
    CHECK(document.elements[2].kind() == ElementKind::Circle);
    CHECK(document.elements[4].kind() == ElementKind::Rect);
}

TEST_CASE("text element attributes") {
    auto document = ParseTraceLog("[0.2] RENDER: Label(12:30) Position(130,60) Font(LARGE) Color(0xFF0000)",
                                  fixed_options());
    REQUIRE(document.elements.size() == 1);
    auto const& element = document.elements.front();
    CHECK(element.id == "label_1");
    CHECK(element.type_name() == "text");
    CHECK(element.x == 130);
    CHECK(element.y == 60);
    CHECK(element.fill_color == "#FF0000");
    CHECK(element.z_index == 10);
    CHECK(element.visible);
    CHECK(element.opacity == doctest::Approx(1.0));
    auto const* text = element.text();
    REQUIRE(text != nullptr);
    CHECK(text->text_content == "12:30");
    CHECK(text->font_family == "large");
    CHECK(text->font_size == 24);
    CHECK(text->font_weight == "bold");
    CHECK(text->text_anchor == "middle");
}

TEST_CASE("circle and rect element attributes") {
    std::string const log = "[Jailbot] RENDER: MinuteMarker(30) Position(235,130) Size(2.0) Color(0xff0000)\n"
                            "[Jailbot] RENDER: JailbotEye(LEFT) Position(110,125) Size(8x3) Color(0x00ff00)\n";
    auto document = ParseTraceLog(log, fixed_options());
    REQUIRE(document.elements.size() == 2);

    auto const& circle = document.elements[0];
    CHECK(circle.id == "minutemarker_1");
    CHECK(circle.z_index == 5);
    REQUIRE(circle.circle() != nullptr);
    CHECK(circle.circle()->radius == doctest::Approx(2.0));
    CHECK(circle.fill_color == "#ff0000");

    auto const& rect = document.elements[1];
    CHECK(rect.id == "jailboteye_2");
    CHECK(rect.z_index == 8);
    REQUIRE(rect.rect() != nullptr);
    CHECK(rect.rect()->width == 8);
    CHECK(rect.rect()->height == 3);
}

TEST_CASE("dropped circles do not consume an id") {
    std::string const log = "[c] RENDER: Dot(a) Position(1,1) Size(1.2.3) Color(0x1)\n"
                            "[c] RENDER: Dot(b) Position(2,2) Size(3) Color(0x1)\n"
                            "[c] RENDER: Bar Position(0,0) Size(1x1) Color(0x1)\n";
    auto document = ParseTraceLog(log, fixed_options());
    REQUIRE(document.elements.size() == 2);
    CHECK(document.elements[0].id == "dot_1");
    CHECK(document.elements[1].id == "bar_2");
}

TEST_CASE("state and layout lines leave the document untouched") {
    auto document = ParseTraceLog("[s] STATE: CurrentTime(12:30)\n[s] LAYOUT: Header(top)\n", fixed_options());
    CHECK(document.elements.empty());
    CHECK(document.state.empty());
}

TEST_CASE("building from explicit matches") {
    TraceMatches matches;
    matches.screen = ScreenMatch{.width = 416, .height = 416, .center_x = 208, .center_y = 208};
    matches.rects.push_back(RectMatch{.name = "Frame", .content = std::nullopt, .x = 0, .y = 0, .width = 416, .height = 2, .color = "0xFFFFFF"});
    auto document = BuildUiState(matches, fixed_options("epix2"));
    CHECK(document.metadata.device_model == "epix2");
    CHECK(document.metadata.screen_width == 416);
    REQUIRE(document.elements.size() == 1);
    CHECK(document.elements[0].id == "frame_1");
    CHECK(document.elements[0].fill_color == "#FFFFFF");
}

} // TEST_SUITE
