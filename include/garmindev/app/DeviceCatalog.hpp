#pragma once

#include <array>
#include <string_view>

namespace GD::App {

inline constexpr std::array<std::string_view, 9> kSupportedDevices{
    "fenix7", "fenix7s", "fenix7x", "fr965", "fr955", "epix2", "venu2", "vivoactive4", "edge1040",
};

[[nodiscard]] constexpr auto IsSupportedDevice(std::string_view device) -> bool {
    for (auto const known : kSupportedDevices) {
        if (known == device) {
            return true;
        }
    }
    return false;
}

} // namespace GD::App
