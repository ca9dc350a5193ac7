#pragma once

#include <garmindev/core/Error.hpp>

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace GD::App {

[[nodiscard]] auto ReadTextFile(std::filesystem::path const& path) -> Expected<std::string>;
[[nodiscard]] auto ReadTextStream(std::istream& in) -> Expected<std::string>;
[[nodiscard]] auto WriteTextFile(std::filesystem::path const& path, std::string_view content) -> Expected<void>;

} // namespace GD::App
