#include <garmindev/app/FileIo.hpp>

#include <fstream>
#include <iterator>
#include <sstream>

namespace GD::App {

auto ReadTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to open " + path.string()});
    }
    auto content = ReadTextStream(ifs);
    if (!content) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to read " + path.string()});
    }
    return content;
}

auto ReadTextStream(std::istream& in) -> Expected<std::string> {
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "input stream failed while reading"});
    }
    return content;
}

auto WriteTextFile(std::filesystem::path const& path, std::string_view content) -> Expected<void> {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to open " + path.string() + " for writing"});
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to write " + path.string()});
    }
    return {};
}

} // namespace GD::App
