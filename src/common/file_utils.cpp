#include "common/file_utils.hpp"

#include "common/errors.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace {

std::filesystem::path TemporarySibling(const std::filesystem::path &path) {
    static std::atomic<unsigned long> counter{0};
    std::ostringstream name;
    name << '.' << path.filename().string() << '.' << ::getpid() << '.' << counter.fetch_add(1) << ".tmp";
    return path.parent_path() / name.str();
}

} // namespace

namespace matchwire::file {

std::optional<std::string> ReadFileText(const std::filesystem::path &path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

void WriteFileAtomically(const std::filesystem::path &path, std::string_view contents) {
    const auto tempPath = TemporarySibling(path);
    {
        std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "Failed to create " + tempPath.string());
        }
        stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        stream.flush();
        if (!stream) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "Failed to write " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        throw MATCHWIRE_ERROR(ErrorKind::Filesystem, "Failed to replace " + path.string() + ": " + ec.message());
    }
}

} // namespace matchwire::file
