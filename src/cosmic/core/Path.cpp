#include "cosmic/core/Path.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utf8.h>

namespace cosmic {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {
    if (!utf8::is_valid(path.begin(), path.end())) {
        CORE_WARN("Path is not valid UTF-8, using raw bytes: {}", path);
    }
}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

std::string Path::extension() const {
    std::string ext = std::filesystem::path(utf8_path_).extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

Path Path::absolute() const {
    std::error_code ec;
    auto abs = std::filesystem::absolute(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Cannot resolve absolute path '{}': {}", utf8_path_, ec.message());
        return *this;
    }
    return Path(abs.lexically_normal().string());
}

Path Path::withSuffix(const std::string& suffix) const {
    return Path(utf8_path_ + suffix);
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    std::error_code ec;
    auto size = std::filesystem::file_size(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    bool removed = std::filesystem::remove(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

bool Path::moveTo(const Path& target) const {
    if (utf8_path_.empty() || target.utf8_path_.empty()) return false;
    std::error_code ec;
    std::filesystem::rename(utf8_path_, target.utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Filesystem error moving file '{}' to '{}': {}",
                   utf8_path_, target.utf8_path_, ec.message());
        return false;
    }
    return true;
}

bool Path::readAll(std::string& out, std::string& error) const {
    FILE* file = openForRead(true);
    if (!file) {
        error = std::strerror(errno);
        return false;
    }

    out.clear();
    char buffer[8192];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        out.append(buffer, n);
    }

    bool ok = std::ferror(file) == 0;
    if (!ok) {
        error = std::strerror(errno);
    }
    std::fclose(file);
    return ok;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
}

} // namespace core
} // namespace cosmic
