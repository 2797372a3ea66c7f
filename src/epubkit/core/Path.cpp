#include "epubkit/core/Path.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"

#ifdef _WIN32
#include <windows.h>
#include <utf8.h>
#include <iterator>
#else
#include <filesystem>
#endif

namespace epubkit {
namespace core {

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception& e) {
        // 非法UTF-8时交给系统API转换
        CORE_DEBUG("utf8cpp conversion failed for '{}': {}", utf8_path_, e.what());
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

std::string Path::filename() const {
    size_t pos = utf8_path_.find_last_of("/\\");
    return pos == std::string::npos ? utf8_path_ : utf8_path_.substr(pos + 1);
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    DWORD attributes = GetFileAttributesW(getWidePath().c_str());
    return attributes != INVALID_FILE_ATTRIBUTES;
#else
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
#endif
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    DWORD attributes = GetFileAttributesW(getWidePath().c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && !(attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
#endif
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

#ifdef _WIN32
    WIN32_FILE_ATTRIBUTE_DATA file_data;
    if (GetFileAttributesExW(getWidePath().c_str(), GetFileExInfoStandard, &file_data)) {
        ULARGE_INTEGER size;
        size.HighPart = file_data.nFileSizeHigh;
        size.LowPart = file_data.nFileSizeLow;
        return size.QuadPart;
    }
    return 0;
#else
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
#endif
}

}} // namespace epubkit::core
