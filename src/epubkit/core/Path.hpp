#pragma once

#include <string>
#include <cstdint>
#include <ostream>

namespace epubkit {
namespace core {

/**
 * @brief 宿主文件系统上的UTF-8路径
 *
 * Windows下通过utf8cpp转成UTF-16再调用宽字符API，其他平台直接使用UTF-8。
 * 注意：包内路径（如 OEBPS/content.opf）不使用这个类，见 utils::PathUtils。
 */
class Path {
private:
    std::string utf8_path_;

public:
    Path() = default;
    explicit Path(const std::string& path) : utf8_path_(path) {}
    explicit Path(const char* path) : utf8_path_(path ? path : "") {}

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 文件名部分（不含目录）
     */
    std::string filename() const;

    bool exists() const;
    bool isFile() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace epubkit::core
