#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace epubkit {
namespace utils {

/**
 * @brief 包内路径工具
 *
 * 包内路径一律使用 '/' 分隔、区分大小写，与宿主文件系统无关。
 * 宿主路径请使用 core::Path。
 */
class PathUtils {
public:
    /**
     * @brief 把 '\' 统一替换为 '/'
     */
    static std::string normalizeSeparators(std::string_view path) {
        std::string result(path);
        std::replace(result.begin(), result.end(), '\\', '/');
        return result;
    }

    /**
     * @brief 目录部分（"OEBPS/content.opf" -> "OEBPS"），没有目录时返回空串
     */
    static std::string dirName(std::string_view path) {
        size_t slash = path.find_last_of('/');
        if (slash == std::string_view::npos) {
            return std::string();
        }
        return clean(path.substr(0, slash));
    }

    /**
     * @brief 拼接并规范化（去掉 "." 段、消解 ".."）
     * @param base 目录，可以为空
     * @param relative 相对路径
     */
    static std::string join(std::string_view base, std::string_view relative) {
        if (base.empty()) {
            return clean(relative);
        }
        if (relative.empty()) {
            return clean(base);
        }
        std::string combined(base);
        combined += '/';
        combined.append(relative.data(), relative.size());
        return clean(combined);
    }

    /**
     * @brief 规范化路径
     *
     * 合并重复的 '/'，去掉 "." 段，".." 回退一级；
     * 超出根的 ".." 保留（相对路径）或丢弃（以 '/' 开头的路径）。
     * 结果为空时返回 "."。
     */
    static std::string clean(std::string_view path) {
        if (path.empty()) {
            return ".";
        }

        const bool rooted = path.front() == '/';
        std::vector<std::string_view> segments;
        size_t pos = 0;
        while (pos <= path.size()) {
            size_t next = path.find('/', pos);
            if (next == std::string_view::npos) {
                next = path.size();
            }
            std::string_view segment = path.substr(pos, next - pos);
            pos = next + 1;

            if (segment.empty() || segment == ".") {
                continue;
            }
            if (segment == "..") {
                if (!segments.empty() && segments.back() != "..") {
                    segments.pop_back();
                } else if (!rooted) {
                    segments.push_back(segment);
                }
                continue;
            }
            segments.push_back(segment);
        }

        std::string result;
        if (rooted) {
            result += '/';
        }
        for (size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) {
                result += '/';
            }
            result.append(segments[i].data(), segments[i].size());
        }
        if (result.empty()) {
            return ".";
        }
        return result;
    }

    // ========== 字符串工具 ==========

    static std::string toLower(std::string_view text) {
        std::string result(text);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    static bool startsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    static bool endsWithIgnoreCase(std::string_view text, std::string_view suffix) {
        if (text.size() < suffix.size()) {
            return false;
        }
        std::string_view tail = text.substr(text.size() - suffix.size());
        return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    }
};

}} // namespace epubkit::utils
