#pragma once

#include "epubkit/epub/ArchiveAccessor.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace epubkit {
namespace epub {

/**
 * @brief 目录定位
 *
 * 按顺序尝试两种方式：
 * 1. NCX：manifest 中第一个媒体类型为 application/x-dtbncx+xml 的条目，
 *    路径为包文档目录拼接 href，读取或解析失败都会返回错误
 * 2. 导航文档：识别 EPUB 3 nav 文档（properties 含 nav，否则第一个HTML条目）并记录日志，
 *    不解析，不产生目录树
 *
 * 两种都没有时返回空，不算错误。
 */
class TocResolver {
public:
    explicit TocResolver(const ArchiveAccessor& accessor) : accessor_(accessor) {}

    core::Result<std::optional<core::Ncx>> resolve(const std::string& root_file,
                                                   const std::vector<core::Item>& manifest) const;

    /**
     * @brief 识别到的导航文档（仅供查询，不解析）
     */
    static const core::Item* findNavigationDocument(const std::vector<core::Item>& manifest);

private:
    const ArchiveAccessor& accessor_;

    core::Result<core::Ncx> loadNcx(const std::string& root_file, const core::Item& item) const;
};

}} // namespace epubkit::epub
