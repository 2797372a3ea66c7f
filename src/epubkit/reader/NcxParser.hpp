/**
 * @file NcxParser.hpp
 * @brief EPUB 2 导航控制文件（NCX）解析器
 */

#pragma once

#include "epubkit/reader/BaseSAXParser.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include <string>
#include <vector>

namespace epubkit {
namespace reader {

/**
 * @brief NCX流式解析器
 *
 * 读取 docTitle 和 navMap 下的 navPoint 树（保持文档顺序和嵌套）。
 * pageList、navList 不解析。
 */
class NcxParser : public BaseSAXParser {
public:
    NcxParser() = default;
    ~NcxParser() = default;

    bool parse(const std::string& xml_content) {
        reset();
        return parseXML(xml_content);
    }

    const core::Ncx& getNcx() const { return ncx_; }
    core::Ncx takeNcx() { return std::move(ncx_); }

    void reset() {
        state_.reset();
        ncx_ = core::Ncx{};
        open_points_.clear();
    }

protected:
    void onStartElement(std::string_view name, AttributeSpan attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    core::Ncx ncx_;

    // 尚未闭合的navPoint，back() 为最内层
    std::vector<core::NavPoint> open_points_;
};

}} // namespace epubkit::reader
