/**
 * @file ContainerParser.hpp
 * @brief META-INF/container.xml 解析器
 */

#pragma once

#include "epubkit/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace epubkit {
namespace reader {

/**
 * @brief 容器描述文件解析器
 *
 * 收集 <rootfiles> 下所有 <rootfile> 的 full-path 和 media-type，
 * 打开流程只使用第一个。
 */
class ContainerParser : public BaseSAXParser {
public:
    struct RootFile {
        std::string full_path;
        std::string media_type;
    };

    ContainerParser() = default;
    ~ContainerParser() = default;

    bool parse(const std::string& xml_content) {
        root_files_.clear();
        return parseXML(xml_content);
    }

    const std::vector<RootFile>& getRootFiles() const { return root_files_; }

    bool hasRootFile() const { return !root_files_.empty(); }

    /**
     * @brief 第一个rootfile的路径，没有时返回空串
     */
    std::string getRootFilePath() const {
        return root_files_.empty() ? std::string() : root_files_.front().full_path;
    }

protected:
    void onStartElement(std::string_view name, AttributeSpan attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}

private:
    std::vector<RootFile> root_files_;
};

}} // namespace epubkit::reader
