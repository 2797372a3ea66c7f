/**
 * @file PackageParser.hpp
 * @brief OPF包文档解析器
 */

#pragma once

#include "epubkit/reader/BaseSAXParser.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include <string>
#include <vector>

namespace epubkit {
namespace reader {

/**
 * @brief 包文档（.opf）流式解析器
 *
 * 一次扫描得到 metadata、manifest 和 spine：
 * - metadata 按本地名匹配（dc:title 和 title 等价），重复元素以最后一次出现为准；
 *   取元素自身的字符数据，跳过子元素文本，不裁剪空白
 * - manifest、spine 保持文档顺序，不做语义校验（重复id、悬空idref原样保留）
 */
class PackageParser : public BaseSAXParser {
public:
    PackageParser() = default;
    ~PackageParser() = default;

    bool parse(const std::string& xml_content) {
        reset();
        return parseXML(xml_content);
    }

    const core::Metadata& getMetadata() const { return metadata_; }
    const std::vector<core::Item>& getManifest() const { return manifest_; }
    const core::Spine& getSpine() const { return spine_; }

    core::Metadata takeMetadata() { return std::move(metadata_); }
    std::vector<core::Item> takeManifest() { return std::move(manifest_); }
    core::Spine takeSpine() { return std::move(spine_); }

    void reset() {
        state_.reset();
        metadata_ = core::Metadata{};
        manifest_.clear();
        spine_ = core::Spine{};
        current_field_ = nullptr;
        field_depth_ = -1;
    }

protected:
    void onStartElement(std::string_view name, AttributeSpan attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    core::Metadata metadata_;
    std::vector<core::Item> manifest_;
    core::Spine spine_;

    // 正在收集文本的metadata字段
    std::string* current_field_ = nullptr;
    int field_depth_ = -1;

    std::string* metadataField(std::string_view local_name);
    void handleMeta(AttributeSpan attributes);
};

}} // namespace epubkit::reader
