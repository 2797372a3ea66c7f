#pragma once

#include <string>
#include <vector>

namespace epubkit {
namespace core {

/**
 * @file EpubTypes.hpp
 * @brief 电子书文档模型的值类型
 *
 * 这些类型都是纯数据，由解析器填充后交给 epub::Epub 持有。
 */

/**
 * @brief 包文档 <metadata> 中的Dublin Core字段
 *
 * 缺失的字段为空字符串；同名元素重复出现时取第一个非空值。
 */
struct Metadata {
    std::string title;
    std::string creator;
    std::string subject;
    std::string description;
    std::string publisher;
    std::string contributor;
    std::string date;
    std::string type;
    std::string format;
    std::string identifier;
    std::string language;
    std::string rights;

    // <meta name="cover" content="..."/> 指向的manifest id（EPUB 2 封面提示）
    std::string cover_id;
};

/**
 * @brief manifest 中的一个资源
 */
struct Item {
    std::string id;
    std::string href;        // 相对包文档所在目录
    std::string media_type;
    std::string properties;  // EPUB 3 属性列表，空格分隔，原样保存

    bool hasProperty(const std::string& token) const;
};

/**
 * @brief spine 中的一个引用
 */
struct ItemRef {
    std::string idref;
    std::string linear;  // 原样保存，不参与章节筛选
};

/**
 * @brief 阅读顺序
 */
struct Spine {
    std::string toc_id;  // <spine toc="..."> 指向的NCX id
    std::vector<ItemRef> itemrefs;

    size_t size() const { return itemrefs.size(); }
    bool empty() const { return itemrefs.empty(); }
};

/**
 * @brief NCX 导航点（可递归嵌套）
 */
struct NavPoint {
    std::string id;
    std::string play_order;
    std::string label;  // navLabel/text
    std::string src;    // content@src
    std::vector<NavPoint> children;
};

/**
 * @brief 解析后的 NCX 目录
 */
struct Ncx {
    std::string title;  // docTitle/text
    std::vector<NavPoint> nav_map;
};

/**
 * @brief 章节（每次查询重新生成）
 */
struct Chapter {
    std::string title;
    std::string content;  // 原始标记，未经处理
    int order = 0;        // 从1开始的spine位置
};

}} // namespace epubkit::core
