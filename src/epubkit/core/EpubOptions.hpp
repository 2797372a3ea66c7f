#pragma once

#include "epubkit/core/CancellationToken.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include <cstdint>
#include <functional>
#include <initializer_list>

namespace epubkit {
namespace core {

/**
 * @brief 章节查询选项
 *
 * 不存在全局默认值；每次调用都显式传入（或使用默认构造的值）。
 */
struct EpubOptions {
    using ChapterFilter = std::function<bool(const Chapter&)>;

    CancellationToken cancellation;       // 默认永不取消
    bool include_cover = false;           // 预留，当前不影响任何查询
    bool include_metadata = false;        // 预留，当前不影响任何查询
    ChapterFilter chapter_filter;         // 为空时接受所有章节
    int64_t max_content_length = 0;       // 0 表示不限制

    bool acceptsChapter(const Chapter& chapter) const {
        return !chapter_filter || chapter_filter(chapter);
    }

    bool exceedsMaxLength(size_t size) const {
        return max_content_length > 0 && static_cast<int64_t>(size) > max_content_length;
    }
};

/**
 * @brief 对选项的一次调整，按顺序应用，后者覆盖前者
 */
using Option = std::function<void(EpubOptions&)>;

Option withCancellation(CancellationToken token);
Option withCover(bool include = true);
Option withMetadata(bool include = true);
Option withChapterFilter(EpubOptions::ChapterFilter filter);
Option withMaxContentLength(int64_t max_length);

/**
 * @brief 从默认值出发依次应用调整
 */
EpubOptions makeOptions(std::initializer_list<Option> options);

}} // namespace epubkit::core
