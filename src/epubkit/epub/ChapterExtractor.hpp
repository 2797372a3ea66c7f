#pragma once

#include "epubkit/core/EpubOptions.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include "epubkit/core/Expected.hpp"
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace epubkit {
namespace epub {

class Epub;

/**
 * @brief 按spine顺序提取章节
 *
 * 章节标题采用位置对应：第 i 个spine条目取 nav_map[i] 的标签，
 * 没有对应导航点时使用 "Chapter <i+1>"。
 */
class ChapterExtractor {
public:
    explicit ChapterExtractor(const Epub& epub) : epub_(epub) {}

    /**
     * @brief 提取全部章节
     *
     * 开始前检查一次取消信号，之后每 5 个spine条目检查一次，取消时整体失败。
     * 缺失的条目、非HTML条目、读取失败和超过长度上限的条目被跳过。
     */
    core::Result<std::vector<core::Chapter>> getChapters(const core::EpubOptions& options) const;

    /**
     * @brief 单个spine条目的原始内容
     *
     * 与批量提取不同，这里所有失败都返回错误，超过长度上限返回 ContentTooLarge。
     */
    core::Result<std::string> getChapterContent(int index, const core::EpubOptions& options) const;

    core::Result<std::unique_ptr<std::istream>> getChapterStream(int index, const core::EpubOptions& options) const;

private:
    const Epub& epub_;

    std::string chapterTitle(size_t index) const;
};

}} // namespace epubkit::epub
