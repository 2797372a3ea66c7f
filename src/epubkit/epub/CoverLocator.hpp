#pragma once

#include "epubkit/core/EpubTypes.hpp"
#include "epubkit/core/Expected.hpp"
#include <istream>
#include <memory>
#include <vector>

namespace epubkit {
namespace epub {

class Epub;

/**
 * @brief 封面图片查找
 *
 * 候选顺序：id 为 cover、cover-image、cover-img 的条目，
 * <meta name="cover"> 指向的条目，properties 含 cover-image 的第一个条目。
 * 候选的媒体类型以 image/ 开头，或 href 以 .jpg/.jpeg/.png/.gif 结尾（不区分大小写）时命中。
 */
class CoverLocator {
public:
    explicit CoverLocator(const Epub& epub) : epub_(epub) {}

    /**
     * @brief 命中的封面条目，没有时返回nullptr
     */
    const core::Item* findCoverItem() const;

    /**
     * @brief 打开封面
     * @return 没有封面时为空指针；命中但读取失败时返回错误
     */
    core::Result<std::unique_ptr<std::istream>> locate() const;

    static bool looksLikeImage(const core::Item& item);

private:
    const Epub& epub_;

    std::vector<const core::Item*> candidates() const;
};

}} // namespace epubkit::epub
