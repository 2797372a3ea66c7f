#pragma once

#include "epubkit/archive/ZipReader.hpp"
#include "epubkit/core/Expected.hpp"
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace epubkit {
namespace epub {

/**
 * @brief 按包内路径读取条目
 *
 * 查询路径和条目名都先把 '\' 规范成 '/' 再比较（区分大小写），
 * 按中央目录顺序线性扫描，第一个匹配的条目胜出。不建立索引。
 *
 * 不持有 ZipReader；reader 为空或已关闭时所有操作返回 ArchiveClosed。
 */
class ArchiveAccessor {
public:
    explicit ArchiveAccessor(const archive::ZipReader* reader = nullptr)
        : reader_(reader) {}

    void reset(const archive::ZipReader* reader = nullptr) { reader_ = reader; }

    bool isAvailable() const { return reader_ && reader_->isOpen(); }

    /**
     * @brief 读取整个条目
     * @return FileNotFound 没有匹配的条目；ArchiveClosed 归档不可用
     */
    core::Result<std::string> getBytes(std::string_view path) const;

    /**
     * @brief 以输入流形式返回条目内容，流由调用方持有
     */
    core::Result<std::unique_ptr<std::istream>> getStream(std::string_view path) const;

    /**
     * @brief 规范化查询路径对应的实际条目名
     */
    core::Result<std::string> resolveEntryName(std::string_view path) const;

private:
    const archive::ZipReader* reader_;
};

}} // namespace epubkit::epub
