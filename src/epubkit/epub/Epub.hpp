#pragma once

#include "epubkit/archive/ZipReader.hpp"
#include "epubkit/core/EpubOptions.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include "epubkit/core/Expected.hpp"
#include "epubkit/core/Path.hpp"
#include "epubkit/epub/ArchiveAccessor.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epubkit {
namespace epub {

/**
 * @brief 已打开的电子书
 *
 * 打开流程依次为：container.xml -> 包文档 -> 目录。任何一步失败都不会产生对象，
 * 自己打开的归档会在返回错误前关闭。
 *
 * 归档所有权：
 * - open()/fromBuffer() 持有归档，close() 或析构时关闭（只关闭一次）
 * - fromArchive() 借用调用方的 ZipReader，close() 只解除关联，不关闭它
 *
 * close() 之后元数据、manifest、spine、目录仍可查询，
 * 需要读取归档的操作返回 ArchiveClosed。
 *
 * 不是线程安全的。
 */
class Epub {
public:
    using StreamPtr = std::unique_ptr<std::istream>;

    // ========== 构造 ==========

    static core::Result<std::unique_ptr<Epub>> open(const core::Path& path);
    static core::Result<std::unique_ptr<Epub>> open(const std::string& path);

    /**
     * @brief 基于已打开的归档构造，不接管其生命周期
     */
    static core::Result<std::unique_ptr<Epub>> fromArchive(archive::ZipReader& reader);

    /**
     * @brief 从内存中的EPUB数据构造
     */
    static core::Result<std::unique_ptr<Epub>> fromBuffer(std::vector<uint8_t> data);

    ~Epub();

    Epub(const Epub&) = delete;
    Epub& operator=(const Epub&) = delete;

    void close();
    bool isClosed() const { return closed_; }
    bool ownsArchive() const { return owned_archive_ != nullptr; }

    // ========== 元数据与结构 ==========

    const std::string& getRootFile() const { return root_file_; }

    /**
     * @brief 包文档所在目录，包文档位于归档根目录时为空串
     */
    std::string getPackageDir() const;

    const core::Metadata& getMetadata() const { return metadata_; }
    const std::string& getTitle() const { return metadata_.title; }
    const std::string& getAuthor() const { return metadata_.creator; }
    const std::string& getDescription() const { return metadata_.description; }

    const std::vector<core::Item>& getItems() const { return manifest_; }
    const core::Spine& getSpine() const { return spine_; }

    /**
     * @brief NCX目录，没有时返回nullptr
     */
    const core::Ncx* getToc() const { return toc_ ? &*toc_ : nullptr; }

    /**
     * @brief 按id查找manifest条目，重复id取第一个
     */
    const core::Item* findItem(std::string_view id) const;

    // ========== 内容访问 ==========

    core::Result<std::vector<core::Chapter>> getChapters(const core::EpubOptions& options = core::EpubOptions()) const;

    core::Result<std::string> getChapterContent(int index, const core::EpubOptions& options = core::EpubOptions()) const;

    core::Result<StreamPtr> getChapterStream(int index, const core::EpubOptions& options = core::EpubOptions()) const;

    /**
     * @brief 封面图片流
     * @return 没有封面时返回空指针（不是错误）
     */
    core::Result<StreamPtr> getCover() const;

    /**
     * @brief 按归档内路径（相对归档根目录）读取
     */
    core::Result<StreamPtr> getFileReader(std::string_view path) const;
    core::Result<std::string> readFile(std::string_view path) const;

    /**
     * @brief 按相对包文档目录的href读取
     */
    core::Result<std::string> readPackageFile(std::string_view href) const;
    std::string resolvePackagePath(std::string_view href) const;

private:
    Epub() = default;

    static core::Result<std::unique_ptr<Epub>> load(std::unique_ptr<Epub> epub);

    core::VoidResult parseContainer();
    core::VoidResult parsePackage();
    core::VoidResult parseToc();

    std::unique_ptr<archive::ZipReader> owned_archive_;
    archive::ZipReader* archive_ = nullptr;
    ArchiveAccessor accessor_;
    bool closed_ = false;

    std::string root_file_;
    core::Metadata metadata_;
    std::vector<core::Item> manifest_;
    core::Spine spine_;
    std::optional<core::Ncx> toc_;
};

}} // namespace epubkit::epub
