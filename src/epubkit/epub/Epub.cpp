#include "epubkit/epub/Epub.hpp"
#include "epubkit/core/Constants.hpp"
#include "epubkit/epub/ChapterExtractor.hpp"
#include "epubkit/epub/CoverLocator.hpp"
#include "epubkit/epub/TocResolver.hpp"
#include "epubkit/reader/ContainerParser.hpp"
#include "epubkit/reader/PackageParser.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include "epubkit/utils/PathUtils.hpp"

namespace epubkit {
namespace epub {

namespace {

core::Error openError(archive::ZipError error, const std::string& name) {
    switch (error) {
        case archive::ZipError::FileNotFound:
            return core::makeError(core::ErrorCode::FileNotFound, "epub file not found", name);
        case archive::ZipError::BadFormat:
            return core::makeError(core::ErrorCode::FileCorrupted, "not a valid zip archive", name);
        default:
            return core::makeError(core::ErrorCode::FileAccessDenied,
                                   fmt::format("cannot open archive: {}", archive::toString(error)), name);
    }
}

} // anonymous namespace

// ========== 构造 ==========

core::Result<std::unique_ptr<Epub>> Epub::open(const std::string& path) {
    return open(core::Path(path));
}

core::Result<std::unique_ptr<Epub>> Epub::open(const core::Path& path) {
    EPUB_INFO("Opening epub: {} ({} bytes)", path.string(), path.fileSize());

    auto reader = std::make_unique<archive::ZipReader>(path);
    archive::ZipError result = reader->open();
    if (result != archive::ZipError::Ok) {
        EPUB_ERROR("Failed to open archive {}: {}", path.string(), archive::toString(result));
        return openError(result, path.string());
    }

    std::unique_ptr<Epub> epub(new Epub());
    epub->archive_ = reader.get();
    epub->owned_archive_ = std::move(reader);
    return load(std::move(epub));
}

core::Result<std::unique_ptr<Epub>> Epub::fromBuffer(std::vector<uint8_t> data) {
    if (data.empty()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "empty epub buffer");
    }
    EPUB_INFO("Opening epub from memory buffer, {} bytes", data.size());

    auto reader = std::make_unique<archive::ZipReader>(std::move(data));
    archive::ZipError result = reader->open();
    if (result != archive::ZipError::Ok) {
        return openError(result, reader->getName());
    }

    std::unique_ptr<Epub> epub(new Epub());
    epub->archive_ = reader.get();
    epub->owned_archive_ = std::move(reader);
    return load(std::move(epub));
}

core::Result<std::unique_ptr<Epub>> Epub::fromArchive(archive::ZipReader& reader) {
    if (!reader.isOpen()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "archive is not open", reader.getName());
    }

    std::unique_ptr<Epub> epub(new Epub());
    epub->archive_ = &reader;
    return load(std::move(epub));
}

core::Result<std::unique_ptr<Epub>> Epub::load(std::unique_ptr<Epub> epub) {
    epub->accessor_.reset(epub->archive_);

    auto result = epub->parseContainer();
    if (result) {
        result = epub->parsePackage();
    }
    if (result) {
        result = epub->parseToc();
    }
    if (!result) {
        EPUB_ERROR("Failed to load epub: {}", result.error().fullMessage());
        epub->close();
        return result.error();
    }

    EPUB_INFO("Epub loaded: '{}', {} manifest items, {} spine entries",
              epub->metadata_.title, epub->manifest_.size(), epub->spine_.size());
    return epub;
}

Epub::~Epub() {
    close();
}

void Epub::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    accessor_.reset();
    archive_ = nullptr;
    if (owned_archive_) {
        owned_archive_->close();
        owned_archive_.reset();
        EPUB_DEBUG("Owned archive closed");
    }
}

// ========== 打开流程 ==========

core::VoidResult Epub::parseContainer() {
    const std::string container_path(core::Constants::kContainerPath);
    auto content = accessor_.getBytes(container_path);
    if (!content) {
        return content.error();
    }

    reader::ContainerParser parser;
    if (!parser.parse(*content)) {
        return core::makeError(core::ErrorCode::XmlParseError, parser.getErrorMessage(), container_path);
    }
    if (!parser.hasRootFile()) {
        return core::makeError(core::ErrorCode::XmlMissingElement, "container has no rootfile", container_path);
    }

    root_file_ = parser.getRootFilePath();
    EPUB_DEBUG("Package document: {}", root_file_);
    return core::success();
}

core::VoidResult Epub::parsePackage() {
    auto content = accessor_.getBytes(root_file_);
    if (!content) {
        return content.error();
    }

    reader::PackageParser parser;
    if (!parser.parse(*content)) {
        return core::makeError(core::ErrorCode::XmlParseError, parser.getErrorMessage(), root_file_);
    }

    metadata_ = parser.takeMetadata();
    manifest_ = parser.takeManifest();
    spine_ = parser.takeSpine();
    return core::success();
}

core::VoidResult Epub::parseToc() {
    TocResolver resolver(accessor_);
    auto toc = resolver.resolve(root_file_, manifest_);
    if (!toc) {
        return toc.error();
    }
    toc_ = std::move(toc).value();
    return core::success();
}

// ========== 查询 ==========

std::string Epub::getPackageDir() const {
    return utils::PathUtils::dirName(root_file_);
}

std::string Epub::resolvePackagePath(std::string_view href) const {
    return utils::PathUtils::join(getPackageDir(), href);
}

const core::Item* Epub::findItem(std::string_view id) const {
    for (const auto& item : manifest_) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

core::Result<std::vector<core::Chapter>> Epub::getChapters(const core::EpubOptions& options) const {
    return ChapterExtractor(*this).getChapters(options);
}

core::Result<std::string> Epub::getChapterContent(int index, const core::EpubOptions& options) const {
    return ChapterExtractor(*this).getChapterContent(index, options);
}

core::Result<Epub::StreamPtr> Epub::getChapterStream(int index, const core::EpubOptions& options) const {
    return ChapterExtractor(*this).getChapterStream(index, options);
}

core::Result<Epub::StreamPtr> Epub::getCover() const {
    return CoverLocator(*this).locate();
}

core::Result<std::string> Epub::readFile(std::string_view path) const {
    if (closed_) {
        return core::makeError(core::ErrorCode::ArchiveClosed, "epub is closed", std::string(path));
    }
    return accessor_.getBytes(path);
}

core::Result<Epub::StreamPtr> Epub::getFileReader(std::string_view path) const {
    if (closed_) {
        return core::makeError(core::ErrorCode::ArchiveClosed, "epub is closed", std::string(path));
    }
    return accessor_.getStream(path);
}

core::Result<std::string> Epub::readPackageFile(std::string_view href) const {
    return readFile(resolvePackagePath(href));
}

}} // namespace epubkit::epub
