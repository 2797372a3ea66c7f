#include "epubkit/epub/ArchiveAccessor.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include "epubkit/utils/PathUtils.hpp"
#include <sstream>

namespace epubkit {
namespace epub {

namespace {

core::Error translateZipError(archive::ZipError error, const std::string& entry) {
    switch (error) {
        case archive::ZipError::FileNotFound:
            return core::makeError(core::ErrorCode::FileNotFound, "file not found in archive", entry);
        case archive::ZipError::NotOpen:
            return core::makeError(core::ErrorCode::ArchiveClosed, "archive is closed", entry);
        case archive::ZipError::TooLarge:
            return core::makeError(core::ErrorCode::ContentTooLarge, "entry too large to load", entry);
        case archive::ZipError::IoFail:
            return core::makeError(core::ErrorCode::FileReadError, "failed to read archive entry", entry);
        default:
            return core::makeError(core::ErrorCode::ZipError,
                                   fmt::format("zip error: {}", archive::toString(error)), entry);
    }
}

} // anonymous namespace

core::Result<std::string> ArchiveAccessor::resolveEntryName(std::string_view path) const {
    if (!isAvailable()) {
        return core::makeError(core::ErrorCode::ArchiveClosed, "archive is closed", std::string(path));
    }

    const std::string wanted = utils::PathUtils::normalizeSeparators(path);
    for (const auto& name : reader_->listFiles()) {
        if (utils::PathUtils::normalizeSeparators(name) == wanted) {
            return name;
        }
    }
    return core::makeError(core::ErrorCode::FileNotFound, "file not found in archive", wanted);
}

core::Result<std::string> ArchiveAccessor::getBytes(std::string_view path) const {
    auto entry = resolveEntryName(path);
    if (!entry) {
        EPUB_DEBUG("Entry lookup failed: {}", entry.error().fullMessage());
        return entry.error();
    }

    std::string content;
    archive::ZipError result = reader_->extractFile(*entry, content);
    if (result != archive::ZipError::Ok) {
        EPUB_WARN("Failed to extract {}: {}", *entry, archive::toString(result));
        return translateZipError(result, *entry);
    }
    return content;
}

core::Result<std::unique_ptr<std::istream>> ArchiveAccessor::getStream(std::string_view path) const {
    auto bytes = getBytes(path);
    if (!bytes) {
        return bytes.error();
    }
    std::unique_ptr<std::istream> stream = std::make_unique<std::istringstream>(
        std::move(bytes).value(), std::ios::in | std::ios::binary);
    return stream;
}

}} // namespace epubkit::epub
