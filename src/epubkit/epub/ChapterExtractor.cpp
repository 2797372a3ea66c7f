#include "epubkit/epub/ChapterExtractor.hpp"
#include "epubkit/core/Constants.hpp"
#include "epubkit/epub/Epub.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include <sstream>

namespace epubkit {
namespace epub {

using core::Constants;

namespace {

bool isHtml(const core::Item& item) {
    return item.media_type.find(Constants::kHtmlMediaTypeMarker) != std::string::npos;
}

} // anonymous namespace

core::Result<std::vector<core::Chapter>> ChapterExtractor::getChapters(const core::EpubOptions& options) const {
    auto cancelled = options.cancellation.check();
    if (!cancelled) {
        return cancelled.error();
    }
    if (epub_.isClosed()) {
        return core::makeError(core::ErrorCode::ArchiveClosed, "epub is closed");
    }

    const auto& itemrefs = epub_.getSpine().itemrefs;
    std::vector<core::Chapter> chapters;
    chapters.reserve(itemrefs.size());

    for (size_t i = 0; i < itemrefs.size(); ++i) {
        if (i % Constants::kCancellationStride == 0) {
            cancelled = options.cancellation.check();
            if (!cancelled) {
                EPUB_INFO("Chapter extraction cancelled at spine index {}: {}", i, cancelled.error().message);
                return cancelled.error();
            }
        }

        const core::Item* item = epub_.findItem(itemrefs[i].idref);
        if (!item) {
            EPUBKIT_LOG_CHAPTER_DEBUG("Spine {} references unknown item {}", i, itemrefs[i].idref);
            continue;
        }
        if (!isHtml(*item)) {
            EPUBKIT_LOG_CHAPTER_DEBUG("Spine {} item {} is not html ({})", i, item->id, item->media_type);
            continue;
        }

        auto content = epub_.readPackageFile(item->href);
        if (!content) {
            EPUB_WARN("Skipping chapter {}: {}", i + 1, content.error().fullMessage());
            continue;
        }
        if (options.exceedsMaxLength(content->size())) {
            EPUBKIT_LOG_CHAPTER_DEBUG("Spine {} exceeds max length: {} > {}", i, content->size(),
                                      options.max_content_length);
            continue;
        }

        core::Chapter chapter;
        chapter.title = chapterTitle(i);
        chapter.content = std::move(content).value();
        chapter.order = static_cast<int>(i + 1);

        if (!options.acceptsChapter(chapter)) {
            continue;
        }
        chapters.push_back(std::move(chapter));
    }

    EPUB_DEBUG("Extracted {} of {} spine entries", chapters.size(), itemrefs.size());
    return chapters;
}

core::Result<std::string> ChapterExtractor::getChapterContent(int index, const core::EpubOptions& options) const {
    auto cancelled = options.cancellation.check();
    if (!cancelled) {
        return cancelled.error();
    }

    const auto& itemrefs = epub_.getSpine().itemrefs;
    if (index < 0 || static_cast<size_t>(index) >= itemrefs.size()) {
        return core::makeError(core::ErrorCode::OutOfRange,
                               fmt::format("chapter index {} out of range [0, {})", index, itemrefs.size()));
    }

    const auto& ref = itemrefs[static_cast<size_t>(index)];
    const core::Item* item = epub_.findItem(ref.idref);
    if (!item) {
        return core::makeError(core::ErrorCode::FileNotFound, "chapter item not found in manifest", ref.idref);
    }
    if (!isHtml(*item)) {
        return core::makeError(core::ErrorCode::UnsupportedContent,
                               fmt::format("chapter is not html: {}", item->media_type), item->href);
    }

    auto content = epub_.readPackageFile(item->href);
    if (!content) {
        return content.error();
    }
    if (options.exceedsMaxLength(content->size())) {
        return core::makeError(core::ErrorCode::ContentTooLarge,
                               fmt::format("chapter size {} exceeds limit {}", content->size(), options.max_content_length),
                               item->href);
    }
    return content;
}

core::Result<std::unique_ptr<std::istream>> ChapterExtractor::getChapterStream(int index,
                                                                              const core::EpubOptions& options) const {
    auto content = getChapterContent(index, options);
    if (!content) {
        return content.error();
    }
    std::unique_ptr<std::istream> stream = std::make_unique<std::istringstream>(
        std::move(content).value(), std::ios::in | std::ios::binary);
    return stream;
}

std::string ChapterExtractor::chapterTitle(size_t index) const {
    const core::Ncx* toc = epub_.getToc();
    if (toc && index < toc->nav_map.size()) {
        return toc->nav_map[index].label;
    }
    return fmt::format("Chapter {}", index + 1);
}

}} // namespace epubkit::epub
