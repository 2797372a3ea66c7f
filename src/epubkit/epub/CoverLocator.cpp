#include "epubkit/epub/CoverLocator.hpp"
#include "epubkit/core/Constants.hpp"
#include "epubkit/epub/Epub.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include "epubkit/utils/PathUtils.hpp"

namespace epubkit {
namespace epub {

using core::Constants;
using utils::PathUtils;

bool CoverLocator::looksLikeImage(const core::Item& item) {
    if (PathUtils::startsWith(item.media_type, Constants::kImageMediaTypePrefix)) {
        return true;
    }
    for (auto extension : Constants::kCoverImageExtensions) {
        if (PathUtils::endsWithIgnoreCase(item.href, extension)) {
            return true;
        }
    }
    return false;
}

std::vector<const core::Item*> CoverLocator::candidates() const {
    std::vector<const core::Item*> result;
    for (auto id : Constants::kCoverCandidateIds) {
        if (const core::Item* item = epub_.findItem(id)) {
            result.push_back(item);
        }
    }

    const std::string& cover_id = epub_.getMetadata().cover_id;
    if (!cover_id.empty()) {
        if (const core::Item* item = epub_.findItem(cover_id)) {
            result.push_back(item);
        }
    }

    const std::string cover_property(Constants::kCoverImageProperty);
    for (const auto& item : epub_.getItems()) {
        if (item.hasProperty(cover_property)) {
            result.push_back(&item);
            break;
        }
    }
    return result;
}

const core::Item* CoverLocator::findCoverItem() const {
    for (const core::Item* item : candidates()) {
        if (looksLikeImage(*item)) {
            return item;
        }
    }
    return nullptr;
}

core::Result<std::unique_ptr<std::istream>> CoverLocator::locate() const {
    const core::Item* item = findCoverItem();
    if (!item) {
        EPUB_DEBUG("No cover image found");
        return std::unique_ptr<std::istream>();
    }

    const std::string path = epub_.resolvePackagePath(item->href);
    EPUB_DEBUG("Cover image: id={}, path={}", item->id, path);
    return epub_.getFileReader(path);
}

}} // namespace epubkit::epub
