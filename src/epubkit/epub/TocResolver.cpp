#include "epubkit/epub/TocResolver.hpp"
#include "epubkit/core/Constants.hpp"
#include "epubkit/reader/NcxParser.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include "epubkit/utils/PathUtils.hpp"

namespace epubkit {
namespace epub {

using core::Constants;

core::Result<std::optional<core::Ncx>> TocResolver::resolve(const std::string& root_file,
                                                             const std::vector<core::Item>& manifest) const {
    // NCX（EPUB 2）
    for (const auto& item : manifest) {
        if (item.media_type != Constants::kNcxMediaType) {
            continue;
        }
        auto ncx = loadNcx(root_file, item);
        if (!ncx) {
            return ncx.error();
        }
        return std::optional<core::Ncx>(std::move(ncx).value());
    }

    // 导航文档（EPUB 3）：只识别，不解析
    if (const core::Item* nav = findNavigationDocument(manifest)) {
        EPUB_DEBUG("Navigation document candidate {} ({}), not parsed", nav->id, nav->href);
    } else {
        EPUB_DEBUG("No table of contents found");
    }
    return std::optional<core::Ncx>();
}

const core::Item* TocResolver::findNavigationDocument(const std::vector<core::Item>& manifest) {
    const core::Item* first_html = nullptr;
    for (const auto& item : manifest) {
        if (item.hasProperty(std::string(Constants::kNavProperty))) {
            return &item;
        }
        if (!first_html && item.media_type.find(Constants::kHtmlMediaTypeMarker) != std::string::npos) {
            first_html = &item;
        }
    }
    return first_html;
}

core::Result<core::Ncx> TocResolver::loadNcx(const std::string& root_file, const core::Item& item) const {
    const std::string path = utils::PathUtils::join(utils::PathUtils::dirName(root_file), item.href);

    auto content = accessor_.getBytes(path);
    if (!content) {
        EPUB_ERROR("Failed to read NCX {}: {}", path, content.error().fullMessage());
        return content.error();
    }

    reader::NcxParser parser;
    if (!parser.parse(*content)) {
        EPUB_ERROR("Failed to parse NCX {}: {}", path, parser.getErrorMessage());
        return core::makeError(core::ErrorCode::XmlParseError, parser.getErrorMessage(), path);
    }

    core::Ncx ncx = parser.takeNcx();
    EPUB_DEBUG("Loaded NCX {}: title='{}', {} top-level entries", path, ncx.title, ncx.nav_map.size());
    return ncx;
}

}} // namespace epubkit::epub
