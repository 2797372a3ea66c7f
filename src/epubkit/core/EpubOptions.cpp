#include "epubkit/core/EpubOptions.hpp"
#include <algorithm>

namespace epubkit {
namespace core {

Option withCancellation(CancellationToken token) {
    return [token = std::move(token)](EpubOptions& options) {
        options.cancellation = token;
    };
}

Option withCover(bool include) {
    return [include](EpubOptions& options) {
        options.include_cover = include;
    };
}

Option withMetadata(bool include) {
    return [include](EpubOptions& options) {
        options.include_metadata = include;
    };
}

Option withChapterFilter(EpubOptions::ChapterFilter filter) {
    return [filter = std::move(filter)](EpubOptions& options) {
        options.chapter_filter = filter;
    };
}

Option withMaxContentLength(int64_t max_length) {
    return [max_length](EpubOptions& options) {
        options.max_content_length = std::max<int64_t>(0, max_length);
    };
}

EpubOptions makeOptions(std::initializer_list<Option> options) {
    EpubOptions result;
    for (const auto& option : options) {
        if (option) {
            option(result);
        }
    }
    return result;
}

}} // namespace epubkit::core
