#include "epubkit/reader/ContainerParser.hpp"

namespace epubkit {
namespace reader {

void ContainerParser::onStartElement(std::string_view name, AttributeSpan attributes, int /*depth*/) {
    if (localName(name) != "rootfile" || !parentIs("rootfiles")) {
        return;
    }

    auto full_path = findAttribute(attributes, "full-path");
    if (!full_path || full_path->empty()) {
        READER_WARN("Skipping rootfile without full-path");
        return;
    }

    RootFile root;
    root.full_path = std::move(*full_path);
    root.media_type = getAttributeOr(attributes, "media-type");
    READER_DEBUG("Found rootfile: {} ({})", root.full_path, root.media_type);
    root_files_.push_back(std::move(root));
}

}} // namespace epubkit::reader
