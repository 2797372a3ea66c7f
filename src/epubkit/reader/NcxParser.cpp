#include "epubkit/reader/NcxParser.hpp"

namespace epubkit {
namespace reader {

void NcxParser::onStartElement(std::string_view name, AttributeSpan attributes, int /*depth*/) {
    std::string_view local = localName(name);

    if (local == "navPoint" && isInElement("navMap")) {
        core::NavPoint point;
        point.id = getAttributeOr(attributes, "id");
        point.play_order = getAttributeOr(attributes, "playOrder");
        open_points_.push_back(std::move(point));
        return;
    }

    if (local == "content" && parentIs("navPoint") && !open_points_.empty()) {
        auto& point = open_points_.back();
        if (point.src.empty()) {
            point.src = getAttributeOr(attributes, "src");
        }
        return;
    }

    if (local == "text" && (parentIs("docTitle") || parentIs("navLabel"))) {
        startCollectingText();
    }
}

void NcxParser::onEndElement(std::string_view name, int /*depth*/) {
    std::string_view local = localName(name);

    if (local == "text") {
        if (parentIs("docTitle") && ncx_.title.empty()) {
            ncx_.title = getCurrentText();
        } else if (parentIs("navLabel") && !open_points_.empty() && open_points_.back().label.empty()) {
            open_points_.back().label = getCurrentText();
        }
        stopCollectingText();
        return;
    }

    if (local == "navPoint" && !open_points_.empty()) {
        core::NavPoint point = std::move(open_points_.back());
        open_points_.pop_back();
        READER_DEBUG("NavPoint: id={}, label={}, src={}, children={}",
                     point.id, point.label, point.src, point.children.size());
        if (open_points_.empty()) {
            ncx_.nav_map.push_back(std::move(point));
        } else {
            open_points_.back().children.push_back(std::move(point));
        }
    }
}

}} // namespace epubkit::reader
