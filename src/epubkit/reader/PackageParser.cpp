#include "epubkit/reader/PackageParser.hpp"

namespace epubkit {
namespace reader {

std::string* PackageParser::metadataField(std::string_view local_name) {
    if (local_name == "title")       return &metadata_.title;
    if (local_name == "creator")     return &metadata_.creator;
    if (local_name == "subject")     return &metadata_.subject;
    if (local_name == "description") return &metadata_.description;
    if (local_name == "publisher")   return &metadata_.publisher;
    if (local_name == "contributor") return &metadata_.contributor;
    if (local_name == "date")        return &metadata_.date;
    if (local_name == "type")        return &metadata_.type;
    if (local_name == "format")      return &metadata_.format;
    if (local_name == "identifier")  return &metadata_.identifier;
    if (local_name == "language")    return &metadata_.language;
    if (local_name == "rights")      return &metadata_.rights;
    return nullptr;
}

void PackageParser::onStartElement(std::string_view name, AttributeSpan attributes, int depth) {
    std::string_view local = localName(name);

    if (parentIs("metadata")) {
        if (local == "meta") {
            handleMeta(attributes);
            return;
        }
        std::string* field = metadataField(local);
        // 重复出现的字段以最后一次为准
        if (field) {
            current_field_ = field;
            field_depth_ = depth;
            startCollectingText();
        }
        return;
    }

    if (local == "item" && parentIs("manifest")) {
        core::Item item;
        item.id = getAttributeOr(attributes, "id");
        item.href = getAttributeOr(attributes, "href");
        item.media_type = getAttributeOr(attributes, "media-type");
        item.properties = getAttributeOr(attributes, "properties");
        READER_DEBUG("Manifest item: id={}, href={}, type={}", item.id, item.href, item.media_type);
        manifest_.push_back(std::move(item));
        return;
    }

    if (local == "spine") {
        spine_.toc_id = getAttributeOr(attributes, "toc");
        return;
    }

    if (local == "itemref" && parentIs("spine")) {
        core::ItemRef ref;
        ref.idref = getAttributeOr(attributes, "idref");
        ref.linear = getAttributeOr(attributes, "linear");
        spine_.itemrefs.push_back(std::move(ref));
    }
}

void PackageParser::onEndElement(std::string_view /*name*/, int depth) {
    if (!current_field_ || depth != field_depth_) {
        return;
    }
    *current_field_ = getCurrentText();
    current_field_ = nullptr;
    field_depth_ = -1;
    stopCollectingText();
}

void PackageParser::handleMeta(AttributeSpan attributes) {
    auto meta_name = findAttribute(attributes, "name");
    if (!meta_name || *meta_name != "cover") {
        return;
    }
    auto content = findAttribute(attributes, "content");
    if (content && metadata_.cover_id.empty()) {
        metadata_.cover_id = std::move(*content);
        READER_DEBUG("Cover hint from metadata: {}", metadata_.cover_id);
    }
}

}} // namespace epubkit::reader
