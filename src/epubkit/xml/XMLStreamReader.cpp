#include "epubkit/xml/XMLStreamReader.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace epubkit {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(16);
    current_text_.reserve(256);
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate(nullptr);
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML buffer");
        return XMLParseError::InvalidInput;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        handleError(XMLParseError::InvalidInput, fmt::format("XML buffer too large: {} bytes", size));
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }
    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调中止时错误已经记录
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

// libexpat回调函数实现

void XMLCALL XMLStreamReader::startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(user_data);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    // 子元素之前的文本属于父元素，先回调
    if (reader->current_depth_ > 0 && !reader->deliverText(reader->current_depth_ - 1)) {
        return;
    }

    auto attributes = reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* user_data, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(user_data);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (!reader->deliverText(reader->current_depth_)) {
        return;
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("end element", e);
            return;
        }
    }

    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::characterDataHandler(void* user_data, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(user_data);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

bool XMLStreamReader::deliverText(int depth) {
    if (current_text_.empty()) {
        return true;
    }
    if (text_callback_) {
        std::string_view text_content = trim_whitespace_ ?
            trimStringView(current_text_) : std::string_view{current_text_};

        if (!text_content.empty()) {
            try {
                text_callback_(text_content, depth);
            } catch (const std::exception& e) {
                abortFromCallback("text", e);
                return false;
            }
        }
    }
    current_text_.clear();
    return true;
}

core::span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])}
                );
            }
        }
    }

    return core::span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::abortFromCallback(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_DEBUG("XML parse error: {}", message);

    if (error_callback_) {
        int line = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
        int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, line, column);
    }
}

}} // namespace epubkit::xml
