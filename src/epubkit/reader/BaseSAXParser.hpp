#pragma once

#include "epubkit/xml/XMLStreamReader.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epubkit {
namespace reader {

using xml::XMLAttribute;
using AttributeSpan = core::span<const XMLAttribute>;

/**
 * @brief SAX解析器基类
 *
 * 驱动 XMLStreamReader，维护元素栈和文本收集状态；子类只需实现
 * onStartElement/onEndElement，在结束标签处通过 getCurrentText() 取文本。
 *
 * 收集的文本只包含开始收集的那个元素自身的字符数据（子元素内的文本不计入），
 * 空白按原样保留。
 *
 * EPUB文档的元素常带命名空间前缀（dc:title、opf:meta），
 * 子类一般用 localName() 去掉前缀后再比较。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;  // 本地名
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        int text_depth = -1;                     // 正在收集文本的元素深度
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            text_depth = -1;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功；失败原因见 getErrorMessage()
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(false);

        reader.setStartElementCallback([this](std::string_view name, AttributeSpan attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(name, depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });
        reader.setErrorCallback([this](xml::XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = fmt::format("XML parse error at line {}, column {}: {}", line, column, message);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                setError("XML parsing failed");
            }
            READER_DEBUG("SAX parse failed: {}", state_.error_message);
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

    /**
     * @brief 去掉命名空间前缀（"dc:title" -> "title"）
     */
    static std::string_view localName(std::string_view qname) {
        size_t colon = qname.find(':');
        return colon == std::string_view::npos ? qname : qname.substr(colon + 1);
    }

protected:
    virtual void onStartElement(std::string_view name, AttributeSpan attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;

    // ==================== 属性工具 ====================

    /**
     * @brief 按属性名查找（同时接受带前缀的写法，如 opf:role）
     */
    std::optional<std::string> findAttribute(AttributeSpan attributes, std::string_view name) const {
        for (const auto& attr : attributes) {
            if (attr.name == name || localName(attr.name) == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    std::string getAttributeOr(AttributeSpan attributes, std::string_view name,
                               const std::string& default_value = std::string()) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    // ==================== 状态工具 ====================

    /**
     * @brief 开始收集当前元素的文本，须在 onStartElement 中调用
     */
    void startCollectingText() {
        state_.collecting_text = true;
        state_.text_depth = state_.current_depth;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
        state_.text_depth = -1;
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
    }

    /**
     * @brief 当前元素的直接父元素是否为 parent（本地名）
     */
    bool parentIs(std::string_view parent) const {
        const auto& stack = state_.element_stack;
        return stack.size() >= 2 && stack[stack.size() - 2] == parent;
    }

    bool isInElement(std::string_view element_name) const {
        for (const auto& name : state_.element_stack) {
            if (name == element_name) return true;
        }
        return false;
    }

private:
    void handleStartElement(std::string_view name, AttributeSpan attributes, int depth) {
        state_.element_stack.emplace_back(localName(name));
        state_.current_depth = depth;
        onStartElement(name, attributes, depth);
    }

    void handleEndElement(std::string_view name, int depth) {
        state_.current_depth = depth;
        onEndElement(name, depth);
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
    }

    void handleText(std::string_view text, int depth) {
        if (state_.collecting_text && depth == state_.text_depth) {
            state_.current_text.append(text.data(), text.size());
        }
    }
};

}} // namespace epubkit::reader
