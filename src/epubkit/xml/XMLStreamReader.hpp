#pragma once

#include "epubkit/core/span.hpp"
#include <expat.h>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace epubkit {
namespace xml {

/**
 * @brief 基于libexpat的SAX解析器
 *
 * - 事件回调，属性和元素名以string_view形式直接引用expat缓冲区
 * - 元素内文本按段回调：子元素开始前和结束标签处各回调一次，深度为文本所属元素的深度
 * - 使用文档自身声明的编码
 * - 回调抛出的异常会终止解析并以 CallbackError 返回
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 文档格式错误
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

// XML属性（零拷贝，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, core::span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setErrorCallback(ErrorCallback callback) { error_callback_ = std::move(callback); }

    // 解析选项设置
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }

    // 解析方法
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 状态查询
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 属性缓存池（每个开始标签复用）
    std::vector<XMLAttribute> attribute_pool_;

    // 当前文本内容累积
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;

    size_t elements_parsed_ = 0;

    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    core::span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    bool deliverText(int depth);
    static std::string_view trimStringView(std::string_view str);
    void handleError(XMLParseError error, const std::string& message);
    void abortFromCallback(const char* stage, const std::exception& e);
};

}} // namespace epubkit::xml
