#pragma once

#include <expat.h>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace xlsxextract {
namespace xml {

// 解析错误
enum class XMLParseError {
    Ok,                    // 成功
    InvalidInput,          // 输入为空
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 文档格式错误
    MemoryError,           // 内存不足
    CallbackError          // 回调抛出异常
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// 属性视图，只在回调期间有效
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

/**
 * @brief 基于 libexpat 的 SAX 解析器
 *
 * 元素的文本内容在元素结束时一次性回调（子元素开始时清空已收集的文本）。
 * 回调抛出的异常会中止解析，错误信息可从 getLastErrorMessage() 取得。
 */
class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name,
                                                    const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }

    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    XML_Parser parser_ = nullptr;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;
    size_t elements_parsed_ = 0;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    static void XMLCALL startElementHandler(void* user_data, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* user_data, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* user_data, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleCallbackError(const char* where, const std::exception& e);
};

}} // namespace xlsxextract::xml
