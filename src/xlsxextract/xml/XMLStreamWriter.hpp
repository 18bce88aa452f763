#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xlsxextract {
namespace xml {

/**
 * @brief 写入内存的流式 XML 生成器
 *
 * 属性在元素开始标签关闭前缓存；文本和属性值自动转义。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;

    void startDocument();

    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, double value);

    void writeText(std::string_view text);
    void writeText(double value);

    /**
     * @brief 原样写入（不转义），用于拼接保留下来的 XML 片段
     */
    void writeRaw(std::string_view data);

    /**
     * @brief 关闭所有未结束的元素并返回结果
     */
    std::string toString();

    void clear();

    static std::string escapeText(std::string_view text);
    static std::string escapeAttribute(std::string_view value);

private:
    struct XMLAttribute {
        std::string key;
        std::string value;

        XMLAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<XMLAttribute> pending_attributes_;
    bool in_element_ = false;
    bool self_closing_ = false;

    void ensureElementClosed();
};

}} // namespace xlsxextract::xml
