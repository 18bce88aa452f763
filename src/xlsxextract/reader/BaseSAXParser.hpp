#pragma once

#include "xlsxextract/xml/XMLStreamReader.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief SAX 解析器基类
 *
 * 子类实现 onStartElement / onEndElement，需要文本时重写 onText。
 * 元素文本在元素结束前回调一次，不做 trim。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
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
     * @brief 解析 XML 内容
     * @return 是否成功，失败原因见 getErrorMessage()
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        xml::XMLStreamReader reader;
        reader.setStartElementCallback([this](std::string_view name,
                                              const std::vector<xml::XMLAttribute>& attributes, int depth) {
            state_.element_stack.emplace_back(name);
            onStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            onEndElement(name, depth);
            if (!state_.element_stack.empty()) {
                state_.element_stack.pop_back();
            }
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            onText(text, depth);
        });

        if (reader.parseFromString(xml_content) != xml::XMLParseError::Ok) {
            state_.has_error = true;
            state_.error_message = reader.getLastErrorMessage();
            READER_DEBUG("SAX parser error: {}", state_.error_message);
            return false;
        }
        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    static std::optional<std::string> findAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                    std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                               std::string_view name) {
        auto val = findAttribute(attributes, name);
        if (!val || val->empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        long parsed = std::strtol(val->c_str(), &end, 10);
        if (*end != '\0') {
            return std::nullopt;
        }
        return static_cast<int>(parsed);
    }

    static std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                      std::string_view name, const std::string& default_value) {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static int getIntAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                 std::string_view name, int default_value) {
        auto val = findIntAttribute(attributes, name);
        return val ? *val : default_value;
    }

    static bool getBoolAttributeOr(const std::vector<xml::XMLAttribute>& attributes,
                                   std::string_view name, bool default_value) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return default_value;
        }
        return *val == "1" || *val == "true";
    }

    /**
     * @brief 记录错误；解析结束后 parseXML 返回 false
     */
    void setError(const std::string& message) {
        if (!state_.has_error) {
            state_.has_error = true;
            state_.error_message = message;
        }
        READER_WARN("Parser error: {}", message);
    }

    std::string getCurrentElement() const {
        return state_.element_stack.empty() ? std::string() : state_.element_stack.back();
    }

    bool isInElement(std::string_view element_name) const {
        for (const auto& name : state_.element_stack) {
            if (name == element_name) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief 去掉命名空间前缀（x:row -> row）
     */
    static std::string_view localName(std::string_view name) {
        size_t colon = name.find(':');
        return colon == std::string_view::npos ? name : name.substr(colon + 1);
    }
};

}} // namespace xlsxextract::reader
