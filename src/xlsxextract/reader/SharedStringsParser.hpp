#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief 解析 xl/sharedStrings.xml
 *
 * 富文本的各个 run 拼接为一个字符串；注音（rPh）忽略。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    const std::vector<std::string>& getStrings() const { return strings_; }
    std::vector<std::string> takeStrings() { return std::move(strings_); }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;

private:
    std::vector<std::string> strings_;
    std::string current_;
    bool in_item_ = false;
    bool in_text_ = false;
    int phonetic_depth_ = 0;
};

}} // namespace xlsxextract::reader
