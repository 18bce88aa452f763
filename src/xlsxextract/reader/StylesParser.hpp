#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief 解析 xl/styles.xml 中与取值相关的部分
 *
 * 只关心 numFmts 和 cellXfs：找出哪些单元格样式把数字显示为日期/时间。
 */
class StylesParser : public BaseSAXParser {
public:
    enum class FormatKind { Number, Date, TimeOnly };

    /**
     * @brief 判断数字格式的类别
     * @param format_code 自定义格式代码；内置格式传空串
     */
    static FormatKind classifyFormat(int num_fmt_id, const std::string& format_code);

    const std::set<uint32_t>& getDateStyles() const { return date_styles_; }
    const std::set<uint32_t>& getTimeOnlyStyles() const { return time_only_styles_; }
    uint32_t getCellXfCount() const { return static_cast<uint32_t>(xf_num_formats_.size()); }
    const std::map<int, std::string>& getNumberFormats() const { return number_formats_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::map<int, std::string> number_formats_;
    std::vector<int> xf_num_formats_;
    std::set<uint32_t> date_styles_;
    std::set<uint32_t> time_only_styles_;
    bool in_cell_xfs_ = false;
};

}} // namespace xlsxextract::reader
