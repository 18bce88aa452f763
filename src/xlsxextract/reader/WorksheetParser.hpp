#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include "xlsxextract/core/Cell.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace xlsxextract {
namespace core {
class Worksheet;
}

namespace reader {

/**
 * @brief 单元格取值所需的工作簿级上下文
 */
struct CellContext {
    const std::vector<std::string>* shared_strings = nullptr;
    const std::set<uint32_t>* date_styles = nullptr;
    const std::set<uint32_t>* time_only_styles = nullptr;
    bool date1904 = false;
};

/**
 * @brief 解析工作表 sheetData，把单元格写入 Worksheet
 *
 * 单元格类型：s / str / inlineStr / n / b / e / d。带日期格式的数字转换为
 * DateTime（只含时间记号且小于 1 时为 Time）；错误值按文本保存。
 */
class WorksheetParser : public BaseSAXParser {
public:
    WorksheetParser(core::Worksheet& worksheet, const CellContext& context)
        : worksheet_(worksheet), context_(context) {}

    size_t getCellCount() const { return cell_count_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;

private:
    struct CellData {
        int row = 0;
        int col = 0;
        std::string type;
        uint32_t style = 0;
        std::string value;
        std::string inline_text;
        std::string formula;
        core::Cell::Attributes formula_attributes;
        bool has_formula = false;
    };

    void finishCell();
    core::Value convertValue(const CellData& cell) const;

    core::Worksheet& worksheet_;
    const CellContext& context_;

    CellData cell_;
    bool in_sheet_data_ = false;
    bool in_cell_ = false;
    bool in_value_ = false;
    bool in_formula_ = false;
    bool in_inline_text_ = false;
    int phonetic_depth_ = 0;
    int current_row_ = 0;
    int last_col_ = 0;
    size_t cell_count_ = 0;
};

}} // namespace xlsxextract::reader
