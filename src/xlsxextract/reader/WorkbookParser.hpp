#pragma once

#include "xlsxextract/reader/BaseSAXParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief 工作表条目
 */
struct WorksheetInfo {
    std::string name;
    std::string sheet_id;
    std::string rel_id;
};

/**
 * @brief 定义名称条目
 */
struct DefinedNameInfo {
    std::string name;
    std::string formula;
    std::optional<int> local_sheet_id;
    bool hidden = false;
};

/**
 * @brief 解析 xl/workbook.xml：工作表列表、定义名称和 date1904 标志
 */
class WorkbookParser : public BaseSAXParser {
public:
    const std::vector<WorksheetInfo>& getWorksheets() const { return worksheets_; }
    const std::vector<DefinedNameInfo>& getDefinedNames() const { return defined_names_; }
    bool isDate1904() const { return date1904_; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                        int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;

private:
    std::vector<WorksheetInfo> worksheets_;
    std::vector<DefinedNameInfo> defined_names_;
    bool date1904_ = false;
    bool in_sheets_ = false;
    bool in_defined_name_ = false;
};

}} // namespace xlsxextract::reader
