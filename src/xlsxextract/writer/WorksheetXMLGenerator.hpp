#pragma once

#include "xlsxextract/core/Worksheet.hpp"
#include "xlsxextract/writer/DateStyleAllocator.hpp"
#include "xlsxextract/writer/SharedStringTable.hpp"
#include "xlsxextract/xml/XMLStreamWriter.hpp"
#include <string>

namespace xlsxextract {
namespace writer {

/**
 * @brief 生成工作表部件
 *
 * 只重新生成 <sheetData>，其余内容取自读取时保存的原始前后缀，
 * 前缀中的 <dimension ref> 按当前已用区域更新。
 */
class WorksheetXMLGenerator {
public:
    /**
     * @param sst 为 nullptr 时字符串写成 inlineStr
     */
    WorksheetXMLGenerator(const core::Worksheet& worksheet, DateStyleAllocator& styles,
                          SharedStringTable* sst, bool date1904);

    /**
     * @brief 生成完整的工作表 XML
     * @param prefix <sheetData> 之前的原始文本
     * @param suffix </sheetData> 之后的原始文本
     */
    std::string generate(const std::string& prefix, const std::string& suffix);

    /**
     * @brief 只生成 <sheetData> 元素
     */
    std::string generateSheetData();

    /**
     * @brief 把前缀中 dimension 的 ref 改为 ref
     */
    static std::string patchDimension(const std::string& prefix, const std::string& ref);

    /**
     * @brief 工作表当前的 dimension 引用
     */
    static std::string dimensionRef(const core::Worksheet& worksheet);

private:
    void writeCell(xml::XMLStreamWriter& writer, int row, int col, const core::Cell& cell);
    void writeValue(xml::XMLStreamWriter& writer, const core::Value& value, bool has_formula);

    const core::Worksheet& worksheet_;
    DateStyleAllocator& styles_;
    SharedStringTable* sst_;
    bool date1904_;
};

}} // namespace xlsxextract::writer
