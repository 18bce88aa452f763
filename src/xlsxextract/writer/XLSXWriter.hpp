#pragma once

#include "xlsxextract/core/Workbook.hpp"
#include <string>
#include <utility>
#include <vector>

namespace xlsxextract {
namespace archive {
class ZipWriter;
}

namespace writer {

/**
 * @brief 把 core::Workbook 写成 xlsx 文件
 *
 * 从文件读入的工作簿按原包重新打包：重新生成各工作表的 sheetData、
 * workbook.xml 中的 definedNames、表格部件和 sharedStrings.xml，
 * 其余条目原样复制。内存中新建的工作簿使用最小的包模板。
 *
 * 先写入临时文件，成功后再替换目标文件，因此可以覆盖源文件。
 */
class XLSXWriter {
public:
    explicit XLSXWriter(const core::Workbook& workbook);

    XLSXWriter(const XLSXWriter&) = delete;
    XLSXWriter& operator=(const XLSXWriter&) = delete;

    /**
     * @throws core::FileException 无法读取源包或无法写入目标文件
     * @throws core::FormatException 源包部件不完整
     * @throws core::OperationException 工作簿含有无法写回原包的新工作表或新表格
     */
    void write(const std::string& path);

    static void save(const core::Workbook& workbook, const std::string& path);

    /**
     * @brief 生成 <definedNames> 片段，没有名称时返回空串
     */
    static std::string generateDefinedNames(const core::DefinedNameManager& names);

    /**
     * @brief 用新的 definedNames 片段替换 workbook.xml 中原有的
     * @throws core::FormatException workbook.xml 中没有 </sheets>
     */
    static std::string spliceDefinedNames(const std::string& workbook_xml, const std::string& defined_names);

    /**
     * @brief 生成表格部件，列名取自表头行
     */
    static std::string generateTable(const core::Table& table, const core::Worksheet& worksheet, int id);

private:
    using Part = std::pair<std::string, std::string>;

    std::vector<Part> buildRepackedParts();
    std::vector<Part> buildTemplateParts();

    static void addPart(archive::ZipWriter& zip, const Part& part, const std::string& target);

    const core::Workbook& workbook_;
};

}} // namespace xlsxextract::writer
