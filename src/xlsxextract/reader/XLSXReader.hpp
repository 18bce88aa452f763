#pragma once

#include "xlsxextract/archive/ZipReader.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/reader/WorksheetParser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace xlsxextract {
namespace reader {

/**
 * @brief 把 xlsx 文件读入 core::Workbook
 *
 * 读取工作表、定义名称、命名表格和单元格值；样式只记录索引以及哪些索引是日期格式。
 * 工作表 XML 中 sheetData 以外的部分原样保存在 Worksheet 上，写回时拼接。
 */
class XLSXReader {
public:
    explicit XLSXReader(const std::string& filename);

    XLSXReader(const XLSXReader&) = delete;
    XLSXReader& operator=(const XLSXReader&) = delete;

    /**
     * @throws core::FileException 文件不存在或无法读取
     * @throws core::FormatException 不是 xlsx 包
     */
    void open();
    void close();
    bool isOpen() const { return zip_reader_.isOpen(); }

    /**
     * @brief 解析整个工作簿
     * @throws core::XMLException 部件 XML 格式错误
     * @throws core::FormatException 缺少必需部件
     */
    std::unique_ptr<core::Workbook> loadWorkbook();

    /**
     * @brief open + loadWorkbook
     */
    static std::unique_ptr<core::Workbook> load(const std::string& filename);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
    archive::ZipReader zip_reader_;

    std::vector<std::string> shared_strings_;

    std::string readPart(const std::string& path);
    bool hasPart(const std::string& path) const;

    std::string findWorkbookPart();
    void parseSharedStrings(const std::string& path);
    void parseStyles(const std::string& path, core::PackageInfo& package);
    void parseWorksheet(const std::string& path, core::Worksheet& worksheet, const CellContext& context);
    void parseTables(const std::string& sheet_path, core::Worksheet& worksheet);

    template <typename Parser>
    void parsePart(Parser& parser, const std::string& path);
};

}} // namespace xlsxextract::reader
