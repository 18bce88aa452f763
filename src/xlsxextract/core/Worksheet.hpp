#pragma once

#include "xlsxextract/core/Cell.hpp"
#include "xlsxextract/core/Table.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace xlsxextract {
namespace core {

class Workbook;

/**
 * @brief 工作表：稀疏的单元格存储 + 命名表格
 *
 * 行列索引基于1。单元格按 (row, col) 排序存放，遍历顺序即行优先顺序。
 * 插入/删除行列会平移单元格、行属性、表格，并通知所属工作簿修正定义名称。
 */
class Worksheet {
public:
    using CellMap = std::map<std::pair<int, int>, Cell>;
    using RowAttributes = std::vector<std::pair<std::string, std::string>>;

    Worksheet(const std::string& name, Workbook* parent);

    // 禁用拷贝：Range 持有工作表指针
    Worksheet(const Worksheet&) = delete;
    Worksheet& operator=(const Worksheet&) = delete;

    const std::string& getName() const { return name_; }
    Workbook* getParentWorkbook() const { return parent_; }

    // ========== 单元格 ==========

    /**
     * @brief 读取值，单元格不存在时返回 Null
     */
    const Value& getValue(int row, int col) const;

    /**
     * @brief 写入值，保留已有样式，清除公式
     */
    void setValue(int row, int col, Value value);

    /**
     * @brief 获取单元格，不存在时创建
     */
    Cell& cell(int row, int col);

    /**
     * @brief 查找单元格，不存在时返回 nullptr
     */
    const Cell* findCell(int row, int col) const;

    bool hasCell(int row, int col) const;
    void removeCell(int row, int col);

    const CellMap& cells() const { return cells_; }

    /**
     * @brief 已用区域的右下角 (max_row, max_col)，空表返回 (0, 0)
     *
     * 已用区域总是从 A1 开始。
     */
    std::pair<int, int> usedRange() const;

    // ========== 行列插入/删除 ==========

    /**
     * @brief 插入后被平移的单元格、行属性和表格是否仍在工作表内
     */
    bool canInsertRows(int row, int count) const;
    bool canInsertColumns(int col, int count) const;

    /// @throws OperationException 位置或数量非法，或内容会被移出工作表
    void insertRows(int row, int count = 1);
    void deleteRows(int row, int count = 1);
    /// @throws OperationException 位置或数量非法，或内容会被移出工作表
    void insertColumns(int col, int count = 1);
    void deleteColumns(int col, int count = 1);

    // ========== 命名表格 ==========

    Table& addTable(Table table);
    const std::vector<Table>& tables() const { return tables_; }
    std::vector<Table>& tables() { return tables_; }

    /**
     * @brief 按 displayName 或 name 查找（不区分大小写）
     */
    Table* findTable(const std::string& name);
    const Table* findTable(const std::string& name) const;

    // ========== 包信息（读取器填充，写入器使用） ==========

    const std::string& getPartPath() const { return part_path_; }
    void setPartPath(const std::string& path) { part_path_ = path; }

    /**
     * @brief 工作表 XML 中 <sheetData> 之前/之后的原始文本
     */
    void setRawXml(std::string prefix, std::string suffix) {
        xml_prefix_ = std::move(prefix);
        xml_suffix_ = std::move(suffix);
    }
    const std::string& getXmlPrefix() const { return xml_prefix_; }
    const std::string& getXmlSuffix() const { return xml_suffix_; }

    void setRowAttributes(int row, RowAttributes attributes);
    const std::map<int, RowAttributes>& rowAttributes() const { return row_attributes_; }

private:
    void validatePosition(int row, int col) const;

    std::string name_;
    Workbook* parent_;
    CellMap cells_;
    std::vector<Table> tables_;
    std::map<int, RowAttributes> row_attributes_;

    std::string part_path_;
    std::string xml_prefix_;
    std::string xml_suffix_;
};

}} // namespace xlsxextract::core
