#pragma once

#include "xlsxextract/utils/AddressParser.hpp"
#include <string>
#include <vector>
#include <utility>

namespace xlsxextract {
namespace core {

/**
 * @brief 命名表格（Excel "Table"）
 *
 * 引用按 displayName 进行；ref 以行列坐标保存，随行列插入删除平移。
 */
struct Table {
    int id = 0;
    std::string name;
    std::string display_name;
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;

    int header_row_count = 1;
    int totals_row_count = 0;
    bool has_auto_filter = true;

    /// tableStyleInfo 元素的属性，写回时原样输出
    std::vector<std::pair<std::string, std::string>> style_info;

    /// 包内部件路径，例如 "xl/tables/table1.xml"；内存中新建的表格为空
    std::string part_path;

    Table() = default;
    Table(std::string table_name, int r1, int c1, int r2, int c2)
        : name(table_name), display_name(std::move(table_name)),
          first_row(r1), first_col(c1), last_row(r2), last_col(c2) {}

    std::string ref() const {
        return utils::AddressParser::formatRange(first_row, first_col, last_row, last_col);
    }

    int rows() const { return last_row - first_row + 1; }
    int columns() const { return last_col - first_col + 1; }
};

}} // namespace xlsxextract::core
