#pragma once

#include "xlsxextract/core/CellAddress.hpp"
#include "xlsxextract/core/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xlsxextract {
namespace core {

class Worksheet;
class Workbook;

/**
 * @brief 工作表中的矩形单元格区域，可带一个别名（定义名称或命名表格）
 *
 * Range 是值对象：保存工作表指针和外接矩形，不拥有单元格。
 * 对工作表做行列插入删除后，之前得到的 Range 全部失效，应使用 resize 返回的新 Range。
 */
class Range {
public:
    enum class AliasKind {
        None,
        DefinedName,
        NamedTable
    };

    /**
     * @brief 空区域
     */
    Range() = default;

    /**
     * @brief 构造区域，起止坐标自动规范化
     */
    Range(Worksheet* sheet, int first_row, int first_col, int last_row, int last_col,
          AliasKind alias_kind = AliasKind::None, std::string alias = "");

    /**
     * @brief 单个单元格的区域
     */
    static Range ofCell(Worksheet* sheet, int row, int col) {
        return Range(sheet, row, col, row, col);
    }

    bool isEmpty() const { return sheet_ == nullptr; }
    bool isCell() const { return !isEmpty() && rows() == 1 && columns() == 1; }
    bool isRange() const { return !isEmpty() && (rows() > 1 || columns() > 1); }

    /**
     * @brief 单个单元格区域的坐标；不是单个单元格时为空
     */
    std::optional<CellAddress> cell() const;
    std::optional<CellAddress> firstCell() const;
    std::optional<CellAddress> lastCell() const;

    int rows() const { return isEmpty() ? 0 : last_row_ - first_row_ + 1; }
    int columns() const { return isEmpty() ? 0 : last_col_ - first_col_ + 1; }

    Worksheet* sheet() const { return sheet_; }
    Workbook* document() const;

    AliasKind aliasKind() const { return alias_kind_; }
    const std::string& alias() const { return alias_; }
    bool hasAlias() const { return alias_kind_ != AliasKind::None; }

    /**
     * @brief 返回带新别名的副本
     */
    Range withAlias(AliasKind kind, const std::string& name) const;

    /**
     * @brief 生成引用字符串
     *
     * 有别名且 use_alias 时返回别名，否则返回 'Report 1'!$B$3 或 $B$2:$C$3 形式。
     * 空区域返回 std::nullopt。
     */
    std::optional<std::string> getReference(bool absolute = true, bool use_sheet = true,
                                            bool use_alias = true) const;

    /**
     * @brief 值的快照（行优先）
     */
    std::vector<std::vector<Value>> getValues() const;

    /**
     * @brief 相对坐标 (r, c)（基于0）处的值
     */
    const Value& valueAt(int r, int c) const;

    /**
     * @brief 相对坐标 (r, c)（基于0）处的绝对坐标
     */
    CellAddress addressAt(int r, int c) const;

    /**
     * @brief 第 i 行（基于0）从左到右的坐标
     */
    std::vector<CellAddress> rowVector(int i) const;

    /**
     * @brief 第 j 列（基于0）从上到下的坐标
     */
    std::vector<CellAddress> columnVector(int j) const;

    bool contains(int row, int col) const {
        return !isEmpty() && row >= first_row_ && row <= last_row_ &&
               col >= first_col_ && col <= last_col_;
    }

    int firstRow() const { return first_row_; }
    int firstColumn() const { return first_col_; }
    int lastRow() const { return last_row_; }
    int lastColumn() const { return last_col_; }

    bool operator==(const Range& other) const;
    bool operator!=(const Range& other) const { return !(*this == other); }

private:
    Worksheet* sheet_ = nullptr;
    int first_row_ = 0;
    int first_col_ = 0;
    int last_row_ = 0;
    int last_col_ = 0;
    AliasKind alias_kind_ = AliasKind::None;
    std::string alias_;
};

std::ostream& operator<<(std::ostream& os, const Range& range);

}} // namespace xlsxextract::core
