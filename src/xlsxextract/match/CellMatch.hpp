#pragma once

#include "xlsxextract/match/Comparator.hpp"
#include "xlsxextract/match/MatchResult.hpp"
#include <optional>
#include <string>

namespace xlsxextract {
namespace core {
class Workbook;
class Worksheet;
}

namespace match {

/**
 * @brief 定位单个单元格
 *
 * 按引用（定义名称、命名表格、A1 坐标）或按值（在搜索框内行优先扫描，
 * 取第一个满足比较器的单元格）定位，之后再应用行列偏移。
 * 未命中返回 std::nullopt，从不抛出；非法组合在构造时抛出 ConfigurationException。
 */
class CellMatch {
public:
    struct Params {
        std::string name;
        std::optional<Comparator> sheet;
        std::optional<std::string> reference;
        std::optional<Comparator> value;
        int row_offset = 0;
        int col_offset = 0;
        std::optional<int> min_row;
        std::optional<int> min_col;
        std::optional<int> max_row;
        std::optional<int> max_col;
    };

    /**
     * @throws core::ConfigurationException reference 与 value 不是恰好设置一个，边界非法，或偏移超过工作表尺寸
     */
    explicit CellMatch(Params params);

    static CellMatch byReference(const std::string& name, const std::string& reference,
                                 std::optional<Comparator> sheet = std::nullopt);

    static CellMatch byValue(const std::string& name, Comparator sheet, Comparator value);

    /**
     * @brief 在工作簿中定位
     */
    std::optional<MatchResult> match(const core::Workbook& workbook) const;

    /**
     * @brief 在指定工作表的指定搜索框内定位（用于在表格内查找行/列）
     *
     * 按值匹配时以 box 代替自身的边界；偏移之后落在 box 之外的结果被拒绝。
     */
    std::optional<MatchResult> matchInSheet(core::Worksheet& sheet, const Bounds& box) const;

    /**
     * @brief 工作簿中第一个名称满足工作表条件的工作表
     */
    core::Worksheet* selectSheet(const core::Workbook& workbook) const;

    // 返回修改后的副本
    CellMatch withSheet(const std::optional<Comparator>& sheet) const;
    CellMatch withMinRow(int min_row) const;
    CellMatch withOffset(int row_offset, int col_offset) const;
    CellMatch withBounds(std::optional<int> min_row, std::optional<int> min_col,
                         std::optional<int> max_row, std::optional<int> max_col) const;

    const std::string& getName() const { return params_.name; }
    const std::optional<Comparator>& getSheet() const { return params_.sheet; }
    const std::optional<std::string>& getReference() const { return params_.reference; }
    const std::optional<Comparator>& getValue() const { return params_.value; }
    int getRowOffset() const { return params_.row_offset; }
    int getColOffset() const { return params_.col_offset; }
    const Params& params() const { return params_; }

private:
    std::optional<MatchResult> searchByValue(core::Worksheet& sheet, const Bounds& box) const;
    std::optional<MatchResult> applyOffset(MatchResult result) const;

    Params params_;
};

}} // namespace xlsxextract::match
