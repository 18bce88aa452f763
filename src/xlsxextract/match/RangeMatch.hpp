#pragma once

#include "xlsxextract/match/CellMatch.hpp"
#include <optional>
#include <string>

namespace xlsxextract {
namespace match {

/**
 * @brief 定位矩形区域
 *
 * 四种方式：
 * - 引用：定义名称、命名表格或 A1 区域
 * - 起点 + 终点：两个 CellMatch 分别定位，必须在同一工作表
 * - 起点 + 尺寸：以起点为左上角的 rows x cols 区域
 * - 连续区域（默认）：从起点沿所在行向右、沿所在列向下扩展，直到遇到 Null 或空文本
 *
 * 设置了工作表条件时，构造时把它下发给没有工作表条件的起点/终点（生成新的副本）。
 */
class RangeMatch {
public:
    struct Params {
        std::string name;
        std::optional<Comparator> sheet;
        std::optional<std::string> reference;
        std::optional<CellMatch> start_cell;
        std::optional<CellMatch> end_cell;
        std::optional<int> rows;
        std::optional<int> cols;
    };

    /**
     * @throws core::ConfigurationException 参数组合非法，或行列数超过工作表尺寸
     */
    explicit RangeMatch(Params params);

    static RangeMatch byReference(const std::string& name, const std::string& reference,
                                  std::optional<Comparator> sheet = std::nullopt);

    static RangeMatch contiguous(const std::string& name, CellMatch start_cell,
                                 std::optional<Comparator> sheet = std::nullopt);

    std::optional<MatchResult> match(const core::Workbook& workbook) const;

    /**
     * @brief 起点搜索从 row 开始的副本
     */
    RangeMatch withStartMinRow(int row) const;

    bool isContiguous() const {
        return params_.start_cell && !params_.end_cell && !params_.rows;
    }

    const std::string& getName() const { return params_.name; }
    const std::optional<Comparator>& getSheet() const { return params_.sheet; }
    const std::optional<std::string>& getReference() const { return params_.reference; }
    const std::optional<CellMatch>& getStartCell() const { return params_.start_cell; }
    const std::optional<CellMatch>& getEndCell() const { return params_.end_cell; }
    const Params& params() const { return params_; }

private:
    std::optional<MatchResult> matchByReference(const core::Workbook& workbook) const;
    core::Range growContiguous(core::Worksheet& sheet, int row, int col) const;

    Params params_;
};

}} // namespace xlsxextract::match
