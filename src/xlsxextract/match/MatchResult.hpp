#pragma once

#include "xlsxextract/core/Range.hpp"
#include "xlsxextract/core/Value.hpp"
#include <optional>

namespace xlsxextract {
namespace match {

/**
 * @brief 一次匹配的结果：命中的区域 + 比较器捕获的值
 *
 * 按引用解析时没有捕获值。
 */
struct MatchResult {
    core::Range range;
    std::optional<core::Value> value;
};

/**
 * @brief 搜索框（行列基于1，闭区间）
 */
struct Bounds {
    int min_row = 1;
    int min_col = 1;
    int max_row = 0;
    int max_col = 0;

    bool contains(int row, int col) const {
        return row >= min_row && row <= max_row && col >= min_col && col <= max_col;
    }

    static Bounds of(const core::Range& range) {
        return Bounds{range.firstRow(), range.firstColumn(), range.lastRow(), range.lastColumn()};
    }
};

}} // namespace xlsxextract::match
