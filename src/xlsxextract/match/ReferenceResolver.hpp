#pragma once

#include "xlsxextract/core/Range.hpp"
#include "xlsxextract/match/Comparator.hpp"
#include <optional>
#include <string>

namespace xlsxextract {
namespace core {
class Workbook;
class Worksheet;
}

namespace match {

/**
 * @brief 把引用字符串解析为 Range
 *
 * 解析顺序：
 * 1. 所选工作表的局部定义名称
 * 2. 工作簿级定义名称
 * 3. 命名表格：所选工作表上；未指定工作表条件时在全部工作表上
 * 4. A1 坐标，可自带工作表名；不带工作表名时需要所选工作表
 *
 * 解析失败返回空 Range，从不抛出。
 */
class ReferenceResolver {
public:
    /**
     * @param selected_sheet 工作表条件选中的工作表，可为 nullptr
     * @param sheet_constrained 是否设置了工作表条件
     */
    static core::Range resolve(const core::Workbook& workbook,
                               const std::string& reference,
                               core::Worksheet* selected_sheet,
                               bool sheet_constrained);

    /**
     * @brief 按工作簿顺序返回第一个名称满足条件的工作表
     * @return 没有条件或没有工作表满足时返回 nullptr
     */
    static core::Worksheet* selectSheet(const core::Workbook& workbook,
                                        const std::optional<Comparator>& sheet_comparator);

private:
    static core::Range resolveDefinedName(const core::Workbook& workbook,
                                          const std::string& reference,
                                          core::Worksheet* selected_sheet);
};

}} // namespace xlsxextract::match
