#pragma once

#include "xlsxextract/core/Value.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace xlsxextract {
namespace writer {

/**
 * @brief 为日期/时间值分配 cellXfs 样式
 *
 * 单元格样式已是日期格式时保持不变；否则按值类型在 cellXfs 末尾追加
 * 一个使用内置格式（14 日期、21 时间、22 日期时间）的 xf，同类只追加一次。
 */
class DateStyleAllocator {
public:
    /**
     * @param enabled 包中没有 styles.xml 时为 false，样式保持不变
     */
    DateStyleAllocator(const std::set<uint32_t>& date_styles, uint32_t cell_xf_count, bool enabled = true)
        : date_styles_(date_styles), cell_xf_count_(cell_xf_count), enabled_(enabled) {}

    /**
     * @brief 返回写入 value 时应使用的样式下标
     */
    uint32_t styleFor(uint32_t current, const core::Value& value);

    bool hasAppended() const { return !appended_.empty(); }

    /**
     * @brief 把追加的 xf 写入 styles.xml 的 cellXfs 并更新 count
     * @throws core::FormatException styles.xml 中没有 cellXfs
     */
    std::string patchStyles(const std::string& styles_xml) const;

    static int builtinFormatFor(core::Value::Type type);

private:
    const std::set<uint32_t>& date_styles_;
    uint32_t cell_xf_count_;
    bool enabled_;
    std::map<int, uint32_t> appended_;  ///< numFmtId -> 新 xf 下标
};

}} // namespace xlsxextract::writer
