#pragma once

#include "xlsxextract/core/Value.hpp"
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace xlsxextract {
namespace core {

/**
 * @brief 单元格：值 + 样式索引 + 可选公式
 *
 * 样式索引直接对应 styles.xml 中 cellXfs 的下标，不做解释。
 * 写入新值会清除公式，样式保持不变。
 */
class Cell {
public:
    using Attributes = std::vector<std::pair<std::string, std::string>>;

    Cell() = default;
    explicit Cell(Value value, uint32_t style_index = 0)
        : value_(std::move(value)), style_index_(style_index) {}

    const Value& getValue() const { return value_; }

    void setValue(Value value) {
        value_ = std::move(value);
        formula_.clear();
        formula_attributes_.clear();
    }

    uint32_t getStyleIndex() const { return style_index_; }
    void setStyleIndex(uint32_t index) { style_index_ = index; }

    bool hasFormula() const { return !formula_.empty() || !formula_attributes_.empty(); }
    const std::string& getFormula() const { return formula_; }

    /**
     * @brief 设置公式，value 作为缓存结果保留
     * @param attributes <f> 元素上的属性（t / ref / si 等），原样写回
     */
    void setFormula(const std::string& formula, Attributes attributes = {}) {
        formula_ = formula;
        formula_attributes_ = std::move(attributes);
    }

    const Attributes& getFormulaAttributes() const { return formula_attributes_; }

    /**
     * @brief 无值、无公式、默认样式
     */
    bool isEmpty() const { return value_.isNull() && !hasFormula() && style_index_ == 0; }

private:
    Value value_;
    uint32_t style_index_ = 0;
    std::string formula_;
    Attributes formula_attributes_;
};

}} // namespace xlsxextract::core
