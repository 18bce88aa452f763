#pragma once

#include "xlsxextract/core/Value.hpp"
#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace xlsxextract {
namespace match {

/**
 * @brief 值谓词：运算符 + 操作数
 *
 * 不可变对象。match() 是纯函数：谓词成立时返回捕获值，否则返回 std::nullopt。
 * 类型不兼容（文本 vs 数字、布尔 vs 数字等）视为不匹配而不是错误；
 * Date 与 DateTime 比较时把 Date 扩展为当天零点。
 */
class Comparator {
public:
    enum class Operator {
        Equal,
        NotEqual,
        Greater,
        GreaterEqual,
        Less,
        LessEqual,
        Empty,
        NotEmpty,
        Regex
    };

    /**
     * @brief 构造比较器
     * @throws core::InvalidComparator 正则的操作数不是文本，或正则表达式非法
     */
    explicit Comparator(Operator op, core::Value operand = core::Value());

    Operator getOperator() const { return op_; }
    const core::Value& getOperand() const { return operand_; }

    /**
     * @brief 对候选值求值
     *
     * - Empty：返回空文本
     * - Regex：有捕获组时返回第1组文本，否则返回整个候选文本
     * - 其他：返回候选值本身
     */
    std::optional<core::Value> match(const core::Value& candidate) const;

    std::string toString() const;

    bool operator==(const Comparator& other) const {
        return op_ == other.op_ && operand_ == other.operand_;
    }
    bool operator!=(const Comparator& other) const { return !(*this == other); }

private:
    std::optional<core::Value> matchRegex(const core::Value& candidate) const;

    Operator op_;
    core::Value operand_;
    std::shared_ptr<const std::regex> regex_;
};

const char* toString(Comparator::Operator op) noexcept;

/**
 * @brief 三路比较兼容的两个值
 * @return -1 / 0 / 1；类型不兼容时返回 std::nullopt
 */
std::optional<int> compareValues(const core::Value& lhs, const core::Value& rhs);

}} // namespace xlsxextract::match
