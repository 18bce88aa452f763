#include "xlsxextract/match/Comparator.hpp"
#include "xlsxextract/core/Exception.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace match {

using core::Value;

namespace {

template <typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // namespace

std::optional<int> compareValues(const Value& lhs, const Value& rhs) {
    using Type = Value::Type;

    if (lhs.isNull() || rhs.isNull()) {
        if (lhs.isNull() && rhs.isNull()) {
            return 0;
        }
        return std::nullopt;
    }

    // Date 与 DateTime 统一到 DateTime
    if (lhs.isDate() && rhs.isDateTime()) {
        return threeWay(core::DateTime(lhs.asDate()), rhs.asDateTime());
    }
    if (lhs.isDateTime() && rhs.isDate()) {
        return threeWay(lhs.asDateTime(), core::DateTime(rhs.asDate()));
    }

    if (lhs.type() != rhs.type()) {
        return std::nullopt;
    }

    switch (lhs.type()) {
        case Type::Text:
            return threeWay(lhs.asText(), rhs.asText());
        case Type::Number: {
            double a = lhs.asNumber();
            double b = rhs.asNumber();
            if (a != a || b != b) {
                return std::nullopt;  // NaN
            }
            return threeWay(a, b);
        }
        case Type::Boolean:
            return threeWay(lhs.asBoolean(), rhs.asBoolean());
        case Type::Date:
            return threeWay(lhs.asDate(), rhs.asDate());
        case Type::Time:
            return threeWay(lhs.asTime(), rhs.asTime());
        case Type::DateTime:
            return threeWay(lhs.asDateTime(), rhs.asDateTime());
        case Type::Null:
            break;
    }
    return std::nullopt;
}

Comparator::Comparator(Operator op, Value operand)
    : op_(op), operand_(std::move(operand)) {
    if (op_ != Operator::Regex) {
        return;
    }
    if (!operand_.isText()) {
        XLSXEXTRACT_THROW(core::InvalidComparator,
                          fmt::format("Regular expression must be text, got {}",
                                      core::typeName(operand_.type())));
    }
    try {
        regex_ = std::make_shared<const std::regex>(
            operand_.asText(), std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        XLSXEXTRACT_THROW(core::InvalidComparator,
                          fmt::format("Invalid regular expression `{}`: {}", operand_.asText(), e.what()));
    }
}

std::optional<Value> Comparator::match(const Value& candidate) const {
    switch (op_) {
        case Operator::Empty:
            if (candidate.isBlank()) {
                return Value(std::string());
            }
            return std::nullopt;

        case Operator::NotEmpty:
            if (!candidate.isBlank()) {
                return candidate;
            }
            return std::nullopt;

        case Operator::Regex:
            return matchRegex(candidate);

        default:
            break;
    }

    // 有序比较不适用于 Null
    if (candidate.isNull() && op_ != Operator::Equal && op_ != Operator::NotEqual) {
        return std::nullopt;
    }

    auto cmp = compareValues(candidate, operand_);
    if (!cmp) {
        return std::nullopt;
    }

    bool ok = false;
    switch (op_) {
        case Operator::Equal:        ok = *cmp == 0; break;
        case Operator::NotEqual:     ok = *cmp != 0; break;
        case Operator::Greater:      ok = *cmp > 0;  break;
        case Operator::GreaterEqual: ok = *cmp >= 0; break;
        case Operator::Less:         ok = *cmp < 0;  break;
        case Operator::LessEqual:    ok = *cmp <= 0; break;
        default:                     break;
    }

    if (!ok) {
        return std::nullopt;
    }
    return candidate;
}

std::optional<Value> Comparator::matchRegex(const Value& candidate) const {
    if (!candidate.isText()) {
        return std::nullopt;
    }

    const std::string& text = candidate.asText();
    std::smatch m;
    if (!std::regex_search(text, m, *regex_)) {
        return std::nullopt;
    }
    if (regex_->mark_count() > 0) {
        return Value(m[1].str());
    }
    return candidate;
}

std::string Comparator::toString() const {
    if (op_ == Operator::Empty || op_ == Operator::NotEmpty) {
        return xlsxextract::match::toString(op_);
    }
    return fmt::format("{} {}", xlsxextract::match::toString(op_), operand_.toString());
}

const char* toString(Comparator::Operator op) noexcept {
    switch (op) {
        case Comparator::Operator::Equal:        return "is";
        case Comparator::Operator::NotEqual:     return "is not";
        case Comparator::Operator::Greater:      return ">";
        case Comparator::Operator::GreaterEqual: return ">=";
        case Comparator::Operator::Less:         return "<";
        case Comparator::Operator::LessEqual:    return "<=";
        case Comparator::Operator::Empty:        return "is empty";
        case Comparator::Operator::NotEmpty:     return "is not empty";
        case Comparator::Operator::Regex:        return "matches";
    }
    return "?";
}

}} // namespace xlsxextract::match
