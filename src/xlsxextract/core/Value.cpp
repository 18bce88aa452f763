#include "xlsxextract/core/Value.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace core {

namespace {

std::string formatDate(const Date& d) {
    return fmt::format("{:04d}-{:02d}-{:02d}", d.year, d.month, d.day);
}

std::string formatTime(const Time& t) {
    if (t.microsecond != 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}.{:06d}", t.hour, t.minute, t.second, t.microsecond);
    }
    return fmt::format("{:02d}:{:02d}:{:02d}", t.hour, t.minute, t.second);
}

} // namespace

std::string Value::toString() const {
    switch (type()) {
        case Type::Null:
            return "";
        case Type::Text:
            return asText();
        case Type::Number:
            return fmt::format("{}", asNumber());
        case Type::Boolean:
            return asBoolean() ? "TRUE" : "FALSE";
        case Type::Date:
            return formatDate(asDate());
        case Type::Time:
            return formatTime(asTime());
        case Type::DateTime:
            return formatDate(asDateTime().date) + " " + formatTime(asDateTime().time);
    }
    return "";
}

const char* typeName(Value::Type type) noexcept {
    switch (type) {
        case Value::Type::Null:     return "Null";
        case Value::Type::Text:     return "Text";
        case Value::Type::Number:   return "Number";
        case Value::Type::Boolean:  return "Boolean";
        case Value::Type::Date:     return "Date";
        case Value::Type::Time:     return "Time";
        case Value::Type::DateTime: return "DateTime";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    if (value.isNull()) {
        return os << "None";
    }
    if (value.isText()) {
        return os << '"' << value.asText() << '"';
    }
    return os << typeName(value.type()) << "(" << value.toString() << ")";
}

}} // namespace xlsxextract::core
