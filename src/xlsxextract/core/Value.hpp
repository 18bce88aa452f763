#pragma once

#include <string>
#include <variant>
#include <tuple>
#include <ostream>

namespace xlsxextract {
namespace core {

/**
 * @brief 日期（公历）
 */
struct Date {
    int year = 1900;
    int month = 1;
    int day = 1;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool operator==(const Date& o) const { return std::tie(year, month, day) == std::tie(o.year, o.month, o.day); }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return std::tie(year, month, day) < std::tie(o.year, o.month, o.day); }
};

/**
 * @brief 一天之内的时间
 */
struct Time {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    Time() = default;
    Time(int h, int m, int s = 0, int us = 0) : hour(h), minute(m), second(s), microsecond(us) {}

    bool operator==(const Time& o) const {
        return std::tie(hour, minute, second, microsecond) == std::tie(o.hour, o.minute, o.second, o.microsecond);
    }
    bool operator!=(const Time& o) const { return !(*this == o); }
    bool operator<(const Time& o) const {
        return std::tie(hour, minute, second, microsecond) < std::tie(o.hour, o.minute, o.second, o.microsecond);
    }
};

/**
 * @brief 日期时间
 */
struct DateTime {
    Date date;
    Time time;

    DateTime() = default;
    DateTime(const Date& d, const Time& t = Time()) : date(d), time(t) {}
    DateTime(int y, int mo, int d, int h = 0, int mi = 0, int s = 0, int us = 0)
        : date(y, mo, d), time(h, mi, s, us) {}

    bool operator==(const DateTime& o) const { return date == o.date && time == o.time; }
    bool operator!=(const DateTime& o) const { return !(*this == o); }
    bool operator<(const DateTime& o) const {
        if (date != o.date) return date < o.date;
        return time < o.time;
    }
};

/**
 * @brief 单元格值：封闭的变体类型
 *
 * Null | Text | Number | Boolean | Date | Time | DateTime。
 * 整数统一以 double 存储。
 */
class Value {
public:
    enum class Type {
        Null,
        Text,
        Number,
        Boolean,
        Date,
        Time,
        DateTime
    };

    using Storage = std::variant<std::monostate, std::string, double, bool,
                                 core::Date, core::Time, core::DateTime>;

    Value() = default;
    Value(std::string text) : data_(std::move(text)) {}
    Value(const char* text) : data_(std::string(text ? text : "")) {}
    Value(double number) : data_(number) {}
    Value(int number) : data_(static_cast<double>(number)) {}
    Value(bool boolean) : data_(boolean) {}
    Value(const core::Date& date) : data_(date) {}
    Value(const core::Time& time) : data_(time) {}
    Value(const core::DateTime& datetime) : data_(datetime) {}

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool isNull() const noexcept { return type() == Type::Null; }
    bool isText() const noexcept { return type() == Type::Text; }
    bool isNumber() const noexcept { return type() == Type::Number; }
    bool isBoolean() const noexcept { return type() == Type::Boolean; }
    bool isDate() const noexcept { return type() == Type::Date; }
    bool isTime() const noexcept { return type() == Type::Time; }
    bool isDateTime() const noexcept { return type() == Type::DateTime; }
    bool isTemporal() const noexcept { return isDate() || isTime() || isDateTime(); }

    /**
     * @brief Null 或零长度文本
     */
    bool isBlank() const noexcept { return isNull() || (isText() && std::get<std::string>(data_).empty()); }

    // 访问器：类型不符时抛出 std::bad_variant_access
    const std::string& asText() const { return std::get<std::string>(data_); }
    double asNumber() const { return std::get<double>(data_); }
    bool asBoolean() const { return std::get<bool>(data_); }
    const core::Date& asDate() const { return std::get<core::Date>(data_); }
    const core::Time& asTime() const { return std::get<core::Time>(data_); }
    const core::DateTime& asDateTime() const { return std::get<core::DateTime>(data_); }

    const Storage& storage() const noexcept { return data_; }

    /**
     * @brief 显示用的字符串形式（也用于变量插值）
     *
     * 数字使用最短往返表示（6 而不是 6.0），日期为 YYYY-MM-DD，
     * 日期时间为 YYYY-MM-DD HH:MM:SS，Null 为空串。
     */
    std::string toString() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage data_;
};

const char* typeName(Value::Type type) noexcept;

std::ostream& operator<<(std::ostream& os, const Value& value);

}} // namespace xlsxextract::core
