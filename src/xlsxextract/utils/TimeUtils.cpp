#include "xlsxextract/utils/TimeUtils.hpp"
#include <cmath>
#include <cstdio>

namespace xlsxextract {
namespace utils {

namespace {

constexpr long long kMicrosPerDay = 86400LL * 1000000LL;

} // namespace

// Howard Hinnant 的 days_from_civil 算法，0 = 1970-01-01
long long TimeUtils::daysFromCivil(int y, int m, int d) noexcept {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

core::Date TimeUtils::civilFromDays(long long z) noexcept {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return core::Date(static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d));
}

double TimeUtils::toExcelSerialNumber(const core::Date& date, bool date1904) {
    long long days = daysFromCivil(date.year, date.month, date.day);
    if (date1904) {
        return static_cast<double>(days - daysFromCivil(1904, 1, 1));
    }
    long long serial = days - daysFromCivil(1899, 12, 30);
    // 1900-03-01 之前没有虚构的 2 月 29 日
    if (serial <= 60) {
        serial -= 1;
    }
    return static_cast<double>(serial);
}

double TimeUtils::toExcelSerialNumber(const core::Time& time) {
    long long micros = ((time.hour * 60LL + time.minute) * 60LL + time.second) * 1000000LL + time.microsecond;
    return static_cast<double>(micros) / static_cast<double>(kMicrosPerDay);
}

double TimeUtils::toExcelSerialNumber(const core::DateTime& datetime, bool date1904) {
    return toExcelSerialNumber(datetime.date, date1904) + toExcelSerialNumber(datetime.time);
}

core::DateTime TimeUtils::fromExcelSerialNumber(double serial, bool date1904) {
    long long total_micros = std::llround(serial * static_cast<double>(kMicrosPerDay));
    long long day_number = total_micros / kMicrosPerDay;
    long long micros = total_micros % kMicrosPerDay;
    if (micros < 0) {
        micros += kMicrosPerDay;
        day_number -= 1;
    }

    core::Date date;
    if (date1904) {
        date = civilFromDays(daysFromCivil(1904, 1, 1) + day_number);
    } else if (day_number < 60) {
        date = civilFromDays(daysFromCivil(1899, 12, 31) + day_number);
    } else if (day_number == 60) {
        date = core::Date(1900, 2, 28);
    } else {
        date = civilFromDays(daysFromCivil(1899, 12, 30) + day_number);
    }

    core::Time time(static_cast<int>(micros / 3600000000LL),
                    static_cast<int>((micros / 60000000LL) % 60),
                    static_cast<int>((micros / 1000000LL) % 60),
                    static_cast<int>(micros % 1000000LL));
    return core::DateTime(date, time);
}

core::Time TimeUtils::timeFromExcelSerialNumber(double serial) {
    double fraction = serial - std::floor(serial);
    return fromExcelSerialNumber(fraction).time;
}

core::Value TimeUtils::parseISO8601(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double s = 0.0;

    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%lf", &y, &mo, &d, &h, &mi, &s) == 6) {
        int whole = static_cast<int>(s);
        int micros = static_cast<int>(std::lround((s - whole) * 1000000.0));
        return core::Value(core::DateTime(y, mo, d, h, mi, whole, micros));
    }
    if (std::sscanf(text.c_str(), "%d-%d-%d", &y, &mo, &d) == 3) {
        return core::Value(core::Date(y, mo, d));
    }
    if (std::sscanf(text.c_str(), "%d:%d:%lf", &h, &mi, &s) == 3) {
        int whole = static_cast<int>(s);
        return core::Value(core::Time(h, mi, whole, static_cast<int>(std::lround((s - whole) * 1000000.0))));
    }
    return core::Value();
}

}} // namespace xlsxextract::utils
