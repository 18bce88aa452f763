#pragma once

#include "xlsxextract/core/Value.hpp"
#include <string>

namespace xlsxextract {
namespace utils {

/**
 * @brief 时间工具类 - Excel 序列号与日历值之间的转换
 *
 * 采用 1900 日期系统（可选 1904），保留 Excel 把 1900 年当作闰年的历史错误：
 * 序列号 60 对应不存在的 1900-02-29，读取时映射为 1900-02-28。
 */
class TimeUtils {
public:
    /**
     * @brief 日期转 Excel 序列号
     */
    static double toExcelSerialNumber(const core::Date& date, bool date1904 = false);

    /**
     * @brief 时间转一天中的小数部分
     */
    static double toExcelSerialNumber(const core::Time& time);

    /**
     * @brief 日期时间转 Excel 序列号
     */
    static double toExcelSerialNumber(const core::DateTime& datetime, bool date1904 = false);

    /**
     * @brief Excel 序列号转日期时间（四舍五入到微秒）
     */
    static core::DateTime fromExcelSerialNumber(double serial, bool date1904 = false);

    /**
     * @brief 小数部分转时间（忽略整数部分）
     */
    static core::Time timeFromExcelSerialNumber(double serial);

    /**
     * @brief 解析 ISO 8601 文本（t="d" 单元格）
     * @return 解析失败时返回 Null
     */
    static core::Value parseISO8601(const std::string& text);

private:
    static long long daysFromCivil(int y, int m, int d) noexcept;
    static core::Date civilFromDays(long long days) noexcept;
};

}} // namespace xlsxextract::utils
