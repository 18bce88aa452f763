#pragma once

#include <cstdint>

namespace xlsxextract {
namespace core {

/**
 * @brief 统一错误码
 *
 * 配置错误、文件/格式错误和内部错误分段编码，异常对象携带其中之一。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileWriteError = 21,
    FileReadError = 22,

    // Excel格式错误 (40-59)
    InvalidWorksheet = 40,
    InvalidCellReference = 41,
    InvalidFormat = 42,

    // XML处理错误 (60-79)
    XmlParseError = 60,

    // 配置错误 (80-99)
    InvalidConfiguration = 80,
    InvalidComparator = 81,
    InvalidOperation = 82
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

}} // namespace xlsxextract::core
