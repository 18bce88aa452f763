#pragma once

namespace xlsxextract {
namespace archive {

// 压缩包操作的错误码
enum class ZipError {
    Ok,                   // 成功
    NotOpen,              // 未打开
    IoFail,               // 读写失败
    BadFormat,            // 不是合法的 ZIP
    TooLarge,             // 条目超过 32 位大小
    FileNotFound,         // 条目不存在
    InvalidParameter,     // 参数非法
    CompressionFail,      // 压缩失败
    InternalError         // 内部错误
};

// 只有 ZipError::Ok 视为成功
constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

inline const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok: return "ok";
        case ZipError::NotOpen: return "archive not open";
        case ZipError::IoFail: return "I/O failure";
        case ZipError::BadFormat: return "bad zip format";
        case ZipError::TooLarge: return "entry too large";
        case ZipError::FileNotFound: return "entry not found";
        case ZipError::InvalidParameter: return "invalid parameter";
        case ZipError::CompressionFail: return "compression failure";
        case ZipError::InternalError: return "internal error";
    }
    return "unknown";
}

}} // namespace xlsxextract::archive
