#include "xlsxextract/core/ErrorCode.hpp"

namespace xlsxextract {
namespace core {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        // Excel格式错误
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::InvalidFormat:
            return "Invalid format";

        // XML处理错误
        case ErrorCode::XmlParseError:
            return "XML parse error";

        // 配置错误
        case ErrorCode::InvalidConfiguration:
            return "Invalid configuration";
        case ErrorCode::InvalidComparator:
            return "Invalid comparator";
        case ErrorCode::InvalidOperation:
            return "Invalid operation";
    }
    return "Unknown error";
}

}} // namespace xlsxextract::core
