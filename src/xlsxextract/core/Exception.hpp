/**
 * @file Exception.hpp
 * @brief xlsxextract异常类定义
 */

#ifndef XLSXEXTRACT_EXCEPTION_HPP
#define XLSXEXTRACT_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace xlsxextract {
namespace core {

/**
 * @brief 基础异常类
 */
class XlsxExtractException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    XlsxExtractException(const std::string& message,
                         ErrorCode code = ErrorCode::InternalError,
                         const char* file = nullptr,
                         int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（含错误码、源码位置和上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public XlsxExtractException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 格式相关异常（损坏的包结构、缺失的部件）
 */
class FormatException : public XlsxExtractException {
public:
    FormatException(const std::string& message,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public XlsxExtractException {
public:
    ParameterException(const std::string& message,
                       const char* file = nullptr, int line = 0);
};

/**
 * @brief 操作相关异常（例如对空区域调整大小）
 */
class OperationException : public XlsxExtractException {
public:
    OperationException(const std::string& message,
                       const char* file = nullptr, int line = 0);
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public XlsxExtractException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 单元格引用异常
 */
class CellException : public XlsxExtractException {
public:
    CellException(const std::string& message,
                  const char* file = nullptr, int line = 0);
};

/**
 * @brief XML解析异常
 */
class XMLException : public XlsxExtractException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

/**
 * @brief 配置错误：构造 Match / Target / Comparator 时违反约束
 *
 * 与"未匹配"严格区分：未匹配返回空结果，配置错误一律抛出。
 */
class ConfigurationException : public XlsxExtractException {
public:
    ConfigurationException(const std::string& message,
                           const char* file = nullptr, int line = 0,
                           ErrorCode code = ErrorCode::InvalidConfiguration);
};

/**
 * @brief 比较器构造错误（正则操作数不是文本、正则表达式非法）
 */
class InvalidComparator : public ConfigurationException {
public:
    InvalidComparator(const std::string& message,
                      const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace xlsxextract

// 便捷宏定义
#define XLSXEXTRACT_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__)

#define XLSXEXTRACT_THROW_IF(condition, ExceptionType, message) \
    do { if (condition) { XLSXEXTRACT_THROW(ExceptionType, message); } } while(0)

#endif // XLSXEXTRACT_EXCEPTION_HPP
