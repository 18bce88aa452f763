/**
 * @file Exception.cpp
 * @brief xlsxextract异常类实现
 */

#include "xlsxextract/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace xlsxextract {
namespace core {

XlsxExtractException::XlsxExtractException(const std::string& message,
                                           ErrorCode code,
                                           const char* file,
                                           int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string XlsxExtractException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void XlsxExtractException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : XlsxExtractException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

FormatException::FormatException(const std::string& message, const char* file, int line)
    : XlsxExtractException(message, ErrorCode::InvalidFormat, file, line) {
}

ParameterException::ParameterException(const std::string& message, const char* file, int line)
    : XlsxExtractException(message, ErrorCode::InvalidArgument, file, line) {
}

OperationException::OperationException(const std::string& message, const char* file, int line)
    : XlsxExtractException(message, ErrorCode::InvalidOperation, file, line) {
}

WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       const char* file, int line)
    : XlsxExtractException(worksheet_name.empty()
                               ? message
                               : fmt::format("{} (worksheet: {})", message, worksheet_name),
                           ErrorCode::InvalidWorksheet, file, line)
    , worksheet_name_(worksheet_name) {
}

CellException::CellException(const std::string& message, const char* file, int line)
    : XlsxExtractException(message, ErrorCode::InvalidCellReference, file, line) {
}

XMLException::XMLException(const std::string& message, const std::string& xml_path,
                           const char* file, int line)
    : XlsxExtractException(xml_path.empty()
                               ? message
                               : fmt::format("{} (part: {})", message, xml_path),
                           ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path) {
}

ConfigurationException::ConfigurationException(const std::string& message,
                                               const char* file, int line,
                                               ErrorCode code)
    : XlsxExtractException(message, code, file, line) {
}

InvalidComparator::InvalidComparator(const std::string& message, const char* file, int line)
    : ConfigurationException(message, file, line, ErrorCode::InvalidComparator) {
}

}} // namespace xlsxextract::core
