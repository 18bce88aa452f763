#include "xlsxextract/reader/StylesParser.hpp"
#include <cctype>

namespace xlsxextract {
namespace reader {

namespace {

bool isBuiltinTimeOnly(int id) {
    return (id >= 18 && id <= 21) || (id >= 45 && id <= 47);
}

bool isBuiltinDate(int id) {
    return (id >= 14 && id <= 22) || isBuiltinTimeOnly(id);
}

} // namespace

StylesParser::FormatKind StylesParser::classifyFormat(int num_fmt_id, const std::string& format_code) {
    if (format_code.empty()) {
        if (isBuiltinTimeOnly(num_fmt_id)) {
            return FormatKind::TimeOnly;
        }
        return isBuiltinDate(num_fmt_id) ? FormatKind::Date : FormatKind::Number;
    }

    bool has_date = false;
    bool has_time = false;
    bool has_month_or_minute = false;

    // 只看第一节；跳过引号文本、转义字符和 [Red] 之类的方括号（[h] [mm] [ss] 除外）
    for (size_t i = 0; i < format_code.size(); ++i) {
        const char ch = format_code[i];
        if (ch == ';') {
            break;
        }
        if (ch == '"') {
            size_t close = format_code.find('"', i + 1);
            if (close == std::string::npos) {
                break;
            }
            i = close;
            continue;
        }
        if (ch == '\\' || ch == '_' || ch == '*') {
            ++i;
            continue;
        }
        if (ch == '[') {
            size_t close = format_code.find(']', i + 1);
            if (close == std::string::npos) {
                break;
            }
            const std::string inner = format_code.substr(i + 1, close - i - 1);
            if (!inner.empty() && inner.find_first_not_of("hHmMsS") == std::string::npos) {
                has_time = true;
            }
            i = close;
            continue;
        }
        switch (std::tolower(static_cast<unsigned char>(ch))) {
            case 'y':
            case 'd':
                has_date = true;
                break;
            case 'h':
            case 's':
                has_time = true;
                break;
            case 'm':
                has_month_or_minute = true;
                break;
            default:
                break;
        }
    }

    if (has_date || (has_month_or_minute && !has_time)) {
        return FormatKind::Date;
    }
    if (has_time) {
        return FormatKind::TimeOnly;
    }
    return FormatKind::Number;
}

void StylesParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                  int /*depth*/) {
    const std::string_view local = localName(name);
    if (local == "numFmt") {
        auto id = findIntAttribute(attributes, "numFmtId");
        if (id) {
            number_formats_[*id] = getAttributeOr(attributes, "formatCode", "");
        }
    } else if (local == "cellXfs") {
        in_cell_xfs_ = true;
    } else if (local == "xf" && in_cell_xfs_) {
        const int num_fmt_id = getIntAttributeOr(attributes, "numFmtId", 0);
        const auto index = static_cast<uint32_t>(xf_num_formats_.size());
        xf_num_formats_.push_back(num_fmt_id);

        auto it = number_formats_.find(num_fmt_id);
        const FormatKind kind = classifyFormat(num_fmt_id, it != number_formats_.end() ? it->second : "");
        if (kind != FormatKind::Number) {
            date_styles_.insert(index);
            if (kind == FormatKind::TimeOnly) {
                time_only_styles_.insert(index);
            }
        }
    }
}

void StylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (localName(name) == "cellXfs") {
        in_cell_xfs_ = false;
        READER_DEBUG("cellXfs: {} styles, {} with date formats", xf_num_formats_.size(), date_styles_.size());
    }
}

}} // namespace xlsxextract::reader
