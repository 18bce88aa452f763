#include "xlsxextract/writer/DateStyleAllocator.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <vector>

namespace xlsxextract {
namespace writer {

int DateStyleAllocator::builtinFormatFor(core::Value::Type type) {
    switch (type) {
        case core::Value::Type::Date:     return 14;  // m/d/yyyy
        case core::Value::Type::Time:     return 21;  // h:mm:ss
        case core::Value::Type::DateTime: return 22;  // m/d/yyyy h:mm
        default:                          return 0;
    }
}

uint32_t DateStyleAllocator::styleFor(uint32_t current, const core::Value& value) {
    if (!enabled_ || !value.isTemporal() || date_styles_.count(current)) {
        return current;
    }
    const int num_fmt = builtinFormatFor(value.type());
    auto it = appended_.find(num_fmt);
    if (it != appended_.end()) {
        return it->second;
    }
    const uint32_t index = cell_xf_count_ + static_cast<uint32_t>(appended_.size());
    appended_.emplace(num_fmt, index);
    WRITER_DEBUG("Appending cellXfs[{}] with numFmtId {}", index, num_fmt);
    return index;
}

std::string DateStyleAllocator::patchStyles(const std::string& styles_xml) const {
    if (appended_.empty()) {
        return styles_xml;
    }

    const size_t open = styles_xml.find("<cellXfs");
    const size_t close = open == std::string::npos ? std::string::npos : styles_xml.find("</cellXfs>", open);
    if (close == std::string::npos) {
        XLSXEXTRACT_THROW(core::FormatException, "styles.xml has no cellXfs element");
    }

    // 按下标顺序追加
    std::vector<std::pair<uint32_t, int>> ordered;
    for (const auto& [num_fmt, index] : appended_) {
        ordered.emplace_back(index, num_fmt);
    }
    std::sort(ordered.begin(), ordered.end());

    std::string xfs;
    for (const auto& entry : ordered) {
        xfs += fmt::format("<xf numFmtId=\"{}\" fontId=\"0\" fillId=\"0\" borderId=\"0\" xfId=\"0\" "
                           "applyNumberFormat=\"1\"/>", entry.second);
    }

    std::string result = styles_xml;
    result.insert(close, xfs);

    // 更新 count 属性
    const size_t tag_end = result.find('>', open);
    const size_t count_pos = result.find("count=\"", open);
    const uint32_t total = cell_xf_count_ + static_cast<uint32_t>(appended_.size());
    if (count_pos != std::string::npos && count_pos < tag_end) {
        const size_t value_start = count_pos + 7;
        const size_t value_end = result.find('"', value_start);
        result.replace(value_start, value_end - value_start, fmt::format("{}", total));
    }
    return result;
}

}} // namespace xlsxextract::writer
