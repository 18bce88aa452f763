#include "xlsxextract/writer/SharedStringTable.hpp"
#include "xlsxextract/xml/XMLStreamWriter.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace writer {

int SharedStringTable::addString(const std::string& str) {
    ++reference_count_;
    auto it = string_map_.find(str);
    if (it != string_map_.end()) {
        return it->second;
    }

    int index = static_cast<int>(strings_.size());
    strings_.push_back(str);
    string_map_.emplace(str, index);
    return index;
}

int SharedStringTable::getStringIndex(const std::string& str) const {
    auto it = string_map_.find(str);
    return it != string_map_.end() ? it->second : -1;
}

std::string SharedStringTable::generate() const {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("sst");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("count", fmt::format("{}", reference_count_));
    writer.writeAttribute("uniqueCount", fmt::format("{}", strings_.size()));

    for (const auto& str : strings_) {
        writer.startElement("si");
        writer.startElement("t");
        // 首尾空白需要 xml:space 才能保留
        if (!str.empty() && (str.front() == ' ' || str.back() == ' ' ||
                             str.front() == '\t' || str.back() == '\t' ||
                             str.front() == '\n' || str.back() == '\n')) {
            writer.writeAttribute("xml:space", "preserve");
        }
        writer.writeText(str);
        writer.endElement(); // t
        writer.endElement(); // si
    }

    writer.endElement(); // sst
    return writer.toString();
}

void SharedStringTable::clear() {
    strings_.clear();
    string_map_.clear();
    reference_count_ = 0;
}

}} // namespace xlsxextract::writer
