#include "xlsxextract/writer/WorksheetXMLGenerator.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include "xlsxextract/utils/TimeUtils.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace xlsxextract {
namespace writer {

namespace {

bool needsPreserve(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    return is_space(text.front()) || is_space(text.back());
}

} // namespace

WorksheetXMLGenerator::WorksheetXMLGenerator(const core::Worksheet& worksheet, DateStyleAllocator& styles,
                                             SharedStringTable* sst, bool date1904)
    : worksheet_(worksheet), styles_(styles), sst_(sst), date1904_(date1904) {
}

std::string WorksheetXMLGenerator::dimensionRef(const core::Worksheet& worksheet) {
    auto [max_row, max_col] = worksheet.usedRange();
    if (max_row <= 0 || max_col <= 0) {
        return "A1";
    }
    return utils::AddressParser::formatRange(1, 1, max_row, max_col);
}

std::string WorksheetXMLGenerator::patchDimension(const std::string& prefix, const std::string& ref) {
    const size_t element = prefix.find("<dimension");
    if (element == std::string::npos) {
        return prefix;
    }
    const size_t tag_end = prefix.find('>', element);
    const size_t attr = prefix.find("ref=\"", element);
    if (attr == std::string::npos || attr > tag_end) {
        return prefix;
    }
    const size_t value_start = attr + 5;
    const size_t value_end = prefix.find('"', value_start);
    std::string result = prefix;
    result.replace(value_start, value_end - value_start, ref);
    return result;
}

std::string WorksheetXMLGenerator::generate(const std::string& prefix, const std::string& suffix) {
    std::string out = patchDimension(prefix, dimensionRef(worksheet_));
    out += generateSheetData();
    out += suffix;
    return out;
}

std::string WorksheetXMLGenerator::generateSheetData() {
    xml::XMLStreamWriter writer;
    writer.startElement("sheetData");

    const auto& cells = worksheet_.cells();
    const auto& row_attributes = worksheet_.rowAttributes();

    auto cell_it = cells.begin();
    auto attr_it = row_attributes.begin();
    size_t cell_count = 0;

    // 行按行号合并遍历：有单元格或有行属性的行都要输出
    while (cell_it != cells.end() || attr_it != row_attributes.end()) {
        int row = 0;
        if (cell_it == cells.end()) {
            row = attr_it->first;
        } else if (attr_it == row_attributes.end()) {
            row = cell_it->first.first;
        } else {
            row = std::min(cell_it->first.first, attr_it->first);
        }

        writer.startElement("row");
        writer.writeAttribute("r", row);
        if (attr_it != row_attributes.end() && attr_it->first == row) {
            for (const auto& [name, value] : attr_it->second) {
                writer.writeAttribute(name, std::string_view(value));
            }
            ++attr_it;
        }

        for (; cell_it != cells.end() && cell_it->first.first == row; ++cell_it) {
            const core::Cell& cell = cell_it->second;
            if (cell.isEmpty()) {
                continue;
            }
            writeCell(writer, row, cell_it->first.second, cell);
            ++cell_count;
        }
        writer.endElement(); // row
    }

    writer.endElement(); // sheetData
    WRITER_DEBUG("Generated sheetData for {}: {} cells", worksheet_.getName(), cell_count);
    return writer.toString();
}

void WorksheetXMLGenerator::writeCell(xml::XMLStreamWriter& writer, int row, int col, const core::Cell& cell) {
    const core::Value& value = cell.getValue();

    writer.startElement("c");
    writer.writeAttribute("r", std::string_view(utils::AddressParser::formatCell(row, col)));

    const uint32_t style = styles_.styleFor(cell.getStyleIndex(), value);
    if (style != 0) {
        writer.writeAttribute("s", static_cast<int>(style));
    }

    // t 属性
    if (value.isText()) {
        if (cell.hasFormula()) {
            writer.writeAttribute("t", "str");
        } else if (sst_) {
            writer.writeAttribute("t", "s");
        } else {
            writer.writeAttribute("t", "inlineStr");
        }
    } else if (value.isBoolean()) {
        writer.writeAttribute("t", "b");
    }

    if (cell.hasFormula()) {
        writer.startElement("f");
        for (const auto& [name, attr_value] : cell.getFormulaAttributes()) {
            writer.writeAttribute(name, std::string_view(attr_value));
        }
        if (!cell.getFormula().empty()) {
            writer.writeText(cell.getFormula());
        }
        writer.endElement(); // f
    }

    writeValue(writer, value, cell.hasFormula());
    writer.endElement(); // c
}

void WorksheetXMLGenerator::writeValue(xml::XMLStreamWriter& writer, const core::Value& value, bool has_formula) {
    switch (value.type()) {
        case core::Value::Type::Null:
            return;
        case core::Value::Type::Text:
            if (!has_formula && !sst_) {
                writer.startElement("is");
                writer.startElement("t");
                if (needsPreserve(value.asText())) {
                    writer.writeAttribute("xml:space", "preserve");
                }
                writer.writeText(value.asText());
                writer.endElement(); // t
                writer.endElement(); // is
                return;
            }
            writer.startElement("v");
            if (has_formula) {
                writer.writeText(value.asText());
            } else {
                writer.writeText(std::string_view(fmt::format("{}", sst_->addString(value.asText()))));
            }
            writer.endElement(); // v
            return;
        case core::Value::Type::Number:
            writer.startElement("v");
            writer.writeText(value.asNumber());
            writer.endElement(); // v
            return;
        case core::Value::Type::Boolean:
            writer.startElement("v");
            writer.writeText(std::string_view(value.asBoolean() ? "1" : "0"));
            writer.endElement(); // v
            return;
        case core::Value::Type::Date:
            writer.startElement("v");
            writer.writeText(utils::TimeUtils::toExcelSerialNumber(value.asDate(), date1904_));
            writer.endElement(); // v
            return;
        case core::Value::Type::Time:
            writer.startElement("v");
            writer.writeText(utils::TimeUtils::toExcelSerialNumber(value.asTime()));
            writer.endElement(); // v
            return;
        case core::Value::Type::DateTime:
            writer.startElement("v");
            writer.writeText(utils::TimeUtils::toExcelSerialNumber(value.asDateTime(), date1904_));
            writer.endElement(); // v
            return;
    }
}

}} // namespace xlsxextract::writer
