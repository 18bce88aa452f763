#include "xlsxextract/reader/WorksheetParser.hpp"
#include "xlsxextract/core/Worksheet.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/TimeUtils.hpp"
#include <fast_float/fast_float.h>
#include <cstdlib>
#include <system_error>
#include <fmt/format.h>

namespace xlsxextract {
namespace reader {

void WorksheetParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                     int /*depth*/) {
    const std::string_view local = localName(name);

    if (local == "sheetData") {
        in_sheet_data_ = true;
        return;
    }
    if (!in_sheet_data_) {
        return;
    }

    if (local == "row") {
        current_row_ = getIntAttributeOr(attributes, "r", current_row_ + 1);
        last_col_ = 0;

        core::Worksheet::RowAttributes row_attributes;
        for (const auto& attr : attributes) {
            // r 由写入器重新生成；spans 在插入列后会失效
            if (attr.name != "r" && attr.name != "spans") {
                row_attributes.emplace_back(std::string(attr.name), std::string(attr.value));
            }
        }
        if (!row_attributes.empty()) {
            worksheet_.setRowAttributes(current_row_, std::move(row_attributes));
        }
    } else if (local == "c") {
        cell_ = CellData{};
        in_cell_ = true;

        auto ref = findAttribute(attributes, "r");
        if (ref) {
            auto parsed = utils::AddressParser::tryParse(*ref);
            if (!parsed || !parsed->isCell()) {
                setError(fmt::format("Invalid cell reference '{}'", *ref));
                return;
            }
            cell_.row = parsed->first_row;
            cell_.col = parsed->first_col;
        } else {
            cell_.row = current_row_;
            cell_.col = last_col_ + 1;
        }
        cell_.type = getAttributeOr(attributes, "t", "n");
        cell_.style = static_cast<uint32_t>(getIntAttributeOr(attributes, "s", 0));
    } else if (in_cell_ && local == "v") {
        in_value_ = true;
    } else if (in_cell_ && local == "f") {
        in_formula_ = true;
        cell_.has_formula = true;
        for (const auto& attr : attributes) {
            cell_.formula_attributes.emplace_back(std::string(attr.name), std::string(attr.value));
        }
    } else if (in_cell_ && local == "rPh") {
        ++phonetic_depth_;
    } else if (in_cell_ && local == "t" && phonetic_depth_ == 0) {
        in_inline_text_ = true;
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    const std::string_view local = localName(name);

    if (local == "sheetData") {
        in_sheet_data_ = false;
    } else if (local == "c" && in_cell_) {
        finishCell();
        in_cell_ = false;
    } else if (local == "v") {
        in_value_ = false;
    } else if (local == "f") {
        in_formula_ = false;
    } else if (local == "rPh") {
        --phonetic_depth_;
    } else if (local == "t") {
        in_inline_text_ = false;
    }
}

void WorksheetParser::onText(std::string_view text, int /*depth*/) {
    if (in_value_) {
        cell_.value.append(text.data(), text.size());
    } else if (in_formula_) {
        cell_.formula.append(text.data(), text.size());
    } else if (in_inline_text_) {
        cell_.inline_text.append(text.data(), text.size());
    }
}

core::Value WorksheetParser::convertValue(const CellData& cell) const {
    const std::string& type = cell.type;

    if (type == "inlineStr") {
        return core::Value(cell.inline_text);
    }
    if (cell.value.empty()) {
        return core::Value();
    }
    if (type == "s") {
        char* end = nullptr;
        const long index = std::strtol(cell.value.c_str(), &end, 10);
        if (*end != '\0' || index < 0 || !context_.shared_strings ||
            static_cast<size_t>(index) >= context_.shared_strings->size()) {
            READER_WARN("Shared string index {} out of range at {}", cell.value,
                        utils::AddressParser::formatCell(cell.row, cell.col));
            return core::Value();
        }
        return core::Value((*context_.shared_strings)[static_cast<size_t>(index)]);
    }
    if (type == "str" || type == "e") {
        return core::Value(cell.value);
    }
    if (type == "b") {
        return core::Value(cell.value == "1" || cell.value == "true");
    }
    if (type == "d") {
        core::Value parsed = utils::TimeUtils::parseISO8601(cell.value);
        if (parsed.isNull()) {
            READER_WARN("Unparseable ISO 8601 value '{}' at {}", cell.value,
                        utils::AddressParser::formatCell(cell.row, cell.col));
        }
        return parsed;
    }

    double number = 0.0;
    const char* first = cell.value.data();
    const char* last = first + cell.value.size();
    auto result = fast_float::from_chars(first, last, number);
    if (result.ec != std::errc() || result.ptr != last) {
        READER_WARN("Invalid numeric value '{}' at {}", cell.value,
                    utils::AddressParser::formatCell(cell.row, cell.col));
        return core::Value(cell.value);
    }

    if (context_.date_styles && context_.date_styles->count(cell.style)) {
        const bool time_only = context_.time_only_styles && context_.time_only_styles->count(cell.style);
        if (time_only && number >= 0.0 && number < 1.0) {
            return core::Value(utils::TimeUtils::timeFromExcelSerialNumber(number));
        }
        if (number >= 0.0) {
            return core::Value(utils::TimeUtils::fromExcelSerialNumber(number, context_.date1904));
        }
    }
    return core::Value(number);
}

void WorksheetParser::finishCell() {
    if (state_.has_error) {
        return;
    }
    last_col_ = cell_.col;

    core::Value value = convertValue(cell_);
    if (value.isNull() && !cell_.has_formula && cell_.style == 0) {
        return;
    }

    core::Cell& cell = worksheet_.cell(cell_.row, cell_.col);
    cell.setValue(std::move(value));
    cell.setStyleIndex(cell_.style);
    if (cell_.has_formula) {
        cell.setFormula(cell_.formula, std::move(cell_.formula_attributes));
    }
    ++cell_count_;
}

}} // namespace xlsxextract::reader
