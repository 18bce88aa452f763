#include "xlsxextract/reader/TableParser.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace reader {

void TableParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                 int depth) {
    const std::string_view local = localName(name);

    if (local == "table" && depth == 0) {
        table_.id = getIntAttributeOr(attributes, "id", 0);
        table_.name = getAttributeOr(attributes, "name", "");
        table_.display_name = getAttributeOr(attributes, "displayName", table_.name);
        if (table_.name.empty()) {
            table_.name = table_.display_name;
        }
        table_.header_row_count = getIntAttributeOr(attributes, "headerRowCount", 1);
        table_.totals_row_count = getIntAttributeOr(attributes, "totalsRowCount", 0);
        table_.has_auto_filter = false;

        const std::string ref = getAttributeOr(attributes, "ref", "");
        auto parsed = utils::AddressParser::tryParse(ref);
        if (table_.display_name.empty() || !parsed || parsed->hasSheet()) {
            setError(fmt::format("Table element has invalid name or ref '{}'", ref));
            return;
        }
        table_.first_row = parsed->first_row;
        table_.first_col = parsed->first_col;
        table_.last_row = parsed->last_row;
        table_.last_col = parsed->last_col;
        has_table_ = true;
    } else if (local == "autoFilter" && depth == 1) {
        table_.has_auto_filter = true;
    } else if (local == "tableStyleInfo") {
        for (const auto& attr : attributes) {
            table_.style_info.emplace_back(std::string(attr.name), std::string(attr.value));
        }
    }
}

}} // namespace xlsxextract::reader
