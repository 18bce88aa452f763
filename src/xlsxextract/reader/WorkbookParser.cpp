#include "xlsxextract/reader/WorkbookParser.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"

namespace xlsxextract {
namespace reader {

void WorkbookParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes,
                                    int /*depth*/) {
    const std::string_view local = localName(name);

    if (local == "sheets") {
        in_sheets_ = true;
    } else if (local == "sheet" && in_sheets_) {
        WorksheetInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.sheet_id = getAttributeOr(attributes, "sheetId", "");
        info.rel_id = getAttributeOr(attributes, "r:id", "");
        if (info.name.empty() || info.rel_id.empty()) {
            READER_WARN("Sheet element missing attributes: name='{}', r:id='{}'", info.name, info.rel_id);
            return;
        }
        READER_DEBUG("Found worksheet {} ({})", info.name, info.rel_id);
        worksheets_.push_back(std::move(info));
    } else if (local == "definedName") {
        DefinedNameInfo info;
        info.name = getAttributeOr(attributes, "name", "");
        info.local_sheet_id = findIntAttribute(attributes, "localSheetId");
        info.hidden = getBoolAttributeOr(attributes, "hidden", false);
        defined_names_.push_back(std::move(info));
        in_defined_name_ = true;
    } else if (local == "workbookPr") {
        date1904_ = getBoolAttributeOr(attributes, "date1904", false);
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    const std::string_view local = localName(name);
    if (local == "sheets") {
        in_sheets_ = false;
        READER_DEBUG("Workbook lists {} worksheets", worksheets_.size());
    } else if (local == "definedName") {
        in_defined_name_ = false;
        if (!defined_names_.empty() && defined_names_.back().name.empty()) {
            READER_WARN("definedName without name attribute ignored");
            defined_names_.pop_back();
        }
    }
}

void WorkbookParser::onText(std::string_view text, int /*depth*/) {
    if (in_defined_name_ && !defined_names_.empty()) {
        defined_names_.back().formula += std::string(text);
    }
}

}} // namespace xlsxextract::reader
