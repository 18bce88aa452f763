#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"

namespace xlsxextract {
namespace core {

Worksheet& Workbook::addSheet(const std::string& name) {
    if (!utils::CommonUtils::isValidSheetName(name)) {
        throw WorksheetException("Invalid worksheet name: " + name, name, __FILE__, __LINE__);
    }
    if (getSheet(name)) {
        throw WorksheetException("Duplicate worksheet name: " + name, name, __FILE__, __LINE__);
    }
    sheets_.push_back(std::make_unique<Worksheet>(name, this));
    CORE_DEBUG("Added worksheet {} at index {}", name, sheets_.size() - 1);
    return *sheets_.back();
}

Worksheet* Workbook::getSheet(const std::string& name) const {
    for (const auto& sheet : sheets_) {
        if (utils::CommonUtils::equalsIgnoreCase(sheet->getName(), name)) {
            return sheet.get();
        }
    }
    return nullptr;
}

Worksheet* Workbook::getSheet(size_t index) const {
    return index < sheets_.size() ? sheets_[index].get() : nullptr;
}

int Workbook::sheetIndex(const Worksheet* sheet) const {
    for (size_t i = 0; i < sheets_.size(); ++i) {
        if (sheets_[i].get() == sheet) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void Workbook::defineName(const std::string& name, const std::string& formula,
                          std::optional<int> scope) {
    if (scope && (*scope < 0 || static_cast<size_t>(*scope) >= sheets_.size())) {
        XLSXEXTRACT_THROW(ParameterException,
                          fmt::format("Invalid scope {} for defined name {}", *scope, name));
    }
    defined_names_.define(name, formula, scope);
}

const DefinedName* Workbook::findDefinedName(const std::string& name, std::optional<int> scope) const {
    return defined_names_.find(name, scope);
}

std::pair<Worksheet*, Table*> Workbook::findTable(const std::string& name, const Worksheet* sheet) const {
    for (const auto& ws : sheets_) {
        if (sheet && ws.get() != sheet) {
            continue;
        }
        if (Table* table = ws->findTable(name)) {
            return {ws.get(), table};
        }
    }
    return {nullptr, nullptr};
}

Range Workbook::resolveReference(const std::string& reference, Worksheet* default_sheet) const {
    auto parsed = utils::AddressParser::tryParse(reference);
    if (!parsed) {
        return Range();
    }

    Worksheet* sheet = parsed->hasSheet() ? getSheet(parsed->sheet) : default_sheet;
    if (!sheet || sheetIndex(sheet) < 0) {
        return Range();
    }
    return Range(sheet, parsed->first_row, parsed->first_col, parsed->last_row, parsed->last_col);
}

Range Workbook::resizeRange(const Range& range, int rows, int cols) {
    if (range.isEmpty()) {
        XLSXEXTRACT_THROW(OperationException, "Cannot resize an empty range");
    }
    if (rows <= 0 || cols <= 0) {
        XLSXEXTRACT_THROW(OperationException,
                          fmt::format("Cannot resize a range to {}x{}", rows, cols));
    }
    Worksheet* sheet = range.sheet();
    if (sheetIndex(sheet) < 0) {
        XLSXEXTRACT_THROW(OperationException, "Range does not belong to this workbook");
    }

    if (rows > utils::AddressParser::kMaxRows - range.firstRow() + 1 ||
        cols > utils::AddressParser::kMaxColumns - range.firstColumn() + 1) {
        XLSXEXTRACT_THROW(OperationException,
                          fmt::format("Cannot resize {} to {}x{}: exceeds the sheet",
                                      *range.getReference(true, true, false), rows, cols));
    }

    const int rows_delta = rows - range.rows();
    const int cols_delta = cols - range.columns();

    // 两个方向都先检查，避免只插入了一半
    if ((rows_delta > 0 && !sheet->canInsertRows(range.lastRow() + 1, rows_delta)) ||
        (cols_delta > 0 && !sheet->canInsertColumns(range.lastColumn() + 1, cols_delta))) {
        XLSXEXTRACT_THROW(OperationException,
                          fmt::format("Cannot resize {} to {}x{}: content would move off the sheet",
                                      *range.getReference(true, true, false), rows, cols));
    }

    if (rows_delta > 0) {
        sheet->insertRows(range.lastRow() + 1, rows_delta);
    } else if (rows_delta < 0) {
        sheet->deleteRows(range.firstRow() + rows, -rows_delta);
    }

    if (cols_delta > 0) {
        sheet->insertColumns(range.lastColumn() + 1, cols_delta);
    } else if (cols_delta < 0) {
        sheet->deleteColumns(range.firstColumn() + cols, -cols_delta);
    }

    Range resized(sheet, range.firstRow(), range.firstColumn(),
                  range.firstRow() + rows - 1, range.firstColumn() + cols - 1,
                  range.aliasKind(), range.alias());

    if (resized.hasAlias() && (rows_delta != 0 || cols_delta != 0)) {
        updateAliasReference(resized);
    }

    CORE_DEBUG("Resized {} by ({}, {}) to {}", *range.getReference(true, true, false),
               rows_delta, cols_delta, *resized.getReference(true, true, false));
    return resized;
}

void Workbook::updateAliasReference(const Range& resized) {
    Worksheet* sheet = resized.sheet();

    if (resized.aliasKind() == Range::AliasKind::DefinedName) {
        DefinedName* dn = defined_names_.find(resized.alias(), sheetIndex(sheet));
        if (!dn) {
            dn = defined_names_.find(resized.alias());
        }
        if (!dn) {
            CORE_WARN("Defined name {} not found, reference not updated", resized.alias());
            return;
        }
        dn->formula = *resized.getReference(true, true, false);
        CORE_DEBUG("Defined name {} now refers to {}", dn->name, dn->formula);
    } else if (resized.aliasKind() == Range::AliasKind::NamedTable) {
        Table* table = sheet->findTable(resized.alias());
        if (!table) {
            CORE_WARN("Table {} not found on sheet {}, reference not updated",
                      resized.alias(), sheet->getName());
            return;
        }
        table->first_row = resized.firstRow();
        table->first_col = resized.firstColumn();
        table->last_row = resized.lastRow();
        table->last_col = resized.lastColumn();
        CORE_DEBUG("Table {} now refers to {}", table->display_name, table->ref());
    }
}

}} // namespace xlsxextract::core
