#include "xlsxextract/match/ReferenceResolver.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"

namespace xlsxextract {
namespace match {

using core::Range;

core::Worksheet* ReferenceResolver::selectSheet(const core::Workbook& workbook,
                                                const std::optional<Comparator>& sheet_comparator) {
    if (!sheet_comparator) {
        return nullptr;
    }
    for (const auto& sheet : workbook.sheets()) {
        // 工作表条件的捕获值不使用
        if (sheet_comparator->match(core::Value(sheet->getName()))) {
            return sheet.get();
        }
    }
    MATCH_DEBUG("No sheet matches `{}`", sheet_comparator->toString());
    return nullptr;
}

Range ReferenceResolver::resolveDefinedName(const core::Workbook& workbook,
                                            const std::string& reference,
                                            core::Worksheet* selected_sheet) {
    const core::DefinedName* dn = nullptr;
    if (selected_sheet) {
        dn = workbook.findDefinedName(reference, workbook.sheetIndex(selected_sheet));
    }
    if (!dn) {
        dn = workbook.findDefinedName(reference);
    }
    if (!dn) {
        return Range();
    }

    // 局部名称的公式不带工作表名时，指向其作用域工作表
    core::Worksheet* scope_sheet = dn->local_sheet_id ? workbook.getSheet(*dn->local_sheet_id) : selected_sheet;
    Range range = workbook.resolveReference(dn->formula, scope_sheet);
    if (range.isEmpty()) {
        MATCH_DEBUG("Defined name {} has unresolvable formula {}", dn->name, dn->formula);
        return Range();
    }
    return range.withAlias(Range::AliasKind::DefinedName, dn->name);
}

Range ReferenceResolver::resolve(const core::Workbook& workbook,
                                 const std::string& reference,
                                 core::Worksheet* selected_sheet,
                                 bool sheet_constrained) {
    Range range = resolveDefinedName(workbook, reference, selected_sheet);
    if (!range.isEmpty()) {
        MATCH_TRACE("Reference {} resolved as defined name", reference);
        return range;
    }

    if (selected_sheet || !sheet_constrained) {
        auto [sheet, table] = workbook.findTable(reference, selected_sheet);
        if (table) {
            MATCH_TRACE("Reference {} resolved as table on {}", reference, sheet->getName());
            return Range(sheet, table->first_row, table->first_col, table->last_row, table->last_col,
                         Range::AliasKind::NamedTable, table->display_name);
        }
    }

    range = workbook.resolveReference(reference, selected_sheet);
    if (range.isEmpty()) {
        MATCH_DEBUG("Reference {} not resolved", reference);
    }
    return range;
}

}} // namespace xlsxextract::match
