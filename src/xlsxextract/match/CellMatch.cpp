#include "xlsxextract/match/CellMatch.hpp"
#include "xlsxextract/match/ReferenceResolver.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace xlsxextract {
namespace match {

using core::Range;

CellMatch::CellMatch(Params params)
    : params_(std::move(params)) {
    const bool has_reference = params_.reference.has_value();
    const bool has_value = params_.value.has_value();

    if (has_reference == has_value) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: exactly one of reference or value must be set", params_.name));
    }
    if (has_reference && params_.reference->empty()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: reference must not be empty", params_.name));
    }

    auto check_bound = [&](const std::optional<int>& bound, const char* what) {
        if (bound && *bound < 1) {
            XLSXEXTRACT_THROW(core::ConfigurationException,
                              fmt::format("{}: {} must be positive, got {}", params_.name, what, *bound));
        }
    };
    check_bound(params_.min_row, "min row");
    check_bound(params_.min_col, "min column");
    check_bound(params_.max_row, "max row");
    check_bound(params_.max_col, "max column");

    // 偏移超过工作表尺寸必然越界
    if (params_.row_offset < -utils::AddressParser::kMaxRows ||
        params_.row_offset > utils::AddressParser::kMaxRows ||
        params_.col_offset < -utils::AddressParser::kMaxColumns ||
        params_.col_offset > utils::AddressParser::kMaxColumns) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: offset ({}, {}) exceeds the sheet size",
                                      params_.name, params_.row_offset, params_.col_offset));
    }
}

CellMatch CellMatch::byReference(const std::string& name, const std::string& reference,
                                 std::optional<Comparator> sheet) {
    Params p;
    p.name = name;
    p.sheet = std::move(sheet);
    p.reference = reference;
    return CellMatch(std::move(p));
}

CellMatch CellMatch::byValue(const std::string& name, Comparator sheet, Comparator value) {
    Params p;
    p.name = name;
    p.sheet = std::move(sheet);
    p.value = std::move(value);
    return CellMatch(std::move(p));
}

CellMatch CellMatch::withSheet(const std::optional<Comparator>& sheet) const {
    Params p = params_;
    p.sheet = sheet;
    return CellMatch(std::move(p));
}

CellMatch CellMatch::withMinRow(int min_row) const {
    Params p = params_;
    p.min_row = min_row;
    return CellMatch(std::move(p));
}

CellMatch CellMatch::withOffset(int row_offset, int col_offset) const {
    Params p = params_;
    p.row_offset = row_offset;
    p.col_offset = col_offset;
    return CellMatch(std::move(p));
}

CellMatch CellMatch::withBounds(std::optional<int> min_row, std::optional<int> min_col,
                                std::optional<int> max_row, std::optional<int> max_col) const {
    Params p = params_;
    p.min_row = min_row;
    p.min_col = min_col;
    p.max_row = max_row;
    p.max_col = max_col;
    return CellMatch(std::move(p));
}

core::Worksheet* CellMatch::selectSheet(const core::Workbook& workbook) const {
    return ReferenceResolver::selectSheet(workbook, params_.sheet);
}

std::optional<MatchResult> CellMatch::match(const core::Workbook& workbook) const {
    core::Worksheet* sheet = selectSheet(workbook);

    if (params_.reference) {
        Range range = ReferenceResolver::resolve(workbook, *params_.reference, sheet,
                                                 params_.sheet.has_value());
        if (!range.isCell()) {
            MATCH_DEBUG("{}: reference {} is not a single cell", params_.name, *params_.reference);
            return std::nullopt;
        }
        return applyOffset(MatchResult{range, std::nullopt});
    }

    if (!sheet) {
        return std::nullopt;
    }

    auto used = sheet->usedRange();
    Bounds box;
    box.min_row = params_.min_row.value_or(1);
    box.min_col = params_.min_col.value_or(1);
    box.max_row = params_.max_row.value_or(used.first);
    box.max_col = params_.max_col.value_or(used.second);

    auto found = searchByValue(*sheet, box);
    if (!found) {
        return std::nullopt;
    }
    return applyOffset(std::move(*found));
}

std::optional<MatchResult> CellMatch::matchInSheet(core::Worksheet& sheet, const Bounds& box) const {
    std::optional<MatchResult> found;

    if (params_.reference) {
        const core::Workbook* workbook = sheet.getParentWorkbook();
        if (!workbook) {
            return std::nullopt;
        }
        Range range = ReferenceResolver::resolve(*workbook, *params_.reference, &sheet, true);
        if (!range.isCell()) {
            return std::nullopt;
        }
        found = MatchResult{range, std::nullopt};
    } else {
        found = searchByValue(sheet, box);
    }

    if (!found) {
        return std::nullopt;
    }
    auto shifted = applyOffset(std::move(*found));
    if (!shifted) {
        return std::nullopt;
    }

    auto address = shifted->range.cell();
    if (shifted->range.sheet() != &sheet || !box.contains(address->row, address->col)) {
        MATCH_DEBUG("{}: located cell {} falls outside the table", params_.name, address->toString());
        return std::nullopt;
    }
    return shifted;
}

std::optional<MatchResult> CellMatch::searchByValue(core::Worksheet& sheet, const Bounds& box) const {
    for (int row = box.min_row; row <= box.max_row; ++row) {
        for (int col = box.min_col; col <= box.max_col; ++col) {
            auto captured = params_.value->match(sheet.getValue(row, col));
            if (captured) {
                MATCH_TRACE("{}: value matched at {}!{}", params_.name, sheet.getName(),
                            utils::AddressParser::formatCell(row, col));
                return MatchResult{Range::ofCell(&sheet, row, col), std::move(captured)};
            }
        }
    }
    MATCH_DEBUG("{}: no cell on {} matches `{}`", params_.name, sheet.getName(), params_.value->toString());
    return std::nullopt;
}

std::optional<MatchResult> CellMatch::applyOffset(MatchResult result) const {
    if (params_.row_offset == 0 && params_.col_offset == 0) {
        return result;
    }

    auto address = result.range.cell();
    const int row = address->row + params_.row_offset;
    const int col = address->col + params_.col_offset;
    if (row < 1 || col < 1 ||
        row > utils::AddressParser::kMaxRows || col > utils::AddressParser::kMaxColumns) {
        MATCH_DEBUG("{}: offset ({}, {}) moves {} off the sheet", params_.name,
                    params_.row_offset, params_.col_offset, address->toString());
        return std::nullopt;
    }
    result.range = Range::ofCell(result.range.sheet(), row, col);
    return result;
}

}} // namespace xlsxextract::match
