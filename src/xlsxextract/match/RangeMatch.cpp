#include "xlsxextract/match/RangeMatch.hpp"
#include "xlsxextract/match/ReferenceResolver.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"

namespace xlsxextract {
namespace match {

using core::Range;

RangeMatch::RangeMatch(Params params)
    : params_(std::move(params)) {
    const std::string& name = params_.name;

    if (params_.reference.has_value() == params_.start_cell.has_value()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: exactly one of reference or start cell must be set", name));
    }
    if (params_.reference && params_.reference->empty()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: reference must not be empty", name));
    }
    if (!params_.start_cell && (params_.end_cell || params_.rows || params_.cols)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: end cell, rows and columns require a start cell", name));
    }
    if (params_.rows.has_value() != params_.cols.has_value()) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: rows and columns must be given together", name));
    }
    if (params_.rows && (*params_.rows < 1 || *params_.cols < 1)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: rows and columns must be positive, got {}x{}",
                                      name, *params_.rows, *params_.cols));
    }
    if (params_.rows && (*params_.rows > utils::AddressParser::kMaxRows ||
                         *params_.cols > utils::AddressParser::kMaxColumns)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: {}x{} block exceeds the sheet size",
                                      name, *params_.rows, *params_.cols));
    }
    if (params_.end_cell && params_.rows) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: end cell cannot be combined with rows and columns", name));
    }

    // 工作表条件下发到子匹配
    if (params_.sheet) {
        if (params_.start_cell && !params_.start_cell->getSheet()) {
            params_.start_cell = params_.start_cell->withSheet(params_.sheet);
        }
        if (params_.end_cell && !params_.end_cell->getSheet()) {
            params_.end_cell = params_.end_cell->withSheet(params_.sheet);
        }
    }
}

RangeMatch RangeMatch::byReference(const std::string& name, const std::string& reference,
                                   std::optional<Comparator> sheet) {
    Params p;
    p.name = name;
    p.sheet = std::move(sheet);
    p.reference = reference;
    return RangeMatch(std::move(p));
}

RangeMatch RangeMatch::contiguous(const std::string& name, CellMatch start_cell,
                                  std::optional<Comparator> sheet) {
    Params p;
    p.name = name;
    p.sheet = std::move(sheet);
    p.start_cell = std::move(start_cell);
    return RangeMatch(std::move(p));
}

RangeMatch RangeMatch::withStartMinRow(int row) const {
    if (!params_.start_cell) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: no start cell to restrict", params_.name));
    }
    Params p = params_;
    p.start_cell = params_.start_cell->withMinRow(row);
    return RangeMatch(std::move(p));
}

std::optional<MatchResult> RangeMatch::matchByReference(const core::Workbook& workbook) const {
    core::Worksheet* sheet = ReferenceResolver::selectSheet(workbook, params_.sheet);
    Range range = ReferenceResolver::resolve(workbook, *params_.reference, sheet, params_.sheet.has_value());
    if (range.isEmpty()) {
        return std::nullopt;
    }
    return MatchResult{range, std::nullopt};
}

std::optional<MatchResult> RangeMatch::match(const core::Workbook& workbook) const {
    if (params_.reference) {
        return matchByReference(workbook);
    }

    auto start = params_.start_cell->match(workbook);
    if (!start) {
        MATCH_DEBUG("{}: start cell not found", params_.name);
        return std::nullopt;
    }
    const core::CellAddress first = *start->range.cell();
    core::Worksheet* sheet = start->range.sheet();

    if (params_.end_cell) {
        auto end = params_.end_cell->match(workbook);
        if (!end) {
            MATCH_DEBUG("{}: end cell not found", params_.name);
            return std::nullopt;
        }
        if (end->range.sheet() != sheet) {
            MATCH_DEBUG("{}: start and end cells are on different sheets", params_.name);
            return std::nullopt;
        }
        const core::CellAddress last = *end->range.cell();
        return MatchResult{Range(sheet, first.row, first.col, last.row, last.col), start->value};
    }

    if (params_.rows) {
        const int last_row = first.row + *params_.rows - 1;
        const int last_col = first.col + *params_.cols - 1;
        if (last_row > utils::AddressParser::kMaxRows || last_col > utils::AddressParser::kMaxColumns) {
            MATCH_DEBUG("{}: {}x{} block at {} exceeds the sheet", params_.name,
                        *params_.rows, *params_.cols, first.toString());
            return std::nullopt;
        }
        return MatchResult{Range(sheet, first.row, first.col, last_row, last_col), start->value};
    }

    return MatchResult{growContiguous(*sheet, first.row, first.col), start->value};
}

Range RangeMatch::growContiguous(core::Worksheet& sheet, int row, int col) const {
    int last_col = col;
    while (last_col < utils::AddressParser::kMaxColumns && !sheet.getValue(row, last_col + 1).isBlank()) {
        ++last_col;
    }

    int last_row = row;
    while (last_row < utils::AddressParser::kMaxRows && !sheet.getValue(last_row + 1, col).isBlank()) {
        ++last_row;
    }

    Range range(&sheet, row, col, last_row, last_col);
    MATCH_DEBUG("{}: contiguous region {}", params_.name, *range.getReference(false, true, false));
    return range;
}

}} // namespace xlsxextract::match
