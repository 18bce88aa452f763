#include "xlsxextract/core/Range.hpp"
#include "xlsxextract/core/Worksheet.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace xlsxextract {
namespace core {

Range::Range(Worksheet* sheet, int first_row, int first_col, int last_row, int last_col,
             AliasKind alias_kind, std::string alias)
    : sheet_(sheet)
    , first_row_(std::min(first_row, last_row))
    , first_col_(std::min(first_col, last_col))
    , last_row_(std::max(first_row, last_row))
    , last_col_(std::max(first_col, last_col))
    , alias_kind_(alias_kind)
    , alias_(std::move(alias)) {
    if (sheet_ && (first_row_ < 1 || first_col_ < 1)) {
        XLSXEXTRACT_THROW(CellException,
                          fmt::format("Range origin out of sheet: ({}, {})", first_row_, first_col_));
    }
    if (alias_kind_ == AliasKind::None) {
        alias_.clear();
    }
}

std::optional<CellAddress> Range::cell() const {
    if (!isCell()) {
        return std::nullopt;
    }
    return CellAddress(first_row_, first_col_);
}

std::optional<CellAddress> Range::firstCell() const {
    if (isEmpty()) {
        return std::nullopt;
    }
    return CellAddress(first_row_, first_col_);
}

std::optional<CellAddress> Range::lastCell() const {
    if (isEmpty()) {
        return std::nullopt;
    }
    return CellAddress(last_row_, last_col_);
}

Workbook* Range::document() const {
    return sheet_ ? sheet_->getParentWorkbook() : nullptr;
}

Range Range::withAlias(AliasKind kind, const std::string& name) const {
    Range copy = *this;
    copy.alias_kind_ = kind;
    copy.alias_ = kind == AliasKind::None ? std::string() : name;
    return copy;
}

std::optional<std::string> Range::getReference(bool absolute, bool use_sheet, bool use_alias) const {
    if (isEmpty()) {
        return std::nullopt;
    }
    if (use_alias && hasAlias()) {
        return alias_;
    }

    std::string prefix = use_sheet ? utils::AddressParser::quoteSheetName(sheet_->getName()) + "!" : "";
    return prefix + utils::AddressParser::formatRange(first_row_, first_col_, last_row_, last_col_, absolute);
}

std::vector<std::vector<Value>> Range::getValues() const {
    std::vector<std::vector<Value>> values;
    values.reserve(rows());
    for (int r = first_row_; !isEmpty() && r <= last_row_; ++r) {
        std::vector<Value> row;
        row.reserve(columns());
        for (int c = first_col_; c <= last_col_; ++c) {
            row.push_back(sheet_->getValue(r, c));
        }
        values.push_back(std::move(row));
    }
    return values;
}

const Value& Range::valueAt(int r, int c) const {
    CellAddress address = addressAt(r, c);
    return sheet_->getValue(address.row, address.col);
}

CellAddress Range::addressAt(int r, int c) const {
    if (r < 0 || c < 0 || r >= rows() || c >= columns()) {
        XLSXEXTRACT_THROW(CellException, fmt::format("Offset ({}, {}) outside range of {}x{}",
                                                     r, c, rows(), columns()));
    }
    return CellAddress(first_row_ + r, first_col_ + c);
}

std::vector<CellAddress> Range::rowVector(int i) const {
    std::vector<CellAddress> vec;
    for (int c = 0; c < columns(); ++c) {
        vec.push_back(addressAt(i, c));
    }
    return vec;
}

std::vector<CellAddress> Range::columnVector(int j) const {
    std::vector<CellAddress> vec;
    for (int r = 0; r < rows(); ++r) {
        vec.push_back(addressAt(r, j));
    }
    return vec;
}

bool Range::operator==(const Range& other) const {
    if (isEmpty() || other.isEmpty()) {
        return isEmpty() && other.isEmpty();
    }
    return sheet_ == other.sheet_ &&
           first_row_ == other.first_row_ && first_col_ == other.first_col_ &&
           last_row_ == other.last_row_ && last_col_ == other.last_col_ &&
           alias_kind_ == other.alias_kind_ && alias_ == other.alias_;
}

std::ostream& operator<<(std::ostream& os, const Range& range) {
    auto reference = range.getReference(true, true, false);
    os << (reference ? *reference : std::string("<empty>"));
    if (range.hasAlias()) {
        os << " (" << range.alias() << ")";
    }
    return os;
}

}} // namespace xlsxextract::core
