#include "xlsxextract/core/Worksheet.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/ShiftUtils.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <tuple>

namespace xlsxextract {
namespace core {

namespace {

const Value kNullValue;

/**
 * @brief 按坐标变换函数重新安放单元格
 *
 * 先收集移动，再删除旧位置，最后写入新位置，避免覆盖尚未移动的单元格。
 * remap 返回 false 表示该单元格被删除。
 */
template <typename Map, typename Remap>
void remapKeys(Map& entries, Remap&& remap) {
    using Key = typename Map::key_type;
    using Mapped = typename Map::mapped_type;

    std::vector<std::tuple<Key, Key, Mapped>> moves;
    std::vector<Key> deletions;

    for (const auto& [pos, entry] : entries) {
        Key new_pos = pos;
        if (!remap(new_pos)) {
            deletions.push_back(pos);
        } else if (new_pos != pos) {
            moves.emplace_back(pos, new_pos, entry);
        }
    }

    for (const auto& pos : deletions) {
        entries.erase(pos);
    }
    for (const auto& [old_pos, new_pos, entry] : moves) {
        entries.erase(old_pos);
    }
    for (auto& [old_pos, new_pos, entry] : moves) {
        entries[new_pos] = std::move(entry);
    }
}

} // namespace

Worksheet::Worksheet(const std::string& name, Workbook* parent)
    : name_(name), parent_(parent) {
}

void Worksheet::validatePosition(int row, int col) const {
    if (row < 1 || row > utils::AddressParser::kMaxRows ||
        col < 1 || col > utils::AddressParser::kMaxColumns) {
        XLSXEXTRACT_THROW(CellException,
                          fmt::format("Cell position out of range: ({}, {}) on sheet {}", row, col, name_));
    }
}

const Value& Worksheet::getValue(int row, int col) const {
    const Cell* c = findCell(row, col);
    return c ? c->getValue() : kNullValue;
}

void Worksheet::setValue(int row, int col, Value value) {
    cell(row, col).setValue(std::move(value));
}

Cell& Worksheet::cell(int row, int col) {
    validatePosition(row, col);
    return cells_[{row, col}];
}

const Cell* Worksheet::findCell(int row, int col) const {
    auto it = cells_.find({row, col});
    return it != cells_.end() ? &it->second : nullptr;
}

bool Worksheet::hasCell(int row, int col) const {
    return cells_.count({row, col}) > 0;
}

void Worksheet::removeCell(int row, int col) {
    cells_.erase({row, col});
}

std::pair<int, int> Worksheet::usedRange() const {
    int max_row = 0;
    int max_col = 0;
    if (!cells_.empty()) {
        max_row = cells_.rbegin()->first.first;
    }
    for (const auto& entry : cells_) {
        max_col = std::max(max_col, entry.first.second);
    }
    return {max_row, max_col};
}

bool Worksheet::canInsertRows(int row, int count) const {
    int last = 0;
    if (!cells_.empty()) {
        last = cells_.rbegin()->first.first;
    }
    if (!row_attributes_.empty()) {
        last = std::max(last, row_attributes_.rbegin()->first);
    }
    for (const auto& table : tables_) {
        last = std::max(last, table.last_row);
    }
    return last < row || last <= utils::AddressParser::kMaxRows - count;
}

bool Worksheet::canInsertColumns(int col, int count) const {
    int last = 0;
    for (const auto& entry : cells_) {
        last = std::max(last, entry.first.second);
    }
    for (const auto& table : tables_) {
        last = std::max(last, table.last_col);
    }
    return last < col || last <= utils::AddressParser::kMaxColumns - count;
}

void Worksheet::insertRows(int row, int count) {
    validatePosition(row, 1);
    if (count <= 0 || count > utils::AddressParser::kMaxRows) {
        XLSXEXTRACT_THROW(OperationException, fmt::format("Invalid row count: {}", count));
    }
    if (!canInsertRows(row, count)) {
        XLSXEXTRACT_THROW(OperationException,
                          fmt::format("Inserting {} row(s) at {} pushes content off sheet {}", count, row, name_));
    }
    CORE_DEBUG("Inserting {} row(s) at {} on sheet {}", count, row, name_);

    remapKeys(cells_, [&](std::pair<int, int>& pos) {
        if (pos.first >= row) pos.first += count;
        return true;
    });
    remapKeys(row_attributes_, [&](int& r) {
        if (r >= row) r += count;
        return true;
    });
    for (auto& table : tables_) {
        shiftIntervalForInsertion(table.first_row, table.last_row, row, count);
    }
    if (parent_) {
        parent_->definedNames().adjustForInsertion(name_, DefinedNameManager::Axis::Rows, row, count);
    }
}

void Worksheet::deleteRows(int row, int count) {
    validatePosition(row, 1);
    if (count <= 0 || count > utils::AddressParser::kMaxRows) {
        XLSXEXTRACT_THROW(OperationException, fmt::format("Invalid row count: {}", count));
    }
    CORE_DEBUG("Deleting {} row(s) at {} on sheet {}", count, row, name_);

    const int end = row + count;
    remapKeys(cells_, [&](std::pair<int, int>& pos) {
        if (pos.first >= end) {
            pos.first -= count;
        } else if (pos.first >= row) {
            return false;
        }
        return true;
    });
    remapKeys(row_attributes_, [&](int& r) {
        if (r >= end) {
            r -= count;
        } else if (r >= row) {
            return false;
        }
        return true;
    });
    tables_.erase(std::remove_if(tables_.begin(), tables_.end(), [&](Table& table) {
        bool survives = shiftIntervalForDeletion(table.first_row, table.last_row, row, count);
        if (!survives) {
            CORE_WARN("Table {} removed with its rows on sheet {}", table.display_name, name_);
        }
        return !survives;
    }), tables_.end());
    if (parent_) {
        parent_->definedNames().adjustForDeletion(name_, DefinedNameManager::Axis::Rows, row, count);
    }
}

void Worksheet::insertColumns(int col, int count) {
    validatePosition(1, col);
    if (count <= 0 || count > utils::AddressParser::kMaxColumns) {
        XLSXEXTRACT_THROW(OperationException, fmt::format("Invalid column count: {}", count));
    }
    if (!canInsertColumns(col, count)) {
        XLSXEXTRACT_THROW(OperationException,
                          fmt::format("Inserting {} column(s) at {} pushes content off sheet {}", count, col, name_));
    }
    CORE_DEBUG("Inserting {} column(s) at {} on sheet {}", count, col, name_);

    remapKeys(cells_, [&](std::pair<int, int>& pos) {
        if (pos.second >= col) pos.second += count;
        return true;
    });
    for (auto& table : tables_) {
        shiftIntervalForInsertion(table.first_col, table.last_col, col, count);
    }
    if (parent_) {
        parent_->definedNames().adjustForInsertion(name_, DefinedNameManager::Axis::Columns, col, count);
    }
}

void Worksheet::deleteColumns(int col, int count) {
    validatePosition(1, col);
    if (count <= 0 || count > utils::AddressParser::kMaxColumns) {
        XLSXEXTRACT_THROW(OperationException, fmt::format("Invalid column count: {}", count));
    }
    CORE_DEBUG("Deleting {} column(s) at {} on sheet {}", count, col, name_);

    const int end = col + count;
    remapKeys(cells_, [&](std::pair<int, int>& pos) {
        if (pos.second >= end) {
            pos.second -= count;
        } else if (pos.second >= col) {
            return false;
        }
        return true;
    });
    tables_.erase(std::remove_if(tables_.begin(), tables_.end(), [&](Table& table) {
        bool survives = shiftIntervalForDeletion(table.first_col, table.last_col, col, count);
        if (!survives) {
            CORE_WARN("Table {} removed with its columns on sheet {}", table.display_name, name_);
        }
        return !survives;
    }), tables_.end());
    if (parent_) {
        parent_->definedNames().adjustForDeletion(name_, DefinedNameManager::Axis::Columns, col, count);
    }
}

Table& Worksheet::addTable(Table table) {
    if (table.display_name.empty()) {
        table.display_name = table.name;
    }
    if (!DefinedNameManager::isValidName(table.display_name)) {
        XLSXEXTRACT_THROW(ParameterException, fmt::format("Invalid table name: {}", table.display_name));
    }
    if (table.first_row < 1 || table.first_col < 1 ||
        table.first_row > table.last_row || table.first_col > table.last_col) {
        XLSXEXTRACT_THROW(ParameterException, fmt::format("Invalid table range for {}", table.display_name));
    }
    if (findTable(table.display_name)) {
        XLSXEXTRACT_THROW(ParameterException, fmt::format("Duplicate table name: {}", table.display_name));
    }
    tables_.push_back(std::move(table));
    return tables_.back();
}

Table* Worksheet::findTable(const std::string& name) {
    return const_cast<Table*>(static_cast<const Worksheet*>(this)->findTable(name));
}

const Table* Worksheet::findTable(const std::string& name) const {
    for (const auto& table : tables_) {
        if (utils::CommonUtils::equalsIgnoreCase(table.display_name, name) ||
            utils::CommonUtils::equalsIgnoreCase(table.name, name)) {
            return &table;
        }
    }
    return nullptr;
}

void Worksheet::setRowAttributes(int row, RowAttributes attributes) {
    if (attributes.empty()) {
        row_attributes_.erase(row);
    } else {
        row_attributes_[row] = std::move(attributes);
    }
}

}} // namespace xlsxextract::core
