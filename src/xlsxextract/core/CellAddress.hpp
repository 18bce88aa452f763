#pragma once

#include "xlsxextract/utils/AddressParser.hpp"
#include <string>
#include <ostream>

namespace xlsxextract {
namespace core {

/**
 * @brief 单元格坐标（行列均基于1）
 */
struct CellAddress {
    int row = 0;
    int col = 0;

    CellAddress() = default;
    CellAddress(int r, int c) : row(r), col(c) {}

    /**
     * @brief 坐标字符串，如 "B3"
     */
    std::string toString(bool absolute = false) const {
        return utils::AddressParser::formatCell(row, col, absolute);
    }

    bool operator==(const CellAddress& other) const { return row == other.row && col == other.col; }
    bool operator!=(const CellAddress& other) const { return !(*this == other); }
    bool operator<(const CellAddress& other) const {
        return row < other.row || (row == other.row && col < other.col);
    }
};

inline std::ostream& operator<<(std::ostream& os, const CellAddress& address) {
    return os << address.toString();
}

}} // namespace xlsxextract::core
