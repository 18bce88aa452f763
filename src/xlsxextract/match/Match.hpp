#pragma once

#include "xlsxextract/match/CellMatch.hpp"
#include "xlsxextract/match/RangeMatch.hpp"
#include <variant>

namespace xlsxextract {
namespace match {

/**
 * @brief 单元格匹配或区域匹配
 */
using Match = std::variant<CellMatch, RangeMatch>;

inline std::optional<MatchResult> matchDocument(const Match& m, const core::Workbook& workbook) {
    return std::visit([&workbook](const auto& concrete) { return concrete.match(workbook); }, m);
}

inline const std::string& matchName(const Match& m) {
    return std::visit([](const auto& concrete) -> const std::string& { return concrete.getName(); }, m);
}

inline const std::optional<Comparator>& matchSheet(const Match& m) {
    return std::visit([](const auto& concrete) -> const std::optional<Comparator>& {
        return concrete.getSheet();
    }, m);
}

inline bool isRangeMatch(const Match& m) {
    return std::holds_alternative<RangeMatch>(m);
}

}} // namespace xlsxextract::match
