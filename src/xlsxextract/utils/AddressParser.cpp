#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/core/Exception.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace xlsxextract {
namespace utils {

namespace {

std::string unquoteSheetName(const std::string& quoted) {
    std::string result;
    result.reserve(quoted.size());
    for (size_t i = 0; i < quoted.size(); ++i) {
        result.push_back(quoted[i]);
        // '' -> '
        if (quoted[i] == '\'' && i + 1 < quoted.size() && quoted[i + 1] == '\'') {
            ++i;
        }
    }
    return result;
}

int parseRow(const std::string& digits) {
    if (digits.size() > 7) {
        return 0;
    }
    int row = std::stoi(digits);
    return (row >= 1 && row <= AddressParser::kMaxRows) ? row : 0;
}

} // namespace

std::optional<ParsedReference> AddressParser::tryParse(const std::string& reference) {
    // [('quoted'|plain)!]$?COL$?ROW[:$?COL$?ROW]
    static const std::regex ref_regex(
        R"(^\s*(?:(?:'((?:[^']|'')+)'|([^'!:]+))!)?\$?([A-Za-z]{1,3})\$?([0-9]+)(?::\$?([A-Za-z]{1,3})\$?([0-9]+))?\s*$)");

    std::smatch m;
    if (!std::regex_match(reference, m, ref_regex)) {
        return std::nullopt;
    }

    ParsedReference result;
    if (m[1].matched) {
        result.sheet = unquoteSheetName(m[1].str());
    } else if (m[2].matched) {
        result.sheet = m[2].str();
    }

    result.first_col = columnToIndex(m[3].str());
    result.first_row = parseRow(m[4].str());
    if (m[5].matched) {
        result.last_col = columnToIndex(m[5].str());
        result.last_row = parseRow(m[6].str());
    } else {
        result.last_col = result.first_col;
        result.last_row = result.first_row;
    }

    if (result.first_row == 0 || result.first_col == 0 ||
        result.last_row == 0 || result.last_col == 0) {
        return std::nullopt;
    }

    // 规范化起止顺序
    if (result.first_row > result.last_row) std::swap(result.first_row, result.last_row);
    if (result.first_col > result.last_col) std::swap(result.first_col, result.last_col);

    return result;
}

ParsedReference AddressParser::parse(const std::string& reference) {
    auto parsed = tryParse(reference);
    if (!parsed) {
        XLSXEXTRACT_THROW(core::CellException, "Invalid cell reference: " + reference);
    }
    return *parsed;
}

int AddressParser::columnToIndex(const std::string& letters) noexcept {
    if (letters.empty() || letters.size() > 3) {
        return 0;
    }
    int result = 0;
    for (char c : letters) {
        char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (u < 'A' || u > 'Z') {
            return 0;
        }
        result = result * 26 + (u - 'A' + 1);
    }
    return result <= kMaxColumns ? result : 0;
}

std::string AddressParser::indexToColumn(int col) {
    if (col < 1 || col > kMaxColumns) {
        XLSXEXTRACT_THROW(core::CellException, "Column index out of range: " + std::to_string(col));
    }
    std::string letters;
    while (col > 0) {
        int rem = (col - 1) % 26;
        letters.insert(letters.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return letters;
}

std::string AddressParser::formatCell(int row, int col, bool absolute) {
    if (row < 1 || row > kMaxRows) {
        XLSXEXTRACT_THROW(core::CellException, "Row index out of range: " + std::to_string(row));
    }
    if (absolute) {
        return "$" + indexToColumn(col) + "$" + std::to_string(row);
    }
    return indexToColumn(col) + std::to_string(row);
}

std::string AddressParser::formatRange(int first_row, int first_col, int last_row, int last_col,
                                       bool absolute) {
    std::string start = formatCell(first_row, first_col, absolute);
    if (first_row == last_row && first_col == last_col) {
        return start;
    }
    return start + ":" + formatCell(last_row, last_col, absolute);
}

bool AddressParser::needsQuoting(const std::string& sheet_name) noexcept {
    if (sheet_name.empty()) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(sheet_name.front()))) {
        return true;
    }
    return std::any_of(sheet_name.begin(), sheet_name.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return !(std::isalnum(uc) || c == '_' || c == '.' || uc >= 0x80);
    });
}

std::string AddressParser::quoteSheetName(const std::string& sheet_name) {
    if (!needsQuoting(sheet_name)) {
        return sheet_name;
    }
    std::string quoted = "'";
    for (char c : sheet_name) {
        quoted.push_back(c);
        if (c == '\'') {
            quoted.push_back('\'');
        }
    }
    quoted.push_back('\'');
    return quoted;
}

}} // namespace xlsxextract::utils
