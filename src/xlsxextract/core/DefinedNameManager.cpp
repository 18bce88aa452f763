#include "xlsxextract/core/DefinedNameManager.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/ShiftUtils.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>

namespace xlsxextract {
namespace core {

void DefinedNameManager::define(const std::string& name, const std::string& formula,
                                std::optional<int> scope) {
    if (!isValidName(name)) {
        XLSXEXTRACT_THROW(ParameterException, fmt::format("Invalid defined name: {}", name));
    }

    if (DefinedName* existing = find(name, scope)) {
        existing->formula = formula;
    } else {
        defined_names_.emplace_back(name, formula, scope);
    }
}

const DefinedName* DefinedNameManager::find(const std::string& name, std::optional<int> scope) const {
    auto it = std::find_if(defined_names_.begin(), defined_names_.end(),
                           [&](const DefinedName& dn) {
                               return dn.local_sheet_id == scope &&
                                      utils::CommonUtils::equalsIgnoreCase(dn.name, name);
                           });
    return it != defined_names_.end() ? &(*it) : nullptr;
}

DefinedName* DefinedNameManager::find(const std::string& name, std::optional<int> scope) {
    return const_cast<DefinedName*>(static_cast<const DefinedNameManager*>(this)->find(name, scope));
}

bool DefinedNameManager::remove(const std::string& name, std::optional<int> scope) {
    auto it = std::find_if(defined_names_.begin(), defined_names_.end(),
                           [&](const DefinedName& dn) {
                               return dn.local_sheet_id == scope &&
                                      utils::CommonUtils::equalsIgnoreCase(dn.name, name);
                           });
    if (it == defined_names_.end()) {
        return false;
    }
    defined_names_.erase(it);
    return true;
}

template <typename Fn>
void DefinedNameManager::adjustReferences(const std::string& sheet_name, Fn&& adjust) {
    for (auto& dn : defined_names_) {
        auto parsed = utils::AddressParser::tryParse(dn.formula);
        if (!parsed || parsed->sheet != sheet_name) {
            continue;
        }
        std::string before = dn.formula;
        if (adjust(*parsed)) {
            dn.formula = utils::AddressParser::quoteSheetName(parsed->sheet) + "!" +
                         utils::AddressParser::formatRange(parsed->first_row, parsed->first_col,
                                                           parsed->last_row, parsed->last_col, true);
        } else {
            dn.formula = "#REF!";
        }
        if (before != dn.formula) {
            CORE_DEBUG("Defined name {} moved: {} -> {}", dn.name, before, dn.formula);
        }
    }
}

void DefinedNameManager::adjustForInsertion(const std::string& sheet_name, Axis axis, int at, int count) {
    adjustReferences(sheet_name, [&](utils::ParsedReference& ref) {
        // 整行/整列引用的末端停在工作表边界
        if (axis == Axis::Rows) {
            shiftIntervalForInsertion(ref.first_row, ref.last_row, at, count);
            ref.last_row = std::min(ref.last_row, utils::AddressParser::kMaxRows);
        } else {
            shiftIntervalForInsertion(ref.first_col, ref.last_col, at, count);
            ref.last_col = std::min(ref.last_col, utils::AddressParser::kMaxColumns);
        }
        return ref.first_row <= ref.last_row && ref.first_col <= ref.last_col;
    });
}

void DefinedNameManager::adjustForDeletion(const std::string& sheet_name, Axis axis, int at, int count) {
    adjustReferences(sheet_name, [&](utils::ParsedReference& ref) {
        if (axis == Axis::Rows) {
            return shiftIntervalForDeletion(ref.first_row, ref.last_row, at, count);
        }
        return shiftIntervalForDeletion(ref.first_col, ref.last_col, at, count);
    });
}

bool DefinedNameManager::isValidName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    const size_t length = utils::CommonUtils::utf16Length(name);
    if (length == std::string::npos || length > 255) {
        return false;
    }

    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_' || first == '\\' || first >= 0x80)) {
        return false;
    }

    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.' && c != '\\' && uc < 0x80) {
            return false;
        }
    }

    // 不能与单元格引用冲突（如 A1, XFD100）
    return !utils::AddressParser::tryParse(name).has_value();
}

}} // namespace xlsxextract::core
