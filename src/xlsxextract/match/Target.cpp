#include "xlsxextract/match/Target.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/utils/CommonUtils.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <type_traits>
#include <unordered_map>

namespace xlsxextract {
namespace match {

using core::Range;
using core::Value;

namespace {

const char* sideName(bool cell, bool vector) {
    return cell ? "cell" : (vector ? "vector" : "table");
}

// 标签比较键：类型 + 去空白小写文本；空标签不参与对齐
std::optional<std::string> labelKey(const Value& label) {
    if (label.isBlank()) {
        return std::nullopt;
    }
    if (label.isText()) {
        std::string key = utils::CommonUtils::normalizeLabel(label.asText());
        if (key.empty()) {
            return std::nullopt;
        }
        return "Text:" + key;
    }
    return std::string(core::typeName(label.type())) + ":" + label.toString();
}

void writeValue(core::Worksheet& sheet, const core::CellAddress& address, const Value& value) {
    // 不为空值创建新单元格
    if (value.isNull() && !sheet.hasCell(address.row, address.col)) {
        return;
    }
    sheet.setValue(address.row, address.col, value);
}

} // namespace

Target::Side Target::sideOf(const Match& m, const std::optional<CellMatch>& row,
                            const std::optional<CellMatch>& col) {
    if (!isRangeMatch(m)) {
        return Side::Cell;
    }
    if (row && col) {
        return Side::Cell;
    }
    if (row || col) {
        return Side::Vector;
    }
    return Side::Table;
}

Target::Target(Params params)
    : params_(std::move(params)) {
    const std::string& name = matchName(params_.source);

    if (!isRangeMatch(params_.source) && (params_.source_row || params_.source_col)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: row/column locators need a range source", name));
    }
    if (!isRangeMatch(params_.target) && (params_.target_row || params_.target_col)) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: row/column locators need a range target", name));
    }

    const Side source_side = sideOf(params_.source, params_.source_row, params_.source_col);
    const Side target_side = sideOf(params_.target, params_.target_row, params_.target_col);
    if (source_side != target_side) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: cannot transfer a {} into a {}", name,
                                      sideName(source_side == Side::Cell, source_side == Side::Vector),
                                      sideName(target_side == Side::Cell, target_side == Side::Vector)));
    }

    switch (source_side) {
        case Side::Cell:
            shape_ = CellCopy{};
            break;
        case Side::Vector:
            shape_ = VectorCopy{};
            break;
        case Side::Table:
            shape_ = TableCopy{};
            break;
    }
}

std::optional<Target::Resolved> Target::resolveSide(const Range& range, bool is_range,
                                                    const std::optional<CellMatch>& row_locator,
                                                    const std::optional<CellMatch>& col_locator) const {
    Resolved resolved;
    resolved.table = range;

    if (!row_locator && !col_locator) {
        if (!is_range) {
            resolved.side = Side::Cell;
            resolved.cell = *range.cell();
        } else {
            resolved.side = Side::Table;
        }
        return resolved;
    }

    const Bounds box = Bounds::of(range);
    std::optional<core::CellAddress> row_hit;
    std::optional<core::CellAddress> col_hit;
    if (row_locator) {
        auto hit = row_locator->matchInSheet(*range.sheet(), box);
        if (!hit) {
            MATCH_DEBUG("Row locator {} not found in {}", row_locator->getName(),
                        *range.getReference(false, true, false));
            return std::nullopt;
        }
        row_hit = hit->range.cell();
    }
    if (col_locator) {
        auto hit = col_locator->matchInSheet(*range.sheet(), box);
        if (!hit) {
            MATCH_DEBUG("Column locator {} not found in {}", col_locator->getName(),
                        *range.getReference(false, true, false));
            return std::nullopt;
        }
        col_hit = hit->range.cell();
    }

    if (row_hit && col_hit) {
        resolved.side = Side::Cell;
        resolved.cell = core::CellAddress(row_hit->row, col_hit->col);
    } else if (row_hit) {
        resolved.side = Side::Vector;
        resolved.row_vector = true;
        resolved.index = row_hit->row - range.firstRow();
    } else {
        resolved.side = Side::Vector;
        resolved.row_vector = false;
        resolved.index = col_hit->col - range.firstColumn();
    }
    return resolved;
}

std::optional<MatchResult> Target::extract(const core::Workbook& source, core::Workbook& target) const {
    const std::string& name = matchName(params_.source);

    auto source_result = matchDocument(params_.source, source);
    if (!source_result) {
        MATCH_DEBUG("{}: source not found", name);
        return std::nullopt;
    }
    auto target_result = matchDocument(params_.target, target);
    if (!target_result) {
        MATCH_DEBUG("{}: target {} not found", name, matchName(params_.target));
        return std::nullopt;
    }

    auto src = resolveSide(source_result->range, isRangeMatch(params_.source), params_.source_row, params_.source_col);
    if (!src) {
        return std::nullopt;
    }
    auto dst = resolveSide(target_result->range, isRangeMatch(params_.target), params_.target_row, params_.target_col);
    if (!dst) {
        return std::nullopt;
    }

    if (src->side != dst->side) {
        XLSXEXTRACT_THROW(core::ConfigurationException,
                          fmt::format("{}: source resolved to a {} but target to a {}", name,
                                      sideName(src->side == Side::Cell, src->side == Side::Vector),
                                      sideName(dst->side == Side::Cell, dst->side == Side::Vector)));
    }

    std::visit([&](const auto& shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, CellCopy>) {
            copyCell(*src, *dst);
        } else if constexpr (std::is_same_v<T, TableCopy>) {
            copyTable(*src, *dst, target);
        } else {
            copyVector(*src, *dst, target);
        }
    }, shape_);

    return source_result;
}

void Target::copyCell(const Resolved& src, const Resolved& dst) const {
    const Value value = src.table.sheet()->getValue(src.cell.row, src.cell.col);
    MATCH_DEBUG("Copy {} -> {}", src.cell.toString(), dst.cell.toString());
    writeValue(*dst.table.sheet(), dst.cell, value);
}

void Target::copyTable(const Resolved& src, Resolved dst, core::Workbook& target) const {
    // 先取出源值，源和目标可能是同一工作表
    const auto values = src.table.getValues();
    const int src_rows = src.table.rows();
    const int src_cols = src.table.columns();

    if (params_.expand && (dst.table.rows() != src_rows || dst.table.columns() != src_cols)) {
        MATCH_DEBUG("Resize target {}x{} -> {}x{}", dst.table.rows(), dst.table.columns(), src_rows, src_cols);
        dst.table = target.resizeRange(dst.table, src_rows, src_cols);
    }

    const int rows = std::min(src_rows, dst.table.rows());
    const int cols = std::min(src_cols, dst.table.columns());
    core::Worksheet& sheet = *dst.table.sheet();
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            writeValue(sheet, dst.table.addressAt(r, c), values[r][c]);
        }
    }
}

void Target::copyVector(const Resolved& src, Resolved dst, core::Workbook& target) const {
    std::vector<Value> values;
    std::vector<Value> labels;
    const int length = src.row_vector ? src.table.columns() : src.table.rows();
    values.reserve(length);
    labels.reserve(length);
    for (int k = 0; k < length; ++k) {
        if (src.row_vector) {
            values.push_back(src.table.valueAt(src.index, k));
            labels.push_back(src.table.valueAt(0, k));
        } else {
            values.push_back(src.table.valueAt(k, src.index));
            labels.push_back(src.table.valueAt(k, 0));
        }
    }

    core::Worksheet& sheet = *dst.table.sheet();

    if (params_.align) {
        std::unordered_map<std::string, size_t> by_label;
        for (size_t k = 0; k < labels.size(); ++k) {
            if (auto key = labelKey(labels[k])) {
                by_label.emplace(*key, k);
            }
        }

        const int target_length = dst.row_vector ? dst.table.columns() : dst.table.rows();
        for (int k = 0; k < target_length; ++k) {
            const Value& label = dst.row_vector ? dst.table.valueAt(0, k) : dst.table.valueAt(k, 0);
            auto key = labelKey(label);
            if (!key) {
                continue;
            }
            auto it = by_label.find(*key);
            if (it == by_label.end()) {
                MATCH_TRACE("Label {} has no source value", label.toString());
                continue;
            }
            const core::CellAddress address = dst.row_vector ? dst.table.addressAt(dst.index, k)
                                                             : dst.table.addressAt(k, dst.index);
            writeValue(sheet, address, values[it->second]);
        }
        return;
    }

    if (params_.expand) {
        const int current = dst.row_vector ? dst.table.columns() : dst.table.rows();
        if (current != length) {
            MATCH_DEBUG("Resize target vector {} -> {}", current, length);
            dst.table = dst.row_vector ? target.resizeRange(dst.table, dst.table.rows(), length)
                                       : target.resizeRange(dst.table, length, dst.table.columns());
        }
    }

    const auto addresses = dst.row_vector ? dst.table.rowVector(dst.index) : dst.table.columnVector(dst.index);
    const size_t count = std::min(addresses.size(), values.size());
    for (size_t k = 0; k < count; ++k) {
        writeValue(sheet, addresses[k], values[k]);
    }
}

}} // namespace xlsxextract::match
