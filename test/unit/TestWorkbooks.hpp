#pragma once

#include "xlsxextract/core/Workbook.hpp"
#include <memory>
#include <vector>

namespace xlsxextract {
namespace test {

/**
 * @brief 按行写入一块值，起点为 (row, col)
 */
inline void fillRows(core::Worksheet& sheet, int row, int col,
                     const std::vector<std::vector<core::Value>>& rows) {
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) {
            if (!rows[r][c].isNull()) {
                sheet.setValue(row + static_cast<int>(r), col + static_cast<int>(c), rows[r][c]);
            }
        }
    }
}

/**
 * @brief 源工作簿："Report 1" 上 C3 为日期，B5:F9 为月度表
 */
inline std::unique_ptr<core::Workbook> makeSourceWorkbook() {
    auto wb = std::make_unique<core::Workbook>();
    core::Worksheet& report = wb->addSheet("Report 1");
    wb->addSheet("Report 2");

    report.setValue(3, 2, core::Value("Date"));
    report.setValue(3, 3, core::Value(core::DateTime(2021, 5, 1)));

    fillRows(report, 5, 2, {
        {core::Value(), "Jan", "Feb", "Mar", "Apr"},
        {"Alpha", 1.5, 6, 11, 4.6},
        {"Beta", 2, 7, 12, 4.7},
        {"Delta", 2.5, 8, 13, 4.8},
        {"Gamma", 3, 9, 14, 4.9},
    });

    wb->defineName("MonthlyData", "'Report 1'!$B$5:$F$9");
    wb->defineName("ReportDate", "'Report 1'!$C$3");
    return wb;
}

/**
 * @brief 目标工作簿："Summary" 上 B7:E9 为待填写的表，B11 为后续内容
 */
inline std::unique_ptr<core::Workbook> makeTargetWorkbook() {
    auto wb = std::make_unique<core::Workbook>();
    core::Worksheet& summary = wb->addSheet("Summary");

    summary.setValue(3, 2, core::Value("Date"));
    fillRows(summary, 7, 2, {
        {core::Value(), "Alpha", "Delta", "Beta"},
        {"Profit"},
        {"Loss"},
    });
    summary.setValue(11, 2, core::Value("Area"));

    wb->defineName("SummaryTable", "Summary!$B$7:$E$9");
    return wb;
}

}} // namespace xlsxextract::test
