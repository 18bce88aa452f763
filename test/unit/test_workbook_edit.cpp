#include "xlsxextract/core/Workbook.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/AddressParser.hpp"
#include "TestWorkbooks.hpp"
#include <gtest/gtest.h>
#include <climits>

using namespace xlsxextract;
using core::Range;
using core::Value;

class WorkbookEditTest : public ::testing::Test {
protected:
    void SetUp() override {
        workbook_ = test::makeTargetWorkbook();
        summary_ = workbook_->getSheet("Summary");
        ASSERT_NE(summary_, nullptr);
    }

    const std::string& formula(const std::string& name) {
        const core::DefinedName* dn = workbook_->findDefinedName(name);
        EXPECT_NE(dn, nullptr);
        static const std::string kMissing;
        return dn ? dn->formula : kMissing;
    }

    std::unique_ptr<core::Workbook> workbook_;
    core::Worksheet* summary_ = nullptr;
};

// 测试1: 工作表与定义名称管理
TEST_F(WorkbookEditTest, SheetsAndNames) {
    EXPECT_EQ(workbook_->sheetCount(), 1u);
    EXPECT_EQ(workbook_->getSheet("summary"), summary_);
    EXPECT_EQ(workbook_->getSheet(0), summary_);
    EXPECT_EQ(workbook_->getSheet(3), nullptr);

    EXPECT_THROW(workbook_->addSheet("Summary"), core::WorksheetException);
    EXPECT_THROW(workbook_->addSheet("Bad/Name"), core::WorksheetException);

    EXPECT_THROW(workbook_->defineName("A1", "Summary!$A$1"), core::ParameterException);
    EXPECT_THROW(workbook_->defineName("Local", "Summary!$A$1", 4), core::ParameterException);

    workbook_->defineName("Local", "$C$3", 0);
    EXPECT_NE(workbook_->findDefinedName("local", 0), nullptr);
    EXPECT_EQ(workbook_->findDefinedName("local"), nullptr);
}

TEST_F(WorkbookEditTest, InsertRowsShiftsCellsAndNames) {
    summary_->insertRows(10, 2);

    EXPECT_TRUE(summary_->getValue(11, 2).isNull());
    EXPECT_EQ(summary_->getValue(13, 2), Value("Area"));
    EXPECT_EQ(summary_->getValue(8, 2), Value("Profit"));
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$E$9");

    // 插入点在区域内部时区域扩大
    summary_->insertRows(8, 1);
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$E$10");
    EXPECT_EQ(summary_->getValue(9, 2), Value("Profit"));
}

TEST_F(WorkbookEditTest, DeleteRowsCanInvalidateNames) {
    workbook_->defineName("LossRow", "Summary!$B$9:$E$9");
    summary_->deleteRows(9, 1);

    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$E$8");
    EXPECT_EQ(formula("LossRow"), "#REF!");
    EXPECT_EQ(summary_->getValue(10, 2), Value("Area"));
}

TEST_F(WorkbookEditTest, ColumnsShiftTables) {
    summary_->addTable(core::Table("Results", 7, 2, 9, 5));
    EXPECT_THROW(summary_->addTable(core::Table("results", 1, 1, 2, 2)), core::ParameterException);
    EXPECT_THROW(summary_->addTable(core::Table("Bad Name", 1, 1, 2, 2)), core::ParameterException);

    summary_->insertColumns(1, 1);
    const core::Table* table = summary_->findTable("RESULTS");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->ref(), "C7:F9");
    EXPECT_EQ(summary_->getValue(8, 3), Value("Profit"));
    EXPECT_EQ(formula("SummaryTable"), "Summary!$C$7:$F$9");

    // 整表被删除
    summary_->deleteColumns(3, 4);
    EXPECT_EQ(summary_->findTable("Results"), nullptr);
    EXPECT_EQ(formula("SummaryTable"), "#REF!");
}

// 内容会被挤出工作表时拒绝插入，且不做任何修改
TEST_F(WorkbookEditTest, InsertRejectedAtSheetEdge) {
    const int last_row = utils::AddressParser::kMaxRows;
    const int last_col = utils::AddressParser::kMaxColumns;

    summary_->setValue(last_row, 1, Value("Bottom"));
    EXPECT_THROW(summary_->insertRows(10, 1), core::OperationException);
    EXPECT_EQ(summary_->getValue(11, 2), Value("Area"));
    EXPECT_EQ(summary_->getValue(last_row, 1), Value("Bottom"));
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$E$9");

    EXPECT_THROW(summary_->insertRows(20, INT_MAX), core::OperationException);
    EXPECT_THROW(summary_->deleteColumns(2, INT_MAX), core::OperationException);

    summary_->setValue(1, last_col, Value("Right"));
    EXPECT_THROW(summary_->insertColumns(3, 1), core::OperationException);
    EXPECT_EQ(summary_->getValue(7, 3), Value("Alpha"));

    EXPECT_FALSE(summary_->canInsertRows(1, 1));
    EXPECT_FALSE(summary_->canInsertColumns(last_col, 1));
    // 插入点在所有内容之后时无需平移
    EXPECT_TRUE(summary_->canInsertRows(last_row + 1, 1));
    EXPECT_TRUE(summary_->canInsertColumns(last_col + 1, 1));
}

TEST_F(WorkbookEditTest, ResizeRejectedAtSheetEdge) {
    Range table(summary_, 7, 2, 9, 5, Range::AliasKind::DefinedName, "SummaryTable");
    summary_->setValue(1, utils::AddressParser::kMaxColumns, Value("Right"));

    // 行方向可以插入，列方向不行：整体拒绝，行也不插入
    EXPECT_THROW(workbook_->resizeRange(table, 5, 5), core::OperationException);
    EXPECT_EQ(summary_->getValue(11, 2), Value("Area"));
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$E$9");

    const int last_row = utils::AddressParser::kMaxRows;
    Range bottom(summary_, last_row - 1, 1, last_row, 1);
    EXPECT_THROW(workbook_->resizeRange(bottom, 3, 1), core::OperationException);
}

// 延伸到工作表末行的名称插入行后仍停在末行
TEST_F(WorkbookEditTest, FullHeightNameStaysOnSheet) {
    workbook_->defineName("ColumnB", "Summary!$B$1:$B$1048576");
    summary_->insertRows(5, 2);
    EXPECT_EQ(formula("ColumnB"), "Summary!$B$1:$B$1048576");
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$9:$E$11");
}

TEST_F(WorkbookEditTest, UsedRange) {
    auto used = summary_->usedRange();
    EXPECT_EQ(used.first, 11);
    EXPECT_EQ(used.second, 5);

    core::Workbook empty;
    EXPECT_EQ(empty.addSheet("Empty").usedRange(), std::make_pair(0, 0));
}

// 测试 resize：扩大时插入整行整列
TEST_F(WorkbookEditTest, ResizeGrowsAndMovesContent) {
    Range table(summary_, 7, 2, 9, 5, Range::AliasKind::DefinedName, "SummaryTable");
    Range resized = workbook_->resizeRange(table, 5, 5);

    EXPECT_EQ(*resized.getReference(false, true, false), "Summary!B7:F11");
    EXPECT_EQ(resized.alias(), "SummaryTable");
    EXPECT_EQ(formula("SummaryTable"), "Summary!$B$7:$F$11");
    EXPECT_EQ(summary_->getValue(13, 2), Value("Area"));
    EXPECT_TRUE(summary_->getValue(11, 2).isNull());
}

TEST_F(WorkbookEditTest, ResizeShrinksAndRepairsTable) {
    summary_->addTable(core::Table("Results", 7, 2, 9, 5));
    Range table(summary_, 7, 2, 9, 5, Range::AliasKind::NamedTable, "Results");

    Range resized = workbook_->resizeRange(table, 2, 3);
    EXPECT_EQ(resized.rows(), 2);
    EXPECT_EQ(resized.columns(), 3);
    EXPECT_EQ(summary_->findTable("Results")->ref(), "B7:D8");
    EXPECT_TRUE(summary_->getValue(9, 2).isNull());
    EXPECT_EQ(summary_->getValue(10, 2), Value("Area"));
    EXPECT_TRUE(summary_->getValue(7, 5).isNull());
}

TEST_F(WorkbookEditTest, ResizeRejectsInvalidInput) {
    Range table(summary_, 7, 2, 9, 5);
    EXPECT_THROW(workbook_->resizeRange(Range(), 1, 1), core::OperationException);
    EXPECT_THROW(workbook_->resizeRange(table, 0, 2), core::OperationException);

    core::Workbook other;
    core::Worksheet& foreign = other.addSheet("Summary");
    EXPECT_THROW(workbook_->resizeRange(Range(&foreign, 1, 1, 2, 2), 3, 3), core::OperationException);
}

TEST(CellTest, SetValueClearsFormulaKeepsStyle) {
    core::Cell cell(Value(3), 5);
    cell.setFormula("SUM(A1:A2)", {{"t", "shared"}, {"si", "0"}});
    EXPECT_TRUE(cell.hasFormula());

    cell.setValue(Value("x"));
    EXPECT_FALSE(cell.hasFormula());
    EXPECT_TRUE(cell.getFormulaAttributes().empty());
    EXPECT_EQ(cell.getStyleIndex(), 5u);
    EXPECT_FALSE(cell.isEmpty());
    EXPECT_TRUE(core::Cell().isEmpty());
}
