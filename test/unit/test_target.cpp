#include "xlsxextract/match/Target.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/core/Workbook.hpp"
#include "TestWorkbooks.hpp"
#include <gtest/gtest.h>

using namespace xlsxextract;
using core::Value;
using match::CellMatch;
using match::Comparator;
using match::RangeMatch;
using match::Target;
using Op = match::Comparator::Operator;
using Rows = std::vector<std::vector<Value>>;

class TargetTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = test::makeSourceWorkbook();
        target_ = test::makeTargetWorkbook();
        summary_ = target_->getSheet("Summary");
    }

    static CellMatch label(const std::string& text) {
        CellMatch::Params p;
        p.name = text;
        p.value = Comparator(Op::Equal, Value(text));
        return CellMatch(std::move(p));
    }

    static RangeMatch sourceTable() {
        return RangeMatch::byReference("Table", "'Report 1'!B5:F9");
    }

    static RangeMatch targetTable() {
        return RangeMatch::byReference("Summary", "'Summary'!B7:E9");
    }

    Rows targetValues(const std::string& reference) {
        return target_->resolveReference(reference).getValues();
    }

    std::unique_ptr<core::Workbook> source_;
    std::unique_ptr<core::Workbook> target_;
    core::Worksheet* summary_ = nullptr;
};

// 测试构造时的形状检查
TEST_F(TargetTest, ShapeIsCheckedAtConstruction) {
    EXPECT_NO_THROW(Target(Target::Params(CellMatch::byReference("s", "SourceRef"),
                                          CellMatch::byReference("t", "TargetRef"))));
    EXPECT_NO_THROW(Target(Target::Params(RangeMatch::byReference("s", "SourceRef"),
                                          RangeMatch::byReference("t", "TargetRef"))));

    EXPECT_THROW(Target(Target::Params(RangeMatch::byReference("s", "SourceRef"),
                                       CellMatch::byReference("t", "TargetRef"))),
                 core::ConfigurationException);
    EXPECT_THROW(Target(Target::Params(CellMatch::byReference("s", "SourceRef"),
                                       RangeMatch::byReference("t", "TargetRef"))),
                 core::ConfigurationException);

    // 两个定位器把区域收窄为单元格
    Target::Params triangulated(RangeMatch::byReference("s", "SourceRef"),
                                CellMatch::byReference("t", "TargetRef"));
    triangulated.source_row = CellMatch::byReference("r", "C2");
    triangulated.source_col = CellMatch::byReference("c", "C1");
    Target cell_copy(triangulated);
    EXPECT_TRUE(std::holds_alternative<Target::CellCopy>(cell_copy.shape()));

    // 一个定位器得到向量
    Target::Params vector(RangeMatch::byReference("s", "SourceRef"),
                          RangeMatch::byReference("t", "TargetRef"));
    vector.source_col = CellMatch::byReference("c", "C1");
    vector.target_row = CellMatch::byReference("r", "C2");
    EXPECT_TRUE(std::holds_alternative<Target::VectorCopy>(Target(vector).shape()));

    Target::Params locator_on_cell(CellMatch::byReference("s", "SourceRef"),
                                   CellMatch::byReference("t", "TargetRef"));
    locator_on_cell.source_row = CellMatch::byReference("r", "C2");
    EXPECT_THROW(Target{locator_on_cell}, core::ConfigurationException);
}

TEST_F(TargetTest, SingleCell) {
    ASSERT_NE(summary_->getValue(3, 3), Value(core::DateTime(2021, 5, 1)));

    Target t(Target::Params(CellMatch::byReference("Date:source", "'Report 1'!C3"),
                            CellMatch::byReference("Date:target", "'Summary'!C3")));
    auto result = t.extract(*source_, *target_);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result->range.getReference(false), "'Report 1'!C3");
    EXPECT_EQ(summary_->getValue(3, 3), Value(core::DateTime(2021, 5, 1)));
}

TEST_F(TargetTest, TriangulatedSource) {
    Target::Params p(sourceTable(), CellMatch::byReference("Date:target", "'Summary'!C3"));
    p.source_row = label("Beta");
    p.source_col = label("Feb");

    ASSERT_TRUE(Target(p).extract(*source_, *target_));
    EXPECT_EQ(summary_->getValue(3, 3), Value(7));
}

TEST_F(TargetTest, TriangulatedTarget) {
    Target::Params p(sourceTable(), targetTable());
    p.source_row = label("Beta");
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    p.target_col = label("Delta");

    ASSERT_TRUE(Target(p).extract(*source_, *target_));
    EXPECT_EQ(summary_->getValue(8, 4), Value(7));
}

// 整表替换：目标较小时截断
TEST_F(TargetTest, ReplaceTableTruncates) {
    ASSERT_TRUE(Target(Target::Params(sourceTable(), targetTable())).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Jan", "Feb", "Mar"},
        {"Alpha", 1.5, 6, 11},
        {"Beta", 2, 7, 12},
    };
    EXPECT_EQ(targetValues("Summary!B7:E9"), expected);
    EXPECT_EQ(summary_->getValue(11, 2), Value("Area"));
}

TEST_F(TargetTest, ReplaceTableExpands) {
    Target::Params p(sourceTable(), targetTable());
    p.expand = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Jan", "Feb", "Mar", "Apr"},
        {"Alpha", 1.5, 6, 11, 4.6},
        {"Beta", 2, 7, 12, 4.7},
        {"Delta", 2.5, 8, 13, 4.8},
        {"Gamma", 3, 9, 14, 4.9},
    };
    EXPECT_EQ(targetValues("Summary!B7:F11"), expected);
    // 下方内容被推下去
    EXPECT_EQ(summary_->getValue(13, 2), Value("Area"));
    EXPECT_TRUE(summary_->getValue(11, 3).isNumber());
    EXPECT_EQ(target_->findDefinedName("SummaryTable")->formula, "Summary!$B$7:$E$9");
}

TEST_F(TargetTest, ExpandUpdatesAliasedTarget) {
    Target::Params p(sourceTable(), RangeMatch::byReference("Summary", "SummaryTable"));
    p.expand = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));
    EXPECT_EQ(target_->findDefinedName("SummaryTable")->formula, "Summary!$B$7:$F$11");
}

// 按标签对齐：Profit 行按列标签取 Feb 列的值
TEST_F(TargetTest, AlignVector) {
    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    p.align = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Alpha", "Delta", "Beta"},
        {"Profit", 6, 8, 7},
        {"Loss", Value(), Value(), Value()},
    };
    EXPECT_EQ(targetValues("Summary!B7:E9"), expected);
}

// 源中没有的目标标签保持原值
TEST_F(TargetTest, AlignKeepsUnmatchedLabel) {
    summary_->setValue(7, 4, Value("Omega"));
    summary_->setValue(8, 4, Value(99));
    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    p.align = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Alpha", "Omega", "Beta"},
        {"Profit", 6, 99, 7},
        {"Loss", Value(), Value(), Value()},
    };
    EXPECT_EQ(targetValues("Summary!B7:E9"), expected);
}

TEST_F(TargetTest, AlignIgnoresCaseAndWhitespace) {
    summary_->setValue(7, 4, Value("  delta "));
    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    p.align = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));
    EXPECT_EQ(summary_->getValue(8, 4), Value(8));
}

TEST_F(TargetTest, ReplaceVector) {
    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    ASSERT_TRUE(Target(p).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Alpha", "Delta", "Beta", Value()},
        {"Feb", 6, 7, 8, Value()},
        {"Loss", Value(), Value(), Value(), Value()},
    };
    EXPECT_EQ(targetValues("Summary!B7:F9"), expected);
}

TEST_F(TargetTest, ReplaceVectorExpands) {
    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Profit");
    p.expand = true;
    ASSERT_TRUE(Target(p).extract(*source_, *target_));

    Rows expected = {
        {Value(), "Alpha", "Delta", "Beta", Value()},
        {"Feb", 6, 7, 8, 9},
        {"Loss", Value(), Value(), Value(), Value()},
    };
    EXPECT_EQ(targetValues("Summary!B7:F9"), expected);
    EXPECT_EQ(summary_->getValue(11, 2), Value("Area"));
}

// 任何定位失败时目标保持不变
TEST_F(TargetTest, FailedLocatorLeavesTargetUntouched) {
    const Rows before = targetValues("Summary!A1:F12");

    Target::Params p(sourceTable(), targetTable());
    p.source_col = label("Feb");
    p.target_row = label("Revenue");
    p.expand = true;
    EXPECT_FALSE(Target(p).extract(*source_, *target_));

    Target::Params missing_source(RangeMatch::byReference("Table", "NoSuchTable"), targetTable());
    missing_source.expand = true;
    EXPECT_FALSE(Target(missing_source).extract(*source_, *target_));

    EXPECT_EQ(targetValues("Summary!A1:F12"), before);
}
