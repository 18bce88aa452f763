#include "xlsxextract/writer/XLSXWriter.hpp"
#include "xlsxextract/writer/DateStyleAllocator.hpp"
#include "xlsxextract/writer/SharedStringTable.hpp"
#include "xlsxextract/writer/WorksheetXMLGenerator.hpp"
#include "xlsxextract/reader/RelationshipsParser.hpp"
#include "xlsxextract/reader/SharedStringsParser.hpp"
#include "xlsxextract/reader/StylesParser.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "TestWorkbooks.hpp"
#include <gtest/gtest.h>

using namespace xlsxextract;
using core::Value;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ========== 共享字符串表 ==========

TEST(SharedStringTableTest, DeduplicatesInInsertionOrder) {
    writer::SharedStringTable sst;
    EXPECT_EQ(sst.addString("Alpha"), 0);
    EXPECT_EQ(sst.addString("Beta"), 1);
    EXPECT_EQ(sst.addString("Alpha"), 0);

    EXPECT_EQ(sst.size(), 2u);
    EXPECT_EQ(sst.referenceCount(), 3u);
    EXPECT_EQ(sst.getStringIndex("Beta"), 1);
    EXPECT_EQ(sst.getStringIndex("Gamma"), -1);

    sst.clear();
    EXPECT_EQ(sst.size(), 0u);
    EXPECT_EQ(sst.referenceCount(), 0u);
}

TEST(SharedStringTableTest, GenerateEscapesAndPreservesSpace) {
    writer::SharedStringTable sst;
    sst.addString("R&D");
    sst.addString(" padded ");
    sst.addString("R&D");

    const std::string xml = sst.generate();
    EXPECT_TRUE(contains(xml, "count=\"3\""));
    EXPECT_TRUE(contains(xml, "uniqueCount=\"2\""));
    EXPECT_TRUE(contains(xml, "<si><t>R&amp;D</t></si>"));
    EXPECT_TRUE(contains(xml, "<t xml:space=\"preserve\"> padded </t>"));

    // 再读回来
    reader::SharedStringsParser parser;
    ASSERT_TRUE(parser.parseXML(xml));
    EXPECT_EQ(parser.getStrings(), (std::vector<std::string>{"R&D", " padded "}));
}

TEST(SharedStringsParserTest, FlattensRichTextAndSkipsPhonetics) {
    const std::string xml =
        "<sst xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" count=\"2\" uniqueCount=\"2\">"
        "<si><t>Plain</t></si>"
        "<si><r><rPr><b/></rPr><t>Bold</t></r><r><t xml:space=\"preserve\"> and thin</t></r>"
        "<rPh sb=\"0\" eb=\"1\"><t>ignored</t></rPh></si>"
        "</sst>";

    reader::SharedStringsParser parser;
    ASSERT_TRUE(parser.parseXML(xml));
    EXPECT_EQ(parser.getStrings(), (std::vector<std::string>{"Plain", "Bold and thin"}));
}

// ========== 日期样式 ==========

TEST(DateStyleAllocatorTest, AppendsOneStylePerKind) {
    const std::set<uint32_t> date_styles = {3};
    writer::DateStyleAllocator styles(date_styles, 5);

    // 非日期值与已是日期格式的样式保持不变
    EXPECT_EQ(styles.styleFor(2, Value(1.5)), 2u);
    EXPECT_EQ(styles.styleFor(3, Value(core::Date(2021, 5, 1))), 3u);
    EXPECT_FALSE(styles.hasAppended());

    EXPECT_EQ(styles.styleFor(0, Value(core::Date(2021, 5, 1))), 5u);
    EXPECT_EQ(styles.styleFor(1, Value(core::DateTime(2021, 5, 1, 12, 30))), 6u);
    EXPECT_EQ(styles.styleFor(4, Value(core::Date(2022, 1, 1))), 5u);
    EXPECT_TRUE(styles.hasAppended());

    EXPECT_EQ(writer::DateStyleAllocator::builtinFormatFor(Value::Type::Date), 14);
    EXPECT_EQ(writer::DateStyleAllocator::builtinFormatFor(Value::Type::Time), 21);
    EXPECT_EQ(writer::DateStyleAllocator::builtinFormatFor(Value::Type::DateTime), 22);
}

TEST(DateStyleAllocatorTest, DisabledKeepsStyle) {
    const std::set<uint32_t> none;
    writer::DateStyleAllocator styles(none, 1, false);
    EXPECT_EQ(styles.styleFor(0, Value(core::DateTime(2021, 5, 1))), 0u);
    EXPECT_FALSE(styles.hasAppended());
}

TEST(DateStyleAllocatorTest, PatchStylesUpdatesCellXfs) {
    const std::set<uint32_t> none;
    writer::DateStyleAllocator styles(none, 1);
    const std::string xml =
        "<styleSheet><cellXfs count=\"1\"><xf numFmtId=\"0\" fontId=\"0\"/></cellXfs></styleSheet>";

    // 没有追加时原样返回
    EXPECT_EQ(styles.patchStyles(xml), xml);

    styles.styleFor(0, Value(core::Time(8, 30)));
    styles.styleFor(0, Value(core::Date(2021, 5, 1)));
    const std::string patched = styles.patchStyles(xml);

    EXPECT_TRUE(contains(patched, "<cellXfs count=\"3\">"));
    const size_t time_xf = patched.find("<xf numFmtId=\"21\"");
    const size_t date_xf = patched.find("<xf numFmtId=\"14\"");
    ASSERT_NE(time_xf, std::string::npos);
    ASSERT_NE(date_xf, std::string::npos);
    EXPECT_LT(time_xf, date_xf);
    EXPECT_LT(date_xf, patched.find("</cellXfs>"));

    EXPECT_THROW(styles.patchStyles("<styleSheet/>"), core::FormatException);
}

TEST(StylesParserTest, ClassifiesNumberFormats) {
    using Kind = reader::StylesParser::FormatKind;
    EXPECT_EQ(reader::StylesParser::classifyFormat(0, ""), Kind::Number);
    EXPECT_EQ(reader::StylesParser::classifyFormat(14, ""), Kind::Date);
    EXPECT_EQ(reader::StylesParser::classifyFormat(22, ""), Kind::Date);
    EXPECT_EQ(reader::StylesParser::classifyFormat(21, ""), Kind::TimeOnly);
    EXPECT_EQ(reader::StylesParser::classifyFormat(164, "yyyy-mm-dd"), Kind::Date);
    EXPECT_EQ(reader::StylesParser::classifyFormat(165, "hh:mm"), Kind::TimeOnly);
    EXPECT_EQ(reader::StylesParser::classifyFormat(166, "[h]:mm:ss"), Kind::TimeOnly);
    EXPECT_EQ(reader::StylesParser::classifyFormat(167, "#,##0.00"), Kind::Number);
    // 引号内和颜色标记里的字母不算
    EXPECT_EQ(reader::StylesParser::classifyFormat(168, "0.0\" days\""), Kind::Number);
    EXPECT_EQ(reader::StylesParser::classifyFormat(169, "[Red]0.00"), Kind::Number);
}

TEST(StylesParserTest, CollectsDateStyles) {
    const std::string xml =
        "<styleSheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\">"
        "<numFmts count=\"1\"><numFmt numFmtId=\"164\" formatCode=\"dd/mm/yyyy\"/></numFmts>"
        "<cellStyleXfs count=\"1\"><xf numFmtId=\"14\"/></cellStyleXfs>"
        "<cellXfs count=\"4\"><xf numFmtId=\"0\"/><xf numFmtId=\"164\"/><xf numFmtId=\"2\"/>"
        "<xf numFmtId=\"20\"/></cellXfs>"
        "</styleSheet>";

    reader::StylesParser parser;
    ASSERT_TRUE(parser.parseXML(xml));
    EXPECT_EQ(parser.getCellXfCount(), 4u);
    EXPECT_EQ(parser.getDateStyles(), (std::set<uint32_t>{1, 3}));
    EXPECT_EQ(parser.getTimeOnlyStyles(), (std::set<uint32_t>{3}));
}

// ========== 关系 ==========

TEST(RelationshipsParserTest, ResolvesTargets) {
    using reader::RelationshipsParser;
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl/", "worksheets/sheet1.xml"), "xl/worksheets/sheet1.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl/worksheets/", "../tables/table1.xml"), "xl/tables/table1.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("xl/", "/xl/styles.xml"), "xl/styles.xml");
    EXPECT_EQ(RelationshipsParser::resolveTarget("", "./xl/workbook.xml"), "xl/workbook.xml");

    EXPECT_EQ(RelationshipsParser::relsPathFor("xl/workbook.xml"), "xl/_rels/workbook.xml.rels");
    EXPECT_EQ(RelationshipsParser::relsPathFor("workbook.xml"), "_rels/workbook.xml.rels");
    EXPECT_EQ(RelationshipsParser::directoryOf("xl/worksheets/sheet1.xml"), "xl/worksheets/");
    EXPECT_EQ(RelationshipsParser::directoryOf("[Content_Types].xml"), "");
}

TEST(RelationshipsParserTest, ParsesRelationships) {
    const std::string xml =
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
        "Target=\"worksheets/sheet1.xml\"/>"
        "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
        "Target=\"styles.xml\"/>"
        "</Relationships>";

    reader::RelationshipsParser parser;
    ASSERT_TRUE(parser.parseXML(xml));
    ASSERT_NE(parser.findById("rId2"), nullptr);
    EXPECT_EQ(parser.findById("rId2")->target, "styles.xml");
    EXPECT_EQ(parser.findById("rId3"), nullptr);
    EXPECT_EQ(parser.findByType("/worksheet").size(), 1u);
    EXPECT_TRUE(parser.findByType("/sharedStrings").empty());
}

// ========== 工作表与工作簿片段 ==========

TEST(WorksheetXMLGeneratorTest, PatchesDimension) {
    using writer::WorksheetXMLGenerator;
    const std::string prefix = "<worksheet><dimension ref=\"A1\"/><sheetViews/>";
    EXPECT_EQ(WorksheetXMLGenerator::patchDimension(prefix, "B2:F9"),
              "<worksheet><dimension ref=\"B2:F9\"/><sheetViews/>");
    EXPECT_EQ(WorksheetXMLGenerator::patchDimension("<worksheet><sheetViews/>", "A1:B2"),
              "<worksheet><sheetViews/>");

    auto workbook = test::makeSourceWorkbook();
    EXPECT_EQ(WorksheetXMLGenerator::dimensionRef(*workbook->getSheet("Report 1")), "A1:F9");
    EXPECT_EQ(WorksheetXMLGenerator::dimensionRef(*workbook->getSheet("Report 2")), "A1");
}

TEST(WorksheetXMLGeneratorTest, WritesCellTypes) {
    core::Workbook workbook;
    core::Worksheet& sheet = workbook.addSheet("Data");
    sheet.setValue(1, 1, Value("Name"));
    sheet.setValue(1, 2, Value(2.5));
    sheet.setValue(2, 1, Value(true));
    sheet.setValue(2, 2, Value(core::Date(2021, 5, 1)));
    sheet.cell(3, 1).setFormula("B1*2");
    sheet.cell(3, 1).setValue(Value(5));
    sheet.cell(3, 1).setFormula("B1*2");

    const std::set<uint32_t> none;
    writer::DateStyleAllocator styles(none, 1);
    writer::SharedStringTable sst;
    writer::WorksheetXMLGenerator generator(sheet, styles, &sst, false);
    const std::string xml = generator.generateSheetData();

    EXPECT_TRUE(contains(xml, "<c r=\"A1\" t=\"s\"><v>0</v></c>"));
    EXPECT_TRUE(contains(xml, "<c r=\"B1\"><v>2.5</v></c>"));
    EXPECT_TRUE(contains(xml, "<c r=\"A2\" t=\"b\"><v>1</v></c>"));
    EXPECT_TRUE(contains(xml, "<c r=\"B2\" s=\"1\"><v>44317</v></c>"));
    EXPECT_TRUE(contains(xml, "<c r=\"A3\"><f>B1*2</f><v>5</v></c>"));
    EXPECT_EQ(sst.strings(), std::vector<std::string>{"Name"});

    // 没有共享字符串表时写成内联字符串
    writer::WorksheetXMLGenerator inline_generator(sheet, styles, nullptr, false);
    EXPECT_TRUE(contains(inline_generator.generateSheetData(),
                         "<c r=\"A1\" t=\"inlineStr\"><is><t>Name</t></is></c>"));
}

TEST(XLSXWriterTest, GeneratesDefinedNames) {
    core::DefinedNameManager empty;
    EXPECT_EQ(writer::XLSXWriter::generateDefinedNames(empty), "");

    auto workbook = test::makeSourceWorkbook();
    workbook->defineName("Local", "$B$6", 0);
    const std::string xml = writer::XLSXWriter::generateDefinedNames(workbook->definedNames());
    EXPECT_TRUE(contains(xml, "<definedName name=\"MonthlyData\">'Report 1'!$B$5:$F$9</definedName>"));
    EXPECT_TRUE(contains(xml, "<definedName name=\"Local\" localSheetId=\"0\">$B$6</definedName>"));
}

TEST(XLSXWriterTest, SplicesDefinedNames) {
    using writer::XLSXWriter;
    const std::string names = "<definedNames><definedName name=\"X\">S!$A$1</definedName></definedNames>";

    // 插入到 </sheets> 之后
    EXPECT_EQ(XLSXWriter::spliceDefinedNames("<workbook><sheets><sheet/></sheets><calcPr/></workbook>", names),
              "<workbook><sheets><sheet/></sheets>" + names + "<calcPr/></workbook>");

    // 替换原有片段
    EXPECT_EQ(XLSXWriter::spliceDefinedNames(
                  "<workbook><sheets></sheets><definedNames><definedName name=\"Old\">S!$B$2</definedName>"
                  "</definedNames><calcPr/></workbook>", names),
              "<workbook><sheets></sheets>" + names + "<calcPr/></workbook>");

    // 名称全部删除时移除片段
    EXPECT_EQ(XLSXWriter::spliceDefinedNames(
                  "<workbook><sheets></sheets><definedNames><definedName name=\"Old\">1</definedName>"
                  "</definedNames></workbook>", ""),
              "<workbook><sheets></sheets></workbook>");

    EXPECT_THROW(XLSXWriter::spliceDefinedNames("<workbook><calcPr/></workbook>", names), core::FormatException);
}

TEST(XLSXWriterTest, GeneratesTableWithUniqueColumns) {
    auto workbook = test::makeSourceWorkbook();
    core::Worksheet* report = workbook->getSheet("Report 1");
    report->setValue(5, 4, Value("jan"));
    core::Table table("Monthly", 5, 2, 9, 6);
    table.totals_row_count = 1;

    const std::string xml = writer::XLSXWriter::generateTable(table, *report, 3);
    EXPECT_TRUE(contains(xml, "id=\"3\" name=\"Monthly\" displayName=\"Monthly\" ref=\"B5:F9\""));
    EXPECT_TRUE(contains(xml, "totalsRowCount=\"1\""));
    EXPECT_TRUE(contains(xml, "<autoFilter ref=\"B5:F8\"/>"));
    EXPECT_TRUE(contains(xml, "<tableColumns count=\"5\">"));
    EXPECT_TRUE(contains(xml, "<tableColumn id=\"1\" name=\"Column1\"/>"));
    EXPECT_TRUE(contains(xml, "<tableColumn id=\"2\" name=\"Jan\"/>"));
    EXPECT_TRUE(contains(xml, "<tableColumn id=\"3\" name=\"jan2\"/>"));
    EXPECT_TRUE(contains(xml, "<tableColumn id=\"5\" name=\"Apr\"/>"));
}
