#include "xlsxextract/config/BlockParser.hpp"
#include "xlsxextract/config/ConfigRunner.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "TestWorkbooks.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace xlsxextract;
using config::Block;
using config::BlockParser;
using config::Variables;
using core::Value;
using match::Comparator;
using Op = match::Comparator::Operator;

namespace fs = std::filesystem;

namespace {

// 测试用的源文件目录
class SourceDirectory {
public:
    explicit SourceDirectory(const std::string& name)
        : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~SourceDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    void touch(const std::string& filename) const {
        std::ofstream out(path_ / filename);
        out << "placeholder";
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ========== BlockParser ==========

TEST(BlockParserTest, OperatorTable) {
    EXPECT_EQ(BlockParser::parseOperator("is"), Op::Equal);
    EXPECT_EQ(BlockParser::parseOperator(" IS "), Op::Equal);
    EXPECT_EQ(BlockParser::parseOperator("is not"), Op::NotEqual);
    EXPECT_EQ(BlockParser::parseOperator("Matches"), Op::Regex);
    EXPECT_EQ(BlockParser::parseOperator(">="), Op::GreaterEqual);
    EXPECT_EQ(BlockParser::parseOperator("is empty"), Op::Empty);
    EXPECT_EQ(BlockParser::parseOperator("is not empty"), Op::NotEmpty);
    EXPECT_FALSE(BlockParser::parseOperator("frobnicate"));

    EXPECT_THROW(BlockParser::parseComparator("frobnicate", Value("x")), core::ConfigurationException);
    EXPECT_THROW(BlockParser::parseComparator("matches", Value("(")), core::InvalidComparator);
}

TEST(BlockParserTest, ParseBlock) {
    core::Workbook wb;
    core::Worksheet& sheet = wb.addSheet("Config");
    test::fillRows(sheet, 1, 1, {
        {"Name", "is", "Profit"},
        {" Start Value ", "matches", "^Pro"},
        {Value(), "is", "ignored"},
        {"sheet", Value(), "ignored"},
        {"Name", "is", "Loss"},
        {"rows", "is", 3},
    });

    auto block = BlockParser::parseBlock(core::Range(&sheet, 1, 1, 6, 3), {});
    ASSERT_TRUE(block);
    EXPECT_EQ(block->size(), 3u);
    // 重复的键以最后一个为准
    EXPECT_EQ(block->at("name"), Comparator(Op::Equal, Value("Loss")));
    EXPECT_EQ(block->at("start value").getOperator(), Op::Regex);
    EXPECT_EQ(block->at("rows").getOperand(), Value(3));
    EXPECT_EQ(block->count("sheet"), 0u);

    EXPECT_FALSE(BlockParser::parseBlock(core::Range(&sheet, 1, 1, 6, 2), {}));
    EXPECT_FALSE(BlockParser::parseBlock(core::Range(), {}));
}

TEST(BlockParserTest, ParseBlockRejectsUnknownOperator) {
    core::Workbook wb;
    core::Worksheet& sheet = wb.addSheet("Config");
    test::fillRows(sheet, 1, 1, {
        {"name", "is", "Bad"},
        {"value", "roughly", 3},
    });
    EXPECT_THROW(BlockParser::parseBlock(core::Range(&sheet, 1, 1, 2, 3), {}), core::ConfigurationException);
}

TEST(BlockParserTest, InterpolateVariables) {
    Variables vars = {
        {"file", Value("2021")},
        {"total", Value(6)},
    };

    EXPECT_EQ(BlockParser::interpolateVariables(Value("Report $file.xlsx"), vars), Value("Report 2021.xlsx"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value("${FILE}x"), vars), Value("2021x"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value("$total items"), vars), Value("6 items"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value("costs $$5"), vars), Value("costs $5"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value("$unknown and ${file"), vars),
              Value("$unknown and ${file"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value("trailing $"), vars), Value("trailing $"));
    EXPECT_EQ(BlockParser::interpolateVariables(Value(5), vars), Value(5));
    EXPECT_EQ(BlockParser::interpolateVariables(Value(), vars), Value());
}

TEST(BlockParserTest, ExtractDirectory) {
    Block block;
    EXPECT_FALSE(BlockParser::extractDirectory(block));

    block.insert_or_assign("directory", Comparator(Op::Equal, Value("data/in")));
    auto dir = BlockParser::extractDirectory(block);
    ASSERT_TRUE(dir);
    EXPECT_EQ(fs::path(*dir), fs::path("data") / "in");

    block.insert_or_assign("directory", Comparator(Op::Regex, Value("data")));
    EXPECT_THROW(BlockParser::extractDirectory(block), core::ConfigurationException);

    block.insert_or_assign("directory", Comparator(Op::Equal, Value(12)));
    EXPECT_THROW(BlockParser::extractDirectory(block), core::ConfigurationException);
}

TEST(BlockParserTest, ExtractFilename) {
    SourceDirectory dir("xlsxextract_extract_filename");
    dir.touch("source-2021.xlsx");
    dir.touch("notes.txt");

    Block block;
    EXPECT_FALSE(BlockParser::extractFilename(block, dir.path()));

    block.insert_or_assign("file", Comparator(Op::Regex, Value("source-(\\d+)\\.xlsx")));
    auto selected = BlockParser::extractFilename(block, dir.path());
    ASSERT_TRUE(selected);
    EXPECT_EQ(fs::path(selected->path).filename(), "source-2021.xlsx");
    EXPECT_EQ(selected->match, Value("2021"));

    block.insert_or_assign("file", Comparator(Op::Equal, Value("notes.txt")));
    selected = BlockParser::extractFilename(block, dir.path());
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->match, Value("notes.txt"));

    block.insert_or_assign("file", Comparator(Op::Equal, Value("missing.xlsx")));
    EXPECT_THROW(BlockParser::extractFilename(block, dir.path()), core::ConfigurationException);

    block.insert_or_assign("file", Comparator(Op::Regex, Value("^report")));
    EXPECT_THROW(BlockParser::extractFilename(block, dir.path()), core::ConfigurationException);

    block.insert_or_assign("file", Comparator(Op::Greater, Value("a")));
    EXPECT_THROW(BlockParser::extractFilename(block, dir.path()), core::ConfigurationException);

    block.insert_or_assign("file", Comparator(Op::Equal, Value("notes.txt")));
    EXPECT_THROW(BlockParser::extractFilename(block, dir.path() + "/nowhere"), core::ConfigurationException);
}

// ========== ConfigRunner ==========

class ConfigRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<SourceDirectory>("xlsxextract_config_runner");
        dir_->touch("source-2021.xlsx");

        target_ = test::makeTargetWorkbook();
        config_ = &target_->addSheet("Config");

        loader_ = [this](const std::string& path) {
            loaded_.push_back(path);
            return test::makeSourceWorkbook();
        };
    }

    std::optional<std::vector<config::Action>> run(std::optional<std::string> source_file = std::nullopt) {
        config::ConfigRunner runner(*target_, dir_->path(), std::move(source_file), "Config", loader_);
        auto history = runner.run();
        variables_ = runner.variables();
        return history;
    }

    std::unique_ptr<SourceDirectory> dir_;
    std::unique_ptr<core::Workbook> target_;
    core::Worksheet* config_ = nullptr;
    config::ConfigRunner::WorkbookLoader loader_;
    std::vector<std::string> loaded_;
    Variables variables_;
};

TEST_F(ConfigRunnerTest, MissingConfigSheet) {
    core::Workbook bare;
    bare.addSheet("Summary");
    config::ConfigRunner runner(bare, dir_->path(), std::nullopt, "Config", loader_);
    EXPECT_FALSE(runner.run());
}

TEST_F(ConfigRunnerTest, NameBlockNeedsSource) {
    test::fillRows(*config_, 2, 1, {
        {"name", "is", "Date"},
        {"reference", "is", "'Report 1'!C3"},
    });

    auto history = run();
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 1u);
    EXPECT_FALSE((*history)[0].success);
    EXPECT_EQ((*history)[0].name, "Date");
    EXPECT_EQ((*history)[0].message, "No source file set ahead of Date");
}

TEST_F(ConfigRunnerTest, DefaultSourceFile) {
    test::fillRows(*config_, 1, 1, {
        {"name", "is", "Date"},
        {"reference", "is", "ReportDate"},
        {"target", "is", "Summary!C3"},
    });

    auto history = run(std::string("source-2021.xlsx"));
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 2u);
    EXPECT_EQ((*history)[0].name, "file");
    EXPECT_TRUE((*history)[0].success);
    ASSERT_EQ(loaded_.size(), 1u);
    EXPECT_EQ(fs::path(loaded_[0]), fs::path(dir_->path()) / "source-2021.xlsx");
    EXPECT_EQ(variables_.at("file"), Value("source-2021.xlsx"));

    EXPECT_TRUE((*history)[1].success) << (*history)[1].message;
    EXPECT_EQ(target_->getSheet("Summary")->getValue(3, 3), Value(core::DateTime(2021, 5, 1)));
}

// 完整的配置表：目录、文件、复制、对齐、失败的块、变量
TEST_F(ConfigRunnerTest, FullConfiguration) {
    test::fillRows(*config_, 1, 1, {
        {"directory", "is", dir_->path()},
        {},
        {"file", "matches", "source-(\\d+)\\.xlsx"},
        {},
        {"name", "is", "Date"},
        {"sheet", "is", "Report 1"},
        {"reference", "is", "C3"},
        {"target", "is", "Summary!C3"},
        {},
        {"name", "is", "Feb values"},
        {"reference", "is", "MonthlyData"},
        {"source column value", "is", "Feb"},
        {"target", "is", "SummaryTable"},
        {"target row value", "is", "Profit"},
        {"align", "is", true},
        {},
        {"name", "is", "Missing"},
        {"reference", "is", "NoSuchName"},
        {},
        {"name", "is", "Bad op"},
        {"value", "frobnicate", "x"},
        {},
        {"name", "is", "Label"},
        {"sheet", "is", "Report 1"},
        {"value", "matches", "^Da(.+)"},
        {},
        {"name", "is", "Echo ${label} $file"},
        {"reference", "is", "'Report 1'!B3"},
    });

    auto history = run();
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 8u);

    const auto& actions = *history;
    EXPECT_EQ(actions[0].name, "directory");
    EXPECT_TRUE(actions[0].success);
    EXPECT_EQ(actions[0].message, "Obtained " + dir_->path());

    EXPECT_EQ(actions[1].name, "file");
    EXPECT_TRUE(actions[1].success);
    EXPECT_EQ(variables_.at("file"), Value("2021"));

    EXPECT_EQ(actions[2].name, "Date");
    EXPECT_TRUE(actions[2].success) << actions[2].message;
    EXPECT_EQ(actions[2].message, "Copied 'Report 1'!C3 to Summary!C3");

    EXPECT_EQ(actions[3].name, "Feb values");
    EXPECT_TRUE(actions[3].success) << actions[3].message;

    EXPECT_EQ(actions[4].name, "Missing");
    EXPECT_FALSE(actions[4].success);
    EXPECT_EQ(actions[4].message, "Missing failed to match");

    EXPECT_EQ(actions[5].name, "name");
    EXPECT_FALSE(actions[5].success);
    EXPECT_NE(actions[5].message.find("frobnicate"), std::string::npos);

    EXPECT_EQ(actions[6].name, "Label");
    EXPECT_TRUE(actions[6].success);
    EXPECT_EQ(variables_.at("label"), Value("te"));

    EXPECT_EQ(actions[7].name, "Echo te 2021");
    EXPECT_EQ(actions[7].message, "Matched 'Report 1'!B3");

    core::Worksheet* summary = target_->getSheet("Summary");
    EXPECT_EQ(summary->getValue(3, 3), Value(core::DateTime(2021, 5, 1)));
    EXPECT_EQ(summary->getValue(8, 3), Value(6));
    EXPECT_EQ(summary->getValue(8, 4), Value(8));
    EXPECT_EQ(summary->getValue(8, 5), Value(7));
}

TEST_F(ConfigRunnerTest, FailedFileBlockKeepsPreviousSource) {
    test::fillRows(*config_, 1, 1, {
        {"file", "is", "source-2021.xlsx"},
        {},
        {"file", "is", "absent.xlsx"},
        {},
        {"name", "is", "Date"},
        {"reference", "is", "'Report 1'!C3"},
    });

    auto history = run();
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 3u);
    EXPECT_TRUE((*history)[0].success);
    EXPECT_FALSE((*history)[1].success);
    EXPECT_EQ((*history)[1].name, "file");
    EXPECT_TRUE((*history)[2].success);
    EXPECT_EQ(loaded_.size(), 1u);
}

// 文件加载失败时跳过块内其余条目，不落到之前加载的源文件上
TEST_F(ConfigRunnerTest, FailedLoadSkipsRestOfBlock) {
    dir_->touch("corrupt.xlsx");
    loader_ = [this](const std::string& path) -> std::unique_ptr<core::Workbook> {
        loaded_.push_back(path);
        if (fs::path(path).filename() == "corrupt.xlsx") {
            throw core::FileException("Corrupt package", path, core::ErrorCode::FileReadError);
        }
        return test::makeSourceWorkbook();
    };
    test::fillRows(*config_, 1, 1, {
        {"file", "is", "source-2021.xlsx"},
        {},
        {"file", "is", "corrupt.xlsx"},
        {"name", "is", "Date"},
        {"reference", "is", "'Report 1'!C3"},
        {"target", "is", "Summary!C3"},
    });

    auto history = run();
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 2u);
    EXPECT_TRUE((*history)[0].success);
    EXPECT_EQ((*history)[1].name, "file");
    EXPECT_FALSE((*history)[1].success);
    EXPECT_EQ(loaded_.size(), 2u);
    EXPECT_TRUE(target_->getSheet("Summary")->getValue(3, 3).isBlank());
}

// directory 写法不合法：记录失败并跳过块内的 file
TEST_F(ConfigRunnerTest, MalformedDirectorySkipsBlock) {
    test::fillRows(*config_, 1, 1, {
        {"directory", "matches", dir_->path()},
        {"file", "is", "source-2021.xlsx"},
        {},
        {"name", "is", "Date"},
        {"reference", "is", "'Report 1'!C3"},
    });

    auto history = run();
    ASSERT_TRUE(history);
    ASSERT_EQ(history->size(), 2u);
    EXPECT_EQ((*history)[0].name, "directory");
    EXPECT_FALSE((*history)[0].success);
    EXPECT_EQ((*history)[1].name, "Date");
    EXPECT_FALSE((*history)[1].success);
    EXPECT_EQ((*history)[1].message, "No source file set ahead of Date");
    EXPECT_TRUE(loaded_.empty());
    EXPECT_EQ(variables_.count("directory"), 0u);
}

TEST_F(ConfigRunnerTest, BuildTargetShapes) {
    auto source = test::makeSourceWorkbook();

    Block cell_block;
    cell_block.insert_or_assign("name", Comparator(Op::Equal, Value("Date")));
    cell_block.insert_or_assign("reference", Comparator(Op::Equal, Value("ReportDate")));
    match::Match cell_source = config::ConfigRunner::buildSourceMatch(cell_block, *source);
    EXPECT_FALSE(match::isRangeMatch(cell_source));
    EXPECT_FALSE(config::ConfigRunner::buildTarget(cell_block, cell_source));

    Block table_block = cell_block;
    table_block.insert_or_assign("reference", Comparator(Op::Equal, Value("MonthlyData")));
    table_block.insert_or_assign("target", Comparator(Op::Equal, Value("SummaryTable")));
    table_block.insert_or_assign("expand", Comparator(Op::Equal, Value("yes")));
    match::Match table_source = config::ConfigRunner::buildSourceMatch(table_block, *source);
    EXPECT_TRUE(match::isRangeMatch(table_source));
    auto table_target = config::ConfigRunner::buildTarget(table_block, table_source);
    ASSERT_TRUE(table_target);
    EXPECT_TRUE(table_target->params().expand);
    EXPECT_TRUE(std::holds_alternative<match::Target::TableCopy>(table_target->shape()));

    Block sized = cell_block;
    sized.insert_or_assign("start reference", Comparator(Op::Equal, Value("'Report 1'!B5")));
    sized.insert_or_assign("rows", Comparator(Op::Equal, Value(2)));
    sized.insert_or_assign("columns", Comparator(Op::Equal, Value(2)));
    match::Match sized_source = config::ConfigRunner::buildSourceMatch(sized, *source);
    ASSERT_TRUE(match::isRangeMatch(sized_source));
    EXPECT_EQ(std::get<match::RangeMatch>(sized_source).params().rows, 2);

    Block bad = cell_block;
    bad.insert_or_assign("rows", Comparator(Op::Equal, Value(1.5)));
    EXPECT_THROW(config::ConfigRunner::buildSourceMatch(bad, *source), core::ConfigurationException);

    // 超出 int 范围的整数
    Block huge = sized;
    huge.insert_or_assign("rows", Comparator(Op::Equal, Value(3e9)));
    EXPECT_THROW(config::ConfigRunner::buildSourceMatch(huge, *source), core::ConfigurationException);

    Block wide = sized;
    wide.insert_or_assign("columns", Comparator(Op::Equal, Value(20000)));
    EXPECT_THROW(config::ConfigRunner::buildSourceMatch(wide, *source), core::ConfigurationException);

    Block far = cell_block;
    far.insert_or_assign("row offset", Comparator(Op::Equal, Value(2147483647)));
    EXPECT_THROW(config::ConfigRunner::buildSourceMatch(far, *source), core::ConfigurationException);
}
