#include "xlsxextract/reader/XLSXReader.hpp"
#include "xlsxextract/reader/RelationshipsParser.hpp"
#include "xlsxextract/reader/SharedStringsParser.hpp"
#include "xlsxextract/reader/StylesParser.hpp"
#include "xlsxextract/reader/TableParser.hpp"
#include "xlsxextract/reader/WorkbookParser.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlsxextract {
namespace reader {

namespace {

const char* const kOfficeDocumentType = "/officeDocument";
const char* const kWorksheetType = "/worksheet";
const char* const kSharedStringsType = "/sharedStrings";
const char* const kStylesType = "/styles";
const char* const kTableType = "/table";

} // namespace

XLSXReader::XLSXReader(const std::string& filename)
    : filename_(filename), zip_reader_(filename) {
}

void XLSXReader::open() {
    archive::ZipError result = zip_reader_.open();
    switch (result) {
        case archive::ZipError::Ok:
            break;
        case archive::ZipError::FileNotFound:
            throw core::FileException("File not found: " + filename_, filename_,
                                      core::ErrorCode::FileNotFound, __FILE__, __LINE__);
        case archive::ZipError::BadFormat:
            XLSXEXTRACT_THROW(core::FormatException, "Not a valid xlsx package: " + filename_);
        default:
            throw core::FileException(fmt::format("Cannot read {}: {}", filename_, archive::toString(result)),
                                      filename_, core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    READER_INFO("Opened {}", filename_);
}

void XLSXReader::close() {
    zip_reader_.close();
    shared_strings_.clear();
}

std::unique_ptr<core::Workbook> XLSXReader::load(const std::string& filename) {
    XLSXReader reader(filename);
    reader.open();
    auto workbook = reader.loadWorkbook();
    reader.close();
    return workbook;
}

bool XLSXReader::hasPart(const std::string& path) const {
    return zip_reader_.fileExists(path) == archive::ZipError::Ok;
}

std::string XLSXReader::readPart(const std::string& path) {
    std::string content;
    archive::ZipError result = zip_reader_.extractFile(path, content);
    if (result == archive::ZipError::FileNotFound) {
        XLSXEXTRACT_THROW(core::FormatException, fmt::format("Missing part {} in {}", path, filename_));
    }
    if (result != archive::ZipError::Ok) {
        throw core::FileException(fmt::format("Cannot read part {}: {}", path, archive::toString(result)),
                                  filename_, core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    return content;
}

template <typename Parser>
void XLSXReader::parsePart(Parser& parser, const std::string& path) {
    const std::string content = readPart(path);
    if (!parser.parseXML(content)) {
        throw core::XMLException(fmt::format("Malformed part {}: {}", path, parser.getErrorMessage()),
                                 path, __FILE__, __LINE__);
    }
}

std::string XLSXReader::findWorkbookPart() {
    if (hasPart("_rels/.rels")) {
        RelationshipsParser root_rels;
        parsePart(root_rels, "_rels/.rels");
        auto documents = root_rels.findByType(kOfficeDocumentType);
        if (!documents.empty()) {
            return RelationshipsParser::resolveTarget("", documents.front()->target);
        }
    }
    READER_WARN("No officeDocument relationship, assuming xl/workbook.xml");
    return "xl/workbook.xml";
}

std::unique_ptr<core::Workbook> XLSXReader::loadWorkbook() {
    if (!zip_reader_.isOpen()) {
        XLSXEXTRACT_THROW(core::OperationException, "XLSX reader is not open");
    }

    auto workbook = std::make_unique<core::Workbook>();
    core::PackageInfo& package = workbook->package();
    package.source_path = filename_;
    package.workbook_part = findWorkbookPart();

    const std::string workbook_dir = RelationshipsParser::directoryOf(package.workbook_part);
    RelationshipsParser workbook_rels;
    const std::string rels_path = RelationshipsParser::relsPathFor(package.workbook_part);
    if (hasPart(rels_path)) {
        parsePart(workbook_rels, rels_path);
    }

    auto strings_rels = workbook_rels.findByType(kSharedStringsType);
    if (!strings_rels.empty()) {
        package.shared_strings_part = RelationshipsParser::resolveTarget(workbook_dir, strings_rels.front()->target);
        parseSharedStrings(package.shared_strings_part);
    }
    auto styles_rels = workbook_rels.findByType(kStylesType);
    if (!styles_rels.empty()) {
        package.styles_part = RelationshipsParser::resolveTarget(workbook_dir, styles_rels.front()->target);
        parseStyles(package.styles_part, package);
    }

    WorkbookParser workbook_parser;
    parsePart(workbook_parser, package.workbook_part);
    package.date1904 = workbook_parser.isDate1904();

    CellContext context;
    context.shared_strings = &shared_strings_;
    context.date_styles = &package.date_styles;
    context.time_only_styles = &package.time_only_styles;
    context.date1904 = package.date1904;

    for (const auto& info : workbook_parser.getWorksheets()) {
        core::Worksheet& worksheet = workbook->addSheet(info.name);

        const auto* rel = workbook_rels.findById(info.rel_id);
        if (!rel) {
            READER_WARN("Sheet {} has no relationship {}", info.name, info.rel_id);
            continue;
        }
        const std::string part = RelationshipsParser::resolveTarget(workbook_dir, rel->target);
        worksheet.setPartPath(part);

        // 图表工作表等只占位，部件原样保留
        const std::string_view type = rel->type;
        if (type.size() < std::char_traits<char>::length(kWorksheetType) ||
            type.substr(type.size() - std::char_traits<char>::length(kWorksheetType)) != kWorksheetType) {
            READER_DEBUG("Sheet {} is not a worksheet ({}), kept as is", info.name, rel->type);
            continue;
        }

        parseWorksheet(part, worksheet, context);
        parseTables(part, worksheet);
    }

    for (const auto& dn : workbook_parser.getDefinedNames()) {
        if (dn.local_sheet_id && (*dn.local_sheet_id < 0 ||
                                  static_cast<size_t>(*dn.local_sheet_id) >= workbook->sheetCount())) {
            READER_WARN("Defined name {} has invalid localSheetId {}", dn.name, *dn.local_sheet_id);
            continue;
        }
        if (!core::DefinedNameManager::isValidName(dn.name)) {
            READER_WARN("Defined name {} is not valid, ignored", dn.name);
            continue;
        }
        workbook->defineName(dn.name, dn.formula, dn.local_sheet_id);
        if (dn.hidden) {
            if (auto* stored = workbook->definedNames().find(dn.name, dn.local_sheet_id)) {
                stored->hidden = true;
            }
        }
    }

    READER_INFO("Loaded {}: {} sheets, {} defined names", filename_, workbook->sheetCount(),
                workbook->definedNames().size());
    return workbook;
}

void XLSXReader::parseSharedStrings(const std::string& path) {
    if (!hasPart(path)) {
        READER_WARN("Shared strings part {} is missing", path);
        return;
    }
    SharedStringsParser parser;
    parsePart(parser, path);
    shared_strings_ = parser.takeStrings();
    READER_DEBUG("Loaded {} shared strings", shared_strings_.size());
}

void XLSXReader::parseStyles(const std::string& path, core::PackageInfo& package) {
    if (!hasPart(path)) {
        READER_WARN("Styles part {} is missing", path);
        package.styles_part.clear();
        return;
    }
    StylesParser parser;
    parsePart(parser, path);
    package.date_styles = parser.getDateStyles();
    package.time_only_styles = parser.getTimeOnlyStyles();
    package.cell_xf_count = parser.getCellXfCount();
}

void XLSXReader::parseWorksheet(const std::string& path, core::Worksheet& worksheet, const CellContext& context) {
    const std::string content = readPart(path);

    // sheetData 前后的原始文本，写回时拼接
    const size_t start = content.find("<sheetData");
    if (start == std::string::npos) {
        XLSXEXTRACT_THROW(core::FormatException, fmt::format("Worksheet part {} has no sheetData", path));
    }
    const size_t tag_end = content.find('>', start);
    if (tag_end == std::string::npos) {
        throw core::XMLException("Unterminated sheetData element", path, __FILE__, __LINE__);
    }
    size_t end = std::string::npos;
    if (content[tag_end - 1] == '/') {
        end = tag_end + 1;
    } else {
        const size_t close = content.find("</sheetData>", tag_end);
        if (close == std::string::npos) {
            throw core::XMLException("Unterminated sheetData element", path, __FILE__, __LINE__);
        }
        end = close + std::char_traits<char>::length("</sheetData>");
    }
    worksheet.setRawXml(content.substr(0, start), content.substr(end));

    WorksheetParser parser(worksheet, context);
    if (!parser.parseXML(content)) {
        throw core::XMLException(fmt::format("Malformed worksheet {}: {}", path, parser.getErrorMessage()),
                                 path, __FILE__, __LINE__);
    }
    READER_DEBUG("Worksheet {}: {} cells", worksheet.getName(), parser.getCellCount());
}

void XLSXReader::parseTables(const std::string& sheet_path, core::Worksheet& worksheet) {
    const std::string rels_path = RelationshipsParser::relsPathFor(sheet_path);
    if (!hasPart(rels_path)) {
        return;
    }
    RelationshipsParser sheet_rels;
    parsePart(sheet_rels, rels_path);

    const std::string sheet_dir = RelationshipsParser::directoryOf(sheet_path);
    for (const auto* rel : sheet_rels.findByType(kTableType)) {
        const std::string table_path = RelationshipsParser::resolveTarget(sheet_dir, rel->target);
        TableParser parser;
        parsePart(parser, table_path);
        if (!parser.hasTable()) {
            XLSXEXTRACT_THROW(core::FormatException, fmt::format("Table part {} has no table element", table_path));
        }
        core::Table table = parser.getTable();
        table.part_path = table_path;
        try {
            worksheet.addTable(std::move(table));
        } catch (const core::ParameterException& e) {
            XLSXEXTRACT_THROW(core::FormatException, fmt::format("Invalid table in {}: {}", table_path, e.what()));
        }
    }
}

}} // namespace xlsxextract::reader
