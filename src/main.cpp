#include "xlsxextract/config/ConfigRunner.hpp"
#include "xlsxextract/core/Exception.hpp"
#include "xlsxextract/reader/XLSXReader.hpp"
#include "xlsxextract/utils/Logger.hpp"
#include "xlsxextract/writer/XLSXWriter.hpp"
#include <fmt/format.h>
#include <getopt.h>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage(std::FILE* out) {
    fmt::print(out, "Usage: xlsx-extract [options] target.xlsx [output.xlsx]\n");
    fmt::print(out, "\t-u, --update             overwrite target.xlsx instead of naming an output file\n");
    fmt::print(out, "\t-a, --allow-failures     write the output even if some actions failed\n");
    fmt::print(out, "\t-c, --config-sheet NAME  configuration sheet name (default \"Config\")\n");
    fmt::print(out, "\t-d, --source-directory   directory where source files are found (default: cwd)\n");
    fmt::print(out, "\t-s, --source-file FILE   default source file, overridable by a `file` block\n");
    fmt::print(out, "\t-v, --verbose            debug logging\n");
    fmt::print(out, "\t-l, --log-file PATH      additionally log to PATH\n");
    fmt::print(out, "\t-h, --help               show this help message\n");
}

struct Options {
    bool update = false;
    bool allow_failures = false;
    bool verbose = false;
    std::string config_sheet = "Config";
    std::string source_directory;
    std::optional<std::string> source_file;
    std::string log_file;
    std::string target;
    std::string output;
};

int run(const Options& options) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!fs::is_regular_file(options.target, ec)) {
        fmt::print(stderr, "Target file {} not found\n", options.target);
        return kExitFailure;
    }
    if (!fs::is_directory(options.source_directory, ec)) {
        fmt::print(stderr, "Source directory {} not found\n", options.source_directory);
        return kExitFailure;
    }
    if (options.source_file) {
        fs::path source(*options.source_file);
        if (source.is_relative()) {
            source = fs::path(options.source_directory) / source;
        }
        if (!fs::is_regular_file(source, ec)) {
            fmt::print(stderr, "Source file {} not found\n", source.string());
            return kExitFailure;
        }
    }

    auto workbook = xlsxextract::reader::XLSXReader::load(options.target);

    auto history = xlsxextract::config::ConfigRunner::run(*workbook, options.source_directory,
                                                          options.source_file, options.config_sheet);
    if (!history) {
        fmt::print(stderr, "Configuration sheet {} not found in {}\n", options.config_sheet, options.target);
        return kExitFailure;
    }

    bool all_ok = true;
    for (const auto& action : *history) {
        fmt::print("[{}] {}: {}\n", action.success ? "OK" : "FAILED", action.name, action.message);
        all_ok = all_ok && action.success;
    }

    const std::string& output = options.update ? options.target : options.output;
    if (all_ok || options.allow_failures) {
        xlsxextract::writer::XLSXWriter::save(*workbook, output);
        fmt::print("Wrote {}\n", output);
    } else {
        fmt::print(stderr, "Some actions failed, {} not written\n", output);
    }
    return all_ok ? kExitOk : kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    static const struct option long_options[] = {
        {"update", no_argument, nullptr, 'u'},
        {"allow-failures", no_argument, nullptr, 'a'},
        {"config-sheet", required_argument, nullptr, 'c'},
        {"source-directory", required_argument, nullptr, 'd'},
        {"source-file", required_argument, nullptr, 's'},
        {"verbose", no_argument, nullptr, 'v'},
        {"log-file", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Options options;
    int ch;
    while ((ch = getopt_long(argc, argv, "uac:d:s:vl:h", long_options, nullptr)) != -1) {
        switch (ch) {
            case 'u':
                options.update = true;
                break;
            case 'a':
                options.allow_failures = true;
                break;
            case 'c':
                options.config_sheet = optarg;
                break;
            case 'd':
                options.source_directory = optarg;
                break;
            case 's':
                options.source_file = std::string(optarg);
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'l':
                options.log_file = optarg;
                break;
            case 'h':
                printUsage(stdout);
                return kExitOk;
            default:
                printUsage(stderr);
                return kExitUsage;
        }
    }

    const int positional = argc - optind;
    if (positional < 1 || positional > 2) {
        printUsage(stderr);
        return kExitUsage;
    }
    options.target = argv[optind];
    if (positional == 2) {
        options.output = argv[optind + 1];
    }
    // 必须且只能指定一种输出方式
    if (options.update == (positional == 2)) {
        printUsage(stderr);
        return kExitUsage;
    }
    if (options.source_directory.empty()) {
        std::error_code ec;
        options.source_directory = std::filesystem::current_path(ec).string();
        if (ec) {
            fmt::print(stderr, "Cannot determine the current directory: {}\n", ec.message());
            return kExitFailure;
        }
    }

    auto& logger = xlsxextract::Logger::getInstance();
    logger.initialize(options.log_file,
                      options.verbose ? xlsxextract::Logger::Level::DEBUG : xlsxextract::Logger::Level::WARN,
                      true);

    int status = kExitFailure;
    try {
        status = run(options);
    } catch (const xlsxextract::core::XlsxExtractException& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        XLSXEXTRACT_LOG_ERROR("Aborted: {}", e.getDetailedMessage());
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        XLSXEXTRACT_LOG_ERROR("Aborted: {}", e.what());
    }

    logger.shutdown();
    return status;
}
