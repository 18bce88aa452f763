#pragma once

#include "xlsxextract/archive/ZipError.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xlsxextract {
namespace archive {

/**
 * @brief 读取 xlsx 压缩包
 *
 * 打开时建立条目缓存，条目按压缩包内的顺序保存，回写时可保持原顺序。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    explicit ZipReader(const std::string& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;

    /**
     * 打开压缩包
     * @return 错误码，文件不存在时为 FileNotFound，格式错误时为 BadFormat
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    /**
     * 按压缩包内顺序列出条目路径（不含目录）
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;

    /**
     * 解压条目到字符串
     * @param internal_path 包内路径
     * @param content 输出内容
     * @return 错误码
     */
    ZipError extractFile(std::string_view internal_path, std::string& content) const;

    const std::string& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    std::string filepath_;
    bool is_open_ = false;

    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;

    void cleanup();
    void buildEntryCache();
};

}} // namespace xlsxextract::archive
