#pragma once

#include "xlsxextract/archive/ZipError.hpp"
#include <string>
#include <string_view>
#include <unordered_set>

namespace xlsxextract {
namespace archive {

/**
 * @brief 写 xlsx 压缩包
 *
 * 已存在的目标文件会被覆盖。同一路径只写一次，重复写入被忽略。
 */
class ZipWriter {
public:
    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };

    explicit ZipWriter(const std::string& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipWriter(ZipWriter&& other) noexcept;
    ZipWriter& operator=(ZipWriter&& other) noexcept;

    ZipError open();

    /**
     * 写出中央目录并关闭
     * @return 中央目录写入失败时返回 IoFail
     */
    ZipError close();

    bool isOpen() const { return is_open_; }

    /**
     * 添加一个条目
     * @param internal_path 包内路径
     * @param content 未压缩内容
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);

private:
    void* zip_handle_ = nullptr;
    std::string filepath_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;
    Stats stats_;

    void cleanup();
    void initializeFileInfo(void* file_info, const std::string& path, size_t size) const;
};

}} // namespace xlsxextract::archive
