#include "xlsxextract/archive/ZipReader.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <filesystem>

namespace xlsxextract {
namespace archive {

ZipReader::ZipReader(const std::string& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      filepath_(std::move(other.filepath_)),
      is_open_(other.is_open_),
      entries_(std::move(other.entries_)),
      entry_index_(std::move(other.entry_index_)) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        filepath_ = std::move(other.filepath_);
        is_open_ = other.is_open_;
        entries_ = std::move(other.entries_);
        entry_index_ = std::move(other.entry_index_);

        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

ZipError ZipReader::open() {
    cleanup();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath_, ec)) {
        ARCHIVE_ERROR("Zip file not found: {}", filepath_);
        return ZipError::FileNotFound;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_);

    buildEntryCache();
    return ZipError::Ok;
}

void ZipReader::close() {
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!entry.is_directory) {
            files.push_back(entry.path);
        }
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_index_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path(internal_path);
    auto it = entry_index_.find(path);
    if (it == entry_index_.end()) {
        ARCHIVE_DEBUG("File {} not found in zip archive", path);
        return ZipError::FileNotFound;
    }
    const EntryInfo& info = entries_[it->second];
    if (info.uncompressed_size > static_cast<uint64_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path, info.uncompressed_size);
        return ZipError::TooLarge;
    }

    if (mz_zip_reader_locate_entry(unzip_handle_, path.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", path);
        return ZipError::IoFail;
    }

    content.assign(static_cast<size_t>(info.uncompressed_size), '\0');
    int32_t total = 0;
    const int32_t expected = static_cast<int32_t>(info.uncompressed_size);
    while (total < expected) {
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, &content[total], expected - total);
        if (read <= 0) {
            break;
        }
        total += read;
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != expected) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes", path, expected, total);
        return ZipError::IoFail;
    }

    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", path, content.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.crc32 = file_info->crc;
                info.compression_method = file_info->compression_method;
                info.modified_date = file_info->modified_date;
                info.is_directory = (info.path.back() == '/');

                // 重复条目只保留第一个，与 locate_entry 的结果一致
                if (entry_index_.emplace(info.path, entries_.size()).second) {
                    entries_.push_back(std::move(info));
                } else {
                    ARCHIVE_WARN("Duplicate zip entry {} ignored", info.path);
                }
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entries_.size());
}

}} // namespace xlsxextract::archive
