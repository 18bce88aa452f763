#include "xlsxextract/archive/ZipWriter.hpp"
#include "xlsxextract/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>
#include <filesystem>

namespace xlsxextract {
namespace archive {

ZipWriter::ZipWriter(const std::string& path)
    : filepath_(path) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipWriter::ZipWriter(ZipWriter&& other) noexcept
    : zip_handle_(other.zip_handle_),
      filepath_(std::move(other.filepath_)),
      is_open_(other.is_open_),
      compression_level_(other.compression_level_),
      written_paths_(std::move(other.written_paths_)),
      stats_(other.stats_) {
    other.zip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipWriter& ZipWriter::operator=(ZipWriter&& other) noexcept {
    if (this != &other) {
        cleanup();
        zip_handle_ = other.zip_handle_;
        filepath_ = std::move(other.filepath_);
        is_open_ = other.is_open_;
        compression_level_ = other.compression_level_;
        written_paths_ = std::move(other.written_paths_);
        stats_ = other.stats_;

        other.zip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

ZipError ZipWriter::open() {
    cleanup();

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return ZipError::InternalError;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    std::error_code ec;
    if (std::filesystem::exists(filepath_, ec)) {
        std::filesystem::remove(filepath_, ec);
        if (ec) {
            ARCHIVE_ERROR("Cannot replace existing file {}: {}", filepath_, ec.message());
            mz_zip_writer_delete(&zip_handle_);
            zip_handle_ = nullptr;
            return ZipError::IoFail;
        }
        ARCHIVE_DEBUG("Removed existing zip file: {}", filepath_);
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filepath_, result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return ZipError::IoFail;
    }

    // 不写 Data Descriptor，兼容旧版 Excel
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for writing: {}", filepath_);
    return ZipError::Ok;
}

ZipError ZipWriter::close() {
    if (!is_open_ || !zip_handle_) {
        return ZipError::Ok;
    }

    ZipError status = ZipError::Ok;
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize zip file: {}, error code: {}", filepath_, result);
        status = ZipError::IoFail;
    } else {
        ARCHIVE_DEBUG("Zip file finalized: {}, {} entries, {} bytes", filepath_,
                      stats_.entries_written, stats_.bytes_written);
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;
    written_paths_.clear();
    return status;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }

    std::string path(internal_path);
    if (written_paths_.count(path)) {
        ARCHIVE_WARN("File {} already exists in zip, skipping duplicate entry", path);
        return ZipError::Ok;
    }
    if (content.size() > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path, content.size());
        return ZipError::TooLarge;
    }

    mz_zip_file file_info = {};
    initializeFileInfo(&file_info, path, content.size());

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    if (!content.empty()) {
        int32_t written = mz_zip_writer_entry_write(zip_handle_, content.data(),
                                                    static_cast<int32_t>(content.size()));
        if (written != static_cast<int32_t>(content.size())) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::CompressionFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(path);
    stats_.entries_written++;
    stats_.bytes_written += content.size();
    return ZipError::Ok;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        if (close() != ZipError::Ok) {
            ARCHIVE_WARN("Zip file {} was not finalized cleanly", filepath_);
        }
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    is_open_ = false;
    written_paths_.clear();
}

void ZipWriter::initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size) const {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                           : MZ_COMPRESS_METHOD_DEFLATE;

    const std::time_t now = std::time(nullptr);
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;

#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif
}

}} // namespace xlsxextract::archive
