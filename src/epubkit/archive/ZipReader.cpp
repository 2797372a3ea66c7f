#include "epubkit/archive/ZipReader.hpp"
#include "epubkit/core/Constants.hpp"
#include "epubkit/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <limits>

namespace epubkit {
namespace archive {

// 构造/析构

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path), from_memory_(false), name_(path.string()) {
}

ZipReader::ZipReader(std::vector<uint8_t> buffer)
    : buffer_(std::move(buffer)), from_memory_(true), name_("<memory>") {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      filepath_(std::move(other.filepath_)),
      buffer_(std::move(other.buffer_)),
      from_memory_(other.from_memory_),
      name_(std::move(other.name_)),
      is_open_(other.is_open_),
      entries_(std::move(other.entries_)) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        filepath_ = std::move(other.filepath_);
        buffer_ = std::move(other.buffer_);
        from_memory_ = other.from_memory_;
        name_ = std::move(other.name_);
        is_open_ = other.is_open_;
        entries_ = std::move(other.entries_);

        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

// 打开/关闭

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();  // 清理之前的状态

    if (from_memory_) {
        if (buffer_.empty() || buffer_.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            ARCHIVE_ERROR("Invalid in-memory zip buffer, size: {}", buffer_.size());
            return ZipError::BadFormat;
        }
    } else if (!filepath_.isFile()) {
        ARCHIVE_ERROR("Zip file does not exist: {}", name_);
        return ZipError::FileNotFound;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = from_memory_
        ? mz_zip_reader_open_buffer(unzip_handle_, buffer_.data(),
                                    static_cast<int32_t>(buffer_.size()), 0)
        : mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip for reading: {}, error: {}", name_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return result == MZ_OPEN_ERROR ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive opened for reading: {}, {} entries", name_, entries_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_open_) {
        ARCHIVE_DEBUG("Closing zip archive: {}", name_);
    }
    cleanup();
}

// 条目查询

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    if (!is_open_) {
        return files;
    }

    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        files.push_back(entry.path);
    }
    return files;
}

std::vector<ZipReader::EntryInfo> ZipReader::listEntriesInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return {};
    }
    return entries_;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }
    return findEntry(internal_path) ? ZipError::Ok : ZipError::FileNotFound;
}

// 读取操作

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }

    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    const EntryInfo* entry = findEntry(internal_path);
    if (!entry) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }
    if (entry->uncompressed_size > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        ARCHIVE_ERROR("Entry {} too large to extract in memory: {} bytes", internal_path, entry->uncompressed_size);
        return ZipError::TooLarge;
    }

    ZipError result = gotoEntry(internal_path);
    if (result != ZipError::Ok) {
        return result;
    }

    std::vector<uint8_t> content;
    content.reserve(static_cast<size_t>(entry->uncompressed_size));
    result = readCurrentEntry(internal_path, [&content](const uint8_t* chunk, size_t size) {
        content.insert(content.end(), chunk, chunk + size);
        return true;
    }, core::Constants::kIOBufferSize);
    if (result != ZipError::Ok) {
        return result;
    }

    data.swap(content);
    EPUBKIT_LOG_ZIP_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

ZipError ZipReader::streamFile(std::string_view internal_path,
                               const std::function<bool(const uint8_t*, size_t)>& callback,
                               size_t buffer_size) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!callback || buffer_size == 0) {
        return ZipError::InvalidParameter;
    }
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    ZipError result = gotoEntry(internal_path);
    if (result != ZipError::Ok) {
        return result;
    }
    return readCurrentEntry(internal_path, callback, buffer_size);
}

// 内部辅助方法

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }

    is_open_ = false;
    entries_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        // 空归档
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
                EPUBKIT_LOG_ZIP_DEBUG("Entry: {} ({} bytes)", info.path, info.uncompressed_size);
                entries_.push_back(std::move(info));
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

const ZipReader::EntryInfo* ZipReader::findEntry(std::string_view internal_path) const {
    for (const auto& entry : entries_) {
        if (entry.path == internal_path) {
            return &entry;
        }
    }
    return nullptr;
}

ZipError ZipReader::gotoEntry(std::string_view internal_path) const {
    // 按中央目录顺序扫描，同名条目取第一个
    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return ZipError::FileNotFound;
    }

    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
            ARCHIVE_ERROR("Failed to read central directory entry while locating {}", internal_path);
            return ZipError::BadFormat;
        }
        if (info->filename && internal_path == info->filename) {
            return ZipError::Ok;
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    return ZipError::FileNotFound;
}

ZipError ZipReader::readCurrentEntry(std::string_view internal_path,
                                     const std::function<bool(const uint8_t*, size_t)>& sink,
                                     size_t buffer_size) const {
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    const size_t chunk_size = std::min<size_t>(buffer_size, static_cast<size_t>(std::numeric_limits<int32_t>::max()));
    std::vector<uint8_t> buffer(chunk_size);
    ZipError result = ZipError::Ok;

    while (true) {
        int32_t bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                                      static_cast<int32_t>(buffer.size()));
        if (bytes_read < 0) {
            ARCHIVE_ERROR("Failed to read entry {}, error: {}", internal_path, bytes_read);
            result = ZipError::IoFail;
            break;
        }
        if (bytes_read == 0) {
            break;  // 读取完成
        }
        if (!sink(buffer.data(), static_cast<size_t>(bytes_read))) {
            break;  // 调用方提前结束
        }
    }

    mz_zip_reader_entry_close(unzip_handle_);
    return result;
}

}} // namespace epubkit::archive
