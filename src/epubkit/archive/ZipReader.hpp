#pragma once

#include "epubkit/archive/ZipError.hpp"
#include "epubkit/core/Path.hpp"
#include <cstdint>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace epubkit {
namespace archive {

/**
 * @brief 基于minizip-ng的只读ZIP访问
 *
 * 特性：
 * - 可以从文件路径或内存缓冲区打开
 * - 条目按中央目录顺序缓存，listFiles() 保持归档内顺序
 * - 条目名区分大小写，同名条目取第一个
 * - 线程安全（内部互斥）
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    // ========== 构造/析构 ==========

    /**
     * @brief 读取宿主文件系统上的ZIP文件
     */
    explicit ZipReader(const core::Path& path);

    /**
     * @brief 读取内存中的ZIP数据（ZipReader接管缓冲区）
     */
    explicit ZipReader(std::vector<uint8_t> buffer);

    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;

    // ========== 打开/关闭 ==========

    /**
     * @brief 打开归档并读取中央目录
     * @return FileNotFound 文件不存在；BadFormat 不是ZIP；Ok 成功
     */
    ZipError open();

    /**
     * @brief 关闭归档，可重复调用
     */
    void close();

    bool isOpen() const { return is_open_; }

    // ========== 条目查询 ==========

    /**
     * @brief 所有条目名（中央目录顺序）
     */
    std::vector<std::string> listFiles() const;

    std::vector<EntryInfo> listEntriesInfo() const;

    /**
     * @brief 精确匹配条目名
     */
    ZipError fileExists(std::string_view internal_path) const;

    // ========== 读取操作 ==========

    ZipError extractFile(std::string_view internal_path, std::string& content) const;
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data) const;

    /**
     * @brief 分块读取条目
     * @param callback 数据回调(data, size)，返回false时提前结束（仍视为成功）
     */
    ZipError streamFile(std::string_view internal_path,
                        const std::function<bool(const uint8_t*, size_t)>& callback,
                        size_t buffer_size = 65536) const;

    /**
     * @brief 用于日志的来源描述（文件路径或 "<memory>"）
     */
    const std::string& getName() const { return name_; }

private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    std::vector<uint8_t> buffer_;  // 内存模式下的数据，生命周期与句柄一致
    bool from_memory_ = false;
    std::string name_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::vector<EntryInfo> entries_;

    void cleanup();
    void buildEntryCache();
    const EntryInfo* findEntry(std::string_view internal_path) const;
    ZipError gotoEntry(std::string_view internal_path) const;
    ZipError readCurrentEntry(std::string_view internal_path,
                              const std::function<bool(const uint8_t*, size_t)>& sink,
                              size_t buffer_size) const;
};

}} // namespace epubkit::archive
