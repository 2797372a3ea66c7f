#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace epubkit {
namespace core {

// 通用常量集中定义
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 容器描述文件的固定位置
    static constexpr std::string_view kContainerPath = "META-INF/container.xml";

    // EPUB 2 导航控制文件（NCX）的媒体类型
    static constexpr std::string_view kNcxMediaType = "application/x-dtbncx+xml";

    // 章节筛选：媒体类型包含该子串才视为正文
    static constexpr std::string_view kHtmlMediaTypeMarker = "html";

    // 封面图片媒体类型前缀
    static constexpr std::string_view kImageMediaTypePrefix = "image/";

    // EPUB 3 manifest item 的属性标记
    static constexpr std::string_view kNavProperty = "nav";
    static constexpr std::string_view kCoverImageProperty = "cover-image";

    // 封面候选manifest id，按顺序尝试
    static constexpr std::array<std::string_view, 3> kCoverCandidateIds{{"cover", "cover-image", "cover-img"}};

    // 媒体类型不是image/*时，按扩展名（不区分大小写）识别封面图片
    static constexpr std::array<std::string_view, 4> kCoverImageExtensions{{".jpg", ".jpeg", ".png", ".gif"}};

    // 批量提取章节时每隔多少个spine条目检查一次取消信号
    static constexpr size_t kCancellationStride = 5;
};

}} // namespace epubkit::core
