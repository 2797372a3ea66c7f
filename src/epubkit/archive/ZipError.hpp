#pragma once

namespace epubkit {
namespace archive {

// ZIP读取错误码
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // 不是合法的ZIP文件
    TooLarge,             // 条目超出可读取的大小
    FileNotFound,         // 条目或归档文件不存在
    InvalidParameter,     // 无效参数
    InternalError         // 内部错误
};

constexpr const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "ok";
        case ZipError::NotOpen:          return "archive not open";
        case ZipError::IoFail:           return "i/o failure";
        case ZipError::BadFormat:        return "bad zip format";
        case ZipError::TooLarge:         return "entry too large";
        case ZipError::FileNotFound:     return "not found";
        case ZipError::InvalidParameter: return "invalid parameter";
        case ZipError::InternalError:    return "internal error";
    }
    return "unknown";
}

}} // namespace epubkit::archive
