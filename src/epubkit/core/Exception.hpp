/**
 * @file Exception.hpp
 * @brief EpubKit异常类定义（用户层）
 */

#ifndef EPUBKIT_EXCEPTION_HPP
#define EPUBKIT_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include "epubkit/core/ErrorCode.hpp"

namespace epubkit {
namespace core {

/**
 * @brief EpubKit基础异常类
 */
class EpubKitException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    EpubKitException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toName(error_code_); }

    /**
     * @brief 获取详细错误信息，包含错误码和源码位置
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件相关异常（归档打不开、包内条目缺失或读取失败）
 */
class FileException : public EpubKitException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public EpubKitException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public EpubKitException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public EpubKitException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 ErrorCode code = ErrorCode::XmlParseError,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }

private:
    std::string xml_path_;
};

/**
 * @brief 取消或超时
 */
class CancelledException : public EpubKitException {
public:
    explicit CancelledException(const std::string& message,
                                const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace epubkit

#endif // EPUBKIT_EXCEPTION_HPP
