/**
 * @file Exception.cpp
 * @brief EpubKit异常类实现
 */

#include "epubkit/core/Exception.hpp"
#include "epubkit/core/ExceptionBridge.hpp"
#include <fmt/format.h>

namespace epubkit {
namespace core {

EpubKitException::EpubKitException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string EpubKitException::getDetailedMessage() const {
    std::string result = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        result += fmt::format(" (at {}:{})", file_, line_);
    }

    return result;
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : EpubKitException(filename.empty() ? message : fmt::format("{} (file: {})", message, filename),
                       code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       ErrorCode code, const char* file, int line)
    : EpubKitException(parameter_name.empty() ? message
                                              : fmt::format("{} (parameter: {})", message, parameter_name),
                       code, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : EpubKitException(operation.empty() ? message
                                         : fmt::format("{} (operation: {})", message, operation),
                       code, file, line)
    , operation_(operation) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           ErrorCode code, const char* file, int line)
    : EpubKitException(message, code, file, line)
    , xml_path_(xml_path) {
}

CancelledException::CancelledException(const std::string& message, const char* file, int line)
    : EpubKitException(message, ErrorCode::Cancelled, file, line) {
}

void throwError(const Error& error) {
    ExceptionBridge::throwFromError(error);
}

}} // namespace epubkit::core
