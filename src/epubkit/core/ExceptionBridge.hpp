/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接系统层Result/Expected和用户层Exception
 */

#pragma once

#include "epubkit/core/Expected.hpp"
#include "epubkit/core/ErrorCode.hpp"
#include "epubkit/core/Exception.hpp"
#include <type_traits>
#include <new>

namespace epubkit {
namespace core {

/**
 * @brief 异常转换层
 *
 * 系统层（解析、归档访问、章节提取）只返回 Result；
 * 用户层便捷接口（epubkit::openEpub 等）通过这里把错误转成异常。
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为值，失败时抛出
     * @throws EpubKitException 及其子类
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return std::move(result).value();
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
    }

    /**
     * @brief 捕获异常并转换为Result
     * @param func 可能抛出异常的函数
     */
    template<typename F>
    static auto wrapCall(F&& func) -> Result<std::remove_reference_t<decltype(func())>> {
        using ReturnType = std::remove_reference_t<decltype(func())>;
        try {
            return Result<ReturnType>(func());
        } catch (const EpubKitException& e) {
            return Result<ReturnType>(makeError(e.getErrorCode(), e.what()));
        } catch (const std::bad_alloc&) {
            return Result<ReturnType>(makeError(ErrorCode::OutOfMemory, "Memory allocation failed"));
        } catch (const std::exception& e) {
            return Result<ReturnType>(makeError(ErrorCode::InternalError, e.what()));
        }
    }

    /**
     * @brief 按错误码映射到异常类型并抛出
     */
    [[noreturn]] static void throwFromError(const Error& error) {
        switch (error.code) {
            case ErrorCode::FileNotFound:
            case ErrorCode::FileAccessDenied:
            case ErrorCode::FileCorrupted:
            case ErrorCode::FileReadError:
            case ErrorCode::ArchiveClosed:
                throw FileException(error.message, error.context, error.code);

            case ErrorCode::InvalidArgument:
            case ErrorCode::OutOfRange:
                throw ParameterException(error.fullMessage(), "", error.code);

            case ErrorCode::XmlParseError:
            case ErrorCode::XmlMissingElement:
                throw XMLException(error.fullMessage(), error.context, error.code);

            case ErrorCode::Cancelled:
                throw CancelledException(error.fullMessage());

            case ErrorCode::UnsupportedContent:
            case ErrorCode::ContentTooLarge:
            case ErrorCode::ZipError:
                throw OperationException(error.fullMessage(), "", error.code);

            default:
                throw EpubKitException(error.fullMessage(), error.code);
        }
    }
};

}} // namespace epubkit::core
