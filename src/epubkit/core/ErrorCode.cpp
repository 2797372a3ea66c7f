#include "epubkit/core/ErrorCode.hpp"

namespace epubkit {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "Success";

        case ErrorCode::InvalidArgument:    return "Invalid argument";
        case ErrorCode::OutOfMemory:        return "Out of memory";
        case ErrorCode::InternalError:      return "Internal error";
        case ErrorCode::OutOfRange:         return "Index out of range";
        case ErrorCode::Cancelled:          return "Operation cancelled";

        case ErrorCode::FileNotFound:       return "File not found";
        case ErrorCode::FileAccessDenied:   return "File access denied";
        case ErrorCode::FileCorrupted:      return "File corrupted";
        case ErrorCode::FileReadError:      return "File read error";

        case ErrorCode::UnsupportedContent: return "Unsupported content type";
        case ErrorCode::ContentTooLarge:    return "Content exceeds maximum length";
        case ErrorCode::ArchiveClosed:      return "Archive already closed";

        case ErrorCode::ZipError:           return "ZIP error";
        case ErrorCode::XmlParseError:      return "XML parse error";
        case ErrorCode::XmlMissingElement:  return "Missing XML element";
    }
    return "Unknown error";
}

const char* toName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "Ok";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::OutOfMemory:        return "OutOfMemory";
        case ErrorCode::InternalError:      return "InternalError";
        case ErrorCode::OutOfRange:         return "OutOfRange";
        case ErrorCode::Cancelled:          return "Cancelled";
        case ErrorCode::FileNotFound:       return "FileNotFound";
        case ErrorCode::FileAccessDenied:   return "FileAccessDenied";
        case ErrorCode::FileCorrupted:      return "FileCorrupted";
        case ErrorCode::FileReadError:      return "FileReadError";
        case ErrorCode::UnsupportedContent: return "UnsupportedContent";
        case ErrorCode::ContentTooLarge:    return "ContentTooLarge";
        case ErrorCode::ArchiveClosed:      return "ArchiveClosed";
        case ErrorCode::ZipError:           return "ZipError";
        case ErrorCode::XmlParseError:      return "XmlParseError";
        case ErrorCode::XmlMissingElement:  return "XmlMissingElement";
    }
    return "Unknown";
}

}} // namespace epubkit::core
