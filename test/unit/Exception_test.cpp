#include "EpubFixture.hpp"
#include "epubkit/EpubKit.hpp"
#include "epubkit/core/ExceptionBridge.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace epubkit {
namespace core {

using test::EpubBuilder;

class ExceptionTest : public test::EpubTestBase {};

// 测试1: 错误码映射到异常类型
TEST_F(ExceptionTest, BridgeMapsErrorCodes) {
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::FileNotFound, "missing", "a.opf")), FileException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::ArchiveClosed, "closed")), FileException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::OutOfRange, "index")), ParameterException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::XmlParseError, "bad xml")), XMLException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::XmlMissingElement, "no rootfile")), XMLException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::Cancelled, "operation cancelled")), CancelledException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::ContentTooLarge, "big")), OperationException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::UnsupportedContent, "png")), OperationException);
    EXPECT_THROW(ExceptionBridge::throwFromError(makeError(ErrorCode::InternalError, "oops")), EpubKitException);
}

// 测试2: 异常保留错误码和上下文
TEST_F(ExceptionTest, ExceptionCarriesCodeAndContext) {
    try {
        ExceptionBridge::throwFromError(makeError(ErrorCode::FileNotFound, "file not found in archive", "OEBPS/x.html"));
        FAIL() << "expected FileException";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileNotFound);
        EXPECT_EQ(e.getFilename(), "OEBPS/x.html");
        EXPECT_EQ(e.getErrorCodeString(), "FileNotFound");
        EXPECT_NE(std::string(e.what()).find("OEBPS/x.html"), std::string::npos);
        EXPECT_NE(e.getDetailedMessage().find("[FileNotFound]"), std::string::npos);
    }
}

// 测试3: Result::valueOrThrow
TEST_F(ExceptionTest, ValueOrThrow) {
    Result<int> ok(42);
    EXPECT_EQ(ok.valueOrThrow(), 42);

    Result<int> failed(makeError(ErrorCode::Cancelled, "deadline exceeded"));
    EXPECT_THROW(failed.valueOrThrow(), CancelledException);
    EXPECT_EQ(failed.valueOr(-1), -1);
    EXPECT_EQ(ok.valueOr(-1), 42);

    VoidResult void_failed(makeError(ErrorCode::OutOfRange, "index 9"));
    EXPECT_THROW(void_failed.valueOrThrow(), ParameterException);
    EXPECT_NO_THROW(success().valueOrThrow());
}

// 测试4: wrapCall 把异常转回Result
TEST_F(ExceptionTest, WrapCall) {
    auto ok = ExceptionBridge::wrapCall([] { return 7; });
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(*ok, 7);

    auto typed = ExceptionBridge::wrapCall([]() -> int {
        throw XMLException("broken", "toc.ncx");
    });
    ASSERT_TRUE(typed.hasError());
    EXPECT_EQ(typed.error().code, ErrorCode::XmlParseError);

    auto generic = ExceptionBridge::wrapCall([]() -> int {
        throw std::runtime_error("plain");
    });
    ASSERT_TRUE(generic.hasError());
    EXPECT_EQ(generic.error().code, ErrorCode::InternalError);
    EXPECT_EQ(generic.error().message, "plain");
}

// 测试5: 用户层接口抛出异常
TEST_F(ExceptionTest, OpenEpubThrows) {
    EXPECT_THROW(epubkit::openEpub(pathFor("missing.epub")), FileException);

    EpubBuilder broken;
    broken.add("META-INF/container.xml", "<container>");
    EXPECT_THROW(epubkit::openEpub(writeBook(broken, "broken.epub")), XMLException);

    EpubBuilder no_rootfile;
    no_rootfile.add("META-INF/container.xml", "<container><rootfiles/></container>");
    EXPECT_THROW(epubkit::openEpub(writeBook(no_rootfile, "no_rootfile.epub")), XMLException);

    auto book = epubkit::openEpub(writeBook(EpubBuilder::sampleBook()));
    ASSERT_NE(book, nullptr);
    EXPECT_EQ(book->getTitle(), "Sample Book");

    EXPECT_THROW(book->getChapterContent(99).valueOrThrow(), ParameterException);
}

// 测试6: 所有异常都可以按基类捕获
TEST_F(ExceptionTest, CatchByBaseClass) {
    try {
        epubkit::openEpub(std::vector<uint8_t>{'n', 'o', 'p', 'e'});
        FAIL() << "expected exception";
    } catch (const EpubKitException& e) {
        EXPECT_NE(e.getErrorCode(), ErrorCode::Ok);
    }
}

// 测试7: 错误码文本
TEST_F(ExceptionTest, ErrorCodeNames) {
    EXPECT_STREQ(toName(ErrorCode::ContentTooLarge), "ContentTooLarge");
    EXPECT_STREQ(toString(ErrorCode::Cancelled), "Operation cancelled");

    Error error(ErrorCode::XmlParseError, "bad", "toc.ncx");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.fullMessage(), "bad (Context: toc.ncx)");
    EXPECT_FALSE(Error().isError());
}

// 测试8: 各异常类型保留附加信息和源码位置
TEST_F(ExceptionTest, ExceptionDetails) {
    ParameterException param("index out of range", "index", ErrorCode::OutOfRange);
    EXPECT_EQ(param.getParameterName(), "index");
    EXPECT_NE(std::string(param.what()).find("(parameter: index)"), std::string::npos);

    OperationException op("too big", "getChapterContent", ErrorCode::ContentTooLarge);
    EXPECT_EQ(op.getOperation(), "getChapterContent");
    EXPECT_EQ(op.getErrorCode(), ErrorCode::ContentTooLarge);

    XMLException xml("broken", "OEBPS/toc.ncx");
    EXPECT_EQ(xml.getXMLPath(), "OEBPS/toc.ncx");

    EpubKitException located("located", ErrorCode::InternalError, "Epub.cpp", 42);
    EXPECT_STREQ(located.getFile(), "Epub.cpp");
    EXPECT_EQ(located.getLine(), 42);
    EXPECT_NE(located.getDetailedMessage().find("(at Epub.cpp:42)"), std::string::npos);

    EpubKitException plain("plain");
    EXPECT_EQ(plain.getFile(), nullptr);
    EXPECT_EQ(plain.getDetailedMessage(), "[InternalError] plain");
}

}} // namespace epubkit::core
