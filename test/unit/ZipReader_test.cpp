#include "EpubFixture.hpp"
#include "epubkit/archive/ZipReader.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

namespace epubkit {
namespace archive {

class ZipReaderTest : public test::EpubTestBase {
protected:
    std::string writeArchive() {
        test::EpubBuilder builder;
        builder.add("first.txt", "hello")
               .add("dir/second.bin", std::string("\x00\x01\x02\x03", 4))
               .add("Dir/Case.txt", "upper")
               .add("dup.txt", "one")
               .add("dup.txt", "two")
               .add("empty.txt", "");
        return writeBook(builder, "archive.zip");
    }
};

// 测试1: 打开并按中央目录顺序列出条目
TEST_F(ZipReaderTest, ListFilesInArchiveOrder) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);
    EXPECT_TRUE(reader.isOpen());

    std::vector<std::string> expected = {"first.txt", "dir/second.bin", "Dir/Case.txt", "dup.txt", "dup.txt", "empty.txt"};
    EXPECT_EQ(reader.listFiles(), expected);

    auto infos = reader.listEntriesInfo();
    ASSERT_EQ(infos.size(), 6u);
    EXPECT_EQ(infos[0].uncompressed_size, 5u);
    EXPECT_FALSE(infos[0].is_directory);
}

// 测试2: 提取文本和二进制条目
TEST_F(ZipReaderTest, ExtractFile) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    std::string text;
    ASSERT_EQ(reader.extractFile("first.txt", text), ZipError::Ok);
    EXPECT_EQ(text, "hello");

    std::vector<uint8_t> bytes;
    ASSERT_EQ(reader.extractFile("dir/second.bin", bytes), ZipError::Ok);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0, 1, 2, 3}));

    std::string empty = "not empty";
    ASSERT_EQ(reader.extractFile("empty.txt", empty), ZipError::Ok);
    EXPECT_TRUE(empty.empty());
}

// 测试3: 条目名区分大小写
TEST_F(ZipReaderTest, CaseSensitiveLookup) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    EXPECT_EQ(reader.fileExists("Dir/Case.txt"), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("dir/case.txt"), ZipError::FileNotFound);

    std::string content;
    EXPECT_EQ(reader.extractFile("DIR/CASE.TXT", content), ZipError::FileNotFound);
}

// 测试4: 同名条目取第一个
TEST_F(ZipReaderTest, DuplicateEntryFirstWins) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    std::string content;
    ASSERT_EQ(reader.extractFile("dup.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "one");
}

// 测试5: 分块流式读取和提前结束
TEST_F(ZipReaderTest, StreamFile) {
    test::EpubBuilder builder;
    builder.add("big.txt", std::string(10000, 'z'));
    ZipReader reader{core::Path(writeBook(builder, "big.zip"))};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    size_t total = 0;
    int chunks = 0;
    ASSERT_EQ(reader.streamFile("big.txt", [&](const uint8_t*, size_t size) {
        total += size;
        ++chunks;
        return true;
    }, 1024), ZipError::Ok);
    EXPECT_EQ(total, 10000u);
    EXPECT_GE(chunks, 10);

    chunks = 0;
    ASSERT_EQ(reader.streamFile("big.txt", [&](const uint8_t*, size_t) {
        ++chunks;
        return false;
    }, 1024), ZipError::Ok);
    EXPECT_EQ(chunks, 1);

    EXPECT_EQ(reader.streamFile("missing.txt", [](const uint8_t*, size_t) { return true; }), ZipError::FileNotFound);
    EXPECT_EQ(reader.streamFile("big.txt", nullptr), ZipError::InvalidParameter);
}

// 测试6: 打开失败的情况
TEST_F(ZipReaderTest, OpenFailures) {
    ZipReader missing{core::Path(pathFor("does-not-exist.zip"))};
    EXPECT_EQ(missing.open(), ZipError::FileNotFound);
    EXPECT_FALSE(missing.isOpen());

    {
        std::ofstream out(pathFor("garbage.zip"), std::ios::binary);
        out << "this is definitely not a zip archive";
    }
    ZipReader garbage{core::Path(pathFor("garbage.zip"))};
    EXPECT_NE(garbage.open(), ZipError::Ok);
    EXPECT_FALSE(garbage.isOpen());
}

// 测试7: 关闭后操作返回NotOpen
TEST_F(ZipReaderTest, OperationsAfterClose) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);
    reader.close();
    reader.close();

    EXPECT_FALSE(reader.isOpen());
    EXPECT_TRUE(reader.listFiles().empty());
    std::string content;
    EXPECT_EQ(reader.extractFile("first.txt", content), ZipError::NotOpen);
    EXPECT_EQ(reader.fileExists("first.txt"), ZipError::NotOpen);
}

// 测试8: 从内存缓冲区打开
TEST_F(ZipReaderTest, OpenFromMemory) {
    test::EpubBuilder builder;
    builder.add("a.txt", "alpha").add("b.txt", "beta");
    auto buffer = builder.toBuffer(pathFor("mem.zip"));
    ASSERT_FALSE(buffer.empty());

    ZipReader reader(std::move(buffer));
    ASSERT_EQ(reader.open(), ZipError::Ok);
    EXPECT_EQ(reader.getName(), "<memory>");

    std::string content;
    ASSERT_EQ(reader.extractFile("b.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "beta");

    ZipReader empty{std::vector<uint8_t>()};
    EXPECT_EQ(empty.open(), ZipError::BadFormat);
}

// 测试9: 移动构造转移句柄
TEST_F(ZipReaderTest, MoveConstruction) {
    ZipReader reader{core::Path(writeArchive())};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    ZipReader moved(std::move(reader));
    EXPECT_TRUE(moved.isOpen());
    std::string content;
    EXPECT_EQ(moved.extractFile("first.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "hello");
}

}} // namespace epubkit::archive
