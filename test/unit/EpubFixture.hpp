#pragma once

#include "epubkit/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace epubkit {
namespace test {

/**
 * @brief 用minizip-ng写出测试用的ZIP/EPUB文件
 *
 * 条目按添加顺序写入，允许重名（用于验证"第一个匹配胜出"）。
 */
class EpubBuilder {
public:
    EpubBuilder& add(const std::string& name, const std::string& content) {
        entries_.emplace_back(name, content);
        return *this;
    }

    EpubBuilder& addContainer(const std::string& root_path) {
        return add("META-INF/container.xml", containerXml(root_path));
    }

    /**
     * @brief 写出到文件
     * @return 是否成功（失败时在调用处断言）
     */
    bool writeTo(const std::string& path) const {
        void* writer = mz_zip_writer_create();
        if (!writer) {
            return false;
        }
        mz_zip_writer_set_compress_method(writer, MZ_COMPRESS_METHOD_DEFLATE);

        if (mz_zip_writer_open_file(writer, path.c_str(), 0, 0) != MZ_OK) {
            mz_zip_writer_delete(&writer);
            return false;
        }

        bool ok = true;
        const time_t now = std::time(nullptr);
        for (const auto& entry : entries_) {
            mz_zip_file file_info = {};
            file_info.filename = entry.first.c_str();
            file_info.uncompressed_size = static_cast<int64_t>(entry.second.size());
            file_info.compression_method = MZ_COMPRESS_METHOD_DEFLATE;
            file_info.modified_date = now;
            file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;

            if (mz_zip_writer_entry_open(writer, &file_info) != MZ_OK) {
                ok = false;
                break;
            }
            if (!entry.second.empty()) {
                int32_t written = mz_zip_writer_entry_write(writer, entry.second.data(),
                                                            static_cast<int32_t>(entry.second.size()));
                if (written != static_cast<int32_t>(entry.second.size())) {
                    mz_zip_writer_entry_close(writer);
                    ok = false;
                    break;
                }
            }
            if (mz_zip_writer_entry_close(writer) != MZ_OK) {
                ok = false;
                break;
            }
        }

        if (mz_zip_writer_close(writer) != MZ_OK) {
            ok = false;
        }
        mz_zip_writer_delete(&writer);
        return ok;
    }

    /**
     * @brief 写出后读回为内存数据
     */
    std::vector<uint8_t> toBuffer(const std::string& scratch_path) const {
        if (!writeTo(scratch_path)) {
            return {};
        }
        std::ifstream in(scratch_path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static std::string containerXml(const std::string& root_path) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">\n"
               "  <rootfiles>\n"
               "    <rootfile full-path=\"" + root_path + "\" media-type=\"application/oebps-package+xml\"/>\n"
               "  </rootfiles>\n"
               "</container>\n";
    }

    /**
     * @brief 生成包文档
     * @param metadata <metadata> 内部的元素
     * @param manifest <manifest> 内部的 <item>
     * @param spine <spine> 内部的 <itemref>
     * @param toc_id spine 的 toc 属性，空表示不写
     */
    static std::string packageOpf(const std::string& metadata, const std::string& manifest,
                                  const std::string& spine, const std::string& toc_id = "") {
        std::string spine_open = toc_id.empty() ? "  <spine>\n" : "  <spine toc=\"" + toc_id + "\">\n";
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"2.0\" unique-identifier=\"bookid\">\n"
               "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:opf=\"http://www.idpf.org/2007/opf\">\n"
               + metadata +
               "  </metadata>\n"
               "  <manifest>\n"
               + manifest +
               "  </manifest>\n"
               + spine_open + spine +
               "  </spine>\n"
               "</package>\n";
    }

    static std::string item(const std::string& id, const std::string& href, const std::string& media_type,
                            const std::string& properties = "") {
        std::string result = "    <item id=\"" + id + "\" href=\"" + href + "\" media-type=\"" + media_type + "\"";
        if (!properties.empty()) {
            result += " properties=\"" + properties + "\"";
        }
        return result + "/>\n";
    }

    static std::string itemref(const std::string& idref) {
        return "    <itemref idref=\"" + idref + "\"/>\n";
    }

    static std::string navPoint(const std::string& id, int order, const std::string& label,
                                const std::string& src, const std::string& children = "") {
        return "    <navPoint id=\"" + id + "\" playOrder=\"" + std::to_string(order) + "\">\n"
               "      <navLabel><text>" + label + "</text></navLabel>\n"
               "      <content src=\"" + src + "\"/>\n"
               + children +
               "    </navPoint>\n";
    }

    static std::string ncx(const std::string& title, const std::string& nav_points) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
               "<ncx xmlns=\"http://www.daisy.org/z3986/2005/ncx/\" version=\"2005-1\">\n"
               "  <head><meta name=\"dtb:uid\" content=\"urn:uuid:1234\"/></head>\n"
               "  <docTitle><text>" + title + "</text></docTitle>\n"
               "  <navMap>\n"
               + nav_points +
               "  </navMap>\n"
               "</ncx>\n";
    }

    /**
     * @brief 指定字节数的最小XHTML文档
     */
    static std::string xhtml(size_t size, char fill = 'x') {
        const std::string head = "<html><body>";
        const std::string tail = "</body></html>";
        std::string body;
        if (size > head.size() + tail.size()) {
            body.assign(size - head.size() - tail.size(), fill);
        }
        return head + body + tail;
    }

    /**
     * @brief 标准样例书：OEBPS/content.opf，两个章节，NCX目录，JPEG封面
     */
    static EpubBuilder sampleBook() {
        EpubBuilder builder;
        builder.add("mimetype", "application/epub+zip");
        builder.addContainer("OEBPS/content.opf");
        builder.add("OEBPS/content.opf", packageOpf(
            "    <dc:title>Sample Book</dc:title>\n"
            "    <dc:creator opf:role=\"aut\">Jane Doe</dc:creator>\n"
            "    <dc:description>A short sample.</dc:description>\n"
            "    <dc:language>en</dc:language>\n"
            "    <dc:identifier id=\"bookid\">urn:uuid:1234</dc:identifier>\n"
            "    <meta name=\"cover\" content=\"cover\"/>\n",
            item("ncx", "toc.ncx", "application/x-dtbncx+xml") +
            item("chap1", "Text/chapter1.xhtml", "application/xhtml+xml") +
            item("chap2", "Text/chapter2.xhtml", "application/xhtml+xml") +
            item("style", "Styles/style.css", "text/css") +
            item("cover", "Images/cover.jpg", "image/jpeg"),
            itemref("chap1") + itemref("chap2"),
            "ncx"));
        builder.add("OEBPS/toc.ncx", ncx("Sample Book",
            navPoint("np1", 1, "Introduction", "Text/chapter1.xhtml") +
            navPoint("np2", 2, "The Middle", "Text/chapter2.xhtml",
                     navPoint("np2-1", 3, "Part A", "Text/chapter2.xhtml#a"))));
        builder.add("OEBPS/Text/chapter1.xhtml", xhtml(120, 'a'));
        builder.add("OEBPS/Text/chapter2.xhtml", xhtml(200, 'b'));
        builder.add("OEBPS/Styles/style.css", "body { margin: 0; }");
        builder.add("OEBPS/Images/cover.jpg", std::string("\xFF\xD8\xFF\xE0JFIFcoverbytes", 18));
        return builder;
    }

    /**
     * @brief 两个50字节HTML章节、没有目录、包文档位于根目录
     */
    static EpubBuilder twoChapterBook() {
        EpubBuilder builder;
        builder.addContainer("content.opf");
        builder.add("content.opf", packageOpf(
            "    <dc:title>Two Chapters</dc:title>\n",
            item("item-1", "one.html", "text/html") +
            item("item-2", "two.html", "text/html"),
            itemref("item-1") + itemref("item-2")));
        builder.add("one.html", xhtml(50, '1'));
        builder.add("two.html", xhtml(50, '2'));
        return builder;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

/**
 * @brief 测试夹具基类：准备临时目录和日志
 */
class EpubTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        epubkit::Logger::getInstance().initialize("logs/epubkit_unit_tests.log",
                                                  epubkit::Logger::Level::DEBUG,
                                                  false);

        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = (std::filesystem::temp_directory_path() /
                     (std::string("epubkit_") + info->test_suite_name() + "_" + info->name())).string();
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        epubkit::Logger::getInstance().shutdown();
    }

    std::string pathFor(const std::string& name) const {
        return (std::filesystem::path(test_dir_) / name).string();
    }

    /**
     * @brief 写出样例并返回文件路径
     */
    std::string writeBook(const EpubBuilder& builder, const std::string& name = "book.epub") const {
        std::string path = pathFor(name);
        EXPECT_TRUE(builder.writeTo(path)) << "failed to write " << path;
        return path;
    }

    std::string test_dir_;
};

}} // namespace epubkit::test
