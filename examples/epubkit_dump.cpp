/**
 * @file epubkit_dump.cpp
 * @brief EpubKit读取示例
 *
 * 打印EPUB文件的元数据、manifest、目录和章节概要
 * 用法: epubkit_dump <book.epub> [--max-length N] [--timeout-ms N] [--cover out.jpg]
 */

#include "epubkit/EpubKit.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void printNavPoints(const std::vector<epubkit::core::NavPoint>& points, int indent) {
    for (const auto& point : points) {
        std::cout << std::string(static_cast<size_t>(indent) * 2, ' ')
                  << "- " << point.label << " -> " << point.src << std::endl;
        printNavPoints(point.children, indent + 1);
    }
}

void printUsage(const char* program) {
    std::cerr << "用法: " << program
              << " <book.epub> [--max-length N] [--timeout-ms N] [--cover out.jpg]" << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string filename = argv[1];
    int64_t max_length = 0;
    long timeout_ms = 0;
    std::string cover_output;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-length" && i + 1 < argc) {
            max_length = std::strtoll(argv[++i], nullptr, 10);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            timeout_ms = std::strtol(argv[++i], nullptr, 10);
        } else if (arg == "--cover" && i + 1 < argc) {
            cover_output = argv[++i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    epubkit::initialize("logs/epubkit_dump.log", false);

    try {
        auto book = epubkit::openEpub(filename);

        std::cout << "=== 元数据 ===" << std::endl;
        const auto& metadata = book->getMetadata();
        std::cout << "标题: " << metadata.title << std::endl;
        std::cout << "作者: " << metadata.creator << std::endl;
        if (!metadata.language.empty()) {
            std::cout << "语言: " << metadata.language << std::endl;
        }
        if (!metadata.identifier.empty()) {
            std::cout << "标识: " << metadata.identifier << std::endl;
        }
        std::cout << "包文档: " << book->getRootFile() << std::endl;

        std::cout << "\n=== Manifest (" << book->getItems().size() << ") ===" << std::endl;
        for (const auto& item : book->getItems()) {
            std::cout << "  " << item.id << "  " << item.href << "  " << item.media_type << std::endl;
        }

        std::cout << "\n=== 目录 ===" << std::endl;
        if (const auto* toc = book->getToc()) {
            if (!toc->title.empty()) {
                std::cout << toc->title << std::endl;
            }
            printNavPoints(toc->nav_map, 1);
        } else {
            std::cout << "  (无NCX目录)" << std::endl;
        }

        auto token = epubkit::core::CancellationToken();
        if (timeout_ms > 0) {
            token = token.withTimeout(std::chrono::milliseconds(timeout_ms));
        }
        auto options = epubkit::core::makeOptions({
            epubkit::core::withCancellation(token),
            epubkit::core::withMaxContentLength(max_length)
        });

        auto chapters = book->getChapters(options).valueOrThrow();
        std::cout << "\n=== 章节 (" << chapters.size() << ") ===" << std::endl;
        for (const auto& chapter : chapters) {
            std::cout << "  " << chapter.order << ". " << chapter.title
                      << " (" << chapter.content.size() << " bytes)" << std::endl;
        }

        if (!cover_output.empty()) {
            auto cover = book->getCover().valueOrThrow();
            if (!cover) {
                std::cout << "\n未找到封面" << std::endl;
            } else {
                std::ofstream out(cover_output, std::ios::binary);
                out << cover->rdbuf();
                std::cout << "\n封面已写入: " << cover_output << std::endl;
            }
        }

        book->close();
    } catch (const epubkit::core::EpubKitException& e) {
        std::cerr << "错误: " << e.getDetailedMessage() << std::endl;
        epubkit::cleanup();
        return 2;
    }

    epubkit::cleanup();
    return 0;
}
