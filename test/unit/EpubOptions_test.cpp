#include "epubkit/core/CancellationToken.hpp"
#include "epubkit/core/EpubOptions.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

namespace epubkit {
namespace core {

// 测试1: 默认值
TEST(EpubOptionsTest, Defaults) {
    EpubOptions options = makeOptions({});
    EXPECT_FALSE(options.include_cover);
    EXPECT_FALSE(options.include_metadata);
    EXPECT_EQ(options.max_content_length, 0);
    EXPECT_FALSE(options.cancellation.isCancelled());
    EXPECT_FALSE(options.cancellation.hasDeadline());

    Chapter chapter;
    EXPECT_TRUE(options.acceptsChapter(chapter));
    EXPECT_FALSE(options.exceedsMaxLength(1u << 30));
}

// 测试2: 按顺序应用，后者覆盖前者
TEST(EpubOptionsTest, LaterAdjustmentsOverride) {
    EpubOptions options = makeOptions({
        withMaxContentLength(100),
        withCover(),
        withMetadata(),
        withMaxContentLength(20),
        withCover(false)
    });
    EXPECT_EQ(options.max_content_length, 20);
    EXPECT_FALSE(options.include_cover);
    EXPECT_TRUE(options.include_metadata);
    EXPECT_TRUE(options.exceedsMaxLength(21));
    EXPECT_FALSE(options.exceedsMaxLength(20));
}

// 测试3: 负数上限视为不限制
TEST(EpubOptionsTest, NegativeMaxLengthClamped) {
    EpubOptions options = makeOptions({withMaxContentLength(-5)});
    EXPECT_EQ(options.max_content_length, 0);
    EXPECT_FALSE(options.exceedsMaxLength(1000));
}

// 测试4: 章节过滤器
TEST(EpubOptionsTest, ChapterFilter) {
    EpubOptions options = makeOptions({withChapterFilter([](const Chapter& chapter) {
        return chapter.title != "skip";
    })});
    Chapter keep;
    keep.title = "keep";
    Chapter skip;
    skip.title = "skip";
    EXPECT_TRUE(options.acceptsChapter(keep));
    EXPECT_FALSE(options.acceptsChapter(skip));
}

// 测试5: 取消信号传播到所有token
TEST(CancellationTokenTest, SourceCancelsTokens) {
    CancellationSource source;
    CancellationToken a = source.token();
    CancellationToken b = makeOptions({withCancellation(source.token())}).cancellation;

    EXPECT_FALSE(a.isCancelled());
    EXPECT_TRUE(a.check().hasValue());

    source.cancel();
    EXPECT_TRUE(source.isCancelled());
    EXPECT_TRUE(a.isCancelled());
    EXPECT_TRUE(b.isCancelled());

    auto result = b.check();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(result.error().message, "operation cancelled");
}

// 测试6: 跨线程取消
TEST(CancellationTokenTest, CancelFromAnotherThread) {
    CancellationSource source;
    CancellationToken token = source.token();

    std::thread canceller([&source] { source.cancel(); });
    canceller.join();

    EXPECT_TRUE(token.isCancelled());
}

// 测试7: 截止时间
TEST(CancellationTokenTest, Deadline) {
    auto past = CancellationToken().withDeadline(CancellationToken::Clock::now() - std::chrono::milliseconds(1));
    EXPECT_TRUE(past.hasDeadline());
    EXPECT_TRUE(past.deadlineExceeded());
    EXPECT_EQ(past.check().error().message, "deadline exceeded");

    auto future = CancellationToken().withTimeout(std::chrono::hours(1));
    EXPECT_FALSE(future.isCancelled());

    // 保留更早的截止时间
    auto combined = past.withTimeout(std::chrono::hours(1));
    EXPECT_TRUE(combined.isCancelled());

    auto short_timeout = CancellationToken().withTimeout(std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_TRUE(short_timeout.isCancelled());
}

// 测试8: 显式取消优先于超时的描述
TEST(CancellationTokenTest, ExplicitCancelReportedFirst) {
    CancellationSource source;
    auto token = source.token().withDeadline(CancellationToken::Clock::now() - std::chrono::seconds(1));
    source.cancel();
    EXPECT_EQ(token.check().error().message, "operation cancelled");
}

}} // namespace epubkit::core
