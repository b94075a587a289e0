#include "pixel_stream.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

using namespace Dangerzone;

namespace {

PageData solidPage(uint16_t width, uint16_t height, uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> pixels;
    pixels.reserve(PageData::expectedSize(width, height));
    for (size_t i = 0; i < static_cast<size_t>(width) * height; i++) {
        pixels.push_back(r);
        pixels.push_back(g);
        pixels.push_back(b);
    }
    return *PageData::create(width, height, std::move(pixels));
}

// Fails every read with a transport error
class BrokenSource : public ByteSource {
public:
    long read(uint8_t*, size_t) override {
        lastError_ = "Connection reset by peer";
        return -1;
    }
};

// Serves `data`, then fails instead of reporting end of stream
class FailingAfterSource : public ByteSource {
public:
    explicit FailingAfterSource(std::vector<uint8_t> data) : data_(std::move(data)), position_(0) {}

    long read(uint8_t* buffer, size_t maxLen) override {
        if (position_ >= data_.size()) {
            lastError_ = "Broken pipe";
            return -1;
        }
        size_t n = std::min(maxLen, data_.size() - position_);
        std::copy(data_.begin() + position_, data_.begin() + position_ + n, buffer);
        position_ += n;
        return static_cast<long>(n);
    }

private:
    std::vector<uint8_t> data_;
    size_t position_;
};

// Hands out at most one byte per read
class TrickleSource : public ByteSource {
public:
    explicit TrickleSource(std::vector<uint8_t> data) : data_(std::move(data)), position_(0) {}

    long read(uint8_t* buffer, size_t maxLen) override {
        if (maxLen == 0 || position_ >= data_.size()) {
            return 0;
        }
        buffer[0] = data_[position_++];
        return 1;
    }

private:
    std::vector<uint8_t> data_;
    size_t position_;
};

} // namespace

// ============================================================================
// PageData
// ============================================================================

TEST(PageData, AcceptsMatchingBuffer) {
    std::optional<PageData> page = PageData::create(2, 3, std::vector<uint8_t>(18, 0x7F));
    ASSERT_TRUE(page.has_value());
    EXPECT_EQ(page->getWidth(), 2);
    EXPECT_EQ(page->getHeight(), 3);
    EXPECT_EQ(page->getPixels().size(), 18u);
    EXPECT_EQ(page->getPixelCount(), 6u);
}

TEST(PageData, RejectsSizeMismatch) {
    StreamError error;
    std::optional<PageData> page = PageData::create(2, 2, std::vector<uint8_t>(10), &error);
    EXPECT_FALSE(page.has_value());
    EXPECT_EQ(error.kind, StreamErrorKind::InvalidPixelData);
    EXPECT_EQ(error.expected, 12u);
    EXPECT_EQ(error.actual, 10u);
    EXPECT_EQ(error.message(), "Invalid pixel data: expected 12 bytes, got 10");
}

TEST(PageData, ExpectedSizeDoesNotOverflow) {
    EXPECT_EQ(PageData::expectedSize(65535, 65535), static_cast<size_t>(65535) * 65535 * 3);
}

// ============================================================================
// PixelStreamReader
// ============================================================================

TEST(PixelStreamReader, RoundTripPreservesPagesAndOrder) {
    std::vector<PageData> pages = {
        solidPage(3, 2, 255, 0, 0),
        solidPage(1, 1, 0, 255, 0),
        solidPage(4, 5, 0, 0, 255),
    };
    MemoryByteSource source(PixelUtil::encodePixelStream(pages));
    PixelStreamReader reader(source);

    std::vector<PageData> decoded;
    ASSERT_TRUE(reader.readAllPages(decoded)) << reader.getLastError().message();
    ASSERT_EQ(decoded.size(), pages.size());
    for (size_t i = 0; i < pages.size(); i++) {
        EXPECT_EQ(decoded[i].getWidth(), pages[i].getWidth());
        EXPECT_EQ(decoded[i].getHeight(), pages[i].getHeight());
        EXPECT_EQ(decoded[i].getPixels(), pages[i].getPixels());
    }
    EXPECT_EQ(source.getRemaining(), 0u);
}

TEST(PixelStreamReader, DecodesBigEndianFields) {
    std::vector<uint8_t> wire = {0x00, 0x01, 0x00, 0x01, 0x00, 0x02, 1, 2, 3, 4, 5, 6};
    MemoryByteSource source(wire);
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    ASSERT_TRUE(reader.readAllPages(pages));
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].getWidth(), 1);
    EXPECT_EQ(pages[0].getHeight(), 2);
    EXPECT_EQ(pages[0].getPixels(), std::vector<uint8_t>({1, 2, 3, 4, 5, 6}));
}

TEST(PixelStreamReader, RejectsZeroPageCount) {
    MemoryByteSource source(std::vector<uint8_t>({0x00, 0x00, 0x00, 0x01, 0x00, 0x01}));
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::InvalidPageCount);
    EXPECT_EQ(reader.getLastError().pageCount, 0);
    EXPECT_EQ(reader.getLastError().message(), "Invalid page count: 0");
    // Nothing past the count field was consumed
    EXPECT_EQ(source.getPosition(), 2u);
}

TEST(PixelStreamReader, RejectsZeroWidthBeforePixels) {
    std::vector<uint8_t> wire = {0x00, 0x01, 0x00, 0x00, 0x00, 0x04};
    wire.insert(wire.end(), 12, 0xAA);
    MemoryByteSource source(wire);
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::InvalidPageDimensions);
    EXPECT_EQ(reader.getLastError().width, 0);
    EXPECT_EQ(reader.getLastError().height, 4);
    EXPECT_EQ(source.getPosition(), 6u);
}

TEST(PixelStreamReader, RejectsZeroHeight) {
    MemoryByteSource source(std::vector<uint8_t>({0x00, 0x01, 0x00, 0x03, 0x00, 0x00}));
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::InvalidPageDimensions);
    EXPECT_EQ(reader.getLastError().message(), "Invalid page dimensions: width=3, height=0");
}

TEST(PixelStreamReader, TruncatedPixelsAreEndOfStream) {
    // 2x2 page needs 12 bytes, only 6 supplied
    std::vector<uint8_t> wire = {0x00, 0x01, 0x00, 0x02, 0x00, 0x02};
    wire.insert(wire.end(), 6, 0x10);
    MemoryByteSource source(wire);
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::UnexpectedEndOfStream);
    EXPECT_EQ(reader.getLastError().expected, 12u);
    EXPECT_EQ(reader.getLastError().actual, 6u);
}

TEST(PixelStreamReader, EmptyStreamIsEndOfStream) {
    MemoryByteSource source{std::vector<uint8_t>()};
    PixelStreamReader reader(source);

    EXPECT_FALSE(reader.readPageCount().has_value());
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::UnexpectedEndOfStream);
}

TEST(PixelStreamReader, ShortHeaderIsEndOfStream) {
    MemoryByteSource source(std::vector<uint8_t>({0x00, 0x02, 0x00, 0x01, 0x00}));
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::UnexpectedEndOfStream);
}

TEST(PixelStreamReader, MissingSecondPageFailsWholeRead) {
    std::vector<PageData> one = {solidPage(2, 2, 1, 2, 3)};
    std::vector<uint8_t> wire = PixelUtil::encodePixelStream(one);
    // Claim two pages but supply one
    wire[1] = 0x02;

    MemoryByteSource source(wire);
    PixelStreamReader reader(source);

    std::vector<PageData> pages = {solidPage(1, 1, 9, 9, 9)};
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::UnexpectedEndOfStream);
    // Caller's vector is untouched on failure
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].getWidth(), 1);
}

TEST(PixelStreamReader, TransportErrorIsIo) {
    BrokenSource source;
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::Io);
    EXPECT_EQ(reader.getLastError().message(), "IO error: Connection reset by peer");
}

TEST(PixelStreamReader, TransportErrorMidPageIsIo) {
    // 2x2 page header plus 5 of its 12 pixel bytes, then the source breaks
    std::vector<uint8_t> wire = {0x00, 0x01, 0x00, 0x02, 0x00, 0x02, 1, 2, 3, 4, 5};
    FailingAfterSource source(wire);
    PixelStreamReader reader(source);

    std::vector<PageData> pages;
    EXPECT_FALSE(reader.readAllPages(pages));
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::Io);
    EXPECT_EQ(reader.getLastError().message(), "IO error: Broken pipe");
    EXPECT_TRUE(pages.empty());
}

TEST(PixelStreamReader, HandlesShortReads) {
    std::vector<PageData> pages = {solidPage(3, 3, 10, 20, 30), solidPage(2, 1, 40, 50, 60)};
    TrickleSource source(PixelUtil::encodePixelStream(pages));
    PixelStreamReader reader(source);

    std::vector<PageData> decoded;
    ASSERT_TRUE(reader.readAllPages(decoded)) << reader.getLastError().message();
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[1].getPixels(), pages[1].getPixels());
}

TEST(PixelStreamReader, ReadsPagesIncrementally) {
    std::vector<PageData> pages = {solidPage(1, 1, 1, 1, 1), solidPage(2, 2, 2, 2, 2)};
    MemoryByteSource source(PixelUtil::encodePixelStream(pages));
    PixelStreamReader reader(source);

    std::optional<uint16_t> count = reader.readPageCount();
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2);

    std::optional<PageData> first = reader.readPage();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->getWidth(), 1);
    EXPECT_TRUE(reader.getLastError().ok());

    std::optional<PageData> second = reader.readPage();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->getWidth(), 2);

    EXPECT_FALSE(reader.readPage().has_value());
    EXPECT_EQ(reader.getLastError().kind, StreamErrorKind::UnexpectedEndOfStream);
}

TEST(PixelStreamReader, ReadsFromIstream) {
    std::vector<PageData> pages = {solidPage(2, 3, 7, 8, 9)};
    std::vector<uint8_t> wire = PixelUtil::encodePixelStream(pages);
    std::istringstream in(std::string(wire.begin(), wire.end()));
    StreamByteSource source(in);
    PixelStreamReader reader(source);

    std::vector<PageData> decoded;
    ASSERT_TRUE(reader.readAllPages(decoded));
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].getPixels(), pages[0].getPixels());
}

// ============================================================================
// PixelUtil
// ============================================================================

TEST(PixelUtil, BigEndianHelpers) {
    uint8_t bytes[2];
    PixelUtil::writeUInt16BE(bytes, 0x1234);
    EXPECT_EQ(bytes[0], 0x12);
    EXPECT_EQ(bytes[1], 0x34);
    EXPECT_EQ(PixelUtil::readUInt16BE(bytes), 0x1234);
}

TEST(PixelUtil, EncodeRejectsEmptyPageList) {
    EXPECT_TRUE(PixelUtil::encodePixelStream(std::vector<PageData>()).empty());
}
