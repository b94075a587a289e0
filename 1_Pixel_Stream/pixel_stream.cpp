#include "pixel_stream.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include <unistd.h>

namespace Dangerzone {

// Pixel data is pulled from the source in chunks of this size, so the
// buffer only grows as fast as the producer actually delivers bytes.
static constexpr size_t PIXEL_READ_CHUNK = 1024 * 1024;

// ============================================================================
// StreamError Implementation
// ============================================================================

std::string StreamError::message() const {
    switch (kind) {
        case StreamErrorKind::None:
            return "No error";
        case StreamErrorKind::Io:
            return "IO error: " + cause;
        case StreamErrorKind::InvalidPageCount:
            return "Invalid page count: " + std::to_string(pageCount);
        case StreamErrorKind::InvalidPageDimensions:
            return "Invalid page dimensions: width=" + std::to_string(width) +
                   ", height=" + std::to_string(height);
        case StreamErrorKind::InvalidPixelData:
            return "Invalid pixel data: expected " + std::to_string(expected) +
                   " bytes, got " + std::to_string(actual);
        case StreamErrorKind::UnexpectedEndOfStream:
            return "Unexpected end of stream (expected " + std::to_string(expected) +
                   " bytes, got " + std::to_string(actual) + ")";
    }
    return "Unknown stream error";
}

StreamError StreamError::io(const std::string& cause) {
    StreamError e;
    e.kind = StreamErrorKind::Io;
    e.cause = cause;
    return e;
}

StreamError StreamError::invalidPageCount(uint16_t count) {
    StreamError e;
    e.kind = StreamErrorKind::InvalidPageCount;
    e.pageCount = count;
    return e;
}

StreamError StreamError::invalidPageDimensions(uint16_t width, uint16_t height) {
    StreamError e;
    e.kind = StreamErrorKind::InvalidPageDimensions;
    e.width = width;
    e.height = height;
    return e;
}

StreamError StreamError::invalidPixelData(size_t expected, size_t actual) {
    StreamError e;
    e.kind = StreamErrorKind::InvalidPixelData;
    e.expected = expected;
    e.actual = actual;
    return e;
}

StreamError StreamError::unexpectedEndOfStream(size_t expected, size_t actual) {
    StreamError e;
    e.kind = StreamErrorKind::UnexpectedEndOfStream;
    e.expected = expected;
    e.actual = actual;
    return e;
}

// ============================================================================
// PageData Implementation
// ============================================================================

std::optional<PageData> PageData::create(uint16_t width, uint16_t height,
                                         std::vector<uint8_t> pixels,
                                         StreamError* error) {
    size_t expected = expectedSize(width, height);
    if (pixels.size() != expected) {
        if (error) {
            *error = StreamError::invalidPixelData(expected, pixels.size());
        }
        return std::nullopt;
    }
    return PageData(width, height, std::move(pixels));
}

// ============================================================================
// ByteSource Implementations
// ============================================================================

long MemoryByteSource::read(uint8_t* buffer, size_t maxLen) {
    size_t n = std::min(maxLen, data_.size() - position_);
    if (n == 0) {
        return 0;
    }
    std::memcpy(buffer, data_.data() + position_, n);
    position_ += n;
    return static_cast<long>(n);
}

long StreamByteSource::read(uint8_t* buffer, size_t maxLen) {
    if (maxLen == 0) {
        return 0;
    }
    if (in_.eof()) {
        return 0;
    }

    size_t request = std::min(maxLen, static_cast<size_t>(std::numeric_limits<long>::max()));
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(request));
    std::streamsize got = in_.gcount();
    if (got > 0) {
        return static_cast<long>(got);
    }
    if (in_.eof()) {
        return 0;
    }

    lastError_ = "Input stream read failed";
    return -1;
}

long FdByteSource::read(uint8_t* buffer, size_t maxLen) {
    for (;;) {
        ssize_t n = ::read(fd_, buffer, maxLen);
        if (n >= 0) {
            return static_cast<long>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        lastError_ = std::strerror(errno);
        return -1;
    }
}

// ============================================================================
// PixelStreamReader Implementation
// ============================================================================

PixelStreamReader::PixelStreamReader(ByteSource& source) : source_(source) {
}

std::optional<uint16_t> PixelStreamReader::readPageCount() {
    lastError_ = StreamError();

    uint16_t count = 0;
    if (!readUInt16(count)) {
        return std::nullopt;
    }
    if (count == 0) {
        fail(StreamError::invalidPageCount(count));
        return std::nullopt;
    }
    return count;
}

std::optional<PageData> PixelStreamReader::readPage() {
    lastError_ = StreamError();

    uint16_t width = 0;
    uint16_t height = 0;
    if (!readUInt16(width) || !readUInt16(height)) {
        return std::nullopt;
    }

    // Checked before any pixel byte is consumed
    if (width == 0 || height == 0) {
        fail(StreamError::invalidPageDimensions(width, height));
        return std::nullopt;
    }

    std::vector<uint8_t> pixels;
    if (!readPixels(pixels, PageData::expectedSize(width, height))) {
        return std::nullopt;
    }

    StreamError error;
    std::optional<PageData> page = PageData::create(width, height, std::move(pixels), &error);
    if (!page) {
        fail(error);
    }
    return page;
}

bool PixelStreamReader::readAllPages(std::vector<PageData>& pages) {
    std::optional<uint16_t> count = readPageCount();
    if (!count) {
        return false;
    }

    std::vector<PageData> result;
    result.reserve(*count);

    for (uint16_t i = 0; i < *count; i++) {
        std::optional<PageData> page = readPage();
        if (!page) {
            return false;
        }
        result.push_back(std::move(*page));
    }

    pages.swap(result);
    return true;
}

PixelStreamReader::ReadStatus PixelStreamReader::readExact(uint8_t* buffer, size_t length, size_t& got) {
    got = 0;
    while (got < length) {
        long n = source_.read(buffer + got, length - got);
        if (n < 0) {
            fail(StreamError::io(source_.getLastError()));
            return ReadStatus::Failed;
        }
        if (n == 0) {
            return ReadStatus::EndOfStream;
        }
        got += static_cast<size_t>(n);
    }
    return ReadStatus::Complete;
}

bool PixelStreamReader::readUInt16(uint16_t& value) {
    uint8_t bytes[2] = {0, 0};
    size_t got = 0;

    switch (readExact(bytes, sizeof(bytes), got)) {
        case ReadStatus::Complete:
            value = PixelUtil::readUInt16BE(bytes);
            return true;
        case ReadStatus::EndOfStream:
            return fail(StreamError::unexpectedEndOfStream(sizeof(bytes), got));
        case ReadStatus::Failed:
            break;
    }
    return false;
}

bool PixelStreamReader::readPixels(std::vector<uint8_t>& pixels, size_t length) {
    pixels.clear();
    pixels.reserve(std::min(length, PIXEL_READ_CHUNK));

    while (pixels.size() < length) {
        size_t offset = pixels.size();
        size_t chunk = std::min(PIXEL_READ_CHUNK, length - offset);
        pixels.resize(offset + chunk);

        size_t got = 0;
        ReadStatus status = readExact(pixels.data() + offset, chunk, got);
        if (status == ReadStatus::EndOfStream) {
            return fail(StreamError::unexpectedEndOfStream(length, offset + got));
        }
        if (status == ReadStatus::Failed) {
            return false;
        }
    }
    return true;
}

bool PixelStreamReader::fail(const StreamError& error) {
    lastError_ = error;
    return false;
}

// ============================================================================
// Wire helpers
// ============================================================================

namespace PixelUtil {

uint16_t readUInt16BE(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | static_cast<uint16_t>(data[1]));
}

void writeUInt16BE(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[1] = static_cast<uint8_t>(value & 0xFF);
}

void appendUInt16BE(std::vector<uint8_t>& out, uint16_t value) {
    uint8_t bytes[2];
    writeUInt16BE(bytes, value);
    out.push_back(bytes[0]);
    out.push_back(bytes[1]);
}

std::vector<uint8_t> encodePixelStream(const std::vector<PageData>& pages) {
    std::vector<uint8_t> out;
    if (pages.empty() || pages.size() > std::numeric_limits<uint16_t>::max()) {
        return out;
    }

    size_t total = 2;
    for (const auto& page : pages) {
        total += 4 + page.getPixels().size();
    }
    out.reserve(total);

    appendUInt16BE(out, static_cast<uint16_t>(pages.size()));
    for (const auto& page : pages) {
        appendUInt16BE(out, page.getWidth());
        appendUInt16BE(out, page.getHeight());
        out.insert(out.end(), page.getPixels().begin(), page.getPixels().end());
    }
    return out;
}

} // namespace PixelUtil

} // namespace Dangerzone
