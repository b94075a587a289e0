#ifndef PIXEL_STREAM_H
#define PIXEL_STREAM_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Pixel stream emitted by the isolated renderer on its stdout:
//
//   [page_count: u16 BE]              must be > 0
//   repeat page_count times:
//     [width:  u16 BE]                must be > 0
//     [height: u16 BE]                must be > 0
//     [pixels: width*height*3 bytes]  RGB, row-major, no padding
//
// No magic bytes, no per-page marker, no trailer. Any framing error after
// the page count is unrecoverable.

namespace Dangerzone {

enum class StreamErrorKind {
    None,
    Io,                     // Transport failure on the byte source
    InvalidPageCount,       // Page count field was 0
    InvalidPageDimensions,  // Width or height field was 0
    InvalidPixelData,       // Pixel buffer length != width*height*3
    UnexpectedEndOfStream   // Source ended before a field was complete
};

struct StreamError {
    StreamErrorKind kind = StreamErrorKind::None;
    uint16_t pageCount = 0;
    uint16_t width = 0;
    uint16_t height = 0;
    size_t expected = 0;
    size_t actual = 0;
    std::string cause;      // Lower-level message for Io errors

    bool ok() const { return kind == StreamErrorKind::None; }

    std::string message() const;

    static StreamError io(const std::string& cause);
    static StreamError invalidPageCount(uint16_t count);
    static StreamError invalidPageDimensions(uint16_t width, uint16_t height);
    static StreamError invalidPixelData(size_t expected, size_t actual);
    static StreamError unexpectedEndOfStream(size_t expected, size_t actual);
};

// One rendered page. Immutable; the pixel buffer length always matches
// the declared dimensions.
class PageData {
public:
    // Returns an empty optional (and fills `error` when given) if the
    // buffer length is not width*height*3.
    static std::optional<PageData> create(uint16_t width, uint16_t height,
                                          std::vector<uint8_t> pixels,
                                          StreamError* error = nullptr);

    static size_t expectedSize(uint16_t width, uint16_t height) {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * 3;
    }

    uint16_t getWidth() const { return width_; }
    uint16_t getHeight() const { return height_; }
    const std::vector<uint8_t>& getPixels() const { return pixels_; }

    size_t getPixelCount() const {
        return static_cast<size_t>(width_) * static_cast<size_t>(height_);
    }

private:
    PageData(uint16_t width, uint16_t height, std::vector<uint8_t> pixels)
        : width_(width), height_(height), pixels_(std::move(pixels)) {}

    uint16_t width_;
    uint16_t height_;
    std::vector<uint8_t> pixels_;
};

// ============================================================================
// Byte sources
// ============================================================================

// Ordered, blocking, non-rewindable byte channel.
class ByteSource {
public:
    virtual ~ByteSource() {}

    // Reads up to maxLen bytes into buffer.
    // Returns the number of bytes read, 0 at end of stream, -1 on a
    // transport error (see getLastError()).
    virtual long read(uint8_t* buffer, size_t maxLen) = 0;

    const std::string& getLastError() const { return lastError_; }

protected:
    std::string lastError_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data)
        : data_(std::move(data)), position_(0) {}

    long read(uint8_t* buffer, size_t maxLen) override;

    size_t getPosition() const { return position_; }
    size_t getRemaining() const { return data_.size() - position_; }

private:
    std::vector<uint8_t> data_;
    size_t position_;
};

class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in) : in_(in) {}

    long read(uint8_t* buffer, size_t maxLen) override;

private:
    std::istream& in_;
};

// Reads from a POSIX file descriptor (e.g. a subprocess pipe).
// Does not own the descriptor.
class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd) : fd_(fd) {}

    long read(uint8_t* buffer, size_t maxLen) override;

private:
    int fd_;
};

// ============================================================================
// Stream reader
// ============================================================================

class PixelStreamReader {
public:
    explicit PixelStreamReader(ByteSource& source);

    PixelStreamReader(const PixelStreamReader&) = delete;
    PixelStreamReader& operator=(const PixelStreamReader&) = delete;

    // Read the page count field (rejects 0)
    std::optional<uint16_t> readPageCount();

    // Read one page header plus its pixel data
    std::optional<PageData> readPage();

    // Read page count then every page, in wire order.
    // `pages` is only modified on success.
    bool readAllPages(std::vector<PageData>& pages);

    const StreamError& getLastError() const { return lastError_; }

private:
    enum class ReadStatus { Complete, EndOfStream, Failed };

    ByteSource& source_;
    StreamError lastError_;

    ReadStatus readExact(uint8_t* buffer, size_t length, size_t& got);
    bool readUInt16(uint16_t& value);
    bool readPixels(std::vector<uint8_t>& pixels, size_t length);
    bool fail(const StreamError& error);
};

// ============================================================================
// Wire helpers
// ============================================================================

namespace PixelUtil {
    // Read big-endian uint16
    uint16_t readUInt16BE(const uint8_t* data);

    // Write big-endian uint16
    void writeUInt16BE(uint8_t* data, uint16_t value);

    void appendUInt16BE(std::vector<uint8_t>& out, uint16_t value);

    // Serialize pages into the renderer's wire format.
    // Returns an empty buffer for 0 or more than 65535 pages.
    std::vector<uint8_t> encodePixelStream(const std::vector<PageData>& pages);
}

} // namespace Dangerzone

#endif // PIXEL_STREAM_H
