#include "document_converter.h"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace Dangerzone {

const char* DEFAULT_CONTAINER_IMAGE = "localhost/dangerzone.rocks/dangerzone";

std::vector<std::string> rendererCommand() {
    return {"/usr/bin/python3", "-m", "dangerzone.conversion.doc_to_pixels"};
}

std::vector<std::string> rendererExtraArgs(bool debug) {
    std::vector<std::string> args;
    if (debug) {
        args.push_back("-e");
        args.push_back("RUNSC_DEBUG=1");
    }
    return args;
}

std::string deriveOutputPath(const std::string& inputPath) {
    fs::path input(inputPath);
    fs::path output = input.parent_path() / (input.stem().string() + "-safe.pdf");
    return output.string();
}

bool readFileBytes(const std::string& path, std::vector<uint8_t>& data, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open file: " + path;
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Failed to read file: " + path;
        return false;
    }
    return true;
}

bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Cannot create output file: " + path;
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        error = "Failed to write output file: " + path;
        return false;
    }
    return true;
}

// ============================================================================
// DocumentConverter Implementation
// ============================================================================

DocumentConverter::DocumentConverter(const PDFReconstructor& reconstructor)
    : reconstructor_(reconstructor), pageCount_(0), exitCode_(-1) {
}

bool DocumentConverter::convert(ChildProcess& renderer,
                                const std::vector<uint8_t>& document,
                                std::vector<uint8_t>& pdfData) {
    lastError_.clear();
    pageCount_ = 0;
    exitCode_ = -1;
    rendererLog_.clear();
    pdfData.clear();

    // A renderer that dies early closes its stdin; the exit status below
    // explains that better than the broken pipe does.
    ContainerError writeError;
    bool written = renderer.writeInput(document, writeError);
    renderer.closeInput();

    std::vector<PageData> pages;
    PixelStreamReader reader(renderer.getOutput());
    bool streamOk = reader.readAllPages(pages);
    StreamError streamError = reader.getLastError();

    // Nothing past the declared pages is read. A renderer still writing
    // (malformed stream or trailing bytes) gets EPIPE instead of blocking
    // forever on a full pipe while we wait for it.
    renderer.closeOutput();

    ContainerError waitError;
    if (!renderer.wait(exitCode_, waitError)) {
        return fail(waitError.message());
    }
    rendererLog_ = renderer.getErrorOutput();

    // A protocol or transport error is the root cause; the exit status of
    // a renderer cut off by closeOutput() only reflects the broken pipe.
    if (!streamOk && streamError.kind != StreamErrorKind::UnexpectedEndOfStream) {
        return fail(streamError.message());
    }
    if (exitCode_ != 0) {
        return fail("Renderer failed (exit code " + std::to_string(exitCode_) + "): " +
                    describeRendererExitCode(exitCode_));
    }
    if (!written) {
        return fail(writeError.message());
    }
    if (!streamOk) {
        return fail(streamError.message());
    }
    pageCount_ = pages.size();

    PDFError pdfError;
    if (!reconstructor_.reconstruct(pages, pdfData, pdfError)) {
        return fail(pdfError.message());
    }
    return true;
}

bool DocumentConverter::fail(const std::string& message) {
    lastError_ = message;
    return false;
}

} // namespace Dangerzone
