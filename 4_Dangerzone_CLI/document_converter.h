#ifndef DOCUMENT_CONVERTER_H
#define DOCUMENT_CONVERTER_H

#include <cstdint>
#include <string>
#include <vector>

#include "container_runner.h"
#include "pdf_reconstructor.h"
#include "pixel_stream.h"

namespace Dangerzone {

// Image the renderer runs in unless --container-image overrides it
extern const char* DEFAULT_CONTAINER_IMAGE;

// Command run inside the renderer container
std::vector<std::string> rendererCommand();

// Extra runtime arguments for the renderer (debug adds RUNSC_DEBUG)
std::vector<std::string> rendererExtraArgs(bool debug);

// "<dir>/<stem>-safe.pdf" next to the input
std::string deriveOutputPath(const std::string& inputPath);

bool readFileBytes(const std::string& path, std::vector<uint8_t>& data, std::string& error);
bool writeFileBytes(const std::string& path, const std::vector<uint8_t>& data, std::string& error);

// Host half of one conversion: feeds the document to an already spawned
// renderer, reads its pixel stream, checks its exit status and rebuilds
// the PDF.
class DocumentConverter {
public:
    explicit DocumentConverter(const PDFReconstructor& reconstructor);

    bool convert(ChildProcess& renderer,
                 const std::vector<uint8_t>& document,
                 std::vector<uint8_t>& pdfData);

    const std::string& getLastError() const { return lastError_; }

    // Valid after convert(), successful or not
    size_t getPageCount() const { return pageCount_; }
    int getExitCode() const { return exitCode_; }
    const std::string& getRendererLog() const { return rendererLog_; }

private:
    bool fail(const std::string& message);

    const PDFReconstructor& reconstructor_;
    std::string lastError_;
    size_t pageCount_;
    int exitCode_;
    std::string rendererLog_;
};

} // namespace Dangerzone

#endif // DOCUMENT_CONVERTER_H
