#ifndef PDF_RECONSTRUCTOR_H
#define PDF_RECONSTRUCTOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "pixel_stream.h"

namespace Dangerzone {

// Resolution the renderer rasterizes at (pixels per inch)
constexpr double DEFAULT_DPI = 150.0;

constexpr double POINTS_PER_INCH = 72.0;

enum class PDFErrorKind {
    None,
    NoPages,            // Empty page sequence
    InvalidDimensions,  // Page with width or height 0
    ImageCreation,      // Pixel data could not be encoded as an image stream
    PdfCreation         // QPDF failed to build or serialize the document
};

struct PDFError {
    PDFErrorKind kind = PDFErrorKind::None;
    uint16_t width = 0;
    uint16_t height = 0;
    std::string cause;

    bool ok() const { return kind == PDFErrorKind::None; }

    std::string message() const;
};

// Physical page size in PDF points (1/72 inch)
struct PageSize {
    double width = 0.0;
    double height = 0.0;
};

// Rebuilds a PDF from rendered pages: one page per PageData, each page
// sized from its pixel dimensions at the configured resolution and fully
// covered by its RGB image.
//
// Holds only the resolution, so one instance may be used from several
// threads at once.
class PDFReconstructor {
public:
    PDFReconstructor();
    explicit PDFReconstructor(double dpi);

    double getDpi() const { return dpi_; }

    // (pixels / dpi) * 72
    double pixelsToPoints(uint16_t pixels) const;

    PageSize getPageSize(const PageData& page) const;

    // Builds the complete document in memory. On failure `pdfData` is
    // left empty and `error` says why.
    bool reconstruct(const std::vector<PageData>& pages,
                     std::vector<uint8_t>& pdfData,
                     PDFError& error) const;

private:
    double dpi_;
};

} // namespace Dangerzone

#endif // PDF_RECONSTRUCTOR_H
