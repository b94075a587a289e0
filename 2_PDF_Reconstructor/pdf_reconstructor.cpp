#include "pdf_reconstructor.h"

#include <cmath>
#include <exception>
#include <iomanip>
#include <memory>
#include <sstream>

#include <zlib.h>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace Dangerzone {

static const char* DOCUMENT_TITLE = "Dangerzone Safe PDF";
static const char* DOCUMENT_PRODUCER = "Dangerzone";
static const char* IMAGE_RESOURCE_NAME = "/Im0";

// ============================================================================
// PDFError Implementation
// ============================================================================

std::string PDFError::message() const {
    switch (kind) {
        case PDFErrorKind::None:
            return "No error";
        case PDFErrorKind::NoPages:
            return "No pages provided";
        case PDFErrorKind::InvalidDimensions:
            return "Invalid page dimensions: width=" + std::to_string(width) +
                   ", height=" + std::to_string(height) +
                   (cause.empty() ? std::string() : " (" + cause + ")");
        case PDFErrorKind::ImageCreation:
            return "Image creation error: " + cause;
        case PDFErrorKind::PdfCreation:
            return "PDF creation error: " + cause;
    }
    return "Unknown PDF error";
}

// ============================================================================
// Helpers
// ============================================================================

// Fixed six decimals with trailing zeros dropped, so the MediaBox and the
// content stream matrix carry the same literal.
static std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << value;
    std::string s = ss.str();

    size_t dot = s.find('.');
    if (dot != std::string::npos) {
        size_t last = s.find_last_not_of('0');
        if (last == dot) {
            last--;
        }
        s.erase(last + 1);
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

static bool zlib_compress(const std::vector<uint8_t>& src, std::string& out, std::string& err) {
    uLongf dest_len = compressBound(static_cast<uLong>(src.size()));
    std::vector<uint8_t> dest(dest_len);

    int ret = compress(dest.data(), &dest_len, src.data(), static_cast<uLong>(src.size()));
    if (ret != Z_OK) {
        err = "zlib compress failed (error " + std::to_string(ret) + ")";
        return false;
    }
    out.assign(reinterpret_cast<const char*>(dest.data()), dest_len);
    return true;
}

static PDFError make_error(PDFErrorKind kind, const std::string& cause = std::string()) {
    PDFError e;
    e.kind = kind;
    e.cause = cause;
    return e;
}

// ============================================================================
// PDFReconstructor Implementation
// ============================================================================

PDFReconstructor::PDFReconstructor() : dpi_(DEFAULT_DPI) {
}

PDFReconstructor::PDFReconstructor(double dpi) : dpi_(dpi) {
}

double PDFReconstructor::pixelsToPoints(uint16_t pixels) const {
    return (static_cast<double>(pixels) / dpi_) * POINTS_PER_INCH;
}

PageSize PDFReconstructor::getPageSize(const PageData& page) const {
    PageSize size;
    size.width = pixelsToPoints(page.getWidth());
    size.height = pixelsToPoints(page.getHeight());
    return size;
}

bool PDFReconstructor::reconstruct(const std::vector<PageData>& pages,
                                   std::vector<uint8_t>& pdfData,
                                   PDFError& error) const {
    pdfData.clear();
    error = PDFError();

    if (pages.empty()) {
        error = make_error(PDFErrorKind::NoPages);
        return false;
    }

    try {
        QPDF pdf;
        pdf.emptyPDF();
        QPDFPageDocumentHelper dh(pdf);

        for (const auto& page : pages) {
            if (page.getWidth() == 0 || page.getHeight() == 0) {
                error = make_error(PDFErrorKind::InvalidDimensions);
                error.width = page.getWidth();
                error.height = page.getHeight();
                return false;
            }

            std::string compressed;
            std::string zerr;
            if (!zlib_compress(page.getPixels(), compressed, zerr)) {
                error = make_error(PDFErrorKind::ImageCreation, zerr);
                return false;
            }

            // Image XObject: raw RGB samples, Flate-encoded
            QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf);
            QPDFObjectHandle imageDict = image.getDict();
            imageDict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
            imageDict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
            imageDict.replaceKey("/Width", QPDFObjectHandle::newInteger(page.getWidth()));
            imageDict.replaceKey("/Height", QPDFObjectHandle::newInteger(page.getHeight()));
            imageDict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
            imageDict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
            image.replaceStreamData(compressed,
                                    QPDFObjectHandle::newName("/FlateDecode"),
                                    QPDFObjectHandle::newNull());

            // dpi is the caller's to choose; 0, negative or NaN would
            // otherwise print "inf"/"nan" into the MediaBox
            PageSize size = getPageSize(page);
            if (!std::isfinite(size.width) || !std::isfinite(size.height) ||
                size.width <= 0.0 || size.height <= 0.0) {
                error = make_error(PDFErrorKind::InvalidDimensions,
                                   "no finite page size at " + format_number(dpi_) + " dpi");
                error.width = page.getWidth();
                error.height = page.getHeight();
                return false;
            }
            std::string w = format_number(size.width);
            std::string h = format_number(size.height);

            // Scale the unit image square to the full page, origin at 0 0
            std::ostringstream content;
            content << "q\n" << w << " 0 0 " << h << " 0 0 cm\n"
                    << IMAGE_RESOURCE_NAME << " Do\nQ\n";
            QPDFObjectHandle contents = QPDFObjectHandle::newStream(&pdf, content.str());

            QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
            xobjects.replaceKey(IMAGE_RESOURCE_NAME, image);
            QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
            resources.replaceKey("/XObject", xobjects);

            QPDFObjectHandle mediaBox = QPDFObjectHandle::newArray();
            mediaBox.appendItem(QPDFObjectHandle::newInteger(0));
            mediaBox.appendItem(QPDFObjectHandle::newInteger(0));
            mediaBox.appendItem(QPDFObjectHandle::newReal(w));
            mediaBox.appendItem(QPDFObjectHandle::newReal(h));

            QPDFObjectHandle pageDict = QPDFObjectHandle::newDictionary();
            pageDict.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
            pageDict.replaceKey("/MediaBox", mediaBox);
            pageDict.replaceKey("/Resources", resources);
            pageDict.replaceKey("/Contents", contents);

            dh.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(pageDict)), false);
        }

        QPDFObjectHandle info = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        info.replaceKey("/Title", QPDFObjectHandle::newString(DOCUMENT_TITLE));
        info.replaceKey("/Producer", QPDFObjectHandle::newString(DOCUMENT_PRODUCER));
        info.replaceKey("/Creator", QPDFObjectHandle::newString(DOCUMENT_PRODUCER));
        pdf.getTrailer().replaceKey("/Info", info);

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setDeterministicID(true);
        writer.write();

        std::shared_ptr<Buffer> buffer = writer.getBufferSharedPointer();
        const unsigned char* bytes = buffer->getBuffer();
        pdfData.assign(bytes, bytes + buffer->getSize());
    } catch (const std::exception& e) {
        pdfData.clear();
        error = make_error(PDFErrorKind::PdfCreation, e.what());
        return false;
    }

    return true;
}

} // namespace Dangerzone
