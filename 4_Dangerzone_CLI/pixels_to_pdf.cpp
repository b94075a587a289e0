// pixels_to_pdf.cpp - Rebuild a PDF from a captured renderer pixel stream
//
// Usage:
//   pixels-to-pdf [--dpi <value>] <input.pixels|-> <output.pdf>
//
// "-" reads the stream from stdin.

#include "document_converter.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Dangerzone;

constexpr int EC_SUCCESS = 0;
constexpr int EC_INVALID_ARGS = 1;
constexpr int EC_CONVERSION_FAILED = 1;

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [--dpi <value>] <input.pixels|-> <output.pdf>\n";
    std::cout << "\n";
    std::cout << "Reads a page stream ([u16 count] then per page [u16 width][u16 height]\n";
    std::cout << "[width*height*3 RGB bytes], big-endian) and writes the rebuilt PDF.\n";
    std::cout << "Use - as input to read from stdin. Default dpi: " << DEFAULT_DPI << "\n";
}

void printError(const std::string& message) {
    std::cerr << "\n";
    std::cerr << "=============================================================================\n";
    std::cerr << "ERROR\n";
    std::cerr << "=============================================================================\n";
    std::cerr << message << "\n";
    std::cerr << "=============================================================================\n";
    std::cerr << "\n";
}

static bool read_pages(ByteSource& source, std::vector<PageData>& pages, std::string& error) {
    PixelStreamReader reader(source);
    if (!reader.readAllPages(pages)) {
        error = reader.getLastError().message();
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    double dpi = DEFAULT_DPI;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EC_SUCCESS;
        }
        else if (arg == "--dpi") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --dpi requires an argument\n";
                return EC_INVALID_ARGS;
            }
            std::string value = argv[++i];
            try {
                size_t used = 0;
                dpi = std::stod(value, &used);
                if (used != value.size() || !(dpi > 0.0)) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid --dpi value: " << value << "\n";
                return EC_INVALID_ARGS;
            }
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return EC_INVALID_ARGS;
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        printUsage(argv[0]);
        return EC_INVALID_ARGS;
    }
    const std::string& inputPath = positional[0];
    const std::string& outputPath = positional[1];

    std::vector<PageData> pages;
    std::string error;
    bool ok = false;
    if (inputPath == "-") {
        StreamByteSource source(std::cin);
        ok = read_pages(source, pages, error);
    } else {
        std::ifstream in(inputPath, std::ios::binary);
        if (!in) {
            printError("Cannot open input file: " + inputPath);
            return EC_CONVERSION_FAILED;
        }
        StreamByteSource source(in);
        ok = read_pages(source, pages, error);
    }
    if (!ok) {
        printError("Failed to read pixel stream: " + error);
        return EC_CONVERSION_FAILED;
    }

    PDFReconstructor reconstructor(dpi);
    std::vector<uint8_t> pdfData;
    PDFError pdfError;
    if (!reconstructor.reconstruct(pages, pdfData, pdfError)) {
        printError(pdfError.message());
        return EC_CONVERSION_FAILED;
    }

    if (!writeFileBytes(outputPath, pdfData, error)) {
        printError(error);
        return EC_CONVERSION_FAILED;
    }

    std::cout << "INFO: Wrote " << pages.size() << " page(s) to " << outputPath
              << " (" << pdfData.size() << " bytes)\n";
    return EC_SUCCESS;
}
