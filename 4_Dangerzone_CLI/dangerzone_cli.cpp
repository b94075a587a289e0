// dangerzone_cli.cpp - Convert untrusted documents into safe PDFs
//
// Each document is rendered to raw RGB pages inside a network-less,
// capability-less container; only those pixels come back to the host,
// where a fresh PDF is rebuilt from them.
//
// Usage:
//   dangerzone-cli [options] <file> [file...]

#include "document_converter.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace Dangerzone;

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int EC_SUCCESS = 0;
constexpr int EC_INVALID_ARGS = 1;
constexpr int EC_CONVERSION_FAILED = 1;

static const char* VERSION = "0.1.0";

struct CliOptions {
    std::vector<std::string> inputFiles;
    std::string outputFilename;
    std::string containerImage = DEFAULT_CONTAINER_IMAGE;
    double dpi = DEFAULT_DPI;
    bool debug = false;
};

void printBanner() {
    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Dangerzone v" << VERSION << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Convert potentially dangerous documents into safe PDFs\n";
    std::cout << "\n";
}

void printUsage(const char* progName) {
    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Dangerzone v" << VERSION << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Convert potentially dangerous documents into safe PDFs\n";
    std::cout << "\n";
    std::cout << "Usage:\n";
    std::cout << "  " << progName << " [options] <file> [file...]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output-filename <path>  Output PDF (only with a single input file)\n";
    std::cout << "  -d, --debug                   Run the renderer in debug mode and print its log\n";
    std::cout << "      --container-image <image> Renderer image\n";
    std::cout << "                                (default: " << DEFAULT_CONTAINER_IMAGE << ")\n";
    std::cout << "      --dpi <value>             Rendering resolution (default: " << DEFAULT_DPI << ")\n";
    std::cout << "  -h, --help                    Show this help\n";
    std::cout << "      --version                 Show version\n";
    std::cout << "\n";
    std::cout << "Without --output-filename, each <name>.<ext> is written to\n";
    std::cout << "<name>-safe.pdf in the same directory.\n";
    std::cout << "\n";
    std::cout << "Requires podman or docker.\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";
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

void printSummary(int successful, int failed) {
    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "SUMMARY\n";
    std::cout << "=============================================================================\n";
    std::cout << "Successful:  " << successful << "\n";
    std::cout << "Failed:      " << failed << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";
}

static std::string make_container_name() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return "dangerzone-cpp-" + std::to_string(ms);
}

static bool parse_dpi(const std::string& text, double& dpi) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size() || !(value > 0.0)) {
            return false;
        }
        dpi = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// ============================================================================
// Conversion
// ============================================================================

static bool convert_document(const std::string& inputPath,
                             const std::string& outputPath,
                             ContainerRuntime runtime,
                             const CliOptions& options) {
    std::cout << "INFO: Converting " << inputPath << "\n";

    std::vector<uint8_t> document;
    std::string ioError;
    if (!readFileBytes(inputPath, document, ioError)) {
        printError(ioError);
        return false;
    }

    ContainerRunner runner(make_container_name(), runtime);
    if (options.debug) {
        std::cout << "INFO: Container:  " << runner.getContainerName() << "\n";
        std::cout << "INFO: Image:      " << options.containerImage << "\n";
    }

    ContainerError containerError;
    std::unique_ptr<ChildProcess> renderer = runner.run(options.containerImage,
                                                        rendererCommand(),
                                                        rendererExtraArgs(options.debug),
                                                        containerError);
    if (!renderer) {
        printError("Failed to start renderer: " + containerError.message());
        return false;
    }

    PDFReconstructor reconstructor(options.dpi);
    DocumentConverter converter(reconstructor);
    std::vector<uint8_t> pdfData;
    bool ok = converter.convert(*renderer, document, pdfData);

    if (options.debug && !converter.getRendererLog().empty()) {
        std::cout << "INFO: Renderer log:\n" << converter.getRendererLog() << "\n";
    }
    if (!ok) {
        printError("Conversion failed for " + inputPath + ": " + converter.getLastError());
        return false;
    }

    if (!writeFileBytes(outputPath, pdfData, ioError)) {
        printError(ioError);
        return false;
    }

    std::cout << "INFO: Wrote " << converter.getPageCount() << " page(s) to " << outputPath
              << " (" << pdfData.size() << " bytes)\n";
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    // A renderer that exits early must not kill us while we write its stdin
    std::signal(SIGPIPE, SIG_IGN);

    CliOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EC_SUCCESS;
        }
        else if (arg == "--version") {
            std::cout << "dangerzone-cli " << VERSION << "\n";
            return EC_SUCCESS;
        }
        else if (arg == "-o" || arg == "--output-filename") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return EC_INVALID_ARGS;
            }
            options.outputFilename = argv[++i];
        }
        else if (arg == "--container-image") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return EC_INVALID_ARGS;
            }
            options.containerImage = argv[++i];
        }
        else if (arg == "--dpi") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                return EC_INVALID_ARGS;
            }
            std::string value = argv[++i];
            if (!parse_dpi(value, options.dpi)) {
                std::cerr << "Error: Invalid --dpi value: " << value << "\n";
                return EC_INVALID_ARGS;
            }
        }
        else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return EC_INVALID_ARGS;
        }
        else {
            options.inputFiles.push_back(arg);
        }
    }

    if (options.inputFiles.empty()) {
        printUsage(argv[0]);
        std::cerr << "Error: At least one input file required\n";
        return EC_INVALID_ARGS;
    }
    if (!options.outputFilename.empty() && options.inputFiles.size() > 1) {
        std::cerr << "Error: --output-filename can only be used with one input file.\n";
        return EC_INVALID_ARGS;
    }

    printBanner();

    ContainerRuntime runtime = ContainerRuntime::Podman;
    ContainerError runtimeError;
    if (!ContainerRunner::detectRuntime(runtime, runtimeError)) {
        printError(runtimeError.message());
        return EC_CONVERSION_FAILED;
    }
    std::cout << "INFO: Using container runtime: " << runtimeCommand(runtime) << "\n";

    int successful = 0;
    int failed = 0;

    for (const auto& input : options.inputFiles) {
        std::error_code ec;
        if (!fs::is_regular_file(input, ec)) {
            std::cerr << "Error: File not found: " << input << "\n";
            failed++;
            continue;
        }

        std::string output = options.outputFilename.empty()
            ? deriveOutputPath(input)
            : options.outputFilename;

        if (convert_document(input, output, runtime, options)) {
            successful++;
        } else {
            failed++;
        }
    }

    printSummary(successful, failed);

    return failed > 0 ? EC_CONVERSION_FAILED : EC_SUCCESS;
}
