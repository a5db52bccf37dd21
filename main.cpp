#include "core/MarshalContext.hpp"
#include "core/Session.hpp"
#include "core/SessionOptions.hpp"
#include "formats/FormatRegistry.hpp"
#include "util/Logger.hpp"
#include "util/Profiler.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace marshal;
using marshal::util::Logger;
using marshal::util::LogLevel;
using marshal::util::Profiler;

namespace {

std::string readInput(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeOutput(const std::string& path, const std::string& data) {
    if (path.empty() || path == "-") {
        std::cout << data;
        std::cout.flush();
        return;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << data;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string from = "json";
        std::string to;
        std::string inputPath;
        std::string outputPath;
        std::string configFile;
        LogLevel logLevel = LogLevel::WARN;
        bool detectRecursions = false;
        bool useWhitespace = false;
        bool enableProfiler = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--from" && i + 1 < argc) {
                from = argv[++i];
            } else if (arg == "--to" && i + 1 < argc) {
                to = argv[++i];
            } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
                inputPath = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                outputPath = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                logLevel = Logger::stringToLevel(argv[++i]);
            } else if (arg == "--detect-recursions") {
                detectRecursions = true;
            } else if (arg == "--ws") {
                useWhitespace = true;
            } else if (arg == "--profile") {
                enableProfiler = true;
            } else if (arg == "-h" || arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Converts a document between formats.\n"
                          << "Options:\n"
                          << "  --from TYPE          Input format (default: json)\n"
                          << "  --to TYPE            Output format (default: mediaType from config, else json)\n"
                          << "                       Formats: json, xml, html, uon, urlencoding, msgpack, rdf\n"
                          << "                       or a media type such as text/xml\n"
                          << "  -i, --input FILE     Input file (default: stdin)\n"
                          << "  -o, --output FILE    Output file (default: stdout)\n"
                          << "  --config FILE        Session options file (key=value lines, @file syntax)\n"
                          << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: warn)\n"
                          << "  --detect-recursions  Detect cyclic references\n"
                          << "  --ws                 Indent the output\n"
                          << "  --profile            Print timing statistics to stderr\n"
                          << "  -h, --help           Show this help\n";
                return 0;
            } else {
                std::cerr << "Error: Unknown argument: " << arg << std::endl;
                return 1;
            }
        }

        Logger::instance().setLevel(logLevel);
        Profiler::instance().setEnabled(enableProfiler);

        // Config file first, command line flags override it
        SessionOptions options;
        if (!configFile.empty()) {
            options.applyFile(configFile);
        }
        if (detectRecursions) options.detectRecursions = true;
        if (useWhitespace) options.useWhitespace = true;
        if (to.empty()) {
            to = options.mediaType.empty() ? "json" : options.mediaType;
        }

        MediaType inputType = formats::FormatRegistry::resolveFormatName(from);
        MediaType outputType = formats::FormatRegistry::resolveFormatName(to);

        const auto& registry = formats::FormatRegistry::instance();
        auto parser = registry.getParser(inputType);
        if (!parser) {
            throw std::invalid_argument("No parser for " + inputType.toString());
        }
        auto serializer = registry.getSerializer(outputType);
        if (!serializer) {
            throw std::invalid_argument("No serializer for " + outputType.toString());
        }

        MarshalContext context;
        context.freeze();

        LOG_INFO("Converting " + inputType.toString() + " to " + outputType.toString());
        std::string input = readInput(inputPath);
        Pojo document = parser->parse(context, input, nullptr, options);
        std::string output = serializer->serialize(context, document, nullptr, options);
        if (!serializer->isBinary() && (outputPath.empty() || outputPath == "-")) {
            output += "\n";
        }
        writeOutput(outputPath, output);

        if (Profiler::instance().isEnabled()) {
            std::cerr << Profiler::instance().formatStats() << std::endl;
        }

    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    return 0;
}
