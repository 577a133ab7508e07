#include <strata/strata.h>
#include <strata/common/Logger.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace strata;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <graph.json> [options.json | preset] [-o output.json]\n"
              << "  preset: default, tree, dag, compact, wide\n"
              << "  Without -o the layout is written to stdout.\n";
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    Logger::initialize();

    std::string graphPath;
    std::string optionsArg;
    std::string outputPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-o" && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (graphPath.empty()) {
            graphPath = arg;
        } else if (optionsArg.empty()) {
            optionsArg = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (graphPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // stdout carries the JSON document
    if (outputPath.empty()) {
        Logger::setLevel(LogLevel::Warn);
    }

    std::string graphJson;
    if (!readFile(graphPath, graphJson)) {
        LOG_ERROR("Cannot read graph file '{}'", graphPath);
        return 1;
    }

    LayoutOptions options;
    LayoutPreset preset;
    GraphData graph;

    try {
        graph = LayoutSerializer::graphFromJson(graphJson);

        if (LayoutSerializer::stringToPreset(optionsArg, preset)) {
            options = LayoutOptions::fromPreset(preset);
        } else if (!optionsArg.empty()) {
            std::string optionsJson;
            if (!readFile(optionsArg, optionsJson)) {
                LOG_ERROR("'{}' is neither a preset nor a readable options file", optionsArg);
                return 1;
            }
            options = LayoutSerializer::optionsFromJson(optionsJson);
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }

    SugiyamaLayout layout(options);
    LayoutResult result = layout.layout(graph);

    LOG_INFO("Laid out {} nodes on {} levels ({} crossings)",
             result.nodeCount(), result.levelCount(), result.stats().crossings);

    if (outputPath.empty()) {
        Logger::flush();
        std::cout << result.toJson() << "\n";
    } else if (!LayoutSerializer::saveToFile(result, outputPath)) {
        LOG_ERROR("Cannot write '{}'", outputPath);
        return 1;
    }

    return 0;
}
