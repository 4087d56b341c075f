#include "dat_toolkit/BatchOrchestrator.hpp"
#include "dat_toolkit/ConverterFactory.hpp"
#include "dat_toolkit/Inspector.hpp"
#include "dat_toolkit/Pipeline.hpp"
#include "dat_toolkit/ToolSettings.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
using namespace dat_toolkit;

static void printUsage(std::ostream& os, const char* exe)
{
    os << "Usage: " << exe << " <input> <output> <converter1> [converter2...] [--param value]...\n"
       << "       " << exe << " --batch <input_dir>:<output_dir> [--param value]...\n"
       << "       " << exe << " --inspect <file> [file...] [--max_preview N]\n";
}

static void printHelp(const char* exe)
{
    printUsage(std::cout, exe);
    std::cout << "\nExample: " << exe << " chase.dat preview.png chase2nodes nodes2png --multiplier 8\n";
    std::cout << "         " << exe << " chase.dat - chase2nodes   (writes chase_nodes.dat)\n";
    std::cout << "\nAvailable converters:\n";
    std::cout << "  chase2nodes - Convert chase.dat (20/28-byte records) to nodes.dat\n";
    std::cout << "  nodes2png   - Render a top-down preview of nodes.dat\n";
    std::cout << "\nConversion parameters:\n";
    std::cout << "  --multiplier <v>   - float → node unit scale (default: 8.0)\n";
    std::cout << "  --area_id <n>      - area id of every node (default: 0)\n";
    std::cout << "  --width <n>        - node width (default: 0)\n";
    std::cout << "  --node_type <n>    - node type byte (default: 0)\n";
    std::cout << "  --flags <n>        - flags byte (default: 0)\n";
    std::cout << "  --backup <bool>    - keep <output>.bak of overwritten outputs (default: true)\n";
    std::cout << "  --threads <n>      - batch workers, clamped to 1..16 (default: 4)\n";
    std::cout << "  --max_preview <n>  - entries listed by --inspect (default: 200)\n";
    std::cout << "\nPreview parameters:\n";
    std::cout << "  --w <px> --h <px>  - image size (default: 1024)\n";
}

// ─────────────────────────────── modes ─────────────────────────────────────
static int runInspect(const std::vector<std::string>& files, const ToolSettings& settings)
{
    for (const auto& f : files) {
        InspectReport r = inspectFile(f, settings.maxPreview);
        std::cout << describe(r) << '\n';
        for (size_t i = 0; i < r.chasePreview.size(); ++i) {
            const auto& p = r.chasePreview[i];
            std::cout << "  " << i << ": (" << p.x << ", " << p.y << ", " << p.z << ")\n";
        }
        for (const auto& n : r.nodePreview)
            std::cout << "  id=" << n.nodeId << " pos=(" << n.x << ", " << n.y << ", " << n.z
                      << ") area=" << n.areaId << " width=" << n.width
                      << " type=" << int(n.nodeType) << " flags=" << int(n.flags) << '\n';
    }
    return 0;
}

static int runCliBatch(const std::string& spec, const ToolSettings& settings)
{
    const auto colon = spec.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == spec.size()) {
        std::cerr << "Error: --batch expects <input_dir>:<output_dir>\n";
        return 1;
    }
    const fs::path inDir  = spec.substr(0, colon);
    const fs::path outDir = spec.substr(colon + 1);

    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(inDir))
        if (e.is_regular_file() && e.path().extension() == ".dat")
            files.push_back(e.path());
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        std::cout << "No .dat files found in " << inDir.string() << '\n';
        return 0;
    }

    fs::create_directories(outDir);
    std::vector<FilePair> pairs;
    for (const auto& f : files)
        pairs.push_back({ f, outDir / (f.stem().string() + "_nodes.dat") });

    std::cout << "Starting batch conversion: " << pairs.size() << " files, threads="
              << BatchOrchestrator::clampConcurrency(settings.threads) << '\n';

    BatchSummary sum = runBatch(pairs, settings.params, settings.backup, settings.threads,
        [](const BatchEvent& ev) {
            if (ev.type == BatchEvent::Type::Result)
                (ev.outcome.success ? std::cout : std::cerr) << ev.outcome.message << '\n';
        });

    std::cout << "Batch done. " << sum.succeeded << "/" << sum.total << " converted";
    if (sum.failed) std::cout << ", " << sum.failed << " failed";
    std::cout << '\n';
    return sum.failed ? 1 : 0;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "dat_toolkit v1.0.0\n";
            return 0;
        }
    }

    // Split argv into positionals, --key value parameters and mode flags
    Options opts;
    std::vector<std::string> positional;
    std::string batchSpec;
    bool inspect = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--inspect") {
            inspect = true;
        } else if (arg == "--batch" || arg == "--cli-batch") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires <input_dir>:<output_dir>\n";
                return 1;
            }
            batchSpec = argv[++i];
        } else if (arg.substr(0, 2) == "--") {
            if (i + 1 < argc) {
                opts.params[arg.substr(2)] = argv[i + 1];
                ++i;
            } else {
                std::cerr << "Error: Parameter " << arg << " requires a value\n";
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }

    try {
        const ToolSettings settings = ToolSettings::fromOptions(opts);

        if (inspect) {
            if (positional.empty()) { printUsage(std::cerr, argv[0]); return 1; }
            return runInspect(positional, settings);
        }
        if (!batchSpec.empty())
            return runCliBatch(batchSpec, settings);

        // converter_cli input output converter1 converter2 ...
        if (positional.size() < 3) {
            printUsage(std::cerr, argv[0]);
            std::cerr << "Use --help for more information.\n";
            return 1;
        }
        const std::string in  = positional[0];
        const std::string out = positional[1] == "-" ? std::string() : positional[1];

        Pipeline pipeline;
        for (size_t i = 2; i < positional.size(); ++i)
            pipeline.addStep(ConverterFactory::create(positional[i]));

        pipeline.run(in, out, opts);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
