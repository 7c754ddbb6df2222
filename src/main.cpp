#include "batch.hpp"
#include "catalog.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "texture_io.hpp"
#include "version.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> writeConfigPath;
    std::optional<std::string> outputDir;
    std::optional<uint32_t> seed;
    std::optional<WoodStyle> wood;
    std::vector<std::string> only;
    bool skipExisting = false;
    bool quiet = false;
    bool list = false;
    bool help = false;
    bool version = false;
};

void printUsage(const char* exe) {
    std::cout
        << PROCTEX_APPNAME << " " << PROCTEX_VERSION << "\n"
        << "Usage: " << (exe ? exe : "proctex") << " [options]\n\n"
        << "Generates 16x16 material textures (24-bit BMP) for the renderer.\n\n"
        << "Options:\n"
        << "  --out <dir>            Output directory (default: assets/textures)\n"
        << "  --seed <n>             Reproduce a batch (decimal or 0x hex; 0 = random)\n"
        << "  --only <name>          Generate only this material (repeatable)\n"
        << "  --wood <rings|circles> Wood grain style\n"
        << "  --skip-existing        Keep textures that already exist\n"
        << "  --config <path>        Load settings from an INI file\n"
        << "  --write-config <path>  Write a commented default settings file and exit\n"
        << "  --list                 List materials and frame counts, then exit\n"
        << "  --quiet                Only print errors and the summary\n"
        << "\n"
        << "  --version, -v          Print version and exit\n"
        << "  --help, -h             Show this help and exit\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

// Returns false (after printing why) on a malformed command line.
bool parseArgs(int argc, char** argv, CliOptions& o) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;

        if (a == "--help" || a == "-h") {
            o.help = true;
        } else if (a == "--version" || a == "-v") {
            o.version = true;
        } else if (a == "--list") {
            o.list = true;
        } else if (a == "--quiet") {
            o.quiet = true;
        } else if (a == "--skip-existing") {
            o.skipExisting = true;
        } else if (a == "--out" || a == "--config" || a == "--write-config" ||
                   a == "--seed" || a == "--only" || a == "--wood") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "Missing value for " << a << "\n";
                return false;
            }
            if (a == "--out") {
                o.outputDir = v;
            } else if (a == "--config") {
                o.configPath = v;
            } else if (a == "--write-config") {
                o.writeConfigPath = v;
            } else if (a == "--only") {
                o.only.push_back(v);
            } else if (a == "--seed") {
                uint32_t s = 0;
                if (!parseSeed(v, s)) {
                    std::cerr << "Invalid --seed value: " << v << "\n";
                    return false;
                }
                o.seed = s;
            } else {
                WoodStyle w = WoodStyle::Rings;
                if (!parseWoodStyle(v, w)) {
                    std::cerr << "Invalid --wood value: " << v << " (expected rings or circles)\n";
                    return false;
                }
                o.wood = w;
            }
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            return false;
        }
    }
    return true;
}

void printCatalog() {
    std::cout << std::left;
    for (const MaterialDef& def : materialCatalog()) {
        std::cout << "  " << std::setw(14) << def.name
                  << std::setw(18) << groupLabel(def.group)
                  << def.frameCount << (def.frameCount == 1 ? " frame" : " frames");
        if (def.frameSeconds > 0.0f) std::cout << " @ " << def.frameSeconds << "s";
        std::cout << "\n";
    }
    std::cout << "  (" << materialCatalog().size() << " materials, "
              << catalogFileCount() << " files)\n";
}

std::string hexSeed(uint32_t s) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(8) << std::setfill('0') << s;
    return ss.str();
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        std::cerr << "Run with --help for usage.\n";
        return 1;
    }
    if (cli.help) {
        printUsage(argc > 0 ? argv[0] : "proctex");
        return 0;
    }
    if (cli.version) {
        std::cout << PROCTEX_APPNAME << " " << PROCTEX_VERSION << "\n";
        return 0;
    }
    if (cli.list) {
        printCatalog();
        return 0;
    }
    if (cli.writeConfigPath) {
        if (!writeDefaultSettings(*cli.writeConfigPath)) {
            std::cerr << "Could not write " << *cli.writeConfigPath << "\n";
            return 1;
        }
        std::cout << "Wrote " << *cli.writeConfigPath << "\n";
        return 0;
    }

    // Settings file first, then CLI overrides.
    Settings settings;
    if (cli.configPath) {
        std::error_code ec;
        if (!std::filesystem::exists(*cli.configPath, ec)) {
            std::cerr << "Config file not found: " << *cli.configPath << "\n";
            return 1;
        }
        settings = loadSettings(*cli.configPath);
    }
    if (cli.outputDir) settings.outputDir = *cli.outputDir;
    if (cli.seed) settings.seed = *cli.seed;
    if (cli.wood) settings.woodStyle = *cli.wood;
    if (cli.skipExisting) settings.skipExisting = true;
    if (cli.quiet) settings.verbose = false;

    std::vector<const MaterialDef*> materials;
    if (cli.only.empty()) {
        for (const MaterialDef& def : materialCatalog()) materials.push_back(&def);
    } else {
        for (const std::string& name : cli.only) {
            const MaterialDef* def = findMaterial(name);
            if (!def) {
                std::cerr << "Unknown material: " << name << " (see --list)\n";
                return 1;
            }
            materials.push_back(def);
        }
    }

    std::string err;
    if (!initImaging(&err)) {
        std::cerr << "Imaging layer unavailable: " << err << "\n";
        return 1;
    }

    if (!ensureOutputDir(settings.outputDir, &err)) {
        std::cerr << "Error: " << err << "\n";
        shutdownImaging();
        return 1;
    }

    const uint32_t runSeed = settings.seed ? settings.seed : RNG::entropySeed();

    GenOptions opt;
    opt.wood = settings.woodStyle;

    if (settings.verbose) {
        std::cout << PROCTEX_APPNAME << " " << PROCTEX_VERSION << "\n"
                  << "Output: " << settings.outputDir << "\n"
                  << "Seed:   " << hexSeed(runSeed) << (settings.seed ? "" : " (random)") << "\n"
                  << "Wood:   " << woodStyleName(opt.wood) << "\n";
    }

    BmpDirectorySink sink(settings.outputDir, settings.skipExisting);
    BatchReport report;
    const bool ok = runBatch(materials, runSeed, opt, sink, settings.verbose, report, &err);

    shutdownImaging();

    if (!ok) {
        // Frames already written stay on disk.
        std::cerr << "Error: " << err << "\n"
                  << "Stopped after " << sink.written() << " file(s).\n";
        return 1;
    }

    std::cout << "\nDone: " << sink.written() << " written, " << sink.skipped()
              << " skipped (" << report.materials << " materials) in " << settings.outputDir << "\n";
    return 0;
}
