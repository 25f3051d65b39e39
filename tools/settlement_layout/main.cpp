// Standalone settlement layout tool
// Generates street and building layouts and writes JSON plus an SVG preview

#include "SettlementSVG.h"
#include "settlegen/io/SettlementJson.h"
#include "settlegen/layout/SettlementGenerator.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace settlegen;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <output_dir> [options]\n"
              << "\n"
              << "Generates settlement layouts (streets, buildings, entry points).\n"
              << "\n"
              << "Arguments:\n"
              << "  output_dir       Directory for output files\n"
              << "\n"
              << "Options:\n"
              << "  --seed <value>              Random seed (default: 1)\n"
              << "  --size <name>               hamlet, village, town or city (default: village)\n"
              << "  --layout <name>             organic, grid or mixed (default: drawn per size)\n"
              << "  --axis <radians>            Main axis angle (default: drawn)\n"
              << "  --density <value>           Density multiplier (default: 1.0)\n"
              << "  --count <value>             Number of settlements, laid out in a row (default: 1)\n"
              << "  --catalog <path>            Building catalog JSON (default: built-in tables)\n"
              << "  --bounds <minX> <minZ> <maxX> <maxZ>\n"
              << "                              Map extent buildings must stay inside\n"
              << "  --svg-width <value>         SVG output width (default: 2048)\n"
              << "  --svg-height <value>        SVG output height (default: 2048)\n"
              << "  --help                      Show this help message\n"
              << "\n"
              << "Output files:\n"
              << "  settlements.json   Settlement records\n"
              << "  settlements.svg    SVG preview\n"
              << "\n"
              << "Example:\n"
              << "  " << programName << " ./out --seed 42 --size town --layout grid\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string outputDir = argv[1];
    uint32_t seed = 1;
    int count = 1;
    int svgWidth = 2048;
    int svgHeight = 2048;
    std::string catalogPath;
    SettlementRequest request;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--size" && i + 1 < argc) {
                auto size = parseSettlementSize(argv[++i]);
                if (!size) {
                    std::cerr << "Unknown settlement size: " << argv[i] << "\n";
                    return 1;
                }
                request.size = *size;
            } else if (arg == "--layout" && i + 1 < argc) {
                auto layout = parseLayoutType(argv[++i]);
                if (!layout) {
                    std::cerr << "Unknown layout: " << argv[i] << "\n";
                    return 1;
                }
                request.layout = *layout;
            } else if (arg == "--axis" && i + 1 < argc) {
                request.mainAxis = std::stof(argv[++i]);
            } else if (arg == "--density" && i + 1 < argc) {
                request.density = std::stof(argv[++i]);
            } else if (arg == "--count" && i + 1 < argc) {
                count = std::max(1, std::stoi(argv[++i]));
            } else if (arg == "--catalog" && i + 1 < argc) {
                catalogPath = argv[++i];
            } else if (arg == "--bounds" && i + 4 < argc) {
                MapBounds bounds;
                bounds.minX = std::stof(argv[++i]);
                bounds.minZ = std::stof(argv[++i]);
                bounds.maxX = std::stof(argv[++i]);
                bounds.maxZ = std::stof(argv[++i]);
                request.mapBounds = bounds;
            } else if (arg == "--svg-width" && i + 1 < argc) {
                svgWidth = std::stoi(argv[++i]);
            } else if (arg == "--svg-height" && i + 1 < argc) {
                svgHeight = std::stoi(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    BuildingCatalog catalog = BuildingCatalog::builtin();
    if (!catalogPath.empty()) {
        auto loaded = BuildingCatalog::loadFromFile(catalogPath);
        if (!loaded) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load catalog: %s", catalogPath.c_str());
            return 1;
        }
        catalog = std::move(*loaded);
    }

    std::filesystem::create_directories(outputDir);

    SDL_Log("Settlement Layout");
    SDL_Log("=================");
    SDL_Log("Output: %s", outputDir.c_str());
    SDL_Log("Seed: %u", seed);
    SDL_Log("Size: %s", getSettlementSizeName(request.size));
    SDL_Log("Layout: %s", request.layout ? getLayoutTypeName(*request.layout) : "weighted");
    SDL_Log("Density: %.2f", request.density);
    SDL_Log("Settlements: %d", count);

    SettlementGenerator generator(seed, catalog);
    generator.setEventCallback(logEventSink());

    // Space settlements so their largest possible radii never touch
    const SettlementParams& params = catalog.params(request.size);
    float density = (std::isfinite(request.density) && request.density > 0.0f)
        ? std::min(request.density, generator.config().maxDensity)
        : 1.0f;
    float spacing = 2.0f * params.radius.max * std::sqrt(density) + 50.0f;

    std::vector<Settlement> settlements;
    settlements.reserve(count);
    for (int i = 0; i < count; i++) {
        request.position = glm::vec2((static_cast<float>(i) - 0.5f * static_cast<float>(count - 1)) * spacing, 0.0f);
        settlements.push_back(generator.generate(request));

        const Settlement& s = settlements.back();
        SDL_Log("  %s \"%s\": %s, radius %.1f m, %zu streets, %zu/%d buildings, %zu entry points",
                s.id.c_str(), s.name.c_str(), getLayoutTypeName(s.layoutType), s.radius,
                s.streets.size(), s.buildings.size(), s.targetBuildingCount, s.entryPoints.size());
    }

    std::string settlementsPath = outputDir + "/settlements.json";
    std::string svgPath = outputDir + "/settlements.svg";

    if (!io::saveSettlements(settlementsPath, settlements)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to save settlements!");
        return 1;
    }

    if (!writeSettlementsSVG(svgPath, settlements, svgWidth, svgHeight)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to save SVG!");
        return 1;
    }

    SDL_Log("Settlement layout complete!");
    SDL_Log("Buildings: %zu, streets: %zu",
            SettlementGenerator::flattenBuildings(settlements).size(),
            SettlementGenerator::flattenStreets(settlements).size());
    SDL_Log("Output files:");
    SDL_Log("  %s", settlementsPath.c_str());
    SDL_Log("  %s", svgPath.c_str());

    return 0;
}
