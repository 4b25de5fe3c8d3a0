#include "tangram/Configuration.h"
#include "tangram/model/Piece.h"
#include "tangram/model/PieceCodec.h"
#include "tangram/model/ShapeKind.h"
#include "tangram/utils/Log.h"

#include <SDL3/SDL.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace tangram;
using namespace tangram::model;

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --config <file>  Load tolerances and unit from a JSON file");
    SDL_Log("  --unit <value>   Override the base unit");
    SDL_Log("  --dump-set       Print a tray layout of the seven pieces as JSON");
    SDL_Log("  --verbose        Enable geometry debug logging");
    SDL_Log("  --help           Show this help message");
}

// Seven pieces side by side along +x, unrotated
std::vector<Piece> trayLayout(const Configuration& config) {
    static const PieceColor COLORS[] = {
        PieceColor::Red, PieceColor::Blue, PieceColor::Green, PieceColor::Yellow,
        PieceColor::Orange, PieceColor::Purple, PieceColor::Cyan
    };

    std::vector<Piece> pieces;
    double x = 0.0;
    size_t i = 0;
    for (ShapeKind kind : ShapeCatalog::allKinds()) {
        glm::dvec2 frame = ShapeCatalog::frameSize(kind, config.unit);
        // Square is centered on its anchor, the others start at it
        double offset = (kind == ShapeKind::Square) ? frame.x / 2.0 : 0.0;
        pieces.emplace_back(kind, geom::Point(x + offset, 0.0), 0.0, COLORS[i++], config.unit);
        x += frame.x + config.unit * 0.5;
    }
    return pieces;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    double unitOverride = 0.0;
    bool dumpSet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --config requires a value");
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--unit") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --unit requires a value");
                return 1;
            }
            unitOverride = std::atof(argv[++i]);
            if (unitOverride <= 0.0) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: --unit must be positive");
                return 1;
            }
        } else if (arg == "--dump-set") {
            dumpSet = true;
        } else if (arg == "--verbose") {
            SDL_SetLogPriority(LOG_CATEGORY_GEOMETRY, SDL_LOG_PRIORITY_DEBUG);
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: Unknown option %s", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    Configuration config = configPath.empty() ? Configuration::defaults()
                                              : Configuration::loadFromJson(configPath);
    if (unitOverride > 0.0) {
        config.unit = unitOverride;
    }
    config.log();

    for (ShapeKind kind : ShapeCatalog::allKinds()) {
        SDL_Log("  %-18s %zu vertices, area %.2f",
                ShapeCatalog::displayName(kind),
                ShapeCatalog::vertexCount(kind),
                ShapeCatalog::area(kind, config.unit));
    }
    SDL_Log("Total area: %.2f", ShapeCatalog::totalArea(config.unit));

    geom::ValidationResult result = ShapeCatalog::validateCatalog(config);
    if (!result) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Catalog invalid (%s): %s",
                     geom::geometryErrorName(result.error), result.message.c_str());
        return 1;
    }
    SDL_Log("Catalog valid");

    if (dumpSet) {
        std::cout << PieceCodec::setToJson(trayLayout(config)).dump(2) << std::endl;
    }

    return 0;
}
