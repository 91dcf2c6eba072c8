#include <sightline/core/config.hpp>
#include <sightline/core/log.hpp>
#include <sightline/terrain/layout_importer.hpp>
#include <sightline/terrain/zone_sampler.hpp>
#include <sightline/vision/visibility_analysis.hpp>
#include <iostream>
#include <string>

using namespace sightline;

// Usage: visibility_analysis_example <layout.json> [config.json] [player]
// Samples the given player's deployment zones (default "attacker") and prints
// which cells of the board they can see.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <layout.json> [config.json] [player]\n";
        return 1;
    }

    const std::string layout_path = argv[1];
    const std::string player = argc > 3 ? argv[3] : "attacker";

    core::AnalysisConfig config;
    if (argc > 2) {
        auto loaded = core::load_analysis_config(argv[2]);
        if (!loaded) {
            std::cerr << "Config error: " << loaded.error().to_string() << "\n";
            return 1;
        }
        config = *loaded;
    }
    core::apply_logging_config(config.logging);

    auto layout = terrain::LayoutImporter::load_layout(layout_path);
    if (!layout) {
        std::cerr << "Layout error: " << layout.error().to_string() << "\n";
        return 1;
    }

    // The board size comes from the layout
    config.board_width = layout->board_width;
    config.board_height = layout->board_height;

    std::vector<math::Vec2> sources =
        terrain::sample_player_zones(layout->deployment_zones, player, config.zone_sample_spacing);
    std::cout << "Layout '" << layout->name << "': " << layout->pieces.size() << " pieces, "
              << sources.size() << " source points for " << player << "\n";

    vision::VisibilityAnalysis analysis(config);
    auto result = analysis.run(sources, layout->pieces, [](double percent) {
        std::cout << "  " << static_cast<int>(percent) << "%\n";
    });
    if (!result) {
        std::cerr << "Analysis failed: " << result.error().to_string() << "\n";
        core::Logger::instance().shutdown();
        return 1;
    }

    std::cout << vision::render_ascii(*analysis.grid());
    std::cout << vision::to_string(*analysis.stats()) << "\n";

    core::Logger::instance().shutdown();
    return 0;
}
