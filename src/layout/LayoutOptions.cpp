#include "strata/layout/config/LayoutOptions.h"

namespace strata {

LayoutOptions LayoutOptions::fromPreset(LayoutPreset preset) {
    LayoutOptions options;

    switch (preset) {
        case LayoutPreset::Default:
            break;

        case LayoutPreset::Tree:
            options.levelSeparation = 80.0f;
            options.nodeSeparation = 40.0f;
            options.subtreeSeparation = 60.0f;
            options.crossingIterations = 12;
            options.compact = true;
            break;

        case LayoutPreset::Dag:
            options.levelSeparation = 120.0f;
            options.nodeSeparation = 60.0f;
            options.subtreeSeparation = 100.0f;
            options.rankingAlgorithm = RankingAlgorithm::NetworkSimplex;
            options.crossingMinimization = CrossingMinimization::Median;
            options.crossingIterations = 48;
            options.compact = false;
            break;

        case LayoutPreset::Compact:
            options.levelSeparation = 60.0f;
            options.nodeSeparation = 30.0f;
            options.subtreeSeparation = 40.0f;
            options.rankingAlgorithm = RankingAlgorithm::TightTree;
            options.crossingIterations = 36;
            options.compact = true;
            break;

        case LayoutPreset::Wide:
            options.direction = Direction::LeftToRight;
            options.levelSeparation = 150.0f;
            options.nodeSeparation = 80.0f;
            options.subtreeSeparation = 120.0f;
            options.compact = false;
            break;
    }

    return options;
}

}  // namespace strata
