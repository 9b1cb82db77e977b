#include "PlantGrid.h"

#include <gtest/gtest.h>

#include <array>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

template <int DIM>
void expectBoardConsistent(const PlantGrid<DIM> &grid) {
    for (int i = 0; i < grid.total_num_cells; i++) {
        const CellPopulation &cell = grid.cells[i];
        ASSERT_LE(cell.size(), grid.storage_limit) << "cell " << i;

        int adults = 0;
        StageCounts expected;
        for (const Plant &p : cell.plants()) {
            ASSERT_FALSE(p.isDead());
            if (p.isAdult()) {
                adults++;
                expected[p.speciesID()][ADULT_BUCKET]++;
            } else {
                expected[p.speciesID()][JUVENILE_BUCKET]++;
            }
        }
        ASSERT_LE(adults, 1) << "cell " << i;
        ASSERT_EQ(cell.hasAdult(), adults == 1) << "cell " << i;
        ASSERT_EQ(cell.counts(), expected) << "cell " << i;
        ASSERT_TRUE(grid.staging[i].empty()) << "staging cell " << i;
    }
}

struct PlantGridTest : public ::testing::Test {
    SpeciesCatalog catalog;
    // immortal and never crowded
    const Species &hardy = catalog.create(-1, 1.0, 1.0, 10, 10, 1, 0.0, 0.0);
    // adults die as soon as a conspecific is in range
    const Species &touchy = catalog.create(-1, 1.0, 1.0, 10, 10, 0, 2.0, 0.0);
};

}  // namespace

// ---------------------------------------------------------------------------
// Construction and indexing
// ---------------------------------------------------------------------------
TEST(PlantGridConfigTest, RejectsBadConfiguration) {
    EXPECT_THROW(PlantGrid<2>(0, 10, DispersalMode::AdultDispersal, 1.0, 1), std::invalid_argument);
    EXPECT_THROW(PlantGrid<2>(5, 0, DispersalMode::AdultDispersal, 1.0, 1), std::invalid_argument);
    EXPECT_THROW(PlantGrid<2>(5, 10, DispersalMode::AdultDispersal, 0.0, 1), std::invalid_argument);
}

TEST(PlantGridConfigTest, FlatIndexRunsAlongFirstAxis) {
    PlantGrid<2> grid(4, 10, DispersalMode::JuvenileDispersal, 1.0, 1);
    EXPECT_EQ(grid.total_num_cells, 16);
    EXPECT_EQ(grid.flattenIdx({1, 2}), 1 + 2 * 4);
    std::array<int, 2> back = grid.unflattenIdx(9);
    EXPECT_EQ(back[0], 1);
    EXPECT_EQ(back[1], 2);
    EXPECT_FALSE(grid.inDomain({4, 0}));
    EXPECT_FALSE(grid.inDomain({0, -1}));
    EXPECT_THROW(grid.cellAt({-1, 0}), std::out_of_range);
}

// ---------------------------------------------------------------------------
// Neighborhoods
// ---------------------------------------------------------------------------
TEST_F(PlantGridTest, MooreBlockIsClippedAtEdges) {
    PlantGrid<2> grid(5, 10, DispersalMode::AdultDispersal, 1.0, 3);
    for (int i = 0; i < grid.total_num_cells; i++) {
        grid.placePlant(grid.unflattenIdx(i), makeAdult(hardy));
    }
    EXPECT_EQ(grid.neighborhoodCounts({0, 0}).at(hardy.speciesID), 4);
    EXPECT_EQ(grid.neighborhoodCounts({4, 4}).at(hardy.speciesID), 4);
    EXPECT_EQ(grid.neighborhoodCounts({0, 2}).at(hardy.speciesID), 6);
    EXPECT_EQ(grid.neighborhoodCounts({2, 2}).at(hardy.speciesID), 9);
}

TEST_F(PlantGridTest, NoWraparound) {
    PlantGrid<2> grid(5, 10, DispersalMode::AdultDispersal, 1.0, 3);
    grid.placePlant({0, 0}, makeAdult(hardy));
    EXPECT_TRUE(grid.neighborhoodCounts({4, 4}).empty());
    EXPECT_TRUE(grid.neighborhoodCounts({4, 0}).empty());
    EXPECT_TRUE(grid.neighborhoodCounts({0, 4}).empty());
    EXPECT_EQ(grid.neighborhoodCounts({1, 1}).at(hardy.speciesID), 1);
}

TEST_F(PlantGridTest, CombinedAggregationCountsJuveniles) {
    PlantGrid<2> grid(3, 10, DispersalMode::JuvenileDispersal, 1.0, 3);
    grid.placePlant({1, 1}, makeAdult(hardy));
    grid.placePlant({1, 1}, makeJuvenile(touchy));
    grid.placePlant({0, 1}, makeJuvenile(touchy));

    SpeciesCounts combined = grid.neighborhoodCounts({1, 1});
    EXPECT_EQ(combined.at(hardy.speciesID), 1);
    EXPECT_EQ(combined.at(touchy.speciesID), 2);
}

TEST_F(PlantGridTest, AdultBoardRefusesJuveniles) {
    PlantGrid<2> grid(3, 10, DispersalMode::AdultDispersal, 1.0, 3);
    EXPECT_FALSE(grid.admitsStage(LifeStage::Juvenile));
    EXPECT_TRUE(grid.admitsStage(LifeStage::Adult));
    EXPECT_THROW(grid.placePlant({1, 1}, makeJuvenile(hardy)), std::invalid_argument);
    EXPECT_EQ(grid.population(), 0);

    grid.placePlant({1, 1}, makeAdult(hardy));
    EXPECT_EQ(grid.neighborhoodCounts({1, 1}).at(hardy.speciesID), 1);
}

TEST_F(PlantGridTest, InconsistentBoardFailsBeforeAnyCellMoves) {
    // a juvenile slipped past placePlant has no entry in an adult-only map
    PlantGrid<2> grid(3, 10, DispersalMode::AdultDispersal, 0.01, 4);
    grid.placePlant({0, 0}, makeAdult(hardy, 6));
    grid.cells[grid.flattenIdx({2, 2})].addPlant(makeJuvenile(touchy, 1), grid.rng);

    EXPECT_THROW(grid.make_tick(), NeighborMapInconsistency);
    EXPECT_EQ(grid.tick_count, 0);
    EXPECT_EQ(grid.cellAt({0, 0}).currentAdult()->age, 6);
    for (const CellPopulation &staged : grid.staging) {
        EXPECT_TRUE(staged.empty());
    }
}

TEST_F(PlantGridTest, OneDimensionalNeighborhoods) {
    PlantGrid<1> line(5, 10, DispersalMode::AdultDispersal, 1.0, 3);
    for (int i = 0; i < 5; i++) {
        line.placePlant({i}, makeAdult(hardy));
    }
    EXPECT_EQ(line.neighborhoodCounts({0}).at(hardy.speciesID), 2);
    EXPECT_EQ(line.neighborhoodCounts({2}).at(hardy.speciesID), 3);
    EXPECT_EQ(line.neighborhoodCounts({4}).at(hardy.speciesID), 2);
}

// ---------------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------------
TEST_F(PlantGridTest, EveryCellSeesThePreTickBoard) {
    // Each adult kills the other; updating in place would spare the second.
    PlantGrid<2> grid(4, 10, DispersalMode::AdultDispersal, 1.0, 5);
    grid.placePlant({1, 1}, makeAdult(touchy));
    grid.placePlant({2, 1}, makeAdult(touchy));
    grid.make_tick();
    EXPECT_EQ(grid.population(), 0);
}

TEST_F(PlantGridTest, SingleFounderGrowsInPlace) {
    PlantGrid<2> grid(3, 10, DispersalMode::JuvenileDispersal, 1e-6, 8);
    grid.placePlant({1, 1}, makeAdult(hardy));

    grid.make_tick();
    const CellPopulation &center = grid.cellAt({1, 1});
    ASSERT_TRUE(center.hasAdult());
    EXPECT_EQ(center.currentAdult()->age, 1);
    EXPECT_EQ(grid.population(), 2);
    StageCounts totals = grid.totalCounts();
    EXPECT_EQ(totals.at(hardy.speciesID)[ADULT_BUCKET], 1);
    EXPECT_EQ(totals.at(hardy.speciesID)[JUVENILE_BUCKET], 1);

    grid.make_tick();
    EXPECT_EQ(grid.population(), 3);
    EXPECT_EQ(grid.cellAt({1, 1}).currentAdult()->age, 2);
    std::vector<int> residents = grid.residentSpecies();
    for (int i = 0; i < grid.total_num_cells; i++) {
        EXPECT_EQ(residents[i], i == grid.flattenIdx({1, 1}) ? hardy.speciesID : -1);
    }
}

TEST(PlantGridScenarioTest, LoneAdultOnSmallBoard) {
    SpeciesCatalog catalog;
    const Species &sp = catalog.create(-1, 1.0, 1.0, 3, 5, 1, 0.0, 0.0);
    PlantGrid<2> grid(3, 50, DispersalMode::JuvenileDispersal, 0.3, 2024);
    grid.placePlant({1, 1}, makeAdult(sp));

    grid.make_tick();

    const CellPopulation &center = grid.cellAt({1, 1});
    ASSERT_TRUE(center.hasAdult());
    EXPECT_EQ(center.currentAdult()->species, &sp);
    EXPECT_EQ(center.currentAdult()->age, 1);

    int offspring = 0;
    for (const CellPopulation &cell : grid.cells) {
        for (const Plant &p : cell.plants()) {
            if (p.isJuvenile()) {
                EXPECT_EQ(p.age, 0);
                offspring++;
            }
        }
    }
    EXPECT_EQ(offspring, 1);
    EXPECT_EQ(grid.population(), 2);
}

TEST_F(PlantGridTest, OffspringLeavingTheBoardAreLost) {
    const Species &prolific = catalog.create(-1, 1.0, 1.0, 10, 10, 5, 0.0, 0.0);
    PlantGrid<2> grid(1, 10, DispersalMode::JuvenileDispersal, 1000.0, 9);
    grid.placePlant({0, 0}, makeAdult(prolific));
    grid.run_ticks(10);
    EXPECT_EQ(grid.population(), 1);
    EXPECT_TRUE(grid.cellAt({0, 0}).hasAdult());
}

TEST(PlantGridConfigTest, RejectsBoardsTooLargeToIndex) {
    EXPECT_THROW(PlantGrid<2>(50000, 10, DispersalMode::JuvenileDispersal, 1.0, 1),
                 std::invalid_argument);
    EXPECT_THROW(PlantGrid<3>(2000, 10, DispersalMode::JuvenileDispersal, 1.0, 1),
                 std::invalid_argument);
}

TEST_F(PlantGridTest, ThreeDimensionalBoard) {
    PlantGrid<3> cube(3, 10, DispersalMode::JuvenileDispersal, 1e-6, 6);
    EXPECT_EQ(cube.total_num_cells, 27);
    for (int i = 0; i < cube.total_num_cells; i++) {
        cube.placePlant(cube.unflattenIdx(i), makeAdult(hardy));
    }
    EXPECT_EQ(cube.neighborhoodCounts({0, 0, 0}).at(hardy.speciesID), 8);
    EXPECT_EQ(cube.neighborhoodCounts({1, 1, 0}).at(hardy.speciesID), 18);
    EXPECT_EQ(cube.neighborhoodCounts({1, 1, 1}).at(hardy.speciesID), 27);

    // each immortal adult keeps its cell and drops one juvenile on itself
    cube.make_tick();
    EXPECT_EQ(cube.population(), 54);
    EXPECT_EQ(cube.totalCounts().at(hardy.speciesID)[ADULT_BUCKET], 27);
    expectBoardConsistent(cube);
}

TEST_F(PlantGridTest, TickCounterAdvances) {
    PlantGrid<2> grid(3, 10, DispersalMode::JuvenileDispersal, 1.0, 1);
    grid.run_ticks(7);
    EXPECT_EQ(grid.tick_count, 7);
    grid.make_tick();
    EXPECT_EQ(grid.tick_count, 8);
}

class PlantGridModeTest : public ::testing::TestWithParam<DispersalMode> {};

TEST_P(PlantGridModeTest, InvariantsHoldOverManyTicks) {
    SpeciesCatalog catalog;
    std::mt19937 speciesRng(17);
    generateSpecies(catalog, 6, 0.5, 3, 20, 4, 0.02, 0.01, speciesRng);

    PlantGrid<2> grid(12, 8, GetParam(), 1.5, 21);
    grid.seedFounders(catalog, 10);
    expectBoardConsistent(grid);
    for (int t = 0; t < 40; t++) {
        grid.make_tick();
        expectBoardConsistent(grid);
        if (HasFatalFailure()) {
            FAIL() << "after tick " << grid.tick_count;
        }
    }
    EXPECT_EQ(grid.tick_count, 40);
}

TEST_P(PlantGridModeTest, SameSeedSameRun) {
    SpeciesCatalog catalog;
    std::mt19937 speciesRng(5);
    generateSpecies(catalog, 4, 0.5, 3, 20, 3, 0.02, 0.01, speciesRng);

    PlantGrid<2> first(10, 10, GetParam(), 2.0, 77);
    PlantGrid<2> second(10, 10, GetParam(), 2.0, 77);
    first.seedFounders(catalog, 6);
    second.seedFounders(catalog, 6);
    first.run_ticks(25);
    second.run_ticks(25);

    EXPECT_EQ(first.snapshotCounts(), second.snapshotCounts());
    EXPECT_EQ(first.residentSpecies(), second.residentSpecies());
}

INSTANTIATE_TEST_SUITE_P(BothModes, PlantGridModeTest,
                         ::testing::Values(DispersalMode::AdultDispersal,
                                           DispersalMode::JuvenileDispersal));

// ---------------------------------------------------------------------------
// Founders and reset
// ---------------------------------------------------------------------------
TEST_F(PlantGridTest, AdultFoundersTakeDistinctCells) {
    const Species &third = catalog.create(-1, 0.5, 0.5, 3, 5, 1, 0.0, 0.0);
    PlantGrid<2> grid(10, 10, DispersalMode::AdultDispersal, 1.0, 12);
    grid.seedFounders(catalog, 4);

    StageCounts totals = grid.totalCounts();
    // the first species in the catalog is merged first, so it never loses a cell
    EXPECT_EQ(totals.at(hardy.speciesID)[ADULT_BUCKET], 4);
    int adults = 0;
    for (const auto &entry : totals) {
        EXPECT_EQ(entry.second[JUVENILE_BUCKET], 0);
        EXPECT_LE(entry.second[ADULT_BUCKET], 4);
        adults += entry.second[ADULT_BUCKET];
    }
    EXPECT_EQ(grid.population(), adults);
    EXPECT_GE(adults, 4);
    EXPECT_LE(adults, 12);
    EXPECT_NE(catalog.find(third.speciesID), nullptr);
    expectBoardConsistent(grid);
    EXPECT_EQ(grid.tick_count, 0);
}

TEST_F(PlantGridTest, JuvenileFoundersAreAllPlaced) {
    PlantGrid<2> grid(6, 50, DispersalMode::JuvenileDispersal, 1.0, 12);
    grid.seedFounders(catalog, 5);

    StageCounts totals = grid.totalCounts();
    EXPECT_EQ(grid.population(), 10);
    EXPECT_EQ(totals.at(hardy.speciesID)[JUVENILE_BUCKET], 5);
    EXPECT_EQ(totals.at(touchy.speciesID)[JUVENILE_BUCKET], 5);
    EXPECT_EQ(totals.at(hardy.speciesID)[ADULT_BUCKET], 0);
    expectBoardConsistent(grid);
}

TEST_F(PlantGridTest, RejectsImpossibleFounderCounts) {
    PlantGrid<2> grid(2, 10, DispersalMode::AdultDispersal, 1.0, 1);
    EXPECT_THROW(grid.seedFounders(catalog, 5), std::invalid_argument);
    EXPECT_THROW(grid.seedFounders(catalog, -1), std::invalid_argument);
    EXPECT_EQ(grid.population(), 0);
}

TEST_F(PlantGridTest, ClearBoardResetsEverything) {
    PlantGrid<2> grid(5, 10, DispersalMode::JuvenileDispersal, 1.0, 2);
    grid.seedFounders(catalog, 3);
    grid.placePlant({2, 2}, makeAdult(hardy));
    grid.run_ticks(2);
    ASSERT_GT(grid.population(), 0);

    grid.clearBoard();
    EXPECT_EQ(grid.population(), 0);
    EXPECT_EQ(grid.tick_count, 0);
    EXPECT_TRUE(grid.totalCounts().empty());
}
