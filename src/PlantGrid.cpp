/**
 * @file PlantGrid.cpp
 * @brief Implementation of the discrete-time plant competition grid.
 *
 * This file contains the implementation of the PlantGrid class template for
 * boards in 1, 2, or 3 dimensions.
 *
 * @date 2025-02-11
 */

#include <climits>
#include <cmath>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <array>
#include "../include/PlantGrid.h"

//============================================================
//  Implementation of PlantGrid<DIM> members
//============================================================

template <int DIM>
PlantGrid<DIM>::PlantGrid(int boardLength, int storageLimit, DispersalMode dispersalMode,
                          double dispersalStdev, int seed, const DensityMultipliers &mult)
    : board_length(boardLength),
      total_num_cells(0),
      storage_limit(storageLimit),
      mode(dispersalMode),
      dispersal_stdev(dispersalStdev),
      multipliers(mult),
      rng(seed),
      tick_count(0) {
    if (board_length <= 0) {
        throw std::invalid_argument("boardLength must be positive, got " +
                                    std::to_string(board_length));
    }
    if (storage_limit <= 0) {
        throw std::invalid_argument("storageLimit must be positive, got " +
                                    std::to_string(storage_limit));
    }
    if (!(dispersal_stdev > 0.0)) {
        throw std::invalid_argument("dispersal stdev must be positive");
    }

    // 1) shape
    int prod = 1;
    for (int dim = 0; dim < DIM; dim++) {
        if (prod > INT_MAX / board_length) {
            throw std::invalid_argument("boardLength " + std::to_string(board_length) +
                                        " gives more cells than an int can index");
        }
        cell_count[dim] = board_length;
        prod *= board_length;
    }
    total_num_cells = prod;

    // 2) allocate live and staging boards
    cells.assign(total_num_cells, CellPopulation(storage_limit));
    staging.assign(total_num_cells, CellPopulation(storage_limit));
}

template <int DIM>
int PlantGrid<DIM>::flattenIdx(const std::array<int, DIM> &idx) const {
    int f = 0;
    int mul = 1;
    for (int dim = 0; dim < DIM; dim++) {
        f += idx[dim] * mul;
        mul *= cell_count[dim];
    }
    return f;
}

template <int DIM>
std::array<int, DIM> PlantGrid<DIM>::unflattenIdx(int cellIndex) const {
    std::array<int, DIM> cIdx;
    for (int dim = 0; dim < DIM; dim++) {
        cIdx[dim] = cellIndex % cell_count[dim];
        cellIndex /= cell_count[dim];
    }
    return cIdx;
}

template <int DIM>
bool PlantGrid<DIM>::inDomain(const std::array<int, DIM> &idx) const {
    for (int dim = 0; dim < DIM; dim++) {
        if (idx[dim] < 0 || idx[dim] >= cell_count[dim]) {
            return false;
        }
    }
    return true;
}

template <int DIM>
CellPopulation &PlantGrid<DIM>::cellAt(const std::array<int, DIM> &idx) {
    if (!inDomain(idx)) {
        throw std::out_of_range("cell index outside the board");
    }
    return cells[flattenIdx(idx)];
}

template <int DIM>
const CellPopulation &PlantGrid<DIM>::cellAt(const std::array<int, DIM> &idx) const {
    if (!inDomain(idx)) {
        throw std::out_of_range("cell index outside the board");
    }
    return cells[flattenIdx(idx)];
}

//---------------------------------------------------------
//     placePlant, seedFounders, clearBoard
//---------------------------------------------------------

template <int DIM>
void PlantGrid<DIM>::placePlant(const std::array<int, DIM> &idx, const Plant &plant) {
    if (!admitsStage(plant.stage)) {
        throw std::invalid_argument("juveniles cannot live on an adult-dispersal board");
    }
    cellAt(idx).addPlant(plant, rng);
}

/**
 * @brief Places the founding population of every species.
 *
 * Adults go to distinct cells per species (several species may still share a
 * cell; the first one merged becomes resident). Juveniles are placed
 * independently and may share cells.
 */
template <int DIM>
void PlantGrid<DIM>::seedFounders(const SpeciesCatalog &catalog, int startNumber) {
    if (startNumber < 0) {
        throw std::invalid_argument("startNumber must not be negative");
    }
    if (mode == DispersalMode::AdultDispersal && startNumber > total_num_cells) {
        throw std::invalid_argument("startNumber " + std::to_string(startNumber) +
                                    " exceeds the number of cells " +
                                    std::to_string(total_num_cells));
    }

    std::uniform_int_distribution<int> cellDist(0, total_num_cells - 1);
    for (const Species &sp : catalog.species()) {
        if (mode == DispersalMode::AdultDispersal) {
            std::set<int> chosen;
            while ((int)chosen.size() < startNumber) {
                chosen.insert(cellDist(rng));
            }
            for (int c : chosen) {
                staging[c].addAdultUnchecked(makeAdult(sp, 0));
            }
        } else {
            for (int i = 0; i < startNumber; i++) {
                staging[cellDist(rng)].addPlant(makeJuvenile(sp, 0), rng);
            }
        }
    }
    mergeStaging();
}

template <int DIM>
void PlantGrid<DIM>::clearBoard() {
    for (auto &c : cells) {
        c.clear();
    }
    for (auto &c : staging) {
        c.clear();
    }
    tick_count = 0;
}

//---------------------------------------------------------
//     neighborhood aggregation
//---------------------------------------------------------

template <int DIM>
SpeciesCounts PlantGrid<DIM>::neighborhoodCounts(const std::array<int, DIM> &idx) const {
    SpeciesCounts counts;
    std::array<int, DIM> range;
    range.fill(1);
    AggregationMode aggregation = aggregationMode();
    forNeighbors<DIM>(idx, range, [&](const std::array<int, DIM> &nIdx) {
        if (!inDomain(nIdx)) {
            return;  // no wraparound: edge cells see fewer neighbors
        }
        cells[flattenIdx(nIdx)].aggregateInto(counts, aggregation);
    });
    return counts;
}

template <int DIM>
std::vector<SpeciesCounts> PlantGrid<DIM>::makeNeighborhoodMaps() const {
    std::vector<SpeciesCounts> maps(total_num_cells);
    for (int i = 0; i < total_num_cells; i++) {
        maps[i] = neighborhoodCounts(unflattenIdx(i));
    }
    return maps;
}

//---------------------------------------------------------
//     dispersal
//---------------------------------------------------------

template <int DIM>
std::array<int, DIM> PlantGrid<DIM>::sampleDisplacement() {
    std::normal_distribution<double> gauss(0.0, dispersal_stdev);
    std::array<int, DIM> shift;
    for (int d = 0; d < DIM; d++) {
        shift[d] = (int)std::lround(gauss(rng));
    }
    return shift;
}

template <int DIM>
void PlantGrid<DIM>::stageOffspring(const std::array<int, DIM> &origin,
                                    const CellPopulation &offspring) {
    for (const Plant &child : offspring.plants()) {
        std::array<int, DIM> shift = sampleDisplacement();
        std::array<int, DIM> target;
        for (int d = 0; d < DIM; d++) {
            target[d] = origin[d] + shift[d];
        }
        if (!inDomain(target)) {
            continue;  // dispersed off the board
        }
        CellPopulation &dest = staging[flattenIdx(target)];
        if (mode == DispersalMode::AdultDispersal) {
            dest.addAdultUnchecked(child);
        } else {
            dest.addPlant(child, rng);
        }
    }
}

template <int DIM>
void PlantGrid<DIM>::mergeStaging() {
    for (int i = 0; i < total_num_cells; i++) {
        if (staging[i].empty()) {
            continue;
        }
        cells[i].mergeFrom(staging[i], rng);
        staging[i].clear();
    }
}

//---------------------------------------------------------
//   make_tick, run_ticks
//---------------------------------------------------------

template <int DIM>
void PlantGrid<DIM>::make_tick() {
    // 1) every neighborhood from the pre-tick board
    std::vector<SpeciesCounts> maps = makeNeighborhoodMaps();
    for (int i = 0; i < total_num_cells; i++) {
        cells[i].checkNeighborCounts(maps[i]);
    }

    // 2) advance each cell, 3) disperse its offspring into staging
    for (int i = 0; i < total_num_cells; i++) {
        CellPopulation &cell = cells[i];
        if (cell.empty()) {
            continue;
        }
        cell.advanceTick(maps[i], rng, multipliers);
        CellPopulation offspring = cell.produceOffspring(mode, rng);
        if (!offspring.empty()) {
            stageOffspring(unflattenIdx(i), offspring);
        }
    }

    // 4) merge arrivals and clear staging
    mergeStaging();

    tick_count++;
}

template <int DIM>
void PlantGrid<DIM>::run_ticks(int ticks) {
    for (int i = 0; i < ticks; i++) {
        make_tick();
    }
}

//---------------------------------------------------------
//   snapshots
//---------------------------------------------------------

template <int DIM>
std::vector<StageCounts> PlantGrid<DIM>::snapshotCounts() const {
    std::vector<StageCounts> result;
    result.reserve(total_num_cells);
    for (const auto &cell : cells) {
        result.push_back(cell.counts());
    }
    return result;
}

template <int DIM>
std::vector<int> PlantGrid<DIM>::residentSpecies() const {
    std::vector<int> result(total_num_cells, -1);
    for (int i = 0; i < total_num_cells; i++) {
        if (cells[i].hasAdult()) {
            result[i] = cells[i].currentAdult()->speciesID();
        }
    }
    return result;
}

template <int DIM>
StageCounts PlantGrid<DIM>::totalCounts() const {
    StageCounts totals;
    for (const auto &cell : cells) {
        for (const auto &entry : cell.counts()) {
            auto &t = totals[entry.first];
            t[ADULT_BUCKET] += entry.second[ADULT_BUCKET];
            t[JUVENILE_BUCKET] += entry.second[JUVENILE_BUCKET];
        }
    }
    return totals;
}

template <int DIM>
int PlantGrid<DIM>::population() const {
    int total = 0;
    for (const auto &cell : cells) {
        total += cell.size();
    }
    return total;
}

template class PlantGrid<1>;
template class PlantGrid<2>;
template class PlantGrid<3>;
