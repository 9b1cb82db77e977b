#ifndef PLANT_GRID_H
#define PLANT_GRID_H

/**
 * @file PlantGrid.h
 * @brief Header for the discrete-time plant competition grid.
 *
 * The grid partitions a bounded (non-periodic) domain into cells, each holding
 * a CellPopulation. One tick is three strict phases:
 *  1) aggregate: every cell's Moore-neighborhood species counts are computed
 *     from the board as it was before the tick
 *  2) advance: every cell updates its occupants and produces offspring, which
 *     are dispersed into a staging board with a discretised Gaussian kernel
 *  3) merge: every staging cell is merged into its live cell and cleared
 *
 * It supports:
 *  - Any number of species (from a SpeciesCatalog)
 *  - Adult dispersal (adult-only counts) or juvenile dispersal (combined counts)
 *  - 1, 2 or 3 dimensions; the model itself is defined on 2-D boards
 *
 * @date 2025-02-11
 */

#include <vector>
#include <array>
#include <random>
#include "CellPopulation.h"
#include "Species.h"

/**
 * @brief Iterates over all cell indices within range of center (center included).
 *
 * Indices may fall outside the domain; callers filter them with inDomain().
 *
 * @tparam DIM  The dimension of the domain (1, 2, or 3).
 * @tparam FUNC A callable like `[](const std::array<int,DIM> &nIdx){ ... }`.
 *
 * @param center The center cell index.
 * @param range  The maximum offset in each dimension.
 * @param func   The callback to invoke for each cell index.
 */
template <int DIM, typename FUNC>
void forNeighbors(const std::array<int, DIM> &center, const std::array<int, DIM> &range,
                  const FUNC &func);

template <int DIM, typename FUNC>
void forNeighborsRecur(const std::array<int, DIM> &center, const std::array<int, DIM> &range,
                       std::array<int, DIM> &temp, int dimIndex, const FUNC &func) {
    if (dimIndex == DIM) {
        func(temp);
        return;
    }
    for (int offset = -range[dimIndex]; offset <= range[dimIndex]; ++offset) {
        temp[dimIndex] = center[dimIndex] + offset;
        forNeighborsRecur<DIM>(center, range, temp, dimIndex + 1, func);
    }
}

template <int DIM, typename FUNC>
void forNeighbors(const std::array<int, DIM> &center, const std::array<int, DIM> &range,
                  const FUNC &func) {
    std::array<int, DIM> temp;
    forNeighborsRecur<DIM>(center, range, temp, 0, func);
}

/**
 * @brief The simulation board: a live board of cells and a staging board of
 *        pending arrivals, both of side board_length in every dimension.
 *
 * - board_length, total_num_cells: shape of the board
 * - storage_limit: capacity of every cell
 * - mode: dispersal mode, which also fixes the aggregation policy
 * - dispersal_stdev: standard deviation of the dispersal kernel per axis
 * - multipliers: stage multipliers of the density penalty
 * - cells / staging: live and staging boards, flat-indexed
 * - rng: the only source of randomness used by a tick
 * - tick_count: number of completed ticks
 */
template <int DIM>
class PlantGrid {
public:
    /// Number of cells along each dimension
    int board_length;

    /// Same value as board_length, per dimension
    std::array<int, DIM> cell_count;

    /// Total number of cells = board_length^DIM
    int total_num_cells;

    /// Capacity of each cell
    int storage_limit;

    DispersalMode mode;

    /// Per-axis standard deviation of the dispersal kernel (mean is zero)
    double dispersal_stdev;

    DensityMultipliers multipliers;

    /// The live board
    std::vector<CellPopulation> cells;

    /// Arrivals for the next tick, merged into cells at the end of a tick
    std::vector<CellPopulation> staging;

    /// Random number generator
    std::mt19937 rng;

    /// Completed ticks
    int tick_count;

public:
    /**
     * @brief Main constructor.
     *
     * @param boardLength    Cells along each dimension (> 0)
     * @param storageLimit   Capacity of each cell (> 0)
     * @param dispersalMode  Adult or juvenile dispersal
     * @param dispersalStdev Per-axis standard deviation of the kernel (> 0)
     * @param seed           Random number generator seed
     * @param mult           Stage multipliers of the density penalty
     * @throws std::invalid_argument on a non-positive length, limit or stdev,
     *         or a board whose cell count does not fit in an int
     */
    PlantGrid(int boardLength, int storageLimit, DispersalMode dispersalMode,
              double dispersalStdev, int seed,
              const DensityMultipliers &mult = DensityMultipliers());

    // --- Basic utilities for indexing cells ---
    /**
     * @brief Converts a multi-dimensional cell index to a flat index
     * @param idx Multi-dimensional cell index
     * @return Flattened one-dimensional index
     */
    int flattenIdx(const std::array<int, DIM> &idx) const;

    /**
     * @brief Converts a flat index to a multi-dimensional cell index
     * @param cellIndex Flattened one-dimensional index
     * @return Multi-dimensional cell index
     */
    std::array<int, DIM> unflattenIdx(int cellIndex) const;

    /**
     * @brief Checks if a multi-dimensional index is within the domain
     * @param idx Multi-dimensional index to check
     * @return true if index is within domain, false otherwise
     */
    bool inDomain(const std::array<int, DIM> &idx) const;

    /**
     * @brief Gets the live cell at idx
     * @throws std::out_of_range if idx is outside the domain
     */
    CellPopulation &cellAt(const std::array<int, DIM> &idx);
    const CellPopulation &cellAt(const std::array<int, DIM> &idx) const;

    /// The aggregation policy implied by the dispersal mode.
    AggregationMode aggregationMode() const {
        return aggregationModeFor(mode);
    }

    // ------------------------------------------------------------------
    // Populating the board
    // ------------------------------------------------------------------

    /**
     * @brief Whether a live cell of this grid may hold a plant in this stage.
     *
     * Under AdultDispersal neighborhoods count resident adults only, so a
     * juvenile would have no entry in its own neighborhood map.
     */
    bool admitsStage(LifeStage stage) const {
        return !(mode == DispersalMode::AdultDispersal && stage == LifeStage::Juvenile);
    }

    /**
     * @brief Offers a plant directly to a live cell (CellPopulation::addPlant).
     * @throws std::invalid_argument if the grid does not admit the plant's stage
     */
    void placePlant(const std::array<int, DIM> &idx, const Plant &plant);

    /**
     * @brief Places startNumber founders of every species in the catalog.
     *
     * Under AdultDispersal each species gets startNumber age-0 adults at
     * distinct random cells; under JuvenileDispersal it gets startNumber
     * age-0 juveniles at independently random cells. Founders are staged and
     * merged immediately, so they are live before the first tick.
     *
     * @throws std::invalid_argument if startNumber is negative, or larger than
     *         the number of cells under AdultDispersal
     */
    void seedFounders(const SpeciesCatalog &catalog, int startNumber);

    /// Empties every live and staging cell and resets the tick counter.
    void clearBoard();

    // ------------------------------------------------------------------
    // Tick phases
    // ------------------------------------------------------------------

    /**
     * @brief Species counts over the Moore block around idx, clipped at the
     *        edges, under the grid's aggregation policy.
     */
    SpeciesCounts neighborhoodCounts(const std::array<int, DIM> &idx) const;

    /**
     * @brief neighborhoodCounts() for every cell, indexed by flat index.
     *
     * Must be called before any cell of the tick is advanced.
     */
    std::vector<SpeciesCounts> makeNeighborhoodMaps() const;

    /**
     * @brief Draws an integer displacement: each component is the rounded
     *        value of an N(0, dispersal_stdev^2) sample.
     */
    std::array<int, DIM> sampleDisplacement();

    /**
     * @brief Scatters offspring produced at origin into the staging board.
     *
     * Offspring landing outside the domain are discarded.
     */
    void stageOffspring(const std::array<int, DIM> &origin, const CellPopulation &offspring);

    /// Merges every staging cell into its live cell, then clears it.
    void mergeStaging();

    // ------------------------------------------------------------------
    // Core simulation loop
    // ------------------------------------------------------------------

    /**
     * @brief Runs one tick: aggregate all cells, advance and disperse, merge.
     *
     * Every cell is checked against its neighborhood map before any cell is
     * advanced, so a NeighborMapInconsistency leaves the board unchanged.
     */
    void make_tick();

    /**
     * @brief Runs a fixed number of ticks.
     * @param ticks Number of ticks to perform.
     */
    void run_ticks(int ticks);

    // ------------------------------------------------------------------
    // Snapshots
    // ------------------------------------------------------------------

    /// Per-cell species -> {adults, juveniles}, indexed by flat index.
    std::vector<StageCounts> snapshotCounts() const;

    /// Per-cell resident species id, -1 where the cell has no adult.
    std::vector<int> residentSpecies() const;

    /// species -> {adults, juveniles} summed over the whole board.
    StageCounts totalCounts() const;

    /// Number of plants on the live board.
    int population() const;
};

// Explicit template instantiations
extern template class PlantGrid<1>;
extern template class PlantGrid<2>;
extern template class PlantGrid<3>;

#endif  // PLANT_GRID_H
