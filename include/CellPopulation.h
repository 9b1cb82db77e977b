#ifndef PLANT_CELL_POPULATION_H
#define PLANT_CELL_POPULATION_H

/**
 * @file CellPopulation.h
 * @brief The bounded population of plants living in one grid cell.
 *
 * A CellPopulation keeps:
 *  - storage: the occupants, at most storageLimit of them
 *  - at most one adult (the resident), which is always also in storage
 *  - stageCounts[s] = {adults of s, juveniles of s}, kept in step with storage
 *
 * Capacity pressure never raises: incoming juveniles are dropped when the
 * cell is full, and an incoming adult replaces a random occupant.
 *
 * @date 2025-02-11
 */

#include <array>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "Plant.h"

/// Default capacity of a cell
constexpr int DEFAULT_STORAGE_LIMIT = 50;

/// species id -> number of individuals counted for the neighborhood
using SpeciesCounts = std::map<int, int>;

/// species id -> {adultCount, juvenileCount}
using StageCounts = std::map<int, std::array<int, 2> >;

constexpr int ADULT_BUCKET = 0;
constexpr int JUVENILE_BUCKET = 1;

/**
 * @brief How offspring are produced and dispersed.
 *
 * AdultDispersal: offspring are staged as adults; neighborhoods count
 * resident adults only. JuvenileDispersal: offspring are juveniles;
 * neighborhoods count adults and juveniles together.
 */
enum class DispersalMode { AdultDispersal, JuvenileDispersal };

/// How a cell contributes to a neighborhood count.
enum class AggregationMode { AdultOnly, Combined };

/// The aggregation policy paired with a dispersal mode.
inline AggregationMode aggregationModeFor(DispersalMode mode) {
    return mode == DispersalMode::AdultDispersal ? AggregationMode::AdultOnly
                                                 : AggregationMode::Combined;
}

/**
 * @brief Raised when a neighborhood map lacks the species of an occupant.
 *
 * Neighborhood maps built over the Moore block always include the cell
 * itself, so this indicates a broken caller.
 */
class NeighborMapInconsistency : public std::logic_error {
public:
    explicit NeighborMapInconsistency(const std::string &what) : std::logic_error(what) {
    }
};

class CellPopulation {
public:
    explicit CellPopulation(int storageLimit_ = DEFAULT_STORAGE_LIMIT);

    /**
     * @brief Offers a plant to the cell.
     *
     * Adult incoming:
     *  - resident present: discarded
     *  - no resident, cell full: replaces an occupant chosen uniformly at random
     *  - no resident, room left: appended and becomes the resident
     * Juvenile incoming:
     *  - cell full: discarded
     *  - room left: appended
     *
     * @param plant The plant to add (Juvenile or Adult)
     * @param rng   Used only for the random replacement
     */
    void addPlant(const Plant &plant, std::mt19937 &rng);

    /**
     * @brief Appends an adult candidate if there is room, without electing it.
     *
     * Only staging containers use this; the single-adult rule is applied when
     * the staged plants are merged with mergeFrom().
     */
    void addAdultUnchecked(const Plant &plant);

    /**
     * @brief Offers every occupant of other, in stored order, to this cell.
     *
     * Does nothing if both cells have a resident adult: the resident wins.
     */
    void mergeFrom(const CellPopulation &other, std::mt19937 &rng);

    /**
     * @brief Offspring of the resident adult for this tick.
     *
     * @return An empty container if there is no resident; otherwise ns age-0
     *         plants of the resident's species (adults under AdultDispersal,
     *         juveniles under JuvenileDispersal), capped by storageLimit.
     */
    CellPopulation produceOffspring(DispersalMode mode, std::mt19937 &rng) const;

    /**
     * @brief Adds this cell's contribution to a running neighborhood count.
     *
     * AdultOnly adds 1 for the resident's species. Combined adds
     * adults + juveniles for every species in the cell.
     */
    void aggregateInto(SpeciesCounts &running, AggregationMode mode) const;

    /**
     * @brief Advances every occupant by one tick.
     *
     * For each occupant of species s, conspecifics = neighborCounts[s] - 1
     * and heterospecifics = sum(neighborCounts) - conspecifics. A surviving
     * resident stays resident; if the resident died, one newly promoted adult
     * is chosen uniformly at random. Storage becomes the surviving juveniles
     * followed by the resident.
     *
     * @param neighborCounts Moore-neighborhood counts, self included
     * @param rng            Random number generator
     * @param mult           Stage multipliers for the density penalty
     * @throws NeighborMapInconsistency if an occupant's species has no
     *         positive entry in neighborCounts; the cell is left unchanged
     */
    void advanceTick(const SpeciesCounts &neighborCounts, std::mt19937 &rng,
                     const DensityMultipliers &mult = DensityMultipliers());

    /**
     * @brief Checks that every species present in the cell has a positive
     *        entry in neighborCounts.
     * @throws NeighborMapInconsistency naming the first uncovered species
     */
    void checkNeighborCounts(const SpeciesCounts &neighborCounts) const;

    /// Removes every occupant.
    void clear();

    bool hasAdult() const {
        return adultIndex >= 0;
    }

    /// The resident adult, or nullptr.
    const Plant *currentAdult() const {
        return hasAdult() ? &storage[adultIndex] : nullptr;
    }

    const std::vector<Plant> &plants() const {
        return storage;
    }

    const StageCounts &counts() const {
        return stageCounts;
    }

    int size() const {
        return (int)storage.size();
    }

    bool empty() const {
        return storage.empty();
    }

    bool full() const {
        return (int)storage.size() >= storageLimit;
    }

    int capacity() const {
        return storageLimit;
    }

private:
    void countPlant(const Plant &plant, int delta);
    void rebuildCounts();

    std::vector<Plant> storage;
    int storageLimit;
    /// Index of the resident adult in storage, -1 if none
    int adultIndex;
    StageCounts stageCounts;
};

#endif  // PLANT_CELL_POPULATION_H
