/**
 * @file CellPopulation.cpp
 * @brief Occupant bookkeeping for a single grid cell.
 *
 * @date 2025-02-11
 */

#include <random>
#include <string>
#include <utility>
#include <vector>
#include "../include/CellPopulation.h"

CellPopulation::CellPopulation(int storageLimit_) : storageLimit(storageLimit_), adultIndex(-1) {
    if (storageLimit <= 0) {
        throw std::invalid_argument("storageLimit must be positive, got " +
                                    std::to_string(storageLimit));
    }
}

void CellPopulation::countPlant(const Plant &plant, int delta) {
    int bucket = plant.isAdult() ? ADULT_BUCKET : JUVENILE_BUCKET;
    auto &entry = stageCounts[plant.speciesID()];  // value-initialised to {0, 0}
    entry[bucket] += delta;
    if (entry[ADULT_BUCKET] == 0 && entry[JUVENILE_BUCKET] == 0) {
        stageCounts.erase(plant.speciesID());
    }
}

void CellPopulation::rebuildCounts() {
    stageCounts.clear();
    for (const auto &plant : storage) {
        countPlant(plant, +1);
    }
}

//---------------------------------------------------------
//     addPlant
//---------------------------------------------------------
void CellPopulation::addPlant(const Plant &plant, std::mt19937 &rng) {
    if (plant.isDead()) {
        return;
    }

    if (plant.isJuvenile()) {
        if (full()) {
            return;
        }
        storage.push_back(plant);
        countPlant(plant, +1);
        return;
    }

    // adult
    if (hasAdult()) {
        return;
    }
    if (full()) {
        // no resident, so the cell is full of juveniles (or staged candidates)
        int victim = std::uniform_int_distribution<int>(0, (int)storage.size() - 1)(rng);
        countPlant(storage[victim], -1);
        storage[victim] = plant;
        adultIndex = victim;
    } else {
        storage.push_back(plant);
        adultIndex = (int)storage.size() - 1;
    }
    countPlant(plant, +1);
}

void CellPopulation::addAdultUnchecked(const Plant &plant) {
    if (full()) {
        return;
    }
    storage.push_back(plant);
    countPlant(plant, +1);
}

//---------------------------------------------------------
//     mergeFrom
//---------------------------------------------------------
void CellPopulation::mergeFrom(const CellPopulation &other, std::mt19937 &rng) {
    if (&other == this) {
        return;
    }
    if (hasAdult() && other.hasAdult()) {
        return;
    }
    for (const auto &plant : other.storage) {
        addPlant(plant, rng);
    }
}

//---------------------------------------------------------
//     produceOffspring
//---------------------------------------------------------
CellPopulation CellPopulation::produceOffspring(DispersalMode mode, std::mt19937 &rng) const {
    CellPopulation offspring(storageLimit);
    if (!hasAdult()) {
        return offspring;
    }
    const Species &sp = *currentAdult()->species;
    for (int i = 0; i < sp.ns; i++) {
        if (mode == DispersalMode::AdultDispersal) {
            offspring.addAdultUnchecked(makeAdult(sp, 0));
        } else {
            offspring.addPlant(makeJuvenile(sp, 0), rng);
        }
    }
    return offspring;
}

//---------------------------------------------------------
//     aggregateInto
//---------------------------------------------------------
void CellPopulation::aggregateInto(SpeciesCounts &running, AggregationMode mode) const {
    if (mode == AggregationMode::AdultOnly) {
        if (hasAdult()) {
            running[currentAdult()->speciesID()] += 1;
        }
        return;
    }
    for (const auto &entry : stageCounts) {
        running[entry.first] += entry.second[ADULT_BUCKET] + entry.second[JUVENILE_BUCKET];
    }
}

//---------------------------------------------------------
//     advanceTick
//---------------------------------------------------------
void CellPopulation::advanceTick(const SpeciesCounts &neighborCounts, std::mt19937 &rng,
                                 const DensityMultipliers &mult) {
    checkNeighborCounts(neighborCounts);

    int total = 0;
    for (const auto &entry : neighborCounts) {
        total += entry.second;
    }

    std::vector<Plant> juveniles;
    std::vector<Plant> candidates;
    std::vector<Plant> resident;  // holds the surviving resident, if any
    juveniles.reserve(storage.size());

    // 1) update every occupant
    for (int i = 0; i < (int)storage.size(); i++) {
        const Plant &plant = storage[i];
        int conCount = neighborCounts.at(plant.speciesID()) - 1;  // the occupant itself is in the map
        int hetCount = total - conCount;

        Plant next = advancePlant(plant, conCount, hetCount, rng, mult);
        switch (next.stage) {
        case LifeStage::Dead:
            break;
        case LifeStage::Adult:
            if (i == adultIndex) {
                resident.push_back(next);
            } else {
                candidates.push_back(next);
            }
            break;
        case LifeStage::Juvenile:
            juveniles.push_back(next);
            break;
        }
    }

    // 2) a surviving resident keeps the cell, otherwise elect a new adult
    if (resident.empty() && !candidates.empty()) {
        int pick = std::uniform_int_distribution<int>(0, (int)candidates.size() - 1)(rng);
        resident.push_back(candidates[pick]);
    }

    // 3) rebuild storage and counts
    storage = std::move(juveniles);
    adultIndex = -1;
    if (!resident.empty()) {
        storage.push_back(resident.front());
        adultIndex = (int)storage.size() - 1;
    }
    rebuildCounts();
}

void CellPopulation::checkNeighborCounts(const SpeciesCounts &neighborCounts) const {
    for (const auto &entry : stageCounts) {
        auto it = neighborCounts.find(entry.first);
        if (it == neighborCounts.end() || it->second <= 0) {
            throw NeighborMapInconsistency("neighborhood has no count for species " +
                                           std::to_string(entry.first) + " present in the cell");
        }
    }
}

void CellPopulation::clear() {
    storage.clear();
    stageCounts.clear();
    adultIndex = -1;
}
