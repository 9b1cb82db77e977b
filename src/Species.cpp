/**
 * @file Species.cpp
 * @brief Species construction, id sequence and catalog.
 *
 * @date 2025-02-11
 */

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include "../include/Species.h"

const std::array<std::string, SPECIES_RECORD_COLUMNS> SPECIES_COLUMN_NAMES = {
    "speciesID", "parentID", "t1",           "p1", "seedPerTick", "t2",
    "p2",        "adultPerTick", "ns", "CNDD", "HNDD"};

void validateSpeciesParameters(double p1, double p2, int t1, int t2, int ns, double conNDD,
                               double hetNDD) {
    // written so that NaN fails as well
    if (!(p1 > 0.0 && p1 <= 1.0)) {
        throw InvalidProbability("p1 must be in (0, 1], got " + std::to_string(p1));
    }
    if (!(p2 > 0.0 && p2 <= 1.0)) {
        throw InvalidProbability("p2 must be in (0, 1], got " + std::to_string(p2));
    }
    if (t1 <= 0) {
        throw ArithmeticDomain("t1 must be positive, got " + std::to_string(t1));
    }
    if (t2 <= 0) {
        throw ArithmeticDomain("t2 must be positive, got " + std::to_string(t2));
    }
    if (ns < 0) {
        throw ArithmeticDomain("ns must not be negative, got " + std::to_string(ns));
    }
    if (!(conNDD >= 0.0) || !(hetNDD >= 0.0)) {
        throw std::invalid_argument("density-dependence coefficients must not be negative");
    }
}

Species::Species(int id, int parent, double p1_, double p2_, int t1_, int t2_, int ns_,
                 double con, double het)
    : speciesID(id),
      parentID(parent),
      t1(t1_),
      p1(p1_),
      seedPerTick(0.0),
      t2(t2_),
      p2(p2_),
      adultPerTick(0.0),
      ns(ns_),
      conNDD(con),
      hetNDD(het) {
    validateSpeciesParameters(p1, p2, t1, t2, ns, conNDD, hetNDD);

    // geometric-mean decomposition of the cumulative probability
    seedPerTick = std::pow(p1, 1.0 / t1);
    adultPerTick = std::pow(p2, 1.0 / t2);
}

std::array<std::string, SPECIES_RECORD_COLUMNS> exportRecord(const Species &species) {
    auto fmt = [](double v) {
        std::ostringstream os;
        os.precision(std::numeric_limits<double>::max_digits10);
        os << v;
        return os.str();
    };
    return {std::to_string(species.speciesID),
            std::to_string(species.parentID),
            std::to_string(species.t1),
            fmt(species.p1),
            fmt(species.seedPerTick),
            std::to_string(species.t2),
            fmt(species.p2),
            fmt(species.adultPerTick),
            std::to_string(species.ns),
            fmt(species.conNDD),
            fmt(species.hetNDD)};
}

//---------------------------------------------------------
//     SpeciesIdSequence
//---------------------------------------------------------

SpeciesIdSequence::SpeciesIdSequence(int first) : nextId(first) {
}

int SpeciesIdSequence::next() {
    return nextId.fetch_add(1);
}

int SpeciesIdSequence::peek() const {
    return nextId.load();
}

void SpeciesIdSequence::advancePast(int id) {
    int current = nextId.load();
    while (current <= id && !nextId.compare_exchange_weak(current, id + 1)) {
    }
}

//---------------------------------------------------------
//     SpeciesCatalog
//---------------------------------------------------------

SpeciesCatalog::SpeciesCatalog(std::shared_ptr<SpeciesIdSequence> sequence)
    : ids(std::move(sequence)) {
    if (!ids) {
        throw std::invalid_argument("SpeciesCatalog needs an id sequence");
    }
}

const Species &SpeciesCatalog::create(int parentId, double p1, double p2, int t1, int t2, int ns,
                                      double conNDD, double hetNDD) {
    // validate first so a rejected species does not burn an id
    validateSpeciesParameters(p1, p2, t1, t2, ns, conNDD, hetNDD);
    int id = ids->next();
    storage.emplace_back(id, parentId, p1, p2, t1, t2, ns, conNDD, hetNDD);
    indexById[id] = (int)storage.size() - 1;
    return storage.back();
}

const Species &SpeciesCatalog::restore(int speciesId, int parentId, double p1, double p2, int t1,
                                       int t2, int ns, double conNDD, double hetNDD) {
    if (indexById.count(speciesId)) {
        throw std::invalid_argument("species " + std::to_string(speciesId) +
                                    " is already in the catalog");
    }
    storage.emplace_back(speciesId, parentId, p1, p2, t1, t2, ns, conNDD, hetNDD);
    indexById[speciesId] = (int)storage.size() - 1;
    ids->advancePast(speciesId);
    return storage.back();
}

int SpeciesCatalog::merge(const SpeciesCatalog &other) {
    int added = 0;
    for (const Species &sp : other.species()) {
        if (indexById.count(sp.speciesID)) {
            continue;
        }
        restore(sp.speciesID, sp.parentID, sp.p1, sp.p2, sp.t1, sp.t2, sp.ns, sp.conNDD,
                sp.hetNDD);
        added++;
    }
    return added;
}

const Species *SpeciesCatalog::find(int speciesId) const {
    auto it = indexById.find(speciesId);
    if (it == indexById.end()) {
        return nullptr;
    }
    return &storage[it->second];
}

void generateSpecies(SpeciesCatalog &catalog, int count, double stdevLog, int t1, int t2, int ns,
                     double conNDD, double hetNDD, std::mt19937 &rng) {
    if (count < 0) {
        throw std::invalid_argument("species count must not be negative");
    }
    if (!(stdevLog > 0.0)) {
        throw std::invalid_argument("stdevLog must be positive");
    }
    std::lognormal_distribution<double> logNormal(0.0, stdevLog);
    for (int i = 0; i < count; i++) {
        double p1 = logNormal(rng);
        double p2 = logNormal(rng);
        while (p1 > 1.0) {
            p1 = logNormal(rng);
        }
        while (p2 > 1.0) {
            p2 = logNormal(rng);
        }
        catalog.create(-1, p1, p2, t1, t2, ns, conNDD, hetNDD);
    }
}
