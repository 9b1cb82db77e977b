#ifndef PLANT_SPECIES_H
#define PLANT_SPECIES_H

/**
 * @file Species.h
 * @brief Per-species life-history constants and the catalog that mints them.
 *
 * A Species is created once, before any grid exists, and is never mutated
 * afterwards. Plants hold a pointer to the Species they belong to; the
 * SpeciesCatalog owns the storage and keeps those pointers stable.
 *
 * @date 2025-02-11
 */

#include <array>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

/**
 * @brief Thrown when p1 or p2 falls outside (0, 1].
 */
class InvalidProbability : public std::invalid_argument {
public:
    explicit InvalidProbability(const std::string &what) : std::invalid_argument(what) {
    }
};

/**
 * @brief Thrown when a horizon (t1, t2) or the seed count cannot be used
 *        to derive per-tick rates.
 */
class ArithmeticDomain : public std::domain_error {
public:
    explicit ArithmeticDomain(const std::string &what) : std::domain_error(what) {
    }
};

/// Number of columns in a species record.
constexpr int SPECIES_RECORD_COLUMNS = 11;

/// Column names of a species record, in export order.
extern const std::array<std::string, SPECIES_RECORD_COLUMNS> SPECIES_COLUMN_NAMES;

/**
 * @brief Checks the raw parameters of a species.
 *
 * @throws InvalidProbability if p1 or p2 is not in (0, 1]
 * @throws ArithmeticDomain   if t1 or t2 is not positive, or ns is negative
 * @throws std::invalid_argument if a density-dependence coefficient is negative
 */
void validateSpeciesParameters(double p1, double p2, int t1, int t2, int ns, double conNDD,
                               double hetNDD);

/**
 * @brief Immutable life-history constants of one species.
 *
 * seedPerTick and adultPerTick are the per-tick survival probabilities whose
 * product over t1 (resp. t2) ticks equals p1 (resp. p2).
 */
struct Species {
    int speciesID;
    /// -1 when the species has no parent
    int parentID;

    /// Ticks a juvenile needs to become an adult
    int t1;
    /// Probability that a juvenile survives all t1 ticks
    double p1;
    double seedPerTick;

    /// Reference horizon for adult survival
    int t2;
    /// Probability that an adult is still alive after t2 ticks
    double p2;
    double adultPerTick;

    /// Offspring per reproducing adult per tick
    int ns;

    /// Conspecific and heterospecific density-dependence coefficients
    double conNDD;
    double hetNDD;

    /**
     * @brief Builds a species and derives its per-tick survival rates.
     *
     * @param id     Identity assigned by the catalog
     * @param parent Parent species id (-1 if none)
     * @param p1_    Juvenile-to-adult survival probability
     * @param p2_    Adult survival probability over t2_ ticks
     * @param t1_    Ticks to maturity
     * @param t2_    Adult survival horizon
     * @param ns_    Offspring per adult per tick
     * @param con    Conspecific density-dependence coefficient
     * @param het    Heterospecific density-dependence coefficient
     */
    Species(int id, int parent, double p1_, double p2_, int t1_, int t2_, int ns_, double con,
            double het);
};

/**
 * @brief Formats a species as a tabular row.
 *
 * Column order matches SPECIES_COLUMN_NAMES:
 * speciesID, parentID, t1, p1, seedPerTick, t2, p2, adultPerTick, ns, CNDD, HNDD.
 */
std::array<std::string, SPECIES_RECORD_COLUMNS> exportRecord(const Species &species);

/**
 * @brief Thread-safe monotonic id generator for species.
 *
 * This is the only piece of process-wide mutable state in a simulation; it is
 * shared by every catalog that should draw from the same id space.
 */
class SpeciesIdSequence {
public:
    explicit SpeciesIdSequence(int first = 1);

    /// Returns the next unused id and advances the sequence.
    int next();

    /// The id that the next call to next() will return.
    int peek() const;

    /// Makes sure no future call to next() returns an id <= id.
    void advancePast(int id);

private:
    std::atomic<int> nextId;
};

/**
 * @brief Owns every Species of a simulation and hands out stable references.
 *
 * Species are stored in a deque so references returned by create() and
 * restore() stay valid for the lifetime of the catalog. The catalog is not
 * copyable for the same reason.
 */
class SpeciesCatalog {
public:
    explicit SpeciesCatalog(std::shared_ptr<SpeciesIdSequence> sequence =
                                std::make_shared<SpeciesIdSequence>());

    SpeciesCatalog(const SpeciesCatalog &) = delete;
    SpeciesCatalog &operator=(const SpeciesCatalog &) = delete;

    /**
     * @brief Validates the parameters, mints an id and stores a new species.
     *
     * No id is consumed when validation fails.
     *
     * @return Reference to the stored species
     */
    const Species &create(int parentId, double p1, double p2, int t1, int t2, int ns,
                          double conNDD, double hetNDD);

    /**
     * @brief Stores a species under a known id (used when loading saved data).
     *
     * The id sequence is advanced past the restored id.
     *
     * @throws std::invalid_argument if the id is already present
     */
    const Species &restore(int speciesId, int parentId, double p1, double p2, int t1, int t2,
                           int ns, double conNDD, double hetNDD);

    /**
     * @brief Copies in every species of other whose id is not already here.
     *
     * Species with a duplicate id are skipped; the local one is kept. The id
     * sequence is advanced past every copied id.
     *
     * @return Number of species copied
     */
    int merge(const SpeciesCatalog &other);

    /// Looks up a species by id; nullptr if unknown.
    const Species *find(int speciesId) const;

    /// All species in insertion order.
    const std::deque<Species> &species() const {
        return storage;
    }

    int size() const {
        return (int)storage.size();
    }

    bool empty() const {
        return storage.empty();
    }

    SpeciesIdSequence &sequence() {
        return *ids;
    }

private:
    std::shared_ptr<SpeciesIdSequence> ids;
    std::deque<Species> storage;
    std::map<int, int> indexById;
};

/**
 * @brief Adds count species whose survival probabilities are drawn at random.
 *
 * p1 and p2 are drawn from lognormal(0, stdevLog) and redrawn until they are
 * at most 1; all other parameters are shared. Created species have no parent.
 *
 * @param catalog  Catalog receiving the species
 * @param count    Number of species to create
 * @param stdevLog Log-scale standard deviation of the lognormal draws
 * @param rng      Random number generator
 */
void generateSpecies(SpeciesCatalog &catalog, int count, double stdevLog, int t1, int t2, int ns,
                     double conNDD, double hetNDD, std::mt19937 &rng);

#endif  // PLANT_SPECIES_H
