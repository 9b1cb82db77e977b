#ifndef PLANT_PLANT_H
#define PLANT_PLANT_H

/**
 * @file Plant.h
 * @brief A single individual and its per-tick stage transition.
 *
 * @date 2025-02-11
 */

#include <random>
#include "Species.h"

/**
 * @brief Life stage of a plant. Dead is only ever returned by advancePlant();
 *        containers never store it.
 */
enum class LifeStage { Juvenile, Adult, Dead };

/**
 * @brief Stage-specific multipliers applied to the density-dependence penalty.
 *
 * Juveniles are more sensitive to crowding than adults. The values are model
 * constants, not derived quantities.
 */
struct DensityMultipliers {
    double juvenile = 2.0;
    double adult = 1.0;
};

/**
 * @brief One organism: a species reference, an age and a life stage.
 */
struct Plant {
    const Species *species;
    int age;
    LifeStage stage;

    Plant(const Species &sp, int age_, LifeStage stage_) : species(&sp), age(age_), stage(stage_) {
    }

    int speciesID() const {
        return species->speciesID;
    }

    bool isAdult() const {
        return stage == LifeStage::Adult;
    }

    bool isJuvenile() const {
        return stage == LifeStage::Juvenile;
    }

    bool isDead() const {
        return stage == LifeStage::Dead;
    }
};

inline Plant makeJuvenile(const Species &species, int age = 0) {
    return Plant(species, age, LifeStage::Juvenile);
}

inline Plant makeAdult(const Species &species, int age = 0) {
    return Plant(species, age, LifeStage::Adult);
}

/**
 * @brief Density-dependence penalty for a plant given its neighbor counts.
 *
 * penalty = mult * (conNeighbors * conNDD + hetNeighbors * hetNDD), where mult
 * depends on the stage.
 */
double densityPenalty(const Plant &plant, int conNeighbors, int hetNeighbors,
                      const DensityMultipliers &mult);

/**
 * @brief Survival threshold for one tick: base per-tick survival minus the
 *        density penalty.
 *
 * The result is not clamped; a negative threshold means certain death.
 */
double survivalThreshold(const Plant &plant, int conNeighbors, int hetNeighbors,
                         const DensityMultipliers &mult);

/**
 * @brief Advances a plant by one tick.
 *
 * Draws u ~ uniform[0,1) and survives iff u <= survivalThreshold(). A
 * surviving juvenile ages by one and becomes an adult once its age reaches
 * species->t1; a surviving adult ages by one. Otherwise the returned plant
 * has stage Dead. A Dead input is returned unchanged without a draw.
 *
 * @param plant        The plant before the tick
 * @param conNeighbors Conspecific neighbor count
 * @param hetNeighbors Heterospecific neighbor count
 * @param rng          Random number generator
 * @param mult         Stage multipliers for the penalty
 * @return The plant after the tick
 */
Plant advancePlant(const Plant &plant, int conNeighbors, int hetNeighbors, std::mt19937 &rng,
                   const DensityMultipliers &mult = DensityMultipliers());

#endif  // PLANT_PLANT_H
