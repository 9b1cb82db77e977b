/**
 * @file Plant.cpp
 * @brief Stage transition of a single plant.
 *
 * @date 2025-02-11
 */

#include <random>
#include "../include/Plant.h"

double densityPenalty(const Plant &plant, int conNeighbors, int hetNeighbors,
                      const DensityMultipliers &mult) {
    double m = 0.0;
    switch (plant.stage) {
    case LifeStage::Juvenile:
        m = mult.juvenile;
        break;
    case LifeStage::Adult:
        m = mult.adult;
        break;
    case LifeStage::Dead:
        return 0.0;
    }
    const Species &sp = *plant.species;
    return m * (conNeighbors * sp.conNDD + hetNeighbors * sp.hetNDD);
}

double survivalThreshold(const Plant &plant, int conNeighbors, int hetNeighbors,
                         const DensityMultipliers &mult) {
    double base = 0.0;
    switch (plant.stage) {
    case LifeStage::Juvenile:
        base = plant.species->seedPerTick;
        break;
    case LifeStage::Adult:
        base = plant.species->adultPerTick;
        break;
    case LifeStage::Dead:
        return -1.0;
    }
    return base - densityPenalty(plant, conNeighbors, hetNeighbors, mult);
}

Plant advancePlant(const Plant &plant, int conNeighbors, int hetNeighbors, std::mt19937 &rng,
                   const DensityMultipliers &mult) {
    if (plant.isDead()) {
        return plant;
    }

    double u = std::uniform_real_distribution<double>(0.0, 1.0)(rng);
    Plant next = plant;
    if (u > survivalThreshold(plant, conNeighbors, hetNeighbors, mult)) {
        next.stage = LifeStage::Dead;
        return next;
    }

    next.age++;
    if (next.stage == LifeStage::Juvenile && next.age >= next.species->t1) {
        next.stage = LifeStage::Adult;
    }
    return next;
}
