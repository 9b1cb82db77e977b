#ifndef PLANT_SIMULATION_IO_H
#define PLANT_SIMULATION_IO_H

/**
 * @file SimulationIO.h
 * @brief Flat-file import and export for species, counts and board state.
 *
 * Formats:
 *  - species CSV: a header row of SPECIES_COLUMN_NAMES, then one row per species
 *  - counts CSV: the species columns followed by Adult,Juvenile totals
 *  - resident map CSV: one row per board row, resident species id or -1
 *  - board state: plain text, see writeBoardState()
 *
 * Stream versions throw std::runtime_error on malformed input. Path versions
 * additionally throw std::runtime_error if the file cannot be opened.
 *
 * @date 2025-02-11
 */

#include <iosfwd>
#include <string>
#include "PlantGrid.h"
#include "Species.h"

void writeSpeciesCsv(std::ostream &os, const SpeciesCatalog &catalog);
void writeSpeciesCsv(const std::string &path, const SpeciesCatalog &catalog);

/**
 * @brief Reads species rows and restores them into catalog under their ids.
 *
 * Derived columns (seedPerTick, adultPerTick) are recomputed, not read.
 *
 * @return Number of species read
 */
int readSpeciesCsv(std::istream &is, SpeciesCatalog &catalog);
int readSpeciesCsv(const std::string &path, SpeciesCatalog &catalog);

/**
 * @brief Writes the species table with Adult and Juvenile totals appended.
 *
 * Species absent from totals are written with zero counts.
 */
void writeSpeciesCounts(std::ostream &os, const SpeciesCatalog &catalog, const StageCounts &totals);
void writeSpeciesCounts(const std::string &path, const SpeciesCatalog &catalog,
                        const StageCounts &totals);

/**
 * @brief Writes the resident species of every cell, one board row per line.
 */
void writeResidentMap(std::ostream &os, const PlantGrid<2> &grid);
void writeResidentMap(const std::string &path, const PlantGrid<2> &grid);

/**
 * @brief Writes a 0/1 map of the cells whose resident adult belongs to
 *        speciesId, one board row per line.
 */
void writeSpeciesPresence(std::ostream &os, const PlantGrid<2> &grid, int speciesId);
void writeSpeciesPresence(const std::string &path, const PlantGrid<2> &grid, int speciesId);

/**
 * @brief Writes everything needed to rebuild the live board.
 *
 * @code
 * tick <tick_count>
 * cells <total_num_cells>
 * cell <flat index> <occupant count>
 * <speciesID> <A|J> <age>
 * ...
 * end
 * @endcode
 * Only non-empty cells are written; occupants keep their stored order.
 */
template <int DIM>
void writeBoardState(std::ostream &os, const PlantGrid<DIM> &grid);

/**
 * @brief Replaces the board contents and tick counter with a saved state.
 *
 * The whole state is parsed before the grid is modified; on any error the
 * grid keeps its previous contents. Occupants are then re-inserted with
 * CellPopulation::addPlant(), so the single-adult rule and capacity of the
 * receiving grid apply.
 *
 * @throws std::runtime_error on malformed input, a cell count that does not
 *         match the grid, a species id unknown to the catalog, or a juvenile
 *         occupant when the grid uses AdultDispersal
 */
template <int DIM>
void readBoardState(std::istream &is, const SpeciesCatalog &catalog, PlantGrid<DIM> &grid);

template <int DIM>
void writeBoardState(const std::string &path, const PlantGrid<DIM> &grid);

template <int DIM>
void readBoardState(const std::string &path, const SpeciesCatalog &catalog, PlantGrid<DIM> &grid);

#endif  // PLANT_SIMULATION_IO_H
