/**
 * @file SimulationIO.cpp
 * @brief CSV and plain-text persistence for species, counts and board state.
 *
 * @date 2025-02-11
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../include/SimulationIO.h"

namespace {

std::vector<std::string> splitCsvLine(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        if (!field.empty() && field.back() == '\r') {
            field.pop_back();
        }
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

void writeRow(std::ostream &os, const std::string *begin, const std::string *end) {
    for (const std::string *it = begin; it != end; ++it) {
        if (it != begin) {
            os << ',';
        }
        os << *it;
    }
}

void writeSpeciesHeader(std::ostream &os) {
    writeRow(os, SPECIES_COLUMN_NAMES.data(), SPECIES_COLUMN_NAMES.data() + SPECIES_RECORD_COLUMNS);
}

std::ofstream openForWrite(const std::string &path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    return out;
}

std::ifstream openForRead(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path + " for reading");
    }
    return in;
}

}  // namespace

//---------------------------------------------------------
//     species table
//---------------------------------------------------------

void writeSpeciesCsv(std::ostream &os, const SpeciesCatalog &catalog) {
    writeSpeciesHeader(os);
    os << '\n';
    for (const Species &sp : catalog.species()) {
        auto record = exportRecord(sp);
        writeRow(os, record.data(), record.data() + record.size());
        os << '\n';
    }
}

void writeSpeciesCsv(const std::string &path, const SpeciesCatalog &catalog) {
    std::ofstream out = openForWrite(path);
    writeSpeciesCsv(out, catalog);
    std::cout << "Species data saved to " << path << std::endl;
}

int readSpeciesCsv(std::istream &is, SpeciesCatalog &catalog) {
    std::string line;
    if (!std::getline(is, line)) {
        throw std::runtime_error("species data is empty");
    }
    std::vector<std::string> header = splitCsvLine(line);
    if ((int)header.size() < SPECIES_RECORD_COLUMNS) {
        throw std::runtime_error("species header has too few columns");
    }
    for (int c = 0; c < SPECIES_RECORD_COLUMNS; c++) {
        if (header[c] != SPECIES_COLUMN_NAMES[c]) {
            throw std::runtime_error("unexpected species column '" + header[c] + "', expected '" +
                                     SPECIES_COLUMN_NAMES[c] + "'");
        }
    }

    int lineNo = 1;
    int read = 0;
    while (std::getline(is, line)) {
        lineNo++;
        if (line.empty() || line == "\r") {
            continue;
        }
        std::vector<std::string> f = splitCsvLine(line);
        if ((int)f.size() < SPECIES_RECORD_COLUMNS) {
            throw std::runtime_error("line " + std::to_string(lineNo) + ": expected " +
                                     std::to_string(SPECIES_RECORD_COLUMNS) + " columns");
        }
        int id, parent, t1, t2, ns;
        double p1, p2, cndd, hndd;
        try {
            id = std::stoi(f[0]);
            parent = std::stoi(f[1]);
            t1 = std::stoi(f[2]);
            p1 = std::stod(f[3]);
            t2 = std::stoi(f[5]);
            p2 = std::stod(f[6]);
            ns = std::stoi(f[8]);
            cndd = std::stod(f[9]);
            hndd = std::stod(f[10]);
        } catch (const std::logic_error &e) {
            // std::stoi / std::stod report bad input as invalid_argument or out_of_range
            throw std::runtime_error("line " + std::to_string(lineNo) + ": " + e.what());
        }
        catalog.restore(id, parent, p1, p2, t1, t2, ns, cndd, hndd);
        read++;
    }
    return read;
}

int readSpeciesCsv(const std::string &path, SpeciesCatalog &catalog) {
    std::ifstream in = openForRead(path);
    int n = readSpeciesCsv(in, catalog);
    std::cout << "Species data loaded from " << path << " (" << n << " species)" << std::endl;
    return n;
}

//---------------------------------------------------------
//     population counts
//---------------------------------------------------------

void writeSpeciesCounts(std::ostream &os, const SpeciesCatalog &catalog, const StageCounts &totals) {
    writeSpeciesHeader(os);
    os << ",Adult,Juvenile\n";
    for (const Species &sp : catalog.species()) {
        auto record = exportRecord(sp);
        writeRow(os, record.data(), record.data() + record.size());
        int adults = 0;
        int juveniles = 0;
        auto it = totals.find(sp.speciesID);
        if (it != totals.end()) {
            adults = it->second[ADULT_BUCKET];
            juveniles = it->second[JUVENILE_BUCKET];
        }
        os << ',' << adults << ',' << juveniles << '\n';
    }
}

void writeSpeciesCounts(const std::string &path, const SpeciesCatalog &catalog,
                        const StageCounts &totals) {
    std::ofstream out = openForWrite(path);
    writeSpeciesCounts(out, catalog, totals);
}

//---------------------------------------------------------
//     resident map
//---------------------------------------------------------

void writeResidentMap(std::ostream &os, const PlantGrid<2> &grid) {
    std::vector<int> residents = grid.residentSpecies();
    for (int i = 0; i < grid.board_length; i++) {
        for (int j = 0; j < grid.board_length; j++) {
            if (j > 0) {
                os << ',';
            }
            os << residents[grid.flattenIdx({i, j})];
        }
        os << '\n';
    }
}

void writeResidentMap(const std::string &path, const PlantGrid<2> &grid) {
    std::ofstream out = openForWrite(path);
    writeResidentMap(out, grid);
}

void writeSpeciesPresence(std::ostream &os, const PlantGrid<2> &grid, int speciesId) {
    std::vector<int> residents = grid.residentSpecies();
    for (int i = 0; i < grid.board_length; i++) {
        for (int j = 0; j < grid.board_length; j++) {
            if (j > 0) {
                os << ',';
            }
            os << (residents[grid.flattenIdx({i, j})] == speciesId ? 1 : 0);
        }
        os << '\n';
    }
}

void writeSpeciesPresence(const std::string &path, const PlantGrid<2> &grid, int speciesId) {
    std::ofstream out = openForWrite(path);
    writeSpeciesPresence(out, grid, speciesId);
}

//---------------------------------------------------------
//     board state
//---------------------------------------------------------

template <int DIM>
void writeBoardState(std::ostream &os, const PlantGrid<DIM> &grid) {
    os << "tick " << grid.tick_count << '\n';
    os << "cells " << grid.total_num_cells << '\n';
    for (int i = 0; i < grid.total_num_cells; i++) {
        const CellPopulation &cell = grid.cells[i];
        if (cell.empty()) {
            continue;
        }
        os << "cell " << i << ' ' << cell.size() << '\n';
        for (const Plant &plant : cell.plants()) {
            os << plant.speciesID() << ' ' << (plant.isAdult() ? 'A' : 'J') << ' ' << plant.age
               << '\n';
        }
    }
    os << "end\n";
}

template <int DIM>
void readBoardState(std::istream &is, const SpeciesCatalog &catalog, PlantGrid<DIM> &grid) {
    std::string word;
    int tick = 0;
    int numCells = 0;
    if (!(is >> word >> tick) || word != "tick" || tick < 0) {
        throw std::runtime_error("board state: expected 'tick <n>'");
    }
    if (!(is >> word >> numCells) || word != "cells") {
        throw std::runtime_error("board state: expected 'cells <n>'");
    }
    if (numCells != grid.total_num_cells) {
        throw std::runtime_error("board state has " + std::to_string(numCells) +
                                 " cells, grid has " + std::to_string(grid.total_num_cells));
    }

    // the grid is only touched once the whole body has parsed
    std::vector<std::pair<int, Plant> > pending;
    bool complete = false;
    while (is >> word) {
        if (word == "end") {
            complete = true;
            break;
        }
        int idx = -1;
        int count = -1;
        if (word != "cell" || !(is >> idx >> count) || idx < 0 || idx >= numCells || count < 0) {
            throw std::runtime_error("board state: malformed cell header");
        }
        for (int k = 0; k < count; k++) {
            int speciesId = 0;
            std::string stage;
            int age = 0;
            if (!(is >> speciesId >> stage >> age) || age < 0) {
                throw std::runtime_error("board state: malformed occupant in cell " +
                                         std::to_string(idx));
            }
            const Species *sp = catalog.find(speciesId);
            if (!sp) {
                throw std::runtime_error("board state: unknown species " +
                                         std::to_string(speciesId));
            }
            LifeStage st;
            if (stage == "A") {
                st = LifeStage::Adult;
            } else if (stage == "J") {
                st = LifeStage::Juvenile;
            } else {
                throw std::runtime_error("board state: unknown stage '" + stage + "'");
            }
            if (!grid.admitsStage(st)) {
                throw std::runtime_error("board state: juvenile in cell " + std::to_string(idx) +
                                         " cannot be loaded into an adult-dispersal grid");
            }
            pending.emplace_back(idx, Plant(*sp, age, st));
        }
    }
    if (!complete) {
        throw std::runtime_error("board state: missing 'end'");
    }

    grid.clearBoard();
    grid.tick_count = tick;
    for (const auto &entry : pending) {
        grid.cells[entry.first].addPlant(entry.second, grid.rng);
    }
}

template <int DIM>
void writeBoardState(const std::string &path, const PlantGrid<DIM> &grid) {
    std::ofstream out = openForWrite(path);
    writeBoardState(out, grid);
    std::cout << "Board state saved to " << path << std::endl;
}

template <int DIM>
void readBoardState(const std::string &path, const SpeciesCatalog &catalog, PlantGrid<DIM> &grid) {
    std::ifstream in = openForRead(path);
    readBoardState(in, catalog, grid);
    std::cout << "Board state loaded from " << path << " at tick " << grid.tick_count << std::endl;
}

template void writeBoardState<1>(std::ostream &, const PlantGrid<1> &);
template void writeBoardState<2>(std::ostream &, const PlantGrid<2> &);
template void writeBoardState<3>(std::ostream &, const PlantGrid<3> &);
template void readBoardState<1>(std::istream &, const SpeciesCatalog &, PlantGrid<1> &);
template void readBoardState<2>(std::istream &, const SpeciesCatalog &, PlantGrid<2> &);
template void readBoardState<3>(std::istream &, const SpeciesCatalog &, PlantGrid<3> &);
template void writeBoardState<1>(const std::string &, const PlantGrid<1> &);
template void writeBoardState<2>(const std::string &, const PlantGrid<2> &);
template void writeBoardState<3>(const std::string &, const PlantGrid<3> &);
template void readBoardState<1>(const std::string &, const SpeciesCatalog &, PlantGrid<1> &);
template void readBoardState<2>(const std::string &, const SpeciesCatalog &, PlantGrid<2> &);
template void readBoardState<3>(const std::string &, const SpeciesCatalog &, PlantGrid<3> &);
