/**
 * @file simulator.cpp
 * @brief Command-line driver: builds a board, runs it and writes periodic
 *        snapshots.
 *
 * Output files (in --output):
 *  - species.csv          species table
 *  - <tick>.csv           species table with Adult/Juvenile totals
 *  - <tick>_map.csv       resident species per cell (-1 = none)
 *  - <tick>_species<id>.csv  cells held by one species (--track-species)
 *  - final_state.txt      board state after the last tick
 *
 * @date 2025-02-11
 */

#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include "../include/PlantGrid.h"
#include "../include/SimulationIO.h"
#include "../include/Species.h"

//============================================================
// 1) Options
//============================================================
struct Options {
    // board
    int boardLength = 100;
    int storageLimit = DEFAULT_STORAGE_LIMIT;
    int startNumber = 5;
    DispersalMode mode = DispersalMode::JuvenileDispersal;
    double stdev = 5.0;
    double juvenileMultiplier = 2.0;
    double adultMultiplier = 1.0;

    // run
    int iterations = 1000;
    int snapshotInterval = 100;
    int seed = 42;
    std::string output = ".";
    std::string speciesCsv;
    std::string extraSpeciesCsv;
    std::string state;
    int trackSpecies = -1;

    // generated species
    int species = 10;
    double stdevLog = 0.5;
    int t1 = 10;
    int t2 = 50;
    int ns = 3;
    double conNDD = 0.01;
    double hetNDD = 0.005;
};

void printUsage(const char *prog) {
    std::cerr << "usage: " << prog << " [--key value]...\n"
              << "  --board-length N       cells per side (100)\n"
              << "  --storage-limit N      plants per cell (50)\n"
              << "  --start-number N       founders per species (5)\n"
              << "  --dispersal MODE       adult | juvenile (juvenile)\n"
              << "  --stdev X              dispersal kernel stdev (5)\n"
              << "  --juvenile-mult X      juvenile density multiplier (2)\n"
              << "  --adult-mult X         adult density multiplier (1)\n"
              << "  --iterations N         ticks to run (1000)\n"
              << "  --snapshot-interval N  ticks between snapshots (100)\n"
              << "  --seed N               random seed (42)\n"
              << "  --output DIR           output directory (.)\n"
              << "  --species-csv FILE     load species instead of generating them\n"
              << "  --extra-species-csv F  merge more species in, skipping known ids\n"
              << "  --state FILE           resume from a saved board state\n"
              << "  --track-species ID     also write a presence map for one species\n"
              << "  --species N            species to generate (10)\n"
              << "  --stdev-log X          lognormal sigma for p1, p2 (0.5)\n"
              << "  --t1 N --t2 N --ns N   shared life-history constants (10, 50, 3)\n"
              << "  --cndd X --hndd X      density-dependence coefficients (0.01, 0.005)\n";
}

Options parseOptions(int argc, char **argv) {
    std::map<std::string, std::string> raw;
    for (int i = 1; i < argc; i++) {
        std::string key = argv[i];
        if (key.compare(0, 2, "--") != 0 || i + 1 >= argc) {
            throw std::invalid_argument("expected '--key value', got '" + key + "'");
        }
        raw[key.substr(2)] = argv[++i];
    }

    Options opt;
    auto take = [&](const std::string &key, auto &field) {
        auto it = raw.find(key);
        if (it == raw.end()) {
            return;
        }
        std::istringstream ss(it->second);
        if (!(ss >> field) || !ss.eof()) {
            throw std::invalid_argument("bad value for --" + key + ": " + it->second);
        }
        raw.erase(it);
    };

    take("board-length", opt.boardLength);
    take("storage-limit", opt.storageLimit);
    take("start-number", opt.startNumber);
    take("stdev", opt.stdev);
    take("juvenile-mult", opt.juvenileMultiplier);
    take("adult-mult", opt.adultMultiplier);
    take("iterations", opt.iterations);
    take("snapshot-interval", opt.snapshotInterval);
    take("seed", opt.seed);
    take("output", opt.output);
    take("species-csv", opt.speciesCsv);
    take("extra-species-csv", opt.extraSpeciesCsv);
    take("state", opt.state);
    take("track-species", opt.trackSpecies);
    take("species", opt.species);
    take("stdev-log", opt.stdevLog);
    take("t1", opt.t1);
    take("t2", opt.t2);
    take("ns", opt.ns);
    take("cndd", opt.conNDD);
    take("hndd", opt.hetNDD);

    auto it = raw.find("dispersal");
    if (it != raw.end()) {
        if (it->second == "adult") {
            opt.mode = DispersalMode::AdultDispersal;
        } else if (it->second == "juvenile") {
            opt.mode = DispersalMode::JuvenileDispersal;
        } else {
            throw std::invalid_argument("--dispersal must be 'adult' or 'juvenile'");
        }
        raw.erase(it);
    }

    if (!raw.empty()) {
        throw std::invalid_argument("unknown option --" + raw.begin()->first);
    }
    if (opt.snapshotInterval <= 0) {
        throw std::invalid_argument("--snapshot-interval must be positive");
    }
    if (opt.iterations < 0) {
        throw std::invalid_argument("--iterations must not be negative");
    }
    return opt;
}

//============================================================
// 2) Snapshots
//============================================================
void writeSnapshot(const Options &opt, const SpeciesCatalog &catalog, const PlantGrid<2> &grid) {
    std::string base = opt.output + "/" + std::to_string(grid.tick_count);
    StageCounts totals = grid.totalCounts();
    writeSpeciesCounts(base + ".csv", catalog, totals);
    writeResidentMap(base + "_map.csv", grid);
    if (opt.trackSpecies >= 0) {
        writeSpeciesPresence(base + "_species" + std::to_string(opt.trackSpecies) + ".csv", grid,
                             opt.trackSpecies);
    }

    int adults = 0;
    int juveniles = 0;
    for (const auto &entry : totals) {
        adults += entry.second[ADULT_BUCKET];
        juveniles += entry.second[JUVENILE_BUCKET];
    }
    std::cout << "tick " << grid.tick_count << ": " << totals.size() << " species alive, "
              << adults << " adults, " << juveniles << " juveniles" << std::endl;
}

//============================================================
// 3) main
//============================================================
int main(int argc, char **argv) {
    Options opt;
    try {
        opt = parseOptions(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        std::mt19937 speciesRng(opt.seed);
        SpeciesCatalog catalog;
        if (!opt.speciesCsv.empty()) {
            readSpeciesCsv(opt.speciesCsv, catalog);
        } else {
            generateSpecies(catalog, opt.species, opt.stdevLog, opt.t1, opt.t2, opt.ns,
                            opt.conNDD, opt.hetNDD, speciesRng);
            std::cout << "Generated " << catalog.size() << " species" << std::endl;
        }
        if (!opt.extraSpeciesCsv.empty()) {
            SpeciesCatalog extra;
            readSpeciesCsv(opt.extraSpeciesCsv, extra);
            int added = catalog.merge(extra);
            std::cout << "Merged " << added << " of " << extra.size() << " species" << std::endl;
        }
        writeSpeciesCsv(opt.output + "/species.csv", catalog);

        DensityMultipliers mult;
        mult.juvenile = opt.juvenileMultiplier;
        mult.adult = opt.adultMultiplier;
        PlantGrid<2> grid(opt.boardLength, opt.storageLimit, opt.mode, opt.stdev, opt.seed, mult);

        if (!opt.state.empty()) {
            readBoardState(opt.state, catalog, grid);
        } else {
            grid.seedFounders(catalog, opt.startNumber);
        }
        std::cout << "Board " << opt.boardLength << "x" << opt.boardLength << ", "
                  << grid.population() << " plants, "
                  << (opt.mode == DispersalMode::AdultDispersal ? "adult" : "juvenile")
                  << " dispersal" << std::endl;

        int lastTick = grid.tick_count + opt.iterations;
        while (grid.tick_count < lastTick) {
            grid.make_tick();
            if (grid.tick_count == 1 || grid.tick_count % opt.snapshotInterval == 0) {
                writeSnapshot(opt, catalog, grid);
            }
        }

        writeBoardState(opt.output + "/final_state.txt", grid);
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
