#include <iostream>
#include <random>
#include <string>

#include "mn_puzzle.hpp"
#include "puzzle_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int rows = 4;
    int cols = 4;
    int empty_cells = 1;
    int depth = 20;
    unsigned int seed = 0;
    string method = "walk";
    string output_file;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--rows" && i + 1 < argc) { rows = stoi(argv[++i]); }
        else if (a == "--cols" && i + 1 < argc) { cols = stoi(argv[++i]); }
        else if (a == "--empty" && i + 1 < argc) { empty_cells = stoi(argv[++i]); }
        else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--method" && i + 1 < argc) { method = argv[++i]; }
        else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: generate-sample-mn [--rows R] [--cols C] [--empty K] [--depth D] [--seed S] "
                    "[--method walk|bfs] --output-file F\n";
            return 0;
        }
        else {
            cerr << "Unknown argument: " << a << '\n';
            return 1;
        }
    }
    if (output_file.empty() || (method != "walk" && method != "bfs")) {
        cerr << "generate-sample-mn needs --output-file and --method walk|bfs\n";
        return 1;
    }

    mt19937 rng(seed);
    try {
        MNPuzzle sample = method == "bfs" ? random_state_bfs(rows, cols, empty_cells, depth, rng)
                                          : random_state_random_walk(rows, cols, empty_cells, depth, rng);
        write_puzzle_to_file(sample, output_file);
    } catch (const MalformedInput& e) {
        cerr << "Error creating sample: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error writing sample: " << e.what() << '\n';
        return 3;
    }
    return 0;
}
