#include <cstring>
#include <exception>
#include <filesystem>
#include <random>
#include <string>

#include "mn_puzzle.hpp"
#include "puzzle_file_operations.hpp"
#include "generate_sample_state.hpp"
#include "c_api.hpp"

namespace fs = std::filesystem;

extern "C" {
    // Generate a sliding puzzle ("walk" or "bfs" sampling) and write it to a
    // file inside out_dir. Returns 0 on success, -1 on bad arguments, -2 if
    // out_path_buf is too small, -3 if generation or writing fails. On
    // success the full path is written into out_path_buf (NUL-terminated).
    int datagen_mn_to_file(
        int rows,
        int cols,
        int empty_cells,
        int depth,
        unsigned int seed,
        const char* method,
        const char* out_dir,
        char* out_path_buf,
        int out_path_buf_len
    ) {
        if (!method || !out_dir || !out_path_buf || out_path_buf_len <= 0) return -1;
        bool use_bfs = std::strcmp(method, "bfs") == 0;
        if (!use_bfs && std::strcmp(method, "walk") != 0) return -1;
        try {
            fs::create_directories(out_dir);

            // same arguments give the same file
            std::string fname = "mn_" + std::to_string(rows) + "x" + std::to_string(cols) + "_e" +
                                std::to_string(empty_cells) + "_" + method + "_d" + std::to_string(depth) +
                                "_" + std::to_string(seed) + ".puzzle";
            fs::path full = fs::path(out_dir) / fname;

            std::mt19937 rng(seed);
            MNPuzzle sample = use_bfs ? random_state_bfs(rows, cols, empty_cells, depth, rng)
                                      : random_state_random_walk(rows, cols, empty_cells, depth, rng);
            write_puzzle_to_file(sample, full.string());

            std::string p = full.string();
            if ((int)p.size() + 1 > out_path_buf_len) return -2;
            std::memcpy(out_path_buf, p.c_str(), p.size() + 1);
            return 0;
        } catch (const std::exception&) {
            return -3;
        }
    }
}
