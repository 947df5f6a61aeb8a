#ifndef __SEARCH_API_HPP___
#define __SEARCH_API_HPP___

/**
 * @file search_api.hpp
 * @brief C entry point for external benchmark harnesses (e.g. Python ctypes).
 */

extern "C" {
    int puzzle_run_instance(
        const char* input_file,
        const char* algorithm,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    );
}

#endif // __SEARCH_API_HPP___
