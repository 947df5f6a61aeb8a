#ifndef __BENCHMARK_RUNNER_HPP___
#define __BENCHMARK_RUNNER_HPP___

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "puzzle_variant.hpp"
#include "solve_stats.hpp"

typedef std::function<std::optional<std::vector<Puzzle>>(const Puzzle&, SolveStats*)> SolverFn;

/**
 * @brief Time one solver on a puzzle and print its result line to `out`.
 *
 * The line holds the kind, algorithm, time, found flag, steps and the solver
 * counters. With `print_path` the rendered states follow.
 *
 * @return false if the solver threw (e.g. std::bad_alloc on a search space
 *         too large for this machine); the error goes to `err`.
 */
bool run_benchmark(const std::string& name, const SolverFn& solver, const Puzzle& start, bool print_path,
                   std::ostream& out, std::ostream& err);

#endif // __BENCHMARK_RUNNER_HPP___
