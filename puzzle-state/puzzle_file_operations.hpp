#ifndef __PUZZLE_FILE_OPERATIONS_HPP___
#define __PUZZLE_FILE_OPERATIONS_HPP___

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <unordered_set>

#include "puzzle_variant.hpp"

/**
 * @file puzzle_file_operations.hpp
 * @brief Helpers to read/write `Puzzle` values from plain text files.
 *
 * The format is whitespace separated. The first token names the kind:
 *
 *   mn <rows> <cols> <rows*cols start values> <rows*cols target values>
 *   sudoku <n> <n*n symbols, '.' or '0' for empty>
 *   peg <rows> <cols> <rows strings of cols markers>
 *   ladder <from> <to> <dictionary words...>
 *
 * A ladder dictionary may instead be a single token `@<path>` naming a word
 * list file, resolved relative to the puzzle file's directory.
 */

/**
 * @brief Parse one puzzle from a stream.
 *
 * @param in Input stream positioned at the kind token.
 * @param base_dir Directory used to resolve `@<path>` word lists.
 * @throws MalformedInput on an unknown kind, missing or extra tokens, or invalid content.
 * @throws std::runtime_error if a referenced word list cannot be opened.
 */
Puzzle parse_puzzle(std::istream& in, const std::filesystem::path& base_dir = std::filesystem::path());

/**
 * @brief Read a `Puzzle` from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws MalformedInput if the content is invalid.
 * @return Constructed `Puzzle` instance.
 */
Puzzle read_puzzle_from_file(const std::string& filename);

/**
 * @brief Read a whitespace separated word list.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
std::unordered_set<std::string> read_word_list(const std::string& filename);

/**
 * @brief Write a puzzle in the format accepted by parse_puzzle.
 *
 * Word ladders are written with their dictionary inline, sorted.
 */
void write_puzzle(std::ostream& out, const Puzzle& puzzle);

/**
 * @brief Write a `Puzzle` to a plain-text file.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_puzzle_to_file(const Puzzle& puzzle, const std::string& filename);

#endif // __PUZZLE_FILE_OPERATIONS_HPP___
