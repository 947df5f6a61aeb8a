#ifndef __WORD_LADDER_PUZZLE_HPP___
#define __WORD_LADDER_PUZZLE_HPP___

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "puzzle.hpp"

using namespace std;

typedef shared_ptr<const unordered_set<string>> WordSet;

/**
 * @brief Word ladder: step from `from_word` to `to_word` changing one letter
 * at a time, every intermediate word taken from the dictionary.
 *
 * The dictionary is shared read-only by every state derived from the same
 * initial puzzle.
 */
class WordLadderPuzzle {

private:
    string from_word;
    string to_word;
    WordSet words;
    void init(const string& from_word, const string& to_word, WordSet words);
public:
    /**
     * @throws MalformedInput on empty words, words of different length,
     * characters outside 'a'-'z' or a missing dictionary.
     */
    WordLadderPuzzle(const string& from_word, const string& to_word, WordSet words);
    WordLadderPuzzle(const string& from_word, const string& to_word, const unordered_set<string>& words);

    const string& get_from_word() const { return from_word; }
    const string& get_to_word() const { return to_word; }
    const WordSet& get_words() const { return words; }

    // Dictionary words one letter away, by position then by letter.
    vector<WordLadderPuzzle> extensions() const;
    bool is_solved() const;
    // The target is not in the dictionary, so no ladder can end on it.
    bool fail_fast() const;

    string canonical_key() const;
    string to_string() const;

    bool operator==(const WordLadderPuzzle& rhs) const;
    bool operator!=(const WordLadderPuzzle& rhs) const { return !(*this == rhs); }
};

#endif // __WORD_LADDER_PUZZLE_HPP___
