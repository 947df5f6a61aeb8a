#include <string>
#include <unordered_set>
#include <vector>

#include "word_ladder_puzzle.hpp"

using namespace std;

static void check_word(const string& word) {
    if (word.empty()) {
        throw MalformedInput("Word ladder words cannot be empty");
    }
    for (char ch : word) {
        if (ch < 'a' || ch > 'z') {
            throw MalformedInput("Word '" + word + "' must use lowercase letters a-z only");
        }
    }
}

void WordLadderPuzzle::init(const string& from_word, const string& to_word, WordSet words) {
    if (!words) {
        throw MalformedInput("Word ladder needs a dictionary");
    }
    check_word(from_word);
    check_word(to_word);
    if (from_word.size() != to_word.size()) {
        throw MalformedInput("Words '" + from_word + "' and '" + to_word + "' differ in length");
    }
    this->from_word = from_word;
    this->to_word = to_word;
    this->words = std::move(words);
}

WordLadderPuzzle::WordLadderPuzzle(const string& from_word, const string& to_word, WordSet words) {
    init(from_word, to_word, std::move(words));
}

WordLadderPuzzle::WordLadderPuzzle(const string& from_word, const string& to_word, const unordered_set<string>& words) {
    init(from_word, to_word, make_shared<const unordered_set<string>>(words));
}

vector<WordLadderPuzzle> WordLadderPuzzle::extensions() const {
    vector<WordLadderPuzzle> moves;
    string changed = from_word;
    for (size_t i = 0; i < from_word.size(); ++i) {
        for (char letter = 'a'; letter <= 'z'; ++letter) {
            if (letter == from_word[i]) continue;
            changed[i] = letter;
            if (words->count(changed)) {
                WordLadderPuzzle next = *this;
                next.from_word = changed;
                moves.push_back(next);
            }
        }
        changed[i] = from_word[i];
    }
    return moves;
}

bool WordLadderPuzzle::is_solved() const {
    return from_word == to_word;
}

bool WordLadderPuzzle::fail_fast() const {
    return from_word != to_word && words->count(to_word) == 0;
}

string WordLadderPuzzle::canonical_key() const {
    return from_word + "->" + to_word;
}

string WordLadderPuzzle::to_string() const {
    return from_word + " -> " + to_word;
}

bool WordLadderPuzzle::operator==(const WordLadderPuzzle &rhs) const {
    return canonical_key() == rhs.canonical_key();
}
