#pragma once
#include <vector>
#include "word.hpp"
#include "solveresult.hpp"

namespace Solver {
    // number of levels expanded before giving up
    const int default_max_depth = 31;

    // the longer of the two endpoints
    int default_max_length(const Word& start, const Word& target);

    // Throws std::runtime_error unless both endpoints fit in Word::max_search_letters and
    // [max_length] is 0 (the default) or 1..Word::max_search_letters.
    void check_search(const Word& start, const Word& target, int max_length);

    // Breadth first search from [start] until [target] shows up in the visited map.
    // The visited map only records (depth, predecessor) per word, and the path is walked
    // back from [target] once the level that found it has been fully expanded.
    //
    // Throws std::runtime_error if either endpoint is longer than Word::max_search_letters,
    // or [max_length] / [max_depth] are out of range. Running out of levels or out of words is
    // not an error, it comes back as rv.found = false, with rv.exhausted set for the latter.
    SolveResult solve
    (const Word& start,
     const Word& target,
     int max_length,
     // dupl_first never makes words longer than this. 0 means default_max_length.
     int max_depth,
     // at most this many levels are expanded
     bool debug_extra_info,
     // prints one line per level
     bool track_time
     // if false we put garbage into rv.perf_microseconds
     );

    // every word one operator away from [w], in the order the search applies them.
    // Duplicates (eg. rotations of periodic words) are kept.
    std::vector<Word> neighbours(const Word& w, int max_length);

    void test();
}
