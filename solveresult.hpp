#pragma once
#include <string>
#include <vector>
#include "word.hpp"

namespace Solver {
    /* The result of Solver::solve'ing one start/target pair. */

    class SolveResult {
    public:
        SolveResult();
        bool found;
        // not found because the frontier ran dry, a deeper search won't help
        bool exhausted;
        // found: number of edits on the path (path.size() - 1).
        // not found: number of levels that were fully expanded.
        int depth;
        // start ... target, empty if not found
        std::vector<Word> path;

        // performance stats
        uint64_t perf_visited; // size of the visited map when the search stopped
        float perf_microseconds;

        // true if a search bounded at [max_depth] levels would come back with the same answer
        bool settles(int max_depth) const;

        // found,exhausted,depth,w0-w1-...-wn,perf_visited,perf_microseconds
        std::string to_string() const;
        static SolveResult of_string(const std::string& r);

        static void test();
    };

    std::ostream& operator<<(std::ostream& os, const SolveResult& s);
}
