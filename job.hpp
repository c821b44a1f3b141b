#pragma once
#include <string>
#include <vector>
#include <iostream>
#include "word.hpp"

// A thing to be solved: find the shortest ladder from [start] to [target] where dupl_first
// never grows a word past [max_length]. max_length = 0 means "the longer of the two words",
// see effective_max_length.
class Job {
public:
    // throws std::runtime_error for endpoints or a max_length the search can't take,
    // see Solver::check_search
    Job(const Word& start_, const Word& target_, int max_length_ = 0);

    // format is "start target [max_length]", separated by whitespace
    static Job of_string(const std::string& str);

    const Word& get_start() const;
    const Word& get_target() const;
    int get_max_length() const;
    int effective_max_length() const;

    // jobs compare by effective_max_length, not by what was written down
    bool operator<(const Job& k) const;
    bool operator==(const Job& k) const;

    static void test();
private:
    Word start;
    Word target;
    int max_length;
};

std::ostream& operator<<(std::ostream&, const Job&);

// one job per line, blank lines and lines starting with '#' are skipped. Jobs without their
// own max_length get [default_max_length]. Throws if the file can't be read or a line
// doesn't parse.
std::vector<Job> load_jobs(const std::string& filename, int default_max_length = 0);

// cheapest searches first: by effective_max_length, then total letters, then start/target
void sort_by_heuristic(std::vector<Job>& jobs);
