#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <unordered_map>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "word.hpp"
#include "solver.hpp"

using std::string;
using std::vector;
using std::cout;
using std::endl;
typedef boost::posix_time::ptime ptime;

namespace Solver {
    struct Visit {
        int depth;
        Word parent; // the root is its own parent
    };
    typedef std::unordered_map<Word, Visit, WordHash> VisitedMap;

    ptime now() {
        return boost::posix_time::microsec_clock::local_time();
    }

    // calls f on every neighbour of w: dupl_first, pop, shifts, rotations
    template <typename F>
    static void for_each_neighbour(const Word& w, int max_length, F f) {
        boost::optional<Word> d = w.dupl_first(max_length);
        if (d) f(*d);
        boost::optional<Word> p = w.pop();
        if (p) f(*p);
        for (const boost::optional<Word>& s : w.shifts()) {
            if (s) f(*s);
        }
        for (const boost::optional<Word>& r : w.rotate()) {
            if (r) f(*r);
        }
    }

    vector<Word> neighbours(const Word& w, int max_length) {
        vector<Word> rv;
        for_each_neighbour(w, max_length, [&rv](const Word& n) { rv.push_back(n); });
        return rv;
    }

    int default_max_length(const Word& start, const Word& target) {
        return std::max(start.length(), target.length());
    }

    static void check_search_word(const Word& w) {
        if (w.length() > Word::max_search_letters) {
            throw std::runtime_error("Can only search words of up to " + std::to_string(Word::max_search_letters)
                                     + " letters, not: " + w.to_string());
        }
    }

    void check_search(const Word& start, const Word& target, int max_length) {
        check_search_word(start);
        check_search_word(target);
        if (max_length < 0 || max_length > Word::max_search_letters) {
            throw std::runtime_error("max_length must be in 1.." + std::to_string(Word::max_search_letters)
                                     + " (or 0 for the longer word), not " + std::to_string(max_length));
        }
    }

    static vector<Word> reconstruct(const VisitedMap& visited, const Word& target) {
        vector<Word> path;
        Word w = target;
        while (true) {
            path.push_back(w);
            VisitedMap::const_iterator it = visited.find(w);
            if (it == visited.end()) {
                throw std::logic_error("Predecessor chain broken at " + w.to_string());
            }
            if (it->second.depth == 0) break;
            w = it->second.parent;
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    SolveResult solve(const Word& start,
                      const Word& target,
                      int max_length,
                      int max_depth,
                      bool debug_extra_info,
                      bool track_time) {
        check_search(start, target, max_length);
        if (max_length == 0) {
            max_length = default_max_length(start, target);
        }
        if (max_depth < 0) {
            throw std::runtime_error("max_depth must not be negative, not " + std::to_string(max_depth));
        }

        ptime begin;
        if (track_time) begin = now();

        SolveResult rv;
        VisitedMap visited;
        visited.reserve(100000);
        visited.insert(std::make_pair(start, Visit{0, start}));

        vector<Word> frontier(1, start);
        vector<Word> next;
        next.reserve(100);
        int depth = 0;
        while (!visited.count(target) && !frontier.empty() && depth < max_depth) {
            depth++;
            next.clear();
            for (const Word& k : frontier) {
                for_each_neighbour(k, max_length, [&](const Word& w) {
                        if (visited.insert(std::make_pair(w, Visit{depth, k})).second) {
                            next.push_back(w);
                        }
                    });
            }
            frontier.swap(next);

            if (debug_extra_info) {
                cout << now() << " " << depth << ": " << frontier.size() << " new, "
                     << visited.size() << " visited, " << target << ": "
                     << (visited.count(target) ? "found" : "not yet") << endl;
            }
        }

        VisitedMap::const_iterator found = visited.find(target);
        if (found != visited.end()) {
            rv.found = true;
            rv.depth = found->second.depth;
            rv.path = reconstruct(visited, target);
            if (rv.path.size() != static_cast<size_t>(rv.depth) + 1 || rv.path.front() != start) {
                throw std::logic_error("Reconstructed path doesn't match its depth for " + target.to_string());
            }
        } else {
            rv.depth = depth;
            rv.exhausted = frontier.empty();
        }
        rv.perf_visited = visited.size();
        if (track_time) rv.perf_microseconds = (now() - begin).total_microseconds();
        return rv;
    }

    //////////////////
    // tests

    static bool reachable_within(const Word& from, const Word& to, int steps, int max_length) {
        if (from == to) return true;
        if (steps == 0) return false;
        for (const Word& n : neighbours(from, max_length)) {
            if (reachable_within(n, to, steps - 1, max_length)) return true;
        }
        return false;
    }

    // iterative deepening, -1 if not within limit
    static int brute_force_distance(const Word& from, const Word& to, int max_length, int limit) {
        for (int d = 0; d <= limit; d++) {
            if (reachable_within(from, to, d, max_length)) return d;
        }
        return -1;
    }

    // every step is a single operator application and no word exceeds max_length
    static bool valid_path(const vector<Word>& path, int max_length) {
        for (size_t i = 0; i + 1 < path.size(); i++) {
            vector<Word> n = neighbours(path[i], max_length);
            if (std::find(n.begin(), n.end(), path[i + 1]) == n.end()) return false;
            if (i > 0 && path[i].length() > max_length) return false;
        }
        return true;
    }

    static void print_path(std::ostream& os, const SolveResult& r) {
        os << r.found << " " << r.depth << ":";
        for (const Word& w : r.path) os << " " << w;
        os << endl;
    }

    static void check(const std::stringstream& output, const std::stringstream& expected, int n) {
        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Solver::test() " + std::to_string(n) + " failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    static void test1() {
        std::stringstream output;
        std::stringstream expected;

        // start == target
        SolveResult r = solve(Word("sick"), Word("sick"), 0, default_max_depth, false, false);
        print_path(output, r);
        output << r.perf_visited << endl;

        // one edit each way
        print_path(output, solve(Word("abc"), Word("bca"), 0, default_max_depth, false, false));
        print_path(output, solve(Word("abc"), Word("bc"), 0, default_max_depth, false, false));
        print_path(output, solve(Word("a"), Word("aa"), 0, default_max_depth, false, false));
        print_path(output, solve(Word("bc"), Word("bd"), 0, default_max_depth, false, false));

        expected << "1 0: sick" << endl;
        expected << 1 << endl;
        expected << "1 1: abc bca" << endl;
        expected << "1 1: abc bc" << endl;
        expected << "1 1: a aa" << endl;
        expected << "1 1: bc bd" << endl;
        check(output, expected, 1);
    }

    // running out of levels and running out of words are both "not found"
    static void test2() {
        std::stringstream output;
        std::stringstream expected;

        // with only one letter allowed, a -> n takes 13 shifts either way round
        SolveResult r = solve(Word("a"), Word("n"), 1, 12, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.path.size() << endl;
        r = solve(Word("a"), Word("n"), 1, 13, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.path.size() << " " << valid_path(r.path, 1) << endl;

        // a two letter target can't be reached with max_length 1, the frontier runs dry
        r = solve(Word("a"), Word("ab"), 1, default_max_depth, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.perf_visited << endl;
        // level 14 is the one that comes back empty, so a bound of 14 still sees it run dry
        r = solve(Word("a"), Word("ab"), 1, 14, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.perf_visited << endl;
        r = solve(Word("a"), Word("ab"), 1, 13, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.perf_visited << endl;

        r = solve(Word("a"), Word("b"), 0, 0, false, false);
        output << r.found << r.exhausted << " " << r.depth << " " << r.perf_visited << endl;

        expected << "00 12 0" << endl;
        expected << "10 13 14 1" << endl;
        expected << "01 14 26" << endl;
        expected << "01 14 26" << endl;
        expected << "00 13 26" << endl;
        expected << "00 0 1" << endl;
        check(output, expected, 2);
    }

    static void test3() {
        std::stringstream output;
        std::stringstream expected;

        int rejected = 0;
        try { solve(Word("abcdefg"), Word("a"), 0, default_max_depth, false, false); } catch (const std::runtime_error&) { rejected++; }
        try { solve(Word("a"), Word("abcdefg"), 0, default_max_depth, false, false); } catch (const std::runtime_error&) { rejected++; }
        try { solve(Word("a"), Word("b"), 7, default_max_depth, false, false); } catch (const std::runtime_error&) { rejected++; }
        try { solve(Word("a"), Word("b"), -1, default_max_depth, false, false); } catch (const std::runtime_error&) { rejected++; }
        try { solve(Word("a"), Word("b"), 0, -1, false, false); } catch (const std::runtime_error&) { rejected++; }
        output << rejected << " " << default_max_length(Word("ab"), Word("abcde")) << endl;

        rejected = 0;
        try { check_search(Word("abcdefg"), Word("a"), 0); } catch (const std::runtime_error&) { rejected++; }
        try { check_search(Word("a"), Word("abcdefg"), 3); } catch (const std::runtime_error&) { rejected++; }
        try { check_search(Word("ab"), Word("ba"), 9); } catch (const std::runtime_error&) { rejected++; }
        try { check_search(Word("ab"), Word("ba"), -2); } catch (const std::runtime_error&) { rejected++; }
        check_search(Word("abcdef"), Word("a"), 0);
        check_search(Word("ab"), Word("ba"), 6);
        output << rejected << endl;

        expected << "5 5" << endl;
        expected << "4" << endl;
        check(output, expected, 3);
    }

    // bfs depth matches a brute force search on short words
    static void test4() {
        std::stringstream output;
        std::stringstream expected;
        const char* pairs[][2] = {
            { "ab", "ba" }, { "a", "c" }, { "abc", "cab" }, { "abc", "bc" }, { "ab", "aab" },
            { "az", "za" }, { "abc", "cba" }, { "b", "bc" }, { "xyz", "x" }, { "zz", "aa" },
            { "ba", "abb" }, { "abc", "a" }
        };
        for (const auto& p : pairs) {
            Word from(p[0]);
            Word to(p[1]);
            int max_length = default_max_length(from, to);
            SolveResult r = solve(from, to, 0, default_max_depth, false, false);
            int brute = brute_force_distance(from, to, max_length, 6);
            output << p[0] << " " << p[1] << " "
                   << r.found << " " << (r.depth == brute) << " "
                   << (r.path.size() == static_cast<size_t>(r.depth) + 1) << " "
                   << valid_path(r.path, max_length) << " "
                   << (!r.path.empty() && r.path.front() == from) << (!r.path.empty() && r.path.back() == to) << endl;
            expected << p[0] << " " << p[1] << " 1 1 1 1 11" << endl;
        }
        check(output, expected, 4);
    }

    static void test5() {
        std::stringstream output;
        std::stringstream expected;

        // sick -> true needs 12 edits at cap 4, and nothing shorter turns up one level earlier
        Word start("sick");
        Word target("true");
        SolveResult r = solve(start, target, 4, default_max_depth, false, false);
        output << r.found << " " << r.depth << " " << (r.path.size() == static_cast<size_t>(r.depth) + 1) << " "
               << valid_path(r.path, 4) << " " << (!r.path.empty() && r.path.front() == start) << (!r.path.empty() && r.path.back() == target) << endl;
        SolveResult shorter = solve(start, target, 4, r.depth - 1, false, false);
        output << shorter.found << shorter.exhausted << " " << shorter.depth << endl;
        expected << "1 12 1 1 11" << endl;
        expected << "00 11" << endl;
        check(output, expected, 5);
    }

    void test() {
        test1();
        test2();
        test3();
        test4();
        test5();
    }
}
