#include <sstream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "solveresult.hpp"

using std::string;
using std::stringstream;

namespace Solver {
    SolveResult::SolveResult() : found(false), exhausted(false), depth(0), perf_visited(0), perf_microseconds(0) {};

    std::ostream& operator<<(std::ostream& os, const SolveResult& s) {
        os << s.found << "," << s.exhausted << "," << s.depth << ",";
        for (size_t i = 0; i < s.path.size(); i++) {
            if (i) os << "-";
            os << s.path[i];
        }
        os << "," << s.perf_visited << "," << s.perf_microseconds;
        return os;
    }

    bool SolveResult::settles(int max_depth) const {
        return found || exhausted || depth >= max_depth;
    }

    std::string SolveResult::to_string() const {
        stringstream ss;
        ss << *this;
        return ss.str();
    }

    SolveResult SolveResult::of_string(const std::string& r) {
        SolveResult t;
        stringstream ss(r);
        string g;
        try {
            std::getline(ss, g, ',');
            t.found = boost::lexical_cast<bool>(g);
            std::getline(ss, g, ',');
            t.exhausted = boost::lexical_cast<bool>(g);
            std::getline(ss, g, ',');
            t.depth = boost::lexical_cast<int>(g);
            std::getline(ss, g, ',');
            stringstream path(g);
            string w;
            while (std::getline(path, w, '-')) {
                t.path.push_back(Word(w));
            }
            std::getline(ss, g, ',');
            t.perf_visited = boost::lexical_cast<uint64_t>(g);
            std::getline(ss, g, ',');
            t.perf_microseconds = boost::lexical_cast<float>(g);
        } catch (const boost::bad_lexical_cast& e) {
            throw std::runtime_error("SolveResult::of_string: can't parse '" + r + "': " + e.what());
        }
        if (t.found && t.exhausted) {
            throw std::runtime_error("SolveResult::of_string: found and exhausted in '" + r + "'");
        }
        if (t.found && t.path.size() != static_cast<size_t>(t.depth) + 1) {
            throw std::runtime_error("SolveResult::of_string: path doesn't match depth in '" + r + "'");
        }
        return t;
    }

    void SolveResult::test() {
        SolveResult s;
        s.found = true;
        s.depth = 2;
        s.path.push_back(Word("ab"));
        s.path.push_back(Word("ba"));
        s.path.push_back(Word("a"));
        s.perf_visited = 234234;
        s.perf_microseconds = 111222333.456;

        std::stringstream output1;
        std::stringstream expected;

        output1
            << s << std::endl
            << of_string(s.to_string()) << std::endl;

        SolveResult n;
        n.depth = 31;
        n.perf_visited = 12;
        n.perf_microseconds = 1;

        output1
            << n << std::endl
            << of_string(n.to_string()) << std::endl;

        SolveResult e = of_string("0,1,14,,26,3");
        output1 << e << std::endl;

        // a bounded miss only answers searches that aren't allowed to go deeper
        output1 << n.settles(12) << n.settles(31) << n.settles(32) << " "
                << e.settles(31) << e.settles(100) << " "
                << s.settles(1) << s.settles(31) << std::endl;

        int rejected = 0;
        const char* bad[] = { "1,0,x,ab,1,1", "1,0,3,ab-ba,1,1", "0,0,0,,lots,1", "1,0,0,AB,1,1",
                              "1,1,1,ab-ba,1,1", "0,14,,26,3" };
        for (const char* b : bad) {
            try {
                of_string(b);
            } catch (const std::runtime_error&) {
                rejected++;
            }
        }
        output1 << rejected << std::endl;

        expected
            << "1,0,2,ab-ba-a,234234,1.11222e+08" << std::endl
            << "1,0,2,ab-ba-a,234234,1.11222e+08" << std::endl
            << "0,0,31,,12,1" << std::endl
            << "0,0,31,,12,1" << std::endl
            << "0,1,14,,26,3" << std::endl
            << "110 11 11" << std::endl
            << 6 << std::endl;

        std::string output1_str = output1.str();
        std::string expected_str = expected.str();
        if (output1_str != expected_str) {
            throw std::runtime_error("SolveResult::test() 1 failed, got " + output1_str + ", but expected " + expected_str);
        }
    }
}
