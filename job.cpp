#include <sstream>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <cstdio>
#include <boost/lexical_cast.hpp>
#include "job.hpp"
#include "solver.hpp"

using std::string;
using std::vector;

Job::Job(const Word& start_, const Word& target_, int max_length_) :
    start(start_),
    target(target_),
    max_length(max_length_)
{
    Solver::check_search(start, target, max_length);
};

Job Job::of_string(const std::string& str) {
    std::istringstream ss(str);
    string s, t, l, extra;
    if (!(ss >> s >> t)) {
        throw std::runtime_error("Job::of_string: expected 'start target [max_length]', not: " + str);
    }
    int max_length = 0;
    if (ss >> l) {
        try {
            max_length = boost::lexical_cast<int>(l);
        } catch (const boost::bad_lexical_cast&) {
            throw std::runtime_error("Job::of_string: bad max_length in: " + str);
        }
    }
    if (ss >> extra) {
        throw std::runtime_error("Job::of_string: trailing junk in: " + str);
    }
    return Job(Word(s), Word(t), max_length);
}

const Word& Job::get_start() const { return start; }
const Word& Job::get_target() const { return target; }
int Job::get_max_length() const { return max_length; }

int Job::effective_max_length() const {
    if (max_length != 0) return max_length;
    return std::max(start.length(), target.length());
}

bool Job::operator<(const Job& k) const {
    if (start < k.start) return true;
    if (k.start < start) return false;
    if (target < k.target) return true;
    if (k.target < target) return false;
    return effective_max_length() < k.effective_max_length();
};

// "sick true" and "sick true 4" are the same search
bool Job::operator==(const Job& k) const {
    return start == k.start && target == k.target && effective_max_length() == k.effective_max_length();
}

std::ostream& operator<<(std::ostream& os, const Job& k) {
    os << k.get_start() << " " << k.get_target() << " " << k.get_max_length();
    return os;
}

vector<Job> load_jobs(const string& filename, int default_max_length) {
    std::ifstream f(filename.c_str());
    if (!f.is_open()) {
        throw std::runtime_error("Can't open job file: " + filename);
    }
    vector<Job> rv;
    string line;
    while (std::getline(f, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == string::npos || line[first] == '#') continue;
        Job j = Job::of_string(line);
        if (j.get_max_length() == 0 && default_max_length != 0) {
            j = Job(j.get_start(), j.get_target(), default_max_length);
        }
        rv.push_back(j);
    }
    return rv;
}

void sort_by_heuristic(vector<Job>& jobs) {
    std::stable_sort
        (jobs.begin(),
         jobs.end(),
         [] (const Job& lhs, const Job& rhs) -> bool {
            int ll = lhs.effective_max_length();
            int rl = rhs.effective_max_length();
            if (ll != rl) return ll < rl;
            int lt = lhs.get_start().length() + lhs.get_target().length();
            int rt = rhs.get_start().length() + rhs.get_target().length();
            if (lt != rt) return lt < rt;
            return lhs < rhs;
        });
}

void Job::test() {
    Job j0 = of_string("sick true");
    Job j1 = of_string("  a   zz 5 ");
    Job j2 = of_string("abc\tb\t3");
    Job j3(Word("ab"), Word("abcdef"));

    std::stringstream output;
    std::stringstream expected;
    output << j0 << " " << j0.effective_max_length() << std::endl;
    output << j1 << " " << j1.effective_max_length() << std::endl;
    output << j2 << " " << j2.effective_max_length() << std::endl;
    output << j3 << " " << j3.effective_max_length() << std::endl;
    output << (j0 == of_string("sick true 0")) << (j0 == of_string("sick true 4")) << (j0 < of_string("sick true 4"))
           << (j0 == j1) << (j0 < j1 || j1 < j0) << (j0 == of_string("sick true 5")) << std::endl;

    int rejected = 0;
    const char* bad[] = { "", "sick", "sick true four", "sick true 4 5", "Sick true", "sick true -1",
                          "abcdefg a", "a abcdefg", "ab ba 9", "ab ba 7" };
    for (const char* b : bad) {
        try {
            of_string(b);
        } catch (const std::runtime_error&) {
            rejected++;
        }
    }
    output << rejected << std::endl;

    vector<Job> jobs;
    jobs.push_back(j3);
    jobs.push_back(j0);
    jobs.push_back(j1);
    jobs.push_back(j2);
    jobs.push_back(of_string("ab cd"));
    sort_by_heuristic(jobs);
    for (const Job& j : jobs) output << j << ", ";
    output << std::endl;

    string tmpfile = "/tmp/tmp.ladder.jobs.txt";
    {
        std::ofstream f(tmpfile.c_str());
        f << "# start target [max_length]" << std::endl
          << std::endl
          << "sick true" << std::endl
          << "  # indented comment" << std::endl
          << "a b 2" << std::endl;
    }
    for (const Job& j : load_jobs(tmpfile, 5)) output << j << ", ";
    output << load_jobs(tmpfile).front() << std::endl;
    try {
        load_jobs(tmpfile, 9);
        output << "loaded with max_length 9" << std::endl;
    } catch (const std::runtime_error&) {
        output << "max_length 9 rejected" << std::endl;
    }
    {
        // a bad line anywhere fails the whole file before anything runs
        std::ofstream f(tmpfile.c_str());
        f << "ab ba" << std::endl
          << "abcdefg a" << std::endl;
    }
    try {
        output << load_jobs(tmpfile).size() << " jobs loaded" << std::endl;
    } catch (const std::runtime_error&) {
        output << "long word rejected" << std::endl;
    }
    remove(tmpfile.c_str());
    try {
        load_jobs(tmpfile);
        output << "loaded missing file" << std::endl;
    } catch (const std::runtime_error&) {
        output << "missing file rejected" << std::endl;
    }

    expected << "sick true 0 4" << std::endl;
    expected << "a zz 5 5" << std::endl;
    expected << "abc b 3 3" << std::endl;
    expected << "ab abcdef 0 6" << std::endl;
    expected << "110010" << std::endl;
    expected << 10 << std::endl;
    expected << "ab cd 0, abc b 3, sick true 0, a zz 5, ab abcdef 0, " << std::endl;
    expected << "sick true 5, a b 2, sick true 0" << std::endl;
    expected << "max_length 9 rejected" << std::endl;
    expected << "long word rejected" << std::endl;
    expected << "missing file rejected" << std::endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Job::test() failed, got " + output_str + ", but expected " + expected_str);
    }
}
