#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <boost/program_options.hpp>
#include "word.hpp"
#include "job.hpp"
#include "solver.hpp"
#include "solveresult.hpp"
#include "db.hpp"

using std::vector;
using std::cout;
using std::cerr;
using std::string;
using std::endl;

namespace po = boost::program_options;

static void print_result(const Job& job, const Solver::SolveResult& r, bool cached) {
    cout << job.get_start() << " -> " << job.get_target() << ": ";
    if (r.found) {
        cout << "depth " << r.depth << ":";
        for (const Word& w : r.path) cout << " " << w;
    } else {
        cout << "not found within " << r.depth << " levels";
        if (r.exhausted) cout << " (no more words to try)";
    }
    if (cached) {
        cout << " [from db]" << endl;
    } else {
        cout << " [" << r.perf_visited << " visited, " << (r.perf_microseconds / 1e6) << "s]" << endl;
    }
}

static int run(int argc, char* argv[]) {
    int max_length = 0;
    int max_depth = Solver::default_max_depth;
    string opt_input;
    vector<string> opt_dbr;
    string opt_dbw;
    vector<string> words;

    po::options_description desc("Find the shortest word ladder between pairs of words");
    desc.add_options()
        ("input,i",      po::value<string>(&opt_input),                                       "file with one 'start target [max_length]' per line")
        ("max-length,l", po::value<int>(&max_length)->default_value(0),                       "longest word dupl_first may build, 0 = longer of start/target")
        ("max-depth,d",  po::value<int>(&max_depth)->default_value(Solver::default_max_depth), "give up after this many levels")
        ("dbr,r",        po::value<vector<string>>(&opt_dbr),                                  "read-only db of solved jobs")
        ("dbw,w",        po::value<string>(&opt_dbw),                                          "read-write db, solved jobs are appended")
        ("quiet,q",                                                                            "don't print progress per level")
        ("help,h",                                                                             "produce help message");
    po::options_description hidden;
    hidden.add_options()
        ("words", po::value<vector<string>>(&words), "start and target");
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("words", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);
    if (vm.count("help")) {
        cerr << "Usage: " << argv[0] << " [options] [start target]" << endl << desc << endl;
        return 1;
    }
    bool quiet = vm.count("quiet") > 0;

    if (max_depth < 0) {
        throw std::runtime_error("--max-depth can't be negative, not " + std::to_string(max_depth));
    }

    Word::test();
    Solver::SolveResult::test();
    Job::test();

    vector<Job> jobs;
    if (!opt_input.empty()) {
        jobs = load_jobs(opt_input, max_length);
    }
    if (words.size() == 2) {
        jobs.push_back(Job(Word(words[0]), Word(words[1]), max_length));
    } else if (!words.empty()) {
        cerr << "Expected exactly two words (start and target), got " << words.size() << endl;
        return 1;
    }
    if (jobs.empty()) {
        cerr << "Nothing to do, give a start and target word or --input" << endl << desc << endl;
        return 1;
    }
    sort_by_heuristic(jobs);
    cout << "Loaded " << jobs.size() << " jobs" << endl;

    std::shared_ptr<Db::Db_intf> db_ptr;
    if (opt_dbw.empty()) {
        db_ptr = std::make_shared<Db::Read_only_db>(opt_dbr);
    } else {
        // the write db is read back too, so a rerun skips what's already solved
        vector<string> read_files(opt_dbr);
        read_files.push_back(opt_dbw);
        db_ptr = std::make_shared<Db::Read_write_db>(read_files, opt_dbw, !quiet);
    }
    Db::Db_intf& db(*db_ptr);

    int not_found = 0;
    for (const Job& job : jobs) {
        Solver::SolveResult r;
        // a miss saved under a smaller --max-depth is solved again
        bool cached = db.query(job, max_depth, r);
        if (!cached) {
            if (!quiet) cout << "Solving " << job << "..." << endl;
            r = Solver::solve(job.get_start(), job.get_target(), job.get_max_length(), max_depth, !quiet, true);
            db.save(job, r);
        }
        print_result(job, r, cached);
        if (!r.found) not_found++;
    }
    cout << (jobs.size() - not_found) << "/" << jobs.size() << " found" << endl;
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const po::error& e) {
        cerr << e.what() << endl;
        return 1;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 2;
    }
}
