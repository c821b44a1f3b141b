#include <fstream>
#include <sstream>
#include <cstdio>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "db.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using std::pair;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;
using Solver::SolveResult;

namespace Db {
    static const string separator = " -> ";

    //////////////////
    // Db_intf
    static SolveResult dummy_result;
    bool Db_intf::query(const Job& j) const { return query(j, dummy_result); }

    // internal to this file
    std::ostream& operator<<(std::ostream& os, const pair<Job, SolveResult>& kv) {
        os << kv.first << separator << kv.second;
        return os;
    }

    pair<Job, SolveResult> record_of_string(const string& line) {
        size_t p = line.find(separator);
        if (p == string::npos) {
            throw std::runtime_error("Bad db record, no '" + separator + "' in: " + line);
        }
        return pair<Job, SolveResult>(Job::of_string(line.substr(0, p)),
                                      SolveResult::of_string(line.substr(p + separator.size())));
    }

    // calls f on every record in the file, returns false if the file couldn't be opened
    template <typename F>
    static bool for_each_record(const string& filename, F f) {
        std::ifstream ifs(filename.c_str());
        if (!ifs.is_open()) return false;
        string line;
        while (std::getline(ifs, line)) {
            if (line.empty()) continue;
            f(record_of_string(line));
        }
        return true;
    }

    bool supersedes(const SolveResult& next, const SolveResult& prev) {
        if (prev.found || prev.exhausted) return false;
        return next.found || next.exhausted || next.depth > prev.depth;
    }

    // returns true if [record] went into [data]
    static bool merge(Records& data, const pair<Job, SolveResult>& record) {
        Records::iterator it = data.find(record.first);
        if (it == data.end()) {
            data.insert(record);
            return true;
        }
        if (!supersedes(record.second, it->second)) return false;
        it->second = record.second;
        return true;
    }

    // not set externally, only used for the test.
    bool silence = false;

    // returns false if the file couldn't be opened
    static bool load_records(const string& filename, Records& data) {
        ptime start = microsec_clock::local_time();
        uint64_t count = 0;
        bool opened = for_each_record(filename, [&data, &count](const pair<Job, SolveResult>& record) {
                merge(data, record);
                count++;
            });
        if (opened && !silence) {
            cerr << "Read " << count << " record from db: " << filename
                 << ", took " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << "s" << endl;
        }
        return opened;
    }

    bool Db_intf::query(const Job& j, int max_depth, SolveResult& result) const {
        SolveResult cached;
        if (!query(j, cached) || !cached.settles(max_depth)) return false;
        result = cached;
        return true;
    }

    //////////////////
    // Read_write_db

    Read_write_db::Read_write_db(bool debug_output_) : debug_output(debug_output_) {}
    Read_write_db::Read_write_db(const vector<string>& read_filenames, const string& write_filename, bool debug_output_) : debug_output(debug_output_) {
        for (const string& file : read_filenames) {
            load_from_file(file);
        }
        if (!write_filename.empty()) set_output_file(write_filename);
    }
    // a missing file is fine, it's usually the output file on its first run
    void Read_write_db::load_from_file(const string& filename) {
        load_records(filename, data);
    }
    void Read_write_db::set_output_file(const string& filename) {
        if (output_file.is_open()) {
            throw std::runtime_error("Can't set_output_file if an output_file is already open.");
        }

        output_file.clear();
        output_file.open(filename, std::ios::app);
        if (!output_file.is_open()) {
            throw std::runtime_error("Can't open db for writing: " + filename);
        }
        output_file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
        if (!silence) cerr << "Writing to db: " << filename << endl;
    }
    void Read_write_db::save(const Job& j, const SolveResult& r) {
        pair<Job, SolveResult> next_record(j, r);
        if (!merge(data, next_record)) return;

        if (output_file.is_open() && output_file.good()) {
            if (debug_output) {
                cerr << "saving " << next_record << endl;
            }
            output_file << next_record << '\n';
            output_file.flush();
        } else if (debug_output) {
            cerr << "not saving " << next_record << endl;
        }
    }

    bool Read_write_db::query(const Job& j, SolveResult& result) const {
        Records::const_iterator it = data.find(j);
        if (it == data.end()) return false;
        result = it->second;
        return true;
    }

    //////////////////
    // Read_only_db

    Read_only_db::Read_only_db(const vector<string>& filenames) {
        for (const string& file : filenames) {
            if (!load_records(file, data)) {
                cerr << "Error opening db: " << file << endl;
            }
        }
    }
    void Read_only_db::save(const Job&, const SolveResult&) {
        return;
    }
    bool Read_only_db::query(const Job& j, SolveResult& result) const {
        Records::const_iterator it = data.find(j);
        if (it == data.end()) return false;
        result = it->second;
        return true;
    }

    static void print_query(std::ostream& os, const Db_intf& db, const Job& j) {
        SolveResult r;
        bool cached = db.query(j, r);
        os << j << " " << cached << " " << r << endl;
    }

    void test() {
        silence = true;
        string tmpfile = "/tmp/tmp.ladder.db.txt";
        remove(tmpfile.c_str());

        std::stringstream output1;
        std::stringstream expected1;
        std::stringstream output2;
        std::stringstream expected2;

        SolveResult found;
        found.found = true;
        found.depth = 1;
        found.path.push_back(Word("abc"));
        found.path.push_back(Word("bca"));
        found.perf_visited = 17;
        found.perf_microseconds = 4.5;

        SolveResult dry;
        dry.exhausted = true;
        dry.depth = 14;
        dry.perf_visited = 26;
        dry.perf_microseconds = 3.25;

        SolveResult shallow;
        shallow.depth = 3;
        shallow.perf_visited = 4;
        shallow.perf_microseconds = 1;

        SolveResult deeper;
        deeper.depth = 12;
        deeper.perf_visited = 14;
        deeper.perf_microseconds = 2;

        Job k1(Word("abc"), Word("bca"));
        Job k2(Word("a"), Word("ab"), 1);
        Job k3(Word("sick"), Word("true"), 4);
        Job k4(Word("a"), Word("n"), 1);

        Read_write_db rw(false);
        rw.set_output_file(tmpfile);
        print_query(output1, rw, k1);
        output1 << rw.query(k2) << endl;
        rw.save(k1, found);
        rw.save(k2, dry);
        // k1 is already solved, this one is dropped
        rw.save(k1, dry);
        print_query(output1, rw, k1);
        print_query(output1, rw, k2);

        SolveResult s;
        // only a run that ran dry answers for any depth
        bool q = rw.query(k2, 100, s);
        output1 << q << " " << s << endl;
        rw.save(k4, shallow);
        s = SolveResult();
        output1 << rw.query(k4) << rw.query(k4, 3, s) << rw.query(k4, 31, s) << " ";
        output1 << s << endl;
        rw.save(k4, deeper);
        rw.save(k4, shallow);
        print_query(output1, rw, k4);
        output1 << rw.query(k4, 12, s) << rw.query(k4, 13, s) << endl;

        // written without a max_length, looked up with the one it defaults to
        rw.save(Job(Word("sick"), Word("true")), shallow);
        rw.save(k3, shallow);
        print_query(output1, rw, k3);
        output1 << rw.size() << endl;
        rw.output_file.close();

        expected1 << "abc bca 0 0 0,0,0,,0,0" << endl;
        expected1 << 0 << endl;
        expected1 << "abc bca 0 1 1,0,1,abc-bca,17,4.5" << endl;
        expected1 << "a ab 1 1 0,1,14,,26,3.25" << endl;
        expected1 << "1 0,1,14,,26,3.25" << endl;
        expected1 << "110 0,0,3,,4,1" << endl;
        expected1 << "a n 1 1 0,0,12,,14,2" << endl;
        expected1 << "10" << endl;
        expected1 << "sick true 4 1 0,0,3,,4,1" << endl;
        expected1 << 4 << endl;

        std::string output1_str = output1.str();
        std::string expected1_str = expected1.str();
        if (output1_str != expected1_str) {
            remove(tmpfile.c_str());
            throw std::runtime_error("Db::test() 1 failed, got\n" + output1_str + ", but expected\n" + expected1_str);
        }

        // the log has both a n 1 lines, reading it back keeps the deeper one
        Read_only_db ro({tmpfile});
        Read_write_db rw2({tmpfile}, "", false);
        Job other(Word("b"), Word("c"));
        ro.save(other, found);
        print_query(output2, ro, k1);
        print_query(output2, ro, k2);
        print_query(output2, ro, k3);
        print_query(output2, ro, k4);
        print_query(output2, ro, other);
        output2 << ro.query(k3, 3, s) << ro.query(k3, 31, s) << endl;
        output2 << rw2.size() << " " << rw2.query(k1) << rw2.query(k2) << rw2.query(k3) << rw2.query(k4) << rw2.query(other) << endl;

        int rejected = 0;
        const char* bad[] = { "abc bca 0 1,0,1,abc-bca,17,4.5", "abc -> 1,0,1,abc-bca,17,4.5",
                              "abc bca 0 -> 1,0,1,abc-bca", "abc bca 9 -> 1,0,1,abc-bca,17,4.5",
                              "abc bca 0 -> 1,1,abc-bca,17,4.5" };
        for (const char* b : bad) {
            try {
                record_of_string(b);
            } catch (const std::runtime_error&) {
                rejected++;
            }
        }
        output2 << rejected << endl;

        expected2 << "abc bca 0 1 1,0,1,abc-bca,17,4.5" << endl;
        expected2 << "a ab 1 1 0,1,14,,26,3.25" << endl;
        expected2 << "sick true 4 1 0,0,3,,4,1" << endl;
        expected2 << "a n 1 1 0,0,12,,14,2" << endl;
        expected2 << "b c 0 0 0,0,0,,0,0" << endl;
        expected2 << "10" << endl;
        expected2 << "4 11110" << endl;
        expected2 << 5 << endl;

        remove(tmpfile.c_str());
        std::string output2_str = output2.str();
        std::string expected2_str = expected2.str();
        if (output2_str != expected2_str) {
            throw std::runtime_error("Db::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
        }
        silence = false;
    }

}
