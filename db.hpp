#pragma once
#include <map>
#include <vector>
#include <fstream>
#include "word.hpp"
#include "solveresult.hpp"
#include "job.hpp"

// Solved jobs are kept in plain text logs, one line per job:
//   start target max_length -> found,exhausted,depth,w0-w1-...-wn,perf_visited,perf_microseconds
// A job can appear more than once; a later line only replaces an earlier one that stopped at
// the depth bound, and then only if it went deeper or settled the job.
namespace Db {
    typedef std::map<Job, Solver::SolveResult> Records;

    class Db_intf {
    public:
        virtual ~Db_intf() {};
        virtual void save(const Job& j, const Solver::SolveResult& result) = 0;
        // returns true if we found the answer cached in the db. If we return false [result] was not touched.
        virtual bool query(const Job& j, Solver::SolveResult& result) const = 0;

        bool query(const Job& j) const;
        // like query, but a miss that stopped short of [max_depth] levels doesn't count
        bool query(const Job& j, int max_depth, Solver::SolveResult& result) const;
    };

    class Read_write_db : public Db_intf {
    public:
        // you can load from many files
        void load_from_file(const std::string& filename);

        // you can only write to one file, and this fails if there's already an output file open
        void set_output_file(const std::string& filename);

        Read_write_db(bool debug_output);
        Read_write_db(const std::vector<std::string>& read_filenames, const std::string& write_filename, bool debug_output);

        virtual void save(const Job& j, const Solver::SolveResult& result);
        virtual bool query(const Job& j, Solver::SolveResult& result) const;
        using Db_intf::query;
        size_t size() const { return data.size(); }
    private:
        Records data;
        std::ofstream output_file;
        bool debug_output;

        friend void test();
    };

    // ignores save commands
    class Read_only_db : public Db_intf {
    public:
        Read_only_db(const std::vector<std::string>& filenames);

        virtual void save(const Job& j, const Solver::SolveResult& result);
        virtual bool query(const Job& j, Solver::SolveResult& result) const;
        using Db_intf::query;
    private:
        Records data;
    };

    // parses one log line, throws std::runtime_error if it's malformed
    std::pair<Job, Solver::SolveResult> record_of_string(const std::string& line);

    // true if [next] should replace [prev] for the same job
    bool supersedes(const Solver::SolveResult& next, const Solver::SolveResult& prev);

    void test();
}
