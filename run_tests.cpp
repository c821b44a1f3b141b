#include <iostream>
#include <stdexcept>
#include "word.hpp"
#include "solveresult.hpp"
#include "solver.hpp"
#include "job.hpp"
#include "db.hpp"

int main() {
    try {
        Word::test();
        std::cout << "Word::test() ok" << std::endl;
        Solver::SolveResult::test();
        std::cout << "SolveResult::test() ok" << std::endl;
        Job::test();
        std::cout << "Job::test() ok" << std::endl;
        Db::test();
        std::cout << "Db::test() ok" << std::endl;
        Solver::test();
        std::cout << "Solver::test() ok" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
