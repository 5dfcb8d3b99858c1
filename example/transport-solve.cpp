#include <iostream>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <boost/program_options.hpp>
#include "transportation.hpp"
#include "transport-io.hpp"

struct MethodRun {
    transportation::InitialMethod method;
    transportation::TransportResult result;
    double constructionTime;
    double refineTime;
    double totalTime() const { return constructionTime + refineTime; }
};

MethodRun runMethod(transportation::InitialMethod method,
        const transportation::TransportProblem& problem,
        const transportation::TransportParams& params) {
    MethodRun run;
    run.method = method;

    auto startTime = std::chrono::steady_clock::now();
    auto initial = transportation::InitialSolution(method, problem.costs,
            problem.supply, problem.demand, params);
    auto refineStart = std::chrono::steady_clock::now();
    run.result = transportation::Refine(problem.costs, initial, params);
    auto endTime = std::chrono::steady_clock::now();

    run.constructionTime = std::chrono::duration<double>{refineStart - startTime}.count();
    run.refineTime = std::chrono::duration<double>{endTime - refineStart}.count();
    run.result.initialCost = transportation::TotalCost(problem.costs, initial);
    run.result.initialAllocations = std::move(initial);
    run.result.stats.constructionTime = run.constructionTime;
    return run;
}

void printRun(const MethodRun& run, bool showAllocation) {
    const auto& r = run.result;
    std::string name = transportation::MethodName(run.method);
    std::cout << std::string(60, '-') << "\n";
    std::cout << name << " + MODI\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "Initial BFS time:       " << run.constructionTime << " s\n";
    std::cout << "MODI time:              " << run.refineTime << " s\n";
    std::cout << "  Potentials:           " << r.stats.dualTime << " s\n";
    std::cout << "  Entering scan:        " << r.stats.scanTime << " s\n";
    std::cout << "  Loops and pivots:     " << r.stats.pivotTime << " s\n";
    std::cout << "Total time:             " << run.totalTime() << " s\n";
    std::cout << "Initial cost:           " << r.initialCost << "\n";
    std::cout << "Optimal cost:           " << r.totalCost << "\n";
    std::cout << "Iterations:             " << r.iterations << "\n";
    std::cout << "Degenerate fill cells:  " << r.repairInsertions << "\n";
    std::cout << "Status:                 " << (r.optimal() ? "optimal" : "NOT CONVERGED") << "\n";
    if (showAllocation) {
        for (const auto& a : r.allocations)
            std::cout << "\t(" << a.row << ", " << a.col << ")\t" << a.flow << "\n";
    }
}

transportation::TransportProblem loadProblem(const std::string& filename) {
    try {
        return transportation::LoadProblem(filename);
    } catch (std::exception& e) {
        std::cout << "Could not load problem " << filename << ": " << e.what() << "\n";
        exit(-1);
    }
}

int main(int argc, char **argv) {
    namespace po = boost::program_options;
    // Variables set by program options
    std::string problemFile;
    std::string method;
    std::string outFile;
    bool showAllocation = false;
    transportation::TransportParams params {};

    po::options_description options_desc("Transport solve arguments");
    options_desc.add_options()
        ("help", "Display this help message")
        ("problem", po::value<std::string>(&problemFile)->required(), "JSON problem file with costs, supply and demand")
        ("method,m", po::value<std::string>(&method)->default_value("both"), "Initial solution method, one of [vogel|russell|both]")
        ("max-iter", po::value<int>(&params.maxIterations)->default_value(0), "MODI iteration cap, 0 for 10*(n+m)")
        ("balance-tol", po::value<double>(&params.balanceTolerance)->default_value(1.0e-2), "Allowed difference between total supply and demand")
        ("optimality-tol", po::value<double>(&params.optimalityTolerance)->default_value(1.0e-9), "Smallest opportunity value that still enters the basis")
        ("parallel-threshold", po::value<int>(&params.parallelThreshold)->default_value(10000), "Cell count from which the entering scan runs in parallel, 0 to disable")
        ("output,o", po::value<std::string>(&outFile), "Write the result as JSON (last method run)")
        ("allocation,a", po::bool_switch(&showAllocation), "Print the final allocation")
        ("verbose,v", po::bool_switch(&params.verbose), "Print every allocation step and pivot")
    ;

    po::positional_options_description popts_desc;
    popts_desc.add("problem", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                options(options_desc).positional(popts_desc).run(), vm);
    } catch (std::exception& e) {
        std::cout << "Parsing error: " << e.what() << "\n";
        std::cout << "Usage: transport-solve [options] problem.json\n";
        std::cout << options_desc;
        exit(-1);
    }

    if (vm.count("help") != 0) {
        std::cout << "Usage: transport-solve [options] problem.json\n";
        std::cout << options_desc;
        exit(0);
    }
    try {
        po::notify(vm);
    } catch (std::exception& e) {
        std::cout << "Parsing error: " << e.what() << "\n";
        std::cout << "Usage: transport-solve [options] problem.json\n";
        std::cout << options_desc;
        exit(-1);
    }

    std::vector<transportation::InitialMethod> methods;
    try {
        if (method == "both") {
            methods = { transportation::InitialMethod::Vogel, transportation::InitialMethod::Russell };
        } else {
            methods = { transportation::ParseMethod(method) };
        }
    } catch (transportation::PreconditionError& e) {
        std::cout << e.what() << "\n";
        exit(-1);
    }

    auto problem = loadProblem(problemFile);

    std::cout << std::setprecision(10);
    std::cout << "Problem: " << problem.costs.shape()[0] << " sources x "
        << problem.costs.shape()[1] << " destinations\n";

    std::vector<MethodRun> runs;
    try {
        for (auto m : methods) {
            runs.push_back(runMethod(m, problem, params));
            printRun(runs.back(), showAllocation);
        }
    } catch (transportation::PreconditionError& e) {
        std::cout << "Invalid problem: " << e.what() << "\n";
        exit(-1);
    } catch (transportation::InternalError& e) {
        std::cout << "Internal error in state " << e.state() << " at iteration "
            << e.iteration() << ": " << e.what() << "\n";
        for (const auto& a : e.basis())
            std::cout << "\t(" << a.row << ", " << a.col << ")\t" << a.flow << "\n";
        exit(-2);
    }

    if (runs.size() == 2) {
        const auto& a = runs[0];
        const auto& b = runs[1];
        const auto& faster = a.totalTime() <= b.totalTime() ? a : b;
        const auto& slower = a.totalTime() <= b.totalTime() ? b : a;
        std::cout << std::string(60, '=') << "\n";
        std::cout << "Time difference (total): " << std::abs(a.totalTime() - b.totalTime()) << " s\n";
        if (slower.totalTime() > 0) {
            std::cout << "Winner: " << transportation::MethodName(faster.method) << " + MODI is "
                << std::setprecision(4)
                << (slower.totalTime() - faster.totalTime()) / slower.totalTime() * 100
                << "% faster\n" << std::setprecision(10);
        }
        bool same = std::abs(a.result.totalCost - b.result.totalCost) <= params.balanceTolerance;
        std::cout << "Both methods reach the same optimal cost: " << (same ? "yes" : "no") << "\n";
    }

    if (!outFile.empty()) {
        std::ofstream out{outFile};
        if (!out) {
            std::cout << "Could not write " << outFile << "\n";
            exit(-1);
        }
        transportation::WriteResult(out, runs.back().result);
    }

    return 0;
}
