#include <iostream>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <boost/program_options.hpp>
#include "transportation.hpp"
#include "transport-io.hpp"
#include "sensitivity.hpp"

void printReport(const transportation::SensitivityReport& r) {
    std::cout << transportation::MethodName(r.method) << " + MODI\n";
    std::cout << "\tInitial cost:  " << r.initialCost << "\n";
    std::cout << "\tOptimal cost:  " << r.optimalCost << "\n";
    std::cout << "\tWorst cell:    (" << r.worst.row << ", " << r.worst.col
        << ") contributing " << r.worst.contribution << "\n";
    for (const auto& l : r.levels) {
        std::cout << "\tLevel " << l.level << ":\tcost " << l.originalCost
            << " -> " << l.perturbedCost << "\toptimal " << l.optimalCost
            << "\tchange " << l.change << "\n";
    }
    std::cout << "\tAverage change: " << r.averageChange << "\n";
}

void writePerturbed(const std::string& prefix, const std::string& tag,
        const transportation::TransportProblem& problem,
        const transportation::SensitivityReport& r) {
    for (const auto& l : r.levels) {
        transportation::TransportProblem p = problem;
        p.costs = transportation::PerturbCost(problem.costs, r.worst.row, r.worst.col, l.level);
        std::ostringstream fname;
        fname << prefix << "_" << tag << "_" << static_cast<int>(std::round(l.level*100)) << ".json";
        transportation::SaveProblem(fname.str(), p);
        std::cout << "Wrote " << fname.str() << ": " << l.originalCost
            << " -> " << l.perturbedCost << "\n";
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
    std::string prefix;
    std::vector<double> levels;
    transportation::TransportParams params {};

    po::options_description options_desc("Transport sensitivity arguments");
    options_desc.add_options()
        ("help", "Display this help message")
        ("problem", po::value<std::string>(&problemFile)->required(), "JSON problem file with costs, supply and demand")
        ("levels,l", po::value<std::vector<double>>(&levels)->multitoken()->default_value(std::vector<double>{0.05, 0.10, 0.15}, "0.05 0.10 0.15"), "Relative cost shifts to apply")
        ("write-perturbed,w", po::value<std::string>(&prefix), "Write each perturbed problem as <prefix>_<method>_<percent>.json")
        ("max-iter", po::value<int>(&params.maxIterations)->default_value(0), "MODI iteration cap, 0 for 10*(n+m)")
        ("balance-tol", po::value<double>(&params.balanceTolerance)->default_value(1.0e-2), "Allowed difference between total supply and demand")
    ;

    po::positional_options_description popts_desc;
    popts_desc.add("problem", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                options(options_desc).positional(popts_desc).run(), vm);
    } catch (std::exception& e) {
        std::cout << "Parsing error: " << e.what() << "\n";
        std::cout << "Usage: transport-sensitivity [options] problem.json\n";
        std::cout << options_desc;
        exit(-1);
    }

    if (vm.count("help") != 0) {
        std::cout << "Usage: transport-sensitivity [options] problem.json\n";
        std::cout << options_desc;
        exit(0);
    }
    try {
        po::notify(vm);
    } catch (std::exception& e) {
        std::cout << "Parsing error: " << e.what() << "\n";
        std::cout << "Usage: transport-sensitivity [options] problem.json\n";
        std::cout << options_desc;
        exit(-1);
    }

    auto problem = loadProblem(problemFile);

    std::cout << std::setprecision(10);
    transportation::SensitivityReport vogel, russell;
    try {
        vogel = transportation::AnalyzeSensitivity(transportation::InitialMethod::Vogel,
                problem.costs, problem.supply, problem.demand, levels, params);
        russell = transportation::AnalyzeSensitivity(transportation::InitialMethod::Russell,
                problem.costs, problem.supply, problem.demand, levels, params);
    } catch (transportation::PreconditionError& e) {
        std::cout << "Invalid problem: " << e.what() << "\n";
        exit(-1);
    } catch (transportation::InternalError& e) {
        std::cout << "Internal error in state " << e.state() << " at iteration "
            << e.iteration() << ": " << e.what() << "\n";
        exit(-2);
    }

    printReport(vogel);
    printReport(russell);

    if (!prefix.empty()) {
        try {
            writePerturbed(prefix, "vam", problem, vogel);
            writePerturbed(prefix, "ram", problem, russell);
        } catch (std::exception& e) {
            std::cout << e.what() << "\n";
            exit(-1);
        }
    }

    if (vogel.averageChange == 0 && russell.averageChange == 0) {
        std::cout << "Conclusion: both methods are robust (no sensitivity detected)\n";
    } else if (vogel.averageChange > russell.averageChange) {
        std::cout << "Conclusion: vogel is more sensitive\n";
        if (russell.averageChange > 0)
            std::cout << "Sensitivity ratio: " << vogel.averageChange / russell.averageChange << "x\n";
    } else {
        std::cout << "Conclusion: russell is more sensitive\n";
        if (vogel.averageChange > 0)
            std::cout << "Sensitivity ratio: " << russell.averageChange / vogel.averageChange << "x\n";
    }
    return 0;
}
