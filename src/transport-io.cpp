#include "transport-io.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace transportation {

using json = nlohmann::json;

static const json& field(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end())
        throw ProblemFormatError(std::string("Missing field \"") + name + "\"");
    if (!it->is_array())
        throw ProblemFormatError(std::string("Field \"") + name + "\" must be an array");
    return *it;
}

static std::vector<double> readVector(const json& j, const char* name) {
    std::vector<double> result;
    for (const auto& x : j) {
        if (!x.is_number())
            throw ProblemFormatError(std::string("Non-numeric entry in \"") + name + "\"");
        result.push_back(x.get<double>());
    }
    return result;
}

TransportProblem ReadProblem(std::istream& in) {
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ProblemFormatError(std::string("Malformed problem file: ") + e.what());
    }
    if (!j.is_object())
        throw ProblemFormatError("Problem file must hold a JSON object");

    TransportProblem problem;
    const json& costs = field(j, "costs");
    problem.supply = readVector(field(j, "supply"), "supply");
    problem.demand = readVector(field(j, "demand"), "demand");

    const size_t n = costs.size();
    const size_t m = n > 0 && costs[0].is_array() ? costs[0].size() : 0;
    problem.costs.resize(boost::extents[n][m]);
    for (size_t i = 0; i < n; ++i) {
        if (!costs[i].is_array() || costs[i].size() != m)
            throw ProblemFormatError("Rows of \"costs\" must be arrays of equal length");
        auto row = readVector(costs[i], "costs");
        for (size_t k = 0; k < m; ++k)
            problem.costs[i][k] = row[k];
    }
    return problem;
}

TransportProblem LoadProblem(const std::string& filename) {
    std::ifstream in{filename};
    if (!in)
        throw ProblemFormatError("Could not open problem file: " + filename);
    return ReadProblem(in);
}

void WriteProblem(std::ostream& out, const TransportProblem& problem) {
    json costs = json::array();
    for (size_t i = 0; i < problem.costs.shape()[0]; ++i) {
        json row = json::array();
        for (size_t k = 0; k < problem.costs.shape()[1]; ++k)
            row.push_back(problem.costs[i][k]);
        costs.push_back(row);
    }
    json j;
    j["costs"] = costs;
    j["supply"] = problem.supply;
    j["demand"] = problem.demand;
    out << j.dump(2) << "\n";
}

void SaveProblem(const std::string& filename, const TransportProblem& problem) {
    std::ofstream out{filename};
    if (!out)
        throw ProblemFormatError("Could not write problem file: " + filename);
    WriteProblem(out, problem);
}

void WriteResult(std::ostream& out, const TransportResult& result) {
    json allocations = json::array();
    for (const auto& a : result.allocations)
        allocations.push_back({a.row, a.col, a.flow});

    json j;
    j["status"] = result.optimal() ? "optimal" : "not_converged";
    j["iterations"] = result.iterations;
    j["repair_insertions"] = result.repairInsertions;
    j["initial_cost"] = result.initialCost;
    j["total_cost"] = result.totalCost;
    j["allocations"] = allocations;
    out << j.dump(2) << "\n";
}

} // namespace transportation
