#ifndef _TRANSPORT_IO_HPP_
#define _TRANSPORT_IO_HPP_

#include "transportation.hpp"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace transportation {

class ProblemFormatError : public std::runtime_error {
    public:
        ProblemFormatError(const std::string& what) : runtime_error(what) { }
};

struct TransportProblem {
    CostMatrix costs;
    std::vector<double> supply;
    std::vector<double> demand;
};

/*
 * Problem files are JSON objects
 *   { "costs": [[...], ...], "supply": [...], "demand": [...] }
 * Any other fields are ignored on read. Shapes are checked here; values
 * are left to ValidateProblem.
 */
TransportProblem ReadProblem(std::istream& in);
TransportProblem LoadProblem(const std::string& filename);

void WriteProblem(std::ostream& out, const TransportProblem& problem);
void SaveProblem(const std::string& filename, const TransportProblem& problem);

void WriteResult(std::ostream& out, const TransportResult& result);

} // namespace transportation

#endif
