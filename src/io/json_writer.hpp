#ifndef LOANCALC_IO_JSON_WRITER_HPP
#define LOANCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../simulation.hpp"
#include "../summary.hpp"

namespace loancalc {
namespace io {

// Write a simulation run to JSON format
// The output includes the summary, the final state and optionally the full history
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const LoanSummary& summary,
                                  bool include_history = true, bool pretty_print = true);

// Write a simulation run to a JSON file
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const LoanSummary& summary,
                                  bool include_history = true, bool pretty_print = true);

} // namespace io
} // namespace loancalc

#endif // LOANCALC_IO_JSON_WRITER_HPP
