#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace loancalc {
namespace io {

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const LoanSummary& summary,
                                  bool include_history, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";
    const std::string i2 = indent + indent;

    std::ios_base::fmtflags saved_flags = os.flags();
    std::streamsize saved_precision = os.precision();

    os << std::fixed << std::setprecision(2);

    os << "{" << newline;

    // Summary section
    os << indent << "\"summary\":" << space << "{" << newline;
    os << i2 << "\"total_repaid\":" << space << round_to_cents(summary.total_repaid) << "," << newline;
    os << i2 << "\"net_salary_lost\":" << space << round_to_cents(summary.net_salary_lost) << "," << newline;
    os << i2 << "\"remaining_balance\":" << space << round_to_cents(summary.remaining_balance) << "," << newline;
    os << i2 << "\"repaid_in_full\":" << space << (summary.repaid_in_full ? "true" : "false") << "," << newline;
    os << i2 << "\"months_repaying\":" << space << summary.months_repaying << "," << newline;
    os << i2 << "\"years_repaying\":" << space << summary.years_repaying << "," << newline;
    os << i2 << "\"total_net_loss_plus_repayments\":" << space
       << round_to_cents(summary.total_net_loss_plus_repayments) << newline;
    os << indent << "}," << newline;

    // Final state
    const SimulationState& state = result.state;
    os << std::setprecision(6);
    os << indent << "\"final_state\":" << space << "{" << newline;
    os << i2 << "\"balance\":" << space << state.balance << "," << newline;
    os << i2 << "\"total_repaid\":" << space << state.total_repaid << "," << newline;
    os << i2 << "\"net_salary_lost\":" << space << state.net_salary_lost << "," << newline;
    os << i2 << "\"months_elapsed\":" << space << state.months_elapsed << "," << newline;
    os << i2 << "\"repaid_in_full\":" << space << (state.repaid_in_full ? "true" : "false") << "," << newline;
    os << i2 << "\"written_off\":" << space << (state.written_off ? "true" : "false") << "," << newline;
    os << i2 << "\"final_date\":" << space << "\"" << state.final_date.to_string() << "\"," << newline;
    os << i2 << "\"final_salary\":" << space << state.final_salary << newline;
    os << indent << "}," << newline;

    os << indent << "\"history_length\":" << space << result.history.size();

    // History (one object per month)
    if (include_history) {
        os << "," << newline;
        os << std::setprecision(2);
        os << indent << "\"history\":" << space << "[";
        for (size_t i = 0; i < result.history.size(); ++i) {
            const MonthlySnapshot& s = result.history[i];
            if (i > 0) {
                os << ",";
            }
            os << newline << i2 << "{"
               << "\"date\":" << space << "\"" << s.date.to_string() << "\"," << space
               << "\"salary\":" << space << s.salary << "," << space
               << "\"balance\":" << space << s.balance << "," << space
               << "\"total_repaid\":" << space << s.total_repaid << "," << space
               << "\"net_salary_lost\":" << space << s.net_salary_lost << "," << space
               << "\"salary_after_tax\":" << space << s.salary_after_tax
               << "}";
        }
        if (!result.history.empty()) {
            os << newline << indent;
        }
        os << "]" << newline;
    } else {
        os << newline;
    }

    os << "}" << newline;

    os.flags(saved_flags);
    os.precision(saved_precision);
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const LoanSummary& summary,
                                  bool include_history, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, summary, include_history, pretty_print);
}

} // namespace io
} // namespace loancalc
