#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../Errors.hpp"
#include "../sample/GroupedSample.h"
#include "../sample/Table.h"
#include "../summary/GroupSummary.hpp"
#include "OutcomeSummary.hpp"

namespace Equity {

// Employment indicator columns (1 = employed, 0 = not, NaN = unknown)
struct EmploymentSpec {
    std::string employed_at_start_column;
    std::string employed_at_end_column;
    // Precomputed macro correction per person: area employment rate at entry
    // minus the rate at exit. Without it the premium equals the raw change.
    std::optional<std::string> macro_correction_column;
    std::string change_column = "employment_change";
    std::string premium_column = "employment_premium";
};

struct EmploymentOutcomes {
    std::vector<GroupSummary> rate_at_end;   // Share employed at program end
    std::vector<GroupSummary> change;        // end - start per person
    std::vector<GroupSummary> premium;       // end - start - macro correction per person
};

// Individual employment premium, end - start - correction. Missing inputs stay missing.
inline std::vector<double> employment_premium(const std::vector<double>& employed_at_start,
                                              const std::vector<double>& employed_at_end,
                                              const std::vector<double>* correction = nullptr) {
    if (employed_at_start.size() != employed_at_end.size() ||
        (correction && correction->size() != employed_at_end.size())) {
        throw ConstructionError("employment_premium: input columns differ in length");
    }
    std::vector<double> out(employed_at_end.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = employed_at_end[i] - employed_at_start[i];
        if (correction) out[i] -= (*correction)[i];
    }
    return out;
}

inline EmploymentOutcomes employment_likelihood(const Table& table,
                                                const std::vector<std::string>& group_columns,
                                                const EmploymentSpec& spec,
                                                GroupedSample::Options opts = GroupedSample::Options()) {
    const std::vector<double>& start = table.values(spec.employed_at_start_column);
    const std::vector<double>& end = table.values(spec.employed_at_end_column);

    EmploymentOutcomes out;
    out.rate_at_end = detail::summarize_column(table, group_columns, spec.employed_at_end_column, opts);

    Table derived = detail::with_column(table, spec.change_column, employment_premium(start, end));
    out.change = detail::summarize_column(derived, group_columns, spec.change_column, opts);

    if (spec.macro_correction_column) {
        const std::vector<double>& correction = table.values(*spec.macro_correction_column);
        derived.add_value_column(spec.premium_column, employment_premium(start, end, &correction));
        out.premium = detail::summarize_column(derived, group_columns, spec.premium_column, opts);
    } else {
        out.premium = out.change;
    }
    return out;
}

} // namespace Equity
