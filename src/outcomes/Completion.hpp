#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../sample/GroupedSample.h"
#include "../sample/Table.h"
#include "../summary/GroupSummary.hpp"
#include "OutcomeSummary.hpp"

namespace Equity {

struct CompletionSpec {
    std::string completed_column;     // 1 = completed the program
    std::string entry_year_column;
    std::string exit_year_column;
    std::string duration_column = "time_to_completion";
};

struct CompletionOutcomes {
    std::vector<GroupSummary> completion_rate;
    std::vector<GroupSummary> time_to_completion;   // Completers only; groups without one are absent
};

inline CompletionOutcomes completion(const Table& table,
                                     const std::vector<std::string>& group_columns,
                                     const CompletionSpec& spec,
                                     GroupedSample::Options opts = GroupedSample::Options()) {
    const std::vector<double>& completed = table.values(spec.completed_column);
    const std::vector<double>& entry = table.values(spec.entry_year_column);
    const std::vector<double>& exit = table.values(spec.exit_year_column);

    std::vector<double> duration(table.rows());
    std::vector<std::size_t> completers;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        duration[i] = exit[i] - entry[i];
        if (completed[i] == 1.0) completers.push_back(i);
    }

    CompletionOutcomes out;
    out.completion_rate = detail::summarize_column(table, group_columns, spec.completed_column, opts);
    Table derived = detail::with_column(table, spec.duration_column, std::move(duration));
    out.time_to_completion = detail::summarize_column(derived, group_columns, spec.duration_column, opts, &completers);
    return out;
}

} // namespace Equity
