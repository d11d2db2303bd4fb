#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "Errors.hpp"
#include "io/json_loader.hpp"
#include "metrics/Metric.hpp"
#include "outcomes/Completion.hpp"
#include "outcomes/EmploymentLikelihood.hpp"
#include "render/ChartRenderer.hpp"
#include "sample/GroupedSample.h"
#include "summary/GroupSummary.hpp"
#include "wage/PremiumColumn.hpp"

using json = nlohmann::json;
using namespace Equity;

namespace {

json to_json(const DecompositionResult& r) {
    json j;
    j["index"] = r.index;
    j["within"] = r.within;
    j["between"] = r.between;
    j["overall"] = r.overall;
    j["ratio"] = r.ratio;
    if (r.residual) j["residual"] = *r.residual;
    j["notes"] = r.notes;
    return j;
}

json to_json(const GroupSummary& s) {
    return json{{"group", s.group}, {"n", s.n}, {"mean", s.mean}, {"median", s.median},
                {"sd", s.sd}, {"min", s.min}, {"max", s.max}, {"suppressed", s.suppressed}};
}

json to_json(const std::vector<GroupSummary>& summaries) {
    json j = json::array();
    for (const auto& s : summaries) j.push_back(to_json(s));
    return j;
}

} // namespace

// Usage: equity_decompose <job.json>
// Prints a JSON report on stdout; progress and warnings go to stderr.
int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <job.json>" << std::endl;
        return 1;
    }

    try {
        // 1. Load job
        Job job = JsonLoader::load_job(argv[1]);
        const DecompositionParams& params = job.params;

        if (params.premium) {
            add_premium_column(job.table, *params.premium);
            std::clog << "[Equity::IO] Derived column '" << params.premium->output_column << "'" << std::endl;
        }

        // 2. Build sample
        GroupedSample::Options sopts;
        sopts.min_group_size = params.min_group_size;
        sopts.verbose = params.verbose;
        GroupedSample sample = GroupedSample::from_table(job.table, params.group_columns, params.value_column,
                                                         params.sample_size, params.seed, sopts);

        if (params.chart) {
            TextBarRenderer renderer;
            std::clog << renderer.render(sample.groups(), sample.grouped_values());
        }

        // 3. Metric options
        MetricBase::Options mopts;
        mopts.residual_tolerance = params.get("residual_tolerance", mopts.residual_tolerance);
        mopts.verbose = params.verbose;

        json report;
        report["value_column"] = params.value_column;
        report["group_columns"] = params.group_columns;
        report["observations"] = sample.n();
        report["nan_count"] = sample.nan_count();
        report["group_count"] = sample.group_count();
        report["diagnostics"] = sample.diagnostics();

        report["summaries"] = to_json(summarize_groups(sample));

        // 4. Employment and completion outcomes, over the full table
        if (params.employment) {
            EmploymentOutcomes e = employment_likelihood(job.table, params.group_columns, *params.employment, sopts);
            report["employment"] = json{{"rate_at_end", to_json(e.rate_at_end)},
                                        {"change", to_json(e.change)},
                                        {"premium", to_json(e.premium)}};
        }
        if (params.completion) {
            CompletionOutcomes c = completion(job.table, params.group_columns, *params.completion, sopts);
            report["completion"] = json{{"completion_rate", to_json(c.completion_rate)},
                                        {"time_to_completion", to_json(c.time_to_completion)}};
        }

        // 5. Run metrics
        bool failed = false;
        json results = json::array();
        for (const auto& name : params.metrics) {
            Metric metric = make_metric(parse_metric_kind(name), sample, mopts);
            try {
                results.push_back(to_json(calculate(metric)));
            } catch (const DomainError& e) {
                std::cerr << "[ERROR][Equity::" << name << "] " << e.what() << std::endl;
                results.push_back(json{{"index", name}, {"error", e.what()}});
                failed = true;
            }
        }
        report["results"] = results;

        std::cout << report.dump(2) << std::endl;
        return failed ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
