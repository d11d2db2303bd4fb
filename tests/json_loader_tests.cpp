#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "Errors.hpp"
#include "io/json_loader.hpp"
#include "sample/GroupedSample.h"

using namespace Equity;
using json = nlohmann::json;

namespace {

json basic_job() {
    return json::parse(R"({
        "table": {
            "race": ["a", "b", "a", "c"],
            "year": [2009, 2009, 2010, 2010],
            "wage": [100.0, null, 300.0, 50]
        },
        "group_columns": "race",
        "value_column": "wage",
        "sample_size": 3,
        "seed": 7,
        "min_group_size": 2,
        "metrics": ["gini", "variance"],
        "parameters": { "residual_tolerance": 1e-6 }
    })");
}

} // namespace

TEST(JsonLoaderTest, ParsesJob) {
    Job job = JsonLoader::parse_job(basic_job());
    const DecompositionParams& p = job.params;

    EXPECT_EQ(job.table.rows(), 4u);
    EXPECT_TRUE(job.table.is_value_column("wage"));
    EXPECT_TRUE(job.table.is_value_column("year"));
    EXPECT_FALSE(job.table.is_value_column("race"));
    EXPECT_TRUE(std::isnan(job.table.values("wage")[1]));

    EXPECT_EQ(p.group_columns, (std::vector<std::string>{"race"}));
    EXPECT_EQ(p.value_column, "wage");
    ASSERT_TRUE(p.sample_size.has_value());
    EXPECT_EQ(*p.sample_size, 3);
    ASSERT_TRUE(p.seed.has_value());
    EXPECT_EQ(*p.seed, 7u);
    EXPECT_EQ(p.min_group_size, 2);
    EXPECT_EQ(p.metrics, (std::vector<std::string>{"gini", "variance"}));
    EXPECT_DOUBLE_EQ(p.get("residual_tolerance", 1e-9), 1e-6);
    EXPECT_DOUBLE_EQ(p.get("missing", 4.0), 4.0);
    EXPECT_THROW(p.get_required("missing"), ConfigurationError);
    EXPECT_FALSE(p.premium.has_value());
}

TEST(JsonLoaderTest, DefaultsWhenOptionalKeysAbsent) {
    json data = basic_job();
    data.erase("sample_size");
    data.erase("seed");
    data.erase("metrics");
    data.erase("min_group_size");

    Job job = JsonLoader::parse_job(data);
    EXPECT_FALSE(job.params.sample_size.has_value());
    EXPECT_FALSE(job.params.seed.has_value());
    EXPECT_EQ(job.params.min_group_size, 30);
    EXPECT_EQ(job.params.metrics.size(), 4u);
}

TEST(JsonLoaderTest, RejectsInvalidOptions) {
    json fractional = basic_job();
    fractional["sample_size"] = 2.5;
    EXPECT_THROW(JsonLoader::parse_job(fractional), ConfigurationError);

    json negative_seed = basic_job();
    negative_seed["seed"] = -1;
    EXPECT_THROW(JsonLoader::parse_job(negative_seed), ConfigurationError);

    json no_table = basic_job();
    no_table.erase("table");
    EXPECT_THROW(JsonLoader::parse_job(no_table), ConfigurationError);

    json no_value = basic_job();
    no_value.erase("value_column");
    EXPECT_THROW(JsonLoader::parse_job(no_value), ConfigurationError);

    json ragged = basic_job();
    ragged["table"]["wage"] = json::array({1.0, 2.0});
    EXPECT_THROW(JsonLoader::parse_job(ragged), ConstructionError);
}

TEST(JsonLoaderTest, RejectsUnknownMetricAtLoad) {
    json unknown = basic_job();
    unknown["metrics"] = json::array({"gini", "atkinson"});
    EXPECT_THROW(JsonLoader::parse_job(unknown), ConfigurationError);

    json not_a_list = basic_job();
    not_a_list["metrics"] = "gini";
    EXPECT_THROW(JsonLoader::parse_job(not_a_list), ConfigurationError);

    json numbers = basic_job();
    numbers["metrics"] = json::array({1, 2});
    EXPECT_THROW(JsonLoader::parse_job(numbers), ConfigurationError);
}

TEST(JsonLoaderTest, MixedColumnsBecomeKeys) {
    Table t = JsonLoader::parse_table(json::parse(R"({ "code": ["x1", 2, true], "v": [1, 2, 3] })"));
    EXPECT_FALSE(t.is_value_column("code"));
    EXPECT_EQ(t.key_at("code", 0), "x1");
    EXPECT_EQ(t.key_at("code", 1), "2");
    EXPECT_EQ(t.key_at("code", 2), "true");
}

TEST(JsonLoaderTest, ParsesPremiumSection) {
    json data = basic_job();
    data["premium"] = json::parse(R"({
        "coefficients": { "schooling_x_experience": 0.001, "experience": 0.05, "experience_squared": -0.001 },
        "education_column": "educ",
        "age_column": "age",
        "starting_wage_column": "w0",
        "ending_wage_column": "w1",
        "years_in_program_column": "years"
    })");

    Job job = JsonLoader::parse_job(data);
    ASSERT_TRUE(job.params.premium.has_value());
    EXPECT_DOUBLE_EQ(job.params.premium->coefficients.experience, 0.05);
    EXPECT_EQ(job.params.premium->output_column, "earnings_premium");
    EXPECT_EQ(job.params.premium->years_in_program_column, "years");
}

TEST(JsonLoaderTest, ParsesOutcomeSections) {
    json data = basic_job();
    data["employment"] = json::parse(R"({
        "employed_at_start_column": "emp0",
        "employed_at_end_column": "emp1",
        "macro_correction_column": "bls"
    })");
    data["completion"] = json::parse(R"({
        "completed_column": "done",
        "entry_year_column": "entry",
        "exit_year_column": "exit"
    })");

    Job job = JsonLoader::parse_job(data);
    ASSERT_TRUE(job.params.employment.has_value());
    EXPECT_EQ(job.params.employment->employed_at_end_column, "emp1");
    ASSERT_TRUE(job.params.employment->macro_correction_column.has_value());
    EXPECT_EQ(*job.params.employment->macro_correction_column, "bls");
    ASSERT_TRUE(job.params.completion.has_value());
    EXPECT_EQ(job.params.completion->exit_year_column, "exit");

    EXPECT_FALSE(JsonLoader::parse_job(basic_job()).params.employment.has_value());
}

TEST(JsonLoaderTest, LoadsTableFileRelativeToJob) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "equity_json_loader_test";
    fs::create_directories(dir);

    json job_data = basic_job();
    {
        std::ofstream(dir / "table.json") << job_data["table"].dump();
    }
    job_data.erase("table");
    job_data["table_file"] = "table.json";
    {
        std::ofstream(dir / "job.json") << job_data.dump();
    }

    Job job = JsonLoader::load_job((dir / "job.json").string());
    EXPECT_EQ(job.table.rows(), 4u);

    GroupedSample::Options o;
    o.verbose = false;
    GroupedSample s = GroupedSample::from_table(job.table, job.params.group_columns, job.params.value_column,
                                                job.params.sample_size, job.params.seed, o);
    EXPECT_EQ(s.n(), 3);

    fs::remove_all(dir);
}

TEST(JsonLoaderTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(JsonLoader::load_job("/nonexistent/equity/job.json"), std::runtime_error);
}
