#pragma once
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>
#include "../Errors.hpp"
#include "../Params.hpp"
#include "../metrics/Metric.hpp"
#include "../sample/Table.h"

namespace Equity {

// A decomposition job: the table to analyse and what to compute on it
struct Job {
    DecompositionParams params;
    Table table;
};

class JsonLoader {
public:
    using json = nlohmann::json;

    static Job load_job(const std::string& filepath) {
        json data = read_file(filepath);
        std::clog << "[Equity::IO] Loading job: " << filepath << std::endl;
        return parse_job(data, std::filesystem::path(filepath).parent_path());
    }

    static Job parse_job(const json& data, const std::filesystem::path& base_dir = {}) {
        if (!data.is_object()) {
            throw ConfigurationError("Job must be a JSON object");
        }

        Job job;
        DecompositionParams& params = job.params;

        // 1. Table: inline, or in a separate file relative to the job
        if (data.contains("table")) {
            job.table = parse_table(data["table"]);
        } else if (data.contains("table_file")) {
            std::filesystem::path p = data["table_file"].get<std::string>();
            if (p.is_relative()) p = base_dir / p;
            job.table = parse_table(read_file(p.string()));
        } else {
            throw ConfigurationError("Job needs either 'table' or 'table_file'");
        }
        std::clog << "[Equity::IO] Table with " << job.table.rows() << " rows" << std::endl;

        // 2. Grouping
        if (!data.contains("group_columns")) {
            throw ConfigurationError("Missing required key: group_columns");
        }
        const json& gc = data["group_columns"];
        if (gc.is_string()) {
            params.group_columns = {gc.get<std::string>()};
        } else {
            params.group_columns = gc.get<std::vector<std::string>>();
        }
        if (!data.contains("value_column")) {
            throw ConfigurationError("Missing required key: value_column");
        }
        params.value_column = data["value_column"].get<std::string>();

        // 3. Sampling
        if (data.contains("sample_size") && !data["sample_size"].is_null()) {
            const json& ss = data["sample_size"];
            if (!ss.is_number_integer()) {
                throw ConfigurationError("sample_size must be an integer, got " + ss.dump());
            }
            params.sample_size = ss.get<long long>();
        }
        if (data.contains("seed") && !data["seed"].is_null()) {
            if (!data["seed"].is_number_unsigned()) {
                throw ConfigurationError("seed must be a non-negative integer");
            }
            params.seed = data["seed"].get<std::uint64_t>();
        }

        // 4. Options
        params.min_group_size = data.value("min_group_size", params.min_group_size);
        params.verbose = data.value("verbose", params.verbose);
        params.chart = data.value("chart", params.chart);
        if (data.contains("metrics")) {
            const json& names = data["metrics"];
            if (!names.is_array()) {
                throw ConfigurationError("'metrics' must be an array of metric names");
            }
            params.metrics.clear();
            for (const auto& name : names) {
                if (!name.is_string()) {
                    throw ConfigurationError("'metrics' must be an array of metric names");
                }
                parse_metric_kind(name.get<std::string>());
                params.metrics.push_back(name.get<std::string>());
            }
        }
        if (data.contains("parameters")) {
            for (auto& [key, val] : data["parameters"].items()) {
                if (val.is_number()) {
                    params.scalars[key] = val.get<double>();
                }
            }
        }

        // 5. Earnings premium derivation (optional)
        if (data.contains("premium")) {
            const json& pd = data["premium"];
            PremiumSpec spec;
            spec.coefficients = parse_mincer(pd.at("coefficients"));
            spec.education_column = pd.at("education_column").get<std::string>();
            spec.age_column = pd.at("age_column").get<std::string>();
            spec.starting_wage_column = pd.at("starting_wage_column").get<std::string>();
            spec.ending_wage_column = pd.at("ending_wage_column").get<std::string>();
            spec.years_in_program_column = pd.at("years_in_program_column").get<std::string>();
            spec.output_column = pd.value("output_column", spec.output_column);
            params.premium = spec;
        }

        // 6. Employment and completion outcomes (optional)
        if (data.contains("employment")) {
            const json& ed = data["employment"];
            EmploymentSpec spec;
            spec.employed_at_start_column = ed.at("employed_at_start_column").get<std::string>();
            spec.employed_at_end_column = ed.at("employed_at_end_column").get<std::string>();
            if (ed.contains("macro_correction_column")) {
                spec.macro_correction_column = ed["macro_correction_column"].get<std::string>();
            }
            params.employment = spec;
        }
        if (data.contains("completion")) {
            const json& cd = data["completion"];
            CompletionSpec spec;
            spec.completed_column = cd.at("completed_column").get<std::string>();
            spec.entry_year_column = cd.at("entry_year_column").get<std::string>();
            spec.exit_year_column = cd.at("exit_year_column").get<std::string>();
            params.completion = spec;
        }

        return job;
    }

    // Column-oriented table: { "name": [v0, v1, ...], ... }.
    // Columns of numbers and nulls become value columns (null = missing),
    // anything containing strings or booleans becomes a key column.
    static Table parse_table(const json& columns) {
        if (!columns.is_object()) {
            throw ConfigurationError("Table must be a JSON object of columns");
        }

        Table table;
        for (auto& [name, col] : columns.items()) {
            if (!col.is_array()) {
                throw ConfigurationError("Column '" + name + "' must be an array");
            }

            bool numeric = true;
            for (const auto& v : col) {
                if (!v.is_number() && !v.is_null()) { numeric = false; break; }
            }

            if (numeric) {
                std::vector<double> values;
                values.reserve(col.size());
                for (const auto& v : col) {
                    values.push_back(v.is_null() ? std::numeric_limits<double>::quiet_NaN() : v.get<double>());
                }
                table.add_value_column(name, std::move(values));
            } else {
                std::vector<std::string> labels;
                labels.reserve(col.size());
                for (const auto& v : col) {
                    if (v.is_string()) labels.push_back(v.get<std::string>());
                    else if (v.is_number()) labels.push_back(format_key(v.get<double>()));
                    else labels.push_back(v.dump());
                }
                table.add_key_column(name, std::move(labels));
            }
        }
        return table;
    }

    static MincerCoefficients parse_mincer(const json& data) {
        MincerCoefficients c;
        c.schooling_x_experience = data.at("schooling_x_experience").get<double>();
        c.experience = data.at("experience").get<double>();
        c.experience_squared = data.at("experience_squared").get<double>();
        return c;
    }

private:
    static json read_file(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open file: " + filepath);
        }
        try {
            return json::parse(f);
        } catch (const json::parse_error& e) {
            throw ConfigurationError("Invalid JSON in " + filepath + ": " + e.what());
        }
    }
};

} // namespace Equity
