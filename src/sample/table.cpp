#include "Table.h"
#include "../Errors.hpp"
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace Equity {

std::string format_key(double v) {
    if (std::isnan(v)) return "NaN";
    std::ostringstream os;
    if (std::floor(v) == v && std::abs(v) < 1e15) {
        os << static_cast<long long>(v);
    } else {
        os << v;
    }
    return os.str();
}

void Table::check_new_column(const std::string& name, std::size_t length) const {
    if (has_column(name)) {
        throw ConstructionError("Duplicate column in table: " + name);
    }
    if (!empty_ && length != rows_) {
        throw ConstructionError("Column '" + name + "' has " + std::to_string(length) +
                                " rows, expected " + std::to_string(rows_));
    }
}

void Table::add_key_column(const std::string& name, std::vector<std::string> values) {
    check_new_column(name, values.size());
    rows_ = values.size();
    empty_ = false;
    key_columns_.emplace(name, std::move(values));
}

void Table::add_value_column(const std::string& name, std::vector<double> values) {
    check_new_column(name, values.size());
    rows_ = values.size();
    empty_ = false;
    value_columns_.emplace(name, std::move(values));
}

bool Table::has_column(const std::string& name) const {
    return key_columns_.count(name) > 0 || value_columns_.count(name) > 0;
}

bool Table::is_value_column(const std::string& name) const {
    return value_columns_.count(name) > 0;
}

void Table::require_column(const std::string& name) const {
    if (!has_column(name)) {
        throw ConfigurationError("Unknown column: " + name);
    }
}

const std::vector<double>& Table::values(const std::string& name) const {
    auto it = value_columns_.find(name);
    if (it == value_columns_.end()) {
        if (key_columns_.count(name)) {
            throw ConfigurationError("Column '" + name + "' holds labels, not numeric values");
        }
        throw ConfigurationError("Unknown column: " + name);
    }
    return it->second;
}

std::string Table::key_at(const std::string& name, std::size_t row) const {
    auto it = key_columns_.find(name);
    if (it != key_columns_.end()) return it->second.at(row);

    auto vit = value_columns_.find(name);
    if (vit != value_columns_.end()) return format_key(vit->second.at(row));

    throw ConfigurationError("Unknown column: " + name);
}

Table::GroupedRows Table::group_by(const std::vector<std::string>& keys,
                                   const std::string& value_column,
                                   const std::vector<std::size_t>* rows) const {
    if (keys.empty()) {
        throw ConfigurationError("At least one grouping column is required");
    }
    for (const auto& k : keys) require_column(k);
    const std::vector<double>& vals = values(value_column);

    GroupedRows grouped;
    std::unordered_map<std::string, std::size_t> position;

    auto visit = [&](std::size_t row) {
        std::string label = key_at(keys[0], row);
        for (std::size_t k = 1; k < keys.size(); ++k) {
            label += ", " + key_at(keys[k], row);
        }

        auto it = position.find(label);
        if (it == position.end()) {
            position.emplace(label, grouped.size());
            grouped.emplace_back(label, std::vector<double>{vals[row]});
        } else {
            grouped[it->second].second.push_back(vals[row]);
        }
    };

    if (rows) {
        for (std::size_t r : *rows) visit(r);
    } else {
        for (std::size_t r = 0; r < rows_; ++r) visit(r);
    }
    return grouped;
}

} // namespace Equity
