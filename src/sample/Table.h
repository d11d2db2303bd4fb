#ifndef EQUITY_SAMPLE_TABLE_H
#define EQUITY_SAMPLE_TABLE_H

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Equity {

// Flat, column-oriented table: the only contract required of an upstream loader.
// Key columns hold labels, value columns hold doubles (NaN marks a missing value).
// A value column may also serve as a grouping key; its numbers are then formatted as labels.
class Table {
public:
    using GroupedRows = std::vector<std::pair<std::string, std::vector<double>>>;

    void add_key_column(const std::string& name, std::vector<std::string> values);
    void add_value_column(const std::string& name, std::vector<double> values);

    std::size_t rows() const { return rows_; }
    bool has_column(const std::string& name) const;
    bool is_value_column(const std::string& name) const;

    const std::vector<double>& values(const std::string& name) const;
    std::string key_at(const std::string& name, std::size_t row) const;

    // Group rows by one or more key columns and extract the value column per group.
    // Groups come out in order of first occurrence; compound labels are joined with ", ".
    // If `rows` is given only those row indices are grouped, in the order listed.
    GroupedRows group_by(const std::vector<std::string>& keys,
                         const std::string& value_column,
                         const std::vector<std::size_t>* rows = nullptr) const;

private:
    void check_new_column(const std::string& name, std::size_t length) const;
    void require_column(const std::string& name) const;

    std::size_t rows_ = 0;
    bool empty_ = true;
    std::map<std::string, std::vector<std::string>> key_columns_;
    std::map<std::string, std::vector<double>> value_columns_;
};

// Format a numeric key the way it reads in the source data (2009 not 2009.000000)
std::string format_key(double v);

} // namespace Equity

#endif // EQUITY_SAMPLE_TABLE_H
