/**
 * sqorm/row_batch.hpp - Canonical column list + value matrix for inserts
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * Accepted shapes:
 *
 *   RowBatch(Row{{"first", "Bob"}, {"last", "Foo"}});          // one row
 *   RowBatch(std::vector<Row>{...});                           // many rows
 *   RowBatch({{"Bob", "Foo"}, {"Herb", "Bar"}}, {"first", "last"});
 *
 * For mappings the column list is the union of every row's keys. When the
 * table's declared column order is supplied, known columns follow it and
 * any others come after in first-seen order; otherwise first-seen order is
 * used throughout. A row lacking a column contributes null there.
 */

#pragma once

#include "row.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace sqorm {

class RowBatch {
public:
    using Tuple = std::vector<Value>;

    RowBatch() = default;

    explicit RowBatch(const Row& row, const std::vector<std::string>& declared = {})
        : RowBatch(std::vector<Row>{row}, declared) {}

    explicit RowBatch(const std::vector<Row>& rows,
                      const std::vector<std::string>& declared = {}) {
        columns_ = merge_columns(rows, declared);
        values_.reserve(rows.size());
        for (const auto& row : rows) {
            Tuple tuple;
            tuple.reserve(columns_.size());
            for (const auto& c : columns_) tuple.push_back(row.get(c));
            values_.push_back(std::move(tuple));
        }
    }

    RowBatch(std::vector<Tuple> tuples, std::vector<std::string> columns)
        : columns_(std::move(columns)), values_(std::move(tuples)) {
        if (columns_.empty() && !values_.empty()) {
            throw ValueError("Positional rows need an explicit column list");
        }
        for (size_t i = 0; i < values_.size(); ++i) {
            if (values_[i].size() != columns_.size()) {
                throw ValueError("Row " + std::to_string(i) + " has " +
                                 std::to_string(values_[i].size()) + " values for " +
                                 std::to_string(columns_.size()) + " columns");
            }
        }
    }

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<Tuple>& values() const { return values_; }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    /**
     * Row i as a mapping (columns paired with that row's values)
     */
    Row row(size_t i) const {
        Row out;
        const Tuple& tuple = values_.at(i);
        for (size_t c = 0; c < columns_.size(); ++c) out.set(columns_[c], tuple[c]);
        return out;
    }

private:
    std::vector<std::string> columns_;
    std::vector<Tuple> values_;

    static bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }

    static std::vector<std::string> merge_columns(const std::vector<Row>& rows,
                                                  const std::vector<std::string>& declared) {
        std::vector<std::string> seen;
        for (const auto& row : rows) {
            for (const auto& entry : row) {
                if (!contains(seen, entry.first)) seen.push_back(entry.first);
            }
        }
        if (declared.empty()) return seen;

        std::vector<std::string> ordered;
        ordered.reserve(seen.size());
        for (const auto& name : declared) {
            if (contains(seen, name)) ordered.push_back(name);
        }
        for (const auto& name : seen) {
            if (!contains(ordered, name)) ordered.push_back(name);
        }
        return ordered;
    }
};

} // namespace sqorm
