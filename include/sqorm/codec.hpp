/**
 * sqorm/codec.hpp - Decoding driver results into records or rows
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * codec::load<M>() maps a RawResult onto M, where M is Row (generic
 * mappings), Record, or a Model subclass. Empty results decode by shape:
 *
 *   raw result          | M = Row                 | M = record type
 *   --------------------+-------------------------+------------------------
 *   no row / empty Row  | empty Row               | fresh unpopulated M
 *   empty list          | list of one empty Row   | empty FetchResult<M>
 *   scalar              | DecodeError             | DecodeError
 */

#pragma once

#include "record.hpp"
#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqorm {

// ============================================================================
// FetchResult
// ============================================================================

template<typename M>
class FetchResult {
public:
    FetchResult() = default;
    explicit FetchResult(std::vector<M> items) : items_(std::move(items)) {}

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const M& operator[](size_t i) const { return items_[i]; }
    M& operator[](size_t i) { return items_[i]; }

    const M& at(size_t i) const {
        if (i >= items_.size()) {
            throw std::out_of_range("FetchResult index " + std::to_string(i) +
                                    " out of range (size " + std::to_string(items_.size()) + ")");
        }
        return items_[i];
    }

    bool contains(const M& item) const {
        return std::find(items_.begin(), items_.end(), item) != items_.end();
    }

    // Iterator support
    auto begin() { return items_.begin(); }
    auto end() { return items_.end(); }
    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

    void push_back(M item) { items_.push_back(std::move(item)); }

    const std::vector<M>& items() const { return items_; }

    ordered_json to_json() const {
        ordered_json j = ordered_json::array();
        for (const auto& item : items_) j.push_back(item.to_json());
        return j;
    }

    std::string repr() const {
        return "<FetchResult(" + std::to_string(items_.size()) + " rows)>";
    }

private:
    std::vector<M> items_;
};

template<typename M>
using Loaded = std::variant<M, FetchResult<M>>;

namespace codec {

namespace detail {

template<typename M>
M make(const TablePtr& table) {
    if constexpr (std::is_same_v<M, Row>) {
        return Row();
    } else if constexpr (std::is_same_v<M, Record>) {
        return Record(table);
    } else {
        static_assert(std::is_base_of_v<Record, M>, "load target must be Row or a Record type");
        static_assert(std::is_default_constructible_v<M>, "record types must be default constructible");
        return M();
    }
}

template<typename M>
M decode_one(const Row& row, const TablePtr& table) {
    if constexpr (std::is_same_v<M, Row>) {
        return row;
    } else {
        M record = make<M>(table);
        Loader::load(record, row);
        return record;
    }
}

} // namespace detail

template<typename M>
Loaded<M> load(const RawResult& raw, const TablePtr& table = nullptr) {
    // Single row, or the absence of one
    if (std::holds_alternative<std::monostate>(raw)) {
        return detail::make<M>(table);
    }
    if (const Row* row = std::get_if<Row>(&raw)) {
        if (row->empty()) return detail::make<M>(table);
        return detail::decode_one<M>(*row, table);
    }

    // Sequence of rows
    if (const auto* rows = std::get_if<std::vector<Row>>(&raw)) {
        FetchResult<M> out;
        if (rows->empty()) {
            // Generic mode answers an empty list with one empty mapping
            if constexpr (std::is_same_v<M, Row>) out.push_back(Row());
            return out;
        }
        for (const auto& r : *rows) out.push_back(detail::decode_one<M>(r, table));
        return out;
    }

    throw DecodeError("Cannot decode a scalar driver result into rows");
}

/**
 * Decode a result that must be a single row
 */
template<typename M>
M load_one(const RawResult& raw, const TablePtr& table = nullptr) {
    Loaded<M> loaded = load<M>(raw, table);
    if (M* one = std::get_if<M>(&loaded)) return std::move(*one);
    throw DecodeError("Expected a single row, driver returned a list");
}

/**
 * Decode a result that must be a list of rows
 */
template<typename M>
FetchResult<M> load_many(const RawResult& raw, const TablePtr& table = nullptr) {
    Loaded<M> loaded = load<M>(raw, table);
    if (auto* many = std::get_if<FetchResult<M>>(&loaded)) return std::move(*many);
    throw DecodeError("Expected a list of rows, driver returned a single row");
}

} // namespace codec

} // namespace sqorm
