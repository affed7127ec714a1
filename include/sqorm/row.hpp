/**
 * sqorm/row.hpp - Generic rows, raw driver results and execution outcomes
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 */

#pragma once

#include "json.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqorm {

// ============================================================================
// Row (generic mapping)
// ============================================================================

/**
 * Ordered column name -> value mapping. Keys are unique; setting an
 * existing key replaces its value in place.
 */
class Row {
public:
    using Entry = std::pair<std::string, Value>;

    Row() = default;
    Row(std::initializer_list<Entry> entries) {
        for (const auto& e : entries) set(e.first, e.second);
    }

    void set(const std::string& key, Value value) {
        for (auto& e : entries_) {
            if (e.first == key) {
                e.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(key, std::move(value));
    }

    bool contains(const std::string& key) const {
        return find(key) != nullptr;
    }

    const Value* find(const std::string& key) const {
        for (const auto& e : entries_) {
            if (e.first == key) return &e.second;
        }
        return nullptr;
    }

    /**
     * Value for key, or null when absent
     */
    Value get(const std::string& key) const {
        const Value* v = find(key);
        return v ? *v : Value();
    }

    bool erase(const std::string& key) {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first == key) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.first);
        return out;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Iterator support
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    // Same keys with same values, regardless of order
    bool operator==(const Row& other) const {
        if (size() != other.size()) return false;
        for (const auto& e : entries_) {
            const Value* v = other.find(e.first);
            if (!v || *v != e.second) return false;
        }
        return true;
    }
    bool operator!=(const Row& other) const { return !(*this == other); }

    ordered_json to_json() const {
        ordered_json j = ordered_json::object();
        for (const auto& e : entries_) j[e.first] = e.second;
        return j;
    }

    std::string repr() const { return to_json().dump(); }

private:
    std::vector<Entry> entries_;
};

// ============================================================================
// Raw Driver Result
// ============================================================================

/**
 * What a driver hands back from a fetch:
 *   - std::monostate: no row (single-row fetch that matched nothing)
 *   - Row: one row
 *   - std::vector<Row>: any number of rows
 *   - Value: a bare scalar, which no decoder accepts
 */
using RawResult = std::variant<std::monostate, Row, std::vector<Row>, Value>;

// ============================================================================
// Execution Outcome
// ============================================================================

struct ExecResult {
    uint64_t affected = 0;

    // Only set for inserts into an auto-increment keyed table
    std::optional<int64_t> last_id;

    ordered_json to_json() const {
        ordered_json j;
        j["affected"] = affected;
        if (last_id) {
            j["last_id"] = *last_id;
        } else {
            j["last_id"] = nullptr;
        }
        return j;
    }

    std::string repr() const {
        return "<ExecResult(affected: " + std::to_string(affected) + ", last_id: " +
               (last_id ? std::to_string(*last_id) : std::string("None")) + ")>";
    }
};

} // namespace sqorm
