/**
 * sqorm/driver.hpp - Boundary to the database driver
 *
 * Part of sqorm - a declarative object-relational mapping layer.
 *
 * The driver is the only place where I/O happens. Statement execution and
 * table create/drop return futures; everything else in sqorm is synchronous
 * construction. Errors raised by a driver travel through its futures to the
 * caller untouched.
 */

#pragma once

#include "statement.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sqorm {

class Table;
struct TableOptions;
struct AlterSpec;
struct TableInfo;

class Driver {
public:
    virtual ~Driver() = default;

    // INSERT / REPLACE / UPDATE / DELETE
    virtual std::future<ExecResult> execute(const Statement& stmt) = 0;

    // SELECT. A statement with fetch_one yields std::monostate or a Row;
    // otherwise a std::vector<Row>.
    virtual std::future<RawResult> fetch(const Statement& stmt) = 0;

    virtual std::future<ExecResult> create_table(const Table& table,
                                                 const TableOptions& options) = 0;
    virtual std::future<ExecResult> drop_table(const Table& table,
                                               const TableOptions& options) = 0;

    virtual ExecResult alter_table(const Table& table, const AlterSpec& spec) = 0;
    virtual TableInfo show_table(const Table& table) = 0;
};

namespace detail {

/**
 * Chain fn onto fut. When fut is already satisfied the continuation runs
 * now, so its side effects do not depend on anyone waiting. Otherwise it is
 * deferred and runs on the thread that waits on the returned future.
 */
template<typename T, typename Fn>
auto then(std::future<T> fut, Fn fn) -> std::future<std::invoke_result_t<Fn, T>> {
    using R = std::invoke_result_t<Fn, T>;
    if (fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        std::promise<R> p;
        try {
            p.set_value(fn(fut.get()));
        } catch (...) {
            p.set_exception(std::current_exception());
        }
        return p.get_future();
    }
    return std::async(std::launch::deferred,
        [fut = std::move(fut), fn = std::move(fn)]() mutable {
            return fn(fut.get());
        });
}

template<typename T>
std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

} // namespace detail

} // namespace sqorm
