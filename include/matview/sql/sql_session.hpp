#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace matview::sql {

enum class TransactionStatus : std::uint8_t {
    Idle = 0,
    Active,
    InTransaction,
    InError,
    Unknown
};

namespace sqlstate {

inline constexpr std::string_view kObjectInUse = "55006";
inline constexpr std::string_view kLockNotAvailable = "55P03";
inline constexpr std::string_view kDependentObjectsStillExist = "2BP01";
inline constexpr std::string_view kConnectionFailure = "08006";

}  // namespace sqlstate

// Driver-independent database failure. Sessions translate their driver's exceptions into this
// type so nothing above the sql layer sees driver classes.
class SqlError final : public std::runtime_error {
public:
    SqlError(const std::string& message, std::string sqlstate, std::string statement = {});

    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }
    [[nodiscard]] const std::string& statement() const noexcept { return statement_; }
    [[nodiscard]] const std::vector<std::string>& backtrace() const noexcept { return backtrace_; }

    [[nodiscard]] bool is_lock_contention() const noexcept;
    [[nodiscard]] bool is_dependency_conflict() const noexcept;

private:
    std::string sqlstate_{};
    std::string statement_{};
    std::vector<std::string> backtrace_{};
};

using Value = std::optional<std::string>;
using Row = std::vector<Value>;
using Params = std::vector<Value>;

class SqlSession {
public:
    virtual ~SqlSession() = default;

    // Runs a statement without parameters (DDL). Autocommits unless inside transaction().
    virtual void execute(std::string_view statement) = 0;

    // Runs a parameterized statement ($1, $2, ...) and returns every row.
    virtual std::vector<Row> query(std::string_view statement, const Params& params = {}) = 0;

    // First column of the first row, nullopt for no rows or NULL.
    virtual Value select_value(std::string_view statement, const Params& params = {});

    virtual std::string schema_search_path() = 0;

    // May throw when the status cannot be determined.
    virtual TransactionStatus transaction_status() = 0;

    // Runs body atomically; nested calls become savepoints. Rolls back and rethrows on failure.
    virtual void transaction(const std::function<void()>& body) = 0;
};

}  // namespace matview::sql
