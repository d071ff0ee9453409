#pragma once

#include "matview/sql/sql_session.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace matview::sql {

// SqlSession over a single libpqxx connection. Not thread safe; use one session per worker.
class PqSession final : public SqlSession {
public:
    struct Config final {
        std::string connection_string{};
        std::string application_name{"matview"};
    };

    explicit PqSession(Config config);
    ~PqSession() override;

    PqSession(const PqSession&) = delete;
    PqSession& operator=(const PqSession&) = delete;

    void execute(std::string_view statement) override;
    std::vector<Row> query(std::string_view statement, const Params& params = {}) override;
    std::string schema_search_path() override;
    TransactionStatus transaction_status() override;
    void transaction(const std::function<void()>& body) override;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Impl;

    Config config_{};
    std::unique_ptr<Impl> impl_;
};

// Converts the libpqxx exception currently being handled into SqlError. Call only from a
// catch block.
[[noreturn]] void rethrow_as_sql_error(std::string_view statement);

}  // namespace matview::sql
