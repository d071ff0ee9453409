#include "matview/sql/pq_session.hpp"

#include <pqxx/pqxx>

#include <utility>

namespace matview::sql {

namespace {

template <typename Fn>
auto translate_errors(std::string_view statement, Fn&& fn) -> decltype(fn())
{
    try {
        return fn();
    } catch (const pqxx::failure&) {
        rethrow_as_sql_error(statement);
    }
}

std::vector<Row> to_rows(const pqxx::result& result)
{
    std::vector<Row> rows;
    rows.reserve(static_cast<std::size_t>(result.size()));
    for (const auto& record : result) {
        Row row;
        row.reserve(static_cast<std::size_t>(record.size()));
        for (const auto& field : record) {
            if (field.is_null()) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string{field.c_str(), field.size()});
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

pqxx::params to_params(const Params& params)
{
    pqxx::params bound;
    for (const auto& value : params) {
        if (value) {
            bound.append(*value);
        } else {
            bound.append();
        }
    }
    return bound;
}

std::string connection_options(const PqSession::Config& config)
{
    auto options = config.connection_string;
    if (!config.application_name.empty() && options.find("application_name") == std::string::npos) {
        if (!options.empty()) {
            options.push_back(' ');
        }
        options.append("application_name=");
        options.append(config.application_name);
    }
    return options;
}

}  // namespace

void rethrow_as_sql_error(std::string_view statement)
{
    try {
        throw;
    } catch (const pqxx::sql_error& error) {
        throw SqlError{error.what(), error.sqlstate(), std::string{statement}};
    } catch (const pqxx::broken_connection& error) {
        throw SqlError{error.what(), std::string{sqlstate::kConnectionFailure}, std::string{statement}};
    } catch (const pqxx::failure& error) {
        throw SqlError{error.what(), std::string{}, std::string{statement}};
    }
}

struct PqSession::Impl final {
    explicit Impl(const std::string& options)
        : connection{options}
    {
    }

    // Statements outside transaction() autocommit through a nontransaction.
    pqxx::result run(std::string_view statement, const Params& params)
    {
        const std::string text{statement};
        if (!stack.empty()) {
            auto& transaction = *stack.back();
            return params.empty() ? transaction.exec(text) : transaction.exec_params(text, to_params(params));
        }
        pqxx::nontransaction transaction{connection};
        return params.empty() ? transaction.exec(text) : transaction.exec_params(text, to_params(params));
    }

    pqxx::connection connection;
    std::vector<std::unique_ptr<pqxx::dbtransaction>> stack{};
    bool failed = false;
};

PqSession::PqSession(Config config)
    : config_{std::move(config)}
{
    const auto options = connection_options(config_);
    impl_ = translate_errors("connect", [&] { return std::make_unique<Impl>(options); });
}

PqSession::~PqSession() = default;

void PqSession::execute(std::string_view statement)
{
    translate_errors(statement, [&] {
        try {
            (void)impl_->run(statement, {});
        } catch (const pqxx::sql_error&) {
            impl_->failed = !impl_->stack.empty();
            throw;
        }
    });
}

std::vector<Row> PqSession::query(std::string_view statement, const Params& params)
{
    return translate_errors(statement, [&] {
        try {
            return to_rows(impl_->run(statement, params));
        } catch (const pqxx::sql_error&) {
            impl_->failed = !impl_->stack.empty();
            throw;
        }
    });
}

std::string PqSession::schema_search_path()
{
    return select_value("SHOW search_path").value_or(std::string{});
}

TransactionStatus PqSession::transaction_status()
{
    if (!impl_->connection.is_open()) {
        throw SqlError{"connection is closed", std::string{sqlstate::kConnectionFailure}};
    }
    if (impl_->stack.empty()) {
        return TransactionStatus::Idle;
    }
    return impl_->failed ? TransactionStatus::InError : TransactionStatus::InTransaction;
}

void PqSession::transaction(const std::function<void()>& body)
{
    translate_errors("BEGIN", [&] {
        if (impl_->stack.empty()) {
            impl_->failed = false;
            impl_->stack.push_back(std::make_unique<pqxx::work>(impl_->connection));
        } else {
            impl_->stack.push_back(std::make_unique<pqxx::subtransaction>(*impl_->stack.back()));
        }
    });

    try {
        body();
        translate_errors("COMMIT", [&] { impl_->stack.back()->commit(); });
    } catch (...) {
        impl_->stack.back()->abort();
        impl_->stack.pop_back();
        // A rolled back savepoint leaves the outer transaction usable.
        impl_->failed = false;
        throw;
    }

    impl_->stack.pop_back();
}

}  // namespace matview::sql
