#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <duckdb.hpp>

namespace adapters::duckdb::sql {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

inline ::duckdb::Value textOrNull(const std::optional<std::string>& value) {
    return value ? ::duckdb::Value(*value) : ::duckdb::Value();
}

inline ::duckdb::Value doubleOrNull(const std::optional<double>& value) {
    return value ? ::duckdb::Value::DOUBLE(*value) : ::duckdb::Value();
}

inline ::duckdb::Value bigint(std::int64_t value) {
    return ::duckdb::Value::BIGINT(value);
}

inline std::string errorOf(::duckdb::QueryResult* result, const char* fallback) {
    return result ? result->GetError() : std::string{fallback};
}

// Rows touched by an INSERT/UPDATE/DELETE; 1 for statements that report no count.
inline std::int64_t changedRows(::duckdb::QueryResult& result) {
    if (result.type == ::duckdb::QueryResultType::MATERIALIZED_RESULT) {
        auto& materialized = result.Cast<::duckdb::MaterializedQueryResult>();
        if (materialized.properties.return_type == ::duckdb::StatementReturnType::CHANGED_ROWS) {
            if (materialized.RowCount() == 0) {
                return 0;
            }
            return materialized.GetValue<std::int64_t>(0, 0);
        }
        return static_cast<std::int64_t>(materialized.RowCount());
    }
    return 1;
}

inline bool isConstraintViolation(::duckdb::QueryResult& result) {
    return result.HasError() && result.GetErrorType() == ::duckdb::ExceptionType::CONSTRAINT;
}

inline std::optional<std::int64_t> optionalBigint(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<std::int64_t>();
}

inline std::optional<std::string> optionalText(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.ToString();
}

}  // namespace adapters::duckdb::sql
