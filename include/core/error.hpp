#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sysmlsql {

// ============================================================================
// Schema errors (resolve / emit pass, always fatal)
// ============================================================================

enum class SchemaErrorKind {
    MALFORMED_DOCUMENT,
    UNRESOLVED_REFERENCE,
    CYCLIC_INHERITANCE,
    UNSUPPORTED_COMBINATOR,
    COLUMN_TYPE_CONFLICT
};

struct SchemaError {
    SchemaErrorKind kind = SchemaErrorKind::MALFORMED_DOCUMENT;
    std::string type_name;      // definition being resolved
    std::string field;          // offending property, if any
    std::string detail;         // reference text, cycle chain, shape description
    std::string type_a;         // COLUMN_TYPE_CONFLICT: first column type seen
    std::string type_b;         // COLUMN_TYPE_CONFLICT: conflicting column type

    [[nodiscard]] std::string message() const {
        switch (kind) {
            case SchemaErrorKind::MALFORMED_DOCUMENT:
                return std::format("malformed schema document: {}", detail);
            case SchemaErrorKind::UNRESOLVED_REFERENCE:
                return std::format("type \"{}\" references unknown definition \"{}\"",
                                   type_name, detail);
            case SchemaErrorKind::CYCLIC_INHERITANCE:
                return std::format("cyclic inheritance through {}", detail);
            case SchemaErrorKind::UNSUPPORTED_COMBINATOR:
                return field.empty()
                    ? std::format("type \"{}\" uses an unsupported shape: {}", type_name, detail)
                    : std::format("property \"{}\" of type \"{}\" uses an unsupported shape: {}",
                                  field, type_name, detail);
            case SchemaErrorKind::COLUMN_TYPE_CONFLICT:
                return std::format("column \"{}\" is declared both as {} and as {}{}",
                                   field, type_a, type_b,
                                   type_name.empty() ? "" : " (in " + type_name + ")");
        }
        return "schema error";
    }
};

// ============================================================================
// Fetch errors
// ============================================================================

enum class FetchErrorKind {
    TRANSIENT_EXHAUSTED,
    HTTP_STATUS,
    MALFORMED_PAGINATION,
    MALFORMED_PAGE,
    TIMEOUT,
    TLS_FAILURE,
    MODEL_NOT_FOUND,
    AMBIGUOUS_MODEL,
    CANCELLED,
    INVALID_REQUEST,
    IO_ERROR
};

[[nodiscard]] inline const char* fetch_error_kind_to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::TRANSIENT_EXHAUSTED:  return "transient_exhausted";
        case FetchErrorKind::HTTP_STATUS:          return "http_status";
        case FetchErrorKind::MALFORMED_PAGINATION: return "malformed_pagination";
        case FetchErrorKind::MALFORMED_PAGE:       return "malformed_page";
        case FetchErrorKind::TIMEOUT:              return "timeout";
        case FetchErrorKind::TLS_FAILURE:          return "tls_failure";
        case FetchErrorKind::MODEL_NOT_FOUND:      return "model_not_found";
        case FetchErrorKind::AMBIGUOUS_MODEL:      return "ambiguous_model";
        case FetchErrorKind::CANCELLED:            return "cancelled";
        case FetchErrorKind::INVALID_REQUEST:      return "invalid_request";
        case FetchErrorKind::IO_ERROR:             return "io_error";
        default:                                   return "unknown";
    }
}

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::INVALID_REQUEST;
    std::string url;
    int http_status = 0;
    uint32_t attempts = 0;
    std::string detail;

    [[nodiscard]] std::string message() const {
        std::string msg = std::format("fetch failed ({})", fetch_error_kind_to_string(kind));
        if (!url.empty()) msg += std::format(" for {}", url);
        if (http_status != 0) msg += std::format(": HTTP {}", http_status);
        if (attempts > 1) msg += std::format(" after {} attempts", attempts);
        if (!detail.empty()) msg += ": " + detail;
        return msg;
    }
};

// ============================================================================
// Import errors
// ============================================================================

enum class ImportErrorKind {
    DANGLING_REFERENCE,     // recoverable, accumulated
    MALFORMED_ELEMENT,      // fatal
    CONFLICTING_DUPLICATE,  // fatal
    DATABASE_ERROR,         // fatal
    IO_ERROR                // fatal
};

struct ImportError {
    ImportErrorKind kind = ImportErrorKind::MALFORMED_ELEMENT;
    std::string relation_id;
    std::string origin_id;
    std::string relation_name;
    std::string target_id;
    std::string element_id;
    size_t element_index = 0;
    std::string detail;

    [[nodiscard]] std::string message() const {
        switch (kind) {
            case ImportErrorKind::DANGLING_REFERENCE:
                return std::format("relation {} ({} -[{}]-> {}) points at an element missing "
                                   "from the document", relation_id, origin_id, relation_name,
                                   target_id);
            case ImportErrorKind::MALFORMED_ELEMENT:
                return std::format("element #{} is malformed: {}", element_index, detail);
            case ImportErrorKind::CONFLICTING_DUPLICATE:
                return std::format("differing elements share the id {}", element_id);
            case ImportErrorKind::DATABASE_ERROR:
                return std::format("database error during import: {}", detail);
            case ImportErrorKind::IO_ERROR:
                return std::format("cannot read element document: {}", detail);
        }
        return "import error";
    }
};

// ============================================================================
// Database errors
// ============================================================================

struct DbError {
    int code = 0;               // native result code
    std::string statement;
    std::string detail;

    [[nodiscard]] std::string message() const {
        if (statement.empty()) return detail;
        return std::format("{} (while executing: {})", detail, statement);
    }
};

// ============================================================================
// Result
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value or a typed error. The error type carries the context
 * needed to diagnose the failure and renders it through message().
 */
template<typename T, typename E>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(E err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const E& err() const { return *error_; }
    std::string error_message() const { return error_ ? error_->message() : std::string{}; }

private:
    std::optional<T> value_;
    std::optional<E> error_;
};

// Placeholder value for operations that only report success or an error
struct Done {};

} // namespace sysmlsql
