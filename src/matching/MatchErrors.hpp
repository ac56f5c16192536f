#pragma once

#include <stdexcept>
#include <string>

namespace matching
{

/// Base of the failures raised at the matching call boundary.
class MatchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The requested match column is not a column of the candidate table.
class InvalidColumnError : public MatchError
{
public:
    explicit InvalidColumnError(const std::string& column)
        : MatchError("Column '" + column + "' not found in candidate table")
        , column_(column)
    {
    }

    const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

/// The method name is none of ngram, phonetic, levenshtein, hybrid.
class InvalidMethodError : public MatchError
{
public:
    explicit InvalidMethodError(const std::string& method)
        : MatchError("Method must be 'hybrid', 'ngram', 'phonetic', or 'levenshtein' (got '" + method + "')")
        , method_(method)
    {
    }

    const std::string& method() const noexcept { return method_; }

private:
    std::string method_;
};

} // namespace matching
