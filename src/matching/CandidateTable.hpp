#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace matching
{

class CandidateTable;

/**
 * @brief Read-only text view of one column, resolved once per matching call.
 *
 * Non-string cells (null, numbers, booleans, nested values) read as the empty string.
 * The view borrows the table and must not outlive it.
 */
class TextColumn
{
public:
    const std::string& name() const noexcept { return name_; }
    std::size_t size() const noexcept;
    std::string operator[](std::size_t row) const;

private:
    friend class CandidateTable;
    TextColumn(const CandidateTable& table, std::size_t index, std::string name);

    const CandidateTable* table_;
    std::size_t index_;
    std::string name_;
};

/**
 * @brief Ordered set of candidate records with named columns.
 *
 * Cells are JSON values so records may carry arbitrary attributes next to the match
 * column. Matching never modifies a caller's table; results are built on copies.
 */
class CandidateTable
{
public:
    using Value = nlohmann::json;

    CandidateTable() = default;
    explicit CandidateTable(std::vector<std::string> columns);

    /// Single-column table, one row per value
    static CandidateTable fromColumn(const std::string& column, const std::vector<std::string>& values);

    /// Load JSON Lines (one object per line). Malformed lines are skipped with a warning.
    /// Returns std::nullopt if the file cannot be opened.
    static std::optional<CandidateTable> loadJsonLines(const std::string& file_path);

    static CandidateTable parseJsonLines(std::istream& input, const std::string& source_name = "<stream>");

    /// Append a row; throws std::invalid_argument if the width differs from columnCount()
    void addRow(std::vector<Value> values);

    /// Append a JSON object. Unknown keys become new columns, missing keys become null.
    void addRecord(const Value& record);

    /// Add or replace a column; throws std::invalid_argument if the length differs from rowCount()
    void setColumn(const std::string& name, std::vector<Value> values);

    bool hasColumn(const std::string& name) const;
    std::optional<std::size_t> columnIndex(const std::string& name) const;

    /// Validated accessor; throws InvalidColumnError if the column is absent
    TextColumn textColumn(const std::string& name) const;

    const std::vector<std::string>& columns() const noexcept { return columns_; }
    std::size_t columnCount() const noexcept { return columns_.size(); }
    std::size_t rowCount() const noexcept { return rows_.size(); }
    bool empty() const noexcept { return rows_.empty(); }

    const Value& at(std::size_t row, std::size_t column) const;
    /// Throws InvalidColumnError if the column is absent
    const Value& at(std::size_t row, const std::string& column) const;

    /// New table with the given rows, in the given order
    CandidateTable selectRows(const std::vector<std::size_t>& rows) const;

    /// Render as an aligned text table with a leading row-index column
    std::string toString(int precision = 4) const;

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<Value>> rows_;
};

} // namespace matching
