#include "CandidateTable.hpp"
#include "MatchErrors.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <plog/Log.h>

using json = nlohmann::json;

namespace matching
{

namespace
{

std::string cellText(const json& value, int precision)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_null())
        return "";
    if (value.is_number_float())
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value.get<double>();
        return ss.str();
    }
    return value.dump();
}

} // namespace

TextColumn::TextColumn(const CandidateTable& table, std::size_t index, std::string name)
    : table_(&table)
    , index_(index)
    , name_(std::move(name))
{
}

std::size_t TextColumn::size() const noexcept { return table_->rowCount(); }

std::string TextColumn::operator[](std::size_t row) const
{
    const auto& value = table_->at(row, index_);
    if (value.is_string())
        return value.get<std::string>();
    return {};
}

CandidateTable::CandidateTable(std::vector<std::string> columns) : columns_(std::move(columns))
{
}

CandidateTable CandidateTable::fromColumn(const std::string& column, const std::vector<std::string>& values)
{
    CandidateTable table({ column });
    for (const auto& value : values)
    {
        table.addRow({ Value(value) });
    }
    return table;
}

std::optional<CandidateTable> CandidateTable::loadJsonLines(const std::string& file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Failed to open candidate file", file_path);
        return std::nullopt;
    }

    CandidateTable table = parseJsonLines(file, file_path);
    PLOG_INFO << "[CandidateTable] Loaded " << table.rowCount() << " candidates with " << table.columnCount()
              << " columns from " << file_path;
    return table;
}

CandidateTable CandidateTable::parseJsonLines(std::istream& input, const std::string& source_name)
{
    CandidateTable table;
    std::string line;
    std::size_t line_number = 0;
    std::size_t skipped = 0;

    while (std::getline(input, line))
    {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        try
        {
            json record = json::parse(line);
            if (!record.is_object())
            {
                PLOG_WARNING << "[CandidateTable] " << source_name << ":" << line_number
                             << ": expected a JSON object, skipping";
                ++skipped;
                continue;
            }
            table.addRecord(record);
        }
        catch (const json::parse_error& e)
        {
            PLOG_WARNING << "[CandidateTable] " << source_name << ":" << line_number << ": " << e.what();
            ++skipped;
        }
    }

    if (skipped > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Skipped malformed candidate lines",
                                            source_name + ": " + std::to_string(skipped) + " line(s)");
    }

    return table;
}

void CandidateTable::addRow(std::vector<Value> values)
{
    if (values.size() != columns_.size())
    {
        throw std::invalid_argument("Row has " + std::to_string(values.size()) + " values, table has " +
                                    std::to_string(columns_.size()) + " columns");
    }
    rows_.push_back(std::move(values));
}

void CandidateTable::addRecord(const Value& record)
{
    if (!record.is_object())
    {
        throw std::invalid_argument("Candidate record must be a JSON object");
    }

    for (const auto& [key, value] : record.items())
    {
        if (!hasColumn(key))
        {
            columns_.push_back(key);
            for (auto& row : rows_)
            {
                row.emplace_back(nullptr);
            }
        }
    }

    std::vector<Value> row(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i)
    {
        auto it = record.find(columns_[i]);
        if (it != record.end())
            row[i] = *it;
    }
    rows_.push_back(std::move(row));
}

void CandidateTable::setColumn(const std::string& name, std::vector<Value> values)
{
    if (values.size() != rows_.size())
    {
        throw std::invalid_argument("Column '" + name + "' has " + std::to_string(values.size()) +
                                    " values, table has " + std::to_string(rows_.size()) + " rows");
    }

    std::size_t index = 0;
    if (auto existing = columnIndex(name))
    {
        index = *existing;
    }
    else
    {
        index = columns_.size();
        columns_.push_back(name);
        for (auto& row : rows_)
        {
            row.emplace_back(nullptr);
        }
    }

    for (std::size_t i = 0; i < rows_.size(); ++i)
    {
        rows_[i][index] = std::move(values[i]);
    }
}

bool CandidateTable::hasColumn(const std::string& name) const { return columnIndex(name).has_value(); }

std::optional<std::size_t> CandidateTable::columnIndex(const std::string& name) const
{
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(columns_.begin(), it));
}

TextColumn CandidateTable::textColumn(const std::string& name) const
{
    auto index = columnIndex(name);
    if (!index)
    {
        throw InvalidColumnError(name);
    }
    return TextColumn(*this, *index, name);
}

const CandidateTable::Value& CandidateTable::at(std::size_t row, std::size_t column) const
{
    return rows_.at(row).at(column);
}

const CandidateTable::Value& CandidateTable::at(std::size_t row, const std::string& column) const
{
    auto index = columnIndex(column);
    if (!index)
    {
        throw InvalidColumnError(column);
    }
    return at(row, *index);
}

CandidateTable CandidateTable::selectRows(const std::vector<std::size_t>& rows) const
{
    CandidateTable result(columns_);
    result.rows_.reserve(rows.size());
    for (std::size_t row : rows)
    {
        result.rows_.push_back(rows_.at(row));
    }
    return result;
}

std::string CandidateTable::toString(int precision) const
{
    // First column holds the row index
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows_.size() + 1);

    std::vector<std::string> header{ "" };
    header.insert(header.end(), columns_.begin(), columns_.end());
    cells.push_back(std::move(header));

    for (std::size_t r = 0; r < rows_.size(); ++r)
    {
        std::vector<std::string> line{ std::to_string(r) };
        for (const auto& value : rows_[r])
        {
            line.push_back(cellText(value, precision));
        }
        cells.push_back(std::move(line));
    }

    std::vector<std::size_t> widths(columns_.size() + 1, 0);
    for (const auto& line : cells)
    {
        for (std::size_t c = 0; c < line.size(); ++c)
        {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    std::ostringstream out;
    for (const auto& line : cells)
    {
        for (std::size_t c = 0; c < line.size(); ++c)
        {
            if (c > 0)
                out << "  ";
            out << std::left << std::setw(static_cast<int>(widths[c])) << line[c];
        }
        out << '\n';
    }
    return out.str();
}

} // namespace matching
