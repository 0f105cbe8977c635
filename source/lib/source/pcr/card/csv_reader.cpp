#include <pcr/card/csv_reader.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include <pcr/util/log.hpp>

namespace
{
using CsvRecord = std::vector<std::string>;

// Splits content into records, honoring quoted cells that contain separators, quotes or line breaks
std::vector<CsvRecord> SplitRecords(std::string_view content)
{
    std::vector<CsvRecord> records;

    CsvRecord record;
    std::string cell;
    bool in_quotes{ false };
    bool cell_was_quoted{ false };

    const auto finish_cell{
        [&]()
        {
            record.push_back(std::move(cell));
            cell.clear();
            cell_was_quoted = false;
        }
    };
    const auto finish_record{
        [&]()
        {
            const bool blank_line{ record.empty() && cell.empty() && !cell_was_quoted };
            if (blank_line)
            {
                return;
            }
            finish_cell();
            records.push_back(std::move(record));
            record.clear();
        }
    };

    for (size_t i = 0; i < content.size(); i++)
    {
        const char c{ content[i] };
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < content.size() && content[i + 1] == '"')
                {
                    cell += '"';
                    i++;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                cell += c;
            }
            continue;
        }

        switch (c)
        {
        case '"':
            in_quotes = true;
            cell_was_quoted = true;
            break;
        case ',':
            finish_cell();
            break;
        case '\r':
            if (i + 1 < content.size() && content[i + 1] == '\n')
            {
                i++;
            }
            finish_record();
            break;
        case '\n':
            finish_record();
            break;
        default:
            cell += c;
            break;
        }
    }

    if (in_quotes)
    {
        LogWarning("Csv content ends inside a quoted cell");
    }
    finish_record();

    return records;
}
} // namespace

std::vector<CsvRow> ParseCsv(std::string_view csv_content)
{
    static constexpr std::string_view c_Utf8Bom{ "\xEF\xBB\xBF" };
    if (csv_content.starts_with(c_Utf8Bom))
    {
        csv_content.remove_prefix(c_Utf8Bom.size());
    }

    const std::vector<CsvRecord> records{ SplitRecords(csv_content) };
    if (records.empty())
    {
        return {};
    }

    std::vector<std::string> headers;
    headers.reserve(records.front().size());
    for (const std::string& header : records.front())
    {
        headers.push_back(ToLower(Trim(header)));
    }

    std::vector<CsvRow> rows;
    rows.reserve(records.size() - 1);
    for (size_t i = 1; i < records.size(); i++)
    {
        const CsvRecord& record{ records[i] };

        CsvRow row{
            .m_Index = i,
            .m_Fields{},
        };
        for (size_t j = 0; j < record.size(); j++)
        {
            if (j >= headers.size())
            {
                row.m_ExtraCells = record.size() - headers.size();
                break;
            }
            if (!headers[j].empty())
            {
                row.m_Fields[headers[j]] = record[j];
            }
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

std::vector<CsvRow> ReadCsv(const fs::path& csv_path)
{
    std::ifstream file{ csv_path, std::ios::binary };
    if (!file)
    {
        throw std::runtime_error{ fmt::format("Could not open card list {}", csv_path.string()) };
    }

    std::stringstream content;
    content << file.rdbuf();

    std::vector<CsvRow> rows{ ParseCsv(content.str()) };
    LogInfo("Read {} card rows from {}", rows.size(), csv_path.string());
    return rows;
}
