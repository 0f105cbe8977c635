#pragma once

#include <string_view>
#include <vector>

#include <pcr/card/card_record.hpp>

// Throws std::runtime_error if the file can not be opened
std::vector<CsvRow> ReadCsv(const fs::path& csv_path);

// Parses csv content already in memory, the first record is the header
std::vector<CsvRow> ParseCsv(std::string_view csv_content);
