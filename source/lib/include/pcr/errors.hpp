#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <pcr/util.hpp>

// A card row that cannot be turned into a valid record
class ValidationError : public std::runtime_error
{
  public:
    ValidationError(std::string_view field, size_t row, std::string_view reason);

    const std::string& Field() const;
    size_t Row() const;

  private:
    std::string m_Field;
    size_t m_Row;
};

// A shared prerequisite (frame or font) is missing, fatal for the whole run
class AssetNotFoundError : public std::runtime_error
{
  public:
    AssetNotFoundError(std::string_view asset, const fs::path& path);

    const fs::path& Path() const;

  private:
    fs::path m_Path;
};

// Writing a rendered card failed, fatal only for that card
class ExportError : public std::runtime_error
{
  public:
    ExportError(const fs::path& path, std::string_view reason);

    const fs::path& Path() const;

  private:
    fs::path m_Path;
};

// The configured card template is unusable
class TemplateError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};
