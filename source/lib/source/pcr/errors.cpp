#include <pcr/errors.hpp>

#include <fmt/format.h>

ValidationError::ValidationError(std::string_view field, size_t row, std::string_view reason)
    : std::runtime_error{ fmt::format("Row {}: invalid field '{}': {}", row, field, reason) }
    , m_Field{ field }
    , m_Row{ row }
{
}

const std::string& ValidationError::Field() const
{
    return m_Field;
}

size_t ValidationError::Row() const
{
    return m_Row;
}

AssetNotFoundError::AssetNotFoundError(std::string_view asset, const fs::path& path)
    : std::runtime_error{ fmt::format("Missing {}: {}", asset, path.string()) }
    , m_Path{ path }
{
}

const fs::path& AssetNotFoundError::Path() const
{
    return m_Path;
}

ExportError::ExportError(const fs::path& path, std::string_view reason)
    : std::runtime_error{ fmt::format("Failed exporting {}: {}", path.string(), reason) }
    , m_Path{ path }
{
}

const fs::path& ExportError::Path() const
{
    return m_Path;
}
