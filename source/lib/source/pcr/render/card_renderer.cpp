#include <pcr/render/card_renderer.hpp>

#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <pcr/card/slug.hpp>
#include <pcr/errors.hpp>
#include <pcr/layout/text_layout.hpp>
#include <pcr/render/compositor.hpp>
#include <pcr/util/log.hpp>

namespace
{
std::string RowName(const CsvRow& row)
{
    const auto it{ row.m_Fields.find("name") };
    return it != row.m_Fields.end() ? std::string{ Trim(it->second) } : std::string{};
}
} // namespace

bool RenderSummary::AllRendered() const
{
    return m_Skipped.empty() && !m_Aborted;
}

CardRenderer::CardRenderer(const Config& config, const AssetResolver& resolver, const PrintExporter& exporter)
    : m_Config{ config }
    , m_Resolver{ resolver }
    , m_Exporter{ exporter }
{
}

Image CardRenderer::RenderCanvas(const CardRecord& record, std::vector<std::string>& warnings) const
{
    const ResolvedAssets assets{ m_Resolver.Resolve(record) };
    if (assets.m_MissingArtwork.has_value())
    {
        warnings.push_back(fmt::format("MissingArtwork: {}", assets.m_MissingArtwork.value()));
    }

    const LayoutOptions options{
        .m_OverflowPolicy = m_Config.m_OverflowPolicy,
        .m_TitleUppercase = m_Config.m_TitleUppercase,
    };
    const CardLayout layout{ LayoutCard(record, assets.m_Fonts, m_Config.m_Template, options) };
    if (!layout.m_Overflows.empty())
    {
        const std::string overflow_warning{
            fmt::format("{} did not fit at the minimum font size ({})",
                        fmt::join(layout.m_Overflows, ", "),
                        m_Config.m_OverflowPolicy == OverflowPolicy::Truncate ? "truncated" : "overflowing"),
        };
        LogWarning("Row {}: {}", record.m_Row, overflow_warning);
        warnings.push_back(overflow_warning);
    }

    return Compose(record, assets, layout, m_Config.m_Template, m_Config.m_Style);
}

RenderedCard CardRenderer::Render(const CardRecord& record, const fs::path& output_dir) const
{
    const std::string slug{ Slugify(record.m_Name) };
    if (slug.empty())
    {
        throw ValidationError{ "name", record.m_Row, fmt::format("'{}' does not contain any letters or digits to name the file after", record.m_Name) };
    }

    RenderedCard rendered{
        .m_Path = OutputPath(output_dir, slug, m_Config),
        .m_Warnings{},
    };

    const Image canvas{ RenderCanvas(record, rendered.m_Warnings) };
    m_Exporter.Export(canvas, rendered.m_Path);
    return rendered;
}

RenderSummary CardRenderer::RenderAll(const std::vector<CsvRow>& rows, const fs::path& output_dir) const
{
    std::error_code error;
    fs::create_directories(output_dir, error);
    if (error)
    {
        throw ExportError{ output_dir, fmt::format("could not create output directory: {}", error.message()) };
    }

    // Fail before the first card if any frame is unusable
    m_Resolver.VerifyFrames();

    RenderSummary summary{};
    std::set<fs::path> written_paths;
    for (size_t i = 0; i < rows.size(); i++)
    {
        const CsvRow& row{ rows[i] };
        const Log::ScopedContext row_context{ fmt::format("row {} '{}'", row.m_Index, RowName(row)) };
        try
        {
            const CardRecord record{ ParseCardRecord(row) };
            RenderedCard rendered{ Render(record, output_dir) };

            if (!written_paths.insert(rendered.m_Path).second)
            {
                rendered.m_Warnings.push_back(fmt::format("overwrote {} written by an earlier row", rendered.m_Path.string()));
                LogWarning("Overwrote {}, another row has the same file name", rendered.m_Path.string());
            }

            for (std::string& warning : rendered.m_Warnings)
            {
                summary.m_Warnings.push_back(RenderWarning{ record.m_Row, record.m_Name, std::move(warning) });
            }
            summary.m_Rendered.push_back(std::move(rendered.m_Path));
        }
        catch (const ValidationError& e)
        {
            LogError("Skipping card: {}", e.what());
            summary.m_Skipped.push_back(SkippedCard{ row.m_Index, RowName(row), e.what() });
        }
        catch (const ExportError& e)
        {
            LogError("Skipping card: {}", e.what());
            summary.m_Skipped.push_back(SkippedCard{ row.m_Index, RowName(row), e.what() });
        }
        catch (const AssetNotFoundError&)
        {
            throw;
        }
        catch (const TemplateError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            // File system and OpenCV errors only affect this card
            LogError("Skipping card after unexpected error: {}", e.what());
            summary.m_Skipped.push_back(SkippedCard{ row.m_Index, RowName(row), e.what() });
        }

        if (m_Config.m_ErrorPolicy == ErrorPolicy::FailFast && !summary.m_Skipped.empty())
        {
            LogError("Stopping after the first failed card, {} rows not attempted", rows.size() - i - 1);
            summary.m_Aborted = true;
            break;
        }
    }

    return summary;
}

void LogSummary(const RenderSummary& summary)
{
    LogInfo("Rendered {} cards, skipped {}", summary.m_Rendered.size(), summary.m_Skipped.size());
    for (const SkippedCard& skipped : summary.m_Skipped)
    {
        LogInfo("  skipped row {} '{}': {}", skipped.m_Row, skipped.m_Name, skipped.m_Reason);
    }
    for (const RenderWarning& warning : summary.m_Warnings)
    {
        LogInfo("  warning row {} '{}': {}", warning.m_Row, warning.m_Name, warning.m_Message);
    }
    if (summary.m_Aborted)
    {
        LogInfo("  batch stopped early");
    }
}
