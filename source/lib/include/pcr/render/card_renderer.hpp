#pragma once

#include <string>
#include <vector>

#include <pcr/assets/asset_resolver.hpp>
#include <pcr/card/csv_reader.hpp>
#include <pcr/config.hpp>
#include <pcr/image.hpp>
#include <pcr/print/print_exporter.hpp>

struct SkippedCard
{
    size_t m_Row;
    std::string m_Name;
    std::string m_Reason;
};

struct RenderWarning
{
    size_t m_Row;
    std::string m_Name;
    std::string m_Message;
};

struct RenderSummary
{
    std::vector<fs::path> m_Rendered;
    std::vector<SkippedCard> m_Skipped;
    std::vector<RenderWarning> m_Warnings;

    // Set when the fail-fast policy stopped the batch early
    bool m_Aborted{ false };

    bool AllRendered() const;
};

struct RenderedCard
{
    fs::path m_Path;
    std::vector<std::string> m_Warnings;
};

class CardRenderer
{
  public:
    CardRenderer(const Config& config, const AssetResolver& resolver, const PrintExporter& exporter);

    // Working resolution canvas, warnings about missing art and overflowing text are appended
    Image RenderCanvas(const CardRecord& record, std::vector<std::string>& warnings) const;

    // Throws ExportError or AssetNotFoundError
    RenderedCard Render(const CardRecord& record, const fs::path& output_dir) const;

    // Per-row failures, including unexpected file system errors, are collected in the summary,
    // missing frames or fonts propagate
    RenderSummary RenderAll(const std::vector<CsvRow>& rows, const fs::path& output_dir) const;

  private:
    const Config& m_Config;
    const AssetResolver& m_Resolver;
    const PrintExporter& m_Exporter;
};

void LogSummary(const RenderSummary& summary);
