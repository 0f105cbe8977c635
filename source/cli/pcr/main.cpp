#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <pcr/assets/asset_resolver.hpp>
#include <pcr/assets/freetype_font.hpp>
#include <pcr/card/csv_reader.hpp>
#include <pcr/config.hpp>
#include <pcr/errors.hpp>
#include <pcr/json_util.hpp>
#include <pcr/print/color_conversion.hpp>
#include <pcr/print/print_exporter.hpp>
#include <pcr/render/card_renderer.hpp>
#include <pcr/util/log.hpp>

#include <pcr/version.hpp>

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_Valid{ true };

    bool m_FailFast{ false };

    std::optional<fs::path> m_CardsFile{ std::nullopt };
    std::optional<fs::path> m_OutputDir{ std::nullopt };
    fs::path m_ConfigFile{ "config.json"_p };
    JsonOverrides m_ConfigOverrides{};
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Print-Card-Renderer

    pcr-cli <cards.csv> <output_dir> [options] [overrides]

    --help              Display this information.
    --config <file>     Load the configuration from this file,
                        defaults to config.json.
    --fail-fast         Stop at the first card that fails to render.

Config Overrides are formatted as follows:
    --<name> <value>    Will override the property <name> with the
                        value <value> as if parsed as json, where
                        <name> can be a nested name and refers to
                        the names seen in config.json files.
                        For example:
                            --dpi 600
                            --bleed_edge "3 mm"
                            --layout.body.line_spacing 6
)"
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    for (size_t i = 1; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--fail-fast")
        {
            cli.m_FailFast = true;
        }
        else if (arg == "--config")
        {
            if (i + 1 >= argv.size())
            {
                LogError("Expected a file after --config");
                cli.m_Valid = false;
                return cli;
            }
            cli.m_ConfigFile = argv[++i];
        }
        else if (arg.starts_with("--"))
        {
            if (i + 1 >= argv.size())
            {
                LogError("Error while parsing config overrides. Missing value for {}", arg);
                cli.m_Valid = false;
                return cli;
            }
            cli.m_ConfigOverrides[std::string{ arg.substr(2) }] = argv[++i];
        }
        else if (!cli.m_CardsFile.has_value())
        {
            cli.m_CardsFile = fs::path{ arg };
        }
        else if (!cli.m_OutputDir.has_value())
        {
            cli.m_OutputDir = fs::path{ arg };
        }
        else
        {
            LogError("Unexpected command line argument {}", arg);
            cli.m_Valid = false;
            return cli;
        }
    }

    if (!cli.m_CardsFile.has_value() || !cli.m_OutputDir.has_value())
    {
        LogError("Expected <cards.csv> and <output_dir>, see --help");
        cli.m_Valid = false;
    }

    return cli;
}

int main(int argc, char** argv)
{
    Log::RegisterThreadName("MainThread");

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailThread |
        LogFlags::DetailContext
    };
    Log main_log{ log_flags, Log::c_MainLogName };

    uint32_t num_warnings{ 0 };
    uint32_t num_errors{ 0 };
    main_log.InstallHook(
        [&](const Log::DetailInformation&, Log::LogLevel level, std::string_view)
        {
            num_warnings += level == Log::LogLevel::Warning ? 1 : 0;
            num_errors += level == Log::LogLevel::Error || level == Log::LogLevel::Fatal ? 1 : 0;
        });

    CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed)
    {
        return 0;
    }
    if (!cli.m_Valid)
    {
        return 2;
    }

    LogInfo("Print-Card-Renderer {} built {}", PcrVersion(), PcrBuildTime());

    try
    {
        nlohmann::json config_json = LoadConfigJson(cli.m_ConfigFile);
        ApplyJsonOverrides(config_json, cli.m_ConfigOverrides);

        Config config{ ConfigFromJson(config_json) };
        if (cli.m_FailFast)
        {
            config.m_ErrorPolicy = ErrorPolicy::FailFast;
        }

        const AssetResolver resolver{ config, LoadFontSet(config) };
        const PrintExporter exporter{ config, MakeColorConverter(config) };
        const CardRenderer renderer{ config, resolver, exporter };

        const std::vector<CsvRow> rows{ ReadCsv(cli.m_CardsFile.value()) };
        const RenderSummary summary{ renderer.RenderAll(rows, cli.m_OutputDir.value()) };
        LogSummary(summary);
        LogInfo("Finished with {} warnings and {} errors logged", num_warnings, num_errors);

        return summary.AllRendered() ? 0 : 1;
    }
    catch (const AssetNotFoundError& e)
    {
        LogFatal("Missing asset, nothing rendered: {}", e.what());
    }
    catch (const TemplateError& e)
    {
        LogFatal("Invalid card template: {}", e.what());
    }
    catch (const ExportError& e)
    {
        LogError("Can not write output: {}", e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Invalid configuration: {}", e.what());
    }
    catch (const std::exception& e)
    {
        LogError("Render run failed: {}", e.what());
    }

    return 1;
}
