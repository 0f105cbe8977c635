#include <pcr/assets/asset_resolver.hpp>

#include <array>
#include <system_error>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <pcr/card/slug.hpp>
#include <pcr/config.hpp>
#include <pcr/errors.hpp>
#include <pcr/util/log.hpp>

namespace
{
inline constexpr std::array c_ArtworkExtensions{ ".png", ".jpg", ".jpeg" };

// Paths that can not be queried, e.g. names too long for the file system, count as missing
bool IsRegularFile(const fs::path& path)
{
    std::error_code error;
    const bool regular_file{ fs::is_regular_file(path, error) };
    if (error)
    {
        LogDebug("Can not query {}: {}", path.string(), error.message());
        return false;
    }
    return regular_file;
}

std::optional<Image> LoadOptional(const fs::path& path, std::string_view what)
{
    if (!IsRegularFile(path))
    {
        return std::nullopt;
    }

    Image image{ Image::Read(path).ToBgra() };
    if (!image)
    {
        LogWarning("Could not decode {} {}, ignoring it", what, path.string());
        return std::nullopt;
    }
    return image;
}
} // namespace

AssetResolver::AssetResolver(const Config& config, FontSet fonts)
    : m_AssetDir{ config.m_AssetDir }
    , m_ArtDir{ config.m_ArtDir }
    , m_Fonts{ std::move(fonts) }
{
}

void AssetResolver::VerifyFrames() const
{
    for (const CardColor color : magic_enum::enum_values<CardColor>())
    {
        const Image frame{ LoadFrame(color) };
        LogDebug("Frame {} is {}x{}", FramePath(color).string(), frame.Width() / 1_pix, frame.Height() / 1_pix);
    }
}

ResolvedAssets AssetResolver::Resolve(const CardRecord& record) const
{
    ResolvedAssets assets{
        .m_Frame = LoadFrame(record.m_Color),
        .m_Pattern = LoadOptional(PatternPath(record.m_Color), "pattern"),
        .m_BodyPanel = LoadOptional(BodyPanelPath(), "body panel"),
        .m_Fonts = m_Fonts,
    };

    if (const auto art_path{ FindArtwork(record) })
    {
        assets.m_Artwork = LoadOptional(art_path.value(), "artwork");
        if (!assets.m_Artwork.has_value())
        {
            assets.m_MissingArtwork = fmt::format("artwork {} could not be decoded", art_path->string());
        }
    }
    else
    {
        assets.m_MissingArtwork = fmt::format("no artwork found for '{}' in {}", record.m_Name, m_ArtDir.string());
    }

    if (assets.m_MissingArtwork.has_value())
    {
        LogWarning("MissingArtwork: row {}: {}, using placeholder", record.m_Row, assets.m_MissingArtwork.value());
    }

    return assets;
}

fs::path AssetResolver::FramePath(CardColor color) const
{
    return m_AssetDir / fmt::format("frame_{}.png", ToLower(CardColorName(color)));
}

fs::path AssetResolver::PatternPath(CardColor color) const
{
    return m_AssetDir / fmt::format("pattern_{}.png", ToLower(CardColorName(color)));
}

fs::path AssetResolver::BodyPanelPath() const
{
    return m_AssetDir / "parchment_box.png";
}

std::optional<fs::path> AssetResolver::FindArtwork(const CardRecord& record) const
{
    if (record.m_ArtFile.has_value())
    {
        const fs::path& art_file{ record.m_ArtFile.value() };
        if (IsRegularFile(art_file))
        {
            return art_file;
        }
        if (IsRegularFile(m_ArtDir / art_file))
        {
            return m_ArtDir / art_file;
        }
        LogWarning("Art file {} for row {} does not exist, looking for derived artwork", art_file.string(), record.m_Row);
    }

    const std::string slug{ Slugify(record.m_Name) };
    for (const char* ext : c_ArtworkExtensions)
    {
        fs::path art_path{ m_ArtDir / slug };
        art_path += ext;
        if (IsRegularFile(art_path))
        {
            return art_path;
        }
    }

    return std::nullopt;
}

Image AssetResolver::LoadFrame(CardColor color) const
{
    const fs::path frame_path{ FramePath(color) };
    Image frame{ Image::Read(frame_path).ToBgra() };
    if (!frame)
    {
        throw AssetNotFoundError{ "frame", frame_path };
    }
    return frame;
}
