#pragma once

#include <optional>
#include <string>

#include <pcr/assets/font.hpp>
#include <pcr/card/card_record.hpp>
#include <pcr/image.hpp>
#include <pcr/util.hpp>

struct Config;

struct ResolvedAssets
{
    Image m_Frame;
    std::optional<Image> m_Pattern{};

    // Panel behind the body text, shared by all colors
    std::optional<Image> m_BodyPanel{};

    // Empty with m_MissingArtwork set when no artwork could be loaded
    std::optional<Image> m_Artwork{};
    std::optional<std::string> m_MissingArtwork{};

    FontSet m_Fonts;
};

class AssetResolver
{
  public:
    AssetResolver(const Config& config, FontSet fonts);

    // Throws AssetNotFoundError naming the first frame that is missing or can not be decoded
    void VerifyFrames() const;

    // Throws AssetNotFoundError if the frame for the record is unusable, missing artwork is not an error
    ResolvedAssets Resolve(const CardRecord& record) const;

    fs::path FramePath(CardColor color) const;
    fs::path PatternPath(CardColor color) const;
    fs::path BodyPanelPath() const;

    // Explicit art file first, then <art_dir>/<slug> with each known extension
    std::optional<fs::path> FindArtwork(const CardRecord& record) const;

  private:
    Image LoadFrame(CardColor color) const;

    fs::path m_AssetDir;
    fs::path m_ArtDir;
    FontSet m_Fonts;
};
