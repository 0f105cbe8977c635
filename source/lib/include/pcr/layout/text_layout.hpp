#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core/types.hpp>

#include <pcr/assets/font.hpp>
#include <pcr/card/card_record.hpp>
#include <pcr/config.hpp>
#include <pcr/layout/card_template.hpp>

struct FittedLine
{
    std::string m_Text;
    uint32_t m_Size;
    int32_t m_Width;
    bool m_Truncated{ false };
};

struct FittedParagraph
{
    std::vector<std::string> m_Lines;
    uint32_t m_Size;
    int32_t m_Height;
    bool m_Truncated{ false };
};

// Shrinks from sizes.m_Start in steps of sizes.m_Step until text fits box_width, never below sizes.m_Min
FittedLine FitSingleLine(std::string_view text,
                         const Font& font,
                         int32_t box_width,
                         const FontSizeRange& sizes,
                         OverflowPolicy policy);

// Greedy word wrap, newlines start a new paragraph and words wider than the box are broken between characters
std::vector<std::string> WrapText(std::string_view text,
                                  const Font& font,
                                  uint32_t size,
                                  int32_t box_width);

int32_t ParagraphHeight(size_t line_count, const Font& font, uint32_t size, int32_t line_spacing);

// Wraps and shrinks until the wrapped lines fit the box, never below sizes.m_Min
FittedParagraph FitParagraph(std::string_view text,
                             const Font& font,
                             cv::Size box,
                             const FontSizeRange& sizes,
                             int32_t line_spacing,
                             OverflowPolicy policy);

std::string TypeLineText(const CardRecord& record);

// "{2}{R}" -> "{2}", "{R}", characters outside of braces are tokens of their own
std::vector<std::string> ParseCost(std::string_view cost);

// Text to draw with the symbol font for a cost token, empty if the token has no symbol
std::optional<std::string_view> CostSymbolGlyph(std::string_view token);

enum class FontRole
{
    Title,
    Body,
    Symbol,
};

const Font& FontFor(const FontSet& fonts, FontRole role);

struct PlacedText
{
    std::string m_Text;
    FontRole m_Font;
    uint32_t m_Size;
    // Left end of the baseline in canvas coordinates
    cv::Point m_Origin;
    int32_t m_Width;
};

struct CostRun
{
    std::vector<PlacedText> m_Glyphs;
    uint32_t m_Size;
    int32_t m_Width;
    bool m_Truncated{ false };
};

// Right-aligned and vertically centered in box, unknown tokens are drawn literally with the body font
CostRun LayoutCost(std::string_view cost,
                   const FontSet& fonts,
                   const cv::Rect& box,
                   const FontSizeRange& sizes,
                   OverflowPolicy policy);

struct LayoutOptions
{
    OverflowPolicy m_OverflowPolicy{ OverflowPolicy::Truncate };
    bool m_TitleUppercase{ true };
};

struct CardLayout
{
    PlacedText m_Title;
    PlacedText m_TypeLine;
    CostRun m_Cost;
    std::vector<PlacedText> m_Body;
    std::optional<PlacedText> m_Strength;

    // Regions whose text did not fit at the minimum size
    std::vector<std::string> m_Overflows;
};

CardLayout LayoutCard(const CardRecord& record,
                      const FontSet& fonts,
                      const CardTemplate& card_template,
                      const LayoutOptions& options);
