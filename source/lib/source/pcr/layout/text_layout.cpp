#include <pcr/layout/text_layout.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include <pcr/util/utf8.hpp>

namespace
{
inline constexpr std::string_view c_Ellipsis{ "..." };

// Size of the i-th shrink step, clamped to the floor
uint32_t SizeAtStep(const FontSizeRange& sizes, uint32_t step)
{
    const uint32_t shrink{ step * sizes.m_Step };
    if (sizes.m_Start < sizes.m_Min || shrink >= sizes.m_Start - sizes.m_Min)
    {
        return sizes.m_Min;
    }
    return sizes.m_Start - shrink;
}

void TrimTrailingWhitespace(std::string& str)
{
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
    {
        str.pop_back();
    }
}

// Drops trailing code points and appends an ellipsis until the text fits, empty if not even the ellipsis fits
std::string TruncateToWidth(std::string text, const Font& font, uint32_t size, int32_t box_width)
{
    const size_t max_iterations{ CodePointCount(text) };
    for (size_t i = 0; i < max_iterations; i++)
    {
        PopCodePoint(text);
        TrimTrailingWhitespace(text);

        std::string candidate{ text };
        candidate += c_Ellipsis;
        if (font.MeasureWidth(candidate, size) <= box_width)
        {
            return candidate;
        }
    }
    return {};
}

std::vector<std::string_view> SplitParagraphs(std::string_view text)
{
    std::vector<std::string_view> paragraphs;
    size_t start{ 0 };
    while (true)
    {
        const size_t end{ text.find('\n', start) };
        std::string_view paragraph{ text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start) };
        if (paragraph.ends_with('\r'))
        {
            paragraph.remove_suffix(1);
        }
        paragraphs.push_back(paragraph);

        if (end == std::string_view::npos)
        {
            break;
        }
        start = end + 1;
    }
    return paragraphs;
}

std::vector<std::string_view> SplitWords(std::string_view paragraph)
{
    std::vector<std::string_view> words;
    size_t i{ 0 };
    while (i < paragraph.size())
    {
        while (i < paragraph.size() && (paragraph[i] == ' ' || paragraph[i] == '\t'))
        {
            i++;
        }
        const size_t start{ i };
        while (i < paragraph.size() && paragraph[i] != ' ' && paragraph[i] != '\t')
        {
            i++;
        }
        if (i > start)
        {
            words.push_back(paragraph.substr(start, i - start));
        }
    }
    return words;
}

int32_t CenteredBaseline(const cv::Rect& box, const FontMetrics& metrics)
{
    return box.y + (box.height - metrics.LineHeight()) / 2 + metrics.m_Ascent;
}

std::string ToUpperAscii(std::string_view text)
{
    std::string upper{ text };
    std::ranges::transform(upper,
                           upper.begin(),
                           [](unsigned char c)
                           { return c < 0x80 ? static_cast<char>(std::toupper(c)) : static_cast<char>(c); });
    return upper;
}

PlacedText PlaceLine(FittedLine line, FontRole role, const Font& font, const cv::Rect& box, bool centered)
{
    const int32_t x{ centered ? box.x + (box.width - line.m_Width) / 2 : box.x };
    return PlacedText{
        .m_Text = std::move(line.m_Text),
        .m_Font = role,
        .m_Size = line.m_Size,
        .m_Origin = cv::Point{ x, CenteredBaseline(box, font.Metrics(line.m_Size)) },
        .m_Width = line.m_Width,
    };
}
} // namespace

FittedLine FitSingleLine(std::string_view text,
                         const Font& font,
                         int32_t box_width,
                         const FontSizeRange& sizes,
                         OverflowPolicy policy)
{
    const uint32_t step_count{ sizes.StepCount() };
    for (uint32_t step = 0; step < step_count; step++)
    {
        const uint32_t size{ SizeAtStep(sizes, step) };
        const int32_t width{ font.MeasureWidth(text, size) };
        if (width <= box_width)
        {
            return FittedLine{ std::string{ text }, size, width };
        }
    }

    if (policy == OverflowPolicy::Overflow)
    {
        return FittedLine{ std::string{ text }, sizes.m_Min, font.MeasureWidth(text, sizes.m_Min), true };
    }

    std::string truncated{ TruncateToWidth(std::string{ text }, font, sizes.m_Min, box_width) };
    const int32_t width{ font.MeasureWidth(truncated, sizes.m_Min) };
    return FittedLine{ std::move(truncated), sizes.m_Min, width, true };
}

std::vector<std::string> WrapText(std::string_view text,
                                  const Font& font,
                                  uint32_t size,
                                  int32_t box_width)
{
    std::vector<std::string> lines;
    if (text.empty())
    {
        return lines;
    }

    const auto fits{
        [&](std::string_view str)
        { return font.MeasureWidth(str, size) <= box_width; }
    };

    for (const std::string_view paragraph : SplitParagraphs(text))
    {
        const std::vector<std::string_view> words{ SplitWords(paragraph) };
        if (words.empty())
        {
            lines.emplace_back();
            continue;
        }

        std::string line;
        for (const std::string_view word : words)
        {
            std::string candidate{ line };
            if (!candidate.empty())
            {
                candidate += ' ';
            }
            candidate += word;

            if (fits(candidate))
            {
                line = std::move(candidate);
                continue;
            }

            if (!line.empty())
            {
                lines.push_back(std::move(line));
                line.clear();
            }

            if (fits(word))
            {
                line = word;
                continue;
            }

            // Hard break, a single glyph wider than the box still gets a line of its own
            std::string piece;
            for (size_t i = 0; i < word.size();)
            {
                const size_t glyph_start{ i };
                NextCodePoint(word, i);
                const std::string_view glyph{ word.substr(glyph_start, i - glyph_start) };

                std::string next{ piece };
                next += glyph;
                if (!piece.empty() && !fits(next))
                {
                    lines.push_back(std::move(piece));
                    piece = glyph;
                }
                else
                {
                    piece = std::move(next);
                }
            }
            line = std::move(piece);
        }

        if (!line.empty())
        {
            lines.push_back(std::move(line));
        }
    }

    while (!lines.empty() && lines.back().empty())
    {
        lines.pop_back();
    }
    return lines;
}

int32_t ParagraphHeight(size_t line_count, const Font& font, uint32_t size, int32_t line_spacing)
{
    if (line_count == 0)
    {
        return 0;
    }
    const int32_t count{ static_cast<int32_t>(line_count) };
    return count * font.Metrics(size).LineHeight() + (count - 1) * line_spacing;
}

FittedParagraph FitParagraph(std::string_view text,
                             const Font& font,
                             cv::Size box,
                             const FontSizeRange& sizes,
                             int32_t line_spacing,
                             OverflowPolicy policy)
{
    const uint32_t step_count{ sizes.StepCount() };
    for (uint32_t step = 0; step < step_count; step++)
    {
        const uint32_t size{ SizeAtStep(sizes, step) };
        std::vector<std::string> lines{ WrapText(text, font, size, box.width) };
        const int32_t height{ ParagraphHeight(lines.size(), font, size, line_spacing) };
        if (height <= box.height)
        {
            return FittedParagraph{ std::move(lines), size, height };
        }
    }

    std::vector<std::string> lines{ WrapText(text, font, sizes.m_Min, box.width) };
    if (policy == OverflowPolicy::Overflow)
    {
        const int32_t height{ ParagraphHeight(lines.size(), font, sizes.m_Min, line_spacing) };
        return FittedParagraph{ std::move(lines), sizes.m_Min, height, true };
    }

    size_t kept{ lines.size() };
    while (kept > 0 && ParagraphHeight(kept, font, sizes.m_Min, line_spacing) > box.height)
    {
        kept--;
    }
    lines.resize(kept);

    if (!lines.empty())
    {
        std::string& last_line{ lines.back() };
        TrimTrailingWhitespace(last_line);
        std::string with_ellipsis{ last_line };
        with_ellipsis += c_Ellipsis;
        last_line = font.MeasureWidth(with_ellipsis, sizes.m_Min) <= box.width
                        ? std::move(with_ellipsis)
                        : TruncateToWidth(std::move(last_line), font, sizes.m_Min, box.width);
    }

    const int32_t height{ ParagraphHeight(lines.size(), font, sizes.m_Min, line_spacing) };
    return FittedParagraph{ std::move(lines), sizes.m_Min, height, true };
}

std::string TypeLineText(const CardRecord& record)
{
    std::string type_line{ record.m_Type == CardType::Creature ? "Creature" : "Spell" };
    if (record.m_Subtype.has_value())
    {
        type_line += " — ";
        type_line += record.m_Subtype.value();
    }
    return type_line;
}

std::vector<std::string> ParseCost(std::string_view cost)
{
    std::vector<std::string> tokens;
    size_t i{ 0 };
    while (i < cost.size())
    {
        if (cost[i] == '{')
        {
            const size_t close{ cost.find('}', i) };
            if (close != std::string_view::npos)
            {
                tokens.emplace_back(cost.substr(i, close - i + 1));
                i = close + 1;
                continue;
            }
        }

        if (std::isspace(static_cast<unsigned char>(cost[i])))
        {
            i++;
            continue;
        }

        const size_t start{ i };
        NextCodePoint(cost, i);
        tokens.emplace_back(cost.substr(start, i - start));
    }
    return tokens;
}

std::optional<std::string_view> CostSymbolGlyph(std::string_view token)
{
    // Symbol fonts draw mana symbols in place of these characters
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 31> c_SymbolGlyphs{ {
        { "0", "0" },
        { "1", "1" },
        { "2", "2" },
        { "3", "3" },
        { "4", "4" },
        { "5", "5" },
        { "6", "6" },
        { "7", "7" },
        { "8", "8" },
        { "9", "9" },
        { "10", "10" },
        { "11", "11" },
        { "12", "12" },
        { "13", "13" },
        { "14", "14" },
        { "15", "15" },
        { "16", "16" },
        { "20", "20" },
        { "W", "W" },
        { "U", "U" },
        { "B", "B" },
        { "R", "R" },
        { "G", "G" },
        { "C", "C" },
        { "S", "S" },
        { "X", "X" },
        { "Y", "Y" },
        { "Z", "Z" },
        { "T", "T" },
        { "E", "E" },
        { "P", "P" },
    } };

    if (token.starts_with('{') && token.ends_with('}') && token.size() >= 2)
    {
        token = token.substr(1, token.size() - 2);
    }

    const std::string key{ ToUpperAscii(token) };
    const auto it{ std::ranges::find(c_SymbolGlyphs, std::string_view{ key }, &std::pair<std::string_view, std::string_view>::first) };
    if (it == c_SymbolGlyphs.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Font& FontFor(const FontSet& fonts, FontRole role)
{
    switch (role)
    {
    case FontRole::Title:
        return *fonts.m_Title;
    case FontRole::Symbol:
        return *fonts.m_Symbol;
    case FontRole::Body:
    default:
        return *fonts.m_Body;
    }
}

CostRun LayoutCost(std::string_view cost,
                   const FontSet& fonts,
                   const cv::Rect& box,
                   const FontSizeRange& sizes,
                   OverflowPolicy policy)
{
    struct CostToken
    {
        std::string m_Text;
        FontRole m_Font;
    };

    std::vector<CostToken> tokens;
    for (std::string& token : ParseCost(cost))
    {
        if (const auto glyph{ CostSymbolGlyph(token) })
        {
            tokens.push_back({ std::string{ glyph.value() }, FontRole::Symbol });
        }
        else
        {
            tokens.push_back({ std::move(token), FontRole::Body });
        }
    }

    const auto measure_tokens{
        [&](size_t count, uint32_t size)
        {
            int32_t width{ 0 };
            for (size_t i = 0; i < count; i++)
            {
                width += FontFor(fonts, tokens[i].m_Font).MeasureWidth(tokens[i].m_Text, size);
            }
            return width;
        }
    };

    size_t kept{ tokens.size() };
    uint32_t size{ sizes.m_Min };
    bool fitted{ false };
    const uint32_t step_count{ sizes.StepCount() };
    for (uint32_t step = 0; step < step_count; step++)
    {
        size = SizeAtStep(sizes, step);
        if (measure_tokens(kept, size) <= box.width)
        {
            fitted = true;
            break;
        }
    }

    if (!fitted && policy == OverflowPolicy::Truncate)
    {
        while (kept > 0 && measure_tokens(kept, size) > box.width)
        {
            kept--;
        }
    }

    CostRun run{
        .m_Glyphs{},
        .m_Size = size,
        .m_Width = measure_tokens(kept, size),
        .m_Truncated = !fitted,
    };

    const int32_t baseline{ CenteredBaseline(box, fonts.m_Symbol->Metrics(size)) };
    int32_t x{ box.x + box.width - run.m_Width };
    for (size_t i = 0; i < kept; i++)
    {
        const int32_t width{ FontFor(fonts, tokens[i].m_Font).MeasureWidth(tokens[i].m_Text, size) };
        run.m_Glyphs.push_back(PlacedText{
            .m_Text = std::move(tokens[i].m_Text),
            .m_Font = tokens[i].m_Font,
            .m_Size = size,
            .m_Origin = cv::Point{ x, baseline },
            .m_Width = width,
        });
        x += width;
    }

    return run;
}

CardLayout LayoutCard(const CardRecord& record,
                      const FontSet& fonts,
                      const CardTemplate& card_template,
                      const LayoutOptions& options)
{
    const OverflowPolicy policy{ options.m_OverflowPolicy };
    std::vector<std::string> overflows;

    const std::string title_text{ options.m_TitleUppercase ? ToUpperAscii(record.m_Name) : record.m_Name };
    FittedLine title{ FitSingleLine(title_text, *fonts.m_Title, card_template.m_TitleBox.width, card_template.m_TitleSizes, policy) };
    if (title.m_Truncated)
    {
        overflows.push_back("title");
    }

    FittedLine type_line{ FitSingleLine(TypeLineText(record), *fonts.m_Title, card_template.m_TypeBox.width, card_template.m_TypeSizes, policy) };
    if (type_line.m_Truncated)
    {
        overflows.push_back("type line");
    }

    CostRun cost{ LayoutCost(record.m_Cost, fonts, card_template.m_CostBox, card_template.m_CostSizes, policy) };
    if (cost.m_Truncated)
    {
        overflows.push_back("cost");
    }

    const cv::Rect body_box{ card_template.BodyBox() };
    const FittedParagraph body{
        FitParagraph(record.m_Description, *fonts.m_Body, body_box.size(), card_template.m_BodySizes, card_template.m_BodyLineSpacing, policy),
    };
    if (body.m_Truncated)
    {
        overflows.push_back("body");
    }

    std::vector<PlacedText> body_lines;
    {
        const FontMetrics metrics{ fonts.m_Body->Metrics(body.m_Size) };
        int32_t baseline{ body_box.y + metrics.m_Ascent };
        for (const std::string& line : body.m_Lines)
        {
            body_lines.push_back(PlacedText{
                .m_Text = line,
                .m_Font = FontRole::Body,
                .m_Size = body.m_Size,
                .m_Origin = cv::Point{ body_box.x, baseline },
                .m_Width = fonts.m_Body->MeasureWidth(line, body.m_Size),
            });
            baseline += metrics.LineHeight() + card_template.m_BodyLineSpacing;
        }
    }

    std::optional<PlacedText> strength;
    if (record.m_Strength.has_value())
    {
        FittedLine strength_line{
            FitSingleLine(fmt::format("{}", record.m_Strength.value()), *fonts.m_Title, card_template.m_StrengthBox.width, card_template.m_StrengthSizes, policy),
        };
        if (strength_line.m_Truncated)
        {
            overflows.push_back("strength");
        }
        strength = PlaceLine(std::move(strength_line), FontRole::Title, *fonts.m_Title, card_template.m_StrengthBox, true);
    }

    return CardLayout{
        .m_Title = PlaceLine(std::move(title), FontRole::Title, *fonts.m_Title, card_template.m_TitleBox, false),
        .m_TypeLine = PlaceLine(std::move(type_line), FontRole::Title, *fonts.m_Title, card_template.m_TypeBox, false),
        .m_Cost = std::move(cost),
        .m_Body = std::move(body_lines),
        .m_Strength = std::move(strength),
        .m_Overflows = std::move(overflows),
    };
}
