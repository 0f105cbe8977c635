#include <catch2/catch_test_macros.hpp>

#include <pcr/card/card_record.hpp>
#include <pcr/layout/card_template.hpp>
#include <pcr/layout/text_layout.hpp>

#include <pcr/errors.hpp>

#include "stub_font.hpp"
#include "test_assets.hpp"

const StubFont g_Font{};
const FontSizeRange g_Sizes{ 40, 20, 4 };

TEST_CASE("Shrink range step count", "[layout_step_count]")
{
    REQUIRE(FontSizeRange{ 40, 20, 4 }.StepCount() == 6);
    REQUIRE(FontSizeRange{ 40, 20, 6 }.StepCount() == 5);
    REQUIRE(FontSizeRange{ 20, 20, 2 }.StepCount() == 1);
}

TEST_CASE("Single line keeps the start size when it fits", "[layout_single_line_fits]")
{
    // 5 glyphs at 40 are 100 wide
    const FittedLine line{ FitSingleLine("Hello", g_Font, 100, g_Sizes, OverflowPolicy::Truncate) };
    REQUIRE(line.m_Size == 40);
    REQUIRE(line.m_Width == 100);
    REQUIRE(line.m_Text == "Hello");
    REQUIRE(!line.m_Truncated);
}

TEST_CASE("Single line shrinks until it fits", "[layout_single_line_shrink]")
{
    // 5 glyphs at 32 are 80 wide
    const FittedLine line{ FitSingleLine("Hello", g_Font, 85, g_Sizes, OverflowPolicy::Truncate) };
    REQUIRE(line.m_Size == 32);
    REQUIRE(line.m_Width <= 85);
    REQUIRE(!line.m_Truncated);
}

TEST_CASE("Single line never goes below the floor", "[layout_single_line_floor]")
{
    const std::string text{ "A rather long title for a small box" };

    const FittedLine truncated{ FitSingleLine(text, g_Font, 100, g_Sizes, OverflowPolicy::Truncate) };
    REQUIRE(truncated.m_Size == g_Sizes.m_Min);
    REQUIRE(truncated.m_Truncated);
    REQUIRE(truncated.m_Width <= 100);
    REQUIRE(truncated.m_Text.ends_with("..."));
    REQUIRE(truncated.m_Text == "A rathe...");

    const FittedLine overflowing{ FitSingleLine(text, g_Font, 100, g_Sizes, OverflowPolicy::Overflow) };
    REQUIRE(overflowing.m_Size == g_Sizes.m_Min);
    REQUIRE(overflowing.m_Truncated);
    REQUIRE(overflowing.m_Text == text);
    REQUIRE(overflowing.m_Width > 100);
}

TEST_CASE("Wrapped lines never exceed the box", "[layout_wrap_width]")
{
    const std::string text{
        "Whenever Test Bear attacks, it gets +1/+0 until end of turn.\n"
        "Supercalifragilisticexpialidocious bears are rare.\n"
        "\n"
        "Flavor: they hibernate."
    };

    // Widest glyph at size 20 is 10 wide
    for (int32_t box_width = 10; box_width <= 400; box_width += 7)
    {
        const std::vector<std::string> lines{ WrapText(text, g_Font, 20, box_width) };
        REQUIRE(!lines.empty());
        for (const std::string& line : lines)
        {
            REQUIRE(g_Font.MeasureWidth(line, 20) <= box_width);
        }
    }
}

TEST_CASE("Wrap keeps paragraphs and breaks long words", "[layout_wrap_paragraphs]")
{
    const std::vector<std::string> lines{ WrapText("aa bb cc\ndddddddd", g_Font, 20, 50) };
    const std::vector<std::string> expected{ "aa bb", "cc", "ddddd", "ddd" };
    REQUIRE(lines == expected);

    REQUIRE(WrapText("", g_Font, 20, 50).empty());
}

TEST_CASE("Paragraph shrinks to fit the box height", "[layout_paragraph_shrink]")
{
    const std::string text{ "one two three four five six seven eight nine ten" };
    const FittedParagraph paragraph{ FitParagraph(text, g_Font, cv::Size{ 200, 120 }, g_Sizes, 4, OverflowPolicy::Truncate) };
    REQUIRE(!paragraph.m_Truncated);
    REQUIRE(paragraph.m_Size >= g_Sizes.m_Min);
    REQUIRE(paragraph.m_Height <= 120);
    REQUIRE(paragraph.m_Height == ParagraphHeight(paragraph.m_Lines.size(), g_Font, paragraph.m_Size, 4));
}

TEST_CASE("Paragraph that does not fit at the floor is truncated", "[layout_paragraph_truncate]")
{
    std::string text;
    for (int i = 0; i < 50; i++)
    {
        text += "word ";
    }

    const cv::Size box{ 200, 70 };
    const FittedParagraph truncated{ FitParagraph(text, g_Font, box, g_Sizes, 4, OverflowPolicy::Truncate) };
    REQUIRE(truncated.m_Truncated);
    REQUIRE(truncated.m_Size == g_Sizes.m_Min);
    REQUIRE(truncated.m_Height <= box.height);
    REQUIRE(!truncated.m_Lines.empty());
    REQUIRE(truncated.m_Lines.back().ends_with("..."));
    for (const std::string& line : truncated.m_Lines)
    {
        REQUIRE(g_Font.MeasureWidth(line, g_Sizes.m_Min) <= box.width);
    }

    const FittedParagraph overflowing{ FitParagraph(text, g_Font, box, g_Sizes, 4, OverflowPolicy::Overflow) };
    REQUIRE(overflowing.m_Truncated);
    REQUIRE(overflowing.m_Size == g_Sizes.m_Min);
    REQUIRE(overflowing.m_Height > box.height);
}

TEST_CASE("Type line joins type and subtype", "[layout_type_line]")
{
    CardRecord record{ ParseCardRecord(TestBearRow()) };
    REQUIRE(TypeLineText(record) == "Creature — Bear");

    record.m_Subtype.reset();
    REQUIRE(TypeLineText(record) == "Creature");
}

TEST_CASE("Parse cost tokens", "[layout_cost_parse]")
{
    const std::vector<std::string> expected{ "{2}", "{R}", "{Q}", "X", "{10}" };
    REQUIRE(ParseCost("{2}{R}{Q} X{10}") == expected);
    REQUIRE(ParseCost("").empty());

    REQUIRE(CostSymbolGlyph("{g}") == "G");
    REQUIRE(CostSymbolGlyph("{10}") == "10");
    REQUIRE(CostSymbolGlyph("X") == "X");
    REQUIRE(!CostSymbolGlyph("{Q}").has_value());
}

TEST_CASE("Cost is right aligned and unknown symbols use the body font", "[layout_cost]")
{
    const FontSet fonts{ MakeStubFontSet() };
    const cv::Rect box{ 100, 10, 200, 60 };
    const CostRun run{ LayoutCost("{1}{G}{Q}", fonts, box, g_Sizes, OverflowPolicy::Truncate) };

    REQUIRE(run.m_Glyphs.size() == 3);
    REQUIRE(!run.m_Truncated);
    REQUIRE(run.m_Glyphs[0].m_Font == FontRole::Symbol);
    REQUIRE(run.m_Glyphs[1].m_Font == FontRole::Symbol);
    REQUIRE(run.m_Glyphs[2].m_Font == FontRole::Body);
    REQUIRE(run.m_Glyphs[2].m_Text == "{Q}");

    const PlacedText& last{ run.m_Glyphs.back() };
    REQUIRE(last.m_Origin.x + last.m_Width == box.x + box.width);
    REQUIRE(run.m_Glyphs.front().m_Origin.x >= box.x);
}

TEST_CASE("Layout is deterministic", "[layout_deterministic]")
{
    const FontSet fonts{ MakeStubFontSet() };
    const CardRecord record{ ParseCardRecord(TestBearRow()) };
    const CardTemplate card_template{};
    const LayoutOptions options{};

    const CardLayout first{ LayoutCard(record, fonts, card_template, options) };
    const CardLayout second{ LayoutCard(record, fonts, card_template, options) };

    REQUIRE(first.m_Title.m_Text == second.m_Title.m_Text);
    REQUIRE(first.m_Title.m_Size == second.m_Title.m_Size);
    REQUIRE(first.m_Body.size() == second.m_Body.size());
    for (size_t i = 0; i < first.m_Body.size(); i++)
    {
        REQUIRE(first.m_Body[i].m_Text == second.m_Body[i].m_Text);
        REQUIRE(first.m_Body[i].m_Size == second.m_Body[i].m_Size);
        REQUIRE(first.m_Body[i].m_Origin == second.m_Body[i].m_Origin);
    }

    REQUIRE(first.m_Title.m_Text == "TEST BEAR");
    REQUIRE(first.m_TypeLine.m_Text == "Creature — Bear");
    REQUIRE(first.m_Strength.has_value());
    REQUIRE(first.m_Strength->m_Text == "2");
    REQUIRE(first.m_Overflows.empty());
}

TEST_CASE("Layout reports regions that overflow", "[layout_overflow]")
{
    const FontSet fonts{ MakeStubFontSet() };
    CardRecord record{ ParseCardRecord(TestBearRow()) };
    record.m_Name = std::string(200, 'B');

    const CardLayout layout{ LayoutCard(record, fonts, CardTemplate{}, LayoutOptions{}) };
    REQUIRE(layout.m_Overflows == std::vector<std::string>{ "title" });
    REQUIRE(layout.m_Title.m_Width <= CardTemplate{}.m_TitleBox.width);
}

TEST_CASE("Default template is valid", "[template_valid]")
{
    REQUIRE_NOTHROW(CardTemplate{}.Validate());
}

TEST_CASE("Overlapping template is rejected", "[template_invalid]")
{
    CardTemplate overlapping{};
    overlapping.m_CostBox = overlapping.m_TitleBox;
    REQUIRE_THROWS_AS(overlapping.Validate(), TemplateError);

    CardTemplate outside{};
    outside.m_StrengthBox.x = outside.m_CanvasSize.width - 10;
    REQUIRE_THROWS_AS(outside.Validate(), TemplateError);

    CardTemplate bad_sizes{};
    bad_sizes.m_BodySizes.m_Min = 0;
    REQUIRE_THROWS_AS(bad_sizes.Validate(), TemplateError);
}
