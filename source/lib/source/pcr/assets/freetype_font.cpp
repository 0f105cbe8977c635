#include <pcr/assets/freetype_font.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <system_error>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <pcr/config.hpp>
#include <pcr/errors.hpp>
#include <pcr/util/log.hpp>
#include <pcr/util/utf8.hpp>

namespace
{
FT_Library FreeTypeLibrary()
{
    static struct FreeTypeLib
    {
        FT_Library m_Lib{ nullptr };
        FreeTypeLib()
        {
            if (FT_Init_FreeType(&m_Lib) != 0)
            {
                m_Lib = nullptr;
            }
        }
        ~FreeTypeLib()
        {
            if (m_Lib != nullptr)
            {
                FT_Done_FreeType(m_Lib);
            }
        }
    } s_Instance;
    return s_Instance.m_Lib;
}
} // namespace

struct FreeTypeFont::FaceImpl
{
    std::string m_Name;
    FT_Face m_Face{ nullptr };

    // Setting the pixel size mutates the face
    std::mutex m_Mutex;

    ~FaceImpl()
    {
        if (m_Face != nullptr)
        {
            FT_Done_Face(m_Face);
        }
    }

    bool SetSize(uint32_t size)
    {
        return FT_Set_Pixel_Sizes(m_Face, 0, size) == 0;
    }

    // Loads the glyph for a code point into the glyph slot, falls back to the missing glyph
    bool LoadGlyph(char32_t code_point, FT_Int32 flags)
    {
        const FT_UInt glyph_index{ FT_Get_Char_Index(m_Face, static_cast<FT_ULong>(code_point)) };
        return FT_Load_Glyph(m_Face, glyph_index, flags) == 0;
    }
};

FreeTypeFont::FreeTypeFont(const fs::path& font_path)
    : m_Impl{ std::make_unique<FaceImpl>() }
{
    FT_Library library{ FreeTypeLibrary() };
    if (library == nullptr)
    {
        throw AssetNotFoundError{ "font", font_path };
    }

    std::error_code error;
    if (!fs::is_regular_file(font_path, error) || FT_New_Face(library, font_path.string().c_str(), 0, &m_Impl->m_Face) != 0)
    {
        m_Impl->m_Face = nullptr;
        throw AssetNotFoundError{ "font", font_path };
    }

    m_Impl->m_Name = font_path.filename().string();
    LogInfo("Loaded font {} ({})", m_Impl->m_Name, m_Impl->m_Face->family_name != nullptr ? m_Impl->m_Face->family_name : "unnamed");
}

FreeTypeFont::~FreeTypeFont() = default;

std::string_view FreeTypeFont::Name() const
{
    return m_Impl->m_Name;
}

int32_t FreeTypeFont::MeasureWidth(std::string_view text, uint32_t size) const
{
    std::lock_guard lock{ m_Impl->m_Mutex };
    if (!m_Impl->SetSize(size))
    {
        return 0;
    }

    int32_t width{ 0 };
    for (size_t i = 0; i < text.size();)
    {
        const char32_t code_point{ NextCodePoint(text, i) };
        if (m_Impl->LoadGlyph(code_point, FT_LOAD_DEFAULT))
        {
            width += static_cast<int32_t>(m_Impl->m_Face->glyph->advance.x >> 6);
        }
    }
    return width;
}

FontMetrics FreeTypeFont::Metrics(uint32_t size) const
{
    std::lock_guard lock{ m_Impl->m_Mutex };
    if (!m_Impl->SetSize(size))
    {
        return FontMetrics{ static_cast<int32_t>(size), 0 };
    }

    const FT_Size_Metrics& metrics{ m_Impl->m_Face->size->metrics };
    return FontMetrics{
        static_cast<int32_t>(metrics.ascender >> 6),
        static_cast<int32_t>(-metrics.descender >> 6),
    };
}

void FreeTypeFont::Draw(cv::Mat& coverage, std::string_view text, cv::Point origin, uint32_t size) const
{
    std::lock_guard lock{ m_Impl->m_Mutex };
    if (coverage.type() != CV_8UC1 || !m_Impl->SetSize(size))
    {
        return;
    }

    int32_t pen_x{ origin.x };
    for (size_t i = 0; i < text.size();)
    {
        const char32_t code_point{ NextCodePoint(text, i) };
        if (!m_Impl->LoadGlyph(code_point, FT_LOAD_RENDER))
        {
            continue;
        }

        const FT_GlyphSlot glyph{ m_Impl->m_Face->glyph };
        const FT_Bitmap& bitmap{ glyph->bitmap };
        const int32_t left{ pen_x + glyph->bitmap_left };
        const int32_t top{ origin.y - glyph->bitmap_top };
        for (uint32_t row = 0; row < bitmap.rows; row++)
        {
            const int32_t y{ top + static_cast<int32_t>(row) };
            if (y < 0 || y >= coverage.rows)
            {
                continue;
            }

            const unsigned char* src_row{ bitmap.buffer + static_cast<ptrdiff_t>(row) * bitmap.pitch };
            uchar* dst_row{ coverage.ptr<uchar>(y) };
            for (uint32_t col = 0; col < bitmap.width; col++)
            {
                const int32_t x{ left + static_cast<int32_t>(col) };
                if (x < 0 || x >= coverage.cols)
                {
                    continue;
                }

                const uchar value{
                    bitmap.pixel_mode == FT_PIXEL_MODE_MONO
                        ? static_cast<uchar>((src_row[col / 8] & (0x80 >> (col % 8))) != 0 ? 255 : 0)
                        : src_row[col],
                };
                dst_row[x] = std::max(dst_row[x], value);
            }
        }

        pen_x += static_cast<int32_t>(glyph->advance.x >> 6);
    }
}

FontSet LoadFontSet(const Config& config)
{
    return FontSet{
        .m_Title = std::make_shared<FreeTypeFont>(config.m_AssetDir / config.m_TitleFont),
        .m_Body = std::make_shared<FreeTypeFont>(config.m_AssetDir / config.m_BodyFont),
        .m_Symbol = std::make_shared<FreeTypeFont>(config.m_AssetDir / config.m_SymbolFont),
    };
}
