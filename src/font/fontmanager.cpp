/*
 * fontmanager.cpp — Font resolution and glyph metrics
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"

#include <QDebug>
#include <QFile>
#include <QStringList>

#include <fontconfig/fontconfig.h>

FontFace::~FontFace()
{
    if (ftFace) {
        FT_Done_Face(ftFace);
        ftFace = nullptr;
    }
}

FontManager::FontManager()
{
    FT_Error err = FT_Init_FreeType(&m_ftLibrary);
    if (err) {
        qWarning() << "FontManager: Failed to initialize FreeType:" << err;
        m_ftLibrary = nullptr;
    }
}

FontManager::~FontManager()
{
    // Faces must go before the library that created them.
    qDeleteAll(m_faces);
    m_faces.clear();
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

// fontconfig aliases that stand for whatever face the configuration prefers
bool FontManager::isGenericFamily(const QString &family)
{
    static const QStringList aliases = {
        QStringLiteral("sans-serif"), QStringLiteral("sans"), QStringLiteral("serif"),
        QStringLiteral("monospace"), QStringLiteral("mono"), QStringLiteral("system-ui"),
        QStringLiteral("cursive"), QStringLiteral("fantasy"), QStringLiteral("emoji"),
    };
    return family.isEmpty() || aliases.contains(family.toLower());
}

QString FontManager::resolveFontPath(const QString &family, bool bold, bool italic) const
{
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config) {
        m_errorString = QStringLiteral("fontconfig could not be initialized");
        return {};
    }

    const QByteArray familyUtf8 = family.toUtf8();
    FcPattern *pat = FcPatternCreate();
    FcPatternAddString(pat, FC_FAMILY,
                       reinterpret_cast<const FcChar8 *>(familyUtf8.constData()));
    FcPatternAddInteger(pat, FC_WEIGHT, bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pat, FC_SLANT, italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN);

    FcConfigSubstitute(config, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    FcResult fcResult;
    FcPattern *match = FcFontMatch(config, pat, &fcResult);
    const bool matched = match != nullptr;
    QString path;
    if (matched) {
        // fontconfig always offers some face; only take it for the family asked for.
        QStringList offered;
        FcChar8 *name = nullptr;
        for (int i = 0; FcPatternGetString(match, FC_FAMILY, i, &name) == FcResultMatch; ++i)
            offered << QString::fromUtf8(reinterpret_cast<const char *>(name));

        bool found = isGenericFamily(family);
        for (const QString &f : std::as_const(offered))
            found = found || f.compare(family, Qt::CaseInsensitive) == 0;

        FcChar8 *file = nullptr;
        if (!found) {
            m_errorString = QStringLiteral("no font for family \"%1\" (fontconfig offered %2)")
                                .arg(family, offered.value(0, QStringLiteral("nothing")));
        } else if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
            path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        }
        FcPatternDestroy(match);
    }
    if (!matched)
        m_errorString = QStringLiteral("fontconfig found no match for \"%1\"").arg(family);
    else if (path.isEmpty() && m_errorString.isEmpty())
        m_errorString = QStringLiteral("fontconfig match for \"%1\" has no file").arg(family);
    FcPatternDestroy(pat);
    FcConfigDestroy(config);
    return path;
}

int FontManager::loadFace(const QString &filePath)
{
    auto it = m_facesByPath.constFind(filePath);
    if (it != m_facesByPath.constEnd())
        return it.value();

    if (!m_ftLibrary) {
        m_errorString = QStringLiteral("FreeType is not initialized");
        return -1;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = QStringLiteral("cannot open font file %1").arg(filePath);
        qWarning() << "FontManager: Cannot open font file:" << filePath;
        return -1;
    }

    auto *face = new FontFace;
    face->filePath = filePath;
    face->rawData = file.readAll();

    FT_Error err = FT_New_Memory_Face(
        m_ftLibrary,
        reinterpret_cast<const FT_Byte *>(face->rawData.constData()),
        face->rawData.size(),
        0,
        &face->ftFace);
    if (err) {
        m_errorString = QStringLiteral("FreeType error %1 loading %2").arg(err).arg(filePath);
        qWarning() << "FontManager: FreeType failed to load:" << filePath << "error:" << err;
        delete face;
        return -1;
    }

    m_faces.append(face);
    const int id = m_faces.size() - 1;
    m_facesByPath.insert(filePath, id);
    return id;
}

FontHandle FontManager::resolveFont(const QString &family, bool bold, bool italic)
{
    FontKey key{family, bold, italic};
    auto it = m_handles.constFind(key);
    if (it != m_handles.constEnd())
        return FontHandle{it.value()};

    m_errorString.clear();
    QString path = resolveFontPath(family, bold, italic);
    if (path.isEmpty()) {
        qWarning().noquote() << "FontManager: Could not resolve font:" << family << bold
                             << italic << m_errorString;
        return FontHandle();
    }

    const int id = loadFace(path);
    if (id < 0)
        return FontHandle();
    m_handles.insert(key, id);
    return FontHandle{id};
}

FontHandle FontManager::loadFontFromPath(const QString &family, bool bold, bool italic,
                                         const QString &filePath)
{
    const int id = loadFace(filePath);
    if (id < 0)
        return FontHandle();
    m_handles.insert(FontKey{family, bold, italic}, id);
    return FontHandle{id};
}

QString FontManager::filePath(FontHandle font) const
{
    FontFace *f = face(font);
    return f ? f->filePath : QString();
}

FontFace *FontManager::face(FontHandle font) const
{
    if (font.id < 0 || font.id >= m_faces.size())
        return nullptr;
    return m_faces.at(font.id);
}

// --- Metrics ---

static qreal ftUnitsToPoints(FT_Face face, FT_Long units, qreal sizePoints)
{
    if (!face || face->units_per_EM == 0)
        return 0;
    return static_cast<qreal>(units) * sizePoints / face->units_per_EM;
}

bool FontManager::glyphWidth(FontHandle font, uint codepoint, qreal sizePoints,
                             qreal *width) const
{
    FontFace *f = face(font);
    if (!f || !f->ftFace) {
        m_errorString = QStringLiteral("invalid font handle %1").arg(font.id);
        return false;
    }

    // Missing glyphs measure as .notdef (index 0), as they will be drawn.
    FT_UInt glyphIndex = FT_Get_Char_Index(f->ftFace, codepoint);
    FT_Error err = FT_Load_Glyph(f->ftFace, glyphIndex, FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP);
    if (err) {
        m_errorString = QStringLiteral("FreeType error %1 loading glyph U+%2")
                            .arg(err).arg(codepoint, 4, 16, QLatin1Char('0'));
        return false;
    }
    if (width)
        *width = ftUnitsToPoints(f->ftFace, f->ftFace->glyph->advance.x, sizePoints);
    return true;
}

bool FontManager::lineMetrics(FontHandle font, qreal sizePoints,
                              FontLineMetrics *metrics) const
{
    FontFace *f = face(font);
    if (!f || !f->ftFace) {
        m_errorString = QStringLiteral("invalid font handle %1").arg(font.id);
        return false;
    }
    if (metrics) {
        metrics->ascent = ftUnitsToPoints(f->ftFace, f->ftFace->ascender, sizePoints);
        // FreeType descent is negative; return as positive
        metrics->descent = -ftUnitsToPoints(f->ftFace, f->ftFace->descender, sizePoints);
    }
    return true;
}
