/*
 * fontmanager.h — Font resolution and glyph metrics
 *
 * Uses fontconfig to map a family/weight/slant request onto a font file
 * and FreeType to read advances and vertical metrics from it.  Advances
 * are read unhinted in font units and scaled linearly, so the widths
 * are identical for identical inputs regardless of render resolution.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FONTMANAGER_H
#define FOLIO_FONTMANAGER_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "fontmetrics.h"

struct FontKey {
    QString family;
    bool bold;
    bool italic;

    bool operator==(const FontKey &o) const
    {
        return family == o.family && bold == o.bold && italic == o.italic;
    }
};

inline size_t qHash(const FontKey &k, size_t seed = 0)
{
    return qHash(k.family, seed) ^ qHash(k.bold, seed) ^ (qHash(k.italic, seed) << 1);
}

struct FontFace {
    FT_Face ftFace = nullptr;
    QString filePath;
    QByteArray rawData; // kept alive for FreeType

    ~FontFace();
};

class FontManager : public FontMetrics
{
public:
    FontManager();
    ~FontManager() override;

    FontManager(const FontManager &) = delete;
    FontManager &operator=(const FontManager &) = delete;

    FontHandle resolveFont(const QString &family, bool bold, bool italic) override;
    bool glyphWidth(FontHandle font, uint codepoint, qreal sizePoints,
                    qreal *width) const override;
    bool lineMetrics(FontHandle font, qreal sizePoints,
                     FontLineMetrics *metrics) const override;
    QString errorString() const override { return m_errorString; }

    // Register a font file directly, bypassing fontconfig.
    FontHandle loadFontFromPath(const QString &family, bool bold, bool italic,
                                const QString &filePath);

    QString filePath(FontHandle font) const;

    // True for fontconfig aliases such as "sans-serif" that match any face.
    static bool isGenericFamily(const QString &family);

private:
    FontFace *face(FontHandle font) const;
    int loadFace(const QString &filePath);
    QString resolveFontPath(const QString &family, bool bold, bool italic) const;

    FT_Library m_ftLibrary = nullptr;
    QList<FontFace *> m_faces;          // owner; handle id indexes this list
    QHash<QString, int> m_facesByPath;
    QHash<FontKey, int> m_handles;
    mutable QString m_errorString;
};

#endif // FOLIO_FONTMANAGER_H
