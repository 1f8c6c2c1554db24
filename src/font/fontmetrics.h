/*
 * fontmetrics.h — Font-metrics collaborator interface
 *
 * The layout core never opens font files itself.  It resolves a
 * family/weight/slant triple to an opaque handle and then asks for
 * per-codepoint advances and line metrics through this interface.
 * FontManager is the FreeType/fontconfig implementation; tests plug in
 * a fixed-advance fake.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FONTMETRICS_H
#define FOLIO_FONTMETRICS_H

#include <QString>

struct FontHandle {
    int id = -1;

    bool isValid() const { return id >= 0; }
    bool operator==(const FontHandle &o) const { return id == o.id; }
    bool operator!=(const FontHandle &o) const { return id != o.id; }
};

// Vertical metrics in points at a given size
struct FontLineMetrics {
    qreal ascent = 0;
    qreal descent = 0; // positive, below the baseline
};

class FontMetrics
{
public:
    virtual ~FontMetrics() = default;

    // Returns an invalid handle when nothing matches.
    virtual FontHandle resolveFont(const QString &family, bool bold, bool italic) = 0;

    // Advance width of a single codepoint, in points.
    virtual bool glyphWidth(FontHandle font, uint codepoint, qreal sizePoints,
                            qreal *width) const = 0;

    virtual bool lineMetrics(FontHandle font, qreal sizePoints,
                             FontLineMetrics *metrics) const = 0;

    // Last failure reason, if any.
    virtual QString errorString() const { return QString(); }
};

#endif // FOLIO_FONTMETRICS_H
