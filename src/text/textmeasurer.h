/*
 * textmeasurer.h — Text measurement and word segmentation
 *
 * Thin layer over the font-metrics and hyphenation collaborators:
 * resolves a Style to a font handle, sums per-codepoint advances,
 * reports line metrics, and returns hyphenation offsets.  Word
 * segmentation uses ICU's line BreakIterator so that break
 * opportunities follow UAX #14 (spaces, hyphens, CJK).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_TEXTMEASURER_H
#define FOLIO_TEXTMEASURER_H

#include <QHash>
#include <QList>
#include <QString>

#include "fontmetrics.h"
#include "layouterror.h"
#include "style.h"

class AbstractHyphenator;

// One break-delimited piece of a text: a word followed by the
// whitespace that ends it (possibly none, e.g. after "well-").
struct TextSegment {
    int start = 0;
    int length = 0;      // word characters, excluding trailing whitespace
    int spaceLength = 0; // trailing whitespace characters
    bool hardBreak = false; // trailing whitespace contains a line separator
};

class TextMeasurer
{
public:
    explicit TextMeasurer(FontMetrics *metrics, AbstractHyphenator *hyphenator = nullptr);

    FontMetrics *fontMetrics() const { return m_metrics; }
    AbstractHyphenator *hyphenator() const { return m_hyphenator; }

    // Advance width of text set in style, in points.
    bool measure(const QString &text, const Style &style, qreal *width,
                 Layout::LayoutError *error = nullptr);

    bool lineMetrics(const Style &style, FontLineMetrics *metrics,
                     Layout::LayoutError *error = nullptr);

    // Offsets (prefix lengths) where word may be hyphenated.  Empty when
    // the style has no language or no hyphenator is installed.
    bool breakCandidates(const QString &word, const Style &style, QList<int> *offsets,
                         Layout::LayoutError *error = nullptr);

    bool hyphenationEnabled(const Style &style) const
    {
        return m_hyphenator && !style.language().isEmpty();
    }

    static QList<TextSegment> segment(const QString &text);

private:
    FontHandle fontFor(const Style &style, Layout::LayoutError *error);

    FontMetrics *m_metrics = nullptr;
    AbstractHyphenator *m_hyphenator = nullptr;
    QHash<QString, FontHandle> m_fonts; // "family|bold|italic" -> handle
};

#endif // FOLIO_TEXTMEASURER_H
