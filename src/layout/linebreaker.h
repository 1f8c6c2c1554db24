/*
 * linebreaker.h — Greedy line breaking over styled words
 *
 * Text runs are segmented at UAX #14 break opportunities into words;
 * each word is a list of fragments (one per style run it touches) plus
 * the whitespace that follows it.  Lines are filled first-fit: a word
 * goes on the current line if it fits after a single inter-word space,
 * otherwise it is hyphenated into the remaining room when the style
 * allows it, or moved to the next line.  A word wider than an empty
 * line is hyphenated if possible and otherwise placed alone, flagged
 * as overflowing.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
#ifndef FOLIO_LINEBREAKER_H
#define FOLIO_LINEBREAKER_H

#include <QList>
#include <QString>

#include "layouterror.h"
#include "style.h"

class TextMeasurer;

namespace LineBreaking {

struct Fragment {
    QString text;
    Style style;        // fully resolved
    int runIndex = -1;  // source run
    qreal width = 0;
};

struct Word {
    QList<Fragment> fragments;
    QString space;          // raw trailing whitespace, may contain '\n'
    Style spaceStyle;
    int spaceRunIndex = -1;
    qreal spaceWidth = 0;   // width of one space; 0 when not followed by a space
    bool hardBreak = false; // a line separator follows

    qreal width() const;
    QString text() const;
    bool isEmpty() const { return fragments.isEmpty(); }
    // Style used for hyphenation decisions and the hyphen glyph
    Style leadStyle() const;
};

struct PlacedWord {
    Word word;
    qreal x = 0;
    bool hyphen = false;    // a hyphen glyph is drawn after the word
    qreal hyphenWidth = 0;
};

struct Line {
    QList<PlacedWord> words;
    qreal width = 0;        // trailing whitespace excluded
    qreal ascent = 0;
    qreal descent = 0;
    qreal height = 0;       // max(size * line-spacing) over the line
    bool overflow = false;  // holds a word wider than the line
    bool hardBreak = false; // ended by a line separator

    qreal baseline() const { return ascent; }
    int gapCount() const;
};

// Segment and measure runs; run styles are merged onto base.
bool collectWords(const QList<StyledString> &runs, const Style &base,
                  TextMeasurer *measurer, QList<Word> *words,
                  Layout::LayoutError *error);

bool breakLines(const QList<Word> &words, qreal maxWidth, TextMeasurer *measurer,
                QList<Line> *lines, Layout::LayoutError *error);

// Rebuild source runs (with the original, unmerged run styles) that
// reproduce the given words.
QList<StyledString> toRuns(const QList<Word> &words, const QList<StyledString> &sourceRuns);

} // namespace LineBreaking

#endif // FOLIO_LINEBREAKER_H
