/*
 * linebreaker.cpp — Greedy line breaking over styled words
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linebreaker.h"
#include "textmeasurer.h"

#include <QDebug>

#include <algorithm>
#include <optional>

namespace LineBreaking {

static constexpr qreal kFitEpsilon = 1e-6;
static const QString kHyphen = QStringLiteral("-");

qreal Word::width() const
{
    qreal w = 0;
    for (const auto &f : fragments)
        w += f.width;
    return w;
}

QString Word::text() const
{
    QString t;
    for (const auto &f : fragments)
        t += f.text;
    return t;
}

Style Word::leadStyle() const
{
    return fragments.isEmpty() ? spaceStyle : fragments.first().style;
}

int Line::gapCount() const
{
    int gaps = 0;
    for (int i = 0; i + 1 < words.size(); ++i) {
        if (words[i].word.spaceWidth > 0)
            ++gaps;
    }
    return gaps;
}

// --- Word collection ---

bool collectWords(const QList<StyledString> &runs, const Style &base,
                  TextMeasurer *measurer, QList<Word> *words,
                  Layout::LayoutError *error)
{
    words->clear();

    QString text;
    QList<int> runEnds;
    QList<Style> styles;
    for (const auto &run : runs) {
        text += run.text;
        runEnds.append(text.length());
        styles.append(Style::merge(base, run.style));
    }
    if (text.isEmpty())
        return true;

    auto runAt = [&runEnds](int pos) {
        return int(std::upper_bound(runEnds.cbegin(), runEnds.cend(), pos) - runEnds.cbegin());
    };

    const QList<TextSegment> segments = TextMeasurer::segment(text);
    for (const auto &seg : segments) {
        Word w;
        int pos = seg.start;
        const int end = seg.start + seg.length;
        while (pos < end) {
            const int r = runAt(pos);
            const int chunkEnd = qMin(end, runEnds[r]);
            Fragment f;
            f.text = text.mid(pos, chunkEnd - pos);
            f.style = styles[r];
            f.runIndex = r;
            if (!measurer->measure(f.text, f.style, &f.width, error))
                return false;
            w.fragments.append(f);
            pos = chunkEnd;
        }

        if (seg.spaceLength > 0) {
            const int r = runAt(end);
            w.space = text.mid(end, seg.spaceLength);
            w.spaceStyle = styles[r];
            w.spaceRunIndex = r;
            const bool hasBlank = std::any_of(w.space.cbegin(), w.space.cend(), [](QChar c) {
                return c != QLatin1Char('\n') && c != QLatin1Char('\r')
                    && c.unicode() != 0x2028 && c.unicode() != 0x2029;
            });
            if (hasBlank && !seg.hardBreak
                && !measurer->measure(QStringLiteral(" "), w.spaceStyle, &w.spaceWidth, error))
                return false;
        } else if (!w.fragments.isEmpty()) {
            w.spaceStyle = w.fragments.last().style;
        }
        w.hardBreak = seg.hardBreak;

        // Leading blanks of the paragraph carry nothing to draw.
        if (w.fragments.isEmpty() && !w.hardBreak)
            continue;
        words->append(w);
    }
    return true;
}

// --- Splitting ---

// Cut word at character offset; head gets no trailing space.
static bool splitWord(const Word &word, int offset, TextMeasurer *measurer,
                      Word *head, Word *tail, Layout::LayoutError *error)
{
    *head = Word();
    *tail = word;
    tail->fragments.clear();

    int consumed = 0;
    for (const auto &f : word.fragments) {
        const int fEnd = consumed + f.text.length();
        if (fEnd <= offset) {
            head->fragments.append(f);
        } else if (consumed >= offset) {
            tail->fragments.append(f);
        } else {
            Fragment a = f;
            Fragment b = f;
            a.text = f.text.left(offset - consumed);
            b.text = f.text.mid(offset - consumed);
            if (!measurer->measure(a.text, a.style, &a.width, error)
                || !measurer->measure(b.text, b.style, &b.width, error))
                return false;
            head->fragments.append(a);
            tail->fragments.append(b);
        }
        consumed = fEnd;
    }
    head->spaceStyle = head->fragments.isEmpty() ? word.spaceStyle
                                                 : head->fragments.last().style;
    return true;
}

// Longest hyphenated prefix of word that fits in room (hyphen included).
static bool hyphenateInto(const Word &word, qreal room, TextMeasurer *measurer,
                          bool *found, Word *head, Word *tail, qreal *hyphenWidth,
                          Layout::LayoutError *error)
{
    *found = false;
    if (word.isEmpty() || !measurer->hyphenationEnabled(word.leadStyle()))
        return true;

    QList<int> offsets;
    if (!measurer->breakCandidates(word.text(), word.leadStyle(), &offsets, error))
        return false;

    for (int i = offsets.size() - 1; i >= 0; --i) {
        Word h, t;
        if (!splitWord(word, offsets[i], measurer, &h, &t, error))
            return false;
        qreal hw = 0;
        if (!measurer->measure(kHyphen, h.fragments.last().style, &hw, error))
            return false;
        // A prefix that exactly fills the room is accepted.
        if (h.width() + hw <= room + kFitEpsilon) {
            *head = h;
            *tail = t;
            *hyphenWidth = hw;
            *found = true;
            return true;
        }
    }
    return true;
}

static bool finalizeLine(Line &line, TextMeasurer *measurer, Layout::LayoutError *error)
{
    auto account = [&](const Style &style) {
        FontLineMetrics m;
        if (!measurer->lineMetrics(style, &m, error))
            return false;
        line.ascent = qMax(line.ascent, m.ascent);
        line.descent = qMax(line.descent, m.descent);
        line.height = qMax(line.height, style.lineHeight());
        return true;
    };

    for (const auto &pw : std::as_const(line.words)) {
        if (pw.word.isEmpty()) {
            if (!account(pw.word.spaceStyle))
                return false;
            continue;
        }
        for (const auto &f : pw.word.fragments) {
            if (!account(f.style))
                return false;
        }
    }
    return true;
}

// --- Greedy breaking ---

bool breakLines(const QList<Word> &words, qreal maxWidth, TextMeasurer *measurer,
                QList<Line> *lines, Layout::LayoutError *error)
{
    lines->clear();

    Line current;
    qreal x = 0;
    qreal pendingGap = 0;

    auto place = [&](const Word &w, bool hyphen, qreal hyphenWidth) {
        if (!current.words.isEmpty())
            x += pendingGap;
        current.words.append(PlacedWord{w, x, hyphen, hyphenWidth});
        x += w.width() + hyphenWidth;
        current.width = x;
        pendingGap = w.spaceWidth;
    };

    auto finish = [&](bool hard) {
        if (!finalizeLine(current, measurer, error))
            return false;
        current.hardBreak = hard;
        lines->append(current);
        current = Line();
        x = 0;
        pendingGap = 0;
        return true;
    };

    int next = 0;
    std::optional<Word> carry;
    while (carry || next < words.size()) {
        Word w = carry ? *carry : words[next++];
        carry.reset();

        if (current.words.isEmpty()) {
            if (w.width() <= maxWidth + kFitEpsilon) {
                place(w, false, 0);
                if (w.hardBreak && !finish(true))
                    return false;
                continue;
            }

            bool found = false;
            Word head, tail;
            qreal hw = 0;
            if (!hyphenateInto(w, maxWidth, measurer, &found, &head, &tail, &hw, error))
                return false;
            if (found) {
                place(head, true, hw);
                if (!finish(false))
                    return false;
                carry = tail;
                continue;
            }

            // Nothing fits: the word goes alone and overflows.
            place(w, false, 0);
            current.overflow = true;
            if (!finish(w.hardBreak))
                return false;
            continue;
        }

        if (x + pendingGap + w.width() <= maxWidth + kFitEpsilon) {
            place(w, false, 0);
            if (w.hardBreak && !finish(true))
                return false;
            continue;
        }

        bool found = false;
        Word head, tail;
        qreal hw = 0;
        if (!hyphenateInto(w, maxWidth - x - pendingGap, measurer, &found, &head, &tail, &hw, error))
            return false;
        if (found) {
            place(head, true, hw);
            if (!finish(false))
                return false;
            carry = tail;
            continue;
        }

        if (!finish(false))
            return false;
        carry = w;
    }

    if (!current.words.isEmpty() && !finish(false))
        return false;
    return true;
}

// --- Remainder reconstruction ---

QList<StyledString> toRuns(const QList<Word> &words, const QList<StyledString> &sourceRuns)
{
    QList<StyledString> runs;
    int lastRun = -1;

    auto append = [&](const QString &text, int runIndex) {
        if (text.isEmpty())
            return;
        if (runIndex == lastRun && !runs.isEmpty()) {
            runs.last().text += text;
            return;
        }
        const Style style = (runIndex >= 0 && runIndex < sourceRuns.size())
            ? sourceRuns[runIndex].style : Style();
        runs.append(StyledString{text, style});
        lastRun = runIndex;
    };

    for (const auto &w : words) {
        for (const auto &f : w.fragments)
            append(f.text, f.runIndex);
        append(w.space, w.spaceRunIndex);
    }
    return runs;
}

} // namespace LineBreaking
