/*
 * textmeasurer.cpp — Text measurement and word segmentation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textmeasurer.h"
#include "hyphenator.h"

#include <QDebug>

#include <unicode/brkiter.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <memory>

TextMeasurer::TextMeasurer(FontMetrics *metrics, AbstractHyphenator *hyphenator)
    : m_metrics(metrics)
    , m_hyphenator(hyphenator)
{
}

FontHandle TextMeasurer::fontFor(const Style &style, Layout::LayoutError *error)
{
    const QString key = style.fontFamily() + QLatin1Char('|')
        + QLatin1Char(style.isBold() ? '1' : '0')
        + QLatin1Char(style.isItalic() ? '1' : '0');
    auto it = m_fonts.constFind(key);
    if (it != m_fonts.constEnd())
        return it.value();

    FontHandle handle = style.resolveFont(m_metrics, error);
    if (handle.isValid())
        m_fonts.insert(key, handle);
    return handle;
}

bool TextMeasurer::measure(const QString &text, const Style &style, qreal *width,
                           Layout::LayoutError *error)
{
    FontHandle font = fontFor(style, error);
    if (!font.isValid())
        return false;

    const qreal size = style.fontSize();
    qreal total = 0;
    const QList<uint> codepoints = text.toUcs4();
    for (uint cp : codepoints) {
        qreal w = 0;
        if (!m_metrics->glyphWidth(font, cp, size, &w)) {
            Layout::setError(error, Layout::LayoutError::CollaboratorFailure,
                             QStringLiteral("glyph width for U+%1 in \"%2\" failed: %3")
                                 .arg(cp, 4, 16, QLatin1Char('0'))
                                 .arg(style.fontFamily(), m_metrics->errorString()));
            return false;
        }
        total += w;
    }
    if (width)
        *width = total;
    return true;
}

bool TextMeasurer::lineMetrics(const Style &style, FontLineMetrics *metrics,
                               Layout::LayoutError *error)
{
    FontHandle font = fontFor(style, error);
    if (!font.isValid())
        return false;
    if (!m_metrics->lineMetrics(font, style.fontSize(), metrics)) {
        Layout::setError(error, Layout::LayoutError::CollaboratorFailure,
                         QStringLiteral("line metrics for \"%1\" failed: %2")
                             .arg(style.fontFamily(), m_metrics->errorString()));
        return false;
    }
    return true;
}

bool TextMeasurer::breakCandidates(const QString &word, const Style &style,
                                   QList<int> *offsets, Layout::LayoutError *error)
{
    if (!offsets)
        return false;
    offsets->clear();
    if (!hyphenationEnabled(style))
        return true;

    QList<int> raw;
    if (!m_hyphenator->hyphenate(word, style.language(), &raw)) {
        Layout::setError(error, Layout::LayoutError::CollaboratorFailure,
                         QStringLiteral("hyphenation of \"%1\" (%2) failed")
                             .arg(word, style.language()));
        return false;
    }

    for (int off : std::as_const(raw)) {
        // Never split a surrogate pair.
        if (off <= 0 || off >= word.length() || word.at(off).isLowSurrogate())
            continue;
        offsets->append(off);
    }
    std::sort(offsets->begin(), offsets->end());
    offsets->erase(std::unique(offsets->begin(), offsets->end()), offsets->end());
    return true;
}

static bool isLineSeparator(QChar ch)
{
    return ch == QLatin1Char('\n') || ch == QLatin1Char('\r')
        || ch.unicode() == 0x2028 || ch.unicode() == 0x2029;
}

// Whitespace that separates words; no-break spaces belong to the word.
static bool isBlank(QChar ch)
{
    return ch.isSpace() && ch.unicode() != 0x00A0 && ch.unicode() != 0x2007
        && ch.unicode() != 0x202F && !isLineSeparator(ch);
}

static TextSegment makeSegment(const QString &text, int start, int end)
{
    // Blanks opening a line (after a hard break) are not part of the word.
    while (start < end && isBlank(text.at(start)))
        ++start;

    TextSegment seg;
    seg.start = start;
    int wordEnd = end;
    while (wordEnd > start && text.at(wordEnd - 1).isSpace())
        --wordEnd;
    seg.length = wordEnd - start;
    seg.spaceLength = end - wordEnd;
    for (int i = wordEnd; i < end; ++i) {
        if (isLineSeparator(text.at(i))) {
            seg.hardBreak = true;
            break;
        }
    }
    return seg;
}

QList<TextSegment> TextMeasurer::segment(const QString &text)
{
    QList<TextSegment> segments;
    if (text.isEmpty())
        return segments;

    UErrorCode err = U_ZERO_ERROR;
    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()), text.length());
    std::unique_ptr<icu::BreakIterator> lineBreakIter(
        icu::BreakIterator::createLineInstance(icu::Locale::getDefault(), err));

    if (U_FAILURE(err) || !lineBreakIter) {
        qWarning() << "TextMeasurer: ICU line iterator unavailable:" << u_errorName(err);
        // Whitespace-only segmentation
        int start = 0;
        int i = 0;
        while (i < text.length()) {
            while (i < text.length() && !text.at(i).isSpace())
                ++i;
            while (i < text.length() && text.at(i).isSpace()) {
                ++i;
                if (isLineSeparator(text.at(i - 1)))
                    break;
            }
            segments.append(makeSegment(text, start, i));
            start = i;
        }
        return segments;
    }

    lineBreakIter->setText(ustr);
    int32_t prev = lineBreakIter->first();
    for (int32_t pos = lineBreakIter->next();
         pos != icu::BreakIterator::DONE;
         pos = lineBreakIter->next()) {
        segments.append(makeSegment(text, prev, pos));
        prev = pos;
    }
    return segments;
}
