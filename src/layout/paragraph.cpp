/*
 * paragraph.cpp — Wrapped, styled text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paragraph.h"
#include "textmeasurer.h"

#include <QDebug>

namespace Layout {

static constexpr qreal kFitEpsilon = 1e-6;

Paragraph::Paragraph(const QString &text, const Style &style)
{
    addText(text, style);
}

Paragraph &Paragraph::addText(const QString &text, const Style &style)
{
    if (!text.isEmpty())
        m_runs.append(StyledString{text, style});
    return *this;
}

QString Paragraph::text() const
{
    QString t;
    for (const auto &run : m_runs)
        t += run.text;
    return t;
}

bool Paragraph::isEmpty() const
{
    for (const auto &run : m_runs) {
        if (!run.text.trimmed().isEmpty())
            return false;
    }
    return true;
}

ElementPtr Paragraph::clone() const
{
    return std::make_unique<Paragraph>(*this);
}

void drawDecorations(const Area &area, const QPointF &baseline, qreal width, const Style &style)
{
    if (width <= 0)
        return;
    const qreal size = style.fontSize();
    const qreal thickness = qMax(qreal(0.5), size * 0.05);
    if (style.isUnderline())
        area.drawRect(QRectF(baseline.x(), baseline.y() + size * 0.1, width, thickness),
                      style.color());
    if (style.isStrikethrough())
        area.drawRect(QRectF(baseline.x(), baseline.y() - size * 0.3, width, thickness),
                      style.color());
}

void Paragraph::drawLine(RenderContext &context, const Area &area,
                         const LineBreaking::Line &line, qreal top, bool lastLine) const
{
    const qreal slack = area.width() - line.width;
    qreal x0 = 0;
    qreal perGap = 0;
    switch (m_alignment) {
    case AlignLeft:
        break;
    case AlignCenter:
        x0 = qMax(qreal(0), slack / 2);
        break;
    case AlignRight:
        x0 = qMax(qreal(0), slack);
        break;
    case AlignJustify: {
        // The last line and lines ended by a hard break stay ragged.
        const int gaps = line.gapCount();
        if (!lastLine && !line.hardBreak && gaps > 0 && slack > 0)
            perGap = slack / gaps;
        break;
    }
    }

    if (line.overflow) {
        QString word = line.words.isEmpty() ? QString() : line.words.first().word.text();
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("word \"%1\" (%2pt) is wider than the area (%3pt)")
                           .arg(word).arg(line.width).arg(area.width()));
    }

    const qreal baselineY = top + line.baseline();
    qreal shift = 0;
    for (int i = 0; i < line.words.size(); ++i) {
        const auto &pw = line.words[i];
        qreal fx = x0 + pw.x + shift;
        const int last = pw.word.fragments.size() - 1;
        for (int f = 0; f <= last; ++f) {
            const auto &frag = pw.word.fragments[f];
            QString text = frag.text;
            qreal width = frag.width;
            if (f == last && pw.hyphen) {
                text += QLatin1Char('-');
                width += pw.hyphenWidth;
            }
            const QPointF baseline(fx, baselineY);
            area.drawText(baseline, text, frag.style, width);
            drawDecorations(area, baseline, width, frag.style);
            fx += width;
        }
        if (pw.word.spaceWidth > 0)
            shift += perGap;
    }
}

RenderResult Paragraph::render(RenderContext &context, const Area &area,
                               const Style &style) const
{
    const Style base = Style::merge(style, m_style);
    TextMeasurer *measurer = context.measurer();

    LayoutError error;
    QList<LineBreaking::Word> words;
    if (!LineBreaking::collectWords(m_runs, base, measurer, &words, &error))
        return RenderResult::failed(error);
    if (words.isEmpty())
        return RenderResult::done(0);

    QList<LineBreaking::Line> lines;
    if (!LineBreaking::breakLines(words, area.width(), measurer, &lines, &error))
        return RenderResult::failed(error);

    const qreal available = area.remainingHeight();
    qreal used = 0;
    int fitted = 0;
    while (fitted < lines.size() && used + lines[fitted].height <= available + kFitEpsilon)
        used += lines[fitted++].height;

    if (fitted == 0) {
        if (!area.isPageTop())
            return RenderResult::partial(0, clone());
        // A single line taller than the whole page: draw it anyway.
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("line height %1pt exceeds the area height %2pt")
                           .arg(lines.first().height).arg(available));
        fitted = 1;
        used = qMin(lines.first().height, available);
    }

    qreal y = 0;
    for (int i = 0; i < fitted; ++i) {
        drawLine(context, area, lines[i], y, i == lines.size() - 1);
        y += lines[i].height;
    }

    if (fitted == lines.size())
        return RenderResult::done(used);

    QList<LineBreaking::Word> rest;
    for (int i = fitted; i < lines.size(); ++i) {
        for (const auto &pw : std::as_const(lines[i].words))
            rest.append(pw.word);
    }

    auto remainder = std::make_unique<Paragraph>();
    remainder->m_runs = LineBreaking::toRuns(rest, m_runs);
    remainder->m_style = m_style;
    remainder->m_alignment = m_alignment;
    return RenderResult::partial(used, std::move(remainder));
}

} // namespace Layout
