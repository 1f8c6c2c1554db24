/*
 * breaks.cpp — Page breaks, vertical spacers and single text lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "breaks.h"
#include "paragraph.h"
#include "textmeasurer.h"

namespace Layout {

static constexpr qreal kFitEpsilon = 1e-6;

// --- PageBreak ---

RenderResult PageBreak::render(RenderContext &, const Area &, const Style &) const
{
    RenderResult r = RenderResult::done(0);
    r.pageBreak = true;
    return r;
}

ElementPtr PageBreak::clone() const
{
    return std::make_unique<PageBreak>(*this);
}

// --- Spacer ---

Spacer::Spacer(qreal lines)
    : m_lines(qMax(qreal(0), lines))
{
}

RenderResult Spacer::render(RenderContext &, const Area &area, const Style &style) const
{
    return RenderResult::done(qMin(m_lines * style.lineHeight(), area.remainingHeight()));
}

ElementPtr Spacer::clone() const
{
    return std::make_unique<Spacer>(*this);
}

// --- TextLine ---

TextLine::TextLine(const QString &text, const Style &style)
    : m_text{text, style}
{
}

ElementPtr TextLine::clone() const
{
    return std::make_unique<TextLine>(*this);
}

RenderResult TextLine::render(RenderContext &context, const Area &area,
                              const Style &style) const
{
    const Style merged = Style::merge(style, m_text.style);
    const qreal height = merged.lineHeight();
    const qreal available = area.remainingHeight();

    if (height > available + kFitEpsilon) {
        if (!area.isPageTop())
            return RenderResult::partial(0, clone());
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("line height %1pt exceeds the area height %2pt")
                           .arg(height).arg(available));
    }

    LayoutError error;
    qreal width = 0;
    FontLineMetrics metrics;
    if (!context.measurer()->measure(m_text.text, merged, &width, &error)
        || !context.measurer()->lineMetrics(merged, &metrics, &error))
        return RenderResult::failed(error);

    if (width > area.width() + kFitEpsilon) {
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("text \"%1\" (%2pt) is wider than the area (%3pt)")
                           .arg(m_text.text).arg(width).arg(area.width()));
    }

    const QPointF baseline(0, metrics.ascent);
    area.drawText(baseline, m_text.text, merged, width);
    drawDecorations(area, baseline, width, merged);
    return RenderResult::done(qMin(height, available));
}

} // namespace Layout
