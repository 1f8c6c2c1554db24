/*
 * decorators.cpp — Elements that wrap another element
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "decorators.h"

namespace Layout {

// --- PaddedElement ---

PaddedElement::PaddedElement(ElementPtr child, const QMarginsF &padding, bool continuation)
    : m_child(std::move(child))
    , m_padding(padding)
    , m_continuation(continuation)
{
}

PaddedElement::PaddedElement(const PaddedElement &other)
    : Element(other)
    , m_child(other.m_child ? other.m_child->clone() : nullptr)
    , m_padding(other.m_padding)
    , m_continuation(other.m_continuation)
{
}

ElementPtr PaddedElement::clone() const
{
    return std::make_unique<PaddedElement>(*this);
}

RenderResult PaddedElement::render(RenderContext &context, const Area &area,
                                   const Style &style) const
{
    if (!m_child)
        return RenderResult::done(0);

    const qreal top = m_continuation ? 0 : m_padding.top();
    const Area inner = area.shrunk(QMarginsF(m_padding.left(), top,
                                             m_padding.right(), m_padding.bottom()));
    RenderResult r = m_child->render(context, inner, style);
    if (r.isFailed())
        return r;

    if (r.isDone()) {
        RenderResult out = RenderResult::done(
            qMin(top + r.height + m_padding.bottom(), area.remainingHeight()));
        out.pageBreak = r.pageBreak;
        return out;
    }

    // A leading break: start over on the next page with the child's rest.
    if (r.height <= 0 && r.pageBreak) {
        RenderResult out = RenderResult::partial(
            0, std::make_unique<PaddedElement>(std::move(r.remainder), m_padding,
                                               m_continuation));
        out.pageBreak = true;
        return out;
    }

    // Nothing of the child fit here.
    if (r.height <= 0 && !m_continuation)
        return RenderResult::partial(0, clone());

    RenderResult out = RenderResult::partial(
        qMin(top + r.height, area.remainingHeight()),
        std::make_unique<PaddedElement>(std::move(r.remainder), m_padding,
                                        m_continuation || r.height > 0));
    out.pageBreak = r.pageBreak;
    return out;
}

// --- FramedElement ---

FramedElement::FramedElement(ElementPtr child, qreal lineWidth, const QColor &color,
                             bool continuation)
    : m_child(std::move(child))
    , m_lineWidth(qMax(qreal(0), lineWidth))
    , m_color(color)
    , m_continuation(continuation)
{
}

FramedElement::FramedElement(const FramedElement &other)
    : Element(other)
    , m_child(other.m_child ? other.m_child->clone() : nullptr)
    , m_lineWidth(other.m_lineWidth)
    , m_color(other.m_color)
    , m_continuation(other.m_continuation)
{
}

ElementPtr FramedElement::clone() const
{
    return std::make_unique<FramedElement>(*this);
}

RenderResult FramedElement::render(RenderContext &context, const Area &area,
                                   const Style &style) const
{
    if (!m_child)
        return RenderResult::done(0);

    const qreal t = m_lineWidth;
    const qreal top = m_continuation ? 0 : t;
    const Area inner = area.shrunk(QMarginsF(t, top, t, t));

    // Frame goes on top of the child's content.
    DrawList content;
    RenderResult r = m_child->render(context, inner.withTarget(&content), style);
    if (r.isFailed())
        return r;

    if (r.isPartial() && r.height <= 0 && r.pageBreak) {
        RenderResult out = RenderResult::partial(
            0, std::make_unique<FramedElement>(std::move(r.remainder), m_lineWidth, m_color,
                                               m_continuation));
        out.pageBreak = true;
        return out;
    }
    if (r.isPartial() && r.height <= 0 && !m_continuation)
        return RenderResult::partial(0, clone());

    const bool last = r.isDone();
    const qreal height = qMin(top + r.height + (last ? t : 0), area.remainingHeight());
    const QColor color = m_color.isValid() ? m_color : style.color();

    if (area.target())
        area.target()->append(content);
    if (t > 0) {
        area.drawRect(QRectF(0, 0, t, height), color);
        area.drawRect(QRectF(area.width() - t, 0, t, height), color);
        if (!m_continuation)
            area.drawRect(QRectF(0, 0, area.width(), t), color);
        if (last)
            area.drawRect(QRectF(0, height - t, area.width(), t), color);
    }

    if (last) {
        RenderResult out = RenderResult::done(height);
        out.pageBreak = r.pageBreak;
        return out;
    }
    RenderResult out = RenderResult::partial(
        height, std::make_unique<FramedElement>(std::move(r.remainder), m_lineWidth, m_color,
                                                m_continuation || r.height > 0));
    out.pageBreak = r.pageBreak;
    return out;
}

} // namespace Layout
