/*
 * list.cpp — Bulleted and numbered lists
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "list.h"
#include "paragraph.h"
#include "textmeasurer.h"

namespace Layout {

// --- ListItem ---

ListItem::ListItem(const QString &marker, ElementPtr content, qreal indent,
                   qreal markerGap, bool continuation)
    : m_marker(marker)
    , m_content(std::move(content))
    , m_indent(indent)
    , m_markerGap(markerGap)
    , m_continuation(continuation)
{
}

ListItem::ListItem(const ListItem &other)
    : Element(other)
    , m_marker(other.m_marker)
    , m_content(other.m_content ? other.m_content->clone() : nullptr)
    , m_indent(other.m_indent)
    , m_markerGap(other.m_markerGap)
    , m_continuation(other.m_continuation)
{
}

ElementPtr ListItem::clone() const
{
    return std::make_unique<ListItem>(*this);
}

RenderResult ListItem::render(RenderContext &context, const Area &area,
                              const Style &style) const
{
    if (!m_content)
        return RenderResult::done(0);

    const qreal indent = qMin(m_indent, area.width());
    RenderResult r = m_content->render(context, area.column(indent, area.width() - indent), style);
    if (r.isFailed())
        return r;

    const bool drewSomething = r.height > 0;
    if (!m_continuation && drewSomething && !m_marker.isEmpty()) {
        LayoutError error;
        qreal width = 0;
        FontLineMetrics metrics;
        if (!context.measurer()->measure(m_marker, style, &width, &error)
            || !context.measurer()->lineMetrics(style, &metrics, &error))
            return RenderResult::failed(error);

        const qreal x = indent - m_markerGap - width;
        if (x < 0) {
            context.report(LayoutError::ContentOverflow,
                           QStringLiteral("list marker \"%1\" is wider than the indent")
                               .arg(m_marker));
        }
        const QPointF baseline(x, metrics.ascent);
        area.drawText(baseline, m_marker, style, width);
    }

    if (r.isPartial()) {
        RenderResult out = RenderResult::partial(
            r.height, std::make_unique<ListItem>(m_marker, std::move(r.remainder), m_indent,
                                                 m_markerGap, m_continuation || drewSomething));
        out.pageBreak = r.pageBreak;
        return out;
    }
    return r;
}

// --- List ---

List::List(Type type)
    : m_type(type)
{
}

QString List::markerAt(int index) const
{
    const auto *item = dynamic_cast<const ListItem *>(m_items.at(index));
    return item ? item->marker() : QString();
}

List &List::addItem(ElementPtr item)
{
    if (!item)
        return *this;
    const QString marker = m_type == Ordered
        ? QStringLiteral("%1.").arg(m_nextNumber++)
        : m_bullet;
    m_items.addElement(std::make_unique<ListItem>(marker, std::move(item), m_indent, m_markerGap));
    return *this;
}

List &List::addItem(const QString &text)
{
    return addItem(std::make_unique<Paragraph>(text));
}

ElementPtr List::clone() const
{
    return std::make_unique<List>(*this);
}

RenderResult List::render(RenderContext &context, const Area &area, const Style &style) const
{
    return m_items.render(context, area, style);
}

} // namespace Layout
