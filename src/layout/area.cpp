/*
 * area.cpp — Rectangular region of a page available to an element
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "area.h"

#include <QtGlobal>

#include <type_traits>

namespace Layout {

DrawCommand translated(const DrawCommand &cmd, const QPointF &offset)
{
    return std::visit([&offset](const auto &c) -> DrawCommand {
        using T = std::decay_t<decltype(c)>;
        T moved = c;
        if constexpr (std::is_same_v<T, DrawText>)
            moved.baseline += offset;
        else
            moved.rect.translate(offset);
        return moved;
    }, cmd);
}

Area::Area(DrawList *target, const QPointF &origin, qreal width, qreal height,
           bool pageTop)
    : m_target(target)
    , m_origin(origin)
    , m_width(qMax(qreal(0), width))
    , m_remainingHeight(qMax(qreal(0), height))
    , m_pageTop(pageTop)
{
}

void Area::consume(qreal height)
{
    if (height <= 0)
        return;
    const qreal step = qMin(height, m_remainingHeight);
    m_origin.ry() += step;
    m_remainingHeight -= step;
    m_pageTop = false;
}

Area Area::column(qreal dx, qreal width) const
{
    Area a = *this;
    a.m_origin.rx() += dx;
    a.m_width = qMax(qreal(0), width);
    return a;
}

Area Area::shrunk(const QMarginsF &margins) const
{
    Area a = *this;
    a.m_origin += QPointF(margins.left(), margins.top());
    a.m_width = qMax(qreal(0), m_width - margins.left() - margins.right());
    a.m_remainingHeight = qMax(qreal(0), m_remainingHeight - margins.top() - margins.bottom());
    return a;
}

Area Area::withTarget(DrawList *target) const
{
    Area a = *this;
    a.m_target = target;
    return a;
}

Area Area::withPageTop(bool pageTop) const
{
    Area a = *this;
    a.m_pageTop = pageTop;
    return a;
}

void Area::drawText(const QPointF &baseline, const QString &text, const Style &style,
                    qreal width) const
{
    if (!m_target)
        return;
    m_target->append(DrawText{toPage(baseline), text, style, width});
}

void Area::drawRect(const QRectF &rect, const QColor &fill, const QColor &stroke,
                    qreal strokeWidth) const
{
    if (!m_target)
        return;
    m_target->append(DrawRect{rect.translated(m_origin), fill, stroke, strokeWidth});
}

void Area::drawImage(const QRectF &rect, const QImage &image, const QString &imageId) const
{
    if (!m_target)
        return;
    m_target->append(DrawImage{rect.translated(m_origin), image, imageId});
}

void Area::draw(const DrawCommand &command, const QPointF &offset) const
{
    if (!m_target)
        return;
    m_target->append(translated(command, m_origin + offset));
}

} // namespace Layout
