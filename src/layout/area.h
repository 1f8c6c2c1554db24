/*
 * area.h — Rectangular region of a page available to an element
 *
 * An Area has a fixed width and a remaining height that only shrinks.
 * Elements draw through it in local coordinates (0,0 = top-left of
 * the area); commands are translated to page coordinates and appended
 * to the area's target list.  Copies share the target, so a container
 * can advance its own copy without touching the caller's.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_AREA_H
#define FOLIO_AREA_H

#include <QMarginsF>
#include <QPointF>
#include <QRectF>

#include "drawcommand.h"

namespace Layout {

class Area
{
public:
    Area(DrawList *target, const QPointF &origin, qreal width, qreal height,
         bool pageTop = true);

    QPointF origin() const { return m_origin; }
    qreal width() const { return m_width; }
    qreal remainingHeight() const { return m_remainingHeight; }
    DrawList *target() const { return m_target; }

    // True while nothing has been placed on the page above this area.
    // An element that gets a page-top area must make progress.
    bool isPageTop() const { return m_pageTop; }

    // Move the top edge down; clamps at zero remaining height.
    void consume(qreal height);

    // Column of this area starting at x offset dx with the given width.
    Area column(qreal dx, qreal width) const;
    // Inset on all four sides; keeps the page-top state.
    Area shrunk(const QMarginsF &margins) const;
    // Same geometry, drawing into another list.
    Area withTarget(DrawList *target) const;
    // Same geometry with the page-top state replaced.
    Area withPageTop(bool pageTop) const;

    QPointF toPage(const QPointF &local) const { return m_origin + local; }

    void drawText(const QPointF &baseline, const QString &text, const Style &style,
                  qreal width) const;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(), qreal strokeWidth = 0) const;
    void drawImage(const QRectF &rect, const QImage &image, const QString &imageId) const;
    // Append a command given relative to local point offset.
    void draw(const DrawCommand &command, const QPointF &offset = QPointF()) const;

private:
    DrawList *m_target = nullptr;
    QPointF m_origin;
    qreal m_width = 0;
    qreal m_remainingHeight = 0;
    bool m_pageTop = true;
};

} // namespace Layout

#endif // FOLIO_AREA_H
