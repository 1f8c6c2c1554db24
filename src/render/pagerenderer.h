/*
 * pagerenderer.h — Base class for page output backends
 *
 * Replays laid-out pages as an ordered stream of draw instructions.
 * The traversal lives in the base; backends implement the primitives
 * and the page bracketing that map to their native API.
 *
 * All coordinates use the layout's top-down point system.  Each
 * backend transforms to its native coordinate system inside the
 * primitive.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAGERENDERER_H
#define FOLIO_PAGERENDERER_H

#include "drawcommand.h"

class PageRenderer
{
public:
    virtual ~PageRenderer();

    // --- Traversal ---

    virtual void renderPages(const QList<Layout::Page> &pages);
    virtual void renderPage(const Layout::Page &page);
    void renderCommand(const Layout::DrawCommand &command);

    // --- Page bracketing ---

    virtual void beginPage(const Layout::Page &page, bool first) = 0;
    virtual void endPage(const Layout::Page &) {}

    // --- Drawing primitives ---

    /// Draw a run of text with its left baseline point at baseline.
    virtual void drawText(const QPointF &baseline, const QString &text,
                          const Style &style, qreal width) = 0;

    /// Fill and/or stroke a rectangle.
    virtual void drawRect(const QRectF &rect, const QColor &fill,
                          const QColor &stroke = QColor(),
                          qreal strokeWidth = 0) = 0;

    /// Draw an image into a destination rectangle.
    virtual void drawImage(const QRectF &destRect, const QImage &image) = 0;
};

#endif // FOLIO_PAGERENDERER_H
