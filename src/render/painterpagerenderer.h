/*
 * painterpagerenderer.h — QPainter backend for PageRenderer
 *
 * Draws pages onto any QPainter.  With a QPagedPaintDevice (such as
 * QPdfWriter) attached, each page after the first starts a new device
 * page.  Text is drawn from the same font files the layout measured
 * against when a FontManager is supplied.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAINTERPAGERENDERER_H
#define FOLIO_PAINTERPAGERENDERER_H

#include "pagerenderer.h"

#include <QHash>
#include <QRawFont>
#include <QString>

class FontManager;
class QPainter;
class QPagedPaintDevice;

class PainterPageRenderer : public PageRenderer
{
public:
    explicit PainterPageRenderer(FontManager *fontManager = nullptr);

    /// Set the QPainter to use for rendering.  Must be called before any
    /// render method; the caller retains ownership of the painter.
    void setPainter(QPainter *painter) { m_painter = painter; }

    /// Device to advance between pages; may be null for single-page output.
    void setPagedDevice(QPagedPaintDevice *device) { m_device = device; }

    void beginPage(const Layout::Page &page, bool first) override;

    void drawText(const QPointF &baseline, const QString &text,
                  const Style &style, qreal width) override;
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(),
                  qreal strokeWidth = 0) override;
    void drawImage(const QRectF &destRect, const QImage &image) override;

private:
    const QRawFont *rawFontFor(const Style &style);

    FontManager *m_fontManager = nullptr;
    QPainter *m_painter = nullptr;
    QPagedPaintDevice *m_device = nullptr;
    QHash<QString, QRawFont> m_rawFontCache; // "path@size" -> font
};

#endif // FOLIO_PAINTERPAGERENDERER_H
