/*
 * painterpagerenderer.cpp — QPainter backend for PageRenderer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "painterpagerenderer.h"
#include "fontmanager.h"

#include <QDebug>
#include <QFont>
#include <QGlyphRun>
#include <QPagedPaintDevice>
#include <QPainter>
#include <QPen>

PainterPageRenderer::PainterPageRenderer(FontManager *fontManager)
    : m_fontManager(fontManager)
{
}

void PainterPageRenderer::beginPage(const Layout::Page &page, bool first)
{
    if (!first && m_device && !m_device->newPage())
        qWarning() << "PainterPageRenderer: could not start page" << page.pageNumber + 1;
}

// --- QRawFont cache ---

const QRawFont *PainterPageRenderer::rawFontFor(const Style &style)
{
    if (!m_fontManager)
        return nullptr;

    FontHandle handle = m_fontManager->resolveFont(style.fontFamily(), style.isBold(),
                                                   style.isItalic());
    const QString path = m_fontManager->filePath(handle);
    if (path.isEmpty())
        return nullptr;

    const QString key = path + QLatin1Char('@') + QString::number(qRound(style.fontSize() * 100));
    auto it = m_rawFontCache.find(key);
    if (it == m_rawFontCache.end())
        it = m_rawFontCache.insert(key, QRawFont(path, style.fontSize()));
    return it.value().isValid() ? &it.value() : nullptr;
}

// --- Drawing primitives ---

void PainterPageRenderer::drawText(const QPointF &baseline, const QString &text,
                                   const Style &style, qreal)
{
    if (!m_painter || text.isEmpty())
        return;

    m_painter->save();
    m_painter->setPen(style.color());

    if (const QRawFont *raw = rawFontFor(style)) {
        const QList<quint32> glyphs = raw->glyphIndexesForString(text);
        const QList<QPointF> advances = raw->advancesForGlyphIndexes(glyphs);
        QList<QPointF> positions;
        positions.reserve(glyphs.size());
        QPointF pen;
        for (const QPointF &adv : advances) {
            positions.append(pen);
            pen += adv;
        }
        QGlyphRun run;
        run.setRawFont(*raw);
        run.setGlyphIndexes(glyphs);
        run.setPositions(positions);
        m_painter->drawGlyphRun(baseline, run);
    } else {
        QFont font(style.fontFamily());
        font.setPointSizeF(style.fontSize());
        font.setBold(style.isBold());
        font.setItalic(style.isItalic());
        m_painter->setFont(font);
        m_painter->drawText(baseline, text);
    }

    m_painter->restore();
}

void PainterPageRenderer::drawRect(const QRectF &rect, const QColor &fill,
                                   const QColor &stroke, qreal strokeWidth)
{
    if (!m_painter)
        return;
    m_painter->save();
    if (fill.isValid()) {
        m_painter->setPen(Qt::NoPen);
        m_painter->setBrush(fill);
        m_painter->drawRect(rect);
    }
    if (stroke.isValid()) {
        m_painter->setPen(QPen(stroke, strokeWidth));
        m_painter->setBrush(Qt::NoBrush);
        m_painter->drawRect(rect);
    }
    m_painter->restore();
}

void PainterPageRenderer::drawImage(const QRectF &destRect, const QImage &image)
{
    if (!m_painter || image.isNull())
        return;
    m_painter->drawImage(destRect, image);
}
