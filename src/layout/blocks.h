/*
 * blocks.h — Unsplittable fixed-size elements
 *
 * Images and externally rendered blocks know their size up front and
 * are never split.  If one does not fit the remaining height it asks
 * for a fresh page; on a fresh page it is drawn regardless and the
 * overflow is reported as a diagnostic.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_BLOCKS_H
#define FOLIO_BLOCKS_H

#include <QImage>
#include <QSizeF>

#include "element.h"

namespace Layout {

class FixedBlock : public Element
{
public:
    enum Alignment { AlignLeft, AlignCenter, AlignRight };

    QSizeF size() const { return m_size; }
    void setAlignment(Alignment alignment) { m_alignment = alignment; }
    Alignment alignment() const { return m_alignment; }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const final;

protected:
    explicit FixedBlock(const QSizeF &size);

    virtual QString describe() const = 0;
    virtual void draw(const Area &area, const QPointF &topLeft, const Style &style) const = 0;

private:
    QSizeF m_size;
    Alignment m_alignment = AlignLeft;
};

class Image : public FixedBlock
{
public:
    // size in points; a null image draws as a placeholder frame
    Image(const QImage &image, const QSizeF &size, const QString &imageId = QString());
    explicit Image(const QSizeF &size, const QString &imageId = QString());

    QImage image() const { return m_image; }
    QString imageId() const { return m_imageId; }

    ElementPtr clone() const override;

protected:
    QString describe() const override;
    void draw(const Area &area, const QPointF &topLeft, const Style &style) const override;

private:
    QImage m_image;
    QString m_imageId;
};

// Pre-measured content supplied by a specialised renderer (code,
// math).  Commands are relative to the block's top-left corner.
class ExternalBlock : public FixedBlock
{
public:
    ExternalBlock(const QSizeF &size, const DrawList &commands,
                  const QString &source = QString());

    const DrawList &commands() const { return m_commands; }
    QString source() const { return m_source; }

    ElementPtr clone() const override;

protected:
    QString describe() const override;
    void draw(const Area &area, const QPointF &topLeft, const Style &style) const override;

private:
    DrawList m_commands;
    QString m_source; // renderer name for diagnostics
};

} // namespace Layout

#endif // FOLIO_BLOCKS_H
