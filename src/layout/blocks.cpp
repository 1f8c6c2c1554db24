/*
 * blocks.cpp — Unsplittable fixed-size elements
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "blocks.h"

namespace Layout {

static constexpr qreal kFitEpsilon = 1e-6;

FixedBlock::FixedBlock(const QSizeF &size)
    : m_size(qMax(qreal(0), size.width()), qMax(qreal(0), size.height()))
{
}

RenderResult FixedBlock::render(RenderContext &context, const Area &area,
                                const Style &style) const
{
    const qreal available = area.remainingHeight();
    if (m_size.height() > available + kFitEpsilon) {
        if (!area.isPageTop())
            return RenderResult::partial(0, clone());
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("%1 height %2pt exceeds the area height %3pt")
                           .arg(describe()).arg(m_size.height()).arg(available));
    }
    if (m_size.width() > area.width() + kFitEpsilon) {
        context.report(LayoutError::ContentOverflow,
                       QStringLiteral("%1 width %2pt exceeds the area width %3pt")
                           .arg(describe()).arg(m_size.width()).arg(area.width()));
    }

    qreal x = 0;
    const qreal slack = qMax(qreal(0), area.width() - m_size.width());
    if (m_alignment == AlignCenter)
        x = slack / 2;
    else if (m_alignment == AlignRight)
        x = slack;

    draw(area, QPointF(x, 0), style);
    return RenderResult::done(qMin(m_size.height(), available));
}

// --- Image ---

Image::Image(const QImage &image, const QSizeF &size, const QString &imageId)
    : FixedBlock(size)
    , m_image(image)
    , m_imageId(imageId)
{
}

Image::Image(const QSizeF &size, const QString &imageId)
    : FixedBlock(size)
    , m_imageId(imageId)
{
}

ElementPtr Image::clone() const
{
    return std::make_unique<Image>(*this);
}

QString Image::describe() const
{
    return m_imageId.isEmpty() ? QStringLiteral("image")
                               : QStringLiteral("image \"%1\"").arg(m_imageId);
}

void Image::draw(const Area &area, const QPointF &topLeft, const Style &style) const
{
    const QRectF rect(topLeft, size());
    if (m_image.isNull())
        area.drawRect(rect, QColor(), style.color(), 0.5);
    else
        area.drawImage(rect, m_image, m_imageId);
}

// --- ExternalBlock ---

ExternalBlock::ExternalBlock(const QSizeF &size, const DrawList &commands,
                             const QString &source)
    : FixedBlock(size)
    , m_commands(commands)
    , m_source(source)
{
}

ElementPtr ExternalBlock::clone() const
{
    return std::make_unique<ExternalBlock>(*this);
}

QString ExternalBlock::describe() const
{
    return m_source.isEmpty() ? QStringLiteral("external block")
                              : QStringLiteral("%1 block").arg(m_source);
}

void ExternalBlock::draw(const Area &area, const QPointF &topLeft, const Style &) const
{
    for (const auto &cmd : m_commands)
        area.draw(cmd, topLeft);
}

} // namespace Layout
