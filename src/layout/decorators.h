/*
 * decorators.h — Elements that wrap another element
 *
 * PaddedElement insets its child; FramedElement draws a frame around
 * it.  When the child splits, the top edge belongs to the first
 * fragment and the bottom edge to the last one.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DECORATORS_H
#define FOLIO_DECORATORS_H

#include <QMarginsF>

#include "element.h"

namespace Layout {

class PaddedElement : public Element
{
public:
    PaddedElement(ElementPtr child, const QMarginsF &padding, bool continuation = false);
    PaddedElement(const PaddedElement &other);

    QMarginsF padding() const { return m_padding; }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    ElementPtr m_child;
    QMarginsF m_padding;
    bool m_continuation = false;
};

class FramedElement : public Element
{
public:
    explicit FramedElement(ElementPtr child, qreal lineWidth = 0.5,
                           const QColor &color = QColor(), bool continuation = false);
    FramedElement(const FramedElement &other);

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    ElementPtr m_child;
    qreal m_lineWidth;
    QColor m_color; // invalid = text color
    bool m_continuation = false;
};

} // namespace Layout

#endif // FOLIO_DECORATORS_H
