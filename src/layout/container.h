/*
 * container.h — Linear stacking of child elements
 *
 * Vertical containers render children top to bottom and stop at the
 * first child that does not finish; the remainder holds that child's
 * remainder followed by the untouched siblings.  Horizontal containers
 * split the width by weight and place children side by side.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_CONTAINER_H
#define FOLIO_CONTAINER_H

#include <vector>

#include "element.h"

namespace Layout {

class Container : public Element
{
public:
    enum Orientation { Vertical, Horizontal };

    explicit Container(Orientation orientation = Vertical);
    Container(const Container &other);

    Container &addElement(ElementPtr element, qreal weight = 1.0);

    Orientation orientation() const { return m_orientation; }
    int count() const { return int(m_children.size()); }
    const Element *at(int index) const { return m_children[size_t(index)].get(); }
    qreal weightAt(int index) const { return m_weights.value(index, 1.0); }

    void setStyle(const Style &style) { m_style = style; }
    Style style() const { return m_style; }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    RenderResult renderVertical(RenderContext &context, const Area &area,
                                const Style &style) const;
    RenderResult renderHorizontal(RenderContext &context, const Area &area,
                                  const Style &style) const;

    Orientation m_orientation;
    std::vector<ElementPtr> m_children;
    QList<qreal> m_weights;
    Style m_style;
};

} // namespace Layout

#endif // FOLIO_CONTAINER_H
