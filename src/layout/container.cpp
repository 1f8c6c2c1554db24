/*
 * container.cpp — Linear stacking of child elements
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "container.h"

namespace Layout {

Container::Container(Orientation orientation)
    : m_orientation(orientation)
{
}

Container::Container(const Container &other)
    : Element(other)
    , m_orientation(other.m_orientation)
    , m_weights(other.m_weights)
    , m_style(other.m_style)
{
    m_children.reserve(other.m_children.size());
    for (const auto &child : other.m_children)
        m_children.push_back(child->clone());
}

Container &Container::addElement(ElementPtr element, qreal weight)
{
    if (!element)
        return *this;
    m_children.push_back(std::move(element));
    m_weights.append(weight > 0 ? weight : 0);
    return *this;
}

ElementPtr Container::clone() const
{
    return std::make_unique<Container>(*this);
}

RenderResult Container::render(RenderContext &context, const Area &area,
                               const Style &style) const
{
    const Style merged = Style::merge(style, m_style);
    if (m_orientation == Horizontal)
        return renderHorizontal(context, area, merged);
    return renderVertical(context, area, merged);
}

RenderResult Container::renderVertical(RenderContext &context, const Area &area,
                                       const Style &style) const
{
    Area cursor = area;
    qreal used = 0;

    for (size_t i = 0; i < m_children.size(); ++i) {
        RenderResult r = m_children[i]->render(context, cursor, style);
        if (r.isFailed())
            return r;

        cursor.consume(r.height);
        used += r.height;

        if (r.isPartial() || (r.pageBreak && i + 1 < m_children.size())) {
            auto rest = std::make_unique<Container>(Vertical);
            rest->m_style = m_style;
            if (r.isPartial())
                rest->addElement(std::move(r.remainder), m_weights.value(int(i), 1.0));
            for (size_t j = i + 1; j < m_children.size(); ++j)
                rest->addElement(m_children[j]->clone(), m_weights.value(int(j), 1.0));

            RenderResult out = RenderResult::partial(qMin(used, area.remainingHeight()),
                                                     std::move(rest));
            out.pageBreak = r.pageBreak;
            return out;
        }

        if (r.pageBreak) {
            RenderResult out = RenderResult::done(qMin(used, area.remainingHeight()));
            out.pageBreak = true;
            return out;
        }
    }
    return RenderResult::done(qMin(used, area.remainingHeight()));
}

RenderResult Container::renderHorizontal(RenderContext &context, const Area &area,
                                         const Style &style) const
{
    if (m_children.empty())
        return RenderResult::done(0);

    qreal totalWeight = 0;
    for (qreal w : m_weights)
        totalWeight += w;

    std::vector<RenderResult> results;
    results.reserve(m_children.size());
    qreal x = 0;
    qreal height = 0;
    bool complete = true;
    bool pageBreak = false;

    for (size_t i = 0; i < m_children.size(); ++i) {
        const qreal share = totalWeight > 0
            ? area.width() * m_weights.value(int(i)) / totalWeight
            : area.width() / qreal(m_children.size());
        RenderResult r = m_children[i]->render(context, area.column(x, share), style);
        if (r.isFailed())
            return r;
        height = qMax(height, r.height);
        complete = complete && r.isDone();
        pageBreak = pageBreak || r.pageBreak;
        results.push_back(std::move(r));
        x += share;
    }

    height = qMin(height, area.remainingHeight());
    if (complete) {
        RenderResult out = RenderResult::done(height);
        out.pageBreak = pageBreak;
        return out;
    }

    // Finished columns continue as empty placeholders to keep the weights aligned.
    auto rest = std::make_unique<Container>(Horizontal);
    rest->m_style = m_style;
    for (size_t i = 0; i < results.size(); ++i) {
        ElementPtr next = results[i].isPartial() ? std::move(results[i].remainder)
                                                 : std::make_unique<Container>(Vertical);
        rest->m_children.push_back(std::move(next));
        rest->m_weights.append(m_weights.value(int(i), 1.0));
    }
    RenderResult out = RenderResult::partial(height, std::move(rest));
    out.pageBreak = pageBreak;
    return out;
}

} // namespace Layout
