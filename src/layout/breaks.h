/*
 * breaks.h — Page breaks, vertical spacers and single text lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_BREAKS_H
#define FOLIO_BREAKS_H

#include "element.h"

namespace Layout {

// Ends the current page.  Draws nothing and takes no space.
class PageBreak : public Element
{
public:
    PageBreak() = default;

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;
};

// Blank vertical space measured in lines of the inherited style.
// Cut short at the end of a page rather than carried over.
class Spacer : public Element
{
public:
    explicit Spacer(qreal lines = 1.0);

    qreal lines() const { return m_lines; }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    qreal m_lines;
};

// A single line of text that is never wrapped.
class TextLine : public Element
{
public:
    explicit TextLine(const QString &text, const Style &style = Style());

    QString text() const { return m_text.text; }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    StyledString m_text;
};

} // namespace Layout

#endif // FOLIO_BREAKS_H
