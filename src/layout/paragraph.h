/*
 * paragraph.h — Wrapped, styled text
 *
 * A paragraph is a list of styled runs.  Each render call re-breaks
 * the runs against the area's width, draws the lines that fit and
 * hands the rest back as a new Paragraph built from the undrawn text,
 * so a continuation adapts to a different width on the next page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PARAGRAPH_H
#define FOLIO_PARAGRAPH_H

#include "element.h"
#include "linebreaker.h"

namespace Layout {

class Paragraph : public Element
{
public:
    enum Alignment { AlignLeft, AlignCenter, AlignRight, AlignJustify };

    Paragraph() = default;
    explicit Paragraph(const QString &text, const Style &style = Style());

    Paragraph &addText(const QString &text, const Style &style = Style());

    // Paragraph-level override applied on top of the inherited style
    void setStyle(const Style &style) { m_style = style; }
    Style style() const { return m_style; }

    void setAlignment(Alignment alignment) { m_alignment = alignment; }
    Alignment alignment() const { return m_alignment; }

    const QList<StyledString> &runs() const { return m_runs; }
    QString text() const;
    bool isEmpty() const;

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    void drawLine(RenderContext &context, const Area &area, const LineBreaking::Line &line,
                  qreal top, bool lastLine) const;

    QList<StyledString> m_runs;
    Style m_style;
    Alignment m_alignment = AlignLeft;
};

// Underline/strikethrough bars for a run drawn at baseline.
void drawDecorations(const Area &area, const QPointF &baseline, qreal width, const Style &style);

} // namespace Layout

#endif // FOLIO_PARAGRAPH_H
