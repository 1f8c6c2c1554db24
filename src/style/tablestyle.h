#ifndef FOLIO_TABLESTYLE_H
#define FOLIO_TABLESTYLE_H

#include <QColor>
#include <QMarginsF>

#include "style.h"

class TableStyle
{
public:
    TableStyle() = default;

    // Cell padding (points)
    QMarginsF cellPadding() const { return m_cellPadding; }
    void setCellPadding(const QMarginsF &p) { m_cellPadding = p; }

    // Colors
    QColor headerBackground() const { return m_headerBackground; }
    void setHeaderBackground(const QColor &c) { m_headerBackground = c; m_hasHeaderBackground = c.isValid(); }
    bool hasHeaderBackground() const { return m_hasHeaderBackground; }

    QColor alternateRowColor() const { return m_alternateRowColor; }
    void setAlternateRowColor(const QColor &c) { m_alternateRowColor = c; m_hasAlternateRowColor = c.isValid(); }
    bool hasAlternateRowColor() const { return m_hasAlternateRowColor; }

    // Border definitions; a zero width disables the border
    struct Border {
        qreal width = 0.5;
        QColor color{0x33, 0x33, 0x33};
    };

    Border outerBorder() const { return m_outerBorder; }
    void setOuterBorder(const Border &b) { m_outerBorder = b; }

    Border innerBorder() const { return m_innerBorder; }
    void setInnerBorder(const Border &b) { m_innerBorder = b; }

    // Override applied to the text of header rows
    Style headerTextStyle() const { return m_headerTextStyle; }
    void setHeaderTextStyle(const Style &s) { m_headerTextStyle = s; }

    // Repeat header rows at the top of every continuation page
    bool repeatHeaderRows() const { return m_repeatHeaderRows; }
    void setRepeatHeaderRows(bool on) { m_repeatHeaderRows = on; }

private:
    QMarginsF m_cellPadding{4.0, 3.0, 4.0, 3.0};
    QColor m_headerBackground;
    QColor m_alternateRowColor;
    Border m_outerBorder;
    Border m_innerBorder;
    Style m_headerTextStyle = Style().withBold();
    bool m_repeatHeaderRows = true;

    bool m_hasHeaderBackground = false;
    bool m_hasAlternateRowColor = false;
};

#endif // FOLIO_TABLESTYLE_H
