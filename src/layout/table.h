/*
 * table.h — Grid of cell elements with weighted columns
 *
 * Column widths are fixed per render from the declared weights.  Rows
 * are atomic: a row that does not fit moves, whole, to the next page.
 * Only a row that does not fit even on a fresh page is split, each
 * cell continuing with its own remainder.  Header rows are repeated at
 * the top of continuation pages and are never left alone at the
 * bottom of a page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_TABLE_H
#define FOLIO_TABLE_H

#include <QStringList>

#include <vector>

#include "element.h"
#include "tablestyle.h"

namespace Layout {

class Table : public Element
{
public:
    // Fails (MalformedTable) for zero columns, a weight count that does
    // not match, negative weights or an all-zero weight sum.  Empty
    // weights mean equal columns.
    static std::unique_ptr<Table> create(int columns, const QList<qreal> &weights = {},
                                         LayoutError *error = nullptr);

    Table(const Table &other);

    int columnCount() const { return int(m_weights.size()); }
    int rowCount() const { return int(m_rows.size()); }
    QList<qreal> weights() const { return m_weights; }

    // Cells are taken in column order; the count must match.
    bool addRow(std::vector<ElementPtr> cells, LayoutError *error = nullptr);
    // Convenience: one Paragraph per string.
    bool addRow(const QStringList &texts, LayoutError *error = nullptr);

    // The first count rows are header rows.
    void setHeaderRowCount(int count) { m_headerRowCount = qMax(0, count); }
    int headerRowCount() const { return m_headerRowCount; }

    TableStyle tableStyle() const { return m_tableStyle; }
    void setTableStyle(const TableStyle &style) { m_tableStyle = style; }

    QList<qreal> columnWidths(qreal totalWidth) const;

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    using Row = std::vector<ElementPtr>;

    struct RowOutcome {
        qreal height = 0;
        bool complete = true;
        DrawList content;
        std::vector<ElementPtr> remainders; // null for finished cells
    };

    struct PlacedRow {
        int row;
        qreal y;
        qreal height;
    };

    explicit Table(const QList<qreal> &weights);

    bool renderRow(RenderContext &context, const Area &cursor, int row,
                   const QList<qreal> &widths, const Style &style, bool mustProgress,
                   RowOutcome *out, LayoutError *error) const;
    void compose(const Area &area, const QList<qreal> &widths,
                 const QList<PlacedRow> &placed, const DrawList &content, qreal height) const;
    std::unique_ptr<Table> continuation(int fromRow, int bodyPlaced) const;
    Row cloneRow(int row) const;

    QList<qreal> m_weights;
    std::vector<Row> m_rows;
    int m_headerRowCount = 0;
    int m_bodyRowOffset = 0; // body rows drawn by earlier fragments
    TableStyle m_tableStyle;
};

} // namespace Layout

#endif // FOLIO_TABLE_H
