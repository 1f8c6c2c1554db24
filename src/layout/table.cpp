/*
 * table.cpp — Grid of cell elements with weighted columns
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "table.h"
#include "container.h"
#include "paragraph.h"

#include <QDebug>

namespace Layout {

Table::Table(const QList<qreal> &weights)
    : m_weights(weights)
{
}

Table::Table(const Table &other)
    : Element(other)
    , m_weights(other.m_weights)
    , m_headerRowCount(other.m_headerRowCount)
    , m_bodyRowOffset(other.m_bodyRowOffset)
    , m_tableStyle(other.m_tableStyle)
{
    m_rows.reserve(other.m_rows.size());
    for (int r = 0; r < other.rowCount(); ++r)
        m_rows.push_back(other.cloneRow(r));
}

std::unique_ptr<Table> Table::create(int columns, const QList<qreal> &weights,
                                     LayoutError *error)
{
    if (columns <= 0) {
        setError(error, LayoutError::MalformedTable,
                 QStringLiteral("table needs at least one column, got %1").arg(columns));
        return nullptr;
    }

    QList<qreal> w = weights;
    if (w.isEmpty())
        w = QList<qreal>(columns, 1.0);

    if (w.size() != columns) {
        setError(error, LayoutError::MalformedTable,
                 QStringLiteral("%1 column weights given for %2 columns")
                     .arg(w.size()).arg(columns));
        return nullptr;
    }

    qreal sum = 0;
    for (qreal v : std::as_const(w)) {
        if (v < 0) {
            setError(error, LayoutError::MalformedTable,
                     QStringLiteral("negative column weight %1").arg(v));
            return nullptr;
        }
        sum += v;
    }
    if (sum <= 0) {
        setError(error, LayoutError::MalformedTable,
                 QStringLiteral("column weights sum to zero"));
        return nullptr;
    }

    return std::unique_ptr<Table>(new Table(w));
}

bool Table::addRow(std::vector<ElementPtr> cells, LayoutError *error)
{
    if (int(cells.size()) != columnCount()) {
        setError(error, LayoutError::MalformedTable,
                 QStringLiteral("row %1 has %2 cells, table has %3 columns")
                     .arg(rowCount()).arg(cells.size()).arg(columnCount()));
        return false;
    }
    for (const auto &cell : cells) {
        if (!cell) {
            setError(error, LayoutError::MalformedTable,
                     QStringLiteral("row %1 has an empty cell").arg(rowCount()));
            return false;
        }
    }
    m_rows.push_back(std::move(cells));
    return true;
}

bool Table::addRow(const QStringList &texts, LayoutError *error)
{
    std::vector<ElementPtr> cells;
    cells.reserve(size_t(texts.size()));
    for (const QString &text : texts)
        cells.push_back(std::make_unique<Paragraph>(text));
    return addRow(std::move(cells), error);
}

QList<qreal> Table::columnWidths(qreal totalWidth) const
{
    qreal sum = 0;
    for (qreal w : m_weights)
        sum += w;

    QList<qreal> widths;
    widths.reserve(m_weights.size());
    for (qreal w : m_weights)
        widths.append(sum > 0 ? totalWidth * w / sum : 0);
    return widths;
}

Table::Row Table::cloneRow(int row) const
{
    Row copy;
    copy.reserve(m_rows[size_t(row)].size());
    for (const auto &cell : m_rows[size_t(row)])
        copy.push_back(cell->clone());
    return copy;
}

ElementPtr Table::clone() const
{
    return std::make_unique<Table>(*this);
}

bool Table::renderRow(RenderContext &context, const Area &cursor, int row,
                      const QList<qreal> &widths, const Style &style, bool mustProgress,
                      RowOutcome *out, LayoutError *error) const
{
    const bool header = row < m_headerRowCount;
    const Style cellStyle = header ? Style::merge(style, m_tableStyle.headerTextStyle()) : style;
    const QMarginsF pad = m_tableStyle.cellPadding();
    // A row that starts a fresh page (below repeated headers at most)
    // lays its cells out as if they were at the page top.
    const Area rowArea = cursor.withTarget(&out->content).withPageTop(mustProgress);

    const Row &cells = m_rows[size_t(row)];
    qreal x = 0;
    for (size_t c = 0; c < cells.size(); ++c) {
        const qreal w = widths.value(int(c));
        const Area cellArea = rowArea.column(x, w).shrunk(pad);
        RenderResult r = cells[c]->render(context, cellArea, cellStyle);
        if (r.isFailed()) {
            *error = r.error;
            return false;
        }
        out->height = qMax(out->height, r.height + pad.top() + pad.bottom());
        if (r.isPartial()) {
            out->complete = false;
            out->remainders.push_back(std::move(r.remainder));
        } else {
            out->remainders.push_back(nullptr);
        }
        x += w;
    }
    out->height = qMin(out->height, cursor.remainingHeight());
    return true;
}

void Table::compose(const Area &area, const QList<qreal> &widths,
                    const QList<PlacedRow> &placed, const DrawList &content,
                    qreal height) const
{
    // Backgrounds first, then cell content, then borders on top.
    for (const auto &p : placed) {
        QColor fill;
        if (p.row < m_headerRowCount) {
            if (m_tableStyle.hasHeaderBackground())
                fill = m_tableStyle.headerBackground();
        } else if (m_tableStyle.hasAlternateRowColor()) {
            const int bodyIndex = p.row - m_headerRowCount + m_bodyRowOffset;
            if (bodyIndex % 2 == 1)
                fill = m_tableStyle.alternateRowColor();
        }
        if (fill.isValid())
            area.drawRect(QRectF(0, p.y, area.width(), p.height), fill);
    }

    if (area.target())
        area.target()->append(content);

    const TableStyle::Border inner = m_tableStyle.innerBorder();
    if (inner.width > 0) {
        for (const auto &p : placed) {
            qreal x = 0;
            for (qreal w : widths) {
                area.drawRect(QRectF(x, p.y, w, p.height), QColor(), inner.color, inner.width);
                x += w;
            }
        }
    }

    const TableStyle::Border outer = m_tableStyle.outerBorder();
    if (outer.width > 0 && height > 0)
        area.drawRect(QRectF(0, 0, area.width(), height), QColor(), outer.color, outer.width);
}

std::unique_ptr<Table> Table::continuation(int fromRow, int bodyPlaced) const
{
    auto rest = std::unique_ptr<Table>(new Table(m_weights));
    rest->m_tableStyle = m_tableStyle;
    rest->m_bodyRowOffset = m_bodyRowOffset + bodyPlaced;

    if (fromRow >= m_headerRowCount && m_tableStyle.repeatHeaderRows()) {
        for (int h = 0; h < m_headerRowCount; ++h)
            rest->m_rows.push_back(cloneRow(h));
        rest->m_headerRowCount = m_headerRowCount;
    } else {
        rest->m_headerRowCount = qMax(0, m_headerRowCount - fromRow);
    }
    return rest;
}

RenderResult Table::render(RenderContext &context, const Area &area,
                           const Style &style) const
{
    if (m_rows.empty())
        return RenderResult::done(0);

    const QList<qreal> widths = columnWidths(area.width());
    const bool startedAtTop = area.isPageTop();

    DrawList content;
    Area cursor = area.withTarget(&content);
    QList<PlacedRow> placed;
    qreal used = 0;
    int bodyPlaced = 0;
    const int tableMark = context.diagnosticMark();

    for (int row = 0; row < rowCount(); ++row) {
        RowOutcome outcome;
        LayoutError error;
        const int rowMark = context.diagnosticMark();
        const bool mustProgress = startedAtTop && bodyPlaced == 0;
        if (!renderRow(context, cursor, row, widths, style, mustProgress, &outcome, &error))
            return RenderResult::failed(error);

        if (outcome.complete) {
            placed.append(PlacedRow{row, used, outcome.height});
            content.append(outcome.content);
            cursor.consume(outcome.height);
            used += outcome.height;
            if (row >= m_headerRowCount)
                ++bodyPlaced;
            continue;
        }

        if (bodyPlaced == 0 && !startedAtTop) {
            // Nothing but (possibly) headers would land here: move the whole table.
            context.rollbackDiagnostics(tableMark);
            return RenderResult::partial(0, clone());
        }

        if (bodyPlaced == 0) {
            // The row does not fit even on a fresh page: split it cell by cell.
            qDebug() << "Table: splitting row" << row << "across pages";
            placed.append(PlacedRow{row, used, outcome.height});
            content.append(outcome.content);
            used += outcome.height;
            compose(area, widths, placed, content, used);

            auto rest = continuation(row, bodyPlaced);
            Row split;
            for (size_t c = 0; c < outcome.remainders.size(); ++c) {
                if (outcome.remainders[c])
                    split.push_back(std::move(outcome.remainders[c]));
                else
                    split.push_back(std::make_unique<Container>());
            }
            rest->m_rows.push_back(std::move(split));
            for (int j = row + 1; j < rowCount(); ++j)
                rest->m_rows.push_back(cloneRow(j));
            return RenderResult::partial(used, std::move(rest));
        }

        context.rollbackDiagnostics(rowMark);
        compose(area, widths, placed, content, used);
        auto rest = continuation(row, bodyPlaced);
        for (int j = row; j < rowCount(); ++j)
            rest->m_rows.push_back(cloneRow(j));
        return RenderResult::partial(used, std::move(rest));
    }

    compose(area, widths, placed, content, used);
    return RenderResult::done(used);
}

} // namespace Layout
