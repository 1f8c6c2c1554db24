/*
 * list.h — Bulleted and numbered lists
 *
 * Markers are fixed when an item is added, so numbering survives page
 * splits unchanged.  The marker is drawn right-aligned in the indent
 * on the first line of its item; continuation fragments carry none.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_LIST_H
#define FOLIO_LIST_H

#include "container.h"

namespace Layout {

class ListItem : public Element
{
public:
    ListItem(const QString &marker, ElementPtr content, qreal indent, qreal markerGap,
             bool continuation = false);
    ListItem(const ListItem &other);

    QString marker() const { return m_marker; }
    bool isContinuation() const { return m_continuation; }
    const Element *content() const { return m_content.get(); }

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    QString m_marker;
    ElementPtr m_content;
    qreal m_indent = 0;
    qreal m_markerGap = 0;
    bool m_continuation = false;
};

class List : public Element
{
public:
    enum Type { Unordered, Ordered };

    static constexpr qreal kDefaultIndent = 28.35;   // 10 mm
    static constexpr qreal kDefaultMarkerGap = 5.67; // 2 mm

    explicit List(Type type = Unordered);

    Type type() const { return m_type; }

    // Options apply to items added afterwards.
    void setBullet(const QString &bullet) { m_bullet = bullet; }
    QString bullet() const { return m_bullet; }
    void setStartNumber(int number) { m_nextNumber = number; }
    void setIndent(qreal indent) { m_indent = indent; }
    qreal indent() const { return m_indent; }
    void setMarkerGap(qreal gap) { m_markerGap = gap; }
    qreal markerGap() const { return m_markerGap; }

    List &addItem(ElementPtr item);
    List &addItem(const QString &text);

    int count() const { return m_items.count(); }
    QString markerAt(int index) const;

    RenderResult render(RenderContext &context, const Area &area,
                        const Style &style) const override;
    ElementPtr clone() const override;

private:
    Type m_type;
    QString m_bullet = QStringLiteral("–");
    int m_nextNumber = 1;
    qreal m_indent = kDefaultIndent;
    qreal m_markerGap = kDefaultMarkerGap;
    Container m_items;
};

} // namespace Layout

#endif // FOLIO_LIST_H
