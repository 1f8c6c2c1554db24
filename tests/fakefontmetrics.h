/*
 * fakefontmetrics.h — Deterministic collaborators for the layout tests
 *
 * FakeFontMetrics gives every codepoint an advance of half the font
 * size, ascent 0.8 * size and descent 0.2 * size.  Families named
 * "Missing" do not resolve; "Broken" resolves but fails every glyph
 * lookup.  FakeHyphenator answers from a word table.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_TESTS_FAKEFONTMETRICS_H
#define FOLIO_TESTS_FAKEFONTMETRICS_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include <ostream>
#include <type_traits>
#include <variant>

#include "drawcommand.h"
#include "fontmetrics.h"
#include "hyphenator.h"
#include "pagerenderer.h"

inline void PrintTo(const QString &s, std::ostream *os)
{
    *os << '"' << s.toStdString() << '"';
}

class FakeFontMetrics : public FontMetrics
{
public:
    static constexpr qreal kAdvance = 0.5;
    static constexpr qreal kAscent = 0.8;
    static constexpr qreal kDescent = 0.2;

    FontHandle resolveFont(const QString &family, bool bold, bool italic) override
    {
        ++resolveCalls;
        if (family == QLatin1String("Missing")) {
            m_error = QStringLiteral("no face for %1").arg(family);
            return FontHandle();
        }
        const QString key = family + QLatin1Char('|') + QLatin1Char(bold ? '1' : '0')
            + QLatin1Char(italic ? '1' : '0');
        int id = m_keys.indexOf(key);
        if (id < 0) {
            id = int(m_keys.size());
            m_keys.append(key);
        }
        return FontHandle{id};
    }

    bool glyphWidth(FontHandle font, uint, qreal sizePoints, qreal *width) const override
    {
        if (!font.isValid() || font.id >= m_keys.size())
            return false;
        if (m_keys.at(font.id).startsWith(QLatin1String("Broken|"))) {
            m_error = QStringLiteral("glyph table unreadable");
            return false;
        }
        *width = sizePoints * kAdvance;
        return true;
    }

    bool lineMetrics(FontHandle font, qreal sizePoints,
                     FontLineMetrics *metrics) const override
    {
        if (!font.isValid() || font.id >= m_keys.size())
            return false;
        metrics->ascent = sizePoints * kAscent;
        metrics->descent = sizePoints * kDescent;
        return true;
    }

    QString errorString() const override { return m_error; }

    int resolveCalls = 0;

private:
    QStringList m_keys;
    mutable QString m_error;
};

class FakeHyphenator : public AbstractHyphenator
{
public:
    void add(const QString &word, const QList<int> &offsets) { m_table.insert(word, offsets); }
    void setFailing(bool on) { m_failing = on; }

    bool hyphenate(const QString &word, const QString &, QList<int> *offsets) override
    {
        if (m_failing)
            return false;
        *offsets = m_table.value(word);
        return true;
    }

private:
    QHash<QString, QList<int>> m_table;
    bool m_failing = false;
};

// Records the primitive calls a PageRenderer receives.
class RecordingRenderer : public PageRenderer
{
public:
    void beginPage(const Layout::Page &page, bool first) override
    {
        events << QStringLiteral("begin %1%2").arg(page.pageNumber)
                      .arg(first ? QStringLiteral(" first") : QString());
    }
    void endPage(const Layout::Page &page) override
    {
        events << QStringLiteral("end %1").arg(page.pageNumber);
    }
    void drawText(const QPointF &baseline, const QString &text, const Style &,
                  qreal) override
    {
        events << QStringLiteral("text %1 %2,%3").arg(text).arg(baseline.x()).arg(baseline.y());
    }
    void drawRect(const QRectF &rect, const QColor &, const QColor &, qreal) override
    {
        events << QStringLiteral("rect %1,%2 %3x%4")
                      .arg(rect.x()).arg(rect.y()).arg(rect.width()).arg(rect.height());
    }
    void drawImage(const QRectF &rect, const QImage &) override
    {
        events << QStringLiteral("image %1,%2").arg(rect.x()).arg(rect.y());
    }

    QStringList events;
};

namespace TestUtil {

inline QList<Layout::DrawText> textCommands(const Layout::DrawList &list)
{
    QList<Layout::DrawText> out;
    for (const auto &cmd : list) {
        if (const auto *t = std::get_if<Layout::DrawText>(&cmd))
            out.append(*t);
    }
    return out;
}

inline QStringList texts(const Layout::DrawList &list)
{
    QStringList out;
    for (const auto &t : textCommands(list))
        out << t.text;
    return out;
}

inline QList<Layout::DrawRect> rectCommands(const Layout::DrawList &list)
{
    QList<Layout::DrawRect> out;
    for (const auto &cmd : list) {
        if (const auto *r = std::get_if<Layout::DrawRect>(&cmd))
            out.append(*r);
    }
    return out;
}

inline int imageCount(const Layout::DrawList &list)
{
    int n = 0;
    for (const auto &cmd : list)
        n += std::holds_alternative<Layout::DrawImage>(cmd) ? 1 : 0;
    return n;
}

// Distinct baselines, in draw order
inline QList<qreal> baselines(const Layout::DrawList &list)
{
    QList<qreal> out;
    for (const auto &t : textCommands(list)) {
        if (out.isEmpty() || !qFuzzyCompare(out.last(), t.baseline.y()))
            out.append(t.baseline.y());
    }
    return out;
}

// Drawn characters, spaces excluded
inline int glyphCount(const Layout::DrawList &list)
{
    int n = 0;
    for (const auto &t : textCommands(list)) {
        QString s = t.text;
        s.remove(QLatin1Char(' '));
        n += int(s.length());
    }
    return n;
}

} // namespace TestUtil

#endif // FOLIO_TESTS_FAKEFONTMETRICS_H
