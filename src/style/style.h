/*
 * style.h — Immutable text style with cascading merge
 *
 * Every field carries a has-flag; unset fields fall back to documented
 * defaults on read.  Styles are values: the with*() builders return a
 * modified copy and merge() overlays the set fields of one style onto
 * another without touching either input.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_STYLE_H
#define FOLIO_STYLE_H

#include <QColor>
#include <QJsonObject>
#include <QString>

#include "fontmetrics.h"

namespace Layout {
struct LayoutError;
}

class Style
{
public:
    static constexpr qreal kDefaultFontSize = 12.0;
    static constexpr qreal kDefaultLineSpacing = 1.0;
    static QString defaultFontFamily();

    Style() = default;

    // Builders
    Style withFontFamily(const QString &family) const;
    Style withFontSize(qreal pts) const;
    Style withBold(bool on = true) const;
    Style withItalic(bool on = true) const;
    Style withUnderline(bool on = true) const;
    Style withStrikethrough(bool on = true) const;
    Style withColor(const QColor &color) const;
    Style withLineSpacing(qreal factor) const;
    Style withLanguage(const QString &language) const;

    // Resolved getters (defaults applied)
    QString fontFamily() const;
    qreal fontSize() const { return m_hasFontSize ? m_fontSize : kDefaultFontSize; }
    bool isBold() const { return m_bold; }
    bool isItalic() const { return m_italic; }
    bool isUnderline() const { return m_underline; }
    bool isStrikethrough() const { return m_strikethrough; }
    QColor color() const { return m_hasColor ? m_color : QColor(Qt::black); }
    qreal lineSpacing() const { return m_hasLineSpacing ? m_lineSpacing : kDefaultLineSpacing; }
    QString language() const { return m_language; }

    // Height of one line set in this style: size * line-spacing
    qreal lineHeight() const { return fontSize() * lineSpacing(); }

    // Has* flags
    bool hasFontFamily() const { return m_hasFontFamily; }
    bool hasFontSize() const { return m_hasFontSize; }
    bool hasBold() const { return m_hasBold; }
    bool hasItalic() const { return m_hasItalic; }
    bool hasUnderline() const { return m_hasUnderline; }
    bool hasStrikethrough() const { return m_hasStrikethrough; }
    bool hasColor() const { return m_hasColor; }
    bool hasLineSpacing() const { return m_hasLineSpacing; }
    bool hasLanguage() const { return m_hasLanguage; }

    // Fields set in override win; everything else comes from base.
    static Style merge(const Style &base, const Style &override);
    Style mergedWith(const Style &override) const { return merge(*this, override); }

    // Ask the metrics collaborator for the face this style names.
    // Returns an invalid handle and fills error (InvalidStyle) when the
    // family/weight/slant combination cannot be resolved.
    FontHandle resolveFont(FontMetrics *metrics, Layout::LayoutError *error) const;

    static Style fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    bool operator==(const Style &o) const;
    bool operator!=(const Style &o) const { return !(*this == o); }

private:
    QString m_fontFamily;
    qreal m_fontSize = 0;
    bool m_bold = false;
    bool m_italic = false;
    bool m_underline = false;
    bool m_strikethrough = false;
    QColor m_color;
    qreal m_lineSpacing = 0;
    QString m_language;

    bool m_hasFontFamily = false;
    bool m_hasFontSize = false;
    bool m_hasBold = false;
    bool m_hasItalic = false;
    bool m_hasUnderline = false;
    bool m_hasStrikethrough = false;
    bool m_hasColor = false;
    bool m_hasLineSpacing = false;
    bool m_hasLanguage = false;
};

// A piece of text carrying its own (partial) style.
struct StyledString {
    QString text;
    Style style;

    bool operator==(const StyledString &o) const { return text == o.text && style == o.style; }
};

#endif // FOLIO_STYLE_H
