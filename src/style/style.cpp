/*
 * style.cpp — Immutable text style with cascading merge
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "style.h"
#include "layouterror.h"

#include <QDebug>

QString Style::defaultFontFamily()
{
    return QStringLiteral("Noto Serif");
}

Style Style::withFontFamily(const QString &family) const
{
    Style s = *this;
    s.m_fontFamily = family;
    s.m_hasFontFamily = !family.isEmpty();
    return s;
}

Style Style::withFontSize(qreal pts) const
{
    if (pts <= 0) {
        qWarning() << "Style: ignoring non-positive font size" << pts;
        return *this;
    }
    Style s = *this;
    s.m_fontSize = pts;
    s.m_hasFontSize = true;
    return s;
}

Style Style::withBold(bool on) const
{
    Style s = *this;
    s.m_bold = on;
    s.m_hasBold = true;
    return s;
}

Style Style::withItalic(bool on) const
{
    Style s = *this;
    s.m_italic = on;
    s.m_hasItalic = true;
    return s;
}

Style Style::withUnderline(bool on) const
{
    Style s = *this;
    s.m_underline = on;
    s.m_hasUnderline = true;
    return s;
}

Style Style::withStrikethrough(bool on) const
{
    Style s = *this;
    s.m_strikethrough = on;
    s.m_hasStrikethrough = true;
    return s;
}

Style Style::withColor(const QColor &color) const
{
    Style s = *this;
    s.m_color = color;
    s.m_hasColor = color.isValid();
    return s;
}

Style Style::withLineSpacing(qreal factor) const
{
    if (factor <= 0) {
        qWarning() << "Style: ignoring non-positive line spacing" << factor;
        return *this;
    }
    Style s = *this;
    s.m_lineSpacing = factor;
    s.m_hasLineSpacing = true;
    return s;
}

Style Style::withLanguage(const QString &language) const
{
    Style s = *this;
    s.m_language = language;
    s.m_hasLanguage = true;
    return s;
}

QString Style::fontFamily() const
{
    return m_hasFontFamily ? m_fontFamily : defaultFontFamily();
}

Style Style::merge(const Style &base, const Style &override)
{
    Style s = base;
    if (override.m_hasFontFamily)    { s.m_fontFamily = override.m_fontFamily; s.m_hasFontFamily = true; }
    if (override.m_hasFontSize)      { s.m_fontSize = override.m_fontSize; s.m_hasFontSize = true; }
    if (override.m_hasBold)          { s.m_bold = override.m_bold; s.m_hasBold = true; }
    if (override.m_hasItalic)        { s.m_italic = override.m_italic; s.m_hasItalic = true; }
    if (override.m_hasUnderline)     { s.m_underline = override.m_underline; s.m_hasUnderline = true; }
    if (override.m_hasStrikethrough) { s.m_strikethrough = override.m_strikethrough; s.m_hasStrikethrough = true; }
    if (override.m_hasColor)         { s.m_color = override.m_color; s.m_hasColor = true; }
    if (override.m_hasLineSpacing)   { s.m_lineSpacing = override.m_lineSpacing; s.m_hasLineSpacing = true; }
    if (override.m_hasLanguage)      { s.m_language = override.m_language; s.m_hasLanguage = true; }
    return s;
}

FontHandle Style::resolveFont(FontMetrics *metrics, Layout::LayoutError *error) const
{
    if (!metrics) {
        Layout::setError(error, Layout::LayoutError::CollaboratorFailure,
                         QStringLiteral("no font metrics available"));
        return FontHandle();
    }
    FontHandle handle = metrics->resolveFont(fontFamily(), m_bold, m_italic);
    if (!handle.isValid()) {
        QString detail = metrics->errorString();
        Layout::setError(error, Layout::LayoutError::InvalidStyle,
                         QStringLiteral("cannot resolve font \"%1\"%2%3%4")
                             .arg(fontFamily(),
                                  m_bold ? QStringLiteral(" bold") : QString(),
                                  m_italic ? QStringLiteral(" italic") : QString(),
                                  detail.isEmpty() ? QString() : QStringLiteral(": ") + detail));
    }
    return handle;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

Style Style::fromJson(const QJsonObject &obj)
{
    Style s;
    if (obj.contains(QLatin1String("fontFamily")))
        s = s.withFontFamily(obj.value(QLatin1String("fontFamily")).toString());
    if (obj.contains(QLatin1String("fontSize")))
        s = s.withFontSize(obj.value(QLatin1String("fontSize")).toDouble(kDefaultFontSize));
    if (obj.contains(QLatin1String("bold")))
        s = s.withBold(obj.value(QLatin1String("bold")).toBool());
    if (obj.contains(QLatin1String("italic")))
        s = s.withItalic(obj.value(QLatin1String("italic")).toBool());
    if (obj.contains(QLatin1String("underline")))
        s = s.withUnderline(obj.value(QLatin1String("underline")).toBool());
    if (obj.contains(QLatin1String("strikethrough")))
        s = s.withStrikethrough(obj.value(QLatin1String("strikethrough")).toBool());
    if (obj.contains(QLatin1String("color"))) {
        QColor c(obj.value(QLatin1String("color")).toString());
        if (c.isValid())
            s = s.withColor(c);
        else
            qWarning() << "Style: invalid color" << obj.value(QLatin1String("color")).toString();
    }
    if (obj.contains(QLatin1String("lineSpacing")))
        s = s.withLineSpacing(obj.value(QLatin1String("lineSpacing")).toDouble(kDefaultLineSpacing));
    if (obj.contains(QLatin1String("language")))
        s = s.withLanguage(obj.value(QLatin1String("language")).toString());
    return s;
}

QJsonObject Style::toJson() const
{
    QJsonObject obj;
    if (m_hasFontFamily)    obj[QLatin1String("fontFamily")] = m_fontFamily;
    if (m_hasFontSize)      obj[QLatin1String("fontSize")] = m_fontSize;
    if (m_hasBold)          obj[QLatin1String("bold")] = m_bold;
    if (m_hasItalic)        obj[QLatin1String("italic")] = m_italic;
    if (m_hasUnderline)     obj[QLatin1String("underline")] = m_underline;
    if (m_hasStrikethrough) obj[QLatin1String("strikethrough")] = m_strikethrough;
    if (m_hasColor)         obj[QLatin1String("color")] = m_color.name();
    if (m_hasLineSpacing)   obj[QLatin1String("lineSpacing")] = m_lineSpacing;
    if (m_hasLanguage)      obj[QLatin1String("language")] = m_language;
    return obj;
}

bool Style::operator==(const Style &o) const
{
    return m_hasFontFamily == o.m_hasFontFamily && m_fontFamily == o.m_fontFamily
        && m_hasFontSize == o.m_hasFontSize && qFuzzyCompare(fontSize(), o.fontSize())
        && m_hasBold == o.m_hasBold && m_bold == o.m_bold
        && m_hasItalic == o.m_hasItalic && m_italic == o.m_italic
        && m_hasUnderline == o.m_hasUnderline && m_underline == o.m_underline
        && m_hasStrikethrough == o.m_hasStrikethrough && m_strikethrough == o.m_strikethrough
        && m_hasColor == o.m_hasColor && color() == o.color()
        && m_hasLineSpacing == o.m_hasLineSpacing && qFuzzyCompare(lineSpacing(), o.lineSpacing())
        && m_hasLanguage == o.m_hasLanguage && m_language == o.m_language;
}
