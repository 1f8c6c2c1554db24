/*
 * codeblockrenderer.h — Syntax-highlighted source code as pre-measured blocks
 *
 * Highlights source with KSyntaxHighlighting and emits one ExternalBlock
 * per source line inside a vertical Container, so a code listing can
 * break between lines but never inside one.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_CODEBLOCKRENDERER_H
#define FOLIO_CODEBLOCKRENDERER_H

#include <QString>

#include <memory>

#include "container.h"

class CodeSpanCollector;
class TextMeasurer;

class CodeBlockRenderer
{
public:
    explicit CodeBlockRenderer(TextMeasurer *measurer);
    ~CodeBlockRenderer();

    // KSyntaxHighlighting theme name; empty selects the default light theme
    void setThemeName(const QString &name);

    void setTabWidth(int width) { m_tabWidth = qMax(1, width); }
    int tabWidth() const { return m_tabWidth; }

    // An unknown language renders as plain text in style.  Returns null
    // and fills error when measuring fails.
    std::unique_ptr<Layout::Container> render(const QString &code, const QString &language,
                                              const Style &style,
                                              Layout::LayoutError *error = nullptr);

private:
    TextMeasurer *m_measurer = nullptr;
    std::unique_ptr<CodeSpanCollector> m_collector;
    int m_tabWidth = 4;
};

#endif // FOLIO_CODEBLOCKRENDERER_H
