/*
 * codeblockrenderer.cpp — Syntax-highlighted source code as pre-measured blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "codeblockrenderer.h"
#include "blocks.h"
#include "textmeasurer.h"

#include <QDebug>

#include <KSyntaxHighlighting/AbstractHighlighter>
#include <KSyntaxHighlighting/Definition>
#include <KSyntaxHighlighting/Format>
#include <KSyntaxHighlighting/Repository>
#include <KSyntaxHighlighting/State>
#include <KSyntaxHighlighting/Theme>

#include <algorithm>

// Collects formatted spans per line instead of painting them.
class CodeSpanCollector : public KSyntaxHighlighting::AbstractHighlighter
{
public:
    struct Span {
        int start;
        int length;
        QColor foreground;
        bool bold = false;
        bool italic = false;
    };

    CodeSpanCollector()
    {
        static KSyntaxHighlighting::Repository repo;
        m_repo = &repo;
        setTheme(repo.defaultTheme(KSyntaxHighlighting::Repository::LightTheme));
    }

    void setThemeName(const QString &name)
    {
        KSyntaxHighlighting::Theme t = name.isEmpty()
            ? m_repo->defaultTheme(KSyntaxHighlighting::Repository::LightTheme)
            : m_repo->theme(name);
        if (!t.isValid()) {
            qWarning() << "CodeBlockRenderer: unknown theme" << name;
            return;
        }
        setTheme(t);
    }

    // Spans per line; empty lists when the language is unknown.
    QList<QList<Span>> highlight(const QStringList &lines, const QString &language)
    {
        QList<QList<Span>> result(lines.size());

        auto def = m_repo->definitionForName(language);
        if (!def.isValid())
            def = m_repo->definitionForFileName(QStringLiteral("file.") + language);
        if (!def.isValid()) {
            if (!language.isEmpty())
                qDebug() << "CodeBlockRenderer: no syntax definition for" << language;
            return result;
        }

        setDefinition(def);

        KSyntaxHighlighting::State state;
        for (int i = 0; i < lines.size(); ++i) {
            m_spans.clear();
            state = highlightLine(lines[i], state);
            result[i] = m_spans;
        }
        return result;
    }

protected:
    void applyFormat(int offset, int length,
                     const KSyntaxHighlighting::Format &format) override
    {
        if (length == 0)
            return;

        Span span;
        span.start = offset;
        span.length = length;
        if (format.hasTextColor(theme()))
            span.foreground = format.textColor(theme());
        span.bold = format.isBold(theme());
        span.italic = format.isItalic(theme());
        m_spans.append(span);
    }

private:
    KSyntaxHighlighting::Repository *m_repo = nullptr;
    QList<Span> m_spans;
};

CodeBlockRenderer::CodeBlockRenderer(TextMeasurer *measurer)
    : m_measurer(measurer)
    , m_collector(std::make_unique<CodeSpanCollector>())
{
}

CodeBlockRenderer::~CodeBlockRenderer() = default;

void CodeBlockRenderer::setThemeName(const QString &name)
{
    m_collector->setThemeName(name);
}

std::unique_ptr<Layout::Container> CodeBlockRenderer::render(const QString &code,
                                                             const QString &language,
                                                             const Style &style,
                                                             Layout::LayoutError *error)
{
    QString source = code;
    source.replace(QLatin1Char('\t'), QString(m_tabWidth, QLatin1Char(' ')));
    if (source.endsWith(QLatin1Char('\n')))
        source.chop(1);
    const QStringList lines = source.split(QLatin1Char('\n'));

    const QList<QList<CodeSpanCollector::Span>> spans = m_collector->highlight(lines, language);

    FontLineMetrics base;
    if (!m_measurer->lineMetrics(style, &base, error))
        return nullptr;
    const qreal lineHeight = style.lineHeight();

    auto block = std::make_unique<Layout::Container>(Layout::Container::Vertical);
    for (int i = 0; i < lines.size(); ++i) {
        const QString &line = lines[i];

        // Cover the whole line: highlighted spans plus plain gaps.
        struct Piece { int start; int length; Style style; };
        QList<Piece> pieces;
        QList<CodeSpanCollector::Span> lineSpans = spans.value(i);
        std::sort(lineSpans.begin(), lineSpans.end(),
                  [](const auto &a, const auto &b) { return a.start < b.start; });
        int pos = 0;
        for (const auto &span : std::as_const(lineSpans)) {
            const int start = qMax(span.start, pos);
            const int end = qMin(span.start + span.length, int(line.length()));
            if (end <= start)
                continue;
            if (start > pos)
                pieces.append(Piece{pos, start - pos, style});
            Style s = style.withBold(span.bold).withItalic(span.italic);
            if (span.foreground.isValid())
                s = s.withColor(span.foreground);
            pieces.append(Piece{start, end - start, s});
            pos = end;
        }
        if (pos < line.length())
            pieces.append(Piece{pos, int(line.length()) - pos, style});

        qreal ascent = base.ascent;
        for (const auto &p : std::as_const(pieces)) {
            FontLineMetrics m;
            if (!m_measurer->lineMetrics(p.style, &m, error))
                return nullptr;
            ascent = qMax(ascent, m.ascent);
        }

        Layout::DrawList commands;
        qreal x = 0;
        for (const auto &p : std::as_const(pieces)) {
            const QString text = line.mid(p.start, p.length);
            qreal width = 0;
            if (!m_measurer->measure(text, p.style, &width, error))
                return nullptr;
            // Leading and inner blanks only advance the pen.
            if (!text.trimmed().isEmpty())
                commands.append(Layout::DrawText{QPointF(x, ascent), text, p.style, width});
            x += width;
        }

        block->addElement(std::make_unique<Layout::ExternalBlock>(
            QSizeF(x, lineHeight), commands, QStringLiteral("code")));
    }
    return block;
}
