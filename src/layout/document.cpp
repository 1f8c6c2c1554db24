/*
 * document.cpp — Document model and layout driver
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "document.h"
#include "pageallocator.h"
#include "pagerenderer.h"
#include "textmeasurer.h"

#include <QDebug>

namespace Layout {

Document::Document(const DocumentConfig &config)
    : m_config(config)
{
}

Document &Document::addElement(ElementPtr element)
{
    if (element)
        m_elements.push_back(std::move(element));
    return *this;
}

DocumentDriver::DocumentDriver(FontMetrics *metrics, AbstractHyphenator *hyphenator)
    : m_metrics(metrics)
    , m_hyphenator(hyphenator)
{
}

LayoutResult DocumentDriver::layout(Document &document) const
{
    LayoutResult result;

    // Font handles are cached per run.
    TextMeasurer measurer(m_metrics, m_hyphenator);
    RenderContext context(&measurer);
    PageAllocator allocator(document.config(), &context);
    for (const auto &element : document.elements())
        allocator.enqueue(element.get());

    allocator.run(&result.error);
    result.pages = allocator.takePages();
    result.diagnostics = context.takeDiagnostics();
    document.setPages(result.pages);

    qDebug() << "DocumentDriver: laid out" << result.pages.size() << "pages,"
             << result.diagnostics.size() << "diagnostics";
    return result;
}

LayoutResult DocumentDriver::render(Document &document, PageRenderer *renderer) const
{
    LayoutResult result = layout(document);
    if (!result.ok() || !renderer)
        return result;
    renderer->renderPages(result.pages);
    return result;
}

} // namespace Layout
