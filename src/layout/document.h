/*
 * document.h — Document model and layout driver
 *
 * A Document owns its configuration and top-level elements; after
 * layout it also holds the produced pages.  DocumentDriver wires the
 * collaborators together, runs the page allocator over the elements
 * and hands the pages to a PageRenderer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DOCUMENT_H
#define FOLIO_DOCUMENT_H

#include <vector>

#include "documentconfig.h"
#include "element.h"

class AbstractHyphenator;
class FontMetrics;
class PageRenderer;

namespace Layout {

struct LayoutResult {
    QList<Page> pages;
    QList<LayoutDiagnostic> diagnostics;
    LayoutError error;

    bool ok() const { return !error.isValid(); }
};

class Document
{
public:
    explicit Document(const DocumentConfig &config = DocumentConfig());

    const DocumentConfig &config() const { return m_config; }

    Document &addElement(ElementPtr element);
    const std::vector<ElementPtr> &elements() const { return m_elements; }

    // Output of the last layout run
    const QList<Page> &pages() const { return m_pages; }
    void setPages(const QList<Page> &pages) { m_pages = pages; }

private:
    DocumentConfig m_config;
    std::vector<ElementPtr> m_elements;
    QList<Page> m_pages;
};

class DocumentDriver
{
public:
    explicit DocumentDriver(FontMetrics *metrics, AbstractHyphenator *hyphenator = nullptr);

    // Lay out every top-level element.  The document's elements are not
    // modified, so the same document can be laid out again.
    LayoutResult layout(Document &document) const;

    // Lay out, then replay the pages onto renderer.  Nothing is rendered
    // when layout fails.
    LayoutResult render(Document &document, PageRenderer *renderer) const;

private:
    FontMetrics *m_metrics = nullptr;
    AbstractHyphenator *m_hyphenator = nullptr;
};

} // namespace Layout

#endif // FOLIO_DOCUMENT_H
