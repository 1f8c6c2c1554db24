/*
 * pageallocator.h — Page allocation state machine
 *
 * Keeps a queue of pending top-level elements and a current page area.
 * Each step renders the head of the queue into the area: Done pops it,
 * Partial replaces it with its remainder and closes the page.  A page
 * is also closed when an element asks for a page break or when less
 * than the configured minimum height remains.  Empty pages are never
 * emitted.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAGEALLOCATOR_H
#define FOLIO_PAGEALLOCATOR_H

#include <deque>

#include "documentconfig.h"
#include "element.h"

namespace Layout {

class PageAllocator
{
public:
    enum State { Filling, PageFull };

    PageAllocator(const DocumentConfig &config, RenderContext *context);

    // Elements are borrowed and must outlive run().
    void enqueue(const Element *element);

    // Drive the queue to exhaustion.  On a fatal error the partially
    // filled page is dropped; pages finished before it are kept.
    bool run(LayoutError *error);

    State state() const { return m_state; }
    const QList<Page> &pages() const { return m_pages; }
    QList<Page> takePages();

private:
    struct Pending {
        const Element *element = nullptr;
        ElementPtr owned; // remainder produced by an earlier page

        const Element *get() const { return owned ? owned.get() : element; }
    };

    void startPage();
    void finishPage();
    bool pageHasContent() const;

    DocumentConfig m_config;
    Style m_defaultStyle;
    RenderContext *m_context = nullptr;

    std::deque<Pending> m_queue;
    QList<Page> m_pages;

    State m_state = Filling;
    DrawList m_commands;
    Area m_area;
    qreal m_consumed = 0;
};

} // namespace Layout

#endif // FOLIO_PAGEALLOCATOR_H
