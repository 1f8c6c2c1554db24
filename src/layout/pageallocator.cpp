/*
 * pageallocator.cpp — Page allocation state machine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageallocator.h"

#include <QDebug>

namespace Layout {

PageAllocator::PageAllocator(const DocumentConfig &config, RenderContext *context)
    : m_config(config)
    , m_defaultStyle(config.effectiveDefaultStyle())
    , m_context(context)
    , m_area(nullptr, QPointF(), 0, 0)
{
    if (m_config.minimumRemainingHeight <= 0)
        m_config.minimumRemainingHeight = DocumentConfig::kDefaultMinimumRemainingHeight;
}

void PageAllocator::enqueue(const Element *element)
{
    if (element)
        m_queue.push_back(Pending{element, nullptr});
}

QList<Page> PageAllocator::takePages()
{
    QList<Page> out;
    out.swap(m_pages);
    return out;
}

void PageAllocator::startPage()
{
    const QRectF content = m_config.pageLayout.contentRect();
    m_commands.clear();
    m_consumed = 0;
    m_area = Area(&m_commands, content.topLeft(), content.width(), content.height(), true);
    m_state = Filling;
    m_context->setPageNumber(m_pages.size());
}

bool PageAllocator::pageHasContent() const
{
    return !m_commands.isEmpty() || m_consumed > 0;
}

void PageAllocator::finishPage()
{
    Page page;
    page.pageNumber = m_pages.size();
    page.pageSize = m_config.pageLayout.pageSize;
    page.margins = m_config.pageLayout.margins;
    page.commands = m_commands;
    page.contentHeight = m_consumed;
    qDebug() << "PageAllocator: finished page" << page.pageNumber + 1
             << "with" << page.commands.size() << "commands, height" << m_consumed;
    m_pages.append(page);
}

bool PageAllocator::run(LayoutError *error)
{
    if (!m_config.pageLayout.isValid()) {
        setError(error, LayoutError::ContentOverflow,
                 QStringLiteral("page content area is empty (%1 x %2pt)")
                     .arg(m_config.pageLayout.contentSize().width())
                     .arg(m_config.pageLayout.contentSize().height()));
        return false;
    }

    startPage();

    while (!m_queue.empty()) {
        const bool exhausted = m_area.remainingHeight() < m_config.minimumRemainingHeight;
        if (m_state == PageFull || exhausted) {
            // An untouched page is reused instead of emitting a blank one.
            if (pageHasContent()) {
                finishPage();
                startPage();
            } else {
                m_state = Filling;
            }
        }

        Pending &head = m_queue.front();
        const bool freshPage = !pageHasContent();
        RenderResult r = head.get()->render(*m_context, m_area, m_defaultStyle);

        if (r.isFailed()) {
            qWarning().noquote() << "PageAllocator: layout failed on page"
                                 << m_pages.size() + 1 << kindName(r.error.kind)
                                 << r.error.message;
            if (error)
                *error = r.error;
            m_commands.clear();
            m_consumed = 0;
            return false;
        }

        const qreal height = qMin(r.height, m_area.remainingHeight());
        m_area.consume(height);
        m_consumed += height;

        if (r.isDone()) {
            m_queue.pop_front();
            if (r.pageBreak)
                m_state = PageFull;
            continue;
        }

        if (!r.remainder) {
            setError(error, LayoutError::ContentOverflow,
                     QStringLiteral("element returned Partial without a remainder"));
            m_commands.clear();
            m_consumed = 0;
            return false;
        }

        if (freshPage && !r.pageBreak && !pageHasContent()) {
            // A fresh page could not take any of it; another page would not either.
            const QString message = QStringLiteral("element makes no progress on empty page %1")
                                        .arg(m_pages.size() + 1);
            qWarning().noquote() << "PageAllocator:" << message;
            setError(error, LayoutError::ContentOverflow, message);
            m_commands.clear();
            m_consumed = 0;
            return false;
        }

        head.owned = std::move(r.remainder);
        m_state = PageFull;
    }

    if (pageHasContent())
        finishPage();
    return true;
}

} // namespace Layout
