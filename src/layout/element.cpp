/*
 * element.cpp — Renderable document element interface
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "element.h"

#include <QDebug>

namespace Layout {

Element::~Element() = default;

RenderContext::RenderContext(TextMeasurer *measurer)
    : m_measurer(measurer)
{
}

void RenderContext::report(LayoutError::Kind kind, const QString &message)
{
    qWarning().noquote() << "Layout: page" << m_pageNumber + 1 << kindName(kind) << message;
    m_diagnostics.append(LayoutDiagnostic{kind, message, m_pageNumber});
}

void RenderContext::rollbackDiagnostics(int mark)
{
    if (mark >= 0 && mark < m_diagnostics.size())
        m_diagnostics.resize(mark);
}

QList<LayoutDiagnostic> RenderContext::takeDiagnostics()
{
    QList<LayoutDiagnostic> out;
    out.swap(m_diagnostics);
    return out;
}

} // namespace Layout
