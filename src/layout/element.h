/*
 * element.h — Renderable document element interface
 *
 * An element renders as much of itself as fits into an Area and
 * reports what happened: Done (everything placed), Partial (some or
 * nothing placed, with a remainder element holding the rest), or
 * Failed (fatal error).  Elements are immutable once handed to a
 * Document; rendering never modifies them, so a remainder is always a
 * fresh element.  The caller, not the element, advances the area by
 * the reported height.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_ELEMENT_H
#define FOLIO_ELEMENT_H

#include <QList>

#include <memory>

#include "area.h"
#include "layouterror.h"
#include "style.h"

class TextMeasurer;

namespace Layout {

class Element;
using ElementPtr = std::unique_ptr<Element>;

struct RenderResult {
    enum Status { Done, Partial, Failed };

    Status status = Done;
    qreal height = 0;         // vertical space used in the area
    ElementPtr remainder;     // set for Partial
    bool pageBreak = false;   // close the page after this result
    LayoutError error;        // set for Failed

    bool isDone() const { return status == Done; }
    bool isPartial() const { return status == Partial; }
    bool isFailed() const { return status == Failed; }

    static RenderResult done(qreal height)
    {
        RenderResult r;
        r.height = height;
        return r;
    }

    static RenderResult partial(qreal height, ElementPtr remainder)
    {
        RenderResult r;
        r.status = Partial;
        r.height = height;
        r.remainder = std::move(remainder);
        return r;
    }

    static RenderResult failed(const LayoutError &error)
    {
        RenderResult r;
        r.status = Failed;
        r.error = error;
        return r;
    }
};

// Per-layout state shared by every element render call.
class RenderContext
{
public:
    explicit RenderContext(TextMeasurer *measurer);

    TextMeasurer *measurer() const { return m_measurer; }

    int pageNumber() const { return m_pageNumber; }
    void setPageNumber(int page) { m_pageNumber = page; }

    // Record a non-fatal problem on the current page.
    void report(LayoutError::Kind kind, const QString &message);
    const QList<LayoutDiagnostic> &diagnostics() const { return m_diagnostics; }
    QList<LayoutDiagnostic> takeDiagnostics();

    // Diagnostics raised by output that is later thrown away (a trial
    // render that gets deferred) are dropped back to a mark.
    int diagnosticMark() const { return int(m_diagnostics.size()); }
    void rollbackDiagnostics(int mark);

private:
    TextMeasurer *m_measurer = nullptr;
    int m_pageNumber = 0;
    QList<LayoutDiagnostic> m_diagnostics;
};

class Element
{
public:
    virtual ~Element();

    virtual RenderResult render(RenderContext &context, const Area &area,
                                const Style &style) const = 0;

    virtual ElementPtr clone() const = 0;

protected:
    Element() = default;
    Element(const Element &) = default;
    Element &operator=(const Element &) = default;
};

} // namespace Layout

#endif // FOLIO_ELEMENT_H
