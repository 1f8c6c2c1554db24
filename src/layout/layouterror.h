/*
 * layouterror.h — Error and diagnostic types reported by the layout core
 *
 * Fatal conditions travel upwards as a LayoutError; non-fatal ones
 * (content that overflows the area but is drawn anyway) are collected
 * as LayoutDiagnostic entries on the render context.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_LAYOUTERROR_H
#define FOLIO_LAYOUTERROR_H

#include <QString>

namespace Layout {

struct LayoutError {
    enum Kind {
        None,
        ContentOverflow,     // unsplittable unit larger than the content area
        InvalidStyle,        // font reference the metrics collaborator cannot resolve
        MalformedTable,      // zero columns, negative weights, wrong cell count
        CollaboratorFailure, // font-metrics or hyphenator call failed
    };

    Kind kind = None;
    QString message;

    bool isValid() const { return kind != None; }

    bool operator==(const LayoutError &o) const
    {
        return kind == o.kind && message == o.message;
    }
};

QString kindName(LayoutError::Kind kind);

// Fill an optional error out-parameter.
inline void setError(LayoutError *error, LayoutError::Kind kind, const QString &message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

struct LayoutDiagnostic {
    LayoutError::Kind kind = LayoutError::ContentOverflow;
    QString message;
    int pageNumber = -1; // 0-based page the diagnostic was raised on
};

} // namespace Layout

#endif // FOLIO_LAYOUTERROR_H
