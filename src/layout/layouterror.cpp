/*
 * layouterror.cpp — Error and diagnostic types reported by the layout core
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layouterror.h"

namespace Layout {

QString kindName(LayoutError::Kind kind)
{
    switch (kind) {
    case LayoutError::None:                return QStringLiteral("None");
    case LayoutError::ContentOverflow:     return QStringLiteral("ContentOverflow");
    case LayoutError::InvalidStyle:        return QStringLiteral("InvalidStyle");
    case LayoutError::MalformedTable:      return QStringLiteral("MalformedTable");
    case LayoutError::CollaboratorFailure: return QStringLiteral("CollaboratorFailure");
    }
    return QStringLiteral("Unknown");
}

} // namespace Layout
