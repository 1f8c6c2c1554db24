/*
 * pagerenderer.cpp — Base class for page output backends
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagerenderer.h"

#include <type_traits>

PageRenderer::~PageRenderer() = default;

void PageRenderer::renderPages(const QList<Layout::Page> &pages)
{
    bool first = true;
    for (const auto &page : pages) {
        beginPage(page, first);
        renderPage(page);
        endPage(page);
        first = false;
    }
}

void PageRenderer::renderPage(const Layout::Page &page)
{
    for (const auto &cmd : page.commands)
        renderCommand(cmd);
}

void PageRenderer::renderCommand(const Layout::DrawCommand &command)
{
    std::visit([this](const auto &c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Layout::DrawText>)
            drawText(c.baseline, c.text, c.style, c.width);
        else if constexpr (std::is_same_v<T, Layout::DrawRect>)
            drawRect(c.rect, c.fill, c.stroke, c.strokeWidth);
        else if constexpr (std::is_same_v<T, Layout::DrawImage>)
            drawImage(c.rect, c.image);
    }, command);
}
