#include <gtest/gtest.h>

#include <QPainter>

#include "fakefontmetrics.h"
#include "painterpagerenderer.h"

using namespace Layout;

namespace {

Page page(int number, const DrawList &commands)
{
    Page p;
    p.pageNumber = number;
    p.pageSize = QSizeF(100, 100);
    p.commands = commands;
    return p;
}

DrawText text(const QString &s, qreal x, qreal y)
{
    DrawText t;
    t.baseline = QPointF(x, y);
    t.text = s;
    return t;
}

DrawRect filled(const QRectF &rect, const QColor &fill)
{
    DrawRect r;
    r.rect = rect;
    r.fill = fill;
    return r;
}

} // namespace

TEST(PageRendererTest, PagesAreBracketedAndCommandsKeepTheirOrder)
{
    DrawImage image;
    image.rect = QRectF(5, 6, 10, 10);

    const QList<Page> pages = {
        page(0, {DrawCommand(filled(QRectF(0, 0, 20, 10), Qt::gray)),
                 DrawCommand(text(QStringLiteral("one"), 1, 8))}),
        page(1, {DrawCommand(text(QStringLiteral("two"), 2, 9)), DrawCommand(image)}),
    };

    RecordingRenderer renderer;
    renderer.renderPages(pages);

    EXPECT_EQ(renderer.events,
              QStringList({QStringLiteral("begin 0 first"), QStringLiteral("rect 0,0 20x10"),
                           QStringLiteral("text one 1,8"), QStringLiteral("end 0"),
                           QStringLiteral("begin 1"), QStringLiteral("text two 2,9"),
                           QStringLiteral("image 5,6"), QStringLiteral("end 1")}));
}

TEST(PageRendererTest, NoPagesMeansNoCalls)
{
    RecordingRenderer renderer;
    renderer.renderPages({});
    EXPECT_TRUE(renderer.events.isEmpty());
}

TEST(PageRendererTest, TranslatedMovesEveryKindOfCommand)
{
    const QPointF offset(3, 4);
    const DrawCommand t = translated(DrawCommand(text(QStringLiteral("x"), 1, 1)), offset);
    EXPECT_EQ(std::get<DrawText>(t).baseline, QPointF(4, 5));

    const DrawCommand r = translated(DrawCommand(filled(QRectF(1, 1, 2, 2), Qt::red)), offset);
    EXPECT_EQ(std::get<DrawRect>(r).rect, QRectF(4, 5, 2, 2));
    EXPECT_EQ(std::get<DrawRect>(r).fill, QColor(Qt::red));
}

TEST(PainterPageRendererTest, FillsRectanglesOntoThePainter)
{
    QImage target(40, 40, QImage::Format_ARGB32);
    target.fill(Qt::white);

    QPainter painter(&target);
    PainterPageRenderer renderer;
    renderer.setPainter(&painter);
    renderer.renderPages({page(0, {DrawCommand(filled(QRectF(10, 10, 20, 20), Qt::red))})});
    painter.end();

    EXPECT_EQ(target.pixelColor(20, 20), QColor(Qt::red));
    EXPECT_EQ(target.pixelColor(5, 5), QColor(Qt::white));
}

TEST(PainterPageRendererTest, NullImageIsSkipped)
{
    QImage target(20, 20, QImage::Format_ARGB32);
    target.fill(Qt::white);

    QPainter painter(&target);
    PainterPageRenderer renderer;
    renderer.setPainter(&painter);
    renderer.drawImage(QRectF(0, 0, 20, 20), QImage());
    painter.end();

    EXPECT_EQ(target.pixelColor(10, 10), QColor(Qt::white));
}

TEST(PainterPageRendererTest, WithoutPainterNothingHappens)
{
    PainterPageRenderer renderer;
    renderer.renderPages({page(0, {DrawCommand(filled(QRectF(0, 0, 5, 5), Qt::red))})});
    SUCCEED();
}
