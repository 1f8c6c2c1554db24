#include <gtest/gtest.h>

#include "blocks.h"
#include "breaks.h"
#include "container.h"
#include "decorators.h"
#include "fakefontmetrics.h"
#include "list.h"
#include "paragraph.h"
#include "textmeasurer.h"

using namespace Layout;
using namespace TestUtil;

namespace {

// Size 10: 5pt per character, 10pt lines, ascent 8.
class ElementsTest : public ::testing::Test
{
protected:
    Area area(qreal width, qreal height, bool pageTop = true)
    {
        return Area(&m_out, QPointF(0, 0), width, height, pageTop);
    }

    RenderResult render(const Element &element, const Area &a)
    {
        return element.render(m_context, a, m_base);
    }

    // n distinct four-letter words: "aaaa bbbb cccc ..."
    static QString words(int n)
    {
        QStringList list;
        for (int i = 0; i < n; ++i)
            list << QString(4, QChar(QLatin1Char('a').unicode() + i));
        return list.join(QLatin1Char(' '));
    }

    const Style m_base = Style().withFontSize(10);
    FakeFontMetrics m_metrics;
    TextMeasurer m_measurer{&m_metrics};
    RenderContext m_context{&m_measurer};
    DrawList m_out;
};

} // namespace

// --- Paragraph ---

TEST_F(ElementsTest, ParagraphFitsCompletely)
{
    Paragraph p(words(5));
    RenderResult r = render(p, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    EXPECT_EQ(baselines(m_out), QList<qreal>({8.0, 18.0}));
    EXPECT_EQ(texts(m_out).size(), 5);
}

TEST_F(ElementsTest, ParagraphSplitsAtLineBoundary)
{
    Paragraph p(words(14));
    RenderResult r = render(p, area(100, 35));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 30.0);
    EXPECT_EQ(texts(m_out).size(), 12);

    const auto *rest = dynamic_cast<const Paragraph *>(r.remainder.get());
    ASSERT_NE(rest, nullptr);
    EXPECT_EQ(rest->text(), QStringLiteral("mmmm nnnn"));

    // The original is untouched.
    EXPECT_EQ(p.text(), words(14));
}

TEST_F(ElementsTest, ParagraphRemainderConservesContent)
{
    const QString text = words(14);
    Paragraph p(text);
    RenderResult first = render(p, area(100, 35));
    ASSERT_TRUE(first.isPartial());
    RenderResult second = render(*first.remainder, area(100, 100));
    ASSERT_TRUE(second.isDone());
    EXPECT_DOUBLE_EQ(second.height, 10.0);

    QString source = text;
    source.remove(QLatin1Char(' '));
    EXPECT_EQ(glyphCount(m_out), source.length());

    DrawList whole;
    RenderResult full = p.render(m_context, Area(&whole, QPointF(), 100, 1000), m_base);
    ASSERT_TRUE(full.isDone());
    EXPECT_EQ(texts(m_out), texts(whole));
}

TEST_F(ElementsTest, ParagraphRemainderRebreaksAtNewWidth)
{
    Paragraph p(words(6));
    RenderResult first = render(p, area(100, 10));
    ASSERT_TRUE(first.isPartial());

    m_out.clear();
    RenderResult second = render(*first.remainder, area(20, 100));
    ASSERT_TRUE(second.isDone());
    EXPECT_DOUBLE_EQ(second.height, 20.0);
}

TEST_F(ElementsTest, ParagraphMovesWhenNothingFitsBelowContent)
{
    Paragraph p(words(3));
    RenderResult r = render(p, area(100, 5, false));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 0.0);
    EXPECT_TRUE(m_out.isEmpty());
    EXPECT_EQ(dynamic_cast<const Paragraph &>(*r.remainder).text(), words(3));
}

TEST_F(ElementsTest, ParagraphForcesOneLineAtPageTop)
{
    Paragraph p(QStringLiteral("aa"));
    RenderResult r = render(p, area(100, 5));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 5.0);
    EXPECT_EQ(texts(m_out), QStringList({QStringLiteral("aa")}));
    ASSERT_EQ(m_context.diagnostics().size(), 1);
    EXPECT_EQ(m_context.diagnostics().first().kind, LayoutError::ContentOverflow);
}

TEST_F(ElementsTest, ParagraphReportsOverflowingWord)
{
    Paragraph p(QStringLiteral("abcdefghijklmnopqrstuvwxyz"));
    RenderResult r = render(p, area(50, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_EQ(m_context.diagnostics().size(), 1);
}

TEST_F(ElementsTest, ParagraphAlignment)
{
    Paragraph p(QStringLiteral("aa"));
    p.setAlignment(Paragraph::AlignCenter);
    render(p, area(100, 100));
    p.setAlignment(Paragraph::AlignRight);
    render(p, area(100, 100));

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 2);
    EXPECT_DOUBLE_EQ(t[0].baseline.x(), 45.0);
    EXPECT_DOUBLE_EQ(t[1].baseline.x(), 90.0);
}

TEST_F(ElementsTest, ParagraphJustifyStretchesAllButLastLine)
{
    Paragraph p(words(5));
    p.setAlignment(Paragraph::AlignJustify);
    render(p, area(100, 100));

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 5);
    // Line 1 is 95pt wide with three gaps; the last word ends flush right.
    EXPECT_NEAR(t[3].baseline.x() + t[3].width, 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(t[4].baseline.x(), 0.0);
}

TEST_F(ElementsTest, ParagraphUsesRunStyles)
{
    Paragraph p;
    p.addText(QStringLiteral("plain "));
    p.addText(QStringLiteral("under"), Style().withUnderline().withColor(Qt::blue));
    render(p, area(200, 100));

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 2);
    EXPECT_TRUE(t[1].style.isUnderline());
    EXPECT_DOUBLE_EQ(t[1].style.fontSize(), 10.0);

    const auto rects = rectCommands(m_out);
    ASSERT_EQ(rects.size(), 1);
    EXPECT_DOUBLE_EQ(rects[0].rect.top(), 9.0);
    EXPECT_DOUBLE_EQ(rects[0].rect.width(), 25.0);
    EXPECT_EQ(rects[0].fill, QColor(Qt::blue));
}

TEST_F(ElementsTest, ParagraphFailsOnUnresolvedFont)
{
    Paragraph p(QStringLiteral("text"), Style().withFontFamily(QStringLiteral("Missing")));
    RenderResult r = render(p, area(100, 100));
    ASSERT_TRUE(r.isFailed());
    EXPECT_EQ(r.error.kind, LayoutError::InvalidStyle);
}

TEST_F(ElementsTest, EmptyParagraphIsDone)
{
    Paragraph p(QStringLiteral("   "));
    RenderResult r = render(p, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 0.0);
}

// --- Container ---

TEST_F(ElementsTest, VerticalContainerStacksChildren)
{
    Container c;
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("bb")));
    RenderResult r = render(c, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    EXPECT_EQ(baselines(m_out), QList<qreal>({8.0, 18.0}));
}

TEST_F(ElementsTest, VerticalContainerDefersLaterSiblings)
{
    Container c;
    c.addElement(std::make_unique<Paragraph>(words(12)));
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("zz")));
    RenderResult r = render(c, area(100, 20));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    EXPECT_FALSE(texts(m_out).contains(QStringLiteral("zz")));

    const auto &rest = dynamic_cast<const Container &>(*r.remainder);
    ASSERT_EQ(rest.count(), 2);
    EXPECT_EQ(dynamic_cast<const Paragraph *>(rest.at(0))->text(),
              QStringLiteral("iiii jjjj kkkk llll"));
    EXPECT_EQ(dynamic_cast<const Paragraph *>(rest.at(1))->text(), QStringLiteral("zz"));
}

TEST_F(ElementsTest, BreakInsideContainerSignalsPageBreak)
{
    Container c;
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    c.addElement(std::make_unique<PageBreak>());
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("bb")));
    RenderResult r = render(c, area(100, 500));
    ASSERT_TRUE(r.isPartial());
    EXPECT_TRUE(r.pageBreak);
    EXPECT_DOUBLE_EQ(r.height, 10.0);
    EXPECT_EQ(dynamic_cast<const Container &>(*r.remainder).count(), 1);
}

TEST_F(ElementsTest, ContainerFailurePropagates)
{
    Container c;
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    c.addElement(std::make_unique<Paragraph>(
        QStringLiteral("bb"), Style().withFontFamily(QStringLiteral("Broken"))));
    RenderResult r = render(c, area(100, 100));
    ASSERT_TRUE(r.isFailed());
    EXPECT_EQ(r.error.kind, LayoutError::CollaboratorFailure);
}

TEST_F(ElementsTest, ContainerStyleIsInherited)
{
    Container c;
    c.setStyle(Style().withFontSize(20));
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    RenderResult r = render(c, area(100, 100));
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    EXPECT_DOUBLE_EQ(textCommands(m_out).first().width, 20.0);
}

TEST_F(ElementsTest, HorizontalContainerSplitsWidthByWeight)
{
    Container c(Container::Horizontal);
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")), 1);
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("bb bb")), 3);
    RenderResult r = render(c, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 10.0);

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 3);
    EXPECT_DOUBLE_EQ(t[1].baseline.x(), 25.0);
}

TEST_F(ElementsTest, HorizontalContainerHeightIsTallestChild)
{
    Container c(Container::Horizontal);
    c.addElement(std::make_unique<Paragraph>(words(3)));
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    RenderResult r = render(c, area(40, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 30.0);
}

TEST_F(ElementsTest, HorizontalContainerSplitsPerChild)
{
    Container c(Container::Horizontal);
    c.addElement(std::make_unique<Paragraph>(words(3)));
    c.addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    RenderResult r = render(c, area(40, 20));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 20.0);

    const auto &rest = dynamic_cast<const Container &>(*r.remainder);
    EXPECT_EQ(rest.orientation(), Container::Horizontal);
    ASSERT_EQ(rest.count(), 2);
    EXPECT_EQ(dynamic_cast<const Paragraph *>(rest.at(0))->text(), QStringLiteral("cccc"));
    EXPECT_EQ(dynamic_cast<const Container *>(rest.at(1))->count(), 0);
}

// --- Image and external blocks ---

TEST_F(ElementsTest, ImageDrawsWhenItFits)
{
    QImage img(4, 4, QImage::Format_RGB32);
    img.fill(Qt::red);
    Image image(img, QSizeF(50, 30), QStringLiteral("logo"));
    RenderResult r = render(image, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 30.0);
    EXPECT_EQ(imageCount(m_out), 1);
}

TEST_F(ElementsTest, ImageIsNeverSplit)
{
    Image image(QSizeF(50, 30));
    RenderResult r = render(image, area(100, 20, false));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 0.0);
    EXPECT_TRUE(m_out.isEmpty());
    EXPECT_NE(dynamic_cast<const Image *>(r.remainder.get()), nullptr);
}

TEST_F(ElementsTest, ImageTallerThanPageOverflowsWithDiagnostic)
{
    Image image(QSizeF(50, 300));
    RenderResult r = render(image, area(100, 200));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 200.0);
    ASSERT_EQ(m_context.diagnostics().size(), 1);
    EXPECT_EQ(m_context.diagnostics().first().kind, LayoutError::ContentOverflow);
    // Null image: a placeholder frame
    EXPECT_EQ(rectCommands(m_out).size(), 1);
}

TEST_F(ElementsTest, ImageAlignment)
{
    Image image(QSizeF(40, 10));
    image.setAlignment(FixedBlock::AlignCenter);
    render(image, area(100, 100));
    EXPECT_DOUBLE_EQ(rectCommands(m_out).first().rect.left(), 30.0);
}

TEST_F(ElementsTest, ExternalBlockReplaysCommandsAtItsPosition)
{
    DrawList commands;
    commands.append(DrawCommand(DrawText{QPointF(0, 8), QStringLiteral("code"), m_base, 20}));
    commands.append(DrawCommand(DrawRect{QRectF(0, 0, 20, 10), QColor(Qt::gray), QColor(), 0}));
    ExternalBlock block(QSizeF(20, 10), commands, QStringLiteral("code"));

    Area a(&m_out, QPointF(10, 20), 100, 100);
    RenderResult r = render(block, a);
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 10.0);

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 1);
    EXPECT_EQ(t[0].baseline, QPointF(10, 28));
    EXPECT_EQ(rectCommands(m_out).first().rect, QRectF(10, 20, 20, 10));
}

// --- Breaks, spacers and single lines ---

TEST_F(ElementsTest, PageBreakIsDoneWithZeroHeight)
{
    RenderResult r = render(PageBreak(), area(100, 400));
    EXPECT_TRUE(r.isDone());
    EXPECT_TRUE(r.pageBreak);
    EXPECT_DOUBLE_EQ(r.height, 0.0);
}

TEST_F(ElementsTest, SpacerUsesLineHeightAndTruncates)
{
    EXPECT_DOUBLE_EQ(render(Spacer(2), area(100, 100)).height, 20.0);
    RenderResult r = render(Spacer(5), area(100, 30));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 30.0);
}

TEST_F(ElementsTest, TextLineIsNeverWrapped)
{
    TextLine line(words(5));
    RenderResult r = render(line, area(50, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 10.0);
    EXPECT_EQ(texts(m_out), QStringList({words(5)}));
    EXPECT_EQ(m_context.diagnostics().size(), 1);
}

TEST_F(ElementsTest, TextLineMovesWhenNoRoom)
{
    TextLine line(QStringLiteral("aa"));
    RenderResult r = render(line, area(50, 5, false));
    EXPECT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 0.0);
}

// --- Decorators ---

TEST_F(ElementsTest, PaddingOffsetsContent)
{
    PaddedElement padded(std::make_unique<Paragraph>(QStringLiteral("aa")),
                         QMarginsF(5, 5, 5, 5));
    RenderResult r = render(padded, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 1);
    EXPECT_EQ(t[0].baseline, QPointF(5, 13));
}

TEST_F(ElementsTest, PaddingTopOnlyOnFirstFragment)
{
    PaddedElement padded(std::make_unique<Paragraph>(words(3)), QMarginsF(5, 5, 5, 5));
    RenderResult r = render(padded, area(30, 30));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 25.0);

    m_out.clear();
    RenderResult rest = render(*r.remainder, area(30, 100));
    EXPECT_TRUE(rest.isDone());
    EXPECT_DOUBLE_EQ(rest.height, 15.0);
    EXPECT_DOUBLE_EQ(textCommands(m_out).first().baseline.y(), 8.0);
}

TEST_F(ElementsTest, FrameIsOpenAtTheSplit)
{
    FramedElement framed(std::make_unique<Paragraph>(words(3)), 1.0);
    RenderResult r = render(framed, area(30, 25));
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 21.0);
    // Left, right and top edges
    EXPECT_EQ(rectCommands(m_out).size(), 3);

    m_out.clear();
    RenderResult rest = render(*r.remainder, area(30, 100));
    EXPECT_TRUE(rest.isDone());
    EXPECT_DOUBLE_EQ(rest.height, 11.0);
    const auto rects = rectCommands(m_out);
    ASSERT_EQ(rects.size(), 3);
    EXPECT_DOUBLE_EQ(rects.last().rect.top(), 10.0);
}

TEST_F(ElementsTest, ClosedFrameHasFourEdges)
{
    FramedElement framed(std::make_unique<Paragraph>(QStringLiteral("aa")), 1.0);
    RenderResult r = render(framed, area(100, 100));
    EXPECT_TRUE(r.isDone());
    EXPECT_DOUBLE_EQ(r.height, 12.0);
    EXPECT_EQ(rectCommands(m_out).size(), 4);
}

TEST_F(ElementsTest, PaddingKeepsLeadingBreak)
{
    auto body = std::make_unique<Container>();
    body->addElement(std::make_unique<PageBreak>());
    body->addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    PaddedElement padded(std::move(body), QMarginsF(5, 5, 5, 5));

    RenderResult r = render(padded, area(100, 100));
    ASSERT_TRUE(r.isPartial());
    EXPECT_TRUE(r.pageBreak);
    EXPECT_DOUBLE_EQ(r.height, 0.0);
    EXPECT_TRUE(m_out.isEmpty());

    RenderResult rest = render(*r.remainder, area(100, 100));
    EXPECT_TRUE(rest.isDone());
    EXPECT_FALSE(rest.pageBreak);
    EXPECT_DOUBLE_EQ(rest.height, 20.0);
    EXPECT_EQ(textCommands(m_out).first().baseline, QPointF(5, 13));
}

TEST_F(ElementsTest, FrameKeepsLeadingBreak)
{
    auto body = std::make_unique<Container>();
    body->addElement(std::make_unique<PageBreak>());
    body->addElement(std::make_unique<Paragraph>(QStringLiteral("aa")));
    FramedElement framed(std::move(body), 1.0);

    RenderResult r = render(framed, area(100, 100));
    ASSERT_TRUE(r.isPartial());
    EXPECT_TRUE(r.pageBreak);
    EXPECT_TRUE(m_out.isEmpty());

    RenderResult rest = render(*r.remainder, area(100, 100));
    EXPECT_TRUE(rest.isDone());
    EXPECT_DOUBLE_EQ(rest.height, 12.0);
    EXPECT_EQ(rectCommands(m_out).size(), 4);
}

// --- Lists ---

TEST_F(ElementsTest, ListMarkersAreAssignedAtConstruction)
{
    List bullets;
    bullets.addItem(QStringLiteral("one")).addItem(QStringLiteral("two"));
    EXPECT_EQ(bullets.markerAt(0), QStringLiteral("–"));

    List numbered(List::Ordered);
    numbered.setStartNumber(3);
    numbered.addItem(QStringLiteral("three")).addItem(QStringLiteral("four"));
    EXPECT_EQ(numbered.markerAt(0), QStringLiteral("3."));
    EXPECT_EQ(numbered.markerAt(1), QStringLiteral("4."));
}

TEST_F(ElementsTest, ListDrawsMarkerInTheIndent)
{
    List list(List::Ordered);
    list.setIndent(30);
    list.setMarkerGap(5);
    list.addItem(QStringLiteral("aa"));
    RenderResult r = render(list, area(100, 100));
    EXPECT_TRUE(r.isDone());

    const auto t = textCommands(m_out);
    ASSERT_EQ(t.size(), 2);
    EXPECT_EQ(t[0].text, QStringLiteral("aa"));
    EXPECT_DOUBLE_EQ(t[0].baseline.x(), 30.0);
    EXPECT_EQ(t[1].text, QStringLiteral("1."));
    EXPECT_DOUBLE_EQ(t[1].baseline.x(), 15.0);
    EXPECT_DOUBLE_EQ(t[1].baseline.y(), 8.0);
}

TEST_F(ElementsTest, ListNumberingSurvivesSplit)
{
    List list(List::Ordered);
    list.setIndent(20);
    list.setMarkerGap(5);
    list.addItem(words(2)).addItem(words(4)).addItem(QStringLiteral("zz"));

    // 60pt of text width: items take 1, 2 and 1 lines.
    RenderResult r = render(list, area(80, 20));
    ASSERT_TRUE(r.isPartial());
    EXPECT_TRUE(texts(m_out).contains(QStringLiteral("1.")));
    EXPECT_TRUE(texts(m_out).contains(QStringLiteral("2.")));

    m_out.clear();
    RenderResult rest = render(*r.remainder, area(80, 100));
    EXPECT_TRUE(rest.isDone());
    const QStringList t = texts(m_out);
    EXPECT_FALSE(t.contains(QStringLiteral("2.")));
    EXPECT_TRUE(t.contains(QStringLiteral("3.")));
    EXPECT_TRUE(t.contains(QStringLiteral("dddd")));
}

TEST_F(ElementsTest, ListCloneIsDeep)
{
    List list;
    list.addItem(QStringLiteral("aa"));
    ElementPtr copy = list.clone();
    list.addItem(QStringLiteral("bb"));
    EXPECT_EQ(dynamic_cast<const List &>(*copy).count(), 1);
    EXPECT_EQ(list.count(), 2);
}
