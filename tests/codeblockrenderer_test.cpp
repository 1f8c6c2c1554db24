#include <gtest/gtest.h>

#include "blocks.h"
#include "codeblockrenderer.h"
#include "fakefontmetrics.h"
#include "textmeasurer.h"

using namespace Layout;

namespace {

class CodeBlockRendererTest : public ::testing::Test
{
protected:
    const ExternalBlock &line(const Container &block, int i)
    {
        return dynamic_cast<const ExternalBlock &>(*block.at(i));
    }

    static QString joined(const ExternalBlock &b)
    {
        QString out;
        for (const auto &t : TestUtil::textCommands(b.commands()))
            out += t.text;
        return out;
    }

    const Style m_style = Style().withFontFamily(QStringLiteral("Mono")).withFontSize(10);
    FakeFontMetrics m_metrics;
    TextMeasurer m_measurer{&m_metrics};
    CodeBlockRenderer m_renderer{&m_measurer};
};

} // namespace

TEST_F(CodeBlockRendererTest, OneBlockPerSourceLine)
{
    auto block = m_renderer.render(QStringLiteral("a\nbb\n\nccc\n"), QString(), m_style);
    ASSERT_TRUE(block);
    ASSERT_EQ(block->count(), 4);
    EXPECT_EQ(line(*block, 0).size(), QSizeF(5, 10));
    EXPECT_EQ(line(*block, 1).size(), QSizeF(10, 10));
    EXPECT_EQ(line(*block, 3).source(), QStringLiteral("code"));
}

TEST_F(CodeBlockRendererTest, EmptyLineKeepsItsHeight)
{
    auto block = m_renderer.render(QStringLiteral("a\n\nb"), QString(), m_style);
    ASSERT_TRUE(block);
    ASSERT_EQ(block->count(), 3);
    EXPECT_EQ(line(*block, 1).size(), QSizeF(0, 10));
    EXPECT_TRUE(line(*block, 1).commands().isEmpty());
}

TEST_F(CodeBlockRendererTest, UnknownLanguageIsPlainText)
{
    auto block = m_renderer.render(QStringLiteral("if (x) return;"),
                                   QStringLiteral("no-such-language"), m_style);
    ASSERT_TRUE(block);
    ASSERT_EQ(block->count(), 1);
    const auto texts = TestUtil::textCommands(line(*block, 0).commands());
    ASSERT_EQ(texts.size(), 1);
    EXPECT_EQ(texts[0].text, QStringLiteral("if (x) return;"));
    EXPECT_EQ(texts[0].style, m_style);
    EXPECT_EQ(texts[0].baseline, QPointF(0, 8));
}

TEST_F(CodeBlockRendererTest, TabsExpandToTabWidth)
{
    m_renderer.setTabWidth(2);
    auto block = m_renderer.render(QStringLiteral("\tx"), QString(), m_style);
    ASSERT_TRUE(block);
    EXPECT_DOUBLE_EQ(line(*block, 0).size().width(), 15.0);
    EXPECT_EQ(joined(line(*block, 0)), QStringLiteral("  x"));
}

TEST_F(CodeBlockRendererTest, HighlightingKeepsTextAndWidth)
{
    const QString code = QStringLiteral("int main() { return 0; }");
    auto block = m_renderer.render(code, QStringLiteral("C++"), m_style);
    ASSERT_TRUE(block);
    ASSERT_EQ(block->count(), 1);

    const ExternalBlock &b = line(*block, 0);
    EXPECT_DOUBLE_EQ(b.size().width(), code.length() * 5.0);

    QString visible = code;
    visible.remove(QLatin1Char(' '));
    QString drawn = joined(b);
    drawn.remove(QLatin1Char(' '));
    EXPECT_EQ(drawn, visible);

    // Pieces sit end to end.
    const auto texts = TestUtil::textCommands(b.commands());
    for (int i = 1; i < texts.size(); ++i)
        EXPECT_GE(texts[i].baseline.x(), texts[i - 1].baseline.x() + texts[i - 1].width - 1e-9);
}

TEST_F(CodeBlockRendererTest, LanguageCanBeGivenAsExtension)
{
    const QString code = QStringLiteral("x = 1");
    auto byName = m_renderer.render(code, QStringLiteral("Python"), m_style);
    auto byExt = m_renderer.render(code, QStringLiteral("py"), m_style);
    ASSERT_TRUE(byName);
    ASSERT_TRUE(byExt);
    EXPECT_EQ(line(*byName, 0).commands(), line(*byExt, 0).commands());
}

TEST_F(CodeBlockRendererTest, UnknownThemeKeepsTheCurrentOne)
{
    auto before = m_renderer.render(QStringLiteral("int x;"), QStringLiteral("C++"), m_style);
    m_renderer.setThemeName(QStringLiteral("No Such Theme"));
    auto after = m_renderer.render(QStringLiteral("int x;"), QStringLiteral("C++"), m_style);
    ASSERT_TRUE(before);
    ASSERT_TRUE(after);
    EXPECT_EQ(line(*before, 0).commands(), line(*after, 0).commands());
}

TEST_F(CodeBlockRendererTest, UnresolvedFontFails)
{
    LayoutError error;
    auto block = m_renderer.render(QStringLiteral("x"), QString(),
                                   Style().withFontFamily(QStringLiteral("Missing")), &error);
    EXPECT_FALSE(block);
    EXPECT_EQ(error.kind, LayoutError::InvalidStyle);
}

TEST_F(CodeBlockRendererTest, BlockLaysOutLikeAnyContainer)
{
    auto block = m_renderer.render(QStringLiteral("a\nb\nc"), QString(), m_style);
    ASSERT_TRUE(block);

    DrawList out;
    RenderContext context(&m_measurer);
    const RenderResult r = block->render(context, Area(&out, QPointF(), 100, 25), m_style);
    ASSERT_TRUE(r.isPartial());
    EXPECT_DOUBLE_EQ(r.height, 20.0);
    EXPECT_EQ(TestUtil::texts(out), QStringList({QStringLiteral("a"), QStringLiteral("b")}));
}
