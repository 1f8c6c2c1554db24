#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QTextStream>

#include "codeblockrenderer.h"
#include "document.h"
#include "documentconfig.h"
#include "fontmanager.h"
#include "hyphenator.h"
#include "painterpagerenderer.h"
#include "paragraph.h"
#include "breaks.h"
#include "textmeasurer.h"

namespace {

// Blank lines separate paragraphs.  A line holding only a form feed is a
// page break, and ``` fences enclose a code block whose opening fence
// may name its language.
bool buildDocument(const QString &text, const DocumentConfig &config,
                   CodeBlockRenderer *codeRenderer, Layout::Document *document)
{
    const Style codeStyle = config.defaultStyle.withFontFamily(QStringLiteral("Noto Sans Mono"))
                                .withFontSize(config.defaultStyle.fontSize() * 0.85);

    QStringList paragraph;
    auto flushParagraph = [&]() {
        if (paragraph.isEmpty())
            return;
        auto p = std::make_unique<Layout::Paragraph>(paragraph.join(QLatin1Char(' ')));
        p->setAlignment(Layout::Paragraph::AlignJustify);
        document->addElement(std::move(p));
        paragraph.clear();
    };

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i];
        const QString trimmed = line.trimmed();

        if (trimmed.startsWith(QLatin1String("```"))) {
            flushParagraph();
            const QString language = trimmed.mid(3).trimmed();
            QStringList code;
            for (++i; i < lines.size(); ++i) {
                if (lines[i].trimmed().startsWith(QLatin1String("```")))
                    break;
                code << lines[i];
            }
            Layout::LayoutError error;
            auto block = codeRenderer->render(code.join(QLatin1Char('\n')), language,
                                              codeStyle, &error);
            if (!block) {
                qWarning() << "folio-render:" << error.message;
                return false;
            }
            document->addElement(std::move(block));
        } else if (line == QLatin1String("\f")) {
            flushParagraph();
            document->addElement(std::make_unique<Layout::PageBreak>());
        } else if (trimmed.isEmpty()) {
            flushParagraph();
        } else {
            paragraph << trimmed;
        }
    }
    flushParagraph();
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("folio-render"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Lay out a plain-text document into pages and write a PDF"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("input"), QStringLiteral("Text file to lay out"));
    parser.addPositionalArgument(QStringLiteral("output"), QStringLiteral("PDF file to write"));

    QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("JSON document configuration"), QStringLiteral("file"));
    QCommandLineOption hyphenationOption(
        QStringLiteral("hyphenation"),
        QStringLiteral("Hyphenation language, e.g. en_US"), QStringLiteral("language"));
    QCommandLineOption dictionaryOption(
        QStringLiteral("dictionary"),
        QStringLiteral("libhyphen dictionary for the hyphenation language"),
        QStringLiteral("file"));
    QCommandLineOption themeOption(
        QStringLiteral("code-theme"),
        QStringLiteral("Syntax highlighting theme for code blocks"), QStringLiteral("name"));
    parser.addOption(configOption);
    parser.addOption(hyphenationOption);
    parser.addOption(dictionaryOption);
    parser.addOption(themeOption);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2)
        parser.showHelp(1);

    DocumentConfig config;
    if (parser.isSet(configOption)) {
        QString errorString;
        if (!DocumentConfig::loadFromFile(parser.value(configOption), &config, &errorString)) {
            qWarning() << "folio-render:" << errorString;
            return 1;
        }
    }
    if (parser.isSet(hyphenationOption))
        config.hyphenationLanguage = parser.value(hyphenationOption);

    QFile input(args.at(0));
    if (!input.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "folio-render: cannot open" << args.at(0) << input.errorString();
        return 1;
    }
    const QString text = QTextStream(&input).readAll();

    FontManager fontManager;
    Hyphenator hyphenator;
    if (parser.isSet(dictionaryOption)) {
        if (config.hyphenationLanguage.isEmpty()) {
            qWarning() << "folio-render: --dictionary needs a hyphenation language";
            return 1;
        }
        if (!hyphenator.loadDictionaryFile(config.hyphenationLanguage,
                                           parser.value(dictionaryOption)))
            return 1;
    }

    TextMeasurer codeMeasurer(&fontManager);
    CodeBlockRenderer codeRenderer(&codeMeasurer);
    if (parser.isSet(themeOption))
        codeRenderer.setThemeName(parser.value(themeOption));

    Layout::Document document(config);
    if (!buildDocument(text, config, &codeRenderer, &document))
        return 1;

    QPdfWriter writer(args.at(1));
    writer.setResolution(72);
    writer.setCreator(QStringLiteral("folio-render"));
    writer.setTitle(QFileInfo(args.at(0)).completeBaseName());
    writer.setPageLayout(QPageLayout(
        QPageSize(config.pageLayout.pageSize, QPageSize::Point),
        QPageLayout::Portrait, QMarginsF(0, 0, 0, 0), QPageLayout::Point));

    QPainter painter;
    if (!painter.begin(&writer)) {
        qWarning() << "folio-render: cannot write" << args.at(1);
        return 1;
    }

    PainterPageRenderer renderer(&fontManager);
    renderer.setPainter(&painter);
    renderer.setPagedDevice(&writer);

    Layout::DocumentDriver driver(&fontManager, &hyphenator);
    const Layout::LayoutResult result = driver.render(document, &renderer);
    painter.end();

    for (const auto &d : result.diagnostics)
        qWarning().noquote() << QStringLiteral("page %1: %2: %3")
                                    .arg(d.pageNumber + 1)
                                    .arg(Layout::kindName(d.kind), d.message);

    if (!result.ok()) {
        qWarning().noquote() << QStringLiteral("folio-render: %1: %2")
                                    .arg(Layout::kindName(result.error.kind), result.error.message);
        QFile::remove(args.at(1));
        return 1;
    }
    return 0;
}
