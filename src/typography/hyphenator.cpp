#include "hyphenator.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QVector>

#include <hyphen.h>

#include <cstdlib>

QHash<QString, QString> Hyphenator::s_dictPaths;

Hyphenator::Hyphenator() = default;

Hyphenator::~Hyphenator()
{
    for (_HyphenDict *dict : std::as_const(m_dicts))
        hnj_hyphen_free(dict);
}

void Hyphenator::initDictPaths()
{
    if (!s_dictPaths.isEmpty())
        return;

    static const char *systemPaths[] = {
        "/usr/share/hyphen",
        "/usr/share/hunspell",
        "/usr/share/myspell/dicts",
        "/usr/local/share/hyphen",
    };

    for (const char *path : systemPaths) {
        QDir dir(QString::fromLatin1(path));
        if (!dir.exists())
            continue;
        const QStringList entries = dir.entryList(
            {QStringLiteral("hyph_*.dic")}, QDir::Files);
        for (const QString &entry : entries) {
            // Extract language code: hyph_en_US.dic -> en_US
            QString lang = entry.mid(5, entry.length() - 9);
            if (!s_dictPaths.contains(lang))
                s_dictPaths.insert(lang, dir.filePath(entry));
        }
    }
}

QStringList Hyphenator::availableLanguages()
{
    initDictPaths();
    QStringList langs = s_dictPaths.keys();
    langs.sort();
    return langs;
}

bool Hyphenator::loadDictionary(const QString &language)
{
    if (m_dicts.contains(language))
        return true;

    initDictPaths();

    QString path = s_dictPaths.value(language);
    if (path.isEmpty()) {
        // Try base language (e.g., "en" -> "en_US"); pick the first in sorted
        // order so the choice does not depend on hash iteration.
        QStringList keys = s_dictPaths.keys();
        keys.sort();
        for (const QString &key : std::as_const(keys)) {
            if (key.startsWith(language)) {
                path = s_dictPaths.value(key);
                break;
            }
        }
    }

    if (path.isEmpty())
        return false;
    return loadDictionaryFile(language, path);
}

bool Hyphenator::loadDictionaryFile(const QString &language, const QString &path)
{
    if (!QFileInfo::exists(path)) {
        qWarning() << "Hyphenator: dictionary not found:" << path;
        return false;
    }

    _HyphenDict *dict = hnj_hyphen_load(QFile::encodeName(path).constData());
    if (!dict) {
        qWarning() << "Hyphenator: failed to load dictionary:" << path;
        return false;
    }

    if (_HyphenDict *old = m_dicts.value(language))
        hnj_hyphen_free(old);
    m_dicts.insert(language, dict);
    m_missing.remove(language);
    return true;
}

bool Hyphenator::hyphenate(const QString &word, const QString &language,
                           QList<int> *offsets)
{
    if (!offsets)
        return false;
    offsets->clear();

    if (language.isEmpty() || word.length() < m_minWordLength)
        return true;

    _HyphenDict *dict = m_dicts.value(language);
    if (!dict) {
        if (m_missing.contains(language))
            return true;
        if (!loadDictionary(language)) {
            qDebug() << "Hyphenator: no dictionary for" << language;
            m_missing.insert(language);
            return true;
        }
        dict = m_dicts.value(language);
    }

    // Dictionaries are written for lowercase input.
    const QString lower = word.toLower();
    const QString &input = lower.length() == word.length() ? lower : word;

    QByteArray utf8 = input.toUtf8();
    const int wordLen = utf8.length();

    // libhyphen output buffer
    QByteArray hyphens(wordLen + 5, 0);
    char **rep = nullptr;
    int *pos = nullptr;
    int *cut = nullptr;

    int ret = hnj_hyphen_hyphenate2(
        dict, utf8.constData(), wordLen,
        hyphens.data(), nullptr, &rep, &pos, &cut);

    if (ret != 0) {
        qWarning() << "Hyphenator: libhyphen failed on" << word;
        return false;
    }

    // Byte position after each UTF-8 sequence -> UTF-16 index after it.
    QVector<int> byteToChar(wordLen + 1, -1);
    int bytePos = 0;
    for (int charIdx = 0; charIdx < input.length(); ++charIdx) {
        QChar ch = input[charIdx];
        if (ch.unicode() < 0x80) bytePos += 1;
        else if (ch.unicode() < 0x800) bytePos += 2;
        else if (ch.isHighSurrogate()) { bytePos += 4; ++charIdx; }
        else bytePos += 3;
        if (bytePos <= wordLen)
            byteToChar[bytePos] = charIdx + 1;
    }

    // Odd digits mark a valid break after this byte.  Keep at least two
    // characters on each side of the split.
    for (int i = 0; i < wordLen; ++i) {
        if (!((hyphens[i] - '0') & 1))
            continue;
        int charAfter = byteToChar.value(i + 1, -1);
        if (charAfter >= 2 && charAfter <= word.length() - 2)
            offsets->append(charAfter);
    }

    // Free allocated memory from hnj_hyphen_hyphenate2
    if (rep) {
        for (int i = 0; i < wordLen; ++i)
            free(rep[i]);
        free(rep);
    }
    free(pos);
    free(cut);

    return true;
}
