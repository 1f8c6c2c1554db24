#ifndef FOLIO_HYPHENATOR_H
#define FOLIO_HYPHENATOR_H

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

// Hyphenation collaborator.  Given a word and a language tag, reports
// the character offsets inside the word where it may be split (the
// prefix length in UTF-16 units).  Returns false only on a hard
// failure; a language without a dictionary yields no offsets.
class AbstractHyphenator
{
public:
    virtual ~AbstractHyphenator() = default;

    virtual bool hyphenate(const QString &word, const QString &language,
                           QList<int> *offsets) = 0;
};

// Opaque forward declaration matching the typedef in hyphen.h:
//   typedef struct _HyphenDict HyphenDict;
// We use the struct tag directly to avoid redeclaration conflicts.
struct _HyphenDict;

class Hyphenator : public AbstractHyphenator
{
public:
    Hyphenator();
    ~Hyphenator() override;

    Hyphenator(const Hyphenator &) = delete;
    Hyphenator &operator=(const Hyphenator &) = delete;

    // Load the system dictionary for a language ("en_US", "de", ...).
    bool loadDictionary(const QString &language);
    // Load a dictionary from an explicit file for a language tag.
    bool loadDictionaryFile(const QString &language, const QString &path);
    bool isLoaded(const QString &language) const { return m_dicts.contains(language); }

    bool hyphenate(const QString &word, const QString &language,
                   QList<int> *offsets) override;

    // Available dictionary languages (scans system paths)
    static QStringList availableLanguages();

    // Words shorter than this are never split
    void setMinWordLength(int len) { m_minWordLength = len; }
    int minWordLength() const { return m_minWordLength; }

private:
    QHash<QString, _HyphenDict *> m_dicts;
    QSet<QString> m_missing; // languages already looked up without success
    int m_minWordLength = 5;

    static QHash<QString, QString> s_dictPaths;
    static void initDictPaths();
};

#endif // FOLIO_HYPHENATOR_H
