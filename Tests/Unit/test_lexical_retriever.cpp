#include <QtTest/QtTest>
#include "core/corpus/corpus_registry.h"
#include "core/retrieval/lexical_retriever.h"

#include "corpus_fixture.h"

#include <QTemporaryDir>

class TestLexicalRetriever : public QObject {
    Q_OBJECT

private slots:
    void testEscapeBuildsOrExpression();
    void testEscapeDropsOperatorsAndShortTokens();
    void testEscapeKeepsPhrases();
    void testEscapeEmpty();
    void testNormalizeScores();
    void testNormalizeDegenerateRange();
    void testRetrieveRanksByBm25();
    void testRetrieveWithoutUsableTerms();
};

void TestLexicalRetriever::testEscapeBuildsOrExpression()
{
    QCOMPARE(sl::LexicalRetriever::escapeFtsQuery(QStringLiteral("hybrid search BM25")),
             QStringLiteral("hybrid OR search OR BM25"));
    // Case-insensitive dedup keeps the first spelling.
    QCOMPARE(sl::LexicalRetriever::escapeFtsQuery(QStringLiteral("Index index INDEX")),
             QStringLiteral("Index"));
}

void TestLexicalRetriever::testEscapeDropsOperatorsAndShortTokens()
{
    const QString escaped = sl::LexicalRetriever::escapeFtsQuery(
        QStringLiteral("a NEAR(b-tree*) ^col: -x (wal)"));
    QCOMPARE(escaped, QStringLiteral("NEAR OR tree OR col OR wal"));
    QVERIFY(!escaped.contains(QLatin1Char('*')));
    QVERIFY(!escaped.contains(QLatin1Char('(')));
}

void TestLexicalRetriever::testEscapeKeepsPhrases()
{
    QCOMPARE(sl::LexicalRetriever::escapeFtsQuery(QStringLiteral("\"inverted index\" postings")),
             QStringLiteral("postings OR \"inverted index\""));
    QCOMPARE(sl::LexicalRetriever::escapeFtsQuery(QStringLiteral("'wal' log")),
             QStringLiteral("log OR wal"));
}

void TestLexicalRetriever::testEscapeEmpty()
{
    QVERIFY(sl::LexicalRetriever::escapeFtsQuery(QString()).isEmpty());
    QVERIFY(sl::LexicalRetriever::escapeFtsQuery(QStringLiteral("  ? ! a ")).isEmpty());
}

void TestLexicalRetriever::testNormalizeScores()
{
    std::vector<sl::ScoredChunk> hits(3);
    hits[0].score = 10.0;
    hits[1].score = 5.0;
    hits[2].score = 0.0;
    sl::LexicalRetriever::normalizeScores(hits);
    QCOMPARE(hits[0].normalized, 1.0);
    QCOMPARE(hits[1].normalized, 0.5);
    QCOMPARE(hits[2].normalized, 0.0);
}

void TestLexicalRetriever::testNormalizeDegenerateRange()
{
    std::vector<sl::ScoredChunk> hits(2);
    hits[0].score = 3.0;
    hits[1].score = 3.0;
    sl::LexicalRetriever::normalizeScores(hits);
    QCOMPARE(hits[0].normalized, 1.0);
    QCOMPARE(hits[1].normalized, 1.0);

    std::vector<sl::ScoredChunk> none;
    sl::LexicalRetriever::normalizeScores(none);
    QVERIFY(none.empty());
}

void TestLexicalRetriever::testRetrieveRanksByBm25()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString error;
    QVERIFY2(sl::test::writeCorpus(dir.path(), QStringLiteral("OReilly"), sl::test::sampleLibrary(), {}, &error),
             qPrintable(error));

    sl::CorpusRegistry registry(dir.path(), {QStringLiteral("OReilly")});
    sl::EmbedderIdentity lexicalOnly;
    auto corpus = registry.load(QStringLiteral("OReilly"), lexicalOnly);
    QVERIFY(corpus);

    const auto hits = sl::LexicalRetriever::retrieve(QStringLiteral("inverted index postings"), *corpus, 5, &error);
    QVERIFY2(hits.has_value(), qPrintable(error));
    QVERIFY(!hits->empty());
    QCOMPARE(hits->front().chunk.section, QStringLiteral("Inverted index"));
    QCOMPARE(hits->front().chunk.publisher, QStringLiteral("OReilly"));
    QCOMPARE(hits->front().chunk.book, QStringLiteral("search-engines-in-practice"));
    QCOMPARE(hits->front().normalized, 1.0);
    for (size_t i = 1; i < hits->size(); ++i) {
        QVERIFY(hits->at(i - 1).score >= hits->at(i).score);
    }
    QVERIFY(hits->size() <= 5);
}

void TestLexicalRetriever::testRetrieveWithoutUsableTerms()
{
    QTemporaryDir dir;
    QVERIFY(sl::test::writeCorpus(dir.path(), QStringLiteral("OReilly"), sl::test::sampleLibrary()));
    sl::CorpusRegistry registry(dir.path(), {QStringLiteral("OReilly")});
    auto corpus = registry.load(QStringLiteral("OReilly"), sl::EmbedderIdentity{});
    QVERIFY(corpus);

    const auto hits = sl::LexicalRetriever::retrieve(QStringLiteral("?? !"), *corpus, 5);
    QVERIFY(hits.has_value());
    QVERIFY(hits->empty());
}

QTEST_MAIN(TestLexicalRetriever)
#include "test_lexical_retriever.moc"
