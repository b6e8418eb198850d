#include <QtTest/QtTest>
#include "core/ranking/diversity_selector.h"

namespace {

sl::Candidate candidate(const QString& book, const QString& section, int idx, double f)
{
    sl::Candidate c;
    c.chunk.publisher = QStringLiteral("Pearson");
    c.chunk.book = book;
    c.chunk.section = section;
    c.chunk.chunkIdx = idx;
    c.fScore = f;
    return c;
}

} // namespace

class TestDiversitySelector : public QObject {
    Q_OBJECT

private slots:
    void testProxySimilarity();
    void testEmbeddingSimilarityWinsWhenPresent();
    void testLambdaOneKeepsFusedOrder();
    void testDiversityPrefersOtherBooks();
    void testNeverRepeatsAndRespectsFinalK();
    void testEmptyAndZeroK();
};

void TestDiversitySelector::testProxySimilarity()
{
    const auto a = candidate("book", "s1", 0, 0.5);
    const auto b = candidate("book", "s1", 1, 0.5);
    const auto c = candidate("book", "s2", 2, 0.5);
    const auto d = candidate("other", "s1", 0, 0.5);
    QCOMPARE(sl::DiversitySelector::similarity(a, b), 1.0);
    QCOMPARE(sl::DiversitySelector::similarity(a, c), 0.5);
    QCOMPARE(sl::DiversitySelector::similarity(a, d), 0.0);
}

void TestDiversitySelector::testEmbeddingSimilarityWinsWhenPresent()
{
    auto a = candidate("book", "s1", 0, 0.5);
    auto b = candidate("book", "s1", 1, 0.5);
    a.embedding = std::vector<float>{1.0f, 0.0f};
    b.embedding = std::vector<float>{0.0f, 1.0f};
    QCOMPARE(sl::DiversitySelector::similarity(a, b), 0.0);
}

void TestDiversitySelector::testLambdaOneKeepsFusedOrder()
{
    const std::vector<sl::Candidate> pool = {
        candidate("a", "x", 0, 0.9), candidate("a", "x", 1, 0.8), candidate("b", "y", 0, 0.7),
    };
    const auto picked = sl::DiversitySelector::select(pool, 3, 1.0);
    QCOMPARE(picked.size(), size_t(3));
    QCOMPARE(picked[0].chunk.chunkIdx, 0);
    QCOMPARE(picked[1].chunk.book, QStringLiteral("a"));
    QCOMPARE(picked[2].chunk.book, QStringLiteral("b"));
}

void TestDiversitySelector::testDiversityPrefersOtherBooks()
{
    const std::vector<sl::Candidate> pool = {
        candidate("a", "x", 0, 0.90), candidate("a", "x", 1, 0.88), candidate("b", "y", 0, 0.80),
    };
    const auto picked = sl::DiversitySelector::select(pool, 2, 0.5);
    QCOMPARE(picked.size(), size_t(2));
    QCOMPARE(picked[0].chunk.book, QStringLiteral("a"));
    // 0.5*0.88 - 0.5*1.0 < 0.5*0.80 - 0
    QCOMPARE(picked[1].chunk.book, QStringLiteral("b"));
}

void TestDiversitySelector::testNeverRepeatsAndRespectsFinalK()
{
    std::vector<sl::Candidate> pool = {
        candidate("a", "x", 0, 0.9), candidate("a", "x", 0, 0.9), candidate("c", "z", 3, 0.2),
    };
    const auto picked = sl::DiversitySelector::select(pool, 10, 0.55);
    QCOMPARE(picked.size(), size_t(2));
    QVERIFY(!(sl::keyOf(picked[0].chunk) == sl::keyOf(picked[1].chunk)));

    QCOMPARE(sl::DiversitySelector::select(pool, 1, 0.55).size(), size_t(1));
}

void TestDiversitySelector::testEmptyAndZeroK()
{
    QVERIFY(sl::DiversitySelector::select({}, 5, 0.5).empty());
    QVERIFY(sl::DiversitySelector::select({candidate("a", "x", 0, 1.0)}, 0, 0.5).empty());
}

QTEST_MAIN(TestDiversitySelector)
#include "test_diversity_selector.moc"
