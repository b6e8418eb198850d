#include <QtTest/QtTest>
#include "core/vector/vector_index.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <vector>

class TestVectorIndex : public QObject {
    Q_OBJECT

private slots:
    void testCreateIndex();
    void testGuardClauses();
    void testAddAndSearch();
    void testSearchOrdersByDistanceThenLabel();
    void testSearchEmptyIndexAndBadQuery();
    void testGrowsPastCapacity();
    void testSaveAndLoad();
    void testVectorForLabel();
    void testLoadRejectsInvalidMetaFiles();
    void testLoadRejectsTruncatedIndex();
    void testLoadRejectsDimensionMismatch();

private:
    static constexpr int kTestDimensions = 32;
    static std::vector<float> makeVector(int seed);
};

std::vector<float> TestVectorIndex::makeVector(int seed)
{
    std::vector<float> vector(static_cast<size_t>(kTestDimensions), 0.0F);
    vector[static_cast<size_t>(seed % kTestDimensions)] = 1.0F;
    return vector;
}

void TestVectorIndex::testCreateIndex()
{
    sl::VectorIndex index;
    QVERIFY(!index.isAvailable());
    QVERIFY(index.create(kTestDimensions, QStringLiteral("unit-test-model"), 8));
    QVERIFY(index.isAvailable());
    QCOMPARE(index.dimensions(), kTestDimensions);
    QCOMPARE(index.metadata().modelId, QStringLiteral("unit-test-model"));
    QCOMPARE(index.totalElements(), 0);
}

void TestVectorIndex::testGuardClauses()
{
    sl::VectorIndex unconfigured;
    QVERIFY(!unconfigured.create(0, QStringLiteral("m"), 8));
    QVERIFY(!unconfigured.addVector(0, makeVector(0)));
    QVERIFY(!unconfigured.save(QStringLiteral("/tmp/sl-vi-none.hnsw"), QStringLiteral("/tmp/sl-vi-none.json")));
    QVERIFY(unconfigured.search(makeVector(0), 3).empty());
    QVERIFY(!unconfigured.vectorForLabel(0).has_value());

    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 8));
    QVERIFY(!index.addVector(1, std::vector<float>(3, 1.0F)));
}

void TestVectorIndex::testAddAndSearch()
{
    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 8));
    for (int i = 0; i < 5; ++i) {
        QVERIFY(index.addVector(static_cast<uint64_t>(i), makeVector(i)));
    }
    QCOMPARE(index.totalElements(), 5);
    QCOMPARE(index.metadata().nextLabel, uint64_t(5));

    const auto results = index.search(makeVector(3), 2);
    QCOMPARE(results.size(), size_t(2));
    QCOMPARE(results.front().label, uint64_t(3));
    QVERIFY(qAbs(results.front().distance) < 1e-5F);
}

void TestVectorIndex::testSearchOrdersByDistanceThenLabel()
{
    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 8));
    // Labels 7 and 2 are equidistant from the query.
    QVERIFY(index.addVector(7, makeVector(1)));
    QVERIFY(index.addVector(2, makeVector(1)));
    QVERIFY(index.addVector(4, makeVector(9)));

    const auto results = index.search(makeVector(1), 10);
    QCOMPARE(results.size(), size_t(3));
    QCOMPARE(results[0].label, uint64_t(2));
    QCOMPARE(results[1].label, uint64_t(7));
    QCOMPARE(results[2].label, uint64_t(4));
    QVERIFY(results[2].distance > results[1].distance);
}

void TestVectorIndex::testSearchEmptyIndexAndBadQuery()
{
    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 8));
    QVERIFY(index.search(makeVector(0), 5).empty());

    QVERIFY(index.addVector(0, makeVector(0)));
    QVERIFY(index.search(makeVector(0), 0).empty());
    QVERIFY(index.search(std::vector<float>(4, 0.5F), 5).empty());
}

void TestVectorIndex::testGrowsPastCapacity()
{
    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 2));
    for (int i = 0; i < 10; ++i) {
        QVERIFY(index.addVector(static_cast<uint64_t>(i), makeVector(i)));
    }
    QCOMPARE(index.totalElements(), 10);
}

void TestVectorIndex::testSaveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString indexPath = dir.filePath(QStringLiteral("index.hnsw"));
    const QString metaPath = dir.filePath(QStringLiteral("index.meta.json"));

    {
        sl::VectorIndex index;
        QVERIFY(index.create(kTestDimensions, QStringLiteral("bge-small"), 8));
        for (int i = 0; i < 6; ++i) {
            QVERIFY(index.addVector(static_cast<uint64_t>(i), makeVector(i)));
        }
        QVERIFY(index.save(indexPath, metaPath));
    }

    sl::VectorIndex loaded;
    QString error;
    QVERIFY2(loaded.load(indexPath, metaPath, &error), qPrintable(error));
    QCOMPARE(loaded.totalElements(), 6);
    QCOMPARE(loaded.dimensions(), kTestDimensions);
    QCOMPARE(loaded.metadata().modelId, QStringLiteral("bge-small"));
    QCOMPARE(loaded.search(makeVector(4), 1).front().label, uint64_t(4));

    const auto md = sl::VectorIndex::readMetadata(metaPath);
    QVERIFY(md.has_value());
    QCOMPARE(md->totalElements, 6);
    QCOMPARE(md->nextLabel, uint64_t(6));
}

void TestVectorIndex::testVectorForLabel()
{
    sl::VectorIndex index;
    QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 8));
    QVERIFY(index.addVector(11, makeVector(5)));

    const auto vector = index.vectorForLabel(11);
    QVERIFY(vector.has_value());
    QCOMPARE(vector->size(), size_t(kTestDimensions));
    QCOMPARE(vector->at(5), 1.0F);
    QVERIFY(!index.vectorForLabel(12).has_value());
}

void TestVectorIndex::testLoadRejectsInvalidMetaFiles()
{
    QTemporaryDir dir;
    const QString indexPath = dir.filePath(QStringLiteral("index.hnsw"));
    const QString metaPath = dir.filePath(QStringLiteral("index.meta.json"));
    {
        sl::VectorIndex index;
        QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 4));
        QVERIFY(index.addVector(0, makeVector(0)));
        QVERIFY(index.save(indexPath, metaPath));
    }

    QString error;
    sl::VectorIndex missingMeta;
    QVERIFY(!missingMeta.load(indexPath, dir.filePath(QStringLiteral("absent.json")), &error));
    QVERIFY(error.contains(QStringLiteral("cannot open")));

    QFile meta(metaPath);
    QVERIFY(meta.open(QIODevice::WriteOnly | QIODevice::Truncate));
    meta.write(QJsonDocument(QJsonObject{{QStringLiteral("model_id"), QStringLiteral("m")}}).toJson());
    meta.close();

    sl::VectorIndex noDims;
    QVERIFY(!noDims.load(indexPath, metaPath, &error));
    QVERIFY(error.contains(QStringLiteral("dimensions")));

    QVERIFY(meta.open(QIODevice::WriteOnly | QIODevice::Truncate));
    meta.write("{ broken");
    meta.close();
    sl::VectorIndex broken;
    QVERIFY(!broken.load(indexPath, metaPath, &error));
    QVERIFY(error.contains(QStringLiteral("invalid index metadata")));
}

void TestVectorIndex::testLoadRejectsTruncatedIndex()
{
    QTemporaryDir dir;
    const QString indexPath = dir.filePath(QStringLiteral("index.hnsw"));
    QFile file(indexPath);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("short");
    file.close();

    sl::VectorIndex index;
    QString error;
    QVERIFY(!index.load(indexPath, dir.filePath(QStringLiteral("index.meta.json")), &error));
    QVERIFY(error.contains(QStringLiteral("truncated")));
    QVERIFY(!index.isAvailable());
}

void TestVectorIndex::testLoadRejectsDimensionMismatch()
{
    QTemporaryDir dir;
    const QString indexPath = dir.filePath(QStringLiteral("index.hnsw"));
    const QString metaPath = dir.filePath(QStringLiteral("index.meta.json"));
    {
        sl::VectorIndex index;
        QVERIFY(index.create(kTestDimensions, QStringLiteral("m"), 4));
        QVERIFY(index.addVector(0, makeVector(0)));
        QVERIFY(index.addVector(1, makeVector(1)));
        QVERIFY(index.save(indexPath, metaPath));
    }

    QFile meta(metaPath);
    QVERIFY(meta.open(QIODevice::ReadOnly));
    QJsonObject json = QJsonDocument::fromJson(meta.readAll()).object();
    meta.close();
    json[QStringLiteral("dimensions")] = kTestDimensions * 2;
    QVERIFY(meta.open(QIODevice::WriteOnly | QIODevice::Truncate));
    meta.write(QJsonDocument(json).toJson());
    meta.close();

    sl::VectorIndex index;
    QString error;
    QVERIFY(!index.load(indexPath, metaPath, &error));
    QVERIFY(error.contains(QStringLiteral("dimension mismatch")));
    QVERIFY(!index.isAvailable());
}

QTEST_MAIN(TestVectorIndex)
#include "test_vector_index.moc"
