#include <QFile>
#include <QRegularExpression>
#include <QSet>
#include <QTemporaryDir>
#include <QTest>

#include <Medgate/Uploads.hpp>

using namespace Medgate;

class UploadsTest : public QObject
{
  Q_OBJECT

private slots:
  void savedFilesAreTimestampPrefixed()
  {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    UploadStore store{dir.path(), QStringLiteral("http://localhost:3010/")};

    const auto a = store.save(QStringLiteral("x-ray scan.png"), "one");
    QVERIFY(QRegularExpression(QStringLiteral("^\\d{13}-x-ray_scan\\.png$"))
                .match(a.fileName)
                .hasMatch());
    QCOMPARE(a.url, QStringLiteral("http://localhost:3010/uploads/") + a.fileName);
    QFile f(a.path);
    QVERIFY(f.open(QIODevice::ReadOnly));
    QCOMPARE(f.readAll(), QByteArray("one"));

    const auto ocr = store.save(QStringLiteral("page.jpg"), "two", QStringLiteral("ocr-"));
    QVERIFY(ocr.fileName.startsWith(QStringLiteral("ocr-")));
  }

  void sameNameNeverOverwrites()
  {
    QTemporaryDir dir;
    UploadStore store{dir.path(), QStringLiteral("http://localhost:3010")};
    QSet<QString> names;
    for (int i = 0; i < 5; i++)
      names.insert(store.save(QStringLiteral("a.png"), QByteArray::number(i)).fileName);
    QCOMPARE(names.size(), 5);
  }

  void sanitizeStripsPaths()
  {
    QCOMPARE(UploadStore::sanitize(QStringLiteral("../../etc/passwd")), QStringLiteral("passwd"));
    QCOMPARE(UploadStore::sanitize(QStringLiteral(".hidden")), QStringLiteral("hidden"));
    QCOMPARE(UploadStore::sanitize(QString()), QStringLiteral("upload"));
  }

  void listsImagesNewestFirst()
  {
    QTemporaryDir dir;
    UploadStore store{dir.path(), QStringLiteral("http://localhost:3010")};
    const auto older = store.save(QStringLiteral("old.png"), "1");
    store.save(QStringLiteral("notes.txt"), "2");
    const auto newer = store.save(QStringLiteral("new.JPG"), "3");

    QFile file(older.path);
    QVERIFY(file.open(QIODevice::ReadWrite));
    QVERIFY(file.setFileTime(
        QDateTime::currentDateTime().addSecs(-60), QFileDevice::FileModificationTime));
    file.close();

    const auto entries = store.list();
    QCOMPARE(entries.size(), std::size_t(2));
    QCOMPARE(entries[0].fileName, newer.fileName);
    QCOMPARE(entries[1].fileName, older.fileName);
    QCOMPARE(entries[1].url, older.url);
  }

  void resolveRejectsTraversal()
  {
    QTemporaryDir dir;
    UploadStore store{dir.path(), QStringLiteral("http://localhost:3010")};
    const auto saved = store.save(QStringLiteral("a.png"), "x");

    QVERIFY(store.resolve(saved.fileName));
    QVERIFY(!store.resolve(QStringLiteral("../a.png")));
    QVERIFY(!store.resolve(QStringLiteral("..")));
    QVERIFY(!store.resolve(QStringLiteral("missing.png")));
  }

  void recognizesOwnUrls()
  {
    QTemporaryDir dir;
    UploadStore store{dir.path(), QStringLiteral("http://medgate.local:3010")};

    QCOMPARE(
        store.fileNameFromUrl(QStringLiteral("http://localhost:3010/uploads/1-a.png")),
        std::optional<QString>(QStringLiteral("1-a.png")));
    QCOMPARE(
        store.fileNameFromUrl(QStringLiteral("http://medgate.local:3010/uploads/1-a.png")),
        std::optional<QString>(QStringLiteral("1-a.png")));
    QCOMPARE(
        store.fileNameFromUrl(QStringLiteral("/uploads/1-a.png")),
        std::optional<QString>(QStringLiteral("1-a.png")));
    QVERIFY(!store.fileNameFromUrl(QStringLiteral("http://example.com:3010/uploads/1-a.png")));
    QVERIFY(!store.fileNameFromUrl(QStringLiteral("http://localhost:8080/uploads/1-a.png")));
    QVERIFY(!store.fileNameFromUrl(QStringLiteral("http://localhost:3010/other/1-a.png")));
  }
};

QTEST_GUILESS_MAIN(UploadsTest)
#include "tst_uploads.moc"
