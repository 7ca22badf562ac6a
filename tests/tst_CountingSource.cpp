#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <atomic>
#include "CountingSource.h"

extern "C" {
#include <libavformat/avio.h>
}

class tst_CountingSource : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    QString m_path;
    QByteArray m_content;

private slots:
    void initTestCase()
    {
        QVERIFY(m_dir.isValid());
        m_path = m_dir.filePath(QStringLiteral("bytes.bin"));
        m_content.resize(100007);
        for (int i = 0; i < m_content.size(); ++i)
            m_content[i] = static_cast<char>((i * 31) & 0xff);
        QFile file(m_path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(m_content), qint64(m_content.size()));
    }

    // ── open ─────────────────────────────────────────────────────
    void open_missingFile()
    {
        CountingSource source;
        ConversionError error;
        QVERIFY(!source.open(m_dir.filePath(QStringLiteral("nope.bin")), &error));
        QCOMPARE(error.kind, ConversionError::IoOpenError);
        QVERIFY(error.message.startsWith(QStringLiteral("Failed to open file: ")));
        QVERIFY(!source.isOpen());
    }

    void open_reportsLength()
    {
        CountingSource source;
        QVERIFY(source.open(m_path));
        QCOMPARE(source.totalLength(), qint64(m_content.size()));
        QVERIFY(source.isSeekable());
        QCOMPARE(source.bytesRead(), quint64(0));
    }

    // ── counting ─────────────────────────────────────────────────
    void read_countsEveryByte()
    {
        CountingSource source;
        QVERIFY(source.open(m_path));

        const int chunks[] = {1, 7, 333, 4096};
        QByteArray collected;
        char buf[4096];
        int c = 0;
        for (;;) {
            qint64 n = source.read(buf, chunks[c++ % 4]);
            QVERIFY(n >= 0);
            if (n == 0)
                break;
            collected.append(buf, static_cast<int>(n));
        }
        QCOMPARE(collected, m_content);
        QCOMPARE(source.bytesRead(), quint64(m_content.size()));
    }

    void seek_doesNotCount()
    {
        CountingSource source;
        QVERIFY(source.open(m_path));
        char buf[100];
        QCOMPARE(source.read(buf, 100), qint64(100));
        QVERIFY(source.seek(50000));
        QCOMPARE(source.pos(), qint64(50000));
        QCOMPARE(source.bytesRead(), quint64(100));

        // Re-reading after a rewind counts again
        QVERIFY(source.seek(0));
        QCOMPARE(source.read(buf, 100), qint64(100));
        QCOMPARE(source.bytesRead(), quint64(200));
        QCOMPARE(QByteArray(buf, 100), m_content.left(100));
    }

    void sharedCounter_receivesReads()
    {
        std::atomic<quint64> counter{5};
        CountingSource source(&counter);
        QVERIFY(source.open(m_path));
        char buf[64];
        QCOMPARE(source.read(buf, 64), qint64(64));
        QCOMPARE(counter.load(), quint64(69));
        QCOMPARE(source.bytesRead(), quint64(69));
    }

    // ── libavformat I/O ──────────────────────────────────────────
    void avio_readsWholeFile()
    {
        CountingSource source;
        QVERIFY(source.open(m_path));
        AVIOContext* avio = source.avioContext();
        QVERIFY(avio);
        QCOMPARE(source.avioContext(), avio);
        QCOMPARE(avio_size(avio), int64_t(m_content.size()));

        QByteArray collected;
        unsigned char buf[1000];
        for (;;) {
            int n = avio_read(avio, buf, sizeof(buf));
            if (n <= 0)
                break;
            collected.append(reinterpret_cast<const char*>(buf), n);
        }
        QCOMPARE(collected, m_content);
        QCOMPARE(source.bytesRead(), quint64(m_content.size()));
    }

    void avio_seekThenRead()
    {
        CountingSource source;
        QVERIFY(source.open(m_path));
        AVIOContext* avio = source.avioContext();
        QVERIFY(avio);
        QCOMPARE(avio_seek(avio, 90000, SEEK_SET), int64_t(90000));

        unsigned char buf[16];
        QCOMPARE(avio_read(avio, buf, 16), 16);
        QCOMPARE(QByteArray(reinterpret_cast<const char*>(buf), 16), m_content.mid(90000, 16));
    }

    void avio_unavailableWhenClosed()
    {
        CountingSource source;
        QVERIFY(!source.avioContext());
    }
};

QTEST_MAIN(tst_CountingSource)
#include "tst_CountingSource.moc"
