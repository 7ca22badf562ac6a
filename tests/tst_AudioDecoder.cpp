#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "AudioDecoder.h"
#include "CountingSource.h"
#include "MediaDemuxer.h"
#include "WavFixtures.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
}

class tst_AudioDecoder : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

private slots:
    void initTestCase()
    {
        av_log_set_level(AV_LOG_QUIET);
        QVERIFY(m_dir.isValid());
    }

    // ── sampleKindFor ────────────────────────────────────────────
    void sampleKind_packedAndPlanarAgree()
    {
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_U8, 0), SampleKind::Unsigned8);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_U8P, 0), SampleKind::Unsigned8);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S16, 0), SampleKind::Signed16);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S16P, 16), SampleKind::Signed16);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_FLTP, 0), SampleKind::Float32);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_DBL, 0), SampleKind::Float64);
    }

    void sampleKind_s32CarryingTwentyFourBits()
    {
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S32, 32), SampleKind::Signed32);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S32P, 0), SampleKind::Signed32);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S32, 24), SampleKind::Signed24);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_S64, 0), SampleKind::Unsupported);
        QCOMPARE(AudioDecoder::sampleKindFor(AV_SAMPLE_FMT_NONE, 0), SampleKind::Unsupported);
    }

    // ── decoding ─────────────────────────────────────────────────
    void decode_interleavedPcm()
    {
        const QString path = m_dir.filePath(QStringLiteral("stereo.wav"));
        QVERIFY(WavFixtures::writeStereoRamp(path, 500));
        const auto input = WavFixtures::stereoRamp(500);

        CountingSource source;
        QVERIFY(source.open(path));
        MediaDemuxer demuxer;
        QVERIFY(demuxer.open(source));
        auto track = demuxer.selectDefaultTrack();
        QVERIFY(track.has_value());

        AudioDecoder decoder;
        ConversionError error;
        QVERIFY2(decoder.open(demuxer, track->id, &error), qPrintable(error.message));
        QVERIFY(decoder.isOpen());
        QCOMPARE(decoder.codecName(), QStringLiteral("pcm_s16le"));

        AVPacket* packet = av_packet_alloc();
        QVector<qint16> left, right;
        DecodedBuffer buffer;

        auto drain = [&]() {
            while (decoder.receiveBuffer(&buffer, &error) == AudioDecoder::ReceiveStatus::Buffer) {
                QCOMPARE(buffer.kind, SampleKind::Signed16);
                QCOMPARE(buffer.channels, 2);
                QCOMPARE(buffer.stride, 2);
                for (int i = 0; i < buffer.frames; ++i) {
                    left.append(buffer.channel<int16_t>(0)[i * buffer.stride]);
                    right.append(buffer.channel<int16_t>(1)[i * buffer.stride]);
                }
            }
        };

        MediaDemuxer::PacketStatus status;
        while ((status = demuxer.readPacket(packet)) != MediaDemuxer::PacketStatus::EndOfStream) {
            if (status == MediaDemuxer::PacketStatus::Reset)
                continue;
            QVERIFY(decoder.sendPacket(packet, &error));
            av_packet_unref(packet);
            drain();
        }
        av_packet_free(&packet);

        QVERIFY(decoder.sendPacket(nullptr, &error));
        drain();
        // A second drain request is harmless
        QVERIFY(decoder.sendPacket(nullptr, &error));

        QVERIFY(!error.isError());
        QCOMPARE(left, input[0]);
        QCOMPARE(right, input[1]);
    }

    void open_missingTrack()
    {
        MediaDemuxer demuxer;
        AudioDecoder decoder;
        ConversionError error;
        QVERIFY(!decoder.open(demuxer, 0, &error));
        QCOMPARE(error.kind, ConversionError::UnsupportedCodec);
        QVERIFY(!decoder.isOpen());
    }

    void sendPacket_whenClosed()
    {
        AudioDecoder decoder;
        ConversionError error;
        QVERIFY(!decoder.sendPacket(nullptr, &error));
        QCOMPARE(error.kind, ConversionError::DecodeError);
    }
};

QTEST_MAIN(tst_AudioDecoder)
#include "tst_AudioDecoder.moc"
