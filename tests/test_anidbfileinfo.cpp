#include <QtTest/QtTest>
#include "../shirabe/src/anidbfileinfo.h"

/**
 * Field decoding of 220 FILE replies.
 *
 * The masks used here select fid (always), aid, eid, size from the file mask
 * and romaji name, episode number, group short name from the anime mask, so
 * a full data line has exactly seven fields.
 */
class TestAniDBFileInfo : public QObject
{
    Q_OBJECT

private:
    Mask fmask() const { return Mask(Mask::fAID | Mask::fEID | Mask::fSIZE, 4); }
    Mask amask() const { return Mask(Mask::aANIME_NAME_ROMAJI | Mask::aEPISODE_NUMBER | Mask::aGROUP_NAME_SHORT, 4); }

private slots:
    void testDecodeSelectedFields()
    {
        AniDBFileInfo info = AniDBFileInfo::decode("312498|4688|69260|733419264|Shingeki no Kyojin|01|HorribleSubs",
                                                   fmask(), amask());
        QVERIFY(info.isValid());
        QCOMPARE(info.fileId(), 312498);
        QCOMPARE(info.animeId(), 4688);
        QCOMPARE(info.episodeId(), 69260);
        QCOMPARE(info.size(), qint64(733419264));
        QCOMPARE(info.anime().nameromaji, QString("Shingeki no Kyojin"));
        QCOMPARE(info.episode().epno, QString("01"));
        QCOMPARE(info.group().groupshortname, QString("HorribleSubs"));
        QCOMPARE(info.fieldsDecoded(), 7);
        QCOMPARE(info.missingFields(), 0);
        QVERIFY(info.extraFields().isEmpty());

        // Fields outside the masks stay empty
        QVERIFY(info.file().gid.isEmpty());
        QVERIFY(info.anime().nameenglish.isEmpty());

        QCOMPARE(info.toString(), QString("fid 312498: Shingeki no Kyojin - 01 [HorribleSubs]"));
    }

    void testFewerFieldsThanMask()
    {
        AniDBFileInfo info = AniDBFileInfo::decode("312498|4688|69260", fmask(), amask());
        QVERIFY(info.isValid());
        QCOMPARE(info.episodeId(), 69260);
        QVERIFY(info.file().size.isEmpty());
        QVERIFY(info.anime().nameromaji.isEmpty());
        QCOMPARE(info.missingFields(), 4);
    }

    void testExtraFieldsKept()
    {
        AniDBFileInfo info = AniDBFileInfo::decode("1|2|3|4|Title|05|Grp|surprise|more", fmask(), amask());
        QCOMPARE(info.group().groupshortname, QString("Grp"));
        QCOMPARE(info.extraFields(), QStringList() << "surprise" << "more");
    }

    void testTruncatedDropsLastField()
    {
        // The datagram was cut inside the group name
        AniDBFileInfo info = AniDBFileInfo::decode("1|2|3|4|Title|05|Horri", fmask(), amask(), true);
        QVERIFY(info.isTruncated());
        QCOMPARE(info.episode().epno, QString("05"));
        QVERIFY(info.group().groupshortname.isEmpty());
        QCOMPARE(info.missingFields(), 1);
        QVERIFY(info.toString().endsWith("(truncated)"));
    }

    void testEmptyFieldsArePositional()
    {
        // Empty fields are positional, not skipped
        AniDBFileInfo info = AniDBFileInfo::decode("1|||4||05|", fmask(), amask());
        QCOMPARE(info.fileId(), 1);
        QVERIFY(info.file().aid.isEmpty());
        QCOMPARE(info.size(), qint64(4));
        QCOMPARE(info.episode().epno, QString("05"));
        QCOMPARE(info.missingFields(), 0);
    }

    void testEmptyLine()
    {
        AniDBFileInfo info = AniDBFileInfo::decode(QString(), fmask(), amask());
        QVERIFY(!info.isValid());
        QCOMPARE(info.missingFields(), 7);
    }

    void testExpectedFieldCount()
    {
        QCOMPARE(AniDBFileInfo::expectedFieldCount(fmask(), amask()), 7);
        // fid + 24 file fields + 14 anime, episode and group fields
        QCOMPARE(AniDBFileInfo::expectedFieldCount(Mask::defaultFileMask(), Mask::defaultAnimeMask()), 39);
    }

    void testListFields()
    {
        Mask f(Mask::fOTHEREPS | Mask::fLANG_DUB | Mask::fLANG_SUB, 4);
        Mask a(Mask::aANIME_RELATED_LIST | Mask::aANIME_SYNONYMS, 4);
        AniDBFileInfo info = AniDBFileInfo::decode("10|12,1'13,1|japanese|english'german|7'9|Syn A'Syn B", f, a);

        QCOMPARE(info.otherEpisodes(), QStringList() << "12,1" << "13,1");
        QCOMPARE(info.dubLanguages(), QStringList() << "japanese");
        QCOMPARE(info.subLanguages(), QStringList() << "english" << "german");
        QCOMPARE(info.relatedAnimeIds(), QStringList() << "7" << "9");
        QCOMPARE(info.synonyms(), QStringList() << "Syn A" << "Syn B");
        QVERIFY(info.categories().isEmpty());
    }

    void testFromParts()
    {
        AniDBFileInfo::FileData file;
        file.fid = "5";
        file.aid = "6";
        AniDBFileInfo::AnimeData anime;
        anime.nameenglish = "Title";
        AniDBFileInfo info = AniDBFileInfo::fromParts(file, anime, AniDBFileInfo::EpisodeData(),
                                                      AniDBFileInfo::GroupData(), "<file/>");
        QVERIFY(info.isValid());
        QCOMPARE(info.animeId(), 6);
        QCOMPARE(info.raw(), QString("<file/>"));
        QCOMPARE(info.toString(), QString("fid 5: Title"));
    }
};

QTEST_MAIN(TestAniDBFileInfo)
#include "test_anidbfileinfo.moc"
