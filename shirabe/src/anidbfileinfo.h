#ifndef ANIDBFILEINFO_H
#define ANIDBFILEINFO_H

#include "mask.h"
#include <QString>
#include <QStringList>
#include <QMetaType>

/**
 * @brief AniDBFileInfo - decoded FILE reply
 *
 * The data line is pipe-delimited. fid always comes first, then one field
 * per bit set in fmask (MSB to LSB), then the amask fields in the same order
 * split into anime, episode and group sections.
 *
 * Decoding is positional and lenient:
 * - a line with fewer fields than the masks promise leaves the rest empty
 * - fields beyond the masks are kept in extraFields()
 * - a truncated datagram loses its last (partial) field before decoding
 *
 * Usage:
 *   AniDBFileInfo info = AniDBFileInfo::decode(reply.dataLine(), fmask, amask);
 *   if (info.isValid())
 *       qDebug() << info.anime().nameromaji << info.episode().epno;
 */
class AniDBFileInfo
{
public:
    struct FileData {
        QString fid;
        QString aid;
        QString eid;
        QString gid;
        QString lid;
        QString othereps;
        QString isdepr;
        QString state;
        QString size;
        QString ed2k;
        QString md5;
        QString sha1;
        QString crc;
        QString quality;
        QString source;
        QString codec_audio;
        QString bitrate_audio;
        QString codec_video;
        QString bitrate_video;
        QString resolution;
        QString filetype;
        QString lang_dub;
        QString lang_sub;
        QString length;
        QString description;
        QString airdate;
        QString filename;
    };

    struct AnimeData {
        QString eptotal;
        QString eplast;
        QString year;
        QString type;
        QString relaidlist;
        QString relaidtype;
        QString category;
        QString nameromaji;
        QString namekanji;
        QString nameenglish;
        QString nameother;
        QString nameshort;
        QString synonyms;
    };

    struct EpisodeData {
        QString epno;
        QString epname;
        QString epnameromaji;
        QString epnamekanji;
        QString eprating;
        QString epvotecount;
    };

    struct GroupData {
        QString groupname;
        QString groupshortname;
        QString dateaidrecordupdated;
    };

    AniDBFileInfo();

    /**
     * @brief Decode a FILE data line
     * @param dataLine Pipe-delimited fields (second line of a 220 reply)
     * @param fmask File mask sent with the request
     * @param amask Anime mask sent with the request
     * @param truncated Drop the last field first (datagram hit the size limit)
     */
    static AniDBFileInfo decode(const QString& dataLine,
                                const Mask& fmask,
                                const Mask& amask,
                                bool truncated = false);

    /**
     * @brief Assemble a record from already separated fields (HTTP replies)
     */
    static AniDBFileInfo fromParts(const FileData& file,
                                   const AnimeData& anime,
                                   const EpisodeData& episode,
                                   const GroupData& group,
                                   const QString& raw);

    /**
     * @brief Number of fields the masks select, fid included
     */
    static int expectedFieldCount(const Mask& fmask, const Mask& amask);

    // Split a list-valued field on the ' separator; empty field gives an empty list
    static QStringList splitList(const QString& value);

    bool isValid() const { return !m_file.fid.isEmpty(); }

    const FileData& file() const { return m_file; }
    const AnimeData& anime() const { return m_anime; }
    const EpisodeData& episode() const { return m_episode; }
    const GroupData& group() const { return m_group; }

    int fileId() const { return m_file.fid.toInt(); }
    int animeId() const { return m_file.aid.toInt(); }
    int episodeId() const { return m_file.eid.toInt(); }
    int groupId() const { return m_file.gid.toInt(); }
    qint64 size() const { return m_file.size.toLongLong(); }

    QStringList otherEpisodes() const { return splitList(m_file.othereps); }
    QStringList dubLanguages() const { return splitList(m_file.lang_dub); }
    QStringList subLanguages() const { return splitList(m_file.lang_sub); }
    QStringList relatedAnimeIds() const { return splitList(m_anime.relaidlist); }
    QStringList relatedAnimeTypes() const { return splitList(m_anime.relaidtype); }
    QStringList categories() const { return splitList(m_anime.category); }
    QStringList shortNames() const { return splitList(m_anime.nameshort); }
    QStringList synonyms() const { return splitList(m_anime.synonyms); }

    // Fields past the ones the masks describe
    QStringList extraFields() const { return m_extraFields; }
    // The data line exactly as received
    QString raw() const { return m_raw; }
    bool isTruncated() const { return m_truncated; }
    int fieldsDecoded() const { return m_fieldsDecoded; }
    // Masked fields that were absent from the line
    int missingFields() const { return m_missingFields; }

    QString toString() const;

private:
    FileData m_file;
    AnimeData m_anime;
    EpisodeData m_episode;
    GroupData m_group;
    QStringList m_extraFields;
    QString m_raw;
    bool m_truncated;
    int m_fieldsDecoded;
    int m_missingFields;
};

Q_DECLARE_METATYPE(AniDBFileInfo)

#endif // ANIDBFILEINFO_H
