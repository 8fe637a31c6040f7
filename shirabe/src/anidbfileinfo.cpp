#include "anidbfileinfo.h"
#include "logger.h"

namespace {

struct MaskBit {
    uint32_t bit;
    QString* field;
};

/**
 * Consume one token per set bit, in table order. Stops filling once the
 * tokens run out; the remaining selected fields are counted as missing.
 */
template <size_t N>
void consumeFields(const QStringList& tokens, uint64_t mask, MaskBit (&maskBits)[N],
                   int& index, int& missing)
{
    for (size_t i = 0; i < N; i++)
    {
        if (!(mask & maskBits[i].bit))
            continue;
        if (index >= tokens.size())
        {
            missing++;
            continue;
        }
        *(maskBits[i].field) = tokens.at(index++);
    }
}

}

AniDBFileInfo::AniDBFileInfo()
    : m_truncated(false)
    , m_fieldsDecoded(0)
    , m_missingFields(0)
{
}

QStringList AniDBFileInfo::splitList(const QString& value)
{
    if (value.isEmpty())
        return QStringList();
    return value.split('\'');
}

AniDBFileInfo AniDBFileInfo::fromParts(const FileData& file,
                                       const AnimeData& anime,
                                       const EpisodeData& episode,
                                       const GroupData& group,
                                       const QString& raw)
{
    AniDBFileInfo info;
    info.m_file = file;
    info.m_anime = anime;
    info.m_episode = episode;
    info.m_group = group;
    info.m_raw = raw;
    return info;
}

int AniDBFileInfo::expectedFieldCount(const Mask& fmask, const Mask& amask)
{
    // An empty line leaves every selected field missing
    return decode(QString(), fmask, amask).missingFields();
}

AniDBFileInfo AniDBFileInfo::decode(const QString& dataLine,
                                    const Mask& fmask,
                                    const Mask& amask,
                                    bool truncated)
{
    AniDBFileInfo info;
    info.m_raw = dataLine;
    info.m_truncated = truncated;

    QString line = dataLine;
    while (line.endsWith('\n') || line.endsWith('\r'))
        line.chop(1);

    QStringList tokens;
    if (!line.isEmpty())
        tokens = line.split('|');

    if (truncated && !tokens.isEmpty())
    {
        LOG(QString("[AniDB Response] 220 FILE - Truncated response, removing last field (was: '%1')")
            .arg(tokens.last()));
        tokens.removeLast();
    }

    const uint64_t f = fmask.getValue();
    const uint64_t a = amask.getValue();
    int index = 0;
    int missing = 0;

    // fid is always returned first, regardless of mask
    if (index < tokens.size())
        info.m_file.fid = tokens.at(index++);
    else
        missing++;

    FileData& file = info.m_file;
    MaskBit fileBits[] = {
        {Mask::fAID,            &file.aid},              // Bit 30
        {Mask::fEID,            &file.eid},              // Bit 29
        {Mask::fGID,            &file.gid},              // Bit 28
        {Mask::fLID,            &file.lid},              // Bit 27
        {Mask::fOTHEREPS,       &file.othereps},         // Bit 26
        {Mask::fISDEPR,         &file.isdepr},           // Bit 25
        {Mask::fSTATE,          &file.state},            // Bit 24
        {Mask::fSIZE,           &file.size},             // Bit 23
        {Mask::fED2K,           &file.ed2k},             // Bit 22
        {Mask::fMD5,            &file.md5},              // Bit 21
        {Mask::fSHA1,           &file.sha1},             // Bit 20
        {Mask::fCRC32,          &file.crc},              // Bit 19
        // Bits 18-16 reserved
        {Mask::fQUALITY,        &file.quality},          // Bit 15
        {Mask::fSOURCE,         &file.source},           // Bit 14
        {Mask::fCODEC_AUDIO,    &file.codec_audio},      // Bit 13
        {Mask::fBITRATE_AUDIO,  &file.bitrate_audio},    // Bit 12
        {Mask::fCODEC_VIDEO,    &file.codec_video},      // Bit 11
        {Mask::fBITRATE_VIDEO,  &file.bitrate_video},    // Bit 10
        {Mask::fRESOLUTION,     &file.resolution},       // Bit 9
        {Mask::fFILETYPE,       &file.filetype},         // Bit 8
        {Mask::fLANG_DUB,       &file.lang_dub},         // Bit 7
        {Mask::fLANG_SUB,       &file.lang_sub},         // Bit 6
        {Mask::fLENGTH,         &file.length},           // Bit 5
        {Mask::fDESCRIPTION,    &file.description},      // Bit 4
        {Mask::fAIRDATE,        &file.airdate},          // Bit 3
        // Bits 2-1 reserved
        {Mask::fFILENAME,       &file.filename}          // Bit 0
    };
    consumeFields(tokens, f, fileBits, index, missing);

    AnimeData& anime = info.m_anime;
    MaskBit animeBits[] = {
        {Mask::aEPISODE_TOTAL,      &anime.eptotal},     // Bit 31
        {Mask::aEPISODE_LAST,       &anime.eplast},      // Bit 30
        {Mask::aANIME_YEAR,         &anime.year},        // Bit 29
        {Mask::aANIME_TYPE,         &anime.type},        // Bit 28
        {Mask::aANIME_RELATED_LIST, &anime.relaidlist},  // Bit 27
        {Mask::aANIME_RELATED_TYPE, &anime.relaidtype},  // Bit 26
        {Mask::aANIME_CATEGORY,     &anime.category},    // Bit 25
        // Bit 24 reserved
        {Mask::aANIME_NAME_ROMAJI,  &anime.nameromaji},  // Bit 23
        {Mask::aANIME_NAME_KANJI,   &anime.namekanji},   // Bit 22
        {Mask::aANIME_NAME_ENGLISH, &anime.nameenglish}, // Bit 21
        {Mask::aANIME_NAME_OTHER,   &anime.nameother},   // Bit 20
        {Mask::aANIME_NAME_SHORT,   &anime.nameshort},   // Bit 19
        {Mask::aANIME_SYNONYMS,     &anime.synonyms}     // Bit 18
    };
    consumeFields(tokens, a, animeBits, index, missing);

    EpisodeData& episode = info.m_episode;
    MaskBit episodeBits[] = {
        {Mask::aEPISODE_NUMBER,      &episode.epno},         // Bit 15
        {Mask::aEPISODE_NAME,        &episode.epname},       // Bit 14
        {Mask::aEPISODE_NAME_ROMAJI, &episode.epnameromaji}, // Bit 13
        {Mask::aEPISODE_NAME_KANJI,  &episode.epnamekanji},  // Bit 12
        {Mask::aEPISODE_RATING,      &episode.eprating},     // Bit 11
        {Mask::aEPISODE_VOTE_COUNT,  &episode.epvotecount}   // Bit 10
    };
    consumeFields(tokens, a, episodeBits, index, missing);

    GroupData& group = info.m_group;
    MaskBit groupBits[] = {
        {Mask::aGROUP_NAME,              &group.groupname},            // Bit 7
        {Mask::aGROUP_NAME_SHORT,        &group.groupshortname},       // Bit 6
        // Bits 5-1 reserved
        {Mask::aDATE_AID_RECORD_UPDATED, &group.dateaidrecordupdated}  // Bit 0
    };
    consumeFields(tokens, a, groupBits, index, missing);

    info.m_fieldsDecoded = index;
    info.m_missingFields = missing;
    if (index < tokens.size())
        info.m_extraFields = tokens.mid(index);

    if (missing > 0 && !dataLine.isEmpty())
    {
        LOG_DEBUG(QString("[AniDB Response] 220 FILE - %1 selected field(s) absent from reply").arg(missing));
    }
    if (!info.m_extraFields.isEmpty())
    {
        LOG_DEBUG(QString("[AniDB Response] 220 FILE - %1 unmapped trailing field(s) kept")
            .arg(info.m_extraFields.size()));
    }
    return info;
}

QString AniDBFileInfo::toString() const
{
    QString title = m_anime.nameromaji;
    if (title.isEmpty())
        title = m_anime.nameenglish;
    if (title.isEmpty())
        title = QString("aid %1").arg(m_file.aid);

    QString text = QString("fid %1: %2").arg(m_file.fid, title);
    if (!m_episode.epno.isEmpty())
        text += QString(" - %1").arg(m_episode.epno);
    if (!m_episode.epname.isEmpty())
        text += QString(" \"%1\"").arg(m_episode.epname);
    if (!m_group.groupshortname.isEmpty())
        text += QString(" [%1]").arg(m_group.groupshortname);
    if (m_truncated)
        text += " (truncated)";
    return text;
}
