#include "anidbcommand.h"
#include <QStringList>
#include <QUrl>

AniDBCommand::AniDBCommand(const QString &verb)
    : m_verb(verb)
{
}

AniDBCommand &AniDBCommand::add(const QString &key, const QString &value)
{
    m_params.append(qMakePair(key, value));
    return *this;
}

AniDBCommand &AniDBCommand::add(const QString &key, qint64 value)
{
    return add(key, QString::number(value));
}

QString AniDBCommand::value(const QString &key) const
{
    for (const auto &param : m_params) {
        if (param.first == key)
            return param.second;
    }
    return QString();
}

bool AniDBCommand::hasParameter(const QString &key) const
{
    for (const auto &param : m_params) {
        if (param.first == key)
            return true;
    }
    return false;
}

QString AniDBCommand::encodeValue(const QString &value)
{
    // Same unreserved set as encodeURIComponent
    return QString::fromLatin1(QUrl::toPercentEncoding(value, "!'()*"));
}

QString AniDBCommand::render(const QString &tag) const
{
    QStringList pairs;
    if (!tag.isEmpty())
        pairs << QString("tag=%1").arg(encodeValue(tag));
    for (const auto &param : m_params)
        pairs << QString("%1=%2").arg(param.first, encodeValue(param.second));

    if (pairs.isEmpty())
        return m_verb;
    return m_verb + " " + pairs.join('&');
}

QString AniDBCommand::redacted(const QString &tag) const
{
    AniDBCommand copy(m_verb);
    for (const auto &param : m_params) {
        if (param.first == "pass")
            copy.add(param.first, QString("***"));
        else if (param.first == "s")
            copy.add(param.first, param.second.left(3) + "...");
        else
            copy.add(param.first, param.second);
    }
    return copy.render(tag);
}
