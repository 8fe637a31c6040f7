#ifndef ANIDBCOMMAND_H
#define ANIDBCOMMAND_H

#include <QString>
#include <QList>
#include <QPair>
#include <QByteArray>

/**
 * @brief An outgoing UDP API command
 *
 * Rendered as "VERB tag=<n>&key=value&key=value". Parameter values are
 * percent-encoded so '&', '=' and spaces survive; keys are sent as given.
 * Parameters keep their insertion order.
 */
class AniDBCommand
{
public:
    explicit AniDBCommand(const QString &verb = QString());

    AniDBCommand &add(const QString &key, const QString &value);
    AniDBCommand &add(const QString &key, qint64 value);

    QString verb() const { return m_verb; }
    QString value(const QString &key) const;
    bool hasParameter(const QString &key) const;
    QList<QPair<QString, QString>> parameters() const { return m_params; }

    // FILE lookups are spaced further apart than other commands
    bool isFileCommand() const { return m_verb == "FILE"; }

    /**
     * @brief Text sent on the wire
     * @param tag Correlation tag, omitted when empty
     */
    QString render(const QString &tag) const;
    QByteArray toDatagram(const QString &tag) const { return render(tag).toUtf8(); }

    /**
     * @brief Same as render() with pass= and s= values masked, for logging
     */
    QString redacted(const QString &tag) const;

    static QString encodeValue(const QString &value);

private:
    QString m_verb;
    QList<QPair<QString, QString>> m_params;
};

#endif // ANIDBCOMMAND_H
