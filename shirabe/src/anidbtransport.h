#ifndef ANIDBTRANSPORT_H
#define ANIDBTRANSPORT_H

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QHostAddress>

class QUdpSocket;

/**
 * @brief Datagram channel to the AniDB UDP API
 */
class AniDBTransport : public QObject
{
	Q_OBJECT
public:
	explicit AniDBTransport(QObject *parent = nullptr) : QObject(parent) {}
	~AniDBTransport() override = default;

	virtual bool open(QString *error) = 0;
	virtual void close() = 0;
	virtual bool isOpen() const = 0;

	/**
	 * @brief Send one datagram
	 * @param error Receives the socket error on failure
	 */
	virtual bool sendDatagram(const QByteArray &datagram, QString *error) = 0;

signals:
	void datagramReceived(const QByteArray &datagram);
};

/**
 * @brief AniDBTransport over a QUdpSocket connected to the API host
 */
class UdpTransport : public AniDBTransport
{
	Q_OBJECT
public:
	/**
	 * @param localPort 0 binds an ephemeral port
	 */
	UdpTransport(const QString &host, quint16 port, quint16 localPort, QObject *parent = nullptr);
	~UdpTransport() override;

	bool open(QString *error) override;
	void close() override;
	bool isOpen() const override;
	bool sendDatagram(const QByteArray &datagram, QString *error) override;

	QHostAddress serverAddress() const { return anidbaddr; }

private slots:
	void Recv();

private:
	QString hostName;
	quint16 anidbport;
	quint16 localport;
	QHostAddress anidbaddr;
	QUdpSocket *Socket;
};

#endif // ANIDBTRANSPORT_H
