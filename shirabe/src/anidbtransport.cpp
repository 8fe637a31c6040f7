#include "anidbtransport.h"
#include "logger.h"
#include <QHostInfo>
#include <QUdpSocket>

UdpTransport::UdpTransport(const QString &host, quint16 port, quint16 localPort, QObject *parent)
	: AniDBTransport(parent)
	, hostName(host)
	, anidbport(port)
	, localport(localPort)
	, Socket(nullptr)
{
}

UdpTransport::~UdpTransport()
{
	close();
}

bool UdpTransport::open(QString *error)
{
	if(Socket != nullptr)
	{
		LOG_DEBUG("[AniDB UDP] Socket already created");
		return true;
	}

	if(anidbaddr.isNull())
	{
		QHostInfo host = QHostInfo::fromName(hostName);
		if(host.error() != QHostInfo::NoError || host.addresses().isEmpty())
		{
			QString msg = QString("cannot resolve %1: %2").arg(hostName, host.errorString());
			LOG_ERROR("[AniDB UDP] " + msg);
			if(error)
				*error = msg;
			return false;
		}
		// Prefer IPv4; the API host publishes both
		anidbaddr = host.addresses().first();
		for(const QHostAddress &address : host.addresses())
		{
			if(address.protocol() == QAbstractSocket::IPv4Protocol)
			{
				anidbaddr = address;
				break;
			}
		}
	}

	Socket = new QUdpSocket(this);
	if(!Socket->bind(QHostAddress::AnyIPv4, localport))
	{
		QString msg = QString("cannot bind port %1: %2").arg(localport).arg(Socket->errorString());
		LOG_ERROR("[AniDB UDP] " + msg);
		if(error)
			*error = msg;
		delete Socket;
		Socket = nullptr;
		return false;
	}

	Socket->connectToHost(anidbaddr, anidbport);
	connect(Socket, &QUdpSocket::readyRead, this, &UdpTransport::Recv);
	LOG(QString("[AniDB UDP] Socket bound to port %1, server %2:%3")
		.arg(Socket->localPort()).arg(anidbaddr.toString()).arg(anidbport));
	return true;
}

void UdpTransport::close()
{
	if(Socket == nullptr)
		return;
	Socket->disconnect(this);
	Socket->close();
	Socket->deleteLater();
	Socket = nullptr;
	LOG("[AniDB UDP] Socket closed");
}

bool UdpTransport::isOpen() const
{
	return Socket != nullptr && Socket->isValid();
}

bool UdpTransport::sendDatagram(const QByteArray &datagram, QString *error)
{
	if(Socket == nullptr || !Socket->isValid() || !Socket->isOpen())
	{
		QString msg = "socket is not open";
		if(Socket != nullptr)
			msg += " - " + Socket->errorString();
		if(error)
			*error = msg;
		return false;
	}

	qint64 written = Socket->write(datagram);
	if(written != datagram.size())
	{
		if(error)
			*error = Socket->errorString();
		return false;
	}
	return true;
}

void UdpTransport::Recv()
{
	if(Socket == nullptr)
		return;

	while(Socket->hasPendingDatagrams())
	{
		QByteArray data;
		data.resize(static_cast<int>(Socket->pendingDatagramSize()));
		qint64 bytesRead = Socket->readDatagram(data.data(), data.size());
		if(bytesRead < 0)
		{
			LOG_WARN("[AniDB Recv] Read failed: " + Socket->errorString());
			continue;
		}
		data.resize(static_cast<int>(bytesRead));
		LOG_DEBUG(QString("[AniDB Recv] Datagram size: %1 bytes").arg(bytesRead));
		emit datagramReceived(data);
	}
}
