#pragma once

#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <asio.hpp>
#include <asio/ssl.hpp>




namespace ProtectClientPp
{




/** Creates the SSL context to be shared by the TLS connections.
If aVerifyCertificates is false, the peer certificates are not verified at all (the NVRs use self-signed ones). */
std::shared_ptr<asio::ssl::context> createSslContext(bool aVerifyCertificates);





/** Represents a single generic TLS-over-TCP connection.
Provides a more usual facade for working with network connection than ASIO:
Handles the details of queueing the outgoing data, so that clients need only call TlsConnection::send(...)
Handles incoming data by appending it to mIncomingData and calling a virtual function parseIncomingData() so
that a descendant may process the data.
Usage:
Create a descendant from this class and call the send() function to send data,
override parseIncomingData() to receive data,
override disconnected() to react to disconnecting.
Note that this class must be wrapped in a std::shared_ptr<> because of lifetime constraints. */
class TlsConnection:
	public std::enable_shared_from_this<TlsConnection>
{
public:

	TlsConnection(asio::io_context & aIoContext, std::shared_ptr<asio::ssl::context> aSslContext);

	virtual ~TlsConnection() {}

	/** Asynchronously connects to the specified host + port and performs the TLS handshake.
	If aVerifyHostName is true, the certificate is checked to match the host name.
	Returns immediately, calls the finish handler async afterwards from an ASIO worker thread. */
	void connectTls(
		const std::string & aHostName,
		uint16_t aPort,
		bool aVerifyHostName,
		std::function<void(const std::error_code &)> aOnFinish
	);

	/** Asynchronously sends the specified data.
	Returns immediately, there is no notification about having sent the data. */
	virtual void send(const std::string & aData);

	/** Closes the socket once all the data queued by send() has been written out. */
	void closeAfterSending();

	/** Closes the socket immediately, without the TLS shutdown.
	Ignores any errors, returns immediately. Pending operations finish with asio::error::operation_aborted. */
	void closeSocket();


protected:

	asio::io_context & mIoContext;

	/** The SSL context used by mStream; kept alive for as long as the stream exists. */
	std::shared_ptr<asio::ssl::context> mSslContext;

	/** The resolver used for DNS lookup while connecting. */
	asio::ip::tcp::resolver mResolver;

	/** The TLS stream over the TCP socket represented in this object. */
	asio::ssl::stream<asio::ip::tcp::socket> mStream;

	/** The data queued for sending over the mStream (ASIO buffer).
	If an outgoing packet is in-flight (mIsOutgoing is true), the buffer is used for an outgoing operation and must not be touched. */
	std::string mOutgoingData;

	/** Flag whether there is an outgoing packet in-flight.
	If true, mOutgoingData contains the packet and must not be modified.
	If false, there's no outgoing packet, mOutgoingData may be freely modified.
	Protected against multithreaded access by mMtxTransfer. */
	bool mIsOutgoing;

	/** The queue for data to be transfered out.
	Protected against multithreaded access by mMtxTransfer. */
	std::string mOutgoingQueue;

	/** The buffer for a single read operation (ASIO buffer). */
	std::array<char, 64 * 1024> mReadBuffer;

	/** The data received so far and not yet consumed by parseIncomingData(). */
	std::string mIncomingData;

	/** The mutex protecting mIsOutgoing, mOutgoingQueue against multithreaded access. */
	std::recursive_mutex mMtxTransfer;

	/** Flag specifying whether the TLS session is established. */
	bool mIsConnected;

	/** Flag specifying whether closeSocket() has been called; no more I/O is started after that. */
	bool mIsClosed;

	/** Set by closeAfterSending() while there is still outgoing data to be written.
	Protected against multithreaded access by mMtxTransfer. */
	bool mShouldCloseWhenSent;


	/** Queues another read operation with ASIO. */
	void queueRead();

	/** Called by ASIO when mOutgoingData has been written to mStream. */
	void onWritten(const std::error_code & aError);

	/** Called by ASIO when data has been read into mReadBuffer. */
	void onRead(const std::error_code & aError, std::size_t aNumBytes);

	/** Takes next item in mOutgoingQueue, if available, and starts writing it.
	Moves the item from mOutgoingQueue into mOutgoingData. */
	void writeNextQueueItem();

	/** Parses mIncomingData for any complete protocol units, processes them and removes them from mIncomingData.
	Descendants provide this protocol-specific functionality. */
	virtual void parseIncomingData() = 0;

	/** Called when a disconnect (or any I/O error) is detected on the socket.
	Descendants provide specific functionality for this. */
	virtual void disconnected(const std::error_code & aError) = 0;
};





}  // namespace ProtectClientPp
