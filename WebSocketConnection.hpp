#pragma once

#include "RealtimeSocket.hpp"
#include "TlsConnection.hpp"
#include "Urls.hpp"





namespace ProtectClientPp
{





/** A client WebSocket (RFC 6455) connection over TLS.
Performs the upgrade handshake, reassembles the fragmented messages and answers the pings.
The events are posted to the io_context and delivered to the handler from there. */
class WebSocketConnection:
	public TlsConnection,
	public RealtimeSocket
{
	using Super = TlsConnection;

public:

	/** The largest message we're willing to receive; anything larger is considered a protocol violation. */
	static const size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;


	/** Creates a new instance.
	Because of lifetime management, this class can only ever exist owned by a shared_ptr, therefore clients need to use
	create() instead of a constructor. */
	static std::shared_ptr<WebSocketConnection> create(
		asio::io_context & aIoContext,
		std::shared_ptr<asio::ssl::context> aSslContext,
		bool aVerifyHostName,
		std::chrono::milliseconds aHandshakeTimeout
	);

	/** Starts connecting to the specified URL, sending the extra headers with the upgrade request.
	Returns false and sets aError if the connection cannot be started at all; no events are delivered then. */
	bool start(const Url & aUrl, const HttpHeaders & aHeaders, EventHandler aHandler, std::error_code & aError);

	// RealtimeSocket override:
	virtual void terminate() override;

	/** Returns the value of the Sec-WebSocket-Accept header that the server must send for the specified key. */
	static std::string acceptKeyFor(const std::string & aKey);


protected:

	bool mVerifyHostName;
	std::chrono::milliseconds mHandshakeTimeout;

	/** The handler receiving the events; reset upon terminate(). */
	EventHandler mHandler;

	/** The Sec-WebSocket-Key sent in the upgrade request. */
	std::string mKey;

	/** Limits the time for the connecting and the upgrade handshake. */
	asio::steady_timer mHandshakeTimer;

	/** Set once the server has accepted the upgrade. */
	bool mIsOpen;

	/** Set once Closed or Failed has been reported; no more events are reported after that. */
	bool mIsDone;

	/** The opcode of the fragmented message being reassembled, 0 if none. */
	int mFragmentOpcode;

	/** The payload of the fragmented message reassembled so far. */
	std::string mFragmentData;


	WebSocketConnection(
		asio::io_context & aIoContext,
		std::shared_ptr<asio::ssl::context> aSslContext,
		bool aVerifyHostName,
		std::chrono::milliseconds aHandshakeTimeout
	);

	/** Returns a correctly typed shared_ptr to self. */
	std::shared_ptr<WebSocketConnection> selfPtr() { return std::static_pointer_cast<WebSocketConnection>(shared_from_this()); }

	/** Posts the event to the handler, unless terminated in the meantime. */
	void emit(SocketEvent aEvent, const std::error_code & aError = {}, const std::string & aPayload = {});

	/** Reports the failure (unless already done) and closes the socket. */
	void fail(const std::error_code & aError);

	/** Parses the server's response to the upgrade request, out of mIncomingData.
	Returns false if more data is needed or the upgrade failed. */
	bool parseUpgradeResponse();

	/** Parses a single frame out of mIncomingData and processes it.
	Returns false if more data is needed or the connection has failed. */
	bool parseFrame();

	/** Processes a single complete frame. */
	void processFrame(bool aIsFinal, int aOpcode, std::string && aPayload);

	/** Sends a single (masked) frame to the server. */
	void sendFrame(int aOpcode, const std::string & aPayload);

	// TlsConnection overrides:
	virtual void parseIncomingData() override;
	virtual void disconnected(const std::error_code & aError) override;
};





/** The RealtimeSocketFactory that creates WebSocketConnection instances. */
class WebSocketFactory:
	public RealtimeSocketFactory
{
public:

	/** Creates a new factory whose connections run in the specified io_context.
	If aVerifyTlsCertificates is false, the server certificates are not validated.
	aHandshakeTimeout limits the time between opening the connection and the server accepting the upgrade. */
	WebSocketFactory(asio::io_context & aIoContext, bool aVerifyTlsCertificates, std::chrono::milliseconds aHandshakeTimeout);

	virtual std::shared_ptr<RealtimeSocket> open(
		const std::string & aUrl,
		const HttpHeaders & aHeaders,
		RealtimeSocket::EventHandler aHandler,
		std::error_code & aError
	) override;


protected:

	asio::io_context & mIoContext;
	bool mVerifyTlsCertificates;
	std::chrono::milliseconds mHandshakeTimeout;
	std::shared_ptr<asio::ssl::context> mSslContext;
};

}  // namespace ProtectClientPp
