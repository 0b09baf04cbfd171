#pragma once

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include "HttpMessage.hpp"





namespace ProtectClientPp
{





/** The notifications delivered by a realtime socket. */
enum class SocketEvent
{
	Opened,  // The upgrade handshake has completed
	Frame,   // A data message has arrived (the payload is provided)
	Ping,    // A protocol-level ping has arrived (already answered by the socket)
	Closed,  // The connection was closed
	Failed,  // The connection failed (the error is provided)
};





/** A single realtime (WebSocket) connection.
WebSocketConnection is the real implementation; the tests substitute their own. */
class RealtimeSocket
{
public:

	/** The handler for the socket's notifications.
	aError is only set for SocketEvent::Failed, aPayload only for SocketEvent::Frame. */
	using EventHandler = std::function<void(SocketEvent aEvent, const std::error_code & aError, const std::string & aPayload)>;


	virtual ~RealtimeSocket() {}

	/** Immediately destroys the connection, without the closing handshake.
	No more events are delivered after this call, except that a socket that hasn't finished establishing yet
	reports SocketEvent::Failed with Error::ClosedBeforeEstablished. */
	virtual void terminate() = 0;
};





/** Creates realtime sockets. */
class RealtimeSocketFactory
{
public:

	virtual ~RealtimeSocketFactory() {}

	/** Starts opening a new connection to the specified wss:// URL, with the specified extra upgrade headers.
	The events are delivered to aHandler from the io_context's thread.
	Returns nullptr and sets aError if the connection cannot even be started. */
	virtual std::shared_ptr<RealtimeSocket> open(
		const std::string & aUrl,
		const HttpHeaders & aHeaders,
		RealtimeSocket::EventHandler aHandler,
		std::error_code & aError
	) = 0;
};

}  // namespace ProtectClientPp
