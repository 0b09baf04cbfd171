#pragma once

#include <memory>
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include "ClientConfig.hpp"
#include "Heartbeat.hpp"
#include "Logger.hpp"
#include "RealtimeSocket.hpp"





namespace ProtectClientPp
{





// fwd:
class SessionManager;





/** The realtime update events connection to the NVR.
Keeps at most one connection open and supervises its liveness: if no traffic arrives within the heartbeat interval,
the connection is terminated and forgotten, so that the next connect() can make a new one.
All methods must be called from the io_context's thread; all callbacks are called from it as well. */
class EventChannel:
	public std::enable_shared_from_this<EventChannel>
{
public:

	using Callback = std::function<void(const std::error_code &)>;

	/** The listener for the update messages received through the connection. */
	using UpdateListener = std::function<void(const nlohmann::json & aUpdate)>;


	/** Creates a new instance, wrapped in a shared_ptr (required for lifetime management of the async handlers).
	aNow provides the current time for the heartbeat supervision; Clock::now is used if not given. */
	static std::shared_ptr<EventChannel> create(
		asio::io_context & aIoContext,
		std::shared_ptr<RealtimeSocketFactory> aSocketFactory,
		std::shared_ptr<SessionManager> aSessionManager,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow = nullptr
	);

	/** Opens the realtime connection, resuming the event stream from the specified update cursor.
	Makes sure we're logged in first. Does nothing (and reports success) if a connection is already open.
	If the connection cannot be started, reports the error, but doesn't retry; the next scheduled refresh will. */
	void connect(const std::string & aLastUpdateId, Callback aOnFinish);

	/** Terminates the connection (if any) and cancels the heartbeat supervision. */
	void disconnect();

	/** Terminates the connection and suppresses the errors that the termination may cause. */
	void shutdown();

	/** Returns true if a connection is recorded as live. */
	bool isConnected() const { return (mSocket != nullptr); }

	void setUpdateListener(UpdateListener aListener) { mUpdateListener = std::move(aListener); }

	/** Sets the function that provides the NVR name for the log messages. */
	void setNameSource(std::function<std::string()> aSource) { mNameSource = std::move(aSource); }


protected:

	std::shared_ptr<RealtimeSocketFactory> mSocketFactory;
	std::shared_ptr<SessionManager> mSessionManager;
	std::shared_ptr<Logger> mLogger;
	std::string mNvrAddress;
	NowFunction mNow;

	/** The live connection, nullptr if none. */
	std::shared_ptr<RealtimeSocket> mSocket;

	/** Identifies the current connection; events from older connections are ignored.
	Bumped by teardown(), so that the events caused by terminating a connection are never processed. */
	uint64_t mSocketID;

	Heartbeat mHeartbeat;

	/** The timer firing at the heartbeat deadline. */
	asio::steady_timer mHeartbeatTimer;

	/** Set once shutdown() has been called. */
	bool mIsShuttingDown;

	UpdateListener mUpdateListener;
	std::function<std::string()> mNameSource;


	EventChannel(
		asio::io_context & aIoContext,
		std::shared_ptr<RealtimeSocketFactory> aSocketFactory,
		std::shared_ptr<SessionManager> aSessionManager,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow
	);

	std::string nvrName() const;

	/** Opens the socket, once the login has been verified. */
	void open(const std::string & aLastUpdateId, Callback aOnFinish);

	/** Processes a single notification from the socket identified by aSocketID. */
	void onSocketEvent(uint64_t aSocketID, SocketEvent aEvent, const std::error_code & aError, const std::string & aPayload);

	/** Executes the action decided by the heartbeat state machine. */
	void applyHeartbeatAction(HeartbeatAction aAction);

	/** Called by ASIO when the heartbeat timer fires (or is cancelled). */
	void onHeartbeatTimer(const std::error_code & aError);

	/** Terminates the current connection immediately and forgets it. */
	void teardown();
};

}  // namespace ProtectClientPp
