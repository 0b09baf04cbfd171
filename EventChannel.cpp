#include "EventChannel.hpp"

#include <fmt/format.h>
#include "Error.hpp"
#include "SessionManager.hpp"
#include "Urls.hpp"





namespace ProtectClientPp
{





std::shared_ptr<EventChannel> EventChannel::create(
	asio::io_context & aIoContext,
	std::shared_ptr<RealtimeSocketFactory> aSocketFactory,
	std::shared_ptr<SessionManager> aSessionManager,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
)
{
	return std::shared_ptr<EventChannel>(new EventChannel(
		aIoContext, std::move(aSocketFactory), std::move(aSessionManager), aConfig, std::move(aLogger), std::move(aNow)
	));
}





EventChannel::EventChannel(
	asio::io_context & aIoContext,
	std::shared_ptr<RealtimeSocketFactory> aSocketFactory,
	std::shared_ptr<SessionManager> aSessionManager,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
):
	mSocketFactory(std::move(aSocketFactory)),
	mSessionManager(std::move(aSessionManager)),
	mLogger(std::move(aLogger)),
	mNvrAddress(aConfig.address),
	mNow(aNow ? std::move(aNow) : NowFunction(&Clock::now)),
	mSocketID(0),
	mHeartbeat(aConfig.heartbeatInterval),
	mHeartbeatTimer(aIoContext),
	mIsShuttingDown(false)
{
}





void EventChannel::connect(const std::string & aLastUpdateId, Callback aOnFinish)
{
	mSessionManager->ensureLoggedIn(
		[self = shared_from_this(), aLastUpdateId, aOnFinish](const std::error_code & aError)
		{
			if (aError)
			{
				return aOnFinish(aError);
			}
			self->open(aLastUpdateId, aOnFinish);
		}
	);
}





void EventChannel::disconnect()
{
	teardown();
}





void EventChannel::shutdown()
{
	mIsShuttingDown = true;
	teardown();
}





std::string EventChannel::nvrName() const
{
	return mNameSource ? mNameSource() : mNvrAddress;
}





void EventChannel::open(const std::string & aLastUpdateId, Callback aOnFinish)
{
	// If we already have a connection, we're all set:
	if (mSocket != nullptr)
	{
		return aOnFinish({});
	}
	if (mIsShuttingDown)
	{
		return aOnFinish(Error::ShuttingDown);
	}

	auto url = Urls::updatesUrl(mNvrAddress, aLastUpdateId);
	mLogger->debug(fmt::format("Update listener: {}", url));
	HttpHeaders headers;
	headers.emplace_back("Cookie", mSessionManager->session().cookie);

	auto socketID = ++mSocketID;
	std::error_code err;
	std::weak_ptr<EventChannel> weakSelf = shared_from_this();
	auto socket = mSocketFactory->open(url, headers,
		[weakSelf, socketID](SocketEvent aEvent, const std::error_code & aError, const std::string & aPayload)
		{
			if (auto self = weakSelf.lock())
			{
				self->onSocketEvent(socketID, aEvent, aError, aPayload);
			}
		},
		err
	);
	if (socket == nullptr)
	{
		mLogger->error(fmt::format(
			"{}: Unable to connect to the realtime update events API: {}. Will retry again later.",
			nvrName(), err.message()
		));
		teardown();
		return aOnFinish(err ? err : make_error_code(Error::ClosedBeforeEstablished));
	}
	mSocket = socket;
	mLogger->info(fmt::format("{}: Connected to the UniFi realtime update events API.", nvrName()));
	aOnFinish({});
}





void EventChannel::onSocketEvent(uint64_t aSocketID, SocketEvent aEvent, const std::error_code & aError, const std::string & aPayload)
{
	// Ignore the leftover events from the connections that have been torn down already:
	if ((aSocketID != mSocketID) || (mSocket == nullptr))
	{
		return;
	}

	switch (aEvent)
	{
		case SocketEvent::Failed:
		{
			mLogger->error(fmt::format("{}: {}", nvrName(), aError.message()));
			break;
		}
		case SocketEvent::Frame:
		{
			if (mUpdateListener)
			{
				auto j = nlohmann::json::parse(aPayload, nullptr, false);
				if (j.is_discarded())
				{
					mLogger->debug(fmt::format("{}: Ignoring a non-JSON realtime update ({} bytes).", nvrName(), aPayload.size()));
				}
				else
				{
					mUpdateListener(j);
				}
			}
			break;
		}
		case SocketEvent::Closed:
		{
			mLogger->debug(fmt::format("{}: The realtime update events API connection was closed.", nvrName()));
			break;
		}
		case SocketEvent::Opened:
		case SocketEvent::Ping:
		{
			break;
		}
	}

	auto action = mHeartbeat.onEvent(aEvent, mNow());

	// A closed connection is no longer live, let the next connect() open a new one.
	// The peer may never close the TCP connection, so the socket is terminated rather than just forgotten:
	if (aEvent == SocketEvent::Closed)
	{
		teardown();
		return;
	}
	applyHeartbeatAction(action);
}





void EventChannel::applyHeartbeatAction(HeartbeatAction aAction)
{
	switch (aAction)
	{
		case HeartbeatAction::None:
		{
			return;
		}
		case HeartbeatAction::Rearm:
		{
			mHeartbeatTimer.expires_after(mHeartbeat.deadline() - mNow());
			mHeartbeatTimer.async_wait(
				[self = shared_from_this()](const std::error_code & aError)
				{
					self->onHeartbeatTimer(aError);
				}
			);
			return;
		}
		case HeartbeatAction::Cancel:
		{
			mHeartbeatTimer.cancel();
			return;
		}
		case HeartbeatAction::Teardown:
		{
			teardown();
			return;
		}
	}
}





void EventChannel::onHeartbeatTimer(const std::error_code & aError)
{
	if (aError)
	{
		// Cancelled, either re-armed or torn down
		return;
	}
	auto action = mHeartbeat.onTimer(mNow());
	if (action == HeartbeatAction::Teardown)
	{
		mLogger->error(fmt::format(
			"{}: {}; terminating the realtime update events API connection.",
			nvrName(), make_error_code(Error::HeartbeatExpired).message()
		));
	}
	applyHeartbeatAction(action);
}





void EventChannel::teardown()
{
	mHeartbeat.reset();
	mHeartbeatTimer.cancel();

	// Use terminate() to destroy the connection immediately; a hung peer may never finish a graceful close:
	auto socket = std::move(mSocket);
	mSocketID += 1;
	if (socket != nullptr)
	{
		socket->terminate();
	}
}

}  // namespace ProtectClientPp
