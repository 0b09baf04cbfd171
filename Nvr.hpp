#pragma once

#include <memory>
#include <mutex>
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include "BootstrapSync.hpp"
#include "ClientConfig.hpp"
#include "EventChannel.hpp"
#include "HttpTransport.hpp"
#include "Inventory.hpp"
#include "Logger.hpp"
#include "RealtimeSocket.hpp"
#include "RequestGateway.hpp"
#include "Root.hpp"
#include "SessionManager.hpp"





namespace ProtectClientPp
{





/** Represents a single UniFi Protect NVR on the network.
Owns all the components talking to the NVR, keeps the inventory refreshed periodically and provides the camera
reconfiguration operations.
The public methods are safe to call from any thread; the work is posted onto the io_context and the callbacks are
called from the io_context's thread. */
class Nvr:
	public std::enable_shared_from_this<Nvr>
{
public:

	using Callback = std::function<void(const std::error_code &)>;

	/** The callback for the camera operations.
	On success, receives the device as updated by the NVR. On error, receives the device as it was passed in. */
	using DeviceCallback = std::function<void(const std::error_code &, const Device &)>;


	/** Creates a new instance, wrapped in a shared_ptr.
	Wrapping in shared_ptr is required due to lifetime management.
	If aTransport or aSocketFactory is nullptr, the HTTPS / WebSocket implementations are used. */
	static std::shared_ptr<Nvr> create(
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		asio::io_context & aIoContext = Root::instance().ioContext(),
		std::shared_ptr<HttpTransport> aTransport = nullptr,
		std::shared_ptr<RealtimeSocketFactory> aSocketFactory = nullptr
	);

	/** Sets the receiver of the inventory change notifications. Must be called before start(). */
	void setObserver(std::shared_ptr<InventoryObserver> aObserver);

	/** Sets the receiver of the realtime update messages. Must be called before start(). */
	void setUpdateListener(EventChannel::UpdateListener aListener);

	/** Starts the periodic inventory refresh; the first refresh is done right away. */
	void start();

	/** Refreshes the inventory right away, reports the result through the callback. */
	void refreshDevices(Callback aOnFinish);

	/** Returns the devices in the current inventory snapshot (empty before the first successful refresh). */
	std::vector<Device> devices() const;

	/** Returns true if the logged in user has the Administrator role. */
	bool isAdmin() const;

	/** Returns true if any known camera has a channel with RTSP disabled.
	Note that despite the name, true means there is still some configuring to do. */
	bool isAllRtspConfigured() const;

	/** Enables RTSP on all the channels of the camera, if not enabled already.
	Requires the Administrator role. */
	void enableRtsp(const Device & aDevice, DeviceCallback aOnFinish);

	/** Pushes the channel configuration of the device to the NVR.
	Requires the Administrator role. */
	void updateChannels(const Device & aDevice, DeviceCallback aOnFinish);

	/** Sends the (opaque) configuration change to the NVR.
	Requires the Administrator role. */
	void updateCamera(const Device & aDevice, const nlohmann::json & aPayload, DeviceCallback aOnFinish);

	/** Sends an arbitrary API request, logging in first if needed. */
	void loginFetch(
		const std::string & aUrl,
		const std::string & aMethod,
		const std::string & aBody,
		bool aDecodeJson,
		bool aLogErrors,
		RequestGateway::Callback aOnFinish
	);

	/** Stops the periodic refresh, closes the realtime connection and cancels the requests in flight. */
	void shutdown();

	std::shared_ptr<RequestGateway> gateway() const { return mGateway; }
	std::shared_ptr<SessionManager> sessionManager() const { return mSessionManager; }
	std::shared_ptr<EventChannel> eventChannel() const { return mEventChannel; }
	std::shared_ptr<BootstrapSync> bootstrapSync() const { return mBootstrapSync; }


protected:

	asio::io_context & mIoContext;
	ClientConfig mConfig;
	std::shared_ptr<Logger> mLogger;

	std::shared_ptr<RequestGateway> mGateway;
	std::shared_ptr<SessionManager> mSessionManager;
	std::shared_ptr<EventChannel> mEventChannel;
	std::shared_ptr<BootstrapSync> mBootstrapSync;

	/** Fires the periodic inventory refresh. */
	asio::steady_timer mRefreshTimer;

	/** Set once shutdown() has been processed. */
	bool mIsShuttingDown;

	/** Protects mDevices and mIsAdmin, which are read from any thread. */
	mutable std::mutex mMtxState;

	/** A copy of the devices in the current snapshot, published for the readers on other threads. */
	std::vector<Device> mDevices;

	/** A copy of the session's Administrator role status, published for the readers on other threads. */
	bool mIsAdmin;


	Nvr(
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		asio::io_context & aIoContext,
		std::shared_ptr<HttpTransport> aTransport,
		std::shared_ptr<RealtimeSocketFactory> aSocketFactory
	);

	/** Refreshes the inventory and publishes the new state. */
	void doRefresh(Callback aOnFinish);

	/** Performs the scheduled refresh, then re-arms the refresh timer. */
	void scheduledRefresh();

	/** Copies the current snapshot's devices and the admin status into the thread-safe copies. */
	void publishState();

	/** Checks that we're logged in, the user is an admin and the device is a camera. */
	void checkCameraState(const Device & aDevice, Callback aOnFinish);

	/** Sends the channel configuration of the (already checked) camera to the NVR. */
	void patchChannels(const Device & aDevice, DeviceCallback aOnFinish);

	/** Parses the updated device out of the NVR's response. */
	std::error_code parseUpdatedDevice(const HttpResponse & aResponse, Device & aDevice);

	std::string fullName(const Device & aDevice) const;
};

}  // namespace ProtectClientPp
