#pragma once

#include <memory>
#include "ClientConfig.hpp"
#include "HttpMessage.hpp"
#include "Inventory.hpp"
#include "Logger.hpp"





namespace ProtectClientPp
{





// fwd:
class EventChannel;
class RequestGateway;
class SessionManager;





/** How the Administrator role status changed with the latest bootstrap. */
enum class PrivilegeChange
{
	Initial,    // First determination after (re)connecting
	Unchanged,
	Granted,    // The user has gained the Administrator role since the previous bootstrap
	Revoked,    // The user has lost the Administrator role since the previous bootstrap
};





/** The devices that appeared or disappeared between two snapshots. */
struct DeviceDiff
{
	/** Managed devices present in the new snapshot but not in the old one. */
	std::vector<Device> discovered;

	/** Devices present in the old snapshot but not in the new one. */
	std::vector<Device> removed;
};





/** Receives the notifications about inventory changes.
All the methods have empty default implementations, descendants override only what they need. */
class InventoryObserver
{
public:

	virtual ~InventoryObserver() {}

	virtual void onDeviceDiscovered(const Device & aDevice) {}
	virtual void onDeviceRemoved(const Device & aDevice) {}
	virtual void onPrivilegeChanged(bool aIsAdmin, PrivilegeChange aChange) {}
};





/** Compares the device lists (by MAC address).
Only managed devices are reported as discovered. */
DeviceDiff diffDevices(const std::vector<Device> & aPrevious, const std::vector<Device> & aCurrent);

/** Determines whether the authenticated user has the Administrator role, by looking for a camera permission
that includes write access (such as "camera:write,read:*").
Returns false if the user or their permissions cannot be found in the snapshot, true otherwise (the result is in aIsAdmin). */
bool determineAdmin(const DeviceSnapshot & aSnapshot, bool & aIsAdmin);





/** Keeps the inventory snapshot in sync with the NVR.
All methods must be called from the io_context's thread; all callbacks are called from it as well. */
class BootstrapSync:
	public std::enable_shared_from_this<BootstrapSync>
{
public:

	using Callback = std::function<void(const std::error_code &)>;


	/** Creates a new instance, wrapped in a shared_ptr (required for lifetime management of the async handlers). */
	static std::shared_ptr<BootstrapSync> create(
		std::shared_ptr<RequestGateway> aGateway,
		std::shared_ptr<SessionManager> aSessionManager,
		std::shared_ptr<EventChannel> aEventChannel,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger
	);

	/** Fetches a new snapshot from the NVR, reports the inventory changes and (re)connects the realtime events.
	On any failure the session is cleared, so that the next refresh starts from scratch. */
	void refresh(Callback aOnFinish);

	/** Returns the current snapshot, or nullptr if there's none (not bootstrapped yet, or the session was cleared). */
	std::shared_ptr<const DeviceSnapshot> snapshot() const { return mSnapshot; }

	/** Returns the devices known from the last successful bootstrap.
	Unlike the snapshot, these survive session resets, so that the changes are reported relative to them. */
	const std::vector<Device> & knownDevices() const { return mKnownDevices; }

	/** Drops the current snapshot; the next successful bootstrap is then treated as the first one. */
	void forgetSnapshot() { mSnapshot.reset(); }

	void setObserver(std::shared_ptr<InventoryObserver> aObserver) { mObserver = std::move(aObserver); }

	/** Returns the NVR name for the log messages, based on the current snapshot. */
	std::string nvrName() const;


protected:

	std::shared_ptr<RequestGateway> mGateway;
	std::shared_ptr<SessionManager> mSessionManager;
	std::shared_ptr<EventChannel> mEventChannel;
	std::shared_ptr<Logger> mLogger;
	std::string mNvrAddress;

	std::shared_ptr<const DeviceSnapshot> mSnapshot;
	std::vector<Device> mKnownDevices;
	std::shared_ptr<InventoryObserver> mObserver;


	BootstrapSync(
		std::shared_ptr<RequestGateway> aGateway,
		std::shared_ptr<SessionManager> aSessionManager,
		std::shared_ptr<EventChannel> aEventChannel,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger
	);

	/** Processes the bootstrap response. */
	void onBootstrapResp(const std::error_code & aError, const HttpResponse & aResponse, Callback aOnFinish);

	/** Logs the error, clears the session and reports the error to the callback. */
	void fail(const std::error_code & aError, const std::string & aMessage, const Callback & aOnFinish);

	/** Reports the discovered and removed devices, then remembers the new device list. */
	void updateKnownDevices(const DeviceSnapshot & aSnapshot);

	/** Re-evaluates the Administrator role of the user and reports the changes. */
	void checkAdminStatus(const DeviceSnapshot & aSnapshot, bool aIsFirstRun);
};

}  // namespace ProtectClientPp
