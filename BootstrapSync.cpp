#include "BootstrapSync.hpp"

#include <fmt/format.h>
#include "Error.hpp"
#include "EventChannel.hpp"
#include "Naming.hpp"
#include "RequestGateway.hpp"
#include "SessionManager.hpp"
#include "Urls.hpp"





namespace ProtectClientPp
{





////////////////////////////////////////////////////////////////////////////////
// Globals:

DeviceDiff diffDevices(const std::vector<Device> & aPrevious, const std::vector<Device> & aCurrent)
{
	auto containsMac = [](const std::vector<Device> & aDevices, const std::string & aMac)
	{
		for (const auto & d: aDevices)
		{
			if (d.mac == aMac)
			{
				return true;
			}
		}
		return false;
	};

	DeviceDiff res;
	for (const auto & d: aCurrent)
	{
		if (d.isManaged && !containsMac(aPrevious, d.mac))
		{
			res.discovered.push_back(d);
		}
	}
	for (const auto & d: aPrevious)
	{
		if (!containsMac(aCurrent, d.mac))
		{
			res.removed.push_back(d);
		}
	}
	return res;
}





bool determineAdmin(const DeviceSnapshot & aSnapshot, bool & aIsAdmin)
{
	auto user = aSnapshot.authUser();
	if ((user == nullptr) || user->allPermissions.empty())
	{
		return false;
	}

	// Each permission line reads "<permission type>:<permissions>:<scope>"; only the camera permissions matter:
	aIsAdmin = false;
	for (const auto & entry: user->allPermissions)
	{
		auto typeEnd = entry.find(':');
		if ((typeEnd == std::string::npos) || (entry.compare(0, typeEnd, "camera") != 0))
		{
			continue;
		}
		auto permsEnd = entry.find(':', typeEnd + 1);
		auto perms = entry.substr(typeEnd + 1, (permsEnd == std::string::npos) ? std::string::npos : permsEnd - typeEnd - 1);
		size_t start = 0;
		while (start <= perms.size())
		{
			auto comma = perms.find(',', start);
			if (perms.compare(start, (comma == std::string::npos) ? std::string::npos : comma - start, "write") == 0)
			{
				aIsAdmin = true;
				return true;
			}
			if (comma == std::string::npos)
			{
				break;
			}
			start = comma + 1;
		}
	}
	return true;
}





////////////////////////////////////////////////////////////////////////////////
// BootstrapSync:

std::shared_ptr<BootstrapSync> BootstrapSync::create(
	std::shared_ptr<RequestGateway> aGateway,
	std::shared_ptr<SessionManager> aSessionManager,
	std::shared_ptr<EventChannel> aEventChannel,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger
)
{
	return std::shared_ptr<BootstrapSync>(new BootstrapSync(
		std::move(aGateway), std::move(aSessionManager), std::move(aEventChannel), aConfig, std::move(aLogger)
	));
}





BootstrapSync::BootstrapSync(
	std::shared_ptr<RequestGateway> aGateway,
	std::shared_ptr<SessionManager> aSessionManager,
	std::shared_ptr<EventChannel> aEventChannel,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger
):
	mGateway(std::move(aGateway)),
	mSessionManager(std::move(aSessionManager)),
	mEventChannel(std::move(aEventChannel)),
	mLogger(std::move(aLogger)),
	mNvrAddress(aConfig.address)
{
}





void BootstrapSync::refresh(Callback aOnFinish)
{
	mSessionManager->ensureLoggedIn(
		[self = shared_from_this(), aOnFinish](const std::error_code & aError)
		{
			if (aError)
			{
				return aOnFinish(aError);
			}
			self->mGateway->send(Urls::bootstrapUrl(self->mNvrAddress), "GET", "",
				[self, aOnFinish](const std::error_code & aError, const HttpResponse & aResponse)
				{
					self->onBootstrapResp(aError, aResponse, aOnFinish);
				}
			);
		}
	);
}





std::string BootstrapSync::nvrName() const
{
	return Naming::nvrName(mSnapshot.get(), mNvrAddress);
}





void BootstrapSync::onBootstrapResp(const std::error_code & aError, const HttpResponse & aResponse, Callback aOnFinish)
{
	if (aError)
	{
		return fail(aError, "Unable to retrieve NVR configuration information from UniFi Protect", aOnFinish);
	}
	if (aResponse.json.is_discarded())
	{
		return fail(Error::MalformedResponse, "Unable to parse response from UniFi Protect", aOnFinish);
	}
	auto itr = aResponse.json.find("cameras");
	if ((itr == aResponse.json.end()) || !itr->is_array())
	{
		return fail(Error::MissingDeviceList, "Unable to retrieve camera information from UniFi Protect", aOnFinish);
	}

	std::shared_ptr<DeviceSnapshot> snapshot;
	try
	{
		snapshot = std::make_shared<DeviceSnapshot>(DeviceSnapshot::fromJson(aResponse.json));
	}
	catch (const nlohmann::json::exception & exc)
	{
		return fail(Error::MalformedResponse, fmt::format("Unable to parse response from UniFi Protect ({})", exc.what()), aOnFinish);
	}

	// On (re)connect, let the user know we made it:
	bool isFirstRun = (mSnapshot == nullptr);
	mSnapshot = snapshot;
	if (isFirstRun)
	{
		mLogger->info(fmt::format(
			"{}: Connected to the Protect controller API (address: {} mac: {}).",
			nvrName(), snapshot->nvr.host, snapshot->nvr.mac
		));
	}
	mLogger->debug(fmt::format(
		"{}: Bootstrap: {} devices, {} users, lastUpdateId {}.",
		nvrName(), snapshot->devices.size(), snapshot->users.size(), snapshot->lastUpdateId
	));

	updateKnownDevices(*snapshot);
	checkAdminStatus(*snapshot, isFirstRun);

	// Now connect to the realtime update events:
	mEventChannel->connect(snapshot->lastUpdateId, aOnFinish);
}





void BootstrapSync::fail(const std::error_code & aError, const std::string & aMessage, const Callback & aOnFinish)
{
	mLogger->error(fmt::format("{}: {}. Will retry again later.", nvrName(), aMessage));

	// Clear out the login credentials and reset for another try:
	mSessionManager->clearSession();
	aOnFinish(aError);
}





void BootstrapSync::updateKnownDevices(const DeviceSnapshot & aSnapshot)
{
	auto diff = diffDevices(mKnownDevices, aSnapshot.devices);
	for (const auto & d: diff.discovered)
	{
		mLogger->info(fmt::format("{}: Discovered {}: {}.", nvrName(), d.modelKey, Naming::deviceName(d, d.name, true)));
		if (mObserver != nullptr)
		{
			mObserver->onDeviceDiscovered(d);
		}
	}
	for (const auto & d: diff.removed)
	{
		mLogger->info(fmt::format("{}: Detected {} removal.", Naming::fullName(&aSnapshot, mNvrAddress, d), d.modelKey));
		if (mObserver != nullptr)
		{
			mObserver->onDeviceRemoved(d);
		}
	}
	mKnownDevices = aSnapshot.devices;
}





void BootstrapSync::checkAdminStatus(const DeviceSnapshot & aSnapshot, bool aIsFirstRun)
{
	bool wasAdmin = mSessionManager->session().isAdmin;
	bool isAdmin = false;
	if (!determineAdmin(aSnapshot, isAdmin))
	{
		mLogger->debug(fmt::format("{}: Unable to find the permissions of the authenticated user.", nvrName()));
		return;
	}
	mSessionManager->setAdmin(isAdmin);

	// Only admin users can reconfigure the cameras. Inform the user on startup, or on a role change:
	PrivilegeChange change = PrivilegeChange::Unchanged;
	if (aIsFirstRun)
	{
		change = PrivilegeChange::Initial;
		if (!isAdmin)
		{
			mLogger->info(fmt::format(
				"{}: The user '{}' requires the Administrator role in order to automatically configure camera RTSP streams.",
				nvrName(), mSessionManager->username()
			));
		}
	}
	else if (wasAdmin != isAdmin)
	{
		change = isAdmin ? PrivilegeChange::Granted : PrivilegeChange::Revoked;
		mLogger->info(fmt::format(
			"{}: Detected a role change for user '{}': the Administrator role has been {}.",
			nvrName(), mSessionManager->username(), isAdmin ? "enabled" : "disabled"
		));
	}
	if (mObserver != nullptr)
	{
		mObserver->onPrivilegeChanged(isAdmin, change);
	}
}

}  // namespace ProtectClientPp
