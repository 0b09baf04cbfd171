#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>





namespace ProtectClientPp
{





/** A single stream channel of a camera. */
struct Channel
{
	int id = 0;
	std::string name;
	bool isRtspEnabled = false;

	/** The whole channel record as received from the NVR. */
	nlohmann::json raw;

	/** Returns the raw record with the fields known to this struct written over it. */
	nlohmann::json toJson() const;
};





/** A device (camera) managed by the NVR.
Only the channel list is ever modified by the client, everything else is kept verbatim in raw. */
struct Device
{
	std::string id;
	std::string mac;
	std::string name;
	std::string type;
	std::string modelKey;
	std::string host;
	bool isManaged = false;
	std::vector<Channel> channels;

	/** The whole device record as received from the NVR. */
	nlohmann::json raw;


	/** Parses the device from its JSON record.
	Throws nlohmann::json::exception if the record has fields of unexpected types. */
	static Device fromJson(const nlohmann::json & aJson);

	/** Returns the channel list in the format expected by the NVR. */
	nlohmann::json channelsJson() const;
};





/** The NVR itself, as described in the bootstrap. */
struct NvrInfo
{
	std::string name;
	std::string type;
	std::string host;
	std::string mac;
};





struct User
{
	std::string id;

	/** Permission strings, "<type>:<permissions>:<scope>", such as "camera:read,write:*". */
	std::vector<std::string> allPermissions;
};





/** The full inventory as returned by the bootstrap endpoint. */
struct DeviceSnapshot
{
	NvrInfo nvr;
	std::vector<Device> devices;
	std::vector<User> users;

	/** The ID of the user that this session is authenticated as. */
	std::string authUserId;

	/** The update cursor, used for resuming the realtime update stream. */
	std::string lastUpdateId;


	/** Parses the snapshot from the bootstrap JSON.
	Throws nlohmann::json::exception if the payload has fields of unexpected types. */
	static DeviceSnapshot fromJson(const nlohmann::json & aJson);

	/** Returns the user this session is authenticated as, or nullptr if not in the snapshot. */
	const User * authUser() const;

	/** Returns the device with the specified MAC address, or nullptr if not in the snapshot. */
	const Device * findByMac(const std::string & aMac) const;
};

}  // namespace ProtectClientPp
