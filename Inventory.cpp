#include "Inventory.hpp"





namespace ProtectClientPp
{





/** Returns the string value stored under the key, or empty string if the key is missing or null.
Throws a json type error if the value is of some other type. */
static std::string stringField(const nlohmann::json & aJson, const char * aKey)
{
	auto itr = aJson.find(aKey);
	if ((itr == aJson.end()) || itr->is_null())
	{
		return {};
	}
	if (itr->is_number_integer())
	{
		// The lastUpdateId et al. are strings on current firmwares, but be lenient:
		return std::to_string(itr->get<long long>());
	}
	return itr->get<std::string>();
}





////////////////////////////////////////////////////////////////////////////////
// Channel:

nlohmann::json Channel::toJson() const
{
	auto res = raw.is_object() ? raw : nlohmann::json::object();
	res["id"] = id;
	res["isRtspEnabled"] = isRtspEnabled;
	if (!name.empty())
	{
		res["name"] = name;
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// Device:

Device Device::fromJson(const nlohmann::json & aJson)
{
	Device res;
	res.id = stringField(aJson, "id");
	res.mac = stringField(aJson, "mac");
	res.name = stringField(aJson, "name");
	res.type = stringField(aJson, "type");
	res.modelKey = stringField(aJson, "modelKey");
	res.host = stringField(aJson, "host");
	res.isManaged = aJson.value("isManaged", false);
	auto itr = aJson.find("channels");
	if ((itr != aJson.end()) && itr->is_array())
	{
		for (const auto & ch: *itr)
		{
			Channel channel;
			channel.id = ch.value("id", 0);
			channel.name = stringField(ch, "name");
			channel.isRtspEnabled = ch.value("isRtspEnabled", false);
			channel.raw = ch;
			res.channels.push_back(std::move(channel));
		}
	}
	res.raw = aJson;
	return res;
}





nlohmann::json Device::channelsJson() const
{
	auto res = nlohmann::json::array();
	for (const auto & ch: channels)
	{
		res.push_back(ch.toJson());
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// DeviceSnapshot:

DeviceSnapshot DeviceSnapshot::fromJson(const nlohmann::json & aJson)
{
	DeviceSnapshot res;
	auto itr = aJson.find("nvr");
	if ((itr != aJson.end()) && itr->is_object())
	{
		res.nvr.name = stringField(*itr, "name");
		res.nvr.type = stringField(*itr, "type");
		res.nvr.host = stringField(*itr, "host");
		res.nvr.mac = stringField(*itr, "mac");
	}
	for (const auto & cam: aJson.at("cameras"))
	{
		res.devices.push_back(Device::fromJson(cam));
	}
	itr = aJson.find("users");
	if ((itr != aJson.end()) && itr->is_array())
	{
		for (const auto & u: *itr)
		{
			User user;
			user.id = stringField(u, "id");
			auto itrPerm = u.find("allPermissions");
			if ((itrPerm != u.end()) && itrPerm->is_array())
			{
				user.allPermissions = itrPerm->get<std::vector<std::string>>();
			}
			res.users.push_back(std::move(user));
		}
	}
	res.authUserId = stringField(aJson, "authUserId");
	res.lastUpdateId = stringField(aJson, "lastUpdateId");
	return res;
}





const User * DeviceSnapshot::authUser() const
{
	for (const auto & u: users)
	{
		if (u.id == authUserId)
		{
			return &u;
		}
	}
	return nullptr;
}





const Device * DeviceSnapshot::findByMac(const std::string & aMac) const
{
	for (const auto & d: devices)
	{
		if (d.mac == aMac)
		{
			return &d;
		}
	}
	return nullptr;
}

}  // namespace ProtectClientPp
