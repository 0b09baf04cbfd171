#include "Naming.hpp"

#include <fmt/format.h>





namespace ProtectClientPp
{
namespace Naming
{





std::string nvrName(const DeviceSnapshot * aSnapshot, const std::string & aNvrAddress)
{
	if ((aSnapshot == nullptr) || aSnapshot->nvr.name.empty())
	{
		return aNvrAddress;
	}
	return fmt::format("{} [{}]", aSnapshot->nvr.name, aSnapshot->nvr.type);
}





std::string deviceName(const Device & aDevice, const std::string & aName, bool aIncludeAddress)
{
	// A device that was never filled in has no name at all:
	if (aDevice.id.empty() && aDevice.mac.empty())
	{
		return {};
	}
	const auto & name = aName.empty() ? aDevice.name : aName;
	if (aIncludeAddress)
	{
		return fmt::format("{} [{}] (address: {} mac: {})", name, aDevice.type, aDevice.host, aDevice.mac);
	}
	return fmt::format("{} [{}]", name, aDevice.type);
}





std::string fullName(const DeviceSnapshot * aSnapshot, const std::string & aNvrAddress, const Device & aDevice)
{
	auto name = deviceName(aDevice);
	if (name.empty())
	{
		return nvrName(aSnapshot, aNvrAddress);
	}
	return nvrName(aSnapshot, aNvrAddress) + " " + name;
}

}  // namespace Naming
}  // namespace ProtectClientPp
