#pragma once

#include <string>
#include "Inventory.hpp"





namespace ProtectClientPp
{





/** Human-readable names of the NVR and its devices, as used in the log messages. */
namespace Naming
{
	/** Returns "<NVR name> [<NVR type>]" if the snapshot is available, or the NVR address otherwise. */
	std::string nvrName(const DeviceSnapshot * aSnapshot, const std::string & aNvrAddress);

	/** Returns "<name> [<type>]", optionally followed by " (address: <host> mac: <mac>)".
	If aName is empty, the device's own name is used.
	Returns an empty string for a default-constructed (unknown) device. */
	std::string deviceName(const Device & aDevice, const std::string & aName = {}, bool aIncludeAddress = false);

	/** Returns the NVR name followed by the device name, or just the NVR name for an unknown device. */
	std::string fullName(const DeviceSnapshot * aSnapshot, const std::string & aNvrAddress, const Device & aDevice);
}

}  // namespace ProtectClientPp
