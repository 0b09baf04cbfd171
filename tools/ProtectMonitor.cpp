// Connects to a single UniFi Protect NVR and logs the inventory changes and the realtime updates until interrupted.
// Usage: protect-monitor <config.json>

#include <iostream>
#include <asio.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "Error.hpp"
#include "Naming.hpp"
#include "Nvr.hpp"





using namespace ProtectClientPp;





/** Logs all the inventory notifications. */
class LoggingObserver:
	public InventoryObserver
{
public:

	LoggingObserver(std::shared_ptr<Logger> aLogger):
		mLogger(std::move(aLogger))
	{
	}

	virtual void onDeviceDiscovered(const Device & aDevice) override
	{
		mLogger->info(fmt::format("+ {}", Naming::deviceName(aDevice, aDevice.name, true)));
	}

	virtual void onDeviceRemoved(const Device & aDevice) override
	{
		mLogger->info(fmt::format("- {}", Naming::deviceName(aDevice, aDevice.name, true)));
	}

	virtual void onPrivilegeChanged(bool aIsAdmin, PrivilegeChange aChange) override
	{
		if (aChange != PrivilegeChange::Unchanged)
		{
			mLogger->info(fmt::format("Administrator role: {}", aIsAdmin ? "yes" : "no"));
		}
	}


protected:

	std::shared_ptr<Logger> mLogger;
};





int main(int argc, char * argv[])
{
	if (argc != 2)
	{
		std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
		return 1;
	}

	std::error_code err;
	auto config = ClientConfig::load(argv[1], err);
	if (err)
	{
		std::cerr << "Cannot load the config from " << argv[1] << ": " << err.message() << std::endl;
		return 2;
	}

	auto logger = std::make_shared<SpdlogLogger>("protect", config.debug);
	asio::io_context ioc;
	auto nvr = Nvr::create(config, logger, ioc);
	nvr->setObserver(std::make_shared<LoggingObserver>(logger));
	nvr->setUpdateListener([logger](const nlohmann::json & aUpdate)
		{
			logger->debug(fmt::format("Update: {}", aUpdate.dump()));
		}
	);
	nvr->start();

	asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&ioc, nvr, logger](const std::error_code & aError, int aSignal)
		{
			if (aError)
			{
				return;
			}
			logger->info(fmt::format("Received signal {}, shutting down.", aSignal));
			nvr->shutdown();

			// Let the shutdown handlers run, then stop:
			asio::post(ioc, [&ioc]() { ioc.stop(); });
		}
	);

	ioc.run();
	spdlog::shutdown();
	return 0;
}
