#include "Root.hpp"

#include <spdlog/spdlog.h>





using namespace ProtectClientPp;





Root & Root::instance()
{
	static Root theInstance;
	return theInstance;
}





Root::Root():
	mIoContext(),
	mWorkGuard(asio::make_work_guard(mIoContext))
{
	mWorkerThreads.emplace_back(new std::thread([this](){ runWorker(); }));
}





Root::~Root()
{
	mWorkGuard.reset();
	mIoContext.stop();
	for (const auto & thr: mWorkerThreads)
	{
		thr->join();
	}
}





void Root::runWorker()
{
	for (;;)
	{
		try
		{
			mIoContext.run();
			return;
		}
		catch (const std::exception & exc)
		{
			spdlog::error("Unhandled exception in the io_context worker: {}", exc.what());
		}
	}
}
