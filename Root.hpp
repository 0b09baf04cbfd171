#pragma once

#include <memory>
#include <thread>
#include <vector>
#include <asio.hpp>





namespace ProtectClientPp
{





/** The singleton that houses the asio's io_context and the executor thread.
All the library's objects created without an explicit io_context use this one. */
class Root
{
public:

	/** Returns the single instance of this class, already initialized. */
	static Root & instance();

	/** Returns the asio's io_context to be used by the objects within the library. */
	asio::io_context & ioContext()
	{
		return mIoContext;
	}


private:

	/** The asio's io_context to be used by the objects within the library. */
	asio::io_context mIoContext;

	/** The work guard object that keeps Asio running even if there is no other current IO queued. */
	asio::executor_work_guard<asio::io_context::executor_type> mWorkGuard;

	/** The worker threads in which asio's asynchronous processing is performed.
	All the components rely on their handlers being serialized, so there must be exactly one. */
	std::vector<std::shared_ptr<std::thread>> mWorkerThreads;


	/** Constructs the single instance.
	Initializes the asio's io_context and starts a single worker thread for the processing. */
	Root();

	~Root();

	/** Runs the io_context until it is stopped.
	An exception escaping a handler is logged and the processing continues. */
	void runWorker();
};

}  // namespace ProtectClientPp
