#pragma once

#include <memory>
#include <string>





// fwd:
namespace spdlog
{
	class logger;
}





namespace ProtectClientPp
{





/** The logging sink used by the library.
All messages are preformatted by the caller (typically using fmt::format). */
class Logger
{
public:

	virtual ~Logger() {}

	virtual void info(const std::string & aMessage) = 0;
	virtual void error(const std::string & aMessage) = 0;
	virtual void debug(const std::string & aMessage) = 0;
};





/** Logger that forwards everything into an spdlog logger. */
class SpdlogLogger:
	public Logger
{
public:

	/** Creates a new instance that logs into a new colored stdout spdlog logger of the specified name.
	If aDebug is false, the debug messages are dropped. */
	SpdlogLogger(const std::string & aName, bool aDebug);

	/** Creates a new instance that logs into the specified spdlog logger. */
	explicit SpdlogLogger(std::shared_ptr<spdlog::logger> aLogger);

	virtual void info(const std::string & aMessage) override;
	virtual void error(const std::string & aMessage) override;
	virtual void debug(const std::string & aMessage) override;


protected:

	std::shared_ptr<spdlog::logger> mLogger;
};





/** Logger that drops everything. */
class NullLogger:
	public Logger
{
public:
	virtual void info(const std::string & aMessage) override {}
	virtual void error(const std::string & aMessage) override {}
	virtual void debug(const std::string & aMessage) override {}
};

}  // namespace ProtectClientPp
