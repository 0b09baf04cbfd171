#include "Logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>





namespace ProtectClientPp
{





SpdlogLogger::SpdlogLogger(const std::string & aName, bool aDebug)
{
	// Reuse the logger if one of the same name was registered already (spdlog refuses duplicates):
	mLogger = spdlog::get(aName);
	if (mLogger == nullptr)
	{
		mLogger = spdlog::stdout_color_mt(aName);
	}
	mLogger->set_level(aDebug ? spdlog::level::debug : spdlog::level::info);
}





SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> aLogger):
	mLogger(std::move(aLogger))
{
}





void SpdlogLogger::info(const std::string & aMessage)
{
	mLogger->info(aMessage);
}





void SpdlogLogger::error(const std::string & aMessage)
{
	mLogger->error(aMessage);
}





void SpdlogLogger::debug(const std::string & aMessage)
{
	mLogger->debug(aMessage);
}

}  // namespace ProtectClientPp
