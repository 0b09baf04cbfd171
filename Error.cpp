#include "Error.hpp"

#include <asio/error.hpp>
#include <asio/ssl/error.hpp>
#include <curl/curl.h>





namespace ProtectClientPp
{





////////////////////////////////////////////////////////////////////////////////
// ErrorCategoryImpl:

const char * ErrorCategoryImpl::name() const noexcept
{
	return "ProtectClientPp";
}





std::string ErrorCategoryImpl::message(int aErrorValue) const
{
	switch (static_cast<Error>(aErrorValue))
	{
		case Error::Throttled: return "API calls are throttled due to previous errors";
		case Error::Timeout: return "The request took too long and was cancelled";
		case Error::ShuttingDown: return "The client is shutting down";
		case Error::AuthenticationFailed: return "Invalid login credentials";
		case Error::TokenUnavailable: return "Unable to acquire a CSRF token from the controller";
		case Error::LoginIncomplete: return "The login response lacked the CSRF token or the session cookie";
		case Error::InsufficientPrivileges: return "Insufficient privileges";
		case Error::NotAdmin: return "The Administrator role is required";
		case Error::NotCamera: return "The device is not a camera";
		case Error::HttpStatus: return "API access error";
		case Error::MalformedResponse: return "Unable to parse the response";
		case Error::MissingDeviceList: return "The response contains no device list";
		case Error::InvalidUrl: return "Invalid URL";
		case Error::HeartbeatExpired: return "No traffic on the realtime connection within the heartbeat interval";
		case Error::ClosedBeforeEstablished: return "WebSocket was closed before the connection was established";
		case Error::UpgradeRejected: return "The server rejected the WebSocket upgrade";
		case Error::BadFrame: return "Malformed WebSocket frame";
		case Error::InvalidConfig: return "Invalid configuration";
	}
	return "Unknown error";
}





std::error_condition ErrorCategoryImpl::default_error_condition(int aErrorValue) const noexcept
{
	switch (static_cast<Error>(aErrorValue))
	{
		case Error::AuthenticationFailed:
		case Error::TokenUnavailable:
		case Error::LoginIncomplete:
		{
			return ErrorKind::Authentication;
		}
		case Error::InsufficientPrivileges:
		case Error::NotAdmin:
		case Error::NotCamera:
		{
			return ErrorKind::Privilege;
		}
		case Error::Throttled:
		case Error::ShuttingDown:
		case Error::InvalidUrl:
		{
			return ErrorKind::Transport;
		}
		case Error::Timeout:
		{
			return ErrorKind::Timeout;
		}
		case Error::HttpStatus:
		case Error::MalformedResponse:
		case Error::MissingDeviceList:
		{
			return ErrorKind::Protocol;
		}
		case Error::HeartbeatExpired:
		case Error::ClosedBeforeEstablished:
		case Error::UpgradeRejected:
		case Error::BadFrame:
		{
			return ErrorKind::ChannelLiveness;
		}
		case Error::InvalidConfig:
		{
			break;
		}
	}
	return std::error_condition(aErrorValue, *this);
}





////////////////////////////////////////////////////////////////////////////////
// ErrorKindCategoryImpl:

const char * ErrorKindCategoryImpl::name() const noexcept
{
	return "ProtectClientPp.Kind";
}





std::string ErrorKindCategoryImpl::message(int aErrorValue) const
{
	switch (static_cast<ErrorKind>(aErrorValue))
	{
		case ErrorKind::Authentication: return "Authentication error";
		case ErrorKind::Privilege: return "Privilege error";
		case ErrorKind::Transport: return "Transport error";
		case ErrorKind::Timeout: return "Timeout";
		case ErrorKind::Protocol: return "Protocol error";
		case ErrorKind::ChannelLiveness: return "Realtime channel liveness error";
	}
	return "Unknown error kind";
}





bool ErrorKindCategoryImpl::equivalent(const std::error_code & aCode, int aCondition) const noexcept
{
	if (aCode.category() == ErrorCategory())
	{
		return (ErrorCategory().default_error_condition(aCode.value()) == std::error_condition(aCondition, *this));
	}

	// Map the asio / OS-level errors:
	switch (static_cast<ErrorKind>(aCondition))
	{
		case ErrorKind::Transport:
		{
			return (
				(aCode == asio::error::connection_refused) ||
				(aCode == asio::error::connection_reset) ||
				(aCode == asio::error::connection_aborted) ||
				(aCode == asio::error::host_not_found) ||
				(aCode == asio::error::host_not_found_try_again) ||
				(aCode == asio::error::host_unreachable) ||
				(aCode == asio::error::network_unreachable) ||
				(aCode == asio::error::broken_pipe) ||
				(aCode == asio::error::eof) ||
				(aCode.category() == asio::error::get_ssl_category()) ||
				(aCode == asio::ssl::error::stream_truncated)
			);
		}
		case ErrorKind::Timeout:
		{
			return (aCode == asio::error::timed_out);
		}
		default:
		{
			return false;
		}
	}
}





////////////////////////////////////////////////////////////////////////////////
// CurlErrorCategoryImpl:

const char * CurlErrorCategoryImpl::name() const noexcept
{
	return "libcurl";
}





std::string CurlErrorCategoryImpl::message(int aErrorValue) const
{
	return curl_easy_strerror(static_cast<CURLcode>(aErrorValue));
}





std::error_condition CurlErrorCategoryImpl::default_error_condition(int aErrorValue) const noexcept
{
	switch (static_cast<CURLcode>(aErrorValue))
	{
		case CURLE_OPERATION_TIMEDOUT:
		{
			return ErrorKind::Timeout;
		}
		case CURLE_WEIRD_SERVER_REPLY:
		case CURLE_GOT_NOTHING:
		case CURLE_BAD_CONTENT_ENCODING:
		case CURLE_FILESIZE_EXCEEDED:
		case CURLE_TOO_MANY_REDIRECTS:
		{
			return ErrorKind::Protocol;
		}
		default:
		{
			return ErrorKind::Transport;
		}
	}
}





////////////////////////////////////////////////////////////////////////////////
// Globals:

const std::error_category & ErrorCategory()
{
	static ErrorCategoryImpl theInstance;
	return theInstance;
}





const std::error_category & ErrorKindCategory()
{
	static ErrorKindCategoryImpl theInstance;
	return theInstance;
}





const std::error_category & CurlErrorCategory()
{
	static CurlErrorCategoryImpl theInstance;
	return theInstance;
}





std::error_code make_error_code(Error aError)
{
	return std::error_code(static_cast<int>(aError), ErrorCategory());
}





std::error_condition make_error_condition(ErrorKind aKind)
{
	return std::error_condition(static_cast<int>(aKind), ErrorKindCategory());
}





std::error_code makeCurlErrorCode(int aCurlCode)
{
	return std::error_code(aCurlCode, CurlErrorCategory());
}

}  // namespace ProtectClientPp
