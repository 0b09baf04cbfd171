#pragma once

#include <system_error>





namespace ProtectClientPp
{





enum class Error
{
	// Request gating:
	Throttled = 1,  // The error budget is exhausted, the request was not sent at all
	Timeout = 2,  // The request didn't finish within the configured timeout and was cancelled
	ShuttingDown = 3,  // The client is being shut down, the operation was abandoned

	// Authentication:
	AuthenticationFailed = 10,  // HTTP 401, bad username or password
	TokenUnavailable = 11,  // The base address didn't hand out a CSRF token
	LoginIncomplete = 12,  // The login response lacked the CSRF token or the session cookie

	// Privileges:
	InsufficientPrivileges = 20,  // HTTP 403
	NotAdmin = 21,  // The user lacks the Administrator role needed for the write operation
	NotCamera = 22,  // The device is not a camera, cannot be configured

	// API / protocol:
	HttpStatus = 30,  // Any other non-2xx HTTP status
	MalformedResponse = 31,  // The response body couldn't be decoded
	MissingDeviceList = 32,  // The bootstrap payload had no device list
	InvalidUrl = 34,

	// Realtime channel:
	HeartbeatExpired = 40,  // No frame arrived within the heartbeat interval
	ClosedBeforeEstablished = 41,  // The socket was closed before the upgrade completed
	UpgradeRejected = 42,  // The server didn't answer the upgrade with 101
	BadFrame = 43,  // Protocol violation in the WebSocket framing

	// Local:
	InvalidConfig = 50,
};





/** The coarse taxonomy of failures, used for matching error codes regardless of their exact origin.
Both our own Error values and the relevant asio errors compare equal to these. */
enum class ErrorKind
{
	Authentication = 1,
	Privilege,
	Transport,
	Timeout,
	Protocol,
	ChannelLiveness,
};





class ErrorCategoryImpl:
	public std::error_category
{
public:
	virtual const char * name() const noexcept override;
	virtual std::string message(int aErrorValue) const override;
	virtual std::error_condition default_error_condition(int aErrorValue) const noexcept override;
};





class ErrorKindCategoryImpl:
	public std::error_category
{
public:
	virtual const char * name() const noexcept override;
	virtual std::string message(int aErrorValue) const override;
	virtual bool equivalent(
		const std::error_code & aCode,
		int aCondition
	) const noexcept override;
};

/** The category for the libcurl transfer result codes (CURLcode values). */
class CurlErrorCategoryImpl:
	public std::error_category
{
public:
	virtual const char * name() const noexcept override;
	virtual std::string message(int aErrorValue) const override;
	virtual std::error_condition default_error_condition(int aErrorValue) const noexcept override;
};

const std::error_category & ErrorCategory();
const std::error_category & ErrorKindCategory();
const std::error_category & CurlErrorCategory();

std::error_code make_error_code(Error aError);
std::error_condition make_error_condition(ErrorKind aKind);

/** Wraps a CURLcode value into an error code of CurlErrorCategory(). */
std::error_code makeCurlErrorCode(int aCurlCode);


}  // namespace ProtectClientPp





namespace std
{




template <>
struct is_error_code_enum<ProtectClientPp::Error>:
	public true_type
{
};




template <>
struct is_error_condition_enum<ProtectClientPp::ErrorKind>:
	public true_type
{
};




}
