#pragma once

#include <map>
#include <memory>
#include <asio.hpp>
#include <curl/curl.h>
#include "HttpTransport.hpp"





namespace ProtectClientPp
{





/** The HttpTransport implementation on top of libcurl's multi interface.
All the transfers share a single curl multi handle whose sockets and timeout are driven by the io_context, so the
requests run on the io_context's thread alongside everything else; libcurl keeps the connections to the NVR alive
between the requests.
Because of lifetime management, this class can only ever exist owned by a shared_ptr, therefore clients need to use
create() instead of a constructor. */
class HttpsClient:
	public HttpTransport,
	public std::enable_shared_from_this<HttpsClient>
{
public:

	/** The largest response body accepted; larger responses fail the request. */
	static const curl_off_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;


	/** Creates a new client that runs its I/O in the specified io_context.
	If aVerifyTlsCertificates is false, the server certificates are not validated (the NVRs use self-signed ones). */
	static std::shared_ptr<HttpsClient> create(asio::io_context & aIoContext, bool aVerifyTlsCertificates);

	virtual ~HttpsClient() override;

	// HttpTransport override:
	virtual std::shared_ptr<PendingRequest> send(const HttpRequest & aRequest, Callback aOnFinish) override;


protected:

	/** A single request, from being handed to libcurl until its callback is called. */
	class Transfer;

	/** A socket that libcurl asked us to watch. */
	struct WatchedSocket
	{
		/** Wraps libcurl's descriptor without owning it; libcurl closes the socket itself. */
		asio::posix::stream_descriptor descriptor;

		/** The CURL_POLL_* directions that libcurl is interested in. */
		int wantedDirections;

		bool isWaitingRead;
		bool isWaitingWrite;

		explicit WatchedSocket(asio::io_context & aIoContext):
			descriptor(aIoContext),
			wantedDirections(CURL_POLL_NONE),
			isWaitingRead(false),
			isWaitingWrite(false)
		{
		}
	};


	asio::io_context & mIoContext;
	bool mVerifyTlsCertificates;

	/** The libcurl multi handle; nullptr if libcurl failed to initialize. */
	CURLM * mMulti;

	/** The timer requested by libcurl through its timer callback. */
	asio::steady_timer mTimer;

	/** The transfers currently added to mMulti, by their easy handle. */
	std::map<CURL *, std::shared_ptr<Transfer>> mTransfers;

	/** The sockets libcurl asked us to watch, by their descriptor. */
	std::map<curl_socket_t, std::shared_ptr<WatchedSocket>> mSockets;

	/** Set in the destructor; libcurl's callbacks made during the cleanup must not schedule any more work. */
	bool mIsDestroying;


	HttpsClient(asio::io_context & aIoContext, bool aVerifyTlsCertificates);

	/** Removes the transfer from mMulti, if it is still there. */
	void detach(Transfer & aTransfer);

	/** Starts or stops waiting on the socket, based on what libcurl requested. */
	void watchSocket(curl_socket_t aSocket, int aWhat);

	/** Starts the asio waits for the directions that libcurl wants and that are not being waited for yet. */
	void armSocket(curl_socket_t aSocket, const std::shared_ptr<WatchedSocket> & aWatched);

	/** Called by ASIO when the socket is ready in the specified direction (CURL_CSELECT_IN or CURL_CSELECT_OUT). */
	void onSocketReady(curl_socket_t aSocket, const std::shared_ptr<WatchedSocket> & aWatched, int aDirection, const std::error_code & aError);

	/** (Re)schedules mTimer as requested by libcurl; a negative timeout stops the timer. */
	void scheduleTimeout(long aTimeoutMs);

	/** Collects the transfers that libcurl has finished, detaches them and calls their callbacks. */
	void processFinished();

	// libcurl callbacks:
	static int onCurlSocket(CURL * aEasy, curl_socket_t aSocket, int aWhat, void * aUserData, void * aSocketData);
	static int onCurlTimer(CURLM * aMulti, long aTimeoutMs, void * aUserData);
};

}  // namespace ProtectClientPp
