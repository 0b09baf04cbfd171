#include "HttpsClient.hpp"

#include <cstring>
#include <mutex>
#include <utility>
#include <vector>
#include "Error.hpp"





namespace ProtectClientPp
{





/** Initializes libcurl globally, once per process. Returns true if the initialization succeeded. */
static bool initCurl()
{
	static std::once_flag initFlag;
	static bool isInitialized = false;
	std::call_once(initFlag, []()
		{
			isInitialized = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
		}
	);
	return isInitialized;
}





/** Returns true if the URL is an absolute http or https URL that libcurl can parse. */
static bool isSupportedUrl(const std::string & aUrl)
{
	auto url = curl_url();
	if (url == nullptr)
	{
		return false;
	}
	char * scheme = nullptr;
	bool res = (
		(curl_url_set(url, CURLUPART_URL, aUrl.c_str(), 0) == CURLUE_OK) &&
		(curl_url_get(url, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK) &&
		((std::strcmp(scheme, "https") == 0) || (std::strcmp(scheme, "http") == 0))
	);
	curl_free(scheme);
	curl_url_cleanup(url);
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// HttpsClient::Transfer:

class HttpsClient::Transfer:
	public HttpTransport::PendingRequest,
	public std::enable_shared_from_this<HttpsClient::Transfer>
{
public:

	Transfer(std::shared_ptr<HttpsClient> aClient, Callback aOnFinish):
		mClient(std::move(aClient)),
		mOnFinish(std::move(aOnFinish)),
		mHandle(nullptr),
		mHeaderList(nullptr),
		mIsFinished(false)
	{
	}


	virtual ~Transfer() override
	{
		if (mHandle != nullptr)
		{
			curl_easy_cleanup(mHandle);
		}
		curl_slist_free_all(mHeaderList);
	}


	/** Creates the easy handle and sets it up for the request.
	Returns false if libcurl cannot allocate the handle or the header list. */
	bool prepare(const HttpRequest & aRequest, bool aVerifyTlsCertificates)
	{
		mHandle = curl_easy_init();
		if (mHandle == nullptr)
		{
			return false;
		}
		curl_easy_setopt(mHandle, CURLOPT_URL, aRequest.url.c_str());
		curl_easy_setopt(mHandle, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(mHandle, CURLOPT_SSL_VERIFYPEER, aVerifyTlsCertificates ? 1L : 0L);
		curl_easy_setopt(mHandle, CURLOPT_SSL_VERIFYHOST, aVerifyTlsCertificates ? 2L : 0L);
		curl_easy_setopt(mHandle, CURLOPT_MAXFILESIZE_LARGE, MAX_RESPONSE_SIZE);

		// Method and body:
		const auto & method = aRequest.method;
		if (method == "GET")
		{
			curl_easy_setopt(mHandle, CURLOPT_HTTPGET, 1L);
		}
		else if (method == "HEAD")
		{
			curl_easy_setopt(mHandle, CURLOPT_NOBODY, 1L);
		}
		else if (method != "POST")
		{
			curl_easy_setopt(mHandle, CURLOPT_CUSTOMREQUEST, method.c_str());
		}
		if (!aRequest.body.empty() || (method == "POST") || (method == "PATCH") || (method == "PUT"))
		{
			mRequestBody = aRequest.body;
			curl_easy_setopt(mHandle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(mRequestBody.size()));
			curl_easy_setopt(mHandle, CURLOPT_POSTFIELDS, mRequestBody.data());
		}

		// Headers; "Expect:" stops libcurl from waiting for a 100 Continue before sending larger bodies:
		auto headers = aRequest.headers;
		if (findHeader(headers, "Accept").empty())
		{
			headers.emplace_back("Accept", "application/json");
		}
		headers.emplace_back("Expect", "");
		for (const auto & hdr: headers)
		{
			auto line = hdr.second.empty() ? (hdr.first + ":") : (hdr.first + ": " + hdr.second);
			auto list = curl_slist_append(mHeaderList, line.c_str());
			if (list == nullptr)
			{
				return false;
			}
			mHeaderList = list;
		}
		curl_easy_setopt(mHandle, CURLOPT_HTTPHEADER, mHeaderList);

		// Response:
		curl_easy_setopt(mHandle, CURLOPT_HEADERFUNCTION, &Transfer::onHeaderLine);
		curl_easy_setopt(mHandle, CURLOPT_HEADERDATA, this);
		curl_easy_setopt(mHandle, CURLOPT_WRITEFUNCTION, &Transfer::onBodyData);
		curl_easy_setopt(mHandle, CURLOPT_WRITEDATA, this);
		return true;
	}


	/** Called when libcurl has finished the transfer with the specified result. */
	void complete(CURLcode aResult)
	{
		if (aResult != CURLE_OK)
		{
			return finish(makeCurlErrorCode(aResult));
		}
		long status = 0;
		curl_easy_getinfo(mHandle, CURLINFO_RESPONSE_CODE, &status);
		mResponse.status = static_cast<int>(status);
		finish({});
	}


	/** Calls the callback, unless already called. */
	void finish(const std::error_code & aError)
	{
		if (mIsFinished)
		{
			return;
		}
		mIsFinished = true;
		auto onFinish = std::move(mOnFinish);
		mOnFinish = nullptr;
		if (onFinish)
		{
			onFinish(aError, mResponse);
		}
	}


	/** Calls the callback from the io_context, so that it is never called from within send() or cancel(). */
	void finishLater(const std::error_code & aError)
	{
		asio::post(mClient->mIoContext, [self = shared_from_this(), aError]()
			{
				self->finish(aError);
			}
		);
	}


	// HttpTransport::PendingRequest override:
	virtual void cancel() override
	{
		if (mIsFinished)
		{
			return;
		}
		finishLater(asio::error::operation_aborted);
		mClient->detach(*this);
	}


	CURL * handle() const { return mHandle; }


protected:

	std::shared_ptr<HttpsClient> mClient;
	Callback mOnFinish;
	CURL * mHandle;
	curl_slist * mHeaderList;

	/** The request body; libcurl reads it in place, so it must live as long as the transfer. */
	std::string mRequestBody;

	HttpResponse mResponse;
	bool mIsFinished;


	/** Receives the response head from libcurl, one line at a time. */
	static size_t onHeaderLine(char * aData, size_t aSize, size_t aCount, void * aUserData)
	{
		auto self = static_cast<Transfer *>(aUserData);
		auto len = aSize * aCount;
		std::string line(aData, len);
		while (!line.empty() && ((line.back() == '\r') || (line.back() == '\n')))
		{
			line.pop_back();
		}

		// A status line starts a new response head (after an interim 1xx response, for example):
		if (line.compare(0, 5, "HTTP/") == 0)
		{
			HttpResponse head;
			self->mResponse.reason = Http::parseResponseHead(line, head) ? head.reason : std::string();
			self->mResponse.headers.clear();
			return len;
		}
		if (!line.empty() && !Http::parseHeaderLine(line, self->mResponse.headers))
		{
			// Not a valid header field, abort the transfer:
			return 0;
		}
		return len;
	}


	/** Receives the response body from libcurl. */
	static size_t onBodyData(char * aData, size_t aSize, size_t aCount, void * aUserData)
	{
		auto self = static_cast<Transfer *>(aUserData);
		self->mResponse.body.append(aData, aSize * aCount);
		return aSize * aCount;
	}
};





////////////////////////////////////////////////////////////////////////////////
// HttpsClient:

const curl_off_t HttpsClient::MAX_RESPONSE_SIZE;





std::shared_ptr<HttpsClient> HttpsClient::create(asio::io_context & aIoContext, bool aVerifyTlsCertificates)
{
	return std::shared_ptr<HttpsClient>(new HttpsClient(aIoContext, aVerifyTlsCertificates));
}





HttpsClient::HttpsClient(asio::io_context & aIoContext, bool aVerifyTlsCertificates):
	mIoContext(aIoContext),
	mVerifyTlsCertificates(aVerifyTlsCertificates),
	mMulti(nullptr),
	mTimer(aIoContext),
	mIsDestroying(false)
{
	if (!initCurl())
	{
		return;
	}
	mMulti = curl_multi_init();
	if (mMulti == nullptr)
	{
		return;
	}
	curl_multi_setopt(mMulti, CURLMOPT_SOCKETFUNCTION, &HttpsClient::onCurlSocket);
	curl_multi_setopt(mMulti, CURLMOPT_SOCKETDATA, this);
	curl_multi_setopt(mMulti, CURLMOPT_TIMERFUNCTION, &HttpsClient::onCurlTimer);
	curl_multi_setopt(mMulti, CURLMOPT_TIMERDATA, this);
}





HttpsClient::~HttpsClient()
{
	mIsDestroying = true;
	if (mMulti != nullptr)
	{
		// Any transfers still added hold a reference to this object, so there are none by now; cleanup closes the cached connections:
		curl_multi_cleanup(mMulti);
	}

	// Don't let asio close the descriptors, they are libcurl's:
	for (auto & s: mSockets)
	{
		s.second->descriptor.release();
	}
}





std::shared_ptr<HttpTransport::PendingRequest> HttpsClient::send(const HttpRequest & aRequest, Callback aOnFinish)
{
	auto transfer = std::make_shared<Transfer>(shared_from_this(), std::move(aOnFinish));
	if (!isSupportedUrl(aRequest.url))
	{
		transfer->finishLater(Error::InvalidUrl);
		return transfer;
	}
	if ((mMulti == nullptr) || !transfer->prepare(aRequest, mVerifyTlsCertificates))
	{
		transfer->finishLater(makeCurlErrorCode(CURLE_FAILED_INIT));
		return transfer;
	}
	auto res = curl_multi_add_handle(mMulti, transfer->handle());
	if (res != CURLM_OK)
	{
		transfer->finishLater(makeCurlErrorCode(CURLE_FAILED_INIT));
		return transfer;
	}
	mTransfers[transfer->handle()] = transfer;
	return transfer;
}





void HttpsClient::detach(Transfer & aTransfer)
{
	auto itr = mTransfers.find(aTransfer.handle());
	if (itr == mTransfers.end())
	{
		return;
	}
	curl_multi_remove_handle(mMulti, aTransfer.handle());
	mTransfers.erase(itr);
}





void HttpsClient::watchSocket(curl_socket_t aSocket, int aWhat)
{
	auto itr = mSockets.find(aSocket);
	if (aWhat == CURL_POLL_REMOVE)
	{
		if (itr != mSockets.end())
		{
			// Releasing cancels the pending waits; the socket itself is closed by libcurl:
			itr->second->wantedDirections = CURL_POLL_NONE;
			itr->second->descriptor.release();
			mSockets.erase(itr);
		}
		return;
	}

	std::shared_ptr<WatchedSocket> watched;
	if (itr == mSockets.end())
	{
		watched = std::make_shared<WatchedSocket>(mIoContext);
		std::error_code err;
		watched->descriptor.assign(aSocket, err);
		if (err)
		{
			// The socket can't be watched, libcurl will time the transfer out
			return;
		}
		mSockets[aSocket] = watched;
	}
	else
	{
		watched = itr->second;
	}
	watched->wantedDirections = aWhat;
	if (!mIsDestroying)
	{
		armSocket(aSocket, watched);
	}
}





void HttpsClient::armSocket(curl_socket_t aSocket, const std::shared_ptr<WatchedSocket> & aWatched)
{
	if (((aWatched->wantedDirections & CURL_POLL_IN) != 0) && !aWatched->isWaitingRead)
	{
		aWatched->isWaitingRead = true;
		aWatched->descriptor.async_wait(asio::posix::stream_descriptor::wait_read,
			[self = shared_from_this(), aSocket, aWatched](const std::error_code & aError)
			{
				aWatched->isWaitingRead = false;
				self->onSocketReady(aSocket, aWatched, CURL_CSELECT_IN, aError);
			}
		);
	}
	if (((aWatched->wantedDirections & CURL_POLL_OUT) != 0) && !aWatched->isWaitingWrite)
	{
		aWatched->isWaitingWrite = true;
		aWatched->descriptor.async_wait(asio::posix::stream_descriptor::wait_write,
			[self = shared_from_this(), aSocket, aWatched](const std::error_code & aError)
			{
				aWatched->isWaitingWrite = false;
				self->onSocketReady(aSocket, aWatched, CURL_CSELECT_OUT, aError);
			}
		);
	}
}





void HttpsClient::onSocketReady(
	curl_socket_t aSocket,
	const std::shared_ptr<WatchedSocket> & aWatched,
	int aDirection,
	const std::error_code & aError
)
{
	if (aError == asio::error::operation_aborted)
	{
		// Released, libcurl is done with the socket
		return;
	}

	// The socket may have been removed (and its descriptor number reused) since the wait started:
	auto itr = mSockets.find(aSocket);
	if ((itr == mSockets.end()) || (itr->second != aWatched))
	{
		return;
	}
	auto wantedDirection = (aDirection == CURL_CSELECT_IN) ? CURL_POLL_IN : CURL_POLL_OUT;
	if ((aWatched->wantedDirections & wantedDirection) == 0)
	{
		return;
	}

	int numRunning = 0;
	curl_multi_socket_action(mMulti, aSocket, aError ? CURL_CSELECT_ERR : aDirection, &numRunning);
	processFinished();

	// Keep waiting, unless libcurl has let go of the socket meanwhile:
	itr = mSockets.find(aSocket);
	if ((itr != mSockets.end()) && (itr->second == aWatched))
	{
		armSocket(aSocket, aWatched);
	}
}





void HttpsClient::scheduleTimeout(long aTimeoutMs)
{
	mTimer.cancel();
	if (aTimeoutMs < 0)
	{
		return;
	}
	mTimer.expires_after(std::chrono::milliseconds(aTimeoutMs));
	mTimer.async_wait(
		[self = shared_from_this()](const std::error_code & aError)
		{
			if (aError)
			{
				// Re-scheduled or stopped
				return;
			}
			int numRunning = 0;
			curl_multi_socket_action(self->mMulti, CURL_SOCKET_TIMEOUT, 0, &numRunning);
			self->processFinished();
		}
	);
}





void HttpsClient::processFinished()
{
	// Detach all the finished transfers first, the callbacks may start or cancel other requests:
	std::vector<std::pair<std::shared_ptr<Transfer>, CURLcode>> finished;
	int numLeft = 0;
	while (auto msg = curl_multi_info_read(mMulti, &numLeft))
	{
		if (msg->msg != CURLMSG_DONE)
		{
			continue;
		}
		auto handle = msg->easy_handle;
		auto result = msg->data.result;
		auto itr = mTransfers.find(handle);
		if (itr == mTransfers.end())
		{
			continue;
		}
		finished.emplace_back(itr->second, result);
		curl_multi_remove_handle(mMulti, handle);
		mTransfers.erase(itr);
	}

	for (auto & f: finished)
	{
		f.first->complete(f.second);
	}
}





int HttpsClient::onCurlSocket(CURL * aEasy, curl_socket_t aSocket, int aWhat, void * aUserData, void * aSocketData)
{
	static_cast<HttpsClient *>(aUserData)->watchSocket(aSocket, aWhat);
	return 0;
}





int HttpsClient::onCurlTimer(CURLM * aMulti, long aTimeoutMs, void * aUserData)
{
	auto self = static_cast<HttpsClient *>(aUserData);
	if (!self->mIsDestroying)
	{
		self->scheduleTimeout(aTimeoutMs);
	}
	return 0;
}

}  // namespace ProtectClientPp
