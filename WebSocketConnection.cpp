#include "WebSocketConnection.hpp"

#include <cctype>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include "Error.hpp"





namespace ProtectClientPp
{





/** The GUID appended to the key when computing the Sec-WebSocket-Accept value. */
static const char WEBSOCKET_GUID[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

/** The maximum size of the upgrade response head. */
static const size_t MAX_HEAD_SIZE = 64 * 1024;

enum
{
	OPCODE_CONTINUATION = 0x0,
	OPCODE_TEXT = 0x1,
	OPCODE_BINARY = 0x2,
	OPCODE_CLOSE = 0x8,
	OPCODE_PING = 0x9,
	OPCODE_PONG = 0xa,
};





/** Base64-encodes the data. */
static std::string base64Encode(const unsigned char * aData, size_t aSize)
{
	std::string res(4 * ((aSize + 2) / 3), '\0');
	auto len = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&res[0]), aData, static_cast<int>(aSize));
	res.resize(static_cast<size_t>(len));
	return res;
}





/** Fills the buffer with random bytes, returns false if the random generator is not available. */
static bool randomBytes(unsigned char * aBuffer, size_t aSize)
{
	return (RAND_bytes(aBuffer, static_cast<int>(aSize)) == 1);
}





static bool equalsNoCase(const std::string & aValue1, const std::string & aValue2)
{
	if (aValue1.size() != aValue2.size())
	{
		return false;
	}
	for (size_t i = 0; i < aValue1.size(); ++i)
	{
		if (std::tolower(static_cast<unsigned char>(aValue1[i])) != std::tolower(static_cast<unsigned char>(aValue2[i])))
		{
			return false;
		}
	}
	return true;
}





////////////////////////////////////////////////////////////////////////////////
// WebSocketConnection:

const size_t WebSocketConnection::MAX_MESSAGE_SIZE;





std::shared_ptr<WebSocketConnection> WebSocketConnection::create(
	asio::io_context & aIoContext,
	std::shared_ptr<asio::ssl::context> aSslContext,
	bool aVerifyHostName,
	std::chrono::milliseconds aHandshakeTimeout
)
{
	return std::shared_ptr<WebSocketConnection>(new WebSocketConnection(
		aIoContext, std::move(aSslContext), aVerifyHostName, aHandshakeTimeout
	));
}





WebSocketConnection::WebSocketConnection(
	asio::io_context & aIoContext,
	std::shared_ptr<asio::ssl::context> aSslContext,
	bool aVerifyHostName,
	std::chrono::milliseconds aHandshakeTimeout
):
	Super(aIoContext, std::move(aSslContext)),
	mVerifyHostName(aVerifyHostName),
	mHandshakeTimeout(aHandshakeTimeout),
	mHandshakeTimer(aIoContext),
	mIsOpen(false),
	mIsDone(false),
	mFragmentOpcode(0)
{
}





std::string WebSocketConnection::acceptKeyFor(const std::string & aKey)
{
	auto toHash = aKey + WEBSOCKET_GUID;
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestLen = 0;
	if (EVP_Digest(toHash.data(), toHash.size(), digest, &digestLen, EVP_sha1(), nullptr) != 1)
	{
		return {};
	}
	return base64Encode(digest, digestLen);
}





bool WebSocketConnection::start(const Url & aUrl, const HttpHeaders & aHeaders, EventHandler aHandler, std::error_code & aError)
{
	unsigned char nonce[16];
	if (!randomBytes(nonce, sizeof(nonce)))
	{
		aError = std::make_error_code(std::errc::resource_unavailable_try_again);
		return false;
	}
	mKey = base64Encode(nonce, sizeof(nonce));
	mHandler = std::move(aHandler);

	auto headers = aHeaders;
	setHeader(headers, "Upgrade", "websocket");
	setHeader(headers, "Connection", "Upgrade");
	setHeader(headers, "Sec-WebSocket-Key", mKey);
	setHeader(headers, "Sec-WebSocket-Version", "13");
	auto rawRequest = Http::serializeRequest("GET", aUrl.hostHeader(), aUrl.target, headers, "");

	mHandshakeTimer.expires_after(mHandshakeTimeout);
	mHandshakeTimer.async_wait(
		[self = selfPtr()](const std::error_code & aError)
		{
			if (!aError && !self->mIsOpen)
			{
				self->fail(Error::Timeout);
			}
		}
	);

	connectTls(aUrl.host, aUrl.port, mVerifyHostName,
		[self = selfPtr(), rawRequest](const std::error_code & aError)
		{
			if (aError)
			{
				return self->fail(aError);
			}
			self->send(rawRequest);
		}
	);
	return true;
}





void WebSocketConnection::terminate()
{
	auto handler = std::move(mHandler);
	mHandler = nullptr;
	mHandshakeTimer.cancel();

	// A socket that hasn't been established yet still reports its demise:
	if (!mIsOpen && !mIsDone && handler)
	{
		asio::post(mIoContext, [handler]()
			{
				handler(SocketEvent::Failed, make_error_code(Error::ClosedBeforeEstablished), {});
			}
		);
	}
	mIsDone = true;
	closeSocket();
}





void WebSocketConnection::emit(SocketEvent aEvent, const std::error_code & aError, const std::string & aPayload)
{
	asio::post(mIoContext, [self = selfPtr(), aEvent, aError, aPayload]()
		{
			if (self->mHandler)
			{
				self->mHandler(aEvent, aError, aPayload);
			}
		}
	);
}





void WebSocketConnection::fail(const std::error_code & aError)
{
	if (mIsDone)
	{
		return;
	}
	mIsDone = true;
	mHandshakeTimer.cancel();
	emit(SocketEvent::Failed, aError);
	closeSocket();
}





bool WebSocketConnection::parseUpgradeResponse()
{
	auto headEnd = mIncomingData.find("\r\n\r\n");
	if (headEnd == std::string::npos)
	{
		if (mIncomingData.size() > MAX_HEAD_SIZE)
		{
			fail(Error::UpgradeRejected);
		}
		return false;
	}
	HttpResponse resp;
	if (!Http::parseResponseHead(mIncomingData.substr(0, headEnd), resp))
	{
		fail(Error::UpgradeRejected);
		return false;
	}
	mIncomingData.erase(0, headEnd + 4);

	if (
		(resp.status != 101) ||
		!equalsNoCase(resp.header("Upgrade"), "websocket") ||
		(resp.header("Sec-WebSocket-Accept") != acceptKeyFor(mKey))
	)
	{
		fail(Error::UpgradeRejected);
		return false;
	}

	mIsOpen = true;
	mHandshakeTimer.cancel();
	emit(SocketEvent::Opened);
	return true;
}





bool WebSocketConnection::parseFrame()
{
	const auto & data = mIncomingData;
	if (data.size() < 2)
	{
		return false;
	}
	auto b0 = static_cast<unsigned char>(data[0]);
	auto b1 = static_cast<unsigned char>(data[1]);
	bool isFinal = ((b0 & 0x80) != 0);
	int opcode = b0 & 0x0f;
	bool isMasked = ((b1 & 0x80) != 0);
	uint64_t payloadLen = b1 & 0x7f;
	size_t pos = 2;

	// Extended payload length:
	if (payloadLen == 126)
	{
		if (data.size() < pos + 2)
		{
			return false;
		}
		payloadLen = (static_cast<uint64_t>(static_cast<unsigned char>(data[2])) << 8) | static_cast<unsigned char>(data[3]);
		pos += 2;
	}
	else if (payloadLen == 127)
	{
		if (data.size() < pos + 8)
		{
			return false;
		}
		payloadLen = 0;
		for (size_t i = 0; i < 8; ++i)
		{
			payloadLen = (payloadLen << 8) | static_cast<unsigned char>(data[pos + i]);
		}
		pos += 8;
	}
	if (payloadLen > MAX_MESSAGE_SIZE)
	{
		fail(Error::BadFrame);
		return false;
	}

	// Masking key (servers shouldn't mask, but be lenient):
	unsigned char mask[4] = {0, 0, 0, 0};
	if (isMasked)
	{
		if (data.size() < pos + 4)
		{
			return false;
		}
		for (size_t i = 0; i < 4; ++i)
		{
			mask[i] = static_cast<unsigned char>(data[pos + i]);
		}
		pos += 4;
	}

	auto len = static_cast<size_t>(payloadLen);
	if (data.size() < pos + len)
	{
		return false;
	}
	auto payload = data.substr(pos, len);
	if (isMasked)
	{
		for (size_t i = 0; i < len; ++i)
		{
			payload[i] = static_cast<char>(static_cast<unsigned char>(payload[i]) ^ mask[i % 4]);
		}
	}
	mIncomingData.erase(0, pos + len);
	processFrame(isFinal, opcode, std::move(payload));
	return !mIsDone;
}





void WebSocketConnection::processFrame(bool aIsFinal, int aOpcode, std::string && aPayload)
{
	// Control frames must not be fragmented and must fit the short length:
	if ((aOpcode & 0x08) && (!aIsFinal || (aPayload.size() > 125)))
	{
		return fail(Error::BadFrame);
	}

	switch (aOpcode)
	{
		case OPCODE_CONTINUATION:
		{
			if (mFragmentOpcode == 0)
			{
				return fail(Error::BadFrame);
			}
			if (mFragmentData.size() + aPayload.size() > MAX_MESSAGE_SIZE)
			{
				return fail(Error::BadFrame);
			}
			mFragmentData.append(aPayload);
			if (aIsFinal)
			{
				mFragmentOpcode = 0;
				emit(SocketEvent::Frame, {}, mFragmentData);
				mFragmentData.clear();
			}
			return;
		}
		case OPCODE_TEXT:
		case OPCODE_BINARY:
		{
			if (mFragmentOpcode != 0)
			{
				return fail(Error::BadFrame);
			}
			if (aIsFinal)
			{
				return emit(SocketEvent::Frame, {}, aPayload);
			}
			mFragmentOpcode = aOpcode;
			mFragmentData = std::move(aPayload);
			return;
		}
		case OPCODE_CLOSE:
		{
			// Echo the status code back and close our end once it's out; the peer may never close its end:
			sendFrame(OPCODE_CLOSE, aPayload.substr(0, 2));
			mIsDone = true;
			emit(SocketEvent::Closed);
			closeAfterSending();
			return;
		}
		case OPCODE_PING:
		{
			sendFrame(OPCODE_PONG, aPayload);
			emit(SocketEvent::Ping);
			return;
		}
		case OPCODE_PONG:
		{
			return;
		}
		default:
		{
			return fail(Error::BadFrame);
		}
	}
}





void WebSocketConnection::sendFrame(int aOpcode, const std::string & aPayload)
{
	unsigned char mask[4];
	if (!randomBytes(mask, sizeof(mask)))
	{
		return fail(std::make_error_code(std::errc::resource_unavailable_try_again));
	}

	std::string frame;
	frame.reserve(aPayload.size() + 14);
	frame.push_back(static_cast<char>(0x80 | aOpcode));
	auto len = aPayload.size();
	if (len < 126)
	{
		frame.push_back(static_cast<char>(0x80 | len));
	}
	else if (len < 65536)
	{
		frame.push_back(static_cast<char>(0x80 | 126));
		frame.push_back(static_cast<char>((len >> 8) & 0xff));
		frame.push_back(static_cast<char>(len & 0xff));
	}
	else
	{
		frame.push_back(static_cast<char>(0x80 | 127));
		for (int shift = 56; shift >= 0; shift -= 8)
		{
			frame.push_back(static_cast<char>((static_cast<uint64_t>(len) >> shift) & 0xff));
		}
	}
	frame.append(reinterpret_cast<const char *>(mask), sizeof(mask));
	for (size_t i = 0; i < len; ++i)
	{
		frame.push_back(static_cast<char>(static_cast<unsigned char>(aPayload[i]) ^ mask[i % 4]));
	}
	send(frame);
}





void WebSocketConnection::parseIncomingData()
{
	if (mIsDone)
	{
		return;
	}
	if (!mIsOpen && !parseUpgradeResponse())
	{
		return;
	}
	while (parseFrame())
	{
		// Process all the complete frames
	}
}





void WebSocketConnection::disconnected(const std::error_code & aError)
{
	if (mIsDone)
	{
		return;
	}
	if (!mIsOpen)
	{
		bool isCleanClose = (aError == asio::error::eof) || (aError == asio::ssl::error::stream_truncated);
		return fail(isCleanClose ? make_error_code(Error::ClosedBeforeEstablished) : aError);
	}
	if ((aError == asio::error::eof) || (aError == asio::ssl::error::stream_truncated))
	{
		mIsDone = true;
		emit(SocketEvent::Closed);
		closeSocket();
		return;
	}
	fail(aError);
}





////////////////////////////////////////////////////////////////////////////////
// WebSocketFactory:

WebSocketFactory::WebSocketFactory(asio::io_context & aIoContext, bool aVerifyTlsCertificates, std::chrono::milliseconds aHandshakeTimeout):
	mIoContext(aIoContext),
	mVerifyTlsCertificates(aVerifyTlsCertificates),
	mHandshakeTimeout(aHandshakeTimeout),
	mSslContext(createSslContext(aVerifyTlsCertificates))
{
}





std::shared_ptr<RealtimeSocket> WebSocketFactory::open(
	const std::string & aUrl,
	const HttpHeaders & aHeaders,
	RealtimeSocket::EventHandler aHandler,
	std::error_code & aError
)
{
	Url url;
	if (!Urls::parse(aUrl, url))
	{
		aError = Error::InvalidUrl;
		return nullptr;
	}
	auto conn = WebSocketConnection::create(mIoContext, mSslContext, mVerifyTlsCertificates, mHandshakeTimeout);
	if (!conn->start(url, aHeaders, std::move(aHandler), aError))
	{
		return nullptr;
	}
	return conn;
}

}  // namespace ProtectClientPp
