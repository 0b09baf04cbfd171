#include "TlsConnection.hpp"

#include <openssl/ssl.h>





namespace ProtectClientPp
{





using LockGuard = std::lock_guard<std::recursive_mutex>;





std::shared_ptr<asio::ssl::context> createSslContext(bool aVerifyCertificates)
{
	auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
	if (aVerifyCertificates)
	{
		ctx->set_default_verify_paths();
		ctx->set_verify_mode(asio::ssl::verify_peer);
	}
	else
	{
		ctx->set_verify_mode(asio::ssl::verify_none);
	}
	return ctx;
}





TlsConnection::TlsConnection(asio::io_context & aIoContext, std::shared_ptr<asio::ssl::context> aSslContext):
	mIoContext(aIoContext),
	mSslContext(std::move(aSslContext)),
	mResolver(aIoContext),
	mStream(aIoContext, *mSslContext),
	mIsOutgoing(false),
	mIsConnected(false),
	mIsClosed(false),
	mShouldCloseWhenSent(false)
{
}





void TlsConnection::connectTls(
	const std::string & aHostName,
	uint16_t aPort,
	bool aVerifyHostName,
	std::function<void(const std::error_code &)> aOnFinish
)
{
	// SNI, so that the virtual-hosted servers present the correct certificate:
	SSL_set_tlsext_host_name(mStream.native_handle(), aHostName.c_str());
	if (aVerifyHostName)
	{
		mStream.set_verify_callback(asio::ssl::host_name_verification(aHostName));
	}

	mResolver.async_resolve(aHostName, std::to_string(aPort),
		[self = shared_from_this(), aOnFinish](const std::error_code & aError, asio::ip::tcp::resolver::results_type aResults)
		{
			if (aError)
			{
				aOnFinish(aError);
				return;
			}
			if (self->mIsClosed)
			{
				aOnFinish(asio::error::operation_aborted);
				return;
			}
			asio::async_connect(self->mStream.lowest_layer(), aResults,
				[self, aOnFinish](const std::error_code & aError, const asio::ip::tcp::endpoint & aEndpoint)
				{
					if (aError)
					{
						aOnFinish(aError);
						return;
					}
					self->mStream.async_handshake(asio::ssl::stream_base::client,
						[self, aOnFinish](const std::error_code & aError)
						{
							if (aError)
							{
								aOnFinish(aError);
								return;
							}
							self->mIsConnected = true;
							self->queueRead();
							aOnFinish({});
						}
					);
				}
			);
		}
	);
}





void TlsConnection::send(const std::string & aData)
{
	{
		LockGuard lg(mMtxTransfer);
		mOutgoingQueue.append(aData);
		if (mIsOutgoing)
		{
			return;
		}
	}
	writeNextQueueItem();
}





void TlsConnection::closeAfterSending()
{
	{
		LockGuard lg(mMtxTransfer);
		if (mIsOutgoing || !mOutgoingQueue.empty())
		{
			mShouldCloseWhenSent = true;
			return;
		}
	}
	closeSocket();
}





void TlsConnection::closeSocket()
{
	mIsClosed = true;
	mIsConnected = false;
	std::error_code err;
	mResolver.cancel();
	mStream.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, err);
	mStream.lowest_layer().close(err);
}





void TlsConnection::queueRead()
{
	mStream.async_read_some(
		asio::buffer(mReadBuffer),
		[self = shared_from_this()](const std::error_code & aError, std::size_t aNumBytes)
		{
			self->onRead(aError, aNumBytes);
		}
	);
}





void TlsConnection::onWritten(const std::error_code & aError)
{
	if (aError)
	{
		disconnected(aError);
		return;
	}
	LockGuard lg(mMtxTransfer);
	mIsOutgoing = false;
	if (mShouldCloseWhenSent && mOutgoingQueue.empty())
	{
		closeSocket();
		return;
	}
	writeNextQueueItem();
}





void TlsConnection::onRead(const std::error_code & aError, std::size_t aNumBytes)
{
	if (aError)
	{
		disconnected(aError);
		return;
	}

	// Process the incoming data:
	mIncomingData.append(mReadBuffer.data(), aNumBytes);
	parseIncomingData();

	// Read more:
	if (!mIsClosed)
	{
		queueRead();
	}
}





void TlsConnection::writeNextQueueItem()
{
	LockGuard lg(mMtxTransfer);

	// If there's no more data to send, or a write is already in progress, bail out:
	if (mOutgoingQueue.empty() || mIsOutgoing || mIsClosed)
	{
		return;
	}

	// Start writing the data through ASIO:
	std::swap(mOutgoingData, mOutgoingQueue);
	mIsOutgoing = true;
	mOutgoingQueue.clear();
	asio::async_write(mStream, asio::buffer(mOutgoingData),
		[self = shared_from_this()](const std::error_code & aError, std::size_t aNumBytes)
		{
			self->onWritten(aError);
		}
	);
}

}  // namespace ProtectClientPp
