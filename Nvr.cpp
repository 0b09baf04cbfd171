#include "Nvr.hpp"

#include <fmt/format.h>
#include "Error.hpp"
#include "HttpsClient.hpp"
#include "Naming.hpp"
#include "Urls.hpp"
#include "WebSocketConnection.hpp"





namespace ProtectClientPp
{





std::shared_ptr<Nvr> Nvr::create(
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	asio::io_context & aIoContext,
	std::shared_ptr<HttpTransport> aTransport,
	std::shared_ptr<RealtimeSocketFactory> aSocketFactory
)
{
	if (aTransport == nullptr)
	{
		aTransport = HttpsClient::create(aIoContext, aConfig.verifyTlsCertificates);
	}
	if (aSocketFactory == nullptr)
	{
		aSocketFactory = std::make_shared<WebSocketFactory>(aIoContext, aConfig.verifyTlsCertificates, aConfig.requestTimeout);
	}
	return std::shared_ptr<Nvr>(new Nvr(aConfig, std::move(aLogger), aIoContext, std::move(aTransport), std::move(aSocketFactory)));
}





Nvr::Nvr(
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	asio::io_context & aIoContext,
	std::shared_ptr<HttpTransport> aTransport,
	std::shared_ptr<RealtimeSocketFactory> aSocketFactory
):
	mIoContext(aIoContext),
	mConfig(aConfig),
	mLogger(std::move(aLogger)),
	mRefreshTimer(aIoContext),
	mIsShuttingDown(false),
	mIsAdmin(false)
{
	mGateway = RequestGateway::create(aIoContext, std::move(aTransport), aConfig, mLogger);
	mSessionManager = SessionManager::create(aIoContext, mGateway, aConfig, mLogger);
	mEventChannel = EventChannel::create(aIoContext, std::move(aSocketFactory), mSessionManager, aConfig, mLogger);
	mBootstrapSync = BootstrapSync::create(mGateway, mSessionManager, mEventChannel, aConfig, mLogger);

	// Wire the components together; the hooks use weak pointers so that they don't form ownership cycles:
	std::weak_ptr<SessionManager> weakSession = mSessionManager;
	std::weak_ptr<EventChannel> weakChannel = mEventChannel;
	std::weak_ptr<BootstrapSync> weakBootstrap = mBootstrapSync;
	mGateway->setSessionHeadersSource([weakSession]()
		{
			auto session = weakSession.lock();
			return (session == nullptr) ? HttpHeaders() : session->session().headers();
		}
	);
	mGateway->setOnAuthenticationFailure([weakSession]()
		{
			if (auto session = weakSession.lock())
			{
				session->clearSession();
			}
		}
	);
	auto address = aConfig.address;
	auto nameSource = [weakBootstrap, address]()
	{
		auto bootstrap = weakBootstrap.lock();
		return (bootstrap == nullptr) ? address : bootstrap->nvrName();
	};
	mGateway->setNameSource(nameSource);
	mEventChannel->setNameSource(nameSource);
	mSessionManager->addOnSessionCleared([weakChannel]()
		{
			if (auto channel = weakChannel.lock())
			{
				channel->disconnect();
			}
		}
	);
	mSessionManager->addOnSessionCleared([weakBootstrap]()
		{
			if (auto bootstrap = weakBootstrap.lock())
			{
				bootstrap->forgetSnapshot();
			}
		}
	);
}





void Nvr::setObserver(std::shared_ptr<InventoryObserver> aObserver)
{
	mBootstrapSync->setObserver(std::move(aObserver));
}





void Nvr::setUpdateListener(EventChannel::UpdateListener aListener)
{
	mEventChannel->setUpdateListener(std::move(aListener));
}





void Nvr::start()
{
	asio::post(mIoContext, [self = shared_from_this()]()
		{
			self->scheduledRefresh();
		}
	);
}





void Nvr::refreshDevices(Callback aOnFinish)
{
	asio::post(mIoContext, [self = shared_from_this(), aOnFinish]()
		{
			self->doRefresh(aOnFinish);
		}
	);
}





std::vector<Device> Nvr::devices() const
{
	std::lock_guard<std::mutex> lock(mMtxState);
	return mDevices;
}





bool Nvr::isAdmin() const
{
	std::lock_guard<std::mutex> lock(mMtxState);
	return mIsAdmin;
}





bool Nvr::isAllRtspConfigured() const
{
	std::lock_guard<std::mutex> lock(mMtxState);
	for (const auto & d: mDevices)
	{
		for (const auto & ch: d.channels)
		{
			if (!ch.isRtspEnabled)
			{
				return true;
			}
		}
	}
	return false;
}





void Nvr::enableRtsp(const Device & aDevice, DeviceCallback aOnFinish)
{
	asio::post(mIoContext, [self = shared_from_this(), aDevice, aOnFinish]()
		{
			self->checkCameraState(aDevice, [self, aDevice, aOnFinish](const std::error_code & aError)
				{
					if (aError)
					{
						return aOnFinish(aError, aDevice);
					}

					// Is there anything to enable at all?
					bool needsUpdate = false;
					for (const auto & ch: aDevice.channels)
					{
						if (!ch.isRtspEnabled)
						{
							needsUpdate = true;
						}
					}
					if (!needsUpdate)
					{
						return aOnFinish({}, aDevice);
					}

					auto device = aDevice;
					for (auto & ch: device.channels)
					{
						ch.isRtspEnabled = true;
					}
					self->patchChannels(device, aOnFinish);
				}
			);
		}
	);
}





void Nvr::updateChannels(const Device & aDevice, DeviceCallback aOnFinish)
{
	asio::post(mIoContext, [self = shared_from_this(), aDevice, aOnFinish]()
		{
			self->checkCameraState(aDevice, [self, aDevice, aOnFinish](const std::error_code & aError)
				{
					if (aError)
					{
						return aOnFinish(aError, aDevice);
					}
					self->patchChannels(aDevice, aOnFinish);
				}
			);
		}
	);
}





void Nvr::updateCamera(const Device & aDevice, const nlohmann::json & aPayload, DeviceCallback aOnFinish)
{
	asio::post(mIoContext, [self = shared_from_this(), aDevice, aPayload, aOnFinish]()
		{
			self->mSessionManager->ensureLoggedIn([self, aDevice, aPayload, aOnFinish](const std::error_code & aError)
				{
					if (aError)
					{
						return aOnFinish(aError, aDevice);
					}
					if (!self->mSessionManager->session().isAdmin)
					{
						return aOnFinish(Error::NotAdmin, aDevice);
					}
					self->mLogger->debug(fmt::format("{}: {}", self->fullName(aDevice), aPayload.dump()));
					self->mGateway->send(Urls::camerasUrl(self->mConfig.address) + "/" + aDevice.id, "PATCH", aPayload.dump(),
						[self, aDevice, aOnFinish](const std::error_code & aError, const HttpResponse & aResponse)
						{
							if (aError)
							{
								self->mLogger->error(fmt::format(
									"{}: Unable to configure the camera: {}.", self->fullName(aDevice), aError.message()
								));
								return aOnFinish(aError, aDevice);
							}
							Device updated;
							auto err = self->parseUpdatedDevice(aResponse, updated);
							if (err)
							{
								return aOnFinish(err, aDevice);
							}
							aOnFinish({}, updated);
						}
					);
				}
			);
		}
	);
}





void Nvr::loginFetch(
	const std::string & aUrl,
	const std::string & aMethod,
	const std::string & aBody,
	bool aDecodeJson,
	bool aLogErrors,
	RequestGateway::Callback aOnFinish
)
{
	asio::post(mIoContext, [=, self = shared_from_this()]()
		{
			self->mSessionManager->ensureLoggedIn([=](const std::error_code & aError)
				{
					if (aError)
					{
						return aOnFinish(aError, HttpResponse());
					}
					self->mGateway->send(aUrl, aMethod, aBody, aDecodeJson, aLogErrors, aOnFinish);
				}
			);
		}
	);
}





void Nvr::shutdown()
{
	asio::post(mIoContext, [self = shared_from_this()]()
		{
			self->mIsShuttingDown = true;
			self->mRefreshTimer.cancel();
			self->mEventChannel->shutdown();
			self->mGateway->cancelAll();
		}
	);
}





void Nvr::doRefresh(Callback aOnFinish)
{
	if (mIsShuttingDown)
	{
		return aOnFinish(Error::ShuttingDown);
	}
	mBootstrapSync->refresh([self = shared_from_this(), aOnFinish](const std::error_code & aError)
		{
			self->publishState();
			aOnFinish(aError);
		}
	);
}





void Nvr::scheduledRefresh()
{
	doRefresh([self = shared_from_this()](const std::error_code & aError)
		{
			// The failures have been logged already, just try again next time:
			if (self->mIsShuttingDown)
			{
				return;
			}
			self->mRefreshTimer.expires_after(self->mConfig.refreshInterval);
			self->mRefreshTimer.async_wait([self](const std::error_code & aError)
				{
					if (!aError && !self->mIsShuttingDown)
					{
						self->scheduledRefresh();
					}
				}
			);
		}
	);
}





void Nvr::publishState()
{
	auto snapshot = mBootstrapSync->snapshot();
	std::lock_guard<std::mutex> lock(mMtxState);
	if (snapshot == nullptr)
	{
		mDevices.clear();
	}
	else
	{
		mDevices = snapshot->devices;
	}
	mIsAdmin = mSessionManager->session().isAdmin;
}





void Nvr::checkCameraState(const Device & aDevice, Callback aOnFinish)
{
	mSessionManager->ensureLoggedIn([self = shared_from_this(), aDevice, aOnFinish](const std::error_code & aError)
		{
			if (aError)
			{
				return aOnFinish(aError);
			}

			// Only admin users can reconfigure the cameras:
			if (!self->mSessionManager->session().isAdmin)
			{
				return aOnFinish(Error::NotAdmin);
			}

			// At the moment, we only know about camera devices:
			if (aDevice.modelKey != "camera")
			{
				return aOnFinish(Error::NotCamera);
			}
			aOnFinish({});
		}
	);
}





void Nvr::patchChannels(const Device & aDevice, DeviceCallback aOnFinish)
{
	nlohmann::json body = {{"channels", aDevice.channelsJson()}};
	mGateway->send(Urls::camerasUrl(mConfig.address) + "/" + aDevice.id, "PATCH", body.dump(), false, true,
		[self = shared_from_this(), aDevice, aOnFinish](const std::error_code & aError, const HttpResponse & aResponse)
		{
			// The network errors have been logged and accounted for by the gateway:
			if (aError)
			{
				self->mLogger->error(fmt::format(
					"{}: Unable to enable RTSP on all channels: {}.", self->fullName(aDevice), aError.message()
				));
				return aOnFinish(aError, aDevice);
			}

			// We took over the response classification, so we report the outcome ourselves:
			if (!aResponse.isOk())
			{
				self->mGateway->recordOutcome(false);
				if (aResponse.status == 403)
				{
					self->mLogger->error(fmt::format(
						"{}: Insufficient privileges to enable RTSP on all channels. "
						"Please ensure this username has the Administrator role assigned in UniFi Protect.",
						self->fullName(aDevice)
					));
					return aOnFinish(Error::InsufficientPrivileges, aDevice);
				}
				self->mLogger->error(fmt::format(
					"{}: Unable to enable RTSP on all channels: {}.", self->fullName(aDevice), aResponse.status
				));
				return aOnFinish(Error::HttpStatus, aDevice);
			}
			self->mGateway->recordOutcome(true);

			Device updated;
			auto err = self->parseUpdatedDevice(aResponse, updated);
			if (err)
			{
				return aOnFinish(err, aDevice);
			}
			aOnFinish({}, updated);
		}
	);
}





std::error_code Nvr::parseUpdatedDevice(const HttpResponse & aResponse, Device & aDevice)
{
	auto j = nlohmann::json::parse(aResponse.body, nullptr, false);
	if (j.is_discarded() || !j.is_object())
	{
		mLogger->error(fmt::format("{}: Unable to parse the updated device configuration.", mBootstrapSync->nvrName()));
		return Error::MalformedResponse;
	}
	try
	{
		aDevice = Device::fromJson(j);
	}
	catch (const nlohmann::json::exception & exc)
	{
		mLogger->error(fmt::format(
			"{}: Unable to parse the updated device configuration: {}", mBootstrapSync->nvrName(), exc.what()
		));
		return Error::MalformedResponse;
	}
	return {};
}





std::string Nvr::fullName(const Device & aDevice) const
{
	return Naming::fullName(mBootstrapSync->snapshot().get(), mConfig.address, aDevice);
}

}  // namespace ProtectClientPp
