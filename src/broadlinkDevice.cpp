/*
 *  Client interface for local Broadlink device access
 *
 *  Device session
 *
 *  A session starts out on the shared template key with an all-zero device
 *  id. Authenticate() trades these for the key and id handed out by the
 *  device. Both are replaced together, an exchange never sees one without
 *  the other.
 *
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDevice.hpp"
#include <cstring>
#include <ctime>
#include <vector>

#include "crypt/rand.hpp"

#ifdef DEBUG
#include <iostream>
#endif


namespace Broadlink {
  namespace Auth {
    // static hello record used by the whole device family for key negotiation
    static std::string GeneratePayload()
    {
      std::string szPayload(BROADLINK_AUTH_PAYLOAD_SIZE, '\0');
      for (int i = 0x04; i <= 0x12; i++)
        szPayload[i] = 0x31;
      szPayload[0x1e] = 0x01;
      szPayload[0x2d] = 0x01;
      szPayload.replace(0x30, 7, "Test  1");
      return szPayload;
    }
  }; // namespace Auth

  namespace Catalog {
    struct entry {
      uint16_t devtype;
      DeviceType::value category;
    };

    static const entry DEVICES[] = {
      { 0x0000, DeviceType::SP1 },
      { 0x2711, DeviceType::SP2 },
      { 0x2719, DeviceType::SP2 },
      { 0x7919, DeviceType::SP2 },
      { 0x271a, DeviceType::SP2 },
      { 0x791a, DeviceType::SP2 },
      { 0x2720, DeviceType::SP2 },
      { 0x753e, DeviceType::SP2 },
      { 0x7d00, DeviceType::SP2 },
      { 0x947a, DeviceType::SP2 },
      { 0x9479, DeviceType::SP2 },
      { 0x2728, DeviceType::SP2 },
      { 0x2733, DeviceType::SP2 },
      { 0x273e, DeviceType::SP2 },
      { 0x7530, DeviceType::SP2 },
      { 0x7918, DeviceType::SP2 },
      { 0x2736, DeviceType::SP2 },
      { 0x2712, DeviceType::RM },
      { 0x2737, DeviceType::RM },
      { 0x273d, DeviceType::RM },
      { 0x2783, DeviceType::RM },
      { 0x277c, DeviceType::RM },
      { 0x272a, DeviceType::RM },
      { 0x2787, DeviceType::RM },
      { 0x278b, DeviceType::RM },
      { 0x278f, DeviceType::RM },
      { 0x51da, DeviceType::RM4 },
      { 0x5f36, DeviceType::RM4 },
      { 0x6026, DeviceType::RM4 },
      { 0x6070, DeviceType::RM4 },
      { 0x610e, DeviceType::RM4 },
      { 0x610f, DeviceType::RM4 },
      { 0x62bc, DeviceType::RM4 },
      { 0x62be, DeviceType::RM4 },
      { 0x2714, DeviceType::A1 },
      { 0x4eb5, DeviceType::MP1 },
      { 0x4ef7, DeviceType::MP1 },
      { 0x4ead, DeviceType::HYSEN },
      { 0x2722, DeviceType::S1C },
      { 0x4e4d, DeviceType::DOOYA }
    };
  }; // namespace Catalog
}; // namespace Broadlink


broadlinkDevice::broadlinkDevice(const struct sockaddr_in &host, const std::string &mac, const uint16_t devtype, const int timeout)
{
	m_host = host;
	m_mac = mac;
	m_devtype = devtype;
	m_category = GetCategory(devtype);
	m_timeout = timeout;

	m_device_id = std::string(BROADLINK_DEVID_SIZE, '\0');
	m_session_key = broadlinkAPI::GetTemplateKey();
	m_iv = broadlinkAPI::GetTemplateIV();
	m_authenticated = false;
	m_disposed = false;
	m_errorState = Broadlink::Error::NONE;

	// start counting from a random point like the vendor clients do
	unsigned char seed[2];
	if (Broadlink::random_bytes(seed, sizeof(seed)))
		m_count = (uint16_t)(((seed[1] << 8) | seed[0]) % 0xffff);
	else
		m_count = (uint16_t)(time(NULL) % 0xffff);
}


broadlinkDevice::~broadlinkDevice()
{
	dispose();
}


broadlinkDevice* broadlinkDevice::create(const uint16_t devtype, const struct sockaddr_in &host, const std::string &mac)
{
	if (mac.length() != BROADLINK_MAC_SIZE)
		return nullptr;
	return new broadlinkDevice(host, mac, devtype);
}


Broadlink::DeviceType::value broadlinkDevice::GetCategory(const uint16_t devtype)
{
	for (size_t i = 0; i < sizeof(Broadlink::Catalog::DEVICES) / sizeof(Broadlink::Catalog::DEVICES[0]); i++)
	{
		if (Broadlink::Catalog::DEVICES[i].devtype == devtype)
			return Broadlink::Catalog::DEVICES[i].category;
	}
	return Broadlink::DeviceType::UNKNOWN;
}


std::string broadlinkDevice::GetCategoryName(const Broadlink::DeviceType::value category)
{
	switch (category)
	{
		case Broadlink::DeviceType::SP1:
			return "SP1";
		case Broadlink::DeviceType::SP2:
			return "SP2";
		case Broadlink::DeviceType::RM:
			return "RM";
		case Broadlink::DeviceType::RM4:
			return "RM4";
		case Broadlink::DeviceType::A1:
			return "A1";
		case Broadlink::DeviceType::MP1:
			return "MP1";
		case Broadlink::DeviceType::HYSEN:
			return "Hysen";
		case Broadlink::DeviceType::S1C:
			return "S1C";
		case Broadlink::DeviceType::DOOYA:
			return "Dooya";
		default:
			break;
	}
	return "Unknown";
}


bool broadlinkDevice::Authenticate()
{
	std::string szKeyUsed, szIVUsed;
	std::string szResponse = ExchangeMessage(BROADLINK_AUTH, Broadlink::Auth::GeneratePayload(), &szKeyUsed, &szIVUsed);
	if (szResponse.empty())
		return false;

	std::string szDecrypted;
	if ((szResponse.length() <= BROADLINK_HEADER_SIZE) ||
	    !broadlinkAPI::Decrypt(szKeyUsed, szIVUsed, szResponse, BROADLINK_HEADER_SIZE, szDecrypted) ||
	    szDecrypted.empty())
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"invalid auth response\",\"size\":" << szResponse.length() << "}\n";
#endif
		std::lock_guard<std::mutex> state_guard(m_state_lock);
		m_errorState = Broadlink::Error::PROTOCOL_MISMATCH;
		return false;
	}

	std::string szKey = szDecrypted.substr(BROADLINK_DEVID_SIZE, BROADLINK_KEY_SIZE);
	if ((szKey.length() % BROADLINK_BLOCK_SIZE) || szKey.empty())
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"auth response holds no key\",\"size\":" << szDecrypted.length() << "}\n";
#endif
		std::lock_guard<std::mutex> state_guard(m_state_lock);
		m_errorState = Broadlink::Error::PROTOCOL_MISMATCH;
		return false;
	}

	std::lock_guard<std::mutex> state_guard(m_state_lock);
	if (m_disposed)
	{
		m_errorState = Broadlink::Error::RESOURCE_DISPOSED;
		return false;
	}
	m_device_id = szDecrypted.substr(0, BROADLINK_DEVID_SIZE);
	m_session_key = szKey;
	m_authenticated = true;
	m_errorState = Broadlink::Error::NONE;

#ifdef DEBUG
	std::cout << "dbg: authenticated, id=" << broadlinkAPI::ToHex(m_device_id) << " key=" << broadlinkAPI::ToHex(m_session_key) << "\n";
#endif
	return true;
}


std::string broadlinkDevice::SendPacket(const uint8_t command, const std::string &szPayload)
{
	return ExchangeMessage(command, szPayload, nullptr, nullptr);
}


bool broadlinkDevice::DecryptPayload(const std::string &szResponse, std::string &szPayload)
{
	std::string szKey, szIV;
	{
		std::lock_guard<std::mutex> state_guard(m_state_lock);
		if (m_disposed)
		{
			m_errorState = Broadlink::Error::RESOURCE_DISPOSED;
			return false;
		}
		szKey = m_session_key;
		szIV = m_iv;
	}

	if (szResponse.length() < BROADLINK_HEADER_SIZE)
		return false;
	return broadlinkAPI::Decrypt(szKey, szIV, szResponse, BROADLINK_HEADER_SIZE, szPayload);
}


void broadlinkDevice::dispose()
{
	std::lock_guard<std::mutex> command_guard(m_command_lock);
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	if (m_disposed)
		return;
	close();
	m_session_key.clear();
	m_iv.clear();
	m_device_id.clear();
	m_authenticated = false;
	m_disposed = true;
}


std::string broadlinkDevice::getDeviceID()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_device_id;
}


std::string broadlinkDevice::getSessionKey()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_session_key;
}


std::string broadlinkDevice::getIV()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_iv;
}


uint16_t broadlinkDevice::getSequenceCount()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_count;
}


bool broadlinkDevice::isAuthenticated()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_authenticated;
}


bool broadlinkDevice::isDisposed()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_disposed;
}


Broadlink::Error::value broadlinkDevice::getErrorState()
{
	std::lock_guard<std::mutex> state_guard(m_state_lock);
	return m_errorState;
}


/* private */ std::string broadlinkDevice::ExchangeMessage(const uint8_t command, const std::string &szPayload, std::string *szKeyUsed, std::string *szIVUsed)
{
	std::lock_guard<std::mutex> command_guard(m_command_lock);

	std::string szMac, szDeviceID, szKey, szIV;
	uint16_t count;
	{
		std::lock_guard<std::mutex> state_guard(m_state_lock);
		if (m_disposed)
		{
			m_errorState = Broadlink::Error::RESOURCE_DISPOSED;
			return "";
		}
		m_count = (m_count + 1) & 0xffff;
		count = m_count;
		szMac = m_mac;
		szDeviceID = m_device_id;
		szKey = m_session_key;
		szIV = m_iv;
	}

	std::vector<unsigned char> cMessageBuffer(BROADLINK_HEADER_SIZE + broadlinkAPI::GetPaddedSize((int)szPayload.length()));
	int message_size = broadlinkAPI::BuildCommandMessage(cMessageBuffer.data(), command, count, szMac, szDeviceID, szPayload, szKey, szIV);
	if (message_size < 0)
	{
		std::lock_guard<std::mutex> state_guard(m_state_lock);
		m_errorState = Broadlink::Error::INVALID_ARGUMENT;
		return "";
	}

	unsigned char cResponseBuffer[BROADLINK_MAX_MESSAGE_SIZE];
	int numbytes = SendAndReceive(cMessageBuffer.data(), message_size, m_host, cResponseBuffer, BROADLINK_MAX_MESSAGE_SIZE, m_timeout);

	std::lock_guard<std::mutex> state_guard(m_state_lock);
	if (numbytes < 0)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"socket error\",\"code\":" << getlasterror() << "}\n";
#endif
		m_errorState = Broadlink::Error::SOCKET_ERROR;
		return "";
	}
	if (numbytes == 0)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"no reply\",\"command\":" << (int)command << "}\n";
#endif
		m_errorState = Broadlink::Error::TIMEOUT;
		return "";
	}

#ifdef DEBUG
	std::cout << "dbg: raw answer: " << broadlinkAPI::ToHex(std::string((char*)cResponseBuffer, numbytes)) << "\n";
#endif

	m_errorState = Broadlink::Error::NONE;
	if (szKeyUsed != nullptr)
		*szKeyUsed = szKey;
	if (szIVUsed != nullptr)
		*szIVUsed = szIV;
	return std::string((char*)cResponseBuffer, numbytes);
}
