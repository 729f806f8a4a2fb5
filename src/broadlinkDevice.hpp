/*
 *  Client interface for local Broadlink device access
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

// Broadlink Device Session Class

#ifndef _broadlinkDevice
#define _broadlinkDevice

#include "broadlinkAPI.hpp"
#include "broadlinkUDP.hpp"

#include <string>
#include <cstdint>
#include <mutex>


namespace Broadlink {
  namespace DeviceType {
    enum value {
      UNKNOWN,
      SP1,
      SP2,
      RM,
      RM4,
      A1,
      MP1,
      HYSEN,
      S1C,
      DOOYA
    }; // enum value
  }; // namespace DeviceType
}; // namespace Broadlink


class broadlinkDevice : public broadlinkUDP
{
public:
/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/
	broadlinkDevice(const struct sockaddr_in &host, const std::string &mac, const uint16_t devtype, const int timeout = BROADLINK_DEFAULT_TIMEOUT);
	virtual ~broadlinkDevice();

	// factory used by discovery, maps the numeric device type to its category
	static broadlinkDevice* create(const uint16_t devtype, const struct sockaddr_in &host, const std::string &mac);
	static Broadlink::DeviceType::value GetCategory(const uint16_t devtype);
	static std::string GetCategoryName(const Broadlink::DeviceType::value category);

	// negotiate a session key, returns true on success
	bool Authenticate();

	// send one command and return the raw response (header included), empty on failure
	std::string SendPacket(const uint8_t command, const std::string &szPayload);

	// decrypt the body of a response (offset 0x38 onwards) with the current key
	bool DecryptPayload(const std::string &szResponse, std::string &szPayload);

	// release the socket and key material, the session is unusable afterwards
	void dispose();

	struct sockaddr_in getHost() const { return m_host; }
	std::string getMac() const { return m_mac; }
	uint16_t getDevType() const { return m_devtype; }
	Broadlink::DeviceType::value getDeviceType() const { return m_category; }
	std::string getDeviceTypeName() const { return GetCategoryName(m_category); }
	int getTimeout() const { return m_timeout; }

	std::string getDeviceID();
	std::string getSessionKey();
	std::string getIV();
	uint16_t getSequenceCount();
	bool isAuthenticated();
	bool isDisposed();
	Broadlink::Error::value getErrorState();

private:
	std::string ExchangeMessage(const uint8_t command, const std::string &szPayload, std::string *szKeyUsed, std::string *szIVUsed);

	struct sockaddr_in m_host;
	std::string m_mac;
	uint16_t m_devtype;
	Broadlink::DeviceType::value m_category;
	int m_timeout;

	std::string m_device_id;
	std::string m_session_key;
	std::string m_iv;
	uint16_t m_count;
	bool m_authenticated;
	bool m_disposed;
	Broadlink::Error::value m_errorState;

	// serializes command execution, one exchange in flight per session
	std::mutex m_command_lock;
	// guards the key material and counters for readers outside an exchange
	std::mutex m_state_lock;
};

#endif // _broadlinkDevice
