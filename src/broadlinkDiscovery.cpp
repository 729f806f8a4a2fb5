/*
 *	Client interface for local Broadlink device access
 *
 *	Discovery and provisioning
 *
 *	Copyright 2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDiscovery.hpp"
#include <cstring>
#include <ctime>
#include <chrono>
#include <deque>
#include <algorithm>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

#ifdef DEBUG
#include <iostream>
#endif


namespace Broadlink {
  namespace Discovery {
    struct reply {
      std::string data;
      struct sockaddr_storage source;
    };
  }; // namespace Discovery
}; // namespace Broadlink


broadlinkDiscovery::broadlinkDiscovery()
{
	m_errorState = Broadlink::Error::NONE;
	m_dropReason = Broadlink::Error::NONE;
	m_dropped = 0;
	memset(&m_target, 0, sizeof(m_target));
	m_target.sin_family = AF_INET;
	m_target.sin_port = htons(BROADLINK_DISCOVERY_PORT);
	m_target.sin_addr.s_addr = htonl(INADDR_BROADCAST);
}


broadlinkDiscovery::~broadlinkDiscovery()
{
	close();
}


bool broadlinkDiscovery::setTarget(const std::string &address, const uint16_t port)
{
	struct sockaddr_in target;
	if (address.empty() || !ResolveAddress(address, port, target))
		return false;
	m_target = target;
	return true;
}


bool broadlinkDiscovery::Discover(std::vector<std::unique_ptr<broadlinkDevice> > &devices, const int timeout, const std::string &local_address, const std::atomic<bool> *cancel)
{
	struct sockaddr_in bind_addr;
	if (!ValidateLocalAddress(local_address, bind_addr))
		return false;

	// used to tell the byte order of addresses reported over IPv6
	unsigned char local_primary[4];
	bool have_primary = GetLocalPrimaryAddress(local_primary);

	if (!open(local_address, 0, true))
	{
		m_errorState = Broadlink::Error::SOCKET_ERROR;
		return false;
	}

	time_t now = time(NULL);
	struct tm ltm;
	localtime_r(&now, &ltm);
	int tzHours = broadlinkAPI::GetTimezoneHours();

	unsigned char cMessageBuffer[BROADLINK_MAX_MESSAGE_SIZE];
	int message_size = broadlinkAPI::BuildDiscoveryMessage(cMessageBuffer, ltm, tzHours, (const unsigned char*)&bind_addr.sin_addr.s_addr, getLocalPort());

#ifdef DEBUG
	std::cout << "dbg: discovery hello: " << broadlinkAPI::ToHex(std::string((char*)cMessageBuffer, message_size)) << "\n";
#endif

	if (sendto(cMessageBuffer, message_size, m_target) != message_size)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"" << strerror(getlasterror()) << "\",\"code\":" << getlasterror() << "}\n";
#endif
		m_errorState = Broadlink::Error::SOCKET_ERROR;
		close();
		return false;
	}

	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	std::deque<Broadlink::Discovery::reply> replies;
	bool isReceivedOnce = false;
	m_errorState = Broadlink::Error::NONE;
	m_dropReason = Broadlink::Error::NONE;
	m_dropped = 0;

	while (true)
	{
		if ((cancel != nullptr) && cancel->load())
			break;

		long elapsed = (long)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
		if (timeout > 0)
		{
			if (elapsed >= (long)timeout * 1000)
				break;
		}
		else if ((cancel == nullptr) && (isReceivedOnce || (elapsed > BROADLINK_DISCOVERY_WINDOW * 1000)))
			break;

		// queue whatever arrived during this interval
		Broadlink::Discovery::reply incoming;
		int numbytes = receive(cMessageBuffer, BROADLINK_MAX_MESSAGE_SIZE, BROADLINK_DISCOVERY_POLL_INTERVAL, &incoming.source);
		while (numbytes > 0)
		{
			incoming.data.assign((char*)cMessageBuffer, numbytes);
			replies.push_back(incoming);
			numbytes = receive(cMessageBuffer, BROADLINK_MAX_MESSAGE_SIZE, 0, &incoming.source);
		}
		if (numbytes < 0)
		{
#ifdef DEBUG
			std::cout << "{\"msg\":\"" << strerror(getlasterror()) << "\",\"code\":" << getlasterror() << "}\n";
#endif
			m_errorState = Broadlink::Error::SOCKET_ERROR;
			break;
		}

		while (!replies.empty())
		{
			Broadlink::Discovery::reply &next = replies.front();
			broadlinkDevice *device = ProcessReply((const unsigned char*)next.data.data(), (int)next.data.length(), next.source, have_primary ? local_primary : nullptr, &m_dropReason);
			replies.pop_front();
			if (device == nullptr)
			{
				m_dropped++;
				continue;
			}
			devices.push_back(std::unique_ptr<broadlinkDevice>(device));
			isReceivedOnce = true;
		}
	}

	close();
	return (m_errorState == Broadlink::Error::NONE);
}


bool broadlinkDiscovery::Setup(const std::string &ssid, const std::string &password, const Broadlink::WifiSecurity::value security, const std::string &local_address)
{
	struct sockaddr_in bind_addr;
	if (!ValidateLocalAddress(local_address, bind_addr))
		return false;

	unsigned char cMessageBuffer[BROADLINK_SETUP_SIZE];
	int message_size = broadlinkAPI::BuildSetupMessage(cMessageBuffer, ssid, password, security);
	if (message_size < 0)
	{
		m_errorState = Broadlink::Error::INVALID_ARGUMENT;
		return false;
	}

	if (!open(local_address, 0, true))
	{
		m_errorState = Broadlink::Error::SOCKET_ERROR;
		return false;
	}

	int numbytes = sendto(cMessageBuffer, message_size, m_target);
	close();
	if (numbytes != message_size)
	{
		m_errorState = Broadlink::Error::SOCKET_ERROR;
		return false;
	}

	m_errorState = Broadlink::Error::NONE;
	return true;
}


bool broadlinkDiscovery::GetLocalPrimaryAddress(unsigned char *address)
{
	struct ifaddrs *ifaddr;
	if (getifaddrs(&ifaddr) != 0)
		return false;

	bool found = false;
	for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
	{
		if ((ifa->ifa_addr == nullptr) || (ifa->ifa_addr->sa_family != AF_INET))
			continue;
		if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK))
			continue;
		memcpy(address, &((struct sockaddr_in*)ifa->ifa_addr)->sin_addr.s_addr, 4);
		found = true;
		break;
	}

	freeifaddrs(ifaddr);
	return found;
}


bool broadlinkDiscovery::ResolveReportedAddress(const struct sockaddr_storage &source, const unsigned char *reply, const unsigned char *local_primary, unsigned char *address)
{
	if (source.ss_family == AF_INET)
	{
		memcpy(address, &((const struct sockaddr_in*)&source)->sin_addr.s_addr, 4);
		return true;
	}

	if (source.ss_family != AF_INET6)
		return false;

	// devices embed their IPv4 address at 0x36, mostly in little endian order
	unsigned char embedded[4];
	memcpy(embedded, &reply[BROADLINK_OFFSET_REPLY_ADDRESS], 4);

	const unsigned char *sockaddr6 = ((const struct sockaddr_in6*)&source)->sin6_addr.s6_addr;
	static const unsigned char v4mapped[12] = { 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff };
	bool is_mapped = (memcmp(sockaddr6, v4mapped, sizeof(v4mapped)) == 0);

	bool reverse = false;
	if (is_mapped && (memcmp(&sockaddr6[12], embedded, 4) == 0))
	{
		// 1. embedded bytes are in network order already
	}
	else if (is_mapped && (sockaddr6[15] == embedded[0]) && (sockaddr6[14] == embedded[1]) && (sockaddr6[13] == embedded[2]) && (sockaddr6[12] == embedded[3]))
	{
		// 2. embedded bytes are the reverse of the socket address
		reverse = true;
	}
	else if ((local_primary != nullptr) && (embedded[3] == local_primary[0]) && (embedded[2] == local_primary[1]))
	{
		// 3. best effort: the reversed high bytes match our own subnet
		reverse = true;
	}

	if (reverse)
		std::reverse(embedded, embedded + 4);
	memcpy(address, embedded, 4);
	return true;
}


broadlinkDevice* broadlinkDiscovery::ProcessReply(const unsigned char *reply, const int size, const struct sockaddr_storage &source, const unsigned char *local_primary,
                                                  Broadlink::Error::value *reason)
{
	if (size < BROADLINK_DISCOVERY_REPLY_MIN_SIZE)
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"discovery reply too short\",\"size\":" << size << "}\n";
#endif
		if (reason != nullptr)
			*reason = Broadlink::Error::PROTOCOL_MISMATCH;
		return nullptr;
	}

	unsigned char address[4];
	if (!ResolveReportedAddress(source, reply, local_primary, address))
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"unexpected address family\",\"family\":" << (int)source.ss_family << "}\n";
#endif
		if (reason != nullptr)
			*reason = Broadlink::Error::UNSUPPORTED_ADDRESS_FAMILY;
		return nullptr;
	}

	// mac is sent in reverse order
	std::string szMac((const char*)&reply[BROADLINK_OFFSET_REPLY_MAC], BROADLINK_MAC_SIZE);
	std::reverse(szMac.begin(), szMac.end());

	uint16_t devtype = (uint16_t)(reply[BROADLINK_OFFSET_REPLY_DEVTYPE] | (reply[BROADLINK_OFFSET_REPLY_DEVTYPE + 1] << 8));

	struct sockaddr_in host;
	memset(&host, 0, sizeof(host));
	host.sin_family = AF_INET;
	host.sin_port = htons(BROADLINK_DEVICE_PORT);
	memcpy(&host.sin_addr.s_addr, address, 4);

#ifdef DEBUG
	char cAddress[INET_ADDRSTRLEN];
	inet_ntop(AF_INET, &host.sin_addr, cAddress, sizeof(cAddress));
	std::cout << "dbg: discovered type 0x" << std::hex << devtype << std::dec << " at " << cAddress << " mac " << broadlinkAPI::MacToString(szMac) << "\n";
#endif

	return broadlinkDevice::create(devtype, host, szMac);
}


/* private */ bool broadlinkDiscovery::ValidateLocalAddress(const std::string &local_address, struct sockaddr_in &bind_addr)
{
	if (!ResolveAddress(local_address, 0, bind_addr))
	{
#ifdef DEBUG
		std::cout << "{\"msg\":\"local address must be IPv4\",\"address\":\"" << local_address << "\"}\n";
#endif
		m_errorState = Broadlink::Error::CONFIGURATION_ERROR;
		return false;
	}
	return true;
}
