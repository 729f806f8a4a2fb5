/*
 *	Client interface for local Broadlink device access
 *
 *	Discovery and provisioning
 *
 *	Functions:
 *	 - Discover(devices, timeout, local_address, cancel)
 *		Broadcasts one hello message and collects the replies into `devices`.
 *		Without `timeout` and `cancel` the scan ends as soon as a device has
 *		answered, or after 10 seconds. A `timeout` in seconds makes the scan
 *		run that long and collect every reply. A `cancel` flag ends the scan
 *		when it is raised; it is checked every 100 milliseconds.
 *		Returns false only on a configuration or socket error, finding no
 *		devices is not an error
 *	 - Setup(ssid, password, security, local_address)
 *		Broadcasts the wifi credentials to a device in AP mode. The device
 *		does not answer.
 *		Returns true once the message is sent
 *
 *	The local address must be an IPv4 address, an IPv6 address is refused
 *	before any network activity takes place.
 *
 *
 *	Copyright 2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkDiscovery
#define _broadlinkDiscovery

// Seconds to wait for a first reply when no timeout or cancel flag is given
#define BROADLINK_DISCOVERY_WINDOW 10

// Milliseconds between checks of the discovery stop conditions
#define BROADLINK_DISCOVERY_POLL_INTERVAL 100

#include "broadlinkAPI.hpp"
#include "broadlinkUDP.hpp"
#include "broadlinkDevice.hpp"

#include <string>
#include <vector>
#include <memory>
#include <atomic>


class broadlinkDiscovery : public broadlinkUDP
{
public:
	broadlinkDiscovery();
	~broadlinkDiscovery();

	bool Discover(std::vector<std::unique_ptr<broadlinkDevice> > &devices, const int timeout = 0, const std::string &local_address = "", const std::atomic<bool> *cancel = nullptr);
	bool Setup(const std::string &ssid, const std::string &password, const Broadlink::WifiSecurity::value security, const std::string &local_address = "");

	// defaults to the IPv4 limited broadcast address on port 80
	bool setTarget(const std::string &address, const uint16_t port = BROADLINK_DISCOVERY_PORT);

	Broadlink::Error::value getErrorState() const { return m_errorState; }
	// replies dropped by the last scan, and why the last one was dropped
	int getDroppedCount() const { return m_dropped; }
	Broadlink::Error::value getDropReason() const { return m_dropReason; }

	// first non-loopback IPv4 address of this host, network order
	static bool GetLocalPrimaryAddress(unsigned char *address);

	/*
	 * Work out the IPv4 address (network order) a discovery reply came from. IPv4
	 * sources are taken as is. For IPv6 sources the address embedded in the reply
	 * is matched against the socket address, see the implementation for the rules.
	 * Returns false if the source is neither IPv4 nor IPv6.
	 */
	static bool ResolveReportedAddress(const struct sockaddr_storage &source, const unsigned char *reply, const unsigned char *local_primary, unsigned char *address);

	// turn one discovery reply into a device session, nullptr if the reply is dropped
	static broadlinkDevice* ProcessReply(const unsigned char *reply, const int size, const struct sockaddr_storage &source, const unsigned char *local_primary,
	                                     Broadlink::Error::value *reason = nullptr);

private:
	bool ValidateLocalAddress(const std::string &local_address, struct sockaddr_in &bind_addr);

	struct sockaddr_in m_target;
	Broadlink::Error::value m_errorState;
	Broadlink::Error::value m_dropReason;
	int m_dropped;
};

#endif // _broadlinkDiscovery
