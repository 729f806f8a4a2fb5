/*
 *	Client interface for local Broadlink device access
 *
 *	This is the base UDP communication class.
 *
 *	Broadlink devices speak a connectionless request/response protocol. A
 *	request is a single datagram and the device answers with a single
 *	datagram. This class does not retry, reorder or deduplicate anything:
 *	a lost datagram simply shows as a timeout to the caller.
 *
 *	Common functions:
 *	 - open(local_address, local_port, broadcast)
 *		Creates the IPv4 UDP socket, optionally bound to a local address
 *		and/or port and optionally allowed to send broadcasts.
 *		Returns true|false indicating success or failure
 *	 - sendto(buffer[], size, target)
 *		Sends `size` bytes of `buffer` to `target`
 *		Returns `size` on success or -1 if an error occurred
 *	 - receive(buffer[], maxsize, timeout, source)
 *		Waits up to `timeout` milliseconds for one datagram and fills
 *		`buffer` with it. If `source` is not null it receives the sender's
 *		address.
 *		Returns number of bytes received, 0 on timeout or -1 if an error
 *		occurred
 *	 - SendAndReceive(request[], size, target, response[], maxsize, timeout)
 *		Opens an ephemeral socket if none is open yet, sends one request
 *		and waits up to `timeout` seconds for one reply.
 *		Returns number of bytes received, 0 on timeout or -1 if an error
 *		occurred
 *	 - close()
 *		Releases the socket
 *		Returns nothing
 *	 - getlasterror()
 *		Use this instead of referencing `errno`, which may be polluted
 *		Returns the last error state of the socket
 *
 *
 *	Copyright 2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _broadlinkUDP
#define _broadlinkUDP

#include <string>
#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>


namespace Broadlink {
  namespace UDP {
    namespace Socket {
      enum value {
        NO_SUCH_HOST,
        NO_SOCK_AVAIL,
        FAILED,
        CLOSED,
        OPEN
      }; // enum value
    }; // namespace Socket
  }; // namespace UDP
}; // namespace Broadlink


class broadlinkUDP
{

public:
	broadlinkUDP();
	virtual ~broadlinkUDP();

	// parse a dotted IPv4 address or resolve a hostname to its IPv4 address
	static bool ResolveAddress(const std::string &hostname, const uint16_t port, struct sockaddr_in &address);

	Broadlink::UDP::Socket::value getSocketState();

	bool open(const std::string &local_address = "", const uint16_t local_port = 0, const bool broadcast = false);
	int sendto(const unsigned char* buffer, const int size, const struct sockaddr_in &target);
	int receive(unsigned char* buffer, const int maxsize, const int timeout, struct sockaddr_storage *source = nullptr);
	virtual int SendAndReceive(const unsigned char* request, const int size, const struct sockaddr_in &target, unsigned char* response, const int maxsize, const int timeout);
	uint16_t getLocalPort();
	int getlasterror();
	bool isSocketReadable(const int timeout = 0);
	void close();

protected:
	Broadlink::UDP::Socket::value m_socketState;

private:
	int getSocketEvents(short events, int timeout);

	int m_sockfd;
	int m_lasterror;
};

#endif

