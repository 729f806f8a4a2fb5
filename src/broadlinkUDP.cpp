/*
 *	Client interface for local Broadlink device access
 *
 *	This is the base UDP communication class.
 *
 *	Copyright 2026 - broadlinkpp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkUDP.hpp"
#include <unistd.h>
#include <cstring>
#include <netdb.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <chrono>

#ifdef DEBUG
#include <iostream>
#endif


broadlinkUDP::broadlinkUDP()
{
	m_sockfd = -1;
	m_lasterror = 0;
	m_socketState = Broadlink::UDP::Socket::CLOSED;
}


broadlinkUDP::~broadlinkUDP()
{
	close();
}


Broadlink::UDP::Socket::value broadlinkUDP::getSocketState()
{
	return m_socketState;
}


bool broadlinkUDP::ResolveAddress(const std::string &hostname, const uint16_t port, struct sockaddr_in &address)
{
	memset(&address, 0, sizeof(address));
	address.sin_family = AF_INET;
	address.sin_port = htons(port);

	if (hostname.empty())
	{
		address.sin_addr.s_addr = htonl(INADDR_ANY);
		return true;
	}

	// this is an IPv4 only protocol
	if (hostname.find(':') != std::string::npos)
		return false;

	if ((hostname[0] ^ 0x30) < 10)
		return (inet_pton(AF_INET, hostname.c_str(), &address.sin_addr) == 1);

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_DGRAM;

	struct addrinfo *result;
	if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0)
		return false;

	address.sin_addr = ((struct sockaddr_in*)result->ai_addr)->sin_addr;
	freeaddrinfo(result);
	return true;
}


bool broadlinkUDP::open(const std::string &local_address, const uint16_t local_port, const bool broadcast)
{
	if (m_sockfd >= 0)
		close();

	struct sockaddr_in bind_addr;
	if (!ResolveAddress(local_address, local_port, bind_addr))
	{
		m_socketState = Broadlink::UDP::Socket::NO_SUCH_HOST;
		return false;
	}

	m_sockfd = socket(AF_INET, SOCK_DGRAM, 0);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Broadlink::UDP::Socket::NO_SOCK_AVAIL;
		return false;
	}

	int sockopts = fcntl(m_sockfd, F_GETFL, 0);
	if ((sockopts == -1) || (fcntl(m_sockfd, F_SETFL, sockopts | O_NONBLOCK) == -1))
	{
		m_lasterror = errno;
		close();
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return false;
	}

	if (broadcast)
	{
		int set = 1;
		if (setsockopt(m_sockfd, SOL_SOCKET, SO_BROADCAST, &set, sizeof(set)) < 0)
		{
			m_lasterror = errno;
			close();
			m_socketState = Broadlink::UDP::Socket::FAILED;
			return false;
		}
	}

	if (bind(m_sockfd, (const sockaddr*)&bind_addr, sizeof(bind_addr)) < 0)
	{
		m_lasterror = errno;
#ifdef DEBUG
		std::cout << "{\"msg\":\"" << strerror(m_lasterror) << "\",\"code\":" << m_lasterror << "}\n";
#endif
		close();
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return false;
	}

	m_lasterror = 0;
	m_socketState = Broadlink::UDP::Socket::OPEN;
	return true;
}


int broadlinkUDP::sendto(const unsigned char* buffer, const int size, const struct sockaddr_in &target)
{
	if (m_sockfd < 0)
	{
		m_lasterror = EBADF;
		return -1;
	}

	int numbytes = (int)::sendto(m_sockfd, buffer, size, 0, (const sockaddr*)&target, sizeof(target));
	if (numbytes < 0)
		m_lasterror = errno;

	return numbytes;
}


int broadlinkUDP::receive(unsigned char* buffer, const int maxsize, const int timeout, struct sockaddr_storage *source)
{
	if (m_sockfd < 0)
	{
		m_lasterror = EBADF;
		return -1;
	}

	m_lasterror = EAGAIN;
	if (getSocketEvents(POLLIN, timeout) != 0)
	{
		if (m_lasterror == EAGAIN)
			return 0;
		return -1;
	}

	struct sockaddr_storage from;
	socklen_t fromlen = sizeof(from);
	int numbytes = (int)recvfrom(m_sockfd, buffer, maxsize, 0, (sockaddr*)&from, &fromlen);
	if (numbytes < 0)
	{
		m_lasterror = errno;
		if ((m_lasterror == EAGAIN) || (m_lasterror == EWOULDBLOCK))
			return 0;
		return -1;
	}

	if (source != nullptr)
		memcpy(source, &from, sizeof(from));
	return numbytes;
}


int broadlinkUDP::SendAndReceive(const unsigned char* request, const int size, const struct sockaddr_in &target, unsigned char* response, const int maxsize, const int timeout)
{
	if ((m_sockfd < 0) && !open())
		return -1;

	if (sendto(request, size, target) != size)
		return -1;

	// a single datagram answers a single request, wait for it until the deadline passes
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
	while (true)
	{
		int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		if (remaining < 0)
			remaining = 0;

		int numbytes = receive(response, maxsize, remaining);
		if (numbytes != 0)
			return numbytes;

		if (remaining == 0)
			break;
	}

	m_lasterror = ETIMEDOUT;
	return 0;
}


uint16_t broadlinkUDP::getLocalPort()
{
	if (m_sockfd < 0)
		return 0;

	struct sockaddr_in local_addr;
	socklen_t len = sizeof(local_addr);
	if (getsockname(m_sockfd, (sockaddr*)&local_addr, &len) < 0)
	{
		m_lasterror = errno;
		return 0;
	}
	return ntohs(local_addr.sin_port);
}


int broadlinkUDP::getlasterror()
{
	return m_lasterror;
}


bool broadlinkUDP::isSocketReadable(const int timeout)
{
	return (getSocketEvents(POLLIN, timeout) == 0);
}


void broadlinkUDP::close()
{
	if (m_sockfd >= 0)
		::close(m_sockfd);
	m_sockfd = -1;
	m_socketState = Broadlink::UDP::Socket::CLOSED;
}


/* private */ int broadlinkUDP::getSocketEvents(short events, int timeout)
{
	if (m_sockfd < 0)
	{
		m_lasterror = EBADF;
		return -1;
	}

	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout);
	if (result > 0)
	{
		if (fds.revents & (POLLERR | POLLNVAL))
		{
			// try to get socket error
			int sockerr;
			socklen_t len = sizeof sockerr;
			if (getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0)
			{
				if (sockerr > 0)
					m_lasterror = sockerr;
			}
			return m_lasterror;
		}
		else if (fds.revents & events)
		{
			m_lasterror = 0;
			return m_lasterror;
		}
	}
	else if (result < 0)
	{
		m_lasterror = errno;
		if (m_lasterror == EINTR)
		{
			m_lasterror = EAGAIN;
			return m_lasterror;
		}
		m_socketState = Broadlink::UDP::Socket::FAILED;
		return m_lasterror;
	}
	// timeout
	return EAGAIN;
}
