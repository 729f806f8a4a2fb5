/*
 *  Discovery and provisioning tests
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDiscovery.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <sys/un.h>
#include <cstring>
#include <cstdlib>
#include <time.h>
#include <thread>
#include <chrono>
#include <atomic>


namespace {

// a reply as sent by an RM mini from 192.168.1.50 with mac 34:ea:34:0a:0b:0c
void build_reply(unsigned char *reply, const unsigned char *embedded)
{
	memset(reply, 0, BROADLINK_DISCOVERY_REPLY_MIN_SIZE);
	reply[0x34] = 0x37;
	reply[0x35] = 0x27;
	memcpy(&reply[0x36], embedded, 4);
	const unsigned char mac_reversed[6] = { 0x0c, 0x0b, 0x0a, 0x34, 0xea, 0x34 };
	memcpy(&reply[0x3a], mac_reversed, 6);
}

struct sockaddr_storage ipv4_source(const char *address)
{
	struct sockaddr_storage source;
	memset(&source, 0, sizeof(source));
	struct sockaddr_in *sin = (struct sockaddr_in*)&source;
	sin->sin_family = AF_INET;
	sin->sin_port = htons(80);
	inet_pton(AF_INET, address, &sin->sin_addr);
	return source;
}

struct sockaddr_storage ipv6_source(const char *address)
{
	struct sockaddr_storage source;
	memset(&source, 0, sizeof(source));
	struct sockaddr_in6 *sin6 = (struct sockaddr_in6*)&source;
	sin6->sin6_family = AF_INET6;
	sin6->sin6_port = htons(80);
	inet_pton(AF_INET6, address, &sin6->sin6_addr);
	return source;
}

const unsigned char FORWARD[4] = { 192, 168, 1, 50 };
const unsigned char REVERSED[4] = { 50, 1, 168, 192 };

long elapsed_ms(const std::chrono::steady_clock::time_point &start)
{
	return (long)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

class scopedTimezone
{
public:
	explicit scopedTimezone(const char *rule)
	{
		const char *previous = getenv("TZ");
		m_had_previous = (previous != nullptr);
		if (m_had_previous)
			m_previous = previous;
		setenv("TZ", rule, 1);
		tzset();
	}

	~scopedTimezone()
	{
		if (m_had_previous)
			setenv("TZ", m_previous.c_str(), 1);
		else
			unsetenv("TZ");
		tzset();
	}

private:
	bool m_had_previous;
	std::string m_previous;
};

} // namespace


TEST(ReportedAddress, IPv4SourceIsTakenAsIs)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, REVERSED);
	unsigned char address[4];
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv4_source("192.168.1.50"), reply, nullptr, address));
	EXPECT_EQ(0, memcmp(address, FORWARD, 4));
}

TEST(ReportedAddress, MappedSourceWithForwardBytes)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, FORWARD);
	unsigned char address[4];
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv6_source("::ffff:192.168.1.50"), reply, nullptr, address));
	EXPECT_EQ(0, memcmp(address, FORWARD, 4));
}

TEST(ReportedAddress, MappedSourceWithReversedBytes)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, REVERSED);
	unsigned char address[4];
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv6_source("::ffff:192.168.1.50"), reply, nullptr, address));
	EXPECT_EQ(0, memcmp(address, FORWARD, 4));
}

TEST(ReportedAddress, ReversedBytesMatchingLocalSubnet)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, REVERSED);
	const unsigned char local_primary[4] = { 192, 168, 1, 2 };
	unsigned char address[4];
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv6_source("fe80::1"), reply, local_primary, address));
	EXPECT_EQ(0, memcmp(address, FORWARD, 4));
}

TEST(ReportedAddress, UnmatchedBytesAreLeftAlone)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, REVERSED);
	const unsigned char local_primary[4] = { 10, 0, 0, 2 };
	unsigned char address[4];
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv6_source("fe80::1"), reply, local_primary, address));
	EXPECT_EQ(0, memcmp(address, REVERSED, 4));
	ASSERT_TRUE(broadlinkDiscovery::ResolveReportedAddress(ipv6_source("fe80::1"), reply, nullptr, address));
	EXPECT_EQ(0, memcmp(address, REVERSED, 4));
}

TEST(ReportedAddress, OtherFamiliesAreRefused)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, FORWARD);
	struct sockaddr_storage source;
	memset(&source, 0, sizeof(source));
	source.ss_family = AF_UNIX;
	unsigned char address[4];
	EXPECT_FALSE(broadlinkDiscovery::ResolveReportedAddress(source, reply, nullptr, address));
}


TEST(DiscoveryReply, YieldsDeviceSession)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, REVERSED);
	Broadlink::Error::value reason = Broadlink::Error::NONE;
	std::unique_ptr<broadlinkDevice> device(broadlinkDiscovery::ProcessReply(reply, sizeof(reply), ipv6_source("::ffff:192.168.1.50"), nullptr, &reason));
	ASSERT_TRUE(device != nullptr);
	EXPECT_EQ(Broadlink::Error::NONE, reason);

	EXPECT_EQ(std::string("\x34\xea\x34\x0a\x0b\x0c", 6), device->getMac());
	EXPECT_EQ(0x2737, device->getDevType());
	EXPECT_EQ(Broadlink::DeviceType::RM, device->getDeviceType());

	struct sockaddr_in host = device->getHost();
	EXPECT_EQ(AF_INET, host.sin_family);
	EXPECT_EQ(htons(80), host.sin_port);
	EXPECT_EQ(0, memcmp(&host.sin_addr.s_addr, FORWARD, 4));

	EXPECT_FALSE(device->isAuthenticated());
	EXPECT_EQ(std::string(4, '\0'), device->getDeviceID());
}

TEST(DiscoveryReply, ShortReplyIsDropped)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, FORWARD);
	Broadlink::Error::value reason = Broadlink::Error::NONE;
	EXPECT_TRUE(broadlinkDiscovery::ProcessReply(reply, 0x3f, ipv4_source("192.168.1.50"), nullptr, &reason) == nullptr);
	EXPECT_EQ(Broadlink::Error::PROTOCOL_MISMATCH, reason);
}

TEST(DiscoveryReply, UnknownFamilyIsDropped)
{
	unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
	build_reply(reply, FORWARD);
	struct sockaddr_storage source;
	memset(&source, 0, sizeof(source));
	source.ss_family = AF_UNIX;
	Broadlink::Error::value reason = Broadlink::Error::NONE;
	EXPECT_TRUE(broadlinkDiscovery::ProcessReply(reply, sizeof(reply), source, nullptr, &reason) == nullptr);
	EXPECT_EQ(Broadlink::Error::UNSUPPORTED_ADDRESS_FAMILY, reason);
}


TEST(Discovery, RefusesIPv6LocalAddress)
{
	broadlinkDiscovery scanner;
	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	EXPECT_FALSE(scanner.Discover(devices, 1, "::1"));
	EXPECT_EQ(Broadlink::Error::CONFIGURATION_ERROR, scanner.getErrorState());
	EXPECT_EQ(Broadlink::UDP::Socket::CLOSED, scanner.getSocketState());
	EXPECT_TRUE(devices.empty());
}

TEST(Discovery, FindsDeviceOverLoopback)
{
	broadlinkUDP fake_device;
	ASSERT_TRUE(fake_device.open("127.0.0.1"));

	broadlinkDiscovery scanner;
	ASSERT_TRUE(scanner.setTarget("127.0.0.1", fake_device.getLocalPort()));

	std::atomic<int> hello_size(0);
	std::atomic<int> hello_category(0);
	std::atomic<bool> hello_checksum_ok(false);
	std::atomic<bool> hello_address_ok(false);
	std::thread peer([&]() {
		unsigned char hello[BROADLINK_MAX_MESSAGE_SIZE];
		struct sockaddr_storage source;
		int numbytes = fake_device.receive(hello, sizeof(hello), 5000, &source);
		if ((numbytes <= 0) || (source.ss_family != AF_INET))
			return;
		hello_size = numbytes;
		if (numbytes < BROADLINK_DISCOVERY_SIZE)
			return;
		hello_category = hello[0x26];
		const unsigned char loopback[4] = { 127, 0, 0, 1 };
		hello_address_ok = (memcmp(&hello[0x18], loopback, 4) == 0);
		uint16_t stored = (uint16_t)(hello[0x20] | (hello[0x21] << 8));
		hello[0x20] = 0;
		hello[0x21] = 0;
		hello_checksum_ok = (broadlinkAPI::checksum(hello, numbytes) == stored);

		// answer on the port announced in the hello
		struct sockaddr_in reply_to = *(struct sockaddr_in*)&source;
		reply_to.sin_port = htons((uint16_t)(hello[0x1c] | (hello[0x1d] << 8)));
		unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
		build_reply(reply, REVERSED);
		fake_device.sendto(reply, sizeof(reply), reply_to);
	});

	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	bool result = scanner.Discover(devices, 0, "127.0.0.1");
	long elapsed = elapsed_ms(start);
	peer.join();

	ASSERT_TRUE(result);
	EXPECT_EQ(BROADLINK_DISCOVERY_SIZE, hello_size.load());
	EXPECT_EQ(0x06, hello_category.load());
	EXPECT_TRUE(hello_checksum_ok.load());
	EXPECT_TRUE(hello_address_ok.load());

	// stops at the first reply instead of waiting out the window
	EXPECT_LT(elapsed, BROADLINK_DISCOVERY_WINDOW * 1000);
	ASSERT_EQ(1u, devices.size());
	EXPECT_EQ(std::string("\x34\xea\x34\x0a\x0b\x0c", 6), devices[0]->getMac());
	EXPECT_EQ(Broadlink::DeviceType::RM, devices[0]->getDeviceType());
	struct sockaddr_in host = devices[0]->getHost();
	EXPECT_EQ(htonl(INADDR_LOOPBACK), host.sin_addr.s_addr);
	EXPECT_EQ(htons(80), host.sin_port);
	EXPECT_EQ(0, scanner.getDroppedCount());
	EXPECT_EQ(Broadlink::UDP::Socket::CLOSED, scanner.getSocketState());
}

TEST(Discovery, HelloCarriesStandardTimeOffset)
{
	// one hour east of UTC, summer time or not
	scopedTimezone zone("CET-1CEST,M3.5.0,M10.5.0/3");

	broadlinkUDP fake_device;
	ASSERT_TRUE(fake_device.open("127.0.0.1"));

	broadlinkDiscovery scanner;
	ASSERT_TRUE(scanner.setTarget("127.0.0.1", fake_device.getLocalPort()));

	std::atomic<bool> cancel(false);
	unsigned char hello[BROADLINK_MAX_MESSAGE_SIZE];
	std::atomic<int> hello_size(0);
	std::thread peer([&]() {
		hello_size = fake_device.receive(hello, sizeof(hello), 5000);
		cancel = true;
	});

	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	bool result = scanner.Discover(devices, 0, "127.0.0.1", &cancel);
	peer.join();

	ASSERT_TRUE(result);
	ASSERT_EQ(BROADLINK_DISCOVERY_SIZE, hello_size.load());
	EXPECT_EQ(0xfd, hello[0x08]);
	EXPECT_EQ(0xff, hello[0x09]);
	EXPECT_EQ(0xff, hello[0x0a]);
	EXPECT_EQ(0xff, hello[0x0b]);
}

TEST(Discovery, CountsDroppedReplies)
{
	broadlinkUDP fake_device;
	ASSERT_TRUE(fake_device.open("127.0.0.1"));

	broadlinkDiscovery scanner;
	ASSERT_TRUE(scanner.setTarget("127.0.0.1", fake_device.getLocalPort()));

	std::thread peer([&]() {
		unsigned char hello[BROADLINK_MAX_MESSAGE_SIZE];
		struct sockaddr_storage source;
		if (fake_device.receive(hello, sizeof(hello), 5000, &source) <= 0)
			return;
		unsigned char reply[BROADLINK_DISCOVERY_REPLY_MIN_SIZE];
		build_reply(reply, REVERSED);
		fake_device.sendto(reply, 0x20, *(struct sockaddr_in*)&source);
	});

	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	ASSERT_TRUE(scanner.Discover(devices, 1, "127.0.0.1"));
	peer.join();

	EXPECT_TRUE(devices.empty());
	EXPECT_EQ(1, scanner.getDroppedCount());
	EXPECT_EQ(Broadlink::Error::PROTOCOL_MISMATCH, scanner.getDropReason());
}

TEST(Discovery, TimeoutRunsFullWindow)
{
	broadlinkUDP silent;
	ASSERT_TRUE(silent.open("127.0.0.1"));

	broadlinkDiscovery scanner;
	ASSERT_TRUE(scanner.setTarget("127.0.0.1", silent.getLocalPort()));

	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	ASSERT_TRUE(scanner.Discover(devices, 1, "127.0.0.1"));
	long elapsed = elapsed_ms(start);

	EXPECT_TRUE(devices.empty());
	EXPECT_GE(elapsed, 1000);
	EXPECT_LT(elapsed, 3000);
}

TEST(Discovery, CancelFlagEndsScan)
{
	broadlinkUDP silent;
	ASSERT_TRUE(silent.open("127.0.0.1"));

	broadlinkDiscovery scanner;
	ASSERT_TRUE(scanner.setTarget("127.0.0.1", silent.getLocalPort()));

	std::atomic<bool> cancel(false);
	std::thread canceller([&cancel]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(300));
		cancel = true;
	});

	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	ASSERT_TRUE(scanner.Discover(devices, 0, "127.0.0.1", &cancel));
	long elapsed = elapsed_ms(start);
	canceller.join();

	EXPECT_TRUE(devices.empty());
	EXPECT_GE(elapsed, 250);
	EXPECT_LT(elapsed, 2000);
}


TEST(Setup, SendsCredentials)
{
	broadlinkUDP fake_device;
	ASSERT_TRUE(fake_device.open("127.0.0.1"));

	broadlinkDiscovery provisioner;
	ASSERT_TRUE(provisioner.setTarget("127.0.0.1", fake_device.getLocalPort()));
	ASSERT_TRUE(provisioner.Setup("home", "secret", Broadlink::WifiSecurity::WPA2, "127.0.0.1"));
	EXPECT_EQ(Broadlink::Error::NONE, provisioner.getErrorState());

	unsigned char message[BROADLINK_MAX_MESSAGE_SIZE];
	ASSERT_EQ(BROADLINK_SETUP_SIZE, fake_device.receive(message, sizeof(message), 2000));
	EXPECT_EQ(0x14, message[0x26]);
	EXPECT_EQ(0, memcmp(&message[68], "home", 4));
	EXPECT_EQ(0, memcmp(&message[100], "secret", 6));
	EXPECT_EQ(4, message[0x84]);
	EXPECT_EQ(6, message[0x85]);
	EXPECT_EQ(3, message[0x86]);
}

TEST(Setup, RejectsBadInput)
{
	broadlinkDiscovery provisioner;
	EXPECT_FALSE(provisioner.Setup(std::string(33, 's'), "secret", Broadlink::WifiSecurity::WPA2));
	EXPECT_EQ(Broadlink::Error::INVALID_ARGUMENT, provisioner.getErrorState());

	EXPECT_FALSE(provisioner.Setup("home", "secret", Broadlink::WifiSecurity::WPA2, "fe80::1"));
	EXPECT_EQ(Broadlink::Error::CONFIGURATION_ERROR, provisioner.getErrorState());
}

TEST(Setup, TargetMustBeIPv4)
{
	broadlinkDiscovery provisioner;
	EXPECT_FALSE(provisioner.setTarget("::1"));
	EXPECT_FALSE(provisioner.setTarget(""));
	EXPECT_TRUE(provisioner.setTarget("192.168.10.255"));
}
