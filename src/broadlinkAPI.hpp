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

// Broadlink API message codec and cipher

#ifndef _broadlinkAPI
#define _broadlinkAPI

// Broadlink discovery and provisioning UDP port
#define BROADLINK_DISCOVERY_PORT 80

// Command port assumed for discovered devices
#define BROADLINK_DEVICE_PORT 80

// Default seconds to wait for a device reply
#define BROADLINK_DEFAULT_TIMEOUT 10

// Largest datagram we expect to exchange with a device
#define BROADLINK_MAX_MESSAGE_SIZE 2048

// Message geometry
#define BROADLINK_HEADER_SIZE 0x38
#define BROADLINK_DISCOVERY_SIZE 0x30
#define BROADLINK_DISCOVERY_REPLY_MIN_SIZE 0x40
#define BROADLINK_SETUP_SIZE 0x88
#define BROADLINK_AUTH_PAYLOAD_SIZE 0x50
#define BROADLINK_BLOCK_SIZE 16
#define BROADLINK_KEY_SIZE 16
#define BROADLINK_MAC_SIZE 6
#define BROADLINK_DEVID_SIZE 4

// Header field offsets
#define BROADLINK_OFFSET_CHECKSUM 0x20
#define BROADLINK_OFFSET_MARKER 0x24
#define BROADLINK_OFFSET_COMMAND 0x26
#define BROADLINK_OFFSET_COUNT 0x28
#define BROADLINK_OFFSET_MAC 0x2a
#define BROADLINK_OFFSET_DEVID 0x30
#define BROADLINK_OFFSET_PAYLOAD_CHECKSUM 0x34

// Discovery reply field offsets
#define BROADLINK_OFFSET_REPLY_DEVTYPE 0x34
#define BROADLINK_OFFSET_REPLY_ADDRESS 0x36
#define BROADLINK_OFFSET_REPLY_MAC 0x3a

// Setup message field offsets
#define BROADLINK_OFFSET_SETUP_SSID 68
#define BROADLINK_OFFSET_SETUP_PASSWORD 100
#define BROADLINK_OFFSET_SETUP_SSID_LEN 0x84
#define BROADLINK_OFFSET_SETUP_PASSWORD_LEN 0x85
#define BROADLINK_OFFSET_SETUP_SECURITY 0x86

// Broadlink Command Types
#define BROADLINK_CATEGORY_HELLO 0x06  // discovery hello
#define BROADLINK_CATEGORY_SETUP 0x14  // wifi provisioning broadcast
#define BROADLINK_AUTH 0x65  // session key negotiation
#define BROADLINK_COMMAND 0x6a  // generic device command

#define BROADLINK_CHECKSUM_SEED 0xbeaf


#include <string>
#include <cstdint>
#include <ctime>


namespace Broadlink {
  namespace Error {
    enum value {
      NONE,
      TIMEOUT,
      PROTOCOL_MISMATCH,
      UNSUPPORTED_ADDRESS_FAMILY,
      CONFIGURATION_ERROR,
      RESOURCE_DISPOSED,
      INVALID_ARGUMENT,
      SOCKET_ERROR
    }; // enum value
  }; // namespace Error

  namespace WifiSecurity {
    enum value {
      NONE = 0,
      WEP = 1,
      WPA1 = 2,
      WPA2 = 3,
      WPA12 = 4
    }; // enum value
  }; // namespace WifiSecurity

  // template key and iv for the unauthenticated channel
  extern const unsigned char KEY_TEMPLATE[BROADLINK_KEY_SIZE];
  extern const unsigned char IV_TEMPLATE[BROADLINK_BLOCK_SIZE];
}; // namespace Broadlink


class broadlinkAPI
{
public:
	// additive checksum shared by every message type
	static uint16_t checksum(const unsigned char *buffer, const int size, uint16_t seed = BROADLINK_CHECKSUM_SEED);
	static uint16_t checksum(const std::string &szBuffer);

	// size of a payload after padding, always at least one byte larger than the input
	static int GetPaddedSize(const int payloadSize);
	static std::string PadPayload(const std::string &szPayload);

	/*
	 * Build a command message into `buffer`, which must hold BROADLINK_HEADER_SIZE plus
	 * the padded payload size. Returns the message size or -1 if the MAC or device id
	 * have the wrong length or encryption failed.
	 */
	static int BuildCommandMessage(unsigned char *buffer, const uint8_t command, const uint16_t count, const std::string &szMac, const std::string &szDeviceID,
	                               const std::string &szPayload, const std::string &szKey, const std::string &szIV);

	// standard time offset of the local zone in hours west of UTC, daylight saving is ignored
	static int GetTimezoneHours();

	// 0x30 byte discovery hello; `localAddress` is IPv4 in network order, `tzHours` is hours west of UTC
	static int BuildDiscoveryMessage(unsigned char *buffer, const struct tm &localtime, const int tzHours, const unsigned char *localAddress, const uint16_t localPort);

	// 0x88 byte wifi provisioning message
	static int BuildSetupMessage(unsigned char *buffer, const std::string &szSSID, const std::string &szPassword, const Broadlink::WifiSecurity::value securityMode);

	// CBC cipher without padding, input size must be a multiple of 16
	static bool Encrypt(const std::string &szKey, const std::string &szIV, const std::string &szPlainText, std::string &szCipherText);
	static bool Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, std::string &szPlainText);
	static bool Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, const size_t offset, std::string &szPlainText);
	static bool Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, const size_t offset, const size_t count, std::string &szPlainText);

	static std::string GetTemplateKey();
	static std::string GetTemplateIV();

	// helpers for the examples
	static std::string MacToString(const std::string &szMac);
	static bool StringToMac(const std::string &szText, std::string &szMac);
	static std::string ToHex(const std::string &szBuffer);
	static bool FromHex(const std::string &szText, std::string &szBuffer);
};

#endif
