/*
 *  Client interface for local Broadlink device access
 *
 *  Message codec
 *
 *  All messages share one layout convention: fixed offsets, little endian
 *  multi-byte integers and an additive checksum seeded with 0xbeaf stored at
 *  0x20. Command messages carry a 0x38 byte clear text header followed by the
 *  AES encrypted payload.
 *
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkAPI.hpp"
#include <cstring>
#include <cstdio>
#include <time.h>

#ifdef DEBUG
#include <iostream>
#endif


namespace Broadlink {
  const unsigned char KEY_TEMPLATE[BROADLINK_KEY_SIZE] = {
    0x09, 0x76, 0x28, 0x34, 0x3f, 0xe9, 0x9e, 0x23,
    0x76, 0x5c, 0x15, 0x13, 0xac, 0xcf, 0x8b, 0x02
  };

  const unsigned char IV_TEMPLATE[BROADLINK_BLOCK_SIZE] = {
    0x56, 0x2e, 0x17, 0x99, 0x6d, 0x09, 0x3d, 0x28,
    0xdd, 0xb3, 0xba, 0x69, 0x5a, 0x2e, 0x6f, 0x58
  };

  namespace Message {
    static const unsigned char MAGIC[8] = { 0x5a, 0xa5, 0xaa, 0x55, 0x5a, 0xa5, 0xaa, 0x55 };
    static const unsigned char MARKER[2] = { 0x2a, 0x27 };
  }; // namespace Message
}; // namespace Broadlink


uint16_t broadlinkAPI::checksum(const unsigned char *buffer, const int size, uint16_t seed)
{
	uint32_t sum = seed;
	for (int i = 0; i < size; i++)
	{
		sum += buffer[i];
		sum &= 0xFFFF;
	}
	return (uint16_t)sum;
}


uint16_t broadlinkAPI::checksum(const std::string &szBuffer)
{
	return checksum((const unsigned char*)szBuffer.data(), (int)szBuffer.length());
}


int broadlinkAPI::GetPaddedSize(const int payloadSize)
{
	// devices expect a trailing zero block even when the payload is block aligned
	return ((payloadSize / BROADLINK_BLOCK_SIZE) + 1) * BROADLINK_BLOCK_SIZE;
}


std::string broadlinkAPI::PadPayload(const std::string &szPayload)
{
	std::string szPadded = szPayload;
	szPadded.append(GetPaddedSize((int)szPayload.length()) - szPayload.length(), '\0');
	return szPadded;
}


int broadlinkAPI::BuildCommandMessage(unsigned char *cMessageBuffer, const uint8_t command, const uint16_t count, const std::string &szMac, const std::string &szDeviceID,
                                      const std::string &szPayload, const std::string &szKey, const std::string &szIV)
{
	if ((szMac.length() != BROADLINK_MAC_SIZE) || (szDeviceID.length() != BROADLINK_DEVID_SIZE))
		return -1;
	if ((szKey.length() != BROADLINK_KEY_SIZE) || (szIV.length() != BROADLINK_BLOCK_SIZE))
		return -1;

	memset(cMessageBuffer, 0, BROADLINK_HEADER_SIZE);
	memcpy(cMessageBuffer, Broadlink::Message::MAGIC, sizeof(Broadlink::Message::MAGIC));
	memcpy(&cMessageBuffer[BROADLINK_OFFSET_MARKER], Broadlink::Message::MARKER, sizeof(Broadlink::Message::MARKER));
	cMessageBuffer[BROADLINK_OFFSET_COMMAND] = command;
	cMessageBuffer[BROADLINK_OFFSET_COUNT] = (count & 0x00FF);
	cMessageBuffer[BROADLINK_OFFSET_COUNT + 1] = (count & 0xFF00) >> 8;
	memcpy(&cMessageBuffer[BROADLINK_OFFSET_MAC], szMac.data(), BROADLINK_MAC_SIZE);
	memcpy(&cMessageBuffer[BROADLINK_OFFSET_DEVID], szDeviceID.data(), BROADLINK_DEVID_SIZE);

	std::string szPadded = PadPayload(szPayload);
	uint16_t payloadChecksum = checksum(szPadded);
	cMessageBuffer[BROADLINK_OFFSET_PAYLOAD_CHECKSUM] = (payloadChecksum & 0x00FF);
	cMessageBuffer[BROADLINK_OFFSET_PAYLOAD_CHECKSUM + 1] = (payloadChecksum & 0xFF00) >> 8;

	std::string szEncrypted;
	if (!Encrypt(szKey, szIV, szPadded, szEncrypted))
	{
		// encryption failure
		return -1;
	}

#ifdef DEBUG
	std::cout << "dbg: encrypted payload (size=" << szEncrypted.length() << "): " << ToHex(szEncrypted) << "\n";
#endif

	memcpy(&cMessageBuffer[BROADLINK_HEADER_SIZE], szEncrypted.data(), szEncrypted.length());
	int buffersize = BROADLINK_HEADER_SIZE + (int)szEncrypted.length();

	// checksum field is still zero at this point
	uint16_t messageChecksum = checksum(cMessageBuffer, buffersize);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM] = (messageChecksum & 0x00FF);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM + 1] = (messageChecksum & 0xFF00) >> 8;

#ifdef DEBUG
	std::cout << "dbg: complete message: " << ToHex(std::string((char*)cMessageBuffer, buffersize)) << "\n";
#endif

	return buffersize;
}


int broadlinkAPI::GetTimezoneHours()
{
	// `timezone` holds the seconds west of UTC of standard time
	tzset();
	return (int)(timezone / 3600);
}


int broadlinkAPI::BuildDiscoveryMessage(unsigned char *cMessageBuffer, const struct tm &localtime, const int tzHours, const unsigned char *localAddress, const uint16_t localPort)
{
	memset(cMessageBuffer, 0, BROADLINK_DISCOVERY_SIZE);

	if (tzHours < 0)
	{
		cMessageBuffer[0x08] = (uint8_t)(0xff + tzHours - 1);
		cMessageBuffer[0x09] = 0xff;
		cMessageBuffer[0x0a] = 0xff;
		cMessageBuffer[0x0b] = 0xff;
	}
	else
		cMessageBuffer[0x08] = (uint8_t)tzHours;

	int year = localtime.tm_year + 1900;
	cMessageBuffer[0x0c] = (year & 0x00FF);
	cMessageBuffer[0x0d] = (year & 0xFF00) >> 8;
	cMessageBuffer[0x0e] = (uint8_t)localtime.tm_min;
	cMessageBuffer[0x0f] = (uint8_t)localtime.tm_hour;
	cMessageBuffer[0x10] = (uint8_t)(year % 100);
	// ISO weekday, 1=monday ... 7=sunday
	cMessageBuffer[0x11] = (localtime.tm_wday == 0) ? 7 : (uint8_t)localtime.tm_wday;
	cMessageBuffer[0x12] = (uint8_t)localtime.tm_mday;
	cMessageBuffer[0x13] = (uint8_t)(localtime.tm_mon + 1);
	memcpy(&cMessageBuffer[0x18], localAddress, 4);
	cMessageBuffer[0x1c] = (localPort & 0x00FF);
	cMessageBuffer[0x1d] = (localPort & 0xFF00) >> 8;
	cMessageBuffer[BROADLINK_OFFSET_COMMAND] = BROADLINK_CATEGORY_HELLO;

	uint16_t messageChecksum = checksum(cMessageBuffer, BROADLINK_DISCOVERY_SIZE);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM] = (messageChecksum & 0x00FF);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM + 1] = (messageChecksum & 0xFF00) >> 8;

	return BROADLINK_DISCOVERY_SIZE;
}


int broadlinkAPI::BuildSetupMessage(unsigned char *cMessageBuffer, const std::string &szSSID, const std::string &szPassword, const Broadlink::WifiSecurity::value securityMode)
{
	// ssid field runs up to the password field, password field up to the length bytes
	if ((szSSID.length() > (BROADLINK_OFFSET_SETUP_PASSWORD - BROADLINK_OFFSET_SETUP_SSID)) ||
	    (szPassword.length() > (BROADLINK_OFFSET_SETUP_SSID_LEN - BROADLINK_OFFSET_SETUP_PASSWORD)))
		return -1;

	memset(cMessageBuffer, 0, BROADLINK_SETUP_SIZE);
	cMessageBuffer[BROADLINK_OFFSET_COMMAND] = BROADLINK_CATEGORY_SETUP;
	memcpy(&cMessageBuffer[BROADLINK_OFFSET_SETUP_SSID], szSSID.data(), szSSID.length());
	memcpy(&cMessageBuffer[BROADLINK_OFFSET_SETUP_PASSWORD], szPassword.data(), szPassword.length());
	cMessageBuffer[BROADLINK_OFFSET_SETUP_SSID_LEN] = (uint8_t)szSSID.length();
	cMessageBuffer[BROADLINK_OFFSET_SETUP_PASSWORD_LEN] = (uint8_t)szPassword.length();
	cMessageBuffer[BROADLINK_OFFSET_SETUP_SECURITY] = (uint8_t)securityMode;

	uint16_t messageChecksum = checksum(cMessageBuffer, BROADLINK_SETUP_SIZE);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM] = (messageChecksum & 0x00FF);
	cMessageBuffer[BROADLINK_OFFSET_CHECKSUM + 1] = (messageChecksum & 0xFF00) >> 8;

	return BROADLINK_SETUP_SIZE;
}


std::string broadlinkAPI::GetTemplateKey()
{
	return std::string((const char*)Broadlink::KEY_TEMPLATE, BROADLINK_KEY_SIZE);
}


std::string broadlinkAPI::GetTemplateIV()
{
	return std::string((const char*)Broadlink::IV_TEMPLATE, BROADLINK_BLOCK_SIZE);
}


std::string broadlinkAPI::MacToString(const std::string &szMac)
{
	std::string result;
	char cOctet[4];
	for (size_t i = 0; i < szMac.length(); i++)
	{
		snprintf(cOctet, sizeof(cOctet), (i == 0) ? "%.2x" : ":%.2x", (uint8_t)szMac[i]);
		result.append(cOctet);
	}
	return result;
}


bool broadlinkAPI::StringToMac(const std::string &szText, std::string &szMac)
{
	std::string szDigits;
	for (size_t i = 0; i < szText.length(); i++)
	{
		if ((szText[i] == ':') || (szText[i] == '-'))
			continue;
		szDigits.push_back(szText[i]);
	}
	std::string szResult;
	if (!FromHex(szDigits, szResult) || (szResult.length() != BROADLINK_MAC_SIZE))
		return false;
	szMac = szResult;
	return true;
}


std::string broadlinkAPI::ToHex(const std::string &szBuffer)
{
	static const char cHexDigits[] = "0123456789abcdef";
	std::string result;
	result.reserve(szBuffer.length() * 2);
	for (size_t i = 0; i < szBuffer.length(); i++)
	{
		result.push_back(cHexDigits[((uint8_t)szBuffer[i]) >> 4]);
		result.push_back(cHexDigits[((uint8_t)szBuffer[i]) & 0x0F]);
	}
	return result;
}


bool broadlinkAPI::FromHex(const std::string &szText, std::string &szBuffer)
{
	if (szText.length() & 0x1)
		return false;

	std::string result;
	for (size_t i = 0; i < szText.length(); i += 2)
	{
		uint8_t octet = 0;
		for (size_t j = i; j < i + 2; j++)
		{
			char c = szText[j];
			octet <<= 4;
			if ((c >= '0') && (c <= '9'))
				octet |= (c - '0');
			else if ((c >= 'a') && (c <= 'f'))
				octet |= (c - 'a' + 10);
			else if ((c >= 'A') && (c <= 'F'))
				octet |= (c - 'A' + 10);
			else
				return false;
		}
		result.push_back((char)octet);
	}
	szBuffer = result;
	return true;
}
