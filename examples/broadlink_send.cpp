/*
 *  Raw command example for local Broadlink client
 *
 *  Authenticates with a device listed in the secrets file and sends it one
 *  command. The decrypted response body is printed as hex.
 *
 *  Example, ask an RM device for its temperature:
 *    broadlink_send livingroom 6a 01
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef SECRETSFILE
#define SECRETSFILE "broadlink-devices.json"
#endif

#include "broadlinkDevice.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <string.h>
#include <json/json.h>
#include <fstream>
#include <memory>


void c_error(const char *msg)
{
	fprintf(stderr, "%s\n", msg);
	exit(1);
}


bool get_device_by_name(const std::string name, std::string &address, int &port, std::string &mac, uint16_t &devtype)
{
	std::string szFileContent;
	std::ifstream myfile (SECRETSFILE);
	if ( myfile.is_open() )
	{
		std::string line;
		while ( getline (myfile,line) )
		{
			szFileContent.append(line);
			szFileContent.append("\n");
		}
		myfile.close();
	}

	Json::Value jDevices;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	if (!jReader->parse(szFileContent.c_str(), szFileContent.c_str() + szFileContent.size(), &jDevices, nullptr))
		return false;

	std::string lowername = name;
	for (int i=0;i<(int)lowername.length();i++)
	{
		if (lowername[i] & 0x40)
			lowername[i] = lowername[i] | 0x20;
	}

	if (jDevices["devices"].isArray())
	{
		for (int i=0;i<(int)jDevices["devices"].size();i++)
		{
			if (jDevices["devices"][i]["name"].asString() == lowername)
			{
				address = jDevices["devices"][i]["address"].asString();
				port = jDevices["devices"][i].get("port", BROADLINK_DEVICE_PORT).asInt();
				mac = jDevices["devices"][i]["mac"].asString();
				devtype = (uint16_t)strtoul(jDevices["devices"][i]["type"].asString().c_str(), nullptr, 16);
				return true;
			}
		}
	}
	return false;
}


int main(int argc, char *argv[])
{
	if (argc < 3) {
	   fprintf(stderr,"usage %s device_name command_hex [payload_hex]\n", argv[0]);
	   exit(0);
	}

	std::string device_address, device_mac;
	int device_port;
	uint16_t device_type;
	if (!get_device_by_name(std::string(argv[1]), device_address, device_port, device_mac, device_type))
		c_error("ERROR device unknown");

	std::string mac;
	if (!broadlinkAPI::StringToMac(device_mac, mac))
		c_error("ERROR invalid mac address in secrets file");

	struct sockaddr_in host;
	if (!broadlinkUDP::ResolveAddress(device_address, (uint16_t)device_port, host))
		c_error("ERROR invalid device address");

	std::string command;
	if (!broadlinkAPI::FromHex(std::string(argv[2]), command) || (command.length() != 1))
		c_error("ERROR command must be a single hex byte");

	std::string payload;
	if ((argc > 3) && !broadlinkAPI::FromHex(std::string(argv[3]), payload))
		c_error("ERROR payload must be hex");

	std::unique_ptr<broadlinkDevice> device(broadlinkDevice::create(device_type, host, mac));
	if (!device)
		c_error("ERROR creating device session");

	if (!device->Authenticate())
	{
		if (device->getErrorState() == Broadlink::Error::TIMEOUT)
			c_error("ERROR device did not answer authentication");
		c_error("ERROR authentication failed");
	}

#ifdef DEBUG
	std::cout << "dbg: device id " << broadlinkAPI::ToHex(device->getDeviceID()) << "\n";
#endif

	std::string response = device->SendPacket((uint8_t)command[0], payload);
	if (response.empty())
		c_error("ERROR no response from device");

	std::string body;
	if (!device->DecryptPayload(response, body))
		c_error("ERROR decrypting response");

	std::cout << broadlinkAPI::ToHex(body) << "\n";
	return 0;
}
