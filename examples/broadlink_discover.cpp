/*
 *  Discovery example for local Broadlink client
 *
 *  Lists the devices that answer a discovery broadcast. With `-j` the list
 *  is printed in the format of the secrets file used by the other examples.
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkDiscovery.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <string.h>
#include <arpa/inet.h>
#include <json/json.h>


void c_error(const char *msg)
{
	fprintf(stderr, "%s\n", msg);
	exit(1);
}


int main(int argc, char *argv[])
{
	bool jsonOutput = false;
	int timeout = 0;
	std::string local_address;

	int argpos = 1;
	if ((argc > argpos) && (strcmp(argv[argpos], "-j") == 0))
	{
		jsonOutput = true;
		argpos++;
	}
	if ((argc > argpos) && (strcmp(argv[argpos], "-h") == 0))
	{
		fprintf(stderr, "usage %s [-j] [timeout_seconds] [local_ipv4_address]\n", argv[0]);
		exit(0);
	}
	if (argc > argpos)
		timeout = atoi(argv[argpos++]);
	if (argc > argpos)
		local_address = std::string(argv[argpos++]);

	broadlinkDiscovery scanner;
	std::vector<std::unique_ptr<broadlinkDevice> > devices;
	if (!scanner.Discover(devices, timeout, local_address))
	{
		if (scanner.getErrorState() == Broadlink::Error::CONFIGURATION_ERROR)
			c_error("ERROR local address must be an IPv4 address");
		c_error("ERROR opening discovery socket");
	}

#ifdef DEBUG
	std::cout << "dbg: dropped replies: " << scanner.getDroppedCount() << "\n";
#endif

	Json::Value jDevices;
	jDevices["devices"] = Json::Value(Json::arrayValue);
	for (size_t i = 0; i < devices.size(); i++)
	{
		struct sockaddr_in host = devices[i]->getHost();
		char cAddress[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &host.sin_addr, cAddress, sizeof(cAddress));

		std::stringstream ssType;
		ssType << "0x" << std::hex << std::setw(4) << std::setfill('0') << devices[i]->getDevType();

		if (jsonOutput)
		{
			Json::Value jDevice;
			jDevice["name"] = devices[i]->getDeviceTypeName() + "-" + std::to_string(i + 1);
			jDevice["address"] = cAddress;
			jDevice["mac"] = broadlinkAPI::MacToString(devices[i]->getMac());
			jDevice["type"] = ssType.str();
			jDevices["devices"].append(jDevice);
		}
		else
			std::cout << cAddress << "\t" << broadlinkAPI::MacToString(devices[i]->getMac()) << "\t" << ssType.str() << "\t" << devices[i]->getDeviceTypeName() << "\n";
	}

	if (jsonOutput)
	{
		Json::StreamWriterBuilder jBuilder;
		jBuilder["indentation"] = "  ";
		std::cout << Json::writeString(jBuilder, jDevices) << "\n";
	}
	else if (devices.empty())
		std::cout << "no devices found\n";

	return 0;
}
