/*
 *  Wifi provisioning example for local Broadlink client
 *
 *  Put the device in AP mode first (long press on reset) and connect this
 *  host to the device's access point before running.
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
#include <string.h>


void c_error(const char *msg)
{
	fprintf(stderr, "%s\n", msg);
	exit(1);
}


bool get_security_mode(const std::string &name, Broadlink::WifiSecurity::value &mode)
{
	if (name == "none")
		mode = Broadlink::WifiSecurity::NONE;
	else if (name == "wep")
		mode = Broadlink::WifiSecurity::WEP;
	else if (name == "wpa1")
		mode = Broadlink::WifiSecurity::WPA1;
	else if (name == "wpa2")
		mode = Broadlink::WifiSecurity::WPA2;
	else if (name == "wpa12")
		mode = Broadlink::WifiSecurity::WPA12;
	else
		return false;
	return true;
}


int main(int argc, char *argv[])
{
	if (argc < 4) {
	   fprintf(stderr,"usage %s ssid password none|wep|wpa1|wpa2|wpa12 [local_ipv4_address]\n", argv[0]);
	   exit(0);
	}

	Broadlink::WifiSecurity::value mode;
	if (!get_security_mode(std::string(argv[3]), mode))
		c_error("ERROR unknown security mode");

	std::string local_address;
	if (argc > 4)
		local_address = std::string(argv[4]);

	broadlinkDiscovery provisioner;
	if (!provisioner.Setup(std::string(argv[1]), std::string(argv[2]), mode, local_address))
	{
		switch (provisioner.getErrorState())
		{
			case Broadlink::Error::CONFIGURATION_ERROR:
				c_error("ERROR local address must be an IPv4 address");
				break;
			case Broadlink::Error::INVALID_ARGUMENT:
				c_error("ERROR ssid and password are limited to 32 characters");
				break;
			default:
				c_error("ERROR sending setup message");
		}
	}

	std::cout << "credentials sent\n";
	return 0;
}
