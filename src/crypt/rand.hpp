/*
 *  Client interface for local Broadlink device access
 *
 *  Random bytes sequence generator
 *
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif



#ifdef USE_OPENSSL

#include <openssl/rand.h>

namespace Broadlink {
static bool random_bytes(unsigned char *buffer, int len)
{
	return (RAND_bytes(buffer, len) == 1);
}
}; // namespace Broadlink

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include <fstream> // must be included in global namespace

namespace Broadlink {
static bool random_bytes(unsigned char *buffer, int len)
{
	std::fstream fr;
	fr.open("/dev/urandom", std::ios::in | std::ios::binary);
	if (!fr.is_open())
		return false;
	fr.read((char*)buffer, len);
	bool success = fr.good();
	fr.close();
	return success;
}
}; // namespace Broadlink

#endif // USE_MBEDTLS
