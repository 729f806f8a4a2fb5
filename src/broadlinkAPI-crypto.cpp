/*
 *  Crypto abstraction layer implementation using OpenSSL
 *
 *  Copyright 2026 - broadlinkpp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "broadlinkAPI.hpp"
#include "crypt/aes_128_cbc.hpp"
#include <vector>


bool broadlinkAPI::Encrypt(const std::string &szKey, const std::string &szIV, const std::string &szPlainText, std::string &szCipherText)
{
	if ((szKey.length() != BROADLINK_KEY_SIZE) || (szIV.length() != BROADLINK_BLOCK_SIZE))
		return false;
	if (szPlainText.length() % BROADLINK_BLOCK_SIZE)
		return false;

	szCipherText.clear();
	if (szPlainText.empty())
		return true;

	std::vector<unsigned char> cOutputBuffer(szPlainText.length() + BROADLINK_BLOCK_SIZE);
	int outputSize = 0;
	if (!Broadlink::aes_128_cbc_encrypt((const unsigned char*)szKey.data(), (const unsigned char*)szIV.data(),
	                                    (const unsigned char*)szPlainText.data(), (int)szPlainText.length(), cOutputBuffer.data(), &outputSize))
		return false;

	szCipherText.assign((char*)cOutputBuffer.data(), outputSize);
	return true;
}


bool broadlinkAPI::Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, std::string &szPlainText)
{
	return Decrypt(szKey, szIV, szCipherText, 0, szCipherText.length(), szPlainText);
}


bool broadlinkAPI::Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, const size_t offset, std::string &szPlainText)
{
	if (offset > szCipherText.length())
		return false;
	return Decrypt(szKey, szIV, szCipherText, offset, szCipherText.length() - offset, szPlainText);
}


bool broadlinkAPI::Decrypt(const std::string &szKey, const std::string &szIV, const std::string &szCipherText, const size_t offset, const size_t count, std::string &szPlainText)
{
	if ((szKey.length() != BROADLINK_KEY_SIZE) || (szIV.length() != BROADLINK_BLOCK_SIZE))
		return false;
	if ((offset > szCipherText.length()) || (count > szCipherText.length() - offset))
		return false;
	if (count % BROADLINK_BLOCK_SIZE)
		return false;

	szPlainText.clear();
	if (count == 0)
		return true;

	std::vector<unsigned char> cOutputBuffer(count + BROADLINK_BLOCK_SIZE);
	int outputSize = 0;
	if (!Broadlink::aes_128_cbc_decrypt((const unsigned char*)szKey.data(), (const unsigned char*)szIV.data(),
	                                    (const unsigned char*)szCipherText.data() + offset, (int)count, cOutputBuffer.data(), &outputSize))
		return false;

	szPlainText.assign((char*)cOutputBuffer.data(), outputSize);
	return true;
}
