/*
 *  Client interface for local Broadlink device access
 *
 *  AES-128 CBC encrypt/decrypt module
 *
 *  Both directions operate on whole 16 byte blocks without a padding scheme,
 *  message padding is the caller's responsibility.
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

#include <openssl/evp.h>

namespace Broadlink {

static bool aes_128_cbc_encrypt(const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_EncryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr, cEncryptionKey, cIV) == 1)
	{
		EVP_CIPHER_CTX_set_padding(ctx, 0);
		if (EVP_EncryptUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_EncryptFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

static bool aes_128_cbc_decrypt(const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_DecryptInit_ex(ctx, EVP_aes_128_cbc(), nullptr, cEncryptionKey, cIV) == 1)
	{
		EVP_CIPHER_CTX_set_padding(ctx, 0);  // protocol pads with zeros, not PKCS#7
		if (EVP_DecryptUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_DecryptFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

}; // namespace Broadlink

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include <cstring>
#include "mbedtls/aes.h"

namespace Broadlink {

static bool aes_128_cbc_encrypt(const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	*outputSize = 0;
	if (inputSize % 16)
		return false;

	// mbedtls advances the IV in place
	unsigned char iv[16];
	memcpy(iv, cIV, 16);

	mbedtls_aes_context aes;
	mbedtls_aes_init(&aes);
	mbedtls_aes_setkey_enc(&aes, cEncryptionKey, 128);
	int ret = mbedtls_aes_crypt_cbc(&aes, MBEDTLS_AES_ENCRYPT, inputSize, iv, cInputBuffer, cOutputBuffer);
	mbedtls_aes_free(&aes);
	if (ret != 0)
		return false;

	*outputSize = inputSize;
	return true;
}


static bool aes_128_cbc_decrypt(const unsigned char *cEncryptionKey, const unsigned char *cIV, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	*outputSize = 0;
	if (inputSize % 16)
		return false;

	unsigned char iv[16];
	memcpy(iv, cIV, 16);

	mbedtls_aes_context aes;
	mbedtls_aes_init(&aes);
	mbedtls_aes_setkey_dec(&aes, cEncryptionKey, 128);
	int ret = mbedtls_aes_crypt_cbc(&aes, MBEDTLS_AES_DECRYPT, inputSize, iv, cInputBuffer, cOutputBuffer);
	mbedtls_aes_free(&aes);
	if (ret != 0)
		return false;

	*outputSize = inputSize;
	return true;
}

}; // namespace Broadlink

#endif // USE_MBEDTLS
