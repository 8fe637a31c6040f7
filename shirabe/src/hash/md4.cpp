/* md4.cpp - MD4 message digest
 */

/* Derived from the RSA Data Security, Inc. MD4 Message-Digest Algorithm.

   License to copy and use this software is granted provided that it
   is identified as the "RSA Data Security, Inc. MD4 Message-Digest
   Algorithm" in all material mentioning or referencing this software
   or this function.

   License is also granted to make and use derivative works provided
   that such works are identified as "derived from the RSA Data
   Security, Inc. MD4 Message-Digest Algorithm" in all material
   mentioning or referencing the derived work.

   RSA Data Security, Inc. makes no representations concerning either
   the merchantability of this software or the suitability of this
   software for any particular purpose. It is provided "as is"
   without express or implied warranty of any kind.

   These notices must be retained in any copies of any part of this
   documentation and/or software.
 */

#include "md4.h"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace
{

// F, G and H are the basic MD4 functions.
inline uint32_t F(uint32_t x, uint32_t y, uint32_t z)
{
	return (x & y) | (~x & z);
}

inline uint32_t G(uint32_t x, uint32_t y, uint32_t z)
{
	return (x & y) | (x & z) | (y & z);
}

inline uint32_t H(uint32_t x, uint32_t y, uint32_t z)
{
	return x ^ y ^ z;
}

inline uint32_t RotateLeft(uint32_t x, int n)
{
	return (x << n) | (x >> (32 - n));
}

// FF, GG and HH are the transformations for rounds 1, 2 and 3.
inline void FF(uint32_t &a, uint32_t b, uint32_t c, uint32_t d, uint32_t x, int s)
{
	a = RotateLeft(a + F(b, c, d) + x, s);
}

inline void GG(uint32_t &a, uint32_t b, uint32_t c, uint32_t d, uint32_t x, int s)
{
	a = RotateLeft(a + G(b, c, d) + x + 0x5a827999u, s);
}

inline void HH(uint32_t &a, uint32_t b, uint32_t c, uint32_t d, uint32_t x, int s)
{
	a = RotateLeft(a + H(b, c, d) + x + 0x6ed9eba1u, s);
}

const unsigned char PADDING[64] = { 0x80 };

}

MD4::MD4()
{
	Init();
}

void MD4::Init()
{
	// Magic initialization constants
	state[0] = 0x67452301u;
	state[1] = 0xefcdab89u;
	state[2] = 0x98badcfeu;
	state[3] = 0x10325476u;
	byteCount = 0;
	memset(buffer, 0, sizeof(buffer));
}

void MD4::Update(const unsigned char *input, size_t inputLen)
{
	size_t index = static_cast<size_t>(byteCount & 0x3F);
	size_t partLen = 64 - index;
	size_t i = 0;

	byteCount += inputLen;

	// Transform as many times as possible
	if(inputLen >= partLen)
	{
		memcpy(&buffer[index], input, partLen);
		Transform(buffer);

		for(i = partLen; i + 63 < inputLen; i += 64)
		{
			Transform(&input[i]);
		}
		index = 0;
	}

	// Buffer remaining input
	if(inputLen > i)
	{
		memcpy(&buffer[index], &input[i], inputLen - i);
	}
}

void MD4::Final(unsigned char digest[DigestLength])
{
	unsigned char bits[8];
	uint64_t bitCount = byteCount << 3;
	for(int i = 0; i < 8; i++)
	{
		bits[i] = static_cast<unsigned char>((bitCount >> (8 * i)) & 0xff);
	}

	// Pad out to 56 mod 64, then append the length before padding
	size_t index = static_cast<size_t>(byteCount & 0x3F);
	size_t padLen = (index < 56) ? (56 - index) : (120 - index);
	Update(PADDING, padLen);
	Update(bits, 8);

	for(int i = 0, j = 0; i < 4; i++, j += 4)
	{
		digest[j] = static_cast<unsigned char>(state[i] & 0xff);
		digest[j+1] = static_cast<unsigned char>((state[i] >> 8) & 0xff);
		digest[j+2] = static_cast<unsigned char>((state[i] >> 16) & 0xff);
		digest[j+3] = static_cast<unsigned char>((state[i] >> 24) & 0xff);
	}

	// Zeroize sensitive information and leave the context ready for reuse
	Init();
}

void MD4::Transform(const unsigned char block[64])
{
	uint32_t a = state[0], b = state[1], c = state[2], d = state[3], x[16];

	for(int i = 0, j = 0; i < 16; i++, j += 4)
	{
		x[i] = static_cast<uint32_t>(block[j]) |
			(static_cast<uint32_t>(block[j+1]) << 8) |
			(static_cast<uint32_t>(block[j+2]) << 16) |
			(static_cast<uint32_t>(block[j+3]) << 24);
	}

	// Round 1
	FF(a, b, c, d, x[ 0], 3);
	FF(d, a, b, c, x[ 1], 7);
	FF(c, d, a, b, x[ 2], 11);
	FF(b, c, d, a, x[ 3], 19);
	FF(a, b, c, d, x[ 4], 3);
	FF(d, a, b, c, x[ 5], 7);
	FF(c, d, a, b, x[ 6], 11);
	FF(b, c, d, a, x[ 7], 19);
	FF(a, b, c, d, x[ 8], 3);
	FF(d, a, b, c, x[ 9], 7);
	FF(c, d, a, b, x[10], 11);
	FF(b, c, d, a, x[11], 19);
	FF(a, b, c, d, x[12], 3);
	FF(d, a, b, c, x[13], 7);
	FF(c, d, a, b, x[14], 11);
	FF(b, c, d, a, x[15], 19);

	// Round 2
	GG(a, b, c, d, x[ 0], 3);
	GG(d, a, b, c, x[ 4], 5);
	GG(c, d, a, b, x[ 8], 9);
	GG(b, c, d, a, x[12], 13);
	GG(a, b, c, d, x[ 1], 3);
	GG(d, a, b, c, x[ 5], 5);
	GG(c, d, a, b, x[ 9], 9);
	GG(b, c, d, a, x[13], 13);
	GG(a, b, c, d, x[ 2], 3);
	GG(d, a, b, c, x[ 6], 5);
	GG(c, d, a, b, x[10], 9);
	GG(b, c, d, a, x[14], 13);
	GG(a, b, c, d, x[ 3], 3);
	GG(d, a, b, c, x[ 7], 5);
	GG(c, d, a, b, x[11], 9);
	GG(b, c, d, a, x[15], 13);

	// Round 3
	HH(a, b, c, d, x[ 0], 3);
	HH(d, a, b, c, x[ 8], 9);
	HH(c, d, a, b, x[ 4], 11);
	HH(b, c, d, a, x[12], 15);
	HH(a, b, c, d, x[ 2], 3);
	HH(d, a, b, c, x[10], 9);
	HH(c, d, a, b, x[ 6], 11);
	HH(b, c, d, a, x[14], 15);
	HH(a, b, c, d, x[ 1], 3);
	HH(d, a, b, c, x[ 9], 9);
	HH(c, d, a, b, x[ 5], 11);
	HH(b, c, d, a, x[13], 15);
	HH(a, b, c, d, x[ 3], 3);
	HH(d, a, b, c, x[11], 9);
	HH(c, d, a, b, x[ 7], 11);
	HH(b, c, d, a, x[15], 15);

	state[0] += a;
	state[1] += b;
	state[2] += c;
	state[3] += d;

	memset(x, 0, sizeof(x));
}

void MD4::Digest(const unsigned char *input, size_t inputLen, unsigned char digest[DigestLength])
{
	MD4 context;
	context.Update(input, inputLen);
	context.Final(digest);
}

std::string MD4::HexDigest(const unsigned char digest[DigestLength])
{
	std::stringstream ss;
	for(int i = 0; i < DigestLength; i++)
	{
		ss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(digest[i]);
	}
	return ss.str();
}
