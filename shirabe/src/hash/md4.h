/* md4.h - MD4 message digest
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

#ifndef MD4_H
#define MD4_H

#include <cstddef>
#include <cstdint>
#include <string>

class MD4
{
public:
	static constexpr int DigestLength = 16;

	MD4();

	void Init();
	void Update(const unsigned char *input, size_t inputLen);
	void Final(unsigned char digest[DigestLength]);

	// Number of bytes fed since the last Init()
	uint64_t Length() const { return byteCount; }

	// One-shot digest of a buffer
	static void Digest(const unsigned char *input, size_t inputLen, unsigned char digest[DigestLength]);
	static std::string HexDigest(const unsigned char digest[DigestLength]);

private:
	uint32_t state[4];
	uint64_t byteCount;
	unsigned char buffer[64];

	void Transform(const unsigned char block[64]);
};

#endif // MD4_H
