#ifndef MASK_H
#define MASK_H

#include <QString>
#include <cstdint>

/**
 * @brief Field-selection bitmask for the FILE command
 *
 * FILE takes two masks (fmask, amask), each sent as a fixed-width upper-case
 * hex string, most significant byte first. Bit values are the ones listed in
 * FileMask / AnimeMask below.
 */
class Mask
{
public:
	// FILE fmask (file data fields)
	enum FileMask : uint32_t
	{
		fAID =				0x40000000,
		fEID =				0x20000000,
		fGID =				0x10000000,
		fLID =				0x08000000,
		fOTHEREPS =			0x04000000,
		fISDEPR =			0x02000000,
		fSTATE =			0x01000000,
		fSIZE =				0x00800000,
		fED2K =				0x00400000,
		fMD5 =				0x00200000,
		fSHA1 =				0x00100000,
		fCRC32 =			0x00080000,
		fQUALITY =			0x00008000,
		fSOURCE =			0x00004000,
		fCODEC_AUDIO =		0x00002000,
		fBITRATE_AUDIO =	0x00001000,
		fCODEC_VIDEO =		0x00000800,
		fBITRATE_VIDEO =	0x00000400,
		fRESOLUTION =		0x00000200,
		fFILETYPE =			0x00000100,
		fLANG_DUB =			0x00000080,
		fLANG_SUB =			0x00000040,
		fLENGTH =			0x00000020,
		fDESCRIPTION =		0x00000010,
		fAIRDATE =			0x00000008,
		fFILENAME =			0x00000001
	};

	// FILE amask (anime, episode and group fields returned with a file)
	enum AnimeMask : uint32_t
	{
		aEPISODE_TOTAL =			0x80000000,
		aEPISODE_LAST =				0x40000000,
		aANIME_YEAR =				0x20000000,
		aANIME_TYPE =				0x10000000,
		aANIME_RELATED_LIST =		0x08000000,
		aANIME_RELATED_TYPE =		0x04000000,
		aANIME_CATEGORY =			0x02000000,
		aANIME_NAME_ROMAJI =		0x00800000,
		aANIME_NAME_KANJI =			0x00400000,
		aANIME_NAME_ENGLISH =		0x00200000,
		aANIME_NAME_OTHER =			0x00100000,
		aANIME_NAME_SHORT =			0x00080000,
		aANIME_SYNONYMS =			0x00040000,
		aEPISODE_NUMBER =			0x00008000,
		aEPISODE_NAME =				0x00004000,
		aEPISODE_NAME_ROMAJI =		0x00002000,
		aEPISODE_NAME_KANJI =		0x00001000,
		aEPISODE_RATING =			0x00000800,
		aEPISODE_VOTE_COUNT =		0x00000400,
		aGROUP_NAME =				0x00000080,
		aGROUP_NAME_SHORT =			0x00000040,
		aDATE_AID_RECORD_UPDATED =	0x00000001
	};

	/**
	 * @brief Construct empty Mask (all bits 0)
	 * @param byteCount Width of the hex rendering in bytes (1-8)
	 */
	explicit Mask(int byteCount = 4);

	/**
	 * @brief Construct Mask from a 64-bit value, truncated to byteCount bytes
	 */
	Mask(uint64_t value, int byteCount);

	/**
	 * @brief Parse a hex string such as "7FF8FEF8"
	 *
	 * The width is taken from the string (rounded up to whole bytes).
	 * @param ok Set to false if the string is empty, too long or not hex
	 */
	static Mask fromString(const QString& hexString, bool* ok = nullptr);

	/**
	 * @brief Fixed-width upper-case hex, most significant byte first
	 */
	QString toString() const;

	uint64_t getValue() const { return mask; }
	int byteCount() const { return bytes; }
	bool isEmpty() const { return mask == 0; }
	bool testBit(uint64_t bit) const { return (mask & bit) == bit && bit != 0; }

	void setBit(uint64_t bit, bool on = true);

	// Masks requested by default for FILE lookups
	static Mask defaultFileMask();
	static Mask defaultAnimeMask();

	Mask operator|(const Mask& other) const;
	Mask operator&(const Mask& other) const;
	Mask& operator|=(const Mask& other);
	bool operator==(const Mask& other) const;
	bool operator!=(const Mask& other) const { return !(*this == other); }

private:
	uint64_t widthMask() const;

	uint64_t mask;
	int bytes;
};

#endif // MASK_H
