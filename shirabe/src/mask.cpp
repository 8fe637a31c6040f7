#include "mask.h"
#include <QtGlobal>

Mask::Mask(int byteCount) : mask(0), bytes(qBound(1, byteCount, 8))
{
}

Mask::Mask(uint64_t value, int byteCount) : mask(0), bytes(qBound(1, byteCount, 8))
{
	mask = value & widthMask();
}

uint64_t Mask::widthMask() const
{
	if (bytes >= 8)
	{
		return ~0ULL;
	}
	return (1ULL << (bytes * 8)) - 1;
}

Mask Mask::fromString(const QString& hexString, bool* ok)
{
	QString hex = hexString.trimmed();
	if (hex.isEmpty() || hex.size() > 16)
	{
		if (ok)
			*ok = false;
		return Mask();
	}

	bool parsed = false;
	uint64_t value = hex.toULongLong(&parsed, 16);
	if (ok)
		*ok = parsed;
	if (!parsed)
	{
		return Mask();
	}
	return Mask(value, (hex.size() + 1) / 2);
}

QString Mask::toString() const
{
	return QString("%1").arg(static_cast<qulonglong>(mask), bytes * 2, 16, QChar('0')).toUpper();
}

void Mask::setBit(uint64_t bit, bool on)
{
	if (on)
		mask |= bit;
	else
		mask &= ~bit;
	mask &= widthMask();
}

Mask Mask::defaultFileMask()
{
	// fid is always returned; everything but filetype and filename
	return Mask(0x7FF8FEF8, 4);
}

Mask Mask::defaultAnimeMask()
{
	return Mask(0xF2F0E0FC, 4);
}

Mask Mask::operator|(const Mask& other) const
{
	return Mask(mask | other.mask, qMax(bytes, other.bytes));
}

Mask Mask::operator&(const Mask& other) const
{
	return Mask(mask & other.mask, qMax(bytes, other.bytes));
}

Mask& Mask::operator|=(const Mask& other)
{
	bytes = qMax(bytes, other.bytes);
	mask |= other.mask;
	return *this;
}

bool Mask::operator==(const Mask& other) const
{
	return mask == other.mask;
}
