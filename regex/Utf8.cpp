#include "Utf8.h"

namespace {

bool isContinuation(unsigned char c) {
	return (c & 0xc0) == 0x80;
}

}

//------------------------------------------------------------------------------
// Name: utf8Length
//------------------------------------------------------------------------------
size_t utf8Length(const char *p, size_t available) {

	if (p == nullptr || available == 0) {
		return 0;
	}

	const unsigned char c0 = static_cast<unsigned char>(p[0]);

	if (c0 < 0x80) {
		return 1;
	}

	size_t length;
	unsigned char lo = 0x80; // allowed range of the second byte
	unsigned char hi = 0xbf;

	if (c0 < 0xc2) {
		// stray continuation byte or overlong 2 byte form
		return 0;
	} else if (c0 < 0xe0) {
		length = 2;
	} else if (c0 < 0xf0) {
		length = 3;
		if (c0 == 0xe0) {
			lo = 0xa0; // overlong
		} else if (c0 == 0xed) {
			hi = 0x9f; // surrogates
		}
	} else if (c0 < 0xf5) {
		length = 4;
		if (c0 == 0xf0) {
			lo = 0x90; // overlong
		} else if (c0 == 0xf4) {
			hi = 0x8f; // above U+10FFFF
		}
	} else {
		return 0;
	}

	if (available < length) {
		return 0;
	}

	const unsigned char c1 = static_cast<unsigned char>(p[1]);
	if (c1 < lo || c1 > hi) {
		return 0;
	}

	for (size_t i = 2; i < length; ++i) {
		if (!isContinuation(static_cast<unsigned char>(p[i]))) {
			return 0;
		}
	}

	return length;
}
