#ifndef UTF8_H_
#define UTF8_H_

#include <cstddef>

/* Length in bytes of the UTF-8 encoded code point at 'p', looking at no more
   than 'available' bytes.  Returns 0 for a truncated, overlong or otherwise
   invalid sequence, and for surrogates and values above U+10FFFF. */
size_t utf8Length(const char *p, size_t available);

#endif
