#include "CompileError.h"
#include <cstdarg>
#include <cstdio>

//------------------------------------------------------------------------------
// Name: CompileError
//------------------------------------------------------------------------------
CompileError::CompileError(EngineKind engine, int code, size_t offset, const char *format, ...) : engine_(engine), code_(code), offset_(offset) {
	va_list ap;
	va_start(ap, format);
	vsnprintf(error_, sizeof(error_), format, ap);
	va_end(ap);
}
