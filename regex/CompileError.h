#ifndef COMPILE_ERROR_H_
#define COMPILE_ERROR_H_

#include "Types.h"
#include <exception>
#include <cstddef>

/* Thrown when an engine rejects a pattern. 'offset' is the byte position in
   the pattern the engine complained about, 'code' is engine specific:
   a PCRE2 compile error number for the backtracking engine, RE2::ErrorCode
   for RE2. */
class CompileError : public std::exception {
public:
	CompileError(EngineKind engine, int code, size_t offset, const char *format, ...);

public:
	const char *what() const noexcept override {
		return error_;
	}

	EngineKind engine() const { return engine_; }
	int code() const          { return code_; }
	size_t offset() const     { return offset_; }

private:
	char       error_[512];
	EngineKind engine_;
	int        code_;
	size_t     offset_;
};

#endif
