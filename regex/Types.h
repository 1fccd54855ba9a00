#ifndef TYPES_H_
#define TYPES_H_

#include <cstdint>

// Which matcher a compiled pattern is routed to.
enum class EngineKind {
	Native,
	Backtracking
};

// Caller override for the pattern classifier.
enum class EngineChoice {
	Auto,
	Native,
	Backtracking
};

const char *engineName(EngineKind kind);

struct CompileOptions {
	EngineChoice  engine          = EngineChoice::Auto;
	bool          caseInsensitive = false;
	bool          longest         = false; // leftmost-longest, Native only
	uint32_t      matchLimit      = 10000000; // backtracking steps per query, Backtracking only
	uint32_t      depthLimit      = 10000000; // nested backtracking points per query, Backtracking only
};

#endif
