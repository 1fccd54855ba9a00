#include "Engine.h"
#include "NativeEngine.h"
#include "BacktrackEngine.h"

//------------------------------------------------------------------------------
// Name: engineName
//------------------------------------------------------------------------------
const char *engineName(EngineKind kind) {
	switch (kind) {
	case EngineKind::Native:
		return "native";
	case EngineKind::Backtracking:
		return "backtracking";
	}

	return "unknown";
}

//------------------------------------------------------------------------------
// Name: compile
//------------------------------------------------------------------------------
std::unique_ptr<Engine> Engine::compile(const std::string &pattern, EngineKind kind, const CompileOptions &options) {
	switch (kind) {
	case EngineKind::Backtracking:
		return std::unique_ptr<Engine>(new BacktrackEngine(pattern, options));
	case EngineKind::Native:
	default:
		return std::unique_ptr<Engine>(new NativeEngine(pattern, options));
	}
}

//------------------------------------------------------------------------------
// Name: literalPrefix
//------------------------------------------------------------------------------
std::string Engine::literalPrefix(bool *complete) const {
	if (complete) {
		*complete = false;
	}

	return std::string();
}
