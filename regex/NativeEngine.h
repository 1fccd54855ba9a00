#ifndef NATIVE_ENGINE_H_
#define NATIVE_ENGINE_H_

#include "Engine.h"
#include <memory>

namespace re2 {
class RE2;
}

// Engine over RE2: no look-around or back-references, linear time.
class NativeEngine : public Engine {
public:
	NativeEngine(const std::string &pattern, const CompileOptions &options);
	~NativeEngine() override;

private:
	NativeEngine(const NativeEngine &) = delete;
	NativeEngine& operator=(const NativeEngine &) = delete;

public:
	EngineKind kind() const override {
		return EngineKind::Native;
	}

	size_t captureCount() const override {
		return captureCount_;
	}

	std::vector<std::string> captureNames() const override {
		return captureNames_;
	}

	std::string literalPrefix(bool *complete) const override;
	bool findAt(const char *subject, size_t length, size_t startOffset, MatchResult *result) const override;
	void release() override;
	bool isReleased() const override;

private:
	std::unique_ptr<re2::RE2> re_;
	size_t                    captureCount_;
	std::vector<std::string>  captureNames_;
	std::string               prefix_;
	bool                      prefixComplete_;
};

#endif
