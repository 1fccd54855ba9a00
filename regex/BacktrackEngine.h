#ifndef BACKTRACK_ENGINE_H_
#define BACKTRACK_ENGINE_H_

#include "Engine.h"
#include <memory>

// Engine over PCRE2, with look-around and back-references.
class BacktrackEngine : public Engine {
public:
	BacktrackEngine(const std::string &pattern, const CompileOptions &options);
	~BacktrackEngine() override;

private:
	BacktrackEngine(const BacktrackEngine &) = delete;
	BacktrackEngine& operator=(const BacktrackEngine &) = delete;

public:
	EngineKind kind() const override {
		return EngineKind::Backtracking;
	}

	size_t captureCount() const override {
		return captureCount_;
	}

	std::vector<std::string> captureNames() const override {
		return captureNames_;
	}

	bool findAt(const char *subject, size_t length, size_t startOffset, MatchResult *result) const override;
	void release() override;
	bool isReleased() const override;

private:
	struct Program;

private:
	std::unique_ptr<Program> program_;
	size_t                   captureCount_;
	std::vector<std::string> captureNames_;
};

#endif
