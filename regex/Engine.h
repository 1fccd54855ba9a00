#ifndef ENGINE_H_
#define ENGINE_H_

#include "Types.h"
#include "MatchResult.h"
#include <memory>
#include <string>
#include <vector>

/* A compiled pattern as seen by the match iteration layer.  The only query
   is "where is the leftmost match starting at or after this offset", every
   other operation is built on top of it by MatchIterator. */
class Engine {
public:
	virtual ~Engine() = default;

public:
	/**
	 * @brief compile - Compiles 'pattern' with the engine named by 'kind'.
	 * @throws CompileError when the engine rejects the pattern
	 */
	static std::unique_ptr<Engine> compile(const std::string &pattern, EngineKind kind, const CompileOptions &options);

public:
	virtual EngineKind kind() const = 0;

	// Number of capturing groups, slot 0 not included.
	virtual size_t captureCount() const = 0;

	// captureCount() + 1 names, "" for slot 0 and unnamed groups.
	virtual std::vector<std::string> captureNames() const = 0;

	/**
	 * @brief findAt - Searches for the leftmost match beginning at or after 'startOffset'.
	 * @param subject - the text, bytes before 'startOffset' are context only
	 * @param length - number of bytes in 'subject'
	 * @param startOffset - first position a match may begin at
	 * @param result - receives captureCount() + 1 slots relative to 'subject'
	 * @return false when there is no match or the engine could not decide
	 */
	virtual bool findAt(const char *subject, size_t length, size_t startOffset, MatchResult *result) const = 0;

	/**
	 * @brief literalPrefix - Bytes every match has to begin with, "" when unknown.
	 * @param complete - set to true when the prefix is the entire pattern, may be NULL
	 */
	virtual std::string literalPrefix(bool *complete) const;

	// Frees the compiled program. Safe to call more than once.
	virtual void release() = 0;
	virtual bool isReleased() const = 0;
};

#endif
