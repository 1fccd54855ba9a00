#ifndef REGEXP_H_
#define REGEXP_H_

#include "Types.h"
#include "CompileError.h"
#include "MatchResult.h"
#include "MatchIterator.h"
#include <memory>
#include <string>
#include <vector>

class Engine;

typedef std::vector<ptrdiff_t> MatchSpan; // {start, end} of a match, empty when there is none

/* A compiled pattern.  The engine is picked once, at compile time, by the
   Classifier (or by CompileOptions::engine) and every query goes to it
   through a MatchIterator.  A Regexp may be queried from several threads at
   once; release() must not race with queries. */
class Regexp {
public:
	/**
	 * @brief compile - Classifies and compiles 'pattern'.
	 * @throws CompileError when the chosen engine rejects the pattern
	 */
	static std::unique_ptr<Regexp> compile(const std::string &pattern, const CompileOptions &options = CompileOptions());

	~Regexp();

private:
	Regexp(const std::string &pattern, EngineKind kind, std::unique_ptr<Engine> engine);
	Regexp(const Regexp &) = delete;
	Regexp& operator=(const Regexp &) = delete;

public:
	const std::string &pattern() const {
		return pattern_;
	}

	EngineKind engineKind() const {
		return kind_;
	}

	bool isBacktracking() const {
		return kind_ == EngineKind::Backtracking;
	}

	void release();
	bool isReleased() const;

public:
	size_t numSubexp() const;
	std::vector<std::string> subexpNames() const;
	int subexpIndex(const std::string &name) const;

	// Bytes every match starts with; 'complete' tells whether they are the whole pattern.
	std::string literalPrefix(bool *complete = nullptr) const;

public:
	bool test(const char *subject, size_t length) const;
	std::string find(const char *subject, size_t length) const;
	MatchSpan findIndex(const char *subject, size_t length) const;
	std::vector<std::string> findSubmatch(const char *subject, size_t length) const;
	MatchOffsets findSubmatchIndex(const char *subject, size_t length) const;
	bool firstMatch(const char *subject, size_t length, MatchResult *result) const;

	std::vector<MatchResult> allMatches(const char *subject, size_t length, int limit) const;
	std::vector<std::string> findAll(const char *subject, size_t length, int limit) const;
	std::vector<MatchSpan> findAllIndex(const char *subject, size_t length, int limit) const;
	std::vector<std::vector<std::string>> findAllSubmatch(const char *subject, size_t length, int limit) const;
	std::vector<MatchOffsets> findAllSubmatchIndex(const char *subject, size_t length, int limit) const;

	std::string replace(const char *subject, size_t length, const Replacement &replacement) const;
	std::string replaceAll(const char *subject, size_t length, const std::string &templ) const;
	std::string replaceAllLiteral(const char *subject, size_t length, const std::string &bytes) const;
	std::string replaceAllFunc(const char *subject, size_t length, const Replacement::Transform &fn) const;

	std::vector<std::string> split(const char *subject, size_t length, int limit) const;
	std::string expand(const std::string &templ, const char *subject, size_t length, const MatchOffsets &offsets) const;

public:
	bool test(const std::string &subject) const {
		return test(subject.data(), subject.size());
	}

	std::string find(const std::string &subject) const {
		return find(subject.data(), subject.size());
	}

	MatchSpan findIndex(const std::string &subject) const {
		return findIndex(subject.data(), subject.size());
	}

	std::vector<std::string> findSubmatch(const std::string &subject) const {
		return findSubmatch(subject.data(), subject.size());
	}

	MatchOffsets findSubmatchIndex(const std::string &subject) const {
		return findSubmatchIndex(subject.data(), subject.size());
	}

	bool firstMatch(const std::string &subject, MatchResult *result) const {
		return firstMatch(subject.data(), subject.size(), result);
	}

	std::vector<MatchResult> allMatches(const std::string &subject, int limit) const {
		return allMatches(subject.data(), subject.size(), limit);
	}

	std::vector<std::string> findAll(const std::string &subject, int limit) const {
		return findAll(subject.data(), subject.size(), limit);
	}

	std::vector<MatchSpan> findAllIndex(const std::string &subject, int limit) const {
		return findAllIndex(subject.data(), subject.size(), limit);
	}

	std::vector<std::vector<std::string>> findAllSubmatch(const std::string &subject, int limit) const {
		return findAllSubmatch(subject.data(), subject.size(), limit);
	}

	std::vector<MatchOffsets> findAllSubmatchIndex(const std::string &subject, int limit) const {
		return findAllSubmatchIndex(subject.data(), subject.size(), limit);
	}

	std::string replace(const std::string &subject, const Replacement &replacement) const {
		return replace(subject.data(), subject.size(), replacement);
	}

	std::string replaceAll(const std::string &subject, const std::string &templ) const {
		return replaceAll(subject.data(), subject.size(), templ);
	}

	std::string replaceAllLiteral(const std::string &subject, const std::string &bytes) const {
		return replaceAllLiteral(subject.data(), subject.size(), bytes);
	}

	std::string replaceAllFunc(const std::string &subject, const Replacement::Transform &fn) const {
		return replaceAllFunc(subject.data(), subject.size(), fn);
	}

	std::vector<std::string> split(const std::string &subject, int limit) const {
		return split(subject.data(), subject.size(), limit);
	}

	std::string expand(const std::string &templ, const std::string &subject, const MatchOffsets &offsets) const {
		return expand(templ, subject.data(), subject.size(), offsets);
	}

private:
	void warnIfReleased() const;

private:
	std::string             pattern_;
	EngineKind              kind_;
	std::unique_ptr<Engine> engine_;
	MatchIterator           iterator_;
};

#endif
