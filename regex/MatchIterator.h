#ifndef MATCH_ITERATOR_H_
#define MATCH_ITERATOR_H_

#include "MatchResult.h"
#include <functional>
#include <string>
#include <vector>

class Engine;

// What to put in place of each match in MatchIterator::replaceAll().
class Replacement {
public:
	typedef std::function<std::string(const std::string &)> Transform;

	enum class Kind {
		Literal,   // the bytes verbatim
		Expand,    // a template, $n is group n and $$ is a dollar
		Transform  // a function of the matched text
	};

public:
	static Replacement literal(const std::string &bytes);
	static Replacement expand(const std::string &templ);
	static Replacement transform(Transform fn);

public:
	Kind kind() const {
		return kind_;
	}

	const std::string &text() const {
		return text_;
	}

	const Transform &function() const {
		return function_;
	}

private:
	Replacement(Kind kind, const std::string &text, Transform fn);

private:
	Kind        kind_;
	std::string text_;
	Transform   function_;
};

/* Builds find, find-all, replace and split out of repeated Engine::findAt()
   queries.  Works the same on every engine. */
class MatchIterator {
public:
	typedef std::function<void(const MatchResult &)> Callback;

public:
	explicit MatchIterator(const Engine &engine);

public:
	bool test(const char *subject, size_t length) const;
	bool firstMatch(const char *subject, size_t length, MatchResult *result) const;

	/* Searches subject[from, length) as if it were the whole subject, offsets
	   in 'result' are relative to 'subject' again. */
	bool firstMatchInSuffix(const char *subject, size_t length, size_t from, MatchResult *result) const;

	// 'limit' < 0 means no limit.
	std::vector<MatchResult> allMatches(const char *subject, size_t length, int limit) const;
	void forEachMatch(const char *subject, size_t length, int limit, const Callback &callback) const;

	std::string replaceAll(const char *subject, size_t length, const Replacement &replacement) const;
	std::vector<std::string> split(const char *subject, size_t length, int limit) const;

public:
	/**
	 * @brief expandTemplate - Substitutes $n in 'templ' with group n of a match.
	 * @param offsets - flattened capture offsets of the match into 'subject'
	 * @return the expanded text, $$ becomes $ and missing groups become nothing
	 */
	static std::string expandTemplate(const std::string &templ, const char *subject, size_t length, const MatchOffsets &offsets);

private:
	bool advance(const char *subject, size_t length, const Capture &match, size_t *cursor) const;

private:
	const Engine &engine_;
};

#endif
