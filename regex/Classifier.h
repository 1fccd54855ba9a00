#ifndef CLASSIFIER_H_
#define CLASSIFIER_H_

#include "Types.h"
#include <string>

/* Decides from the pattern text alone which engine a pattern needs.  This is
   a syntactic scan, not a parse: anything that looks like look-around or a
   back-reference outside of an escape routes to the backtracking engine. */
class Classifier {
public:
	static EngineKind classify(const std::string &pattern);

	// Resolves an explicit choice, EngineChoice::Auto runs classify().
	static EngineKind choose(const std::string &pattern, EngineChoice choice);

public:
	static bool hasLookaround(const std::string &pattern);
	static bool hasNumericBackReference(const std::string &pattern);
	static bool hasNamedBackReference(const std::string &pattern);

private:
	static bool containsUnescaped(const std::string &pattern, const char *marker);
	static int countCapturingGroups(const std::string &pattern);
};

#endif
