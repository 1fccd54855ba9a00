#include "Classifier.h"
#include <cstring>

namespace {

const char *const Lookaround_Markers[] = {
	"(?=",  // positive look-ahead
	"(?!",  // negative look-ahead
	"(?<=", // positive look-behind
	"(?<!"  // negative look-behind
};

const char *const Named_Reference_Markers[] = {
	"\\k<",
	"\\k'",
	"\\k{",
	"(?P="
};

}

//------------------------------------------------------------------------------
// Name: classify
//------------------------------------------------------------------------------
EngineKind Classifier::classify(const std::string &pattern) {

	if (hasLookaround(pattern)) {
		return EngineKind::Backtracking;
	}

	if (hasNumericBackReference(pattern)) {
		return EngineKind::Backtracking;
	}

	if (hasNamedBackReference(pattern)) {
		return EngineKind::Backtracking;
	}

	return EngineKind::Native;
}

//------------------------------------------------------------------------------
// Name: choose
//------------------------------------------------------------------------------
EngineKind Classifier::choose(const std::string &pattern, EngineChoice choice) {
	switch (choice) {
	case EngineChoice::Native:
		return EngineKind::Native;
	case EngineChoice::Backtracking:
		return EngineKind::Backtracking;
	case EngineChoice::Auto:
		break;
	}

	return classify(pattern);
}

//------------------------------------------------------------------------------
// Name: hasLookaround
//------------------------------------------------------------------------------
bool Classifier::hasLookaround(const std::string &pattern) {
	for (const char *marker : Lookaround_Markers) {
		if (containsUnescaped(pattern, marker)) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: hasNumericBackReference
// Desc: \1 to \9 only count when the pattern has a capturing group at all
//------------------------------------------------------------------------------
bool Classifier::hasNumericBackReference(const std::string &pattern) {

	if (countCapturingGroups(pattern) == 0) {
		return false;
	}

	bool escaped = false;

	for (size_t i = 0; i < pattern.size(); ++i) {
		if (pattern[i] == '\\') {
			if (!escaped && i + 1 < pattern.size()) {
				const char next = pattern[i + 1];
				if (next >= '1' && next <= '9') {
					return true;
				}
			}
			escaped = !escaped;
		} else {
			escaped = false;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: hasNamedBackReference
//------------------------------------------------------------------------------
bool Classifier::hasNamedBackReference(const std::string &pattern) {
	for (const char *marker : Named_Reference_Markers) {
		if (containsUnescaped(pattern, marker)) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: containsUnescaped
// Desc: substring search where a backslash hides the byte after it. A marker
//       that itself starts with a backslash must start on an unescaped one.
//------------------------------------------------------------------------------
bool Classifier::containsUnescaped(const std::string &pattern, const char *marker) {

	const size_t length = strlen(marker);
	if (length > pattern.size()) {
		return false;
	}

	bool escaped = false;

	for (size_t i = 0; i + length <= pattern.size(); ++i) {
		if (!escaped && pattern.compare(i, length, marker) == 0) {
			return true;
		}

		if (pattern[i] == '\\') {
			escaped = !escaped;
		} else {
			escaped = false;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: countCapturingGroups
// Desc: unescaped '(' not followed by "?:" or "?P"
//------------------------------------------------------------------------------
int Classifier::countCapturingGroups(const std::string &pattern) {

	int groups = 0;
	bool escaped = false;

	for (size_t i = 0; i < pattern.size(); ++i) {
		if (pattern[i] == '\\') {
			escaped = !escaped;
			continue;
		}

		if (!escaped && pattern[i] == '(') {
			if (i + 2 < pattern.size() && pattern[i + 1] == '?' && (pattern[i + 2] == ':' || pattern[i + 2] == 'P')) {
				continue;
			}
			groups++;
		}

		escaped = false;
	}

	return groups;
}
