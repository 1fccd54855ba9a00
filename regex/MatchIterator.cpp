#include "MatchIterator.h"
#include "Engine.h"
#include "Utf8.h"
#include <utility>

//------------------------------------------------------------------------------
// Name: Replacement
//------------------------------------------------------------------------------
Replacement::Replacement(Kind kind, const std::string &text, Transform fn) : kind_(kind), text_(text), function_(std::move(fn)) {
}

//------------------------------------------------------------------------------
// Name: literal
//------------------------------------------------------------------------------
Replacement Replacement::literal(const std::string &bytes) {
	return Replacement(Kind::Literal, bytes, Transform());
}

//------------------------------------------------------------------------------
// Name: expand
//------------------------------------------------------------------------------
Replacement Replacement::expand(const std::string &templ) {
	return Replacement(Kind::Expand, templ, Transform());
}

//------------------------------------------------------------------------------
// Name: transform
//------------------------------------------------------------------------------
Replacement Replacement::transform(Transform fn) {
	return Replacement(Kind::Transform, std::string(), std::move(fn));
}

//------------------------------------------------------------------------------
// Name: MatchIterator
//------------------------------------------------------------------------------
MatchIterator::MatchIterator(const Engine &engine) : engine_(engine) {
}

//------------------------------------------------------------------------------
// Name: test
//------------------------------------------------------------------------------
bool MatchIterator::test(const char *subject, size_t length) const {
	MatchResult result;
	return engine_.findAt(subject, length, 0, &result);
}

//------------------------------------------------------------------------------
// Name: firstMatch
//------------------------------------------------------------------------------
bool MatchIterator::firstMatch(const char *subject, size_t length, MatchResult *result) const {
	return engine_.findAt(subject, length, 0, result);
}

//------------------------------------------------------------------------------
// Name: firstMatchInSuffix
//------------------------------------------------------------------------------
bool MatchIterator::firstMatchInSuffix(const char *subject, size_t length, size_t from, MatchResult *result) const {

	if (from > length) {
		return false;
	}

	if (!engine_.findAt(subject + from, length - from, 0, result)) {
		return false;
	}

	result->shift(static_cast<ptrdiff_t>(from));
	return true;
}

//------------------------------------------------------------------------------
// Name: advance
// Desc: moves the scan cursor past 'match', returns false when the scan is over
//------------------------------------------------------------------------------
bool MatchIterator::advance(const char *subject, size_t length, const Capture &match, size_t *cursor) const {

	const size_t end = static_cast<size_t>(match.end);

	if (!match.empty()) {
		*cursor = end;
		return true;
	}

	// An empty match steps over exactly one code point.
	if (end >= length) {
		return false;
	}

	const size_t n = utf8Length(subject + end, length - end);
	if (n == 0) {
		return false;
	}

	*cursor = end + n;
	return true;
}

//------------------------------------------------------------------------------
// Name: forEachMatch
//------------------------------------------------------------------------------
void MatchIterator::forEachMatch(const char *subject, size_t length, int limit, const Callback &callback) const {

	if (limit == 0) {
		return;
	}

	int count = 0;
	size_t cursor = 0;
	MatchResult result;

	while (cursor <= length) {
		if (!engine_.findAt(subject, length, cursor, &result)) {
			break;
		}

		callback(result);

		if (limit > 0 && ++count >= limit) {
			break;
		}

		if (!advance(subject, length, result.whole(), &cursor)) {
			break;
		}
	}
}

//------------------------------------------------------------------------------
// Name: allMatches
//------------------------------------------------------------------------------
std::vector<MatchResult> MatchIterator::allMatches(const char *subject, size_t length, int limit) const {
	std::vector<MatchResult> matches;

	forEachMatch(subject, length, limit, [&matches](const MatchResult &result) {
		matches.push_back(result);
	});

	return matches;
}

//------------------------------------------------------------------------------
// Name: replaceAll
//------------------------------------------------------------------------------
std::string MatchIterator::replaceAll(const char *subject, size_t length, const Replacement &replacement) const {

	std::string output;
	output.reserve(length);

	size_t last = 0;

	forEachMatch(subject, length, -1, [&](const MatchResult &result) {
		const size_t start = static_cast<size_t>(result.whole().start);
		const size_t end   = static_cast<size_t>(result.whole().end);

		output.append(subject + last, start - last);

		switch (replacement.kind()) {
		case Replacement::Kind::Literal:
			output.append(replacement.text());
			break;
		case Replacement::Kind::Expand:
			output.append(expandTemplate(replacement.text(), subject, length, result.offsets()));
			break;
		case Replacement::Kind::Transform:
			output.append(replacement.function()(std::string(subject + start, end - start)));
			break;
		}

		last = end;
	});

	output.append(subject + last, length - last);
	return output;
}

//------------------------------------------------------------------------------
// Name: split
// Desc: An empty separator at the start of the current piece or at the end of
//       the subject does not split.
//------------------------------------------------------------------------------
std::vector<std::string> MatchIterator::split(const char *subject, size_t length, int limit) const {

	std::vector<std::string> pieces;

	if (limit == 0) {
		return pieces;
	}

	size_t beg    = 0; // start of the piece being built
	size_t cursor = 0; // where the next separator search begins
	MatchResult result;

	while (limit < 0 || pieces.size() < static_cast<size_t>(limit - 1)) {
		if (!firstMatchInSuffix(subject, length, cursor, &result)) {
			break;
		}

		const size_t start = static_cast<size_t>(result.whole().start);
		const size_t end   = static_cast<size_t>(result.whole().end);

		if (start == end) {
			if (start >= length) {
				break;
			}

			const size_t n = utf8Length(subject + start, length - start);
			if (n == 0) {
				break;
			}

			if (start != beg) {
				pieces.emplace_back(subject + beg, start - beg);
				beg = start;
			}

			cursor = start + n;
		} else {
			pieces.emplace_back(subject + beg, start - beg);
			beg    = end;
			cursor = end;
		}
	}

	pieces.emplace_back(subject + beg, length - beg);
	return pieces;
}

//------------------------------------------------------------------------------
// Name: expandTemplate
//------------------------------------------------------------------------------
std::string MatchIterator::expandTemplate(const std::string &templ, const char *subject, size_t length, const MatchOffsets &offsets) {

	std::string output;
	output.reserve(templ.size());

	for (size_t i = 0; i < templ.size(); ++i) {
		const char c = templ[i];

		if (c == '$' && i + 1 < templ.size()) {
			const char next = templ[i + 1];

			if (next == '$') {
				output.push_back('$');
				++i;
				continue;
			}

			if (next >= '0' && next <= '9') {
				size_t group = 0;
				bool overflow = false;
				size_t j = i + 1;

				while (j < templ.size() && templ[j] >= '0' && templ[j] <= '9') {
					if (group > offsets.size()) {
						// past any group that can exist, keep consuming digits
						overflow = true;
					} else {
						group = group * 10 + static_cast<size_t>(templ[j] - '0');
					}
					++j;
				}

				if (!overflow && 2 * group + 1 < offsets.size()) {
					const ptrdiff_t start = offsets[2 * group];
					const ptrdiff_t end   = offsets[2 * group + 1];

					if (start >= 0 && end >= start && static_cast<size_t>(end) <= length) {
						output.append(subject + start, static_cast<size_t>(end - start));
					}
				}

				i = j - 1;
				continue;
			}
		}

		output.push_back(c);
	}

	return output;
}
