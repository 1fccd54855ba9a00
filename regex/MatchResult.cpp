#include "MatchResult.h"

//------------------------------------------------------------------------------
// Name: reset
//------------------------------------------------------------------------------
void MatchResult::reset(size_t slots) {
	captures_.assign(slots, Capture());
}

//------------------------------------------------------------------------------
// Name: shift
//------------------------------------------------------------------------------
void MatchResult::shift(ptrdiff_t delta) {
	for (Capture &cap : captures_) {
		if (cap.matched()) {
			cap.start += delta;
			cap.end   += delta;
		}
	}
}

//------------------------------------------------------------------------------
// Name: offsets
//------------------------------------------------------------------------------
MatchOffsets MatchResult::offsets() const {
	MatchOffsets result;
	result.reserve(captures_.size() * 2);

	for (const Capture &cap : captures_) {
		if (cap.matched()) {
			result.push_back(cap.start);
			result.push_back(cap.end);
		} else {
			result.push_back(-1);
			result.push_back(-1);
		}
	}

	return result;
}

//------------------------------------------------------------------------------
// Name: group
// Desc: text of slot 'index', empty when the group did not participate
//------------------------------------------------------------------------------
std::string MatchResult::group(const char *subject, size_t index) const {
	if (index >= captures_.size() || !captures_[index].matched()) {
		return std::string();
	}

	const Capture &cap = captures_[index];
	return std::string(subject + cap.start, static_cast<size_t>(cap.end - cap.start));
}

//------------------------------------------------------------------------------
// Name: groups
//------------------------------------------------------------------------------
std::vector<std::string> MatchResult::groups(const char *subject) const {
	std::vector<std::string> result;
	result.reserve(captures_.size());

	for (size_t i = 0; i < captures_.size(); ++i) {
		result.push_back(group(subject, i));
	}

	return result;
}
