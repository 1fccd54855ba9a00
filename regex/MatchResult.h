#ifndef MATCH_RESULT_H_
#define MATCH_RESULT_H_

#include <string>
#include <vector>
#include <cstddef>

// Flattened capture offsets: [s0, e0, s1, e1, ...], -1 for an unset group.
typedef std::vector<ptrdiff_t> MatchOffsets;

// Byte range of one capture slot, both ends -1 when the group did not take part.
struct Capture {
	ptrdiff_t start = -1;
	ptrdiff_t end   = -1;

	bool matched() const {
		return start >= 0 && end >= 0;
	}

	bool empty() const {
		return start == end;
	}
};

class MatchResult {
public:
	MatchResult() = default;
	explicit MatchResult(size_t slots) : captures_(slots) {
	}

public:
	void reset(size_t slots);

	size_t size() const {
		return captures_.size();
	}

	bool empty() const {
		return captures_.empty();
	}

	const Capture &operator[](size_t index) const {
		return captures_[index];
	}

	Capture &operator[](size_t index) {
		return captures_[index];
	}

	const Capture &whole() const {
		return captures_.front();
	}

public:
	/* Moves every defined slot by 'delta' bytes. Used to translate offsets
	   found in a suffix of the subject back to the subject itself. */
	void shift(ptrdiff_t delta);

	MatchOffsets offsets() const;
	std::string group(const char *subject, size_t index) const;
	std::vector<std::string> groups(const char *subject) const;

private:
	std::vector<Capture> captures_;
};

#endif
