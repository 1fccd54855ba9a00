#include "NativeEngine.h"
#include "CompileError.h"
#include <re2/re2.h>
#include <QtDebug>
#include <cctype>
#include <cstring>

namespace {

bool isMeta(char ch) {
	return ch != '\0' && std::strchr(".[]()|*+?{}^$", ch) != nullptr;
}

bool isQuantifier(char ch) {
	return ch != '\0' && std::strchr("*+?{", ch) != nullptr;
}

/*--------------------------------------------------------------------
**  true when 'pattern' has a '|' outside of every group and class,
**  the pattern is then a choice and has no common prefix.
**--------------------------------------------------------------------*/
bool hasTopLevelAlternation(const std::string &pattern) {

	int depth    = 0;
	bool inClass = false;

	for (size_t i = 0; i < pattern.size(); ++i) {
		const char ch = pattern[i];

		if (ch == '\\') {
			++i;
		} else if (inClass) {
			if (ch == ']') {
				inClass = false;
			}
		} else if (ch == '[') {
			inClass = true;
			// a leading ']' (or "^]") is a member, not the end
			if (i + 1 < pattern.size() && pattern[i + 1] == '^') {
				++i;
			}
			if (i + 1 < pattern.size() && pattern[i + 1] == ']') {
				++i;
			}
		} else if (ch == '(') {
			++depth;
		} else if (ch == ')') {
			--depth;
		} else if (ch == '|' && depth == 0) {
			return true;
		}
	}

	return false;
}

/*--------------------------------------------------------------------
**  Leading run of literal bytes of 'pattern'. Stops at the first
**  meta character, and before a literal that a quantifier applies
**  to. Returns true when the run covers the whole pattern.
**--------------------------------------------------------------------*/
bool scanLiteralPrefix(const std::string &pattern, std::string *prefix) {

	prefix->clear();

	if (hasTopLevelAlternation(pattern)) {
		return false;
	}

	size_t i = 0;
	while (i < pattern.size()) {
		char literal;
		size_t next;

		if (pattern[i] == '\\') {
			if (i + 1 >= pattern.size() || !std::ispunct(static_cast<unsigned char>(pattern[i + 1]))) {
				break;
			}
			literal = pattern[i + 1];
			next    = i + 2;
		} else if (isMeta(pattern[i])) {
			break;
		} else {
			literal = pattern[i];
			next    = i + 1;
		}

		if (next < pattern.size() && isQuantifier(pattern[next])) {
			break;
		}

		prefix->push_back(literal);
		i = next;
	}

	return i == pattern.size();
}

}

//------------------------------------------------------------------------------
// Name: NativeEngine
//------------------------------------------------------------------------------
NativeEngine::NativeEngine(const std::string &pattern, const CompileOptions &options) : captureCount_(0), prefixComplete_(false) {

	RE2::Options re2Options;
	re2Options.set_log_errors(false);
	re2Options.set_case_sensitive(!options.caseInsensitive);
	re2Options.set_longest_match(options.longest);

	re_.reset(new RE2(re2::StringPiece(pattern.data(), pattern.size()), re2Options));

	if (!re_->ok()) {
		// RE2 only reports the offending fragment, find it in the pattern.
		size_t offset = 0;
		if (!re_->error_arg().empty()) {
			const size_t pos = pattern.find(re_->error_arg());
			if (pos != std::string::npos) {
				offset = pos;
			}
		}

		const int code = re_->error_code();
		const std::string message = re_->error();
		re_.reset();

		qDebug("RE2 rejected \"%s\": %s", pattern.c_str(), message.c_str());
		throw CompileError(EngineKind::Native, code, offset, "%s", message.c_str());
	}

	// case folded patterns match more than their literal bytes
	if (!options.caseInsensitive) {
		prefixComplete_ = scanLiteralPrefix(pattern, &prefix_);
	}

	captureCount_ = static_cast<size_t>(re_->NumberOfCapturingGroups());
	captureNames_.assign(captureCount_ + 1, std::string());

	for (const auto &entry : re_->CapturingGroupNames()) {
		const size_t index = static_cast<size_t>(entry.first);
		if (index < captureNames_.size()) {
			captureNames_[index] = entry.second;
		}
	}
}

//------------------------------------------------------------------------------
// Name: ~NativeEngine
//------------------------------------------------------------------------------
NativeEngine::~NativeEngine() = default;

//------------------------------------------------------------------------------
// Name: literalPrefix
//------------------------------------------------------------------------------
std::string NativeEngine::literalPrefix(bool *complete) const {
	if (complete) {
		*complete = prefixComplete_;
	}

	return prefix_;
}

//------------------------------------------------------------------------------
// Name: findAt
//------------------------------------------------------------------------------
bool NativeEngine::findAt(const char *subject, size_t length, size_t startOffset, MatchResult *result) const {

	if (!re_) {
		qDebug("query on a released native pattern");
		return false;
	}

	if (!result || (!subject && length != 0)) {
		qDebug("NULL parameter to 'findAt'");
		return false;
	}

	if (startOffset > length) {
		return false;
	}

	// an empty view may come without storage
	if (!subject) {
		subject = "";
	}

	const int slots = static_cast<int>(captureCount_) + 1;
	std::vector<re2::StringPiece> groups(static_cast<size_t>(slots));

	if (!re_->Match(re2::StringPiece(subject, length), startOffset, length, RE2::UNANCHORED, groups.data(), slots)) {
		return false;
	}

	result->reset(static_cast<size_t>(slots));

	for (size_t i = 0; i < groups.size(); ++i) {
		// Groups that did not participate have a null data pointer.
		if (groups[i].data() != nullptr) {
			(*result)[i].start = groups[i].data() - subject;
			(*result)[i].end   = (*result)[i].start + static_cast<ptrdiff_t>(groups[i].size());
		}
	}

	return true;
}

//------------------------------------------------------------------------------
// Name: release
//------------------------------------------------------------------------------
void NativeEngine::release() {
	re_.reset();
}

//------------------------------------------------------------------------------
// Name: isReleased
//------------------------------------------------------------------------------
bool NativeEngine::isReleased() const {
	return re_ == nullptr;
}
