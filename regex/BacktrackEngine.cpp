#define PCRE2_CODE_UNIT_WIDTH 8
#include "BacktrackEngine.h"
#include "CompileError.h"
#include <pcre2.h>
#include <QtDebug>
#include <new>
#include <string>

// Compiled pattern plus the limits applied to each query.
struct BacktrackEngine::Program {
	Program(pcre2_code *code, pcre2_match_context *context) : code(code), context(context) {
	}

	~Program() {
		pcre2_match_context_free(context);
		pcre2_code_free(code);
	}

	Program(const Program &) = delete;
	Program& operator=(const Program &) = delete;

	pcre2_code          *code;
	pcre2_match_context *context;
};

namespace {

/*--------------------------------------------------------------------
**  Text of a PCRE2 error number, compile or match.
**--------------------------------------------------------------------*/
std::string errorMessage(int code) {
	PCRE2_UCHAR buffer[256];
	if (pcre2_get_error_message(code, buffer, sizeof(buffer)) < 0) {
		return "unknown PCRE2 error " + std::to_string(code);
	}

	return reinterpret_cast<const char *>(buffer);
}

/*--------------------------------------------------------------------
**  Group names by number, "" for unnamed groups and slot 0. Each
**  name table entry is a big endian group number followed by the
**  NUL terminated name.
**--------------------------------------------------------------------*/
std::vector<std::string> groupNames(const pcre2_code *code, size_t captureCount) {

	std::vector<std::string> names(captureCount + 1);

	uint32_t count     = 0;
	uint32_t entrySize = 0;
	PCRE2_SPTR table   = nullptr;

	if (pcre2_pattern_info(code, PCRE2_INFO_NAMECOUNT, &count) != 0 ||
	    pcre2_pattern_info(code, PCRE2_INFO_NAMEENTRYSIZE, &entrySize) != 0 ||
	    pcre2_pattern_info(code, PCRE2_INFO_NAMETABLE, &table) != 0) {
		qDebug("unable to read the group name table");
		return names;
	}

	for (uint32_t i = 0; i < count; ++i) {
		PCRE2_SPTR entry = table + i * entrySize;
		const size_t group = (static_cast<size_t>(entry[0]) << 8) | entry[1];

		// duplicate names keep the first group holding them
		if (group < names.size() && names[group].empty()) {
			names[group] = reinterpret_cast<const char *>(entry + 2);
		}
	}

	return names;
}

}

//------------------------------------------------------------------------------
// Name: BacktrackEngine
//------------------------------------------------------------------------------
BacktrackEngine::BacktrackEngine(const std::string &pattern, const CompileOptions &options) : captureCount_(0) {

	if (options.longest) {
		qDebug("leftmost-longest matching is not available for \"%s\", using leftmost-first", pattern.c_str());
	}

	const uint32_t flags = options.caseInsensitive ? PCRE2_CASELESS : 0;

	int errorCode          = 0;
	PCRE2_SIZE errorOffset = 0;

	pcre2_code *code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), flags, &errorCode, &errorOffset, nullptr);
	if (!code) {
		const std::string message = errorMessage(errorCode);
		qDebug("backtracking compile of \"%s\" failed at %zu: %s", pattern.c_str(), static_cast<size_t>(errorOffset), message.c_str());
		throw CompileError(EngineKind::Backtracking, errorCode, errorOffset, "%s", message.c_str());
	}

	pcre2_match_context *context = pcre2_match_context_create(nullptr);
	if (!context) {
		pcre2_code_free(code);
		throw std::bad_alloc();
	}

	pcre2_set_match_limit(context, options.matchLimit);
	pcre2_set_depth_limit(context, options.depthLimit);

	program_.reset(new Program(code, context));

	uint32_t groups = 0;
	if (pcre2_pattern_info(code, PCRE2_INFO_CAPTURECOUNT, &groups) != 0) {
		qDebug("unable to read the group count of \"%s\"", pattern.c_str());
	}

	captureCount_ = groups;
	captureNames_ = groupNames(code, captureCount_);
}

//------------------------------------------------------------------------------
// Name: ~BacktrackEngine
//------------------------------------------------------------------------------
BacktrackEngine::~BacktrackEngine() = default;

//------------------------------------------------------------------------------
// Name: findAt
//------------------------------------------------------------------------------
bool BacktrackEngine::findAt(const char *subject, size_t length, size_t startOffset, MatchResult *result) const {

	if (!program_) {
		qDebug("query on a released backtracking pattern");
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

	std::unique_ptr<pcre2_match_data, decltype(&pcre2_match_data_free)> matchData(pcre2_match_data_create_from_pattern(program_->code, nullptr), &pcre2_match_data_free);
	if (!matchData) {
		qDebug("unable to allocate match data");
		return false;
	}

	const int rc = pcre2_match(program_->code, reinterpret_cast<PCRE2_SPTR>(subject), length, startOffset, 0, matchData.get(), program_->context);
	if (rc == PCRE2_ERROR_NOMATCH) {
		return false;
	}

	if (rc < 0) {
		qDebug("backtracking query abandoned: %s", errorMessage(rc).c_str());
		return false;
	}

	const PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(matchData.get());
	const size_t used = rc == 0 ? pcre2_get_ovector_count(matchData.get()) : static_cast<size_t>(rc);

	result->reset(captureCount_ + 1);

	for (size_t i = 0; i < used && i <= captureCount_; ++i) {
		if (ovector[2 * i] != PCRE2_UNSET) {
			(*result)[i].start = static_cast<ptrdiff_t>(ovector[2 * i]);
			(*result)[i].end   = static_cast<ptrdiff_t>(ovector[2 * i + 1]);
		}
	}

	return true;
}

//------------------------------------------------------------------------------
// Name: release
//------------------------------------------------------------------------------
void BacktrackEngine::release() {
	program_.reset();
}

//------------------------------------------------------------------------------
// Name: isReleased
//------------------------------------------------------------------------------
bool BacktrackEngine::isReleased() const {
	return program_ == nullptr;
}
