#include "Regexp.h"
#include "Engine.h"
#include "Classifier.h"
#include <QtDebug>
#include <utility>

//------------------------------------------------------------------------------
// Name: compile
//------------------------------------------------------------------------------
std::unique_ptr<Regexp> Regexp::compile(const std::string &pattern, const CompileOptions &options) {
	const EngineKind kind = Classifier::choose(pattern, options.engine);

	std::unique_ptr<Engine> engine = Engine::compile(pattern, kind, options);
	return std::unique_ptr<Regexp>(new Regexp(pattern, kind, std::move(engine)));
}

//------------------------------------------------------------------------------
// Name: Regexp
//------------------------------------------------------------------------------
Regexp::Regexp(const std::string &pattern, EngineKind kind, std::unique_ptr<Engine> engine) : pattern_(pattern), kind_(kind), engine_(std::move(engine)), iterator_(*engine_) {
}

//------------------------------------------------------------------------------
// Name: ~Regexp
//------------------------------------------------------------------------------
Regexp::~Regexp() {
	release();
}

//------------------------------------------------------------------------------
// Name: release
//------------------------------------------------------------------------------
void Regexp::release() {
	engine_->release();
}

//------------------------------------------------------------------------------
// Name: isReleased
//------------------------------------------------------------------------------
bool Regexp::isReleased() const {
	return engine_->isReleased();
}

//------------------------------------------------------------------------------
// Name: warnIfReleased
//------------------------------------------------------------------------------
void Regexp::warnIfReleased() const {
	if (engine_->isReleased()) {
		qWarning("query on released pattern \"%s\" (%s engine), treated as no match", pattern_.c_str(), engineName(kind_));
	}
}

//------------------------------------------------------------------------------
// Name: numSubexp
//------------------------------------------------------------------------------
size_t Regexp::numSubexp() const {
	return engine_->captureCount();
}

//------------------------------------------------------------------------------
// Name: subexpNames
//------------------------------------------------------------------------------
std::vector<std::string> Regexp::subexpNames() const {
	return engine_->captureNames();
}

//------------------------------------------------------------------------------
// Name: literalPrefix
//------------------------------------------------------------------------------
std::string Regexp::literalPrefix(bool *complete) const {
	return engine_->literalPrefix(complete);
}

//------------------------------------------------------------------------------
// Name: subexpIndex
// Desc: index of the first group called 'name', -1 if there is none
//------------------------------------------------------------------------------
int Regexp::subexpIndex(const std::string &name) const {
	if (name.empty()) {
		return -1;
	}

	const std::vector<std::string> names = engine_->captureNames();

	for (size_t i = 1; i < names.size(); ++i) {
		if (names[i] == name) {
			return static_cast<int>(i);
		}
	}

	return -1;
}

//------------------------------------------------------------------------------
// Name: test
//------------------------------------------------------------------------------
bool Regexp::test(const char *subject, size_t length) const {
	warnIfReleased();
	return iterator_.test(subject, length);
}

//------------------------------------------------------------------------------
// Name: firstMatch
//------------------------------------------------------------------------------
bool Regexp::firstMatch(const char *subject, size_t length, MatchResult *result) const {
	warnIfReleased();
	return iterator_.firstMatch(subject, length, result);
}

//------------------------------------------------------------------------------
// Name: find
//------------------------------------------------------------------------------
std::string Regexp::find(const char *subject, size_t length) const {
	MatchResult result;
	if (!firstMatch(subject, length, &result)) {
		return std::string();
	}

	return result.group(subject, 0);
}

//------------------------------------------------------------------------------
// Name: findIndex
//------------------------------------------------------------------------------
MatchSpan Regexp::findIndex(const char *subject, size_t length) const {
	MatchResult result;
	if (!firstMatch(subject, length, &result)) {
		return MatchSpan();
	}

	return MatchSpan{result.whole().start, result.whole().end};
}

//------------------------------------------------------------------------------
// Name: findSubmatch
//------------------------------------------------------------------------------
std::vector<std::string> Regexp::findSubmatch(const char *subject, size_t length) const {
	MatchResult result;
	if (!firstMatch(subject, length, &result)) {
		return std::vector<std::string>();
	}

	return result.groups(subject);
}

//------------------------------------------------------------------------------
// Name: findSubmatchIndex
//------------------------------------------------------------------------------
MatchOffsets Regexp::findSubmatchIndex(const char *subject, size_t length) const {
	MatchResult result;
	if (!firstMatch(subject, length, &result)) {
		return MatchOffsets();
	}

	return result.offsets();
}

//------------------------------------------------------------------------------
// Name: allMatches
//------------------------------------------------------------------------------
std::vector<MatchResult> Regexp::allMatches(const char *subject, size_t length, int limit) const {
	warnIfReleased();
	return iterator_.allMatches(subject, length, limit);
}

//------------------------------------------------------------------------------
// Name: findAll
//------------------------------------------------------------------------------
std::vector<std::string> Regexp::findAll(const char *subject, size_t length, int limit) const {
	std::vector<std::string> texts;

	for (const MatchResult &result : allMatches(subject, length, limit)) {
		texts.push_back(result.group(subject, 0));
	}

	return texts;
}

//------------------------------------------------------------------------------
// Name: findAllIndex
//------------------------------------------------------------------------------
std::vector<MatchSpan> Regexp::findAllIndex(const char *subject, size_t length, int limit) const {
	std::vector<MatchSpan> spans;

	for (const MatchResult &result : allMatches(subject, length, limit)) {
		spans.push_back(MatchSpan{result.whole().start, result.whole().end});
	}

	return spans;
}

//------------------------------------------------------------------------------
// Name: findAllSubmatch
//------------------------------------------------------------------------------
std::vector<std::vector<std::string>> Regexp::findAllSubmatch(const char *subject, size_t length, int limit) const {
	std::vector<std::vector<std::string>> texts;

	for (const MatchResult &result : allMatches(subject, length, limit)) {
		texts.push_back(result.groups(subject));
	}

	return texts;
}

//------------------------------------------------------------------------------
// Name: findAllSubmatchIndex
//------------------------------------------------------------------------------
std::vector<MatchOffsets> Regexp::findAllSubmatchIndex(const char *subject, size_t length, int limit) const {
	std::vector<MatchOffsets> offsets;

	for (const MatchResult &result : allMatches(subject, length, limit)) {
		offsets.push_back(result.offsets());
	}

	return offsets;
}

//------------------------------------------------------------------------------
// Name: replace
//------------------------------------------------------------------------------
std::string Regexp::replace(const char *subject, size_t length, const Replacement &replacement) const {
	warnIfReleased();
	return iterator_.replaceAll(subject, length, replacement);
}

//------------------------------------------------------------------------------
// Name: replaceAll
//------------------------------------------------------------------------------
std::string Regexp::replaceAll(const char *subject, size_t length, const std::string &templ) const {
	return replace(subject, length, Replacement::expand(templ));
}

//------------------------------------------------------------------------------
// Name: replaceAllLiteral
//------------------------------------------------------------------------------
std::string Regexp::replaceAllLiteral(const char *subject, size_t length, const std::string &bytes) const {
	return replace(subject, length, Replacement::literal(bytes));
}

//------------------------------------------------------------------------------
// Name: replaceAllFunc
//------------------------------------------------------------------------------
std::string Regexp::replaceAllFunc(const char *subject, size_t length, const Replacement::Transform &fn) const {
	return replace(subject, length, Replacement::transform(fn));
}

//------------------------------------------------------------------------------
// Name: split
//------------------------------------------------------------------------------
std::vector<std::string> Regexp::split(const char *subject, size_t length, int limit) const {
	warnIfReleased();
	return iterator_.split(subject, length, limit);
}

//------------------------------------------------------------------------------
// Name: expand
//------------------------------------------------------------------------------
std::string Regexp::expand(const std::string &templ, const char *subject, size_t length, const MatchOffsets &offsets) const {
	return MatchIterator::expandTemplate(templ, subject, length, offsets);
}
