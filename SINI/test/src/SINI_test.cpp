//======== ======== ======== ======== ======== ======== ======== ========
///	\file
///
///	\copyright
///		
//======== ======== ======== ======== ======== ======== ======== ========

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <SINI/SINI.hpp>

#include <CoreLib/core_type.hpp>

using namespace core::literals;

using ::testing::ElementsAre;

namespace
{

constexpr std::u8string_view compat_sample =
	u8"[Foo Bar]\n"
	u8"foo=bar1\n"
	u8"[Spacey Bar]\n"
	u8"foo = bar2\n"
	u8"[Spacey Bar From The Beginning]\n"
	u8"  foo = bar3\n"
	u8"  baz = qwe\n"
	u8"[Commented Bar]\n"
	u8"foo: bar4 ; comment\n"
	u8"baz=qwe #another one\n"
	u8"[Long Line]\n"
	u8"foo: this line is much, much longer than my editor\n"
	u8"   likes it.\n"
	u8"[Section\\with$weird%characters[\t]\n"
	u8"[Internationalized Stuff]\n"
	u8"foo[bg]: Bulgarian\n"
	u8"foo=Default\n"
	u8"foo[en]=English\n"
	u8"foo[de]=Deutsch\n"
	u8"[Spaces]\n"
	u8"key with spaces : value\n"
	u8"another with spaces = splat!\n"
	u8"[Types]\n"
	u8"int : 42\n"
	u8"float = 0.44\n"
	u8"boolean = NO\n"
	u8"123 : strange but acceptable\n"
	u8"[This One Has A ] In It]\n"
	u8"  forks = spoons\n";

constexpr std::u8string_view indented_sample =
	u8"\n"
	u8"        [options.packages.find]\n"
	u8"        exclude =\n"
	u8"            example*\n"
	u8"            tests*\n"
	u8"            docs*\n"
	u8"            build\n"
	u8"\n"
	u8"        [bumpversion:file:CHANGELOG.md]\n"
	u8"        replace = **unreleased**\n"
	u8"            **v{new_version}**\n"
	u8"\n"
	u8"        [bumpversion:part:release]\n"
	u8"        optional_value = gamma\n"
	u8"        values =\n"
	u8"            dev\n"
	u8"            gamma\n"
	u8"    ";

sini::dialect compat_dialect()
{
	sini::dialect t_dialect;
	t_dialect.inline_comment_prefixes = {u8";", u8"#"};
	return t_dialect;
}

struct callback_log
{
	uint32_t					calls	= 0;
	sini::warningBehaviour		answer	= sini::warningBehaviour::Default;
	std::vector<sini::Error>	codes;
};

sini::warningBehaviour RecordingHandler(const sini::Error_Context& p_error, void* p_context)
{
	callback_log& t_log = *reinterpret_cast<callback_log*>(p_context);
	++t_log.calls;
	t_log.codes.push_back(p_error.error_code());
	return t_log.answer;
}

} //namespace


TEST(SINI, load_compat_sample)
{
	sini::document doc;
	ASSERT_EQ(doc.load(compat_sample, compat_dialect()), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());

	EXPECT_THAT(doc.sections(), ElementsAre(
		u8"Foo Bar",
		u8"Spacey Bar",
		u8"Spacey Bar From The Beginning",
		u8"Commented Bar",
		u8"Long Line",
		u8"Section\\with$weird%characters[\t",
		u8"Internationalized Stuff",
		u8"Spaces",
		u8"Types",
		u8"This One Has A ] In It"));

	EXPECT_EQ(doc.get(u8"Foo Bar", u8"foo"), u8"bar1");
	EXPECT_EQ(doc.get(u8"Spacey Bar", u8"foo"), u8"bar2");
	EXPECT_EQ(doc.get(u8"Spacey Bar From The Beginning", u8"foo"), u8"bar3");
	EXPECT_EQ(doc.get(u8"Spacey Bar From The Beginning", u8"baz"), u8"qwe");
	EXPECT_EQ(doc.get(u8"Commented Bar", u8"foo"), u8"bar4");
	EXPECT_EQ(doc.get(u8"Commented Bar", u8"baz"), u8"qwe");
	EXPECT_EQ(doc.get(u8"Long Line", u8"foo"), u8"this line is much, much longer than my editor\nlikes it.");
	EXPECT_TRUE(doc.keys(u8"Section\\with$weird%characters[\t").empty());
	EXPECT_EQ(doc.get(u8"Spaces", u8"key with spaces"), u8"value");
	EXPECT_EQ(doc.get(u8"Spaces", u8"another with spaces"), u8"splat!");
	EXPECT_EQ(doc.get(u8"Types", u8"123"), u8"strange but acceptable");
	EXPECT_EQ(doc.get(u8"This One Has A ] In It", u8"forks"), u8"spoons");

	EXPECT_THAT(doc.keys(u8"Internationalized Stuff"), ElementsAre(u8"foo[bg]", u8"foo", u8"foo[en]", u8"foo[de]"));

	EXPECT_EQ(doc.get_num<int32_t>(u8"Types", u8"int"), 42);
	const std::optional<double> real = doc.get_num<double>(u8"Types", u8"float");
	ASSERT_TRUE(real.has_value());
	EXPECT_DOUBLE_EQ(real.value(), 0.44);
	EXPECT_EQ(doc.get_bool(u8"Types", u8"boolean"), false);
	EXPECT_FALSE(doc.get_bool(u8"Types", u8"123").has_value());
}

TEST(SINI, load_indented_sample)
{
	sini::document doc;
	ASSERT_EQ(doc.load(indented_sample), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());

	EXPECT_THAT(doc.sections(), ElementsAre(
		u8"options.packages.find",
		u8"bumpversion:file:CHANGELOG.md",
		u8"bumpversion:part:release"));

	EXPECT_EQ(doc.get_raw(u8"options.packages.find", u8"exclude"), u8"\nexample*\ntests*\ndocs*\nbuild");
	EXPECT_EQ(doc.get_raw(u8"bumpversion:file:CHANGELOG.md", u8"replace"), u8"**unreleased**\n**v{new_version}**");
	EXPECT_EQ(doc.get_raw(u8"bumpversion:part:release", u8"optional_value"), u8"gamma");
	EXPECT_EQ(doc.get_raw(u8"bumpversion:part:release", u8"values"), u8"\ndev\ngamma");

	const std::optional<sini::span> key = doc.key_span(u8"options.packages.find", u8"exclude");
	ASSERT_TRUE(key.has_value());
	EXPECT_EQ(key->line, 3_ui64);
	EXPECT_EQ(key->column, 9_ui64);

	const std::optional<sini::span> entry = doc.entry_span(u8"options.packages.find", u8"exclude");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->end_line, 7_ui64);
}

TEST(SINI, sections_in_order)
{
	std::u8string text;
	std::vector<std::u8string> expected;
	for(char8_t name = u8'a'; name <= u8'p'; ++name)
	{
		expected.push_back(std::u8string{u8"s_"} + name);
		text += u8"[" + expected.back() + u8"]\nkey = value\n";
	}

	sini::document doc;
	ASSERT_EQ(doc.load(text), sini::Error::None);

	const std::vector<std::u8string_view> sections = doc.sections();
	ASSERT_EQ(sections.size(), expected.size());
	for(uintptr_t i = 0; i < expected.size(); ++i)
	{
		EXPECT_EQ(sections[i], expected[i]);
	}
	EXPECT_EQ(doc.section_items().size(), 16_uip);
}

TEST(SINI, duplicate_key_lenient)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo=1\nfoo=2"), sini::Error::None);

	EXPECT_EQ(doc.get(u8"a", u8"foo"), u8"2");
	EXPECT_THAT(doc.keys(u8"a"), ElementsAre(u8"foo"));

	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	const sini::Error_Context& warning = doc.diagnostics()[0];
	EXPECT_EQ(warning.error_code(), sini::Error::DuplicateKey);
	EXPECT_EQ(warning.severity(), sini::Severity::Warning);
	EXPECT_EQ(warning.line(), 3_ui64);
	EXPECT_EQ(warning.related().line, 2_ui64);
	EXPECT_EQ(warning.subject(), u8"foo");

	const std::optional<sini::span> value = doc.value_span(u8"a", u8"foo");
	ASSERT_TRUE(value.has_value());
	EXPECT_EQ(value->line, 2_ui64);
	EXPECT_EQ(value->end_line, 3_ui64);

	const std::optional<sini::span> entry = doc.entry_span(u8"a", u8"foo");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->line, 2_ui64);
	EXPECT_EQ(entry->end_line, 3_ui64);
}

TEST(SINI, duplicate_key_strict)
{
	sini::dialect strict;
	strict.flags = strict.flags | sini::Flag::Strict;

	callback_log log;
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo=1\nfoo=2", strict, RecordingHandler, &log), sini::Error::DuplicateKey);
	EXPECT_EQ(log.calls, 0u);

	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].severity(), sini::Severity::Fatal);
	EXPECT_EQ(doc.diagnostics()[0].line(), 3_ui64);
	EXPECT_EQ(doc.diagnostics()[0].column(), 1_ui64);
	EXPECT_EQ(doc.last_error().error_code(), sini::Error::DuplicateKey);

	EXPECT_TRUE(doc.sections().empty());
	EXPECT_FALSE(doc.has_key(u8"a", u8"foo"));
}

TEST(SINI, duplicate_section_lenient)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx=1\n[b]\n[a]\ny=2"), sini::Error::None);

	EXPECT_THAT(doc.sections(), ElementsAre(u8"a", u8"b"));
	EXPECT_THAT(doc.keys(u8"a"), ElementsAre(u8"x", u8"y"));

	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].error_code(), sini::Error::DuplicateSection);
	EXPECT_EQ(doc.diagnostics()[0].line(), 4_ui64);
	EXPECT_EQ(doc.diagnostics()[0].related().line, 1_ui64);
}

TEST(SINI, duplicate_section_discard)
{
	callback_log log;
	log.answer = sini::warningBehaviour::Discard;

	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx=1\n[a]\ny=2\n[b]\nz=3", {}, RecordingHandler, &log), sini::Error::None);

	EXPECT_EQ(log.calls, 1u);
	EXPECT_THAT(doc.keys(u8"a"), ElementsAre(u8"x"));
	EXPECT_EQ(doc.get(u8"b", u8"z"), u8"3");
}

TEST(SINI, duplicate_section_abort)
{
	callback_log log;
	log.answer = sini::warningBehaviour::Abort;

	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx=1\n[a]\ny=2", {}, RecordingHandler, &log), sini::Error::DuplicateSection);

	EXPECT_THAT(log.codes, ElementsAre(sini::Error::DuplicateSection));
	EXPECT_TRUE(doc.sections().empty());
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics().back().severity(), sini::Severity::Fatal);
}

TEST(SINI, continuation)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo = bar\n  baz"), sini::Error::None);

	EXPECT_EQ(doc.get_raw(u8"a", u8"foo"), u8"bar\nbaz");

	const std::optional<sini::span> key = doc.key_span(u8"a", u8"foo");
	ASSERT_TRUE(key.has_value());
	EXPECT_EQ(key->begin, 4_ui64);
	EXPECT_EQ(key->end, 7_ui64);
	EXPECT_EQ(key->line, 2_ui64);
	EXPECT_EQ(key->column, 1_ui64);
	EXPECT_EQ(key->end_column, 4_ui64);

	const std::optional<sini::span> value = doc.value_span(u8"a", u8"foo");
	ASSERT_TRUE(value.has_value());
	EXPECT_EQ(value->begin, 10_ui64);
	EXPECT_EQ(value->end, 19_ui64);
	EXPECT_EQ(value->line, 2_ui64);
	EXPECT_EQ(value->column, 7_ui64);
	EXPECT_EQ(value->end_line, 3_ui64);
	EXPECT_EQ(value->end_column, 6_ui64);

	const std::optional<sini::span> entry = doc.entry_span(u8"a", u8"foo");
	ASSERT_TRUE(entry.has_value());
	EXPECT_EQ(entry->begin, 4_ui64);
	EXPECT_EQ(entry->end, 19_ui64);

	const std::optional<sini::span> header = doc.section_span(u8"a");
	ASSERT_TRUE(header.has_value());
	EXPECT_EQ(header->line, 1_ui64);
	EXPECT_EQ(header->end_column, 4_ui64);
}

TEST(SINI, continuation_keeps_relative_indentation)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo =\n  one\n    two\n\n  three\n\n[b]"), sini::Error::None);

	EXPECT_EQ(doc.get_raw(u8"a", u8"foo"), u8"\none\n  two\n\nthree");
}

TEST(SINI, indented_key_starts_new_entry)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo = bar\n  baz = qux\n"), sini::Error::None);
	EXPECT_EQ(doc.get_raw(u8"a", u8"foo"), u8"bar");
	EXPECT_EQ(doc.get_raw(u8"a", u8"baz"), u8"qux");

	sini::dialect configparser;
	configparser.flags = sini::Flag::ConfigParser;
	ASSERT_EQ(doc.load(u8"[a]\nfoo = bar\n  baz = qux\n", configparser), sini::Error::None);
	EXPECT_EQ(doc.get_raw(u8"a", u8"foo"), u8"bar\nbaz = qux");
	EXPECT_FALSE(doc.has_key(u8"a", u8"baz"));
}

TEST(SINI, section_header_inside_value)
{
	constexpr std::u8string_view text = u8"[a]\nsearch =\n  [project]\n  version = 1\n";

	sini::document doc;
	ASSERT_EQ(doc.load(text), sini::Error::None);
	EXPECT_THAT(doc.sections(), ElementsAre(u8"a", u8"project"));
	EXPECT_EQ(doc.get_raw(u8"a", u8"search"), u8"");
	EXPECT_EQ(doc.get_raw(u8"project", u8"version"), u8"1");
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].error_code(), sini::Error::SectionInValue);
	EXPECT_EQ(doc.diagnostics()[0].severity(), sini::Severity::Warning);
	EXPECT_EQ(doc.diagnostics()[0].line(), 3_ui64);
	EXPECT_EQ(doc.diagnostics()[0].subject(), u8"project");

	callback_log log;
	log.answer = sini::warningBehaviour::Discard;
	ASSERT_EQ(doc.load(text, {}, RecordingHandler, &log), sini::Error::None);
	EXPECT_THAT(log.codes, ElementsAre(sini::Error::SectionInValue));
	EXPECT_THAT(doc.sections(), ElementsAre(u8"a"));
	EXPECT_THAT(doc.keys(u8"a"), ElementsAre(u8"search", u8"version"));

	log.answer = sini::warningBehaviour::Abort;
	EXPECT_EQ(doc.load(text, {}, RecordingHandler, &log), sini::Error::SectionInValue);
	EXPECT_TRUE(doc.sections().empty());

	sini::dialect strict;
	strict.flags = strict.flags | sini::Flag::Strict;
	ASSERT_EQ(doc.load(text, strict), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());
	EXPECT_THAT(doc.sections(), ElementsAre(u8"a", u8"project"));

	//same indentation as the key is not inside the value
	ASSERT_EQ(doc.load(u8"[a]\n  k = v\n  [b]\n"), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());
}

TEST(SINI, blank_line_closes_value)
{
	sini::dialect no_empty;
	no_empty.flags = sini::Flag::AllowContinuation | sini::Flag::FoldKeys | sini::Flag::KeysBeforeSection;

	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo = one\n\n  two = 2", no_empty), sini::Error::None);

	EXPECT_EQ(doc.get_raw(u8"a", u8"foo"), u8"one");
	EXPECT_EQ(doc.get_raw(u8"a", u8"two"), u8"2");
}

TEST(SINI, backslash_continuation)
{
	sini::dialect backslash;
	backslash.flags = backslash.flags | sini::Flag::BackslashContinuation;

	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx = one \\\ntwo\ny = 2", backslash), sini::Error::None);
	EXPECT_EQ(doc.get_raw(u8"a", u8"x"), u8"one\ntwo");
	EXPECT_EQ(doc.get_raw(u8"a", u8"y"), u8"2");

	ASSERT_EQ(doc.load(u8"[a]\nx = one \\", backslash), sini::Error::None);
	EXPECT_EQ(doc.get_raw(u8"a", u8"x"), u8"one");
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].error_code(), sini::Error::UnterminatedContinuation);

	backslash.flags = backslash.flags | sini::Flag::Strict;
	EXPECT_EQ(doc.load(u8"[a]\nx = one \\", backslash), sini::Error::UnterminatedContinuation);
}

TEST(SINI, locale_fallback)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nfoo[en]=English\nfoo=Default"), sini::Error::None);

	EXPECT_EQ(doc.get_localized(u8"a", u8"foo", u8"en"), u8"English");
	EXPECT_EQ(doc.get_localized(u8"a", u8"foo", u8"fr"), u8"Default");
	EXPECT_EQ(doc.get(u8"a", u8"foo"), u8"Default");
	EXPECT_FALSE(doc.get_localized(u8"a", u8"bar", u8"en").has_value());
}

TEST(SINI, inline_comment)
{
	sini::dialect slashes;
	slashes.key_value_delimiters	= {u8"="};
	slashes.inline_comment_prefixes	= {u8"//"};

	sini::document doc;
	ASSERT_EQ(doc.load(u8"[s]\nfoo= bar // note\nurl = http://host\n// only a note\n", slashes), sini::Error::None);

	EXPECT_EQ(doc.get_raw(u8"s", u8"foo"), u8"bar");
	EXPECT_EQ(doc.get_raw(u8"s", u8"url"), u8"http://host");
	EXPECT_TRUE(doc.diagnostics().empty());
}

TEST(SINI, default_section)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[DEFAULT]\nhost=localhost\n[a]\nport=80\n[DEFAULT]\nuser=admin"), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());

	EXPECT_THAT(doc.sections(), ElementsAre(u8"a"));
	EXPECT_FALSE(doc.has_section(u8"DEFAULT"));
	EXPECT_TRUE(doc.has_section(u8"a"));

	EXPECT_EQ(doc.get(u8"a", u8"host"), u8"localhost");
	EXPECT_EQ(doc.get(u8"DEFAULT", u8"user"), u8"admin");
	EXPECT_TRUE(doc.has_key(u8"a", u8"user"));
	EXPECT_THAT(doc.keys(u8"a"), ElementsAre(u8"port", u8"host", u8"user"));
	EXPECT_THAT(doc.keys(u8"DEFAULT"), ElementsAre(u8"host", u8"user"));
	EXPECT_EQ(doc.defaults()->size(), 2_uip);
}

TEST(SINI, keys_before_section)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"top=1\n[a]\nx=2"), sini::Error::None);
	EXPECT_EQ(doc.get(u8"DEFAULT", u8"top"), u8"1");
	EXPECT_EQ(doc.get(u8"a", u8"top"), u8"1");

	sini::dialect headers;
	headers.flags = sini::Flag::AllowContinuation | sini::Flag::FoldKeys;

	ASSERT_EQ(doc.load(u8"top=1\n[a]\nx=2", headers), sini::Error::None);
	EXPECT_FALSE(doc.has_key(u8"a", u8"top"));
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].error_code(), sini::Error::MissingSectionHeader);
	EXPECT_EQ(doc.diagnostics()[0].line(), 1_ui64);

	headers.flags = headers.flags | sini::Flag::Strict;
	EXPECT_EQ(doc.load(u8"top=1\n[a]\nx=2", headers), sini::Error::MissingSectionHeader);
}

TEST(SINI, malformed_lines)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\njunk\nx=1"), sini::Error::None);
	EXPECT_EQ(doc.get(u8"a", u8"x"), u8"1");
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].error_code(), sini::Error::MalformedLine);
	EXPECT_EQ(doc.diagnostics()[0].line(), 2_ui64);
	EXPECT_EQ(doc.diagnostics()[0].message(), u8"variable assignment missing one of: `=`, `:`");

	sini::dialect quiet;
	quiet.flags = quiet.flags | sini::Flag::MalformedAsComment;
	ASSERT_EQ(doc.load(u8"[a]\njunk\nx=1", quiet), sini::Error::None);
	EXPECT_TRUE(doc.diagnostics().empty());

	sini::dialect strict;
	strict.flags = strict.flags | sini::Flag::Strict;
	EXPECT_EQ(doc.load(u8"[a]\njunk\nx=1", strict), sini::Error::MalformedLine);
	ASSERT_EQ(doc.diagnostics().size(), 1_uip);
	EXPECT_EQ(doc.diagnostics()[0].severity(), sini::Severity::Fatal);
}

TEST(SINI, unterminated_section_header)
{
	sini::document doc;
	EXPECT_EQ(doc.load(u8"[a\nx=1"), sini::Error::MalformedLine);
	EXPECT_EQ(doc.last_error().message(), u8"section was not closed: missing ']'");

	callback_log log;
	log.answer = sini::warningBehaviour::Continue;
	ASSERT_EQ(doc.load(u8"[a\nx=1", {}, RecordingHandler, &log), sini::Error::None);
	EXPECT_EQ(doc.get(u8"DEFAULT", u8"x"), u8"1");
}

TEST(SINI, line_endings_and_bom)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"\xEF\xBB\xBF[a]\r\nx = 1\r\ny = 2\rz = 3\n"), sini::Error::None);

	EXPECT_EQ(doc.get(u8"a", u8"x"), u8"1");
	EXPECT_EQ(doc.get(u8"a", u8"y"), u8"2");
	EXPECT_EQ(doc.get(u8"a", u8"z"), u8"3");

	const std::optional<sini::span> header = doc.section_span(u8"a");
	ASSERT_TRUE(header.has_value());
	EXPECT_EQ(header->begin, 3_ui64);
	EXPECT_EQ(header->column, 1_ui64);

	const std::optional<sini::span> key = doc.key_span(u8"a", u8"z");
	ASSERT_TRUE(key.has_value());
	EXPECT_EQ(key->line, 4_ui64);
}

TEST(SINI, unicode_columns)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nnăme = välue"), sini::Error::None);

	const std::optional<sini::span> value = doc.value_span(u8"a", u8"năme");
	ASSERT_TRUE(value.has_value());
	EXPECT_EQ(value->column, 8_ui64);
	EXPECT_EQ(value->end_column, 13_ui64);
	EXPECT_EQ(value->size(), 6_ui64);
}

TEST(SINI, case_folding)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[Section]\nFoo=1"), sini::Error::None);

	EXPECT_EQ(doc.get(u8"Section", u8"FOO"), u8"1");
	EXPECT_THAT(doc.keys(u8"Section"), ElementsAre(u8"Foo"));
	EXPECT_FALSE(doc.has_section(u8"section"));

	sini::dialect folded;
	folded.flags = folded.flags | sini::Flag::FoldSections;
	ASSERT_EQ(doc.load(u8"[Section]\nFoo=1\n[SECTION]\nbar=2", folded), sini::Error::None);
	EXPECT_THAT(doc.sections(), ElementsAre(u8"Section"));
	EXPECT_EQ(doc.get(u8"section", u8"bar"), u8"2");
}

TEST(SINI, raw_value_reparses)
{
	sini::document doc;
	ASSERT_EQ(doc.load(compat_sample, compat_dialect()), sini::Error::None);

	for(const std::u8string_view section_name : doc.sections())
	{
		for(const std::u8string_view key : doc.keys(section_name))
		{
			const std::u8string raw = doc.get_raw(section_name, key).value();

			std::u8string text = u8"[s]\nk = ";
			for(const char8_t t_char : raw)
			{
				text.push_back(t_char);
				if(t_char == u8'\n') text.append(u8"  ");
			}

			sini::document single;
			ASSERT_EQ(single.load(text), sini::Error::None);
			EXPECT_EQ(single.get_raw(u8"s", u8"k"), raw);
		}
	}
}

TEST(SINI, resolve_errors)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx=1"), sini::Error::None);

	std::u8string out;
	sini::Error_Context error;
	EXPECT_EQ(doc.resolve(u8"b", u8"x", out, &error), sini::Error::NoSection);
	EXPECT_EQ(error.error_code(), sini::Error::NoSection);
	EXPECT_EQ(error.line(), sini::noline);
	EXPECT_EQ(error.subject(), u8"b");

	EXPECT_EQ(doc.resolve(u8"a", u8"y", out, &error), sini::Error::NoKey);
	EXPECT_EQ(error.subject(), u8"y");

	EXPECT_EQ(doc.resolve(u8"a", u8"x", out, &error), sini::Error::None);
	EXPECT_EQ(out, u8"1");
	EXPECT_EQ(error.error_code(), sini::Error::None);

	EXPECT_FALSE(doc.get(u8"a", u8"y").has_value());
	EXPECT_FALSE(doc.key_span(u8"a", u8"y").has_value());
}

TEST(SINI, modification)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx=1"), sini::Error::None);

	EXPECT_EQ(doc.add_section(u8"a"), sini::Error::DuplicateSection);
	EXPECT_EQ(doc.add_section(u8"DEFAULT"), sini::Error::DuplicateSection);
	EXPECT_EQ(doc.add_section(u8"b"), sini::Error::None);
	EXPECT_THAT(doc.sections(), ElementsAre(u8"a", u8"b"));

	EXPECT_EQ(doc.set(u8"c", u8"k", u8"v"), sini::Error::NoSection);
	EXPECT_EQ(doc.set(u8"b", u8"k", u8"v"), sini::Error::None);
	EXPECT_EQ(doc.set(u8"a", u8"x", u8"2"), sini::Error::None);
	EXPECT_EQ(doc.get(u8"b", u8"k"), u8"v");
	EXPECT_EQ(doc.get(u8"a", u8"x"), u8"2");
	EXPECT_FALSE(doc.key_span(u8"b", u8"k").has_value());

	EXPECT_TRUE(doc.remove_key(u8"a", u8"x"));
	EXPECT_FALSE(doc.remove_key(u8"a", u8"x"));
	EXPECT_TRUE(doc.remove_section(u8"a"));
	EXPECT_FALSE(doc.remove_section(u8"a"));
	EXPECT_THAT(doc.sections(), ElementsAre(u8"b"));
	EXPECT_EQ(doc.get(u8"b", u8"k"), u8"v");

	doc.clear();
	EXPECT_TRUE(doc.sections().empty());
}

TEST(SINI, item_access)
{
	sini::document doc;
	ASSERT_EQ(doc.load(u8"[a]\nx = 1\ny = 2"), sini::Error::None);

	sini::itemProxy<const sini::section> section = doc.find_section(u8"a");
	ASSERT_TRUE(section);
	EXPECT_EQ(section->type(), sini::ItemType::section);
	EXPECT_EQ(section->line(), 1_ui64);
	ASSERT_EQ(section->size(), 2_uip);

	const sini::section& items = *section;
	EXPECT_EQ(items[0]->type(), sini::ItemType::key_value);
	EXPECT_EQ(items[0]->name(), u8"x");
	EXPECT_EQ(items[1]->value(), u8"2");
	EXPECT_EQ(items[1]->line(), 3_ui64);
	EXPECT_EQ(items[1]->column(), 1_ui64);
}

TEST(SINI, move)
{
	sini::document source;
	ASSERT_EQ(source.load(u8"[DEFAULT]\nd = 0\n[a]\nx = 1\nbad"), sini::Error::None);

	sini::document target{std::move(source)};
	EXPECT_EQ(target.get(u8"a", u8"x"), u8"1");
	EXPECT_EQ(target.get(u8"a", u8"d"), u8"0");
	EXPECT_EQ(target.diagnostics().size(), 1_uip);

	EXPECT_TRUE(source.sections().empty());
	EXPECT_TRUE(source.diagnostics().empty());
	EXPECT_FALSE(source.remove_section(u8"DEFAULT"));
	EXPECT_FALSE(source.get(u8"DEFAULT", u8"d").has_value());
	EXPECT_EQ(source.set(u8"DEFAULT", u8"d", u8"2"), sini::Error::None);
	EXPECT_EQ(source.get(u8"DEFAULT", u8"d"), u8"2");

	sini::document assigned;
	assigned = std::move(target);
	EXPECT_EQ(assigned.get(u8"a", u8"x"), u8"1");
	EXPECT_TRUE(target.sections().empty());
	EXPECT_FALSE(target.remove_section(u8"DEFAULT"));

	ASSERT_EQ(target.load(u8"[b]\ny = 2"), sini::Error::None);
	EXPECT_EQ(target.get(u8"b", u8"y"), u8"2");
}
