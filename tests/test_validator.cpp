#include "test_framework.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/skills/loader.hpp"
#include "skillsref/skills/validator.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

using skillsref::skills::FrontmatterMapping;
using skillsref::skills::FrontmatterValue;
using skillsref::skills::ValidationResult;

FrontmatterMapping skill_header(const std::string &name, const std::string &description = "x") {
  FrontmatterMapping header;
  skillsref::skills::set_value(header, "name", FrontmatterValue(name));
  skillsref::skills::set_value(header, "description", FrontmatterValue(description));
  return header;
}

bool any_contains(const ValidationResult &result, const std::string &needle) {
  for (const auto &error : result.errors) {
    if (error.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string joined(const ValidationResult &result) {
  std::string out;
  for (const auto &error : result.errors) {
    out += "[" + error + "]";
  }
  return out;
}

std::string repeat(const std::string &unit, std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    out += unit;
  }
  return out;
}

} // namespace

void register_validator_tests(std::vector<skillsref::tests::TestCase> &tests) {
  using skillsref::tests::require;
  namespace sk = skillsref::skills;

  tests.push_back({"validator_accepts_kebab_case_name", [] {
                     const auto result = sk::validate_metadata(skill_header("my-skill"), "my-skill");
                     require(result.ok(), joined(result));
                   }});

  tests.push_back({"validator_accepts_digits", [] {
                     require(sk::validate_metadata(skill_header("skill-2")).ok(), "ascii digit");
                     // Arabic-Indic digit three.
                     require(sk::validate_metadata(skill_header("skill-\xd9\xa3")).ok(),
                             "non-ascii digit");
                   }});

  tests.push_back({"validator_rejects_uppercase_only_as_lowercase_error", [] {
                     const auto result = sk::validate_metadata(skill_header("MySkill"), "MySkill");
                     require(any_contains(result, "lowercase"), joined(result));
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] == "Skill name 'MySkill' must be lowercase",
                             result.errors[0]);
                   }});

  tests.push_back({"validator_rejects_consecutive_hyphens", [] {
                     const auto result =
                         sk::validate_metadata(skill_header("my--skill"), "my--skill");
                     require(any_contains(result, "consecutive hyphens"), joined(result));
                   }});

  tests.push_back({"validator_rejects_edge_hyphens", [] {
                     const auto leading =
                         sk::validate_metadata(skill_header("-my-skill"), "-my-skill");
                     require(any_contains(leading, "cannot start or end with a hyphen"),
                             joined(leading));
                     const auto trailing = sk::validate_metadata(skill_header("my-skill-"));
                     require(any_contains(trailing, "cannot start or end with a hyphen"),
                             joined(trailing));
                   }});

  tests.push_back({"validator_rejects_long_name", [] {
                     const std::string name(65, 'a');
                     const auto result = sk::validate_metadata(skill_header(name), name);
                     require(any_contains(result, "exceeds") &&
                                 any_contains(result, "character limit"),
                             joined(result));
                     require(result.errors[0] == "Skill name '" + name +
                                                     "' exceeds 64 character limit (65 chars)",
                             result.errors[0]);

                     const std::string limit(64, 'a');
                     require(sk::validate_metadata(skill_header(limit), limit).ok(),
                             "64 characters is allowed");
                   }});

  tests.push_back({"validator_reports_independent_name_errors", [] {
                     const std::string name(65, 'A');
                     const auto result = sk::validate_metadata(skill_header(name));
                     require(any_contains(result, "character limit"), joined(result));
                     require(any_contains(result, "lowercase"), joined(result));
                   }});

  tests.push_back({"validator_rejects_invalid_characters", [] {
                     const auto result = sk::validate_metadata(skill_header("my_skill"));
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] ==
                                 "Skill name 'my_skill' contains invalid characters. Only "
                                 "letters, digits, and hyphens are allowed.",
                             result.errors[0]);
                     require(any_contains(sk::validate_metadata(skill_header("my skill")),
                                          "invalid characters"),
                             "space is invalid");
                   }});

  tests.push_back({"validator_accepts_lowercase_cyrillic", [] {
                     const auto result = sk::validate_metadata(skill_header("технав"), "технав");
                     require(result.ok(), joined(result));
                   }});

  tests.push_back({"validator_rejects_uppercase_cyrillic", [] {
                     const auto result = sk::validate_metadata(skill_header("Технав"), "Технав");
                     require(any_contains(result, "lowercase"), joined(result));
                     require(!any_contains(result, "invalid characters"), joined(result));
                   }});

  tests.push_back({"validator_normalizes_name_and_directory", [] {
                     const std::string decomposed = "cafe\xcc\x81";
                     const std::string composed = "caf\xc3\xa9";
                     const auto result = sk::validate_metadata(skill_header(decomposed), composed);
                     require(result.ok(), joined(result));
                     const auto reverse = sk::validate_metadata(skill_header(composed), decomposed);
                     require(reverse.ok(), joined(reverse));
                   }});

  tests.push_back({"validator_counts_name_length_after_normalization", [] {
                     // 33 decomposed e-acute pairs are 66 code points before NFKC
                     // and 33 after.
                     const std::string name = repeat("e\xcc\x81", 33);
                     require(sk::validate_metadata(skill_header(name)).ok(),
                             "normalized length is 33");
                   }});

  tests.push_back({"validator_rejects_directory_mismatch", [] {
                     const auto result = sk::validate_metadata(skill_header("my-skill"), "other");
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] ==
                                 "Directory name 'other' must match skill name 'my-skill'",
                             result.errors[0]);
                   }});

  tests.push_back({"validator_trims_name", [] {
                     require(sk::validate_metadata(skill_header("  my-skill  "), "my-skill").ok(),
                             "surrounding whitespace is ignored");
                   }});

  tests.push_back({"validator_reports_missing_required_fields", [] {
                     const auto result = sk::validate_metadata({});
                     require(result.errors.size() == 2, joined(result));
                     require(result.errors[0] == "Missing required field in frontmatter: name",
                             result.errors[0]);
                     require(result.errors[1] ==
                                 "Missing required field in frontmatter: description",
                             result.errors[1]);
                   }});

  tests.push_back({"validator_rejects_non_string_and_blank_fields", [] {
                     FrontmatterMapping header;
                     sk::set_value(header, "name", FrontmatterValue(5));
                     sk::set_value(header, "description", FrontmatterValue("   "));
                     const auto result = sk::validate_metadata(header);
                     require(result.errors.size() == 2, joined(result));
                     require(result.errors[0] == "Field 'name' must be a non-empty string",
                             result.errors[0]);
                     require(result.errors[1] == "Field 'description' must be a non-empty string",
                             result.errors[1]);
                   }});

  tests.push_back({"validator_limits_description_length", [] {
                     const auto over =
                         sk::validate_metadata(skill_header("my-skill", std::string(1025, 'd')));
                     require(over.errors.size() == 1, joined(over));
                     require(over.errors[0] ==
                                 "Description exceeds 1024 character limit (1025 chars)",
                             over.errors[0]);
                     require(sk::validate_metadata(skill_header("my-skill", std::string(1024, 'd')))
                                 .ok(),
                             "1024 characters is allowed");
                     require(sk::validate_metadata(skill_header("my-skill", repeat("\xc3\xa9", 1024)))
                                 .ok(),
                             "length counts characters, not bytes");
                   }});

  tests.push_back({"validator_limits_compatibility_length", [] {
                     auto header = skill_header("my-skill");
                     sk::set_value(header, "compatibility", FrontmatterValue(std::string(501, 'c')));
                     const auto result = sk::validate_metadata(header);
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] ==
                                 "Compatibility exceeds 500 character limit (501 chars)",
                             result.errors[0]);

                     sk::set_value(header, "compatibility", FrontmatterValue(std::string(500, 'c')));
                     require(sk::validate_metadata(header).ok(), "500 characters is allowed");

                     sk::set_value(header, "compatibility", FrontmatterValue(3));
                     require(sk::validate_metadata(header).ok(),
                             "non-string compatibility is not length checked");
                   }});

  tests.push_back({"validator_rejects_unexpected_fields", [] {
                     auto header = skill_header("my-skill");
                     sk::set_value(header, "zeta", FrontmatterValue("1"));
                     sk::set_value(header, "alpha", FrontmatterValue("2"));
                     sk::set_value(header, "license", FrontmatterValue("MIT"));
                     const auto result = sk::validate_metadata(header);
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] ==
                                 "Unexpected fields in frontmatter: alpha, zeta. Only "
                                 "[allowed-tools, compatibility, description, license, "
                                 "metadata, name] are allowed.",
                             result.errors[0]);
                   }});

  tests.push_back({"validator_orders_errors_by_rule", [] {
                     auto header = skill_header("Bad_Name", "");
                     sk::set_value(header, "extra", FrontmatterValue(true));
                     sk::set_value(header, "compatibility", FrontmatterValue(std::string(600, 'c')));
                     const auto result = sk::validate_metadata(header);
                     require(result.errors.size() == 5, joined(result));
                     require(result.errors[0].find("lowercase") != std::string::npos,
                             joined(result));
                     require(result.errors[1].find("invalid characters") != std::string::npos,
                             joined(result));
                     require(result.errors[2] == "Field 'description' must be a non-empty string",
                             joined(result));
                     require(result.errors[3].rfind("Compatibility exceeds", 0) == 0,
                             joined(result));
                     require(result.errors[4].rfind("Unexpected fields", 0) == 0, joined(result));
                   }});

  tests.push_back({"validator_directory_missing_path", [] {
                     skillsref::testing::TempWorkspace workspace;
                     const auto missing = workspace.path() / "nope";
                     const auto result = sk::validate(missing);
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] == "Path does not exist: " + missing.string(),
                             result.errors[0]);
                   }});

  tests.push_back({"validator_directory_not_a_directory", [] {
                     skillsref::testing::TempWorkspace workspace;
                     workspace.create_file("plain.txt", "hello");
                     const auto file = workspace.path() / "plain.txt";
                     const auto result = sk::validate(file);
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] == "Not a directory: " + file.string(),
                             result.errors[0]);
                   }});

  tests.push_back({"validator_directory_missing_skill_file", [] {
                     skillsref::testing::TempWorkspace workspace;
                     std::filesystem::create_directories(workspace.path() / "empty-skill");
                     const auto result = sk::validate(workspace.path() / "empty-skill");
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] == "Missing required file: SKILL.md",
                             result.errors[0]);
                   }});

  tests.push_back({"validator_directory_reports_parse_error", [] {
                     skillsref::testing::TempWorkspace workspace;
                     workspace.create_file("broken/SKILL.md", "no frontmatter here\n");
                     const auto result = sk::validate(workspace.path() / "broken");
                     require(result.errors.size() == 1, joined(result));
                     require(result.errors[0] ==
                                 "SKILL.md must start with YAML frontmatter (---)",
                             result.errors[0]);
                   }});

  tests.push_back({"validator_directory_valid_skill", [] {
                     skillsref::testing::TempWorkspace workspace;
                     const auto dir = workspace.create_skill(
                         "pdf-tools", "name: pdf-tools\ndescription: Work with PDF files\n"
                                      "license: MIT\nmetadata:\n  author: someone\n");
                     const auto result = sk::validate(dir);
                     require(result.ok(), joined(result));

                     const auto trailing = sk::validate(dir / "");
                     require(trailing.ok(), "trailing separator keeps the directory name: " +
                                                joined(trailing));
                   }});

  tests.push_back({"validator_directory_accepts_lowercase_file", [] {
                     skillsref::testing::TempWorkspace workspace;
                     workspace.create_file("lower/skill.md",
                                           "---\nname: lower\ndescription: lowercase file\n---\n");
                     const auto result = sk::validate(workspace.path() / "lower");
                     require(result.ok(), joined(result));
                   }});

  tests.push_back({"validator_directory_name_mismatch", [] {
                     skillsref::testing::TempWorkspace workspace;
                     const auto dir =
                         workspace.create_skill("wrong-dir", "name: right-name\ndescription: x\n");
                     const auto result = sk::validate(dir);
                     require(result.errors.size() == 1, joined(result));
                     require(any_contains(result, "must match skill name"), joined(result));
                   }});

  tests.push_back({"validator_is_idempotent", [] {
                     skillsref::testing::TempWorkspace workspace;
                     const auto dir = workspace.create_skill(
                         "Bad--Dir", "name: Bad--Dir\ndescription: x\nunknown: 1\n");
                     const auto first = sk::validate(dir);
                     const auto second = sk::validate(dir);
                     require(!first.ok(), "skill should be invalid");
                     require(first == second, "validation should be repeatable");
                   }});

  tests.push_back({"validator_round_trips_read_properties", [] {
                     skillsref::testing::TempWorkspace workspace;
                     const auto dir = workspace.create_skill(
                         "data-pipeline",
                         "name: data-pipeline\ndescription: Builds pipelines\n"
                         "compatibility: Requires python3\nallowed-tools: Bash(git:*) Read\n"
                         "metadata:\n  version: 1.0\n  tags: [etl, batch]\n");
                     const auto properties = sk::read_properties(dir);
                     require(properties.ok(), sk::describe(properties.error()));

                     const auto content = skillsref::common::read_file(dir / "SKILL.md");
                     require(content.ok(), content.error());
                     const auto parsed = sk::parse_frontmatter(content.value());
                     require(parsed.ok(), parsed.error().message);
                     const auto result = sk::validate_metadata(parsed.value().header,
                                                               properties.value().name());
                     require(result.ok(), joined(result));
                   }});

  tests.push_back({"validator_unicode_whitespace_is_blank", [] {
                     // NBSP, ideographic space, em space
                     for (const std::string blank :
                          {"\xc2\xa0", "\xe3\x80\x80", "\xe2\x80\x83"}) {
                       const auto name_result = sk::validate_metadata(skill_header(blank));
                       require(name_result.errors ==
                                   std::vector<std::string>{
                                       "Field 'name' must be a non-empty string"},
                               joined(name_result));

                       const auto description_result =
                           sk::validate_metadata(skill_header("fine", blank));
                       require(description_result.errors ==
                                   std::vector<std::string>{
                                       "Field 'description' must be a non-empty string"},
                               joined(description_result));
                     }
                   }});

  tests.push_back({"validator_trims_unicode_whitespace_around_name", [] {
                     const auto result =
                         sk::validate_metadata(skill_header("\xc2\xa0my-skill\xe3\x80\x80"),
                                               "my-skill");
                     require(result.ok(), joined(result));
                   }});
}
