// tests/unit/templates/test_reference_extractor.cpp - Unit tests for placeholder extraction

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/templates/reference_extractor.hpp"

namespace fs = std::filesystem;
using namespace chartscan;

namespace
{

void write_file(const fs::path & p, const std::string & content)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << content;
}

}  // namespace

// ============================================================================
// extract_references
// ============================================================================

TEST(TemplatesExtractor, NoPlaceholdersYieldsEmptyList)
{
  const auto result = extract_references("apiVersion: v1\nkind: Service\n", "svc.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.references.empty());

  const auto empty = extract_references("", "empty.yaml");
  ASSERT_TRUE(empty.success);
  EXPECT_TRUE(empty.references.empty());
}

TEST(TemplatesExtractor, RecordsNameLineAndText)
{
  const auto result = extract_references(
    "metadata:\n"
    "  name: {{ .Values.name }}\n"
    "spec:\n"
    "  image: \"{{.Values.image.repository}}:{{ .Values.image.tag }}\"\n",
    "deploy.yaml");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.references.size(), 3U);

  EXPECT_EQ(result.references[0].name, "name");
  EXPECT_EQ(result.references[0].line, 2U);
  EXPECT_EQ(result.references[0].full_text, "{{ .Values.name }}");
  EXPECT_EQ(result.references[0].file, fs::path("deploy.yaml"));

  EXPECT_EQ(result.references[1].name, "image.repository");
  EXPECT_EQ(result.references[1].line, 4U);
  EXPECT_EQ(result.references[1].full_text, "{{.Values.image.repository}}");

  EXPECT_EQ(result.references[2].name, "image.tag");
  EXPECT_EQ(result.references[2].line, 4U);
}

TEST(TemplatesExtractor, DuplicatesAreNotMerged)
{
  const auto result =
    extract_references("a: {{ .Values.port }}\nb: {{ .Values.port }}\n", "svc.yaml");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.references.size(), 2U);
  EXPECT_EQ(result.references[0].line, 1U);
  EXPECT_EQ(result.references[1].line, 2U);
}

TEST(TemplatesExtractor, OtherConstructsAreIgnored)
{
  const auto result = extract_references(
    "{{- if .Values.enabled }}\n"
    "name: {{ include \"chart.fullname\" . }}\n"
    "tag: {{ .Values.image.tag | default \"latest\" }}\n"
    "{{- range .Values.hosts }}\n"
    "{{- end }}\n"
    "{{ .Values }}\n",
    "t.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.references.empty());
}

TEST(TemplatesExtractor, AcceptsHyphenUnderscoreAndIndex)
{
  const auto result =
    extract_references("{{ .Values.my-app.extra_env[0].name }}\n", "t.yaml");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.references.size(), 1U);
  EXPECT_EQ(result.references[0].name, "my-app.extra_env[0].name");
}

TEST(TemplatesExtractor, EmptyBodyFailsWholeFile)
{
  const auto result =
    extract_references("ok: {{ .Values.fine }}\nbad: {{ .Values. }}\n", "t.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.references.empty());
  EXPECT_NE(result.error.find("{{ .Values. }}"), std::string::npos);
}

TEST(TemplatesExtractor, CrlfLineEndings)
{
  const auto result = extract_references("a: 1\r\nb: {{ .Values.b }}\r\n", "t.yaml");
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.references.size(), 1U);
  EXPECT_EQ(result.references[0].line, 2U);
}

TEST(TemplatesExtractor, VeryLongPathOnOneLine)
{
  const std::string path(150000, 'a');
  const auto result = extract_references("x: {{ .Values." + path + " }}\n", "t.yaml");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.references.size(), 1U);
  EXPECT_EQ(result.references[0].name, path);

  // Unterminated placeholder with a long path is not a reference.
  const auto open = extract_references("x: {{ .Values." + path + "\n", "t.yaml");
  ASSERT_TRUE(open.success);
  EXPECT_TRUE(open.references.empty());
}

TEST(TemplatesExtractor, ExtraBracesBeforePlaceholder)
{
  const auto result = extract_references("a: {{{ .Values.a }} {{ {{ .Values.b }}\n", "t.yaml");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.references.size(), 2U);
  EXPECT_EQ(result.references[0].full_text, "{{ .Values.a }}");
  EXPECT_EQ(result.references[1].full_text, "{{ .Values.b }}");
}

// ============================================================================
// scan_templates
// ============================================================================

TEST(TemplatesScan, MissingTemplatesDirIsNotAnError)
{
  const ScopedTempDir chart("chartscan_test");
  const auto result = scan_templates(chart.path());
  EXPECT_TRUE(result.references.empty());
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.files_scanned, 0U);
}

TEST(TemplatesScan, WalksRecursivelyInPathOrder)
{
  const ScopedTempDir chart("chartscan_test");
  const fs::path templates = chart.path() / "templates";
  write_file(templates / "b.yaml", "x: {{ .Values.b }}\n");
  write_file(templates / "a.yaml", "x: {{ .Values.a }}\n");
  write_file(templates / "sub" / "c.yaml", "x: {{ .Values.c }}\n");
  write_file(templates / "_helpers.tpl", "{{ .Values.ignored }}\n");
  write_file(templates / "NOTES.txt", "{{ .Values.ignored }}\n");

  const auto result = scan_templates(chart.path());
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.files_scanned, 3U);
  ASSERT_EQ(result.references.size(), 3U);
  EXPECT_EQ(result.references[0].name, "a");
  EXPECT_EQ(result.references[1].name, "b");
  EXPECT_EQ(result.references[2].name, "c");
  EXPECT_EQ(result.references[2].file, templates / "sub" / "c.yaml");
}

TEST(TemplatesScan, ParseErrorInOneFileKeepsOthers)
{
  const ScopedTempDir chart("chartscan_test");
  const fs::path templates = chart.path() / "templates";
  write_file(templates / "bad.yaml", "x: {{ .Values. }}\n");
  write_file(templates / "good.yaml", "x: {{ .Values.good }}\n");

  const auto result = scan_templates(chart.path());
  ASSERT_EQ(result.references.size(), 1U);
  EXPECT_EQ(result.references[0].name, "good");

  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::ParseError);
  EXPECT_EQ(errors[0].message.rfind("Error parsing template file ", 0), 0U);
}

TEST(TemplatesScan, TemplatesFileInsteadOfDirectory)
{
  const ScopedTempDir chart("chartscan_test");
  write_file(chart.path() / "templates", "not a directory\n");

  const auto result = scan_templates(chart.path());
  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::WalkError);
}

TEST(TemplatesScan, UnreadableFileKeepsWalking)
{
  const ScopedTempDir chart("chartscan_test");
  const fs::path templates = chart.path() / "templates";
  write_file(templates / "good.yaml", "x: {{ .Values.good }}\n");
  fs::create_symlink(templates / "missing-target.yaml.bak", templates / "broken.yaml");

  const auto result = scan_templates(chart.path());
  ASSERT_EQ(result.references.size(), 1U);
  EXPECT_EQ(result.references[0].name, "good");
  EXPECT_EQ(result.files_scanned, 1U);

  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::WalkError);
  EXPECT_EQ(errors[0].message.rfind("Error accessing file " + (templates / "broken.yaml").string(), 0), 0U)
    << errors[0].message;
}
