// tests/unit/analysis/test_reference_resolver.cpp - Unit tests for reference resolution

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "chartscan/analysis/reference_resolver.hpp"
#include "chartscan/basic/temp_dir.hpp"
#include "chartscan/templates/reference_extractor.hpp"
#include "chartscan/values/values_loader.hpp"

namespace fs = std::filesystem;
using namespace chartscan;

namespace
{

ValueMapping parse(const std::string & yaml)
{
  auto result = parse_values(yaml);
  EXPECT_TRUE(result.success) << result.error;
  return std::move(result.values);
}

ValueReference ref(std::string name, uint32_t line = 1)
{
  ValueReference r;
  r.name = std::move(name);
  r.file = "templates/deployment.yaml";
  r.line = line;
  r.full_text = "{{ .Values." + r.name + " }}";
  return r;
}

}  // namespace

TEST(AnalysisResolver, SplitsOnDots)
{
  const std::vector<std::string> expected{"image", "tag"};
  EXPECT_EQ(split_reference_path("image.tag"), expected);

  const std::vector<std::string> single{"name"};
  EXPECT_EQ(split_reference_path("name"), single);
}

TEST(AnalysisResolver, ResolvesExistingChain)
{
  const ValueMapping values = parse("image:\n  repository: nginx\n  tag: \"1.0\"\n");
  EXPECT_TRUE(resolve_reference(ref("image"), values));
  EXPECT_TRUE(resolve_reference(ref("image.tag"), values));
  EXPECT_FALSE(resolve_reference(ref("image.pullPolicy"), values));
  EXPECT_FALSE(resolve_reference(ref("service.port"), values));
}

TEST(AnalysisResolver, NullLeafCountsAsDefined)
{
  const ValueMapping values = parse("ingress:\n  host:\n");
  EXPECT_TRUE(resolve_reference(ref("ingress.host"), values));
  // A null node has no children
  EXPECT_FALSE(resolve_reference(ref("ingress.host.name"), values));
}

TEST(AnalysisResolver, ScalarOrSequenceInTheMiddleIsUnresolved)
{
  const ValueMapping values = parse("image: nginx\nhosts: [a, b]\n");
  EXPECT_FALSE(resolve_reference(ref("image.tag"), values));
  EXPECT_FALSE(resolve_reference(ref("hosts.0"), values));
}

TEST(AnalysisResolver, IndexNotationIsLiteralKey)
{
  const ValueMapping values = parse("hosts: [a, b]\n");
  EXPECT_FALSE(resolve_reference(ref("hosts[0]"), values));

  const ValueMapping literal = parse("\"hosts[0]\": a\n");
  EXPECT_TRUE(resolve_reference(ref("hosts[0]"), literal));
}

TEST(AnalysisResolver, EmptyNameIsUnresolved)
{
  const ValueMapping values = parse("a: 1\n");
  EXPECT_FALSE(resolve_reference(ref(""), values));
  EXPECT_FALSE(path_exists({}, values));
}

TEST(AnalysisResolver, IsIdempotent)
{
  const ValueMapping values = parse("a:\n  b: 1\n");
  const ValueReference present = ref("a.b");
  const ValueReference absent = ref("a.c");
  EXPECT_EQ(resolve_reference(present, values), resolve_reference(present, values));
  EXPECT_EQ(resolve_reference(absent, values), resolve_reference(absent, values));
}

TEST(AnalysisResolver, UndefinedMessageFormat)
{
  EXPECT_EQ(
    format_undefined_value(ref("image.tag", 12)),
    "Undefined value: 'image.tag' referenced in templates/deployment.yaml at line 12");
}

TEST(AnalysisResolver, UndefinedImageTagScenario)
{
  const auto extracted =
    extract_references("image: {{ .Values.image.tag }}\n", "templates/deployment.yaml");
  ASSERT_TRUE(extracted.success);

  const std::vector<std::string> undefined =
    check_references(extracted.references, parse("image:\n  repository: x\n"));
  ASSERT_EQ(undefined.size(), 1U);
  EXPECT_EQ(
    undefined[0],
    "Undefined value: 'image.tag' referenced in templates/deployment.yaml at line 1");
}

TEST(AnalysisResolver, LoadResolveRoundTrip)
{
  const ScopedTempDir dir("chartscan_test");
  const fs::path file = dir.path() / "values.yaml";
  {
    std::ofstream out(file);
    out << "service:\n  port: 80\n  name: web\n";
  }

  const auto loaded = load_values_file(file);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_TRUE(resolve_reference(ref("service.port"), loaded.values));

  {
    std::ofstream out(file, std::ios::trunc);
    out << "service:\n  name: web\n";
  }
  const auto reloaded = load_values_file(file);
  ASSERT_TRUE(reloaded.success) << reloaded.error;
  EXPECT_FALSE(resolve_reference(ref("service.port"), reloaded.values));
}

TEST(AnalysisResolver, EveryOccurrenceIsReported)
{
  const std::vector<ValueReference> refs{ref("missing", 1), ref("missing", 7), ref("present", 9)};
  const auto undefined = check_references(refs, parse("present: true\n"));
  ASSERT_EQ(undefined.size(), 2U);
  EXPECT_NE(undefined[0].find("at line 1"), std::string::npos);
  EXPECT_NE(undefined[1].find("at line 7"), std::string::npos);
}

TEST(AnalysisResolver, AnchoredValuesResolveThroughMergeKey)
{
  const ValueMapping values = parse(
    "base: &b\n"
    "  port: 80\n"
    "svc:\n"
    "  <<: *b\n"
    "  name: web\n");

  const auto extracted =
    extract_references("port: {{ .Values.svc.port }}\nname: {{ .Values.svc.name }}\n", "t.yaml");
  ASSERT_TRUE(extracted.success) << extracted.error;
  EXPECT_TRUE(check_references(extracted.references, values).empty());
  EXPECT_FALSE(resolve_reference(ref("svc.<<"), values));
}
