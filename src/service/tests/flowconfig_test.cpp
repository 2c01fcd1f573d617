#include <gtest/gtest.h>

#include "../include/flowconfig.hpp"

using nlohmann::json;

namespace {

json minimalFlow() {
  return json{{"name", "orders"},
              {"sourceDirectory", "/data/in"},
              {"targetDirectory", "/data/out"}};
}

}  // namespace

TEST(FlowConfigTest, DefaultsApplied) {
  FlowConfig cfg = FlowConfig::fromJson(minimalFlow());

  EXPECT_EQ(cfg.name, "orders");
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.pollInterval, std::chrono::seconds(30));
  EXPECT_EQ(cfg.filePattern, "*");
  EXPECT_TRUE(cfg.exclusionMask.empty());
  EXPECT_FALSE(cfg.processReadOnlyFiles);
  EXPECT_EQ(cfg.maximumFileSize, 0);
  EXPECT_EQ(cfg.msecsToWaitBeforeModificationCheck, 0);
  EXPECT_EQ(cfg.emptyFileHandling, EmptyFileHandling::DO_NOT_CREATE_MESSAGE);
  EXPECT_EQ(cfg.emptyMessageHandling, EmptyMessageHandling::WRITE_EMPTY_FILE);
  EXPECT_EQ(cfg.postProcessAction, PostProcessAction::ARCHIVE);
  EXPECT_EQ(cfg.outputFilenameMode, OutputNamingMode::ORIGINAL);
  EXPECT_EQ(cfg.writeMode, WriteMode::DIRECT);
  EXPECT_EQ(cfg.maximumConcurrency, 1);
  EXPECT_TRUE(cfg.customValidationRules.empty());
}

TEST(FlowConfigTest, DisplayLiteralsParsed) {
  json src = minimalFlow();
  src["emptyFileHandling"] = "SkipEmptyFiles";
  src["emptyMessageHandling"] = "SkipEmptyMessages";
  src["outputFilenameMode"] = "AddTimestamp";
  src["writeMode"] = "Create Temp File";
  src["postProcessAction"] = "keep_and_mark";

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_EQ(cfg.emptyFileHandling, EmptyFileHandling::SKIP);
  EXPECT_EQ(cfg.emptyMessageHandling, EmptyMessageHandling::SKIP_EMPTY);
  EXPECT_EQ(cfg.outputFilenameMode, OutputNamingMode::TIMESTAMPED);
  EXPECT_EQ(cfg.writeMode, WriteMode::TEMP_THEN_RENAME);
  EXPECT_EQ(cfg.postProcessAction, PostProcessAction::KEEP_AND_MARK);
}

TEST(FlowConfigTest, EnumNamesParsed) {
  json src = minimalFlow();
  src["outputFilenameMode"] = "CUSTOM_PATTERN";
  src["customFilenamePattern"] = "{original_name}{extension}";
  src["writeMode"] = "TEMP_THEN_RENAME";
  src["emptyFileHandling"] = "process";

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_EQ(cfg.outputFilenameMode, OutputNamingMode::CUSTOM_PATTERN);
  EXPECT_EQ(cfg.writeMode, WriteMode::TEMP_THEN_RENAME);
  EXPECT_EQ(cfg.emptyFileHandling, EmptyFileHandling::PROCESS);
}

TEST(FlowConfigTest, UnknownEnumValuesFallBack) {
  json src = minimalFlow();
  src["postProcessAction"] = "SHRED";
  src["writeMode"] = "carrier pigeon";
  src["outputFilenameMode"] = "Whatever";

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_EQ(cfg.postProcessAction, PostProcessAction::ARCHIVE);
  EXPECT_EQ(cfg.writeMode, WriteMode::DIRECT);
  EXPECT_EQ(cfg.outputFilenameMode, OutputNamingMode::ORIGINAL);
}

TEST(FlowConfigTest, TestProcessingModeKeepsFiles) {
  json src = minimalFlow();
  src["processingMode"] = "Test";

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_EQ(cfg.postProcessAction, PostProcessAction::KEEP_AND_REPROCESS);
}

TEST(FlowConfigTest, PostProcessActionWinsOverProcessingMode) {
  json src = minimalFlow();
  src["processingMode"] = "DELETE";
  src["postProcessAction"] = "KEEP_AND_MARK";

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_EQ(cfg.postProcessAction, PostProcessAction::KEEP_AND_MARK);
}

TEST(FlowConfigTest, StringEncodedScalarsAccepted) {
  json src = minimalFlow();
  src["processReadOnlyFiles"] = "true";
  src["maximumFileSize"] = "1024";
  src["maximumConcurrency"] = 4;

  FlowConfig cfg = FlowConfig::fromJson(src);
  EXPECT_TRUE(cfg.processReadOnlyFiles);
  EXPECT_EQ(cfg.maximumFileSize, 1024);
  EXPECT_EQ(cfg.maximumConcurrency, 4);
}

TEST(FlowConfigTest, ValidationErrors) {
  auto expectInvalid = [](json src) {
    EXPECT_THROW(FlowConfig::fromJson(src), std::invalid_argument)
        << src.dump();
  };

  json noName = minimalFlow();
  noName.erase("name");
  expectInvalid(noName);

  json noSource = minimalFlow();
  noSource["sourceDirectory"] = "";
  expectInvalid(noSource);

  json noTarget = minimalFlow();
  noTarget.erase("targetDirectory");
  expectInvalid(noTarget);

  json negativeSize = minimalFlow();
  negativeSize["maximumFileSize"] = -1;
  expectInvalid(negativeSize);

  json zeroConcurrency = minimalFlow();
  zeroConcurrency["maximumConcurrency"] = 0;
  expectInvalid(zeroConcurrency);

  json zeroPoll = minimalFlow();
  zeroPoll["pollInterval"] = 0;
  expectInvalid(zeroPoll);

  json badGlob = minimalFlow();
  badGlob["exclusionMask"] = "[abc";
  expectInvalid(badGlob);

  json wrongType = minimalFlow();
  wrongType["enabled"] = "maybe";
  expectInvalid(wrongType);

  expectInvalid(json::array());
}

TEST(FlowConfigTest, OutOfRangeIntegersRejected) {
  // 2^32 + 2 не должно превращаться в 2 при сужении до int
  json wide = minimalFlow();
  wide["maximumConcurrency"] = 4294967298LL;
  EXPECT_THROW(FlowConfig::fromJson(wide), std::invalid_argument);

  json wideString = minimalFlow();
  wideString["maximumConcurrency"] = "4294967298";
  EXPECT_THROW(FlowConfig::fromJson(wideString), std::invalid_argument);

  json huge = minimalFlow();
  huge["maximumFileSize"] = 18446744073709551615ULL;
  EXPECT_THROW(FlowConfig::fromJson(huge), std::invalid_argument);

  json largest = minimalFlow();
  largest["maximumConcurrency"] = 2147483647;
  EXPECT_EQ(FlowConfig::fromJson(largest).maximumConcurrency, 2147483647);
}

TEST(FlowConfigTest, ErrorMessageNamesFlow) {
  json src = minimalFlow();
  src["maximumConcurrency"] = 0;
  try {
    FlowConfig::fromJson(src);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &e) {
    EXPECT_NE(std::string(e.what()).find("orders"), std::string::npos);
  }
}

TEST(FlowConfigTest, RuleSeverityParsing) {
  json src = minimalFlow();
  src["customValidationRules"] = json::array(
      {json{{"type", "filename_regex"}, {"pattern", "^a.*"}},
       json{{"type", "content_contains"},
            {"text", "ID"},
            {"severity", "warning"}},
       json{{"type", "line_count"}, {"minLines", 1}, {"required", false}},
       json{{"type", "header_validation"},
            {"expectedHeader", "H"},
            {"severity", "fatal"}}});

  FlowConfig cfg = FlowConfig::fromJson(src);
  ASSERT_EQ(cfg.customValidationRules.size(), 4u);
  EXPECT_EQ(cfg.customValidationRules[0].severity, RuleSeverity::ERROR);
  EXPECT_EQ(cfg.customValidationRules[0].params["pattern"], "^a.*");
  EXPECT_FALSE(cfg.customValidationRules[0].params.contains("type"));
  EXPECT_EQ(cfg.customValidationRules[1].severity, RuleSeverity::WARNING);
  EXPECT_EQ(cfg.customValidationRules[2].severity, RuleSeverity::WARNING);
  // Неизвестная строгость трактуется как ошибка
  EXPECT_EQ(cfg.customValidationRules[3].severity, RuleSeverity::ERROR);
}

TEST(FlowConfigTest, RulesMustBeArray) {
  json src = minimalFlow();
  src["customValidationRules"] = json::object();
  EXPECT_THROW(FlowConfig::fromJson(src), std::invalid_argument);
}

TEST(FlowConfigTest, ToJsonRoundTrip) {
  json src = minimalFlow();
  src["pollInterval"] = 5;
  src["exclusionMask"] = "*.tmp";
  src["postProcessAction"] = "DELETE";
  src["writeMode"] = "Create Temp File";
  src["outputFilenameMode"] = "Custom";
  src["customFilenamePattern"] = "{date}_{original_name}{extension}";
  src["archiveFaultySourceFiles"] = true;
  src["archiveErrorDirectory"] = "/data/err";
  src["customValidationRules"] =
      json::array({json{{"type", "line_count"}, {"maxLines", 10}}});

  FlowConfig original = FlowConfig::fromJson(src);
  FlowConfig copy = FlowConfig::fromJson(original.toJson());

  EXPECT_EQ(copy.toJson(), original.toJson());
  EXPECT_EQ(copy.postProcessAction, PostProcessAction::DELETE);
  EXPECT_EQ(copy.writeMode, WriteMode::TEMP_THEN_RENAME);
  EXPECT_EQ(copy.outputFilenameMode, OutputNamingMode::CUSTOM_PATTERN);
  EXPECT_EQ(copy.pollInterval, std::chrono::seconds(5));
  ASSERT_EQ(copy.customValidationRules.size(), 1u);
  EXPECT_EQ(copy.customValidationRules[0].params["maxLines"], 10);
}
