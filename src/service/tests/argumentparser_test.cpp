#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../include/argumentparser.hpp"

namespace {

/// argv из списка строк; строки живут, пока жив объект
class Argv {
 public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "filebridge");
    for (auto &s : storage_) pointers_.push_back(s.data());
  }
  int argc() { return static_cast<int>(pointers_.size()); }
  char **argv() { return pointers_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char *> pointers_;
};

ParsedArgs parse(Argv args) {
  return ArgumentParser().parse(args.argc(), args.argv());
}

}  // namespace

TEST(ArgumentParserTest, Defaults) {
  ParsedArgs args = parse({});
  EXPECT_EQ(args.config_path, "filebridge.json");
  EXPECT_EQ(args.environment, "production");
  EXPECT_FALSE(args.run_once);
  EXPECT_FALSE(args.use_cli_logging);
  EXPECT_FALSE(args.log_level.has_value());
}

TEST(ArgumentParserTest, HelpAndVersion) {
  EXPECT_TRUE(parse({"-h"}).help_message);
  EXPECT_TRUE(parse({"--help"}).help_message);
  EXPECT_TRUE(parse({"-v"}).version_message);
  EXPECT_TRUE(parse({"--version"}).version_message);
  EXPECT_NE(ArgumentParser::helpText().find("--once"), std::string::npos);
}

TEST(ArgumentParserTest, ValueWithEqualsOrSeparate) {
  ParsedArgs a = parse({"--config-file=/etc/fb.json", "--environment", "dev"});
  EXPECT_EQ(a.config_path, "/etc/fb.json");
  EXPECT_EQ(a.environment, "dev");

  ParsedArgs b = parse({"--config-file", "local.json", "--environment=test"});
  EXPECT_EQ(b.config_path, "local.json");
  EXPECT_EQ(b.environment, "test");
}

TEST(ArgumentParserTest, OverridesCollected) {
  ParsedArgs args = parse({"--override=defaults.flows:[]",
                           "--override=environments.production.x:http://h:1"});
  ASSERT_EQ(args.overrides.size(), 2u);
  EXPECT_EQ(args.overrides["defaults.flows"], "[]");
  // Значение берётся после первого двоеточия
  EXPECT_EQ(args.overrides["environments.production.x"], "http://h:1");
}

TEST(ArgumentParserTest, LoggingOptions) {
  ParsedArgs args = parse({"--log-type=console,sync_file", "--log-level=debug"});
  EXPECT_TRUE(args.use_cli_logging);
  EXPECT_EQ(args.logger_types,
            (std::vector<std::string>{"console", "sync_file"}));
  EXPECT_EQ(args.log_level.value(), "debug");

  ParsedArgs levelOnly = parse({"--log-level", "warning"});
  EXPECT_FALSE(levelOnly.use_cli_logging);
  EXPECT_EQ(levelOnly.log_level.value(), "warning");
}

TEST(ArgumentParserTest, OnceFlag) { EXPECT_TRUE(parse({"--once"}).run_once); }

TEST(ArgumentParserTest, InvalidArguments) {
  EXPECT_THROW(parse({"--unknown"}), std::invalid_argument);
  EXPECT_THROW(parse({"--log-level=verbose"}), std::invalid_argument);
  EXPECT_THROW(parse({"--log-type=syslog"}), std::invalid_argument);
  EXPECT_THROW(parse({"--override=novalue"}), std::invalid_argument);
  EXPECT_THROW(parse({"--override"}), std::invalid_argument);
  EXPECT_THROW(parse({"--config-file"}), std::invalid_argument);
  EXPECT_THROW(parse({"--config-file="}), std::invalid_argument);
  // Префикс не должен совпадать с другой опцией
  EXPECT_THROW(parse({"--config-filex=a"}), std::invalid_argument);
}
