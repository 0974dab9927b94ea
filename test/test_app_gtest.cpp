#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>

#include "app.hpp"

static std::string write_temp(const std::string& name, const std::string& content) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

class RunTest : public ::testing::Test {
protected:
  Args args;
  std::ostringstream out;
  std::ostringstream err;
};

TEST_F(RunTest, ChunksDocumentAndExitsZero) {
  args.input_path = write_temp("run_ok.md", "# Hello\n\nWorld\n\nfoo\n");
  args.chunk.limit = 10;
  EXPECT_EQ(run(args, out, err), 0) << err.str();
  EXPECT_EQ(out.str(),
            "--- --- --- 5 --- --- ---\nHello\n\n"
            "--- --- --- 9 --- --- ---\nWorld foo\n\n");
  EXPECT_TRUE(err.str().empty());
}

TEST_F(RunTest, AppliesSubstitutionsBeforeParsing) {
  args.input_path = write_temp("run_subs.md", "foo foo\n");
  args.substitutions_path = write_temp("run_subs.csv", "from,to\nfoo,bar\n");
  EXPECT_EQ(run(args, out, err), 0) << err.str();
  EXPECT_EQ(out.str(), "--- --- --- 7 --- --- ---\nbar bar\n\n");
}

TEST_F(RunTest, MissingInputExitsOne) {
  args.input_path = ::testing::TempDir() + "run_missing.md";
  EXPECT_EQ(run(args, out, err), 1);
  EXPECT_TRUE(out.str().empty());
  EXPECT_NE(err.str().find("error: "), std::string::npos);
}

TEST_F(RunTest, InvalidUtf8ExitsOne) {
  args.input_path = write_temp("run_bad.md", "ok \xFF\n");
  EXPECT_EQ(run(args, out, err), 1);
  EXPECT_NE(err.str().find("invalid UTF-8"), std::string::npos) << err.str();
}

TEST_F(RunTest, UnreadableTableExitsOne) {
  args.input_path = write_temp("run_table.md", "text\n");
  args.substitutions_path = ::testing::TempDir() + "run_missing.csv";
  EXPECT_EQ(run(args, out, err), 1);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(RunTest, EmptyKeyInTableExitsOne) {
  args.input_path = write_temp("run_table2.md", "text\n");
  args.substitutions_path = write_temp("run_empty_key.csv", "from,to\n,x\n");
  EXPECT_EQ(run(args, out, err), 1);
}

TEST_F(RunTest, VerboseReportsLeafKinds) {
  args.input_path = write_temp("run_verbose.md",
                               "Call `f()` here\n\n```\n" + std::string(90, 'x') + "\n```\n");
  args.verbose = true;
  EXPECT_EQ(run(args, out, err), 0);
  std::string log = err.str();
  EXPECT_NE(log.find("4 leaves (2 text, 1 inline-code, 1 code-block)"), std::string::npos) << log;
  EXPECT_NE(log.find("1 listings omitted"), std::string::npos) << log;
}
