#include <gtest/gtest.h>
#include <codebox/errors.h>
#include <codebox/evaluator.h>

#include "utils.h"

using json = nlohmann::json;

TEST(EvaluatorOutput, FromFailure) {
  auto out = ToEvaluatorOutput(ExecutionResult::Failure("ValueError: bad", "partial", "trace"));
  EXPECT_EQ(out.status, EvaluatorRunStatus::FAIL);
  EXPECT_EQ(out.error_code, kRunErrorCode);
  EXPECT_EQ(out.error_message, "ValueError: bad");
  EXPECT_EQ(out.stdout_text, "partial");
  EXPECT_FALSE(out.score);
  EXPECT_EQ(out.ToJson(), json({
    {"status", "fail"},
    {"stdout", "partial"},
    {"evaluator_run_error", {{"code", 500}, {"message", "ValueError: bad"}}},
  }));
}

TEST(EvaluatorOutput, FromTimeout) {
  auto out = ToEvaluatorOutput(ExecutionResult::Timeout("", ""));
  EXPECT_EQ(out.status, EvaluatorRunStatus::FAIL);
  EXPECT_EQ(out.error_message, "timeout");
}

TEST(EvaluatorOutput, FromScoreObject) {
  auto out = ToEvaluatorOutput(ExecutionResult::Success("log\n", "", R"({"score": 0.75, "reason": "close"})"));
  EXPECT_EQ(out.status, EvaluatorRunStatus::SUCCESS);
  ASSERT_TRUE(out.score);
  EXPECT_DOUBLE_EQ(*out.score, 0.75);
  EXPECT_EQ(out.reasoning, "close");
  EXPECT_EQ(out.stdout_text, "log\n");
  EXPECT_EQ(out.ToJson(), json({
    {"status", "success"},
    {"stdout", "log\n"},
    {"evaluator_result", {{"score", 0.75}, {"reasoning", "close"}}},
  }));

  out = ToEvaluatorOutput(ExecutionResult::Success("", "", R"({"score": 1, "reason": {"a": 1}})"));
  EXPECT_DOUBLE_EQ(*out.score, 1);
  EXPECT_EQ(out.reasoning, R"({"a":1})");
}

TEST(EvaluatorOutput, FromPlainValues) {
  auto out = ToEvaluatorOutput(ExecutionResult::Success("", "", "3"));
  ASSERT_TRUE(out.score);
  EXPECT_DOUBLE_EQ(*out.score, 3);

  out = ToEvaluatorOutput(ExecutionResult::Success("", "", "looks fine"));
  EXPECT_FALSE(out.score);
  EXPECT_EQ(out.reasoning, "looks fine");

  out = ToEvaluatorOutput(ExecutionResult::Success("", "", ""));
  EXPECT_EQ(out.status, EvaluatorRunStatus::SUCCESS);
  EXPECT_FALSE(out.score);
  EXPECT_TRUE(out.ToJson()["evaluator_result"]["score"].is_null());
}

TEST(EvaluatorRunStatus, Names) {
  EXPECT_STREQ(EvaluatorRunStatusName(EvaluatorRunStatus::UNKNOWN), "unknown");
  EXPECT_STREQ(EvaluatorRunStatusName(EvaluatorRunStatus::SUCCESS), "success");
  EXPECT_STREQ(EvaluatorRunStatusName(EvaluatorRunStatus::FAIL), "fail");
}

TEST(CodeEvaluator, Python) {
  auto registry = MakeDefaultRegistry(TestConfig());
  CodeEvaluator evaluator;
  evaluator.code =
      "def exec_evaluation(turn):\n"
      "    print('grading')\n"
      "    return EvalOutput(score=1.0 if turn['output'] == turn['expected'] else 0.0, reason='match')\n";
  auto out = RunCodeEvaluator(*registry, evaluator, {{"output", "4"}, {"expected", "4"}});
  ASSERT_EQ(out.status, EvaluatorRunStatus::SUCCESS) << out.error_message;
  EXPECT_DOUBLE_EQ(*out.score, 1.0);
  EXPECT_EQ(out.reasoning, "match");
  EXPECT_EQ(out.stdout_text, "grading\n");
}

TEST(CodeEvaluator, JavaScript) {
  auto registry = MakeDefaultRegistry(TestConfig());
  CodeEvaluator evaluator;
  evaluator.language = Language::JAVASCRIPT;
  evaluator.entry_point = "grade";
  evaluator.code =
      "function grade(turn) {\n"
      "  return { score: turn.output.length, reason: 'length' };\n"
      "}\n";
  auto out = RunCodeEvaluator(*registry, evaluator, {{"output", "abc"}});
  ASSERT_EQ(out.status, EvaluatorRunStatus::SUCCESS) << out.error_message;
  EXPECT_DOUBLE_EQ(*out.score, 3);
  EXPECT_EQ(out.reasoning, "length");
}

TEST(CodeEvaluator, ValidateRequiresEntryPoint) {
  auto registry = MakeDefaultRegistry(TestConfig());
  CodeEvaluator evaluator;
  evaluator.code = "def exec_evaluation(turn):\n    return 1\n";
  EXPECT_TRUE(ValidateCodeEvaluator(*registry, evaluator));
  evaluator.code = "def grade(turn):\n    return 1\n";
  EXPECT_FALSE(ValidateCodeEvaluator(*registry, evaluator));
  evaluator.entry_point = "grade";
  EXPECT_TRUE(ValidateCodeEvaluator(*registry, evaluator));
  // the runtime checks still apply
  evaluator.code = "def grade(turn):\n    return open('x')\n";
  EXPECT_FALSE(ValidateCodeEvaluator(*registry, evaluator));

  evaluator.language = Language::JAVASCRIPT;
  evaluator.code = "const grade = (turn) => 1;\n";
  EXPECT_TRUE(ValidateCodeEvaluator(*registry, evaluator));
  evaluator.code = "const evaluation_result = 1;\n";
  EXPECT_FALSE(ValidateCodeEvaluator(*registry, evaluator));
  evaluator.language = Language::TYPESCRIPT;
  EXPECT_THROW(ValidateCodeEvaluator(*registry, evaluator), UnsupportedLanguageError);
}

TEST(CodeEvaluator, UnsupportedLanguage) {
  auto registry = MakeDefaultRegistry(TestConfig());
  CodeEvaluator evaluator;
  evaluator.language = Language::TYPESCRIPT;
  evaluator.code = "const x = 1;";
  EXPECT_THROW(RunCodeEvaluator(*registry, evaluator, json::object()), UnsupportedLanguageError);
}

TEST(CodeEvaluator, BatchKeepsOrder) {
  auto registry = MakeDefaultRegistry(TestConfig());
  CodeEvaluator evaluator;
  evaluator.code =
      "def exec_evaluation(turn):\n"
      "    if turn < 0:\n"
      "        raise ValueError('negative')\n"
      "    return turn * 2\n";
  std::vector<json> turns = {1, 2, -1, 4, 5};
  auto outputs = RunCodeEvaluatorBatch(*registry, evaluator, turns, 3);
  ASSERT_EQ(outputs.size(), turns.size());
  for (size_t i = 0; i < turns.size(); i++) {
    if (turns[i].get<int>() < 0) {
      EXPECT_EQ(outputs[i].status, EvaluatorRunStatus::FAIL);
      EXPECT_EQ(outputs[i].error_message, "ValueError: negative");
    } else {
      ASSERT_EQ(outputs[i].status, EvaluatorRunStatus::SUCCESS) << outputs[i].error_message;
      EXPECT_DOUBLE_EQ(*outputs[i].score, turns[i].get<int>() * 2);
    }
  }
  EXPECT_EQ(BoxCount(), 0u);
}

TEST(CodeEvaluator, BatchIsolatesUnsupportedLanguage) {
  RuntimeRegistry registry;
  CodeEvaluator evaluator;
  auto outputs = RunCodeEvaluatorBatch(registry, evaluator, {json(1), json(2)}, 4);
  ASSERT_EQ(outputs.size(), 2u);
  for (auto& i : outputs) {
    EXPECT_EQ(i.status, EvaluatorRunStatus::FAIL);
    EXPECT_EQ(i.error_code, kRunErrorCode);
    EXPECT_EQ(i.error_message, "Unsupported language: Python");
  }
  EXPECT_TRUE(RunCodeEvaluatorBatch(registry, evaluator, {}, 4).empty());
}
