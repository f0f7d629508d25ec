#include <gtest/gtest.h>

#include "guard/guardrail_scanner.hpp"

using namespace selfrepair;

namespace {

guard::ScreenResult Screen(const std::string& source) {
    guard::GuardrailScanner scanner;
    return scanner.Screen(source);
}

}  // namespace

// ─── Allowed code ──────────────────────────────────────────────

TEST(GuardrailScannerTest, AllowsPlainFunction) {
    const auto result = Screen(
        "def add(a, b):\n"
        "    return a + b\n");
    EXPECT_TRUE(result.Allowed());
    EXPECT_TRUE(result.reason.empty());
}

TEST(GuardrailScannerTest, AllowsLookalikeIdentifiers) {
    const auto result = Screen(
        "import re\n"
        "from collections import Counter\n"
        "PATTERN = re.compile(r'\\d+')\n"
        "def evaluate(expr):\n"
        "    text = expr.replace(' ', '')\n"
        "    with open('data.txt') as handle:\n"
        "        return handle.read() + text\n"
        "def my_exit(code):\n"
        "    return code\n");
    EXPECT_TRUE(result.Allowed()) << result.reason;
}

// ─── Categories ────────────────────────────────────────────────

TEST(GuardrailScannerTest, BlocksProcessExecution) {
    const auto result = Screen("import subprocess\nsubprocess.run(['ls'])\n");
    ASSERT_TRUE(result.blocked);
    EXPECT_EQ(result.category, guard::kProcessExecution);
    EXPECT_EQ(result.line, 1);

    EXPECT_EQ(Screen("import os\nos.system('rm -rf /')\n").category, guard::kProcessExecution);
    EXPECT_EQ(Screen("from os import *\n").category, guard::kProcessExecution);
    EXPECT_EQ(Screen("def f():\n    return system('id')\n").category, guard::kProcessExecution);
    EXPECT_EQ(Screen("import os\ngetattr(os, 'sys' + 'tem')('id')\n").category, guard::kProcessExecution);
    EXPECT_EQ(Screen("import os\nsetattr(os, 'sep', '/')\n").category, guard::kProcessExecution);
}

TEST(GuardrailScannerTest, BlocksComputedAttributeNames) {
    EXPECT_EQ(Screen("def f(obj, name):\n    return getattr(obj, name)()\n").category,
              guard::kDynamicEvaluation);
    EXPECT_TRUE(Screen("def f(point):\n    return getattr(point, 'x', 0)\n").Allowed());
}

TEST(GuardrailScannerTest, BlocksDynamicEvaluation) {
    EXPECT_EQ(Screen("def f(s):\n    return eval(s)\n").category, guard::kDynamicEvaluation);
    EXPECT_EQ(Screen("exec('x = 1')\n").category, guard::kDynamicEvaluation);
    EXPECT_EQ(Screen("mod = __import__('os')\n").category, guard::kDynamicEvaluation);
    EXPECT_EQ(Screen("code = compile('1', 'f', 'eval')\n").category, guard::kDynamicEvaluation);
}

TEST(GuardrailScannerTest, BlocksFilesystemMutation) {
    EXPECT_EQ(Screen("open('out.txt', 'w').write('x')\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("open(path, mode='a')\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("import shutil\nshutil.rmtree('/work')\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("import os\nos.remove('solution.py')\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("def save(p, m):\n    open(p, m).write('x')\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("open(p, mode=m)\n").category, guard::kFilesystemMutation);
    EXPECT_EQ(Screen("from pathlib import Path\nPath('x').open('a')\n").category, guard::kFilesystemMutation);
}

TEST(GuardrailScannerTest, AllowsReadOnlyOpen) {
    EXPECT_TRUE(Screen("data = open('in.txt', 'r').read()\n").Allowed());
    EXPECT_TRUE(Screen("data = open('in.bin', 'rb').read()\n").Allowed());
    EXPECT_TRUE(Screen("data = open('in.txt', encoding='utf-8').read()\n").Allowed());
    EXPECT_TRUE(Screen("data = open('in.txt', mode='r').read()\n").Allowed());
}

TEST(GuardrailScannerTest, BlocksNetworkAccess) {
    const auto result = Screen(
        "import requests\n"
        "def fetch():\n"
        "    return requests.get('http://example.com').text\n");
    ASSERT_TRUE(result.blocked);
    EXPECT_EQ(result.category, guard::kNetworkAccess);
    EXPECT_EQ(result.line, 1);
    EXPECT_NE(result.reason.find("network_access"), std::string::npos);

    EXPECT_EQ(Screen("import socket\n").category, guard::kNetworkAccess);
    EXPECT_EQ(Screen("from urllib.request import urlopen\n").category, guard::kNetworkAccess);
}

TEST(GuardrailScannerTest, BlocksTestTampering) {
    EXPECT_EQ(Screen("def test_add():\n    assert True\n").category, guard::kTestTampering);
    EXPECT_EQ(Screen("import pytest\n").category, guard::kTestTampering);
    EXPECT_EQ(Screen("import sys\nsys.exit(0)\n").category, guard::kTestTampering);
}

// ─── Reporting and configuration ───────────────────────────────

TEST(GuardrailScannerTest, ReasonNamesFragmentAndLine) {
    const auto result = Screen(
        "def f(x):\n"
        "    y = x * 2\n"
        "    return eval('y')\n");
    ASSERT_TRUE(result.blocked);
    EXPECT_EQ(result.line, 3);
    EXPECT_EQ(result.fragment, "eval(");
    EXPECT_EQ(result.reason, "dynamic_evaluation: forbidden construct 'eval(' at line 3");
}

TEST(GuardrailScannerTest, IsDeterministic) {
    guard::GuardrailScanner scanner;
    const std::string source = "import os\nos.popen('ls')\nexec('1')\n";
    const auto first = scanner.Screen(source);
    for (int i = 0; i < 5; ++i) {
        const auto again = scanner.Screen(source);
        EXPECT_EQ(again.blocked, first.blocked);
        EXPECT_EQ(again.category, first.category);
        EXPECT_EQ(again.reason, first.reason);
    }
}

TEST(GuardrailScannerTest, DisabledScannerAllowsEverything) {
    config::GuardrailConfig config{};
    config.enabled = false;
    guard::GuardrailScanner scanner(config);
    EXPECT_TRUE(scanner.Screen("import subprocess\n").Allowed());
}

TEST(GuardrailScannerTest, ExtraPatternsExtendDefaults) {
    config::GuardrailConfig config{};
    config.extra_patterns.push_back({"custom", R"(\bpickle\b)"});
    guard::GuardrailScanner scanner(config);

    const auto result = scanner.Screen("import pickle\n");
    ASSERT_TRUE(result.blocked);
    EXPECT_EQ(result.category, "custom");
    EXPECT_TRUE(scanner.Screen("import subprocess\n").blocked);
}

TEST(GuardrailScannerTest, InvalidPatternIsSkipped) {
    guard::GuardrailScanner scanner;
    const auto before = scanner.Rules().size();
    EXPECT_FALSE(scanner.AddRule("broken", "(unclosed"));
    EXPECT_EQ(scanner.Rules().size(), before);
    EXPECT_TRUE(scanner.Screen("def f():\n    return 1\n").Allowed());
}
