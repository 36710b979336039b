#include "test_common.h"
#include "scriptbox/policy.h"
#include "scriptbox/pyparse.h"
#include "scriptbox/validator.h"

#include <string>
#include <thread>
#include <vector>

using namespace scriptbox;

static bool any_contains(const std::vector<std::string>& msgs, const std::string& needle) {
    for (const auto& m : msgs) {
        if (contains(m, needle)) return true;
    }
    return false;
}

int main() {
    const SandboxPolicy policy = default_policy();
    const PolicyValidator v(policy);

    // Test 1: allowed imports pass
    {
        auto r = v.validate(
            "import numpy as np\n"
            "import matplotlib.pyplot as plt\n"
            "from scipy.stats import norm\n"
            "from collections import defaultdict\n"
            "import math, json\n"
            "x = np.linspace(0, 1, 10)\n"
            "print(math.pi, json.dumps({'a': 1}))\n");
        expect_true(r.accepted, "allowed imports accepted");
        expect_true(r.violations.empty(), "no violations for allowed imports");
    }

    // Test 2: blocked imports name the module and the allow-list
    {
        auto r = v.validate("import os\nfrom subprocess import run\nimport sys, json\n");
        expect_true(!r.accepted && !r.syntax_error, "blocked imports rejected");
        auto msgs = r.messages();
        expect_eq_ll((long long)msgs.size(), 3, "os, subprocess, sys");
        expect_true(contains(msgs[0], "Line 1: import of 'os' is not allowed. Allowed modules: "), "os message");
        expect_true(contains(msgs[0], "numpy") && contains(msgs[0], "math"), "allow-list in message");
        expect_true(contains(msgs[1], "Line 2: import of 'subprocess' is not allowed."), "subprocess message");
        expect_true(contains(msgs[2], "Line 3: import of 'sys' is not allowed."), "sys message");
        expect_eq_ll(r.violations[2].line, 3, "violation line");
    }

    // Test 3: submodules of allowed packages pass, look-alikes do not
    expect_true(v.validate("import scipy.special\n").accepted, "scipy.special via top-level package");
    expect_true(!v.validate("import numpyx\n").accepted, "prefix look-alike rejected");
    expect_true(!v.validate("import os.path\n").accepted, "os.path rejected");

    // Test 4: relative imports without a module name are not checked
    expect_true(v.validate("from . import helpers\n").accepted, "from . import accepted");
    expect_true(!v.validate("from .os import x\n").accepted, "from .os checked by module name");

    // Test 5: blocked builtins
    {
        auto r = v.validate("x = eval('1+1')\nexec('print(1)')\nopen('/etc/passwd')\n__import__('os')\n");
        auto msgs = r.messages();
        expect_eq_ll((long long)msgs.size(), 4, "four blocked calls");
        expect_eq_str(msgs[0], "Line 1: call to 'eval()' is not allowed.", "eval message");
        expect_eq_str(msgs[1], "Line 2: call to 'exec()' is not allowed.", "exec message");
        expect_eq_str(msgs[2], "Line 3: call to 'open()' is not allowed.", "open message");
        expect_eq_str(msgs[3], "Line 4: call to '__import__()' is not allowed.", "__import__ message");
    }
    expect_true(v.validate("def f():\n    return input()\n").violations.size() == 1, "call inside function body");
    expect_true(v.validate("x = [getattr(o, 'a') for o in y]\n").violations.size() == 1, "call inside comprehension");

    // Test 6: method calls that share a builtin's name are fine
    expect_true(v.validate("import pandas as pd\ndf = pd.DataFrame()\ndf.eval('a + b')\n").accepted,
                "attribute call named eval");

    // Test 7: blocked dunder attributes
    {
        auto r = v.validate("x = ().__class__.__bases__[0].__subclasses__()\n");
        auto msgs = r.messages();
        expect_eq_ll((long long)msgs.size(), 3, "three dunder accesses");
        expect_true(any_contains(msgs, "access to '__class__' is not allowed."), "__class__");
        expect_true(any_contains(msgs, "access to '__bases__' is not allowed."), "__bases__");
        expect_true(any_contains(msgs, "Line 1: access to '__subclasses__' is not allowed."), "__subclasses__");
    }
    expect_true(!v.validate("f.__globals__\n").accepted, "__globals__");
    expect_true(v.validate("print(x.__name__, x.__doc__)\n").accepted, "other dunders allowed");

    // Test 8: syntax errors yield exactly one violation
    {
        auto r = v.validate("def foo(\n");
        expect_true(!r.accepted && r.syntax_error, "syntax error flagged");
        expect_eq_ll((long long)r.violations.size(), 1, "single syntax violation");
        expect_true(contains(r.violations[0].message, "Syntax error"), "syntax error prefix");
        expect_true(contains(r.violations[0].message, "(line 1)"), "syntax error line");
    }
    {
        auto r = v.validate("import os\nprint(\n");
        expect_true(r.syntax_error, "syntax error wins over policy checks");
        expect_eq_ll((long long)r.violations.size(), 1, "no policy violations for unparseable code");
    }

    // Test 9: a deeply nested submission is rejected without taking the process down
    {
        std::string tower = "x = ";
        for (int i = 0; i < 100000; i++) tower += "2**";
        auto r = v.validate(tower + "2\n");
        expect_true(!r.accepted && r.syntax_error, "power tower is a syntax error");
        expect_eq_ll((long long)r.violations.size(), 1, "single violation for the power tower");
        expect_true(contains(r.violations[0].message, "too many nested expressions"), "nesting message");
    }

    // Test 9b: empty and comment-only programs are accepted
    expect_true(v.validate("").accepted, "empty source");
    expect_true(v.validate("# nothing here\n\n").accepted, "comment-only source");

    // Test 10: every violation is reported, in source order
    {
        auto r = v.validate("import os\nimport subprocess\nx = eval('1')\ny = z.__class__\nopen('f')\n");
        auto msgs = r.messages();
        expect_eq_ll((long long)msgs.size(), 5, "five violations");
        for (size_t i = 0; i < r.violations.size(); i++) {
            expect_eq_ll(r.violations[i].line, (long long)i + 1, "source order");
        }
    }

    // Test 11: expressions inside f-string fields are checked
    {
        auto r = v.validate("name = 'x'\nprint(f'{name} {eval(name)}')\n");
        expect_eq_ll((long long)r.violations.size(), 1, "eval inside f-string");
        expect_true(contains(r.violations[0].message, "Line 2: call to 'eval()'"), "f-string violation line");
        expect_true(!v.validate("f'{x.__class__}'\n").accepted, "dunder inside f-string");
        expect_true(v.validate("'{eval}'.format(eval=1)\n").accepted, "plain string with braces");
    }

    // Test 12: aliasing is a known gap (direct calls by literal name only)
    expect_true(v.validate("f = eval\nprint(f('1+1'))\n").accepted, "alias of blocked builtin passes");

    // Test 13: custom policy tables are honoured
    {
        SandboxPolicy p = default_policy();
        p.allowed_modules = {"os"};
        p.blocked_builtins = {"print"};
        p.blocked_attributes = {};
        PolicyValidator custom(p);
        auto r = custom.validate("import os\nprint(os.__class__)\n");
        expect_eq_ll((long long)r.violations.size(), 1, "only print blocked");
        expect_true(contains(r.violations[0].message, "'print()'"), "custom builtin");
        expect_true(!custom.validate("import numpy\n").accepted, "numpy no longer allowed");
    }

    // Test 14: check_tree on a pre-parsed tree
    {
        auto tree = pyast::parse_module("import socket\n");
        auto r = v.check_tree(*tree);
        expect_eq_ll((long long)r.violations.size(), 1, "check_tree");
    }

    // Test 15: concurrent validation against one validator
    {
        std::vector<std::thread> ts;
        std::vector<int> counts(8, -1);
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&, i]() {
                auto r = v.validate("import os\nx = eval('1')\n" + std::string((size_t)i, '\n') + "y = 1\n");
                counts[(size_t)i] = (int)r.violations.size();
            });
        }
        for (auto& t : ts) t.join();
        for (int c : counts) expect_eq_ll(c, 2, "concurrent validation");
    }

    std::cerr << "test_validator: ALL PASSED" << std::endl;
    return 0;
}
