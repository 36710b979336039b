#include "test_common.h"
#include "scriptbox/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("SCRIPTBOX_PROFILE");
    auto p = scriptbox::detect_profile();
    expect_true(p == scriptbox::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("SCRIPTBOX_PROFILE", "prod", 1);
    expect_true(scriptbox::detect_profile() == scriptbox::Profile::PROD, "should detect PROD");
    setenv("SCRIPTBOX_PROFILE", "Production", 1);
    expect_true(scriptbox::detect_profile() == scriptbox::Profile::PROD, "should detect Production");
    setenv("SCRIPTBOX_PROFILE", "staging", 1);
    expect_true(scriptbox::detect_profile() == scriptbox::Profile::DEV, "unknown falls back to DEV");

    // Test 3: Apply defaults won't override existing values
    setenv("SCRIPTBOX_RLIMIT_AS_MB", "42", 1);
    scriptbox::apply_profile_defaults(scriptbox::Profile::PROD);
    std::string val = std::getenv("SCRIPTBOX_RLIMIT_AS_MB") ? std::getenv("SCRIPTBOX_RLIMIT_AS_MB") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    unsetenv("SCRIPTBOX_RLIMIT_NOFILE");
    scriptbox::apply_profile_defaults(scriptbox::Profile::PROD);
    val = std::getenv("SCRIPTBOX_RLIMIT_NOFILE") ? std::getenv("SCRIPTBOX_RLIMIT_NOFILE") : "";
    expect_true(val == "256", "PROD should set RLIMIT_NOFILE=256");

    unsetenv("SCRIPTBOX_RLIMIT_CPU_SEC");
    scriptbox::apply_profile_defaults(scriptbox::Profile::DEV);
    val = std::getenv("SCRIPTBOX_RLIMIT_CPU_SEC") ? std::getenv("SCRIPTBOX_RLIMIT_CPU_SEC") : "";
    expect_true(val == "0", "DEV leaves CPU rlimit off");

    // Test 5: Profile name
    expect_true(std::string(scriptbox::profile_name(scriptbox::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(scriptbox::profile_name(scriptbox::Profile::PROD)) == "prod", "prod name");

    // Test 6: env lookups fall back on malformed values
    setenv("SCRIPTBOX_TEST_INT", "17", 1);
    expect_eq_ll(scriptbox::getenv_int("SCRIPTBOX_TEST_INT", 3), 17, "int parse");
    setenv("SCRIPTBOX_TEST_INT", "abc", 1);
    expect_eq_ll(scriptbox::getenv_int("SCRIPTBOX_TEST_INT", 3), 3, "malformed int");
    setenv("SCRIPTBOX_TEST_INT", "99999999999", 1);
    expect_eq_ll(scriptbox::getenv_int("SCRIPTBOX_TEST_INT", 3), 3, "out-of-range int");
    expect_eq_ll(scriptbox::getenv_i64("SCRIPTBOX_TEST_INT", 3), 99999999999LL, "i64 parse");
    unsetenv("SCRIPTBOX_TEST_INT");
    expect_eq_ll(scriptbox::getenv_int("SCRIPTBOX_TEST_INT", 5), 5, "unset int");

    setenv("SCRIPTBOX_TEST_STR", "", 1);
    expect_true(scriptbox::getenv_str("SCRIPTBOX_TEST_STR", "dflt") == "dflt", "empty string uses default");
    setenv("SCRIPTBOX_TEST_STR", "v", 1);
    expect_true(scriptbox::getenv_str("SCRIPTBOX_TEST_STR", "dflt") == "v", "string value");

    setenv("SCRIPTBOX_TEST_BOOL", "Yes", 1);
    expect_true(scriptbox::env_true("SCRIPTBOX_TEST_BOOL"), "Yes is true");
    setenv("SCRIPTBOX_TEST_BOOL", "0", 1);
    expect_true(!scriptbox::env_true("SCRIPTBOX_TEST_BOOL"), "0 is false");

    // Cleanup
    unsetenv("SCRIPTBOX_PROFILE");
    unsetenv("SCRIPTBOX_RLIMIT_AS_MB");
    unsetenv("SCRIPTBOX_RLIMIT_NOFILE");
    unsetenv("SCRIPTBOX_RLIMIT_CPU_SEC");
    unsetenv("SCRIPTBOX_TEST_STR");
    unsetenv("SCRIPTBOX_TEST_BOOL");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
