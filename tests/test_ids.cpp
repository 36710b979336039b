#include "test_common.h"
#include "scriptbox/ids.h"

#include <set>

int main() {
    // Test 1: canonical v4 form
    std::string id = scriptbox::gen_execution_id();
    expect_eq_ll((long long)id.size(), 36, "uuid length");
    expect_true(id[14] == '4', "version nibble");
    expect_true(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b', "variant nibble");
    expect_true(scriptbox::is_execution_id(id), "generated id validates");

    // Test 2: uniqueness over many draws
    std::set<std::string> seen;
    for (int i = 0; i < 10000; i++) seen.insert(scriptbox::gen_execution_id());
    expect_eq_ll((long long)seen.size(), 10000, "ids are unique");

    // Test 3: rejects anything that could escape the output root
    expect_true(!scriptbox::is_execution_id(""), "empty");
    expect_true(!scriptbox::is_execution_id(".."), "dot-dot");
    expect_true(!scriptbox::is_execution_id("../../../../../../../../etc/passwd"), "traversal");
    expect_true(!scriptbox::is_execution_id("0123456789ab-cdef-0123-4567-89abcdef0123"), "misplaced dash");
    expect_true(!scriptbox::is_execution_id("01234567-89AB-4def-8123-456789abcdef"), "uppercase");
    expect_true(!scriptbox::is_execution_id("01234567-89ab-4def-8123-456789abcde/"), "slash");
    expect_true(scriptbox::is_execution_id("01234567-89ab-4def-8123-456789abcdef"), "well-formed");

    std::cerr << "test_ids: ALL PASSED" << std::endl;
    return 0;
}
